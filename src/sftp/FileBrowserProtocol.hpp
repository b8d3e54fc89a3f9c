#ifndef __WT_FILE_BROWSER_PROTOCOL__
#define __WT_FILE_BROWSER_PROTOCOL__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace wt {
/**
 * @brief Converts one `dir_list` entry.  `modified` and `permissions` stay
 * unset when the backend sends null.  Throws SessionError(PROTOCOL) when the
 * entry is not an object with a name.
 */
FileEntry fileEntryFromJson(const json& j);

json fileEntryToJson(const FileEntry& entry);

/** @brief `name` inside `dir`, where "." is the root of relative paths. */
string joinRemotePath(const string& dir, const string& name);

/**
 * @brief The directory containing `path`.  "/" and "." are their own
 * parents.
 */
string parentRemotePath(const string& path);

/** @brief `drwxr-xr-x` style mode string, or "-" when unknown. */
string formatPermissions(const FileEntry& entry);
}  // namespace wt

#endif  // __WT_FILE_BROWSER_PROTOCOL__
