#include "FileBrowserProtocol.hpp"

#include "SessionError.hpp"

namespace wt {
FileEntry fileEntryFromJson(const json& j) {
  if (!j.is_object()) {
    throw SessionError(SessionErrorKind::PROTOCOL,
                       "Directory entry is not an object");
  }
  auto name = j.find("name");
  if (name == j.end() || !name->is_string()) {
    throw SessionError(SessionErrorKind::PROTOCOL,
                       "Directory entry without a name");
  }
  FileEntry entry;
  entry.set_name(name->get<string>());
  auto isDir = j.find("is_dir");
  entry.set_is_dir(isDir != j.end() && isDir->is_boolean() &&
                   isDir->get<bool>());
  entry.set_size(jsonInt64(j, "size", 0));
  auto modified = j.find("modified");
  if (modified != j.end() && modified->is_number()) {
    entry.set_modified(modified->get<int64_t>());
  }
  auto permissions = j.find("permissions");
  if (permissions != j.end() && permissions->is_number()) {
    entry.set_permissions(permissions->get<int32_t>());
  }
  auto editable = j.find("is_content_editable");
  entry.set_is_content_editable(editable != j.end() &&
                                editable->is_boolean() &&
                                editable->get<bool>());
  return entry;
}

json fileEntryToJson(const FileEntry& entry) {
  json j = {
      {"name", entry.name()},
      {"is_dir", entry.is_dir()},
      {"size", entry.size()},
      {"modified", nullptr},
      {"permissions", nullptr},
      {"is_content_editable", entry.is_content_editable()},
  };
  if (entry.has_modified()) {
    j["modified"] = entry.modified();
  }
  if (entry.has_permissions()) {
    j["permissions"] = entry.permissions();
  }
  return j;
}

string joinRemotePath(const string& dir, const string& name) {
  if (dir.empty() || dir == ".") {
    return name;
  }
  if (dir[dir.size() - 1] == '/') {
    return dir + name;
  }
  return dir + "/" + name;
}

string parentRemotePath(const string& path) {
  if (path.empty() || path == "/" || path == ".") {
    return path.empty() ? "." : path;
  }
  if (path[0] == '/') {
    vector<string> parts;
    for (const auto& part : split(path, '/')) {
      if (!part.empty()) {
        parts.push_back(part);
      }
    }
    if (!parts.empty()) {
      parts.pop_back();
    }
    string parent;
    for (const auto& part : parts) {
      parent += "/" + part;
    }
    return parent.empty() ? "/" : parent;
  }
  vector<string> parts = split(path, '/');
  if (!parts.empty()) {
    parts.pop_back();
  }
  string parent;
  for (size_t i = 0; i < parts.size(); i++) {
    if (i) parent += "/";
    parent += parts[i];
  }
  return parent.empty() ? "." : parent;
}

string formatPermissions(const FileEntry& entry) {
  if (!entry.has_permissions()) {
    return "-";
  }
  static const char* TRIPLES[] = {"---", "--x", "-w-", "-wx",
                                  "r--", "r-x", "rw-", "rwx"};
  int perms = entry.permissions() & 0777;
  string result = entry.is_dir() ? "d" : "-";
  result += TRIPLES[(perms >> 6) & 7];
  result += TRIPLES[(perms >> 3) & 7];
  result += TRIPLES[perms & 7];
  return result;
}
}  // namespace wt
