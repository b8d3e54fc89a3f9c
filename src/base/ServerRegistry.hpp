#ifndef __WT_SERVER_REGISTRY__
#define __WT_SERVER_REGISTRY__

#include "Headers.hpp"

namespace wt {
/**
 * @brief Read-only lookup of the remote targets sessions connect to.
 */
class ServerRegistry {
 public:
  virtual ~ServerRegistry() {}

  /** @brief Throws std::runtime_error for an unknown id. */
  virtual ServerRef lookup(int64_t id) = 0;
  virtual vector<ServerRef> list() = 0;
};

/**
 * @brief Servers declared as `[server.<id>]` sections (name, host, port,
 * username) of an INI file.
 */
class IniServerRegistry : public ServerRegistry {
 public:
  IniServerRegistry() {}

  void loadFile(const string& path);
  void loadData(const string& iniData);

  virtual ServerRef lookup(int64_t id);
  virtual vector<ServerRef> list();

 protected:
  map<int64_t, ServerRef> servers;
};
}  // namespace wt

#endif  // __WT_SERVER_REGISTRY__
