#include "ServerRegistry.hpp"

#include "SimpleIni.h"

namespace wt {
namespace {
const string SERVER_SECTION_PREFIX = "server.";

void readServers(const CSimpleIniA& ini, map<int64_t, ServerRef>* servers) {
  CSimpleIniA::TNamesDepend sections;
  ini.GetAllSections(sections);
  for (const auto& section : sections) {
    string name(section.pItem);
    if (!startsWith(name, SERVER_SECTION_PREFIX)) {
      continue;
    }
    int64_t id;
    try {
      id = std::stoll(name.substr(SERVER_SECTION_PREFIX.size()));
    } catch (const std::exception& e) {
      LOG(WARNING) << "Ignoring server section with a bad id: " << name;
      continue;
    }
    const char* host = ini.GetValue(section.pItem, "host", NULL);
    if (!host) {
      LOG(WARNING) << "Ignoring server " << id << " without a host";
      continue;
    }
    ServerRef server;
    server.set_id(id);
    server.set_host(host);
    server.set_name(ini.GetValue(section.pItem, "name", host));
    server.set_port(int(ini.GetLongValue(section.pItem, "port", 22)));
    const char* username = ini.GetValue(section.pItem, "username", NULL);
    if (username) {
      server.set_username(username);
    }
    VLOG(1) << "Loaded server " << id << ": " << server;
    (*servers)[id] = server;
  }
}
}  // namespace

void IniServerRegistry::loadFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  if (ini.LoadFile(path.c_str()) < 0) {
    throw std::runtime_error("Invalid server file: " + path);
  }
  readServers(ini, &servers);
}

void IniServerRegistry::loadData(const string& iniData) {
  CSimpleIniA ini(true, false, false);
  if (ini.LoadData(iniData) < 0) {
    throw std::runtime_error("Invalid server data");
  }
  readServers(ini, &servers);
}

ServerRef IniServerRegistry::lookup(int64_t id) {
  auto it = servers.find(id);
  if (it == servers.end()) {
    throw std::runtime_error("Unknown server: " + to_string(id));
  }
  return it->second;
}

vector<ServerRef> IniServerRegistry::list() {
  vector<ServerRef> result;
  for (const auto& it : servers) {
    result.push_back(it.second);
  }
  return result;
}
}  // namespace wt
