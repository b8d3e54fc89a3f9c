#include "Transport.hpp"

namespace wt {
string getWebSocketUrl(const string& apiUrl, const string& path) {
  string scheme = "ws";
  string rest = apiUrl;
  auto schemeEnd = apiUrl.find("://");
  if (schemeEnd != string::npos) {
    string apiScheme = apiUrl.substr(0, schemeEnd);
    std::transform(apiScheme.begin(), apiScheme.end(), apiScheme.begin(),
                   ::tolower);
    if (apiScheme == "https" || apiScheme == "wss") {
      scheme = "wss";
    }
    rest = apiUrl.substr(schemeEnd + 3);
  }
  auto hostEnd = rest.find('/');
  string host = (hostEnd == string::npos) ? rest : rest.substr(0, hostEnd);
  if (host.empty()) {
    host = "localhost:3000";
  }
  return scheme + "://" + host + path;
}
}  // namespace wt
