#include "server_url.hpp"

#include <stdexcept>

namespace rfshared::transport {

ServerUrl ParseServerUrl(std::string_view url) {
  const auto scheme_end = url.find("://");
  if (scheme_end == std::string_view::npos || scheme_end == 0) {
    throw std::invalid_argument("server url '" + std::string(url) + "' has no scheme");
  }

  ServerUrl out;
  out.scheme = std::string(url.substr(0, scheme_end));

  auto rest = url.substr(scheme_end + 3);
  if (const auto slash = rest.find('/'); slash != std::string_view::npos) {
    rest = rest.substr(0, slash);
  }

  if (const auto at = rest.rfind('@'); at != std::string_view::npos) {
    const auto userinfo = rest.substr(0, at);
    rest                = rest.substr(at + 1);

    if (const auto colon = userinfo.find(':'); colon != std::string_view::npos) {
      out.user     = std::string(userinfo.substr(0, colon));
      out.password = std::string(userinfo.substr(colon + 1));
    } else {
      out.token = std::string(userinfo);
    }
  }

  if (rest.empty()) {
    throw std::invalid_argument("server url '" + std::string(url) + "' has no host");
  }
  out.authority = std::string(rest);
  return out;
}

ConnectOptions WithUrlCredentials(ConnectOptions options, const ServerUrl& url) {
  if (options.user.empty() && options.password.empty() && options.token.empty()) {
    options.user     = url.user;
    options.password = url.password;
    options.token    = url.token;
  }
  return options;
}

} // namespace rfshared::transport
