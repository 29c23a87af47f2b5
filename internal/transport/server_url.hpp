#pragma once

#include <string>
#include <string_view>

#include "internal/transport/transport.hpp"

namespace rfshared::transport {

/*
  scheme://[userinfo@]host[:port]

  userinfo is either "user:password" or a bare token, the way broker URLs
  carry credentials ("grpc://s3cret@127.0.0.1:4222").
*/
struct ServerUrl {
  std::string scheme;
  std::string authority; // host[:port]
  std::string user;
  std::string password;
  std::string token;
};

// Throws std::invalid_argument on a missing scheme or host.
ServerUrl ParseServerUrl(std::string_view url);

// Fills credentials missing from `options` with the ones carried by `url`.
ConnectOptions WithUrlCredentials(ConnectOptions options, const ServerUrl& url);

} // namespace rfshared::transport
