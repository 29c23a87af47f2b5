#pragma once

#include <grpcpp/grpcpp.h>

#include <exception>
#include <string_view>

namespace rfshared::grpc {

/*
  Converts internal exceptions into gRPC status codes (server side) and
  non-OK statuses back into util::TransportError subclasses (client side).
*/

::grpc::Status ToStatus(const std::exception& e);

// No-op on OK. Message: "<action> failed: <status message>".
void ThrowIfError(const ::grpc::Status& status, std::string_view action);

} // namespace rfshared::grpc
