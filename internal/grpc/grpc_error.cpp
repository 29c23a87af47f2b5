#include "grpc_error.hpp"

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace rfshared::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace rfshared::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const Unauthenticated*>(&e)) {
    return {::grpc::StatusCode::UNAUTHENTICATED, e.what()};
  }
  if (dynamic_cast<const Unavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }
  if (dynamic_cast<const ConnectionStateError*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const TransportError*>(&e) || dynamic_cast<const std::invalid_argument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

void ThrowIfError(const ::grpc::Status& status, std::string_view action) {
  using namespace rfshared::util;

  if (status.ok()) return;

  const auto message = std::string(action) + " failed: " + status.error_message();
  switch (status.error_code()) {
    case ::grpc::StatusCode::NOT_FOUND:
      throw NotFound(message);
    case ::grpc::StatusCode::ALREADY_EXISTS:
      throw AlreadyExists(message);
    case ::grpc::StatusCode::UNAUTHENTICATED:
      throw Unauthenticated(message);
    case ::grpc::StatusCode::UNAVAILABLE:
      throw Unavailable(message);
    default:
      throw TransportError(message);
  }
}

} // namespace rfshared::grpc
