#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace rfshared::util {

/*
  Central error types.

  Parsing errors are thrown with std::throw_with_nested so the low-level cause
  stays reachable through std::rethrow_if_nested. BusServer translates these
  into gRPC status codes and GrpcTransport maps them back.
*/

class ChecksumMismatchError : public std::runtime_error {
 public:
  ChecksumMismatchError(const std::string& source, std::string expected, std::string actual)
      : std::runtime_error("Checksum mismatch for " + source + ". Expected: '" + expected + "', Got: '" + actual + "'"),
        expected_(std::move(expected)),
        actual_(std::move(actual)) {
  }

  const std::string& expected() const {
    return expected_;
  }

  const std::string& actual() const {
    return actual_;
  }

 private:
  std::string expected_;
  std::string actual_;
};

class MetadataParsingError : public std::runtime_error {
 public:
  explicit MetadataParsingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class EnvelopeParsingError : public std::runtime_error {
 public:
  explicit EnvelopeParsingError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// An operation that needs a live connection ran before connect or after close.
class ConnectionStateError : public std::runtime_error {
 public:
  explicit ConnectionStateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransportError : public std::runtime_error {
 public:
  explicit TransportError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Transport failures the broker can name precisely.

class NotFound : public TransportError {
 public:
  explicit NotFound(const std::string& msg) : TransportError(msg) {
  }
};

class AlreadyExists : public TransportError {
 public:
  explicit AlreadyExists(const std::string& msg) : TransportError(msg) {
  }
};

class Unauthenticated : public TransportError {
 public:
  explicit Unauthenticated(const std::string& msg) : TransportError(msg) {
  }
};

class Unavailable : public TransportError {
 public:
  explicit Unavailable(const std::string& msg) : TransportError(msg) {
  }
};

// Innermost message of a nested exception chain, or the message itself.
std::string RootCause(const std::exception& e);

} // namespace rfshared::util
