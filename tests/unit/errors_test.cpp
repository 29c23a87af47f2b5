#include "internal/util/errors.hpp"

#include <cassert>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>

namespace {

using namespace rfshared::util;

void TestChecksumMismatchMessage() {
  const ChecksumMismatchError e("/data/a.iq", "abc", "def");
  assert(std::string(e.what()) == "Checksum mismatch for /data/a.iq. Expected: 'abc', Got: 'def'");
  assert(e.expected() == "abc");
  assert(e.actual() == "def");
}

void TestTransportHierarchy() {
  try {
    throw NotFound("stream 'x' not found");
  } catch (const TransportError& e) {
    assert(std::string(e.what()) == "stream 'x' not found");
  }

  try {
    throw Unauthenticated("bad token");
  } catch (const TransportError&) {
  }

  try {
    throw ConnectionStateError("publish: not connected");
  } catch (const std::runtime_error& e) {
    assert(dynamic_cast<const TransportError*>(&e) == nullptr);
  }
}

void TestRootCauseWalksNestedChain() {
  try {
    try {
      try {
        throw std::out_of_range("missing required key 'gain'");
      } catch (const std::exception&) {
        std::throw_with_nested(std::invalid_argument("bad field"));
      }
    } catch (const std::exception&) {
      std::throw_with_nested(MetadataParsingError("malformed metadata record"));
    }
  } catch (const MetadataParsingError& e) {
    assert(RootCause(e) == "missing required key 'gain'");
  }

  const EnvelopeParsingError flat("flat");
  assert(RootCause(flat) == "flat");
}

} // namespace

int main() {
  TestChecksumMismatchMessage();
  TestTransportHierarchy();
  TestRootCauseWalksNestedChain();

  std::cout << "rfshared_unit_errors: pass\n";
  return 0;
}
