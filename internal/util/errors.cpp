#include "errors.hpp"

#include <exception>

namespace rfshared::util {

std::string RootCause(const std::exception& e) {
  try {
    std::rethrow_if_nested(e);
  } catch (const std::exception& nested) {
    return RootCause(nested);
  }
  return e.what();
}

} // namespace rfshared::util
