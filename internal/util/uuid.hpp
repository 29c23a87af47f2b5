#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <string_view>

namespace rfshared::util {

/*
  UUID helpers

  Envelope message ids are random RFC4122 version 4 UUIDs, rendered in the
  canonical lowercase 8-4-4-4-12 form on the wire.
*/

using UUID = std::array<uint8_t, 16>;

UUID GenerateUUID();

std::string ToString(const UUID& id);

/*
  Accepts the canonical form, 32 bare hex digits, "{...}" and "urn:uuid:..."
  (hyphens anywhere are ignored). Throws std::invalid_argument otherwise.
*/
UUID FromString(std::string_view str);

} // namespace rfshared::util
