#pragma once

#include <google/protobuf/struct.pb.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace rfshared::model {

/*
  Flat JSON-compatible mapping.

  google::protobuf::Struct is the in-memory form of every JSON object the
  messaging layer handles (record mappings, envelope payloads). The Require*
  accessors throw std::out_of_range for a missing key and
  std::invalid_argument for a value of the wrong kind; callers wrap those
  into their own parsing error.
*/
using Mapping = google::protobuf::Struct;

const google::protobuf::Value& Require(const Mapping& mapping, const std::string& key);

std::string    RequireString(const Mapping& mapping, const std::string& key);
double         RequireNumber(const Mapping& mapping, const std::string& key);
std::int64_t   RequireInteger(const Mapping& mapping, const std::string& key);
const Mapping& RequireMapping(const Mapping& mapping, const std::string& key);

// Throws std::invalid_argument naming the first key not in `known`.
void RejectUnknownKeys(const Mapping& mapping, std::initializer_list<std::string_view> known);

void SetString(Mapping* mapping, const std::string& key, const std::string& value);
void SetNumber(Mapping* mapping, const std::string& key, double value);

/*
  Compact by default; `indent` adds whitespace for human-readable files.

  Keys are written in a stable order at every nesting level: those listed in
  `key_order` first, in that order, then the rest sorted by name.
*/
std::string ToJson(const Mapping& mapping, bool indent = false, const std::vector<std::string_view>& key_order = {});

// Throws std::invalid_argument when the text is not a JSON object.
Mapping MappingFromJson(const std::string& json);

bool Equals(const Mapping& a, const Mapping& b);

} // namespace rfshared::model
