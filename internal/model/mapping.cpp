#include "mapping.hpp"

#include <google/protobuf/util/json_util.h>
#include <google/protobuf/util/message_differencer.h>

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace rfshared::model {

namespace {

const char* KindName(const google::protobuf::Value& value) {
  switch (value.kind_case()) {
    case google::protobuf::Value::kNullValue:
      return "null";
    case google::protobuf::Value::kNumberValue:
      return "number";
    case google::protobuf::Value::kStringValue:
      return "string";
    case google::protobuf::Value::kBoolValue:
      return "bool";
    case google::protobuf::Value::kStructValue:
      return "object";
    case google::protobuf::Value::kListValue:
      return "list";
    default:
      return "unset";
  }
}

std::invalid_argument WrongKind(const std::string& key, const char* expected, const google::protobuf::Value& got) {
  return std::invalid_argument("key '" + key + "' must be " + expected + ", got " + KindName(got));
}

// Renders a scalar Value (string, number, bool, null) as a JSON token.
std::string ScalarJson(const google::protobuf::Value& value) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(value, &json);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize mapping to JSON: " + std::string(status.message()));
  }
  return json;
}

class JsonWriter {
 public:
  JsonWriter(bool indent, const std::vector<std::string_view>& key_order) : indent_(indent), key_order_(key_order) {
  }

  void Object(const Mapping& mapping, int depth) {
    std::vector<const std::string*> keys;
    keys.reserve(mapping.fields_size());
    for (const auto& [key, value] : mapping.fields()) {
      keys.push_back(&key);
    }
    std::sort(keys.begin(), keys.end(), [this](const std::string* a, const std::string* b) {
      const auto ra = Rank(*a);
      const auto rb = Rank(*b);
      return ra != rb ? ra < rb : *a < *b;
    });

    if (keys.empty()) {
      out_ += "{}";
      return;
    }

    out_ += '{';
    for (size_t i = 0; i < keys.size(); ++i) {
      if (i > 0) out_ += ',';
      NewLine(depth + 1);

      google::protobuf::Value key;
      key.set_string_value(*keys[i]);
      out_ += ScalarJson(key);
      out_ += indent_ ? ": " : ":";
      Write(mapping.fields().at(*keys[i]), depth + 1);
    }
    NewLine(depth);
    out_ += '}';
  }

  void Write(const google::protobuf::Value& value, int depth) {
    if (value.kind_case() == google::protobuf::Value::kStructValue) {
      Object(value.struct_value(), depth);
      return;
    }
    if (value.kind_case() != google::protobuf::Value::kListValue) {
      out_ += ScalarJson(value);
      return;
    }

    const auto& items = value.list_value().values();
    if (items.empty()) {
      out_ += "[]";
      return;
    }
    out_ += '[';
    for (int i = 0; i < items.size(); ++i) {
      if (i > 0) out_ += ',';
      NewLine(depth + 1);
      Write(items.Get(i), depth + 1);
    }
    NewLine(depth);
    out_ += ']';
  }

  std::string Take() {
    return std::move(out_);
  }

 private:
  size_t Rank(const std::string& key) const {
    const auto it = std::find(key_order_.begin(), key_order_.end(), key);
    return static_cast<size_t>(it - key_order_.begin());
  }

  void NewLine(int depth) {
    if (!indent_) return;
    out_ += '\n';
    out_.append(static_cast<size_t>(depth) * 2, ' ');
  }

  bool                                 indent_;
  const std::vector<std::string_view>& key_order_;
  std::string                          out_;
};

} // namespace

const google::protobuf::Value& Require(const Mapping& mapping, const std::string& key) {
  auto it = mapping.fields().find(key);
  if (it == mapping.fields().end()) {
    throw std::out_of_range("missing required key '" + key + "'");
  }
  return it->second;
}

std::string RequireString(const Mapping& mapping, const std::string& key) {
  const auto& value = Require(mapping, key);
  if (value.kind_case() != google::protobuf::Value::kStringValue) {
    throw WrongKind(key, "a string", value);
  }
  return value.string_value();
}

double RequireNumber(const Mapping& mapping, const std::string& key) {
  const auto& value = Require(mapping, key);
  if (value.kind_case() != google::protobuf::Value::kNumberValue) {
    throw WrongKind(key, "a number", value);
  }
  return value.number_value();
}

std::int64_t RequireInteger(const Mapping& mapping, const std::string& key) {
  const double number = RequireNumber(mapping, key);

  // 2^63 is exactly representable; anything at or beyond it does not fit.
  constexpr double kLimit = 9223372036854775808.0;
  if (!std::isfinite(number) || std::trunc(number) != number || number >= kLimit || number < -kLimit) {
    throw std::invalid_argument("key '" + key + "' must be an integer");
  }
  return static_cast<std::int64_t>(number);
}

const Mapping& RequireMapping(const Mapping& mapping, const std::string& key) {
  const auto& value = Require(mapping, key);
  if (value.kind_case() != google::protobuf::Value::kStructValue) {
    throw WrongKind(key, "an object", value);
  }
  return value.struct_value();
}

void RejectUnknownKeys(const Mapping& mapping, std::initializer_list<std::string_view> known) {
  for (const auto& [key, value] : mapping.fields()) {
    bool found = false;
    for (auto k : known) {
      if (k == key) {
        found = true;
        break;
      }
    }
    if (!found) {
      throw std::invalid_argument("unexpected key '" + key + "'");
    }
  }
}

void SetString(Mapping* mapping, const std::string& key, const std::string& value) {
  (*mapping->mutable_fields())[key].set_string_value(value);
}

void SetNumber(Mapping* mapping, const std::string& key, double value) {
  (*mapping->mutable_fields())[key].set_number_value(value);
}

std::string ToJson(const Mapping& mapping, bool indent, const std::vector<std::string_view>& key_order) {
  JsonWriter writer(indent, key_order);
  writer.Object(mapping, 0);
  return writer.Take();
}

Mapping MappingFromJson(const std::string& json) {
  Mapping mapping;
  auto    status = google::protobuf::util::JsonStringToMessage(json, &mapping);
  if (!status.ok()) {
    throw std::invalid_argument("invalid JSON object: " + std::string(status.message()));
  }
  return mapping;
}

bool Equals(const Mapping& a, const Mapping& b) {
  return google::protobuf::util::MessageDifferencer::Equals(a, b);
}

} // namespace rfshared::model
