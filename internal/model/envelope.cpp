#include "envelope.hpp"

#include <exception>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "internal/util/errors.hpp"

namespace rfshared::model {

namespace {

constexpr const char* kSourcePath = "source_path";
constexpr const char* kPayload    = "payload";
constexpr const char* kMessageId  = "message_id";

} // namespace

Envelope::Envelope(std::filesystem::path source_path, Mapping payload, util::UUID message_id)
    : source_path_(std::move(source_path)), payload_(std::move(payload)), message_id_(message_id) {
}

Envelope Envelope::FromRecord(const MetadataRecord& record) {
  return Envelope(record.source_path(), record.ToMapping(), util::GenerateUUID());
}

Envelope Envelope::FromMapping(const Mapping& mapping) {
  try {
    RejectUnknownKeys(mapping, {kSourcePath, kPayload, kMessageId});

    auto source_path = RequireString(mapping, kSourcePath);
    if (source_path.empty()) {
      throw std::invalid_argument("key 'source_path' must not be empty");
    }
    const auto& payload    = RequireMapping(mapping, kPayload);
    const auto  message_id = util::FromString(RequireString(mapping, kMessageId));

    return Envelope(std::move(source_path), payload, message_id);
  } catch (const std::invalid_argument& e) {
    std::throw_with_nested(util::EnvelopeParsingError(std::string("malformed envelope: ") + e.what()));
  } catch (const std::out_of_range& e) {
    std::throw_with_nested(util::EnvelopeParsingError(std::string("malformed envelope: ") + e.what()));
  }
}

Envelope Envelope::FromJson(const std::string& json) {
  Mapping mapping;
  try {
    mapping = MappingFromJson(json);
  } catch (const std::invalid_argument& e) {
    std::throw_with_nested(util::EnvelopeParsingError(std::string("malformed envelope: ") + e.what()));
  }
  return FromMapping(mapping);
}

Mapping Envelope::ToMapping() const {
  Mapping m;
  SetString(&m, kSourcePath, source_path_.string());
  *(*m.mutable_fields())[kPayload].mutable_struct_value() = payload_;
  SetString(&m, kMessageId, util::ToString(message_id_));
  return m;
}

std::string Envelope::ToJson() const {
  // envelope keys first; the record's own order applies inside the payload
  static const std::vector<std::string_view> order = [] {
    std::vector<std::string_view> keys{kSourcePath, kPayload, kMessageId};
    const auto&                   record_keys = MetadataRecord::KeyOrder();
    keys.insert(keys.end(), record_keys.begin(), record_keys.end());
    return keys;
  }();
  return model::ToJson(ToMapping(), /*indent=*/false, order);
}

bool Envelope::operator==(const Envelope& other) const {
  return message_id_ == other.message_id_ && source_path_ == other.source_path_ && Equals(payload_, other.payload_);
}

} // namespace rfshared::model
