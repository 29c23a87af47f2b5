#pragma once

#include <filesystem>
#include <string>

#include "internal/model/mapping.hpp"
#include "internal/model/metadata_record.hpp"
#include "internal/util/uuid.hpp"

namespace rfshared::model {

/*
  Wire-level wrapper around a serialized payload.

  `message_id` is a transport identity minted when the envelope is built; it
  is never derived from the payload, so two envelopes around identical
  records compare unequal. Producers only build envelopes via FromRecord();
  FromMapping()/FromJson() rebuild received ones.

  Wire form:
    {"source_path": "...", "payload": {...}, "message_id": "<uuid>"}
*/
class Envelope {
 public:
  static Envelope FromRecord(const MetadataRecord& record);

  // Throws util::EnvelopeParsingError (cause nested).
  static Envelope FromMapping(const Mapping& mapping);
  static Envelope FromJson(const std::string& json);

  Mapping     ToMapping() const;
  std::string ToJson() const;

  const std::filesystem::path& source_path() const {
    return source_path_;
  }
  const Mapping& payload() const {
    return payload_;
  }
  const util::UUID& message_id() const {
    return message_id_;
  }

  bool operator==(const Envelope& other) const;
  bool operator!=(const Envelope& other) const {
    return !(*this == other);
  }

 private:
  Envelope(std::filesystem::path source_path, Mapping payload, util::UUID message_id);

  std::filesystem::path source_path_;
  Mapping               payload_;
  util::UUID            message_id_;
};

} // namespace rfshared::model
