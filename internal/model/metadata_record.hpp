#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/mapping.hpp"
#include "internal/util/time.hpp"

namespace rfshared::model {

/*
  Metadata for a single IQ recording.

  Created once at the edge when a recording completes and never mutated
  afterwards; With*() helpers return a modified copy. `checksum` is the digest
  of the bytes at `source_path` when the record was made. The record itself
  never reads that file: callers compute a digest and hand it to
  ValidateChecksum().
*/
class MetadataRecord {
 public:
  struct Fields {
    // identity
    std::string           hostname;
    util::Timestamp       timestamp;
    std::filesystem::path source_path;
    std::string           serial;

    // grouping and location
    std::string organization;
    std::string gcs;
    std::string group;

    // radio settings
    std::int64_t frequency     = 0; // Hz
    std::int64_t interval      = 0; // seconds
    double       length        = 0; // seconds
    std::int64_t gain          = 0;
    std::int64_t sampling_rate = 0; // Hz
    std::int64_t bit_depth     = 0;

    std::string checksum;
  };

  // Integer fields travel as JSON numbers (doubles); beyond this magnitude
  // they no longer round-trip exactly.
  static constexpr std::int64_t kMaxExactInteger = std::int64_t{1} << 53;

  // Throws std::invalid_argument when an integer field exceeds kMaxExactInteger.
  explicit MetadataRecord(Fields fields);

  const Fields& fields() const {
    return fields_;
  }

  const std::string& hostname() const {
    return fields_.hostname;
  }
  const util::Timestamp& timestamp() const {
    return fields_.timestamp;
  }
  const std::filesystem::path& source_path() const {
    return fields_.source_path;
  }
  const std::string& serial() const {
    return fields_.serial;
  }
  const std::string& organization() const {
    return fields_.organization;
  }
  const std::string& gcs() const {
    return fields_.gcs;
  }
  const std::string& group() const {
    return fields_.group;
  }
  std::int64_t frequency() const {
    return fields_.frequency;
  }
  std::int64_t interval() const {
    return fields_.interval;
  }
  double length() const {
    return fields_.length;
  }
  std::int64_t gain() const {
    return fields_.gain;
  }
  std::int64_t sampling_rate() const {
    return fields_.sampling_rate;
  }
  std::int64_t bit_depth() const {
    return fields_.bit_depth;
  }
  const std::string& checksum() const {
    return fields_.checksum;
  }

  MetadataRecord WithChecksum(std::string checksum) const;

  // All fields; timestamp as ISO-8601 with offset and microseconds.
  Mapping ToMapping() const;

  // Mapping keys in declaration order; JSON output follows it.
  static const std::vector<std::string_view>& KeyOrder();

  std::string ToJson(bool indent = false) const;

  // Throws util::MetadataParsingError (cause nested) on any malformed input.
  static MetadataRecord FromMapping(const Mapping& mapping);

  // Indented JSON sidecar file, written atomically.
  void WriteToFile(const std::filesystem::path& path) const;

  static MetadataRecord ReadFromFile(const std::filesystem::path& path);

  // Throws util::ChecksumMismatchError when `computed` differs from checksum().
  void ValidateChecksum(const std::string& computed) const;

  bool operator==(const MetadataRecord& other) const;
  bool operator!=(const MetadataRecord& other) const {
    return !(*this == other);
  }

 private:
  Fields fields_;
};

} // namespace rfshared::model
