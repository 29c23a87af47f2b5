#include "metadata_record.hpp"

#include <exception>
#include <stdexcept>
#include <string>

#include "internal/util/arrow_io.hpp"
#include "internal/util/errors.hpp"

namespace rfshared::model {

namespace {

constexpr const char* kHostname     = "hostname";
constexpr const char* kTimestamp    = "timestamp";
constexpr const char* kSourcePath   = "source_path";
constexpr const char* kSerial       = "serial";
constexpr const char* kOrganization = "organization";
constexpr const char* kGcs          = "gcs";
constexpr const char* kGroup        = "group";
constexpr const char* kFrequency    = "frequency";
constexpr const char* kInterval     = "interval";
constexpr const char* kLength       = "length";
constexpr const char* kGain         = "gain";
constexpr const char* kSamplingRate = "sampling_rate";
constexpr const char* kBitDepth     = "bit_depth";
constexpr const char* kChecksum     = "checksum";

MetadataRecord::Fields ParseFields(const Mapping& mapping) {
  RejectUnknownKeys(mapping, {kHostname, kTimestamp, kSourcePath, kSerial, kOrganization, kGcs, kGroup, kFrequency, kInterval, kLength,
                              kGain, kSamplingRate, kBitDepth, kChecksum});

  MetadataRecord::Fields f;
  f.hostname  = RequireString(mapping, kHostname);
  f.timestamp = util::ParseIso8601(RequireString(mapping, kTimestamp));

  const auto path = RequireString(mapping, kSourcePath);
  if (path.empty()) {
    throw std::invalid_argument("key 'source_path' must not be empty");
  }
  f.source_path = path;

  f.serial        = RequireString(mapping, kSerial);
  f.organization  = RequireString(mapping, kOrganization);
  f.gcs           = RequireString(mapping, kGcs);
  f.group         = RequireString(mapping, kGroup);
  f.frequency     = RequireInteger(mapping, kFrequency);
  f.interval      = RequireInteger(mapping, kInterval);
  f.length        = RequireNumber(mapping, kLength);
  f.gain          = RequireInteger(mapping, kGain);
  f.sampling_rate = RequireInteger(mapping, kSamplingRate);
  f.bit_depth     = RequireInteger(mapping, kBitDepth);
  f.checksum      = RequireString(mapping, kChecksum);
  return f;
}

void RequireExact(const char* key, std::int64_t value) {
  if (value > MetadataRecord::kMaxExactInteger || value < -MetadataRecord::kMaxExactInteger) {
    throw std::invalid_argument("key '" + std::string(key) + "' is outside the exact integer range (+/-2^53): " + std::to_string(value));
  }
}

} // namespace

MetadataRecord::MetadataRecord(Fields fields) : fields_(std::move(fields)) {
  RequireExact(kFrequency, fields_.frequency);
  RequireExact(kInterval, fields_.interval);
  RequireExact(kGain, fields_.gain);
  RequireExact(kSamplingRate, fields_.sampling_rate);
  RequireExact(kBitDepth, fields_.bit_depth);
}

MetadataRecord MetadataRecord::WithChecksum(std::string checksum) const {
  Fields copy   = fields_;
  copy.checksum = std::move(checksum);
  return MetadataRecord(std::move(copy));
}

Mapping MetadataRecord::ToMapping() const {
  Mapping m;
  SetString(&m, kHostname, fields_.hostname);
  SetString(&m, kTimestamp, util::FormatIso8601(fields_.timestamp));
  SetString(&m, kSourcePath, fields_.source_path.string());
  SetString(&m, kSerial, fields_.serial);
  SetString(&m, kOrganization, fields_.organization);
  SetString(&m, kGcs, fields_.gcs);
  SetString(&m, kGroup, fields_.group);
  SetNumber(&m, kFrequency, static_cast<double>(fields_.frequency));
  SetNumber(&m, kInterval, static_cast<double>(fields_.interval));
  SetNumber(&m, kLength, fields_.length);
  SetNumber(&m, kGain, static_cast<double>(fields_.gain));
  SetNumber(&m, kSamplingRate, static_cast<double>(fields_.sampling_rate));
  SetNumber(&m, kBitDepth, static_cast<double>(fields_.bit_depth));
  SetString(&m, kChecksum, fields_.checksum);
  return m;
}

const std::vector<std::string_view>& MetadataRecord::KeyOrder() {
  static const std::vector<std::string_view> order{kHostname, kTimestamp, kSourcePath, kSerial,       kOrganization, kGcs,      kGroup,
                                                   kFrequency, kInterval, kLength,     kGain, kSamplingRate, kBitDepth,    kChecksum};
  return order;
}

std::string MetadataRecord::ToJson(bool indent) const {
  return model::ToJson(ToMapping(), indent, KeyOrder());
}

MetadataRecord MetadataRecord::FromMapping(const Mapping& mapping) {
  try {
    return MetadataRecord(ParseFields(mapping));
  } catch (const std::invalid_argument& e) {
    std::throw_with_nested(util::MetadataParsingError(std::string("malformed metadata record: ") + e.what()));
  } catch (const std::out_of_range& e) {
    std::throw_with_nested(util::MetadataParsingError(std::string("malformed metadata record: ") + e.what()));
  }
}

void MetadataRecord::WriteToFile(const std::filesystem::path& path) const {
  util::WriteFileAtomic(path, ToJson(/*indent=*/true));
}

MetadataRecord MetadataRecord::ReadFromFile(const std::filesystem::path& path) {
  const auto json = util::ReadFileToString(path);

  Mapping mapping;
  try {
    mapping = MappingFromJson(json);
  } catch (const std::invalid_argument& e) {
    std::throw_with_nested(util::MetadataParsingError("malformed metadata file " + path.string() + ": " + e.what()));
  }
  return FromMapping(mapping);
}

void MetadataRecord::ValidateChecksum(const std::string& computed) const {
  if (computed != fields_.checksum) {
    throw util::ChecksumMismatchError(fields_.source_path.string(), fields_.checksum, computed);
  }
}

bool MetadataRecord::operator==(const MetadataRecord& other) const {
  const auto& a = fields_;
  const auto& b = other.fields_;
  return a.hostname == b.hostname && a.timestamp == b.timestamp && a.source_path == b.source_path && a.serial == b.serial &&
         a.organization == b.organization && a.gcs == b.gcs && a.group == b.group && a.frequency == b.frequency && a.interval == b.interval &&
         a.length == b.length && a.gain == b.gain && a.sampling_rate == b.sampling_rate && a.bit_depth == b.bit_depth &&
         a.checksum == b.checksum;
}

} // namespace rfshared::model
