#include "internal/model/metadata_record.hpp"

#include <cassert>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/checksum/checksum.hpp"
#include "internal/model/iq_statistics.hpp"
#include "internal/util/errors.hpp"
#include "tests/common/sample_record.hpp"

namespace {

using rfshared::model::Mapping;
using rfshared::model::MetadataRecord;
using rfshared::testing::SampleRecord;
using rfshared::util::MetadataParsingError;

std::filesystem::path TestDir() {
  const auto dir = std::filesystem::temp_directory_path() / "rfshared_metadata_record_tests";
  std::filesystem::create_directories(dir);
  return dir;
}

void TestMappingHasEveryField() {
  const auto mapping = SampleRecord().ToMapping();
  assert(mapping.fields_size() == 14);

  assert(mapping.fields().at("hostname").string_value() == "edge-01");
  assert(mapping.fields().at("timestamp").string_value() == "2024-04-02T23:14:50.009919+00:00");
  assert(mapping.fields().at("source_path").string_value() == "/data/iq/edge-01/20240402T231450.iq");
  assert(mapping.fields().at("frequency").number_value() == 915000000);
  assert(mapping.fields().at("length").number_value() == 10.5);
  assert(mapping.fields().at("checksum").string_value() == "d41d8cd98f00b204e9800998ecf8427e");
}

void TestMappingRoundTrip() {
  const auto record = SampleRecord();
  assert(MetadataRecord::FromMapping(record.ToMapping()) == record);

  auto fields      = record.fields();
  fields.timestamp = rfshared::util::FromCivil(2023, 12, 31, 19, 0, 0, 1, std::chrono::minutes(-300));
  const MetadataRecord offset_record(fields);
  const auto           back = MetadataRecord::FromMapping(offset_record.ToMapping());
  assert(back == offset_record);
  assert(back.timestamp().utc_offset == std::chrono::minutes(-300));
}

void TestMissingKeyRaisesParsingError() {
  const std::vector<std::string> keys{"hostname", "timestamp",     "source_path", "serial",    "organization", "gcs",  "group",
                                      "frequency", "interval", "length",  "gain", "sampling_rate", "bit_depth", "checksum"};
  assert(keys.size() == MetadataRecord::KeyOrder().size());

  for (const auto& key : keys) {
    auto mapping = SampleRecord().ToMapping();
    assert(mapping.mutable_fields()->erase(key) == 1);

    bool threw = false;
    try {
      (void)MetadataRecord::FromMapping(mapping);
    } catch (const MetadataParsingError& e) {
      threw = true;
      assert(std::string(e.what()).find("'" + key + "'") != std::string::npos);
      assert(rfshared::util::RootCause(e).find("missing required key") != std::string::npos);
    }
    assert(threw);
  }
}

void TestWrongShapesRaiseParsingError() {
  auto bad_timestamp = SampleRecord().ToMapping();
  (*bad_timestamp.mutable_fields())["timestamp"].set_string_value("not a timestamp");

  auto fractional = SampleRecord().ToMapping();
  (*fractional.mutable_fields())["gain"].set_number_value(40.5);

  auto wrong_kind = SampleRecord().ToMapping();
  (*wrong_kind.mutable_fields())["hostname"].set_number_value(1);

  auto extra = SampleRecord().ToMapping();
  (*extra.mutable_fields())["unexpected"].set_string_value("x");

  for (const auto& mapping : {bad_timestamp, fractional, wrong_kind, extra}) {
    bool threw = false;
    try {
      (void)MetadataRecord::FromMapping(mapping);
    } catch (const MetadataParsingError&) {
      threw = true;
    }
    assert(threw);
  }
}

void TestIntegerFieldsStayExact() {
  constexpr std::int64_t kLimit = MetadataRecord::kMaxExactInteger;

  auto fields          = SampleRecord().fields();
  fields.frequency     = kLimit;
  fields.sampling_rate = -kLimit;
  const MetadataRecord edge(fields);

  const auto back = MetadataRecord::FromMapping(edge.ToMapping());
  assert(back == edge);
  assert(back.frequency() == kLimit);

  for (const std::int64_t value : {kLimit + 1, -kLimit - 1, std::numeric_limits<std::int64_t>::max()}) {
    auto too_big      = SampleRecord().fields();
    too_big.frequency = value;

    bool threw = false;
    try {
      (void)MetadataRecord(too_big);
    } catch (const std::invalid_argument& e) {
      threw = true;
      assert(std::string(e.what()).find("frequency") != std::string::npos);
    }
    assert(threw);
  }

  // a JSON number past the exact range is rejected, not silently rounded
  auto mapping = SampleRecord().ToMapping();
  (*mapping.mutable_fields())["gain"].set_number_value(1152921504606846976.0); // 2^60

  bool threw = false;
  try {
    (void)MetadataRecord::FromMapping(mapping);
  } catch (const MetadataParsingError&) {
    threw = true;
  }
  assert(threw);
}

void TestJsonKeysFollowDeclarationOrder() {
  const auto record = SampleRecord();
  const auto json   = record.ToJson(/*indent=*/true);
  assert(json == record.ToJson(/*indent=*/true));
  assert(json.rfind("{\n  \"hostname\": \"edge-01\",\n", 0) == 0);

  size_t last = 0;
  for (const auto key : MetadataRecord::KeyOrder()) {
    const auto at = json.find("\"" + std::string(key) + "\"");
    assert(at != std::string::npos);
    assert(at >= last);
    last = at;
  }

  const auto compact = record.ToJson();
  assert(compact.find('\n') == std::string::npos);
  assert(compact.find("\"frequency\":915000000,\"interval\":60,\"length\":10.5") != std::string::npos);
  assert(MetadataRecord::FromMapping(rfshared::model::MappingFromJson(compact)) == record);
}

void TestValidateChecksum() {
  const auto digest = rfshared::checksum::Digest("payload");
  const auto record = SampleRecord(digest);

  record.ValidateChecksum(digest);

  bool threw = false;
  try {
    record.ValidateChecksum("wrong");
  } catch (const rfshared::util::ChecksumMismatchError& e) {
    threw                    = true;
    const std::string what   = e.what();
    assert(what.find("'wrong'") != std::string::npos);
    assert(what.find(digest) != std::string::npos);
    assert(what.find(record.source_path().string()) != std::string::npos);
    assert(e.expected() == digest);
    assert(e.actual() == "wrong");
  }
  assert(threw);
}

void TestFileRoundTrip() {
  const auto path   = TestDir() / "record.json";
  const auto record = SampleRecord();

  record.WriteToFile(path);
  assert(!std::filesystem::exists(path.string() + ".tmp"));

  std::ifstream     in(path);
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(text.find('\n') != std::string::npos);

  assert(MetadataRecord::ReadFromFile(path) == record);
}

void TestMalformedFileRaisesParsingError() {
  const auto path = TestDir() / "broken.json";
  {
    std::ofstream out(path);
    out << "{\"hostname\": ";
  }

  bool threw = false;
  try {
    (void)MetadataRecord::ReadFromFile(path);
  } catch (const MetadataParsingError&) {
    threw = true;
  }
  assert(threw);

  bool missing = false;
  try {
    (void)MetadataRecord::ReadFromFile(TestDir() / "absent.json");
  } catch (const std::filesystem::filesystem_error&) {
    missing = true;
  }
  assert(missing);
}

void TestWithChecksumCopies() {
  const auto record  = SampleRecord("aaa");
  const auto updated = record.WithChecksum("bbb");
  assert(record.checksum() == "aaa");
  assert(updated.checksum() == "bbb");
  assert(updated != record);
  assert(updated.WithChecksum("aaa") == record);
}

void TestIQStatisticsIsPlainValue() {
  rfshared::model::IQStatistics stats{0.5, 1.0, 0.25, 0.1, 3.0};
  const auto                    copy = stats;
  assert(copy.average == 0.5 && copy.max == 1.0 && copy.median == 0.25 && copy.stddev == 0.1 && copy.kurtosis == 3.0);
}

} // namespace

int main() {
  TestMappingHasEveryField();
  TestMappingRoundTrip();
  TestMissingKeyRaisesParsingError();
  TestWrongShapesRaiseParsingError();
  TestIntegerFieldsStayExact();
  TestJsonKeysFollowDeclarationOrder();
  TestValidateChecksum();
  TestFileRoundTrip();
  TestMalformedFileRaisesParsingError();
  TestWithChecksumCopies();
  TestIQStatisticsIsPlainValue();

  std::cout << "rfshared_unit_metadata_record: pass\n";
  return 0;
}
