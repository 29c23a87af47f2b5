#pragma once

#include <chrono>
#include <string>

#include "internal/model/metadata_record.hpp"
#include "internal/util/time.hpp"

namespace rfshared::testing {

inline model::MetadataRecord SampleRecord(const std::string& checksum = "d41d8cd98f00b204e9800998ecf8427e") {
  model::MetadataRecord::Fields f;
  f.hostname      = "edge-01";
  f.timestamp     = util::FromCivil(2024, 4, 2, 23, 14, 50, 9919);
  f.source_path   = "/data/iq/edge-01/20240402T231450.iq";
  f.serial        = "31E8A9B";
  f.organization  = "rf-lab";
  f.gcs           = "39.7392,-104.9903";
  f.group         = "survey-a";
  f.frequency     = 915000000;
  f.interval      = 60;
  f.length        = 10.5;
  f.gain          = 40;
  f.sampling_rate = 20000000;
  f.bit_depth     = 16;
  f.checksum      = checksum;
  return model::MetadataRecord(std::move(f));
}

} // namespace rfshared::testing
