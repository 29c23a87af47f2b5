#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

#include "internal/bus/consumer.hpp"
#include "internal/bus/producer.hpp"
#include "internal/checksum/checksum.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/envelope.hpp"
#include "internal/model/metadata_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

using rfshared::model::Envelope;
using rfshared::model::MetadataRecord;
using rfshared::runtime::config::RuntimeConfig;

namespace {

constexpr std::chrono::milliseconds kDefaultFetchTimeout{3000};

void Usage() {
  std::cout << "Usage:\n"
            << "  rfctl checksum <file>\n"
            << "  rfctl validate <metadata.json> <data-file>\n"
            << "  rfctl publish <config.yaml> <metadata.json>\n"
            << "  rfctl fetch <config.yaml> [count]\n";
}

int Checksum(const std::string& path) {
  std::cout << rfshared::checksum::DigestOfFile(path) << "\n";
  return 0;
}

int Validate(const std::string& metadata_path, const std::string& data_path) {
  const auto record = MetadataRecord::ReadFromFile(metadata_path);
  try {
    record.ValidateChecksum(rfshared::checksum::DigestOfFile(data_path));
  } catch (const rfshared::util::ChecksumMismatchError& e) {
    std::cerr << e.what() << "\n";
    return 3;
  }

  std::cout << "ok " << record.checksum() << "\n";
  return 0;
}

int Publish(const RuntimeConfig& config, const std::string& metadata_path) {
  auto logger    = rfshared::observability::MakeLogger("rfctl", config.logging());
  auto transport = rfshared::factory::MakeTransport(config.connection(), config.broker(), logger);

  const auto record = MetadataRecord::ReadFromFile(metadata_path);

  rfshared::bus::Producer producer(logger, transport, config.producer().subject());
  producer.Connect(rfshared::config::ToConnectOptions(config.connection())).get();
  producer.PublishMetadata(record).get();
  producer.Close();

  std::cout << "published " << record.source_path().string() << " on " << producer.subject() << "\n";
  return 0;
}

int Fetch(const RuntimeConfig& config, int count) {
  auto logger    = rfshared::observability::MakeLogger("rfctl", config.logging());
  auto transport = rfshared::factory::MakeTransport(config.connection(), config.broker(), logger);

  const auto& consumer_config = config.consumer();
  const auto  timeout =
      consumer_config.fetch_timeout_ms() > 0 ? std::chrono::milliseconds(consumer_config.fetch_timeout_ms()) : kDefaultFetchTimeout;

  rfshared::bus::Consumer consumer(logger, transport);
  consumer.Connect(rfshared::config::ToConnectOptions(config.connection())).get();

  auto fetch = consumer.JetstreamSubscribe(consumer_config.stream(), consumer_config.subject(), consumer_config.durable()).get();

  int received = 0;
  for (int i = 0; i < count; ++i) {
    auto message = fetch(timeout).get();
    if (!message) break;

    // parse failures leave the message unacked for redelivery
    const auto envelope = Envelope::FromJson(message->data());
    const auto record   = MetadataRecord::FromMapping(envelope.payload());

    std::cout << record.ToJson(/*indent=*/true) << "\n";
    message->Ack();
    ++received;
  }

  consumer.Close();

  if (received == 0) {
    std::cerr << "no message within " << timeout.count() << " ms\n";
    return 4;
  }
  return 0;
}

} // namespace

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string cmd = argv[1];

  try {
    if (cmd == "checksum") {
      return Checksum(argv[2]);
    }

    if (cmd == "validate") {
      if (argc < 4) {
        Usage();
        return 1;
      }
      return Validate(argv[2], argv[3]);
    }

    if (cmd == "publish") {
      if (argc < 4) {
        Usage();
        return 1;
      }
      return Publish(rfshared::config::ConfigLoader::LoadFromYaml(argv[2]), argv[3]);
    }

    if (cmd == "fetch") {
      const int count = argc >= 4 ? std::atoi(argv[3]) : 1;
      if (count <= 0) {
        std::cerr << "count must be positive\n";
        return 1;
      }
      return Fetch(rfshared::config::ConfigLoader::LoadFromYaml(argv[2]), count);
    }
  } catch (const std::exception& e) {
    std::cerr << e.what() << "\n";
    const auto cause = rfshared::util::RootCause(e);
    if (cause != e.what()) {
      std::cerr << "  caused by: " << cause << "\n";
    }
    return 2;
  }

  Usage();
  return 1;
}
