#pragma once

#include <future>
#include <mutex>
#include <string>

#include "internal/bus/connection_manager.hpp"
#include "internal/model/metadata_record.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transport/transport.hpp"

namespace rfshared::bus {

/*
  Publishing side of the bus.

  Messages go to the persistent stream capturing the subject; the stream
  position the broker acknowledges with is logged, not returned.
*/
class Producer {
 public:
  Producer(observability::LoggerPtr logger, transport::TransportPtr transport, std::string subject);
  ~Producer();

  Producer(const Producer&)            = delete;
  Producer& operator=(const Producer&) = delete;

  // Logs and rethrows transport failures.
  std::future<void> Connect(transport::ConnectOptions options);

  // Idempotent.
  void Close();

  // util::ConnectionStateError before a successful Connect().
  std::future<void> PublishRaw(std::string subject, std::string data);

  // Wraps the record in a fresh Envelope and publishes it on subject().
  std::future<void> PublishMetadata(const model::MetadataRecord& record);

  const std::string& subject() const {
    return subject_;
  }

  bool IsConnected() const;

 private:
  void Publish(const std::string& subject, const std::string& data);

  observability::LoggerPtr logger_;
  ConnectionManager        conn_;
  std::string              subject_;

  mutable std::mutex mutex_;
  std::string        servers_;
};

} // namespace rfshared::bus
