#include "producer.hpp"

#include <stdexcept>
#include <utility>

#include "internal/model/envelope.hpp"

namespace rfshared::bus {

using observability::IntField;
using observability::StringField;

Producer::Producer(observability::LoggerPtr logger, transport::TransportPtr transport, std::string subject)
    : logger_(std::move(logger)), conn_(std::move(transport)), subject_(std::move(subject)) {
  if (!logger_) {
    throw std::invalid_argument("producer: logger is required");
  }
}

Producer::~Producer() {
  Close();
}

std::future<void> Producer::Connect(transport::ConnectOptions options) {
  return std::async(std::launch::async, [this, options = std::move(options)] {
    std::string servers;
    for (const auto& server : options.servers) {
      if (!servers.empty()) servers += ",";
      servers += server;
    }

    try {
      conn_.Connect(options, /*jetstream=*/true);
    } catch (const std::exception& e) {
      logger_->Error("Unexpected error connecting to broker", {StringField("servers", servers), StringField("error", e.what())});
      throw;
    }

    {
      std::lock_guard lock(mutex_);
      servers_ = servers;
    }
    logger_->Info("Connected to broker", {StringField("servers", servers)});
  });
}

void Producer::Close() {
  const bool was_connected = conn_.state() == ConnectionManager::State::kConnected;
  conn_.Close();

  if (was_connected) {
    std::lock_guard lock(mutex_);
    logger_->Info("Producer connection closed", {StringField("servers", servers_)});
  }
}

void Producer::Publish(const std::string& subject, const std::string& data) {
  // ConnectionStateError before connect
  auto context = conn_.JetStream();
  auto ack     = context->Publish(subject, data);

  logger_->Debug("Published message", {StringField("subject", subject), StringField("stream", ack.stream),
                                       IntField("sequence", static_cast<std::int64_t>(ack.sequence))});
}

std::future<void> Producer::PublishRaw(std::string subject, std::string data) {
  return std::async(std::launch::async,
                    [this, subject = std::move(subject), data = std::move(data)] { Publish(subject, data); });
}

std::future<void> Producer::PublishMetadata(const model::MetadataRecord& record) {
  return std::async(std::launch::async, [this, record] {
    const auto envelope = model::Envelope::FromRecord(record);
    Publish(subject_, envelope.ToJson());
  });
}

bool Producer::IsConnected() const {
  return conn_.IsConnected();
}

} // namespace rfshared::bus
