#include "memory_transport.hpp"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <vector>

#include "internal/transport/server_url.hpp"
#include "internal/util/errors.hpp"

namespace rfshared::transport {

namespace {

using Alive = std::shared_ptr<std::atomic<bool>>;

void RequireAlive(const Alive& alive, const char* op) {
  if (!alive->load()) {
    throw util::TransportError(std::string(op) + ": connection closed");
  }
}

class MemorySubscription final : public Subscription {
 public:
  MemorySubscription(std::weak_ptr<broker::MemoryBroker> broker, broker::MemoryBroker::SubscriberId id, std::string subject)
      : broker_(std::move(broker)), id_(id), subject_(std::move(subject)) {
  }

  ~MemorySubscription() override {
    Unsubscribe();
  }

  void Unsubscribe() override {
    if (auto broker = broker_.lock()) {
      broker->Unsubscribe(id_);
    }
  }

  const std::string& subject() const override {
    return subject_;
  }

 private:
  std::weak_ptr<broker::MemoryBroker> broker_;
  broker::MemoryBroker::SubscriberId  id_;
  std::string                         subject_;
};

class MemoryPullSubscription final : public PullSubscription {
 public:
  MemoryPullSubscription(std::shared_ptr<broker::MemoryBroker> broker, Alive alive, std::string stream, std::string durable)
      : broker_(std::move(broker)), alive_(std::move(alive)), stream_(std::move(stream)), durable_(std::move(durable)) {
  }

  std::optional<InboundMessage> Fetch(std::chrono::milliseconds timeout) override {
    RequireAlive(alive_, "fetch");
    if (unsubscribed_) {
      throw util::TransportError("fetch: subscription closed");
    }

    auto delivery = broker_->Fetch(stream_, durable_, timeout);
    if (!delivery) return std::nullopt;

    std::weak_ptr<broker::MemoryBroker> weak = broker_;
    InboundMessage                      message;
    message.subject = delivery->subject;
    message.data    = std::move(delivery->data);
    message.ack     = [weak, stream = stream_, durable = durable_, sequence = delivery->sequence] {
      auto broker = weak.lock();
      if (!broker) {
        throw util::TransportError("ack: broker is gone");
      }
      broker->Ack(stream, durable, sequence);
    };
    return message;
  }

  // The durable consumer stays on the stream.
  void Unsubscribe() override {
    unsubscribed_ = true;
  }

 private:
  std::shared_ptr<broker::MemoryBroker> broker_;
  Alive                                 alive_;
  std::string                           stream_;
  std::string                           durable_;
  std::atomic<bool>                     unsubscribed_{false};
};

class MemoryStreamContext final : public StreamContext {
 public:
  MemoryStreamContext(std::shared_ptr<broker::MemoryBroker> broker, Alive alive)
      : broker_(std::move(broker)), alive_(std::move(alive)) {
  }

  PublishAck Publish(const std::string& subject, const std::string& data) override {
    RequireAlive(alive_, "publish");

    auto ack = broker_->Publish(subject, data);
    if (!ack) {
      throw util::NotFound("publish: no stream captures subject '" + subject + "'");
    }
    return *ack;
  }

  std::unique_ptr<PullSubscription> PullSubscribe(const std::string& stream, const std::string& subject,
                                                  const std::string& durable) override {
    RequireAlive(alive_, "pull subscribe");

    broker_->EnsureConsumer(stream, durable, subject);
    return std::make_unique<MemoryPullSubscription>(broker_, alive_, stream, durable);
  }

 private:
  std::shared_ptr<broker::MemoryBroker> broker_;
  Alive                                 alive_;
};

class MemoryConnection final : public Connection {
 public:
  explicit MemoryConnection(std::shared_ptr<broker::MemoryBroker> broker)
      : broker_(std::move(broker)), alive_(std::make_shared<std::atomic<bool>>(true)) {
  }

  ~MemoryConnection() override {
    Close();
  }

  void Publish(const std::string& subject, const std::string& data) override {
    RequireAlive(alive_, "publish");
    broker_->Publish(subject, data);
  }

  std::unique_ptr<Subscription> Subscribe(const std::string& subject, MessageHandler handler) override {
    RequireAlive(alive_, "subscribe");

    const auto id = broker_->Subscribe(subject, [handler = std::move(handler)](const broker::Delivery& delivery) {
      handler(InboundMessage{delivery.subject, delivery.data, {}});
    });

    {
      std::lock_guard lock(mutex_);
      subscriber_ids_.push_back(id);
    }
    return std::make_unique<MemorySubscription>(broker_, id, subject);
  }

  std::shared_ptr<StreamContext> JetStream() override {
    RequireAlive(alive_, "stream context");
    return std::make_shared<MemoryStreamContext>(broker_, alive_);
  }

  bool IsConnected() const override {
    return alive_->load();
  }

  void Close() override {
    if (!alive_->exchange(false)) return;

    std::vector<broker::MemoryBroker::SubscriberId> ids;
    {
      std::lock_guard lock(mutex_);
      ids.swap(subscriber_ids_);
    }
    for (const auto id : ids) {
      broker_->Unsubscribe(id);
    }
  }

 private:
  std::shared_ptr<broker::MemoryBroker> broker_;
  Alive                                 alive_;

  std::mutex                                      mutex_;
  std::vector<broker::MemoryBroker::SubscriberId> subscriber_ids_;
};

} // namespace

MemoryTransport::MemoryTransport(std::shared_ptr<broker::MemoryBroker> broker) : broker_(std::move(broker)) {
  if (!broker_) {
    throw std::invalid_argument("memory transport: broker is required");
  }
}

std::unique_ptr<Connection> MemoryTransport::Connect(const ConnectOptions& options) {
  ConnectOptions resolved = options;

  for (const auto& server : options.servers) {
    ServerUrl url;
    try {
      url = ParseServerUrl(server);
    } catch (const std::invalid_argument& e) {
      throw util::TransportError(std::string("connect: ") + e.what());
    }
    if (url.scheme != "memory") {
      throw util::TransportError("connect: memory transport cannot reach '" + server + "'");
    }
    resolved = WithUrlCredentials(std::move(resolved), url);
  }

  broker_->Authenticate(resolved);
  return std::make_unique<MemoryConnection>(broker_);
}

} // namespace rfshared::transport
