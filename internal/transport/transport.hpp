#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace rfshared::transport {

/*
  Broker transport abstraction.

  The messaging layer talks to the broker only through these interfaces.
  Calls are synchronous and may block; the bus layer (Consumer/Producer)
  runs them on futures. Failures are reported as util::TransportError.

  Implementations:
    memory → in-process MemoryBroker (tests, single-process pipelines)
    grpc   → rf-broker over the rfshared.bus.v1.MessageBus service
*/

struct ConnectOptions {
  std::vector<std::string> servers;
  std::string              name;

  // auth: user/password or token, whichever the broker expects
  std::string user;
  std::string password;
  std::string token;
};

/*
  A message as delivered by the transport. `ack` is empty when the delivery
  has no acknowledgement concept (core push subscriptions).
*/
struct InboundMessage {
  std::string           subject;
  std::string           data;
  std::function<void()> ack;
};

using MessageHandler = std::function<void(InboundMessage)>;

struct PublishAck {
  std::string   stream;
  std::uint64_t sequence = 0;
};

class Subscription {
 public:
  virtual ~Subscription() = default;

  // Stops delivery and waits for an in-progress handler to return.
  virtual void Unsubscribe() = 0;

  virtual const std::string& subject() const = 0;
};

class PullSubscription {
 public:
  virtual ~PullSubscription() = default;

  /*
    Waits up to `timeout` for the next message of the durable consumer.

    Returns std::nullopt when nothing arrived before the deadline; any other
    failure throws.
  */
  virtual std::optional<InboundMessage> Fetch(std::chrono::milliseconds timeout) = 0;

  virtual void Unsubscribe() = 0;
};

/*
  Persistent-stream context of a connection.
*/
class StreamContext {
 public:
  virtual ~StreamContext() = default;

  // Throws when no stream captures `subject`.
  virtual PublishAck Publish(const std::string& subject, const std::string& data) = 0;

  // Binds the durable consumer, creating it on the stream if it does not exist.
  virtual std::unique_ptr<PullSubscription> PullSubscribe(const std::string& stream, const std::string& subject,
                                                          const std::string& durable) = 0;
};

class Connection {
 public:
  virtual ~Connection() = default;

  virtual void Publish(const std::string& subject, const std::string& data) = 0;

  // `handler` runs on a dispatch thread owned by the subscription.
  virtual std::unique_ptr<Subscription> Subscribe(const std::string& subject, MessageHandler handler) = 0;

  virtual std::shared_ptr<StreamContext> JetStream() = 0;

  virtual bool IsConnected() const = 0;

  // Idempotent.
  virtual void Close() = 0;
};

class Transport {
 public:
  virtual ~Transport() = default;

  virtual std::unique_ptr<Connection> Connect(const ConnectOptions& options) = 0;

  virtual std::string Name() const = 0;
};

using TransportPtr = std::shared_ptr<Transport>;

} // namespace rfshared::transport
