#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/observability/logging.hpp"
#include "internal/transport/transport.hpp"

namespace rfshared::broker {

struct StreamOptions {
  std::string              name;
  std::vector<std::string> subjects;

  // 0 keeps every message
  std::uint64_t max_msgs = 0;
};

struct BrokerOptions {
  // When any credential is set, Authenticate() requires a match.
  std::string user;
  std::string password;
  std::string token;

  // Unacknowledged pull deliveries are redelivered after this long.
  std::chrono::milliseconds ack_wait{30000};
};

struct Delivery {
  std::string   subject;
  std::string   data;
  std::string   stream;
  std::uint64_t sequence = 0;
};

/*
  In-process message broker.

  Core publishes fan out to push subscribers; subjects captured by a stream
  are also appended to that stream's log. Durable consumers track their own
  cursor plus an in-flight set, and redeliver in-flight messages whose ack
  wait expired. Every push subscriber owns a dispatch thread, so a slow
  handler only delays its own subscription; a handler that throws is logged
  and the subscription keeps running.

  Thread-safe. Errors are util::TransportError subclasses.
*/
class MemoryBroker {
 public:
  using SubscriberId = std::uint64_t;

  explicit MemoryBroker(BrokerOptions options = {}, observability::LoggerPtr logger = nullptr);
  ~MemoryBroker();

  MemoryBroker(const MemoryBroker&)            = delete;
  MemoryBroker& operator=(const MemoryBroker&) = delete;

  // ------------------------------------------------------------------
  // Administration
  // ------------------------------------------------------------------
  void AddStream(const StreamOptions& options);
  void DeleteStream(const std::string& name);

  // Unavailable brokers reject Authenticate() with util::Unavailable.
  void SetAvailable(bool available);

  void Authenticate(const transport::ConnectOptions& options) const;

  // ------------------------------------------------------------------
  // Publish
  // ------------------------------------------------------------------
  /*
    Delivers to matching push subscribers and appends to the capturing
    stream, if any. Returns the stream position when captured.
  */
  std::optional<transport::PublishAck> Publish(const std::string& subject, const std::string& data);

  // ------------------------------------------------------------------
  // Durable pull consumers
  // ------------------------------------------------------------------
  void EnsureConsumer(const std::string& stream, const std::string& durable, const std::string& filter_subject);

  std::optional<Delivery> Fetch(const std::string& stream, const std::string& durable, std::chrono::milliseconds timeout);

  void Ack(const std::string& stream, const std::string& durable, std::uint64_t sequence);

  // ------------------------------------------------------------------
  // Push subscribers
  // ------------------------------------------------------------------
  SubscriberId Subscribe(const std::string& subject, std::function<void(const Delivery&)> handler);

  // Idempotent. Waits for a running handler unless called from that handler.
  void Unsubscribe(SubscriberId id);

  // ------------------------------------------------------------------
  // Introspection
  // ------------------------------------------------------------------
  std::uint64_t StreamMessageCount(const std::string& stream) const;
  std::uint64_t PendingCount(const std::string& stream, const std::string& durable) const;

 private:
  using Clock = std::chrono::steady_clock;

  struct StoredMessage {
    std::uint64_t sequence = 0;
    std::string   subject;
    std::string   data;
  };

  struct DurableConsumer {
    std::string                                filter_subject;
    std::uint64_t                              next_sequence = 1;
    std::map<std::uint64_t, Clock::time_point> in_flight; // sequence -> redelivery deadline
  };

  struct Stream {
    StreamOptions                                    options;
    std::deque<StoredMessage>                        messages;
    std::uint64_t                                    last_sequence = 0;
    std::unordered_map<std::string, DurableConsumer> consumers;
  };

  class Subscriber;

  Stream&       StreamOrThrow(const std::string& name, const std::string& op);
  const Stream& StreamOrThrow(const std::string& name, const std::string& op) const;

  static const StoredMessage* FindMessage(const Stream& stream, std::uint64_t sequence);

  std::optional<Delivery> NextDelivery(Stream& stream, DurableConsumer& consumer, Clock::time_point now);

  BrokerOptions            options_;
  observability::LoggerPtr logger_;
  bool                     available_ = true;

  mutable std::mutex                              mutex_;
  std::condition_variable                         cv_;
  std::unordered_map<std::string, Stream>         streams_;
  std::map<SubscriberId, std::shared_ptr<Subscriber>> subscribers_;
  SubscriberId                                    next_subscriber_id_ = 1;
};

} // namespace rfshared::broker
