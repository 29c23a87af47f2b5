#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "internal/bus/connection_manager.hpp"
#include "internal/model/received_message.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transport/transport.hpp"

namespace rfshared::bus {

// One bounded pull. Resolves to std::nullopt on timeout and on fetch failure.
using FetchFunction = std::function<std::future<std::optional<model::ReceivedMessage>>(std::chrono::milliseconds)>;

struct FetchOutcome {
  enum class Status { kMessage, kTimeout, kError };

  Status                                status = Status::kTimeout;
  std::optional<model::ReceivedMessage> message;
  std::string                           error; // set for kError
};

// One bounded pull that keeps a timeout apart from a broken subscription.
using CheckedFetchFunction = std::function<std::future<FetchOutcome>(std::chrono::milliseconds)>;

using MessageCallback = std::function<void(const model::ReceivedMessage&)>;

/*
  Receiving side of the bus.

  Every operation runs on its own task and hands back a future. Pull
  subscriptions return a fetch function that may be called from any thread;
  push subscriptions invoke the callback on the transport's dispatch thread.

  Failures after setup (ack, callback, fetch) are logged and absorbed so a
  processing loop keeps running. The futures returned here must be waited on
  before the Consumer is destroyed.
*/
class Consumer {
 public:
  Consumer(observability::LoggerPtr logger, transport::TransportPtr transport);
  ~Consumer();

  Consumer(const Consumer&)            = delete;
  Consumer& operator=(const Consumer&) = delete;

  // Logs and rethrows transport failures.
  std::future<void> Connect(transport::ConnectOptions options);

  // Binds the durable pull consumer, creating it on first use.
  std::future<FetchFunction> JetstreamSubscribe(std::string stream, std::string subject, std::string durable);

  std::future<CheckedFetchFunction> JetstreamSubscribeChecked(std::string stream, std::string subject, std::string durable);

  // Callback exceptions are logged per message; delivery continues.
  std::future<void> CoreSubscribe(std::string subject, MessageCallback callback);

  // Tears down every subscription and the connection. Idempotent.
  void Close();

  bool IsConnected() const;

 private:
  std::shared_ptr<transport::PullSubscription> BindPull(const std::string& stream, const std::string& subject,
                                                        const std::string& durable);

  observability::LoggerPtr logger_;
  ConnectionManager        conn_;

  mutable std::mutex                                        mutex_;
  std::string                                               servers_;
  std::vector<std::shared_ptr<transport::PullSubscription>> pulls_;
  std::vector<std::unique_ptr<transport::Subscription>>     subscriptions_;
};

} // namespace rfshared::bus
