#include "memory_broker.hpp"

#include <algorithm>
#include <thread>

#include "internal/broker/subject.hpp"
#include "internal/util/errors.hpp"

namespace rfshared::broker {

using observability::IntField;
using observability::StringField;

// ------------------------------------------------------------
// Push subscriber: one queue + one dispatch thread
// ------------------------------------------------------------

class MemoryBroker::Subscriber : public std::enable_shared_from_this<MemoryBroker::Subscriber> {
 public:
  Subscriber(std::string pattern, std::function<void(const Delivery&)> handler, observability::LoggerPtr logger)
      : pattern_(std::move(pattern)), handler_(std::move(handler)), logger_(std::move(logger)) {
  }

  // The thread holds a reference so a handler that unsubscribes itself
  // cannot outlive its subscriber.
  void Start() {
    thread_ = std::thread([self = shared_from_this()] { self->Run(); });
  }

  const std::string& pattern() const {
    return pattern_;
  }

  void Enqueue(Delivery delivery) {
    {
      std::lock_guard lock(mutex_);
      if (stopped_) return;
      queue_.push_back(std::move(delivery));
    }
    cv_.notify_one();
  }

  void Stop() {
    {
      std::lock_guard lock(mutex_);
      stopped_ = true;
      queue_.clear();
    }
    cv_.notify_all();

    if (!thread_.joinable()) return;
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }

 private:
  void Run() {
    while (true) {
      Delivery delivery;
      {
        std::unique_lock lock(mutex_);
        cv_.wait(lock, [this] { return stopped_ || !queue_.empty(); });
        if (stopped_) return;
        delivery = std::move(queue_.front());
        queue_.pop_front();
      }

      try {
        handler_(delivery);
      } catch (const std::exception& e) {
        if (logger_) {
          logger_->Error("push subscriber handler failed", {StringField("subject", delivery.subject), StringField("error", e.what())});
        }
      } catch (...) {
        if (logger_) {
          logger_->Error("push subscriber handler failed", {StringField("subject", delivery.subject), StringField("error", "unknown error")});
        }
      }
    }
  }

  std::string                          pattern_;
  std::function<void(const Delivery&)> handler_;
  observability::LoggerPtr             logger_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::deque<Delivery>    queue_;
  bool                    stopped_ = false;
  std::thread             thread_;
};

MemoryBroker::MemoryBroker(BrokerOptions options, observability::LoggerPtr logger)
    : options_(std::move(options)), logger_(std::move(logger)) {
}

MemoryBroker::~MemoryBroker() {
  std::map<SubscriberId, std::shared_ptr<Subscriber>> subscribers;
  {
    std::lock_guard lock(mutex_);
    subscribers.swap(subscribers_);
  }
  for (auto& [id, subscriber] : subscribers) {
    subscriber->Stop();
  }
}

// ------------------------------------------------------------
// Administration
// ------------------------------------------------------------

void MemoryBroker::AddStream(const StreamOptions& options) {
  if (options.name.empty()) {
    throw util::TransportError("add stream: missing stream name");
  }
  if (options.subjects.empty()) {
    throw util::TransportError("add stream: stream '" + options.name + "' needs at least one subject");
  }
  for (const auto& subject : options.subjects) {
    if (!IsValidSubject(subject, /*allow_wildcards=*/true)) {
      throw util::TransportError("add stream: invalid subject '" + subject + "'");
    }
  }

  std::lock_guard lock(mutex_);
  if (streams_.count(options.name)) {
    throw util::AlreadyExists("add stream: stream '" + options.name + "' already exists");
  }
  for (const auto& [name, stream] : streams_) {
    for (const auto& existing : stream.options.subjects) {
      for (const auto& subject : options.subjects) {
        if (existing == subject) {
          throw util::AlreadyExists("add stream: subject '" + subject + "' is already captured by stream '" + name + "'");
        }
      }
    }
  }

  Stream stream;
  stream.options = options;
  streams_.emplace(options.name, std::move(stream));

  if (logger_) {
    logger_->Info("stream created", {StringField("stream", options.name), IntField("max_msgs", static_cast<int64_t>(options.max_msgs))});
  }
}

void MemoryBroker::DeleteStream(const std::string& name) {
  {
    std::lock_guard lock(mutex_);
    if (streams_.erase(name) == 0) {
      throw util::NotFound("delete stream: stream '" + name + "' not found");
    }
  }
  cv_.notify_all();

  if (logger_) {
    logger_->Info("stream deleted", {StringField("stream", name)});
  }
}

void MemoryBroker::SetAvailable(bool available) {
  std::lock_guard lock(mutex_);
  available_ = available;
}

void MemoryBroker::Authenticate(const transport::ConnectOptions& options) const {
  std::lock_guard lock(mutex_);

  if (!available_) {
    throw util::Unavailable("connect: broker is not accepting connections");
  }

  if (!options_.token.empty()) {
    if (options.token != options_.token) {
      throw util::Unauthenticated("connect: authorization violation");
    }
    return;
  }

  if (!options_.user.empty() || !options_.password.empty()) {
    if (options.user != options_.user || options.password != options_.password) {
      throw util::Unauthenticated("connect: authorization violation");
    }
  }
}

// ------------------------------------------------------------
// Publish
// ------------------------------------------------------------

std::optional<transport::PublishAck> MemoryBroker::Publish(const std::string& subject, const std::string& data) {
  if (!IsValidSubject(subject, /*allow_wildcards=*/false)) {
    throw util::TransportError("publish: invalid subject '" + subject + "'");
  }

  std::optional<transport::PublishAck>     ack;
  std::vector<std::shared_ptr<Subscriber>> targets;
  {
    std::lock_guard lock(mutex_);

    for (auto& [name, stream] : streams_) {
      const bool captured = std::any_of(stream.options.subjects.begin(), stream.options.subjects.end(),
                                        [&](const std::string& pattern) { return SubjectMatches(pattern, subject); });
      if (!captured) continue;

      StoredMessage message;
      message.sequence = ++stream.last_sequence;
      message.subject  = subject;
      message.data     = data;
      stream.messages.push_back(std::move(message));

      if (stream.options.max_msgs > 0) {
        while (stream.messages.size() > stream.options.max_msgs) {
          stream.messages.pop_front();
        }
      }

      ack = transport::PublishAck{name, stream.last_sequence};
      break;
    }

    for (const auto& [id, subscriber] : subscribers_) {
      if (SubjectMatches(subscriber->pattern(), subject)) {
        targets.push_back(subscriber);
      }
    }
  }

  if (ack) {
    cv_.notify_all();
  }

  for (auto& subscriber : targets) {
    subscriber->Enqueue(Delivery{subject, data, "", 0});
  }

  return ack;
}

// ------------------------------------------------------------
// Durable pull consumers
// ------------------------------------------------------------

MemoryBroker::Stream& MemoryBroker::StreamOrThrow(const std::string& name, const std::string& op) {
  auto it = streams_.find(name);
  if (it == streams_.end()) {
    throw util::NotFound(op + ": stream '" + name + "' not found");
  }
  return it->second;
}

const MemoryBroker::Stream& MemoryBroker::StreamOrThrow(const std::string& name, const std::string& op) const {
  auto it = streams_.find(name);
  if (it == streams_.end()) {
    throw util::NotFound(op + ": stream '" + name + "' not found");
  }
  return it->second;
}

const MemoryBroker::StoredMessage* MemoryBroker::FindMessage(const Stream& stream, std::uint64_t sequence) {
  if (stream.messages.empty()) return nullptr;

  const auto first = stream.messages.front().sequence;
  if (sequence < first || sequence > stream.last_sequence) return nullptr;
  return &stream.messages[sequence - first];
}

void MemoryBroker::EnsureConsumer(const std::string& stream_name, const std::string& durable, const std::string& filter_subject) {
  if (durable.empty()) {
    throw util::TransportError("pull subscribe: missing durable name");
  }
  if (!filter_subject.empty() && !IsValidSubject(filter_subject, /*allow_wildcards=*/true)) {
    throw util::TransportError("pull subscribe: invalid subject '" + filter_subject + "'");
  }

  std::lock_guard lock(mutex_);
  auto&           stream = StreamOrThrow(stream_name, "pull subscribe");

  auto it = stream.consumers.find(durable);
  if (it != stream.consumers.end()) {
    if (it->second.filter_subject != filter_subject) {
      throw util::AlreadyExists("pull subscribe: durable '" + durable + "' is bound to subject '" + it->second.filter_subject + "'");
    }
    return;
  }

  DurableConsumer consumer;
  consumer.filter_subject = filter_subject;
  stream.consumers.emplace(durable, std::move(consumer));

  if (logger_) {
    logger_->Info("durable consumer created", {StringField("stream", stream_name), StringField("durable", durable),
                                               StringField("subject", filter_subject)});
  }
}

std::optional<Delivery> MemoryBroker::NextDelivery(Stream& stream, DurableConsumer& consumer, Clock::time_point now) {
  // expired in-flight messages first, oldest sequence first
  for (auto it = consumer.in_flight.begin(); it != consumer.in_flight.end();) {
    if (it->second > now) {
      ++it;
      continue;
    }

    const auto* message = FindMessage(stream, it->first);
    if (!message) {
      // dropped by retention
      it = consumer.in_flight.erase(it);
      continue;
    }

    it->second = now + options_.ack_wait;
    return Delivery{message->subject, message->data, stream.options.name, message->sequence};
  }

  if (stream.messages.empty()) return std::nullopt;

  const auto first = stream.messages.front().sequence;
  for (size_t i = consumer.next_sequence > first ? consumer.next_sequence - first : 0; i < stream.messages.size(); ++i) {
    const auto& message    = stream.messages[i];
    consumer.next_sequence = message.sequence + 1;

    if (!consumer.filter_subject.empty() && !SubjectMatches(consumer.filter_subject, message.subject)) continue;

    consumer.in_flight[message.sequence] = now + options_.ack_wait;
    return Delivery{message.subject, message.data, stream.options.name, message.sequence};
  }

  return std::nullopt;
}

std::optional<Delivery> MemoryBroker::Fetch(const std::string& stream_name, const std::string& durable, std::chrono::milliseconds timeout) {
  const auto deadline = Clock::now() + timeout;

  std::unique_lock lock(mutex_);
  while (true) {
    auto& stream = StreamOrThrow(stream_name, "fetch");

    auto consumer = stream.consumers.find(durable);
    if (consumer == stream.consumers.end()) {
      throw util::NotFound("fetch: durable '" + durable + "' not found on stream '" + stream_name + "'");
    }

    const auto now = Clock::now();
    if (auto delivery = NextDelivery(stream, consumer->second, now)) {
      return delivery;
    }
    if (now >= deadline) {
      return std::nullopt;
    }

    auto wake = deadline;
    for (const auto& [sequence, redeliver_at] : consumer->second.in_flight) {
      wake = std::min(wake, redeliver_at);
    }
    cv_.wait_until(lock, wake);
  }
}

void MemoryBroker::Ack(const std::string& stream_name, const std::string& durable, std::uint64_t sequence) {
  std::lock_guard lock(mutex_);
  auto&           stream = StreamOrThrow(stream_name, "ack");

  auto consumer = stream.consumers.find(durable);
  if (consumer == stream.consumers.end()) {
    throw util::NotFound("ack: durable '" + durable + "' not found on stream '" + stream_name + "'");
  }
  consumer->second.in_flight.erase(sequence);
}

// ------------------------------------------------------------
// Push subscribers
// ------------------------------------------------------------

MemoryBroker::SubscriberId MemoryBroker::Subscribe(const std::string& subject, std::function<void(const Delivery&)> handler) {
  if (!IsValidSubject(subject, /*allow_wildcards=*/true)) {
    throw util::TransportError("subscribe: invalid subject '" + subject + "'");
  }

  auto subscriber = std::make_shared<Subscriber>(subject, std::move(handler), logger_);
  subscriber->Start();

  std::lock_guard lock(mutex_);
  const auto      id = next_subscriber_id_++;
  subscribers_.emplace(id, std::move(subscriber));
  return id;
}

void MemoryBroker::Unsubscribe(SubscriberId id) {
  std::shared_ptr<Subscriber> subscriber;
  {
    std::lock_guard lock(mutex_);
    auto            it = subscribers_.find(id);
    if (it == subscribers_.end()) return;
    subscriber = std::move(it->second);
    subscribers_.erase(it);
  }
  subscriber->Stop();
}

// ------------------------------------------------------------
// Introspection
// ------------------------------------------------------------

std::uint64_t MemoryBroker::StreamMessageCount(const std::string& stream) const {
  std::lock_guard lock(mutex_);
  return StreamOrThrow(stream, "stream info").messages.size();
}

std::uint64_t MemoryBroker::PendingCount(const std::string& stream_name, const std::string& durable) const {
  std::lock_guard lock(mutex_);
  const auto&     stream   = StreamOrThrow(stream_name, "consumer info");
  auto            consumer = stream.consumers.find(durable);
  if (consumer == stream.consumers.end()) {
    throw util::NotFound("consumer info: durable '" + durable + "' not found on stream '" + stream_name + "'");
  }
  return consumer->second.in_flight.size();
}

} // namespace rfshared::broker
