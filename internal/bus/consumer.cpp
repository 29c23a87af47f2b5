#include "consumer.hpp"

#include <stdexcept>
#include <utility>

namespace rfshared::bus {

using observability::StringField;

namespace {

std::string JoinServers(const std::vector<std::string>& servers) {
  std::string out;
  for (const auto& server : servers) {
    if (!out.empty()) out += ",";
    out += server;
  }
  return out;
}

// Wraps the native ack so a failing acknowledgement is logged, never thrown.
model::ReceivedMessage WrapPulled(transport::InboundMessage inbound, const observability::LoggerPtr& logger) {
  model::ReceivedMessage::AckFn ack;
  if (inbound.ack) {
    ack = [native = std::move(inbound.ack), logger, subject = inbound.subject] {
      try {
        native();
      } catch (const std::exception& e) {
        logger->Error("Failed to ack message", {StringField("subject", subject), StringField("error", e.what())});
      } catch (...) {
        logger->Error("Failed to ack message", {StringField("subject", subject), StringField("error", "unknown error")});
      }
    };
  }
  return model::ReceivedMessage(std::move(inbound.data), std::move(ack));
}

} // namespace

Consumer::Consumer(observability::LoggerPtr logger, transport::TransportPtr transport)
    : logger_(std::move(logger)), conn_(std::move(transport)) {
  if (!logger_) {
    throw std::invalid_argument("consumer: logger is required");
  }
}

Consumer::~Consumer() {
  Close();
}

std::future<void> Consumer::Connect(transport::ConnectOptions options) {
  return std::async(std::launch::async, [this, options = std::move(options)] {
    const auto servers = JoinServers(options.servers);
    try {
      conn_.Connect(options, /*jetstream=*/true);
    } catch (const std::exception& e) {
      logger_->Error("Broker connection failed", {StringField("servers", servers), StringField("error", e.what())});
      throw;
    }

    {
      std::lock_guard lock(mutex_);
      servers_ = servers;
    }
    logger_->Info("Connected to broker", {StringField("servers", servers)});
  });
}

std::shared_ptr<transport::PullSubscription> Consumer::BindPull(const std::string& stream, const std::string& subject,
                                                                const std::string& durable) {
  std::shared_ptr<transport::PullSubscription> pull = conn_.JetStream()->PullSubscribe(stream, subject, durable);

  {
    std::lock_guard lock(mutex_);
    pulls_.push_back(pull);
  }

  logger_->Info("Subscribed to stream",
                {StringField("stream", stream), StringField("subject", subject), StringField("durable", durable)});
  return pull;
}

std::future<FetchFunction> Consumer::JetstreamSubscribe(std::string stream, std::string subject, std::string durable) {
  return std::async(std::launch::async, [this, stream = std::move(stream), subject = std::move(subject), durable = std::move(durable)] {
    auto pull = BindPull(stream, subject, durable);

    FetchFunction fetch = [pull, logger = logger_](std::chrono::milliseconds timeout) {
      return std::async(std::launch::async, [pull, logger, timeout]() -> std::optional<model::ReceivedMessage> {
        try {
          auto inbound = pull->Fetch(timeout);
          if (!inbound) return std::nullopt;
          return WrapPulled(std::move(*inbound), logger);
        } catch (const std::exception& e) {
          logger->Error("Fetch error", {StringField("error", e.what())});
          return std::nullopt;
        }
      });
    };
    return fetch;
  });
}

std::future<CheckedFetchFunction> Consumer::JetstreamSubscribeChecked(std::string stream, std::string subject, std::string durable) {
  return std::async(std::launch::async, [this, stream = std::move(stream), subject = std::move(subject), durable = std::move(durable)] {
    auto pull = BindPull(stream, subject, durable);

    CheckedFetchFunction fetch = [pull, logger = logger_](std::chrono::milliseconds timeout) {
      return std::async(std::launch::async, [pull, logger, timeout] {
        FetchOutcome outcome;
        try {
          auto inbound = pull->Fetch(timeout);
          if (inbound) {
            outcome.status = FetchOutcome::Status::kMessage;
            outcome.message.emplace(WrapPulled(std::move(*inbound), logger));
          }
        } catch (const std::exception& e) {
          logger->Error("Fetch error", {StringField("error", e.what())});
          outcome.status = FetchOutcome::Status::kError;
          outcome.error  = e.what();
        }
        return outcome;
      });
    };
    return fetch;
  });
}

std::future<void> Consumer::CoreSubscribe(std::string subject, MessageCallback callback) {
  return std::async(std::launch::async, [this, subject = std::move(subject), callback = std::move(callback)] {
    auto handler = [callback, logger = logger_](transport::InboundMessage inbound) {
      const model::ReceivedMessage message(std::move(inbound.data));
      try {
        callback(message);
      } catch (const std::exception& e) {
        logger->Error("Message handler failed", {StringField("subject", inbound.subject), StringField("error", e.what())});
      } catch (...) {
        logger->Error("Message handler failed", {StringField("subject", inbound.subject), StringField("error", "unknown error")});
      }
    };

    {
      std::lock_guard lock(mutex_);
      subscriptions_.push_back(conn_.connection().Subscribe(subject, std::move(handler)));
    }

    logger_->Info("Subscribed to subject", {StringField("subject", subject)});
  });
}

void Consumer::Close() {
  std::vector<std::unique_ptr<transport::Subscription>>     subscriptions;
  std::vector<std::shared_ptr<transport::PullSubscription>> pulls;
  std::string                                               servers;
  {
    std::lock_guard lock(mutex_);
    subscriptions.swap(subscriptions_);
    pulls.swap(pulls_);
    servers = servers_;
  }

  const bool was_connected = conn_.state() == ConnectionManager::State::kConnected;

  for (auto& subscription : subscriptions) {
    subscription->Unsubscribe();
  }
  for (auto& pull : pulls) {
    pull->Unsubscribe();
  }
  conn_.Close();

  if (was_connected) {
    logger_->Info("Consumer connection closed", {StringField("servers", servers)});
  }
}

bool Consumer::IsConnected() const {
  return conn_.IsConnected();
}

} // namespace rfshared::bus
