#include "bus_service.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <memory>
#include <stdexcept>
#include <string>

#include "internal/broker/memory_broker.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace rfshared::service {

using namespace rfshared::bus::v1;
using observability::IntField;
using observability::StringField;

namespace {

constexpr std::chrono::milliseconds kSubscribePollInterval{100};

void FillMessage(const broker::Delivery& delivery, BusMessage* out) {
  out->set_subject(delivery.subject);
  out->set_data(delivery.data);
  out->set_stream(delivery.stream);
  out->set_sequence(delivery.sequence);
}

} // namespace

BusService::BusService(ServiceContext ctx) : ctx_(std::move(ctx)) {
  if (!ctx_.broker) {
    throw std::invalid_argument("bus service: broker is required");
  }
  if (!ctx_.logger) {
    ctx_.logger = std::make_shared<observability::NullLogger>();
  }
}

void BusService::RequireSession(const SessionID& session, const char* op) const {
  std::lock_guard lock(mutex_);
  if (!sessions_.count(session.value())) {
    throw util::ConnectionStateError(std::string(op) + ": unknown session '" + session.value() + "'");
  }
}

bool BusService::HasSession(const std::string& session) const {
  std::lock_guard lock(mutex_);
  return sessions_.count(session) > 0;
}

ConnectResponse BusService::Connect(const ConnectRequest& req) {
  transport::ConnectOptions options;
  options.name     = req.name();
  options.user     = req.user();
  options.password = req.password();
  options.token    = req.token();

  try {
    ctx_.broker->Authenticate(options);
  } catch (const util::TransportError& e) {
    ctx_.logger->Warning("client rejected", {StringField("name", req.name()), StringField("error", e.what())});
    throw;
  }

  const auto id = util::ToString(util::GenerateUUID());
  {
    std::lock_guard lock(mutex_);
    sessions_.emplace(id, Session{req.name()});
  }

  ctx_.logger->Info("client connected", {StringField("session", id), StringField("name", req.name())});

  ConnectResponse resp;
  resp.mutable_session()->set_value(id);
  return resp;
}

void BusService::Disconnect(const DisconnectRequest& req) {
  {
    std::lock_guard lock(mutex_);
    if (sessions_.erase(req.session().value()) == 0) return;
  }
  ctx_.logger->Info("client disconnected", {StringField("session", req.session().value())});
}

PublishResponse BusService::Publish(const PublishRequest& req) {
  RequireSession(req.session(), "publish");

  auto ack = ctx_.broker->Publish(req.subject(), req.data());
  if (req.persistent() && !ack) {
    throw util::NotFound("publish: no stream captures subject '" + req.subject() + "'");
  }

  PublishResponse resp;
  if (ack) {
    resp.set_stream(ack->stream);
    resp.set_sequence(ack->sequence);
  }
  return resp;
}

void BusService::PullSubscribe(const PullSubscribeRequest& req) {
  RequireSession(req.session(), "pull subscribe");
  ctx_.broker->EnsureConsumer(req.stream(), req.durable(), req.subject());
}

FetchResponse BusService::Fetch(const FetchRequest& req) {
  RequireSession(req.session(), "fetch");

  const auto timeout  = std::min(std::chrono::milliseconds(req.timeout_ms()), kMaxFetchTimeout);
  auto       delivery = ctx_.broker->Fetch(req.stream(), req.durable(), timeout);

  FetchResponse resp;
  if (delivery) {
    FillMessage(*delivery, resp.mutable_message());
  }
  return resp;
}

void BusService::Ack(const AckRequest& req) {
  RequireSession(req.session(), "ack");
  ctx_.broker->Ack(req.stream(), req.durable(), req.sequence());
}

void BusService::Subscribe(const SubscribeRequest& req, const std::function<bool()>& cancelled,
                           const std::function<void()>& ready, const BusMessageSink& sink) {
  RequireSession(req.session(), "subscribe");

  struct Queue {
    std::mutex                   mutex;
    std::condition_variable      cv;
    std::deque<broker::Delivery> items;
  };
  auto queue = std::make_shared<Queue>();

  const auto id = ctx_.broker->Subscribe(req.subject(), [queue](const broker::Delivery& delivery) {
    {
      std::lock_guard lock(queue->mutex);
      queue->items.push_back(delivery);
    }
    queue->cv.notify_one();
  });

  ctx_.logger->Info("push subscription opened", {StringField("session", req.session().value()), StringField("subject", req.subject())});

  std::int64_t delivered = 0;
  try {
    ready();

    while (!cancelled() && HasSession(req.session().value())) {
      std::deque<broker::Delivery> batch;
      {
        std::unique_lock lock(queue->mutex);
        queue->cv.wait_for(lock, kSubscribePollInterval, [&] { return !queue->items.empty(); });
        batch.swap(queue->items);
      }

      bool open = true;
      for (const auto& delivery : batch) {
        BusMessage message;
        FillMessage(delivery, &message);
        if (!sink(message)) {
          open = false;
          break;
        }
        ++delivered;
      }
      if (!open) break;
    }
  } catch (...) {
    ctx_.broker->Unsubscribe(id);
    throw;
  }

  ctx_.broker->Unsubscribe(id);
  ctx_.logger->Info("push subscription closed", {StringField("session", req.session().value()), StringField("subject", req.subject()),
                                                 IntField("delivered", delivered)});
}

} // namespace rfshared::service
