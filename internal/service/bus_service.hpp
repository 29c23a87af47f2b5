#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

#include "rfshared/v1.hpp"
#include "service_context.hpp"

namespace rfshared::service {

/*
  Session-based front of the MemoryBroker, shaped after the
  rfshared.bus.v1.MessageBus RPCs.

  Connect authenticates and mints a session id; every other call must carry
  a live one (util::ConnectionStateError otherwise). Disconnect ends the
  session's push streams.
*/
class BusService {
 public:
  // Longest a single Fetch may block on the server.
  static constexpr std::chrono::milliseconds kMaxFetchTimeout{60000};

  using BusMessageSink = std::function<bool(const rfshared::bus::v1::BusMessage&)>;

  explicit BusService(ServiceContext ctx);

  rfshared::bus::v1::ConnectResponse Connect(const rfshared::bus::v1::ConnectRequest& req);
  void                               Disconnect(const rfshared::bus::v1::DisconnectRequest& req);

  rfshared::bus::v1::PublishResponse Publish(const rfshared::bus::v1::PublishRequest& req);

  void                             PullSubscribe(const rfshared::bus::v1::PullSubscribeRequest& req);
  rfshared::bus::v1::FetchResponse Fetch(const rfshared::bus::v1::FetchRequest& req);
  void                             Ack(const rfshared::bus::v1::AckRequest& req);

  /*
    Streams every message published on the subject to `sink` until the sink
    reports a broken stream, `cancelled` returns true or the session ends.
    `ready` runs once the subscription is registered with the broker.
  */
  void Subscribe(const rfshared::bus::v1::SubscribeRequest& req, const std::function<bool()>& cancelled,
                 const std::function<void()>& ready, const BusMessageSink& sink);

  bool HasSession(const std::string& session) const;

 private:
  struct Session {
    std::string name;
  };

  void RequireSession(const rfshared::bus::v1::SessionID& session, const char* op) const;

  ServiceContext ctx_;

  mutable std::mutex                       mutex_;
  std::unordered_map<std::string, Session> sessions_;
};

} // namespace rfshared::service
