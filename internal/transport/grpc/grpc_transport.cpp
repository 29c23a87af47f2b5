#include "grpc_transport.hpp"

#include <grpcpp/grpcpp.h>

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <thread>

#include "internal/broker/subject.hpp"
#include "internal/grpc/bus_server.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/transport/server_url.hpp"
#include "internal/util/errors.hpp"
#include "rfshared/v1.hpp"

namespace rfshared::transport {

using namespace rfshared::bus::v1;
using observability::StringField;
using rfshared::grpc::ThrowIfError;

namespace {

using Stub = MessageBus::Stub;

struct Session {
  std::shared_ptr<Stub>    stub;
  std::string              id;
  observability::LoggerPtr logger;
  std::atomic<bool>        alive{true};
};

void RequireAlive(const Session& session, const char* op) {
  if (!session.alive.load()) {
    throw util::TransportError(std::string(op) + ": connection closed");
  }
}

// ------------------------------------------------------------
// Push subscription: server stream + reader thread
// ------------------------------------------------------------

class GrpcSubscription final : public Subscription {
 public:
  GrpcSubscription(const std::shared_ptr<Session>& session, std::string subject, MessageHandler handler)
      : reader_(std::make_shared<Reader>()), subject_(std::move(subject)) {
    reader_->handler = std::move(handler);
    reader_->logger  = session->logger;
    reader_->subject = subject_;

    SubscribeRequest req;
    req.mutable_session()->set_value(session->id);
    req.set_subject(subject_);

    reader_->stream = session->stub->Subscribe(&reader_->ctx, req);

    // the server sends initial metadata once its subscription is registered
    reader_->stream->WaitForInitialMetadata();

    const auto& initial = reader_->ctx.GetServerInitialMetadata();
    if (initial.find(rfshared::grpc::BusServer::kSubscribedMetadataKey) == initial.end()) {
      const auto action = "subscribe to " + subject_;
      ThrowIfError(reader_->stream->Finish(), action);
      throw util::TransportError(action + " failed: stream ended before the subscription was registered");
    }

    thread_ = std::thread([reader = reader_] { Run(*reader); });
  }

  ~GrpcSubscription() override {
    Unsubscribe();
  }

  void Unsubscribe() override {
    std::lock_guard lock(mutex_);
    if (!thread_.joinable()) return;

    reader_->ctx.TryCancel();
    if (thread_.get_id() == std::this_thread::get_id()) {
      thread_.detach();
    } else {
      thread_.join();
    }
  }

  const std::string& subject() const override {
    return subject_;
  }

 private:
  struct Reader {
    ::grpc::ClientContext                             ctx;
    std::unique_ptr<::grpc::ClientReader<BusMessage>> stream;
    MessageHandler                                    handler;
    observability::LoggerPtr                          logger;
    std::string                                       subject;
  };

  static void Run(Reader& reader) {
    BusMessage message;
    while (reader.stream->Read(&message)) {
      try {
        reader.handler(InboundMessage{message.subject(), message.data(), {}});
      } catch (const std::exception& e) {
        reader.logger->Error("push handler failed", {StringField("subject", message.subject()), StringField("error", e.what())});
      } catch (...) {
        reader.logger->Error("push handler failed", {StringField("subject", message.subject()), StringField("error", "unknown error")});
      }
    }

    const auto status = reader.stream->Finish();
    if (!status.ok() && status.error_code() != ::grpc::StatusCode::CANCELLED) {
      reader.logger->Warning("push subscription ended",
                             {StringField("subject", reader.subject), StringField("error", status.error_message())});
    }
  }

  std::shared_ptr<Reader> reader_;
  std::string             subject_;

  std::mutex  mutex_;
  std::thread thread_;
};

// ------------------------------------------------------------
// Pull subscription
// ------------------------------------------------------------

class GrpcPullSubscription final : public PullSubscription {
 public:
  GrpcPullSubscription(std::shared_ptr<Session> session, std::string stream, std::string durable)
      : session_(std::move(session)), stream_(std::move(stream)), durable_(std::move(durable)) {
  }

  std::optional<InboundMessage> Fetch(std::chrono::milliseconds timeout) override {
    RequireAlive(*session_, "fetch");
    if (unsubscribed_) {
      throw util::TransportError("fetch: subscription closed");
    }

    FetchRequest req;
    req.mutable_session()->set_value(session_->id);
    req.set_stream(stream_);
    req.set_durable(durable_);
    req.set_timeout_ms(static_cast<std::uint32_t>(timeout.count()));

    ::grpc::ClientContext ctx;
    ctx.set_deadline(std::chrono::system_clock::now() + timeout + GrpcTransport::kDeadlineSlack);

    FetchResponse resp;
    const auto    status = session_->stub->Fetch(&ctx, req, &resp);
    if (status.error_code() == ::grpc::StatusCode::DEADLINE_EXCEEDED) {
      return std::nullopt;
    }
    ThrowIfError(status, "fetch");

    if (!resp.has_message()) return std::nullopt;

    InboundMessage message;
    message.subject = resp.message().subject();
    message.data    = resp.message().data();
    message.ack     = [session = session_, stream = stream_, durable = durable_, sequence = resp.message().sequence()] {
      RequireAlive(*session, "ack");

      AckRequest ack;
      ack.mutable_session()->set_value(session->id);
      ack.set_stream(stream);
      ack.set_durable(durable);
      ack.set_sequence(sequence);

      ::grpc::ClientContext   ack_ctx;
      google::protobuf::Empty empty;
      ThrowIfError(session->stub->Ack(&ack_ctx, ack, &empty), "ack");
    };
    return message;
  }

  void Unsubscribe() override {
    unsubscribed_ = true;
  }

 private:
  std::shared_ptr<Session> session_;
  std::string              stream_;
  std::string              durable_;
  std::atomic<bool>        unsubscribed_{false};
};

// ------------------------------------------------------------
// Stream context
// ------------------------------------------------------------

class GrpcStreamContext final : public StreamContext {
 public:
  explicit GrpcStreamContext(std::shared_ptr<Session> session) : session_(std::move(session)) {
  }

  PublishAck Publish(const std::string& subject, const std::string& data) override {
    RequireAlive(*session_, "publish");

    PublishRequest req;
    req.mutable_session()->set_value(session_->id);
    req.set_subject(subject);
    req.set_data(data);
    req.set_persistent(true);

    ::grpc::ClientContext ctx;
    PublishResponse       resp;
    ThrowIfError(session_->stub->Publish(&ctx, req, &resp), "publish");

    return PublishAck{resp.stream(), resp.sequence()};
  }

  std::unique_ptr<PullSubscription> PullSubscribe(const std::string& stream, const std::string& subject,
                                                  const std::string& durable) override {
    RequireAlive(*session_, "pull subscribe");

    PullSubscribeRequest req;
    req.mutable_session()->set_value(session_->id);
    req.set_stream(stream);
    req.set_subject(subject);
    req.set_durable(durable);

    ::grpc::ClientContext   ctx;
    google::protobuf::Empty empty;
    ThrowIfError(session_->stub->PullSubscribe(&ctx, req, &empty), "pull subscribe");

    return std::make_unique<GrpcPullSubscription>(session_, stream, durable);
  }

 private:
  std::shared_ptr<Session> session_;
};

// ------------------------------------------------------------
// Connection
// ------------------------------------------------------------

class GrpcConnection final : public Connection {
 public:
  explicit GrpcConnection(std::shared_ptr<Session> session) : session_(std::move(session)) {
  }

  ~GrpcConnection() override {
    Close();
  }

  void Publish(const std::string& subject, const std::string& data) override {
    RequireAlive(*session_, "publish");

    PublishRequest req;
    req.mutable_session()->set_value(session_->id);
    req.set_subject(subject);
    req.set_data(data);

    ::grpc::ClientContext ctx;
    PublishResponse       resp;
    ThrowIfError(session_->stub->Publish(&ctx, req, &resp), "publish");
  }

  std::unique_ptr<Subscription> Subscribe(const std::string& subject, MessageHandler handler) override {
    RequireAlive(*session_, "subscribe");
    if (!broker::IsValidSubject(subject, /*allow_wildcards=*/true)) {
      throw util::TransportError("subscribe: invalid subject '" + subject + "'");
    }
    return std::make_unique<GrpcSubscription>(session_, subject, std::move(handler));
  }

  std::shared_ptr<StreamContext> JetStream() override {
    RequireAlive(*session_, "stream context");
    return std::make_shared<GrpcStreamContext>(session_);
  }

  bool IsConnected() const override {
    return session_->alive.load();
  }

  // Ends the server session, which also closes its push streams.
  void Close() override {
    if (!session_->alive.exchange(false)) return;

    DisconnectRequest req;
    req.mutable_session()->set_value(session_->id);

    ::grpc::ClientContext   ctx;
    google::protobuf::Empty empty;
    const auto              status = session_->stub->Disconnect(&ctx, req, &empty);
    if (!status.ok()) {
      session_->logger->Warning("disconnect failed", {StringField("session", session_->id), StringField("error", status.error_message())});
    }
  }

 private:
  std::shared_ptr<Session> session_;
};

} // namespace

GrpcTransport::GrpcTransport(observability::LoggerPtr logger) : logger_(std::move(logger)) {
  if (!logger_) {
    logger_ = std::make_shared<observability::NullLogger>();
  }
}

std::unique_ptr<Connection> GrpcTransport::Connect(const ConnectOptions& options) {
  if (options.servers.empty()) {
    throw util::TransportError("connect: no server configured");
  }

  ServerUrl url;
  try {
    url = ParseServerUrl(options.servers.front());
  } catch (const std::invalid_argument& e) {
    throw util::TransportError(std::string("connect: ") + e.what());
  }
  if (url.scheme != "grpc") {
    throw util::TransportError("connect: grpc transport cannot reach '" + options.servers.front() + "'");
  }

  const auto resolved = WithUrlCredentials(options, url);

  auto session    = std::make_shared<Session>();
  session->stub   = MessageBus::NewStub(::grpc::CreateChannel(url.authority, ::grpc::InsecureChannelCredentials()));
  session->logger = logger_;

  ConnectRequest req;
  req.set_name(resolved.name);
  req.set_user(resolved.user);
  req.set_password(resolved.password);
  req.set_token(resolved.token);

  ::grpc::ClientContext ctx;
  ConnectResponse       resp;
  ThrowIfError(session->stub->Connect(&ctx, req, &resp), "connect to " + url.authority);

  session->id = resp.session().value();
  return std::make_unique<GrpcConnection>(std::move(session));
}

} // namespace rfshared::transport
