#include "internal/bus/consumer.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "internal/transport/memory/memory_transport.hpp"
#include "internal/util/errors.hpp"
#include "tests/common/recording_logger.hpp"
#include "tests/common/wait.hpp"

namespace {

using namespace std::chrono_literals;
using rfshared::broker::MemoryBroker;
using rfshared::bus::Consumer;
using rfshared::bus::FetchOutcome;
using rfshared::testing::RecordingLogger;
using rfshared::testing::WaitFor;

struct Fixture {
  std::shared_ptr<MemoryBroker>                         broker    = std::make_shared<MemoryBroker>();
  std::shared_ptr<rfshared::transport::MemoryTransport> transport = std::make_shared<rfshared::transport::MemoryTransport>(broker);
  std::shared_ptr<RecordingLogger>                      logger    = std::make_shared<RecordingLogger>();

  Fixture() {
    broker->AddStream({"RF_METADATA", {"rf.metadata.>"}, 0});
  }
};

rfshared::transport::ConnectOptions Local() {
  rfshared::transport::ConnectOptions options;
  options.servers = {"memory://local"};
  return options;
}

void TestConnectLogs() {
  Fixture  f;
  Consumer consumer(f.logger, f.transport);

  consumer.Connect(Local()).get();
  assert(consumer.IsConnected());
  assert(f.logger->Contains(spdlog::level::info, "memory://local"));

  consumer.Close();
  consumer.Close();
  assert(!consumer.IsConnected());
  assert(f.logger->Contains(spdlog::level::info, "Consumer connection closed"));
}

void TestConnectFailureIsLoggedAndPropagated() {
  Fixture f;
  f.broker->SetAvailable(false);
  Consumer consumer(f.logger, f.transport);

  bool threw = false;
  try {
    consumer.Connect(Local()).get();
  } catch (const rfshared::util::Unavailable&) {
    threw = true;
  }
  assert(threw);
  assert(f.logger->Count(spdlog::level::err) == 1);
  assert(!consumer.IsConnected());
}

void TestSubscribeBeforeConnect() {
  Fixture  f;
  Consumer consumer(f.logger, f.transport);

  bool pull_threw = false;
  try {
    (void)consumer.JetstreamSubscribe("RF_METADATA", "rf.metadata.>", "ingest").get();
  } catch (const rfshared::util::ConnectionStateError&) {
    pull_threw = true;
  }
  assert(pull_threw);

  bool push_threw = false;
  try {
    consumer.CoreSubscribe("rf.events", [](const rfshared::model::ReceivedMessage&) {}).get();
  } catch (const rfshared::util::ConnectionStateError&) {
    push_threw = true;
  }
  assert(push_threw);
}

void TestFetchTimeoutIsNone() {
  Fixture  f;
  Consumer consumer(f.logger, f.transport);
  consumer.Connect(Local()).get();

  auto fetch = consumer.JetstreamSubscribe("RF_METADATA", "rf.metadata.>", "ingest").get();

  const auto start   = std::chrono::steady_clock::now();
  const auto message = fetch(100ms).get();
  const auto elapsed = std::chrono::steady_clock::now() - start;

  assert(!message);
  assert(elapsed >= 90ms && elapsed < 2s);
  assert(f.logger->Count(spdlog::level::err) == 0);
}

void TestFetchAndAck() {
  Fixture  f;
  Consumer consumer(f.logger, f.transport);
  consumer.Connect(Local()).get();

  auto fetch = consumer.JetstreamSubscribe("RF_METADATA", "rf.metadata.>", "ingest").get();
  assert(f.logger->Contains(spdlog::level::info, "durable=ingest"));

  f.broker->Publish("rf.metadata.edge", "first");
  f.broker->Publish("rf.metadata.edge", "second");

  auto first = fetch(500ms).get();
  assert(first && first->data() == "first");
  first->Ack();

  auto second = fetch(500ms).get();
  assert(second && second->data() == "second");
  assert(f.broker->PendingCount("RF_METADATA", "ingest") == 1);
  second->Ack();
  assert(f.broker->PendingCount("RF_METADATA", "ingest") == 0);
}

void TestConcurrentFetchesDoNotBlockEachOther() {
  Fixture  f;
  Consumer consumer(f.logger, f.transport);
  consumer.Connect(Local()).get();

  auto fetch = consumer.JetstreamSubscribe("RF_METADATA", "rf.metadata.>", "ingest").get();

  auto slow = fetch(2s);
  f.broker->Publish("rf.metadata.edge", "x");

  assert(slow.wait_for(1s) == std::future_status::ready);
  auto message = slow.get();
  assert(message && message->data() == "x");
}

void TestAckFailureIsLogged() {
  Fixture  f;
  Consumer consumer(f.logger, f.transport);
  consumer.Connect(Local()).get();

  auto fetch = consumer.JetstreamSubscribe("RF_METADATA", "rf.metadata.>", "ingest").get();
  f.broker->Publish("rf.metadata.edge", "x");
  auto message = fetch(500ms).get();
  assert(message);

  f.broker->DeleteStream("RF_METADATA");
  message->Ack();
  assert(f.logger->Contains(spdlog::level::err, "Failed to ack message"));
}

// Hands out one message whose ack throws something that is not a std::exception.
class ThrowingAckTransport final : public rfshared::transport::Transport {
 public:
  std::unique_ptr<rfshared::transport::Connection> Connect(const rfshared::transport::ConnectOptions&) override {
    return std::make_unique<FakeConnection>();
  }

  std::string Name() const override {
    return "throwing-ack";
  }

 private:
  class FakePull final : public rfshared::transport::PullSubscription {
   public:
    std::optional<rfshared::transport::InboundMessage> Fetch(std::chrono::milliseconds) override {
      return rfshared::transport::InboundMessage{"rf.metadata.edge", "x", [] { throw 7; }};
    }
    void Unsubscribe() override {
    }
  };

  class FakeStream final : public rfshared::transport::StreamContext {
   public:
    rfshared::transport::PublishAck Publish(const std::string&, const std::string&) override {
      return {};
    }
    std::unique_ptr<rfshared::transport::PullSubscription> PullSubscribe(const std::string&, const std::string&,
                                                                         const std::string&) override {
      return std::make_unique<FakePull>();
    }
  };

  class FakeConnection final : public rfshared::transport::Connection {
   public:
    void Publish(const std::string&, const std::string&) override {
    }
    std::unique_ptr<rfshared::transport::Subscription> Subscribe(const std::string&, rfshared::transport::MessageHandler) override {
      throw rfshared::util::TransportError("subscribe: not supported");
    }
    std::shared_ptr<rfshared::transport::StreamContext> JetStream() override {
      return std::make_shared<FakeStream>();
    }
    bool IsConnected() const override {
      return open_;
    }
    void Close() override {
      open_ = false;
    }

   private:
    bool open_ = true;
  };
};

void TestNonStandardAckFailureIsLogged() {
  auto     logger = std::make_shared<RecordingLogger>();
  Consumer consumer(logger, std::make_shared<ThrowingAckTransport>());
  consumer.Connect(Local()).get();

  auto fetch   = consumer.JetstreamSubscribe("RF_METADATA", "rf.metadata.>", "ingest").get();
  auto message = fetch(20ms).get();
  assert(message);

  message->Ack();
  assert(logger->Contains(spdlog::level::err, "Failed to ack message"));
  assert(logger->Contains(spdlog::level::err, "unknown error"));
}

void TestFetchErrorDegradesToNone() {
  Fixture  f;
  Consumer consumer(f.logger, f.transport);
  consumer.Connect(Local()).get();

  auto fetch   = consumer.JetstreamSubscribe("RF_METADATA", "rf.metadata.>", "ingest").get();
  auto checked = consumer.JetstreamSubscribeChecked("RF_METADATA", "rf.metadata.>", "checked").get();

  auto timeout = checked(20ms).get();
  assert(timeout.status == FetchOutcome::Status::kTimeout);
  assert(!timeout.message);

  f.broker->Publish("rf.metadata.edge", "x");
  auto delivered = checked(500ms).get();
  assert(delivered.status == FetchOutcome::Status::kMessage);
  assert(delivered.message && delivered.message->data() == "x");

  f.broker->DeleteStream("RF_METADATA");

  assert(!fetch(20ms).get());
  assert(f.logger->Contains(spdlog::level::err, "Fetch error"));

  auto broken = checked(20ms).get();
  assert(broken.status == FetchOutcome::Status::kError);
  assert(broken.error.find("RF_METADATA") != std::string::npos);
}

void TestFetchAfterCloseDegradesToNone() {
  Fixture  f;
  Consumer consumer(f.logger, f.transport);
  consumer.Connect(Local()).get();

  auto fetch = consumer.JetstreamSubscribe("RF_METADATA", "rf.metadata.>", "ingest").get();
  consumer.Close();

  assert(!fetch(20ms).get());
}

void TestThrowingHandlerDoesNotStopDelivery() {
  Fixture  f;
  Consumer consumer(f.logger, f.transport);
  consumer.Connect(Local()).get();

  std::mutex               mutex;
  std::vector<std::string> handled;

  consumer
      .CoreSubscribe("rf.events",
                     [&](const rfshared::model::ReceivedMessage& message) {
                       message.Ack(); // no-op for push delivery
                       if (message.data() == "first") throw std::runtime_error("handler exploded");
                       if (message.data() == "odd") throw std::string("not an exception type");
                       std::lock_guard lock(mutex);
                       handled.push_back(message.data());
                     })
      .get();

  f.broker->Publish("rf.events", "first");
  f.broker->Publish("rf.events", "odd");
  f.broker->Publish("rf.events", "second");

  assert(WaitFor([&] {
    std::lock_guard lock(mutex);
    return handled.size() == 1;
  }));
  assert(handled[0] == "second");
  assert(f.logger->Contains(spdlog::level::err, "handler exploded"));
  assert(f.logger->Contains(spdlog::level::err, "unknown error"));
}

void TestCloseTearsDownPushSubscriptions() {
  Fixture  f;
  Consumer consumer(f.logger, f.transport);
  consumer.Connect(Local()).get();

  std::atomic<int> calls{0};
  consumer.CoreSubscribe("rf.events", [&](const rfshared::model::ReceivedMessage&) { ++calls; }).get();
  consumer.CoreSubscribe("rf.other", [&](const rfshared::model::ReceivedMessage&) { ++calls; }).get();

  f.broker->Publish("rf.events", "1");
  assert(WaitFor([&] { return calls.load() == 1; }));

  consumer.Close();
  f.broker->Publish("rf.events", "2");
  f.broker->Publish("rf.other", "3");
  std::this_thread::sleep_for(50ms);
  assert(calls.load() == 1);

  bool threw = false;
  try {
    consumer.CoreSubscribe("rf.events", [](const rfshared::model::ReceivedMessage&) {}).get();
  } catch (const rfshared::util::ConnectionStateError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestConnectLogs();
  TestConnectFailureIsLoggedAndPropagated();
  TestSubscribeBeforeConnect();
  TestFetchTimeoutIsNone();
  TestFetchAndAck();
  TestConcurrentFetchesDoNotBlockEachOther();
  TestAckFailureIsLogged();
  TestNonStandardAckFailureIsLogged();
  TestFetchErrorDegradesToNone();
  TestFetchAfterCloseDegradesToNone();
  TestThrowingHandlerDoesNotStopDelivery();
  TestCloseTearsDownPushSubscriptions();

  std::cout << "rfshared_unit_consumer: pass\n";
  return 0;
}
