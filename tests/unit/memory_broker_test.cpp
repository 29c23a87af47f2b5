#include "internal/broker/memory_broker.hpp"

#include <atomic>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "internal/util/errors.hpp"
#include "tests/common/recording_logger.hpp"
#include "tests/common/wait.hpp"

namespace {

using namespace std::chrono_literals;
using rfshared::broker::BrokerOptions;
using rfshared::broker::Delivery;
using rfshared::broker::MemoryBroker;
using rfshared::broker::StreamOptions;
using rfshared::testing::WaitFor;

StreamOptions MetadataStream(std::uint64_t max_msgs = 0) {
  return StreamOptions{"RF_METADATA", {"rf.metadata.>"}, max_msgs};
}

void TestStreamAdministration() {
  MemoryBroker broker;
  broker.AddStream(MetadataStream());

  bool duplicate_name = false;
  try {
    broker.AddStream(MetadataStream());
  } catch (const rfshared::util::AlreadyExists&) {
    duplicate_name = true;
  }
  assert(duplicate_name);

  bool duplicate_subject = false;
  try {
    broker.AddStream(StreamOptions{"OTHER", {"rf.metadata.>"}, 0});
  } catch (const rfshared::util::AlreadyExists&) {
    duplicate_subject = true;
  }
  assert(duplicate_subject);

  bool invalid = false;
  try {
    broker.AddStream(StreamOptions{"BAD", {"rf..x"}, 0});
  } catch (const rfshared::util::TransportError&) {
    invalid = true;
  }
  assert(invalid);

  broker.DeleteStream("RF_METADATA");

  bool missing = false;
  try {
    broker.DeleteStream("RF_METADATA");
  } catch (const rfshared::util::NotFound&) {
    missing = true;
  }
  assert(missing);
}

void TestPublishIsCapturedBySequence() {
  MemoryBroker broker;
  broker.AddStream(MetadataStream());

  const auto first  = broker.Publish("rf.metadata.edge01", "a");
  const auto second = broker.Publish("rf.metadata.edge02", "b");
  const auto stray  = broker.Publish("rf.status.edge01", "c");

  assert(first && first->stream == "RF_METADATA" && first->sequence == 1);
  assert(second && second->sequence == 2);
  assert(!stray);
  assert(broker.StreamMessageCount("RF_METADATA") == 2);
}

void TestRetentionDropsOldest() {
  MemoryBroker broker;
  broker.AddStream(MetadataStream(2));

  broker.EnsureConsumer("RF_METADATA", "ingest", "");
  for (const char* data : {"1", "2", "3"}) {
    broker.Publish("rf.metadata.edge", data);
  }
  assert(broker.StreamMessageCount("RF_METADATA") == 2);

  const auto d = broker.Fetch("RF_METADATA", "ingest", 10ms);
  assert(d && d->data == "2" && d->sequence == 2);
}

void TestDurableCursorAndFilter() {
  MemoryBroker broker;
  broker.AddStream(MetadataStream());

  broker.Publish("rf.metadata.edge01", "one");
  broker.Publish("rf.metadata.edge02", "two");
  broker.Publish("rf.metadata.edge01", "three");

  broker.EnsureConsumer("RF_METADATA", "edge01", "rf.metadata.edge01");
  broker.EnsureConsumer("RF_METADATA", "all", "rf.metadata.>");

  auto a = broker.Fetch("RF_METADATA", "edge01", 10ms);
  auto b = broker.Fetch("RF_METADATA", "edge01", 10ms);
  auto c = broker.Fetch("RF_METADATA", "edge01", 10ms);
  assert(a && a->data == "one");
  assert(b && b->data == "three");
  assert(!c);

  // independent cursor
  auto first = broker.Fetch("RF_METADATA", "all", 10ms);
  assert(first && first->data == "one");

  // rebinding with another filter is rejected, same filter is fine
  broker.EnsureConsumer("RF_METADATA", "edge01", "rf.metadata.edge01");
  bool rebound = false;
  try {
    broker.EnsureConsumer("RF_METADATA", "edge01", "rf.metadata.edge02");
  } catch (const rfshared::util::AlreadyExists&) {
    rebound = true;
  }
  assert(rebound);

  bool missing_stream = false;
  try {
    broker.EnsureConsumer("NOPE", "x", "");
  } catch (const rfshared::util::NotFound&) {
    missing_stream = true;
  }
  assert(missing_stream);
}

void TestFetchTimesOut() {
  MemoryBroker broker;
  broker.AddStream(MetadataStream());
  broker.EnsureConsumer("RF_METADATA", "ingest", "");

  const auto start   = std::chrono::steady_clock::now();
  const auto result  = broker.Fetch("RF_METADATA", "ingest", 100ms);
  const auto elapsed = std::chrono::steady_clock::now() - start;

  assert(!result);
  assert(elapsed >= 90ms);
  assert(elapsed < 2s);
}

void TestFetchWakesOnPublish() {
  MemoryBroker broker;
  broker.AddStream(MetadataStream());
  broker.EnsureConsumer("RF_METADATA", "ingest", "");

  auto pending = std::async(std::launch::async, [&] { return broker.Fetch("RF_METADATA", "ingest", 5s); });
  std::this_thread::sleep_for(50ms);
  broker.Publish("rf.metadata.edge", "late");

  assert(pending.wait_for(2s) == std::future_status::ready);
  const auto d = pending.get();
  assert(d && d->data == "late");
}

void TestUnackedMessagesAreRedelivered() {
  BrokerOptions options;
  options.ack_wait = 100ms;
  MemoryBroker broker(options);
  broker.AddStream(MetadataStream());
  broker.EnsureConsumer("RF_METADATA", "ingest", "");

  broker.Publish("rf.metadata.edge", "keep");
  broker.Publish("rf.metadata.edge", "drop");

  auto keep = broker.Fetch("RF_METADATA", "ingest", 10ms);
  auto drop = broker.Fetch("RF_METADATA", "ingest", 10ms);
  assert(keep && drop);
  assert(broker.PendingCount("RF_METADATA", "ingest") == 2);

  broker.Ack("RF_METADATA", "ingest", keep->sequence);
  assert(broker.PendingCount("RF_METADATA", "ingest") == 1);

  // nothing new until the ack wait expires
  assert(!broker.Fetch("RF_METADATA", "ingest", 10ms));

  auto again = broker.Fetch("RF_METADATA", "ingest", 1s);
  assert(again && again->data == "drop" && again->sequence == drop->sequence);

  broker.Ack("RF_METADATA", "ingest", again->sequence);
  assert(broker.PendingCount("RF_METADATA", "ingest") == 0);
  assert(!broker.Fetch("RF_METADATA", "ingest", 200ms));
}

void TestDeletedStreamFailsFetch() {
  MemoryBroker broker;
  broker.AddStream(MetadataStream());
  broker.EnsureConsumer("RF_METADATA", "ingest", "");

  auto pending = std::async(std::launch::async, [&] { return broker.Fetch("RF_METADATA", "ingest", 5s); });
  std::this_thread::sleep_for(50ms);
  broker.DeleteStream("RF_METADATA");

  bool threw = false;
  try {
    (void)pending.get();
  } catch (const rfshared::util::NotFound&) {
    threw = true;
  }
  assert(threw);
}

void TestPushSubscribersFanOut() {
  MemoryBroker broker;
  broker.AddStream(MetadataStream());

  std::mutex               mutex;
  std::vector<std::string> exact;
  std::vector<std::string> wildcard;

  broker.Subscribe("rf.metadata.edge", [&](const Delivery& d) {
    std::lock_guard lock(mutex);
    exact.push_back(d.data);
  });
  const auto id = broker.Subscribe("rf.>", [&](const Delivery& d) {
    std::lock_guard lock(mutex);
    wildcard.push_back(d.data);
  });

  broker.Publish("rf.metadata.edge", "captured");
  broker.Publish("rf.status.edge", "core");

  assert(WaitFor([&] {
    std::lock_guard lock(mutex);
    return exact.size() == 1 && wildcard.size() == 2;
  }));

  broker.Unsubscribe(id);
  broker.Unsubscribe(id);
  broker.Publish("rf.status.edge", "after");
  std::this_thread::sleep_for(50ms);

  std::lock_guard lock(mutex);
  assert(exact == std::vector<std::string>{"captured"});
  assert((wildcard == std::vector<std::string>{"captured", "core"}));
}

void TestThrowingHandlerKeepsSubscription() {
  auto         logger = std::make_shared<rfshared::testing::RecordingLogger>();
  MemoryBroker broker({}, logger);

  std::atomic<int> calls{0};
  broker.Subscribe("rf.events", [&](const Delivery&) {
    const int n = calls.fetch_add(1);
    if (n == 0) throw std::runtime_error("boom");
    if (n == 1) throw 42;
  });

  broker.Publish("rf.events", "1");
  broker.Publish("rf.events", "2");
  broker.Publish("rf.events", "3");

  assert(WaitFor([&] { return calls.load() == 3; }));
  assert(WaitFor([&] { return logger->Contains(spdlog::level::err, "boom"); }));
  assert(WaitFor([&] { return logger->Contains(spdlog::level::err, "unknown error"); }));
}

void TestUnsubscribeFromOwnHandler() {
  MemoryBroker broker;

  std::atomic<int>                   calls{0};
  std::atomic<MemoryBroker::SubscriberId> self{0};
  std::promise<void>                 unsubscribed;

  self = broker.Subscribe("rf.once", [&](const Delivery&) {
    ++calls;
    broker.Unsubscribe(self.load());
    unsubscribed.set_value();
  });

  broker.Publish("rf.once", "1");
  assert(unsubscribed.get_future().wait_for(2s) == std::future_status::ready);

  broker.Publish("rf.once", "2");
  std::this_thread::sleep_for(50ms);
  assert(calls.load() == 1);
}

void TestAuthentication() {
  BrokerOptions options;
  options.token = "s3cret";
  MemoryBroker broker(options);

  rfshared::transport::ConnectOptions good;
  good.token = "s3cret";
  broker.Authenticate(good);

  rfshared::transport::ConnectOptions bad;
  bad.token = "nope";
  bool rejected = false;
  try {
    broker.Authenticate(bad);
  } catch (const rfshared::util::Unauthenticated&) {
    rejected = true;
  }
  assert(rejected);

  BrokerOptions user_options;
  user_options.user     = "alice";
  user_options.password = "pw";
  MemoryBroker user_broker(user_options);

  rfshared::transport::ConnectOptions alice;
  alice.user     = "alice";
  alice.password = "pw";
  user_broker.Authenticate(alice);

  alice.password = "wrong";
  bool wrong_password = false;
  try {
    user_broker.Authenticate(alice);
  } catch (const rfshared::util::Unauthenticated&) {
    wrong_password = true;
  }
  assert(wrong_password);

  user_broker.SetAvailable(false);
  alice.password = "pw";
  bool unavailable = false;
  try {
    user_broker.Authenticate(alice);
  } catch (const rfshared::util::Unavailable&) {
    unavailable = true;
  }
  assert(unavailable);
}

void TestInvalidPublishSubject() {
  MemoryBroker broker;
  bool         threw = false;
  try {
    broker.Publish("rf.*", "x");
  } catch (const rfshared::util::TransportError&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestStreamAdministration();
  TestPublishIsCapturedBySequence();
  TestRetentionDropsOldest();
  TestDurableCursorAndFilter();
  TestFetchTimesOut();
  TestFetchWakesOnPublish();
  TestUnackedMessagesAreRedelivered();
  TestDeletedStreamFailsFetch();
  TestPushSubscribersFanOut();
  TestThrowingHandlerKeepsSubscription();
  TestUnsubscribeFromOwnHandler();
  TestAuthentication();
  TestInvalidPublishSubject();

  std::cout << "rfshared_unit_memory_broker: pass\n";
  return 0;
}
