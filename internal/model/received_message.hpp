#pragma once

#include <functional>
#include <string>
#include <utility>

namespace rfshared::model {

/*
  Transport-agnostic unit handed to application code.

  `ack` signals successful processing to the transport. Transports without
  per-message acknowledgement (push delivery) leave it as a no-op, so callers
  can always invoke Ack() unconditionally.
*/
class ReceivedMessage {
 public:
  using AckFn = std::function<void()>;

  explicit ReceivedMessage(std::string data, AckFn ack = [] {}) : data_(std::move(data)), ack_(std::move(ack)) {
    if (!ack_) ack_ = [] {};
  }

  const std::string& data() const {
    return data_;
  }

  void Ack() const {
    ack_();
  }

 private:
  std::string data_;
  AckFn       ack_;
};

} // namespace rfshared::model
