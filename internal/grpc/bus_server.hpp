#pragma once

#include <memory>

#include <grpcpp/grpcpp.h>

#include "internal/service/bus_service.hpp"
#include "rfshared/v1.hpp"

namespace rfshared::grpc {

class BusServer final : public rfshared::bus::v1::MessageBus::Service {
 public:
  // Initial-metadata key sent on Subscribe once the broker subscription is
  // registered. A stream that ends without it was rejected.
  static constexpr const char* kSubscribedMetadataKey = "rfshared-subscribed";

  explicit BusServer(std::shared_ptr<rfshared::service::BusService> svc);

  ::grpc::Status Connect(::grpc::ServerContext*, const rfshared::bus::v1::ConnectRequest*, rfshared::bus::v1::ConnectResponse*) override;

  ::grpc::Status Disconnect(::grpc::ServerContext*, const rfshared::bus::v1::DisconnectRequest*, google::protobuf::Empty*) override;

  ::grpc::Status Publish(::grpc::ServerContext*, const rfshared::bus::v1::PublishRequest*, rfshared::bus::v1::PublishResponse*) override;

  ::grpc::Status PullSubscribe(::grpc::ServerContext*, const rfshared::bus::v1::PullSubscribeRequest*, google::protobuf::Empty*) override;

  ::grpc::Status Fetch(::grpc::ServerContext*, const rfshared::bus::v1::FetchRequest*, rfshared::bus::v1::FetchResponse*) override;

  ::grpc::Status Ack(::grpc::ServerContext*, const rfshared::bus::v1::AckRequest*, google::protobuf::Empty*) override;

  ::grpc::Status Subscribe(::grpc::ServerContext*, const rfshared::bus::v1::SubscribeRequest*,
                           ::grpc::ServerWriter<rfshared::bus::v1::BusMessage>*) override;

 private:
  std::shared_ptr<rfshared::service::BusService> service_;
};

} // namespace rfshared::grpc
