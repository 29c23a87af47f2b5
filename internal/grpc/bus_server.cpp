#include "bus_server.hpp"

#include "grpc_error.hpp"

namespace rfshared::grpc {

using namespace rfshared::bus::v1;

BusServer::BusServer(std::shared_ptr<rfshared::service::BusService> svc) : service_(std::move(svc)) {
}

::grpc::Status BusServer::Connect(::grpc::ServerContext*, const ConnectRequest* req, ConnectResponse* resp) {
  try {
    *resp = service_->Connect(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BusServer::Disconnect(::grpc::ServerContext*, const DisconnectRequest* req, google::protobuf::Empty*) {
  try {
    service_->Disconnect(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BusServer::Publish(::grpc::ServerContext*, const PublishRequest* req, PublishResponse* resp) {
  try {
    *resp = service_->Publish(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BusServer::PullSubscribe(::grpc::ServerContext*, const PullSubscribeRequest* req, google::protobuf::Empty*) {
  try {
    service_->PullSubscribe(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BusServer::Fetch(::grpc::ServerContext*, const FetchRequest* req, FetchResponse* resp) {
  try {
    *resp = service_->Fetch(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BusServer::Ack(::grpc::ServerContext*, const AckRequest* req, google::protobuf::Empty*) {
  try {
    service_->Ack(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status BusServer::Subscribe(::grpc::ServerContext* ctx, const SubscribeRequest* req, ::grpc::ServerWriter<BusMessage>* writer) {
  try {
    service_->Subscribe(
        *req, [ctx] { return ctx->IsCancelled(); },
        [ctx, writer] {
          ctx->AddInitialMetadata(kSubscribedMetadataKey, "1");
          writer->SendInitialMetadata();
        },
        [writer](const BusMessage& message) { return writer->Write(message); });
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace rfshared::grpc
