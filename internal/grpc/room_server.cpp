#include "room_server.hpp"
#include "grpc_error.hpp"

namespace relations::grpc {

RoomServer::RoomServer(std::shared_ptr<relations::service::RoomService> svc)
    : service_(std::move(svc)) {}

::grpc::Status RoomServer::SendEvent(::grpc::ServerContext*,
                                     const relations::engine::v1::SendEventRequest* req,
                                     relations::engine::v1::SendEventResponse* resp) {
  try {
    *resp = service_->SendEvent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RoomServer::GetEvent(::grpc::ServerContext*,
                                    const relations::engine::v1::GetEventRequest* req,
                                    relations::engine::v1::GetEventResponse* resp) {
  try {
    *resp = service_->GetEvent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

::grpc::Status RoomServer::RedactEvent(::grpc::ServerContext*,
                                       const relations::engine::v1::RedactEventRequest* req,
                                       relations::engine::v1::RedactEventResponse* resp) {
  try {
    *resp = service_->RedactEvent(*req);
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace relations::grpc
