#pragma once

#include <memory>
#include <grpcpp/grpcpp.h>

#include "relations/engine/v1/room_service.grpc.pb.h"
#include "internal/service/room_service.hpp"

namespace relations::grpc {

class RoomServer final : public relations::engine::v1::RoomService::Service {
public:
  explicit RoomServer(std::shared_ptr<relations::service::RoomService> svc);

  ::grpc::Status SendEvent(::grpc::ServerContext*,
                           const relations::engine::v1::SendEventRequest*,
                           relations::engine::v1::SendEventResponse*) override;

  ::grpc::Status GetEvent(::grpc::ServerContext*,
                          const relations::engine::v1::GetEventRequest*,
                          relations::engine::v1::GetEventResponse*) override;

  ::grpc::Status RedactEvent(::grpc::ServerContext*,
                             const relations::engine::v1::RedactEventRequest*,
                             relations::engine::v1::RedactEventResponse*) override;

private:
  std::shared_ptr<relations::service::RoomService> service_;
};

} // namespace relations::grpc
