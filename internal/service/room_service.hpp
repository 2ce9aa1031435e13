#pragma once

#include "relations/engine/v1/room_service.pb.h"
#include "service_context.hpp"

namespace relations::service {

/*
  Minimal room surface: send plain events, read one event (bundled with
  its relations by default) and redact.
*/
class RoomService {
public:
  explicit RoomService(ServiceContext ctx);

  relations::engine::v1::SendEventResponse
  SendEvent(const relations::engine::v1::SendEventRequest& req);

  relations::engine::v1::GetEventResponse
  GetEvent(const relations::engine::v1::GetEventRequest& req);

  relations::engine::v1::RedactEventResponse
  RedactEvent(const relations::engine::v1::RedactEventRequest& req);

private:
  ServiceContext ctx_;
};

} // namespace relations::service
