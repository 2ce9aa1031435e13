#include <grpcpp/create_channel.h>
#include <grpcpp/security/credentials.h>

#include <iostream>
#include <memory>
#include <string>

#include "relations/engine/v1.hpp"

using namespace relations::engine::v1;

namespace {

bool Check(const grpc::Status& status, const char* what) {
  if (status.ok()) {
    return true;
  }
  std::cerr << what << " failed: " << status.error_message() << " (" << status.error_details() << ")\n";
  return false;
}

std::string Join(RoomService::Stub& rooms, const std::string& room_id, const std::string& user_id) {
  grpc::ClientContext ctx;
  SendEventRequest    req;
  req.set_room_id(room_id);
  req.set_sender(user_id);
  req.set_type("m.room.member");
  req.set_state_key(user_id);
  (*req.mutable_content()->mutable_fields())["membership"].set_string_value("join");

  SendEventResponse resp;
  return Check(rooms.SendEvent(&ctx, req, &resp), "join") ? resp.event_id() : std::string();
}

bool React(RelationsService::Stub& relations, const std::string& room_id, const std::string& sender,
           const std::string& parent_id, const std::string& key) {
  grpc::ClientContext ctx;
  SendRelationRequest req;
  req.set_room_id(room_id);
  req.set_sender(sender);
  req.set_parent_id(parent_id);
  req.set_rel_type("m.annotation");
  req.set_event_type("m.reaction");
  req.set_key(key);

  SendRelationResponse resp;
  return Check(relations.SendRelation(&ctx, req, &resp), "react");
}

} // namespace

int main(int argc, char** argv) {
  // Allow overriding the service endpoint for remote or containerized runs.
  const std::string target = argc > 1 ? argv[1] : "localhost:50051";
  const std::string room   = "!example:example.org";

  auto channel   = grpc::CreateChannel(target, grpc::InsecureChannelCredentials());
  auto rooms     = RoomService::NewStub(channel);
  auto relations = RelationsService::NewStub(channel);

  if (Join(*rooms, room, "@alice:example.org").empty() || Join(*rooms, room, "@bob:example.org").empty()) {
    return 1;
  }

  // A message for everyone to react to.
  std::string message_id;
  {
    grpc::ClientContext ctx;
    SendEventRequest    req;
    req.set_room_id(room);
    req.set_sender("@alice:example.org");
    req.set_type("m.room.message");
    auto& fields = *req.mutable_content()->mutable_fields();
    fields["msgtype"].set_string_value("m.text");
    fields["body"].set_string_value("lunch?");

    SendEventResponse resp;
    if (!Check(rooms->SendEvent(&ctx, req, &resp), "send")) return 1;
    message_id = resp.event_id();
  }

  if (!React(*relations, room, "@alice:example.org", message_id, "👍") ||
      !React(*relations, room, "@bob:example.org", message_id, "👍") ||
      !React(*relations, room, "@bob:example.org", message_id, "🍕")) {
    return 1;
  }

  // Walk the aggregation groups one per page.
  std::string from;
  do {
    grpc::ClientContext    ctx;
    GetAggregationsRequest req;
    req.set_room_id(room);
    req.set_requester("@bob:example.org");
    req.set_event_id(message_id);
    req.set_limit(1);
    req.set_from(from);

    GetAggregationsResponse resp;
    if (!Check(relations->GetAggregations(&ctx, req, &resp), "aggregations")) return 1;

    for (const auto& group : resp.chunk()) {
      std::cout << group.type() << " " << group.key() << " x" << group.count() << '\n';
    }
    from = resp.has_next_batch() ? resp.next_batch() : std::string();
  } while (!from.empty());

  // The same data bundled into the served event.
  grpc::ClientContext ctx;
  GetEventRequest     req;
  req.set_room_id(room);
  req.set_requester("@alice:example.org");
  req.set_event_id(message_id);

  GetEventResponse resp;
  if (!Check(rooms->GetEvent(&ctx, req, &resp), "get")) return 1;

  const auto& bundled = resp.event().unsigned_data().relations().annotation();
  std::cout << "bundled groups: " << bundled.chunk_size() << '\n';
  return 0;
}
