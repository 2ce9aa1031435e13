#include <grpcpp/grpcpp.h>
#include <google/protobuf/util/json_util.h>

#include <iostream>
#include <memory>
#include <string>

#include "relations/engine/v1/relations_service.grpc.pb.h"
#include "relations/engine/v1/room_service.grpc.pb.h"

using namespace relations::engine::v1;

static void Usage() {
  std::cout << "Usage:\n"
            << "  relationsctl <addr> join <room_id> <user_id>\n"
            << "  relationsctl <addr> send <room_id> <sender> <type> [content_json]\n"
            << "  relationsctl <addr> react <room_id> <sender> <event_id> <key>\n"
            << "  relationsctl <addr> reference <room_id> <sender> <event_id> [body]\n"
            << "  relationsctl <addr> get <room_id> <user_id> <event_id> [nobundle]\n"
            << "  relationsctl <addr> relations <room_id> <user_id> <event_id> [rel_type] [from] [limit] [forward]\n"
            << "  relationsctl <addr> aggregations <room_id> <user_id> <event_id> [from] [limit]\n"
            << "  relationsctl <addr> group <room_id> <user_id> <event_id> <event_type> <key> [from] [limit]\n"
            << "  relationsctl <addr> redact <room_id> <sender> <event_id> [reason]\n";
}

static int Fail(const grpc::Status& status) {
  std::cerr << status.error_message();
  if (!status.error_details().empty()) {
    std::cerr << " (" << status.error_details() << ")";
  }
  std::cerr << "\n";
  return 2;
}

static void Print(const google::protobuf::Message& message) {
  std::string                              json;
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace = true;
  auto status            = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    std::cerr << "cannot render response: " << status.ToString() << "\n";
    return;
  }
  std::cout << json;
}

static bool ParseContent(const std::string& json, google::protobuf::Struct* out) {
  auto status = google::protobuf::util::JsonStringToMessage(json, out);
  if (!status.ok()) {
    std::cerr << "invalid content json: " << status.ToString() << "\n";
    return false;
  }
  return true;
}

static std::string Arg(int argc, char** argv, int i) {
  return i < argc ? std::string(argv[i]) : std::string();
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string addr = argv[1];
  std::string cmd  = argv[2];

  auto channel = grpc::CreateChannel(addr, grpc::InsecureChannelCredentials());

  auto room_stub      = RoomService::NewStub(channel);
  auto relations_stub = RelationsService::NewStub(channel);

  grpc::ClientContext ctx;

  // ------------------------------------------------------------

  if (cmd == "join") {
    if (argc < 5) return 1;

    SendEventRequest req;
    req.set_room_id(argv[3]);
    req.set_sender(argv[4]);
    req.set_type("m.room.member");
    req.set_state_key(argv[4]);
    (*req.mutable_content()->mutable_fields())["membership"].set_string_value("join");

    SendEventResponse resp;
    auto              status = room_stub->SendEvent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.event_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "send") {
    if (argc < 6) return 1;

    SendEventRequest req;
    req.set_room_id(argv[3]);
    req.set_sender(argv[4]);
    req.set_type(argv[5]);
    if (argc >= 7 && !ParseContent(argv[6], req.mutable_content())) return 1;

    SendEventResponse resp;
    auto              status = room_stub->SendEvent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.event_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "react" || cmd == "reference") {
    if (argc < 6) return 1;

    SendRelationRequest req;
    req.set_room_id(argv[3]);
    req.set_sender(argv[4]);
    req.set_parent_id(argv[5]);

    if (cmd == "react") {
      if (argc < 7) return 1;
      req.set_rel_type("m.annotation");
      req.set_event_type("m.reaction");
      req.set_key(argv[6]);
    } else {
      req.set_rel_type("m.reference");
      req.set_event_type("m.room.message");
      auto& fields = *req.mutable_content()->mutable_fields();
      fields["msgtype"].set_string_value("m.text");
      fields["body"].set_string_value(argc >= 7 ? argv[6] : "reference");
    }

    SendRelationResponse resp;
    auto                 status = relations_stub->SendRelation(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.event_id() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "get") {
    if (argc < 6) return 1;

    GetEventRequest req;
    req.set_room_id(argv[3]);
    req.set_requester(argv[4]);
    req.set_event_id(argv[5]);
    if (Arg(argc, argv, 6) == "nobundle") req.set_bundle_relations(false);

    GetEventResponse resp;
    auto             status = room_stub->GetEvent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp.event());
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "relations") {
    if (argc < 6) return 1;

    GetRelationsRequest req;
    req.set_room_id(argv[3]);
    req.set_requester(argv[4]);
    req.set_event_id(argv[5]);
    if (!Arg(argc, argv, 6).empty() && Arg(argc, argv, 6) != "-") req.set_rel_type(argv[6]);
    if (!Arg(argc, argv, 7).empty() && Arg(argc, argv, 7) != "-") req.set_from(argv[7]);
    if (!Arg(argc, argv, 8).empty()) req.set_limit(static_cast<uint32_t>(std::stoul(argv[8])));
    if (Arg(argc, argv, 9) == "forward") req.set_dir(DIRECTION_FORWARD);

    GetRelationsResponse resp;
    auto                 status = relations_stub->GetRelations(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "aggregations") {
    if (argc < 6) return 1;

    GetAggregationsRequest req;
    req.set_room_id(argv[3]);
    req.set_requester(argv[4]);
    req.set_event_id(argv[5]);
    if (!Arg(argc, argv, 6).empty() && Arg(argc, argv, 6) != "-") req.set_from(argv[6]);
    if (!Arg(argc, argv, 7).empty()) req.set_limit(static_cast<uint32_t>(std::stoul(argv[7])));

    GetAggregationsResponse resp;
    auto                    status = relations_stub->GetAggregations(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "group") {
    if (argc < 8) return 1;

    GetAggregationGroupRequest req;
    req.set_room_id(argv[3]);
    req.set_requester(argv[4]);
    req.set_event_id(argv[5]);
    req.set_rel_type("m.annotation");
    req.set_event_type(argv[6]);
    req.set_key(argv[7]);
    if (!Arg(argc, argv, 8).empty() && Arg(argc, argv, 8) != "-") req.set_from(argv[8]);
    if (!Arg(argc, argv, 9).empty()) req.set_limit(static_cast<uint32_t>(std::stoul(argv[9])));

    GetRelationsResponse resp;
    auto                 status = relations_stub->GetAggregationGroup(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    Print(resp);
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "redact") {
    if (argc < 6) return 1;

    RedactEventRequest req;
    req.set_room_id(argv[3]);
    req.set_sender(argv[4]);
    req.set_event_id(argv[5]);
    req.set_reason(Arg(argc, argv, 6));

    RedactEventResponse resp;
    auto                status = room_stub->RedactEvent(&ctx, req, &resp);
    if (!status.ok()) return Fail(status);

    std::cout << resp.event_id() << "\n";
    return 0;
  }

  Usage();
  return 1;
}
