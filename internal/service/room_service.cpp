#include "room_service.hpp"

#include "internal/auth/membership.hpp"
#include "internal/core/bundler.hpp"
#include "internal/core/ingest_validator.hpp"
#include "internal/core/relation_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_store.hpp"
#include "internal/model/relation_type.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"

namespace relations::service {

using namespace relations::engine::v1;

namespace {

std::optional<std::string> StringField(const google::protobuf::Struct& s, const std::string& name) {
  auto it = s.fields().find(name);
  if (it == s.fields().end() || !it->second.has_string_value()) {
    return std::nullopt;
  }
  return it->second.string_value();
}

// An m.relates_to carrying event_id and rel_type turns a plain send into
// a relation send.
std::optional<relations::core::RelationDraft> AsRelation(const SendEventRequest& req) {
  auto it = req.content().fields().find(std::string(relations::model::kRelatesToField));
  if (it == req.content().fields().end() || !it->second.has_struct_value()) {
    return std::nullopt;
  }

  const auto& relates_to = it->second.struct_value();
  auto        event_id   = StringField(relates_to, "event_id");
  auto        rel_type   = StringField(relates_to, "rel_type");
  if (!event_id || !rel_type) {
    return std::nullopt;
  }

  return relations::core::RelationDraft{
      .room_id         = req.room_id(),
      .sender          = req.sender(),
      .target_event_id = *event_id,
      .rel_type        = *rel_type,
      .event_type      = req.type(),
      .key             = StringField(relates_to, "key"),
      .content         = req.content(),
  };
}

bool IsSelfJoin(const SendEventRequest& req) {
  if (!relations::model::IsMembershipEventType(req.type()) || !req.has_state_key() || req.state_key() != req.sender()) {
    return false;
  }
  return StringField(req.content(), "membership") == std::optional<std::string>(relations::auth::kJoin);
}

} // namespace

RoomService::RoomService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SendEventResponse RoomService::SendEvent(const SendEventRequest& req) {
  return ObserveRpc("RoomService.SendEvent", req.room_id(), [&] {
    if (req.room_id().empty() || req.type().empty()) {
      throw relations::util::InvalidArgument("room_id and type are required");
    }
    if (req.type() == relations::model::kRedactionEventType) {
      throw relations::util::InvalidArgument("redactions are sent with RedactEvent");
    }

    SendEventResponse resp;
    if (auto relation = AsRelation(req); relation && !req.has_state_key()) {
      resp.set_event_id(ctx_.ingest->Submit(*relation).event_id);
      return resp;
    }

    auto tx = ctx_.repository->Begin();
    // joining is the one event a non-member may send
    if (!IsSelfJoin(req)) {
      relations::auth::RequireJoined(*ctx_.membership, *tx, req.room_id(), req.sender());
    }

    relations::events::EventDraft draft{
        .room_id   = req.room_id(),
        .type      = req.type(),
        .sender    = req.sender(),
        .state_key = req.has_state_key() ? std::optional<std::string>(req.state_key()) : std::nullopt,
        .content   = req.content(),
    };
    resp.set_event_id(ctx_.events->Persist(*tx, draft).event_id);
    tx->Commit();
    return resp;
  });
}

GetEventResponse RoomService::GetEvent(const GetEventRequest& req) {
  return ObserveRpc("RoomService.GetEvent", req.room_id(), [&] {
    auto tx = ctx_.repository->Begin();
    relations::auth::RequireJoined(*ctx_.membership, *tx, req.room_id(), req.requester());

    auto record = ctx_.events->Get(*tx, req.event_id());
    if (!record || record->room_id != req.room_id()) {
      throw relations::util::NotFound("event " + req.event_id() + " not found in room " + req.room_id());
    }

    GetEventResponse resp;
    *resp.mutable_event() = relations::events::EventStore::ToProto(*record);
    if (!req.has_bundle_relations() || req.bundle_relations()) {
      ctx_.bundler->Bundle(*tx, *resp.mutable_event());
    }
    tx->Commit();
    return resp;
  });
}

RedactEventResponse RoomService::RedactEvent(const RedactEventRequest& req) {
  return ObserveRpc("RoomService.RedactEvent", req.room_id(), [&] {
    auto tx = ctx_.repository->Begin();
    relations::auth::RequireJoined(*ctx_.membership, *tx, req.room_id(), req.sender());

    auto target = ctx_.events->Get(*tx, req.event_id());
    if (!target || target->room_id != req.room_id()) {
      throw relations::util::NotFound("event " + req.event_id() + " not found in room " + req.room_id());
    }
    if (target->sender != req.sender()) {
      throw relations::util::PermissionDenied("only the sender may redact " + req.event_id());
    }

    google::protobuf::Struct content;
    (*content.mutable_fields())["redacts"].set_string_value(req.event_id());
    if (!req.reason().empty()) {
      (*content.mutable_fields())["reason"].set_string_value(req.reason());
    }

    auto redaction = ctx_.events->Persist(*tx, relations::events::EventDraft{
                                                   .room_id   = req.room_id(),
                                                   .type      = std::string(relations::model::kRedactionEventType),
                                                   .sender    = req.sender(),
                                                   .state_key = std::nullopt,
                                                   .content   = std::move(content),
                                               });
    ctx_.events->Redact(*tx, req.event_id(), redaction.event_id);
    ctx_.relations->Redact(*tx, req.event_id());
    tx->Commit();

    RedactEventResponse resp;
    resp.set_event_id(redaction.event_id);
    return resp;
  });
}

} // namespace relations::service
