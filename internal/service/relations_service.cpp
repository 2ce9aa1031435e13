#include "relations_service.hpp"

#include "internal/auth/membership.hpp"
#include "internal/core/aggregation_engine.hpp"
#include "internal/core/ingest_validator.hpp"
#include "internal/core/relation_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_store.hpp"
#include "internal/service/observe_rpc.hpp"
#include "internal/util/errors.hpp"

namespace relations::service {

using namespace relations::engine::v1;

namespace {

relations::model::Direction FromProto(Direction dir) {
  return dir == DIRECTION_FORWARD ? relations::model::Direction::kForward : relations::model::Direction::kBackward;
}

// Parent must exist in the requested room; other rooms are invisible.
void RequireParent(relations::events::EventStore& events, relations::db::Transaction& tx, const std::string& room_id,
                   const std::string& event_id) {
  auto parent = events.Get(tx, event_id);
  if (!parent || parent->room_id != room_id) {
    throw relations::util::NotFound("event " + event_id + " not found in room " + room_id);
  }
}

void FillChunk(relations::events::EventStore& events, relations::db::Transaction& tx, const relations::core::RelationPage& page,
               GetRelationsResponse& resp) {
  for (const auto& edge : page.edges) {
    auto record = events.Get(tx, edge.event_id);
    if (!record) {
      throw std::runtime_error("relation " + edge.event_id + " has no event row");
    }
    *resp.add_chunk() = relations::events::EventStore::ToProto(*record);
  }
  if (page.next_batch) {
    resp.set_next_batch(*page.next_batch);
  }
}

} // namespace

RelationsService::RelationsService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

SendRelationResponse RelationsService::SendRelation(const SendRelationRequest& req) {
  return ObserveRpc("RelationsService.SendRelation", req.room_id(), [&] {
    relations::core::RelationDraft draft{
        .room_id         = req.room_id(),
        .sender          = req.sender(),
        .target_event_id = req.parent_id(),
        .rel_type        = req.rel_type(),
        .event_type      = req.event_type(),
        .key             = req.has_key() ? std::optional<std::string>(req.key()) : std::nullopt,
        .content         = req.content(),
    };

    SendRelationResponse resp;
    resp.set_event_id(ctx_.ingest->Submit(draft).event_id);
    return resp;
  });
}

GetRelationsResponse RelationsService::GetRelations(const GetRelationsRequest& req) {
  return ObserveRpc("RelationsService.GetRelations", req.room_id(), [&] {
    auto tx = ctx_.repository->Begin();
    relations::auth::RequireJoined(*ctx_.membership, *tx, req.room_id(), req.requester());
    RequireParent(*ctx_.events, *tx, req.room_id(), req.event_id());

    relations::core::RelationFilter filter;
    if (req.has_rel_type()) filter.rel_type = req.rel_type();
    if (req.has_event_type()) filter.event_type = req.event_type();
    if (req.has_key()) filter.key = req.key();

    auto page = ctx_.relations->QueryPage(*tx, req.event_id(), std::move(filter), FromProto(req.dir()), req.from(),
                                          ctx_.limits.Resolve(req.limit()));

    GetRelationsResponse resp;
    FillChunk(*ctx_.events, *tx, page, resp);
    tx->Commit();

    relations::observability::Metrics::Instance().ObservePageSize("RelationsService.GetRelations", page.edges.size());
    return resp;
  });
}

GetAggregationsResponse RelationsService::GetAggregations(const GetAggregationsRequest& req) {
  return ObserveRpc("RelationsService.GetAggregations", req.room_id(), [&] {
    auto tx = ctx_.repository->Begin();
    relations::auth::RequireJoined(*ctx_.membership, *tx, req.room_id(), req.requester());
    RequireParent(*ctx_.events, *tx, req.room_id(), req.event_id());

    auto page = ctx_.aggregations->Aggregate(*tx, req.event_id(), req.has_rel_type() ? std::optional<std::string>(req.rel_type()) : std::nullopt,
                                             req.has_event_type() ? std::optional<std::string>(req.event_type()) : std::nullopt, req.from(),
                                             ctx_.limits.Resolve(req.limit()));
    tx->Commit();

    GetAggregationsResponse resp;
    for (const auto& group : page.groups) {
      auto* entry = resp.add_chunk();
      entry->set_type(group.event_type);
      entry->set_key(group.aggregation_key);
      entry->set_count(group.count);
    }
    if (page.next_batch) {
      resp.set_next_batch(*page.next_batch);
    }

    relations::observability::Metrics::Instance().ObservePageSize("RelationsService.GetAggregations", page.groups.size());
    return resp;
  });
}

GetRelationsResponse RelationsService::GetAggregationGroup(const GetAggregationGroupRequest& req) {
  return ObserveRpc("RelationsService.GetAggregationGroup", req.room_id(), [&] {
    auto tx = ctx_.repository->Begin();
    relations::auth::RequireJoined(*ctx_.membership, *tx, req.room_id(), req.requester());
    RequireParent(*ctx_.events, *tx, req.room_id(), req.event_id());

    auto page = ctx_.aggregations->PaginateGroup(*tx, req.event_id(), req.rel_type(), req.event_type(), req.key(), req.from(),
                                                 ctx_.limits.Resolve(req.limit()));

    GetRelationsResponse resp;
    FillChunk(*ctx_.events, *tx, page, resp);
    tx->Commit();

    relations::observability::Metrics::Instance().ObservePageSize("RelationsService.GetAggregationGroup", page.edges.size());
    return resp;
  });
}

} // namespace relations::service
