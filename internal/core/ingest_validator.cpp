#include "ingest_validator.hpp"

#include <string_view>

#include "internal/model/relation_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace relations::core {

using relations::model::RelationType;

namespace {

bool IsBlank(std::string_view s) {
  return s.find_first_not_of(" \t\n\v\f\r") == std::string_view::npos;
}

} // namespace

IngestValidator::IngestValidator(std::shared_ptr<relations::db::Repository> repository, std::shared_ptr<relations::events::EventStore> events,
                                 std::shared_ptr<relations::auth::MembershipChecker> membership, std::shared_ptr<RelationStore> store)
    : repository_(std::move(repository)), events_(std::move(events)), membership_(std::move(membership)), store_(std::move(store)) {
}

void IngestValidator::Validate(relations::db::Transaction& tx, const RelationDraft& draft) {
  relations::auth::RequireJoined(*membership_, tx, draft.room_id, draft.sender);

  if (draft.rel_type.empty()) {
    throw relations::util::InvalidRelation("rel_type is required");
  }
  if (draft.event_type.empty()) {
    throw relations::util::InvalidRelation("event_type is required");
  }

  auto target = events_->Get(tx, draft.target_event_id);
  if (!target || target->room_id != draft.room_id) {
    throw relations::util::NotFound("event " + draft.target_event_id + " not found in room " + draft.room_id);
  }

  if (relations::model::IsMembershipEventType(target->type)) {
    throw relations::util::InvalidRelation("relations to membership events are not allowed");
  }
  if (relations::model::IsMembershipEventType(draft.event_type)) {
    throw relations::util::InvalidRelation("relations cannot be membership events");
  }
  if (target->redacted) {
    throw relations::util::InvalidRelation("relations to redacted events are not allowed");
  }

  const auto type = relations::model::ParseRelationType(draft.rel_type);
  if (type == RelationType::kAnnotation) {
    if (relations::model::IsReactionEventType(draft.event_type) && (!draft.key || IsBlank(*draft.key))) {
      throw relations::util::InvalidRelation("reaction annotations require a non-empty key");
    }
  } else if (draft.key) {
    throw relations::util::InvalidRelation("key is only valid for " + std::string(relations::model::kAnnotation) + " relations");
  }
}

google::protobuf::Struct IngestValidator::WithRelatesTo(const RelationDraft& draft) {
  google::protobuf::Struct content = draft.content;

  google::protobuf::Struct relates_to;
  auto&                    fields = *relates_to.mutable_fields();
  fields["event_id"].set_string_value(draft.target_event_id);
  fields["rel_type"].set_string_value(draft.rel_type);
  if (draft.key) {
    fields["key"].set_string_value(*draft.key);
  }

  *(*content.mutable_fields())[std::string(relations::model::kRelatesToField)].mutable_struct_value() = std::move(relates_to);
  return content;
}

relations::db::model::EventRecord IngestValidator::Submit(const RelationDraft& draft) {
  relations::observability::SpanScope span("IngestValidator.Submit");
  span.SetRelation(draft.target_event_id, draft.rel_type, draft.event_type);

  auto tx = repository_->Begin();
  Validate(*tx, draft);

  relations::events::EventDraft event{
      .room_id   = draft.room_id,
      .type      = draft.event_type,
      .sender    = draft.sender,
      .state_key = std::nullopt,
      .content   = WithRelatesTo(draft),
  };
  auto record = events_->Persist(*tx, event);

  store_->Index(*tx, relations::db::model::RelationRecord{
                         .event_id             = record.event_id,
                         .relates_to_id        = draft.target_event_id,
                         .rel_type             = draft.rel_type,
                         .event_type           = draft.event_type,
                         .aggregation_key      = draft.key.value_or(""),
                         .sender               = draft.sender,
                         .origin_server_ts     = record.origin_server_ts,
                         .topological_ordering = record.topological_ordering,
                         .stream_ordering      = record.stream_ordering,
                     });
  tx->Commit();

  relations::observability::Metrics::Instance().RecordRelationIngested(draft.rel_type);
  RELATIONS_LOG_INFO("relation ingested", relations::observability::RelationFields(record.event_id, draft.target_event_id,
                                                                                   draft.rel_type, draft.key.value_or("")));
  return record;
}

} // namespace relations::core
