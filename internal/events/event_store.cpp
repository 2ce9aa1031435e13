#include "event_store.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/core/db_error.hpp"
#include "internal/model/relation_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/event_id.hpp"
#include "internal/util/time.hpp"

namespace relations::events {

using relations::db::model::EventRecord;

EventStore::EventStore(std::shared_ptr<relations::db::Repository> repository, std::string server_name)
    : repository_(std::move(repository)), server_name_(std::move(server_name)) {
}

EventRecord EventStore::Persist(relations::db::Transaction& tx, const EventDraft& draft) {
  EventRecord record;
  record.event_id         = relations::util::GenerateEventId(server_name_);
  record.room_id          = draft.room_id;
  record.type             = draft.type;
  record.sender           = draft.sender;
  record.state_key        = draft.state_key;
  record.content_json     = ContentToJson(draft.content);
  record.origin_server_ts = relations::util::NowMillis();

  relations::core::ThrowIfDbError(repository_->InsertEvent(tx, record), "persist event");

  if (relations::model::IsMembershipEventType(record.type) && record.state_key) {
    const auto& fields     = draft.content.fields();
    auto        membership = fields.find("membership");
    if (membership != fields.end() && membership->second.has_string_value()) {
      relations::core::ThrowIfDbError(repository_->UpsertMembership(tx, {.room_id    = record.room_id,
                                                                          .user_id    = *record.state_key,
                                                                          .membership = membership->second.string_value(),
                                                                          .event_id   = record.event_id}),
                                      "record membership");
    }
  }

  auto fields = relations::observability::EventFields(record.event_id, record.room_id, record.type);
  fields.push_back(relations::observability::IntField("depth", static_cast<int64_t>(record.topological_ordering)));
  fields.push_back(relations::observability::IntField("stream", static_cast<int64_t>(record.stream_ordering)));
  RELATIONS_LOG_INFO("event persisted", fields);
  return record;
}

std::optional<EventRecord> EventStore::Get(relations::db::Transaction& tx, const std::string& event_id) {
  return repository_->GetEvent(tx, event_id);
}

void EventStore::Redact(relations::db::Transaction& tx, const std::string& event_id, const std::string& redaction_id) {
  relations::core::ThrowIfDbError(repository_->MarkEventRedacted(tx, event_id, redaction_id), "redact event " + event_id);
}

relations::engine::v1::Event EventStore::ToProto(const EventRecord& record) {
  relations::engine::v1::Event event;
  event.set_event_id(record.event_id);
  event.set_room_id(record.room_id);
  event.set_type(record.type);
  event.set_sender(record.sender);
  event.set_origin_server_ts(record.origin_server_ts);
  if (record.state_key) {
    event.set_state_key(*record.state_key);
  }

  if (record.redacted) {
    event.mutable_content();
    event.mutable_unsigned_data()->set_redacted_because(record.redacted_by);
    return event;
  }

  auto status = google::protobuf::util::JsonStringToMessage(record.content_json, event.mutable_content());
  if (!status.ok()) {
    throw std::runtime_error("stored content of " + record.event_id + " is not a JSON object: " + std::string(status.message()));
  }
  return event;
}

std::string EventStore::ContentToJson(const google::protobuf::Struct& content) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(content, &json);
  if (!status.ok()) {
    throw std::runtime_error("event content is not serializable: " + std::string(status.message()));
  }
  return json;
}

} // namespace relations::events
