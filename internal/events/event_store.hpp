#pragma once

#include <memory>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/db/api/repository.hpp"
#include "relations/engine/v1/event.pb.h"

namespace relations::events {

struct EventDraft {
  std::string                room_id;
  std::string                type;
  std::string                sender;
  std::optional<std::string> state_key;
  google::protobuf::Struct   content;
};

/*
  Append-only room event log.

  Persist() assigns the event id, origin timestamp, room depth and stream
  ordering. m.room.member state events also update the membership table
  in the same transaction.
*/
class EventStore {
 public:
  EventStore(std::shared_ptr<relations::db::Repository> repository, std::string server_name);

  relations::db::model::EventRecord Persist(relations::db::Transaction& tx, const EventDraft& draft);

  std::optional<relations::db::model::EventRecord> Get(relations::db::Transaction& tx, const std::string& event_id);

  // Marks the event redacted by `redaction_id`. Relation bookkeeping is
  // the caller's job.
  void Redact(relations::db::Transaction& tx, const std::string& event_id, const std::string& redaction_id);

  // Served form. Content of a redacted event is pruned.
  static relations::engine::v1::Event ToProto(const relations::db::model::EventRecord& record);

  static std::string ContentToJson(const google::protobuf::Struct& content);

  const std::string& server_name() const {
    return server_name_;
  }

 private:
  std::shared_ptr<relations::db::Repository> repository_;
  std::string                                server_name_;
};

} // namespace relations::events
