#pragma once

#include <memory>
#include <optional>
#include <string>

#include <google/protobuf/struct.pb.h>

#include "internal/auth/membership.hpp"
#include "internal/core/relation_store.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/events/event_store.hpp"

namespace relations::core {

struct RelationDraft {
  std::string                room_id;
  std::string                sender;
  std::string                target_event_id;
  std::string                rel_type;
  std::string                event_type;
  std::optional<std::string> key;
  google::protobuf::Struct   content;
};

/*
  Single entry point for new relation events.

  Rules are checked in order before anything is written:

    0. sender joined, rel_type and event_type non-empty
    1. target exists in the same room          else NotFound
    2. target is not membership, not redacted  else InvalidRelation
    3. annotation reactions carry a non-blank key; keys only on
       annotations                              else InvalidRelation

  Then m.relates_to is written into the content, and the event, its edge
  and the annotation counter are committed in one transaction.
*/
class IngestValidator {
 public:
  IngestValidator(std::shared_ptr<relations::db::Repository> repository, std::shared_ptr<relations::events::EventStore> events,
                  std::shared_ptr<relations::auth::MembershipChecker> membership, std::shared_ptr<RelationStore> store);

  relations::db::model::EventRecord Submit(const RelationDraft& draft);

  // Rules 0-3 only. Throws on the first violation.
  void Validate(relations::db::Transaction& tx, const RelationDraft& draft);

  // Content with m.relates_to replaced by the relation descriptor.
  static google::protobuf::Struct WithRelatesTo(const RelationDraft& draft);

 private:
  std::shared_ptr<relations::db::Repository>          repository_;
  std::shared_ptr<relations::events::EventStore>      events_;
  std::shared_ptr<relations::auth::MembershipChecker> membership_;
  std::shared_ptr<RelationStore>                      store_;
};

} // namespace relations::core
