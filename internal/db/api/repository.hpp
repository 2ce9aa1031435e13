#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/aggregation_record.hpp"
#include "internal/db/model/event_record.hpp"
#include "internal/db/model/membership_record.hpp"
#include "internal/db/model/relation_record.hpp"

namespace relations::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All access goes through a Transaction
  - Reads inside a transaction see its writes
  - Stream orderings are strictly increasing in commit order per backend
  - Counter updates are atomic read-modify-write

  The DB is the source of truth for:
    events
    relation edges
    annotation counters
    room membership
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Events
  // ---------------------------------------------------------------------

  // Appends the event, assigning stream_ordering and topological_ordering
  // (room depth) on the record.
  virtual Result InsertEvent(Transaction&, model::EventRecord&) = 0;

  virtual std::optional<model::EventRecord> GetEvent(Transaction&, const std::string& event_id) = 0;

  virtual Result MarkEventRedacted(Transaction&, const std::string& event_id, const std::string& redacted_by) = 0;

  // ---------------------------------------------------------------------
  // Membership
  // ---------------------------------------------------------------------

  virtual Result UpsertMembership(Transaction&, const model::MembershipRecord&) = 0;

  virtual std::optional<model::MembershipRecord> GetMembership(Transaction&, const std::string& room_id, const std::string& user_id) = 0;

  // ---------------------------------------------------------------------
  // Relations
  // ---------------------------------------------------------------------

  virtual Result InsertRelation(Transaction&, const model::RelationRecord&) = 0;

  virtual std::optional<model::RelationRecord> GetRelation(Transaction&, const std::string& event_id) = 0;

  virtual Result MarkRelationRedacted(Transaction&, const std::string& event_id) = 0;

  virtual std::vector<model::RelationRecord> ReadRelations(Transaction&, const model::RelationQuery& query) = 0;

  // ---------------------------------------------------------------------
  // Annotation counters
  // ---------------------------------------------------------------------

  // Creates the group with count=1 and the given creation ordering, or
  // increments an existing group.
  virtual Result IncrementAggregation(Transaction&, const std::string& relates_to_id, const std::string& event_type,
                                      const std::string& aggregation_key, uint64_t creation_ordering) = 0;

  // Decrements the group and deletes it at zero. NotFound if absent.
  virtual Result DecrementAggregation(Transaction&, const std::string& relates_to_id, const std::string& event_type,
                                      const std::string& aggregation_key) = 0;

  virtual std::vector<model::AggregationRecord> ReadAggregations(Transaction&, const model::AggregationQuery& query) = 0;
};

} // namespace relations::db
