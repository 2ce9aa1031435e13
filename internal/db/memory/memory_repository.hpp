#pragma once

#include <map>
#include <mutex>
#include <tuple>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace relations::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertEvent(Transaction&, model::EventRecord&) override;
  std::optional<model::EventRecord> GetEvent(Transaction&, const std::string&) override;
  Result MarkEventRedacted(Transaction&, const std::string&, const std::string&) override;

  Result UpsertMembership(Transaction&, const model::MembershipRecord&) override;
  std::optional<model::MembershipRecord> GetMembership(Transaction&, const std::string&, const std::string&) override;

  Result InsertRelation(Transaction&, const model::RelationRecord&) override;
  std::optional<model::RelationRecord> GetRelation(Transaction&, const std::string&) override;
  Result MarkRelationRedacted(Transaction&, const std::string&) override;
  std::vector<model::RelationRecord> ReadRelations(Transaction&, const model::RelationQuery&) override;

  Result IncrementAggregation(Transaction&, const std::string& relates_to_id, const std::string& event_type,
                              const std::string& aggregation_key, uint64_t creation_ordering) override;
  Result DecrementAggregation(Transaction&, const std::string& relates_to_id, const std::string& event_type,
                              const std::string& aggregation_key) override;
  std::vector<model::AggregationRecord> ReadAggregations(Transaction&, const model::AggregationQuery&) override;

private:
  friend class MemoryTransaction;

  // (relates_to_id, event_type, aggregation_key)
  using GroupKey = std::tuple<std::string, std::string, std::string>;

  struct State {
    std::unordered_map<std::string, model::EventRecord> events;
    std::unordered_map<std::string, uint64_t> room_depth;

    // room_id#user_id
    std::unordered_map<std::string, model::MembershipRecord> memberships;

    std::unordered_map<std::string, model::RelationRecord> relations;
    // relates_to_id -> source event ids in insertion order
    std::unordered_map<std::string, std::vector<std::string>> relations_by_target;

    std::map<GroupKey, model::AggregationRecord> aggregations;

    uint64_t next_stream_ordering = 1;
  };

  std::mutex mutex_;
  State state_;
};

} // namespace relations::db::memory
