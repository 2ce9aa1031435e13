#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace relations::db::postgres {

class PgRepository final : public db::Repository {
public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

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
  static PgTransaction& TX(Transaction&);
  static Result Translate(const std::exception& e);

  std::shared_ptr<PgPool> pool_;
};

} // namespace relations::db::postgres
