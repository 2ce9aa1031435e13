#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace relations::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  static SqliteTransaction& TX(Transaction&);
  static Result Translate(sqlite3* db, int rc);

  std::shared_ptr<SqliteDB> db_;
};

} // namespace relations::db::sqlite
