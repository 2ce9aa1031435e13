#include "pg_repository.hpp"

namespace relations::db::postgres {

using relations::model::Direction;

namespace {

std::optional<std::string> OptText(const pqxx::field& f) {
  if (f.is_null()) return std::nullopt;
  return std::string(f.c_str());
}

model::RelationRecord ReadRelationRow(const pqxx::row& row) {
  model::RelationRecord r;
  r.event_id             = row[0].c_str();
  r.relates_to_id        = row[1].c_str();
  r.rel_type             = row[2].c_str();
  r.event_type           = row[3].c_str();
  r.aggregation_key      = row[4].c_str();
  r.sender               = row[5].c_str();
  r.origin_server_ts     = row[6].as<uint64_t>();
  r.topological_ordering = row[7].as<uint64_t>();
  r.stream_ordering      = row[8].as<uint64_t>();
  r.redacted             = row[9].as<bool>();
  return r;
}

std::optional<int64_t> OptLimit(uint64_t limit) {
  if (limit == 0) return std::nullopt;
  return static_cast<int64_t>(limit);
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::serialization_failure*>(&e)) {
    return Result::Err(ErrorCode::SerializationFailure, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ---------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------

Result PgRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  try {
    auto&          w           = TX(t).Work();
    const uint64_t topological = w.exec_prepared1("room_depth", r.room_id)[0].as<uint64_t>() + 1;

    auto row = w.exec_prepared1("insert_event", r.event_id, r.room_id, r.type, r.sender, r.state_key, r.content_json,
                                static_cast<int64_t>(r.origin_server_ts), static_cast<int64_t>(topological));

    r.topological_ordering = topological;
    r.stream_ordering      = row[0].as<uint64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::EventRecord> PgRepository::GetEvent(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_event", id);
  if (res.empty()) return std::nullopt;

  const auto&        row = res[0];
  model::EventRecord r;
  r.event_id             = row[0].c_str();
  r.room_id              = row[1].c_str();
  r.type                 = row[2].c_str();
  r.sender               = row[3].c_str();
  r.state_key            = OptText(row[4]);
  r.content_json         = row[5].c_str();
  r.origin_server_ts     = row[6].as<uint64_t>();
  r.topological_ordering = row[7].as<uint64_t>();
  r.stream_ordering      = row[8].as<uint64_t>();
  r.redacted             = row[9].as<bool>();
  r.redacted_by          = row[10].c_str();
  return r;
}

Result PgRepository::MarkEventRedacted(Transaction& t, const std::string& id, const std::string& redacted_by) {
  try {
    auto res = TX(t).Work().exec_prepared("redact_event", id, redacted_by);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ---------------------------------------------------------------------
// Membership
// ---------------------------------------------------------------------

Result PgRepository::UpsertMembership(Transaction& t, const model::MembershipRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_membership", r.room_id, r.user_id, r.membership, r.event_id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::MembershipRecord> PgRepository::GetMembership(Transaction& t, const std::string& room_id,
                                                                   const std::string& user_id) {
  auto res = TX(t).Work().exec_prepared("get_membership", room_id, user_id);
  if (res.empty()) return std::nullopt;

  return model::MembershipRecord{
      .room_id    = res[0][0].c_str(),
      .user_id    = res[0][1].c_str(),
      .membership = res[0][2].c_str(),
      .event_id   = res[0][3].c_str(),
  };
}

// ---------------------------------------------------------------------
// Relations
// ---------------------------------------------------------------------

Result PgRepository::InsertRelation(Transaction& t, const model::RelationRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_relation", r.event_id, r.relates_to_id, r.rel_type, r.event_type,
                               r.aggregation_key, r.sender, static_cast<int64_t>(r.origin_server_ts),
                               static_cast<int64_t>(r.topological_ordering), static_cast<int64_t>(r.stream_ordering));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::RelationRecord> PgRepository::GetRelation(Transaction& t, const std::string& id) {
  auto res = TX(t).Work().exec_prepared("get_relation", id);
  if (res.empty()) return std::nullopt;
  return ReadRelationRow(res[0]);
}

Result PgRepository::MarkRelationRedacted(Transaction& t, const std::string& id) {
  try {
    auto res = TX(t).Work().exec_prepared("redact_relation", id);
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound, id);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::RelationRecord> PgRepository::ReadRelations(Transaction& t, const model::RelationQuery& q) {
  std::optional<int64_t> from_topological;
  std::optional<int64_t> from_stream;
  if (q.from) {
    from_topological = static_cast<int64_t>(q.from->topological);
    from_stream      = static_cast<int64_t>(q.from->stream);
  }

  const char* stmt = q.direction == Direction::kBackward ? "relations_backward" : "relations_forward";
  auto        res  = TX(t).Work().exec_prepared(stmt, q.relates_to_id, q.rel_type, q.event_type, q.aggregation_key,
                                               from_topological, from_stream, OptLimit(q.limit));

  std::vector<model::RelationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(ReadRelationRow(row));
  }
  return out;
}

// ---------------------------------------------------------------------
// Annotation counters
// ---------------------------------------------------------------------

Result PgRepository::IncrementAggregation(Transaction& t, const std::string& relates_to_id,
                                          const std::string& event_type, const std::string& aggregation_key,
                                          uint64_t creation_ordering) {
  try {
    TX(t).Work().exec_prepared("increment_aggregation", relates_to_id, event_type, aggregation_key,
                               static_cast<int64_t>(creation_ordering));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::DecrementAggregation(Transaction& t, const std::string& relates_to_id,
                                          const std::string& event_type, const std::string& aggregation_key) {
  try {
    auto& w   = TX(t).Work();
    auto  res = w.exec_prepared("decrement_aggregation", relates_to_id, event_type, aggregation_key);
    if (res.empty()) return Result::Err(ErrorCode::NotFound, aggregation_key);

    if (res[0][0].as<int64_t>() <= 0) {
      w.exec_prepared("delete_aggregation", relates_to_id, event_type, aggregation_key);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::AggregationRecord> PgRepository::ReadAggregations(Transaction& t,
                                                                     const model::AggregationQuery& q) {
  std::optional<int64_t> after_count;
  std::optional<int64_t> after_creation;
  if (q.after) {
    after_count    = static_cast<int64_t>(q.after->count);
    after_creation = static_cast<int64_t>(q.after->creation);
  }

  auto res = TX(t).Work().exec_prepared("read_aggregations", q.relates_to_id, q.event_type, after_count,
                                        after_creation, OptLimit(q.limit));

  std::vector<model::AggregationRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) {
    out.push_back(model::AggregationRecord{
        .relates_to_id     = row[0].c_str(),
        .event_type        = row[1].c_str(),
        .aggregation_key   = row[2].c_str(),
        .count             = row[3].as<uint64_t>(),
        .creation_ordering = row[4].as<uint64_t>(),
    });
  }
  return out;
}

} // namespace relations::db::postgres
