#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace relations::db::sqlite {

using relations::db::ErrorCode;
using relations::db::Result;
using relations::model::Direction;

namespace {

struct StmtDeleter {
  void operator()(sqlite3_stmt* st) const {
    sqlite3_finalize(st);
  }
};

using Stmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

Stmt Prepare(sqlite3* db, const std::string& sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return Stmt(st);
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

model::RelationRecord ReadRelationRow(sqlite3_stmt* st) {
  model::RelationRecord r;
  r.event_id             = ColText(st, 0);
  r.relates_to_id        = ColText(st, 1);
  r.rel_type             = ColText(st, 2);
  r.event_type           = ColText(st, 3);
  r.aggregation_key      = ColText(st, 4);
  r.sender               = ColText(st, 5);
  r.origin_server_ts     = ColU64(st, 6);
  r.topological_ordering = ColU64(st, 7);
  r.stream_ordering      = ColU64(st, 8);
  r.redacted             = sqlite3_column_int(st, 9) != 0;
  return r;
}

model::AggregationRecord ReadAggregationRow(sqlite3_stmt* st) {
  model::AggregationRecord r;
  r.relates_to_id     = ColText(st, 0);
  r.event_type        = ColText(st, 1);
  r.aggregation_key   = ColText(st, 2);
  r.count             = ColU64(st, 3);
  r.creation_ordering = ColU64(st, 4);
  return r;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xff) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Events
// ------------------------------------------------------------------

Result SqliteRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  auto* db = TX(t).Handle();

  auto depth = Prepare(db, sql::SELECT_ROOM_DEPTH);
  BindText(depth.get(), 1, r.room_id);
  int rc = sqlite3_step(depth.get());
  if (rc != SQLITE_ROW) return Translate(db, rc);
  const uint64_t topological = ColU64(depth.get(), 0) + 1;

  auto st = Prepare(db, sql::INSERT_EVENT);
  BindText(st.get(), 1, r.event_id);
  BindText(st.get(), 2, r.room_id);
  BindText(st.get(), 3, r.type);
  BindText(st.get(), 4, r.sender);
  if (r.state_key) {
    BindText(st.get(), 5, *r.state_key);
  } else {
    sqlite3_bind_null(st.get(), 5);
  }
  BindText(st.get(), 6, r.content_json);
  BindU64(st.get(), 7, r.origin_server_ts);
  BindU64(st.get(), 8, topological);

  rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) {
    if ((rc & 0xff) == SQLITE_CONSTRAINT) return Result::Err(ErrorCode::AlreadyExists, r.event_id);
    return Translate(db, rc);
  }

  r.topological_ordering = topological;
  r.stream_ordering      = static_cast<uint64_t>(sqlite3_last_insert_rowid(db));
  return Result::Ok();
}

std::optional<model::EventRecord> SqliteRepository::GetEvent(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_EVENT);
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  model::EventRecord r;
  r.event_id = ColText(st.get(), 0);
  r.room_id  = ColText(st.get(), 1);
  r.type     = ColText(st.get(), 2);
  r.sender   = ColText(st.get(), 3);
  if (sqlite3_column_type(st.get(), 4) != SQLITE_NULL) {
    r.state_key = ColText(st.get(), 4);
  }
  r.content_json         = ColText(st.get(), 5);
  r.origin_server_ts     = ColU64(st.get(), 6);
  r.topological_ordering = ColU64(st.get(), 7);
  r.stream_ordering      = ColU64(st.get(), 8);
  r.redacted             = sqlite3_column_int(st.get(), 9) != 0;
  r.redacted_by          = ColText(st.get(), 10);
  return r;
}

Result SqliteRepository::MarkEventRedacted(Transaction& t, const std::string& id, const std::string& redacted_by) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::REDACT_EVENT);
  BindText(st.get(), 1, redacted_by);
  BindText(st.get(), 2, id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Membership
// ------------------------------------------------------------------

Result SqliteRepository::UpsertMembership(Transaction& t, const model::MembershipRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::UPSERT_MEMBERSHIP);
  BindText(st.get(), 1, r.room_id);
  BindText(st.get(), 2, r.user_id);
  BindText(st.get(), 3, r.membership);
  BindText(st.get(), 4, r.event_id);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::MembershipRecord> SqliteRepository::GetMembership(Transaction& t, const std::string& room_id,
                                                                       const std::string& user_id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::SELECT_MEMBERSHIP);
  BindText(st.get(), 1, room_id);
  BindText(st.get(), 2, user_id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;

  return model::MembershipRecord{
      .room_id    = ColText(st.get(), 0),
      .user_id    = ColText(st.get(), 1),
      .membership = ColText(st.get(), 2),
      .event_id   = ColText(st.get(), 3),
  };
}

// ------------------------------------------------------------------
// Relations
// ------------------------------------------------------------------

Result SqliteRepository::InsertRelation(Transaction& t, const model::RelationRecord& r) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INSERT_RELATION);
  BindText(st.get(), 1, r.event_id);
  BindText(st.get(), 2, r.relates_to_id);
  BindText(st.get(), 3, r.rel_type);
  BindText(st.get(), 4, r.event_type);
  BindText(st.get(), 5, r.aggregation_key);
  BindText(st.get(), 6, r.sender);
  BindU64(st.get(), 7, r.origin_server_ts);
  BindU64(st.get(), 8, r.topological_ordering);
  BindU64(st.get(), 9, r.stream_ordering);
  return Translate(db, sqlite3_step(st.get()));
}

std::optional<model::RelationRecord> SqliteRepository::GetRelation(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, std::string(sql::RELATION_COLUMNS) + " WHERE event_id=?;");
  BindText(st.get(), 1, id);

  if (sqlite3_step(st.get()) != SQLITE_ROW) return std::nullopt;
  return ReadRelationRow(st.get());
}

Result SqliteRepository::MarkRelationRedacted(Transaction& t, const std::string& id) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::REDACT_RELATION);
  BindText(st.get(), 1, id);

  int rc = sqlite3_step(st.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, id);
  return Result::Ok();
}

std::vector<model::RelationRecord> SqliteRepository::ReadRelations(Transaction& t, const model::RelationQuery& q) {
  auto* db = TX(t).Handle();

  const bool  backward = q.direction == Direction::kBackward;
  std::string sql      = std::string(sql::RELATION_COLUMNS) + " WHERE relates_to_id=? AND redacted=0";
  if (q.rel_type) sql += " AND rel_type=?";
  if (q.event_type) sql += " AND event_type=?";
  if (q.aggregation_key) sql += " AND aggregation_key=?";
  if (q.from) {
    sql += backward ? " AND (topological_ordering<? OR (topological_ordering=? AND stream_ordering<?))"
                    : " AND (topological_ordering>? OR (topological_ordering=? AND stream_ordering>?))";
  }
  sql += backward ? " ORDER BY topological_ordering DESC, stream_ordering DESC"
                  : " ORDER BY topological_ordering ASC, stream_ordering ASC";
  if (q.limit > 0) sql += " LIMIT ?";
  sql += ";";

  auto st  = Prepare(db, sql);
  int  idx = 1;
  BindText(st.get(), idx++, q.relates_to_id);
  if (q.rel_type) BindText(st.get(), idx++, *q.rel_type);
  if (q.event_type) BindText(st.get(), idx++, *q.event_type);
  if (q.aggregation_key) BindText(st.get(), idx++, *q.aggregation_key);
  if (q.from) {
    BindU64(st.get(), idx++, q.from->topological);
    BindU64(st.get(), idx++, q.from->topological);
    BindU64(st.get(), idx++, q.from->stream);
  }
  if (q.limit > 0) BindU64(st.get(), idx++, q.limit);

  std::vector<model::RelationRecord> out;
  int                                rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadRelationRow(st.get()));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("ReadRelations: ") + sqlite3_errmsg(db));
  }
  return out;
}

// ------------------------------------------------------------------
// Annotation counters
// ------------------------------------------------------------------

Result SqliteRepository::IncrementAggregation(Transaction& t, const std::string& relates_to_id,
                                              const std::string& event_type, const std::string& aggregation_key,
                                              uint64_t creation_ordering) {
  auto* db = TX(t).Handle();
  auto  st = Prepare(db, sql::INCREMENT_AGGREGATION);
  BindText(st.get(), 1, relates_to_id);
  BindText(st.get(), 2, event_type);
  BindText(st.get(), 3, aggregation_key);
  BindU64(st.get(), 4, creation_ordering);
  return Translate(db, sqlite3_step(st.get()));
}

Result SqliteRepository::DecrementAggregation(Transaction& t, const std::string& relates_to_id,
                                              const std::string& event_type, const std::string& aggregation_key) {
  auto* db = TX(t).Handle();

  auto dec = Prepare(db, sql::DECREMENT_AGGREGATION);
  BindText(dec.get(), 1, relates_to_id);
  BindText(dec.get(), 2, event_type);
  BindText(dec.get(), 3, aggregation_key);
  int rc = sqlite3_step(dec.get());
  if (rc != SQLITE_DONE) return Translate(db, rc);
  if (sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound, aggregation_key);

  auto del = Prepare(db, sql::DELETE_EMPTY_AGGREGATION);
  BindText(del.get(), 1, relates_to_id);
  BindText(del.get(), 2, event_type);
  BindText(del.get(), 3, aggregation_key);
  return Translate(db, sqlite3_step(del.get()));
}

std::vector<model::AggregationRecord> SqliteRepository::ReadAggregations(Transaction& t,
                                                                         const model::AggregationQuery& q) {
  auto* db = TX(t).Handle();

  std::string sql = std::string(sql::AGGREGATION_COLUMNS) + " WHERE relates_to_id=?";
  if (q.event_type) sql += " AND event_type=?";
  if (q.after) sql += " AND (count<? OR (count=? AND creation_ordering>?))";
  sql += " ORDER BY count DESC, creation_ordering ASC";
  if (q.limit > 0) sql += " LIMIT ?";
  sql += ";";

  auto st  = Prepare(db, sql);
  int  idx = 1;
  BindText(st.get(), idx++, q.relates_to_id);
  if (q.event_type) BindText(st.get(), idx++, *q.event_type);
  if (q.after) {
    BindU64(st.get(), idx++, q.after->count);
    BindU64(st.get(), idx++, q.after->count);
    BindU64(st.get(), idx++, q.after->creation);
  }
  if (q.limit > 0) BindU64(st.get(), idx++, q.limit);

  std::vector<model::AggregationRecord> out;
  int                                   rc;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    out.push_back(ReadAggregationRow(st.get()));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("ReadAggregations: ") + sqlite3_errmsg(db));
  }
  return out;
}

} // namespace relations::db::sqlite
