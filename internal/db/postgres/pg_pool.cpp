#include "pg_pool.hpp"

namespace relations::db::postgres {

PgPool::PgPool(std::string conninfo, std::size_t max_connections)
    : conninfo_(std::move(conninfo)),
      max_connections_(max_connections == 0 ? 1 : max_connections) {
}

std::shared_ptr<pqxx::connection> PgPool::Acquire() {
  for (;;) {
    {
      std::unique_lock lock(mutex_);

      if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return Wrap(conn.release());
      }

      if (live_connections_ < max_connections_) {
        ++live_connections_;
        lock.unlock();

        try {
          auto conn = std::make_unique<pqxx::connection>(conninfo_);
          PrepareStatements(*conn);
          return Wrap(conn.release());
        } catch (const std::exception&) {
          std::lock_guard rollback_lock(mutex_);
          --live_connections_;
          cv_.notify_one();
          throw;
        }
      }

      cv_.wait(lock, [this] {
        return !idle_.empty() || live_connections_ < max_connections_;
      });
    }
  }
}

void PgPool::PrepareStatements(pqxx::connection& conn) {
  conn.prepare("room_depth",
               "SELECT COALESCE(MAX(topological_ordering),0) FROM events WHERE room_id=$1");

  conn.prepare("insert_event",
               "INSERT INTO events(event_id,room_id,type,sender,state_key,content,origin_server_ts,topological_ordering) "
               "VALUES($1,$2,$3,$4,$5,$6::jsonb,$7,$8) RETURNING stream_ordering");

  conn.prepare("get_event",
               "SELECT event_id,room_id,type,sender,state_key,content::text,origin_server_ts,"
               "topological_ordering,stream_ordering,redacted,COALESCE(redacted_by,'') "
               "FROM events WHERE event_id=$1");

  conn.prepare("redact_event", "UPDATE events SET redacted=TRUE,redacted_by=$2 WHERE event_id=$1");

  conn.prepare("upsert_membership",
               "INSERT INTO room_memberships(room_id,user_id,membership,event_id) VALUES($1,$2,$3,$4) "
               "ON CONFLICT(room_id,user_id) DO UPDATE SET membership=EXCLUDED.membership,event_id=EXCLUDED.event_id");

  conn.prepare("get_membership",
               "SELECT room_id,user_id,membership,event_id FROM room_memberships WHERE room_id=$1 AND user_id=$2");

  conn.prepare("insert_relation",
               "INSERT INTO event_relations(event_id,relates_to_id,rel_type,event_type,aggregation_key,"
               "sender,origin_server_ts,topological_ordering,stream_ordering) "
               "VALUES($1,$2,$3,$4,$5,$6,$7,$8,$9)");

  conn.prepare("get_relation",
               "SELECT event_id,relates_to_id,rel_type,event_type,aggregation_key,sender,"
               "origin_server_ts,topological_ordering,stream_ordering,redacted "
               "FROM event_relations WHERE event_id=$1");

  conn.prepare("redact_relation", "UPDATE event_relations SET redacted=TRUE WHERE event_id=$1");

  // Optional filters are passed as NULL. LIMIT NULL means unbounded.
  conn.prepare("relations_backward",
               "SELECT event_id,relates_to_id,rel_type,event_type,aggregation_key,sender,"
               "origin_server_ts,topological_ordering,stream_ordering,redacted "
               "FROM event_relations WHERE relates_to_id=$1 AND NOT redacted "
               "AND ($2::text IS NULL OR rel_type=$2) "
               "AND ($3::text IS NULL OR event_type=$3) "
               "AND ($4::text IS NULL OR aggregation_key=$4) "
               "AND ($5::bigint IS NULL OR (topological_ordering,stream_ordering) < ($5,$6::bigint)) "
               "ORDER BY topological_ordering DESC, stream_ordering DESC LIMIT $7");

  conn.prepare("relations_forward",
               "SELECT event_id,relates_to_id,rel_type,event_type,aggregation_key,sender,"
               "origin_server_ts,topological_ordering,stream_ordering,redacted "
               "FROM event_relations WHERE relates_to_id=$1 AND NOT redacted "
               "AND ($2::text IS NULL OR rel_type=$2) "
               "AND ($3::text IS NULL OR event_type=$3) "
               "AND ($4::text IS NULL OR aggregation_key=$4) "
               "AND ($5::bigint IS NULL OR (topological_ordering,stream_ordering) > ($5,$6::bigint)) "
               "ORDER BY topological_ordering ASC, stream_ordering ASC LIMIT $7");

  conn.prepare("increment_aggregation",
               "INSERT INTO event_relation_aggregations(relates_to_id,event_type,aggregation_key,count,creation_ordering) "
               "VALUES($1,$2,$3,1,$4) "
               "ON CONFLICT(relates_to_id,event_type,aggregation_key) DO UPDATE SET "
               "count=event_relation_aggregations.count+1");

  conn.prepare("decrement_aggregation",
               "UPDATE event_relation_aggregations SET count=count-1 "
               "WHERE relates_to_id=$1 AND event_type=$2 AND aggregation_key=$3 RETURNING count");

  conn.prepare("delete_aggregation",
               "DELETE FROM event_relation_aggregations "
               "WHERE relates_to_id=$1 AND event_type=$2 AND aggregation_key=$3");

  conn.prepare("read_aggregations",
               "SELECT relates_to_id,event_type,aggregation_key,count,creation_ordering "
               "FROM event_relation_aggregations WHERE relates_to_id=$1 "
               "AND ($2::text IS NULL OR event_type=$2) "
               "AND ($3::bigint IS NULL OR count<$3 OR (count=$3 AND creation_ordering>$4::bigint)) "
               "ORDER BY count DESC, creation_ordering ASC LIMIT $5");
}

std::shared_ptr<pqxx::connection> PgPool::Wrap(pqxx::connection* conn) {
  std::weak_ptr<PgPool> weak_self = shared_from_this();
  return std::shared_ptr<pqxx::connection>(conn, [weak_self](pqxx::connection* released_conn) {
    if (auto self = weak_self.lock()) {
      self->Release(released_conn);
      return;
    }
    delete released_conn;
  });
}

void PgPool::Release(pqxx::connection* conn) {
  {
    std::lock_guard lock(mutex_);
    idle_.emplace_back(conn);
  }
  cv_.notify_one();
}

} // namespace relations::db::postgres
