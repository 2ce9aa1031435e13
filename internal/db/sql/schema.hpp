#pragma once

#include <array>

namespace relations::db::sql {

/*
  Schema bootstrap, applied idempotently at startup by the factory.

  events                       append-only room log; stream_ordering is the
                               global insertion order
  room_memberships             current membership per (room, user)
  event_relations              one edge per relation event, reverse-indexed
                               by target
  event_relation_aggregations  materialized annotation counters
*/

inline constexpr std::array<const char*, 7> kSqliteSchema = {
    "CREATE TABLE IF NOT EXISTS events ("
    " stream_ordering INTEGER PRIMARY KEY AUTOINCREMENT,"
    " event_id TEXT NOT NULL UNIQUE,"
    " room_id TEXT NOT NULL,"
    " type TEXT NOT NULL,"
    " sender TEXT NOT NULL,"
    " state_key TEXT,"
    " content TEXT NOT NULL,"
    " origin_server_ts INTEGER NOT NULL,"
    " topological_ordering INTEGER NOT NULL,"
    " redacted INTEGER NOT NULL DEFAULT 0,"
    " redacted_by TEXT);",

    "CREATE INDEX IF NOT EXISTS events_room_depth ON events(room_id, topological_ordering);",

    "CREATE TABLE IF NOT EXISTS room_memberships ("
    " room_id TEXT NOT NULL,"
    " user_id TEXT NOT NULL,"
    " membership TEXT NOT NULL,"
    " event_id TEXT NOT NULL,"
    " PRIMARY KEY (room_id, user_id));",

    "CREATE TABLE IF NOT EXISTS event_relations ("
    " event_id TEXT PRIMARY KEY REFERENCES events(event_id),"
    " relates_to_id TEXT NOT NULL,"
    " rel_type TEXT NOT NULL,"
    " event_type TEXT NOT NULL,"
    " aggregation_key TEXT NOT NULL DEFAULT '',"
    " sender TEXT NOT NULL,"
    " origin_server_ts INTEGER NOT NULL,"
    " topological_ordering INTEGER NOT NULL,"
    " stream_ordering INTEGER NOT NULL,"
    " redacted INTEGER NOT NULL DEFAULT 0);",

    "CREATE INDEX IF NOT EXISTS event_relations_target"
    " ON event_relations(relates_to_id, topological_ordering, stream_ordering);",

    "CREATE TABLE IF NOT EXISTS event_relation_aggregations ("
    " relates_to_id TEXT NOT NULL,"
    " event_type TEXT NOT NULL,"
    " aggregation_key TEXT NOT NULL,"
    " count INTEGER NOT NULL,"
    " creation_ordering INTEGER NOT NULL,"
    " PRIMARY KEY (relates_to_id, event_type, aggregation_key));",

    "CREATE INDEX IF NOT EXISTS event_relation_aggregations_order"
    " ON event_relation_aggregations(relates_to_id, count DESC, creation_ordering);",
};

inline constexpr std::array<const char*, 7> kPostgresSchema = {
    "CREATE TABLE IF NOT EXISTS events ("
    " stream_ordering BIGSERIAL PRIMARY KEY,"
    " event_id TEXT NOT NULL UNIQUE,"
    " room_id TEXT NOT NULL,"
    " type TEXT NOT NULL,"
    " sender TEXT NOT NULL,"
    " state_key TEXT,"
    " content JSONB NOT NULL,"
    " origin_server_ts BIGINT NOT NULL,"
    " topological_ordering BIGINT NOT NULL,"
    " redacted BOOLEAN NOT NULL DEFAULT FALSE,"
    " redacted_by TEXT);",

    "CREATE INDEX IF NOT EXISTS events_room_depth ON events(room_id, topological_ordering);",

    "CREATE TABLE IF NOT EXISTS room_memberships ("
    " room_id TEXT NOT NULL,"
    " user_id TEXT NOT NULL,"
    " membership TEXT NOT NULL,"
    " event_id TEXT NOT NULL,"
    " PRIMARY KEY (room_id, user_id));",

    "CREATE TABLE IF NOT EXISTS event_relations ("
    " event_id TEXT PRIMARY KEY REFERENCES events(event_id),"
    " relates_to_id TEXT NOT NULL,"
    " rel_type TEXT NOT NULL,"
    " event_type TEXT NOT NULL,"
    " aggregation_key TEXT NOT NULL DEFAULT '',"
    " sender TEXT NOT NULL,"
    " origin_server_ts BIGINT NOT NULL,"
    " topological_ordering BIGINT NOT NULL,"
    " stream_ordering BIGINT NOT NULL,"
    " redacted BOOLEAN NOT NULL DEFAULT FALSE);",

    "CREATE INDEX IF NOT EXISTS event_relations_target"
    " ON event_relations(relates_to_id, topological_ordering, stream_ordering);",

    "CREATE TABLE IF NOT EXISTS event_relation_aggregations ("
    " relates_to_id TEXT NOT NULL,"
    " event_type TEXT NOT NULL,"
    " aggregation_key TEXT NOT NULL,"
    " count BIGINT NOT NULL,"
    " creation_ordering BIGINT NOT NULL,"
    " PRIMARY KEY (relates_to_id, event_type, aggregation_key));",

    "CREATE INDEX IF NOT EXISTS event_relation_aggregations_order"
    " ON event_relation_aggregations(relates_to_id, count DESC, creation_ordering);",
};

} // namespace relations::db::sql
