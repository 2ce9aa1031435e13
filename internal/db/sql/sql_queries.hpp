#pragma once

namespace relations::db::sql {

/*
  Canonical SQL used by the SQLite backend.

  Postgres installs the same statements with $n placeholders as prepared
  statements on each pooled connection (see PgPool).
*/

// events

static constexpr const char* SELECT_ROOM_DEPTH =
    "SELECT COALESCE(MAX(topological_ordering),0) FROM events WHERE room_id=?;";

static constexpr const char* INSERT_EVENT =
    "INSERT INTO events(event_id,room_id,type,sender,state_key,content,origin_server_ts,topological_ordering)"
    " VALUES(?,?,?,?,?,?,?,?);";

static constexpr const char* SELECT_EVENT =
    "SELECT event_id,room_id,type,sender,state_key,content,origin_server_ts,"
    "topological_ordering,stream_ordering,redacted,COALESCE(redacted_by,'')"
    " FROM events WHERE event_id=?;";

static constexpr const char* REDACT_EVENT =
    "UPDATE events SET redacted=1,redacted_by=? WHERE event_id=?;";

// membership

static constexpr const char* UPSERT_MEMBERSHIP =
    "INSERT INTO room_memberships(room_id,user_id,membership,event_id)"
    " VALUES(?,?,?,?)"
    " ON CONFLICT(room_id,user_id) DO UPDATE SET"
    " membership=excluded.membership,"
    " event_id=excluded.event_id;";

static constexpr const char* SELECT_MEMBERSHIP =
    "SELECT room_id,user_id,membership,event_id"
    " FROM room_memberships WHERE room_id=? AND user_id=?;";

// relations

static constexpr const char* INSERT_RELATION =
    "INSERT INTO event_relations(event_id,relates_to_id,rel_type,event_type,aggregation_key,"
    "sender,origin_server_ts,topological_ordering,stream_ordering)"
    " VALUES(?,?,?,?,?,?,?,?,?);";

static constexpr const char* RELATION_COLUMNS =
    "SELECT event_id,relates_to_id,rel_type,event_type,aggregation_key,sender,"
    "origin_server_ts,topological_ordering,stream_ordering,redacted"
    " FROM event_relations";

static constexpr const char* REDACT_RELATION =
    "UPDATE event_relations SET redacted=1 WHERE event_id=?;";

// annotation counters

static constexpr const char* INCREMENT_AGGREGATION =
    "INSERT INTO event_relation_aggregations(relates_to_id,event_type,aggregation_key,count,creation_ordering)"
    " VALUES(?,?,?,1,?)"
    " ON CONFLICT(relates_to_id,event_type,aggregation_key) DO UPDATE SET"
    " count=event_relation_aggregations.count+1;";

static constexpr const char* DECREMENT_AGGREGATION =
    "UPDATE event_relation_aggregations SET count=count-1"
    " WHERE relates_to_id=? AND event_type=? AND aggregation_key=?;";

static constexpr const char* DELETE_EMPTY_AGGREGATION =
    "DELETE FROM event_relation_aggregations"
    " WHERE relates_to_id=? AND event_type=? AND aggregation_key=? AND count<=0;";

static constexpr const char* AGGREGATION_COLUMNS =
    "SELECT relates_to_id,event_type,aggregation_key,count,creation_ordering"
    " FROM event_relation_aggregations";

} // namespace relations::db::sql
