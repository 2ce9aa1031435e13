#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace relations::db::memory {

namespace {

using relations::model::Direction;
using relations::model::IsAfter;

std::string MembershipKey(const std::string& room_id, const std::string& user_id) {
  return room_id + "#" + user_id;
}

bool Matches(const model::RelationRecord& r, const model::RelationQuery& q) {
  if (r.redacted) return false;
  if (q.rel_type && r.rel_type != *q.rel_type) return false;
  if (q.event_type && r.event_type != *q.event_type) return false;
  if (q.aggregation_key && r.aggregation_key != *q.aggregation_key) return false;
  if (q.from) {
    if (q.direction == Direction::kBackward && !(r.Position() < *q.from)) return false;
    if (q.direction == Direction::kForward && !(r.Position() > *q.from)) return false;
  }
  return true;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ---------------------------------------------------------------------------
// Events
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertEvent(Transaction& t, model::EventRecord& r) {
  if (TX(t).View().events.contains(r.event_id)) return Result::Err(ErrorCode::AlreadyExists, r.event_id);

  const auto id         = r.event_id;
  const auto room       = r.room_id;
  const auto prev_depth = TX(t).View().room_depth.contains(room) ? TX(t).View().room_depth.at(room) : 0;
  const auto prev_next  = TX(t).View().next_stream_ordering;

  auto& s = TX(t).Mutable([id, room, prev_depth, prev_next](State& st) {
    st.events.erase(id);
    if (prev_depth == 0) {
      st.room_depth.erase(room);
    } else {
      st.room_depth[room] = prev_depth;
    }
    st.next_stream_ordering = prev_next;
  });

  r.topological_ordering = prev_depth + 1;
  r.stream_ordering      = s.next_stream_ordering++;
  s.room_depth[room]     = r.topological_ordering;
  s.events[id]           = r;
  return Result::Ok();
}

std::optional<model::EventRecord> MemoryRepository::GetEvent(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.events.find(id);
  if (it == s.events.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::MarkEventRedacted(Transaction& t, const std::string& id, const std::string& redacted_by) {
  auto it = TX(t).View().events.find(id);
  if (it == TX(t).View().events.end()) return Result::Err(ErrorCode::NotFound, id);

  const auto before = it->second;
  auto&      s      = TX(t).Mutable([before](State& st) { st.events[before.event_id] = before; });
  auto&      e      = s.events[id];
  e.redacted        = true;
  e.redacted_by     = redacted_by;
  return Result::Ok();
}

// ---------------------------------------------------------------------------
// Membership
// ---------------------------------------------------------------------------

Result MemoryRepository::UpsertMembership(Transaction& t, const model::MembershipRecord& r) {
  const auto key = MembershipKey(r.room_id, r.user_id);

  std::optional<model::MembershipRecord> before;
  if (auto it = TX(t).View().memberships.find(key); it != TX(t).View().memberships.end()) {
    before = it->second;
  }

  auto& s = TX(t).Mutable([key, before](State& st) {
    if (before) {
      st.memberships[key] = *before;
    } else {
      st.memberships.erase(key);
    }
  });
  s.memberships[key] = r;
  return Result::Ok();
}

std::optional<model::MembershipRecord> MemoryRepository::GetMembership(Transaction& t, const std::string& room_id,
                                                                       const std::string& user_id) {
  const auto& s  = TX(t).View();
  auto        it = s.memberships.find(MembershipKey(room_id, user_id));
  if (it == s.memberships.end()) return std::nullopt;
  return it->second;
}

// ---------------------------------------------------------------------------
// Relations
// ---------------------------------------------------------------------------

Result MemoryRepository::InsertRelation(Transaction& t, const model::RelationRecord& r) {
  if (TX(t).View().relations.contains(r.event_id)) return Result::Err(ErrorCode::AlreadyExists, r.event_id);

  const auto id     = r.event_id;
  const auto target = r.relates_to_id;
  auto&      s      = TX(t).Mutable([id, target](State& st) {
    st.relations.erase(id);
    auto& ids = st.relations_by_target[target];
    std::erase(ids, id);
    if (ids.empty()) st.relations_by_target.erase(target);
  });

  s.relations[id] = r;
  s.relations_by_target[target].push_back(id);
  return Result::Ok();
}

std::optional<model::RelationRecord> MemoryRepository::GetRelation(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.relations.find(id);
  if (it == s.relations.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::MarkRelationRedacted(Transaction& t, const std::string& id) {
  auto it = TX(t).View().relations.find(id);
  if (it == TX(t).View().relations.end()) return Result::Err(ErrorCode::NotFound, id);

  const bool was = it->second.redacted;
  auto&      s   = TX(t).Mutable([id, was](State& st) { st.relations[id].redacted = was; });
  s.relations[id].redacted = true;
  return Result::Ok();
}

std::vector<model::RelationRecord> MemoryRepository::ReadRelations(Transaction& t, const model::RelationQuery& q) {
  const auto& s = TX(t).View();

  std::vector<model::RelationRecord> out;
  auto                               it = s.relations_by_target.find(q.relates_to_id);
  if (it == s.relations_by_target.end()) return out;

  for (const auto& id : it->second) {
    const auto& r = s.relations.at(id);
    if (Matches(r, q)) out.push_back(r);
  }

  if (q.direction == Direction::kBackward) {
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.Position() > b.Position(); });
  } else {
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.Position() < b.Position(); });
  }

  if (q.limit > 0 && out.size() > q.limit) out.resize(q.limit);
  return out;
}

// ---------------------------------------------------------------------------
// Annotation counters
// ---------------------------------------------------------------------------

Result MemoryRepository::IncrementAggregation(Transaction& t, const std::string& relates_to_id,
                                              const std::string& event_type, const std::string& aggregation_key,
                                              uint64_t creation_ordering) {
  GroupKey   key{relates_to_id, event_type, aggregation_key};
  const bool existed = TX(t).View().aggregations.contains(key);

  auto& s = TX(t).Mutable([key, existed](State& st) {
    if (existed) {
      st.aggregations[key].count--;
    } else {
      st.aggregations.erase(key);
    }
  });

  if (existed) {
    s.aggregations[key].count++;
    return Result::Ok();
  }

  s.aggregations[key] = model::AggregationRecord{
      .relates_to_id     = relates_to_id,
      .event_type        = event_type,
      .aggregation_key   = aggregation_key,
      .count             = 1,
      .creation_ordering = creation_ordering,
  };
  return Result::Ok();
}

Result MemoryRepository::DecrementAggregation(Transaction& t, const std::string& relates_to_id,
                                              const std::string& event_type, const std::string& aggregation_key) {
  GroupKey key{relates_to_id, event_type, aggregation_key};
  auto     it = TX(t).View().aggregations.find(key);
  if (it == TX(t).View().aggregations.end()) return Result::Err(ErrorCode::NotFound, aggregation_key);

  const auto before = it->second;
  auto&      s      = TX(t).Mutable([key, before](State& st) { st.aggregations[key] = before; });

  auto& group = s.aggregations[key];
  if (group.count <= 1) {
    s.aggregations.erase(key);
  } else {
    group.count--;
  }
  return Result::Ok();
}

std::vector<model::AggregationRecord> MemoryRepository::ReadAggregations(Transaction& t,
                                                                         const model::AggregationQuery& q) {
  const auto& s = TX(t).View();

  std::vector<model::AggregationRecord> out;
  for (auto it = s.aggregations.lower_bound(GroupKey{q.relates_to_id, "", ""}); it != s.aggregations.end(); ++it) {
    const auto& g = it->second;
    if (g.relates_to_id != q.relates_to_id) break;
    if (q.event_type && g.event_type != *q.event_type) continue;
    if (q.after && !IsAfter(g.Position(), *q.after)) continue;
    out.push_back(g);
  }

  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
    if (a.count != b.count) return a.count > b.count;
    return a.creation_ordering < b.creation_ordering;
  });

  if (q.limit > 0 && out.size() > q.limit) out.resize(q.limit);
  return out;
}

} // namespace relations::db::memory
