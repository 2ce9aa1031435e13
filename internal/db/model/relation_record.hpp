#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/position.hpp"

namespace relations::db::model {

/*
  Relation edge: source event ---rel_type---> target event.

  One row per relation event, written in the same transaction as the event.
  Ordering columns are copied from the source event so the reverse index
  (relates_to_id, topological_ordering, stream_ordering) can be scanned
  without joining the events table.
*/

struct RelationRecord {
  std::string event_id;      // source
  std::string relates_to_id; // target
  std::string rel_type;
  std::string event_type;
  std::string aggregation_key; // empty unless m.annotation
  std::string sender;

  uint64_t origin_server_ts     = 0;
  uint64_t topological_ordering = 0;
  uint64_t stream_ordering      = 0;

  // soft-delete marker, set when the source event is redacted
  bool redacted = false;

  relations::model::StreamPosition Position() const {
    return {topological_ordering, stream_ordering};
  }
};

/*
  Scan over one target's relation partition.

  `from` is exclusive. Backward scans return rows strictly before it in
  descending order, forward scans rows strictly after it in ascending order.
  Redacted rows are never returned.
*/
struct RelationQuery {
  std::string relates_to_id;
  std::optional<std::string> rel_type;
  std::optional<std::string> event_type;
  std::optional<std::string> aggregation_key;

  relations::model::Direction direction = relations::model::Direction::kBackward;
  std::optional<relations::model::StreamPosition> from;

  uint64_t limit = 0; // 0 = unbounded
};

} // namespace relations::db::model
