#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "internal/model/position.hpp"

namespace relations::db::model {

/*
  Materialized annotation counter.

  Keyed by (relates_to_id, event_type, aggregation_key). The row is created
  by the first contributing edge and deleted when its count reaches zero;
  creation_ordering is the stream ordering of the edge that created it.
*/

struct AggregationRecord {
  std::string relates_to_id;
  std::string event_type;
  std::string aggregation_key;

  uint64_t count             = 0;
  uint64_t creation_ordering = 0;

  relations::model::GroupPosition Position() const {
    return {count, creation_ordering};
  }
};

/*
  Scan over one target's groups in (count desc, creation asc) order.
  `after` is exclusive.
*/
struct AggregationQuery {
  std::string relates_to_id;
  std::optional<std::string> event_type;
  std::optional<relations::model::GroupPosition> after;

  uint64_t limit = 0; // 0 = unbounded
};

} // namespace relations::db::model
