#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/core/relation_store.hpp"
#include "internal/db/api/repository.hpp"

namespace relations::core {

struct AggregationPage {
  std::vector<relations::db::model::AggregationRecord> groups;
  std::optional<std::string> next_batch;
};

/*
  Grouped annotation counts for one target.

  Groups are keyed by (event_type, key) and read from the materialized
  counters, ordered by count desc then first-seen asc. Only m.annotation
  relations aggregate.
*/
class AggregationEngine {
 public:
  AggregationEngine(std::shared_ptr<relations::db::Repository> repository, std::shared_ptr<RelationStore> store);

  AggregationPage Aggregate(relations::db::Transaction& tx, const std::string& target_event_id,
                            const std::optional<std::string>& rel_type, const std::optional<std::string>& event_type,
                            const std::string& from, uint64_t limit);

  // Backward listing of the edges of one group.
  RelationPage PaginateGroup(relations::db::Transaction& tx, const std::string& target_event_id, const std::string& rel_type,
                             const std::string& event_type, const std::string& key, const std::string& from, uint64_t limit);

 private:
  std::shared_ptr<relations::db::Repository> repository_;
  std::shared_ptr<RelationStore>             store_;
};

} // namespace relations::core
