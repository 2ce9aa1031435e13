#pragma once

#include <cstdint>
#include <memory>

#include "internal/core/aggregation_engine.hpp"
#include "internal/core/relation_store.hpp"
#include "relations/engine/v1/event.pb.h"

namespace relations::core {

/*
  Attaches unsigned."m.relations" to a served event:

    m.annotation  first page of annotation groups
    m.reference   first page of references, oldest first

  Each section carries next_batch when more remain. Empty sections are
  left out. The stored event is never touched.
*/
class Bundler {
 public:
  Bundler(std::shared_ptr<AggregationEngine> aggregations, std::shared_ptr<RelationStore> store, uint64_t bundle_limit);

  void Bundle(relations::db::Transaction& tx, relations::engine::v1::Event& event) const;

 private:
  std::shared_ptr<AggregationEngine> aggregations_;
  std::shared_ptr<RelationStore>     store_;
  uint64_t                           bundle_limit_;
};

} // namespace relations::core
