#pragma once

#include <algorithm>
#include <cstdint>
#include <memory>

namespace relations::db { class Repository; }
namespace relations::events { class EventStore; }
namespace relations::auth { class MembershipChecker; }
namespace relations::core {
class RelationStore;
class AggregationEngine;
class IngestValidator;
class Bundler;
}

namespace relations::service {

/*
  Page size policy: 0 selects the default, anything above max is clamped.
*/
struct PageLimits {
  uint32_t default_limit = 5;
  uint32_t max_limit     = 100;

  uint32_t Resolve(uint32_t requested) const {
    if (requested == 0) {
      return default_limit;
    }
    return std::min(requested, max_limit);
  }
};

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<relations::db::Repository> repository;
  std::shared_ptr<relations::events::EventStore> events;
  std::shared_ptr<relations::auth::MembershipChecker> membership;
  std::shared_ptr<relations::core::RelationStore> relations;
  std::shared_ptr<relations::core::AggregationEngine> aggregations;
  std::shared_ptr<relations::core::IngestValidator> ingest;
  std::shared_ptr<relations::core::Bundler> bundler;
  PageLimits limits;
};

} // namespace relations::service
