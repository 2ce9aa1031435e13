#include "bundler.hpp"

#include "internal/model/relation_type.hpp"
#include "internal/observability/spans.hpp"

namespace relations::core {

namespace v1 = relations::engine::v1;

Bundler::Bundler(std::shared_ptr<AggregationEngine> aggregations, std::shared_ptr<RelationStore> store, uint64_t bundle_limit)
    : aggregations_(std::move(aggregations)), store_(std::move(store)), bundle_limit_(bundle_limit) {
}

void Bundler::Bundle(relations::db::Transaction& tx, v1::Event& event) const {
  if (event.has_unsigned_data() && event.unsigned_data().has_redacted_because()) {
    return;
  }

  relations::observability::SpanScope span("Bundler.Bundle");
  span.SetRelation(event.event_id(), {});

  v1::BundledRelations bundled;

  auto groups = aggregations_->Aggregate(tx, event.event_id(), std::nullopt, std::nullopt, "", bundle_limit_);
  if (!groups.groups.empty()) {
    auto* annotation = bundled.mutable_annotation();
    for (const auto& group : groups.groups) {
      auto* entry = annotation->add_chunk();
      entry->set_type(group.event_type);
      entry->set_key(group.aggregation_key);
      entry->set_count(group.count);
    }
    if (groups.next_batch) {
      annotation->set_next_batch(*groups.next_batch);
    }
  }

  RelationFilter references{.rel_type = std::string(relations::model::kReference)};
  auto           refs = store_->QueryPage(tx, event.event_id(), references, relations::model::Direction::kForward, "", bundle_limit_);
  if (!refs.edges.empty()) {
    auto* reference = bundled.mutable_reference();
    for (const auto& edge : refs.edges) {
      reference->add_chunk()->set_event_id(edge.event_id);
    }
    if (refs.next_batch) {
      reference->set_next_batch(*refs.next_batch);
    }
  }

  if (bundled.has_annotation() || bundled.has_reference()) {
    *event.mutable_unsigned_data()->mutable_relations() = std::move(bundled);
  }
}

} // namespace relations::core
