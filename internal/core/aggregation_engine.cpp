#include "aggregation_engine.hpp"

#include <algorithm>

#include "internal/core/cursor_codec.hpp"
#include "internal/model/relation_type.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace relations::core {

namespace {

void RequireAnnotation(std::string_view rel_type) {
  if (rel_type != relations::model::kAnnotation) {
    throw relations::util::InvalidRelation("aggregation is only supported for " + std::string(relations::model::kAnnotation) +
                                           ", got " + std::string(rel_type));
  }
}

} // namespace

AggregationEngine::AggregationEngine(std::shared_ptr<relations::db::Repository> repository, std::shared_ptr<RelationStore> store)
    : repository_(std::move(repository)), store_(std::move(store)) {
}

AggregationPage AggregationEngine::Aggregate(relations::db::Transaction& tx, const std::string& target_event_id,
                                             const std::optional<std::string>& rel_type, const std::optional<std::string>& event_type,
                                             const std::string& from, uint64_t limit) {
  relations::observability::SpanScope span("AggregationEngine.Aggregate");
  span.SetRelation(target_event_id, relations::model::kAnnotation, event_type.value_or(""));

  if (rel_type) {
    RequireAnnotation(*rel_type);
  }

  const QueryShape shape{
      .event_id   = target_event_id,
      .rel_type   = std::string(relations::model::kAnnotation),
      .event_type = event_type.value_or(""),
      .key        = "",
  };

  relations::db::model::AggregationQuery query{
      .relates_to_id = target_event_id,
      .event_type    = event_type,
  };
  if (!from.empty()) {
    query.after = CursorCodec::DecodeAs<AggregationCursor>(from, shape).position;
  }

  const auto page_size = std::max<uint64_t>(limit, 1);
  query.limit          = page_size + 1;

  AggregationPage page;
  page.groups = repository_->ReadAggregations(tx, query);
  if (page.groups.size() > page_size) {
    page.groups.resize(page_size);
    page.next_batch = CursorCodec::Encode(shape, AggregationCursor{page.groups.back().Position()});
  }
  span.SetPage(page.groups.size(), page.next_batch.has_value());
  return page;
}

RelationPage AggregationEngine::PaginateGroup(relations::db::Transaction& tx, const std::string& target_event_id, const std::string& rel_type,
                                              const std::string& event_type, const std::string& key, const std::string& from,
                                              uint64_t limit) {
  RequireAnnotation(rel_type);
  if (event_type.empty()) {
    throw relations::util::InvalidRelation("event_type is required to page through an annotation group");
  }
  return store_->QueryGroupPage(tx, target_event_id, event_type, key, from, limit);
}

} // namespace relations::core
