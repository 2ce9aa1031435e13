#include "relation_store.hpp"

#include <algorithm>

#include "internal/core/cursor_codec.hpp"
#include "internal/core/db_error.hpp"
#include "internal/model/relation_type.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace relations::core {

using relations::db::model::RelationQuery;
using relations::db::model::RelationRecord;
using relations::model::Direction;

namespace {

template <typename CursorT>
RelationPage RunQuery(relations::db::Repository& repository, relations::db::Transaction& tx, RelationQuery query,
                      const QueryShape& shape, const std::string& from, uint64_t limit) {
  if (!from.empty()) {
    const auto cursor = CursorCodec::DecodeAs<CursorT>(from, shape);
    if (cursor.direction != query.direction) {
      throw relations::util::InvalidCursor("pagination token was issued for the opposite direction");
    }
    query.from = cursor.position;
  }

  // one extra row tells whether another page exists
  const auto page_size = std::max<uint64_t>(limit, 1);
  query.limit          = page_size + 1;

  relations::observability::SpanScope span("RelationStore.ReadRelations");
  span.SetRelation(shape.event_id, shape.rel_type, shape.event_type);

  RelationPage page;
  page.edges = repository.ReadRelations(tx, query);
  if (page.edges.size() > page_size) {
    page.edges.resize(page_size);
    page.next_batch = CursorCodec::Encode(shape, CursorT{query.direction, page.edges.back().Position()});
  }
  span.SetPage(page.edges.size(), page.next_batch.has_value());
  return page;
}

} // namespace

RelationStore::RelationStore(std::shared_ptr<relations::db::Repository> repository) : repository_(std::move(repository)) {
}

void RelationStore::Index(relations::db::Transaction& tx, const RelationRecord& edge) {
  ThrowIfDbError(repository_->InsertRelation(tx, edge), "index relation " + edge.event_id);

  if (edge.rel_type == relations::model::kAnnotation) {
    ThrowIfDbError(repository_->IncrementAggregation(tx, edge.relates_to_id, edge.event_type, edge.aggregation_key, edge.stream_ordering),
                   "count annotation " + edge.event_id);
  }
}

bool RelationStore::Redact(relations::db::Transaction& tx, const std::string& source_event_id) {
  auto edge = repository_->GetRelation(tx, source_event_id);
  if (!edge) {
    return false;
  }
  if (edge->redacted) {
    return true;
  }

  ThrowIfDbError(repository_->MarkRelationRedacted(tx, source_event_id), "redact relation " + source_event_id);

  if (edge->rel_type == relations::model::kAnnotation) {
    ThrowIfDbError(repository_->DecrementAggregation(tx, edge->relates_to_id, edge->event_type, edge->aggregation_key),
                   "uncount annotation " + source_event_id);
  }

  relations::observability::Metrics::Instance().RecordRelationRedacted(edge->rel_type);
  RELATIONS_LOG_INFO("relation redacted",
                     relations::observability::RelationFields(source_event_id, edge->relates_to_id, edge->rel_type, edge->aggregation_key));
  return true;
}

RelationPage RelationStore::QueryPage(relations::db::Transaction& tx, const std::string& target_event_id, RelationFilter filter,
                                      Direction direction, const std::string& from, uint64_t limit) {
  // a key only exists on annotations
  if (filter.key) {
    if (filter.rel_type && *filter.rel_type != relations::model::kAnnotation) {
      throw relations::util::InvalidRelation("key filter requires rel_type " + std::string(relations::model::kAnnotation));
    }
    filter.rel_type = std::string(relations::model::kAnnotation);
  }

  const QueryShape shape{
      .event_id   = target_event_id,
      .rel_type   = filter.rel_type.value_or(""),
      .event_type = filter.event_type.value_or(""),
      .key        = filter.key.value_or(""),
  };

  RelationQuery query{
      .relates_to_id   = target_event_id,
      .rel_type        = filter.rel_type,
      .event_type      = filter.event_type,
      .aggregation_key = filter.key,
      .direction       = direction,
  };

  return RunQuery<RelationsCursor>(*repository_, tx, std::move(query), shape, from, limit);
}

RelationPage RelationStore::QueryGroupPage(relations::db::Transaction& tx, const std::string& target_event_id, const std::string& event_type,
                                           const std::string& key, const std::string& from, uint64_t limit) {
  const QueryShape shape{
      .event_id   = target_event_id,
      .rel_type   = std::string(relations::model::kAnnotation),
      .event_type = event_type,
      .key        = key,
  };

  RelationQuery query{
      .relates_to_id   = target_event_id,
      .rel_type        = std::string(relations::model::kAnnotation),
      .event_type      = event_type,
      .aggregation_key = key,
      .direction       = Direction::kBackward,
  };

  return RunQuery<GroupRelationsCursor>(*repository_, tx, std::move(query), shape, from, limit);
}

} // namespace relations::core
