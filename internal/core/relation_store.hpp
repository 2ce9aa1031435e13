#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/position.hpp"

namespace relations::core {

struct RelationFilter {
  std::optional<std::string> rel_type;
  std::optional<std::string> event_type;
  std::optional<std::string> key;
};

struct RelationPage {
  std::vector<relations::db::model::RelationRecord> edges;
  // absent at end of stream
  std::optional<std::string> next_batch;
};

/*
  Reverse index over relation edges.

  Edges are listed per target in (topological, stream) order, descending
  for backward pagination and ascending for forward. Every page after the
  first resumes strictly beyond the cursor position, so edges indexed
  after a walk started never appear in it.

  Annotation edges also bump their (target, event_type, key) counter in
  the caller's transaction.
*/
class RelationStore {
 public:
  explicit RelationStore(std::shared_ptr<relations::db::Repository> repository);

  void Index(relations::db::Transaction& tx, const relations::db::model::RelationRecord& edge);

  // Soft-deletes the edge whose source is `source_event_id` and decrements
  // its group. Returns false when the event is not a relation.
  bool Redact(relations::db::Transaction& tx, const std::string& source_event_id);

  RelationPage QueryPage(relations::db::Transaction& tx, const std::string& target_event_id, RelationFilter filter,
                         relations::model::Direction direction, const std::string& from, uint64_t limit);

  // Listing of one annotation group. Tokens are only valid for this kind.
  RelationPage QueryGroupPage(relations::db::Transaction& tx, const std::string& target_event_id, const std::string& event_type,
                              const std::string& key, const std::string& from, uint64_t limit);

 private:
  std::shared_ptr<relations::db::Repository> repository_;
};

} // namespace relations::core
