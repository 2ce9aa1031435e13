#include "internal/core/relation_store.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using relations::core::RelationFilter;
using relations::core::RelationStore;
using relations::db::model::AggregationQuery;
using relations::db::model::RelationRecord;
using relations::model::Direction;

const std::string kParent = "$parent:example.org";

RelationRecord Edge(const std::string& id, const std::string& rel_type, uint64_t topological, uint64_t stream,
                    const std::string& key = "") {
  return RelationRecord{
      .event_id             = id,
      .relates_to_id        = kParent,
      .rel_type             = rel_type,
      .event_type           = rel_type == "m.annotation" ? "m.reaction" : "m.room.message",
      .aggregation_key      = key,
      .sender               = "@alice:example.org",
      .origin_server_ts     = 1000 + stream,
      .topological_ordering = topological,
      .stream_ordering      = stream,
  };
}

std::vector<std::string> Ids(const relations::core::RelationPage& page) {
  std::vector<std::string> ids;
  for (const auto& edge : page.edges) ids.push_back(edge.event_id);
  return ids;
}

struct Fixture {
  std::shared_ptr<relations::db::memory::MemoryRepository> repo = std::make_shared<relations::db::memory::MemoryRepository>();
  RelationStore                                           store{repo};

  void IndexAll(const std::vector<RelationRecord>& edges) {
    auto tx = repo->Begin();
    for (const auto& edge : edges) store.Index(*tx, edge);
    tx->Commit();
  }
};

void TestBackwardIsNewestFirstAndForwardOldestFirst() {
  Fixture f;
  f.IndexAll({Edge("$a", "m.reference", 2, 2), Edge("$b", "m.reference", 3, 3), Edge("$c", "m.reference", 3, 4)});

  auto tx       = f.repo->Begin();
  auto backward = f.store.QueryPage(*tx, kParent, {}, Direction::kBackward, "", 10);
  assert((Ids(backward) == std::vector<std::string>{"$c", "$b", "$a"}));
  assert(!backward.next_batch);

  auto forward = f.store.QueryPage(*tx, kParent, {}, Direction::kForward, "", 10);
  assert((Ids(forward) == std::vector<std::string>{"$a", "$b", "$c"}));
  tx->Commit();
}

void TestPagesResumeStrictlyAfterTheCursor() {
  Fixture f;
  std::vector<RelationRecord> edges;
  for (uint64_t i = 1; i <= 7; ++i) edges.push_back(Edge("$e" + std::to_string(i), "m.reference", i + 1, i));
  f.IndexAll(edges);

  std::vector<std::string> seen;
  std::string              from;
  int                      pages = 0;
  do {
    auto tx   = f.repo->Begin();
    auto page = f.store.QueryPage(*tx, kParent, {}, Direction::kBackward, from, 3);
    tx->Commit();
    for (const auto& id : Ids(page)) seen.push_back(id);
    from = page.next_batch.value_or("");
    ++pages;
  } while (!from.empty());

  assert(pages == 3);
  assert((seen == std::vector<std::string>{"$e7", "$e6", "$e5", "$e4", "$e3", "$e2", "$e1"}));
}

void TestEdgesIndexedAfterAWalkStartedAreNotReplayed() {
  Fixture f;
  f.IndexAll({Edge("$a", "m.reference", 2, 1), Edge("$b", "m.reference", 3, 2), Edge("$c", "m.reference", 4, 3)});

  std::string from;
  {
    auto tx   = f.repo->Begin();
    auto page = f.store.QueryPage(*tx, kParent, {}, Direction::kBackward, "", 1);
    tx->Commit();
    assert((Ids(page) == std::vector<std::string>{"$c"}));
    from = *page.next_batch;
  }

  f.IndexAll({Edge("$late", "m.reference", 5, 4)});

  auto tx   = f.repo->Begin();
  auto rest = f.store.QueryPage(*tx, kParent, {}, Direction::kBackward, from, 10);
  tx->Commit();
  assert((Ids(rest) == std::vector<std::string>{"$b", "$a"}));
}

void TestFiltersNarrowThePartition() {
  Fixture f;
  f.IndexAll({Edge("$r1", "m.annotation", 2, 1, "👍"), Edge("$ref", "m.reference", 3, 2), Edge("$r2", "m.annotation", 4, 3, "👎"),
              Edge("$thread", "m.thread", 5, 4)});

  auto tx = f.repo->Begin();

  auto refs = f.store.QueryPage(*tx, kParent, RelationFilter{.rel_type = "m.reference"}, Direction::kBackward, "", 10);
  assert((Ids(refs) == std::vector<std::string>{"$ref"}));

  auto by_key = f.store.QueryPage(*tx, kParent, RelationFilter{.key = "👍"}, Direction::kBackward, "", 10);
  assert((Ids(by_key) == std::vector<std::string>{"$r1"}));

  auto by_type = f.store.QueryPage(*tx, kParent, RelationFilter{.event_type = "m.room.message"}, Direction::kBackward, "", 10);
  assert((Ids(by_type) == std::vector<std::string>{"$thread", "$ref"}));

  bool threw = false;
  try {
    f.store.QueryPage(*tx, kParent, RelationFilter{.rel_type = "m.reference", .key = "👍"}, Direction::kBackward, "", 10);
  } catch (const relations::util::InvalidRelation&) {
    threw = true;
  }
  assert(threw);
  tx->Commit();
}

void TestTokenFromOneFilterIsRejectedByAnother() {
  Fixture f;
  f.IndexAll({Edge("$a", "m.reference", 2, 1), Edge("$b", "m.reference", 3, 2)});

  auto tx   = f.repo->Begin();
  auto page = f.store.QueryPage(*tx, kParent, RelationFilter{.rel_type = "m.reference"}, Direction::kBackward, "", 1);
  assert(page.next_batch);

  bool threw = false;
  try {
    f.store.QueryPage(*tx, kParent, {}, Direction::kBackward, *page.next_batch, 1);
  } catch (const relations::util::InvalidCursor&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    f.store.QueryPage(*tx, kParent, RelationFilter{.rel_type = "m.reference"}, Direction::kForward, *page.next_batch, 1);
  } catch (const relations::util::InvalidCursor&) {
    threw = true;
  }
  assert(threw);
  tx->Commit();
}

void TestAnnotationsMaintainGroupCounters() {
  Fixture f;
  f.IndexAll({Edge("$r1", "m.annotation", 2, 1, "👍"), Edge("$r2", "m.annotation", 3, 2, "👍"), Edge("$ref", "m.reference", 4, 3)});

  auto tx     = f.repo->Begin();
  auto groups = f.repo->ReadAggregations(*tx, AggregationQuery{.relates_to_id = kParent});
  assert(groups.size() == 1);
  assert(groups[0].aggregation_key == "👍");
  assert(groups[0].count == 2);
  assert(groups[0].creation_ordering == 1);

  assert(f.store.Redact(*tx, "$r1"));
  groups = f.repo->ReadAggregations(*tx, AggregationQuery{.relates_to_id = kParent});
  assert(groups.size() == 1 && groups[0].count == 1);

  // redacting twice is harmless, and plain events are not relations
  assert(f.store.Redact(*tx, "$r1"));
  assert(!f.store.Redact(*tx, "$not-a-relation"));

  assert(f.store.Redact(*tx, "$r2"));
  groups = f.repo->ReadAggregations(*tx, AggregationQuery{.relates_to_id = kParent});
  assert(groups.empty());

  auto page = f.store.QueryPage(*tx, kParent, {}, Direction::kBackward, "", 10);
  assert((Ids(page) == std::vector<std::string>{"$ref"}));
  tx->Commit();
}

void TestRolledBackIndexLeavesNoTrace() {
  Fixture f;
  {
    auto tx = f.repo->Begin();
    f.store.Index(*tx, Edge("$r1", "m.annotation", 2, 1, "👍"));
    tx->Rollback();
  }

  auto tx = f.repo->Begin();
  assert(f.store.QueryPage(*tx, kParent, {}, Direction::kBackward, "", 10).edges.empty());
  assert(f.repo->ReadAggregations(*tx, AggregationQuery{.relates_to_id = kParent}).empty());
  tx->Commit();
}

} // namespace

int main() {
  TestBackwardIsNewestFirstAndForwardOldestFirst();
  TestPagesResumeStrictlyAfterTheCursor();
  TestEdgesIndexedAfterAWalkStartedAreNotReplayed();
  TestFiltersNarrowThePartition();
  TestTokenFromOneFilterIsRejectedByAnother();
  TestAnnotationsMaintainGroupCounters();
  TestRolledBackIndexLeavesNoTrace();

  std::cout << "relations_engine_unit_relation_store: pass\n";
  return 0;
}
