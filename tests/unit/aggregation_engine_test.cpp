#include "internal/core/aggregation_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "internal/core/relation_store.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"

namespace {

using relations::core::AggregationEngine;
using relations::core::RelationStore;
using relations::db::model::RelationRecord;

const std::string kParent = "$parent:example.org";

struct Fixture {
  std::shared_ptr<relations::db::memory::MemoryRepository> repo   = std::make_shared<relations::db::memory::MemoryRepository>();
  std::shared_ptr<RelationStore>                          store  = std::make_shared<RelationStore>(repo);
  AggregationEngine                                       engine{repo, store};
  uint64_t                                                stream = 0;

  void Annotate(const std::string& event_type, const std::string& key, int times = 1) {
    auto tx = repo->Begin();
    for (int i = 0; i < times; ++i) {
      ++stream;
      store->Index(*tx, RelationRecord{
                            .event_id             = "$ann" + std::to_string(stream),
                            .relates_to_id        = kParent,
                            .rel_type             = "m.annotation",
                            .event_type           = event_type,
                            .aggregation_key      = key,
                            .sender               = "@alice:example.org",
                            .topological_ordering = stream + 1,
                            .stream_ordering      = stream,
                        });
    }
    tx->Commit();
  }
};

std::vector<std::pair<std::string, uint64_t>> Keys(const relations::core::AggregationPage& page) {
  std::vector<std::pair<std::string, uint64_t>> out;
  for (const auto& group : page.groups) out.emplace_back(group.aggregation_key, group.count);
  return out;
}

void TestGroupsOrderByCountThenFirstSeen() {
  Fixture f;
  f.Annotate("m.reaction", "a");
  f.Annotate("m.reaction", "b", 3);
  f.Annotate("m.reaction", "c");
  f.Annotate("m.reaction", "d", 3);

  auto tx   = f.repo->Begin();
  auto page = f.engine.Aggregate(*tx, kParent, std::nullopt, std::nullopt, "", 10);
  tx->Commit();

  using Row = std::pair<std::string, uint64_t>;
  assert((Keys(page) == std::vector<Row>{{"b", 3}, {"d", 3}, {"a", 1}, {"c", 1}}));
  assert(!page.next_batch);
}

void TestPaginationVisitsEveryGroupOnce() {
  Fixture f;
  for (int i = 0; i < 10; ++i) {
    f.Annotate("m.reaction", "k" + std::to_string(i), i % 3 + 1);
  }

  std::vector<std::string> seen;
  std::string              from;
  do {
    auto tx   = f.repo->Begin();
    auto page = f.engine.Aggregate(*tx, kParent, std::string("m.annotation"), std::nullopt, from, 3);
    tx->Commit();
    assert(page.groups.size() <= 3);
    for (const auto& group : page.groups) seen.push_back(group.aggregation_key);
    from = page.next_batch.value_or("");
  } while (!from.empty());

  assert(seen.size() == 10);
  // count 3 groups come first in creation order
  assert(seen[0] == "k2" && seen[1] == "k5" && seen[2] == "k8");
}

void TestEventTypeFilterSplitsGroups() {
  Fixture f;
  f.Annotate("m.reaction", "👍", 2);
  f.Annotate("org.example.vote", "👍");

  auto tx        = f.repo->Begin();
  auto all       = f.engine.Aggregate(*tx, kParent, std::nullopt, std::nullopt, "", 10);
  auto reactions = f.engine.Aggregate(*tx, kParent, std::nullopt, std::string("m.reaction"), "", 10);
  tx->Commit();

  assert(all.groups.size() == 2);
  assert(reactions.groups.size() == 1);
  assert(reactions.groups[0].count == 2);
}

void TestOnlyAnnotationsAggregate() {
  Fixture f;
  f.Annotate("m.reaction", "👍");

  auto tx    = f.repo->Begin();
  bool threw = false;
  try {
    f.engine.Aggregate(*tx, kParent, std::string("m.reference"), std::nullopt, "", 10);
  } catch (const relations::util::InvalidRelation& e) {
    threw = std::string(e.errcode()) == "M_INVALID_PARAM";
  }
  assert(threw);

  threw = false;
  try {
    f.engine.PaginateGroup(*tx, kParent, "m.thread", "m.reaction", "👍", "", 10);
  } catch (const relations::util::InvalidRelation&) {
    threw = true;
  }
  assert(threw);
  tx->Commit();
}

void TestGroupPaginationListsNewestFirst() {
  Fixture f;
  f.Annotate("m.reaction", "👍", 3);
  f.Annotate("m.reaction", "👎");

  std::vector<std::string> seen;
  std::string              from;
  do {
    auto tx   = f.repo->Begin();
    auto page = f.engine.PaginateGroup(*tx, kParent, "m.annotation", "m.reaction", "👍", from, 2);
    tx->Commit();
    for (const auto& edge : page.edges) seen.push_back(edge.event_id);
    from = page.next_batch.value_or("");
  } while (!from.empty());

  assert((seen == std::vector<std::string>{"$ann3", "$ann2", "$ann1"}));
}

void TestAggregationTokenIsNotAGroupToken() {
  Fixture f;
  f.Annotate("m.reaction", "a");
  f.Annotate("m.reaction", "b");

  auto tx   = f.repo->Begin();
  auto page = f.engine.Aggregate(*tx, kParent, std::nullopt, std::nullopt, "", 1);
  assert(page.next_batch);

  bool threw = false;
  try {
    f.engine.PaginateGroup(*tx, kParent, "m.annotation", "m.reaction", "a", *page.next_batch, 1);
  } catch (const relations::util::InvalidCursor&) {
    threw = true;
  }
  assert(threw);
  tx->Commit();
}

} // namespace

int main() {
  TestGroupsOrderByCountThenFirstSeen();
  TestPaginationVisitsEveryGroupOnce();
  TestEventTypeFilterSplitsGroups();
  TestOnlyAnnotationsAggregate();
  TestGroupPaginationListsNewestFirst();
  TestAggregationTokenIsNotAGroupToken();

  std::cout << "relations_engine_unit_aggregation_engine: pass\n";
  return 0;
}
