#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"

namespace {

using relations::db::Repository;
using relations::db::memory::MemoryRepository;
using relations::db::model::AggregationQuery;
using relations::db::model::EventRecord;
using relations::db::model::MembershipRecord;
using relations::db::model::RelationQuery;
using relations::db::model::RelationRecord;
using relations::model::Direction;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

EventRecord MakeEvent(const std::string& id, const std::string& room, const std::string& type = "m.room.message") {
  EventRecord event;
  event.event_id         = id;
  event.room_id          = room;
  event.type             = type;
  event.sender           = "@alice:test";
  event.content_json     = R"({"body":"hi"})";
  event.origin_server_ts = NowMs();
  return event;
}

// Inserts the source event and its edge in one go, the way ingest does.
RelationRecord Relate(Repository& repo, relations::db::Transaction& tx, const std::string& id, const std::string& room,
                      const std::string& target, const std::string& rel_type, const std::string& key = "") {
  auto event = MakeEvent(id, room, rel_type == "m.annotation" ? "m.reaction" : "m.room.message");
  assert(repo.InsertEvent(tx, event));

  RelationRecord edge{
      .event_id             = id,
      .relates_to_id        = target,
      .rel_type             = rel_type,
      .event_type           = event.type,
      .aggregation_key      = key,
      .sender               = event.sender,
      .origin_server_ts     = event.origin_server_ts,
      .topological_ordering = event.topological_ordering,
      .stream_ordering      = event.stream_ordering,
  };
  assert(repo.InsertRelation(tx, edge));
  if (rel_type == "m.annotation") {
    assert(repo.IncrementAggregation(tx, target, edge.event_type, key, edge.stream_ordering));
  }
  return edge;
}

void VerifyEventsAndOrdering(Repository& repo, const std::string& prefix) {
  const auto room = "!" + prefix + "-events:test";
  auto       tx   = repo.Begin();

  auto first  = MakeEvent("$" + prefix + "-e1:test", room);
  auto second = MakeEvent("$" + prefix + "-e2:test", room);
  assert(repo.InsertEvent(*tx, first));
  assert(repo.InsertEvent(*tx, second));

  assert(second.topological_ordering == first.topological_ordering + 1);
  assert(second.stream_ordering > first.stream_ordering);

  auto duplicate = MakeEvent(first.event_id, room);
  auto dup       = repo.InsertEvent(*tx, duplicate);
  assert(!dup);
  tx->Rollback();

  // the rollback took both events with it
  auto check = repo.Begin();
  assert(!repo.GetEvent(*check, first.event_id).has_value());
  check->Commit();

  tx = repo.Begin();
  first = MakeEvent(first.event_id, room);
  assert(repo.InsertEvent(*tx, first));
  assert(repo.MarkEventRedacted(*tx, first.event_id, "$" + prefix + "-redaction:test"));
  auto loaded = repo.GetEvent(*tx, first.event_id);
  assert(loaded.has_value());
  assert(loaded->redacted);
  assert(loaded->redacted_by == "$" + prefix + "-redaction:test");
  assert(loaded->content_json == R"({"body":"hi"})");
  assert(!loaded->state_key.has_value());

  auto missing = repo.MarkEventRedacted(*tx, "$" + prefix + "-missing:test", "$x:test");
  assert(missing.code == relations::db::ErrorCode::NotFound);
  tx->Commit();
}

void VerifyMembership(Repository& repo, const std::string& prefix) {
  const auto room = "!" + prefix + "-members:test";
  auto       tx   = repo.Begin();

  assert(!repo.GetMembership(*tx, room, "@bob:test").has_value());
  assert(repo.UpsertMembership(*tx, MembershipRecord{.room_id = room, .user_id = "@bob:test", .membership = "join", .event_id = "$j:test"}));
  assert(repo.GetMembership(*tx, room, "@bob:test")->membership == "join");

  assert(repo.UpsertMembership(*tx, MembershipRecord{.room_id = room, .user_id = "@bob:test", .membership = "leave", .event_id = "$l:test"}));
  auto current = repo.GetMembership(*tx, room, "@bob:test");
  assert(current->membership == "leave");
  assert(current->event_id == "$l:test");
  tx->Commit();
}

void VerifyRelationScans(Repository& repo, const std::string& prefix) {
  const auto room   = "!" + prefix + "-relations:test";
  const auto target = "$" + prefix + "-target:test";

  std::vector<RelationRecord> edges;
  {
    auto tx     = repo.Begin();
    auto parent = MakeEvent(target, room);
    assert(repo.InsertEvent(*tx, parent));
    for (int i = 0; i < 5; ++i) {
      const bool annotation = i % 2 == 0;
      edges.push_back(Relate(repo, *tx, "$" + prefix + "-r" + std::to_string(i) + ":test", room, target,
                             annotation ? "m.annotation" : "m.reference", annotation ? "👍" : ""));
    }
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto backward = repo.ReadRelations(*tx, RelationQuery{.relates_to_id = target});
  assert(backward.size() == 5);
  assert(backward.front().event_id == edges.back().event_id);
  assert(backward.back().event_id == edges.front().event_id);

  auto forward_page = repo.ReadRelations(*tx, RelationQuery{.relates_to_id = target, .direction = Direction::kForward, .limit = 2});
  assert(forward_page.size() == 2);
  assert(forward_page[0].event_id == edges[0].event_id);
  assert(forward_page[1].event_id == edges[1].event_id);

  auto resumed = repo.ReadRelations(
      *tx, RelationQuery{.relates_to_id = target, .direction = Direction::kForward, .from = forward_page[1].Position(), .limit = 2});
  assert(resumed.size() == 2);
  assert(resumed[0].event_id == edges[2].event_id);

  auto before = repo.ReadRelations(*tx, RelationQuery{.relates_to_id = target, .from = edges[2].Position()});
  assert(before.size() == 2);
  assert(before[0].event_id == edges[1].event_id);

  auto annotations = repo.ReadRelations(*tx, RelationQuery{.relates_to_id = target, .rel_type = "m.annotation", .aggregation_key = "👍"});
  assert(annotations.size() == 3);

  auto references = repo.ReadRelations(*tx, RelationQuery{.relates_to_id = target, .rel_type = "m.reference"});
  assert(references.size() == 2);

  auto loaded = repo.GetRelation(*tx, edges[0].event_id);
  assert(loaded.has_value());
  assert(loaded->aggregation_key == "👍");
  assert(loaded->stream_ordering == edges[0].stream_ordering);

  assert(repo.MarkRelationRedacted(*tx, edges[0].event_id));
  assert(repo.ReadRelations(*tx, RelationQuery{.relates_to_id = target}).size() == 4);
  assert(repo.GetRelation(*tx, edges[0].event_id)->redacted);
  tx->Commit();
}

void VerifyAggregationCounters(Repository& repo, const std::string& prefix) {
  const auto target = "$" + prefix + "-counted:test";
  auto       tx     = repo.Begin();

  assert(repo.IncrementAggregation(*tx, target, "m.reaction", "a", 10));
  assert(repo.IncrementAggregation(*tx, target, "m.reaction", "b", 11));
  assert(repo.IncrementAggregation(*tx, target, "m.reaction", "b", 12));
  assert(repo.IncrementAggregation(*tx, target, "m.reaction", "c", 13));
  assert(repo.IncrementAggregation(*tx, target, "org.example.vote", "a", 14));

  auto groups = repo.ReadAggregations(*tx, AggregationQuery{.relates_to_id = target});
  assert(groups.size() == 4);
  assert(groups[0].aggregation_key == "b" && groups[0].count == 2 && groups[0].creation_ordering == 11);
  assert(groups[1].aggregation_key == "a" && groups[1].event_type == "m.reaction");
  assert(groups[2].aggregation_key == "c");
  assert(groups[3].event_type == "org.example.vote");

  auto after = repo.ReadAggregations(*tx, AggregationQuery{.relates_to_id = target, .after = groups[1].Position(), .limit = 1});
  assert(after.size() == 1);
  assert(after[0].aggregation_key == "c");

  auto votes = repo.ReadAggregations(*tx, AggregationQuery{.relates_to_id = target, .event_type = "org.example.vote"});
  assert(votes.size() == 1);

  assert(repo.DecrementAggregation(*tx, target, "m.reaction", "b"));
  assert(repo.DecrementAggregation(*tx, target, "m.reaction", "a"));
  auto missing = repo.DecrementAggregation(*tx, target, "m.reaction", "a");
  assert(missing.code == relations::db::ErrorCode::NotFound);

  groups = repo.ReadAggregations(*tx, AggregationQuery{.relates_to_id = target, .event_type = "m.reaction"});
  assert(groups.size() == 2);
  // b kept its first-seen position after dropping to 1
  assert(groups[0].aggregation_key == "b" && groups[0].count == 1);
  tx->Commit();
}

void VerifyConcurrentIncrements(Repository& repo, const std::string& prefix) {
  constexpr int kThreads   = 4;
  constexpr int kPerThread = 20;
  const auto    target     = "$" + prefix + "-hot:test";

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&] {
      for (int n = 0; n < kPerThread; ++n) {
        auto tx = repo.Begin();
        assert(repo.IncrementAggregation(*tx, target, "m.reaction", "🔥", 1));
        tx->Commit();
      }
    });
  }
  for (auto& thread : threads) thread.join();

  auto tx     = repo.Begin();
  auto groups = repo.ReadAggregations(*tx, AggregationQuery{.relates_to_id = target});
  assert(groups.size() == 1);
  assert(groups[0].count == kThreads * kPerThread);
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& prefix) {
  if (!backend.supports_restart()) {
    return;
  }

  auto       repo   = backend.make_repository();
  const auto room   = "!" + prefix + "-durable:test";
  const auto target = "$" + prefix + "-durable:test";
  {
    auto tx     = repo->Begin();
    auto parent = MakeEvent(target, room);
    assert(repo->InsertEvent(*tx, parent));
    Relate(*repo, *tx, "$" + prefix + "-durable-r:test", room, target, "m.annotation", "✅");
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  assert(repo->GetEvent(*tx, target).has_value());
  assert(repo->ReadRelations(*tx, RelationQuery{.relates_to_id = target}).size() == 1);
  auto groups = repo->ReadAggregations(*tx, AggregationQuery{.relates_to_id = target});
  assert(groups.size() == 1 && groups[0].count == 1);

  // room depth continues where it left off
  auto next = MakeEvent("$" + prefix + "-durable-next:test", room);
  assert(repo->InsertEvent(*tx, next));
  assert(next.topological_ordering == 3);
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if RELATIONS_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("relations_engine_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    relations::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_sqlite()->set_path(db_path);
    config.mutable_database()->mutable_sqlite()->set_wal_mode(true);
    return relations::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) {
        repo.reset();
        repo = make_repo();
      },
      .cleanup = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if RELATIONS_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("RELATIONS_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("RELATIONS_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    relations::runtime::config::RuntimeConfig config;
    config.mutable_database()->mutable_postgres()->set_connection_uri(conninfo);
    return relations::factory::BuildRepository(config);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return false; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  const auto prefix = backend.name + std::to_string(NowMs());
  {
    auto repo = backend.make_repository();

    VerifyEventsAndOrdering(*repo, prefix);
    VerifyMembership(*repo, prefix);
    VerifyRelationScans(*repo, prefix);
    VerifyAggregationCounters(*repo, prefix);
    VerifyConcurrentIncrements(*repo, prefix);
  }

  VerifyRestartDurability(backend, prefix);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if RELATIONS_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if RELATIONS_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "relations_engine_integration_repository_parity: pass\n";
  return 0;
}
