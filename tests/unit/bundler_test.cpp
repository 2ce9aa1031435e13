#include "internal/core/bundler.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"

namespace {

using namespace relations::engine::v1;

const std::string kRoom  = "!room:test";
const std::string kAlice = "@alice:test";
const std::string kBob   = "@bob:test";

using relations::db::Repository;
using relations::db::Result;
using relations::db::Transaction;

// Reports every annotation group as if it had been counted kCountOffset
// more times than stored.
class InflatedCountRepository : public Repository {
 public:
  static constexpr uint64_t kCountOffset = uint64_t{1} << 32;

  std::unique_ptr<Transaction> Begin() override {
    return inner_.Begin();
  }

  Result InsertEvent(Transaction& tx, relations::db::model::EventRecord& record) override {
    return inner_.InsertEvent(tx, record);
  }

  std::optional<relations::db::model::EventRecord> GetEvent(Transaction& tx, const std::string& id) override {
    return inner_.GetEvent(tx, id);
  }

  Result MarkEventRedacted(Transaction& tx, const std::string& id, const std::string& redacted_by) override {
    return inner_.MarkEventRedacted(tx, id, redacted_by);
  }

  Result UpsertMembership(Transaction& tx, const relations::db::model::MembershipRecord& record) override {
    return inner_.UpsertMembership(tx, record);
  }

  std::optional<relations::db::model::MembershipRecord> GetMembership(Transaction& tx, const std::string& room_id,
                                                                      const std::string& user_id) override {
    return inner_.GetMembership(tx, room_id, user_id);
  }

  Result InsertRelation(Transaction& tx, const relations::db::model::RelationRecord& record) override {
    return inner_.InsertRelation(tx, record);
  }

  std::optional<relations::db::model::RelationRecord> GetRelation(Transaction& tx, const std::string& id) override {
    return inner_.GetRelation(tx, id);
  }

  Result MarkRelationRedacted(Transaction& tx, const std::string& id) override {
    return inner_.MarkRelationRedacted(tx, id);
  }

  std::vector<relations::db::model::RelationRecord> ReadRelations(Transaction& tx, const relations::db::model::RelationQuery& query) override {
    return inner_.ReadRelations(tx, query);
  }

  Result IncrementAggregation(Transaction& tx, const std::string& relates_to_id, const std::string& event_type, const std::string& key,
                              uint64_t creation_ordering) override {
    return inner_.IncrementAggregation(tx, relates_to_id, event_type, key, creation_ordering);
  }

  Result DecrementAggregation(Transaction& tx, const std::string& relates_to_id, const std::string& event_type,
                              const std::string& key) override {
    return inner_.DecrementAggregation(tx, relates_to_id, event_type, key);
  }

  std::vector<relations::db::model::AggregationRecord> ReadAggregations(Transaction&                                 tx,
                                                                        const relations::db::model::AggregationQuery& query) override {
    auto groups = inner_.ReadAggregations(tx, query);
    for (auto& group : groups) group.count += kCountOffset;
    return groups;
  }

 private:
  relations::db::memory::MemoryRepository inner_;
};

relations::service::ServiceContext BuildServiceContext(uint32_t bundle_limit = 5,
                                                       std::shared_ptr<Repository> repository = nullptr) {
  auto config = relations::config::ConfigLoader::Defaults();
  config.mutable_server()->set_server_name("test");
  config.mutable_relations()->set_bundle_limit(bundle_limit);
  if (!repository) repository = std::make_shared<relations::db::memory::MemoryRepository>();
  return relations::factory::BuildContext(config, std::move(repository));
}

struct Room {
  relations::service::ServiceContext ctx;
  relations::service::RoomService      rooms{ctx};
  relations::service::RelationsService relations{ctx};

  explicit Room(relations::service::ServiceContext context) : ctx(std::move(context)) {
    Join(kAlice);
    Join(kBob);
  }

  void Join(const std::string& user) {
    SendEventRequest req;
    req.set_room_id(kRoom);
    req.set_sender(user);
    req.set_type("m.room.member");
    req.set_state_key(user);
    (*req.mutable_content()->mutable_fields())["membership"].set_string_value("join");
    rooms.SendEvent(req);
  }

  std::string Message() {
    SendEventRequest req;
    req.set_room_id(kRoom);
    req.set_sender(kAlice);
    req.set_type("m.room.message");
    (*req.mutable_content()->mutable_fields())["body"].set_string_value("hi");
    return rooms.SendEvent(req).event_id();
  }

  std::string Relate(const std::string& parent, const std::string& rel_type, const std::string& key = "") {
    SendRelationRequest req;
    req.set_room_id(kRoom);
    req.set_sender(kBob);
    req.set_parent_id(parent);
    req.set_rel_type(rel_type);
    req.set_event_type(rel_type == "m.annotation" ? "m.reaction" : "m.room.message");
    if (!key.empty()) req.set_key(key);
    return relations.SendRelation(req).event_id();
  }

  Event Get(const std::string& event_id, bool bundle = true) {
    GetEventRequest req;
    req.set_room_id(kRoom);
    req.set_requester(kAlice);
    req.set_event_id(event_id);
    if (!bundle) req.set_bundle_relations(false);
    return rooms.GetEvent(req).event();
  }
};

void TestAnnotationsAndReferencesAreBundled() {
  Room       room(BuildServiceContext());
  const auto parent = room.Message();

  room.Relate(parent, "m.annotation", "a");
  room.Relate(parent, "m.annotation", "a");
  room.Relate(parent, "m.annotation", "b");
  const auto r1 = room.Relate(parent, "m.reference");
  const auto r2 = room.Relate(parent, "m.reference");

  const auto  event   = room.Get(parent);
  const auto& bundled = event.unsigned_data().relations();

  assert(bundled.annotation().chunk_size() == 2);
  assert(bundled.annotation().chunk(0).type() == "m.reaction");
  assert(bundled.annotation().chunk(0).key() == "a");
  assert(bundled.annotation().chunk(0).count() == 2);
  assert(bundled.annotation().chunk(1).key() == "b");
  assert(bundled.annotation().chunk(1).count() == 1);
  assert(!bundled.annotation().has_next_batch());

  assert(bundled.reference().chunk_size() == 2);
  assert(bundled.reference().chunk(0).event_id() == r1);
  assert(bundled.reference().chunk(1).event_id() == r2);
  assert(!bundled.reference().has_next_batch());

  // stored content is left alone
  assert(event.content().fields().at("body").string_value() == "hi");
}

void TestEmptySectionsAreOmitted() {
  Room       room(BuildServiceContext());
  const auto plain = room.Message();
  assert(!room.Get(plain).unsigned_data().has_relations());

  const auto reacted = room.Message();
  room.Relate(reacted, "m.annotation", "👍");
  const auto bundled = room.Get(reacted).unsigned_data().relations();
  assert(bundled.has_annotation());
  assert(!bundled.has_reference());
}

void TestBundlingCanBeDisabled() {
  Room       room(BuildServiceContext());
  const auto parent = room.Message();
  room.Relate(parent, "m.annotation", "👍");

  assert(!room.Get(parent, false).unsigned_data().has_relations());
}

void TestLargeSectionsCarryNextBatch() {
  Room       room(BuildServiceContext(2));
  const auto parent = room.Message();
  for (const char* key : {"a", "b", "c"}) room.Relate(parent, "m.annotation", key);
  for (int i = 0; i < 3; ++i) room.Relate(parent, "m.reference");

  const auto bundled = room.Get(parent).unsigned_data().relations();
  assert(bundled.annotation().chunk_size() == 2);
  assert(bundled.annotation().has_next_batch());
  assert(bundled.reference().chunk_size() == 2);
  assert(bundled.reference().has_next_batch());

  // the annotation token continues the aggregation listing
  GetAggregationsRequest req;
  req.set_room_id(kRoom);
  req.set_requester(kAlice);
  req.set_event_id(parent);
  req.set_limit(10);
  req.set_from(bundled.annotation().next_batch());
  const auto rest = room.relations.GetAggregations(req);
  assert(rest.chunk_size() == 1);
  assert(rest.chunk(0).key() == "c");
}

void TestRedactedEventsAreNotBundled() {
  Room       room(BuildServiceContext());
  const auto parent = room.Message();
  room.Relate(parent, "m.annotation", "👍");

  RedactEventRequest req;
  req.set_room_id(kRoom);
  req.set_sender(kAlice);
  req.set_event_id(parent);
  const auto redaction = room.rooms.RedactEvent(req).event_id();

  const auto event = room.Get(parent);
  assert(event.unsigned_data().redacted_because() == redaction);
  assert(!event.unsigned_data().has_relations());
  assert(event.content().fields().empty());
}

void TestCountsBeyond32BitsSurviveBundlingAndListing() {
  Room       room(BuildServiceContext(5, std::make_shared<InflatedCountRepository>()));
  const auto parent = room.Message();
  room.Relate(parent, "m.annotation", "👍");
  room.Relate(parent, "m.annotation", "👍");

  const auto bundled = room.Get(parent).unsigned_data().relations();
  assert(bundled.annotation().chunk_size() == 1);
  assert(bundled.annotation().chunk(0).count() == InflatedCountRepository::kCountOffset + 2);

  GetAggregationsRequest req;
  req.set_room_id(kRoom);
  req.set_requester(kAlice);
  req.set_event_id(parent);
  const auto listed = room.relations.GetAggregations(req);
  assert(listed.chunk_size() == 1);
  assert(listed.chunk(0).count() == InflatedCountRepository::kCountOffset + 2);
}

} // namespace

int main() {
  TestAnnotationsAndReferencesAreBundled();
  TestEmptySectionsAreOmitted();
  TestBundlingCanBeDisabled();
  TestLargeSectionsCarryNextBatch();
  TestRedactedEventsAreNotBundled();
  TestCountsBeyond32BitsSurviveBundlingAndListing();

  std::cout << "relations_engine_unit_bundler: pass\n";
  return 0;
}
