#pragma once

#include <memory>
#include <string>

#include "internal/db/api/repository.hpp"

namespace relations::auth {

inline constexpr const char* kJoin = "join";

/*
  Answers "is this user joined to this room?" inside a transaction.

  The engine trusts the verdict; room auth rules live behind this seam.
*/
class MembershipChecker {
 public:
  virtual ~MembershipChecker() = default;

  virtual bool IsJoined(relations::db::Transaction& tx, const std::string& room_id, const std::string& user_id) = 0;
};

// Reads membership recorded by the event store from m.room.member events.
class RepositoryMembershipChecker final : public MembershipChecker {
 public:
  explicit RepositoryMembershipChecker(std::shared_ptr<relations::db::Repository> repository);

  bool IsJoined(relations::db::Transaction& tx, const std::string& room_id, const std::string& user_id) override;

 private:
  std::shared_ptr<relations::db::Repository> repository_;
};

// Throws util::PermissionDenied unless the user is joined.
void RequireJoined(MembershipChecker& checker, relations::db::Transaction& tx, const std::string& room_id, const std::string& user_id);

} // namespace relations::auth
