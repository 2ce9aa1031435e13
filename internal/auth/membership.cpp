#include "membership.hpp"

#include "internal/util/errors.hpp"

namespace relations::auth {

RepositoryMembershipChecker::RepositoryMembershipChecker(std::shared_ptr<relations::db::Repository> repository)
    : repository_(std::move(repository)) {
}

bool RepositoryMembershipChecker::IsJoined(relations::db::Transaction& tx, const std::string& room_id, const std::string& user_id) {
  auto membership = repository_->GetMembership(tx, room_id, user_id);
  return membership && membership->membership == kJoin;
}

void RequireJoined(MembershipChecker& checker, relations::db::Transaction& tx, const std::string& room_id, const std::string& user_id) {
  if (user_id.empty()) {
    throw relations::util::PermissionDenied("request has no user");
  }
  if (!checker.IsJoined(tx, room_id, user_id)) {
    throw relations::util::PermissionDenied("user " + user_id + " is not in room " + room_id);
  }
}

} // namespace relations::auth
