#pragma once

#include <string>

namespace relations::db::model {

/*
  Current membership of one user in one room, derived from the latest
  m.room.member state event.
*/

struct MembershipRecord {
  std::string room_id;
  std::string user_id;
  std::string membership; // "join", "leave", "invite", "ban", ...
  std::string event_id;
};

} // namespace relations::db::model
