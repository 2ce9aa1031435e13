#pragma once

#include <string>
#include <string_view>

namespace relations::util {

/*
  Event id helpers

  Event ids are "$<localpart>:<server_name>" with a 24 character
  url-safe random localpart.
*/

std::string GenerateEventId(std::string_view server_name);

} // namespace relations::util
