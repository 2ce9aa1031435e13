#pragma once

#include <compare>
#include <cstdint>

namespace relations::model {

enum class Direction : std::uint8_t {
  kBackward = 0,
  kForward  = 1,
};

/*
  Position of an event in a room stream.

  topological = room depth, stream = global insertion order.
  Ordered lexicographically; stream breaks ties between events of equal depth.
*/
struct StreamPosition {
  uint64_t topological = 0;
  uint64_t stream      = 0;

  friend auto operator<=>(const StreamPosition&, const StreamPosition&) = default;
};

/*
  Position of an aggregation group in the (count desc, creation asc) order.
*/
struct GroupPosition {
  uint64_t count    = 0;
  uint64_t creation = 0;

  friend bool operator==(const GroupPosition&, const GroupPosition&) = default;
};

// True if `group` sorts strictly after `watermark`.
constexpr bool IsAfter(const GroupPosition& group, const GroupPosition& watermark) {
  if (group.count != watermark.count) {
    return group.count < watermark.count;
  }
  return group.creation > watermark.creation;
}

} // namespace relations::model
