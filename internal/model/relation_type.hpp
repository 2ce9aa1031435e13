#pragma once

#include <cstdint>
#include <string_view>

namespace relations::model {

// Wire names of the relation types the engine gives meaning to. Any other
// non-empty rel_type is stored and paginated but never aggregated.
inline constexpr std::string_view kAnnotation = "m.annotation";
inline constexpr std::string_view kReference  = "m.reference";
inline constexpr std::string_view kReplace    = "m.replace";

inline constexpr std::string_view kReactionEventType  = "m.reaction";
inline constexpr std::string_view kMemberEventType    = "m.room.member";
inline constexpr std::string_view kRedactionEventType = "m.room.redaction";

// Reserved content key carrying the relation descriptor.
inline constexpr std::string_view kRelatesToField = "m.relates_to";

enum class RelationType : std::uint8_t {
  kOther      = 0,
  kAnnotation = 1,
  kReference  = 2,
  kReplace    = 3,
};

constexpr RelationType ParseRelationType(std::string_view rel_type) {
  if (rel_type == kAnnotation) {
    return RelationType::kAnnotation;
  }
  if (rel_type == kReference) {
    return RelationType::kReference;
  }
  if (rel_type == kReplace) {
    return RelationType::kReplace;
  }
  return RelationType::kOther;
}

constexpr bool IsReactionEventType(std::string_view event_type) {
  return event_type == kReactionEventType;
}

constexpr bool IsMembershipEventType(std::string_view event_type) {
  return event_type == kMemberEventType;
}

} // namespace relations::model
