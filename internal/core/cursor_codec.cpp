#include "cursor_codec.hpp"

#include <absl/strings/escaping.h>

#include <stdexcept>

#include "internal/util/errors.hpp"
#include "relations/engine/v1/pagination.pb.h"

namespace relations::core {

namespace v1 = relations::engine::v1;

using relations::model::Direction;

namespace {

v1::Direction ToProto(Direction direction) {
  return direction == Direction::kForward ? v1::DIRECTION_FORWARD : v1::DIRECTION_BACKWARD;
}

Direction FromProto(v1::Direction direction) {
  switch (direction) {
    case v1::DIRECTION_FORWARD:
      return Direction::kForward;
    case v1::DIRECTION_BACKWARD:
      return Direction::kBackward;
    default:
      throw relations::util::InvalidCursor("pagination token has an unknown direction");
  }
}

void SetEdge(v1::EdgePosition* edge, Direction direction, const relations::model::StreamPosition& position) {
  edge->set_direction(ToProto(direction));
  edge->set_topological(position.topological);
  edge->set_stream(position.stream);
}

} // namespace

std::string CursorCodec::Encode(const QueryShape& shape, const Cursor& cursor) {
  v1::PaginationToken token;
  token.set_version(kVersion);

  auto* wire_shape = token.mutable_shape();
  wire_shape->set_event_id(shape.event_id);
  wire_shape->set_rel_type(shape.rel_type);
  wire_shape->set_event_type(shape.event_type);
  wire_shape->set_key(shape.key);

  if (const auto* c = std::get_if<RelationsCursor>(&cursor)) {
    SetEdge(token.mutable_relations(), c->direction, c->position);
  } else if (const auto* c = std::get_if<AggregationCursor>(&cursor)) {
    auto* group = token.mutable_aggregations();
    group->set_count(c->position.count);
    group->set_creation(c->position.creation);
  } else if (const auto* c = std::get_if<GroupRelationsCursor>(&cursor)) {
    SetEdge(token.mutable_group_relations(), c->direction, c->position);
  }

  std::string bytes;
  if (!token.SerializeToString(&bytes)) {
    throw std::runtime_error("pagination token serialization failed");
  }
  return absl::WebSafeBase64Escape(bytes);
}

DecodedToken CursorCodec::Decode(const std::string& token) {
  if (token.empty()) {
    throw relations::util::InvalidCursor("pagination token is empty");
  }

  std::string bytes;
  if (!absl::WebSafeBase64Unescape(token, &bytes)) {
    throw relations::util::InvalidCursor("pagination token is not url-safe base64");
  }

  v1::PaginationToken wire;
  if (!wire.ParseFromString(bytes)) {
    throw relations::util::InvalidCursor("pagination token is malformed");
  }
  if (wire.version() != kVersion) {
    throw relations::util::InvalidCursor("pagination token version " + std::to_string(wire.version()) + " is not supported");
  }

  DecodedToken decoded;
  decoded.shape = QueryShape{
      .event_id   = wire.shape().event_id(),
      .rel_type   = wire.shape().rel_type(),
      .event_type = wire.shape().event_type(),
      .key        = wire.shape().key(),
  };

  switch (wire.position_case()) {
    case v1::PaginationToken::kRelations: {
      const auto& edge = wire.relations();
      decoded.cursor   = RelationsCursor{FromProto(edge.direction()), {edge.topological(), edge.stream()}};
      break;
    }
    case v1::PaginationToken::kAggregations: {
      const auto& group = wire.aggregations();
      decoded.cursor    = AggregationCursor{{group.count(), group.creation()}};
      break;
    }
    case v1::PaginationToken::kGroupRelations: {
      const auto& edge = wire.group_relations();
      decoded.cursor   = GroupRelationsCursor{FromProto(edge.direction()), {edge.topological(), edge.stream()}};
      break;
    }
    case v1::PaginationToken::POSITION_NOT_SET:
      throw relations::util::InvalidCursor("pagination token has no position");
  }
  return decoded;
}

void CursorCodec::ThrowShapeMismatch() {
  throw relations::util::InvalidCursor("pagination token was issued for a different query");
}

void CursorCodec::ThrowKindMismatch() {
  throw relations::util::InvalidCursor("pagination token was issued for a different kind of listing");
}

} // namespace relations::core
