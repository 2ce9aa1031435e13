#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "internal/model/position.hpp"

namespace relations::core {

/*
  Opaque pagination tokens.

  A token carries a version, the shape of the query that produced it, and
  one of three positions:

    RelationsCursor       edge position in a relation listing
    AggregationCursor     group watermark in an aggregation listing
    GroupRelationsCursor  edge position inside one annotation group

  Wire form: url-safe base64 (no padding) of a serialized
  relations.engine.v1.PaginationToken.

  A token only decodes against the same kind and shape it was issued
  for; anything else is util::InvalidCursor.
*/

struct QueryShape {
  std::string event_id;
  std::string rel_type;
  std::string event_type;
  std::string key;

  friend bool operator==(const QueryShape&, const QueryShape&) = default;
};

struct RelationsCursor {
  relations::model::Direction      direction = relations::model::Direction::kBackward;
  relations::model::StreamPosition position;

  friend bool operator==(const RelationsCursor&, const RelationsCursor&) = default;
};

struct AggregationCursor {
  relations::model::GroupPosition position;

  friend bool operator==(const AggregationCursor&, const AggregationCursor&) = default;
};

struct GroupRelationsCursor {
  relations::model::Direction      direction = relations::model::Direction::kBackward;
  relations::model::StreamPosition position;

  friend bool operator==(const GroupRelationsCursor&, const GroupRelationsCursor&) = default;
};

using Cursor = std::variant<RelationsCursor, AggregationCursor, GroupRelationsCursor>;

struct DecodedToken {
  QueryShape shape;
  Cursor     cursor;
};

class CursorCodec {
 public:
  static constexpr uint32_t kVersion = 1;

  static std::string Encode(const QueryShape& shape, const Cursor& cursor);

  // Parses any well-formed token of the current version.
  static DecodedToken Decode(const std::string& token);

  // Parses a token and checks it was issued for `expected` and kind T.
  template <typename T>
  static T DecodeAs(const std::string& token, const QueryShape& expected) {
    auto decoded = Decode(token);
    if (!(decoded.shape == expected)) {
      ThrowShapeMismatch();
    }
    if (auto* cursor = std::get_if<T>(&decoded.cursor)) {
      return *cursor;
    }
    ThrowKindMismatch();
  }

 private:
  [[noreturn]] static void ThrowShapeMismatch();
  [[noreturn]] static void ThrowKindMismatch();
};

} // namespace relations::core
