#include "internal/observability/logging.hpp"

#include <cassert>
#include <iostream>
#include <string>

namespace {

using relations::observability::FormatFields;
using relations::observability::IntField;
using relations::observability::RelationFields;
using relations::observability::StringField;

void TestPlainValuesAreWrittenBare() {
  const auto line = FormatFields({StringField("event_id", "$abc:test"), IntField("stream", 42)});
  assert(line == "event_id=$abc:test stream=42");
}

void TestAnnotationKeysAreQuotedWhenNeeded() {
  // multi-byte keys stay bare, whitespace and quotes force quoting
  assert(FormatFields({StringField("key", "👍")}) == "key=👍");
  assert(FormatFields({StringField("key", "thumbs up")}) == "key=\"thumbs up\"");
  assert(FormatFields({StringField("key", "a=\"b\"")}) == "key=\"a=\\\"b\\\"\"");
  assert(FormatFields({StringField("key", "line\nbreak")}) == "key=\"line\\nbreak\"");
  assert(FormatFields({StringField("key", "")}) == "key=\"\"");
}

void TestRelationFieldsCarryTheEdge() {
  const auto reference = RelationFields("$r:test", "$p:test", "m.reference");
  assert(reference.size() == 3);
  assert(FormatFields(reference) == "event_id=$r:test relates_to=$p:test rel_type=m.reference");

  const auto annotation = RelationFields("$a:test", "$p:test", "m.annotation", "👍");
  assert(annotation.size() == 4);
  assert(annotation.back().key == "key" && annotation.back().value == "👍");
}

} // namespace

int main() {
  TestPlainValuesAreWrittenBare();
  TestAnnotationKeysAreQuotedWhenNeeded();
  TestRelationFieldsCarryTheEdge();

  std::cout << "relations_engine_unit_logging: pass\n";
  return 0;
}
