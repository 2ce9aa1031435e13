#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace relations::db::model {

/*
  Persisted room event.

  Content is stored as JSON text for portability:
    postgres -> jsonb
    sqlite   -> text

  Events are append-only. Redaction only flips `redacted`; the row stays.
*/

struct EventRecord {
  std::string event_id;
  std::string room_id;
  std::string type;
  std::string sender;
  std::optional<std::string> state_key;

  std::string content_json = "{}";

  uint64_t origin_server_ts = 0;

  // Assigned by the repository on insert.
  uint64_t topological_ordering = 0;
  uint64_t stream_ordering      = 0;

  bool        redacted = false;
  std::string redacted_by;
};

} // namespace relations::db::model
