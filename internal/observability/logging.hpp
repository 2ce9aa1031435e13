#pragma once

#include <spdlog/common.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace relations::runtime::config {
class RuntimeConfig;
}

namespace relations::observability {

// One key=value pair of a log line. Values containing whitespace, quotes,
// '=' or control characters are written quoted and escaped so that
// annotation keys (emoji, free text) keep the line parseable.
struct LogField {
  std::string key;
  std::string value;
};

using LogFields = std::vector<LogField>;

LogField StringField(std::string_view key, std::string_view value);
LogField IntField(std::string_view key, std::int64_t value);

// event_id, room_id, type
LogFields EventFields(std::string_view event_id, std::string_view room_id, std::string_view type);

// event_id, relates_to, rel_type and key when non-empty
LogFields RelationFields(std::string_view event_id, std::string_view relates_to, std::string_view rel_type,
                         std::string_view aggregation_key = {});

std::string FormatFields(const LogFields& fields);

void InitializeLogging(const relations::runtime::config::RuntimeConfig& config);
void ShutdownLogging();

void Log(spdlog::level::level_enum level, std::string_view message, const LogFields& fields);

inline void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields = {}) {
  Log(level, message, LogFields(fields));
}

} // namespace relations::observability

#define RELATIONS_LOG_INFO(message, ...) ::relations::observability::Log(::spdlog::level::info, (message), ##__VA_ARGS__)
#define RELATIONS_LOG_WARN(message, ...) ::relations::observability::Log(::spdlog::level::warn, (message), ##__VA_ARGS__)
#define RELATIONS_LOG_ERROR(message, ...) ::relations::observability::Log(::spdlog::level::err, (message), ##__VA_ARGS__)
