#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <iterator>
#include <string>

#include <spdlog/fmt/fmt.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

#ifdef ENABLE_OTEL
#include <opentelemetry/context/runtime_context.h>
#include <opentelemetry/trace/provider.h>
#include <opentelemetry/trace/span.h>
#endif

namespace relations::observability {
namespace {

constexpr const char* kLoggerName     = "relations-engine";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%n] %v";

bool g_include_trace_context{false};

// Environment wins over the config file.
std::string FromEnvOr(const char* name, const std::string& configured, std::string fallback) {
  if (const char* value = std::getenv(name)) {
    return value;
  }
  return configured.empty() ? std::move(fallback) : configured;
}

bool NeedsQuoting(std::string_view value) {
  if (value.empty()) {
    return true;
  }
  for (unsigned char c : value) {
    if (c <= 0x20 || c == '"' || c == '=' || c == '\\' || c == 0x7f) {
      return true;
    }
  }
  return false;
}

void AppendValue(fmt::memory_buffer& out, std::string_view value) {
  if (!NeedsQuoting(value)) {
    out.append(value.data(), value.data() + value.size());
    return;
  }

  out.push_back('"');
  for (unsigned char c : value) {
    switch (c) {
      case '"':
        fmt::format_to(std::back_inserter(out), "\\\"");
        break;
      case '\\':
        fmt::format_to(std::back_inserter(out), "\\\\");
        break;
      case '\n':
        fmt::format_to(std::back_inserter(out), "\\n");
        break;
      case '\t':
        fmt::format_to(std::back_inserter(out), "\\t");
        break;
      default:
        if (c < 0x20 || c == 0x7f) {
          fmt::format_to(std::back_inserter(out), "\\x{:02x}", c);
        } else {
          out.push_back(static_cast<char>(c));
        }
    }
  }
  out.push_back('"');
}

void AppendFields(fmt::memory_buffer& out, const LogFields& fields) {
  for (const auto& field : fields) {
    if (out.size() > 0) {
      out.push_back(' ');
    }
    fmt::format_to(std::back_inserter(out), "{}=", field.key);
    AppendValue(out, field.value);
  }
}

#ifdef ENABLE_OTEL
void AppendTraceContext(fmt::memory_buffer& out) {
  if (!g_include_trace_context) {
    return;
  }

  auto span = opentelemetry::trace::GetSpan(opentelemetry::context::RuntimeContext::GetCurrent());
  if (!span) {
    return;
  }

  auto context = span->GetContext();
  if (!context.IsValid()) {
    return;
  }

  char trace_id[32];
  char span_id[16];
  context.trace_id().ToLowerBase16(trace_id);
  context.span_id().ToLowerBase16(span_id);
  fmt::format_to(std::back_inserter(out), " trace_id={} span_id={}", std::string_view(trace_id, sizeof(trace_id)),
                 std::string_view(span_id, sizeof(span_id)));
}
#else
void AppendTraceContext(fmt::memory_buffer&) {
}
#endif

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogFields EventFields(std::string_view event_id, std::string_view room_id, std::string_view type) {
  return {StringField("event_id", event_id), StringField("room_id", room_id), StringField("type", type)};
}

LogFields RelationFields(std::string_view event_id, std::string_view relates_to, std::string_view rel_type,
                         std::string_view aggregation_key) {
  LogFields fields{StringField("event_id", event_id), StringField("relates_to", relates_to), StringField("rel_type", rel_type)};
  if (!aggregation_key.empty()) {
    fields.push_back(StringField("key", aggregation_key));
  }
  return fields;
}

std::string FormatFields(const LogFields& fields) {
  fmt::memory_buffer out;
  AppendFields(out, fields);
  return fmt::to_string(out);
}

void InitializeLogging(const relations::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  auto level_name = FromEnvOr("RELATIONS_LOG_LEVEL", logging.level(), "info");
  auto level      = spdlog::level::from_str(level_name);
  // from_str maps unknown names to off; silence is never what a typo meant.
  const bool unknown_level = level == spdlog::level::off && level_name != "off";

  auto logger = spdlog::stdout_color_mt(kLoggerName);
  logger->set_pattern(FromEnvOr("RELATIONS_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(unknown_level ? spdlog::level::info : level);
  spdlog::set_default_logger(std::move(logger));
  spdlog::flush_on(spdlog::level::warn);

  const auto include_trace = FromEnvOr("RELATIONS_LOG_INCLUDE_TRACE_CONTEXT", logging.include_trace_context() ? "true" : "", "false");
  g_include_trace_context  = include_trace == "1" || include_trace == "true";

  if (unknown_level) {
    RELATIONS_LOG_WARN("unknown log level, using info", {StringField("level", level_name)});
  }
}

void ShutdownLogging() {
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, const LogFields& fields) {
  auto logger = spdlog::default_logger_raw();
  if (!logger->should_log(level)) {
    return;
  }

  fmt::memory_buffer line;
  line.append(message.data(), message.data() + message.size());
  AppendFields(line, fields);
  AppendTraceContext(line);
  logger->log(level, "{}", std::string_view(line.data(), line.size()));
}

} // namespace relations::observability
