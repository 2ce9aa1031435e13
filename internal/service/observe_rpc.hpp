#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace relations::service {

/*
  Wraps one RPC body in a span and request metrics. Failures are logged
  and rethrown unchanged for the transport layer to translate.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view room_id, Fn&& fn) {
  relations::observability::SpanScope span(route);
  span.SetAttribute("room.id", room_id);

  const auto started_at = std::chrono::steady_clock::now();
  auto       finish     = [&](bool success) {
    relations::observability::Metrics::Instance().RecordRequest(route, success);
    relations::observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      finish(true);
      return;
    } else {
      auto result = fn();
      finish(true);
      return result;
    }
  } catch (const relations::util::Error& ex) {
    // client errors log at warn
    span.RecordException(ex.what());
    RELATIONS_LOG_WARN("RPC rejected", {relations::observability::StringField("route", route),
                                        relations::observability::StringField("room_id", room_id),
                                        relations::observability::StringField("errcode", ex.errcode()),
                                        relations::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    RELATIONS_LOG_ERROR("RPC failed", {relations::observability::StringField("route", route),
                                       relations::observability::StringField("room_id", room_id),
                                       relations::observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace relations::service
