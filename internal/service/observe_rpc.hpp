#pragma once

#include <chrono>
#include <string_view>
#include <type_traits>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace mediaflow::service {

/*
  Wraps one service call in a span plus request count / latency metrics.
  Exceptions are logged and rethrown for the transport layer to map.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  observability::SpanScope span(route);

  const auto started_at = std::chrono::steady_clock::now();
  const auto finish     = [&](bool success) {
    observability::Metrics::Instance().RecordRequest(route, success);
    observability::Metrics::Instance().ObserveRequestLatencyMs(
        route, std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count());
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      std::forward<Fn>(fn)();
      finish(true);
      return;
    } else {
      auto result = std::forward<Fn>(fn)();
      finish(true);
      return result;
    }
  } catch (const std::exception& ex) {
    span.MarkFailed("rpc", ex.what());
    MEDIAFLOW_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    finish(false);
    throw;
  }
}

} // namespace mediaflow::service
