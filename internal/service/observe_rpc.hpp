#pragma once

#include <chrono>
#include <string>
#include <string_view>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace workgraph::service {

/*
  Runs one service call inside a span and logs its outcome.

  Exceptions are recorded on the span, logged and rethrown unchanged so the
  transport can map them.
*/
template <typename Fn>
auto ObserveRpc(std::string_view route, std::string_view item_id, Fn&& fn) {
  workgraph::observability::SpanScope span(route);
  if (!item_id.empty()) {
    span.SetAttribute("work_item.id", item_id);
  }

  const auto started_at = std::chrono::steady_clock::now();
  auto       elapsed_ms = [&] {
    return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
  };

  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Fn>>) {
      fn();
      span.SetAttribute("rpc.latency_ms", elapsed_ms());
      WORKGRAPH_LOG_DEBUG("RPC ok", {workgraph::observability::StringField("route", route),
                                     workgraph::observability::DoubleField("latency_ms", elapsed_ms())});
      return;
    } else {
      auto result = fn();
      span.SetAttribute("rpc.latency_ms", elapsed_ms());
      WORKGRAPH_LOG_DEBUG("RPC ok", {workgraph::observability::StringField("route", route),
                                     workgraph::observability::DoubleField("latency_ms", elapsed_ms())});
      return result;
    }
  } catch (const std::exception& ex) {
    span.RecordException(ex.what());
    WORKGRAPH_LOG_ERROR("RPC failed", {workgraph::observability::StringField("route", route),
                                       workgraph::observability::StringField("error", ex.what()),
                                       workgraph::observability::StringField("work_item_id", item_id),
                                       workgraph::observability::DoubleField("latency_ms", elapsed_ms())});
    throw;
  }
}

} // namespace workgraph::service
