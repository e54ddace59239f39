#pragma once

#include <chrono>
#include <exception>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace shortener::service {

/*
  Runs one RPC body, logging failures with their route and latency.

  Caller mistakes (bad input, unknown code) are logged at warn, everything
  else at error. The exception is always rethrown.
*/
template <typename Fn>
auto RunLogged(std::string_view route, Fn&& fn) -> decltype(fn()) {
  const auto started_at = std::chrono::steady_clock::now();

  try {
    return fn();
  } catch (const std::exception& ex) {
    const auto elapsed_ms = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started_at).count();

    const bool caller_error = dynamic_cast<const util::InvalidArgument*>(&ex) || dynamic_cast<const util::NotFound*>(&ex);
    if (caller_error) {
      SHORTENER_LOG_WARN("RPC rejected", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                          observability::IntField("latency_ms", elapsed_ms)});
    } else {
      SHORTENER_LOG_ERROR("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what()),
                                         observability::IntField("latency_ms", elapsed_ms)});
    }
    throw;
  }
}

} // namespace shortener::service
