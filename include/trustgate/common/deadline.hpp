#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <optional>
#include <string_view>
#include <thread>
#include <type_traits>
#include <utility>

namespace trustgate::common {

/// Run `fn` against an external capability, giving up after `timeout`.
///
/// Returns std::nullopt when the call times out or throws; both are logged
/// and treated as recoverable by callers. A zero timeout runs `fn` inline.
/// On timeout the worker thread is abandoned, so `fn` must own (by value or
/// shared_ptr) everything it touches.
template <typename Fn>
std::optional<std::invoke_result_t<Fn>> call_with_deadline(
    const std::string_view operation,
    const std::chrono::milliseconds timeout,
    Fn&& fn) {
  using value_t = std::invoke_result_t<Fn>;
  if (timeout.count() <= 0) {
    try {
      return std::optional<value_t>{fn()};
    } catch (const std::exception& ex) {
      spdlog::warn("{} failed: {}", operation, ex.what());
      return std::nullopt;
    }
  }

  auto promise = std::make_shared<std::promise<value_t>>();
  auto future = promise->get_future();
  std::thread([promise, fn = std::forward<Fn>(fn)]() mutable {
    try {
      promise->set_value(fn());
    } catch (...) {
      promise->set_exception(std::current_exception());
    }
  }).detach();

  if (future.wait_for(timeout) != std::future_status::ready) {
    spdlog::warn("{} timed out after {}ms", operation, timeout.count());
    return std::nullopt;
  }
  try {
    return std::optional<value_t>{future.get()};
  } catch (const std::exception& ex) {
    spdlog::warn("{} failed: {}", operation, ex.what());
    return std::nullopt;
  }
}

/// Timeout to use for a call into `capability`. In-process capabilities run
/// inline.
template <typename Capability>
std::chrono::milliseconds deadline_for(const Capability& capability,
                                       const std::chrono::milliseconds timeout) {
  return capability.in_process() ? std::chrono::milliseconds{0} : timeout;
}

}  // namespace trustgate::common
