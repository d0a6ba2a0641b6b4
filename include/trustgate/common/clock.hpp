#pragma once

#include <trustgate/schema/primitives.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace trustgate::common {

/// Source of "now" in unix milliseconds. Components take one so tests can
/// move time without sleeping.
using clock_fn_t = std::function<trustgate::schema::timestamp_milliseconds_t()>;

trustgate::schema::timestamp_milliseconds_t system_now_ms();
clock_fn_t system_clock();

/// `YYYY-MM-DDTHH:MM:SS.mmmZ`
std::string format_iso8601(trustgate::schema::timestamp_milliseconds_t ms);

/// Accepts `YYYY-MM-DD`, `YYYY-MM-DDTHH:MM:SS`, an optional fractional part of
/// up to three digits and an optional trailing `Z`.
std::optional<trustgate::schema::timestamp_milliseconds_t> parse_iso8601(
    std::string_view value);

inline constexpr auto kMillisecondsPerDay =
    trustgate::schema::duration_milliseconds_t{24ull * 60 * 60 * 1000};

}  // namespace trustgate::common
