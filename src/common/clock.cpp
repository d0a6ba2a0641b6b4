#include <trustgate/common/clock.hpp>

#include <fmt/format.h>

#include <cctype>
#include <chrono>

namespace trustgate::common {

namespace {

std::optional<unsigned> read_digits(std::string_view& value,
                                    const std::size_t count) {
  if (value.size() < count) {
    return std::nullopt;
  }
  auto out = 0u;
  for (std::size_t i = 0; i < count; ++i) {
    if (std::isdigit(static_cast<unsigned char>(value[i])) == 0) {
      return std::nullopt;
    }
    out = (out * 10u) + static_cast<unsigned>(value[i] - '0');
  }
  value.remove_prefix(count);
  return out;
}

bool consume(std::string_view& value, const char expected) {
  if (value.empty() || value.front() != expected) {
    return false;
  }
  value.remove_prefix(1);
  return true;
}

}  // namespace

trustgate::schema::timestamp_milliseconds_t system_now_ms() {
  return static_cast<trustgate::schema::timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

clock_fn_t system_clock() {
  return [] { return system_now_ms(); };
}

std::string format_iso8601(const trustgate::schema::timestamp_milliseconds_t ms) {
  using namespace std::chrono;
  const auto tp = sys_time<milliseconds>{milliseconds{ms}};
  const auto midnight = floor<days>(tp);
  const auto ymd = year_month_day{midnight};
  const auto time_of_day = hh_mm_ss<milliseconds>{tp - midnight};
  return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                     static_cast<int>(ymd.year()),
                     static_cast<unsigned>(ymd.month()),
                     static_cast<unsigned>(ymd.day()), time_of_day.hours().count(),
                     time_of_day.minutes().count(), time_of_day.seconds().count(),
                     time_of_day.subseconds().count());
}

std::optional<trustgate::schema::timestamp_milliseconds_t> parse_iso8601(
    std::string_view value) {
  using namespace std::chrono;
  auto y = read_digits(value, 4);
  if (!y || !consume(value, '-')) {
    return std::nullopt;
  }
  auto m = read_digits(value, 2);
  if (!m || !consume(value, '-')) {
    return std::nullopt;
  }
  auto d = read_digits(value, 2);
  if (!d) {
    return std::nullopt;
  }
  const auto ymd = year_month_day{year{static_cast<int>(*y)}, month{*m},
                                  day{*d}};
  if (!ymd.ok()) {
    return std::nullopt;
  }

  auto time_of_day = milliseconds{0};
  if (consume(value, 'T')) {
    auto hh = read_digits(value, 2);
    if (!hh || *hh > 23 || !consume(value, ':')) {
      return std::nullopt;
    }
    auto mm = read_digits(value, 2);
    if (!mm || *mm > 59 || !consume(value, ':')) {
      return std::nullopt;
    }
    auto ss = read_digits(value, 2);
    if (!ss || *ss > 59) {
      return std::nullopt;
    }
    time_of_day = hours{*hh} + minutes{*mm} + seconds{*ss};
    if (consume(value, '.')) {
      auto fraction = 0u;
      auto digits = 0u;
      while (!value.empty() &&
             std::isdigit(static_cast<unsigned char>(value.front())) != 0) {
        if (digits < 3) {
          fraction = (fraction * 10u) +
                     static_cast<unsigned>(value.front() - '0');
          ++digits;
        }
        value.remove_prefix(1);
      }
      if (digits == 0) {
        return std::nullopt;
      }
      while (digits < 3) {
        fraction *= 10u;
        ++digits;
      }
      time_of_day += milliseconds{fraction};
    }
    consume(value, 'Z');
  }
  if (!value.empty()) {
    return std::nullopt;
  }

  const auto since_epoch = sys_days{ymd}.time_since_epoch();
  if (since_epoch.count() < 0) {
    return std::nullopt;
  }
  return static_cast<trustgate::schema::timestamp_milliseconds_t>(
      (duration_cast<milliseconds>(since_epoch) + time_of_day).count());
}

}  // namespace trustgate::common
