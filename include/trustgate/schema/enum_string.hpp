#pragma once

#include <array>
#include <cstddef>
#include <optional>
#include <string_view>

namespace trustgate::schema {

/// Wire name of one enumerator.
template <typename Enum>
struct enum_name final {
  std::string_view name;
  Enum value;
};

template <typename Enum, std::size_t N>
using enum_names_t = std::array<enum_name<Enum>, N>;

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> find_enum(const std::string_view name,
                                        const enum_names_t<Enum, N>& names) {
  for (const auto& entry : names) {
    if (entry.name == name) {
      return entry.value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view name_of(const Enum value,
                                   const enum_names_t<Enum, N>& names) {
  for (const auto& entry : names) {
    if (entry.value == value) {
      return entry.name;
    }
  }
  return "unknown";
}

/// Specialized next to each enum that appears in JSON or on the command line.
template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace trustgate::schema
