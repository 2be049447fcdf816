#pragma once

#include <array>
#include <string_view>
#include <utility>

namespace courier::schema {

template <typename Enum, std::size_t N>
using enum_mappings_t = std::array<std::pair<std::string_view, Enum>, N>;

/// Look up the display name of `value`; "unknown" when it is not mapped.
template <typename Enum, std::size_t N>
constexpr std::string_view enum_name(const Enum value,
                                     const enum_mappings_t<Enum, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return "unknown";
}

}  // namespace courier::schema
