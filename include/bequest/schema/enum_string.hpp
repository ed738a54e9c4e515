#pragma once

#include <array>
#include <optional>
#include <string_view>
#include <utility>

// Stable string names for schema enums, used in logs, result envelopes and
// the CLI.
namespace bequest::schema {

template <typename Enum>
using enum_mapping_t = std::pair<std::string_view, Enum>;

inline constexpr auto kUnknownEnumName = std::string_view{"unknown"};

template <typename Enum, std::size_t N>
constexpr std::optional<Enum> from_string(
    const std::string_view value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (name == value) {
      return enum_value;
    }
  }
  return std::nullopt;
}

template <typename Enum, std::size_t N>
constexpr std::string_view name_of(
    const Enum value,
    const std::array<enum_mapping_t<Enum>, N>& mappings) {
  for (const auto& [name, enum_value] : mappings) {
    if (enum_value == value) {
      return name;
    }
  }
  return kUnknownEnumName;
}

template <typename Enum>
std::optional<Enum> try_from_string(const std::string_view value) {
  static_cast<void>(value);
  return std::nullopt;
}

}  // namespace bequest::schema
