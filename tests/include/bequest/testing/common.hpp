#pragma once

#include <bequest/blake3/hash.hpp>
#include <bequest/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace bequest::testing {

inline constexpr auto kDay = bequest::schema::kMillisecondsPerDay;
inline constexpr auto kStartTime =
    bequest::schema::timestamp_milliseconds_t{1'700'000'000'000};

inline bequest::schema::account_id_t make_account(const std::string_view name) {
  return bequest::blake3::make_account_id(name);
}

inline bequest::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = bequest::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline std::string make_db_path(const std::string_view prefix) {
  static auto sequence = std::atomic<uint64_t>{0};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path =
      std::filesystem::temp_directory_path() /
      (std::string{prefix} + "_" +
       std::to_string(static_cast<unsigned long long>(now)) + "_" +
       std::to_string(sequence.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace bequest::testing
