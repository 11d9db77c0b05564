#pragma once

#include <credence/schema/primitives.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace credence::testing {

/// 2027-01-15T08:00:00.000Z
inline constexpr auto kStartMillis =
    credence::schema::timestamp_milliseconds_t{1'800'000'000'000};

inline constexpr auto kTestSigningKeyHex = std::string_view{
    "9d61b19deffd5a60ba844af492ec2cc44449c5697b326919703bac031cae7f60"};

inline credence::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = credence::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

/// Lower-case 64-character hex public key derived from `seed`.
inline std::string make_pubkey(const uint8_t seed) {
  return credence::schema::to_hex(make_hash(seed));
}

inline std::string make_db_path(const std::string_view prefix) {
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

}  // namespace credence::testing
