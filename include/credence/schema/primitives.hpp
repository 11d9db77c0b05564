#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace credence::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using sats_t = uint64_t;
using msats_t = uint64_t;
using basis_points_t = uint32_t;
/// UTC instant, milliseconds since the Unix epoch.
using timestamp_milliseconds_t = uint64_t;
using duration_milliseconds_t = uint64_t;

inline constexpr auto kMillisecondsPerSecond = duration_milliseconds_t{1000};
inline constexpr auto kMillisecondsPerDay = duration_milliseconds_t{86'400'000};

using ed25519_public_key_t = std::array<uint8_t, 32>;
using ed25519_secret_key_t = std::array<uint8_t, 32>;
using ed25519_signature_t = std::array<uint8_t, 64>;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string_view make_string_view(const bytes_view_t& bytes);
std::string make_string(const bytes_view_t& bytes);

std::string to_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(std::string_view hex);
std::optional<hash32_t> try_make_hash32(std::string_view hex);

/// Trim ASCII whitespace from both ends.
std::string trim(std::string_view value);
std::string to_lower_ascii(std::string_view value);
bool is_hex(std::string_view value);

/// RFC 3339 UTC rendering with millisecond precision, e.g.
/// `2026-10-19T08:29:00.000Z`.
std::string format_rfc3339(timestamp_milliseconds_t value);

constexpr timestamp_milliseconds_t saturating_sub(
    const timestamp_milliseconds_t value,
    const duration_milliseconds_t amount) {
  return value > amount ? value - amount : 0;
}

/// Product clamped to the uint64_t maximum.
constexpr uint64_t saturating_mul(const uint64_t lhs, const uint64_t rhs) {
  if (lhs != 0 && rhs > UINT64_MAX / lhs) {
    return UINT64_MAX;
  }
  return lhs * rhs;
}

}  // namespace credence::schema
