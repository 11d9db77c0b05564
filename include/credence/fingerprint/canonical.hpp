#pragma once

#include <json/value.h>

#include <optional>
#include <string>
#include <string_view>

namespace credence::fingerprint {

/// Compact JSON with object keys in lexicographic order, no insignificant
/// whitespace and raw UTF-8. Two values with the same members serialize to
/// the same bytes regardless of insertion order.
std::string canonical_json(const Json::Value& value);

/// Lower-case hex SHA-256 of `canonical_json(value)`, or std::nullopt on
/// digest failure.
std::optional<std::string> canonical_sha256(const Json::Value& value);

inline constexpr auto kEntityIdDigestChars = std::size_t{24};

/// `<prefix>_<first 24 hex chars of digest>`.
std::string make_entity_id(std::string_view prefix,
                           std::string_view digest_hex);

}  // namespace credence::fingerprint
