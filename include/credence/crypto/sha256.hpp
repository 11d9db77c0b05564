#pragma once

#include <credence/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace credence::crypto {

std::optional<credence::schema::hash32_t> sha256(
    const credence::schema::bytes_view_t& bytes);

/// Lower-case hex SHA-256 of the UTF-8 bytes of `text`.
std::optional<std::string> sha256_hex(std::string_view text);

}  // namespace credence::crypto
