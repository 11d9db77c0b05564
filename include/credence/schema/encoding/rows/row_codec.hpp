#pragma once

#include <cstdint>
#include <optional>
#include <tuple>

// Stored rows travel through the encoder as flat tuples of SCALE primitives.
// Each persisted type specialises row_codec with its tuple layout; enums are
// written as their uint8_t value and checked on the way back.
namespace credence::schema::encoding {

template <typename T>
struct row_codec;

template <typename Enum>
constexpr uint8_t to_wire(const Enum value) {
  return static_cast<uint8_t>(value);
}

template <typename Enum>
constexpr std::optional<Enum> enum_from_wire(const uint8_t value,
                                             const Enum last) {
  if (value > static_cast<uint8_t>(last)) {
    return std::nullopt;
  }
  return static_cast<Enum>(value);
}

}  // namespace credence::schema::encoding
