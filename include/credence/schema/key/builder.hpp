#pragma once
#include <credence/schema/primitives.hpp>

#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace credence::schema::key {

/// Byte-wise key assembly for the RocksDB keyspace. Variable-length fields
/// that precede other fields are hashed to a fixed 32 bytes so prefixes stay
/// unambiguous.
struct builder final {
  credence::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);

  builder& hash(const std::string_view& str);
  builder& hash(const std::span<const uint8_t>& bytes);

  /// Big-endian, so lexicographic key order follows numeric order.
  builder& write_ordered(uint64_t value);

  std::string str() const;
};

}  // namespace credence::schema::key
