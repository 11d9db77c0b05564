#include <credence/blake3/hash.hpp>
#include <credence/schema/key/builder.hpp>

#include <algorithm>
#include <iterator>
#include <ranges>

using namespace credence::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::hash(const std::string_view& str) {
  auto digest = credence::blake3::hash(str);
  std::ranges::copy(digest, std::back_inserter(data));
  return *this;
}

builder& builder::hash(const std::span<const uint8_t>& bytes) {
  auto digest = credence::blake3::hash(bytes);
  std::ranges::copy(digest, std::back_inserter(data));
  return *this;
}

builder& builder::write_ordered(const uint64_t value) {
  for (auto shift = 56; shift >= 0; shift -= 8) {
    data.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
  }
  return *this;
}

std::string builder::str() const {
  return std::string{reinterpret_cast<const char*>(data.data()), data.size()};
}
