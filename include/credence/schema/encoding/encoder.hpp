#pragma once
#include <credence/schema/primitives.hpp>

#include <optional>
#include <span>

namespace credence::schema::encoding {

// Storage codec, selected at build time by tag. The only backend today is
// SCALE (see scale/encoder.hpp).
template <typename Library>
struct encoder {
  template <typename T>
  credence::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, credence::schema::bytes_t& out);

  template <typename T>
  T decode(const credence::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const credence::schema::bytes_view_t& bytes);
};

}  // namespace credence::schema::encoding
