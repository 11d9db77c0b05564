#pragma once

#include <credence/schema/enum_string.hpp>

#include <cstdint>

namespace credence::schema {

enum class offer_status_t : uint8_t { offered = 0, accepted = 1 };

inline constexpr auto kOfferStatusMappings = enum_mappings_t<offer_status_t, 2>{
    {{"offered", offer_status_t::offered},
     {"accepted", offer_status_t::accepted}}};

template <>
inline std::optional<offer_status_t> try_from_string<offer_status_t>(
    const std::string_view value) {
  return lookup_enum(value, kOfferStatusMappings);
}

inline constexpr std::string_view to_string(const offer_status_t value) {
  return lookup_name(value, kOfferStatusMappings);
}

}  // namespace credence::schema
