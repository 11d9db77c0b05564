#pragma once

#include <credence/schema/enum_string.hpp>

#include <cstdint>

namespace credence::schema {

enum class settlement_outcome_t : uint8_t {
  success = 0,
  failed = 1,
  expired = 2
};

inline constexpr auto kSettlementOutcomeMappings =
    enum_mappings_t<settlement_outcome_t, 3>{
        {{"success", settlement_outcome_t::success},
         {"failed", settlement_outcome_t::failed},
         {"expired", settlement_outcome_t::expired}}};

template <>
inline std::optional<settlement_outcome_t>
try_from_string<settlement_outcome_t>(const std::string_view value) {
  return lookup_enum(value, kSettlementOutcomeMappings);
}

inline constexpr std::string_view to_string(const settlement_outcome_t value) {
  return lookup_name(value, kSettlementOutcomeMappings);
}

}  // namespace credence::schema
