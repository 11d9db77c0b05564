#pragma once

#include <credence/schema/enum_string.hpp>

#include <cstdint>

// Kind of work a credit line is scoped to. Only NIP-90 data-vending jobs are
// underwritten today.
namespace credence::schema {

enum class scope_type_t : uint8_t { nip90 = 0 };

inline constexpr auto kScopeTypeMappings =
    enum_mappings_t<scope_type_t, 1>{{{"nip90", scope_type_t::nip90}}};

template <>
inline std::optional<scope_type_t> try_from_string<scope_type_t>(
    const std::string_view value) {
  return lookup_enum(value, kScopeTypeMappings);
}

inline constexpr std::string_view to_string(const scope_type_t value) {
  return lookup_name(value, kScopeTypeMappings);
}

}  // namespace credence::schema
