#pragma once

#include <credence/schema/enum_string.hpp>

#include <cstdint>

// Envelope lifecycle: accepted is the only open state; settled and defaulted
// are terminal.
namespace credence::schema {

enum class envelope_status_t : uint8_t {
  accepted = 0,
  settled = 1,
  defaulted = 2
};

inline constexpr auto kEnvelopeStatusMappings =
    enum_mappings_t<envelope_status_t, 3>{
        {{"accepted", envelope_status_t::accepted},
         {"settled", envelope_status_t::settled},
         {"defaulted", envelope_status_t::defaulted}}};

template <>
inline std::optional<envelope_status_t> try_from_string<envelope_status_t>(
    const std::string_view value) {
  return lookup_enum(value, kEnvelopeStatusMappings);
}

inline constexpr std::string_view to_string(const envelope_status_t value) {
  return lookup_name(value, kEnvelopeStatusMappings);
}

}  // namespace credence::schema
