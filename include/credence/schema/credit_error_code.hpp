#pragma once

#include <credence/schema/enum_string.hpp>

#include <cstdint>

// Protocol failure taxonomy. Numeric values are stable and safe to surface to
// callers; dependency_unavailable is the only retryable kind.
namespace credence::schema {

enum class credit_error_code : uint32_t {
  ok = 0,
  invalid_request = 1,
  not_found = 2,
  conflict = 3,
  dependency_unavailable = 4,
  internal = 5,
};

inline constexpr auto kCreditErrorCodeMappings =
    enum_mappings_t<credit_error_code, 6>{
        {{"ok", credit_error_code::ok},
         {"invalid_request", credit_error_code::invalid_request},
         {"not_found", credit_error_code::not_found},
         {"conflict", credit_error_code::conflict},
         {"dependency_unavailable", credit_error_code::dependency_unavailable},
         {"internal_error", credit_error_code::internal}}};

inline constexpr std::string_view to_string(const credit_error_code value) {
  return lookup_name(value, kCreditErrorCodeMappings);
}

}  // namespace credence::schema
