#pragma once
#include <credence/schema/primitives.hpp>

#include <string>

namespace credence::schema {

template <uint16_t Version>
struct underwriting_audit;

/// Inputs and decision behind an offer, written once per offer_id.
template <>
struct underwriting_audit<1> final {
  uint16_t version{1};
  std::string offer_id;
  std::string canonical_json_sha256;
  std::string audit_json;
  timestamp_milliseconds_t created_at{};
};

using underwriting_audit_t = underwriting_audit<1>;

}  // namespace credence::schema
