#pragma once
#include <credence/schema/offer_status.hpp>
#include <credence/schema/primitives.hpp>
#include <credence/schema/scope_type.hpp>

#include <optional>
#include <string>

namespace credence::schema {

template <uint16_t Version>
struct offer_request;

template <>
struct offer_request<1> final {
  std::string schema;
  std::optional<std::string> intent_id;
  std::string agent_id;
  std::string pool_id;
  std::string scope_type;
  std::string scope_id;
  sats_t max_sats{};
  basis_points_t fee_bps{};
  bool requires_verifier{};
  timestamp_milliseconds_t exp{};
};

using offer_request_t = offer_request<1>;

/// Credit terms. An offer carries two of these: what the caller asked for and
/// what underwriting granted. Only the granted terms are binding.
struct offer_terms_t final {
  sats_t max_sats{};
  basis_points_t fee_bps{};
  bool requires_verifier{};
};

template <uint16_t Version>
struct offer;

/// Pool's underwritten willingness to extend credit. `max_sats`, `fee_bps`
/// and `requires_verifier` hold the granted terms.
template <>
struct offer<1> final {
  uint16_t version{1};
  std::string offer_id;
  std::string agent_id;
  std::string pool_id;
  scope_type_t scope_type{scope_type_t::nip90};
  std::string scope_id;
  sats_t max_sats{};
  basis_points_t fee_bps{};
  bool requires_verifier{true};
  timestamp_milliseconds_t exp{};
  offer_status_t status{offer_status_t::offered};
  timestamp_milliseconds_t issued_at{};
};

using offer_t = offer<1>;

struct offer_response_t final {
  offer_t offer;
  offer_terms_t requested;
  offer_terms_t granted;
};

}  // namespace credence::schema
