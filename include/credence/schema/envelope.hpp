#pragma once
#include <credence/schema/envelope_status.hpp>
#include <credence/schema/primitives.hpp>
#include <credence/schema/receipt.hpp>
#include <credence/schema/scope_type.hpp>

#include <string>

namespace credence::schema {

template <uint16_t Version>
struct envelope_request;

template <>
struct envelope_request<1> final {
  std::string schema;
  std::string offer_id;
  std::string provider_id;
};

using envelope_request_t = envelope_request<1>;

template <uint16_t Version>
struct envelope;

/// Credit line drawn against an offer for one provider.
template <>
struct envelope<1> final {
  uint16_t version{1};
  std::string envelope_id;
  std::string offer_id;
  std::string agent_id;
  std::string pool_id;
  std::string provider_id;
  scope_type_t scope_type{scope_type_t::nip90};
  std::string scope_id;
  sats_t max_sats{};
  basis_points_t fee_bps{};
  timestamp_milliseconds_t exp{};
  envelope_status_t status{envelope_status_t::accepted};
  timestamp_milliseconds_t issued_at{};
};

using envelope_t = envelope<1>;

struct envelope_response_t final {
  envelope_t envelope;
  envelope_issue_receipt_t receipt;
};

}  // namespace credence::schema
