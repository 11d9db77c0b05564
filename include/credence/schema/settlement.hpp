#pragma once
#include <credence/schema/envelope_status.hpp>
#include <credence/schema/primitives.hpp>
#include <credence/schema/settlement_outcome.hpp>

#include <json/value.h>

#include <optional>
#include <string>

namespace credence::schema {

template <uint16_t Version>
struct settle_request;

template <>
struct settle_request<1> final {
  std::string schema;
  std::string envelope_id;
  bool verification_passed{};
  std::string verification_receipt_sha256;
  std::string provider_invoice;
  std::string provider_host;
  msats_t max_fee_msats{};
  Json::Value policy_context;
};

using settle_request_t = settle_request<1>;

template <uint16_t Version>
struct settlement;

/// Final outcome of an envelope. At most one exists per envelope_id.
template <>
struct settlement<1> final {
  uint16_t version{1};
  std::string settlement_id;
  std::string envelope_id;
  settlement_outcome_t outcome{settlement_outcome_t::success};
  sats_t spent_sats{};
  sats_t fee_sats{};
  std::string verification_receipt_sha256;
  std::optional<std::string> liquidity_receipt_sha256;
  timestamp_milliseconds_t created_at{};
};

using settlement_t = settlement<1>;

/// `receipt` is the settlement receipt or default notice as persisted.
/// `replayed` is set when the settlement already existed and nothing in the
/// request was evaluated.
struct settle_response_t final {
  settlement_t settlement;
  envelope_status_t envelope_status{envelope_status_t::accepted};
  Json::Value receipt;
  bool replayed{};
};

}  // namespace credence::schema
