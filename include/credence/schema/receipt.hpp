#pragma once
#include <credence/schema/label_event.hpp>
#include <credence/schema/primitives.hpp>
#include <credence/schema/scope_type.hpp>
#include <credence/schema/settlement_outcome.hpp>

#include <optional>
#include <string>

namespace credence::schema {

template <uint16_t Version>
struct receipt_signature;

/// Detached Ed25519 signature over the 32 raw bytes of `signed_sha256`.
template <>
struct receipt_signature<1> final {
  std::string schema;
  std::string scheme;
  std::string signer;
  std::string signed_sha256;
  std::string signature_hex;
};

using receipt_signature_t = receipt_signature<1>;

/// Attestation fields shared by settlement receipts and default notices.
/// Present only when a signing key is configured.
struct label_reference_t final {
  std::string label_event_id;
  std::string label_event_sha256;
  label_event_t label_event;
};

template <uint16_t Version>
struct envelope_issue_receipt;

template <>
struct envelope_issue_receipt<1> final {
  std::string schema;
  std::string receipt_id;
  std::string offer_id;
  std::string envelope_id;
  std::string agent_id;
  std::string pool_id;
  std::string provider_id;
  scope_type_t scope_type{scope_type_t::nip90};
  std::string scope_id;
  sats_t max_sats{};
  basis_points_t fee_bps{};
  timestamp_milliseconds_t exp{};
  timestamp_milliseconds_t issued_at{};
  std::string canonical_json_sha256;
  std::optional<receipt_signature_t> signature;
};

using envelope_issue_receipt_t = envelope_issue_receipt<1>;

template <uint16_t Version>
struct settlement_receipt;

template <>
struct settlement_receipt<1> final {
  std::string schema;
  std::string receipt_id;
  std::string envelope_id;
  std::string agent_id;
  std::string pool_id;
  std::string provider_id;
  scope_type_t scope_type{scope_type_t::nip90};
  std::string scope_id;
  settlement_outcome_t outcome{settlement_outcome_t::success};
  sats_t spent_sats{};
  sats_t fee_sats{};
  std::string verification_receipt_sha256;
  std::string liquidity_receipt_sha256;
  std::optional<label_reference_t> label;
  timestamp_milliseconds_t created_at{};
  std::string canonical_json_sha256;
  std::optional<receipt_signature_t> signature;
};

using settlement_receipt_t = settlement_receipt<1>;

enum class default_reason_t : uint8_t { expired = 0, verification_failed = 1 };

inline constexpr std::string_view to_string(const default_reason_t value) {
  return value == default_reason_t::expired ? "expired"
                                            : "verification_failed";
}

template <uint16_t Version>
struct default_notice;

template <>
struct default_notice<1> final {
  std::string schema;
  std::string receipt_id;
  std::string settlement_id;
  std::string envelope_id;
  std::string agent_id;
  std::string pool_id;
  std::string provider_id;
  scope_type_t scope_type{scope_type_t::nip90};
  std::string scope_id;
  default_reason_t reason{default_reason_t::expired};
  sats_t loss_sats{};
  std::optional<std::string> verification_receipt_sha256;
  std::optional<label_reference_t> label;
  timestamp_milliseconds_t created_at{};
  std::string canonical_json_sha256;
  std::optional<receipt_signature_t> signature;
};

using default_notice_t = default_notice<1>;

template <uint16_t Version>
struct stored_receipt;

/// Persisted form of any receipt, unique on (entity_kind, entity_id, schema).
/// `receipt_json` is the canonical JSON of the full receipt.
template <>
struct stored_receipt<1> final {
  uint16_t version{1};
  std::string receipt_id;
  std::string entity_kind;
  std::string entity_id;
  std::string schema;
  std::string canonical_json_sha256;
  std::optional<std::string> signature_json;
  std::string receipt_json;
  timestamp_milliseconds_t created_at{};
};

using stored_receipt_t = stored_receipt<1>;

}  // namespace credence::schema
