#pragma once
#include <credence/schema/envelope.hpp>
#include <credence/schema/envelope_status.hpp>
#include <credence/schema/intent.hpp>
#include <credence/schema/liquidity_pay_event.hpp>
#include <credence/schema/offer.hpp>
#include <credence/schema/primitives.hpp>
#include <credence/schema/receipt.hpp>
#include <credence/schema/settlement.hpp>
#include <credence/schema/underwriting_audit.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace credence::storage {

enum class store_status : uint8_t { created, existing, conflict, not_found };

/// Result of a conditional write. `row` holds the stored row after the call:
/// the new row for `created`, the prior row for `existing` and, where one
/// exists, for `conflict`.
template <typename T>
struct store_outcome final {
  store_status status{store_status::created};
  std::optional<T> row;
  std::string message;
};

/// Envelopes in `accepted` status whose expiry is still ahead.
struct open_envelope_stats_t final {
  uint64_t count{};
  credence::schema::sats_t exposure_sats{};
};

template <typename Library>
struct storage {
  /// Insert keyed by intent_id, or return the stored intent when the
  /// fingerprint matches. A different fingerprint under the same id is a
  /// conflict.
  store_outcome<credence::schema::intent_t> create_or_get_intent(
      const credence::schema::intent_t& intent,
      std::string_view fingerprint);

  store_outcome<credence::schema::offer_t> create_or_get_offer(
      const credence::schema::offer_t& offer,
      std::string_view fingerprint);

  /// Create the envelope and flip its offer to `accepted` in one write. Fails
  /// with `conflict` once the offer has been accepted by anything else.
  store_outcome<credence::schema::envelope_t> accept_offer(
      const credence::schema::envelope_t& envelope,
      std::string_view fingerprint);

  store_outcome<credence::schema::envelope_t> update_envelope_status(
      std::string_view envelope_id,
      credence::schema::envelope_status_t status);

  /// Write the settlement, move its envelope out of `accepted` and store its
  /// receipt in one batch. At most one settlement is ever written per
  /// envelope.
  store_outcome<credence::schema::settlement_t> record_settlement(
      const credence::schema::settlement_t& settlement,
      std::string_view fingerprint,
      credence::schema::envelope_status_t envelope_status,
      const credence::schema::stored_receipt_t& receipt);

  /// Receipts, audits and pay events are write-once; rewriting identical
  /// content is `existing`, different content is `conflict`.
  store_outcome<credence::schema::stored_receipt_t> put_receipt(
      const credence::schema::stored_receipt_t& receipt);
  store_outcome<credence::schema::underwriting_audit_t> put_underwriting_audit(
      const credence::schema::underwriting_audit_t& audit);
  store_outcome<credence::schema::liquidity_pay_event_t>
  put_liquidity_pay_event(const credence::schema::liquidity_pay_event_t& event);

  std::optional<credence::schema::intent_t> get_intent(
      std::string_view intent_id) const;
  std::optional<credence::schema::offer_t> get_offer(
      std::string_view offer_id) const;
  std::optional<credence::schema::envelope_t> get_envelope(
      std::string_view envelope_id) const;
  std::optional<credence::schema::settlement_t> get_settlement_by_envelope(
      std::string_view envelope_id) const;
  std::optional<credence::schema::stored_receipt_t> get_receipt(
      std::string_view entity_kind,
      std::string_view entity_id,
      std::string_view schema) const;
  std::optional<credence::schema::underwriting_audit_t> get_underwriting_audit(
      std::string_view offer_id) const;
  std::optional<credence::schema::liquidity_pay_event_t>
  get_liquidity_pay_event(std::string_view quote_id) const;

  /// Newest first, created_at >= since, at most `limit` rows.
  std::vector<credence::schema::settlement_t> list_recent_settlements(
      credence::schema::timestamp_milliseconds_t since,
      uint32_t limit) const;
  std::vector<credence::schema::settlement_t> list_recent_settlements_for_agent(
      std::string_view agent_id,
      credence::schema::timestamp_milliseconds_t since,
      uint32_t limit) const;
  std::vector<credence::schema::liquidity_pay_event_t>
  list_recent_liquidity_pay_events(
      credence::schema::timestamp_milliseconds_t since,
      uint32_t limit) const;

  open_envelope_stats_t get_agent_open_envelope_stats(
      std::string_view agent_id,
      credence::schema::timestamp_milliseconds_t now) const;
  open_envelope_stats_t get_global_open_envelope_stats(
      credence::schema::timestamp_milliseconds_t now) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace credence::storage
