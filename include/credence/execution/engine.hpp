#pragma once

#include <credence/config/policy_config.hpp>
#include <credence/execution/collaborators.hpp>
#include <credence/receipts/signer.hpp>
#include <credence/schema/agent_exposure.hpp>
#include <credence/schema/credit_result.hpp>
#include <credence/schema/envelope.hpp>
#include <credence/schema/health_report.hpp>
#include <credence/schema/intent.hpp>
#include <credence/schema/label_event.hpp>
#include <credence/schema/offer.hpp>
#include <credence/schema/settlement.hpp>
#include <credence/storage/rocksdb/storage.hpp>
#include <credence/underwriting/engine.hpp>

#include <json/value.h>

#include <optional>
#include <string>
#include <string_view>

namespace credence::execution {

/// Credit Envelope Protocol state machine.
///
/// Intent -> Offer -> Envelope -> Settlement. Every write goes through an
/// idempotent store primitive keyed by a fingerprint of the normalised
/// request, so repeating a request returns the row it created the first time.
/// The engine keeps no state between calls beyond its configuration and
/// installed collaborators.
class engine final {
 public:
  using storage_t =
      credence::storage::storage<credence::storage::rocksdb_storage_tag>;

  /// `signer` may be disabled; receipts are then hash-addressed but unsigned.
  engine(storage_t& storage,
         credence::config::policy_config policy,
         credence::receipts::receipt_signer signer = {});

  /// Record an agent's willingness to spend. Keyed by idempotency_key.
  credence::schema::credit_result_t<credence::schema::intent_t> intent(
      const credence::schema::intent_request_t& request);

  /// Underwrite and issue an offer. The granted terms come from the
  /// underwriting decision; the requested terms are kept for the response and
  /// the fingerprint only.
  credence::schema::credit_result_t<credence::schema::offer_response_t> offer(
      const credence::schema::offer_request_t& request);

  /// Accept an offer on behalf of a provider and issue the envelope with its
  /// issue receipt. An offer backs at most one envelope.
  credence::schema::credit_result_t<credence::schema::envelope_response_t>
  envelope(const credence::schema::envelope_request_t& request);

  /// Settle an accepted envelope: pay the provider invoice, or default it
  /// when expired or unverified. The first settlement of an envelope is
  /// final; later calls return it unchanged whatever they ask for.
  ///
  /// Payment happens before the settlement is persisted. A crash between the
  /// two leaves the envelope accepted, and a retry pays again unless the
  /// payment collaborator dedups on the quote idempotency key.
  credence::schema::credit_result_t<credence::schema::settle_response_t>
  settle(const credence::schema::settle_request_t& request);

  /// Loss and payment-failure rates and the breakers they trip.
  credence::schema::credit_result_t<credence::schema::health_report_t> health()
      const;

  /// Open exposure, recent history and current underwriting terms for one
  /// agent.
  credence::schema::credit_result_t<credence::schema::agent_exposure_t>
  agent_exposure(std::string_view agent_id) const;

  /// Collaborators are installed before the engine serves requests.
  void set_payment_collaborator(payment_collaborator_t payment);
  void set_attestation_publisher(attestation_publisher_t publisher);
  void set_invoice_decoder(invoice_decoder_t decoder);
  void set_clock(clock_fn_t clock);

  const credence::config::policy_config& policy() const;
  const credence::receipts::receipt_signer& signer() const;

 private:
  credence::schema::timestamp_milliseconds_t now() const;

  credence::schema::health_report_t evaluate_health(
      credence::schema::timestamp_milliseconds_t now) const;

  credence::underwriting::underwriting_decision_t underwrite(
      std::string_view agent_id,
      credence::schema::timestamp_milliseconds_t now) const;

  void record_underwriting_audit(
      const credence::schema::offer_t& offer,
      const std::optional<std::string>& intent_id,
      const credence::underwriting::underwriting_decision_t& decision);

  credence::schema::credit_result_t<credence::schema::envelope_response_t>
  issue_receipt(const credence::schema::envelope_t& envelope);

  credence::schema::credit_result_t<credence::schema::settle_response_t>
  replay_settlement(const credence::schema::settlement_t& settlement) const;

  credence::schema::credit_result_t<credence::schema::settle_response_t>
  settle_default(const credence::schema::envelope_t& envelope,
                 credence::schema::settlement_t settlement,
                 std::string_view fingerprint);

  credence::schema::credit_result_t<credence::schema::settle_response_t>
  settle_payment(const credence::schema::envelope_t& envelope,
                 const credence::schema::settle_request_t& request,
                 credence::schema::settlement_t settlement,
                 std::string_view fingerprint);

  credence::schema::credit_result_t<credence::schema::settle_response_t>
  persist_settlement(const credence::schema::envelope_t& envelope,
                     const credence::schema::settlement_t& settlement,
                     std::string_view fingerprint,
                     credence::schema::envelope_status_t envelope_status,
                     const Json::Value& receipt,
                     const std::optional<credence::schema::label_event_t>&
                         label);

  void publish_attestation(const credence::schema::label_event_t& event) const;

  storage_t& storage_;
  credence::config::policy_config policy_;
  credence::receipts::receipt_signer signer_;
  payment_collaborator_t payment_;
  attestation_publisher_t attestation_publisher_;
  invoice_decoder_t invoice_decoder_;
  clock_fn_t clock_;
};

}  // namespace credence::execution
