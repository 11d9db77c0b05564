#pragma once

#include <credence/config/policy_config.hpp>
#include <credence/execution/collaborators.hpp>
#include <credence/execution/engine.hpp>
#include <credence/receipts/signer.hpp>
#include <credence/schema/schemas.hpp>
#include <credence/storage/rocksdb/storage.hpp>
#include <credence/testing/common.hpp>

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace credence::testing {

/// Liquidity pool stand-in. Records every call and answers according to the
/// public knobs.
class scripted_payment final {
 public:
  std::string pay_status{"succeeded"};
  std::optional<std::string> pay_error_code;
  bool quote_not_found{};
  bool throw_on_pay{};
  std::vector<credence::execution::quote_pay_request_t> quotes;
  std::vector<credence::execution::pay_request_t> pays;

  credence::execution::payment_collaborator_t collaborator() {
    auto payment = credence::execution::payment_collaborator_t{};
    payment.quote_pay = [this](const auto& request) {
      quotes.push_back(request);
      if (quote_not_found) {
        return credence::schema::make_failure<
            credence::execution::quote_pay_response_t>(
            credence::schema::credit_error_code::not_found, "no route");
      }
      return credence::schema::make_success(
          credence::execution::quote_pay_response_t{
              .quote_id = "quote_" + std::to_string(quotes.size())});
    };
    payment.pay = [this](const auto& request) {
      pays.push_back(request);
      if (throw_on_pay) {
        throw std::runtime_error{"wallet unreachable"};
      }
      auto response = credence::execution::pay_response_t{};
      response.quote_id = request.quote_id;
      response.status = pay_status;
      response.error_code = pay_error_code;
      if (pay_status == credence::schema::kPayStatusSucceeded) {
        response.receipt_sha256 = credence::schema::to_hex(make_hash(0xA0));
      }
      return credence::schema::make_success(std::move(response));
    };
    return payment;
  }
};

/// Engine over a throwaway RocksDB directory with a manual clock and scripted
/// collaborators.
class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix,
                          const credence::config::policy_config& policy =
                              credence::config::policy_config{},
                          const bool signing = true)
      : db_path_{make_db_path(db_prefix)},
        storage_{credence::storage::make_storage<
            credence::storage::rocksdb_storage_tag>(db_path_)},
        engine_{storage_, policy, signing ? test_signer()
                                          : credence::receipts::receipt_signer{}} {
    engine_.set_clock([this] { return now_; });
    engine_.set_payment_collaborator(payment_.collaborator());
    engine_.set_attestation_publisher(
        [this](const credence::schema::label_event_t& event) {
          published_.push_back(event);
        });
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() {
    storage_.database.reset();
    remove_path(db_path_);
  }

  static credence::receipts::receipt_signer test_signer() {
    auto signer =
        credence::receipts::receipt_signer::from_secret_hex(kTestSigningKeyHex);
    if (!signer) {
      throw std::runtime_error{"test signing key rejected"};
    }
    return *signer;
  }

  credence::execution::engine& engine() { return engine_; }
  credence::execution::engine::storage_t& storage() { return storage_; }
  scripted_payment& payment() { return payment_; }
  const std::vector<credence::schema::label_event_t>& published() const {
    return published_;
  }

  credence::schema::timestamp_milliseconds_t now() const { return now_; }
  void advance_seconds(const uint64_t seconds) {
    now_ += seconds * credence::schema::kMillisecondsPerSecond;
  }

  credence::schema::intent_request_t intent_request(
      const std::string_view idempotency_key,
      const std::string& agent_id,
      const credence::schema::sats_t max_sats = 1'000) const {
    auto request = credence::schema::intent_request_t{};
    request.schema = std::string{credence::schema::kIntentRequestSchemaV1};
    request.idempotency_key = std::string{idempotency_key};
    request.agent_id = agent_id;
    request.scope_type = "nip90";
    request.scope_id = "job-1";
    request.max_sats = max_sats;
    request.exp = now_ + 1'800'000;
    request.policy_context["purpose"] = "translation";
    return request;
  }

  credence::schema::offer_request_t offer_request(
      const std::string& agent_id,
      const credence::schema::sats_t max_sats = 1'000,
      const std::string_view scope_id = "job-1") const {
    auto request = credence::schema::offer_request_t{};
    request.schema = std::string{credence::schema::kOfferRequestSchemaV1};
    request.agent_id = agent_id;
    request.pool_id = make_pubkey(0x50);
    request.scope_type = "nip90";
    request.scope_id = std::string{scope_id};
    request.max_sats = max_sats;
    request.fee_bps = 100;
    request.requires_verifier = true;
    request.exp = now_ + 1'800'000;
    return request;
  }

  credence::schema::envelope_request_t envelope_request(
      const std::string& offer_id,
      const std::string& provider_id) const {
    return credence::schema::envelope_request_t{
        .schema = std::string{credence::schema::kEnvelopeRequestSchemaV1},
        .offer_id = offer_id,
        .provider_id = provider_id};
  }

  credence::schema::settle_request_t settle_request(
      const std::string& envelope_id,
      const bool verification_passed = true,
      const std::string_view invoice = "lnbc3000n1cep") const {
    auto request = credence::schema::settle_request_t{};
    request.schema = std::string{credence::schema::kSettleRequestSchemaV1};
    request.envelope_id = envelope_id;
    request.verification_passed = verification_passed;
    request.verification_receipt_sha256 =
        credence::schema::to_hex(make_hash(0x70));
    request.provider_invoice = std::string{invoice};
    request.provider_host = "Provider.Example";
    request.max_fee_msats = 5'000;
    return request;
  }

  /// Offer then envelope for `agent_id`; throws if either step fails.
  credence::schema::envelope_response_t issue_envelope(
      const std::string& agent_id,
      const std::string& provider_id,
      const credence::schema::sats_t max_sats = 1'000,
      const std::string_view scope_id = "job-1") {
    auto offer = engine_.offer(offer_request(agent_id, max_sats, scope_id));
    if (!offer.ok()) {
      throw std::runtime_error{"offer failed: " + offer.log};
    }
    auto envelope = engine_.envelope(
        envelope_request(offer.value->offer.offer_id, provider_id));
    if (!envelope.ok()) {
      throw std::runtime_error{"envelope failed: " + envelope.log};
    }
    return *envelope.value;
  }

  /// Issue and default `count` envelopes, one fresh agent each.
  void default_envelopes(const uint8_t count, const uint8_t first_seed = 0x10) {
    for (uint8_t i = 0; i < count; ++i) {
      auto issued = issue_envelope(
          make_pubkey(static_cast<uint8_t>(first_seed + i)), make_pubkey(0x90));
      auto settled = engine_.settle(
          settle_request(issued.envelope.envelope_id, false));
      if (!settled.ok()) {
        throw std::runtime_error{"settle failed: " + settled.log};
      }
    }
  }

 private:
  std::string db_path_;
  credence::schema::timestamp_milliseconds_t now_{kStartMillis};
  scripted_payment payment_;
  std::vector<credence::schema::label_event_t> published_;
  credence::execution::engine::storage_t storage_;
  credence::execution::engine engine_;
};

}  // namespace credence::testing
