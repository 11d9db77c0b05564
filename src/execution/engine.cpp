#include <spdlog/spdlog.h>
#include <credence/crypto/sha256.hpp>
#include <credence/execution/engine.hpp>
#include <credence/fingerprint/canonical.hpp>
#include <credence/health/monitor.hpp>
#include <credence/lightning/invoice.hpp>
#include <credence/receipts/builder.hpp>
#include <credence/schema/json.hpp>
#include <credence/schema/schemas.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>

using namespace credence::schema;

namespace {

inline constexpr auto kIntentCodespace = std::string_view{"credence.intent"};
inline constexpr auto kOfferCodespace = std::string_view{"credence.offer"};
inline constexpr auto kEnvelopeCodespace =
    std::string_view{"credence.envelope"};
inline constexpr auto kSettleCodespace = std::string_view{"credence.settle"};
inline constexpr auto kHealthCodespace = std::string_view{"credence.health"};
inline constexpr auto kExposureCodespace =
    std::string_view{"credence.exposure"};

inline constexpr auto kPubkeyHexChars = std::size_t{64};
inline constexpr auto kMaxBasisPoints = uint64_t{10'000};
inline constexpr auto kMsatsPerSat = uint64_t{1'000};
inline constexpr auto kQuoteIdempotencyPrefix = std::string_view{"cep:quote:"};

template <typename T>
credit_result_t<T> invalid(std::string log, const std::string_view codespace) {
  return make_failure<T>(credit_error_code::invalid_request, std::move(log),
                         codespace);
}

template <typename T>
credit_result_t<T> internal(std::string log, const std::string_view codespace) {
  spdlog::error("{}: {}", codespace, log);
  return make_failure<T>(credit_error_code::internal, std::move(log),
                         codespace);
}

bool check_schema(const std::string_view value,
                  const std::string_view expected,
                  std::string& error) {
  if (trim(value) != expected) {
    error = fmt::format("schema must be {}", expected);
    return false;
  }
  return true;
}

std::optional<scope_type_t> check_scope_type(const std::string_view value,
                                             std::string& error) {
  auto scope_type = try_from_string<scope_type_t>(trim(value));
  if (!scope_type) {
    error = "scope_type must be nip90";
  }
  return scope_type;
}

std::optional<std::string> require_text(const std::string_view value,
                                        const std::string_view field,
                                        std::string& error) {
  auto trimmed = trim(value);
  if (trimmed.empty()) {
    error = fmt::format("{} is required", field);
    return std::nullopt;
  }
  return trimmed;
}

/// Trimmed, lower-cased 64-character hex public key.
std::optional<std::string> require_pubkey(const std::string_view value,
                                          const std::string_view field,
                                          std::string& error) {
  auto normalized = to_lower_ascii(trim(value));
  if (normalized.size() != kPubkeyHexChars || !is_hex(normalized)) {
    error = fmt::format("{} must be a 64-character hex public key", field);
    return std::nullopt;
  }
  return normalized;
}

bool check_terms(const sats_t max_sats,
                 const timestamp_milliseconds_t exp,
                 const timestamp_milliseconds_t now,
                 const credence::config::policy_config& policy,
                 std::string& error) {
  if (max_sats == 0) {
    error = "max_sats must be > 0";
    return false;
  }
  if (max_sats > policy.max_sats_per_envelope) {
    error = fmt::format("max_sats exceeds max_sats_per_envelope ({})",
                        policy.max_sats_per_envelope);
    return false;
  }
  if (exp <= now) {
    error = "exp must be in the future";
    return false;
  }
  auto ttl_ms =
      saturating_mul(policy.max_offer_ttl_seconds, kMillisecondsPerSecond);
  if (exp - now > ttl_ms) {
    error = fmt::format("exp exceeds max_offer_ttl_seconds ({})",
                        policy.max_offer_ttl_seconds);
    return false;
  }
  return true;
}

uint64_t checked_msats(const sats_t sats) {
  return saturating_mul(sats, kMsatsPerSat);
}

/// Whole sats spent for an invoice amount, rounded up, never zero.
sats_t spent_sats_for(const msats_t amount_msats) {
  auto sats = amount_msats / kMsatsPerSat +
              (amount_msats % kMsatsPerSat != 0 ? 1 : 0);
  return std::max<sats_t>(sats, 1);
}

/// ceil(spent * fee_bps / 10000) without forming the full product.
sats_t fee_sats_for(const sats_t spent, const basis_points_t fee_bps) {
  auto whole = spent / kMaxBasisPoints;
  auto remainder = spent % kMaxBasisPoints;
  auto fractional = (remainder * fee_bps + kMaxBasisPoints - 1) /
                    kMaxBasisPoints;
  return whole * fee_bps + fractional;
}

/// Map a failed collaborator call onto the protocol taxonomy.
template <typename T, typename U>
credit_result_t<T> collaborator_failure(const credit_result_t<U>& failure,
                                        const std::string_view stage) {
  if (failure.code == credit_error_code::not_found) {
    return make_failure<T>(credit_error_code::dependency_unavailable,
                           fmt::format("liquidity {} failed: quote not found",
                                       stage),
                           kSettleCodespace);
  }
  return make_failure<T>(failure.code,
                         fmt::format("liquidity {} failed: {}", stage,
                                     failure.log),
                         kSettleCodespace);
}

}  // namespace

namespace credence::execution {

engine::engine(storage_t& storage,
               credence::config::policy_config policy,
               credence::receipts::receipt_signer signer)
    : storage_{storage},
      policy_{std::move(policy)},
      signer_{std::move(signer)},
      invoice_decoder_{credence::lightning::bolt11_amount_msats} {
  spdlog::info("Credit engine ready (receipt signing {})",
               signer_.enabled() ? signer_.public_key_hex() : "disabled");
}

void engine::set_payment_collaborator(payment_collaborator_t payment) {
  payment_ = std::move(payment);
}

void engine::set_attestation_publisher(attestation_publisher_t publisher) {
  attestation_publisher_ = std::move(publisher);
}

void engine::set_invoice_decoder(invoice_decoder_t decoder) {
  invoice_decoder_ = std::move(decoder);
}

void engine::set_clock(clock_fn_t clock) { clock_ = std::move(clock); }

const credence::config::policy_config& engine::policy() const {
  return policy_;
}

const credence::receipts::receipt_signer& engine::signer() const {
  return signer_;
}

timestamp_milliseconds_t engine::now() const {
  if (clock_) {
    return clock_();
  }
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

health_report_t engine::evaluate_health(
    const timestamp_milliseconds_t now) const {
  auto since = credence::health::window_since(now, policy_);
  auto open = storage_.get_global_open_envelope_stats(now);
  auto settlements = storage_.list_recent_settlements(
      since, credence::health::settlement_sample_limit(policy_));
  auto pay_events = storage_.list_recent_liquidity_pay_events(
      since, credence::health::ln_pay_sample_limit(policy_));
  return credence::health::evaluate(
      now,
      credence::health::open_commitments_t{.envelope_count = open.count,
                                           .reserved_sats = open.exposure_sats},
      settlements, pay_events, policy_);
}

credence::underwriting::underwriting_decision_t engine::underwrite(
    const std::string_view agent_id,
    const timestamp_milliseconds_t now) const {
  auto settlements = storage_.list_recent_settlements_for_agent(
      agent_id, credence::underwriting::history_since(now, policy_),
      credence::underwriting::history_sample_limit(policy_));
  auto open = storage_.get_agent_open_envelope_stats(agent_id, now);
  auto stats = credence::underwriting::summarize(now, settlements, open.count,
                                                 open.exposure_sats);
  return credence::underwriting::decide(agent_id, now, stats, policy_);
}

credit_result_t<intent_t> engine::intent(const intent_request_t& request) {
  auto now = this->now();
  auto error = std::string{};
  if (!check_schema(request.schema, kIntentRequestSchemaV1, error)) {
    return invalid<intent_t>(error, kIntentCodespace);
  }
  auto scope_type = check_scope_type(request.scope_type, error);
  if (!scope_type) {
    return invalid<intent_t>(error, kIntentCodespace);
  }
  auto idempotency_key =
      require_text(request.idempotency_key, "idempotency_key", error);
  if (!idempotency_key) {
    return invalid<intent_t>(error, kIntentCodespace);
  }
  auto agent_id = require_pubkey(request.agent_id, "agent_id", error);
  if (!agent_id) {
    return invalid<intent_t>(error, kIntentCodespace);
  }
  auto scope_id = require_text(request.scope_id, "scope_id", error);
  if (!scope_id) {
    return invalid<intent_t>(error, kIntentCodespace);
  }
  if (!check_terms(request.max_sats, request.exp, now, policy_, error)) {
    return invalid<intent_t>(error, kIntentCodespace);
  }

  auto context_sha256 =
      credence::fingerprint::canonical_sha256(request.policy_context);
  auto key_sha256 = credence::crypto::sha256_hex(*idempotency_key);
  if (!context_sha256 || !key_sha256) {
    return internal<intent_t>("failed to hash intent", kIntentCodespace);
  }

  auto fingerprint_input = Json::Value{Json::objectValue};
  fingerprint_input["schema"] = std::string{kIntentRequestSchemaV1};
  fingerprint_input["idempotency_key"] = *idempotency_key;
  fingerprint_input["agent_id"] = *agent_id;
  fingerprint_input["scope_type"] = std::string{to_string(*scope_type)};
  fingerprint_input["scope_id"] = *scope_id;
  fingerprint_input["max_sats"] = to_json_u64(request.max_sats);
  fingerprint_input["exp"] = to_json_time(request.exp);
  fingerprint_input["policy_context_sha256"] = *context_sha256;
  auto fingerprint = credence::fingerprint::canonical_sha256(fingerprint_input);
  if (!fingerprint) {
    return internal<intent_t>("failed to fingerprint intent",
                              kIntentCodespace);
  }

  auto row = intent_t{};
  row.intent_id =
      credence::fingerprint::make_entity_id(kIntentIdPrefix, *key_sha256);
  row.idempotency_key = *idempotency_key;
  row.agent_id = *agent_id;
  row.scope_type = *scope_type;
  row.scope_id = *scope_id;
  row.max_sats = request.max_sats;
  row.exp = request.exp;
  row.created_at = now;

  auto outcome = storage_.create_or_get_intent(row, *fingerprint);
  switch (outcome.status) {
    case credence::storage::store_status::created:
      spdlog::info("Intent {} created for agent {} ({} sats)", row.intent_id,
                   row.agent_id, row.max_sats);
      return make_success(std::move(*outcome.row));
    case credence::storage::store_status::existing:
      return make_success(std::move(*outcome.row));
    case credence::storage::store_status::conflict:
      return make_failure<intent_t>(
          credit_error_code::conflict,
          fmt::format("idempotency_key reused with different parameters ({})",
                      outcome.message),
          kIntentCodespace);
    case credence::storage::store_status::not_found:
      break;
  }
  return internal<intent_t>("unexpected store outcome", kIntentCodespace);
}

credit_result_t<offer_response_t> engine::offer(
    const offer_request_t& request) {
  auto now = this->now();
  auto error = std::string{};
  if (!check_schema(request.schema, kOfferRequestSchemaV1, error)) {
    return invalid<offer_response_t>(error, kOfferCodespace);
  }
  auto scope_type = check_scope_type(request.scope_type, error);
  if (!scope_type) {
    return invalid<offer_response_t>(error, kOfferCodespace);
  }
  auto agent_id = require_pubkey(request.agent_id, "agent_id", error);
  if (!agent_id) {
    return invalid<offer_response_t>(error, kOfferCodespace);
  }
  auto pool_id = require_pubkey(request.pool_id, "pool_id", error);
  if (!pool_id) {
    return invalid<offer_response_t>(error, kOfferCodespace);
  }
  auto scope_id = require_text(request.scope_id, "scope_id", error);
  if (!scope_id) {
    return invalid<offer_response_t>(error, kOfferCodespace);
  }
  if (!check_terms(request.max_sats, request.exp, now, policy_, error)) {
    return invalid<offer_response_t>(error, kOfferCodespace);
  }

  auto intent_id = std::optional<std::string>{};
  if (request.intent_id) {
    intent_id = require_text(*request.intent_id, "intent_id", error);
    if (!intent_id) {
      return invalid<offer_response_t>(error, kOfferCodespace);
    }
    auto bound = storage_.get_intent(*intent_id);
    if (!bound) {
      return make_failure<offer_response_t>(credit_error_code::not_found,
                                            "intent not found",
                                            kOfferCodespace);
    }
    auto mismatch = std::string_view{};
    if (bound->agent_id != *agent_id) {
      mismatch = "agent_id differs";
    } else if (bound->scope_type != *scope_type ||
               bound->scope_id != *scope_id) {
      mismatch = "scope differs";
    } else if (request.max_sats > bound->max_sats) {
      mismatch = "max_sats exceeds intent";
    } else if (request.exp > bound->exp) {
      mismatch = "exp exceeds intent";
    }
    if (!mismatch.empty()) {
      return make_failure<offer_response_t>(
          credit_error_code::conflict,
          fmt::format("intent mismatch: {}", mismatch), kOfferCodespace);
    }
  }

  auto requested = offer_terms_t{.max_sats = request.max_sats,
                                 .fee_bps = request.fee_bps,
                                 .requires_verifier = request.requires_verifier};

  auto fingerprint_input = Json::Value{Json::objectValue};
  fingerprint_input["schema"] = std::string{kOfferRequestSchemaV1};
  fingerprint_input["intent_id"] =
      intent_id ? Json::Value{*intent_id} : Json::Value{};
  fingerprint_input["agent_id"] = *agent_id;
  fingerprint_input["pool_id"] = *pool_id;
  fingerprint_input["scope_type"] = std::string{to_string(*scope_type)};
  fingerprint_input["scope_id"] = *scope_id;
  fingerprint_input["max_sats"] = to_json_u64(requested.max_sats);
  fingerprint_input["fee_bps"] = Json::Value{requested.fee_bps};
  fingerprint_input["requires_verifier"] = requested.requires_verifier;
  fingerprint_input["exp"] = to_json_time(request.exp);
  auto fingerprint = credence::fingerprint::canonical_sha256(fingerprint_input);
  if (!fingerprint) {
    return internal<offer_response_t>("failed to fingerprint offer",
                                      kOfferCodespace);
  }

  auto decision = underwrite(*agent_id, now);

  auto row = offer_t{};
  row.offer_id =
      credence::fingerprint::make_entity_id(kOfferIdPrefix, *fingerprint);
  row.agent_id = *agent_id;
  row.pool_id = *pool_id;
  row.scope_type = *scope_type;
  row.scope_id = *scope_id;
  row.max_sats =
      std::max<sats_t>(1, std::min(requested.max_sats, decision.limit_sats));
  row.fee_bps = decision.fee_bps;
  row.requires_verifier = decision.requires_verifier;
  row.exp = request.exp;
  row.status = offer_status_t::offered;
  row.issued_at = now;

  auto outcome = storage_.create_or_get_offer(row, *fingerprint);
  if (outcome.status == credence::storage::store_status::conflict) {
    return make_failure<offer_response_t>(credit_error_code::conflict,
                                          outcome.message, kOfferCodespace);
  }
  if (outcome.status != credence::storage::store_status::created &&
      outcome.status != credence::storage::store_status::existing) {
    return internal<offer_response_t>("unexpected store outcome",
                                      kOfferCodespace);
  }
  auto stored = std::move(*outcome.row);
  if (outcome.status == credence::storage::store_status::created) {
    spdlog::info(
        "Offer {} issued to agent {}: requested {} sats, granted {} sats at "
        "{} bps",
        stored.offer_id, stored.agent_id, requested.max_sats, stored.max_sats,
        stored.fee_bps);
  }

  record_underwriting_audit(stored, intent_id, decision);

  auto response = offer_response_t{};
  response.requested = requested;
  response.granted = offer_terms_t{.max_sats = stored.max_sats,
                                   .fee_bps = stored.fee_bps,
                                   .requires_verifier = stored.requires_verifier};
  response.offer = std::move(stored);
  return make_success(std::move(response));
}

void engine::record_underwriting_audit(
    const offer_t& offer,
    const std::optional<std::string>& intent_id,
    const credence::underwriting::underwriting_decision_t& decision) {
  auto document = Json::Value{Json::objectValue};
  document["schema"] = std::string{kUnderwritingAuditSchemaV1};
  document["offerId"] = offer.offer_id;
  document["intentId"] = intent_id ? Json::Value{*intent_id} : Json::Value{};
  document["issuedAt"] = to_json_time(offer.issued_at);
  document["inputs"] = decision.audit_inputs;
  auto decided = Json::Value{Json::objectValue};
  decided["limitSats"] = to_json_u64(decision.limit_sats);
  decided["feeBps"] = Json::Value{decision.fee_bps};
  decided["requiresVerifier"] = decision.requires_verifier;
  decided["riskScore"] = decision.risk_score;
  document["decision"] = decided;

  auto digest = credence::fingerprint::canonical_sha256(document);
  if (!digest) {
    spdlog::warn("Skipping underwriting audit for offer {}: hash failed",
                 offer.offer_id);
    return;
  }
  auto audit = underwriting_audit_t{};
  audit.offer_id = offer.offer_id;
  audit.canonical_json_sha256 = *digest;
  audit.audit_json = credence::fingerprint::canonical_json(document);
  audit.created_at = offer.issued_at;
  auto outcome = storage_.put_underwriting_audit(audit);
  if (outcome.status == credence::storage::store_status::conflict) {
    spdlog::debug("Underwriting audit for offer {} already recorded",
                  offer.offer_id);
  }
}

credit_result_t<envelope_response_t> engine::envelope(
    const envelope_request_t& request) {
  auto now = this->now();
  auto error = std::string{};
  if (!check_schema(request.schema, kEnvelopeRequestSchemaV1, error)) {
    return invalid<envelope_response_t>(error, kEnvelopeCodespace);
  }
  auto offer_id = require_text(request.offer_id, "offer_id", error);
  if (!offer_id) {
    return invalid<envelope_response_t>(error, kEnvelopeCodespace);
  }
  auto provider_id = require_pubkey(request.provider_id, "provider_id", error);
  if (!provider_id) {
    return invalid<envelope_response_t>(error, kEnvelopeCodespace);
  }

  auto offer = storage_.get_offer(*offer_id);
  if (!offer) {
    return make_failure<envelope_response_t>(credit_error_code::not_found,
                                             "offer not found",
                                             kEnvelopeCodespace);
  }

  auto fingerprint_input = Json::Value{Json::objectValue};
  fingerprint_input["schema"] = std::string{kEnvelopeRequestSchemaV1};
  fingerprint_input["offer_id"] = *offer_id;
  fingerprint_input["provider_id"] = *provider_id;
  auto fingerprint = credence::fingerprint::canonical_sha256(fingerprint_input);
  if (!fingerprint) {
    return internal<envelope_response_t>("failed to fingerprint envelope",
                                         kEnvelopeCodespace);
  }
  auto envelope_id =
      credence::fingerprint::make_entity_id(kEnvelopeIdPrefix, *fingerprint);

  if (auto existing = storage_.get_envelope(envelope_id)) {
    return issue_receipt(*existing);
  }

  if (offer->status != offer_status_t::offered) {
    return make_failure<envelope_response_t>(credit_error_code::conflict,
                                             "offer is not in offered status",
                                             kEnvelopeCodespace);
  }
  if (offer->exp <= now) {
    return invalid<envelope_response_t>("offer expired", kEnvelopeCodespace);
  }
  if (!offer->requires_verifier) {
    return invalid<envelope_response_t>("offer.requires_verifier must be true",
                                        kEnvelopeCodespace);
  }
  if (offer->max_sats > policy_.max_sats_per_envelope) {
    return invalid<envelope_response_t>(
        fmt::format("offer max_sats exceeds max_sats_per_envelope ({})",
                    policy_.max_sats_per_envelope),
        kEnvelopeCodespace);
  }

  auto health = evaluate_health(now);
  if (health.breakers.halt_new_envelopes) {
    spdlog::warn(
        "Refusing envelope for offer {}: loss rate {:.3f} over {} settlements",
        offer->offer_id, health.loss_rate, health.settlement_sample);
    return make_failure<envelope_response_t>(
        credit_error_code::dependency_unavailable,
        "credit circuit breaker: halt_new_envelopes", kEnvelopeCodespace);
  }

  auto open = storage_.get_agent_open_envelope_stats(offer->agent_id, now);
  if (open.count >= policy_.max_outstanding_envelopes_per_agent) {
    return make_failure<envelope_response_t>(
        credit_error_code::conflict, "max outstanding envelopes exceeded",
        kEnvelopeCodespace);
  }

  auto row = envelope_t{};
  row.envelope_id = envelope_id;
  row.offer_id = offer->offer_id;
  row.agent_id = offer->agent_id;
  row.pool_id = offer->pool_id;
  row.provider_id = *provider_id;
  row.scope_type = offer->scope_type;
  row.scope_id = offer->scope_id;
  row.max_sats = offer->max_sats;
  row.fee_bps = offer->fee_bps;
  row.exp = offer->exp;
  row.status = envelope_status_t::accepted;
  row.issued_at = now;

  auto outcome = storage_.accept_offer(row, *fingerprint);
  switch (outcome.status) {
    case credence::storage::store_status::created:
      spdlog::info("Envelope {} issued on offer {} to provider {} ({} sats)",
                   row.envelope_id, row.offer_id, row.provider_id,
                   row.max_sats);
      return issue_receipt(*outcome.row);
    case credence::storage::store_status::existing:
      return issue_receipt(*outcome.row);
    case credence::storage::store_status::conflict:
      return make_failure<envelope_response_t>(
          credit_error_code::conflict, outcome.message, kEnvelopeCodespace);
    case credence::storage::store_status::not_found:
      return make_failure<envelope_response_t>(
          credit_error_code::not_found, outcome.message, kEnvelopeCodespace);
  }
  return internal<envelope_response_t>("unexpected store outcome",
                                       kEnvelopeCodespace);
}

credit_result_t<envelope_response_t> engine::issue_receipt(
    const envelope_t& envelope) {
  auto receipt = credence::receipts::build_envelope_issue_receipt(envelope,
                                                                  signer_);
  if (!receipt.ok()) {
    return make_failure<envelope_response_t>(receipt.code, receipt.log,
                                             kEnvelopeCodespace);
  }
  auto stored = credence::receipts::make_stored_receipt(
      kEnvelopeEntityKind, envelope.envelope_id, to_json(*receipt.value),
      envelope.issued_at);
  if (!stored.ok()) {
    return make_failure<envelope_response_t>(stored.code, stored.log,
                                             kEnvelopeCodespace);
  }
  auto outcome = storage_.put_receipt(*stored.value);
  if (outcome.status == credence::storage::store_status::conflict) {
    return internal<envelope_response_t>(outcome.message, kEnvelopeCodespace);
  }
  return make_success(envelope_response_t{.envelope = envelope,
                                          .receipt = std::move(*receipt.value)});
}

credit_result_t<settle_response_t> engine::settle(
    const settle_request_t& request) {
  auto now = this->now();
  auto error = std::string{};
  if (!check_schema(request.schema, kSettleRequestSchemaV1, error)) {
    return invalid<settle_response_t>(error, kSettleCodespace);
  }
  auto envelope_id = require_text(request.envelope_id, "envelope_id", error);
  if (!envelope_id) {
    return invalid<settle_response_t>(error, kSettleCodespace);
  }

  if (auto existing = storage_.get_settlement_by_envelope(*envelope_id)) {
    return replay_settlement(*existing);
  }

  auto verification_sha256 = require_text(request.verification_receipt_sha256,
                                          "verification_receipt_sha256", error);
  if (!verification_sha256) {
    return invalid<settle_response_t>(error, kSettleCodespace);
  }

  auto envelope = storage_.get_envelope(*envelope_id);
  if (!envelope) {
    return make_failure<settle_response_t>(credit_error_code::not_found,
                                           "envelope not found",
                                           kSettleCodespace);
  }
  if (envelope->status != envelope_status_t::accepted) {
    return make_failure<settle_response_t>(
        credit_error_code::conflict, "envelope is not in accepted status",
        kSettleCodespace);
  }

  auto invoice = trim(request.provider_invoice);
  auto host = to_lower_ascii(trim(request.provider_host));
  auto invoice_sha256 = credence::crypto::sha256_hex(invoice);
  if (!invoice_sha256) {
    return internal<settle_response_t>("failed to hash provider invoice",
                                       kSettleCodespace);
  }

  auto fingerprint_input = Json::Value{Json::objectValue};
  fingerprint_input["schema"] = std::string{kSettleRequestSchemaV1};
  fingerprint_input["envelope_id"] = *envelope_id;
  fingerprint_input["verification_passed"] = request.verification_passed;
  fingerprint_input["verification_receipt_sha256"] = *verification_sha256;
  fingerprint_input["provider_invoice_hash"] = *invoice_sha256;
  fingerprint_input["provider_host"] = host;
  fingerprint_input["max_fee_msats"] = to_json_u64(request.max_fee_msats);
  auto fingerprint = credence::fingerprint::canonical_sha256(fingerprint_input);
  if (!fingerprint) {
    return internal<settle_response_t>("failed to fingerprint settlement",
                                       kSettleCodespace);
  }

  auto settlement = settlement_t{};
  settlement.settlement_id =
      credence::fingerprint::make_entity_id(kSettlementIdPrefix, *fingerprint);
  settlement.envelope_id = *envelope_id;
  settlement.verification_receipt_sha256 = *verification_sha256;
  settlement.created_at = now;

  if (now > envelope->exp) {
    settlement.outcome = settlement_outcome_t::expired;
    return settle_default(*envelope, std::move(settlement), *fingerprint);
  }
  if (!request.verification_passed) {
    settlement.outcome = settlement_outcome_t::failed;
    return settle_default(*envelope, std::move(settlement), *fingerprint);
  }

  auto normalized = request;
  normalized.provider_invoice = invoice;
  normalized.provider_host = host;
  return settle_payment(*envelope, normalized, std::move(settlement),
                        *fingerprint);
}

credit_result_t<settle_response_t> engine::replay_settlement(
    const settlement_t& settlement) const {
  auto success = settlement.outcome == settlement_outcome_t::success;
  auto schema = success ? kEnvelopeSettlementReceiptSchemaV1
                        : kDefaultNoticeSchemaV1;
  auto stored = storage_.get_receipt(kSettlementEntityKind,
                                     settlement.settlement_id, schema);
  if (!stored) {
    return internal<settle_response_t>(
        fmt::format("receipt for settlement {} is missing",
                    settlement.settlement_id),
        kSettleCodespace);
  }
  auto receipt = try_parse_json(stored->receipt_json);
  if (!receipt) {
    return internal<settle_response_t>(
        fmt::format("receipt for settlement {} is not valid JSON",
                    settlement.settlement_id),
        kSettleCodespace);
  }
  spdlog::debug("Replaying settlement {} for envelope {}",
                settlement.settlement_id, settlement.envelope_id);
  return make_success(settle_response_t{
      .settlement = settlement,
      .envelope_status =
          success ? envelope_status_t::settled : envelope_status_t::defaulted,
      .receipt = std::move(*receipt),
      .replayed = true});
}

credit_result_t<settle_response_t> engine::settle_default(
    const envelope_t& envelope,
    settlement_t settlement,
    const std::string_view fingerprint) {
  settlement.spent_sats = 0;
  settlement.fee_sats = 0;
  auto notice =
      credence::receipts::build_default_notice(envelope, settlement, signer_);
  if (!notice.ok()) {
    return make_failure<settle_response_t>(notice.code, notice.log,
                                           kSettleCodespace);
  }
  auto label = notice.value->label
                   ? std::optional<label_event_t>{notice.value->label
                                                      ->label_event}
                   : std::nullopt;
  return persist_settlement(envelope, settlement, fingerprint,
                            envelope_status_t::defaulted,
                            to_json(*notice.value), label);
}

credit_result_t<settle_response_t> engine::settle_payment(
    const envelope_t& envelope,
    const settle_request_t& request,
    settlement_t settlement,
    const std::string_view fingerprint) {
  if (request.provider_invoice.empty()) {
    return invalid<settle_response_t>("provider_invoice is required",
                                      kSettleCodespace);
  }
  if (request.provider_host.empty()) {
    return invalid<settle_response_t>("provider_host is required",
                                      kSettleCodespace);
  }
  auto amount_msats = invoice_decoder_
                          ? invoice_decoder_(request.provider_invoice)
                          : std::optional<msats_t>{};
  if (!amount_msats || *amount_msats == 0) {
    return invalid<settle_response_t>(
        "provider_invoice must be a bolt11 with amount", kSettleCodespace);
  }
  auto max_amount_msats = checked_msats(envelope.max_sats);
  if (*amount_msats > max_amount_msats) {
    return invalid<settle_response_t>("invoice exceeds envelope max_sats",
                                      kSettleCodespace);
  }
  auto spent = spent_sats_for(*amount_msats);

  auto now = settlement.created_at;
  auto health = evaluate_health(now);
  if (health.breakers.halt_large_settlements &&
      spent > policy_.ln_failure_large_settlement_cap_sats) {
    spdlog::warn(
        "Refusing {} sat settlement of envelope {}: ln failure rate {:.3f} "
        "over {} payments",
        spent, envelope.envelope_id, health.ln_failure_rate,
        health.ln_pay_sample);
    return make_failure<settle_response_t>(
        credit_error_code::dependency_unavailable,
        "credit circuit breaker: halt_large_settlements", kSettleCodespace);
  }

  if (!payment_.quote_pay || !payment_.pay) {
    return make_failure<settle_response_t>(
        credit_error_code::dependency_unavailable,
        "liquidity payment collaborator is not configured", kSettleCodespace);
  }

  auto caller_context = request.policy_context;
  auto policy_context = Json::Value{Json::objectValue};
  policy_context["schema"] = std::string{kPolicyContextSchemaV1};
  policy_context["envelope_id"] = envelope.envelope_id;
  policy_context["agent_id"] = envelope.agent_id;
  policy_context["pool_id"] = envelope.pool_id;
  policy_context["provider_id"] = envelope.provider_id;
  policy_context["scope_type"] = std::string{to_string(envelope.scope_type)};
  policy_context["scope_id"] = envelope.scope_id;
  policy_context["caller_context"] = caller_context;

  auto quote_request = quote_pay_request_t{};
  quote_request.idempotency_key =
      std::string{kQuoteIdempotencyPrefix} +
      std::string{fingerprint.substr(
          0, std::min(fingerprint.size(),
                      credence::fingerprint::kEntityIdDigestChars))};
  quote_request.invoice = request.provider_invoice;
  quote_request.host = request.provider_host;
  quote_request.max_amount_msats = max_amount_msats;
  quote_request.max_fee_msats = request.max_fee_msats;
  quote_request.policy_context = std::move(policy_context);

  auto quote = credit_result_t<quote_pay_response_t>{};
  try {
    quote = payment_.quote_pay(quote_request);
  } catch (const std::exception& ex) {
    spdlog::warn("Liquidity quote for envelope {} threw: {}",
                 envelope.envelope_id, ex.what());
    return make_failure<settle_response_t>(
        credit_error_code::dependency_unavailable,
        fmt::format("liquidity quote failed: {}", ex.what()),
        kSettleCodespace);
  }
  if (!quote.ok()) {
    return collaborator_failure<settle_response_t>(quote, "quote");
  }
  if (!quote.value || quote.value->quote_id.empty()) {
    return internal<settle_response_t>("liquidity quote returned no quote_id",
                                       kSettleCodespace);
  }

  auto paid = credit_result_t<pay_response_t>{};
  try {
    paid = payment_.pay(pay_request_t{.quote_id = quote.value->quote_id});
  } catch (const std::exception& ex) {
    spdlog::warn("Liquidity pay for envelope {} threw: {}",
                 envelope.envelope_id, ex.what());
    return make_failure<settle_response_t>(
        credit_error_code::dependency_unavailable,
        fmt::format("liquidity pay failed: {}", ex.what()), kSettleCodespace);
  }
  if (!paid.ok()) {
    return collaborator_failure<settle_response_t>(paid, "pay");
  }
  if (!paid.value) {
    return internal<settle_response_t>("liquidity pay returned no result",
                                       kSettleCodespace);
  }

  auto event = liquidity_pay_event_t{};
  event.quote_id = paid.value->quote_id.empty() ? quote.value->quote_id
                                                : paid.value->quote_id;
  event.envelope_id = envelope.envelope_id;
  event.status = paid.value->status;
  event.error_code = paid.value->error_code;
  event.amount_msats = *amount_msats;
  event.host = request.provider_host;
  event.created_at = now;
  auto recorded = storage_.put_liquidity_pay_event(event);
  if (recorded.status == credence::storage::store_status::conflict) {
    spdlog::warn("Pay event for quote {} not recorded: {}", event.quote_id,
                 recorded.message);
  }

  if (paid.value->status != kPayStatusSucceeded) {
    spdlog::warn("Liquidity pay for envelope {} returned {}",
                 envelope.envelope_id, paid.value->status);
    auto detail = paid.value->error_code
                      ? fmt::format("{} ({})", paid.value->status,
                                    *paid.value->error_code)
                      : paid.value->status;
    return make_failure<settle_response_t>(
        credit_error_code::dependency_unavailable,
        fmt::format("liquidity pay failed: {}", detail), kSettleCodespace);
  }

  settlement.outcome = settlement_outcome_t::success;
  settlement.spent_sats = spent;
  settlement.fee_sats = fee_sats_for(spent, envelope.fee_bps);
  if (!paid.value->receipt_sha256.empty()) {
    settlement.liquidity_receipt_sha256 = paid.value->receipt_sha256;
  }

  auto receipt = credence::receipts::build_settlement_receipt(
      envelope, settlement, signer_);
  if (!receipt.ok()) {
    return make_failure<settle_response_t>(receipt.code, receipt.log,
                                           kSettleCodespace);
  }
  auto label = receipt.value->label
                   ? std::optional<label_event_t>{receipt.value->label
                                                      ->label_event}
                   : std::nullopt;
  return persist_settlement(envelope, settlement, fingerprint,
                            envelope_status_t::settled,
                            to_json(*receipt.value), label);
}

credit_result_t<settle_response_t> engine::persist_settlement(
    const envelope_t& envelope,
    const settlement_t& settlement,
    const std::string_view fingerprint,
    const envelope_status_t envelope_status,
    const Json::Value& receipt,
    const std::optional<label_event_t>& label) {
  auto stored = credence::receipts::make_stored_receipt(
      kSettlementEntityKind, settlement.settlement_id, receipt,
      settlement.created_at);
  if (!stored.ok()) {
    return make_failure<settle_response_t>(stored.code, stored.log,
                                           kSettleCodespace);
  }

  auto outcome = storage_.record_settlement(settlement, fingerprint,
                                            envelope_status, *stored.value);
  switch (outcome.status) {
    case credence::storage::store_status::created:
      break;
    case credence::storage::store_status::existing:
      return replay_settlement(*outcome.row);
    case credence::storage::store_status::conflict:
      if (outcome.row) {
        return replay_settlement(*outcome.row);
      }
      return make_failure<settle_response_t>(
          credit_error_code::conflict, outcome.message, kSettleCodespace);
    case credence::storage::store_status::not_found:
      return make_failure<settle_response_t>(
          credit_error_code::not_found, outcome.message, kSettleCodespace);
  }

  spdlog::info("Envelope {} settled: {} (spent {} sats, fee {} sats)",
               envelope.envelope_id, to_string(settlement.outcome),
               settlement.spent_sats, settlement.fee_sats);
  if (label) {
    publish_attestation(*label);
  }
  return make_success(settle_response_t{.settlement = settlement,
                                        .envelope_status = envelope_status,
                                        .receipt = receipt,
                                        .replayed = false});
}

void engine::publish_attestation(const label_event_t& event) const {
  if (!attestation_publisher_) {
    return;
  }
  try {
    attestation_publisher_(event);
  } catch (const std::exception& ex) {
    spdlog::warn("Attestation {} not published: {}", event.id, ex.what());
  }
}

credit_result_t<health_report_t> engine::health() const {
  auto report = evaluate_health(now());
  if (report.breakers.halt_new_envelopes ||
      report.breakers.halt_large_settlements) {
    spdlog::warn("Credit breakers: halt_new_envelopes={} "
                 "halt_large_settlements={}",
                 report.breakers.halt_new_envelopes,
                 report.breakers.halt_large_settlements);
  }
  return make_success(std::move(report));
}

credit_result_t<agent_exposure_t> engine::agent_exposure(
    const std::string_view agent_id) const {
  auto error = std::string{};
  auto normalized = require_pubkey(agent_id, "agent_id", error);
  if (!normalized) {
    return invalid<agent_exposure_t>(error, kExposureCodespace);
  }
  auto now = this->now();
  auto decision = underwrite(*normalized, now);

  auto exposure = agent_exposure_t{};
  exposure.agent_id = *normalized;
  exposure.open_envelope_count = decision.stats.open_envelope_count;
  exposure.open_exposure_sats = decision.stats.open_exposure_sats;
  exposure.settled_count = decision.stats.settled_count;
  exposure.success_volume_sats = decision.stats.success_volume_sats;
  exposure.pass_rate = decision.stats.pass_rate;
  exposure.loss_count = decision.stats.loss_count;
  exposure.underwriting_limit_sats = decision.limit_sats;
  exposure.underwriting_fee_bps = decision.fee_bps;
  exposure.requires_verifier = decision.requires_verifier;
  exposure.computed_at = now;
  return make_success(std::move(exposure));
}

}  // namespace credence::execution
