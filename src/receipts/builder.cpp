#include <credence/fingerprint/canonical.hpp>
#include <credence/receipts/builder.hpp>
#include <credence/receipts/label_event.hpp>
#include <credence/schema/json.hpp>
#include <credence/schema/schemas.hpp>

namespace credence::receipts {

using namespace credence::schema;

namespace {

inline constexpr auto kCodespace = std::string_view{"credence.receipts"};

template <typename T>
credit_result_t<T> hash_failure() {
  return make_failure<T>(credit_error_code::internal,
                         "failed to hash receipt", kCodespace);
}

void put_envelope_parties(Json::Value& input, const envelope_t& envelope) {
  input["envelope_id"] = envelope.envelope_id;
  input["agent_id"] = envelope.agent_id;
  input["pool_id"] = envelope.pool_id;
  input["provider_id"] = envelope.provider_id;
  input["scope_type"] = std::string{to_string(envelope.scope_type)};
  input["scope_id"] = envelope.scope_id;
}

std::optional<label_reference_t> make_label_reference(
    const envelope_t& envelope,
    const settlement_t& settlement,
    const receipt_signer& signer) {
  auto event = build_label_event(
      signer,
      label_subject_t{
          .success = settlement.outcome == settlement_outcome_t::success,
          .agent_id = envelope.agent_id,
          .provider_id = envelope.provider_id,
          .envelope_id = envelope.envelope_id,
          .scope_id = envelope.scope_id,
          .created_at_seconds = settlement.created_at / kMillisecondsPerSecond});
  if (!event) {
    return std::nullopt;
  }
  auto event_sha256 = credence::fingerprint::canonical_sha256(to_json(*event));
  if (!event_sha256) {
    return std::nullopt;
  }
  return label_reference_t{.label_event_id = event->id,
                           .label_event_sha256 = *event_sha256,
                           .label_event = *event};
}

void put_label_hash_input(Json::Value& input,
                          const std::optional<label_reference_t>& label) {
  input["label_event_id"] =
      label ? Json::Value{label->label_event_id} : Json::Value{};
  input["label_event_sha256"] =
      label ? Json::Value{label->label_event_sha256} : Json::Value{};
}

}  // namespace

credit_result_t<envelope_issue_receipt_t> build_envelope_issue_receipt(
    const envelope_t& envelope,
    const receipt_signer& signer) {
  auto input = Json::Value{Json::objectValue};
  input["schema"] = std::string{kEnvelopeIssueReceiptSchemaV1};
  input["offer_id"] = envelope.offer_id;
  put_envelope_parties(input, envelope);
  input["max_sats"] = to_json_u64(envelope.max_sats);
  input["fee_bps"] = Json::Value{envelope.fee_bps};
  input["exp"] = to_json_time(envelope.exp);
  input["issued_at"] = to_json_time(envelope.issued_at);

  auto digest = credence::fingerprint::canonical_sha256(input);
  if (!digest) {
    return hash_failure<envelope_issue_receipt_t>();
  }
  auto signature = signer.sign_digest(*digest);
  if (!signature.ok()) {
    return forward_failure<envelope_issue_receipt_t>(signature);
  }

  auto receipt = envelope_issue_receipt_t{};
  receipt.schema = std::string{kEnvelopeIssueReceiptSchemaV1};
  receipt.receipt_id = credence::fingerprint::make_entity_id(
      kEnvelopeIssueReceiptIdPrefix, *digest);
  receipt.offer_id = envelope.offer_id;
  receipt.envelope_id = envelope.envelope_id;
  receipt.agent_id = envelope.agent_id;
  receipt.pool_id = envelope.pool_id;
  receipt.provider_id = envelope.provider_id;
  receipt.scope_type = envelope.scope_type;
  receipt.scope_id = envelope.scope_id;
  receipt.max_sats = envelope.max_sats;
  receipt.fee_bps = envelope.fee_bps;
  receipt.exp = envelope.exp;
  receipt.issued_at = envelope.issued_at;
  receipt.canonical_json_sha256 = *digest;
  receipt.signature = std::move(*signature.value);
  return make_success(std::move(receipt));
}

credit_result_t<settlement_receipt_t> build_settlement_receipt(
    const envelope_t& envelope,
    const settlement_t& settlement,
    const receipt_signer& signer) {
  auto label = make_label_reference(envelope, settlement, signer);
  auto liquidity_sha256 = settlement.liquidity_receipt_sha256.value_or("");

  auto input = Json::Value{Json::objectValue};
  input["schema"] = std::string{kEnvelopeSettlementReceiptSchemaV1};
  put_envelope_parties(input, envelope);
  input["outcome"] = std::string{to_string(settlement.outcome)};
  input["spent_sats"] = to_json_u64(settlement.spent_sats);
  input["fee_sats"] = to_json_u64(settlement.fee_sats);
  input["verification_receipt_sha256"] = settlement.verification_receipt_sha256;
  input["liquidity_receipt_sha256"] = liquidity_sha256;
  put_label_hash_input(input, label);
  input["created_at"] = to_json_time(settlement.created_at);

  auto digest = credence::fingerprint::canonical_sha256(input);
  if (!digest) {
    return hash_failure<settlement_receipt_t>();
  }
  auto signature = signer.sign_digest(*digest);
  if (!signature.ok()) {
    return forward_failure<settlement_receipt_t>(signature);
  }

  auto receipt = settlement_receipt_t{};
  receipt.schema = std::string{kEnvelopeSettlementReceiptSchemaV1};
  receipt.receipt_id = credence::fingerprint::make_entity_id(
      kSettlementReceiptIdPrefix, *digest);
  receipt.envelope_id = envelope.envelope_id;
  receipt.agent_id = envelope.agent_id;
  receipt.pool_id = envelope.pool_id;
  receipt.provider_id = envelope.provider_id;
  receipt.scope_type = envelope.scope_type;
  receipt.scope_id = envelope.scope_id;
  receipt.outcome = settlement.outcome;
  receipt.spent_sats = settlement.spent_sats;
  receipt.fee_sats = settlement.fee_sats;
  receipt.verification_receipt_sha256 = settlement.verification_receipt_sha256;
  receipt.liquidity_receipt_sha256 = liquidity_sha256;
  receipt.label = std::move(label);
  receipt.created_at = settlement.created_at;
  receipt.canonical_json_sha256 = *digest;
  receipt.signature = std::move(*signature.value);
  return make_success(std::move(receipt));
}

credit_result_t<default_notice_t> build_default_notice(
    const envelope_t& envelope,
    const settlement_t& settlement,
    const receipt_signer& signer) {
  auto reason = settlement.outcome == settlement_outcome_t::expired
                    ? default_reason_t::expired
                    : default_reason_t::verification_failed;
  auto label = make_label_reference(envelope, settlement, signer);
  auto verification_sha256 =
      settlement.verification_receipt_sha256.empty()
          ? std::optional<std::string>{}
          : std::optional<std::string>{settlement.verification_receipt_sha256};

  auto input = Json::Value{Json::objectValue};
  input["schema"] = std::string{kDefaultNoticeSchemaV1};
  input["settlement_id"] = settlement.settlement_id;
  put_envelope_parties(input, envelope);
  input["reason"] = std::string{to_string(reason)};
  input["loss_sats"] = to_json_u64(0);
  input["verification_receipt_sha256"] =
      verification_sha256 ? Json::Value{*verification_sha256} : Json::Value{};
  put_label_hash_input(input, label);
  input["created_at"] = to_json_time(settlement.created_at);

  auto digest = credence::fingerprint::canonical_sha256(input);
  if (!digest) {
    return hash_failure<default_notice_t>();
  }
  auto signature = signer.sign_digest(*digest);
  if (!signature.ok()) {
    return forward_failure<default_notice_t>(signature);
  }

  auto notice = default_notice_t{};
  notice.schema = std::string{kDefaultNoticeSchemaV1};
  notice.receipt_id =
      credence::fingerprint::make_entity_id(kDefaultNoticeIdPrefix, *digest);
  notice.settlement_id = settlement.settlement_id;
  notice.envelope_id = envelope.envelope_id;
  notice.agent_id = envelope.agent_id;
  notice.pool_id = envelope.pool_id;
  notice.provider_id = envelope.provider_id;
  notice.scope_type = envelope.scope_type;
  notice.scope_id = envelope.scope_id;
  notice.reason = reason;
  notice.loss_sats = 0;
  notice.verification_receipt_sha256 = std::move(verification_sha256);
  notice.label = std::move(label);
  notice.created_at = settlement.created_at;
  notice.canonical_json_sha256 = *digest;
  notice.signature = std::move(*signature.value);
  return make_success(std::move(notice));
}

credit_result_t<stored_receipt_t> make_stored_receipt(
    const std::string_view entity_kind,
    const std::string_view entity_id,
    const Json::Value& receipt,
    const timestamp_milliseconds_t created_at) {
  const auto& receipt_id = receipt["receipt_id"];
  const auto& schema = receipt["schema"];
  const auto& digest = receipt["canonical_json_sha256"];
  if (!receipt_id.isString() || !schema.isString() || !digest.isString() ||
      receipt_id.asString().empty() || schema.asString().empty() ||
      digest.asString().empty()) {
    return make_failure<stored_receipt_t>(
        credit_error_code::internal,
        "receipt missing receipt_id/schema/canonical_json_sha256", kCodespace);
  }

  auto stored = stored_receipt_t{};
  stored.receipt_id = receipt_id.asString();
  stored.entity_kind = std::string{entity_kind};
  stored.entity_id = std::string{entity_id};
  stored.schema = schema.asString();
  stored.canonical_json_sha256 = digest.asString();
  if (receipt.isMember("signature") && !receipt["signature"].isNull()) {
    stored.signature_json =
        credence::fingerprint::canonical_json(receipt["signature"]);
  }
  stored.receipt_json = credence::fingerprint::canonical_json(receipt);
  stored.created_at = created_at;
  return make_success(std::move(stored));
}

}  // namespace credence::receipts
