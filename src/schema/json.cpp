#include <credence/schema/json.hpp>

#include <json/reader.h>

#include <memory>
#include <string>

namespace credence::schema {

namespace {

void put_signature(Json::Value& out,
                   const std::optional<receipt_signature_t>& signature) {
  if (signature) {
    out["signature"] = to_json(*signature);
  }
}

void put_label(Json::Value& out, const std::optional<label_reference_t>& label) {
  if (label) {
    out["label_event_id"] = label->label_event_id;
    out["label_event_sha256"] = label->label_event_sha256;
    out["label_event"] = to_json(label->label_event);
  }
}

void put_parties(Json::Value& out,
                 const std::string& envelope_id,
                 const std::string& agent_id,
                 const std::string& pool_id,
                 const std::string& provider_id,
                 const scope_type_t scope_type,
                 const std::string& scope_id) {
  out["envelope_id"] = envelope_id;
  out["agent_id"] = agent_id;
  out["pool_id"] = pool_id;
  out["provider_id"] = provider_id;
  out["scope_type"] = std::string{to_string(scope_type)};
  out["scope_id"] = scope_id;
}

std::optional<std::string> string_member(const Json::Value& value,
                                         const char* name) {
  const auto& member = value[name];
  if (!member.isString()) {
    return std::nullopt;
  }
  return member.asString();
}

}  // namespace

Json::Value to_json_u64(const uint64_t value) {
  return Json::Value{static_cast<Json::UInt64>(value)};
}

Json::Value to_json_time(const timestamp_milliseconds_t value) {
  return Json::Value{format_rfc3339(value)};
}

Json::Value to_json(const intent_t& intent) {
  auto out = Json::Value{Json::objectValue};
  out["intent_id"] = intent.intent_id;
  out["idempotency_key"] = intent.idempotency_key;
  out["agent_id"] = intent.agent_id;
  out["scope_type"] = std::string{to_string(intent.scope_type)};
  out["scope_id"] = intent.scope_id;
  out["max_sats"] = to_json_u64(intent.max_sats);
  out["exp"] = to_json_time(intent.exp);
  out["created_at"] = to_json_time(intent.created_at);
  return out;
}

Json::Value to_json(const offer_terms_t& terms) {
  auto out = Json::Value{Json::objectValue};
  out["max_sats"] = to_json_u64(terms.max_sats);
  out["fee_bps"] = Json::Value{terms.fee_bps};
  out["requires_verifier"] = terms.requires_verifier;
  return out;
}

Json::Value to_json(const offer_t& offer) {
  auto out = Json::Value{Json::objectValue};
  out["offer_id"] = offer.offer_id;
  out["agent_id"] = offer.agent_id;
  out["pool_id"] = offer.pool_id;
  out["scope_type"] = std::string{to_string(offer.scope_type)};
  out["scope_id"] = offer.scope_id;
  out["max_sats"] = to_json_u64(offer.max_sats);
  out["fee_bps"] = Json::Value{offer.fee_bps};
  out["requires_verifier"] = offer.requires_verifier;
  out["exp"] = to_json_time(offer.exp);
  out["status"] = std::string{to_string(offer.status)};
  out["issued_at"] = to_json_time(offer.issued_at);
  return out;
}

Json::Value to_json(const offer_response_t& response) {
  auto out = Json::Value{Json::objectValue};
  out["offer"] = to_json(response.offer);
  out["requested"] = to_json(response.requested);
  out["granted"] = to_json(response.granted);
  return out;
}

Json::Value to_json(const envelope_t& envelope) {
  auto out = Json::Value{Json::objectValue};
  put_parties(out, envelope.envelope_id, envelope.agent_id, envelope.pool_id,
              envelope.provider_id, envelope.scope_type, envelope.scope_id);
  out["offer_id"] = envelope.offer_id;
  out["max_sats"] = to_json_u64(envelope.max_sats);
  out["fee_bps"] = Json::Value{envelope.fee_bps};
  out["exp"] = to_json_time(envelope.exp);
  out["status"] = std::string{to_string(envelope.status)};
  out["issued_at"] = to_json_time(envelope.issued_at);
  return out;
}

Json::Value to_json(const envelope_response_t& response) {
  auto out = Json::Value{Json::objectValue};
  out["envelope"] = to_json(response.envelope);
  out["receipt"] = to_json(response.receipt);
  return out;
}

Json::Value to_json(const settlement_t& settlement) {
  auto out = Json::Value{Json::objectValue};
  out["settlement_id"] = settlement.settlement_id;
  out["envelope_id"] = settlement.envelope_id;
  out["outcome"] = std::string{to_string(settlement.outcome)};
  out["spent_sats"] = to_json_u64(settlement.spent_sats);
  out["fee_sats"] = to_json_u64(settlement.fee_sats);
  out["verification_receipt_sha256"] = settlement.verification_receipt_sha256;
  if (settlement.liquidity_receipt_sha256) {
    out["liquidity_receipt_sha256"] = *settlement.liquidity_receipt_sha256;
  }
  out["created_at"] = to_json_time(settlement.created_at);
  return out;
}

Json::Value to_json(const settle_response_t& response) {
  auto out = to_json(response.settlement);
  out["envelope_status"] = std::string{to_string(response.envelope_status)};
  out["receipt"] = response.receipt;
  out["replayed"] = response.replayed;
  return out;
}

Json::Value to_json(const receipt_signature_t& signature) {
  auto out = Json::Value{Json::objectValue};
  out["schema"] = signature.schema;
  out["scheme"] = signature.scheme;
  out["signer"] = signature.signer;
  out["signed_sha256"] = signature.signed_sha256;
  out["signature_hex"] = signature.signature_hex;
  return out;
}

Json::Value to_json(const label_event_t& event) {
  auto out = Json::Value{Json::objectValue};
  out["id"] = event.id;
  out["pubkey"] = event.pubkey;
  out["created_at"] = to_json_u64(event.created_at);
  out["kind"] = Json::Value{static_cast<Json::UInt>(event.kind)};
  auto tags = Json::Value{Json::arrayValue};
  for (const auto& tag : event.tags) {
    auto entry = Json::Value{Json::arrayValue};
    for (const auto& part : tag) {
      entry.append(part);
    }
    tags.append(entry);
  }
  out["tags"] = tags;
  out["content"] = event.content;
  out["sig"] = event.sig;
  return out;
}

Json::Value to_json(const envelope_issue_receipt_t& receipt) {
  auto out = Json::Value{Json::objectValue};
  out["schema"] = receipt.schema;
  out["receipt_id"] = receipt.receipt_id;
  out["offer_id"] = receipt.offer_id;
  put_parties(out, receipt.envelope_id, receipt.agent_id, receipt.pool_id,
              receipt.provider_id, receipt.scope_type, receipt.scope_id);
  out["max_sats"] = to_json_u64(receipt.max_sats);
  out["fee_bps"] = Json::Value{receipt.fee_bps};
  out["exp"] = to_json_time(receipt.exp);
  out["issued_at"] = to_json_time(receipt.issued_at);
  out["canonical_json_sha256"] = receipt.canonical_json_sha256;
  put_signature(out, receipt.signature);
  return out;
}

Json::Value to_json(const settlement_receipt_t& receipt) {
  auto out = Json::Value{Json::objectValue};
  out["schema"] = receipt.schema;
  out["receipt_id"] = receipt.receipt_id;
  put_parties(out, receipt.envelope_id, receipt.agent_id, receipt.pool_id,
              receipt.provider_id, receipt.scope_type, receipt.scope_id);
  out["outcome"] = std::string{to_string(receipt.outcome)};
  out["spent_sats"] = to_json_u64(receipt.spent_sats);
  out["fee_sats"] = to_json_u64(receipt.fee_sats);
  out["verification_receipt_sha256"] = receipt.verification_receipt_sha256;
  out["liquidity_receipt_sha256"] = receipt.liquidity_receipt_sha256;
  put_label(out, receipt.label);
  out["created_at"] = to_json_time(receipt.created_at);
  out["canonical_json_sha256"] = receipt.canonical_json_sha256;
  put_signature(out, receipt.signature);
  return out;
}

Json::Value to_json(const default_notice_t& notice) {
  auto out = Json::Value{Json::objectValue};
  out["schema"] = notice.schema;
  out["receipt_id"] = notice.receipt_id;
  out["settlement_id"] = notice.settlement_id;
  put_parties(out, notice.envelope_id, notice.agent_id, notice.pool_id,
              notice.provider_id, notice.scope_type, notice.scope_id);
  out["reason"] = std::string{to_string(notice.reason)};
  out["loss_sats"] = to_json_u64(notice.loss_sats);
  if (notice.verification_receipt_sha256) {
    out["verification_receipt_sha256"] = *notice.verification_receipt_sha256;
  }
  put_label(out, notice.label);
  out["created_at"] = to_json_time(notice.created_at);
  out["canonical_json_sha256"] = notice.canonical_json_sha256;
  put_signature(out, notice.signature);
  return out;
}

Json::Value to_json(const liquidity_pay_event_t& event) {
  auto out = Json::Value{Json::objectValue};
  out["quote_id"] = event.quote_id;
  out["envelope_id"] = event.envelope_id;
  out["status"] = event.status;
  if (event.error_code) {
    out["error_code"] = *event.error_code;
  }
  out["amount_msats"] = to_json_u64(event.amount_msats);
  out["host"] = event.host;
  out["created_at"] = to_json_time(event.created_at);
  return out;
}

Json::Value to_json(const health_report_t& report) {
  auto out = Json::Value{Json::objectValue};
  out["generated_at"] = to_json_time(report.generated_at);
  out["open_envelope_count"] = to_json_u64(report.open_envelope_count);
  out["open_reserved_commitments_sats"] =
      to_json_u64(report.open_reserved_commitments_sats);
  out["settlement_sample"] = to_json_u64(report.settlement_sample);
  out["loss_count"] = to_json_u64(report.loss_count);
  out["loss_rate"] = report.loss_rate;
  out["ln_pay_sample"] = to_json_u64(report.ln_pay_sample);
  out["ln_fail_count"] = to_json_u64(report.ln_fail_count);
  out["ln_failure_rate"] = report.ln_failure_rate;
  auto breakers = Json::Value{Json::objectValue};
  breakers["halt_new_envelopes"] = report.breakers.halt_new_envelopes;
  breakers["halt_large_settlements"] = report.breakers.halt_large_settlements;
  out["breakers"] = breakers;
  out["policy"] = to_json(report.policy);
  return out;
}

Json::Value to_json(const agent_exposure_t& exposure) {
  auto out = Json::Value{Json::objectValue};
  out["agent_id"] = exposure.agent_id;
  out["open_envelope_count"] = to_json_u64(exposure.open_envelope_count);
  out["open_exposure_sats"] = to_json_u64(exposure.open_exposure_sats);
  out["settled_count"] = to_json_u64(exposure.settled_count);
  out["success_volume_sats"] = to_json_u64(exposure.success_volume_sats);
  out["pass_rate"] = exposure.pass_rate;
  out["loss_count"] = to_json_u64(exposure.loss_count);
  out["underwriting_limit_sats"] =
      to_json_u64(exposure.underwriting_limit_sats);
  out["underwriting_fee_bps"] = Json::Value{exposure.underwriting_fee_bps};
  out["requires_verifier"] = exposure.requires_verifier;
  out["computed_at"] = to_json_time(exposure.computed_at);
  return out;
}

Json::Value to_json(const credence::config::policy_config& policy) {
  auto out = Json::Value{Json::objectValue};
  out["max_sats_per_envelope"] = to_json_u64(policy.max_sats_per_envelope);
  out["max_outstanding_envelopes_per_agent"] =
      to_json_u64(policy.max_outstanding_envelopes_per_agent);
  out["max_offer_ttl_seconds"] = to_json_u64(policy.max_offer_ttl_seconds);
  out["underwriting_history_days"] =
      Json::Value{policy.underwriting_history_days};
  out["underwriting_base_sats"] = to_json_u64(policy.underwriting_base_sats);
  out["underwriting_k"] = policy.underwriting_k;
  out["underwriting_default_penalty_multiplier"] =
      policy.underwriting_default_penalty_multiplier;
  out["min_fee_bps"] = Json::Value{policy.min_fee_bps};
  out["max_fee_bps"] = Json::Value{policy.max_fee_bps};
  out["fee_risk_scaler"] = policy.fee_risk_scaler;
  out["health_window_seconds"] = to_json_u64(policy.health_window_seconds);
  out["health_settlement_sample_limit"] =
      Json::Value{policy.health_settlement_sample_limit};
  out["health_ln_pay_sample_limit"] =
      Json::Value{policy.health_ln_pay_sample_limit};
  out["circuit_breaker_min_sample"] =
      to_json_u64(policy.circuit_breaker_min_sample);
  out["loss_rate_halt_threshold"] = policy.loss_rate_halt_threshold;
  out["ln_failure_rate_halt_threshold"] = policy.ln_failure_rate_halt_threshold;
  out["ln_failure_large_settlement_cap_sats"] =
      to_json_u64(policy.ln_failure_large_settlement_cap_sats);
  return out;
}

std::optional<receipt_signature_t> try_signature_from_json(
    const Json::Value& value) {
  if (!value.isObject()) {
    return std::nullopt;
  }
  auto schema = string_member(value, "schema");
  auto scheme = string_member(value, "scheme");
  auto signer = string_member(value, "signer");
  auto signed_sha256 = string_member(value, "signed_sha256");
  auto signature_hex = string_member(value, "signature_hex");
  if (!schema || !scheme || !signer || !signed_sha256 || !signature_hex) {
    return std::nullopt;
  }
  return receipt_signature_t{.schema = *schema,
                             .scheme = *scheme,
                             .signer = *signer,
                             .signed_sha256 = *signed_sha256,
                             .signature_hex = *signature_hex};
}

std::optional<Json::Value> try_parse_json(const std::string_view text) {
  auto builder = Json::CharReaderBuilder{};
  auto reader = std::unique_ptr<Json::CharReader>{builder.newCharReader()};
  auto value = Json::Value{};
  auto errors = std::string{};
  if (!reader->parse(text.data(), text.data() + text.size(), &value,
                     &errors)) {
    return std::nullopt;
  }
  return value;
}

}  // namespace credence::schema
