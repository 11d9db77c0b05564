#include <credence/crypto/sha256.hpp>
#include <credence/crypto/verify.hpp>
#include <credence/fingerprint/canonical.hpp>
#include <credence/receipts/label_event.hpp>
#include <credence/schema/json.hpp>
#include <credence/schema/schemas.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace credence::receipts {

namespace {

inline constexpr auto kSuccessLabel = std::string_view{"success"};
inline constexpr auto kDefaultLabel = std::string_view{"default"};

std::vector<std::vector<std::string>> make_tags(
    const label_subject_t& subject) {
  auto label_namespace = std::string{credence::schema::kLabelNamespace};
  auto value = std::string{subject.success ? kSuccessLabel : kDefaultLabel};
  auto topic = label_namespace + ":scope:" + std::string{subject.scope_id};
  return {{"L", label_namespace},
          {"l", value, label_namespace},
          {"p", std::string{subject.agent_id}},
          {"p", std::string{subject.provider_id}},
          {"t", topic}};
}

}  // namespace

std::string serialize_for_id(const credence::schema::label_event_t& event) {
  auto rendered = credence::schema::to_json(event);
  auto payload = Json::Value{Json::arrayValue};
  payload.append(Json::Value{0});
  payload.append(rendered["pubkey"]);
  payload.append(rendered["created_at"]);
  payload.append(rendered["kind"]);
  payload.append(rendered["tags"]);
  payload.append(rendered["content"]);
  return credence::fingerprint::canonical_json(payload);
}

std::optional<credence::schema::label_event_t> build_label_event(
    const receipt_signer& signer,
    const label_subject_t& subject) {
  if (!signer.enabled()) {
    return std::nullopt;
  }
  if (subject.agent_id.empty() || subject.provider_id.empty() ||
      subject.scope_id.empty()) {
    spdlog::warn("Skipping label event for envelope {}: missing subject",
                 subject.envelope_id);
    return std::nullopt;
  }

  auto event = credence::schema::label_event_t{};
  event.pubkey = signer.public_key_hex();
  event.created_at = subject.created_at_seconds;
  event.tags = make_tags(subject);
  event.content = "envelope=" + std::string{subject.envelope_id} +
                  " scope=" + std::string{subject.scope_id};

  auto id = credence::crypto::sha256(
      credence::schema::make_bytes_view(serialize_for_id(event)));
  if (!id) {
    spdlog::warn("Failed to hash label event for envelope {}",
                 subject.envelope_id);
    return std::nullopt;
  }
  auto signature = signer.sign_bytes(*id);
  if (!signature) {
    spdlog::warn("Failed to sign label event for envelope {}",
                 subject.envelope_id);
    return std::nullopt;
  }
  event.id = credence::schema::to_hex(*id);
  event.sig = credence::schema::to_hex(*signature);
  return event;
}

bool verify_label_event(const credence::schema::label_event_t& event) {
  auto id = credence::crypto::sha256(
      credence::schema::make_bytes_view(serialize_for_id(event)));
  if (!id || credence::schema::to_hex(*id) != event.id) {
    return false;
  }
  auto pubkey = credence::schema::try_make_hash32(event.pubkey);
  auto signature = credence::schema::try_from_hex(event.sig);
  if (!pubkey || !signature ||
      signature->size() != credence::schema::ed25519_signature_t{}.size()) {
    return false;
  }
  auto fixed = credence::schema::ed25519_signature_t{};
  std::ranges::copy(*signature, fixed.begin());
  return credence::crypto::verify_signature(*id, *pubkey, fixed);
}

}  // namespace credence::receipts
