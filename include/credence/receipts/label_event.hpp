#pragma once

#include <credence/receipts/signer.hpp>
#include <credence/schema/label_event.hpp>

#include <json/value.h>

#include <optional>
#include <string>
#include <string_view>

namespace credence::receipts {

struct label_subject_t final {
  bool success{};
  std::string_view agent_id;
  std::string_view provider_id;
  std::string_view envelope_id;
  std::string_view scope_id;
  uint64_t created_at_seconds{};
};

/// Build and sign the public success/default label for an envelope. Returns
/// std::nullopt when the signer is disabled or signing fails; the label is
/// never required for a settlement to complete.
///
/// The event is Nostr-shaped (NIP-01 id, NIP-32 tags) but `pubkey` and `sig`
/// are the receipt signer's Ed25519 key and signature, not a BIP-340
/// secp256k1 pair. Relays will reject it; check it with verify_label_event.
std::optional<credence::schema::label_event_t> build_label_event(
    const receipt_signer& signer,
    const label_subject_t& subject);

/// NIP-01 serialization `[0, pubkey, created_at, kind, tags, content]`.
std::string serialize_for_id(const credence::schema::label_event_t& event);

/// Recompute the id and check the Ed25519 `sig` against `pubkey`.
bool verify_label_event(const credence::schema::label_event_t& event);

}  // namespace credence::receipts
