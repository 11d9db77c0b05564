#pragma once
#include <credence/schema/primitives.hpp>

#include <string>
#include <vector>

namespace credence::schema {

inline constexpr auto kLabelEventKind = uint16_t{1985};

/// Public label in the NIP-32 layout pointing at a settlement outcome. `id`
/// is the SHA-256 of the NIP-01 serialization; `sig` is an Ed25519 signature
/// over the raw id bytes by the receipt key in `pubkey`. Not relay-valid.
struct label_event_t final {
  std::string id;
  std::string pubkey;
  uint64_t created_at{};
  uint16_t kind{kLabelEventKind};
  std::vector<std::vector<std::string>> tags;
  std::string content;
  std::string sig;
};

}  // namespace credence::schema
