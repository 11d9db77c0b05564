#pragma once

#include <credence/schema/credit_result.hpp>
#include <credence/schema/primitives.hpp>
#include <credence/schema/receipt.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace credence::receipts {

/// Holds the optional process-wide receipt key. A default-constructed signer
/// is disabled and produces unsigned receipts.
class receipt_signer final {
 public:
  receipt_signer() = default;

  static std::optional<receipt_signer> from_secret_key(
      const credence::schema::ed25519_secret_key_t& secret_key);

  /// Accepts 64 hex characters, with or without a `0x` prefix.
  static std::optional<receipt_signer> from_secret_hex(std::string_view hex);

  bool enabled() const;
  const credence::schema::ed25519_public_key_t& public_key() const;
  std::string public_key_hex() const;

  /// Sign the 32 raw bytes behind a hex SHA-256 digest. The value is
  /// std::nullopt when the signer is disabled.
  credence::schema::credit_result_t<
      std::optional<credence::schema::receipt_signature_t>>
  sign_digest(std::string_view sha256_hex) const;

  std::optional<credence::schema::ed25519_signature_t> sign_bytes(
      const credence::schema::bytes_view_t& message) const;

 private:
  std::optional<credence::schema::ed25519_secret_key_t> secret_key_;
  credence::schema::ed25519_public_key_t public_key_{};
};

/// Check a detached receipt signature on its own, with no engine state.
bool verify_receipt_signature(
    const credence::schema::receipt_signature_t& signature);

/// As above, and also require that it covers `expected_sha256`.
bool verify_receipt_signature(
    const credence::schema::receipt_signature_t& signature,
    std::string_view expected_sha256);

}  // namespace credence::receipts
