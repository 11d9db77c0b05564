#include <credence/crypto/sign.hpp>
#include <credence/crypto/verify.hpp>
#include <credence/receipts/signer.hpp>
#include <credence/schema/schemas.hpp>

#include <algorithm>

namespace credence::receipts {

namespace {

inline constexpr auto kCodespace = std::string_view{"credence.receipts"};
inline constexpr auto kSignatureScheme = std::string_view{"ed25519"};

}  // namespace

std::optional<receipt_signer> receipt_signer::from_secret_key(
    const credence::schema::ed25519_secret_key_t& secret_key) {
  auto public_key = credence::crypto::derive_public_key(secret_key);
  if (!public_key) {
    return std::nullopt;
  }
  auto signer = receipt_signer{};
  signer.secret_key_ = secret_key;
  signer.public_key_ = *public_key;
  return signer;
}

std::optional<receipt_signer> receipt_signer::from_secret_hex(
    const std::string_view hex) {
  auto decoded = credence::schema::try_make_hash32(
      credence::schema::trim(hex));
  if (!decoded) {
    return std::nullopt;
  }
  return from_secret_key(*decoded);
}

bool receipt_signer::enabled() const {
  return secret_key_.has_value();
}

const credence::schema::ed25519_public_key_t& receipt_signer::public_key()
    const {
  return public_key_;
}

std::string receipt_signer::public_key_hex() const {
  return credence::schema::to_hex(public_key_);
}

credence::schema::credit_result_t<
    std::optional<credence::schema::receipt_signature_t>>
receipt_signer::sign_digest(const std::string_view sha256_hex) const {
  using result_t = std::optional<credence::schema::receipt_signature_t>;
  if (!enabled()) {
    return credence::schema::make_success(result_t{});
  }
  auto digest = credence::schema::try_make_hash32(sha256_hex);
  if (!digest) {
    return credence::schema::make_failure<result_t>(
        credence::schema::credit_error_code::internal,
        "receipt digest is not a 32-byte hex value", kCodespace);
  }
  auto signature = sign_bytes(*digest);
  if (!signature) {
    return credence::schema::make_failure<result_t>(
        credence::schema::credit_error_code::internal,
        "failed to sign receipt digest", kCodespace);
  }
  return credence::schema::make_success(
      result_t{credence::schema::receipt_signature_t{
          .schema = std::string{credence::schema::kReceiptSignatureSchemaV1},
          .scheme = std::string{kSignatureScheme},
          .signer = public_key_hex(),
          .signed_sha256 = std::string{sha256_hex},
          .signature_hex = credence::schema::to_hex(*signature)}});
}

std::optional<credence::schema::ed25519_signature_t> receipt_signer::sign_bytes(
    const credence::schema::bytes_view_t& message) const {
  if (!secret_key_) {
    return std::nullopt;
  }
  return credence::crypto::sign_message(message, *secret_key_);
}

bool verify_receipt_signature(
    const credence::schema::receipt_signature_t& signature) {
  if (signature.schema != credence::schema::kReceiptSignatureSchemaV1 ||
      signature.scheme != kSignatureScheme) {
    return false;
  }
  auto signer = credence::schema::try_make_hash32(signature.signer);
  auto digest = credence::schema::try_make_hash32(signature.signed_sha256);
  auto raw_signature =
      credence::schema::try_from_hex(signature.signature_hex);
  if (!signer || !digest || !raw_signature ||
      raw_signature->size() != credence::schema::ed25519_signature_t{}.size()) {
    return false;
  }
  auto fixed = credence::schema::ed25519_signature_t{};
  std::ranges::copy(*raw_signature, fixed.begin());
  return credence::crypto::verify_signature(*digest, *signer, fixed);
}

bool verify_receipt_signature(
    const credence::schema::receipt_signature_t& signature,
    const std::string_view expected_sha256) {
  return signature.signed_sha256 == expected_sha256 &&
         verify_receipt_signature(signature);
}

}  // namespace credence::receipts
