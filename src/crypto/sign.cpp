#include <credence/crypto/sign.hpp>

#include <openssl/evp.h>

#include <memory>

namespace credence::crypto {

namespace {

using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

evp_pkey_ptr make_private_key(
    const credence::schema::ed25519_secret_key_t& secret_key) {
  return evp_pkey_ptr{
      EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr,
                                   secret_key.data(), secret_key.size()),
      EVP_PKEY_free};
}

}  // namespace

std::optional<credence::schema::ed25519_public_key_t> derive_public_key(
    const credence::schema::ed25519_secret_key_t& secret_key) {
  auto pkey = make_private_key(secret_key);
  if (!pkey) {
    return std::nullopt;
  }
  auto public_key = credence::schema::ed25519_public_key_t{};
  auto length = public_key.size();
  if (EVP_PKEY_get_raw_public_key(pkey.get(), public_key.data(), &length) !=
          1 ||
      length != public_key.size()) {
    return std::nullopt;
  }
  return public_key;
}

std::optional<credence::schema::ed25519_signature_t> sign_message(
    const credence::schema::bytes_view_t& message,
    const credence::schema::ed25519_secret_key_t& secret_key) {
  auto pkey = make_private_key(secret_key);
  if (!pkey) {
    return std::nullopt;
  }
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, pkey.get()) !=
      1) {
    return std::nullopt;
  }
  auto signature = credence::schema::ed25519_signature_t{};
  auto length = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &length, message.data(),
                     message.size()) != 1 ||
      length != signature.size()) {
    return std::nullopt;
  }
  return signature;
}

}  // namespace credence::crypto
