#include <credence/crypto/sha256.hpp>

#include <openssl/evp.h>

#include <memory>

namespace credence::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

}  // namespace

std::optional<credence::schema::hash32_t> sha256(
    const credence::schema::bytes_view_t& bytes) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    return std::nullopt;
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    return std::nullopt;
  }
  if (EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1) {
    return std::nullopt;
  }
  auto digest = credence::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 ||
      length != digest.size()) {
    return std::nullopt;
  }
  return digest;
}

std::optional<std::string> sha256_hex(const std::string_view text) {
  auto digest = sha256(credence::schema::make_bytes_view(text));
  if (!digest) {
    return std::nullopt;
  }
  return credence::schema::to_hex(*digest);
}

}  // namespace credence::crypto
