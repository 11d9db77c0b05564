#include <credence/crypto/sha256.hpp>
#include <credence/fingerprint/canonical.hpp>

#include <json/writer.h>

namespace credence::fingerprint {

std::string canonical_json(const Json::Value& value) {
  auto builder = Json::StreamWriterBuilder{};
  builder["indentation"] = "";
  builder["commentStyle"] = "None";
  builder["emitUTF8"] = true;
  builder["enableYAMLCompatibility"] = false;
  builder["dropNullPlaceholders"] = false;
  return Json::writeString(builder, value);
}

std::optional<std::string> canonical_sha256(const Json::Value& value) {
  return credence::crypto::sha256_hex(canonical_json(value));
}

std::string make_entity_id(const std::string_view prefix,
                           const std::string_view digest_hex) {
  auto id = std::string{prefix};
  id.push_back('_');
  id.append(digest_hex.substr(0, kEntityIdDigestChars));
  return id;
}

}  // namespace credence::fingerprint
