#pragma once

#include <credence/schema/primitives.hpp>

namespace credence::crypto {

/// True when the linked OpenSSL provides Ed25519.
bool available();

bool verify_signature(const credence::schema::bytes_view_t& message,
                      const credence::schema::ed25519_public_key_t& signer,
                      const credence::schema::ed25519_signature_t& signature);

}  // namespace credence::crypto
