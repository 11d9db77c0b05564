#pragma once

#include <credence/schema/primitives.hpp>

#include <optional>

namespace credence::crypto {

/// Public half of a raw 32-byte Ed25519 secret key.
std::optional<credence::schema::ed25519_public_key_t> derive_public_key(
    const credence::schema::ed25519_secret_key_t& secret_key);

/// Pure Ed25519 signature over `message`. Deterministic for a given key.
std::optional<credence::schema::ed25519_signature_t> sign_message(
    const credence::schema::bytes_view_t& message,
    const credence::schema::ed25519_secret_key_t& secret_key);

}  // namespace credence::crypto
