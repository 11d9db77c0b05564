#pragma once

#include <credence/schema/primitives.hpp>

#include <optional>
#include <string_view>

namespace credence::lightning {

/// Amount encoded in the human-readable part of a BOLT11 invoice, in
/// millisatoshis. Returns std::nullopt for anything that is not an `ln...`
/// invoice with an explicit, representable amount.
std::optional<credence::schema::msats_t> bolt11_amount_msats(
    std::string_view invoice);

}  // namespace credence::lightning
