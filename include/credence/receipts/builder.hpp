#pragma once

#include <credence/receipts/signer.hpp>
#include <credence/schema/credit_result.hpp>
#include <credence/schema/envelope.hpp>
#include <credence/schema/receipt.hpp>
#include <credence/schema/settlement.hpp>

#include <json/value.h>

#include <string_view>

// Receipts are hash-addressed: canonical_json_sha256 covers every field except
// the signature and the embedded label event body, and receipt_id is derived
// from it. Hash inputs carry null for absent optionals.
namespace credence::receipts {

credence::schema::credit_result_t<credence::schema::envelope_issue_receipt_t>
build_envelope_issue_receipt(const credence::schema::envelope_t& envelope,
                             const receipt_signer& signer);

/// Receipt for a paid settlement. Embeds a signed success label when the
/// signer is enabled.
credence::schema::credit_result_t<credence::schema::settlement_receipt_t>
build_settlement_receipt(const credence::schema::envelope_t& envelope,
                         const credence::schema::settlement_t& settlement,
                         const receipt_signer& signer);

/// Notice for an expired or unverified envelope. The reason follows the
/// settlement outcome and no loss is booked.
credence::schema::credit_result_t<credence::schema::default_notice_t>
build_default_notice(const credence::schema::envelope_t& envelope,
                     const credence::schema::settlement_t& settlement,
                     const receipt_signer& signer);

/// Wrap a rendered receipt for persistence under (entity_kind, entity_id,
/// schema).
credence::schema::credit_result_t<credence::schema::stored_receipt_t>
make_stored_receipt(std::string_view entity_kind,
                    std::string_view entity_id,
                    const Json::Value& receipt,
                    credence::schema::timestamp_milliseconds_t created_at);

}  // namespace credence::receipts
