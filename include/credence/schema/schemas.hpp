#pragma once

#include <string_view>

// Versioned schema tags carried by requests, receipts and audit documents.
namespace credence::schema {

inline constexpr auto kIntentRequestSchemaV1 =
    std::string_view{"openagents.credit.intent_request.v1"};
inline constexpr auto kOfferRequestSchemaV1 =
    std::string_view{"openagents.credit.offer_request.v1"};
inline constexpr auto kEnvelopeRequestSchemaV1 =
    std::string_view{"openagents.credit.envelope_request.v1"};
inline constexpr auto kSettleRequestSchemaV1 =
    std::string_view{"openagents.credit.settle_request.v1"};

inline constexpr auto kEnvelopeIssueReceiptSchemaV1 =
    std::string_view{"openagents.credit.envelope_issue_receipt.v1"};
inline constexpr auto kEnvelopeSettlementReceiptSchemaV1 =
    std::string_view{"openagents.credit.envelope_settlement_receipt.v1"};
inline constexpr auto kDefaultNoticeSchemaV1 =
    std::string_view{"openagents.credit.default_notice.v1"};
inline constexpr auto kReceiptSignatureSchemaV1 =
    std::string_view{"openagents.receipt_signature.v1"};

inline constexpr auto kUnderwritingAuditSchemaV1 =
    std::string_view{"openagents.credit.underwriting_audit.v1"};
inline constexpr auto kUnderwritingInputsSchemaV1 =
    std::string_view{"openagents.credit.underwriting_inputs.v1"};
inline constexpr auto kPolicyContextSchemaV1 =
    std::string_view{"openagents.credit.policy_context.v1"};

inline constexpr auto kLabelNamespace = std::string_view{"openagents.credit"};

// Entity id prefixes; ids are `<prefix>_<first 24 hex chars of digest>`.
inline constexpr auto kIntentIdPrefix = std::string_view{"cepi"};
inline constexpr auto kOfferIdPrefix = std::string_view{"cepo"};
inline constexpr auto kEnvelopeIdPrefix = std::string_view{"cepe"};
inline constexpr auto kSettlementIdPrefix = std::string_view{"ceps"};
inline constexpr auto kEnvelopeIssueReceiptIdPrefix = std::string_view{"ceir"};
inline constexpr auto kSettlementReceiptIdPrefix = std::string_view{"cesr"};
inline constexpr auto kDefaultNoticeIdPrefix = std::string_view{"cedn"};

// Receipt owner kinds used in the (entity_kind, entity_id, schema) key.
inline constexpr auto kEnvelopeEntityKind = std::string_view{"envelope"};
inline constexpr auto kSettlementEntityKind = std::string_view{"settlement"};

}  // namespace credence::schema
