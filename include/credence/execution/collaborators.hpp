#pragma once

#include <credence/schema/credit_result.hpp>
#include <credence/schema/label_event.hpp>
#include <credence/schema/primitives.hpp>

#include <json/value.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

// Services the engine calls out to but does not own. Each is installed on the
// engine as a callback; a missing payment collaborator makes settle() fail as
// dependency_unavailable.
namespace credence::execution {

struct quote_pay_request_t final {
  std::string idempotency_key;
  std::string invoice;
  std::string host;
  credence::schema::msats_t max_amount_msats{};
  credence::schema::msats_t max_fee_msats{};
  std::string urgency{"normal"};
  Json::Value policy_context;
};

struct quote_pay_response_t final {
  std::string quote_id;
};

struct pay_request_t final {
  std::string quote_id;
};

struct pay_response_t final {
  std::string quote_id;
  std::string status;
  /// canonical_json_sha256 of the payment receipt.
  std::string receipt_sha256;
  std::optional<std::string> error_code;
};

using quote_pay_fn_t =
    std::function<credence::schema::credit_result_t<quote_pay_response_t>(
        const quote_pay_request_t&)>;
using pay_fn_t =
    std::function<credence::schema::credit_result_t<pay_response_t>(
        const pay_request_t&)>;

/// Quote-then-pay against the liquidity pool. Both calls must be idempotent
/// on the quote request's idempotency_key.
struct payment_collaborator_t final {
  quote_pay_fn_t quote_pay;
  pay_fn_t pay;
};

/// Fire-and-forget publisher for signed label events.
using attestation_publisher_t =
    std::function<void(const credence::schema::label_event_t&)>;

using invoice_decoder_t =
    std::function<std::optional<credence::schema::msats_t>(std::string_view)>;

using clock_fn_t = std::function<credence::schema::timestamp_milliseconds_t()>;

}  // namespace credence::execution
