#pragma once
#include <credence/config/policy_config.hpp>
#include <credence/schema/agent_exposure.hpp>
#include <credence/schema/envelope.hpp>
#include <credence/schema/health_report.hpp>
#include <credence/schema/intent.hpp>
#include <credence/schema/label_event.hpp>
#include <credence/schema/liquidity_pay_event.hpp>
#include <credence/schema/offer.hpp>
#include <credence/schema/receipt.hpp>
#include <credence/schema/settlement.hpp>

#include <json/value.h>

#include <optional>
#include <string_view>

// JSON renderings of protocol documents. Timestamps render as RFC 3339 UTC
// strings, enums by name, and absent optionals are omitted.
namespace credence::schema {

Json::Value to_json(const intent_t& intent);
Json::Value to_json(const offer_terms_t& terms);
Json::Value to_json(const offer_t& offer);
Json::Value to_json(const offer_response_t& response);
Json::Value to_json(const envelope_t& envelope);
Json::Value to_json(const envelope_response_t& response);
Json::Value to_json(const settlement_t& settlement);
Json::Value to_json(const settle_response_t& response);
Json::Value to_json(const receipt_signature_t& signature);
Json::Value to_json(const label_event_t& event);
Json::Value to_json(const envelope_issue_receipt_t& receipt);
Json::Value to_json(const settlement_receipt_t& receipt);
Json::Value to_json(const default_notice_t& notice);
Json::Value to_json(const liquidity_pay_event_t& event);
Json::Value to_json(const health_report_t& report);
Json::Value to_json(const agent_exposure_t& exposure);
Json::Value to_json(const credence::config::policy_config& policy);

Json::Value to_json_u64(uint64_t value);
Json::Value to_json_time(timestamp_milliseconds_t value);

std::optional<receipt_signature_t> try_signature_from_json(
    const Json::Value& value);
std::optional<Json::Value> try_parse_json(std::string_view text);

}  // namespace credence::schema
