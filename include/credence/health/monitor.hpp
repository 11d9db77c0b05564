#pragma once

#include <credence/config/policy_config.hpp>
#include <credence/schema/health_report.hpp>
#include <credence/schema/liquidity_pay_event.hpp>
#include <credence/schema/settlement.hpp>

#include <vector>

namespace credence::health {

/// Start of the health window; at least 60 seconds before `now`.
credence::schema::timestamp_milliseconds_t window_since(
    credence::schema::timestamp_milliseconds_t now,
    const credence::config::policy_config& policy);

/// Sample bounds; never fewer than 50.
uint32_t settlement_sample_limit(const credence::config::policy_config& policy);
uint32_t ln_pay_sample_limit(const credence::config::policy_config& policy);

struct open_commitments_t final {
  uint64_t envelope_count{};
  credence::schema::sats_t reserved_sats{};
};

/// Loss and payment-failure rates over the sampled rows and the two circuit
/// breakers they imply. A breaker trips only with at least
/// circuit_breaker_min_sample rows and a rate strictly above its threshold.
credence::schema::health_report_t evaluate(
    credence::schema::timestamp_milliseconds_t now,
    const open_commitments_t& open,
    const std::vector<credence::schema::settlement_t>& settlements,
    const std::vector<credence::schema::liquidity_pay_event_t>& pay_events,
    const credence::config::policy_config& policy);

}  // namespace credence::health
