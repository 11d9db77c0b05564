#pragma once

#include <credence/config/policy_config.hpp>
#include <credence/schema/primitives.hpp>
#include <credence/schema/settlement.hpp>

#include <json/value.h>

#include <string_view>
#include <vector>

namespace credence::underwriting {

/// Agent history over the underwriting window plus its current exposure.
struct underwriting_stats_t final {
  uint64_t settled_count{};
  credence::schema::sats_t success_volume_sats{};
  double pass_rate{1.0};
  uint64_t loss_count{};
  uint64_t open_envelope_count{};
  credence::schema::sats_t open_exposure_sats{};
  double weighted_loss_score{};
};

struct underwriting_decision_t final {
  credence::schema::sats_t limit_sats{};
  credence::schema::basis_points_t fee_bps{};
  bool requires_verifier{true};
  double risk_score{};
  underwriting_stats_t stats;
  Json::Value audit_inputs;
};

/// Decay weight of a loss by age: 1.0 within an hour, 0.75 within a day, 0.5
/// within a week, 0.25 after that. Future timestamps count as age zero.
double loss_weight(credence::schema::timestamp_milliseconds_t now,
                   credence::schema::timestamp_milliseconds_t created_at);

/// Start of the history window; at least one day before `now`.
credence::schema::timestamp_milliseconds_t history_since(
    credence::schema::timestamp_milliseconds_t now,
    const credence::config::policy_config& policy);

/// Settlements sampled per agent; never fewer than 200.
uint32_t history_sample_limit(const credence::config::policy_config& policy);

underwriting_stats_t summarize(
    credence::schema::timestamp_milliseconds_t now,
    const std::vector<credence::schema::settlement_t>& settlements,
    uint64_t open_envelope_count,
    credence::schema::sats_t open_exposure_sats);

/// Credit limit, fee and verifier requirement for `stats`. Pure; the caller
/// persists `audit_inputs` with the offer it backs.
underwriting_decision_t decide(std::string_view agent_id,
                               credence::schema::timestamp_milliseconds_t now,
                               const underwriting_stats_t& stats,
                               const credence::config::policy_config& policy);

}  // namespace credence::underwriting
