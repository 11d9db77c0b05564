#include <credence/schema/json.hpp>
#include <credence/schema/schemas.hpp>
#include <credence/underwriting/engine.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace credence::underwriting {

namespace {

inline constexpr auto kHourSeconds = uint64_t{3'600};
inline constexpr auto kDaySeconds = uint64_t{86'400};
inline constexpr auto kWeekSeconds = 7 * kDaySeconds;
inline constexpr auto kExposureRiskDivisor = 50'000.0;
inline constexpr auto kExposureRiskCap = 50.0;
inline constexpr auto kMinimumAgentSampleLimit = uint32_t{200};

uint64_t saturating_add(const uint64_t lhs, const uint64_t rhs) {
  return rhs > std::numeric_limits<uint64_t>::max() - lhs
             ? std::numeric_limits<uint64_t>::max()
             : lhs + rhs;
}

Json::Value make_audit_inputs(const std::string_view agent_id,
                              const credence::schema::timestamp_milliseconds_t since,
                              const underwriting_stats_t& stats,
                              const credence::config::policy_config& policy) {
  auto inputs = Json::Value{Json::objectValue};
  inputs["schema"] =
      std::string{credence::schema::kUnderwritingInputsSchemaV1};
  inputs["agentId"] = std::string{agent_id};
  inputs["since"] = credence::schema::to_json_time(since);
  inputs["settledCount30d"] = credence::schema::to_json_u64(stats.settled_count);
  inputs["successVolumeSats30d"] =
      credence::schema::to_json_u64(stats.success_volume_sats);
  inputs["passRate30d"] = stats.pass_rate;
  inputs["lossCount30d"] = credence::schema::to_json_u64(stats.loss_count);
  inputs["weightedLossScore"] = stats.weighted_loss_score;
  inputs["openEnvelopeCount"] =
      credence::schema::to_json_u64(stats.open_envelope_count);
  inputs["openExposureSats"] =
      credence::schema::to_json_u64(stats.open_exposure_sats);

  auto policy_inputs = Json::Value{Json::objectValue};
  policy_inputs["baseSats"] =
      credence::schema::to_json_u64(policy.underwriting_base_sats);
  policy_inputs["k"] = policy.underwriting_k;
  policy_inputs["defaultPenaltyMultiplier"] =
      policy.underwriting_default_penalty_multiplier;
  policy_inputs["maxSatsPerEnvelope"] =
      credence::schema::to_json_u64(policy.max_sats_per_envelope);
  inputs["policy"] = policy_inputs;
  return inputs;
}

}  // namespace

double loss_weight(const credence::schema::timestamp_milliseconds_t now,
                   const credence::schema::timestamp_milliseconds_t created_at) {
  auto age_seconds =
      credence::schema::saturating_sub(now, created_at) /
      credence::schema::kMillisecondsPerSecond;
  if (age_seconds <= kHourSeconds) {
    return 1.0;
  }
  if (age_seconds <= kDaySeconds) {
    return 0.75;
  }
  if (age_seconds <= kWeekSeconds) {
    return 0.50;
  }
  return 0.25;
}

credence::schema::timestamp_milliseconds_t history_since(
    const credence::schema::timestamp_milliseconds_t now,
    const credence::config::policy_config& policy) {
  auto days = std::max<uint64_t>(policy.underwriting_history_days, 1);
  return credence::schema::saturating_sub(
      now, credence::schema::saturating_mul(
               days, credence::schema::kMillisecondsPerDay));
}

uint32_t history_sample_limit(const credence::config::policy_config& policy) {
  return std::max(policy.health_settlement_sample_limit,
                  kMinimumAgentSampleLimit);
}

underwriting_stats_t summarize(
    const credence::schema::timestamp_milliseconds_t now,
    const std::vector<credence::schema::settlement_t>& settlements,
    const uint64_t open_envelope_count,
    const credence::schema::sats_t open_exposure_sats) {
  auto stats = underwriting_stats_t{};
  auto success_count = uint64_t{};
  for (const auto& row : settlements) {
    if (row.outcome == credence::schema::settlement_outcome_t::success) {
      ++success_count;
      stats.success_volume_sats =
          saturating_add(stats.success_volume_sats, row.spent_sats);
    } else {
      ++stats.loss_count;
      stats.weighted_loss_score += loss_weight(now, row.created_at);
    }
  }
  stats.settled_count = settlements.size();
  stats.pass_rate = stats.settled_count == 0
                        ? 1.0
                        : static_cast<double>(success_count) /
                              static_cast<double>(stats.settled_count);
  stats.open_envelope_count = open_envelope_count;
  stats.open_exposure_sats = open_exposure_sats;
  return stats;
}

underwriting_decision_t decide(
    const std::string_view agent_id,
    const credence::schema::timestamp_milliseconds_t now,
    const underwriting_stats_t& stats,
    const credence::config::policy_config& policy) {
  auto exposure = static_cast<double>(stats.open_exposure_sats);

  auto raw_limit =
      static_cast<double>(policy.underwriting_base_sats) +
      policy.underwriting_k *
          std::sqrt(static_cast<double>(stats.success_volume_sats));
  auto loss_penalty =
      1.0 / (1.0 + stats.weighted_loss_score *
                       policy.underwriting_default_penalty_multiplier);
  auto exposure_penalty = 1.0 / (1.0 + exposure / std::max(raw_limit, 1.0));

  auto limit_cap =
      std::max(1.0, static_cast<double>(policy.max_sats_per_envelope));
  auto limit = std::clamp(
      std::round(raw_limit * loss_penalty * exposure_penalty), 1.0, limit_cap);

  auto risk_score = std::max(1.0 - stats.pass_rate, 0.0) * 2.0 +
                    stats.weighted_loss_score * 0.5 +
                    std::sqrt(std::min(exposure / kExposureRiskDivisor,
                                       kExposureRiskCap));
  auto fee_floor = static_cast<double>(policy.min_fee_bps);
  auto fee_ceiling =
      std::max(fee_floor, static_cast<double>(policy.max_fee_bps));
  auto fee = std::clamp(std::round(risk_score * policy.fee_risk_scaler),
                        fee_floor, fee_ceiling);

  auto decision = underwriting_decision_t{};
  decision.limit_sats = static_cast<credence::schema::sats_t>(limit);
  decision.fee_bps = static_cast<credence::schema::basis_points_t>(fee);
  // Verification is mandatory for every envelope.
  decision.requires_verifier = true;
  decision.risk_score = risk_score;
  decision.stats = stats;
  decision.audit_inputs =
      make_audit_inputs(agent_id, history_since(now, policy), stats, policy);
  return decision;
}

}  // namespace credence::underwriting
