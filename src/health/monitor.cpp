#include <credence/health/monitor.hpp>

#include <algorithm>

namespace credence::health {

namespace {

inline constexpr auto kMinimumWindowSeconds = uint64_t{60};
inline constexpr auto kMinimumSampleLimit = uint32_t{50};

double rate(const uint64_t count, const uint64_t sample) {
  return sample == 0 ? 0.0
                     : static_cast<double>(count) / static_cast<double>(sample);
}

}  // namespace

credence::schema::timestamp_milliseconds_t window_since(
    const credence::schema::timestamp_milliseconds_t now,
    const credence::config::policy_config& policy) {
  auto seconds = std::max(policy.health_window_seconds, kMinimumWindowSeconds);
  return credence::schema::saturating_sub(
      now, credence::schema::saturating_mul(
               seconds, credence::schema::kMillisecondsPerSecond));
}

uint32_t settlement_sample_limit(
    const credence::config::policy_config& policy) {
  return std::max(policy.health_settlement_sample_limit, kMinimumSampleLimit);
}

uint32_t ln_pay_sample_limit(const credence::config::policy_config& policy) {
  return std::max(policy.health_ln_pay_sample_limit, kMinimumSampleLimit);
}

credence::schema::health_report_t evaluate(
    const credence::schema::timestamp_milliseconds_t now,
    const open_commitments_t& open,
    const std::vector<credence::schema::settlement_t>& settlements,
    const std::vector<credence::schema::liquidity_pay_event_t>& pay_events,
    const credence::config::policy_config& policy) {
  auto report = credence::schema::health_report_t{};
  report.generated_at = now;
  report.open_envelope_count = open.envelope_count;
  report.open_reserved_commitments_sats = open.reserved_sats;

  report.settlement_sample = settlements.size();
  report.loss_count = static_cast<uint64_t>(
      std::ranges::count_if(settlements, [](const auto& row) {
        return row.outcome != credence::schema::settlement_outcome_t::success;
      }));
  report.loss_rate = rate(report.loss_count, report.settlement_sample);

  report.ln_pay_sample = pay_events.size();
  report.ln_fail_count = static_cast<uint64_t>(
      std::ranges::count_if(pay_events, [](const auto& row) {
        return row.status != credence::schema::kPayStatusSucceeded;
      }));
  report.ln_failure_rate = rate(report.ln_fail_count, report.ln_pay_sample);

  report.breakers.halt_new_envelopes =
      report.settlement_sample >= policy.circuit_breaker_min_sample &&
      report.loss_rate > policy.loss_rate_halt_threshold;
  report.breakers.halt_large_settlements =
      report.ln_pay_sample >= policy.circuit_breaker_min_sample &&
      report.ln_failure_rate > policy.ln_failure_rate_halt_threshold;

  report.policy = policy;
  return report;
}

}  // namespace credence::health
