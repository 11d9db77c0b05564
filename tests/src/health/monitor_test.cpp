#include <gtest/gtest.h>
#include <credence/health/monitor.hpp>
#include <credence/testing/common.hpp>

#include <cstdint>
#include <vector>

namespace {

using credence::schema::settlement_outcome_t;

constexpr auto kNow = credence::testing::kStartMillis;

std::vector<credence::schema::settlement_t> make_settlements(
    const std::size_t successes,
    const std::size_t losses) {
  auto rows = std::vector<credence::schema::settlement_t>{};
  for (std::size_t i = 0; i < successes; ++i) {
    rows.push_back(credence::schema::settlement_t{
        .outcome = settlement_outcome_t::success, .created_at = kNow});
  }
  for (std::size_t i = 0; i < losses; ++i) {
    rows.push_back(credence::schema::settlement_t{
        .outcome = i % 2 == 0 ? settlement_outcome_t::failed
                              : settlement_outcome_t::expired,
        .created_at = kNow});
  }
  return rows;
}

std::vector<credence::schema::liquidity_pay_event_t> make_pay_events(
    const std::size_t succeeded,
    const std::size_t failed) {
  auto rows = std::vector<credence::schema::liquidity_pay_event_t>{};
  for (std::size_t i = 0; i < succeeded; ++i) {
    rows.push_back(credence::schema::liquidity_pay_event_t{
        .status = "succeeded", .created_at = kNow});
  }
  for (std::size_t i = 0; i < failed; ++i) {
    rows.push_back(credence::schema::liquidity_pay_event_t{
        .status = "failed", .created_at = kNow});
  }
  return rows;
}

}  // namespace

TEST(health_monitor, window_and_sample_floors_apply) {
  auto policy = credence::config::policy_config{};
  policy.health_window_seconds = 5;
  policy.health_settlement_sample_limit = 1;
  policy.health_ln_pay_sample_limit = 0;
  EXPECT_EQ(credence::health::window_since(kNow, policy), kNow - 60'000);
  EXPECT_EQ(credence::health::settlement_sample_limit(policy), 50u);
  EXPECT_EQ(credence::health::ln_pay_sample_limit(policy), 50u);
  EXPECT_EQ(credence::health::window_since(1'000, policy), 0u);
}

TEST(health_monitor, oversized_window_reaches_epoch) {
  auto policy = credence::config::policy_config{};
  policy.health_window_seconds = 18'446'744'073'709'552ull;
  EXPECT_EQ(credence::health::window_since(kNow, policy), 0u);
  policy.health_window_seconds = UINT64_MAX;
  EXPECT_EQ(credence::health::window_since(kNow, policy), 0u);
}

TEST(health_monitor, empty_window_reports_zero_rates) {
  auto policy = credence::config::policy_config{};
  auto report = credence::health::evaluate(
      kNow, credence::health::open_commitments_t{.envelope_count = 2,
                                                 .reserved_sats = 700},
      {}, {}, policy);
  EXPECT_EQ(report.generated_at, kNow);
  EXPECT_EQ(report.open_envelope_count, 2u);
  EXPECT_EQ(report.open_reserved_commitments_sats, 700u);
  EXPECT_DOUBLE_EQ(report.loss_rate, 0.0);
  EXPECT_DOUBLE_EQ(report.ln_failure_rate, 0.0);
  EXPECT_FALSE(report.breakers.halt_new_envelopes);
  EXPECT_FALSE(report.breakers.halt_large_settlements);
  EXPECT_EQ(report.policy.max_sats_per_envelope,
            policy.max_sats_per_envelope);
}

TEST(health_monitor, loss_breaker_needs_minimum_sample) {
  auto policy = credence::config::policy_config{};
  auto small = credence::health::evaluate(kNow, {}, make_settlements(0, 4), {},
                                          policy);
  EXPECT_DOUBLE_EQ(small.loss_rate, 1.0);
  EXPECT_FALSE(small.breakers.halt_new_envelopes);

  auto enough = credence::health::evaluate(kNow, {}, make_settlements(1, 4),
                                           {}, policy);
  EXPECT_EQ(enough.settlement_sample, 5u);
  EXPECT_EQ(enough.loss_count, 4u);
  EXPECT_DOUBLE_EQ(enough.loss_rate, 0.8);
  EXPECT_TRUE(enough.breakers.halt_new_envelopes);
  EXPECT_FALSE(enough.breakers.halt_large_settlements);
}

TEST(health_monitor, breakers_trip_strictly_above_threshold) {
  auto policy = credence::config::policy_config{};
  auto at_threshold = credence::health::evaluate(
      kNow, {}, make_settlements(3, 3), make_pay_events(3, 3), policy);
  EXPECT_DOUBLE_EQ(at_threshold.loss_rate, 0.5);
  EXPECT_DOUBLE_EQ(at_threshold.ln_failure_rate, 0.5);
  EXPECT_FALSE(at_threshold.breakers.halt_new_envelopes);
  EXPECT_FALSE(at_threshold.breakers.halt_large_settlements);

  auto above = credence::health::evaluate(kNow, {}, {}, make_pay_events(2, 3),
                                          policy);
  EXPECT_EQ(above.ln_fail_count, 3u);
  EXPECT_TRUE(above.breakers.halt_large_settlements);
  EXPECT_FALSE(above.breakers.halt_new_envelopes);
}
