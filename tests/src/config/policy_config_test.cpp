#include <gtest/gtest.h>
#include <boost/program_options.hpp>
#include <credence/config/policy_config.hpp>

#include <sstream>
#include <vector>

namespace po = boost::program_options;

TEST(policy_config, defaults_are_valid) {
  auto policy = credence::config::policy_config{};
  EXPECT_EQ(policy.max_sats_per_envelope, 100'000u);
  EXPECT_EQ(policy.max_outstanding_envelopes_per_agent, 3u);
  EXPECT_EQ(policy.underwriting_base_sats, 2'000u);
  EXPECT_EQ(policy.circuit_breaker_min_sample, 5u);
  EXPECT_FALSE(credence::config::validate(policy).has_value());
}

TEST(policy_config, command_line_overrides_defaults) {
  auto policy = credence::config::policy_config{};
  auto description = credence::config::make_options_description(policy);
  auto args = std::vector<const char*>{"credenced", "--max_sats_per_envelope",
                                       "5000", "--loss_rate_halt_threshold",
                                       "0.25"};
  auto vm = po::variables_map{};
  po::store(po::parse_command_line(static_cast<int>(args.size()), args.data(),
                                   description),
            vm);
  po::notify(vm);
  EXPECT_EQ(policy.max_sats_per_envelope, 5'000u);
  EXPECT_DOUBLE_EQ(policy.loss_rate_halt_threshold, 0.25);
  EXPECT_EQ(policy.min_fee_bps, 50u);
}

TEST(policy_config, config_file_sets_options) {
  auto policy = credence::config::policy_config{};
  auto description = credence::config::make_options_description(policy);
  auto file = std::istringstream{
      "underwriting_base_sats = 400\n"
      "min_fee_bps = 75\n"
      "health_window_seconds = 600\n"};
  auto vm = po::variables_map{};
  po::store(po::parse_config_file(file, description), vm);
  po::notify(vm);
  EXPECT_EQ(policy.underwriting_base_sats, 400u);
  EXPECT_EQ(policy.min_fee_bps, 75u);
  EXPECT_EQ(policy.health_window_seconds, 600u);
}

TEST(policy_config, validate_rejects_inconsistent_policy) {
  auto policy = credence::config::policy_config{};
  policy.min_fee_bps = 3'000;
  EXPECT_TRUE(credence::config::validate(policy).has_value());

  policy = credence::config::policy_config{};
  policy.max_sats_per_envelope = 0;
  EXPECT_TRUE(credence::config::validate(policy).has_value());

  policy = credence::config::policy_config{};
  policy.ln_failure_rate_halt_threshold = 1.5;
  EXPECT_TRUE(credence::config::validate(policy).has_value());

  policy = credence::config::policy_config{};
  policy.fee_risk_scaler = -1.0;
  EXPECT_TRUE(credence::config::validate(policy).has_value());
}

TEST(policy_config, log_level_names_round_trip) {
  using credence::config::parse_log_level;
  EXPECT_EQ(parse_log_level("trace"), spdlog::level::trace);
  EXPECT_EQ(parse_log_level("info"), spdlog::level::info);
  EXPECT_EQ(parse_log_level("warning"), spdlog::level::warn);
  EXPECT_EQ(parse_log_level("warn"), spdlog::level::warn);
  EXPECT_EQ(parse_log_level("error"), spdlog::level::err);
  EXPECT_EQ(parse_log_level("err"), spdlog::level::err);
  EXPECT_EQ(parse_log_level("off"), spdlog::level::off);

  EXPECT_FALSE(parse_log_level("verbose").has_value());
  EXPECT_FALSE(parse_log_level("INFO").has_value());
  EXPECT_FALSE(parse_log_level("").has_value());
}
