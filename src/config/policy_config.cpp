#include <credence/config/policy_config.hpp>

#include <boost/program_options/value_semantic.hpp>

#include <spdlog/fmt/fmt.h>

namespace credence::config {

namespace po = boost::program_options;

po::options_description make_options_description(policy_config& policy) {
  auto defaults = policy_config{};
  auto description = po::options_description{"Credit policy"};
  description.add_options()(
      "max_sats_per_envelope",
      po::value<uint64_t>(&policy.max_sats_per_envelope)
          ->default_value(defaults.max_sats_per_envelope),
      "Hard cap on any offer or envelope, in sats")(
      "max_outstanding_envelopes_per_agent",
      po::value<uint64_t>(&policy.max_outstanding_envelopes_per_agent)
          ->default_value(defaults.max_outstanding_envelopes_per_agent),
      "Open envelopes an agent may hold at once")(
      "max_offer_ttl_seconds",
      po::value<uint64_t>(&policy.max_offer_ttl_seconds)
          ->default_value(defaults.max_offer_ttl_seconds),
      "Furthest expiry an intent or offer may request")(
      "underwriting_history_days",
      po::value<uint32_t>(&policy.underwriting_history_days)
          ->default_value(defaults.underwriting_history_days),
      "Settlement history window used for underwriting")(
      "underwriting_base_sats",
      po::value<uint64_t>(&policy.underwriting_base_sats)
          ->default_value(defaults.underwriting_base_sats),
      "Limit granted to an agent with no history")(
      "underwriting_k",
      po::value<double>(&policy.underwriting_k)
          ->default_value(defaults.underwriting_k),
      "Growth factor applied to sqrt(success volume)")(
      "underwriting_default_penalty_multiplier",
      po::value<double>(&policy.underwriting_default_penalty_multiplier)
          ->default_value(defaults.underwriting_default_penalty_multiplier),
      "Weight of recent losses in the limit penalty")(
      "min_fee_bps",
      po::value<uint32_t>(&policy.min_fee_bps)
          ->default_value(defaults.min_fee_bps),
      "Fee floor in basis points")(
      "max_fee_bps",
      po::value<uint32_t>(&policy.max_fee_bps)
          ->default_value(defaults.max_fee_bps),
      "Fee ceiling in basis points")(
      "fee_risk_scaler",
      po::value<double>(&policy.fee_risk_scaler)
          ->default_value(defaults.fee_risk_scaler),
      "Basis points charged per unit of risk score")(
      "health_window_seconds",
      po::value<uint64_t>(&policy.health_window_seconds)
          ->default_value(defaults.health_window_seconds),
      "Trailing window sampled by the health monitor")(
      "health_settlement_sample_limit",
      po::value<uint32_t>(&policy.health_settlement_sample_limit)
          ->default_value(defaults.health_settlement_sample_limit),
      "Most recent settlements sampled for the loss rate")(
      "health_ln_pay_sample_limit",
      po::value<uint32_t>(&policy.health_ln_pay_sample_limit)
          ->default_value(defaults.health_ln_pay_sample_limit),
      "Most recent payment attempts sampled for the failure rate")(
      "circuit_breaker_min_sample",
      po::value<uint64_t>(&policy.circuit_breaker_min_sample)
          ->default_value(defaults.circuit_breaker_min_sample),
      "Samples required before a breaker may trip")(
      "loss_rate_halt_threshold",
      po::value<double>(&policy.loss_rate_halt_threshold)
          ->default_value(defaults.loss_rate_halt_threshold),
      "Loss rate above which new envelopes halt")(
      "ln_failure_rate_halt_threshold",
      po::value<double>(&policy.ln_failure_rate_halt_threshold)
          ->default_value(defaults.ln_failure_rate_halt_threshold),
      "Payment failure rate above which large settlements halt")(
      "ln_failure_large_settlement_cap_sats",
      po::value<uint64_t>(&policy.ln_failure_large_settlement_cap_sats)
          ->default_value(defaults.ln_failure_large_settlement_cap_sats),
      "Settlements above this size are blocked while payments are failing");
  return description;
}

std::optional<std::string> validate(const policy_config& policy) {
  if (policy.max_sats_per_envelope == 0) {
    return "max_sats_per_envelope must be > 0";
  }
  if (policy.max_outstanding_envelopes_per_agent == 0) {
    return "max_outstanding_envelopes_per_agent must be > 0";
  }
  if (policy.max_offer_ttl_seconds == 0) {
    return "max_offer_ttl_seconds must be > 0";
  }
  if (policy.min_fee_bps > policy.max_fee_bps) {
    return fmt::format("min_fee_bps ({}) exceeds max_fee_bps ({})",
                       policy.min_fee_bps, policy.max_fee_bps);
  }
  if (policy.max_fee_bps > 10'000) {
    return "max_fee_bps must be <= 10000";
  }
  if (policy.underwriting_k < 0.0 ||
      policy.underwriting_default_penalty_multiplier < 0.0 ||
      policy.fee_risk_scaler < 0.0) {
    return "underwriting and fee scalers must not be negative";
  }
  if (policy.loss_rate_halt_threshold < 0.0 ||
      policy.loss_rate_halt_threshold > 1.0) {
    return "loss_rate_halt_threshold must be within [0, 1]";
  }
  if (policy.ln_failure_rate_halt_threshold < 0.0 ||
      policy.ln_failure_rate_halt_threshold > 1.0) {
    return "ln_failure_rate_halt_threshold must be within [0, 1]";
  }
  return std::nullopt;
}

std::optional<spdlog::level::level_enum> parse_log_level(
    const std::string_view name) {
  auto level = spdlog::level::from_str(std::string{name});
  auto canonical = spdlog::level::to_string_view(level);
  if (std::string_view{canonical.data(), canonical.size()} == name) {
    return level;
  }
  if ((name == "warn" && level == spdlog::level::warn) ||
      (name == "err" && level == spdlog::level::err)) {
    return level;
  }
  return std::nullopt;
}

}  // namespace credence::config
