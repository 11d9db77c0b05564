#pragma once

#include <boost/program_options/options_description.hpp>
#include <spdlog/common.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace credence::config {

/// Protocol policy. Every field is exposed as `--<name>` on the command line
/// and as `<name> = value` in a config file.
struct policy_config final {
  uint64_t max_sats_per_envelope{100'000};
  uint64_t max_outstanding_envelopes_per_agent{3};
  uint64_t max_offer_ttl_seconds{3600};

  uint32_t underwriting_history_days{30};
  uint64_t underwriting_base_sats{2'000};
  double underwriting_k{150.0};
  double underwriting_default_penalty_multiplier{2.0};

  uint32_t min_fee_bps{50};
  uint32_t max_fee_bps{2'000};
  double fee_risk_scaler{400.0};

  uint64_t health_window_seconds{21'600};
  uint32_t health_settlement_sample_limit{200};
  uint32_t health_ln_pay_sample_limit{200};
  uint64_t circuit_breaker_min_sample{5};
  double loss_rate_halt_threshold{0.50};
  double ln_failure_rate_halt_threshold{0.50};
  uint64_t ln_failure_large_settlement_cap_sats{5'000};
};

/// Bind every policy field to an option of the same name. The returned
/// description writes parsed values straight into `policy` on `notify`.
boost::program_options::options_description make_options_description(
    policy_config& policy);

/// Reject configurations the engine cannot run with. Returns a description
/// of the first problem found.
std::optional<std::string> validate(const policy_config& policy);

/// spdlog level for `name`. Accepts the canonical level names plus the
/// `warn` and `err` aliases; anything else is rejected rather than read as
/// `off`.
std::optional<spdlog::level::level_enum> parse_log_level(
    std::string_view name);

}  // namespace credence::config
