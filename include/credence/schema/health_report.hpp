#pragma once
#include <credence/config/policy_config.hpp>
#include <credence/schema/primitives.hpp>

namespace credence::schema {

struct circuit_breakers_t final {
  bool halt_new_envelopes{};
  bool halt_large_settlements{};
};

/// Pool-wide health over the trailing health window.
struct health_report_t final {
  timestamp_milliseconds_t generated_at{};
  uint64_t open_envelope_count{};
  sats_t open_reserved_commitments_sats{};
  uint64_t settlement_sample{};
  uint64_t loss_count{};
  double loss_rate{};
  uint64_t ln_pay_sample{};
  uint64_t ln_fail_count{};
  double ln_failure_rate{};
  circuit_breakers_t breakers;
  credence::config::policy_config policy;
};

}  // namespace credence::schema
