#pragma once
#include <credence/schema/primitives.hpp>

#include <string>

namespace credence::schema {

/// Current exposure and underwriting terms for a single agent.
struct agent_exposure_t final {
  std::string agent_id;
  uint64_t open_envelope_count{};
  sats_t open_exposure_sats{};
  uint64_t settled_count{};
  sats_t success_volume_sats{};
  double pass_rate{};
  uint64_t loss_count{};
  sats_t underwriting_limit_sats{};
  basis_points_t underwriting_fee_bps{};
  bool requires_verifier{true};
  timestamp_milliseconds_t computed_at{};
};

}  // namespace credence::schema
