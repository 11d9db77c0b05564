#pragma once
#include <credence/schema/primitives.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace credence::schema {

/// The only payment status counted as a success.
inline constexpr auto kPayStatusSucceeded = std::string_view{"succeeded"};

template <uint16_t Version>
struct liquidity_pay_event;

/// One payment attempt against the liquidity pool, successful or not.
template <>
struct liquidity_pay_event<1> final {
  uint16_t version{1};
  std::string quote_id;
  std::string envelope_id;
  std::string status;
  std::optional<std::string> error_code;
  msats_t amount_msats{};
  std::string host;
  timestamp_milliseconds_t created_at{};
};

using liquidity_pay_event_t = liquidity_pay_event<1>;

}  // namespace credence::schema
