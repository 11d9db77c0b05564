#include <credence/lightning/invoice.hpp>

#include <limits>
#include <string>

namespace credence::lightning {

namespace {

bool is_digit(const char c) { return c >= '0' && c <= '9'; }
bool is_alpha(const char c) { return c >= 'a' && c <= 'z'; }

// Amount of one unit of the whole bitcoin amount, in millisatoshis.
inline constexpr auto kMsatsPerBitcoin = uint64_t{100'000'000'000};

}  // namespace

std::optional<credence::schema::msats_t> bolt11_amount_msats(
    const std::string_view invoice) {
  auto lowered = credence::schema::to_lower_ascii(
      credence::schema::trim(invoice));
  auto separator = lowered.rfind('1');
  if (separator == std::string::npos || separator < 2) {
    return std::nullopt;
  }
  auto hrp = std::string_view{lowered}.substr(0, separator);
  if (!hrp.starts_with("ln")) {
    return std::nullopt;
  }
  hrp.remove_prefix(2);

  // Currency prefix (bc, tb, bcrt, ...) runs up to the first digit.
  auto cursor = std::size_t{0};
  while (cursor < hrp.size() && is_alpha(hrp[cursor])) {
    ++cursor;
  }
  if (cursor == 0 || cursor == hrp.size()) {
    return std::nullopt;
  }

  auto amount = uint64_t{0};
  auto digits = std::size_t{0};
  while (cursor < hrp.size() && is_digit(hrp[cursor])) {
    auto digit = static_cast<uint64_t>(hrp[cursor] - '0');
    if (amount > (std::numeric_limits<uint64_t>::max() - digit) / 10) {
      return std::nullopt;
    }
    amount = amount * 10 + digit;
    ++cursor;
    ++digits;
  }
  if (digits == 0 || amount == 0) {
    return std::nullopt;
  }

  auto multiplier = uint64_t{kMsatsPerBitcoin};
  auto divisor = uint64_t{1};
  if (cursor < hrp.size()) {
    switch (hrp[cursor]) {
      case 'm':
        multiplier = 100'000'000;
        break;
      case 'u':
        multiplier = 100'000;
        break;
      case 'n':
        multiplier = 100;
        break;
      case 'p':
        multiplier = 1;
        divisor = 10;
        break;
      default:
        return std::nullopt;
    }
    ++cursor;
  }
  if (cursor != hrp.size()) {
    return std::nullopt;
  }
  if (divisor != 1) {
    if (amount % divisor != 0) {
      return std::nullopt;
    }
    return amount / divisor;
  }
  if (amount > std::numeric_limits<uint64_t>::max() / multiplier) {
    return std::nullopt;
  }
  return amount * multiplier;
}

}  // namespace credence::lightning
