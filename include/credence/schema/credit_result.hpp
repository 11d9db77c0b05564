#pragma once

#include <credence/schema/credit_error_code.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace credence::schema {

template <uint16_t Version, typename T>
struct credit_result;

/// Outcome of a protocol operation. `value` is engaged iff `code == ok`;
/// otherwise `log` carries a human-readable reason and `codespace` names the
/// operation that failed.
template <typename T>
struct credit_result<1, T> final {
  uint16_t version{1};
  credit_error_code code{credit_error_code::ok};
  std::string log;
  std::string codespace;
  std::optional<T> value;

  bool ok() const { return code == credit_error_code::ok; }
};

template <typename T>
using credit_result_t = credit_result<1, T>;

template <typename T>
credit_result_t<T> make_success(T value) {
  auto result = credit_result_t<T>{};
  result.value = std::move(value);
  return result;
}

template <typename T>
credit_result_t<T> make_failure(const credit_error_code code,
                                std::string log,
                                const std::string_view codespace = {}) {
  auto result = credit_result_t<T>{};
  result.code = code;
  result.log = std::move(log);
  result.codespace = std::string{codespace};
  return result;
}

/// Re-type a failure so it can be propagated from a helper to its caller.
template <typename T, typename U>
credit_result_t<T> forward_failure(const credit_result_t<U>& failure) {
  return make_failure<T>(failure.code, failure.log, failure.codespace);
}

}  // namespace credence::schema
