#pragma once
#include <credence/schema/encoding/rows/row_codec.hpp>
#include <credence/schema/liquidity_pay_event.hpp>

#include <string>

namespace credence::schema::encoding {

template <>
struct row_codec<liquidity_pay_event_t> final {
  using tuple_t = std::tuple<uint16_t,
                             std::string,
                             std::string,
                             std::string,
                             std::optional<std::string>,
                             uint64_t,
                             std::string,
                             uint64_t>;

  static tuple_t to_tuple(const liquidity_pay_event_t& row) {
    return tuple_t{row.version, row.quote_id,   row.envelope_id,
                   row.status,  row.error_code, row.amount_msats,
                   row.host,    row.created_at};
  }

  static std::optional<liquidity_pay_event_t> from_tuple(
      const tuple_t& tuple) {
    auto row = liquidity_pay_event_t{};
    row.version = std::get<0>(tuple);
    row.quote_id = std::get<1>(tuple);
    row.envelope_id = std::get<2>(tuple);
    row.status = std::get<3>(tuple);
    row.error_code = std::get<4>(tuple);
    row.amount_msats = std::get<5>(tuple);
    row.host = std::get<6>(tuple);
    row.created_at = std::get<7>(tuple);
    return row;
  }
};

}  // namespace credence::schema::encoding
