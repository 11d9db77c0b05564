#pragma once
#include <credence/schema/encoding/rows/row_codec.hpp>
#include <credence/schema/settlement.hpp>

#include <string>

namespace credence::schema::encoding {

template <>
struct row_codec<settlement_t> final {
  using tuple_t = std::tuple<uint16_t,
                             std::string,
                             std::string,
                             uint8_t,
                             uint64_t,
                             uint64_t,
                             std::string,
                             std::optional<std::string>,
                             uint64_t>;

  static tuple_t to_tuple(const settlement_t& row) {
    return tuple_t{row.version,
                   row.settlement_id,
                   row.envelope_id,
                   to_wire(row.outcome),
                   row.spent_sats,
                   row.fee_sats,
                   row.verification_receipt_sha256,
                   row.liquidity_receipt_sha256,
                   row.created_at};
  }

  static std::optional<settlement_t> from_tuple(const tuple_t& tuple) {
    auto outcome =
        enum_from_wire(std::get<3>(tuple), settlement_outcome_t::expired);
    if (!outcome) {
      return std::nullopt;
    }
    auto row = settlement_t{};
    row.version = std::get<0>(tuple);
    row.settlement_id = std::get<1>(tuple);
    row.envelope_id = std::get<2>(tuple);
    row.outcome = *outcome;
    row.spent_sats = std::get<4>(tuple);
    row.fee_sats = std::get<5>(tuple);
    row.verification_receipt_sha256 = std::get<6>(tuple);
    row.liquidity_receipt_sha256 = std::get<7>(tuple);
    row.created_at = std::get<8>(tuple);
    return row;
  }
};

}  // namespace credence::schema::encoding
