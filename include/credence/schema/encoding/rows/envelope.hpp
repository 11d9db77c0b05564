#pragma once
#include <credence/schema/encoding/rows/row_codec.hpp>
#include <credence/schema/envelope.hpp>

#include <string>

namespace credence::schema::encoding {

template <>
struct row_codec<envelope_t> final {
  using tuple_t = std::tuple<uint16_t,
                             std::string,
                             std::string,
                             std::string,
                             std::string,
                             std::string,
                             uint8_t,
                             std::string,
                             uint64_t,
                             uint32_t,
                             uint64_t,
                             uint8_t,
                             uint64_t>;

  static tuple_t to_tuple(const envelope_t& row) {
    return tuple_t{row.version,
                   row.envelope_id,
                   row.offer_id,
                   row.agent_id,
                   row.pool_id,
                   row.provider_id,
                   to_wire(row.scope_type),
                   row.scope_id,
                   row.max_sats,
                   row.fee_bps,
                   row.exp,
                   to_wire(row.status),
                   row.issued_at};
  }

  static std::optional<envelope_t> from_tuple(const tuple_t& tuple) {
    auto scope_type =
        enum_from_wire(std::get<6>(tuple), scope_type_t::nip90);
    auto status =
        enum_from_wire(std::get<11>(tuple), envelope_status_t::defaulted);
    if (!scope_type || !status) {
      return std::nullopt;
    }
    auto row = envelope_t{};
    row.version = std::get<0>(tuple);
    row.envelope_id = std::get<1>(tuple);
    row.offer_id = std::get<2>(tuple);
    row.agent_id = std::get<3>(tuple);
    row.pool_id = std::get<4>(tuple);
    row.provider_id = std::get<5>(tuple);
    row.scope_type = *scope_type;
    row.scope_id = std::get<7>(tuple);
    row.max_sats = std::get<8>(tuple);
    row.fee_bps = std::get<9>(tuple);
    row.exp = std::get<10>(tuple);
    row.status = *status;
    row.issued_at = std::get<12>(tuple);
    return row;
  }
};

}  // namespace credence::schema::encoding
