#pragma once
#include <credence/schema/encoding/rows/row_codec.hpp>
#include <credence/schema/intent.hpp>

#include <string>

namespace credence::schema::encoding {

template <>
struct row_codec<intent_t> final {
  using tuple_t = std::tuple<uint16_t,
                             std::string,
                             std::string,
                             std::string,
                             uint8_t,
                             std::string,
                             uint64_t,
                             uint64_t,
                             uint64_t>;

  static tuple_t to_tuple(const intent_t& row) {
    return tuple_t{row.version,
                   row.intent_id,
                   row.idempotency_key,
                   row.agent_id,
                   to_wire(row.scope_type),
                   row.scope_id,
                   row.max_sats,
                   row.exp,
                   row.created_at};
  }

  static std::optional<intent_t> from_tuple(const tuple_t& tuple) {
    auto scope_type =
        enum_from_wire(std::get<4>(tuple), scope_type_t::nip90);
    if (!scope_type) {
      return std::nullopt;
    }
    auto row = intent_t{};
    row.version = std::get<0>(tuple);
    row.intent_id = std::get<1>(tuple);
    row.idempotency_key = std::get<2>(tuple);
    row.agent_id = std::get<3>(tuple);
    row.scope_type = *scope_type;
    row.scope_id = std::get<5>(tuple);
    row.max_sats = std::get<6>(tuple);
    row.exp = std::get<7>(tuple);
    row.created_at = std::get<8>(tuple);
    return row;
  }
};

}  // namespace credence::schema::encoding
