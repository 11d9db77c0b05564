#pragma once
#include <credence/schema/encoding/rows/row_codec.hpp>
#include <credence/schema/receipt.hpp>

#include <string>

namespace credence::schema::encoding {

template <>
struct row_codec<stored_receipt_t> final {
  using tuple_t = std::tuple<uint16_t,
                             std::string,
                             std::string,
                             std::string,
                             std::string,
                             std::string,
                             std::optional<std::string>,
                             std::string,
                             uint64_t>;

  static tuple_t to_tuple(const stored_receipt_t& row) {
    return tuple_t{row.version,
                   row.receipt_id,
                   row.entity_kind,
                   row.entity_id,
                   row.schema,
                   row.canonical_json_sha256,
                   row.signature_json,
                   row.receipt_json,
                   row.created_at};
  }

  static std::optional<stored_receipt_t> from_tuple(const tuple_t& tuple) {
    auto row = stored_receipt_t{};
    row.version = std::get<0>(tuple);
    row.receipt_id = std::get<1>(tuple);
    row.entity_kind = std::get<2>(tuple);
    row.entity_id = std::get<3>(tuple);
    row.schema = std::get<4>(tuple);
    row.canonical_json_sha256 = std::get<5>(tuple);
    row.signature_json = std::get<6>(tuple);
    row.receipt_json = std::get<7>(tuple);
    row.created_at = std::get<8>(tuple);
    return row;
  }
};

}  // namespace credence::schema::encoding
