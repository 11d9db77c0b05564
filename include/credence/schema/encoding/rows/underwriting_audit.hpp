#pragma once
#include <credence/schema/encoding/rows/row_codec.hpp>
#include <credence/schema/underwriting_audit.hpp>

#include <string>

namespace credence::schema::encoding {

template <>
struct row_codec<underwriting_audit_t> final {
  using tuple_t =
      std::tuple<uint16_t, std::string, std::string, std::string, uint64_t>;

  static tuple_t to_tuple(const underwriting_audit_t& row) {
    return tuple_t{row.version, row.offer_id, row.canonical_json_sha256,
                   row.audit_json, row.created_at};
  }

  static std::optional<underwriting_audit_t> from_tuple(const tuple_t& tuple) {
    auto row = underwriting_audit_t{};
    row.version = std::get<0>(tuple);
    row.offer_id = std::get<1>(tuple);
    row.canonical_json_sha256 = std::get<2>(tuple);
    row.audit_json = std::get<3>(tuple);
    row.created_at = std::get<4>(tuple);
    return row;
  }
};

}  // namespace credence::schema::encoding
