#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <credence/common/critical.hpp>
#include <credence/schema/encoding/scale/encoder.hpp>
#include <credence/storage/storage.hpp>

#include <memory>
#include <mutex>
#include <string_view>

namespace credence::storage {

struct rocksdb_storage_tag {};

// Conditional writes read, compare and write under `write_mutex`; the batch
// itself is atomic in RocksDB. Reads take no lock.
template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  std::unique_ptr<std::mutex> write_mutex;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder, std::string_view key) const;

  void write(ROCKSDB_NAMESPACE::WriteBatch& batch);

  store_outcome<credence::schema::intent_t> create_or_get_intent(
      const credence::schema::intent_t& intent,
      std::string_view fingerprint);
  store_outcome<credence::schema::offer_t> create_or_get_offer(
      const credence::schema::offer_t& offer,
      std::string_view fingerprint);
  store_outcome<credence::schema::envelope_t> accept_offer(
      const credence::schema::envelope_t& envelope,
      std::string_view fingerprint);
  store_outcome<credence::schema::envelope_t> update_envelope_status(
      std::string_view envelope_id,
      credence::schema::envelope_status_t status);
  store_outcome<credence::schema::settlement_t> record_settlement(
      const credence::schema::settlement_t& settlement,
      std::string_view fingerprint,
      credence::schema::envelope_status_t envelope_status,
      const credence::schema::stored_receipt_t& receipt);
  store_outcome<credence::schema::stored_receipt_t> put_receipt(
      const credence::schema::stored_receipt_t& receipt);
  store_outcome<credence::schema::underwriting_audit_t> put_underwriting_audit(
      const credence::schema::underwriting_audit_t& audit);
  store_outcome<credence::schema::liquidity_pay_event_t>
  put_liquidity_pay_event(const credence::schema::liquidity_pay_event_t& event);

  std::optional<credence::schema::intent_t> get_intent(
      std::string_view intent_id) const;
  std::optional<credence::schema::offer_t> get_offer(
      std::string_view offer_id) const;
  std::optional<credence::schema::envelope_t> get_envelope(
      std::string_view envelope_id) const;
  std::optional<credence::schema::settlement_t> get_settlement_by_envelope(
      std::string_view envelope_id) const;
  std::optional<credence::schema::stored_receipt_t> get_receipt(
      std::string_view entity_kind,
      std::string_view entity_id,
      std::string_view schema) const;
  std::optional<credence::schema::underwriting_audit_t> get_underwriting_audit(
      std::string_view offer_id) const;
  std::optional<credence::schema::liquidity_pay_event_t>
  get_liquidity_pay_event(std::string_view quote_id) const;

  std::vector<credence::schema::settlement_t> list_recent_settlements(
      credence::schema::timestamp_milliseconds_t since,
      uint32_t limit) const;
  std::vector<credence::schema::settlement_t> list_recent_settlements_for_agent(
      std::string_view agent_id,
      credence::schema::timestamp_milliseconds_t since,
      uint32_t limit) const;
  std::vector<credence::schema::liquidity_pay_event_t>
  list_recent_liquidity_pay_events(
      credence::schema::timestamp_milliseconds_t since,
      uint32_t limit) const;

  open_envelope_stats_t get_agent_open_envelope_stats(
      std::string_view agent_id,
      credence::schema::timestamp_milliseconds_t now) const;
  open_envelope_stats_t get_global_open_envelope_stats(
      credence::schema::timestamp_milliseconds_t now) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const std::string_view key) const {
  if (!database) {
    credence::common::critical("RocksDB database is not initialized");
  }
  auto key_slice = ROCKSDB_NAMESPACE::Slice{key.data(), key.size()};
  auto value = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, key_slice, &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      credence::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(credence::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

}  // namespace credence::storage
