#include <credence/common/critical.hpp>
#include <credence/schema/encoding/rows/envelope.hpp>
#include <credence/schema/encoding/rows/intent.hpp>
#include <credence/schema/encoding/rows/liquidity_pay_event.hpp>
#include <credence/schema/encoding/rows/offer.hpp>
#include <credence/schema/encoding/rows/settlement.hpp>
#include <credence/schema/encoding/rows/stored_receipt.hpp>
#include <credence/schema/encoding/rows/underwriting_audit.hpp>
#include <credence/schema/key/builder.hpp>
#include <credence/storage/rocksdb/storage.hpp>

#include <spdlog/fmt/fmt.h>

#include <limits>
#include <memory>
#include <tuple>
#include <utility>

namespace credence::storage {

namespace detail {

using encoder_t = credence::schema::encoding::encoder<
    credence::schema::encoding::scale_encoder_tag>;
using credence::schema::encoding::row_codec;
using rocksdb_store_t = storage<rocksdb_storage_tag>;

inline constexpr auto kIntentPrefix = std::string_view{"CEP|INTENT|"};
inline constexpr auto kOfferPrefix = std::string_view{"CEP|OFFER|"};
inline constexpr auto kEnvelopePrefix = std::string_view{"CEP|ENV|"};
inline constexpr auto kOpenEnvelopePrefix = std::string_view{"CEP|OPEN|"};
inline constexpr auto kAgentOpenEnvelopePrefix =
    std::string_view{"CEP|AGENT_OPEN|"};
inline constexpr auto kSettlementPrefix = std::string_view{"CEP|SETTLE|"};
inline constexpr auto kSettlementTimePrefix =
    std::string_view{"CEP|SETTLE_TIME|"};
inline constexpr auto kAgentSettlementTimePrefix =
    std::string_view{"CEP|AGENT_SETTLE|"};
inline constexpr auto kReceiptPrefix = std::string_view{"CEP|RECEIPT|"};
inline constexpr auto kAuditPrefix = std::string_view{"CEP|AUDIT|"};
inline constexpr auto kLnPayPrefix = std::string_view{"CEP|LNPAY|"};
inline constexpr auto kLnPayTimePrefix = std::string_view{"CEP|LNPAY_TIME|"};

inline constexpr auto kOrderedWidth = std::size_t{8};

template <typename T>
using fingerprinted_t =
    std::tuple<typename row_codec<T>::tuple_t, std::string>;

std::string make_key(const std::string_view prefix, const std::string_view id) {
  return credence::schema::key::builder{}.write(prefix).write(id).str();
}

std::string receipt_key(const std::string_view entity_kind,
                        const std::string_view entity_id,
                        const std::string_view schema) {
  return credence::schema::key::builder{}
      .write(kReceiptPrefix)
      .write(entity_kind)
      .write("|")
      .write(entity_id)
      .write("|")
      .write(schema)
      .str();
}

std::string agent_prefix(const std::string_view prefix,
                         const std::string_view agent_id) {
  return credence::schema::key::builder{}.write(prefix).hash(agent_id).str();
}

std::string ordered_key(const std::string_view prefix,
                        const uint64_t timestamp,
                        const std::string_view id) {
  return credence::schema::key::builder{}
      .write(prefix)
      .write_ordered(timestamp)
      .write(id)
      .str();
}

uint64_t read_ordered(const std::string_view suffix) {
  auto value = uint64_t{0};
  for (auto i = std::size_t{0}; i < kOrderedWidth; ++i) {
    value = (value << 8) | static_cast<uint8_t>(suffix[i]);
  }
  return value;
}

template <typename T>
std::string encode_value(const T& value) {
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(value);
  return std::string{reinterpret_cast<const char*>(encoded.data()),
                     encoded.size()};
}

template <typename T>
T to_row(const typename row_codec<T>::tuple_t& tuple) {
  auto row = row_codec<T>::from_tuple(tuple);
  if (!row) {
    credence::common::critical("stored row carries an unknown enum value");
  }
  return *row;
}

template <typename T>
std::optional<std::pair<T, std::string>> load_fingerprinted(
    const rocksdb_store_t& store,
    const std::string_view key) {
  auto encoder = encoder_t{};
  auto stored = store.get<encoder_t, fingerprinted_t<T>>(encoder, key);
  if (!stored) {
    return std::nullopt;
  }
  return std::pair<T, std::string>{to_row<T>(std::get<0>(*stored)),
                                   std::get<1>(*stored)};
}

template <typename T>
std::optional<T> load_row(const rocksdb_store_t& store,
                          const std::string_view key) {
  auto encoder = encoder_t{};
  auto stored =
      store.get<encoder_t, typename row_codec<T>::tuple_t>(encoder, key);
  if (!stored) {
    return std::nullopt;
  }
  return to_row<T>(*stored);
}

template <typename T>
std::string encode_fingerprinted(const T& row,
                                 const std::string_view fingerprint) {
  return encode_value(fingerprinted_t<T>{row_codec<T>::to_tuple(row),
                                         std::string{fingerprint}});
}

template <typename T>
std::string encode_row(const T& row) {
  return encode_value(row_codec<T>::to_tuple(row));
}

void batch_put(ROCKSDB_NAMESPACE::WriteBatch& batch,
               const std::string_view key,
               const std::string_view value) {
  auto status =
      batch.Put(ROCKSDB_NAMESPACE::Slice{key.data(), key.size()},
                ROCKSDB_NAMESPACE::Slice{value.data(), value.size()});
  if (!status.ok()) {
    credence::common::critical("failed to stage RocksDB put",
                               status.ToString());
  }
}

void batch_delete(ROCKSDB_NAMESPACE::WriteBatch& batch,
                  const std::string_view key) {
  auto status = batch.Delete(ROCKSDB_NAMESPACE::Slice{key.data(), key.size()});
  if (!status.ok()) {
    credence::common::critical("failed to stage RocksDB delete",
                               status.ToString());
  }
}

std::string ordered_value(const uint64_t value) {
  return credence::schema::key::builder{}.write_ordered(value).str();
}

// Open-envelope index entries are `<prefix><exp><envelope_id>` and hold the
// envelope's max_sats, so live exposure is read from `now` onwards without
// touching expired entries or the envelope rows.
std::string global_open_key(const credence::schema::envelope_t& envelope) {
  return ordered_key(kOpenEnvelopePrefix, envelope.exp, envelope.envelope_id);
}

std::string agent_open_key(const credence::schema::envelope_t& envelope) {
  return ordered_key(agent_prefix(kAgentOpenEnvelopePrefix, envelope.agent_id),
                     envelope.exp, envelope.envelope_id);
}

void stage_open_index(ROCKSDB_NAMESPACE::WriteBatch& batch,
                      const credence::schema::envelope_t& envelope) {
  if (envelope.status == credence::schema::envelope_status_t::accepted) {
    auto value = ordered_value(envelope.max_sats);
    batch_put(batch, global_open_key(envelope), value);
    batch_put(batch, agent_open_key(envelope), value);
  } else {
    batch_delete(batch, global_open_key(envelope));
    batch_delete(batch, agent_open_key(envelope));
  }
}

ROCKSDB_NAMESPACE::DB& open_database(const rocksdb_store_t& store) {
  if (!store.database) {
    credence::common::critical("RocksDB database is not initialized");
  }
  return *store.database;
}

/// Visit the key suffixes under `prefix`, in key order or reversed. Stops
/// when `visit` returns false.
template <typename Visitor>
void scan(ROCKSDB_NAMESPACE::DB& database,
          const std::string& prefix,
          const bool reverse,
          Visitor&& visit) {
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database.NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  if (reverse) {
    iterator->SeekForPrev(prefix + std::string(kOrderedWidth + 1, '\xFF'));
  } else {
    iterator->Seek(prefix);
  }
  while (iterator->Valid()) {
    auto key =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key.starts_with(prefix)) {
      break;
    }
    if (!visit(key.substr(prefix.size()))) {
      break;
    }
    if (reverse) {
      iterator->Prev();
    } else {
      iterator->Next();
    }
  }
  if (!iterator->status().ok()) {
    credence::common::critical("RocksDB iteration failed",
                               iterator->status().ToString());
  }
}

template <typename T, typename Loader>
std::vector<T> list_recent(ROCKSDB_NAMESPACE::DB& database,
                           const std::string& prefix,
                           const credence::schema::timestamp_milliseconds_t
                               since,
                           const uint32_t limit,
                           Loader&& load) {
  auto rows = std::vector<T>{};
  if (limit == 0) {
    return rows;
  }
  scan(database, prefix, true, [&](const std::string_view suffix) {
    if (suffix.size() < kOrderedWidth) {
      return true;
    }
    if (read_ordered(suffix) < since) {
      return false;
    }
    auto row = load(suffix.substr(kOrderedWidth));
    if (!row) {
      credence::common::critical("time index points at a missing row",
                                 suffix.substr(kOrderedWidth));
    }
    rows.push_back(std::move(*row));
    return rows.size() < limit;
  });
  return rows;
}

open_envelope_stats_t open_stats(
    const rocksdb_store_t& store,
    const std::string& prefix,
    const credence::schema::timestamp_milliseconds_t now) {
  auto stats = open_envelope_stats_t{};
  if (now == std::numeric_limits<uint64_t>::max()) {
    return stats;
  }
  auto first_live = credence::schema::key::builder{}
                        .write(prefix)
                        .write_ordered(now + 1)
                        .str();
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      open_database(store).NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(first_live); iterator->Valid(); iterator->Next()) {
    auto key =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key.starts_with(prefix)) {
      break;
    }
    auto value =
        std::string_view{iterator->value().data(), iterator->value().size()};
    if (value.size() < kOrderedWidth) {
      credence::common::critical("malformed open envelope index entry");
    }
    ++stats.count;
    stats.exposure_sats += read_ordered(value);
  }
  if (!iterator->status().ok()) {
    credence::common::critical("RocksDB iteration failed",
                               iterator->status().ToString());
  }
  return stats;
}

/// Stage removal of every open-index entry that expired at or before `now`.
/// Each entry is visited once: the envelope row supplies the agent index key.
void stage_expired_open_pruning(
    ROCKSDB_NAMESPACE::WriteBatch& batch,
    const rocksdb_store_t& store,
    const credence::schema::timestamp_milliseconds_t now) {
  scan(open_database(store), std::string{kOpenEnvelopePrefix}, false,
       [&](const std::string_view suffix) {
    if (suffix.size() < kOrderedWidth || read_ordered(suffix) > now) {
      return false;
    }
    auto envelope_id = suffix.substr(kOrderedWidth);
    batch_delete(batch, ordered_key(kOpenEnvelopePrefix, read_ordered(suffix),
                                    envelope_id));
    if (auto envelope = load_fingerprinted<credence::schema::envelope_t>(
            store, make_key(kEnvelopePrefix, envelope_id))) {
      batch_delete(batch, agent_open_key(envelope->first));
    }
    return true;
  });
}

template <typename T>
store_outcome<T> create_or_get(rocksdb_store_t& store,
                               const std::string& key,
                               const T& row,
                               const std::string_view fingerprint,
                               const std::string_view kind,
                               const std::string_view id) {
  if (auto stored = load_fingerprinted<T>(store, key)) {
    if (stored->second == fingerprint) {
      return {store_status::existing, std::move(stored->first), {}};
    }
    return {store_status::conflict, std::move(stored->first),
            fmt::format("{} {} exists with different parameters", kind, id)};
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  batch_put(batch, key, encode_fingerprinted(row, fingerprint));
  store.write(batch);
  return {store_status::created, row, {}};
}

}  // namespace detail

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    credence::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);
  store.write_mutex = std::make_unique<std::mutex>();

  return store;
}

void storage<rocksdb_storage_tag>::write(ROCKSDB_NAMESPACE::WriteBatch& batch) {
  if (!database) {
    credence::common::critical("RocksDB database is not initialized");
  }
  auto status = database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}", status.ToString());
    credence::common::critical("Failed to commit RocksDB batch");
  }
}

store_outcome<credence::schema::intent_t>
storage<rocksdb_storage_tag>::create_or_get_intent(
    const credence::schema::intent_t& intent,
    const std::string_view fingerprint) {
  auto lock = std::scoped_lock{*write_mutex};
  return detail::create_or_get(
      *this, detail::make_key(detail::kIntentPrefix, intent.intent_id), intent,
      fingerprint, "intent", intent.intent_id);
}

store_outcome<credence::schema::offer_t>
storage<rocksdb_storage_tag>::create_or_get_offer(
    const credence::schema::offer_t& offer,
    const std::string_view fingerprint) {
  auto lock = std::scoped_lock{*write_mutex};
  return detail::create_or_get(
      *this, detail::make_key(detail::kOfferPrefix, offer.offer_id), offer,
      fingerprint, "offer", offer.offer_id);
}

store_outcome<credence::schema::envelope_t>
storage<rocksdb_storage_tag>::accept_offer(
    const credence::schema::envelope_t& envelope,
    const std::string_view fingerprint) {
  auto lock = std::scoped_lock{*write_mutex};
  auto envelope_key =
      detail::make_key(detail::kEnvelopePrefix, envelope.envelope_id);
  if (auto stored = detail::load_fingerprinted<credence::schema::envelope_t>(
          *this, envelope_key)) {
    if (stored->second == fingerprint) {
      return {store_status::existing, std::move(stored->first), {}};
    }
    return {store_status::conflict, std::move(stored->first),
            fmt::format("envelope {} exists with different parameters",
                        envelope.envelope_id)};
  }

  auto offer_key = detail::make_key(detail::kOfferPrefix, envelope.offer_id);
  auto offer =
      detail::load_fingerprinted<credence::schema::offer_t>(*this, offer_key);
  if (!offer) {
    return {store_status::not_found, std::nullopt, "offer not found"};
  }
  if (offer->first.status != credence::schema::offer_status_t::offered) {
    return {store_status::conflict, std::nullopt,
            "offer is not in offered status"};
  }
  auto accepted = offer->first;
  accepted.status = credence::schema::offer_status_t::accepted;

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  detail::batch_put(batch, envelope_key,
                    detail::encode_fingerprinted(envelope, fingerprint));
  detail::batch_put(batch, offer_key,
                    detail::encode_fingerprinted(accepted, offer->second));
  detail::stage_open_index(batch, envelope);
  detail::stage_expired_open_pruning(batch, *this, envelope.issued_at);
  write(batch);
  return {store_status::created, envelope, {}};
}

store_outcome<credence::schema::envelope_t>
storage<rocksdb_storage_tag>::update_envelope_status(
    const std::string_view envelope_id,
    const credence::schema::envelope_status_t status) {
  auto lock = std::scoped_lock{*write_mutex};
  auto key = detail::make_key(detail::kEnvelopePrefix, envelope_id);
  auto stored =
      detail::load_fingerprinted<credence::schema::envelope_t>(*this, key);
  if (!stored) {
    return {store_status::not_found, std::nullopt, "envelope not found"};
  }
  auto updated = stored->first;
  updated.status = status;

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  detail::batch_put(batch, key,
                    detail::encode_fingerprinted(updated, stored->second));
  detail::stage_open_index(batch, updated);
  write(batch);
  return {store_status::created, std::move(updated), {}};
}

store_outcome<credence::schema::settlement_t>
storage<rocksdb_storage_tag>::record_settlement(
    const credence::schema::settlement_t& settlement,
    const std::string_view fingerprint,
    const credence::schema::envelope_status_t envelope_status,
    const credence::schema::stored_receipt_t& receipt) {
  auto lock = std::scoped_lock{*write_mutex};
  auto settlement_key =
      detail::make_key(detail::kSettlementPrefix, settlement.envelope_id);
  if (auto stored = detail::load_fingerprinted<credence::schema::settlement_t>(
          *this, settlement_key)) {
    if (stored->second == fingerprint) {
      return {store_status::existing, std::move(stored->first), {}};
    }
    return {store_status::conflict, std::move(stored->first),
            fmt::format("envelope {} is already settled",
                        settlement.envelope_id)};
  }

  auto envelope_key =
      detail::make_key(detail::kEnvelopePrefix, settlement.envelope_id);
  auto envelope = detail::load_fingerprinted<credence::schema::envelope_t>(
      *this, envelope_key);
  if (!envelope) {
    return {store_status::not_found, std::nullopt, "envelope not found"};
  }
  if (envelope->first.status != credence::schema::envelope_status_t::accepted) {
    return {store_status::conflict, std::nullopt,
            "envelope is not in accepted status"};
  }
  auto updated = envelope->first;
  updated.status = envelope_status;

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  detail::batch_put(batch, settlement_key,
                    detail::encode_fingerprinted(settlement, fingerprint));
  detail::batch_put(batch,
                    detail::ordered_key(detail::kSettlementTimePrefix,
                                        settlement.created_at,
                                        settlement.envelope_id),
                    {});
  detail::batch_put(
      batch,
      detail::ordered_key(detail::agent_prefix(
                              detail::kAgentSettlementTimePrefix,
                              updated.agent_id),
                          settlement.created_at, settlement.envelope_id),
      {});
  detail::batch_put(batch, envelope_key,
                    detail::encode_fingerprinted(updated, envelope->second));
  detail::stage_open_index(batch, updated);
  detail::batch_put(batch,
                    detail::receipt_key(receipt.entity_kind,
                                        receipt.entity_id, receipt.schema),
                    detail::encode_row(receipt));
  write(batch);
  return {store_status::created, settlement, {}};
}

store_outcome<credence::schema::stored_receipt_t>
storage<rocksdb_storage_tag>::put_receipt(
    const credence::schema::stored_receipt_t& receipt) {
  auto lock = std::scoped_lock{*write_mutex};
  auto key = detail::receipt_key(receipt.entity_kind, receipt.entity_id,
                                 receipt.schema);
  if (auto stored =
          detail::load_row<credence::schema::stored_receipt_t>(*this, key)) {
    if (stored->canonical_json_sha256 == receipt.canonical_json_sha256) {
      return {store_status::existing, std::move(stored), {}};
    }
    return {store_status::conflict, std::move(stored),
            fmt::format("receipt for {} {} differs from the stored receipt",
                        receipt.entity_kind, receipt.entity_id)};
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  detail::batch_put(batch, key, detail::encode_row(receipt));
  write(batch);
  return {store_status::created, receipt, {}};
}

store_outcome<credence::schema::underwriting_audit_t>
storage<rocksdb_storage_tag>::put_underwriting_audit(
    const credence::schema::underwriting_audit_t& audit) {
  auto lock = std::scoped_lock{*write_mutex};
  auto key = detail::make_key(detail::kAuditPrefix, audit.offer_id);
  if (auto stored =
          detail::load_row<credence::schema::underwriting_audit_t>(*this,
                                                                   key)) {
    if (stored->canonical_json_sha256 == audit.canonical_json_sha256) {
      return {store_status::existing, std::move(stored), {}};
    }
    return {store_status::conflict, std::move(stored),
            fmt::format("underwriting audit for {} already recorded",
                        audit.offer_id)};
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  detail::batch_put(batch, key, detail::encode_row(audit));
  write(batch);
  return {store_status::created, audit, {}};
}

store_outcome<credence::schema::liquidity_pay_event_t>
storage<rocksdb_storage_tag>::put_liquidity_pay_event(
    const credence::schema::liquidity_pay_event_t& event) {
  auto lock = std::scoped_lock{*write_mutex};
  auto key = detail::make_key(detail::kLnPayPrefix, event.quote_id);
  if (auto stored =
          detail::load_row<credence::schema::liquidity_pay_event_t>(*this,
                                                                    key)) {
    auto same = stored->envelope_id == event.envelope_id &&
                stored->status == event.status &&
                stored->error_code == event.error_code &&
                stored->amount_msats == event.amount_msats &&
                stored->host == event.host;
    if (same) {
      return {store_status::existing, std::move(stored), {}};
    }
    return {store_status::conflict, std::move(stored),
            fmt::format("pay event for quote {} differs from the stored event",
                        event.quote_id)};
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  detail::batch_put(batch, key, detail::encode_row(event));
  detail::batch_put(batch,
                    detail::ordered_key(detail::kLnPayTimePrefix,
                                        event.created_at, event.quote_id),
                    {});
  write(batch);
  return {store_status::created, event, {}};
}

std::optional<credence::schema::intent_t>
storage<rocksdb_storage_tag>::get_intent(
    const std::string_view intent_id) const {
  auto stored = detail::load_fingerprinted<credence::schema::intent_t>(
      *this, detail::make_key(detail::kIntentPrefix, intent_id));
  if (!stored) {
    return std::nullopt;
  }
  return std::move(stored->first);
}

std::optional<credence::schema::offer_t> storage<rocksdb_storage_tag>::get_offer(
    const std::string_view offer_id) const {
  auto stored = detail::load_fingerprinted<credence::schema::offer_t>(
      *this, detail::make_key(detail::kOfferPrefix, offer_id));
  if (!stored) {
    return std::nullopt;
  }
  return std::move(stored->first);
}

std::optional<credence::schema::envelope_t>
storage<rocksdb_storage_tag>::get_envelope(
    const std::string_view envelope_id) const {
  auto stored = detail::load_fingerprinted<credence::schema::envelope_t>(
      *this, detail::make_key(detail::kEnvelopePrefix, envelope_id));
  if (!stored) {
    return std::nullopt;
  }
  return std::move(stored->first);
}

std::optional<credence::schema::settlement_t>
storage<rocksdb_storage_tag>::get_settlement_by_envelope(
    const std::string_view envelope_id) const {
  auto stored = detail::load_fingerprinted<credence::schema::settlement_t>(
      *this, detail::make_key(detail::kSettlementPrefix, envelope_id));
  if (!stored) {
    return std::nullopt;
  }
  return std::move(stored->first);
}

std::optional<credence::schema::stored_receipt_t>
storage<rocksdb_storage_tag>::get_receipt(
    const std::string_view entity_kind,
    const std::string_view entity_id,
    const std::string_view schema) const {
  return detail::load_row<credence::schema::stored_receipt_t>(
      *this, detail::receipt_key(entity_kind, entity_id, schema));
}

std::optional<credence::schema::underwriting_audit_t>
storage<rocksdb_storage_tag>::get_underwriting_audit(
    const std::string_view offer_id) const {
  return detail::load_row<credence::schema::underwriting_audit_t>(
      *this, detail::make_key(detail::kAuditPrefix, offer_id));
}

std::optional<credence::schema::liquidity_pay_event_t>
storage<rocksdb_storage_tag>::get_liquidity_pay_event(
    const std::string_view quote_id) const {
  return detail::load_row<credence::schema::liquidity_pay_event_t>(
      *this, detail::make_key(detail::kLnPayPrefix, quote_id));
}

std::vector<credence::schema::settlement_t>
storage<rocksdb_storage_tag>::list_recent_settlements(
    const credence::schema::timestamp_milliseconds_t since,
    const uint32_t limit) const {
  return detail::list_recent<credence::schema::settlement_t>(
      detail::open_database(*this),
      std::string{detail::kSettlementTimePrefix}, since, limit,
      [this](const std::string_view envelope_id) {
        return get_settlement_by_envelope(envelope_id);
      });
}

std::vector<credence::schema::settlement_t>
storage<rocksdb_storage_tag>::list_recent_settlements_for_agent(
    const std::string_view agent_id,
    const credence::schema::timestamp_milliseconds_t since,
    const uint32_t limit) const {
  return detail::list_recent<credence::schema::settlement_t>(
      detail::open_database(*this),
      detail::agent_prefix(detail::kAgentSettlementTimePrefix, agent_id),
      since, limit, [this](const std::string_view envelope_id) {
        return get_settlement_by_envelope(envelope_id);
      });
}

std::vector<credence::schema::liquidity_pay_event_t>
storage<rocksdb_storage_tag>::list_recent_liquidity_pay_events(
    const credence::schema::timestamp_milliseconds_t since,
    const uint32_t limit) const {
  return detail::list_recent<credence::schema::liquidity_pay_event_t>(
      detail::open_database(*this), std::string{detail::kLnPayTimePrefix},
      since, limit,
      [this](const std::string_view quote_id) {
        return get_liquidity_pay_event(quote_id);
      });
}

open_envelope_stats_t storage<rocksdb_storage_tag>::get_agent_open_envelope_stats(
    const std::string_view agent_id,
    const credence::schema::timestamp_milliseconds_t now) const {
  return detail::open_stats(
      *this, detail::agent_prefix(detail::kAgentOpenEnvelopePrefix, agent_id),
      now);
}

open_envelope_stats_t
storage<rocksdb_storage_tag>::get_global_open_envelope_stats(
    const credence::schema::timestamp_milliseconds_t now) const {
  return detail::open_stats(
      *this, std::string{detail::kOpenEnvelopePrefix}, now);
}

}  // namespace credence::storage
