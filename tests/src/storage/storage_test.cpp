#include <credence/storage/rocksdb/storage.hpp>
#include <credence/storage/storage.hpp>
#include <credence/testing/common.hpp>
#include <gtest/gtest.h>

#include <memory>
#include <string>

namespace {

using storage_t =
    credence::storage::storage<credence::storage::rocksdb_storage_tag>;
using credence::storage::store_status;

constexpr auto kNow = credence::testing::kStartMillis;

class scoped_store final {
 public:
  explicit scoped_store(const std::string_view prefix)
      : path_{credence::testing::make_db_path(prefix)},
        storage_{credence::storage::make_storage<
            credence::storage::rocksdb_storage_tag>(path_)} {}

  ~scoped_store() {
    storage_.database.reset();
    credence::testing::remove_path(path_);
  }

  storage_t& operator*() { return storage_; }
  storage_t* operator->() { return &storage_; }

 private:
  std::string path_;
  storage_t storage_;
};

credence::schema::offer_t make_offer(const std::string& id,
                                     const std::string& agent_id) {
  auto offer = credence::schema::offer_t{};
  offer.offer_id = id;
  offer.agent_id = agent_id;
  offer.pool_id = credence::testing::make_pubkey(0x50);
  offer.scope_id = "job-1";
  offer.max_sats = 400;
  offer.fee_bps = 50;
  offer.exp = kNow + 600'000;
  offer.issued_at = kNow;
  return offer;
}

credence::schema::envelope_t make_envelope(
    const std::string& id,
    const credence::schema::offer_t& offer) {
  auto envelope = credence::schema::envelope_t{};
  envelope.envelope_id = id;
  envelope.offer_id = offer.offer_id;
  envelope.agent_id = offer.agent_id;
  envelope.pool_id = offer.pool_id;
  envelope.provider_id = credence::testing::make_pubkey(0x90);
  envelope.scope_id = offer.scope_id;
  envelope.max_sats = offer.max_sats;
  envelope.fee_bps = offer.fee_bps;
  envelope.exp = offer.exp;
  envelope.issued_at = kNow;
  return envelope;
}

credence::schema::settlement_t make_settlement(
    const std::string& envelope_id,
    const credence::schema::settlement_outcome_t outcome,
    const credence::schema::timestamp_milliseconds_t created_at) {
  auto settlement = credence::schema::settlement_t{};
  settlement.settlement_id = "ceps_" + envelope_id;
  settlement.envelope_id = envelope_id;
  settlement.outcome = outcome;
  settlement.verification_receipt_sha256 = std::string(64, 'c');
  settlement.created_at = created_at;
  return settlement;
}

credence::schema::stored_receipt_t make_receipt(
    const std::string& settlement_id,
    const std::string& digest) {
  auto receipt = credence::schema::stored_receipt_t{};
  receipt.receipt_id = "cedn_" + digest.substr(0, 24);
  receipt.entity_kind = "settlement";
  receipt.entity_id = settlement_id;
  receipt.schema = "openagents.credit.default_notice.v1";
  receipt.canonical_json_sha256 = digest;
  receipt.receipt_json = R"({"schema":"openagents.credit.default_notice.v1"})";
  receipt.created_at = kNow;
  return receipt;
}

std::size_t count_keys(storage_t& storage, const std::string& prefix) {
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      storage.database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  auto count = std::size_t{0};
  for (iterator->Seek(prefix);
       iterator->Valid() && iterator->key().starts_with(prefix);
       iterator->Next()) {
    ++count;
  }
  return count;
}

/// Store an offer and accept it; returns the envelope.
credence::schema::envelope_t open_envelope(storage_t& storage,
                                           const std::string& suffix,
                                           const std::string& agent_id) {
  auto offer = make_offer("cepo_" + suffix, agent_id);
  EXPECT_EQ(storage.create_or_get_offer(offer, "fp-offer-" + suffix).status,
            store_status::created);
  auto envelope = make_envelope("cepe_" + suffix, offer);
  EXPECT_EQ(storage.accept_offer(envelope, "fp-env-" + suffix).status,
            store_status::created);
  return envelope;
}

}  // namespace

TEST(storage, intent_create_or_get_is_fingerprint_checked) {
  auto store = scoped_store{"credence_storage_intent"};
  auto intent = credence::schema::intent_t{};
  intent.intent_id = "cepi_1";
  intent.agent_id = credence::testing::make_pubkey(1);
  intent.scope_id = "job-1";
  intent.max_sats = 1'000;
  intent.exp = kNow + 60'000;
  intent.created_at = kNow;

  auto created = store->create_or_get_intent(intent, "fp-a");
  EXPECT_EQ(created.status, store_status::created);

  auto changed = intent;
  changed.max_sats = 2'000;
  auto existing = store->create_or_get_intent(changed, "fp-a");
  EXPECT_EQ(existing.status, store_status::existing);
  ASSERT_TRUE(existing.row.has_value());
  EXPECT_EQ(existing.row->max_sats, 1'000u);

  auto conflict = store->create_or_get_intent(changed, "fp-b");
  EXPECT_EQ(conflict.status, store_status::conflict);
  EXPECT_FALSE(conflict.message.empty());

  auto loaded = store->get_intent("cepi_1");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->agent_id, intent.agent_id);
  EXPECT_EQ(loaded->exp, intent.exp);
  EXPECT_FALSE(store->get_intent("cepi_2").has_value());
}

TEST(storage, accept_offer_is_exclusive) {
  auto store = scoped_store{"credence_storage_accept"};
  auto agent = credence::testing::make_pubkey(1);
  auto offer = make_offer("cepo_1", agent);

  auto missing = store->accept_offer(make_envelope("cepe_1", offer), "fp-e1");
  EXPECT_EQ(missing.status, store_status::not_found);

  ASSERT_EQ(store->create_or_get_offer(offer, "fp-o1").status,
            store_status::created);
  auto first = store->accept_offer(make_envelope("cepe_1", offer), "fp-e1");
  EXPECT_EQ(first.status, store_status::created);

  auto replay = store->accept_offer(make_envelope("cepe_1", offer), "fp-e1");
  EXPECT_EQ(replay.status, store_status::existing);

  auto second = store->accept_offer(make_envelope("cepe_2", offer), "fp-e2");
  EXPECT_EQ(second.status, store_status::conflict);
  EXPECT_FALSE(store->get_envelope("cepe_2").has_value());

  auto stored_offer = store->get_offer("cepo_1");
  ASSERT_TRUE(stored_offer.has_value());
  EXPECT_EQ(stored_offer->status, credence::schema::offer_status_t::accepted);
  EXPECT_EQ(stored_offer->max_sats, 400u);
}

TEST(storage, open_envelope_stats_follow_status_and_expiry) {
  auto store = scoped_store{"credence_storage_open"};
  auto agent = credence::testing::make_pubkey(1);
  auto other = credence::testing::make_pubkey(2);
  open_envelope(*store, "a", agent);
  open_envelope(*store, "b", agent);
  open_envelope(*store, "c", other);

  auto agent_stats = store->get_agent_open_envelope_stats(agent, kNow);
  EXPECT_EQ(agent_stats.count, 2u);
  EXPECT_EQ(agent_stats.exposure_sats, 800u);
  auto global = store->get_global_open_envelope_stats(kNow);
  EXPECT_EQ(global.count, 3u);
  EXPECT_EQ(global.exposure_sats, 1'200u);

  auto updated = store->update_envelope_status(
      "cepe_a", credence::schema::envelope_status_t::defaulted);
  EXPECT_EQ(updated.status, store_status::created);
  EXPECT_EQ(store->get_agent_open_envelope_stats(agent, kNow).count, 1u);
  EXPECT_EQ(store
                ->update_envelope_status(
                    "cepe_missing", credence::schema::envelope_status_t::settled)
                .status,
            store_status::not_found);

  // Expired envelopes no longer count, even before settlement.
  EXPECT_EQ(store->get_global_open_envelope_stats(kNow + 600'000).count, 0u);
}

TEST(storage, expired_open_envelopes_are_pruned_on_next_accept) {
  auto store = scoped_store{"credence_storage_open_prune"};
  auto agent = credence::testing::make_pubkey(1);
  open_envelope(*store, "a", agent);
  open_envelope(*store, "b", agent);
  EXPECT_EQ(count_keys(*store, "CEP|OPEN|"), 2u);

  // At exactly exp the envelopes are no longer open.
  auto expiry = kNow + 600'000;
  EXPECT_EQ(store->get_global_open_envelope_stats(expiry - 1).count, 2u);
  EXPECT_EQ(store->get_global_open_envelope_stats(expiry).count, 0u);
  EXPECT_EQ(store->get_agent_open_envelope_stats(agent, expiry).count, 0u);

  auto offer = make_offer("cepo_late", agent);
  offer.issued_at = expiry;
  offer.exp = expiry + 600'000;
  ASSERT_EQ(store->create_or_get_offer(offer, "fp-offer-late").status,
            store_status::created);
  auto late = make_envelope("cepe_late", offer);
  late.issued_at = expiry;
  ASSERT_EQ(store->accept_offer(late, "fp-env-late").status,
            store_status::created);

  EXPECT_EQ(count_keys(*store, "CEP|OPEN|"), 1u);
  EXPECT_EQ(count_keys(*store, "CEP|AGENT_OPEN|"), 1u);
  auto stats = store->get_agent_open_envelope_stats(agent, expiry);
  EXPECT_EQ(stats.count, 1u);
  EXPECT_EQ(stats.exposure_sats, 400u);

  // Settling a pruned envelope still succeeds.
  auto receipt = make_receipt("ceps_cepe_a", std::string(64, 'a'));
  EXPECT_EQ(store
                ->record_settlement(
                    make_settlement("cepe_a",
                                    credence::schema::settlement_outcome_t::
                                        expired,
                                    expiry + 1),
                    "fp-settle-a",
                    credence::schema::envelope_status_t::defaulted, receipt)
                .status,
            store_status::created);
  EXPECT_EQ(store->get_global_open_envelope_stats(expiry).count, 1u);
}

TEST(storage, record_settlement_is_first_wins) {
  auto store = scoped_store{"credence_storage_settle"};
  auto agent = credence::testing::make_pubkey(1);
  auto envelope = open_envelope(*store, "a", agent);

  auto settlement = make_settlement(
      envelope.envelope_id, credence::schema::settlement_outcome_t::failed,
      kNow + 1'000);
  auto receipt = make_receipt(settlement.settlement_id, std::string(64, 'a'));
  auto first = store->record_settlement(
      settlement, "fp-s1", credence::schema::envelope_status_t::defaulted,
      receipt);
  EXPECT_EQ(first.status, store_status::created);

  auto stored_envelope = store->get_envelope(envelope.envelope_id);
  ASSERT_TRUE(stored_envelope.has_value());
  EXPECT_EQ(stored_envelope->status,
            credence::schema::envelope_status_t::defaulted);
  EXPECT_EQ(store->get_agent_open_envelope_stats(agent, kNow).count, 0u);
  EXPECT_TRUE(store
                  ->get_receipt("settlement", settlement.settlement_id,
                                "openagents.credit.default_notice.v1")
                  .has_value());

  auto same = store->record_settlement(
      settlement, "fp-s1", credence::schema::envelope_status_t::defaulted,
      receipt);
  EXPECT_EQ(same.status, store_status::existing);

  auto other = settlement;
  other.outcome = credence::schema::settlement_outcome_t::success;
  auto conflict = store->record_settlement(
      other, "fp-s2", credence::schema::envelope_status_t::settled, receipt);
  EXPECT_EQ(conflict.status, store_status::conflict);
  ASSERT_TRUE(conflict.row.has_value());
  EXPECT_EQ(conflict.row->outcome,
            credence::schema::settlement_outcome_t::failed);

  auto missing = store->record_settlement(
      make_settlement("cepe_missing",
                      credence::schema::settlement_outcome_t::failed, kNow),
      "fp-s3", credence::schema::envelope_status_t::defaulted, receipt);
  EXPECT_EQ(missing.status, store_status::not_found);
}

TEST(storage, recent_settlements_are_newest_first_and_bounded) {
  auto store = scoped_store{"credence_storage_recent"};
  auto agent = credence::testing::make_pubkey(1);
  auto other = credence::testing::make_pubkey(2);
  auto suffixes = std::vector<std::string>{"a", "b", "c", "d"};
  for (std::size_t i = 0; i < suffixes.size(); ++i) {
    auto owner = i == 3 ? other : agent;
    auto envelope = open_envelope(*store, suffixes[i], owner);
    auto settlement = make_settlement(
        envelope.envelope_id, credence::schema::settlement_outcome_t::success,
        kNow + i * 1'000);
    ASSERT_EQ(store
                  ->record_settlement(
                      settlement, "fp-" + suffixes[i],
                      credence::schema::envelope_status_t::settled,
                      make_receipt(settlement.settlement_id,
                                   std::string(64, 'a' + static_cast<char>(i))))
                  .status,
              store_status::created);
  }

  auto all = store->list_recent_settlements(kNow, 10);
  ASSERT_EQ(all.size(), 4u);
  EXPECT_EQ(all[0].envelope_id, "cepe_d");
  EXPECT_EQ(all[3].envelope_id, "cepe_a");

  auto limited = store->list_recent_settlements(kNow, 2);
  ASSERT_EQ(limited.size(), 2u);
  EXPECT_EQ(limited[1].envelope_id, "cepe_c");

  auto since = store->list_recent_settlements(kNow + 2'000, 10);
  EXPECT_EQ(since.size(), 2u);

  auto for_agent = store->list_recent_settlements_for_agent(agent, kNow, 10);
  ASSERT_EQ(for_agent.size(), 3u);
  EXPECT_EQ(for_agent[0].envelope_id, "cepe_c");
  EXPECT_TRUE(
      store->list_recent_settlements_for_agent(agent, kNow, 0).empty());
}

TEST(storage, receipts_are_write_once_by_digest) {
  auto store = scoped_store{"credence_storage_receipt"};
  auto receipt = make_receipt("ceps_1", std::string(64, 'a'));
  EXPECT_EQ(store->put_receipt(receipt).status, store_status::created);
  EXPECT_EQ(store->put_receipt(receipt).status, store_status::existing);

  auto changed = make_receipt("ceps_1", std::string(64, 'b'));
  auto conflict = store->put_receipt(changed);
  EXPECT_EQ(conflict.status, store_status::conflict);
  ASSERT_TRUE(conflict.row.has_value());
  EXPECT_EQ(conflict.row->canonical_json_sha256, std::string(64, 'a'));

  auto loaded = store->get_receipt("settlement", "ceps_1",
                                   "openagents.credit.default_notice.v1");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->receipt_json, receipt.receipt_json);
  EXPECT_FALSE(store
                   ->get_receipt("settlement", "ceps_1",
                                 "openagents.credit.envelope_settlement_"
                                 "receipt.v1")
                   .has_value());
}

TEST(storage, pay_events_and_audits_round_trip) {
  auto store = scoped_store{"credence_storage_events"};
  for (auto i = 0; i < 3; ++i) {
    auto event = credence::schema::liquidity_pay_event_t{};
    event.quote_id = "quote_" + std::to_string(i);
    event.envelope_id = "cepe_a";
    event.status = i == 1 ? "failed" : "succeeded";
    if (i == 1) {
      event.error_code = "no_route";
    }
    event.amount_msats = 300'000;
    event.host = "provider.example";
    event.created_at = kNow + static_cast<uint64_t>(i) * 1'000;
    EXPECT_EQ(store->put_liquidity_pay_event(event).status,
              store_status::created);
    EXPECT_EQ(store->put_liquidity_pay_event(event).status,
              store_status::existing);
  }
  auto events = store->list_recent_liquidity_pay_events(kNow, 10);
  ASSERT_EQ(events.size(), 3u);
  EXPECT_EQ(events[0].quote_id, "quote_2");
  EXPECT_EQ(events[1].error_code, std::optional<std::string>{"no_route"});

  auto audit = credence::schema::underwriting_audit_t{};
  audit.offer_id = "cepo_1";
  audit.canonical_json_sha256 = std::string(64, 'e');
  audit.audit_json = R"({"offerId":"cepo_1"})";
  audit.created_at = kNow;
  EXPECT_EQ(store->put_underwriting_audit(audit).status, store_status::created);
  auto loaded = store->get_underwriting_audit("cepo_1");
  ASSERT_TRUE(loaded.has_value());
  EXPECT_EQ(loaded->audit_json, audit.audit_json);
}
