#include <gtest/gtest.h>
#include <credence/receipts/signer.hpp>
#include <credence/schema/json.hpp>
#include <credence/testing/engine_fixture.hpp>

#include <algorithm>
#include <string>
#include <vector>

namespace {

using credence::schema::credit_error_code;
using credence::schema::envelope_status_t;
using credence::schema::settlement_outcome_t;
using credence::testing::engine_fixture;
using credence::testing::make_pubkey;

credence::config::policy_config small_pool_policy() {
  auto policy = credence::config::policy_config{};
  policy.underwriting_base_sats = 400;
  return policy;
}

bool has_tag(const credence::schema::label_event_t& event,
             const std::vector<std::string>& tag) {
  return std::find(event.tags.begin(), event.tags.end(), tag) !=
         event.tags.end();
}

}  // namespace

TEST(engine_settle, pays_invoice_and_records_receipt) {
  auto fixture = engine_fixture{"credence_settle_success", small_pool_policy()};
  auto issued = fixture.issue_envelope(make_pubkey(1), make_pubkey(0x90));
  const auto& envelope_id = issued.envelope.envelope_id;

  fixture.advance_seconds(60);
  auto settled = fixture.engine().settle(fixture.settle_request(envelope_id));
  ASSERT_TRUE(settled.ok()) << settled.log;
  EXPECT_FALSE(settled.value->replayed);
  EXPECT_EQ(settled.value->envelope_status, envelope_status_t::settled);

  const auto& settlement = settled.value->settlement;
  EXPECT_EQ(settlement.settlement_id.substr(0, 5), "ceps_");
  EXPECT_EQ(settlement.outcome, settlement_outcome_t::success);
  EXPECT_EQ(settlement.spent_sats, 300u);
  EXPECT_EQ(settlement.fee_sats, 2u);
  EXPECT_EQ(settlement.created_at, fixture.now());
  ASSERT_TRUE(settlement.liquidity_receipt_sha256.has_value());

  const auto& receipt = settled.value->receipt;
  EXPECT_EQ(receipt["schema"].asString(),
            "openagents.credit.envelope_settlement_receipt.v1");
  EXPECT_EQ(receipt["outcome"].asString(), "success");
  EXPECT_EQ(receipt["spent_sats"].asUInt64(), 300u);
  EXPECT_EQ(receipt["fee_sats"].asUInt64(), 2u);
  EXPECT_EQ(receipt["receipt_id"].asString().substr(0, 5), "cesr_");

  // Quote request carries the envelope ceiling and a stable idempotency key.
  ASSERT_EQ(fixture.payment().quotes.size(), 1u);
  const auto& quote = fixture.payment().quotes.front();
  EXPECT_EQ(quote.idempotency_key.rfind("cep:quote:", 0), 0u);
  EXPECT_EQ(quote.idempotency_key.size(), 34u);
  EXPECT_EQ(quote.invoice, "lnbc3000n1cep");
  EXPECT_EQ(quote.host, "provider.example");
  EXPECT_EQ(quote.max_amount_msats, 400'000u);
  EXPECT_EQ(quote.max_fee_msats, 5'000u);
  EXPECT_EQ(quote.policy_context["schema"].asString(),
            "openagents.credit.policy_context.v1");
  EXPECT_EQ(quote.policy_context["envelope_id"].asString(), envelope_id);
  ASSERT_EQ(fixture.payment().pays.size(), 1u);
  EXPECT_EQ(fixture.payment().pays.front().quote_id, "quote_1");

  auto envelope = fixture.storage().get_envelope(envelope_id);
  ASSERT_TRUE(envelope.has_value());
  EXPECT_EQ(envelope->status, envelope_status_t::settled);
  auto stored = fixture.storage().get_receipt(
      "settlement", settlement.settlement_id,
      "openagents.credit.envelope_settlement_receipt.v1");
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->receipt_id, receipt["receipt_id"].asString());
  auto pay_event = fixture.storage().get_liquidity_pay_event("quote_1");
  ASSERT_TRUE(pay_event.has_value());
  EXPECT_EQ(pay_event->status, "succeeded");
  EXPECT_EQ(pay_event->amount_msats, 300'000u);

  ASSERT_EQ(fixture.published().size(), 1u);
  const auto& label = fixture.published().front();
  EXPECT_EQ(label.kind, 1985u);
  EXPECT_EQ(label.created_at, fixture.now() / 1'000);
  EXPECT_TRUE(has_tag(label, {"l", "success", "openagents.credit"}));
  EXPECT_TRUE(has_tag(label, {"p", make_pubkey(1)}));
  EXPECT_TRUE(has_tag(label, {"p", make_pubkey(0x90)}));
  EXPECT_EQ(receipt["label_event_id"].asString(), label.id);
}

TEST(engine_settle, first_settlement_is_final) {
  auto fixture = engine_fixture{"credence_settle_replay"};
  auto issued = fixture.issue_envelope(make_pubkey(1), make_pubkey(0x90));
  const auto& envelope_id = issued.envelope.envelope_id;
  auto first = fixture.engine().settle(fixture.settle_request(envelope_id));
  ASSERT_TRUE(first.ok()) << first.log;

  fixture.advance_seconds(10);
  auto replay = fixture.engine().settle(fixture.settle_request(envelope_id));
  ASSERT_TRUE(replay.ok()) << replay.log;
  EXPECT_TRUE(replay.value->replayed);
  EXPECT_EQ(replay.value->settlement.settlement_id,
            first.value->settlement.settlement_id);
  EXPECT_EQ(replay.value->receipt, first.value->receipt);

  // A different request for the same envelope replays the stored outcome.
  auto different = fixture.engine().settle(
      fixture.settle_request(envelope_id, false, "lnbc1000n1cep"));
  ASSERT_TRUE(different.ok()) << different.log;
  EXPECT_TRUE(different.value->replayed);
  EXPECT_EQ(different.value->settlement.outcome, settlement_outcome_t::success);
  EXPECT_EQ(different.value->envelope_status, envelope_status_t::settled);

  EXPECT_EQ(fixture.payment().pays.size(), 1u);
  EXPECT_EQ(fixture.published().size(), 1u);
}

TEST(engine_settle, failed_verification_defaults_without_paying) {
  auto fixture = engine_fixture{"credence_settle_verification"};
  auto issued = fixture.issue_envelope(make_pubkey(1), make_pubkey(0x90));
  auto settled = fixture.engine().settle(
      fixture.settle_request(issued.envelope.envelope_id, false));
  ASSERT_TRUE(settled.ok()) << settled.log;
  EXPECT_EQ(settled.value->envelope_status, envelope_status_t::defaulted);
  EXPECT_EQ(settled.value->settlement.outcome, settlement_outcome_t::failed);
  EXPECT_EQ(settled.value->settlement.spent_sats, 0u);
  EXPECT_EQ(settled.value->settlement.fee_sats, 0u);

  const auto& notice = settled.value->receipt;
  EXPECT_EQ(notice["schema"].asString(), "openagents.credit.default_notice.v1");
  EXPECT_EQ(notice["reason"].asString(), "verification_failed");
  EXPECT_EQ(notice["loss_sats"].asUInt64(), 0u);
  EXPECT_EQ(notice["receipt_id"].asString().substr(0, 5), "cedn_");

  EXPECT_TRUE(fixture.payment().quotes.empty());
  ASSERT_EQ(fixture.published().size(), 1u);
  EXPECT_TRUE(has_tag(fixture.published().front(),
                      {"l", "default", "openagents.credit"}));
  auto envelope = fixture.storage().get_envelope(issued.envelope.envelope_id);
  ASSERT_TRUE(envelope.has_value());
  EXPECT_EQ(envelope->status, envelope_status_t::defaulted);
}

TEST(engine_settle, expired_envelope_defaults) {
  auto fixture = engine_fixture{"credence_settle_expired"};
  auto issued = fixture.issue_envelope(make_pubkey(1), make_pubkey(0x90));
  fixture.advance_seconds(1'801);
  // Expiry takes precedence over a failed verification.
  auto settled = fixture.engine().settle(
      fixture.settle_request(issued.envelope.envelope_id, false));
  ASSERT_TRUE(settled.ok()) << settled.log;
  EXPECT_FALSE(settled.value->replayed);
  EXPECT_EQ(settled.value->envelope_status, envelope_status_t::defaulted);
  EXPECT_EQ(settled.value->settlement.outcome, settlement_outcome_t::expired);
  EXPECT_EQ(settled.value->settlement.spent_sats, 0u);
  EXPECT_EQ(settled.value->settlement.fee_sats, 0u);
  EXPECT_EQ(settled.value->receipt["schema"].asString(),
            "openagents.credit.default_notice.v1");
  EXPECT_EQ(settled.value->receipt["reason"].asString(), "expired");
  EXPECT_TRUE(fixture.payment().quotes.empty());
  EXPECT_TRUE(fixture.payment().pays.empty());

  auto envelope = fixture.storage().get_envelope(issued.envelope.envelope_id);
  ASSERT_TRUE(envelope.has_value());
  EXPECT_EQ(envelope->status, envelope_status_t::defaulted);
}

TEST(engine_settle, failed_settlement_is_final) {
  auto fixture = engine_fixture{"credence_settle_failed_replay"};
  auto issued = fixture.issue_envelope(make_pubkey(1), make_pubkey(0x90));
  const auto& envelope_id = issued.envelope.envelope_id;
  auto failed =
      fixture.engine().settle(fixture.settle_request(envelope_id, false));
  ASSERT_TRUE(failed.ok()) << failed.log;
  EXPECT_EQ(failed.value->settlement.outcome, settlement_outcome_t::failed);

  // A later passing verification cannot reopen a defaulted envelope.
  fixture.advance_seconds(10);
  auto replay =
      fixture.engine().settle(fixture.settle_request(envelope_id, true));
  ASSERT_TRUE(replay.ok()) << replay.log;
  EXPECT_TRUE(replay.value->replayed);
  EXPECT_EQ(replay.value->settlement.outcome, settlement_outcome_t::failed);
  EXPECT_EQ(replay.value->settlement.settlement_id,
            failed.value->settlement.settlement_id);
  EXPECT_EQ(replay.value->envelope_status, envelope_status_t::defaulted);
  EXPECT_EQ(replay.value->receipt, failed.value->receipt);

  EXPECT_TRUE(fixture.payment().quotes.empty());
  EXPECT_TRUE(fixture.payment().pays.empty());
  EXPECT_EQ(fixture.published().size(), 1u);
  auto envelope = fixture.storage().get_envelope(envelope_id);
  ASSERT_TRUE(envelope.has_value());
  EXPECT_EQ(envelope->status, envelope_status_t::defaulted);
}

TEST(engine_settle, unsigned_engine_settles_without_label) {
  auto fixture = engine_fixture{"credence_settle_unsigned", {}, false};
  auto issued = fixture.issue_envelope(make_pubkey(1), make_pubkey(0x90));
  EXPECT_FALSE(issued.receipt.signature.has_value());
  auto settled = fixture.engine().settle(
      fixture.settle_request(issued.envelope.envelope_id));
  ASSERT_TRUE(settled.ok()) << settled.log;
  EXPECT_FALSE(settled.value->receipt.isMember("signature"));
  EXPECT_FALSE(settled.value->receipt.isMember("label_event"));
  EXPECT_TRUE(fixture.published().empty());
}

TEST(engine_settle, rejects_bad_requests) {
  auto fixture = engine_fixture{"credence_settle_invalid", small_pool_policy()};
  auto issued = fixture.issue_envelope(make_pubkey(1), make_pubkey(0x90));
  const auto& envelope_id = issued.envelope.envelope_id;

  auto unknown = fixture.engine().settle(fixture.settle_request("cepe_nope"));
  EXPECT_EQ(unknown.code, credit_error_code::not_found);

  auto no_hash = fixture.settle_request(envelope_id);
  no_hash.verification_receipt_sha256 = "  ";
  EXPECT_EQ(fixture.engine().settle(no_hash).code,
            credit_error_code::invalid_request);

  auto over = fixture.engine().settle(
      fixture.settle_request(envelope_id, true, "lnbc5000n1cep"));
  EXPECT_EQ(over.code, credit_error_code::invalid_request);
  EXPECT_EQ(over.log, "invoice exceeds envelope max_sats");

  auto no_amount = fixture.engine().settle(
      fixture.settle_request(envelope_id, true, "lnbc1pvjluez"));
  EXPECT_EQ(no_amount.code, credit_error_code::invalid_request);
  EXPECT_EQ(no_amount.log, "provider_invoice must be a bolt11 with amount");

  auto no_invoice = fixture.engine().settle(
      fixture.settle_request(envelope_id, true, ""));
  EXPECT_EQ(no_invoice.code, credit_error_code::invalid_request);

  auto no_host = fixture.settle_request(envelope_id);
  no_host.provider_host = "";
  EXPECT_EQ(fixture.engine().settle(no_host).code,
            credit_error_code::invalid_request);

  EXPECT_TRUE(fixture.payment().quotes.empty());
  // Nothing above consumed the envelope.
  EXPECT_TRUE(fixture.engine().settle(fixture.settle_request(envelope_id)).ok());
}

TEST(engine_settle, failed_payment_leaves_envelope_open) {
  auto fixture = engine_fixture{"credence_settle_pay_failed"};
  auto issued = fixture.issue_envelope(make_pubkey(1), make_pubkey(0x90));
  const auto& envelope_id = issued.envelope.envelope_id;

  fixture.payment().pay_status = "failed";
  fixture.payment().pay_error_code = "no_route";
  auto failed = fixture.engine().settle(fixture.settle_request(envelope_id));
  EXPECT_EQ(failed.code, credit_error_code::dependency_unavailable);
  EXPECT_EQ(failed.log, "liquidity pay failed: failed (no_route)");

  auto envelope = fixture.storage().get_envelope(envelope_id);
  ASSERT_TRUE(envelope.has_value());
  EXPECT_EQ(envelope->status, envelope_status_t::accepted);
  EXPECT_FALSE(
      fixture.storage().get_settlement_by_envelope(envelope_id).has_value());
  auto pay_event = fixture.storage().get_liquidity_pay_event("quote_1");
  ASSERT_TRUE(pay_event.has_value());
  EXPECT_EQ(pay_event->status, "failed");
  EXPECT_EQ(pay_event->error_code, std::optional<std::string>{"no_route"});

  auto health = fixture.engine().health();
  ASSERT_TRUE(health.ok());
  EXPECT_EQ(health.value->ln_pay_sample, 1u);
  EXPECT_EQ(health.value->ln_fail_count, 1u);

  // The retry reuses the same idempotency key.
  fixture.payment().pay_status = "succeeded";
  fixture.payment().pay_error_code.reset();
  auto retried = fixture.engine().settle(fixture.settle_request(envelope_id));
  ASSERT_TRUE(retried.ok()) << retried.log;
  ASSERT_EQ(fixture.payment().quotes.size(), 2u);
  EXPECT_EQ(fixture.payment().quotes[0].idempotency_key,
            fixture.payment().quotes[1].idempotency_key);
}

TEST(engine_settle, collaborator_faults_are_dependency_unavailable) {
  auto fixture = engine_fixture{"credence_settle_faults"};
  auto issued = fixture.issue_envelope(make_pubkey(1), make_pubkey(0x90));
  const auto& envelope_id = issued.envelope.envelope_id;

  fixture.payment().quote_not_found = true;
  auto no_quote = fixture.engine().settle(fixture.settle_request(envelope_id));
  EXPECT_EQ(no_quote.code, credit_error_code::dependency_unavailable);
  EXPECT_EQ(no_quote.log, "liquidity quote failed: quote not found");
  EXPECT_TRUE(fixture.payment().pays.empty());

  fixture.payment().quote_not_found = false;
  fixture.payment().throw_on_pay = true;
  auto thrown = fixture.engine().settle(fixture.settle_request(envelope_id));
  EXPECT_EQ(thrown.code, credit_error_code::dependency_unavailable);
  EXPECT_EQ(thrown.log, "liquidity pay failed: wallet unreachable");

  fixture.engine().set_payment_collaborator({});
  auto missing = fixture.engine().settle(fixture.settle_request(envelope_id));
  EXPECT_EQ(missing.code, credit_error_code::dependency_unavailable);

  EXPECT_FALSE(
      fixture.storage().get_settlement_by_envelope(envelope_id).has_value());
}

TEST(engine_settle, payment_breaker_blocks_large_settlements) {
  auto policy = credence::config::policy_config{};
  policy.ln_failure_large_settlement_cap_sats = 100;
  auto fixture = engine_fixture{"credence_settle_breaker", policy};
  for (auto i = 0; i < 5; ++i) {
    auto event = credence::schema::liquidity_pay_event_t{};
    event.quote_id = "seed_" + std::to_string(i);
    event.envelope_id = "cepe_seed";
    event.status = "failed";
    event.amount_msats = 1'000;
    event.host = "provider.example";
    event.created_at = fixture.now();
    fixture.storage().put_liquidity_pay_event(event);
  }
  auto health = fixture.engine().health();
  ASSERT_TRUE(health.ok());
  EXPECT_TRUE(health.value->breakers.halt_large_settlements);
  EXPECT_FALSE(health.value->breakers.halt_new_envelopes);

  auto large = fixture.issue_envelope(make_pubkey(1), make_pubkey(0x90));
  auto blocked = fixture.engine().settle(
      fixture.settle_request(large.envelope.envelope_id));
  EXPECT_EQ(blocked.code, credit_error_code::dependency_unavailable);
  EXPECT_EQ(blocked.log, "credit circuit breaker: halt_large_settlements");
  EXPECT_TRUE(fixture.payment().quotes.empty());

  auto small = fixture.engine().settle(fixture.settle_request(
      large.envelope.envelope_id, true, "lnbc500n1cep"));
  ASSERT_TRUE(small.ok()) << small.log;
  EXPECT_EQ(small.value->settlement.spent_sats, 50u);
}
