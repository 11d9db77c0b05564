#include <gtest/gtest.h>
#include <credence/lightning/invoice.hpp>

TEST(bolt11_amount, decodes_each_multiplier) {
  EXPECT_EQ(credence::lightning::bolt11_amount_msats("lnbc3000n1cep"),
            300'000u);
  EXPECT_EQ(credence::lightning::bolt11_amount_msats("lnbc2500u1pvjluez"),
            250'000'000u);
  EXPECT_EQ(credence::lightning::bolt11_amount_msats("lnbc1m1pvjluez"),
            100'000'000u);
  EXPECT_EQ(credence::lightning::bolt11_amount_msats("lntb10p1pvjluez"), 1u);
  EXPECT_EQ(credence::lightning::bolt11_amount_msats("lnbc21pvjluez"),
            200'000'000'000u);
}

TEST(bolt11_amount, normalises_case_and_whitespace) {
  EXPECT_EQ(credence::lightning::bolt11_amount_msats("  LNBC3000N1CEP \n"),
            300'000u);
  EXPECT_EQ(credence::lightning::bolt11_amount_msats("lnbcrt500n1cep"),
            50'000u);
}

TEST(bolt11_amount, rejects_invoices_without_usable_amount) {
  EXPECT_FALSE(credence::lightning::bolt11_amount_msats("").has_value());
  EXPECT_FALSE(
      credence::lightning::bolt11_amount_msats("lnbc1pvjluez").has_value());
  EXPECT_FALSE(
      credence::lightning::bolt11_amount_msats("lnbc0n1cep").has_value());
  EXPECT_FALSE(
      credence::lightning::bolt11_amount_msats("bc3000n1cep").has_value());
  EXPECT_FALSE(
      credence::lightning::bolt11_amount_msats("ln3000n1cep").has_value());
  EXPECT_FALSE(
      credence::lightning::bolt11_amount_msats("lnbc3000x1cep").has_value());
  EXPECT_FALSE(
      credence::lightning::bolt11_amount_msats("lnbc15p1cep").has_value());
  EXPECT_FALSE(credence::lightning::bolt11_amount_msats(
                   "lnbc99999999999999999999n1cep")
                   .has_value());
  EXPECT_FALSE(
      credence::lightning::bolt11_amount_msats("lnbc300000000000m1cep")
          .has_value());
}
