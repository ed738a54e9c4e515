#include <bequest/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <limits>
#include <vector>

namespace {

using bequest::schema::account_id_t;
using bequest::schema::amount_t;
using bequest::schema::ledger_error_code;
using bequest::schema::ledger_event_type_t;
using bequest::testing::kDay;
using bequest::testing::ledger_fixture;
using bequest::testing::make_account;

uint32_t code_of(const ledger_error_code code) {
  return static_cast<uint32_t>(code);
}

}  // namespace

TEST(ledger_vault, create_vault_escrows_and_indexes) {
  auto fixture = ledger_fixture{"bequest_vault_create"};
  auto owner = make_account("alice");
  auto heir = make_account("bob");
  auto unlock_time = fixture.days_from_now(365);

  auto result =
      fixture.ledger().create_vault(owner, heir, unlock_time, amount_t{1000});
  ASSERT_TRUE(result.ok()) << result.log;
  ASSERT_TRUE(result.id.has_value());
  EXPECT_EQ(*result.id, 1u);
  EXPECT_EQ(result.codespace, "bequest.ledger");
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, ledger_event_type_t::vault_created);
  EXPECT_EQ(result.events[0].actor, owner);
  ASSERT_TRUE(result.events[0].counterparty.has_value());
  EXPECT_EQ(*result.events[0].counterparty, heir);
  ASSERT_TRUE(result.events[0].amount.has_value());
  EXPECT_EQ(*result.events[0].amount, amount_t{1000});

  auto vault = fixture.ledger().vault_details(1);
  ASSERT_TRUE(vault.has_value());
  EXPECT_EQ(vault->owner, owner);
  EXPECT_EQ(vault->beneficiary, heir);
  EXPECT_EQ(vault->balance, amount_t{1000});
  EXPECT_EQ(vault->unlock_time, unlock_time);
  EXPECT_EQ(vault->created_at, bequest::testing::kStartTime);
  EXPECT_FALSE(vault->claimed);
  EXPECT_FALSE(vault->heartbeat_enabled);

  EXPECT_EQ(fixture.ledger().owner_vaults(owner),
            std::vector<bequest::schema::vault_id_t>{1});
  EXPECT_EQ(fixture.ledger().beneficiary_vaults(heir),
            std::vector<bequest::schema::vault_id_t>{1});
  EXPECT_TRUE(fixture.ledger().vault_beneficiaries(1).empty());

  auto escrows = fixture.transfer().escrows();
  ASSERT_EQ(escrows.size(), 1u);
  EXPECT_EQ(escrows[0].from, owner);
  EXPECT_EQ(escrows[0].amount, amount_t{1000});
  EXPECT_EQ(fixture.published().size(), 1u);
}

TEST(ledger_vault, create_vault_rejects_invalid_input_in_order) {
  auto fixture = ledger_fixture{"bequest_vault_validation"};
  auto owner = make_account("alice");
  auto heir = make_account("bob");
  auto& ledger = fixture.ledger();

  // Zero amount is reported before the null beneficiary.
  auto result = ledger.create_vault(owner, bequest::schema::kNoSingleBeneficiary,
                                    fixture.days_from_now(1), amount_t{0});
  EXPECT_EQ(result.code, code_of(ledger_error_code::invalid_amount));
  EXPECT_EQ(result.log, "invalid_amount");

  result = ledger.create_vault(owner, bequest::schema::kNoSingleBeneficiary,
                               fixture.clock().now(), amount_t{5});
  EXPECT_EQ(result.code, code_of(ledger_error_code::invalid_beneficiary));

  result = ledger.create_vault(owner, heir, fixture.clock().now(), amount_t{5});
  EXPECT_EQ(result.code, code_of(ledger_error_code::invalid_unlock_time));

  EXPECT_TRUE(result.events.empty());
  EXPECT_TRUE(fixture.transfer().escrows().empty());
  EXPECT_TRUE(fixture.published().empty());
  EXPECT_EQ(ledger.stats().total_vaults, 0u);
}

TEST(ledger_vault, failed_escrow_creates_nothing) {
  auto fixture = ledger_fixture{"bequest_vault_escrow_failure"};
  auto owner = make_account("alice");
  fixture.transfer().fail_escrow(true);

  auto result = fixture.ledger().create_vault(
      owner, make_account("bob"), fixture.days_from_now(10), amount_t{50});
  EXPECT_EQ(result.code, code_of(ledger_error_code::value_transfer_failed));
  EXPECT_FALSE(fixture.ledger().vault_details(1).has_value());
  EXPECT_TRUE(fixture.ledger().owner_vaults(owner).empty());
  EXPECT_TRUE(fixture.published().empty());
}

TEST(ledger_vault, multi_beneficiary_validation_order) {
  auto fixture = ledger_fixture{"bequest_vault_multi_validation"};
  auto owner = make_account("alice");
  auto a = make_account("a");
  auto b = make_account("b");
  auto later = fixture.days_from_now(30);
  auto& ledger = fixture.ledger();

  auto result = ledger.create_multi_beneficiary_vault(owner, {a, b}, {100},
                                                      later, amount_t{0});
  EXPECT_EQ(result.code, code_of(ledger_error_code::arity_mismatch));

  result = ledger.create_multi_beneficiary_vault(owner, {}, {}, later,
                                                 amount_t{10});
  EXPECT_EQ(result.code, code_of(ledger_error_code::empty_beneficiary_list));

  result = ledger.create_multi_beneficiary_vault(
      owner, {a, bequest::schema::kNoSingleBeneficiary}, {50, 50}, later,
      amount_t{10});
  EXPECT_EQ(result.code, code_of(ledger_error_code::invalid_beneficiary));

  result = ledger.create_multi_beneficiary_vault(owner, {a, b}, {50, 49},
                                                 later, amount_t{10});
  EXPECT_EQ(result.code, code_of(ledger_error_code::percentage_sum_invalid));

  result = ledger.create_multi_beneficiary_vault(owner, {a, b}, {60, 41},
                                                 later, amount_t{10});
  EXPECT_EQ(result.code, code_of(ledger_error_code::percentage_sum_invalid));

  result = ledger.create_multi_beneficiary_vault(
      owner, {a, b}, {50, 50}, fixture.clock().now(), amount_t{0});
  EXPECT_EQ(result.code, code_of(ledger_error_code::invalid_unlock_time));

  result = ledger.create_multi_beneficiary_vault(owner, {a, b}, {50, 50},
                                                 later, amount_t{0});
  EXPECT_EQ(result.code, code_of(ledger_error_code::invalid_amount));

  EXPECT_EQ(ledger.stats().total_vaults, 0u);
}

TEST(ledger_vault, multi_beneficiary_vault_records_shares) {
  auto fixture = ledger_fixture{"bequest_vault_multi"};
  auto owner = make_account("alice");
  auto a = make_account("a");
  auto b = make_account("b");
  auto c = make_account("c");

  auto result = fixture.ledger().create_multi_beneficiary_vault(
      owner, {a, b, c}, {50, 30, 20}, fixture.days_from_now(30),
      amount_t{900});
  ASSERT_TRUE(result.ok()) << result.log;
  auto vault_id = *result.id;
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type,
            ledger_event_type_t::multi_beneficiary_vault_created);

  auto vault = fixture.ledger().vault_details(vault_id);
  ASSERT_TRUE(vault.has_value());
  EXPECT_TRUE(bequest::schema::is_multi_beneficiary(*vault));

  auto shares = fixture.ledger().vault_beneficiaries(vault_id);
  ASSERT_EQ(shares.size(), 3u);
  EXPECT_EQ(shares[0].beneficiary, a);
  EXPECT_EQ(shares[0].percentage, 50u);
  EXPECT_EQ(shares[1].beneficiary, b);
  EXPECT_EQ(shares[1].percentage, 30u);
  EXPECT_EQ(shares[2].beneficiary, c);
  EXPECT_EQ(shares[2].percentage, 20u);
  for (const auto& share : shares) {
    EXPECT_EQ(share.vault_id, vault_id);
  }

  for (const auto& beneficiary : {a, b, c}) {
    EXPECT_EQ(fixture.ledger().beneficiary_vaults(beneficiary),
              std::vector<bequest::schema::vault_id_t>{vault_id});
  }
}

TEST(ledger_vault, add_funds_and_extend_are_owner_only) {
  auto fixture = ledger_fixture{"bequest_vault_owner_ops"};
  auto owner = make_account("alice");
  auto stranger = make_account("mallory");
  auto unlock_time = fixture.days_from_now(10);
  auto vault_id =
      fixture.create_vault(owner, make_account("bob"), unlock_time, amount_t{100});
  auto& ledger = fixture.ledger();

  EXPECT_EQ(ledger.add_funds(owner, 99, amount_t{1}).code,
            code_of(ledger_error_code::vault_not_found));
  EXPECT_EQ(ledger.add_funds(stranger, vault_id, amount_t{1}).code,
            code_of(ledger_error_code::not_owner));
  EXPECT_EQ(ledger.add_funds(owner, vault_id, amount_t{0}).code,
            code_of(ledger_error_code::invalid_amount));

  auto funded = ledger.add_funds(owner, vault_id, amount_t{25});
  ASSERT_TRUE(funded.ok()) << funded.log;
  EXPECT_EQ(ledger.vault_details(vault_id)->balance, amount_t{125});

  EXPECT_EQ(ledger.extend_vault_time(stranger, vault_id, unlock_time + 1).code,
            code_of(ledger_error_code::not_owner));
  EXPECT_EQ(ledger.extend_vault_time(owner, vault_id, unlock_time).code,
            code_of(ledger_error_code::time_not_later));
  EXPECT_EQ(ledger.extend_vault_time(owner, vault_id, unlock_time - 1).code,
            code_of(ledger_error_code::time_not_later));

  auto extended = ledger.extend_vault_time(owner, vault_id, unlock_time + kDay);
  ASSERT_TRUE(extended.ok());
  ASSERT_EQ(extended.events.size(), 1u);
  EXPECT_EQ(extended.events[0].type, ledger_event_type_t::vault_extended);
  EXPECT_EQ(ledger.vault_details(vault_id)->unlock_time, unlock_time + kDay);
}

TEST(ledger_vault, update_beneficiary_filters_stale_index_entries) {
  auto fixture = ledger_fixture{"bequest_vault_update_beneficiary"};
  auto owner = make_account("alice");
  auto old_heir = make_account("bob");
  auto new_heir = make_account("carol");
  auto vault_id = fixture.create_vault(owner, old_heir,
                                       fixture.days_from_now(10), amount_t{10});
  auto& ledger = fixture.ledger();

  EXPECT_EQ(ledger.update_beneficiary(owner, vault_id,
                                      bequest::schema::kNoSingleBeneficiary)
                .code,
            code_of(ledger_error_code::invalid_beneficiary));
  EXPECT_EQ(ledger.update_beneficiary(old_heir, vault_id, new_heir).code,
            code_of(ledger_error_code::not_owner));

  auto result = ledger.update_beneficiary(owner, vault_id, new_heir);
  ASSERT_TRUE(result.ok()) << result.log;
  ASSERT_EQ(result.events.size(), 1u);
  EXPECT_EQ(result.events[0].type, ledger_event_type_t::beneficiary_updated);

  EXPECT_EQ(ledger.vault_details(vault_id)->beneficiary, new_heir);
  EXPECT_TRUE(ledger.beneficiary_vaults(old_heir).empty());
  EXPECT_EQ(ledger.beneficiary_vaults(new_heir),
            std::vector<bequest::schema::vault_id_t>{vault_id});

  // Switching back re-lists the vault for the first beneficiary once.
  ASSERT_TRUE(ledger.update_beneficiary(owner, vault_id, old_heir).ok());
  EXPECT_EQ(ledger.beneficiary_vaults(old_heir),
            std::vector<bequest::schema::vault_id_t>{vault_id});
  EXPECT_TRUE(ledger.beneficiary_vaults(new_heir).empty());
}

TEST(ledger_vault, update_beneficiary_rejects_multi_beneficiary_vaults) {
  auto fixture = ledger_fixture{"bequest_vault_update_multi"};
  auto owner = make_account("alice");
  auto result = fixture.ledger().create_multi_beneficiary_vault(
      owner, {make_account("a"), make_account("b")}, {70, 30},
      fixture.days_from_now(5), amount_t{10});
  ASSERT_TRUE(result.ok());

  EXPECT_EQ(fixture.ledger()
                .update_beneficiary(owner, *result.id, make_account("c"))
                .code,
            code_of(ledger_error_code::cannot_update_multi_beneficiary_vault));
}

TEST(ledger_vault, set_message_replaces_note) {
  auto fixture = ledger_fixture{"bequest_vault_message"};
  auto owner = make_account("alice");
  auto vault_id = fixture.create_vault(owner, make_account("bob"),
                                       fixture.days_from_now(3), amount_t{1});

  EXPECT_EQ(fixture.ledger().set_message(make_account("bob"), vault_id, "hi").code,
            code_of(ledger_error_code::not_owner));
  ASSERT_TRUE(fixture.ledger().set_message(owner, vault_id, "first").ok());
  auto result = fixture.ledger().set_message(owner, vault_id, "second");
  ASSERT_TRUE(result.ok());
  EXPECT_EQ(result.events[0].type, ledger_event_type_t::message_updated);
  EXPECT_EQ(fixture.ledger().vault_details(vault_id)->note, "second");
}

TEST(ledger_vault, queries_report_time_and_stats) {
  auto fixture = ledger_fixture{"bequest_vault_queries"};
  auto owner = make_account("alice");
  auto other = make_account("dave");
  auto first = fixture.create_vault(owner, make_account("bob"),
                                    fixture.days_from_now(2), amount_t{40});
  auto second = fixture.create_vault(other, make_account("bob"),
                                     fixture.days_from_now(4), amount_t{60});
  auto third = fixture.create_vault(owner, make_account("erin"),
                                    fixture.days_from_now(6), amount_t{5});
  auto& ledger = fixture.ledger();

  EXPECT_EQ(ledger.owner_vaults(owner),
            (std::vector<bequest::schema::vault_id_t>{first, third}));
  EXPECT_EQ(ledger.owner_vaults(other),
            std::vector<bequest::schema::vault_id_t>{second});
  EXPECT_EQ(ledger.beneficiary_vaults(make_account("bob")),
            (std::vector<bequest::schema::vault_id_t>{first, second}));
  EXPECT_TRUE(ledger.owner_vaults(make_account("nobody")).empty());

  EXPECT_EQ(ledger.time_until_unlock(first), 2 * kDay);
  fixture.clock().advance(3 * kDay);
  EXPECT_EQ(ledger.time_until_unlock(first), 0u);
  EXPECT_EQ(ledger.time_until_unlock(second), kDay);
  EXPECT_FALSE(ledger.time_until_unlock(42).has_value());
  EXPECT_FALSE(ledger.vault_details(42).has_value());
  EXPECT_FALSE(ledger.token_details(42).has_value());

  auto stats = ledger.stats();
  EXPECT_EQ(stats.total_vaults, 3u);
  EXPECT_EQ(stats.total_tokens, 0u);
  EXPECT_EQ(stats.total_escrowed, amount_t{105});
  EXPECT_EQ(stats.claimed_vaults, 0u);
  EXPECT_EQ(stats.heartbeat_vaults, 0u);
}

TEST(ledger_vault, failed_top_up_escrow_leaves_balance_unchanged) {
  auto fixture = ledger_fixture{"bequest_vault_top_up_failure"};
  auto owner = make_account("alice");
  auto vault_id = fixture.create_vault(owner, make_account("bob"),
                                       fixture.days_from_now(10), amount_t{40});
  auto& ledger = fixture.ledger();
  auto published_before = fixture.published().size();

  fixture.transfer().fail_escrow(true);
  EXPECT_EQ(ledger.add_funds(owner, vault_id, amount_t{5}).code,
            code_of(ledger_error_code::value_transfer_failed));
  EXPECT_EQ(ledger.vault_details(vault_id)->balance, amount_t{40});
  EXPECT_EQ(fixture.published().size(), published_before);

  fixture.transfer().fail_escrow(false);
  ASSERT_TRUE(ledger.add_funds(owner, vault_id, amount_t{5}).ok());
  EXPECT_EQ(ledger.vault_details(vault_id)->balance, amount_t{45});
}

TEST(ledger_vault, add_funds_refuses_to_wrap_the_balance) {
  auto fixture = ledger_fixture{"bequest_vault_overflow"};
  auto owner = make_account("alice");
  auto max = std::numeric_limits<amount_t>::max();
  auto vault_id = fixture.create_vault(
      owner, make_account("bob"), fixture.days_from_now(10), amount_t{max - 1});
  auto& ledger = fixture.ledger();
  auto escrows_before = fixture.transfer().escrows().size();

  EXPECT_EQ(ledger.add_funds(owner, vault_id, amount_t{2}).code,
            code_of(ledger_error_code::balance_overflow));
  EXPECT_EQ(ledger.add_funds(owner, vault_id, max).code,
            code_of(ledger_error_code::balance_overflow));
  EXPECT_EQ(fixture.transfer().escrows().size(), escrows_before);
  EXPECT_EQ(ledger.vault_details(vault_id)->balance, amount_t{max - 1});

  ASSERT_TRUE(ledger.add_funds(owner, vault_id, amount_t{1}).ok());
  EXPECT_EQ(ledger.vault_details(vault_id)->balance, max);
  EXPECT_EQ(ledger.add_funds(owner, vault_id, amount_t{1}).code,
            code_of(ledger_error_code::balance_overflow));
}
