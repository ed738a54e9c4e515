#include <bequest/execution/ledger.hpp>
#include <bequest/execution/vault_lock_table.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <thread>
#include <utility>

TEST(ledger_types, defaults_are_stable) {
  auto vault = bequest::schema::vault_state_t{};
  EXPECT_EQ(vault.version, 1u);
  EXPECT_EQ(vault.balance, bequest::schema::amount_t{0});
  EXPECT_FALSE(vault.claimed);
  EXPECT_FALSE(vault.heartbeat_enabled);
  EXPECT_TRUE(vault.note.empty());
  EXPECT_TRUE(bequest::schema::is_multi_beneficiary(vault));

  auto token = bequest::schema::inheritance_token_state_t{};
  EXPECT_TRUE(token.active);

  auto result = bequest::schema::ledger_result_t{};
  EXPECT_TRUE(result.ok());
  EXPECT_FALSE(result.id.has_value());
  EXPECT_TRUE(result.events.empty());

  auto stats = bequest::schema::ledger_stats_t{};
  EXPECT_EQ(stats.total_vaults, 0u);
  EXPECT_EQ(stats.total_escrowed, bequest::schema::amount_t{0});
}

TEST(ledger_types, error_codes_have_stable_names) {
  using bequest::schema::ledger_error_code;
  EXPECT_EQ(static_cast<uint32_t>(ledger_error_code::invalid_amount), 1u);
  EXPECT_EQ(static_cast<uint32_t>(ledger_error_code::not_owner), 20u);
  EXPECT_EQ(static_cast<uint32_t>(ledger_error_code::vault_not_found), 40u);
  EXPECT_EQ(static_cast<uint32_t>(ledger_error_code::value_transfer_failed),
            60u);
  EXPECT_EQ(bequest::schema::to_string(ledger_error_code::balance_overflow),
            "balance_overflow");
  EXPECT_EQ(bequest::schema::to_string(ledger_error_code::reentrant_call),
            "reentrant_call");
  EXPECT_EQ(bequest::schema::to_string(ledger_error_code::still_locked),
            "still_locked");
  EXPECT_EQ(bequest::schema::try_from_string<ledger_error_code>("not_owner"),
            ledger_error_code::not_owner);
  EXPECT_FALSE(bequest::schema::try_from_string<ledger_error_code>("nope")
                   .has_value());
  EXPECT_EQ(bequest::schema::to_string(static_cast<ledger_error_code>(999)),
            bequest::schema::kUnknownEnumName);
}

TEST(ledger_types, event_types_have_stable_names) {
  using bequest::schema::ledger_event_type_t;
  EXPECT_EQ(bequest::schema::to_string(ledger_event_type_t::vault_claimed),
            "vault_claimed");
  EXPECT_EQ(bequest::schema::try_from_string<ledger_event_type_t>(
                "heartbeat_enabled"),
            ledger_event_type_t::heartbeat_enabled);
}

TEST(ledger_types, callback_types_compile) {
  auto sink = bequest::execution::event_sink_t{
      [](const bequest::schema::ledger_event_t&) {}};
  EXPECT_TRUE(static_cast<bool>(sink));

  auto transfer = bequest::execution::value_transfer{};
  EXPECT_FALSE(static_cast<bool>(transfer.escrow));
  EXPECT_FALSE(static_cast<bool>(transfer.release));

  auto now = bequest::execution::system_time_source();
  EXPECT_GT(now(), 0u);
}

TEST(ledger_types, vault_lock_table_serializes_one_vault) {
  auto table = bequest::execution::vault_lock_table{};
  auto guard = table.acquire(1);
  ASSERT_TRUE(guard);
  EXPECT_EQ(table.size(), 1u);

  // A different vault is not blocked by the held lock.
  {
    auto other = table.acquire(2);
    EXPECT_TRUE(other);
    EXPECT_EQ(table.size(), 2u);
  }
  EXPECT_EQ(table.size(), 1u);

  auto acquired = std::atomic<bool>{false};
  auto waiter = std::thread{[&] {
    auto lock = table.acquire(1);
    acquired.store(static_cast<bool>(lock));
  }};
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  EXPECT_FALSE(acquired.load());
  guard.release();
  waiter.join();
  EXPECT_TRUE(acquired.load());
  EXPECT_EQ(table.size(), 0u);
}

TEST(ledger_types, vault_lock_table_forgets_released_ids) {
  auto table = bequest::execution::vault_lock_table{};
  for (auto vault_id = uint64_t{1}; vault_id <= 10'000; ++vault_id) {
    auto guard = table.acquire(vault_id);
    ASSERT_TRUE(guard);
  }
  EXPECT_EQ(table.size(), 0u);

  auto moved = table.acquire(7);
  auto holder = std::move(moved);
  EXPECT_FALSE(moved);
  EXPECT_TRUE(holder);
  EXPECT_EQ(table.size(), 1u);
  holder = bequest::execution::vault_lock_table::guard{};
  EXPECT_EQ(table.size(), 0u);
}

TEST(ledger_types, vault_lock_table_refuses_same_thread_reacquire) {
  auto table = bequest::execution::vault_lock_table{};
  auto guard = table.acquire(3);
  ASSERT_TRUE(guard);

  auto again = table.acquire(3);
  EXPECT_FALSE(again);
  again.release();
  EXPECT_EQ(table.size(), 1u);

  // Released locks can be taken again by the same thread.
  guard.release();
  auto fresh = table.acquire(3);
  EXPECT_TRUE(fresh);
}
