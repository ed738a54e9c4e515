#pragma once

#include <bequest/execution/event_sink.hpp>
#include <bequest/execution/time_source.hpp>
#include <bequest/execution/value_transfer.hpp>
#include <bequest/execution/vault_lock_table.hpp>
#include <bequest/schema/beneficiary_share.hpp>
#include <bequest/schema/encoding/scale/encoder.hpp>
#include <bequest/schema/heartbeat.hpp>
#include <bequest/schema/inheritance_token_state.hpp>
#include <bequest/schema/ledger_error_code.hpp>
#include <bequest/schema/ledger_event.hpp>
#include <bequest/schema/ledger_result.hpp>
#include <bequest/schema/ledger_stats.hpp>
#include <bequest/schema/primitives.hpp>
#include <bequest/schema/vault_state.hpp>
#include <bequest/storage/rocksdb/storage.hpp>
#include <atomic>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace bequest::execution {

inline constexpr auto kLedgerCodespace = std::string_view{"bequest.ledger"};

/// Time-locked custody ledger.
///
/// Owns every vault, share, token and index row in the backing store and is
/// the only component allowed to mutate them. Calls on the same vault are
/// serialized by a per-vault lock; calls on different vaults run
/// concurrently. Every successful mutation is committed as one atomic write
/// together with its index rows and the events it emits. Events are then
/// handed to the installed sink in commit order after the vault lock is
/// released, so the sink may call back into the ledger.
///
/// `caller` arguments are identities already authenticated by the transport;
/// the ledger only compares them with stored fields.
class ledger final {
 public:
  /// Construct the ledger over encoder/storage backends.
  ///
  /// Id counters are recovered from the highest stored vault, token and
  /// event keys, so reopening a database never reuses an id.
  explicit ledger(
      bequest::schema::encoding::encoder<
          bequest::schema::encoding::scale_encoder_tag>& encoder,
      bequest::storage::storage<bequest::storage::rocksdb_storage_tag>& storage,
      value_transfer transfer = {},
      time_source_t now = system_time_source());

  /// Install the fact sink. Must be called before the ledger is shared
  /// between threads.
  ///
  /// Events are delivered one at a time in commit order with no ledger lock
  /// held. A thread already delivering also delivers events committed
  /// meanwhile by other threads, including those committed by the sink
  /// itself.
  void set_event_sink(event_sink_t sink);

  /// Create a single-beneficiary vault funded with `deposit`.
  ///
  /// On success `id` holds the new vault id.
  bequest::schema::ledger_result_t create_vault(
      const bequest::schema::account_id_t& caller,
      const bequest::schema::account_id_t& beneficiary,
      bequest::schema::timestamp_milliseconds_t unlock_time,
      const bequest::schema::amount_t& deposit);

  /// Create a vault split across `beneficiaries` by `percentages`.
  ///
  /// The lists are parallel, non-empty and the percentages sum to exactly
  /// 100. Shares are immutable once written.
  bequest::schema::ledger_result_t create_multi_beneficiary_vault(
      const bequest::schema::account_id_t& caller,
      const std::vector<bequest::schema::account_id_t>& beneficiaries,
      const std::vector<uint32_t>& percentages,
      bequest::schema::timestamp_milliseconds_t unlock_time,
      const bequest::schema::amount_t& deposit);

  /// Escrow `amount` more into an unclaimed vault. Owner only.
  bequest::schema::ledger_result_t add_funds(
      const bequest::schema::account_id_t& caller,
      bequest::schema::vault_id_t vault_id,
      const bequest::schema::amount_t& amount);

  /// Push the unlock time later. Owner only; never shortens the lock.
  bequest::schema::ledger_result_t extend_vault_time(
      const bequest::schema::account_id_t& caller,
      bequest::schema::vault_id_t vault_id,
      bequest::schema::timestamp_milliseconds_t new_unlock_time);

  /// Replace the beneficiary of a single-beneficiary vault. Owner only.
  ///
  /// Tokens minted for the previous beneficiary stay stored but can no
  /// longer pass the claim identity check.
  bequest::schema::ledger_result_t update_beneficiary(
      const bequest::schema::account_id_t& caller,
      bequest::schema::vault_id_t vault_id,
      const bequest::schema::account_id_t& new_beneficiary);

  /// Replace the note shown to beneficiaries. Owner only.
  bequest::schema::ledger_result_t set_message(
      const bequest::schema::account_id_t& caller,
      bequest::schema::vault_id_t vault_id,
      const std::string& text);

  /// Mint a claim token bound to the vault's current beneficiary.
  ///
  /// Several tokens may exist for one vault. On success `id` holds the new
  /// token id.
  bequest::schema::ledger_result_t mint_inheritance_token(
      const bequest::schema::account_id_t& caller,
      bequest::schema::vault_id_t vault_id);

  /// Release a single-beneficiary vault to its beneficiary.
  bequest::schema::ledger_result_t claim_vault(
      const bequest::schema::account_id_t& caller,
      bequest::schema::vault_id_t vault_id,
      bequest::schema::token_id_t token_id);

  /// Release a multi-beneficiary vault, paying each share
  /// `floor(balance * percentage / 100)`. Any caller may trigger it; the
  /// truncation remainder is not paid out.
  bequest::schema::ledger_result_t claim_multi_beneficiary_vault(
      const bequest::schema::account_id_t& caller,
      bequest::schema::vault_id_t vault_id);

  /// Return the whole balance to the owner before the unlock time.
  bequest::schema::ledger_result_t emergency_withdraw(
      const bequest::schema::account_id_t& caller,
      bequest::schema::vault_id_t vault_id);

  /// Turn on proof-of-life tracking and count the call as a heartbeat.
  bequest::schema::ledger_result_t enable_heartbeat(
      const bequest::schema::account_id_t& caller,
      bequest::schema::vault_id_t vault_id,
      bequest::schema::duration_milliseconds_t interval);

  bequest::schema::ledger_result_t record_heartbeat(
      const bequest::schema::account_id_t& caller,
      bequest::schema::vault_id_t vault_id);

  /// Advisory: false for unknown vaults and disabled heartbeats.
  bool is_heartbeat_overdue(bequest::schema::vault_id_t vault_id) const;

  /// Instant after which the vault counts as overdue.
  std::optional<bequest::schema::timestamp_milliseconds_t> heartbeat_deadline(
      bequest::schema::vault_id_t vault_id) const;

  std::optional<bequest::schema::vault_state_t> vault_details(
      bequest::schema::vault_id_t vault_id) const;

  /// Vault ids created by `owner`, ascending.
  std::vector<bequest::schema::vault_id_t> owner_vaults(
      const bequest::schema::account_id_t& owner) const;

  /// Vault ids `beneficiary` can currently receive from, ascending.
  ///
  /// The index keeps entries for past beneficiaries; they are dropped here
  /// by checking the vault's current state.
  std::vector<bequest::schema::vault_id_t> beneficiary_vaults(
      const bequest::schema::account_id_t& beneficiary) const;

  /// Shares of a multi-beneficiary vault in creation order; empty otherwise.
  std::vector<bequest::schema::beneficiary_share_t> vault_beneficiaries(
      bequest::schema::vault_id_t vault_id) const;

  std::optional<bequest::schema::inheritance_token_state_t> token_details(
      bequest::schema::token_id_t token_id) const;

  /// Remaining lock duration; zero once unlocked.
  std::optional<bequest::schema::duration_milliseconds_t> time_until_unlock(
      bequest::schema::vault_id_t vault_id) const;

  bequest::schema::ledger_stats_t stats() const;

  /// Persisted events with ids in [from_id, to_id].
  std::vector<bequest::schema::ledger_event_t> events(
      bequest::schema::event_id_t from_id,
      bequest::schema::event_id_t to_id) const;

 private:
  std::optional<bequest::schema::vault_state_t> load_vault(
      bequest::schema::vault_id_t vault_id) const;
  std::optional<bequest::schema::inheritance_token_state_t> load_token(
      bequest::schema::token_id_t token_id) const;

  /// Shared precondition chain for owner-only mutations: vault exists,
  /// caller owns it, and it is not claimed yet.
  std::optional<bequest::schema::ledger_error_code> check_owner_mutation(
      const std::optional<bequest::schema::vault_state_t>& vault,
      const bequest::schema::account_id_t& caller) const;

  bequest::schema::ledger_event_t make_event(
      bequest::schema::ledger_event_type_t type,
      bequest::schema::vault_id_t vault_id,
      const bequest::schema::account_id_t& actor,
      bequest::schema::timestamp_milliseconds_t now);

  template <typename T>
  bequest::storage::key_value_entry_t make_entry(
      const bequest::schema::bytes_t& key,
      const T& value) const;

  /// Append event rows, write everything in one batch and queue the events,
  /// then release `guard` and publish.
  bequest::schema::ledger_result_t commit(
      vault_lock_table::guard& guard,
      std::vector<bequest::storage::key_value_entry_t> entries,
      std::vector<bequest::schema::ledger_event_t> events,
      std::optional<uint64_t> id = std::nullopt);

  bequest::schema::ledger_result_t reject(
      bequest::schema::ledger_error_code code,
      std::string_view operation,
      bequest::schema::vault_id_t vault_id) const;

  /// Deliver queued events unless another call is already delivering.
  void publish_pending();

  bool escrow(const bequest::schema::account_id_t& from,
              const bequest::schema::amount_t& amount) const;
  bool release(const std::vector<payout>& payouts) const;

  /// Recover id counters from storage at startup.
  void load_persisted_state();

  bequest::schema::encoding::encoder<
      bequest::schema::encoding::scale_encoder_tag>& encoder_;
  bequest::storage::storage<bequest::storage::rocksdb_storage_tag>& storage_;
  value_transfer transfer_;
  time_source_t now_;
  event_sink_t event_sink_;
  vault_lock_table vault_locks_;
  std::mutex outbox_mutex_;
  std::deque<bequest::schema::ledger_event_t> outbox_;
  bool publishing_{false};
  std::atomic<bequest::schema::vault_id_t> next_vault_id_{1};
  std::atomic<bequest::schema::token_id_t> next_token_id_{1};
  std::atomic<bequest::schema::event_id_t> next_event_id_{1};
};

template <typename T>
bequest::storage::key_value_entry_t ledger::make_entry(
    const bequest::schema::bytes_t& key,
    const T& value) const {
  return {key, encoder_.encode(value)};
}

}  // namespace bequest::execution
