#include <spdlog/spdlog.h>
#include <bequest/execution/ledger.hpp>
#include <bequest/schema/encoding/scale/encoder.hpp>
#include <bequest/schema/key/ledger_keys.hpp>
#include <iterator>
#include <limits>
#include <numeric>
#include <utility>

using namespace bequest::schema;

namespace {

std::string short_hex(const account_id_t& account) {
  return to_hex(bytes_view_t{account.data(), 8});
}

}  // namespace

namespace bequest::execution {

ledger::ledger(
    encoding::encoder<encoding::scale_encoder_tag>& encoder,
    bequest::storage::storage<bequest::storage::rocksdb_storage_tag>& storage,
    value_transfer transfer,
    time_source_t now)
    : encoder_{encoder},
      storage_{storage},
      transfer_{std::move(transfer)},
      now_{std::move(now)} {
  if (!now_) {
    spdlog::warn("No time source supplied; falling back to the system clock");
    now_ = system_time_source();
  }
  load_persisted_state();
  spdlog::info("Vault ledger ready: next vault {}, next token {}, next event {}",
               next_vault_id_.load(), next_token_id_.load(),
               next_event_id_.load());
}

void ledger::set_event_sink(event_sink_t sink) {
  event_sink_ = std::move(sink);
}

ledger_result_t ledger::create_vault(const account_id_t& caller,
                                     const account_id_t& beneficiary,
                                     const timestamp_milliseconds_t unlock_time,
                                     const amount_t& deposit) {
  constexpr auto kOperation = std::string_view{"create_vault"};
  auto now = now_();
  if (deposit == 0) {
    return reject(ledger_error_code::invalid_amount, kOperation, 0);
  }
  if (is_null_account(beneficiary)) {
    return reject(ledger_error_code::invalid_beneficiary, kOperation, 0);
  }
  if (unlock_time <= now) {
    return reject(ledger_error_code::invalid_unlock_time, kOperation, 0);
  }
  if (!escrow(caller, deposit)) {
    return reject(ledger_error_code::value_transfer_failed, kOperation, 0);
  }

  auto vault_id = next_vault_id_.fetch_add(1);
  auto guard = vault_locks_.acquire(vault_id);

  auto vault = vault_state_t{};
  vault.vault_id = vault_id;
  vault.owner = caller;
  vault.beneficiary = beneficiary;
  vault.balance = deposit;
  vault.unlock_time = unlock_time;
  vault.created_at = now;

  auto event = make_event(ledger_event_type_t::vault_created, vault_id, caller,
                          now);
  event.counterparty = beneficiary;
  event.amount = deposit;
  event.unlock_time = unlock_time;

  auto entries = std::vector<bequest::storage::key_value_entry_t>{};
  entries.push_back(make_entry(key::make_vault_key(vault_id), vault));
  entries.push_back(
      {key::make_owner_index_key(caller, vault_id), bytes_t{}});
  entries.push_back(
      {key::make_beneficiary_index_key(beneficiary, vault_id), bytes_t{}});

  spdlog::info("Vault {} created by {} for {} with balance {}", vault_id,
               short_hex(caller), short_hex(beneficiary), deposit.str());
  return commit(guard, std::move(entries), {std::move(event)}, vault_id);
}

ledger_result_t ledger::create_multi_beneficiary_vault(
    const account_id_t& caller,
    const std::vector<account_id_t>& beneficiaries,
    const std::vector<uint32_t>& percentages,
    const timestamp_milliseconds_t unlock_time,
    const amount_t& deposit) {
  constexpr auto kOperation = std::string_view{"create_multi_beneficiary_vault"};
  auto now = now_();
  if (beneficiaries.size() != percentages.size()) {
    return reject(ledger_error_code::arity_mismatch, kOperation, 0);
  }
  if (beneficiaries.empty()) {
    return reject(ledger_error_code::empty_beneficiary_list, kOperation, 0);
  }
  for (const auto& beneficiary : beneficiaries) {
    if (is_null_account(beneficiary)) {
      return reject(ledger_error_code::invalid_beneficiary, kOperation, 0);
    }
  }
  auto total_percentage = std::accumulate(
      std::begin(percentages), std::end(percentages), uint64_t{0},
      [](const uint64_t sum, const uint32_t value) { return sum + value; });
  if (total_percentage != kTotalSharePercentage) {
    return reject(ledger_error_code::percentage_sum_invalid, kOperation, 0);
  }
  if (unlock_time <= now) {
    return reject(ledger_error_code::invalid_unlock_time, kOperation, 0);
  }
  if (deposit == 0) {
    return reject(ledger_error_code::invalid_amount, kOperation, 0);
  }
  if (!escrow(caller, deposit)) {
    return reject(ledger_error_code::value_transfer_failed, kOperation, 0);
  }

  auto vault_id = next_vault_id_.fetch_add(1);
  auto guard = vault_locks_.acquire(vault_id);

  auto vault = vault_state_t{};
  vault.vault_id = vault_id;
  vault.owner = caller;
  vault.beneficiary = kNoSingleBeneficiary;
  vault.balance = deposit;
  vault.unlock_time = unlock_time;
  vault.created_at = now;

  auto shares = std::vector<beneficiary_share_t>{};
  shares.reserve(beneficiaries.size());
  auto entries = std::vector<bequest::storage::key_value_entry_t>{};
  entries.push_back(make_entry(key::make_vault_key(vault_id), vault));
  entries.push_back(
      {key::make_owner_index_key(caller, vault_id), bytes_t{}});
  for (size_t i = 0; i < beneficiaries.size(); ++i) {
    shares.push_back(beneficiary_share_t{.vault_id = vault_id,
                                         .beneficiary = beneficiaries[i],
                                         .percentage = percentages[i]});
    entries.push_back(
        {key::make_beneficiary_index_key(beneficiaries[i], vault_id),
         bytes_t{}});
  }
  entries.push_back(make_entry(key::make_shares_key(vault_id), shares));

  auto event = make_event(ledger_event_type_t::multi_beneficiary_vault_created,
                          vault_id, caller, now);
  event.amount = deposit;
  event.unlock_time = unlock_time;
  event.detail = std::to_string(shares.size()) + " shares";

  spdlog::info("Multi-beneficiary vault {} created by {} with {} shares and "
               "balance {}",
               vault_id, short_hex(caller), shares.size(), deposit.str());
  return commit(guard, std::move(entries), {std::move(event)}, vault_id);
}

ledger_result_t ledger::add_funds(const account_id_t& caller,
                                  const vault_id_t vault_id,
                                  const amount_t& amount) {
  constexpr auto kOperation = std::string_view{"add_funds"};
  auto guard = vault_locks_.acquire(vault_id);
  if (!guard) {
    return reject(ledger_error_code::reentrant_call, kOperation, vault_id);
  }
  auto vault = load_vault(vault_id);
  if (auto error = check_owner_mutation(vault, caller)) {
    return reject(*error, kOperation, vault_id);
  }
  if (amount == 0) {
    return reject(ledger_error_code::invalid_amount, kOperation, vault_id);
  }
  if (vault->balance > std::numeric_limits<amount_t>::max() - amount) {
    return reject(ledger_error_code::balance_overflow, kOperation, vault_id);
  }
  if (!escrow(caller, amount)) {
    return reject(ledger_error_code::value_transfer_failed, kOperation,
                  vault_id);
  }

  vault->balance += amount;
  auto event =
      make_event(ledger_event_type_t::vault_funded, vault_id, caller, now_());
  event.amount = amount;

  spdlog::debug("Vault {} funded with {}, balance now {}", vault_id,
                amount.str(), vault->balance.str());
  return commit(guard,
                {make_entry(key::make_vault_key(vault_id), *vault)},
                {std::move(event)});
}

ledger_result_t ledger::extend_vault_time(
    const account_id_t& caller,
    const vault_id_t vault_id,
    const timestamp_milliseconds_t new_unlock_time) {
  constexpr auto kOperation = std::string_view{"extend_vault_time"};
  auto guard = vault_locks_.acquire(vault_id);
  if (!guard) {
    return reject(ledger_error_code::reentrant_call, kOperation, vault_id);
  }
  auto vault = load_vault(vault_id);
  if (auto error = check_owner_mutation(vault, caller)) {
    return reject(*error, kOperation, vault_id);
  }
  if (new_unlock_time <= vault->unlock_time) {
    return reject(ledger_error_code::time_not_later, kOperation, vault_id);
  }

  vault->unlock_time = new_unlock_time;
  auto event =
      make_event(ledger_event_type_t::vault_extended, vault_id, caller, now_());
  event.unlock_time = new_unlock_time;

  spdlog::debug("Vault {} unlock time extended to {}", vault_id,
                new_unlock_time);
  return commit(guard,
                {make_entry(key::make_vault_key(vault_id), *vault)},
                {std::move(event)});
}

ledger_result_t ledger::update_beneficiary(
    const account_id_t& caller,
    const vault_id_t vault_id,
    const account_id_t& new_beneficiary) {
  constexpr auto kOperation = std::string_view{"update_beneficiary"};
  auto guard = vault_locks_.acquire(vault_id);
  if (!guard) {
    return reject(ledger_error_code::reentrant_call, kOperation, vault_id);
  }
  auto vault = load_vault(vault_id);
  if (auto error = check_owner_mutation(vault, caller)) {
    return reject(*error, kOperation, vault_id);
  }
  if (is_multi_beneficiary(*vault)) {
    return reject(ledger_error_code::cannot_update_multi_beneficiary_vault,
                  kOperation, vault_id);
  }
  if (is_null_account(new_beneficiary)) {
    return reject(ledger_error_code::invalid_beneficiary, kOperation,
                  vault_id);
  }

  auto previous = vault->beneficiary;
  vault->beneficiary = new_beneficiary;
  auto event = make_event(ledger_event_type_t::beneficiary_updated, vault_id,
                          caller, now_());
  event.counterparty = new_beneficiary;
  event.detail = "previous=" + to_hex(bytes_view_t{previous});

  // The previous beneficiary's index row is left in place.
  auto entries = std::vector<bequest::storage::key_value_entry_t>{};
  entries.push_back(make_entry(key::make_vault_key(vault_id), *vault));
  entries.push_back(
      {key::make_beneficiary_index_key(new_beneficiary, vault_id), bytes_t{}});

  spdlog::info("Vault {} beneficiary changed from {} to {}", vault_id,
               short_hex(previous), short_hex(new_beneficiary));
  return commit(guard, std::move(entries), {std::move(event)});
}

ledger_result_t ledger::set_message(const account_id_t& caller,
                                    const vault_id_t vault_id,
                                    const std::string& text) {
  constexpr auto kOperation = std::string_view{"set_message"};
  auto guard = vault_locks_.acquire(vault_id);
  if (!guard) {
    return reject(ledger_error_code::reentrant_call, kOperation, vault_id);
  }
  auto vault = load_vault(vault_id);
  if (auto error = check_owner_mutation(vault, caller)) {
    return reject(*error, kOperation, vault_id);
  }

  vault->note = text;
  auto event = make_event(ledger_event_type_t::message_updated, vault_id,
                          caller, now_());
  event.detail = text;
  return commit(guard,
                {make_entry(key::make_vault_key(vault_id), *vault)},
                {std::move(event)});
}

std::optional<vault_state_t> ledger::load_vault(
    const vault_id_t vault_id) const {
  auto key = key::make_vault_key(vault_id);
  return storage_.get<vault_state_t>(encoder_, bytes_view_t{key});
}

std::optional<inheritance_token_state_t> ledger::load_token(
    const token_id_t token_id) const {
  auto key = key::make_token_key(token_id);
  return storage_.get<inheritance_token_state_t>(encoder_, bytes_view_t{key});
}

std::optional<ledger_error_code> ledger::check_owner_mutation(
    const std::optional<vault_state_t>& vault,
    const account_id_t& caller) const {
  if (!vault) {
    return ledger_error_code::vault_not_found;
  }
  if (vault->owner != caller) {
    return ledger_error_code::not_owner;
  }
  if (vault->claimed) {
    return ledger_error_code::already_claimed;
  }
  return std::nullopt;
}

ledger_event_t ledger::make_event(const ledger_event_type_t type,
                                  const vault_id_t vault_id,
                                  const account_id_t& actor,
                                  const timestamp_milliseconds_t now) {
  auto event = ledger_event_t{};
  event.event_id = next_event_id_.fetch_add(1);
  event.type = type;
  event.vault_id = vault_id;
  event.actor = actor;
  event.recorded_at = now;
  return event;
}

ledger_result_t ledger::commit(
    vault_lock_table::guard& guard,
    std::vector<bequest::storage::key_value_entry_t> entries,
    std::vector<ledger_event_t> events,
    std::optional<uint64_t> id) {
  for (const auto& event : events) {
    entries.push_back(make_entry(key::make_event_key(event.event_id), event));
  }
  storage_.write(entries);

  if (event_sink_) {
    // Queued before the vault lock drops so per-vault order is kept.
    auto lock = std::scoped_lock{outbox_mutex_};
    outbox_.insert(std::end(outbox_), std::begin(events), std::end(events));
  }
  guard.release();
  publish_pending();

  auto result = ledger_result_t{};
  result.code = 0;
  result.codespace = std::string{kLedgerCodespace};
  result.id = id;
  result.events = std::move(events);
  return result;
}

ledger_result_t ledger::reject(const ledger_error_code code,
                               const std::string_view operation,
                               const vault_id_t vault_id) const {
  auto result = ledger_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{to_string(code)};
  result.codespace = std::string{kLedgerCodespace};
  spdlog::warn("Rejected {} on vault {}: {}", operation, vault_id, result.log);
  return result;
}

void ledger::publish_pending() {
  if (!event_sink_) {
    return;
  }
  auto lock = std::unique_lock{outbox_mutex_};
  if (publishing_) {
    return;
  }
  publishing_ = true;
  while (!outbox_.empty()) {
    auto event = std::move(outbox_.front());
    outbox_.pop_front();
    lock.unlock();
    try {
      event_sink_(event);
    } catch (...) {
      lock.lock();
      publishing_ = false;
      throw;
    }
    lock.lock();
  }
  publishing_ = false;
}

bool ledger::escrow(const account_id_t& from, const amount_t& amount) const {
  if (!transfer_.escrow) {
    return true;
  }
  if (!transfer_.escrow(from, amount)) {
    spdlog::warn("Escrow of {} from {} failed", amount.str(), short_hex(from));
    return false;
  }
  return true;
}

bool ledger::release(const std::vector<payout>& payouts) const {
  if (!transfer_.release) {
    return true;
  }
  if (!transfer_.release(payouts)) {
    spdlog::warn("Release of {} payout(s) failed", payouts.size());
    return false;
  }
  return true;
}

void ledger::load_persisted_state() {
  spdlog::debug("Recovering ledger id counters");
  auto recover = [this](const std::string_view prefix,
                        std::atomic<uint64_t>& counter) {
    auto last = storage_.last_by_prefix(make_bytes_view(prefix));
    if (!last) {
      return;
    }
    auto id = key::parse_trailing_id(bytes_view_t{last->first});
    if (!id) {
      bequest::common::critical("corrupt key while recovering id counters");
    }
    counter.store(*id + 1);
  };
  recover(key::kVaultKeyPrefix, next_vault_id_);
  recover(key::kTokenKeyPrefix, next_token_id_);
  recover(key::kEventPrefix, next_event_id_);
}

}  // namespace bequest::execution
