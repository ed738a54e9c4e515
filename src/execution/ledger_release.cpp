#include <spdlog/spdlog.h>
#include <bequest/execution/ledger.hpp>
#include <bequest/schema/key/ledger_keys.hpp>
#include <utility>

using namespace bequest::schema;

namespace bequest::execution {

ledger_result_t ledger::mint_inheritance_token(const account_id_t& caller,
                                               const vault_id_t vault_id) {
  constexpr auto kOperation = std::string_view{"mint_inheritance_token"};
  auto guard = vault_locks_.acquire(vault_id);
  if (!guard) {
    return reject(ledger_error_code::reentrant_call, kOperation, vault_id);
  }
  auto vault = load_vault(vault_id);
  if (auto error = check_owner_mutation(vault, caller)) {
    return reject(*error, kOperation, vault_id);
  }

  auto now = now_();
  auto token = inheritance_token_state_t{};
  token.token_id = next_token_id_.fetch_add(1);
  token.vault_id = vault_id;
  token.beneficiary = vault->beneficiary;
  token.active = true;
  token.minted_at = now;

  auto event =
      make_event(ledger_event_type_t::token_minted, vault_id, caller, now);
  event.counterparty = token.beneficiary;
  event.token_id = token.token_id;

  spdlog::info("Token {} minted for vault {}", token.token_id, vault_id);
  return commit(guard,
                {make_entry(key::make_token_key(token.token_id), token)},
                {std::move(event)}, token.token_id);
}

ledger_result_t ledger::claim_vault(const account_id_t& caller,
                                    const vault_id_t vault_id,
                                    const token_id_t token_id) {
  constexpr auto kOperation = std::string_view{"claim_vault"};
  auto guard = vault_locks_.acquire(vault_id);
  if (!guard) {
    return reject(ledger_error_code::reentrant_call, kOperation, vault_id);
  }
  auto vault = load_vault(vault_id);
  if (!vault) {
    return reject(ledger_error_code::vault_not_found, kOperation, vault_id);
  }
  if (vault->claimed) {
    return reject(ledger_error_code::already_claimed, kOperation, vault_id);
  }
  auto now = now_();
  if (now < vault->unlock_time) {
    return reject(ledger_error_code::still_locked, kOperation, vault_id);
  }
  if (caller != vault->beneficiary) {
    return reject(ledger_error_code::not_beneficiary, kOperation, vault_id);
  }
  // Tokens of this vault are only written under this vault's lock, so the
  // copy read here stays current until commit.
  auto token = load_token(token_id);
  if (!token || !token->active) {
    return reject(ledger_error_code::token_inactive, kOperation, vault_id);
  }
  if (token->vault_id != vault_id) {
    return reject(ledger_error_code::token_vault_mismatch, kOperation,
                  vault_id);
  }
  if (token->beneficiary != caller) {
    return reject(ledger_error_code::token_owner_mismatch, kOperation,
                  vault_id);
  }

  auto amount = vault->balance;
  if (!release({payout{.recipient = caller, .amount = amount}})) {
    return reject(ledger_error_code::value_transfer_failed, kOperation,
                  vault_id);
  }

  vault->claimed = true;
  vault->balance = 0;
  token->active = false;

  auto event =
      make_event(ledger_event_type_t::vault_claimed, vault_id, caller, now);
  event.counterparty = caller;
  event.amount = amount;
  event.token_id = token_id;

  spdlog::info("Vault {} claimed with token {}, released {}", vault_id,
               token_id, amount.str());
  return commit(guard,
                {make_entry(key::make_vault_key(vault_id), *vault),
                 make_entry(key::make_token_key(token_id), *token)},
                {std::move(event)});
}

ledger_result_t ledger::claim_multi_beneficiary_vault(
    const account_id_t& caller,
    const vault_id_t vault_id) {
  constexpr auto kOperation = std::string_view{"claim_multi_beneficiary_vault"};
  auto guard = vault_locks_.acquire(vault_id);
  if (!guard) {
    return reject(ledger_error_code::reentrant_call, kOperation, vault_id);
  }
  auto vault = load_vault(vault_id);
  if (!vault) {
    return reject(ledger_error_code::vault_not_found, kOperation, vault_id);
  }
  if (vault->claimed) {
    return reject(ledger_error_code::already_claimed, kOperation, vault_id);
  }
  auto now = now_();
  if (now < vault->unlock_time) {
    return reject(ledger_error_code::still_locked, kOperation, vault_id);
  }
  if (!is_multi_beneficiary(*vault)) {
    return reject(ledger_error_code::not_multi_beneficiary_vault, kOperation,
                  vault_id);
  }
  auto shares = vault_beneficiaries(vault_id);
  if (shares.empty()) {
    return reject(ledger_error_code::not_multi_beneficiary_vault, kOperation,
                  vault_id);
  }

  auto total = vault->balance;
  auto payouts = std::vector<payout>{};
  payouts.reserve(shares.size());
  auto paid = amount_t{0};
  for (const auto& share : shares) {
    // Split before multiplying so a balance near the top of the range
    // cannot wrap.
    auto amount =
        amount_t{total / kTotalSharePercentage * share.percentage +
                 total % kTotalSharePercentage * share.percentage /
                     kTotalSharePercentage};
    paid += amount;
    payouts.push_back(payout{.recipient = share.beneficiary, .amount = amount});
  }
  if (!release(payouts)) {
    return reject(ledger_error_code::value_transfer_failed, kOperation,
                  vault_id);
  }

  vault->claimed = true;
  vault->balance = 0;

  auto events = std::vector<ledger_event_t>{};
  events.reserve(payouts.size());
  for (const auto& [recipient, amount] : payouts) {
    auto event =
        make_event(ledger_event_type_t::vault_claimed, vault_id, caller, now);
    event.counterparty = recipient;
    event.amount = amount;
    events.push_back(std::move(event));
  }

  if (paid != total) {
    spdlog::info("Vault {} split left {} unassigned after rounding", vault_id,
                 amount_t{total - paid}.str());
  }
  spdlog::info("Multi-beneficiary vault {} claimed across {} shares", vault_id,
               shares.size());
  return commit(guard,
                {make_entry(key::make_vault_key(vault_id), *vault)},
                std::move(events));
}

ledger_result_t ledger::emergency_withdraw(const account_id_t& caller,
                                           const vault_id_t vault_id) {
  constexpr auto kOperation = std::string_view{"emergency_withdraw"};
  auto guard = vault_locks_.acquire(vault_id);
  if (!guard) {
    return reject(ledger_error_code::reentrant_call, kOperation, vault_id);
  }
  auto vault = load_vault(vault_id);
  if (auto error = check_owner_mutation(vault, caller)) {
    return reject(*error, kOperation, vault_id);
  }
  auto now = now_();
  if (now >= vault->unlock_time) {
    return reject(ledger_error_code::vault_unlocked, kOperation, vault_id);
  }

  auto amount = vault->balance;
  if (!release({payout{.recipient = vault->owner, .amount = amount}})) {
    return reject(ledger_error_code::value_transfer_failed, kOperation,
                  vault_id);
  }

  vault->claimed = true;
  vault->balance = 0;

  auto event =
      make_event(ledger_event_type_t::emergency_withdraw, vault_id, caller, now);
  event.counterparty = vault->owner;
  event.amount = amount;

  spdlog::info("Vault {} emergency withdrawn by owner, returned {}", vault_id,
               amount.str());
  return commit(guard,
                {make_entry(key::make_vault_key(vault_id), *vault)},
                {std::move(event)});
}

}  // namespace bequest::execution
