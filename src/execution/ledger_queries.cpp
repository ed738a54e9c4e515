#include <spdlog/spdlog.h>
#include <bequest/execution/ledger.hpp>
#include <bequest/schema/key/ledger_keys.hpp>
#include <algorithm>
#include <utility>

using namespace bequest::schema;

namespace {

std::vector<vault_id_t> scan_index(
    const bequest::storage::storage<bequest::storage::rocksdb_storage_tag>&
        storage,
    const bytes_t& prefix) {
  auto ids = std::vector<vault_id_t>{};
  for (const auto& [key, value] : storage.list_by_prefix(bytes_view_t{prefix})) {
    auto id = key::parse_trailing_id(bytes_view_t{key});
    if (!id) {
      bequest::common::critical("corrupt vault index key");
    }
    ids.push_back(*id);
  }
  return ids;
}

}  // namespace

namespace bequest::execution {

std::optional<vault_state_t> ledger::vault_details(
    const vault_id_t vault_id) const {
  return load_vault(vault_id);
}

std::optional<inheritance_token_state_t> ledger::token_details(
    const token_id_t token_id) const {
  return load_token(token_id);
}

std::vector<vault_id_t> ledger::owner_vaults(
    const account_id_t& owner) const {
  return scan_index(storage_, key::make_owner_index_prefix(owner));
}

std::vector<vault_id_t> ledger::beneficiary_vaults(
    const account_id_t& beneficiary) const {
  auto candidates =
      scan_index(storage_, key::make_beneficiary_index_prefix(beneficiary));
  auto current = std::vector<vault_id_t>{};
  current.reserve(candidates.size());
  for (const auto vault_id : candidates) {
    auto vault = load_vault(vault_id);
    if (!vault) {
      continue;
    }
    // Shares never change, so a multi-beneficiary index row is always live.
    if (is_multi_beneficiary(*vault) || vault->beneficiary == beneficiary) {
      current.push_back(vault_id);
    }
  }
  return current;
}

std::vector<beneficiary_share_t> ledger::vault_beneficiaries(
    const vault_id_t vault_id) const {
  auto key = key::make_shares_key(vault_id);
  auto shares = storage_.get<std::vector<beneficiary_share_t>>(
      encoder_, bytes_view_t{key});
  if (!shares) {
    return {};
  }
  return *shares;
}

std::optional<duration_milliseconds_t> ledger::time_until_unlock(
    const vault_id_t vault_id) const {
  auto vault = load_vault(vault_id);
  if (!vault) {
    return std::nullopt;
  }
  auto now = now_();
  if (now >= vault->unlock_time) {
    return duration_milliseconds_t{0};
  }
  return vault->unlock_time - now;
}

ledger_stats_t ledger::stats() const {
  auto stats = ledger_stats_t{};
  for (const auto& [key, value] :
       storage_.list_by_prefix(make_bytes_view(key::kVaultKeyPrefix))) {
    auto vault = encoder_.decode<vault_state_t>(bytes_view_t{value});
    ++stats.total_vaults;
    stats.total_escrowed += vault.balance;
    if (vault.claimed) {
      ++stats.claimed_vaults;
    }
    if (vault.heartbeat_enabled) {
      ++stats.heartbeat_vaults;
    }
  }
  stats.total_tokens =
      storage_.list_by_prefix(make_bytes_view(key::kTokenKeyPrefix)).size();
  return stats;
}

std::vector<ledger_event_t> ledger::events(const event_id_t from_id,
                                           const event_id_t to_id) const {
  auto out = std::vector<ledger_event_t>{};
  if (from_id > to_id) {
    return out;
  }
  auto last_allocated = next_event_id_.load() - 1;
  auto upper = std::min(to_id, last_allocated);
  for (auto id = std::max<event_id_t>(from_id, 1); id <= upper; ++id) {
    auto key = key::make_event_key(id);
    // Ids allocated to an in-flight commit are not visible yet.
    if (auto event = storage_.get<ledger_event_t>(encoder_, bytes_view_t{key})) {
      out.push_back(std::move(*event));
    }
  }
  spdlog::debug("Read {} event(s) in [{}, {}]", out.size(), from_id, to_id);
  return out;
}

}  // namespace bequest::execution
