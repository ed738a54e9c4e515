#include <spdlog/spdlog.h>
#include <bequest/execution/ledger.hpp>
#include <bequest/schema/key/ledger_keys.hpp>
#include <utility>

using namespace bequest::schema;

namespace bequest::execution {

ledger_result_t ledger::enable_heartbeat(
    const account_id_t& caller,
    const vault_id_t vault_id,
    const duration_milliseconds_t interval) {
  constexpr auto kOperation = std::string_view{"enable_heartbeat"};
  auto guard = vault_locks_.acquire(vault_id);
  if (!guard) {
    return reject(ledger_error_code::reentrant_call, kOperation, vault_id);
  }
  auto vault = load_vault(vault_id);
  if (auto error = check_owner_mutation(vault, caller)) {
    return reject(*error, kOperation, vault_id);
  }
  if (interval < kMinHeartbeatInterval || interval > kMaxHeartbeatInterval) {
    return reject(ledger_error_code::invalid_interval, kOperation, vault_id);
  }

  auto now = now_();
  vault->heartbeat_enabled = true;
  vault->heartbeat_interval = interval;
  vault->last_heartbeat_at = now;

  auto event = make_event(ledger_event_type_t::heartbeat_enabled, vault_id,
                          caller, now);
  event.detail = "interval_ms=" + std::to_string(interval);

  spdlog::info("Vault {} heartbeat enabled every {} ms", vault_id, interval);
  return commit(guard,
                {make_entry(key::make_vault_key(vault_id), *vault)},
                {std::move(event)});
}

ledger_result_t ledger::record_heartbeat(const account_id_t& caller,
                                         const vault_id_t vault_id) {
  constexpr auto kOperation = std::string_view{"record_heartbeat"};
  auto guard = vault_locks_.acquire(vault_id);
  if (!guard) {
    return reject(ledger_error_code::reentrant_call, kOperation, vault_id);
  }
  auto vault = load_vault(vault_id);
  if (auto error = check_owner_mutation(vault, caller)) {
    return reject(*error, kOperation, vault_id);
  }
  if (!vault->heartbeat_enabled) {
    return reject(ledger_error_code::heartbeat_not_enabled, kOperation,
                  vault_id);
  }

  auto now = now_();
  vault->last_heartbeat_at = now;
  auto event = make_event(ledger_event_type_t::heartbeat_recorded, vault_id,
                          caller, now);

  spdlog::debug("Vault {} heartbeat recorded", vault_id);
  return commit(guard,
                {make_entry(key::make_vault_key(vault_id), *vault)},
                {std::move(event)});
}

std::optional<timestamp_milliseconds_t> ledger::heartbeat_deadline(
    const vault_id_t vault_id) const {
  auto vault = load_vault(vault_id);
  if (!vault || !vault->heartbeat_enabled) {
    return std::nullopt;
  }
  return vault->last_heartbeat_at + vault->heartbeat_interval;
}

bool ledger::is_heartbeat_overdue(const vault_id_t vault_id) const {
  auto deadline = heartbeat_deadline(vault_id);
  if (!deadline) {
    return false;
  }
  return now_() > *deadline;
}

}  // namespace bequest::execution
