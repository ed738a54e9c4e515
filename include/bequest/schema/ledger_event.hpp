#pragma once

#include <bequest/schema/ledger_event_type.hpp>
#include <bequest/schema/primitives.hpp>
#include <optional>
#include <string>

// Schema type: ledger event.
// Custody workflow: Durable fact describing one committed mutation. Event ids
// are global and increase in commit order for any single vault.
namespace bequest::schema {

template <uint16_t Version>
struct ledger_event;

template <>
struct ledger_event<1> final {
  uint16_t version{1};
  event_id_t event_id{};
  ledger_event_type_t type{};
  vault_id_t vault_id{};
  account_id_t actor{};
  std::optional<account_id_t> counterparty;
  std::optional<amount_t> amount;
  std::optional<token_id_t> token_id;
  std::optional<timestamp_milliseconds_t> unlock_time;
  std::optional<std::string> detail;
  timestamp_milliseconds_t recorded_at{};
};

using ledger_event_t = ledger_event<1>;

}  // namespace bequest::schema
