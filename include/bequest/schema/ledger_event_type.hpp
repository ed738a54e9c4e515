#pragma once

#include <bequest/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: ledger event type.
// Custody workflow: Kinds of facts the ledger emits after a committed
// mutation.
namespace bequest::schema {

enum class ledger_event_type_t : uint16_t {
  vault_created = 1,
  multi_beneficiary_vault_created = 2,
  token_minted = 3,
  vault_claimed = 4,
  emergency_withdraw = 5,
  vault_extended = 6,
  beneficiary_updated = 7,
  heartbeat_recorded = 8,
  vault_funded = 9,
  message_updated = 10,
  heartbeat_enabled = 11,
};

inline constexpr auto kLedgerEventTypeMappings = std::array{
    enum_mapping_t<ledger_event_type_t>{"vault_created",
                                        ledger_event_type_t::vault_created},
    enum_mapping_t<ledger_event_type_t>{
        "multi_beneficiary_vault_created",
        ledger_event_type_t::multi_beneficiary_vault_created},
    enum_mapping_t<ledger_event_type_t>{"token_minted",
                                        ledger_event_type_t::token_minted},
    enum_mapping_t<ledger_event_type_t>{"vault_claimed",
                                        ledger_event_type_t::vault_claimed},
    enum_mapping_t<ledger_event_type_t>{
        "emergency_withdraw", ledger_event_type_t::emergency_withdraw},
    enum_mapping_t<ledger_event_type_t>{"vault_extended",
                                        ledger_event_type_t::vault_extended},
    enum_mapping_t<ledger_event_type_t>{
        "beneficiary_updated", ledger_event_type_t::beneficiary_updated},
    enum_mapping_t<ledger_event_type_t>{
        "heartbeat_recorded", ledger_event_type_t::heartbeat_recorded},
    enum_mapping_t<ledger_event_type_t>{"vault_funded",
                                        ledger_event_type_t::vault_funded},
    enum_mapping_t<ledger_event_type_t>{"message_updated",
                                        ledger_event_type_t::message_updated},
    enum_mapping_t<ledger_event_type_t>{
        "heartbeat_enabled", ledger_event_type_t::heartbeat_enabled},
};

template <>
inline std::optional<ledger_event_type_t> try_from_string<ledger_event_type_t>(
    const std::string_view value) {
  return from_string(value, kLedgerEventTypeMappings);
}

inline constexpr std::string_view to_string(const ledger_event_type_t value) {
  return name_of(value, kLedgerEventTypeMappings);
}

}  // namespace bequest::schema
