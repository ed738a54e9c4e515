#pragma once

#include <bequest/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: ledger error code.
// Custody workflow: Failure taxonomy for ledger operations. Zero is success;
// every rejected call reports exactly one of these codes.
namespace bequest::schema {

enum class ledger_error_code : uint32_t {
  // Validation
  invalid_amount = 1,
  invalid_beneficiary = 2,
  invalid_unlock_time = 3,
  arity_mismatch = 4,
  empty_beneficiary_list = 5,
  percentage_sum_invalid = 6,
  time_not_later = 7,
  invalid_interval = 8,
  balance_overflow = 9,
  // Authorization
  not_owner = 20,
  not_beneficiary = 21,
  token_owner_mismatch = 22,
  // State
  vault_not_found = 40,
  already_claimed = 41,
  still_locked = 42,
  token_inactive = 43,
  token_vault_mismatch = 44,
  heartbeat_not_enabled = 45,
  not_multi_beneficiary_vault = 46,
  cannot_update_multi_beneficiary_vault = 47,
  vault_unlocked = 48,
  reentrant_call = 49,
  // Transfer
  value_transfer_failed = 60,
};

inline constexpr auto kLedgerErrorCodeMappings = std::array{
    enum_mapping_t<ledger_error_code>{"invalid_amount",
                                      ledger_error_code::invalid_amount},
    enum_mapping_t<ledger_error_code>{"invalid_beneficiary",
                                      ledger_error_code::invalid_beneficiary},
    enum_mapping_t<ledger_error_code>{"invalid_unlock_time",
                                      ledger_error_code::invalid_unlock_time},
    enum_mapping_t<ledger_error_code>{"arity_mismatch",
                                      ledger_error_code::arity_mismatch},
    enum_mapping_t<ledger_error_code>{
        "empty_beneficiary_list", ledger_error_code::empty_beneficiary_list},
    enum_mapping_t<ledger_error_code>{
        "percentage_sum_invalid", ledger_error_code::percentage_sum_invalid},
    enum_mapping_t<ledger_error_code>{"time_not_later",
                                      ledger_error_code::time_not_later},
    enum_mapping_t<ledger_error_code>{"invalid_interval",
                                      ledger_error_code::invalid_interval},
    enum_mapping_t<ledger_error_code>{"balance_overflow",
                                      ledger_error_code::balance_overflow},
    enum_mapping_t<ledger_error_code>{"not_owner",
                                      ledger_error_code::not_owner},
    enum_mapping_t<ledger_error_code>{"not_beneficiary",
                                      ledger_error_code::not_beneficiary},
    enum_mapping_t<ledger_error_code>{"token_owner_mismatch",
                                      ledger_error_code::token_owner_mismatch},
    enum_mapping_t<ledger_error_code>{"vault_not_found",
                                      ledger_error_code::vault_not_found},
    enum_mapping_t<ledger_error_code>{"already_claimed",
                                      ledger_error_code::already_claimed},
    enum_mapping_t<ledger_error_code>{"still_locked",
                                      ledger_error_code::still_locked},
    enum_mapping_t<ledger_error_code>{"token_inactive",
                                      ledger_error_code::token_inactive},
    enum_mapping_t<ledger_error_code>{"token_vault_mismatch",
                                      ledger_error_code::token_vault_mismatch},
    enum_mapping_t<ledger_error_code>{
        "heartbeat_not_enabled", ledger_error_code::heartbeat_not_enabled},
    enum_mapping_t<ledger_error_code>{
        "not_multi_beneficiary_vault",
        ledger_error_code::not_multi_beneficiary_vault},
    enum_mapping_t<ledger_error_code>{
        "cannot_update_multi_beneficiary_vault",
        ledger_error_code::cannot_update_multi_beneficiary_vault},
    enum_mapping_t<ledger_error_code>{"vault_unlocked",
                                      ledger_error_code::vault_unlocked},
    enum_mapping_t<ledger_error_code>{"reentrant_call",
                                      ledger_error_code::reentrant_call},
    enum_mapping_t<ledger_error_code>{
        "value_transfer_failed", ledger_error_code::value_transfer_failed},
};

template <>
inline std::optional<ledger_error_code> try_from_string<ledger_error_code>(
    const std::string_view value) {
  return from_string(value, kLedgerErrorCodeMappings);
}

inline constexpr std::string_view to_string(const ledger_error_code value) {
  return name_of(value, kLedgerErrorCodeMappings);
}

}  // namespace bequest::schema
