#pragma once

#include <array>
#include <bequest/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: ledger keys.
// Custody workflow: Canonical key prefixes and key codecs for vaults, tokens,
// shares, the two identity indices and the event log.
namespace bequest::schema::key {

inline constexpr std::string_view kStatePrefix{"SYS|STATE|"};
inline constexpr std::string_view kVaultKeyPrefix{"SYS|STATE|VAULT|"};
inline constexpr std::string_view kTokenKeyPrefix{"SYS|STATE|TOKEN|"};
inline constexpr std::string_view kSharesKeyPrefix{"SYS|STATE|SHARES|"};
inline constexpr std::string_view kOwnerIndexPrefix{"SYS|INDEX|OWNER|"};
inline constexpr std::string_view kBeneficiaryIndexPrefix{
    "SYS|INDEX|BENEFICIARY|"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

inline constexpr auto kLedgerKeyspaces = std::array{
    kVaultKeyPrefix,   kTokenKeyPrefix,         kSharesKeyPrefix,
    kOwnerIndexPrefix, kBeneficiaryIndexPrefix, kEventPrefix};

bequest::schema::bytes_t make_vault_key(vault_id_t vault_id);
bequest::schema::bytes_t make_token_key(token_id_t token_id);
bequest::schema::bytes_t make_shares_key(vault_id_t vault_id);
bequest::schema::bytes_t make_event_key(event_id_t event_id);

/// Index prefix for one identity; entries append the vault id.
bequest::schema::bytes_t make_owner_index_prefix(const account_id_t& owner);
bequest::schema::bytes_t make_owner_index_key(const account_id_t& owner,
                                              vault_id_t vault_id);
bequest::schema::bytes_t make_beneficiary_index_prefix(
    const account_id_t& beneficiary);
bequest::schema::bytes_t make_beneficiary_index_key(
    const account_id_t& beneficiary,
    vault_id_t vault_id);

/// Recover the trailing id from any key produced above.
std::optional<uint64_t> parse_trailing_id(
    const bequest::schema::bytes_view_t& key);

}  // namespace bequest::schema::key
