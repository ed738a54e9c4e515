#pragma once
#include <bequest/schema/primitives.hpp>
#include <string>

// Schema type: vault state.
// Custody workflow: Escrowed balance awaiting conditional release to a
// beneficiary, or to a fixed set of shares when `beneficiary` is the
// no-single-beneficiary marker.
namespace bequest::schema {

template <uint16_t Version>
struct vault_state;

template <>
struct vault_state<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  account_id_t owner{};
  account_id_t beneficiary{};
  amount_t balance{};
  timestamp_milliseconds_t unlock_time{};
  timestamp_milliseconds_t created_at{};
  bool claimed{};
  bool heartbeat_enabled{};
  duration_milliseconds_t heartbeat_interval{};
  timestamp_milliseconds_t last_heartbeat_at{};
  std::string note;
};

using vault_state_t = vault_state<1>;

inline bool is_multi_beneficiary(const vault_state_t& vault) {
  return vault.beneficiary == kNoSingleBeneficiary;
}

}  // namespace bequest::schema
