#pragma once
#include <bequest/schema/primitives.hpp>

// Schema type: inheritance token state.
// Custody workflow: Authorization record letting one identity claim one
// single-beneficiary vault. Checked by identity equality, never transferred.
namespace bequest::schema {

template <uint16_t Version>
struct inheritance_token_state;

template <>
struct inheritance_token_state<1> final {
  uint16_t version{1};
  token_id_t token_id{};
  vault_id_t vault_id{};
  account_id_t beneficiary{};
  bool active{true};
  timestamp_milliseconds_t minted_at{};
};

using inheritance_token_state_t = inheritance_token_state<1>;

}  // namespace bequest::schema
