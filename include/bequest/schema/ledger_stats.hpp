#pragma once

#include <bequest/schema/primitives.hpp>
#include <cstdint>

// Schema type: ledger stats.
// Custody workflow: Aggregate read over the whole ledger.
namespace bequest::schema {

template <uint16_t Version>
struct ledger_stats;

template <>
struct ledger_stats<1> final {
  uint16_t version{1};
  uint64_t total_vaults{};
  uint64_t total_tokens{};
  amount_t total_escrowed{};
  uint64_t claimed_vaults{};
  uint64_t heartbeat_vaults{};
};

using ledger_stats_t = ledger_stats<1>;

}  // namespace bequest::schema
