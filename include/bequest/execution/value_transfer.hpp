#pragma once

#include <bequest/schema/primitives.hpp>
#include <functional>
#include <vector>

namespace bequest::execution {

struct payout final {
  bequest::schema::account_id_t recipient{};
  bequest::schema::amount_t amount{};
};

/// Pull `amount` from `from` into escrow. Returns false when the value could
/// not be moved.
using escrow_handler_t =
    std::function<bool(const bequest::schema::account_id_t& from,
                       const bequest::schema::amount_t& amount)>;

/// Move every payout out of escrow, all or nothing. Returns false when no
/// value was moved.
using release_handler_t =
    std::function<bool(const std::vector<payout>& payouts)>;

/// Value transfer backend. An unset handler means value moves outside the
/// ledger and the step always succeeds.
struct value_transfer final {
  escrow_handler_t escrow;
  release_handler_t release;
};

}  // namespace bequest::execution
