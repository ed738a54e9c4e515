#pragma once

#include <bequest/schema/ledger_error_code.hpp>
#include <bequest/schema/ledger_event.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

// Schema type: ledger result.
// Custody workflow: Outcome envelope of a mutating ledger call. `code` is 0
// on success or a `ledger_error_code` value; `id` carries the allocated
// vault or token id for create and mint calls.
namespace bequest::schema {

template <uint16_t Version>
struct ledger_result;

template <>
struct ledger_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<uint64_t> id;
  std::vector<ledger_event_t> events;

  bool ok() const { return code == 0; }
};

using ledger_result_t = ledger_result<1>;

}  // namespace bequest::schema
