#pragma once
#include <bequest/schema/primitives.hpp>

// Schema type: beneficiary share.
// Custody workflow: One slice of a multi-beneficiary vault. Written once at
// vault creation; the shares of a vault always sum to 100 percent.
namespace bequest::schema {

inline constexpr auto kTotalSharePercentage = uint32_t{100};

template <uint16_t Version>
struct beneficiary_share;

template <>
struct beneficiary_share<1> final {
  uint16_t version{1};
  vault_id_t vault_id{};
  account_id_t beneficiary{};
  uint32_t percentage{};
};

using beneficiary_share_t = beneficiary_share<1>;

}  // namespace bequest::schema
