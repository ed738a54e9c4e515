#pragma once
#include <bequest/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace bequest::blake3 {

bequest::schema::hash32_t hash(const std::string_view& str);
bequest::schema::hash32_t hash(const bequest::schema::bytes_view_t& bytes);

/// Derive a stable account identity from a human-readable name.
bequest::schema::account_id_t make_account_id(const std::string_view& name);

}  // namespace bequest::blake3
