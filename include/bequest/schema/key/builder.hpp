#pragma once
#include <bequest/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace bequest::schema::key {

/// Byte-wise key writer. Ids are written big-endian so RocksDB's
/// lexicographic order matches numeric order inside a prefix.
struct builder final {
  bequest::schema::bytes_t data;

  builder& write(const std::string_view& str);
  builder& write(const std::span<const uint8_t>& bytes);
  builder& write(const account_id_t& account);
  builder& write_id(uint64_t id);
};

/// Read back a big-endian id written by `builder::write_id` at `offset`.
std::optional<uint64_t> read_id(const bequest::schema::bytes_view_t& key,
                                std::size_t offset);

}  // namespace bequest::schema::key
