#include <algorithm>
#include <bequest/schema/key/builder.hpp>
#include <iterator>
#include <ranges>

using namespace bequest::schema;
using namespace bequest::schema::key;

builder& builder::write(const std::string_view& str) {
  std::ranges::copy_n(str.data(), str.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const std::span<const uint8_t>& bytes) {
  std::ranges::copy_n(bytes.data(), bytes.size(), std::back_inserter(data));
  return *this;
}

builder& builder::write(const account_id_t& account) {
  return write(std::span<const uint8_t>{account.data(), account.size()});
}

builder& builder::write_id(const uint64_t id) {
  auto buffer = big_endian_id_t{id};
  return write(std::span<const uint8_t>{buffer.data(), sizeof(buffer)});
}

std::optional<uint64_t> bequest::schema::key::read_id(
    const bytes_view_t& key,
    const std::size_t offset) {
  auto buffer = big_endian_id_t{};
  if (key.size() < offset + sizeof(buffer)) {
    return std::nullopt;
  }
  std::ranges::copy_n(key.data() + offset, sizeof(buffer), buffer.data());
  return buffer.value();
}
