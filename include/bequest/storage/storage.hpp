#pragma once
#include <bequest/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace bequest::storage {

using key_value_entry_t =
    std::pair<bequest::schema::bytes_t, bequest::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const bequest::schema::bytes_view_t& key) const;

  /// Persist all entries in one atomic write. Readers observe either none
  /// or all of them.
  void write(const std::vector<key_value_entry_t>& entries) const;

  /// Return all key-value pairs that share the provided key prefix, in
  /// ascending key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const bequest::schema::bytes_view_t& prefix) const;

  /// Return the greatest key-value pair under prefix, if any.
  std::optional<key_value_entry_t> last_by_prefix(
      const bequest::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path. With
/// `create_if_missing` false, a path holding no database is an error.
template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              bool create_if_missing = true);

}  // namespace bequest::storage
