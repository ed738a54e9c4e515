#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <bequest/common/critical.hpp>
#include <bequest/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string_view>

namespace bequest::storage {

namespace detail {

inline bequest::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const bequest::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const bequest::schema::bytes_view_t& key) const;

  void write(const std::vector<key_value_entry_t>& entries) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const bequest::schema::bytes_view_t& prefix) const;
  std::optional<key_value_entry_t> last_by_prefix(
      const bequest::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    bool create_if_missing);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const bequest::schema::bytes_view_t& key) const {
  if (!database) {
    bequest::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      bequest::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(bequest::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

inline void storage<rocksdb_storage_tag>::write(
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    bequest::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(bequest::schema::bytes_view_t{key}),
                  detail::to_slice(bequest::schema::bytes_view_t{value}));
    if (!put_status.ok()) {
      bequest::common::critical("failed staging key in write batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch of {} entries: {}",
                  entries.size(), write_status.ToString());
    bequest::common::critical("failed to commit write batch");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const bequest::schema::bytes_view_t& prefix) const {
  if (!database) {
    bequest::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("Prefix scan failed: {}", iterator->status().ToString());
    bequest::common::critical("failed to scan RocksDB prefix");
  }
  return entries;
}

inline std::optional<key_value_entry_t>
storage<rocksdb_storage_tag>::last_by_prefix(
    const bequest::schema::bytes_view_t& prefix) const {
  if (!database) {
    bequest::common::critical("RocksDB database is not initialized");
  }

  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  // Every key under the prefix sorts before prefix + 0xFF...; ids in keys
  // are fixed width, so eight 0xFF bytes bound them.
  auto upper = prefix_string;
  upper.append(sizeof(uint64_t) + 1, static_cast<char>(0xFF));

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->SeekForPrev(upper);
  if (!iterator->Valid()) {
    return std::nullopt;
  }
  auto key_view =
      std::string_view{iterator->key().data(), iterator->key().size()};
  if (!key_view.starts_with(prefix_string)) {
    return std::nullopt;
  }
  return key_value_entry_t{detail::to_bytes(iterator->key()),
                           detail::to_bytes(iterator->value())};
}

}  // namespace bequest::storage
