#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <ferry/common/critical.hpp>
#include <ferry/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>
#include <utility>

namespace ferry::storage {

namespace detail {

inline ferry::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const ferry::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline void check(const ROCKSDB_NAMESPACE::Status& status,
                  const std::string_view operation) {
  if (!status.ok()) {
    ferry::common::critical("RocksDB {} failed: {}", operation,
                            status.ToString());
  }
}

}  // namespace detail

struct rocksdb_storage_tag {};

/// RocksDB-backed ledger. Every failure is fatal; callers never see a
/// partially applied write.
template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const ferry::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const ferry::schema::bytes_view_t& key,
           const T& value);

  std::optional<ferry::schema::bytes_t> get_raw(
      const ferry::schema::bytes_view_t& key) const;
  void write(const std::vector<write_entry_t>& entries) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const ferry::schema::bytes_view_t& prefix) const;

 private:
  ROCKSDB_NAMESPACE::DB& open_database() const {
    if (!database) {
      ferry::common::critical("RocksDB database is not open");
    }
    return *database;
  }
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const ferry::schema::bytes_view_t& key) const {
  auto raw = get_raw(key);
  if (!raw) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      ferry::schema::bytes_view_t{raw->data(), raw->size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const ferry::schema::bytes_view_t& key,
                                       const T& value) {
  auto encoded = encoder.encode(value);
  write({write_entry_t{ferry::schema::make_bytes(key), std::move(encoded)}});
}

inline std::optional<ferry::schema::bytes_t>
storage<rocksdb_storage_tag>::get_raw(
    const ferry::schema::bytes_view_t& key) const {
  auto value = std::string{};
  auto status = open_database().Get(ROCKSDB_NAMESPACE::ReadOptions{},
                                    detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  detail::check(status, "get");
  return ferry::schema::bytes_t(std::begin(value), std::end(value));
}

inline void storage<rocksdb_storage_tag>::write(
    const std::vector<write_entry_t>& entries) const {
  auto& db = open_database();
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto key_slice =
        detail::to_slice(ferry::schema::bytes_view_t{key.data(), key.size()});
    if (value) {
      detail::check(batch.Put(key_slice,
                              detail::to_slice(ferry::schema::bytes_view_t{
                                  value->data(), value->size()})),
                    "batch put");
    } else {
      detail::check(batch.Delete(key_slice), "batch delete");
    }
  }
  detail::check(db.Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch),
                "batch commit");
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const ferry::schema::bytes_view_t& prefix) const {
  auto entries = std::vector<key_value_entry_t>{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      open_database().NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  auto start = detail::to_slice(prefix);
  for (iterator->Seek(start);
       iterator->Valid() && iterator->key().starts_with(start);
       iterator->Next()) {
    entries.emplace_back(detail::to_bytes(iterator->key()),
                         detail::to_bytes(iterator->value()));
  }
  detail::check(iterator->status(), "prefix scan");
  return entries;
}

}  // namespace ferry::storage
