#pragma once
#include <ferry/schema/primitives.hpp>
#include <ferry/storage/storage.hpp>
#include <map>
#include <optional>
#include <utility>
#include <vector>

namespace ferry::storage {

/// Write-buffering view over a storage backend for one router call.
///
/// Reads see buffered writes first, then the backend. Nothing reaches the
/// backend until `commit()`, which applies every buffered write as one atomic
/// batch. Destroying an uncommitted view discards its writes.
template <typename Library>
class pending_state final {
 public:
  explicit pending_state(storage<Library>& backend) : backend_{backend} {}

  pending_state(const pending_state&) = delete;
  pending_state& operator=(const pending_state&) = delete;

  std::optional<ferry::schema::bytes_t> get(
      const ferry::schema::bytes_view_t& key) const {
    auto buffered = writes_.find(ferry::schema::make_bytes(key));
    if (buffered != std::end(writes_)) {
      return buffered->second;
    }
    return backend_.get_raw(key);
  }

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const ferry::schema::bytes_view_t& key) const {
    auto raw = get(key);
    if (!raw) {
      return std::nullopt;
    }
    return {encoder.template decode<T>(
        ferry::schema::bytes_view_t{raw->data(), raw->size()})};
  }

  void put(const ferry::schema::bytes_view_t& key,
           ferry::schema::bytes_t value) {
    writes_[ferry::schema::make_bytes(key)] = std::move(value);
  }

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const ferry::schema::bytes_view_t& key,
           const T& value) {
    put(key, encoder.encode(value));
  }

  void erase(const ferry::schema::bytes_view_t& key) {
    writes_[ferry::schema::make_bytes(key)] = std::nullopt;
  }

  /// Number of keys with a buffered write or delete.
  std::size_t pending_writes() const { return writes_.size(); }

  void commit() {
    if (writes_.empty()) {
      return;
    }
    auto entries = std::vector<write_entry_t>{};
    entries.reserve(writes_.size());
    for (auto& [key, value] : writes_) {
      entries.emplace_back(key, std::move(value));
    }
    backend_.write(entries);
    writes_.clear();
  }

  void discard() { writes_.clear(); }

 private:
  storage<Library>& backend_;
  std::map<ferry::schema::bytes_t, std::optional<ferry::schema::bytes_t>>
      writes_;
};

}  // namespace ferry::storage
