#include <spdlog/spdlog.h>
#include <ferry/common/critical.hpp>
#include <ferry/storage/rocksdb/storage.hpp>

namespace ferry::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  // Rows are small and written in short batches; keep the default memtable
  // but let background work use the available cores.
  options.IncreaseParallelism();

  auto* raw = static_cast<ROCKSDB_NAMESPACE::DB*>(nullptr);
  auto status = ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &raw);
  if (!status.ok()) {
    ferry::common::critical("Failed to open ledger at {}: {}", path,
                            status.ToString());
  }
  spdlog::info("Opened ledger at {}", path);

  auto store = storage<rocksdb_storage_tag>{};
  store.database.reset(raw);
  return store;
}

}  // namespace ferry::storage
