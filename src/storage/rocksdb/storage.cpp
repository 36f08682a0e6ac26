#include <coffer/common/critical.hpp>
#include <coffer/storage/rocksdb/storage.hpp>

namespace {

// Single writer; each slot commits one small batch.
ROCKSDB_NAMESPACE::Options make_ledger_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.OptimizeForSmallDb();
  options.max_background_jobs = 2;
  options.max_open_files = 64;
  options.keep_log_file_num = 4;
  options.info_log_level = ROCKSDB_NAMESPACE::InfoLogLevel::WARN_LEVEL;
  return options;
}

}  // namespace

namespace coffer::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(make_ledger_options(),
                                            std::string{path}, &database);
  if (status.IsIOError()) {
    coffer::common::critical(
        "ledger store at {} is unavailable (held by another coffer process?): "
        "{}",
        path, status.ToString());
  }
  if (!status.ok()) {
    coffer::common::critical("cannot open ledger store at {}: {}", path,
                             status.ToString());
  }
  store.database.reset(database);
  spdlog::debug("Opened ledger store at {}", path);

  return store;
}

}  // namespace coffer::storage
