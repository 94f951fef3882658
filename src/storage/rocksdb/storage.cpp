#include <depot/common/critical.hpp>
#include <depot/storage/rocksdb/storage.hpp>
#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

namespace depot::storage {

namespace detail {

void raise_on_failure(const ROCKSDB_NAMESPACE::Status& status,
                      const std::string_view operation) {
  if (status.ok() || status.IsNotFound()) {
    return;
  }
  auto retryable = is_retryable(status);
  spdlog::debug("RocksDB {} failed ({}): {}", operation,
                retryable ? "retryable" : "fatal", status.ToString());
  throw storage_error{fmt::format("{}: {}", operation, status.ToString()),
                      retryable};
}

namespace {

// Smallest key greater than every key that starts with prefix; empty when no
// such key exists (prefix made only of 0xFF bytes).
std::string make_prefix_successor(std::string prefix) {
  while (!prefix.empty() &&
         static_cast<uint8_t>(prefix.back()) == uint8_t{0xFF}) {
    prefix.pop_back();
  }
  if (!prefix.empty()) {
    prefix.back() = static_cast<char>(static_cast<uint8_t>(prefix.back()) + 1);
  }
  return prefix;
}

}  // namespace

}  // namespace detail

transaction<rocksdb_storage_tag>::transaction(
    std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> handle,
    const bool pin_snapshot)
    : handle_{std::move(handle)} {
  if (!handle_) {
    depot::common::critical("RocksDB failed to begin a transaction");
  }
  if (pin_snapshot) {
    handle_->SetSnapshot();
  }
}

transaction<rocksdb_storage_tag>::~transaction() {
  if (!active()) {
    return;
  }
  auto status = handle_->Rollback();
  if (!status.ok()) {
    spdlog::warn("RocksDB rollback on release failed: {}", status.ToString());
  }
}

transaction<rocksdb_storage_tag>::transaction(transaction&& other) noexcept
    : handle_{std::move(other.handle_)}, finished_{other.finished_} {
  other.finished_ = true;
}

transaction<rocksdb_storage_tag>& transaction<rocksdb_storage_tag>::operator=(
    transaction&& other) noexcept {
  if (this != &other) {
    if (active()) {
      auto status = handle_->Rollback();
      if (!status.ok()) {
        spdlog::warn("RocksDB rollback on reassignment failed: {}",
                     status.ToString());
      }
    }
    handle_ = std::move(other.handle_);
    finished_ = other.finished_;
    other.finished_ = true;
  }
  return *this;
}

ROCKSDB_NAMESPACE::ReadOptions transaction<rocksdb_storage_tag>::read_options()
    const {
  auto options = ROCKSDB_NAMESPACE::ReadOptions{};
  options.snapshot = handle_->GetSnapshot();
  return options;
}

std::optional<std::string> transaction<rocksdb_storage_tag>::read(
    const depot::schema::bytes_view_t& key,
    const bool exclusive) {
  if (!active()) {
    throw storage_error{"read on a finished transaction", false};
  }
  auto value = std::string{};
  auto status = ROCKSDB_NAMESPACE::Status{};
  if (exclusive) {
    // No snapshot on write transactions: the locked read sees the latest
    // committed value, so there is nothing to validate at commit.
    status = handle_->GetForUpdate(ROCKSDB_NAMESPACE::ReadOptions{},
                                   detail::to_slice(key), &value,
                                   /*exclusive=*/true);
  } else {
    status = handle_->Get(read_options(), detail::to_slice(key), &value);
  }
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  detail::raise_on_failure(status, exclusive ? "get_for_update" : "get");
  return value;
}

void transaction<rocksdb_storage_tag>::erase(
    const depot::schema::bytes_view_t& key) {
  if (!active()) {
    throw storage_error{"erase on a finished transaction", false};
  }
  detail::raise_on_failure(handle_->Delete(detail::to_slice(key)), "erase");
}

std::vector<key_value_entry_t> transaction<rocksdb_storage_tag>::list_by_prefix(
    const depot::schema::bytes_view_t& prefix) const {
  if (!active()) {
    throw storage_error{"scan on a finished transaction", false};
  }
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      handle_->GetIterator(read_options())};
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
  detail::raise_on_failure(iterator->status(), "list_by_prefix");
  return entries;
}

std::vector<key_value_entry_t>
transaction<rocksdb_storage_tag>::list_by_prefix_reverse(
    const depot::schema::bytes_view_t& prefix,
    const std::size_t limit) const {
  if (!active()) {
    throw storage_error{"scan on a finished transaction", false};
  }
  auto entries = std::vector<key_value_entry_t>{};
  if (limit == 0) {
    return entries;
  }
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};
  auto successor = detail::make_prefix_successor(prefix_string);

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      handle_->GetIterator(read_options())};
  if (successor.empty()) {
    iterator->SeekToLast();
  } else {
    iterator->SeekForPrev(successor);
    if (iterator->Valid() && iterator->key() == successor) {
      iterator->Prev();
    }
  }
  while (iterator->Valid() && entries.size() < limit) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Prev();
  }
  detail::raise_on_failure(iterator->status(), "list_by_prefix_reverse");
  return entries;
}

void transaction<rocksdb_storage_tag>::commit() {
  if (!active()) {
    throw storage_error{"commit on a finished transaction", false};
  }
  auto status = handle_->Commit();
  finished_ = true;
  if (!status.ok()) {
    // A failed commit leaves the transaction unusable; release its locks.
    auto rollback_status = handle_->Rollback();
    if (!rollback_status.ok()) {
      spdlog::warn("RocksDB rollback after failed commit: {}",
                   rollback_status.ToString());
    }
  }
  detail::raise_on_failure(status, "commit");
}

void transaction<rocksdb_storage_tag>::rollback() {
  if (!active()) {
    return;
  }
  auto status = handle_->Rollback();
  finished_ = true;
  detail::raise_on_failure(status, "rollback");
}

transaction<rocksdb_storage_tag>
storage<rocksdb_storage_tag>::begin_transaction() {
  if (!database) {
    depot::common::critical("RocksDB database is not initialized");
  }
  auto txn_options = ROCKSDB_NAMESPACE::TransactionOptions{};
  txn_options.lock_timeout = options.lock_timeout_ms;
  txn_options.deadlock_detect = true;
  return transaction<rocksdb_storage_tag>{
      std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{database->BeginTransaction(
          ROCKSDB_NAMESPACE::WriteOptions{}, txn_options)},
      false};
}

transaction<rocksdb_storage_tag> storage<rocksdb_storage_tag>::begin_read() {
  if (!database) {
    depot::common::critical("RocksDB database is not initialized");
  }
  return transaction<rocksdb_storage_tag>{
      std::unique_ptr<ROCKSDB_NAMESPACE::Transaction>{database->BeginTransaction(
          ROCKSDB_NAMESPACE::WriteOptions{},
          ROCKSDB_NAMESPACE::TransactionOptions{})},
      true};
}

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const storage_options& options) {
  auto store = storage<rocksdb_storage_tag>();
  store.options = options;

  auto db_options = ROCKSDB_NAMESPACE::Options{};
  db_options.create_if_missing = options.create_if_missing;
  db_options.IncreaseParallelism();
  db_options.OptimizeLevelStyleCompaction();

  auto txn_db_options = ROCKSDB_NAMESPACE::TransactionDBOptions{};
  txn_db_options.transaction_lock_timeout = options.lock_timeout_ms;
  txn_db_options.default_lock_timeout = options.lock_timeout_ms;

  ROCKSDB_NAMESPACE::TransactionDB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::TransactionDB::Open(
      db_options, txn_db_options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    depot::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {} (lock timeout {} ms)", path,
               options.lock_timeout_ms);
  store.database.reset(database);

  return store;
}

}  // namespace depot::storage
