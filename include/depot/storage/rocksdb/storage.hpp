#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/utilities/transaction.h>
#include <rocksdb/utilities/transaction_db.h>
#include <depot/storage/storage.hpp>
#include <memory>
#include <string>
#include <string_view>

namespace depot::storage {

namespace detail {

inline depot::schema::bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const depot::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

inline depot::schema::bytes_view_t to_view(const std::string& value) {
  return depot::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()};
}

inline bool is_retryable(const ROCKSDB_NAMESPACE::Status& status) {
  return status.IsBusy() || status.IsTimedOut() || status.IsTryAgain();
}

/// Throw storage_error for any status other than ok and not-found.
void raise_on_failure(const ROCKSDB_NAMESPACE::Status& status,
                      std::string_view operation);

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct transaction<rocksdb_storage_tag> final {
  transaction(std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> handle,
              bool pin_snapshot);
  ~transaction();

  transaction(const transaction&) = delete;
  transaction& operator=(const transaction&) = delete;
  transaction(transaction&& other) noexcept;
  transaction& operator=(transaction&& other) noexcept;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const depot::schema::bytes_view_t& key);

  template <typename T, typename Encoder>
  std::optional<T> get_for_update(Encoder& encoder,
                                  const depot::schema::bytes_view_t& key);

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const depot::schema::bytes_view_t& key,
           const T& value);

  void erase(const depot::schema::bytes_view_t& key);

  std::vector<key_value_entry_t> list_by_prefix(
      const depot::schema::bytes_view_t& prefix) const;

  std::vector<key_value_entry_t> list_by_prefix_reverse(
      const depot::schema::bytes_view_t& prefix,
      std::size_t limit) const;

  void commit();
  void rollback();

  bool active() const noexcept { return handle_ != nullptr && !finished_; }

 private:
  ROCKSDB_NAMESPACE::ReadOptions read_options() const;
  std::optional<std::string> read(const depot::schema::bytes_view_t& key,
                                  bool exclusive);

  std::unique_ptr<ROCKSDB_NAMESPACE::Transaction> handle_;
  bool finished_{};
};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::TransactionDB> database;
  storage_options options;

  transaction<rocksdb_storage_tag> begin_transaction();
  transaction<rocksdb_storage_tag> begin_read();
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path,
    const storage_options& options);

template <typename T, typename Encoder>
std::optional<T> transaction<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const depot::schema::bytes_view_t& key) {
  auto value = read(key, false);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(detail::to_view(*value))};
}

template <typename T, typename Encoder>
std::optional<T> transaction<rocksdb_storage_tag>::get_for_update(
    Encoder& encoder,
    const depot::schema::bytes_view_t& key) {
  auto value = read(key, true);
  if (!value) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(detail::to_view(*value))};
}

template <typename T, typename Encoder>
void transaction<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const depot::schema::bytes_view_t& key,
    const T& value) {
  if (!active()) {
    throw storage_error{"put on a finished transaction", false};
  }
  auto encoded_value = encoder.encode(value);
  auto status = handle_->Put(
      detail::to_slice(key),
      detail::to_slice(depot::schema::bytes_view_t{encoded_value}));
  detail::raise_on_failure(status, "put");
}

}  // namespace depot::storage
