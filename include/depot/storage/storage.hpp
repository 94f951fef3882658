#pragma once
#include <depot/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace depot::storage {

using key_value_entry_t =
    std::pair<depot::schema::bytes_t, depot::schema::bytes_t>;

/// Backend tuning supplied at open time.
struct storage_options final {
  /// Upper bound on a row lock wait before the operation fails.
  int64_t lock_timeout_ms{1000};
  bool create_if_missing{true};
};

/// Raised by transactional operations. retryable() is true for lock
/// timeouts, busy rows and deadlocks: re-running the whole transaction may
/// succeed.
class storage_error : public std::runtime_error {
 public:
  storage_error(const std::string& message, bool retryable)
      : std::runtime_error{message}, retryable_{retryable} {}

  bool retryable() const noexcept { return retryable_; }

 private:
  bool retryable_{};
};

/// Unit of work with row locks. Rolls back on destruction unless committed.
template <typename Library>
struct transaction {
  /// Decode the value at key as seen by this transaction, or std::nullopt.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const depot::schema::bytes_view_t& key);

  /// Same as get, holding an exclusive lock on key until commit/rollback.
  template <typename T, typename Encoder>
  std::optional<T> get_for_update(Encoder& encoder,
                                  const depot::schema::bytes_view_t& key);

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const depot::schema::bytes_view_t& key,
           const T& value);

  void erase(const depot::schema::bytes_view_t& key);

  /// Entries sharing prefix in ascending key order.
  std::vector<key_value_entry_t> list_by_prefix(
      const depot::schema::bytes_view_t& prefix) const;

  /// Entries sharing prefix in descending key order, at most limit of them.
  std::vector<key_value_entry_t> list_by_prefix_reverse(
      const depot::schema::bytes_view_t& prefix,
      std::size_t limit) const;

  void commit();
  void rollback();
};

template <typename Library>
struct storage {
  /// Read-write transaction. Plain reads see the latest committed data.
  transaction<Library> begin_transaction();

  /// Read transaction pinned to a consistent snapshot.
  transaction<Library> begin_read();
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path,
                              const storage_options& options);

}  // namespace depot::storage
