#pragma once
#include <depot/schema/encoding/scale/encoder.hpp>
#include <depot/storage/rocksdb/storage.hpp>
#include <vector>

namespace depot::store {

using encoder_t = depot::schema::encoding::encoder<
    depot::schema::encoding::scale_encoder_tag>;
using storage_t = depot::storage::storage<depot::storage::rocksdb_storage_tag>;
using transaction_t =
    depot::storage::transaction<depot::storage::rocksdb_storage_tag>;

template <typename T>
std::vector<T> decode_values(
    encoder_t& encoder,
    const std::vector<depot::storage::key_value_entry_t>& entries) {
  auto out = std::vector<T>{};
  out.reserve(entries.size());
  for (const auto& entry : entries) {
    out.push_back(encoder.decode<T>(entry.second));
  }
  return out;
}

}  // namespace depot::store
