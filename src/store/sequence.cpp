#include <spdlog/spdlog.h>
#include <depot/schema/key/store_keys.hpp>
#include <depot/store/sequence.hpp>

namespace depot::store {

uint64_t next_sequence(encoder_t& encoder,
                       transaction_t& txn,
                       const std::string_view name) {
  auto key = depot::schema::key::make_sequence_key(name);
  auto last = txn.get_for_update<uint64_t>(encoder, key).value_or(0);
  auto next = last + 1;
  txn.put(encoder, key, next);
  spdlog::debug("sequence {} advanced to {}", name, next);
  return next;
}

}  // namespace depot::store
