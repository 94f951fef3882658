#include <depot/schema/key/builder.hpp>
#include <depot/schema/key/store_keys.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <string>

namespace {

std::string as_string(const depot::schema::bytes_t& bytes) {
  return std::string{std::begin(bytes), std::end(bytes)};
}

}  // namespace

TEST(store_keys, no_keyspace_is_a_prefix_of_another) {
  const auto& spaces = depot::schema::key::kStoreKeyspaces;
  for (std::size_t i = 0; i < spaces.size(); ++i) {
    for (std::size_t j = 0; j < spaces.size(); ++j) {
      if (i == j) {
        continue;
      }
      EXPECT_FALSE(spaces[j].starts_with(spaces[i]))
          << spaces[i] << " prefixes " << spaces[j];
    }
  }
}

TEST(store_keys, ids_are_big_endian_so_keys_sort_numerically) {
  auto low = depot::schema::key::make_requisition_key(255);
  auto high = depot::schema::key::make_requisition_key(256);
  EXPECT_LT(as_string(low), as_string(high));
  EXPECT_TRUE(as_string(low).starts_with(
      depot::schema::key::kRequisitionKeyPrefix));
  EXPECT_EQ(low.size(),
            depot::schema::key::kRequisitionKeyPrefix.size() + sizeof(uint64_t));
}

TEST(store_keys, requester_index_key_ends_with_requisition_id) {
  auto key = depot::schema::key::make_requester_index_key(4, 0x0102030405060708);
  ASSERT_GE(key.size(), 16u);
  EXPECT_EQ(depot::schema::bytes_t(key.end() - 8, key.end()),
            (depot::schema::bytes_t{0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07,
                                    0x08}));
  EXPECT_EQ(depot::schema::bytes_t(key.end() - 16, key.end() - 8),
            (depot::schema::bytes_t{0, 0, 0, 0, 0, 0, 0, 4}));
}

TEST(store_keys, child_keys_share_their_parent_prefix) {
  auto lines = as_string(depot::schema::key::make_requisition_line_prefix(9));
  EXPECT_TRUE(
      as_string(depot::schema::key::make_requisition_line_key(9, 3))
          .starts_with(lines));
  EXPECT_FALSE(
      as_string(depot::schema::key::make_requisition_line_key(10, 3))
          .starts_with(lines));

  auto approvals = as_string(depot::schema::key::make_approval_prefix(9));
  EXPECT_TRUE(as_string(depot::schema::key::make_approval_key(9, 1))
                  .starts_with(approvals));

  auto requester =
      as_string(depot::schema::key::make_requester_index_prefix(2));
  EXPECT_TRUE(as_string(depot::schema::key::make_requester_index_key(2, 5))
                  .starts_with(requester));
}

TEST(store_keys, natural_key_indexes_embed_the_text) {
  EXPECT_EQ(as_string(depot::schema::key::make_code_index_key(
                "REQ-20250314-0001")),
            "DEPOT|INDEX|CODE|REQ-20250314-0001");
  EXPECT_EQ(as_string(depot::schema::key::make_sku_index_key("SKU-001")),
            "DEPOT|INDEX|SKU|SKU-001");
  EXPECT_EQ(as_string(depot::schema::key::make_day_sequence_key("20250314")),
            "DEPOT|SEQ|DAY|20250314");
}

TEST(store_keys, builder_writes_integers_big_endian) {
  auto builder = depot::schema::key::builder{};
  builder.write(std::string_view{"K"}).write(uint32_t{0x01020304});
  EXPECT_EQ(builder.data,
            (depot::schema::bytes_t{'K', 0x01, 0x02, 0x03, 0x04}));

  auto id = depot::schema::key::builder{};
  id.write(uint64_t{42});
  EXPECT_EQ(id.data, (depot::schema::bytes_t{0, 0, 0, 0, 0, 0, 0, 42}));
}
