#include <gtest/gtest.h>
#include <depot/schema/primitives.hpp>

TEST(primitives, to_hex_renders_lowercase_pairs) {
  auto bytes = depot::schema::bytes_t{0x00, 0x0A, 0xFF, 0x10};
  EXPECT_EQ(depot::schema::to_hex(bytes),
            "000aff10");
}

TEST(primitives, bytes_and_strings_share_content) {
  auto bytes = depot::schema::make_bytes(std::string_view{"REQ-20250314-0001"});
  EXPECT_EQ(bytes.size(), 17u);
  EXPECT_EQ(bytes.front(), 'R');
  EXPECT_EQ(depot::schema::make_string(bytes), "REQ-20250314-0001");
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = depot::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}
