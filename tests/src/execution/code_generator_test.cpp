#include <depot/execution/code_generator.hpp>
#include <depot/schema/key/store_keys.hpp>
#include <depot/testing/common.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

using depot::execution::calendar_day_t;

TEST(code_generator, formats_zero_padded_codes) {
  auto day = calendar_day_t{.year = 2025, .month = 3, .day = 4};
  EXPECT_EQ(depot::execution::to_compact_string(day), "20250304");
  EXPECT_EQ(depot::execution::format_code(day, 1), "REQ-20250304-0001");
  EXPECT_EQ(depot::execution::format_code(day, 9999), "REQ-20250304-9999");
}

TEST(code_generator, parse_inverts_format) {
  auto parsed = depot::execution::parse_code("REQ-20241231-0042");
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(parsed->day, (calendar_day_t{.year = 2024, .month = 12, .day = 31}));
  EXPECT_EQ(parsed->sequence, 42u);
}

TEST(code_generator, parse_rejects_malformed_codes) {
  EXPECT_FALSE(depot::execution::parse_code("REQ-20250230-0001").has_value());
  EXPECT_FALSE(depot::execution::parse_code("REQ-20250301-0000").has_value());
  EXPECT_FALSE(depot::execution::parse_code("REQ-2025031-00001").has_value());
  EXPECT_FALSE(depot::execution::parse_code("ORD-20250301-0001").has_value());
  EXPECT_FALSE(depot::execution::parse_code("REQ-20250301-00a1").has_value());
  EXPECT_FALSE(depot::execution::parse_code("").has_value());
}

TEST(code_generator, calendar_day_honours_utc_offset) {
  // 2025-03-14T02:30:00Z
  constexpr auto ts = depot::schema::timestamp_milliseconds_t{1741919400000};
  EXPECT_EQ(depot::execution::to_calendar_day(ts, 0),
            (calendar_day_t{.year = 2025, .month = 3, .day = 14}));
  EXPECT_EQ(depot::execution::to_calendar_day(ts, -180),
            (calendar_day_t{.year = 2025, .month = 3, .day = 13}));
  EXPECT_EQ(depot::execution::to_calendar_day(ts, 600),
            (calendar_day_t{.year = 2025, .month = 3, .day = 14}));
}

namespace {

class code_generator_test : public ::testing::Test {
 protected:
  void SetUp() override {
    db_path_ = depot::testing::make_db_path("depot_codes");
    storage_.emplace(
        depot::storage::make_storage<depot::storage::rocksdb_storage_tag>(
            db_path_, depot::storage::storage_options{.lock_timeout_ms = 50}));
  }

  void TearDown() override {
    storage_.reset();
    depot::testing::remove_path(db_path_);
  }

  std::string issue(const calendar_day_t& day) {
    auto txn = storage_->begin_transaction();
    auto code = generator_.next_code(txn, day);
    txn.commit();
    return code;
  }

  depot::store::encoder_t encoder_;
  depot::execution::code_generator generator_{encoder_};
  std::optional<depot::store::storage_t> storage_;
  calendar_day_t day_{.year = 2025, .month = 3, .day = 14};

 private:
  std::string db_path_;
};

}  // namespace

TEST_F(code_generator_test, sequences_are_per_day_and_gap_free) {
  EXPECT_EQ(issue(day_), "REQ-20250314-0001");
  EXPECT_EQ(issue(day_), "REQ-20250314-0002");
  EXPECT_EQ(issue(calendar_day_t{.year = 2025, .month = 3, .day = 15}),
            "REQ-20250315-0001");
  EXPECT_EQ(issue(day_), "REQ-20250314-0003");
}

TEST_F(code_generator_test, aborted_creation_gives_its_number_back) {
  {
    auto txn = storage_->begin_transaction();
    EXPECT_EQ(generator_.next_code(txn, day_), "REQ-20250314-0001");
    txn.rollback();
  }
  EXPECT_EQ(issue(day_), "REQ-20250314-0001");
}

TEST_F(code_generator_test, codes_already_indexed_are_skipped) {
  {
    auto txn = storage_->begin_transaction();
    txn.put(encoder_,
            depot::schema::key::make_code_index_key("REQ-20250314-0001"),
            uint64_t{77});
    txn.commit();
  }
  EXPECT_EQ(issue(day_), "REQ-20250314-0002");
}

TEST_F(code_generator_test, exhausted_day_raises) {
  {
    auto txn = storage_->begin_transaction();
    txn.put(encoder_,
            depot::schema::key::make_day_sequence_key(
                depot::execution::to_compact_string(day_)),
            uint64_t{depot::execution::kMaxDailySequence});
    txn.commit();
  }
  auto txn = storage_->begin_transaction();
  EXPECT_THROW(static_cast<void>(generator_.next_code(txn, day_)),
               depot::execution::code_generation_error);
}

TEST_F(code_generator_test, concurrent_issuers_serialize_on_the_day_counter) {
  auto holder = storage_->begin_transaction();
  EXPECT_EQ(generator_.next_code(holder, day_), "REQ-20250314-0001");

  auto contender = storage_->begin_transaction();
  EXPECT_THROW(static_cast<void>(generator_.next_code(contender, day_)),
               depot::storage::storage_error);
}
