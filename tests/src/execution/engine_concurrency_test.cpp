#include <depot/execution/code_generator.hpp>
#include <depot/execution/engine.hpp>
#include <depot/testing/engine_fixture.hpp>
#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using depot::schema::error_code;
using depot::schema::requisition_line_t;
using depot::testing::engine_fixture;
using depot::testing::units;

namespace {

constexpr auto kWorkers = 8;

}  // namespace

TEST(engine_concurrency, parallel_creations_get_distinct_gap_free_codes) {
  auto fixture = engine_fixture{"depot_concurrency_codes", 5000};
  constexpr auto kCreations = 50;

  auto codes = std::vector<std::string>{};
  auto codes_mutex = std::mutex{};
  auto failures = std::atomic<int>{};
  auto next = std::atomic<int>{};

  auto workers = std::vector<std::thread>{};
  for (auto w = 0; w < kWorkers; ++w) {
    workers.emplace_back([&] {
      while (next.fetch_add(1) < kCreations) {
        auto result = fixture.submit({requisition_line_t{
            .inventory_item_id = fixture.filter_id(), .quantity = units(1)}});
        if (!result.ok()) {
          ++failures;
          continue;
        }
        auto lock = std::scoped_lock{codes_mutex};
        codes.push_back(result.value->header.code);
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  EXPECT_EQ(failures.load(), 0);
  ASSERT_EQ(codes.size(), static_cast<std::size_t>(kCreations));
  auto sequences = std::set<uint32_t>{};
  for (const auto& code : codes) {
    auto parsed = depot::execution::parse_code(code);
    ASSERT_TRUE(parsed.has_value()) << code;
    sequences.insert(parsed->sequence);
  }
  ASSERT_EQ(sequences.size(), static_cast<std::size_t>(kCreations));
  EXPECT_EQ(*sequences.begin(), 1u);
  EXPECT_EQ(*sequences.rbegin(), static_cast<uint32_t>(kCreations));

  auto pending = fixture.engine().list_pending();
  ASSERT_TRUE(pending.ok());
  EXPECT_EQ(pending.value->size(), static_cast<std::size_t>(kCreations));
}

TEST(engine_concurrency, racing_decisions_on_one_requisition_apply_once) {
  auto fixture = engine_fixture{"depot_concurrency_decide", 5000};
  auto submitted = fixture.submit({requisition_line_t{
      .inventory_item_id = fixture.filter_id(), .quantity = units(3)}});
  ASSERT_TRUE(submitted.ok());
  auto requisition_id = submitted.value->header.requisition_id;
  auto item_id = submitted.value->items[0].requisition_item_id;

  auto successes = std::atomic<int>{};
  auto state_conflicts = std::atomic<int>{};
  auto workers = std::vector<std::thread>{};
  for (auto w = 0; w < kWorkers; ++w) {
    workers.emplace_back([&] {
      auto result = fixture.approve(requisition_id, {{item_id, units(3)}});
      if (result.ok()) {
        ++successes;
      } else if (result.error() == error_code::invalid_state_transition) {
        ++state_conflicts;
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  EXPECT_EQ(successes.load(), 1);
  EXPECT_EQ(state_conflicts.load(), kWorkers - 1);
  EXPECT_EQ(fixture.stock_of(fixture.filter_id()), units(7));
  auto stored = fixture.engine().get_requisition(requisition_id);
  ASSERT_TRUE(stored.ok());
  EXPECT_EQ(stored.value->approvals.size(), 1u);
}

TEST(engine_concurrency, approvals_on_one_sku_never_oversell) {
  auto fixture = engine_fixture{"depot_concurrency_stock", 5000};
  // 8 requisitions of 2 units against a stock of 10.
  auto requisitions = std::vector<depot::schema::requisition_t>{};
  for (auto i = 0; i < kWorkers; ++i) {
    auto submitted = fixture.submit({requisition_line_t{
        .inventory_item_id = fixture.filter_id(), .quantity = units(2)}});
    ASSERT_TRUE(submitted.ok());
    requisitions.push_back(*submitted.value);
  }

  auto applied_milli = std::atomic<int64_t>{};
  auto shortfall_milli = std::atomic<int64_t>{};
  auto failures = std::atomic<int>{};
  auto workers = std::vector<std::thread>{};
  for (const auto& requisition : requisitions) {
    workers.emplace_back([&fixture, &applied_milli, &shortfall_milli, &failures,
                          requisition] {
      const auto& item = requisition.items[0];
      auto result = fixture.approve(requisition.header.requisition_id,
                                    {{item.requisition_item_id, units(2)}});
      if (!result.ok()) {
        ++failures;
        return;
      }
      applied_milli += result.value->requisition.items[0].approved->milli_units;
      for (const auto& shortfall : result.value->shortfalls) {
        shortfall_milli += shortfall.shortfall.milli_units;
      }
    });
  }
  for (auto& worker : workers) {
    worker.join();
  }

  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(applied_milli.load(), units(10).milli_units);
  EXPECT_EQ(shortfall_milli.load(), units(6).milli_units);
  EXPECT_EQ(fixture.stock_of(fixture.filter_id()), depot::schema::quantity_t{});
}
