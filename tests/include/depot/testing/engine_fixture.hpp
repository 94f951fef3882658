#pragma once

#include <depot/execution/engine.hpp>
#include <depot/schema/primitives.hpp>
#include <depot/storage/rocksdb/storage.hpp>
#include <depot/store/types.hpp>
#include <depot/testing/common.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace depot::testing {

inline constexpr std::string_view kTestPassword{"secret"};
inline constexpr uint32_t kTestCredentialIterations = 1000;

/// Fresh database with an administrator, one requester, one approver and two
/// inventory items (10 and 5 units). The clock is fixed until advanced.
class engine_fixture final {
 public:
  explicit engine_fixture(const std::string_view db_prefix,
                          const int64_t lock_timeout_ms = 1000)
      : db_path_{make_db_path(db_prefix)},
        encoder_{},
        storage_{depot::storage::make_storage<
            depot::storage::rocksdb_storage_tag>(
            db_path_,
            depot::storage::storage_options{.lock_timeout_ms = lock_timeout_ms,
                                            .create_if_missing = true})},
        engine_{encoder_, storage_,
                depot::execution::engine_options{
                    .utc_offset_minutes = 0,
                    .max_code_attempts = 16,
                    .credential_iterations = kTestCredentialIterations},
                [this] { return now_.load(); }} {
    seed();
  }

  engine_fixture(const engine_fixture&) = delete;
  engine_fixture& operator=(const engine_fixture&) = delete;
  engine_fixture(engine_fixture&&) = delete;
  engine_fixture& operator=(engine_fixture&&) = delete;

  ~engine_fixture() { remove_path(db_path_); }

  depot::store::encoder_t& encoder() { return encoder_; }
  depot::store::storage_t& storage() { return storage_; }
  depot::execution::engine& engine() { return engine_; }

  void set_now(const depot::schema::timestamp_milliseconds_t now) {
    now_ = now;
  }
  void advance(const depot::schema::timestamp_milliseconds_t delta) {
    now_ += delta;
  }

  depot::schema::user_id_t admin_id() const { return admin_id_; }
  depot::schema::user_id_t requester_id() const { return requester_id_; }
  depot::schema::user_id_t approver_id() const { return approver_id_; }
  depot::schema::inventory_item_id_t filter_id() const { return filter_id_; }
  depot::schema::inventory_item_id_t bolt_id() const { return bolt_id_; }

  depot::schema::operation_result<depot::schema::requisition_t> submit(
      const std::vector<depot::schema::requisition_line_t>& lines) {
    auto request = depot::schema::submit_requisition_t{};
    request.requester_id = requester_id_;
    request.lines = lines;
    return engine_.submit_requisition(request);
  }

  depot::schema::operation_result<depot::schema::decision_outcome_t> approve(
      const depot::schema::requisition_id_t requisition_id,
      const std::map<depot::schema::requisition_item_id_t,
                     depot::schema::quantity_t>& quantities) {
    auto request = depot::schema::decide_requisition_t{};
    request.requisition_id = requisition_id;
    request.approver_id = approver_id_;
    request.decision = depot::schema::decision_t::approve;
    request.approved_quantities = quantities;
    return engine_.decide_requisition(request);
  }

  depot::schema::operation_result<depot::schema::decision_outcome_t> reject(
      const depot::schema::requisition_id_t requisition_id) {
    auto request = depot::schema::decide_requisition_t{};
    request.requisition_id = requisition_id;
    request.approver_id = approver_id_;
    request.decision = depot::schema::decision_t::reject;
    return engine_.decide_requisition(request);
  }

  depot::schema::quantity_t stock_of(
      const depot::schema::inventory_item_id_t item_id) {
    auto inventory = engine_.get_inventory();
    EXPECT_TRUE(inventory.ok());
    for (const auto& item : *inventory.value) {
      if (item.inventory_item_id == item_id) {
        return item.stock;
      }
    }
    ADD_FAILURE() << "inventory item " << item_id << " not found";
    return depot::schema::quantity_t{};
  }

 private:
  void seed() {
    auto admin =
        engine_.bootstrap_administrator("admin", "Admin", kTestPassword);
    EXPECT_TRUE(admin.ok()) << admin.info;
    admin_id_ = admin.value->user_id;

    auto requester = engine_.register_user(admin_id_, "requester", "Requester",
                                           kTestPassword,
                                           depot::schema::role_id_t::requester);
    EXPECT_TRUE(requester.ok()) << requester.info;
    requester_id_ = requester.value->user_id;

    auto approver = engine_.register_user(admin_id_, "approver", "Approver",
                                          kTestPassword,
                                          depot::schema::role_id_t::approver);
    EXPECT_TRUE(approver.ok()) << approver.info;
    approver_id_ = approver.value->user_id;

    auto filter = engine_.register_inventory_item(admin_id_, "SKU-001",
                                                  "Filtro", units(10), "un");
    EXPECT_TRUE(filter.ok()) << filter.info;
    filter_id_ = filter.value->inventory_item_id;

    auto bolt = engine_.register_inventory_item(admin_id_, "SKU-002",
                                                "Tornillo M8", units(5), "pcs");
    EXPECT_TRUE(bolt.ok()) << bolt.info;
    bolt_id_ = bolt.value->inventory_item_id;
  }

  std::string db_path_;
  std::atomic<depot::schema::timestamp_milliseconds_t> now_{kFixedNow};
  depot::store::encoder_t encoder_;
  depot::store::storage_t storage_;
  depot::execution::engine engine_;
  depot::schema::user_id_t admin_id_{};
  depot::schema::user_id_t requester_id_{};
  depot::schema::user_id_t approver_id_{};
  depot::schema::inventory_item_id_t filter_id_{};
  depot::schema::inventory_item_id_t bolt_id_{};
};

}  // namespace depot::testing
