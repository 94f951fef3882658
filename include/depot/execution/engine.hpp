#pragma once

#include <depot/audit/approval_log.hpp>
#include <depot/crypto/credential.hpp>
#include <depot/execution/code_generator.hpp>
#include <depot/ledger/inventory_ledger.hpp>
#include <depot/schema/area_state.hpp>
#include <depot/schema/audit_verification.hpp>
#include <depot/schema/decide_requisition.hpp>
#include <depot/schema/identity.hpp>
#include <depot/schema/inventory_item_state.hpp>
#include <depot/schema/machine_state.hpp>
#include <depot/schema/operation_result.hpp>
#include <depot/schema/primitives.hpp>
#include <depot/schema/requisition.hpp>
#include <depot/schema/submit_requisition.hpp>
#include <depot/store/reference_store.hpp>
#include <depot/store/requisition_store.hpp>
#include <depot/store/types.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace depot::execution {

using clock_fn_t = std::function<depot::schema::timestamp_milliseconds_t()>;

/// Wall clock in milliseconds since the Unix epoch.
depot::schema::timestamp_milliseconds_t system_clock_now();

struct engine_options final {
  /// Fixed offset applied before taking the calendar day of a code.
  int32_t utc_offset_minutes{0};
  /// Whole-transaction attempts for a creation that hits lock contention.
  uint32_t max_code_attempts{8};
  /// PBKDF2 work factor for new credentials.
  uint32_t credential_iterations{depot::crypto::kDefaultCredentialIterations};
};

/// approved when every line got its full requested quantity, otherwise
/// partially_approved.
depot::schema::requisition_status_t derive_approval_status(
    const std::vector<depot::schema::requisition_item_state_t>& items);

/// Requisition lifecycle engine.
///
/// Every mutating call runs in one pessimistic RocksDB transaction and holds
/// row locks until it commits or rolls back; there is no engine-wide mutex, so
/// the engine may be called from any number of threads. Domain failures are
/// reported through operation_result codes and never leave partial writes.
class engine final {
 public:
  explicit engine(depot::store::encoder_t& encoder,
                  depot::store::storage_t& storage,
                  engine_options options = {},
                  clock_fn_t clock = system_clock_now);

  /// Check username/password. Unknown user and wrong password both yield
  /// invalid_credentials.
  depot::schema::operation_result<depot::schema::identity_t> authenticate(
      std::string_view username,
      std::string_view password);

  /// Create a pending requisition with a fresh daily code.
  ///
  /// Lines with a non-positive quantity are dropped before validation. Lock
  /// conflicts re-run the whole creation up to max_code_attempts times.
  depot::schema::operation_result<depot::schema::requisition_t>
  submit_requisition(const depot::schema::submit_requisition_t& request);

  /// Approve or reject a pending requisition.
  ///
  /// Approval deducts each approved quantity from stock (ascending inventory
  /// id order) and reports any shortfall. The decision is never retried
  /// automatically.
  depot::schema::operation_result<depot::schema::decision_outcome_t>
  decide_requisition(const depot::schema::decide_requisition_t& request);

  depot::schema::operation_result<depot::schema::requisition_t>
  get_requisition(depot::schema::requisition_id_t requisition_id);

  depot::schema::operation_result<depot::schema::requisition_t>
  get_requisition_by_code(std::string_view code);

  /// Requisitions of one requester, newest first.
  depot::schema::operation_result<std::vector<depot::schema::requisition_t>>
  list_by_requester(depot::schema::user_id_t requester_id);

  /// Pending requisitions, oldest first.
  depot::schema::operation_result<std::vector<depot::schema::requisition_t>>
  list_pending();

  /// Most recent requisitions of any status, newest first.
  depot::schema::operation_result<std::vector<depot::schema::requisition_t>>
  list_history(std::size_t limit);

  depot::schema::operation_result<
      std::vector<depot::schema::inventory_item_state_t>>
  get_inventory();

  depot::schema::operation_result<std::vector<depot::schema::area_state_t>>
  list_areas();

  depot::schema::operation_result<std::vector<depot::schema::machine_state_t>>
  list_machines();

  /// Recompute the approval digest chain of a requisition.
  depot::schema::operation_result<depot::schema::audit_verification_t>
  verify_audit_trail(depot::schema::requisition_id_t requisition_id);

  /// Create the first administrator. Denied once any user exists.
  depot::schema::operation_result<depot::schema::identity_t>
  bootstrap_administrator(std::string_view username,
                          std::string_view display_name,
                          std::string_view password);

  depot::schema::operation_result<depot::schema::identity_t> register_user(
      depot::schema::user_id_t actor_id,
      std::string_view username,
      std::string_view display_name,
      std::string_view password,
      depot::schema::role_id_t role);

  depot::schema::operation_result<depot::schema::identity_t> update_user_role(
      depot::schema::user_id_t actor_id,
      depot::schema::user_id_t user_id,
      depot::schema::role_id_t role);

  depot::schema::operation_result<depot::schema::identity_t>
  update_user_credential(depot::schema::user_id_t actor_id,
                         depot::schema::user_id_t user_id,
                         std::string_view password);

  depot::schema::operation_result<std::vector<depot::schema::identity_t>>
  list_users(depot::schema::user_id_t actor_id);

  depot::schema::operation_result<depot::schema::area_state_t> register_area(
      depot::schema::user_id_t actor_id,
      std::string_view code,
      std::string_view name);

  depot::schema::operation_result<depot::schema::machine_state_t>
  register_machine(depot::schema::user_id_t actor_id,
                   std::string_view code,
                   std::string_view name,
                   std::optional<depot::schema::area_id_t> area_id);

  depot::schema::operation_result<depot::schema::inventory_item_state_t>
  register_inventory_item(depot::schema::user_id_t actor_id,
                          std::string_view sku,
                          std::string_view description,
                          depot::schema::quantity_t stock,
                          std::string_view unit);

 private:
  /// Header, lines and approvals of one requisition as seen by txn.
  std::optional<depot::schema::requisition_t> load_requisition(
      depot::store::transaction_t& txn,
      depot::schema::requisition_id_t requisition_id) const;

  std::vector<depot::schema::requisition_t> load_requisitions(
      depot::store::transaction_t& txn,
      const std::vector<depot::schema::requisition_state_t>& headers) const;

  /// std::nullopt when actor is an existing administrator, otherwise the
  /// denial to report.
  std::optional<depot::schema::error_code> check_administrator(
      depot::store::transaction_t& txn,
      depot::schema::user_id_t actor_id) const;

  depot::store::encoder_t& encoder_;
  depot::store::storage_t& storage_;
  engine_options options_;
  clock_fn_t clock_;
  depot::store::reference_store references_;
  depot::store::requisition_store requisitions_;
  depot::ledger::inventory_ledger ledger_;
  depot::audit::approval_log approvals_;
  code_generator codes_;
  depot::schema::bytes_t decoy_credential_;
};

}  // namespace depot::execution
