#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <depot/execution/engine.hpp>
#include <iterator>
#include <numeric>
#include <utility>

using namespace depot::schema;

namespace {

template <typename T>
operation_result<T> storage_failure(const std::string_view codespace,
                                    const std::string_view operation,
                                    const depot::storage::storage_error& error) {
  spdlog::warn("{} aborted by storage: {}", operation, error.what());
  return make_error<T>(
      error_code::storage_failure, codespace,
      fmt::format("{} (retryable: {})", error.what(), error.retryable()));
}

identity_t make_identity(const user_state_t& user) {
  return identity_t{.user_id = user.user_id,
                    .username = user.username,
                    .display_name = user.display_name,
                    .role = user.role};
}

std::optional<std::string> invalid_name(const std::string_view field,
                                        const std::string_view value) {
  if (value.empty()) {
    return fmt::format("{} must not be empty", field);
  }
  return std::nullopt;
}

}  // namespace

namespace depot::execution {

timestamp_milliseconds_t system_clock_now() {
  return static_cast<timestamp_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::system_clock::now().time_since_epoch())
          .count());
}

requisition_status_t derive_approval_status(
    const std::vector<requisition_item_state_t>& items) {
  auto fully_approved =
      std::all_of(std::begin(items), std::end(items), [](const auto& item) {
        return item.approved.has_value() && *item.approved == item.requested;
      });
  return fully_approved ? requisition_status_t::approved
                        : requisition_status_t::partially_approved;
}

engine::engine(depot::store::encoder_t& encoder,
               depot::store::storage_t& storage,
               engine_options options,
               clock_fn_t clock)
    : encoder_{encoder},
      storage_{storage},
      options_{options},
      clock_{std::move(clock)},
      references_{encoder},
      requisitions_{encoder},
      ledger_{encoder},
      approvals_{encoder},
      codes_{encoder},
      decoy_credential_{depot::crypto::hash_credential(
          "", options.credential_iterations)} {
  if (options_.max_code_attempts == 0) {
    spdlog::warn("max_code_attempts is 0; using 1");
    options_.max_code_attempts = 1;
  }
  spdlog::info(
      "Requisition engine ready (utc offset {} min, {} code attempt(s))",
      options_.utc_offset_minutes, options_.max_code_attempts);
}

operation_result<identity_t> engine::authenticate(
    const std::string_view username,
    const std::string_view password) {
  try {
    auto txn = storage_.begin_read();
    auto user = references_.find_user_by_username(txn, username);
    if (!user) {
      // Same amount of work as a real check.
      static_cast<void>(
          depot::crypto::verify_credential(password, decoy_credential_));
      spdlog::warn("authentication failed for '{}'", username);
      return make_error<identity_t>(error_code::invalid_credentials,
                                    kCodespaceAuth,
                                    "username or password mismatch");
    }
    if (!depot::crypto::verify_credential(password, user->credential)) {
      spdlog::warn("authentication failed for '{}'", username);
      return make_error<identity_t>(error_code::invalid_credentials,
                                    kCodespaceAuth,
                                    "username or password mismatch");
    }
    return make_success(make_identity(*user), kCodespaceAuth);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<identity_t>(kCodespaceAuth, "authenticate", error);
  }
}

operation_result<requisition_t> engine::submit_requisition(
    const submit_requisition_t& request) {
  auto lines = std::vector<requisition_line_t>{};
  std::copy_if(std::begin(request.lines), std::end(request.lines),
               std::back_inserter(lines),
               [](const auto& line) { return is_positive(line.quantity); });
  if (lines.empty()) {
    return make_error<requisition_t>(
        error_code::empty_requisition, kCodespaceSubmit,
        "no line with a positive quantity");
  }

  for (auto attempt = uint32_t{1}; attempt <= options_.max_code_attempts;
       ++attempt) {
    try {
      auto txn = storage_.begin_transaction();

      auto requester = references_.find_user(txn, request.requester_id);
      if (!requester) {
        return make_error<requisition_t>(
            error_code::unknown_requester, kCodespaceSubmit,
            fmt::format("user {} does not exist", request.requester_id));
      }
      if (!can_submit(requester->role)) {
        return make_error<requisition_t>(
            error_code::authorization_denied, kCodespaceSubmit,
            fmt::format("role {} cannot submit requisitions",
                        to_string(requester->role)));
      }
      if (request.machine_id &&
          !references_.find_machine(txn, *request.machine_id)) {
        return make_error<requisition_t>(
            error_code::unknown_machine, kCodespaceSubmit,
            fmt::format("machine {} does not exist", *request.machine_id));
      }
      if (request.area_id && !references_.find_area(txn, *request.area_id)) {
        return make_error<requisition_t>(
            error_code::unknown_area, kCodespaceSubmit,
            fmt::format("area {} does not exist", *request.area_id));
      }
      for (const auto& line : lines) {
        if (!ledger_.find(txn, line.inventory_item_id)) {
          return make_error<requisition_t>(
              error_code::unknown_inventory_item, kCodespaceSubmit,
              fmt::format("inventory item {} does not exist",
                          line.inventory_item_id));
        }
      }

      auto now = clock_();
      auto code = codes_.next_code(
          txn, to_calendar_day(now, options_.utc_offset_minutes));

      auto result = requisition_t{};
      auto& header = result.header;
      header.requisition_id = requisitions_.allocate_requisition_id(txn);
      header.code = std::move(code);
      header.requester_id = request.requester_id;
      header.machine_id = request.machine_id;
      header.area_id = request.area_id;
      header.status = requisition_status_t::pending;
      header.created_at = now;
      header.updated_at = now;
      header.note = request.note.value_or("");

      result.items.reserve(lines.size());
      for (const auto& line : lines) {
        auto item = requisition_item_state_t{};
        item.requisition_item_id = requisitions_.allocate_item_id(txn);
        item.requisition_id = header.requisition_id;
        item.inventory_item_id = line.inventory_item_id;
        item.requested = line.quantity;
        result.items.push_back(std::move(item));
      }

      requisitions_.insert(txn, header, result.items);
      txn.commit();

      spdlog::info("requisition {} ({}) created by user {} with {} line(s)",
                   header.code, header.requisition_id, header.requester_id,
                   result.items.size());
      return make_success(std::move(result), kCodespaceSubmit);
    } catch (const depot::storage::storage_error& error) {
      if (!error.retryable()) {
        return storage_failure<requisition_t>(kCodespaceSubmit,
                                              "submit_requisition", error);
      }
      spdlog::warn("requisition creation attempt {}/{} conflicted: {}",
                   attempt, options_.max_code_attempts, error.what());
    } catch (const code_generation_error& error) {
      spdlog::warn("requisition creation failed: {}", error.what());
      return make_error<requisition_t>(error_code::code_generation_failed,
                                       kCodespaceSubmit, error.what());
    }
  }
  return make_error<requisition_t>(
      error_code::code_generation_failed, kCodespaceSubmit,
      fmt::format("no unique code after {} attempt(s)",
                  options_.max_code_attempts));
}

operation_result<decision_outcome_t> engine::decide_requisition(
    const decide_requisition_t& request) {
  try {
    auto txn = storage_.begin_transaction();

    auto approver = references_.find_user(txn, request.approver_id);
    if (!approver) {
      return make_error<decision_outcome_t>(
          error_code::unknown_approver, kCodespaceDecide,
          fmt::format("user {} does not exist", request.approver_id));
    }
    if (!can_decide(approver->role)) {
      return make_error<decision_outcome_t>(
          error_code::authorization_denied, kCodespaceDecide,
          fmt::format("role {} cannot decide requisitions",
                      to_string(approver->role)));
    }

    auto header = requisitions_.lock(txn, request.requisition_id);
    if (!header) {
      return make_error<decision_outcome_t>(
          error_code::requisition_missing, kCodespaceDecide,
          fmt::format("requisition {} does not exist",
                      request.requisition_id));
    }
    if (is_terminal(header->status)) {
      return make_error<decision_outcome_t>(
          error_code::invalid_state_transition, kCodespaceDecide,
          fmt::format("requisition {} is {}, not pending", header->code,
                      to_string(header->status)));
    }

    auto items = requisitions_.list_items(txn, header->requisition_id);
    for (const auto& [item_id, quantity] : request.approved_quantities) {
      auto match = std::find_if(
          std::begin(items), std::end(items), [id = item_id](const auto& item) {
            return item.requisition_item_id == id;
          });
      if (match == std::end(items)) {
        return make_error<decision_outcome_t>(
            error_code::unknown_requisition_item, kCodespaceDecide,
            fmt::format("item {} is not part of requisition {}", item_id,
                        header->code));
      }
      if (request.decision == decision_t::approve &&
          (is_negative(quantity) || quantity > match->requested)) {
        return make_error<decision_outcome_t>(
            error_code::invalid_approved_quantity, kCodespaceDecide,
            fmt::format("item {} approved {} outside [0, {}]", item_id,
                        to_string(quantity), to_string(match->requested)));
      }
    }

    auto now = clock_();
    auto outcome = decision_outcome_t{};

    switch (request.decision) {
      case decision_t::reject:
        for (auto& item : items) {
          item.approved = quantity_t{};
        }
        header->status = requisition_status_t::rejected;
        break;
      case decision_t::approve: {
        // Ledger rows are locked in ascending inventory id order.
        auto order = std::vector<std::size_t>(items.size());
        std::iota(std::begin(order), std::end(order), std::size_t{0});
        std::stable_sort(std::begin(order), std::end(order),
                         [&items](const auto lhs, const auto rhs) {
                           return items[lhs].inventory_item_id <
                                  items[rhs].inventory_item_id;
                         });
        for (auto index : order) {
          auto& item = items[index];
          auto wanted = quantity_t{};
          if (auto it = request.approved_quantities.find(
                  item.requisition_item_id);
              it != std::end(request.approved_quantities)) {
            wanted = it->second;
          }
          if (!is_positive(wanted)) {
            item.approved = quantity_t{};
            continue;
          }
          auto applied = ledger_.decrement(txn, item.inventory_item_id, wanted);
          if (!applied) {
            return make_error<decision_outcome_t>(
                error_code::unknown_inventory_item, kCodespaceDecide,
                fmt::format("inventory item {} does not exist",
                            item.inventory_item_id));
          }
          item.approved = applied->applied;
          if (is_positive(applied->shortfall)) {
            outcome.shortfalls.push_back(stock_shortfall_t{
                .requisition_item_id = item.requisition_item_id,
                .inventory_item_id = item.inventory_item_id,
                .wanted = wanted,
                .applied = applied->applied,
                .shortfall = applied->shortfall});
            spdlog::warn("requisition {} item {}: short by {}", header->code,
                         item.requisition_item_id,
                         to_string(applied->shortfall));
          }
        }
        header->status = derive_approval_status(items);
        break;
      }
    }

    approvals_.append(txn, *header, approver->user_id, request.decision,
                      request.comment.value_or(""), now);
    header->updated_at = now;
    for (const auto& item : items) {
      requisitions_.update_item(txn, item);
    }
    requisitions_.update(txn, *header);

    outcome.requisition.approvals = approvals_.list(txn, header->requisition_id);
    txn.commit();

    spdlog::info("requisition {} {} by user {} -> {} ({} shortfall(s))",
                 header->code, to_string(request.decision), approver->user_id,
                 to_string(header->status), outcome.shortfalls.size());
    outcome.requisition.header = std::move(*header);
    outcome.requisition.items = std::move(items);
    return make_success(std::move(outcome), kCodespaceDecide);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<decision_outcome_t>(kCodespaceDecide,
                                               "decide_requisition", error);
  }
}

operation_result<requisition_t> engine::get_requisition(
    const requisition_id_t requisition_id) {
  try {
    auto txn = storage_.begin_read();
    auto requisition = load_requisition(txn, requisition_id);
    if (!requisition) {
      return make_error<requisition_t>(
          error_code::requisition_missing, kCodespaceQuery,
          fmt::format("requisition {} does not exist", requisition_id));
    }
    return make_success(std::move(*requisition), kCodespaceQuery);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<requisition_t>(kCodespaceQuery, "get_requisition",
                                          error);
  }
}

operation_result<requisition_t> engine::get_requisition_by_code(
    const std::string_view code) {
  try {
    auto txn = storage_.begin_read();
    auto requisition_id = requisitions_.find_id_by_code(txn, code);
    auto requisition = requisition_id ? load_requisition(txn, *requisition_id)
                                      : std::nullopt;
    if (!requisition) {
      return make_error<requisition_t>(
          error_code::requisition_missing, kCodespaceQuery,
          fmt::format("requisition {} does not exist", code));
    }
    return make_success(std::move(*requisition), kCodespaceQuery);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<requisition_t>(kCodespaceQuery,
                                          "get_requisition_by_code", error);
  }
}

operation_result<std::vector<requisition_t>> engine::list_by_requester(
    const user_id_t requester_id) {
  try {
    auto txn = storage_.begin_read();
    if (!references_.find_user(txn, requester_id)) {
      return make_error<std::vector<requisition_t>>(
          error_code::unknown_requester, kCodespaceQuery,
          fmt::format("user {} does not exist", requester_id));
    }
    return make_success(
        load_requisitions(txn,
                          requisitions_.list_by_requester(txn, requester_id)),
        kCodespaceQuery);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<std::vector<requisition_t>>(
        kCodespaceQuery, "list_by_requester", error);
  }
}

operation_result<std::vector<requisition_t>> engine::list_pending() {
  try {
    auto txn = storage_.begin_read();
    return make_success(
        load_requisitions(txn, requisitions_.list_pending(txn)),
        kCodespaceQuery);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<std::vector<requisition_t>>(kCodespaceQuery,
                                                       "list_pending", error);
  }
}

operation_result<std::vector<requisition_t>> engine::list_history(
    const std::size_t limit) {
  if (limit == 0) {
    return make_error<std::vector<requisition_t>>(
        error_code::invalid_argument, kCodespaceQuery,
        "history limit must be positive");
  }
  try {
    auto txn = storage_.begin_read();
    return make_success(
        load_requisitions(txn, requisitions_.list_recent(txn, limit)),
        kCodespaceQuery);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<std::vector<requisition_t>>(kCodespaceQuery,
                                                       "list_history", error);
  }
}

operation_result<std::vector<inventory_item_state_t>> engine::get_inventory() {
  try {
    auto txn = storage_.begin_read();
    return make_success(ledger_.list(txn), kCodespaceQuery);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<std::vector<inventory_item_state_t>>(
        kCodespaceQuery, "get_inventory", error);
  }
}

operation_result<std::vector<area_state_t>> engine::list_areas() {
  try {
    auto txn = storage_.begin_read();
    return make_success(references_.list_areas(txn), kCodespaceQuery);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<std::vector<area_state_t>>(kCodespaceQuery,
                                                      "list_areas", error);
  }
}

operation_result<std::vector<machine_state_t>> engine::list_machines() {
  try {
    auto txn = storage_.begin_read();
    return make_success(references_.list_machines(txn), kCodespaceQuery);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<std::vector<machine_state_t>>(kCodespaceQuery,
                                                         "list_machines", error);
  }
}

operation_result<audit_verification_t> engine::verify_audit_trail(
    const requisition_id_t requisition_id) {
  try {
    auto txn = storage_.begin_read();
    if (!requisitions_.find(txn, requisition_id)) {
      return make_error<audit_verification_t>(
          error_code::requisition_missing, kCodespaceQuery,
          fmt::format("requisition {} does not exist", requisition_id));
    }
    return make_success(approvals_.verify(txn, requisition_id),
                        kCodespaceQuery);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<audit_verification_t>(kCodespaceQuery,
                                                 "verify_audit_trail", error);
  }
}

operation_result<identity_t> engine::bootstrap_administrator(
    const std::string_view username,
    const std::string_view display_name,
    const std::string_view password) {
  for (const auto& problem : {invalid_name("username", username),
                              invalid_name("password", password)}) {
    if (problem) {
      return make_error<identity_t>(error_code::invalid_argument,
                                    kCodespaceAdmin, *problem);
    }
  }
  try {
    auto txn = storage_.begin_transaction();
    if (references_.lock_user_count(txn) > 0) {
      return make_error<identity_t>(error_code::authorization_denied,
                                    kCodespaceAdmin,
                                    "users already exist; bootstrap refused");
    }
    auto user = user_state_t{};
    user.username = std::string{username};
    user.display_name = std::string{display_name};
    user.credential =
        depot::crypto::hash_credential(password, options_.credential_iterations);
    user.role = role_id_t::administrator;
    user.created_at = clock_();
    auto inserted = references_.insert_user(txn, std::move(user));
    if (!inserted) {
      return make_error<identity_t>(error_code::user_exists, kCodespaceAdmin,
                                    fmt::format("user {} exists", username));
    }
    txn.commit();
    spdlog::info("bootstrap administrator '{}' created as user {}", username,
                 inserted->user_id);
    return make_success(make_identity(*inserted), kCodespaceAdmin);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<identity_t>(kCodespaceAdmin,
                                       "bootstrap_administrator", error);
  }
}

operation_result<identity_t> engine::register_user(
    const user_id_t actor_id,
    const std::string_view username,
    const std::string_view display_name,
    const std::string_view password,
    const role_id_t role) {
  for (const auto& problem : {invalid_name("username", username),
                              invalid_name("password", password)}) {
    if (problem) {
      return make_error<identity_t>(error_code::invalid_argument,
                                    kCodespaceAdmin, *problem);
    }
  }
  try {
    auto txn = storage_.begin_transaction();
    if (auto denied = check_administrator(txn, actor_id)) {
      return make_error<identity_t>(
          *denied, kCodespaceAdmin,
          fmt::format("user {} may not register users", actor_id));
    }
    auto user = user_state_t{};
    user.username = std::string{username};
    user.display_name = std::string{display_name};
    user.credential =
        depot::crypto::hash_credential(password, options_.credential_iterations);
    user.role = role;
    user.created_at = clock_();
    auto inserted = references_.insert_user(txn, std::move(user));
    if (!inserted) {
      return make_error<identity_t>(error_code::user_exists, kCodespaceAdmin,
                                    fmt::format("user {} exists", username));
    }
    txn.commit();
    spdlog::info("user '{}' registered as {} (id {})", username,
                 to_string(role), inserted->user_id);
    return make_success(make_identity(*inserted), kCodespaceAdmin);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<identity_t>(kCodespaceAdmin, "register_user",
                                       error);
  }
}

operation_result<identity_t> engine::update_user_role(
    const user_id_t actor_id,
    const user_id_t user_id,
    const role_id_t role) {
  try {
    auto txn = storage_.begin_transaction();
    if (auto denied = check_administrator(txn, actor_id)) {
      return make_error<identity_t>(
          *denied, kCodespaceAdmin,
          fmt::format("user {} may not change roles", actor_id));
    }
    auto user = references_.lock_user(txn, user_id);
    if (!user) {
      return make_error<identity_t>(
          error_code::unknown_user, kCodespaceAdmin,
          fmt::format("user {} does not exist", user_id));
    }
    user->role = role;
    references_.update_user(txn, *user);
    txn.commit();
    spdlog::info("user {} role set to {}", user_id, to_string(role));
    return make_success(make_identity(*user), kCodespaceAdmin);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<identity_t>(kCodespaceAdmin, "update_user_role",
                                       error);
  }
}

operation_result<identity_t> engine::update_user_credential(
    const user_id_t actor_id,
    const user_id_t user_id,
    const std::string_view password) {
  if (auto problem = invalid_name("password", password)) {
    return make_error<identity_t>(error_code::invalid_argument,
                                  kCodespaceAdmin, *problem);
  }
  try {
    auto txn = storage_.begin_transaction();
    if (auto denied = check_administrator(txn, actor_id)) {
      return make_error<identity_t>(
          *denied, kCodespaceAdmin,
          fmt::format("user {} may not change credentials", actor_id));
    }
    auto user = references_.lock_user(txn, user_id);
    if (!user) {
      return make_error<identity_t>(
          error_code::unknown_user, kCodespaceAdmin,
          fmt::format("user {} does not exist", user_id));
    }
    user->credential =
        depot::crypto::hash_credential(password, options_.credential_iterations);
    references_.update_user(txn, *user);
    txn.commit();
    spdlog::info("user {} credential replaced", user_id);
    return make_success(make_identity(*user), kCodespaceAdmin);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<identity_t>(kCodespaceAdmin,
                                       "update_user_credential", error);
  }
}

operation_result<std::vector<identity_t>> engine::list_users(
    const user_id_t actor_id) {
  try {
    auto txn = storage_.begin_read();
    if (auto denied = check_administrator(txn, actor_id)) {
      return make_error<std::vector<identity_t>>(
          *denied, kCodespaceAdmin,
          fmt::format("user {} may not list users", actor_id));
    }
    auto users = references_.list_users(txn);
    auto identities = std::vector<identity_t>{};
    identities.reserve(users.size());
    std::transform(std::begin(users), std::end(users),
                   std::back_inserter(identities), make_identity);
    return make_success(std::move(identities), kCodespaceAdmin);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<std::vector<identity_t>>(kCodespaceAdmin,
                                                    "list_users", error);
  }
}

operation_result<area_state_t> engine::register_area(
    const user_id_t actor_id,
    const std::string_view code,
    const std::string_view name) {
  if (auto problem = invalid_name("area code", code)) {
    return make_error<area_state_t>(error_code::invalid_argument,
                                    kCodespaceAdmin, *problem);
  }
  try {
    auto txn = storage_.begin_transaction();
    if (auto denied = check_administrator(txn, actor_id)) {
      return make_error<area_state_t>(
          *denied, kCodespaceAdmin,
          fmt::format("user {} may not register areas", actor_id));
    }
    auto area = area_state_t{};
    area.code = std::string{code};
    area.name = std::string{name};
    auto inserted = references_.insert_area(txn, std::move(area));
    if (!inserted) {
      return make_error<area_state_t>(error_code::area_exists, kCodespaceAdmin,
                                      fmt::format("area {} exists", code));
    }
    txn.commit();
    spdlog::info("area {} registered (id {})", code, inserted->area_id);
    return make_success(std::move(*inserted), kCodespaceAdmin);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<area_state_t>(kCodespaceAdmin, "register_area",
                                         error);
  }
}

operation_result<machine_state_t> engine::register_machine(
    const user_id_t actor_id,
    const std::string_view code,
    const std::string_view name,
    const std::optional<area_id_t> area_id) {
  if (auto problem = invalid_name("machine code", code)) {
    return make_error<machine_state_t>(error_code::invalid_argument,
                                       kCodespaceAdmin, *problem);
  }
  try {
    auto txn = storage_.begin_transaction();
    if (auto denied = check_administrator(txn, actor_id)) {
      return make_error<machine_state_t>(
          *denied, kCodespaceAdmin,
          fmt::format("user {} may not register machines", actor_id));
    }
    if (area_id && !references_.find_area(txn, *area_id)) {
      return make_error<machine_state_t>(
          error_code::unknown_area, kCodespaceAdmin,
          fmt::format("area {} does not exist", *area_id));
    }
    auto machine = machine_state_t{};
    machine.code = std::string{code};
    machine.name = std::string{name};
    machine.area_id = area_id;
    auto inserted = references_.insert_machine(txn, std::move(machine));
    if (!inserted) {
      return make_error<machine_state_t>(
          error_code::machine_exists, kCodespaceAdmin,
          fmt::format("machine {} exists", code));
    }
    txn.commit();
    spdlog::info("machine {} registered (id {})", code, inserted->machine_id);
    return make_success(std::move(*inserted), kCodespaceAdmin);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<machine_state_t>(kCodespaceAdmin,
                                            "register_machine", error);
  }
}

operation_result<inventory_item_state_t> engine::register_inventory_item(
    const user_id_t actor_id,
    const std::string_view sku,
    const std::string_view description,
    const quantity_t stock,
    const std::string_view unit) {
  if (auto problem = invalid_name("sku", sku)) {
    return make_error<inventory_item_state_t>(error_code::invalid_argument,
                                              kCodespaceAdmin, *problem);
  }
  if (is_negative(stock)) {
    return make_error<inventory_item_state_t>(
        error_code::invalid_quantity, kCodespaceAdmin,
        fmt::format("initial stock {} is negative", to_string(stock)));
  }
  try {
    auto txn = storage_.begin_transaction();
    if (auto denied = check_administrator(txn, actor_id)) {
      return make_error<inventory_item_state_t>(
          *denied, kCodespaceAdmin,
          fmt::format("user {} may not register inventory", actor_id));
    }
    auto inserted =
        ledger_.register_item(txn, std::string{sku}, std::string{description},
                              stock, std::string{unit});
    if (!inserted) {
      return make_error<inventory_item_state_t>(
          error_code::sku_exists, kCodespaceAdmin,
          fmt::format("sku {} exists", sku));
    }
    txn.commit();
    spdlog::info("inventory item {} registered (id {}, stock {} {})", sku,
                 inserted->inventory_item_id, to_string(inserted->stock),
                 inserted->unit);
    return make_success(std::move(*inserted), kCodespaceAdmin);
  } catch (const depot::storage::storage_error& error) {
    return storage_failure<inventory_item_state_t>(
        kCodespaceAdmin, "register_inventory_item", error);
  }
}

std::optional<requisition_t> engine::load_requisition(
    depot::store::transaction_t& txn,
    const requisition_id_t requisition_id) const {
  auto header = requisitions_.find(txn, requisition_id);
  if (!header) {
    return std::nullopt;
  }
  auto requisition = requisition_t{};
  requisition.header = std::move(*header);
  requisition.items = requisitions_.list_items(txn, requisition_id);
  requisition.approvals = approvals_.list(txn, requisition_id);
  return requisition;
}

std::vector<requisition_t> engine::load_requisitions(
    depot::store::transaction_t& txn,
    const std::vector<requisition_state_t>& headers) const {
  auto out = std::vector<requisition_t>{};
  out.reserve(headers.size());
  for (const auto& header : headers) {
    auto requisition = requisition_t{};
    requisition.header = header;
    requisition.items = requisitions_.list_items(txn, header.requisition_id);
    requisition.approvals = approvals_.list(txn, header.requisition_id);
    out.push_back(std::move(requisition));
  }
  return out;
}

std::optional<error_code> engine::check_administrator(
    depot::store::transaction_t& txn,
    const user_id_t actor_id) const {
  auto actor = references_.find_user(txn, actor_id);
  if (!actor || !can_administer(actor->role)) {
    return error_code::authorization_denied;
  }
  return std::nullopt;
}

}  // namespace depot::execution
