#include <depot/common/critical.hpp>
#include <depot/execution/demo_seed.hpp>
#include <spdlog/spdlog.h>

using namespace depot::schema;

namespace {

template <typename T>
T require(operation_result<T> result, const std::string_view step) {
  if (!result.ok() || !result.value) {
    spdlog::error("demo seed step '{}' failed: {} ({})", step, result.log,
                  result.info);
    depot::common::critical("demo seed failed");
  }
  return std::move(*result.value);
}

}  // namespace

namespace depot::execution {

bool seed_demo_data(engine& engine) {
  auto admin =
      engine.bootstrap_administrator("admin", "Admin", kDemoPassword);
  if (admin.error() == error_code::authorization_denied) {
    spdlog::info("users already exist; demo seed skipped");
    return false;
  }
  auto admin_id = require(std::move(admin), "admin").user_id;

  require(engine.register_user(admin_id, "supervisor1", "Supervisor Uno",
                               kDemoPassword, role_id_t::requester),
          "supervisor1");
  require(engine.register_user(admin_id, "bodega1", "Bodega Uno",
                               kDemoPassword, role_id_t::approver),
          "bodega1");

  auto area_a = require(engine.register_area(admin_id, "A1", "Area A"), "A1");
  auto area_b = require(engine.register_area(admin_id, "A2", "Area B"), "A2");
  require(engine.register_machine(admin_id, "MACH-001", "Corte 1",
                                  area_a.area_id),
          "MACH-001");
  require(engine.register_machine(admin_id, "MACH-002", "Taladro 1",
                                  area_b.area_id),
          "MACH-002");

  require(engine.register_inventory_item(admin_id, "SKU-001", "Filtro",
                                         make_quantity(50), "un"),
          "SKU-001");
  require(engine.register_inventory_item(admin_id, "SKU-002", "Tornillo M8",
                                         make_quantity(1000), "pcs"),
          "SKU-002");

  spdlog::info("demo data seeded");
  return true;
}

}  // namespace depot::execution
