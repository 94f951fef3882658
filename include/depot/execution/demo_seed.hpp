#pragma once
#include <depot/execution/engine.hpp>

namespace depot::execution {

inline constexpr std::string_view kDemoPassword{"pass"};

/// Load the demo users, areas, machines and inventory. Skipped (returns false)
/// when any user already exists.
bool seed_demo_data(engine& engine);

}  // namespace depot::execution
