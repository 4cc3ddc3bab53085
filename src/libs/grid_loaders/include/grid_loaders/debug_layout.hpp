#pragma once

#include <grid_model/layout_item.hpp>
#include <cstdint>

namespace grid_loaders {

// Deterministic pseudo-random layout: `count` items named "item_<i>", the first
// `static_count` of them static. Positions may overlap.
grid_model::Layout generate_debug_layout(int count, int cols, int static_count = 0, std::uint32_t seed = 42);

// Small hand-written dashboard (12 columns) with a static header.
grid_model::Layout sample_dashboard_layout();

} // namespace grid_loaders
