#pragma once

#include <grid_engine/engine_limits.hpp>
#include <grid_engine/geometry.hpp>
#include <grid_engine/types.hpp>

namespace grid_engine::detail {

// Throws std::invalid_argument for a non-positive grid extent.
void require_positive_cols(int cols, const char* operation);

// Rebuilds a compaction result in input order: untouched items are returned
// as-is, everything else with moved cleared.
Layout finish_compaction(const Layout& original, const Layout& compacted);

// Pushes every non-static item that overlaps an earlier one (in `axis` order)
// forward along `axis` until clear. Statics seed the placed set.
Layout resolve_overlaps(const Layout& layout, CompactType axis, const EngineLimits& limits);

} // namespace grid_engine::detail
