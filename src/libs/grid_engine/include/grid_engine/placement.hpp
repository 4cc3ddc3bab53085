#pragma once

#include <grid_engine/engine_limits.hpp>
#include <grid_engine/geometry.hpp>

namespace grid_engine {

// Appends `new_items` to `existing`. Items with explicit coordinates keep them;
// items with a kUnplaced coordinate are laid out left to right, top to bottom,
// starting below everything already placed. Existing items never move.
//
// An item that cannot be placed (wider than `cols`, or out of search steps)
// is put at x = 0 below everything else and reported through the engine log.
Layout place_new_items(const Layout& existing, const Layout& new_items, int cols,
    const EngineLimits& limits = {});

// Re-packs non-static items into the first free cell in reading order, keeping
// their relative (y, x) order and their input position in the result. Items
// wider than `cols` go below everything. Like compaction, clears `moved`.
Layout optimize_layout(const Layout& layout, int cols, const EngineLimits& limits = {});

// Fits non-static items into `cols` after a column count change: items sticking
// out on the right are shifted left, items with x < 0 get the full width.
// Static items keep their x; one that overlaps an item accepted before it is
// pushed down row by row until clear.
Layout correct_bounds(const Layout& layout, int cols, const EngineLimits& limits = {});

} // namespace grid_engine
