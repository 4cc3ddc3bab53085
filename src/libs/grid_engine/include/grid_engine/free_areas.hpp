#pragma once

#include <grid_engine/geometry.hpp>
#include <optional>

namespace grid_engine {

// Queries over the empty cells of [0, cols) x [0, bottom(layout)). Areas are
// returned as LayoutItems named "free_area_<i>". An empty layout has a single
// cols x 1 area at the origin.

// Maximal empty rectangles, sorted by (y, x).
Layout available_free_areas(const Layout& layout, int cols);

// Maximal runs of empty cells, one row high, in reading order.
Layout available_horizontal_free_areas(const Layout& layout, int cols);

// True when some free area is at least as wide and as tall as `item`.
bool can_item_fit(const Layout& layout, const LayoutItem& item, int cols);

std::optional<LayoutItem> first_free_area(const Layout& layout, int cols);

// First free area starting on the row of the lowest item top edge.
std::optional<LayoutItem> last_row_free_area(const Layout& layout, int cols);

} // namespace grid_engine
