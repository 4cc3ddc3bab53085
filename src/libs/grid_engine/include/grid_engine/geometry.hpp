#pragma once

#include <grid_engine/types.hpp>
#include <grid_model/layout_item.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace grid_engine {

using grid_model::Layout;
using grid_model::LayoutItem;

// Axis-aligned overlap of [x, x+w) x [y, y+h). An item never collides with itself (same id).
bool collides(const LayoutItem& a, const LayoutItem& b);

std::optional<LayoutItem> first_collision(const Layout& layout, const LayoutItem& item);
Layout all_collisions(const Layout& layout, const LayoutItem& item);

Layout statics(const Layout& layout);

// max(y + h) over the layout, 0 when empty.
int bottom(const Layout& layout);

// Stable order by (y, x), or (x, y) for horizontal compaction.
std::vector<std::size_t> sorted_order(const Layout& layout, CompactType compact_type);
Layout sort_layout_items(const Layout& layout, CompactType compact_type);

// Minimal rectangle enclosing every item; zero-sized at the origin for an empty layout.
LayoutItem bounding_box(const Layout& layout);

const LayoutItem* find_item(const Layout& layout, const std::string& id);

// Number of overlapping pairs. Static/static pairs are ignored: statics are
// placed by the caller and may legitimately overlap each other.
std::size_t count_overlaps(const Layout& layout);

} // namespace grid_engine
