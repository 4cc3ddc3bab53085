#pragma once

#include <grid_engine/geometry.hpp>
#include <grid_engine/types.hpp>

namespace grid_engine {

// Applies the new size of `resized` (matched by id) and makes room for it.
//
// The requested size is clamped to the item's min/max. With
// ResizeBehavior::Shrink every colliding neighbour gives up the overlapping
// columns; if any of them would drop below its min_w (or is static) nothing is
// shrunk and the resize falls back to pushing. Pushing is a forced in-place
// move through move_element().
//
// With options.prevent_collision the resize is all or nothing: if the item
// cannot keep its requested position without touching a static item the input
// layout is returned unchanged. Otherwise leftover overlaps are resolved
// vertically. Static or non-resizable items, and ids not present in the
// layout, leave the layout unchanged.
Layout resize_item(const Layout& layout, const LayoutItem& resized, const ResizeOptions& options);

} // namespace grid_engine
