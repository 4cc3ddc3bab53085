#pragma once

#include <grid_engine/geometry.hpp>
#include <grid_engine/types.hpp>
#include <optional>

namespace grid_engine {

// Moves `item` to (x, y) and pushes everything it lands on down, breadth-first.
// A pushed item that lands on a static one jumps below it instead. A missing
// coordinate keeps the current one. Static items and no-op moves (unless
// options.force) return the input layout. An item absent from `layout` is
// appended at the target.
//
// Propagation stops after options.limits.move_iteration_cap() steps; the
// partial result is returned and the cap hit is logged and reported in `stats`.
Layout move_element(const Layout& layout, const LayoutItem& item,
    std::optional<int> x, std::optional<int> y,
    const MoveOptions& options, PropagationStats* stats = nullptr);

} // namespace grid_engine
