#include <grid_engine/placement.hpp>
#include <grid_engine/compactor.hpp>
#include <grid_engine/log.hpp>
#include "engine_detail.hpp"
#include <algorithm>
#include <optional>
#include <vector>

namespace grid_engine {

Layout place_new_items(const Layout& existing, const Layout& new_items, int cols, const EngineLimits& limits) {
    detail::require_positive_cols(cols, "place_new_items");

    Layout result = existing;
    result.reserve(existing.size() + new_items.size());

    Layout to_place;
    for (const LayoutItem& item : new_items) {
        if (grid_model::needs_placement(item))
            to_place.push_back(item);
        else
            result.push_back(item);
    }
    if (to_place.empty()) return result;

    int cursor_x = 0;
    int cursor_y = bottom(result);

    for (const LayoutItem& item : to_place) {
        bool placed = false;
        if (item.w <= cols) {
            for (int step = 0; step < limits.max_placement_iterations; ++step) {
                if (cursor_x + item.w > cols) {
                    cursor_x = 0;
                    ++cursor_y;
                    continue;
                }
                const LayoutItem candidate = item.with_position(cursor_x, cursor_y);
                if (first_collision(result, candidate)) {
                    ++cursor_x;
                    continue;
                }
                result.push_back(candidate);
                cursor_x += item.w;
                placed = true;
                break;
            }
        }
        if (!placed) {
            const int y = bottom(result);
            engine_logger()->warn("no free slot found for '{}' ({}x{} on {} columns), appending at row {}",
                item.id, item.w, item.h, cols, y);
            result.push_back(item.with_position(0, y));
            cursor_x = 0;
            cursor_y = bottom(result);
        }
    }
    return result;
}

Layout optimize_layout(const Layout& layout, int cols, const EngineLimits& limits) {
    detail::require_positive_cols(cols, "optimize_layout");

    Layout out = layout;
    Layout placed = statics(layout);
    placed.reserve(layout.size());

    for (std::size_t index : sorted_order(layout, CompactType::Vertical)) {
        const LayoutItem& item = layout[index];
        if (item.is_static) continue;

        std::optional<LayoutItem> spot;
        if (item.w <= cols) {
            const int last_row = bottom(placed);
            for (int y = 0; y <= last_row && !spot; ++y) {
                for (int x = 0; x + item.w <= cols; ++x) {
                    const LayoutItem candidate = item.with_position(x, y);
                    if (!first_collision(placed, candidate)) {
                        spot = candidate;
                        break;
                    }
                }
            }
        }
        // Row `bottom(placed)` is always free, so only an oversized item ends up here.
        if (!spot) spot = item.with_position(0, bottom(placed));

        out[index] = *spot;
        placed.push_back(*spot);
    }

    return detail::finish_compaction(layout, NoCompactor(CompactType::Vertical, limits).resolve_collisions(out, cols));
}

Layout correct_bounds(const Layout& layout, int cols, const EngineLimits& limits) {
    detail::require_positive_cols(cols, "correct_bounds");

    Layout out;
    out.reserve(layout.size());
    Layout placed;
    placed.reserve(layout.size());

    for (const LayoutItem& item : layout) {
        LayoutItem current = item;
        if (!current.is_static) {
            if (current.x + current.w > cols) current.x = cols - current.w;
            if (current.x < 0) {
                current.x = 0;
                current.w = cols;
            }
            placed.push_back(current);
        } else {
            int pushes = 0;
            while (first_collision(placed, current)) {
                if (++pushes > limits.max_push_iterations) {
                    engine_logger()->warn("bounds correction gave up pushing static '{}' after {} rows",
                        current.id, limits.max_push_iterations);
                    break;
                }
                current.y += 1;
            }
        }
        out.push_back(current);
    }
    return out;
}

} // namespace grid_engine
