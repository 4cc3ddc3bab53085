#include <grid_engine/resize.hpp>
#include <grid_engine/compactor.hpp>
#include <grid_engine/log.hpp>
#include <grid_engine/move.hpp>
#include "engine_detail.hpp"
#include <algorithm>
#include <cmath>
#include <optional>

namespace grid_engine {

namespace {

int clamp_extent(int value, int min_value, double max_value) {
    int result = std::max(value, min_value);
    // Compared as double: the limit may be far outside int range.
    if (std::isfinite(max_value) && result > max_value)
        result = max_value < min_value ? min_value : static_cast<int>(max_value);
    return result;
}

// All neighbours absorb the overlap, or none does.
std::optional<Layout> try_shrink(const Layout& layout, const LayoutItem& resized, const Layout& collisions) {
    Layout out = layout;
    for (const LayoutItem& collision : collisions) {
        if (collision.is_static) return std::nullopt;

        LayoutItem shrunk = collision;
        if (resized.x < collision.x) {
            // Growing to the right: the neighbour keeps its right edge.
            const int overlap = resized.x + resized.w - collision.x;
            shrunk.x = collision.x + overlap;
            shrunk.w = collision.w - overlap;
            shrunk.moved = true;
        } else {
            const int overlap = collision.x + collision.w - resized.x;
            shrunk.w = collision.w - overlap;
        }
        if (shrunk.w < collision.min_w) return std::nullopt;

        for (LayoutItem& item : out) {
            if (item.id == shrunk.id) item = shrunk;
        }
    }
    return out;
}

} // namespace

Layout resize_item(const Layout& layout, const LayoutItem& resized, const ResizeOptions& options) {
    detail::require_positive_cols(options.cols, "resize_item");

    const LayoutItem* current = find_item(layout, resized.id);
    if (!current || !grid_model::is_resizable(*current)) return layout;

    const LayoutItem target = resized.with_size(
        clamp_extent(resized.w, current->min_w, current->max_w),
        clamp_extent(resized.h, current->min_h, current->max_h));

    Layout new_layout = layout;
    for (LayoutItem& item : new_layout) {
        if (item.id == target.id) item = target;
    }

    const Layout collisions = all_collisions(new_layout, target);
    if (collisions.empty()) return new_layout;

    if (options.behavior == ResizeBehavior::Shrink) {
        if (auto shrunk = try_shrink(new_layout, target, collisions)) return *shrunk;
        engine_logger()->debug("resize of '{}': neighbours cannot shrink, pushing instead", target.id);
    }

    MoveOptions move_options;
    move_options.cols = options.cols;
    move_options.compact_type = CompactType::Vertical;
    move_options.prevent_collision = false;
    move_options.force = true;
    move_options.limits = options.limits;
    Layout pushed = move_element(new_layout, target, target.x, target.y, move_options);

    if (!options.prevent_collision) return pushed;

    const LayoutItem* final_item = find_item(pushed, target.id);
    bool blocked = !final_item || final_item->x != target.x || final_item->y != target.y;
    if (!blocked) {
        for (const LayoutItem& hit : all_collisions(pushed, *final_item)) {
            if (hit.is_static) {
                blocked = true;
                break;
            }
        }
    }
    if (blocked) {
        engine_logger()->debug("resize of '{}' reverted: blocked by a static item", target.id);
        return layout;
    }

    return VerticalCompactor(options.limits).resolve_collisions(pushed, options.cols);
}

} // namespace grid_engine
