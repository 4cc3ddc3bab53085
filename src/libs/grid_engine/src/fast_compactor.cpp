#include <grid_engine/compactor.hpp>
#include <grid_engine/log.hpp>
#include "engine_detail.hpp"
#include <algorithm>
#include <numeric>
#include <vector>

namespace grid_engine {

namespace {

// Accessors that let one skyline pass serve both orientations: "along" is the
// gravity axis, "cross" the bounded one.
struct Axes {
    bool vertical = true;

    int along(const LayoutItem& item) const { return vertical ? item.y : item.x; }
    int cross(const LayoutItem& item) const { return vertical ? item.x : item.y; }
    int along_size(const LayoutItem& item) const { return vertical ? item.h : item.w; }
    int cross_size(const LayoutItem& item) const { return vertical ? item.w : item.h; }

    void set_along(LayoutItem& item, int value) const {
        if (vertical)
            item.y = value;
        else
            item.x = value;
    }

    bool overlaps_at(const LayoutItem& item, int along_pos, const LayoutItem& other) const {
        if (along_pos + along_size(item) <= along(other)) return false;
        if (along_pos >= along(other) + along_size(other)) return false;
        if (cross(item) + cross_size(item) <= cross(other)) return false;
        if (cross(item) >= cross(other) + cross_size(other)) return false;
        return true;
    }
};

Layout rising_tide_compact(const Layout& layout, int extent, bool vertical, const EngineLimits& limits) {
    const Axes axes{vertical};
    Layout work = layout;

    // (along, cross) order with statics first among ties.
    std::vector<std::size_t> order(work.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
        const LayoutItem& la = work[a];
        const LayoutItem& lb = work[b];
        if (axes.along(la) != axes.along(lb)) return axes.along(la) < axes.along(lb);
        if (axes.cross(la) != axes.cross(lb)) return axes.cross(la) < axes.cross(lb);
        return la.is_static && !lb.is_static;
    });

    std::vector<std::size_t> static_order;
    for (std::size_t index : order) {
        if (work[index].is_static) static_order.push_back(index);
    }

    // The tide spans every cross cell any item touches, so items sticking out
    // of [0, extent) still stack instead of overlapping.
    int cross_lo = 0;
    int cross_hi = extent;
    for (const LayoutItem& item : work) {
        cross_lo = std::min(cross_lo, axes.cross(item));
        cross_hi = std::max(cross_hi, axes.cross(item) + axes.cross_size(item));
    }
    std::vector<int> tide(static_cast<std::size_t>(cross_hi - cross_lo), 0);

    for (std::size_t index : order) {
        LayoutItem& item = work[index];
        const int lo = axes.cross(item) - cross_lo;
        const int hi = lo + axes.cross_size(item);

        if (item.is_static) {
            const int item_end = axes.along(item) + axes.along_size(item);
            for (int k = lo; k < hi; ++k)
                tide[static_cast<std::size_t>(k)] = std::max(tide[static_cast<std::size_t>(k)], item_end);
            continue;
        }

        int candidate = 0;
        for (int k = lo; k < hi; ++k)
            candidate = std::max(candidate, tide[static_cast<std::size_t>(k)]);

        // Statics are sorted along the gravity axis, so the scan can stop at the first
        // one starting past the candidate. A shift restarts the scan: a static
        // already passed may overlap the new position.
        std::size_t cursor = 0;
        int shifts = 0;
        while (cursor < static_order.size()) {
            const LayoutItem& obstacle = work[static_order[cursor]];
            if (axes.along(obstacle) >= candidate + axes.along_size(item)) break;
            if (axes.overlaps_at(item, candidate, obstacle)) {
                candidate = axes.along(obstacle) + axes.along_size(obstacle);
                cursor = 0;
                if (++shifts > limits.max_push_iterations) {
                    engine_logger()->warn("skyline compaction of '{}' gave up after {} static shifts",
                        item.id, limits.max_push_iterations);
                    break;
                }
                continue;
            }
            ++cursor;
        }

        axes.set_along(item, candidate);
        const int item_end = candidate + axes.along_size(item);
        for (int k = lo; k < hi; ++k)
            tide[static_cast<std::size_t>(k)] = item_end;
    }

    return detail::finish_compaction(layout, work);
}

} // namespace

Layout FastVerticalCompactor::compact(const Layout& layout, int cols, bool allow_overlap) const {
    if (allow_overlap) return layout;
    detail::require_positive_cols(cols, "FastVerticalCompactor::compact");
    return rising_tide_compact(layout, cols, true, limits_);
}

Layout FastVerticalCompactor::resolve_collisions(const Layout& layout, int cols) const {
    detail::require_positive_cols(cols, "FastVerticalCompactor::resolve_collisions");
    return detail::resolve_overlaps(layout, CompactType::Vertical, limits_);
}

Layout FastHorizontalCompactor::compact(const Layout& layout, int cols, bool allow_overlap) const {
    if (allow_overlap) return layout;
    detail::require_positive_cols(cols, "FastHorizontalCompactor::compact");
    return rising_tide_compact(layout, cols, false, limits_);
}

Layout FastHorizontalCompactor::resolve_collisions(const Layout& layout, int cols) const {
    detail::require_positive_cols(cols, "FastHorizontalCompactor::resolve_collisions");
    return detail::resolve_overlaps(layout, CompactType::Horizontal, limits_);
}

} // namespace grid_engine
