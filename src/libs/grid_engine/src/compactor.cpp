#include <grid_engine/compactor.hpp>
#include <grid_engine/log.hpp>
#include "engine_detail.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace grid_engine {

namespace detail {

void require_positive_cols(int cols, const char* operation) {
    if (cols <= 0)
        throw std::invalid_argument(std::string(operation) + ": cols must be positive, got "
            + std::to_string(cols));
}

Layout finish_compaction(const Layout& original, const Layout& compacted) {
    Layout out;
    out.reserve(original.size());
    for (std::size_t i = 0; i < original.size(); ++i) {
        const LayoutItem& before = original[i];
        const LayoutItem& after = compacted[i];
        if (after.x == before.x && after.y == before.y && !before.moved)
            out.push_back(before);
        else
            out.push_back(after.with_moved(false));
    }
    return out;
}

Layout resolve_overlaps(const Layout& layout, CompactType axis, const EngineLimits& limits) {
    const bool horizontal = axis == CompactType::Horizontal;
    Layout out = layout;
    Layout placed = statics(layout);
    placed.reserve(layout.size());

    for (std::size_t index : sorted_order(layout, horizontal ? CompactType::Horizontal : CompactType::Vertical)) {
        LayoutItem current = out[index];
        if (current.is_static) continue;

        int guard = 0;
        while (auto hit = first_collision(placed, current)) {
            if (++guard > limits.max_push_iterations) {
                engine_logger()->warn("overlap resolution gave up on '{}' after {} pushes",
                    current.id, limits.max_push_iterations);
                break;
            }
            if (horizontal)
                current.x = hit->x + hit->w;
            else
                current.y = hit->y + hit->h;
        }
        if (current.x != out[index].x || current.y != out[index].y) current.moved = true;
        out[index] = current;
        placed.push_back(current);
    }
    return out;
}

} // namespace detail

namespace {

// Pushes pending items (after `pos` in `order`) out of the way of the item just
// committed at `pos`, and transitively out of the way of every item pushed.
void cascade_push(Layout& work, const std::vector<std::size_t>& order, std::size_t pos,
    CompactType compact_type, const EngineLimits& limits)
{
    const bool horizontal = compact_type == CompactType::Horizontal;
    std::vector<std::size_t> stack{pos};
    std::unordered_set<std::size_t> visited{pos};
    int iterations = 0;

    while (!stack.empty()) {
        if (++iterations > limits.max_push_iterations) {
            engine_logger()->warn("compaction cascade from '{}' stopped after {} steps",
                work[order[pos]].id, limits.max_push_iterations);
            return;
        }
        const LayoutItem pusher = work[order[stack.back()]];
        stack.pop_back();

        for (std::size_t q = pos + 1; q < order.size(); ++q) {
            LayoutItem& other = work[order[q]];
            if (other.is_static || visited.count(q) != 0) continue;
            if (!collides(pusher, other)) continue;
            if (horizontal)
                other.x = pusher.x + pusher.w;
            else
                other.y = pusher.y + pusher.h;
            visited.insert(q);
            stack.push_back(q);
        }
    }
}

Layout gravity_compact(const Layout& layout, CompactType compact_type, int cols,
    const EngineLimits& limits)
{
    Layout work = layout;
    Layout placed = statics(layout);
    placed.reserve(layout.size());
    const std::vector<std::size_t> order = sorted_order(layout, compact_type);

    for (std::size_t pos = 0; pos < order.size(); ++pos) {
        const std::size_t index = order[pos];
        if (work[index].is_static) continue;

        work[index] = compact_item(placed, work[index], compact_type, cols, limits);
        cascade_push(work, order, pos, compact_type, limits);
        placed.push_back(work[index]);
    }
    return detail::finish_compaction(layout, work);
}

} // namespace

LayoutItem compact_item(const Layout& placed, const LayoutItem& item, CompactType compact_type,
    int cols, const EngineLimits& limits)
{
    LayoutItem current = item;
    const bool vertical = compact_type == CompactType::Vertical;
    const bool horizontal = compact_type == CompactType::Horizontal;

    if (vertical) {
        while (current.y > 0 && !first_collision(placed, current))
            current.y -= 1;
    } else if (horizontal) {
        while (current.x > 0 && !first_collision(placed, current))
            current.x -= 1;
    }

    int guard = 0;
    while (auto hit = first_collision(placed, current)) {
        if (++guard > limits.max_push_iterations) {
            engine_logger()->warn("compaction of '{}' gave up after {} pushes",
                current.id, limits.max_push_iterations);
            break;
        }
        if (horizontal) {
            current.x = hit->x + hit->w;
            if (current.x + current.w > cols) {
                current.x = 0;
                current.y += 1;
            }
        } else {
            current.y = hit->y + hit->h;
        }
    }

    current.x = std::max(current.x, 0);
    current.y = std::max(current.y, 0);
    return current;
}

Layout VerticalCompactor::compact(const Layout& layout, int cols, bool allow_overlap) const {
    if (allow_overlap) return layout;
    detail::require_positive_cols(cols, "VerticalCompactor::compact");
    return gravity_compact(layout, CompactType::Vertical, cols, limits_);
}

Layout VerticalCompactor::resolve_collisions(const Layout& layout, int cols) const {
    detail::require_positive_cols(cols, "VerticalCompactor::resolve_collisions");
    return detail::resolve_overlaps(layout, CompactType::Vertical, limits_);
}

Layout HorizontalCompactor::compact(const Layout& layout, int cols, bool allow_overlap) const {
    if (allow_overlap) return layout;
    detail::require_positive_cols(cols, "HorizontalCompactor::compact");
    return gravity_compact(layout, CompactType::Horizontal, cols, limits_);
}

Layout HorizontalCompactor::resolve_collisions(const Layout& layout, int cols) const {
    detail::require_positive_cols(cols, "HorizontalCompactor::resolve_collisions");
    return detail::resolve_overlaps(layout, CompactType::Horizontal, limits_);
}

Layout NoCompactor::compact(const Layout& layout, int cols, bool allow_overlap) const {
    if (allow_overlap) return layout;
    detail::require_positive_cols(cols, "NoCompactor::compact");
    return detail::finish_compaction(layout, detail::resolve_overlaps(layout, axis_, limits_));
}

Layout NoCompactor::resolve_collisions(const Layout& layout, int cols) const {
    detail::require_positive_cols(cols, "NoCompactor::resolve_collisions");
    return detail::resolve_overlaps(layout, axis_, limits_);
}

std::unique_ptr<Compactor> make_compactor(CompactorKind kind, const EngineLimits& limits) {
    switch (kind) {
    case CompactorKind::None: return std::make_unique<NoCompactor>(CompactType::Vertical, limits);
    case CompactorKind::Vertical: return std::make_unique<VerticalCompactor>(limits);
    case CompactorKind::Horizontal: return std::make_unique<HorizontalCompactor>(limits);
    case CompactorKind::FastVertical: return std::make_unique<FastVerticalCompactor>(limits);
    case CompactorKind::FastHorizontal: return std::make_unique<FastHorizontalCompactor>(limits);
    }
    return std::make_unique<VerticalCompactor>(limits);
}

Layout compact(const Layout& layout, CompactType compact_type, int cols, bool allow_overlap,
    const EngineLimits& limits)
{
    return make_compactor(compactor_kind_for(compact_type), limits)->compact(layout, cols, allow_overlap);
}

} // namespace grid_engine
