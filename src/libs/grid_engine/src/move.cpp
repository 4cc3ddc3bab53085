#include <grid_engine/move.hpp>
#include <grid_engine/compactor.hpp>
#include <grid_engine/log.hpp>
#include "engine_detail.hpp"
#include <algorithm>
#include <deque>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace grid_engine {

Layout move_element(const Layout& layout, const LayoutItem& item,
    std::optional<int> x, std::optional<int> y,
    const MoveOptions& options, PropagationStats* stats)
{
    detail::require_positive_cols(options.cols, "move_element");
    if (stats) *stats = PropagationStats{};

    const LayoutItem* in_layout = find_item(layout, item.id);
    const LayoutItem& current = in_layout ? *in_layout : item;
    if (item.is_static || current.is_static) return layout;

    const int new_x = x.value_or(current.x);
    const int new_y = y.value_or(current.y);
    if (!options.force && in_layout && current.x == new_x && current.y == new_y
        && current.w == item.w && current.h == item.h)
        return layout;

    Layout work = layout;
    std::unordered_map<std::string, std::size_t> index_of;
    index_of.reserve(work.size() + 1);
    for (std::size_t i = 0; i < work.size(); ++i)
        index_of.emplace(work[i].id, i);

    LayoutItem moving = current.with_position(new_x, new_y).with_moved(true);
    if (in_layout) {
        work[index_of.at(moving.id)] = moving;
    } else {
        index_of.emplace(moving.id, work.size());
        work.push_back(moving);
    }

    std::deque<std::size_t> queue{index_of.at(moving.id)};
    std::unordered_set<std::string> processed{moving.id};
    const int cap = options.limits.move_iteration_cap(work.size());
    int iterations = 0;
    bool capped = false;

    while (!queue.empty()) {
        if (++iterations > cap) {
            capped = true;
            engine_logger()->warn("move of '{}' stopped after {} propagation steps", item.id, cap);
            break;
        }
        const std::size_t head = queue.front();
        queue.pop_front();
        const LayoutItem pusher = work[head];

        std::vector<std::size_t> hits;
        for (std::size_t i = 0; i < work.size(); ++i) {
            if (i == head || processed.count(work[i].id) != 0) continue;
            if (collides(pusher, work[i])) hits.push_back(i);
        }
        // Top to bottom, so pushes are deterministic.
        std::stable_sort(hits.begin(), hits.end(),
            [&](std::size_t a, std::size_t b) { return work[a].y < work[b].y; });

        for (std::size_t i : hits) {
            if (work[i].is_static) {
                // The pusher jumps below the static item and is re-checked first.
                work[head] = pusher.with_position(pusher.x, work[i].y + work[i].h).with_moved(true);
                queue.push_front(head);
                break;
            }
            processed.insert(work[i].id);
            work[i] = work[i].with_position(work[i].x, pusher.y + pusher.h).with_moved(true);
            queue.push_back(i);
        }
    }

    if (stats) {
        stats->iterations = std::min(iterations, cap);
        stats->capped = capped;
    }

    if (options.prevent_collision) {
        const auto compactor = make_compactor(compactor_kind_for(options.compact_type), options.limits);
        return compactor->resolve_collisions(work, options.cols);
    }
    return work;
}

} // namespace grid_engine
