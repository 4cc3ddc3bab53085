#include <grid_engine/cluster.hpp>
#include <grid_engine/log.hpp>
#include <grid_engine/move.hpp>
#include "engine_detail.hpp"

namespace grid_engine {

Layout move_cluster(const Layout& layout, const std::unordered_set<std::string>& ids, int x, int y,
    const ClusterMoveOptions& options)
{
    detail::require_positive_cols(options.cols, "move_cluster");

    // Static items never move, so they stay obstacles even when selected.
    const auto is_member = [&](const LayoutItem& item) { return !item.is_static && ids.count(item.id) != 0; };

    Layout members;
    Layout obstacles;
    for (const LayoutItem& item : layout) {
        if (is_member(item))
            members.push_back(item);
        else
            obstacles.push_back(item);
    }
    if (members.empty()) {
        engine_logger()->debug("cluster move ignored: none of the {} ids is in the layout", ids.size());
        return layout;
    }

    LayoutItem block = bounding_box(members);
    block.id = kClusterId;

    Layout working = obstacles;
    working.push_back(block);

    MoveOptions move_options;
    move_options.cols = options.cols;
    move_options.compact_type = options.compact_type;
    move_options.prevent_collision = options.prevent_collision;
    move_options.limits = options.limits;
    const Layout resolved = move_element(working, block, x, y, move_options);

    const LayoutItem* moved_block = find_item(resolved, kClusterId);
    if (!moved_block) return layout;
    const int dx = moved_block->x - block.x;
    const int dy = moved_block->y - block.y;
    if (dx == 0 && dy == 0 && resolved == working) return layout;

    Layout out;
    out.reserve(layout.size());
    for (const LayoutItem& item : layout) {
        if (is_member(item)) {
            out.push_back(item.with_position(item.x + dx, item.y + dy).with_moved(true));
        } else {
            const LayoutItem* obstacle = find_item(resolved, item.id);
            out.push_back(obstacle ? *obstacle : item);
        }
    }
    return out;
}

} // namespace grid_engine
