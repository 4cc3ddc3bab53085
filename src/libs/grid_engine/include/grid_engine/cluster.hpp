#pragma once

#include <grid_engine/geometry.hpp>
#include <grid_engine/types.hpp>
#include <string>
#include <unordered_set>

namespace grid_engine {

// Id of the temporary item standing in for a cluster during the move.
inline constexpr const char* kClusterId = "__cluster__";

// Moves the items named in `ids` as one block whose bounding box goes to
// (x, y). Other items are pushed out of the way as by move_element(); members
// keep their offsets inside the block and are marked moved. Static items are
// never members. Empty or unknown ids leave the layout unchanged.
Layout move_cluster(const Layout& layout, const std::unordered_set<std::string>& ids, int x, int y,
    const ClusterMoveOptions& options);

} // namespace grid_engine
