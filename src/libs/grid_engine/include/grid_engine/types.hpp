#pragma once

#include <grid_engine/engine_limits.hpp>
#include <optional>
#include <string_view>

namespace grid_engine {

// Gravity direction of a layout.
enum class CompactType { None, Vertical, Horizontal };

// How colliding neighbours react when an item grows.
enum class ResizeBehavior { Push, Shrink };

// Concrete compaction strategy. The fast variants are skyline ("rising tide")
// replacements for Vertical and Horizontal.
enum class CompactorKind { None, Vertical, Horizontal, FastVertical, FastHorizontal };

struct MoveOptions {
    int cols = 12;
    CompactType compact_type = CompactType::Vertical;
    // Run the strategy's overlap resolution over the result.
    bool prevent_collision = false;
    // Propagate even when the item already sits at the target.
    bool force = false;
    EngineLimits limits;
};

struct ResizeOptions {
    int cols = 12;
    ResizeBehavior behavior = ResizeBehavior::Push;
    // Reject the whole resize if it cannot avoid a static item.
    bool prevent_collision = false;
    EngineLimits limits;
};

struct ClusterMoveOptions {
    int cols = 12;
    CompactType compact_type = CompactType::Vertical;
    bool prevent_collision = false;
    EngineLimits limits;
};

// Diagnostics of one move propagation.
struct PropagationStats {
    int iterations = 0;
    bool capped = false;
};

std::optional<CompactType> parse_compact_type(std::string_view name);
std::optional<CompactorKind> parse_compactor_kind(std::string_view name);
std::optional<ResizeBehavior> parse_resize_behavior(std::string_view name);
const char* to_string(CompactType type);
const char* to_string(CompactorKind kind);
const char* to_string(ResizeBehavior behavior);

CompactorKind compactor_kind_for(CompactType type);
CompactType axis_of(CompactorKind kind);

} // namespace grid_engine
