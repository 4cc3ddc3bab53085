#pragma once

#include <cstddef>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <vector>

namespace grid_model {

// Coordinate value marking an item that still needs auto-placement.
constexpr int kUnplaced = -1;

// Reserved id of the transient drag/drop placeholder.
inline constexpr const char* kPlaceholderId = "__placeholder__";

struct LayoutItem {
    std::string id;
    // x is the cross-axis index (column), y the main-axis index (row).
    int x = 0;
    int y = 0;
    int w = 1;
    int h = 1;
    int min_w = 1;
    int min_h = 1;
    double max_w = std::numeric_limits<double>::infinity();
    double max_h = std::numeric_limits<double>::infinity();
    // Unset means the layout-level setting applies.
    std::optional<bool> is_draggable;
    std::optional<bool> is_resizable;
    // Never relocated by the engine, but still an obstacle for everything else.
    bool is_static = false;
    // Set when an engine call changed the position; renderers use it as an animation hint.
    bool moved = false;

    LayoutItem with_position(int new_x, int new_y) const {
        LayoutItem copy = *this;
        copy.x = new_x;
        copy.y = new_y;
        return copy;
    }

    LayoutItem with_size(int new_w, int new_h) const {
        LayoutItem copy = *this;
        copy.w = new_w;
        copy.h = new_h;
        return copy;
    }

    LayoutItem with_moved(bool value) const {
        LayoutItem copy = *this;
        copy.moved = value;
        return copy;
    }

    bool operator==(const LayoutItem&) const = default;
};

// Ordered sequence of items with unique ids. Order only matters for tie-breaking.
using Layout = std::vector<LayoutItem>;

inline bool needs_placement(const LayoutItem& item) {
    return item.x == kUnplaced || item.y == kUnplaced;
}

inline bool is_placeholder(const LayoutItem& item) {
    return item.id == kPlaceholderId;
}

inline bool is_resizable(const LayoutItem& item) {
    return !item.is_static && item.is_resizable.value_or(true);
}

inline bool is_draggable(const LayoutItem& item) {
    return !item.is_static && item.is_draggable.value_or(true);
}

// Hash of everything that affects how the item looks, excluding position and `moved`.
inline std::size_t content_signature(const LayoutItem& item) {
    std::size_t seed = 0;
    auto mix = [&seed](std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2);
    };
    auto flag = [](const std::optional<bool>& v) -> std::size_t {
        return v.has_value() ? (*v ? 2u : 1u) : 0u;
    };
    mix(std::hash<std::string>{}(item.id));
    mix(std::hash<int>{}(item.w));
    mix(std::hash<int>{}(item.h));
    mix(std::hash<int>{}(item.min_w));
    mix(std::hash<int>{}(item.min_h));
    mix(std::hash<double>{}(item.max_w));
    mix(std::hash<double>{}(item.max_h));
    mix(flag(item.is_draggable));
    mix(flag(item.is_resizable));
    mix(item.is_static ? 1u : 0u);
    return seed;
}

} // namespace grid_model
