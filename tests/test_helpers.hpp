#pragma once

#include <grid_engine/geometry.hpp>
#include <catch2/catch.hpp>
#include <string>

namespace test_helpers {

inline grid_model::LayoutItem item(const std::string& id, int x, int y, int w = 1, int h = 1) {
    grid_model::LayoutItem out;
    out.id = id;
    out.x = x;
    out.y = y;
    out.w = w;
    out.h = h;
    return out;
}

inline grid_model::LayoutItem static_item(const std::string& id, int x, int y, int w = 1, int h = 1) {
    grid_model::LayoutItem out = item(id, x, y, w, h);
    out.is_static = true;
    return out;
}

inline grid_model::LayoutItem unplaced(const std::string& id, int w, int h) {
    return item(id, grid_model::kUnplaced, grid_model::kUnplaced, w, h);
}

// Fails the current test when `id` is missing.
inline const grid_model::LayoutItem& get(const grid_model::Layout& layout, const std::string& id) {
    const grid_model::LayoutItem* found = grid_engine::find_item(layout, id);
    INFO("item id=" << id);
    REQUIRE(found != nullptr);
    return *found;
}

} // namespace test_helpers
