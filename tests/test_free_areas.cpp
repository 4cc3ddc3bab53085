/// @file test_free_areas.cpp
/// @brief Tests for free-space queries over a layout

#include <catch2/catch.hpp>

#include <grid_engine/free_areas.hpp>
#include <grid_loaders/debug_layout.hpp>

#include "test_helpers.hpp"

#include <algorithm>

using namespace grid_engine;
using test_helpers::item;
using test_helpers::static_item;

namespace {

// [a, a, b,  ]
// [a, a,  ,  ]
// [s,  ,  ,  ]
Layout sample_layout() {
    return {item("a", 0, 0, 2, 2), item("b", 2, 0, 1, 1), static_item("s", 0, 2, 1, 1)};
}

bool has_area(const Layout& areas, int x, int y, int w, int h) {
    return std::any_of(areas.begin(), areas.end(), [&](const LayoutItem& a) {
        return a.x == x && a.y == y && a.w == w && a.h == h;
    });
}

} // namespace

TEST_CASE("Maximal free rectangles", "[free_areas]") {
    const Layout areas = available_free_areas(sample_layout(), 4);

    REQUIRE(areas.size() == 3);
    CHECK(has_area(areas, 3, 0, 1, 3));
    CHECK(has_area(areas, 2, 1, 2, 2));
    CHECK(has_area(areas, 1, 2, 3, 1));

    CHECK(areas[0].id == "free_area_0");
    CHECK(areas[2].id == "free_area_2");
    CHECK(areas[0].y <= areas[1].y);
    CHECK(areas[1].y <= areas[2].y);
}

TEST_CASE("An empty layout has one full-width area", "[free_areas]") {
    const Layout areas = available_free_areas({}, 6);
    REQUIRE(areas.size() == 1);
    CHECK(areas[0].x == 0);
    CHECK(areas[0].y == 0);
    CHECK(areas[0].w == 6);
    CHECK(areas[0].h == 1);

    const Layout rows = available_horizontal_free_areas({}, 5);
    REQUIRE(rows.size() == 1);
    CHECK(rows[0].w == 5);
}

TEST_CASE("Horizontal free runs", "[free_areas]") {
    const Layout areas = available_horizontal_free_areas(sample_layout(), 4);

    REQUIRE(areas.size() == 3);
    CHECK(has_area(areas, 3, 0, 1, 1));
    CHECK(has_area(areas, 2, 1, 2, 1));
    CHECK(has_area(areas, 1, 2, 3, 1));
}

TEST_CASE("first_free_area is the top-left area", "[free_areas]") {
    auto first = first_free_area(sample_layout(), 4);
    REQUIRE(first.has_value());
    CHECK(first->x == 3);
    CHECK(first->y == 0);
    CHECK(first->w == 1);
    CHECK(first->h == 3);

    CHECK_FALSE(first_free_area({item("full", 0, 0, 4, 2)}, 4).has_value());
}

TEST_CASE("last_row_free_area looks at the lowest item row", "[free_areas]") {
    auto area = last_row_free_area(sample_layout(), 4);
    REQUIRE(area.has_value());
    CHECK(area->x == 1);
    CHECK(area->y == 2);
    CHECK(area->w == 3);
    CHECK(area->h == 1);

    Layout filled = sample_layout();
    filled.push_back(item("filler", 1, 2, 3, 1));
    CHECK_FALSE(last_row_free_area(filled, 4).has_value());
    CHECK_FALSE(last_row_free_area({}, 4).has_value());
}

TEST_CASE("can_item_fit compares against the free areas", "[free_areas]") {
    const Layout layout = sample_layout();
    CHECK(can_item_fit(layout, item("_", 0, 0, 1, 1), 4));
    CHECK(can_item_fit(layout, item("_", 0, 0, 2, 2), 4));
    CHECK(can_item_fit(layout, item("_", 0, 0, 1, 3), 4));
    CHECK_FALSE(can_item_fit(layout, item("_", 0, 0, 3, 2), 4));
    CHECK_FALSE(can_item_fit(layout, item("_", 0, 0, 4, 1), 4));
}

TEST_CASE("Free areas on a tall layout are empty and cannot grow", "[free_areas]") {
    const int cols = 6;
    const Layout layout = grid_loaders::generate_debug_layout(120, cols, 10, 7);
    const int rows = bottom(layout);
    const Layout areas = available_free_areas(layout, cols);
    REQUIRE_FALSE(areas.empty());

    auto is_free = [&](int x, int y, int w, int h) {
        if (x < 0 || y < 0 || x + w > cols || y + h > rows) return false;
        const LayoutItem candidate = item("candidate", x, y, w, h);
        return std::none_of(layout.begin(), layout.end(),
            [&](const LayoutItem& other) { return collides(candidate, other); });
    };

    for (const LayoutItem& a : areas) {
        INFO(a.id << " at " << a.x << "," << a.y << " " << a.w << "x" << a.h);
        CHECK(is_free(a.x, a.y, a.w, a.h));
        CHECK_FALSE(is_free(a.x - 1, a.y, a.w + 1, a.h));
        CHECK_FALSE(is_free(a.x, a.y, a.w + 1, a.h));
        CHECK_FALSE(is_free(a.x, a.y - 1, a.w, a.h + 1));
        CHECK_FALSE(is_free(a.x, a.y, a.w, a.h + 1));
    }
}
