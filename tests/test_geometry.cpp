/// @file test_geometry.cpp
/// @brief Tests for collision primitives and layout queries

#include <catch2/catch.hpp>

#include <grid_engine/geometry.hpp>

#include "test_helpers.hpp"

using namespace grid_engine;
using test_helpers::item;
using test_helpers::static_item;

TEST_CASE("Collision uses half-open extents", "[geometry]") {
    const LayoutItem a = item("a", 0, 0, 2, 2);

    CHECK(collides(a, item("b", 1, 1, 2, 2)));
    CHECK_FALSE(collides(a, item("b", 2, 0, 2, 2))); // touching on the right
    CHECK_FALSE(collides(a, item("b", 0, 2, 2, 2))); // touching below
    CHECK(collides(a, item("b", 0, 0, 1, 1)));       // contained
}

TEST_CASE("An item never collides with itself", "[geometry]") {
    const LayoutItem a = item("a", 0, 0, 2, 2);
    CHECK_FALSE(collides(a, a));
    CHECK_FALSE(collides(a, a.with_position(1, 1)));
    CHECK_FALSE(first_collision({a}, a.with_position(1, 0)).has_value());
}

TEST_CASE("first_collision and all_collisions follow layout order", "[geometry]") {
    const Layout layout = {
        item("a", 0, 0, 2, 1),
        item("b", 2, 0, 2, 1),
        item("c", 0, 3, 4, 1),
    };
    const LayoutItem probe = item("p", 1, 0, 2, 1);

    auto first = first_collision(layout, probe);
    REQUIRE(first.has_value());
    CHECK(first->id == "a");

    const Layout all = all_collisions(layout, probe);
    REQUIRE(all.size() == 2);
    CHECK(all[0].id == "a");
    CHECK(all[1].id == "b");

    CHECK(all_collisions(layout, item("p", 0, 1, 4, 2)).empty());
}

TEST_CASE("bottom and statics", "[geometry]") {
    CHECK(bottom({}) == 0);

    const Layout layout = {item("a", 0, 0, 1, 2), static_item("s", 1, 3, 1, 2), item("b", 2, 1, 1, 1)};
    CHECK(bottom(layout) == 5);

    const Layout fixed = statics(layout);
    REQUIRE(fixed.size() == 1);
    CHECK(fixed[0].id == "s");
}

TEST_CASE("sort_layout_items orders by row or by column", "[geometry]") {
    const Layout layout = {item("c", 0, 2), item("b", 3, 0), item("a", 1, 0), item("d", 0, 0)};

    const Layout rows = sort_layout_items(layout, CompactType::Vertical);
    CHECK(rows[0].id == "d");
    CHECK(rows[1].id == "a");
    CHECK(rows[2].id == "b");
    CHECK(rows[3].id == "c");

    const Layout columns = sort_layout_items(layout, CompactType::Horizontal);
    CHECK(columns[0].id == "d");
    CHECK(columns[1].id == "c");
    CHECK(columns[2].id == "a");
    CHECK(columns[3].id == "b");
}

TEST_CASE("bounding_box encloses every item", "[geometry]") {
    const LayoutItem box = bounding_box({item("1", 0, 0, 2, 2), item("2", 2, 1, 2, 1)});
    CHECK(box.x == 0);
    CHECK(box.y == 0);
    CHECK(box.w == 4);
    CHECK(box.h == 2);

    const LayoutItem offset = bounding_box({item("1", 3, 2, 1, 1), item("2", 5, 4, 2, 3)});
    CHECK(offset.x == 3);
    CHECK(offset.y == 2);
    CHECK(offset.w == 4);
    CHECK(offset.h == 5);

    const LayoutItem empty = bounding_box({});
    CHECK(empty.w == 0);
    CHECK(empty.h == 0);
}

TEST_CASE("count_overlaps ignores static pairs", "[geometry]") {
    CHECK(count_overlaps({item("a", 0, 0, 2, 2), item("b", 1, 1, 2, 2), item("c", 5, 5)}) == 1);
    CHECK(count_overlaps({static_item("s", 0, 0, 2, 2), static_item("t", 1, 1, 2, 2)}) == 0);
    CHECK(count_overlaps({static_item("s", 0, 0, 2, 2), item("a", 1, 1)}) == 1);
}

TEST_CASE("find_item looks up by id", "[geometry]") {
    const Layout layout = {item("a", 0, 0), item("b", 1, 0)};
    REQUIRE(find_item(layout, "b") != nullptr);
    CHECK(find_item(layout, "b")->x == 1);
    CHECK(find_item(layout, "z") == nullptr);
}
