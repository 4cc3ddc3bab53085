/// @file test_placement.cpp
/// @brief Tests for auto-placement, the optimizer and bounds correction

#include <catch2/catch.hpp>

#include <grid_engine/placement.hpp>
#include <grid_loaders/debug_layout.hpp>

#include "test_helpers.hpp"

using namespace grid_engine;
using test_helpers::get;
using test_helpers::item;
using test_helpers::static_item;
using test_helpers::unplaced;

TEST_CASE("place_new_items with nothing to place returns the existing layout", "[placement]") {
    const Layout existing = {item("1", 0, 0)};
    CHECK(place_new_items(existing, {}, 4) == existing);
}

TEST_CASE("A single item lands at the origin of an empty grid", "[placement]") {
    const Layout result = place_new_items({}, {unplaced("new", 2, 2)}, 4);
    REQUIRE(result.size() == 1);
    CHECK(result[0].id == "new");
    CHECK(result[0].x == 0);
    CHECK(result[0].y == 0);
    CHECK(result[0].w == 2);
    CHECK(result[0].h == 2);
}

TEST_CASE("New items are appended below existing content", "[placement]") {
    const Layout result = place_new_items({item("1", 0, 0, 4, 2)}, {unplaced("new", 2, 1)}, 4);
    CHECK(get(result, "new").x == 0);
    CHECK(get(result, "new").y == 2);
}

TEST_CASE("Placement wraps when an item does not fit the row", "[placement]") {
    SECTION("after an existing item") {
        const Layout result = place_new_items({item("1", 0, 0, 3, 1)}, {unplaced("new", 2, 1)}, 4);
        CHECK(get(result, "new").x == 0);
        CHECK(get(result, "new").y == 1);
    }

    SECTION("within one batch") {
        const Layout result = place_new_items({}, {unplaced("a", 3, 1), unplaced("b", 2, 1)}, 4);
        CHECK(get(result, "a").x == 0);
        CHECK(get(result, "a").y == 0);
        CHECK(get(result, "b").x == 0);
        CHECK(get(result, "b").y == 1);
    }
}

TEST_CASE("Items of one batch are placed side by side", "[placement]") {
    const Layout result = place_new_items({}, {unplaced("A", 2, 1), unplaced("B", 2, 1), unplaced("C", 2, 1)}, 4);

    CHECK(get(result, "A").x == 0);
    CHECK(get(result, "A").y == 0);
    CHECK(get(result, "B").x == 2);
    CHECK(get(result, "B").y == 0);
    CHECK(get(result, "C").x == 0);
    CHECK(get(result, "C").y == 1);
}

TEST_CASE("Items with explicit positions keep them", "[placement]") {
    const Layout result = place_new_items({}, {item("Fixed", 2, 0), unplaced("Auto", 1, 1)}, 4);

    CHECK(get(result, "Fixed").x == 2);
    CHECK(get(result, "Fixed").y == 0);
    CHECK(get(result, "Auto").y >= 1);
    CHECK(count_overlaps(result) == 0);
}

TEST_CASE("Placed items never overlap earlier ones of the same batch", "[placement]") {
    const Layout result = place_new_items({}, {unplaced("Big", 4, 2), unplaced("Small", 1, 1)}, 4);
    CHECK(get(result, "Big").x == 0);
    CHECK(get(result, "Big").y == 0);
    CHECK(get(result, "Small").y == 2);
}

TEST_CASE("An item wider than the grid goes below everything", "[placement]") {
    const Layout result = place_new_items({item("a", 0, 0, 2, 3)}, {unplaced("wide", 6, 1)}, 4);
    CHECK(get(result, "wide").x == 0);
    CHECK(get(result, "wide").y == 3);
}

TEST_CASE("Placement does not move existing items", "[placement]") {
    const Layout existing = {item("a", 0, 0, 2, 2), static_item("s", 2, 0, 2, 1), item("b", 1, 3)};
    const Layout result = place_new_items(existing, {unplaced("n1", 2, 1), unplaced("n2", 3, 2)}, 4);

    REQUIRE(result.size() == 5);
    for (std::size_t i = 0; i < existing.size(); ++i)
        CHECK(result[i] == existing[i]);
    CHECK(count_overlaps(result) == 0);
}

TEST_CASE("Optimizer packs items towards the top left", "[optimizer]") {
    const Layout input = {item("A", 0, 0), item("B", 1, 1), item("C", 2, 2)};
    const Layout result = optimize_layout(input, 3);

    REQUIRE(result.size() == 3);
    CHECK(get(result, "A").x == 0);
    CHECK(get(result, "A").y == 0);
    CHECK(get(result, "B").x == 1);
    CHECK(get(result, "B").y == 0);
    CHECK(get(result, "C").x == 2);
    CHECK(get(result, "C").y == 0);
}

TEST_CASE("Optimizer treats statics as walls", "[optimizer]") {
    const Layout result = optimize_layout({static_item("S", 1, 0), item("D", 0, 2)}, 3);

    CHECK(get(result, "S").x == 1);
    CHECK(get(result, "S").y == 0);
    CHECK(get(result, "D").x == 0);
    CHECK(get(result, "D").y == 0);
}

TEST_CASE("Optimizer keeps reading order", "[optimizer]") {
    const Layout result = optimize_layout({item("2", 0, 2), item("1", 0, 1)}, 1);
    CHECK(get(result, "1").y == 0);
    CHECK(get(result, "2").y == 1);
    CHECK(result[0].id == "2");
}

TEST_CASE("Optimizer skips gaps too small for an item", "[optimizer]") {
    const Layout result = optimize_layout({item("A", 0, 0), item("B", 2, 0), item("L", 0, 2, 2, 1)}, 3);
    CHECK(get(result, "L").x == 0);
    CHECK(get(result, "L").y == 1);
}

TEST_CASE("Optimizer output is overlap-free with statics fixed", "[optimizer]") {
    for (std::uint32_t seed : {5u, 17u, 99u}) {
        const Layout layout = grid_loaders::generate_debug_layout(30, 8, 3, seed);
        const Layout result = optimize_layout(layout, 8);
        INFO("seed=" << seed);
        CHECK(count_overlaps(result) == 0);
        for (std::size_t i = 0; i < 3; ++i) {
            CHECK(result[i].x == layout[i].x);
            CHECK(result[i].y == layout[i].y);
        }
    }
}

TEST_CASE("correct_bounds shifts items back inside the grid", "[bounds]") {
    SECTION("sticking out on the right") {
        const Layout result = correct_bounds({item("a", 8, 0, 4, 1)}, 10);
        CHECK(result[0].x == 6);
        CHECK(result[0].w == 4);
    }

    SECTION("starting left of the grid") {
        const Layout result = correct_bounds({item("a", -2, 0, 4, 1)}, 10);
        CHECK(result[0].x == 0);
        CHECK(result[0].w == 10);
    }

    SECTION("already inside") {
        const Layout layout = {item("a", 0, 0, 10, 1)};
        CHECK(correct_bounds(layout, 10) == layout);
    }
}

TEST_CASE("correct_bounds never moves a static item sideways", "[bounds]") {
    const Layout layout = {static_item("s", 6, 0, 2, 2)};
    const Layout result = correct_bounds(layout, 4);
    CHECK(result[0].x == 6);
    CHECK(result[0].w == 2);
    CHECK(result[0].y == 0);
}

TEST_CASE("correct_bounds pushes a static item down past shifted items", "[bounds]") {
    // Shrinking from 8 to 4 columns moves `a` onto `s`.
    const Layout layout = {item("a", 4, 0, 4, 2), static_item("s", 2, 0, 2, 1)};
    const Layout result = correct_bounds(layout, 4);

    CHECK(get(result, "a").x == 0);
    CHECK(get(result, "s").x == 2);
    CHECK(get(result, "s").y == 2);
    CHECK(count_overlaps(result) == 0);
}
