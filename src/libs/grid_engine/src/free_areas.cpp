#include <grid_engine/free_areas.hpp>
#include "engine_detail.hpp"
#include <algorithm>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace grid_engine {

namespace {

using Occupancy = std::vector<std::vector<bool>>;

Occupancy occupancy(const Layout& layout, int cols, int rows) {
    Occupancy grid(static_cast<std::size_t>(rows), std::vector<bool>(static_cast<std::size_t>(cols), false));
    for (const LayoutItem& item : layout) {
        const int y_end = std::min(rows, item.y + item.h);
        const int x_end = std::min(cols, item.x + item.w);
        for (int y = std::max(0, item.y); y < y_end; ++y) {
            for (int x = std::max(0, item.x); x < x_end; ++x)
                grid[static_cast<std::size_t>(y)][static_cast<std::size_t>(x)] = true;
        }
    }
    return grid;
}

LayoutItem area(int index, int x, int y, int w, int h) {
    LayoutItem result;
    result.id = "free_area_" + std::to_string(index);
    result.x = x;
    result.y = y;
    result.w = w;
    result.h = h;
    return result;
}

struct Rect {
    int x, y, w, h;

    bool operator<(const Rect& other) const {
        return std::tie(y, x, w, h) < std::tie(other.y, other.x, other.w, other.h);
    }
};

} // namespace

Layout available_free_areas(const Layout& layout, int cols) {
    detail::require_positive_cols(cols, "available_free_areas");
    if (layout.empty()) return {area(0, 0, 0, cols, 1)};

    const int rows = bottom(layout);
    const Occupancy grid = occupancy(layout, cols, rows);

    // Histogram method: heights[c] is the run of free cells ending at row r.
    // Every (row, right column, left column) triple yields the tallest
    // rectangle with that bottom-right corner and left edge, which cannot grow
    // upwards. It is kept only when it cannot grow sideways or downwards
    // either, so no pairwise containment check is needed.
    std::vector<int> heights(static_cast<std::size_t>(cols), 0);
    std::set<Rect> maximal;
    for (int r = 0; r < rows; ++r) {
        for (int c = 0; c < cols; ++c) {
            const auto uc = static_cast<std::size_t>(c);
            heights[uc] = grid[static_cast<std::size_t>(r)][uc] ? 0 : heights[uc] + 1;
        }
        for (int c = 0; c < cols; ++c) {
            int min_height = heights[static_cast<std::size_t>(c)];
            for (int k = c; k >= 0; --k) {
                min_height = std::min(min_height, heights[static_cast<std::size_t>(k)]);
                if (min_height == 0) break;
                if (k > 0 && heights[static_cast<std::size_t>(k - 1)] >= min_height) continue;
                if (c + 1 < cols && heights[static_cast<std::size_t>(c + 1)] >= min_height) continue;
                if (r + 1 < rows) {
                    const auto& below = grid[static_cast<std::size_t>(r + 1)];
                    const bool blocked = std::any_of(below.begin() + k, below.begin() + c + 1,
                        [](bool occupied) { return occupied; });
                    if (!blocked) continue;
                }
                maximal.insert(Rect{k, r - min_height + 1, c - k + 1, min_height});
            }
        }
    }

    // std::set orders by (y, x), so the result is sorted.
    Layout result;
    for (const Rect& rect : maximal)
        result.push_back(area(static_cast<int>(result.size()), rect.x, rect.y, rect.w, rect.h));
    return result;
}

Layout available_horizontal_free_areas(const Layout& layout, int cols) {
    detail::require_positive_cols(cols, "available_horizontal_free_areas");
    if (layout.empty()) return {area(0, 0, 0, cols, 1)};

    const int rows = bottom(layout);
    const Occupancy grid = occupancy(layout, cols, rows);

    Layout result;
    for (int r = 0; r < rows; ++r) {
        const auto& row = grid[static_cast<std::size_t>(r)];
        int c = 0;
        while (c < cols) {
            if (row[static_cast<std::size_t>(c)]) {
                ++c;
                continue;
            }
            const int start = c;
            while (c < cols && !row[static_cast<std::size_t>(c)])
                ++c;
            result.push_back(area(static_cast<int>(result.size()), start, r, c - start, 1));
        }
    }
    return result;
}

bool can_item_fit(const Layout& layout, const LayoutItem& item, int cols) {
    const Layout areas = available_free_areas(layout, cols);
    return std::any_of(areas.begin(), areas.end(),
        [&](const LayoutItem& a) { return item.w <= a.w && item.h <= a.h; });
}

std::optional<LayoutItem> first_free_area(const Layout& layout, int cols) {
    const Layout areas = available_free_areas(layout, cols);
    if (areas.empty()) return std::nullopt;
    return areas.front();
}

std::optional<LayoutItem> last_row_free_area(const Layout& layout, int cols) {
    if (layout.empty()) return std::nullopt;
    const Layout areas = available_free_areas(layout, cols);

    int last_row = layout.front().y;
    for (const LayoutItem& item : layout)
        last_row = std::max(last_row, item.y);

    for (const LayoutItem& a : areas) {
        if (a.y == last_row) return a;
    }
    return std::nullopt;
}

} // namespace grid_engine
