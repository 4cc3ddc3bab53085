#include <grid_loaders/debug_layout.hpp>
#include <algorithm>
#include <random>
#include <string>

namespace grid_loaders {

grid_model::Layout generate_debug_layout(int count, int cols, int static_count, std::uint32_t seed) {
    grid_model::Layout out;
    if (count <= 0 || cols <= 0) return out;
    out.reserve(static_cast<std::size_t>(count));

    // Raw engine output rather than a distribution: distributions are not
    // required to produce the same sequence across standard libraries.
    std::mt19937 rng(seed);
    const int max_w = std::min(cols, 4);
    const int rows = std::max(1, count / 2);

    for (int i = 0; i < count; ++i) {
        grid_model::LayoutItem item;
        item.id = "item_" + std::to_string(i);
        item.w = 1 + static_cast<int>(rng() % static_cast<std::uint32_t>(max_w));
        item.h = 1 + static_cast<int>(rng() % 3u);
        item.x = static_cast<int>(rng() % static_cast<std::uint32_t>(cols - item.w + 1));
        item.y = static_cast<int>(rng() % static_cast<std::uint32_t>(rows));
        item.is_static = i < static_count;
        out.push_back(std::move(item));
    }
    return out;
}

grid_model::Layout sample_dashboard_layout() {
    grid_model::Layout out;

    auto add = [&](const char* id, int x, int y, int w, int h, bool is_static = false) {
        grid_model::LayoutItem item;
        item.id = id;
        item.x = x;
        item.y = y;
        item.w = w;
        item.h = h;
        item.is_static = is_static;
        out.push_back(std::move(item));
    };

    add("header", 0, 0, 12, 1, true);
    add("revenue", 0, 1, 4, 2);
    add("orders", 4, 1, 4, 2);
    add("visitors", 8, 1, 4, 2);
    add("sales_chart", 0, 3, 8, 4);
    add("top_products", 8, 3, 4, 4);
    add("activity", 0, 9, 6, 3);
    add("alerts", 6, 8, 3, 2);
    add("notes", 9, 10, 3, 2);

    return out;
}

} // namespace grid_loaders
