#include <grid_engine/geometry.hpp>
#include <algorithm>
#include <iterator>
#include <numeric>

namespace grid_engine {

bool collides(const LayoutItem& a, const LayoutItem& b) {
    if (a.id == b.id) return false;
    if (a.x + a.w <= b.x) return false; // a is left of b
    if (a.x >= b.x + b.w) return false; // a is right of b
    if (a.y + a.h <= b.y) return false; // a is above b
    if (a.y >= b.y + b.h) return false; // a is below b
    return true;
}

std::optional<LayoutItem> first_collision(const Layout& layout, const LayoutItem& item) {
    for (const auto& other : layout) {
        if (collides(other, item)) return other;
    }
    return std::nullopt;
}

Layout all_collisions(const Layout& layout, const LayoutItem& item) {
    Layout out;
    const int left = item.x;
    const int right = item.x + item.w;
    const int top = item.y;
    const int bottom_edge = item.y + item.h;
    for (const auto& other : layout) {
        if (other.id == item.id) continue;
        if (right <= other.x) continue;
        if (left >= other.x + other.w) continue;
        if (bottom_edge <= other.y) continue;
        if (top >= other.y + other.h) continue;
        out.push_back(other);
    }
    return out;
}

Layout statics(const Layout& layout) {
    Layout out;
    std::copy_if(layout.begin(), layout.end(), std::back_inserter(out),
        [](const LayoutItem& item) { return item.is_static; });
    return out;
}

int bottom(const Layout& layout) {
    int max_y = 0;
    for (const auto& item : layout)
        max_y = std::max(max_y, item.y + item.h);
    return max_y;
}

std::vector<std::size_t> sorted_order(const Layout& layout, CompactType compact_type) {
    std::vector<std::size_t> order(layout.size());
    std::iota(order.begin(), order.end(), std::size_t{0});
    if (compact_type == CompactType::Horizontal) {
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            if (layout[a].x != layout[b].x) return layout[a].x < layout[b].x;
            return layout[a].y < layout[b].y;
        });
    } else {
        std::stable_sort(order.begin(), order.end(), [&](std::size_t a, std::size_t b) {
            if (layout[a].y != layout[b].y) return layout[a].y < layout[b].y;
            return layout[a].x < layout[b].x;
        });
    }
    return order;
}

Layout sort_layout_items(const Layout& layout, CompactType compact_type) {
    Layout out;
    out.reserve(layout.size());
    for (std::size_t index : sorted_order(layout, compact_type))
        out.push_back(layout[index]);
    return out;
}

LayoutItem bounding_box(const Layout& layout) {
    LayoutItem box;
    box.w = 0;
    box.h = 0;
    if (layout.empty()) return box;

    int min_x = layout.front().x;
    int min_y = layout.front().y;
    int max_x = layout.front().x + layout.front().w;
    int max_y = layout.front().y + layout.front().h;
    for (const auto& item : layout) {
        min_x = std::min(min_x, item.x);
        min_y = std::min(min_y, item.y);
        max_x = std::max(max_x, item.x + item.w);
        max_y = std::max(max_y, item.y + item.h);
    }
    box.x = min_x;
    box.y = min_y;
    box.w = max_x - min_x;
    box.h = max_y - min_y;
    return box;
}

const LayoutItem* find_item(const Layout& layout, const std::string& id) {
    for (const auto& item : layout) {
        if (item.id == id) return &item;
    }
    return nullptr;
}

std::size_t count_overlaps(const Layout& layout) {
    std::size_t count = 0;
    for (std::size_t i = 0; i < layout.size(); ++i) {
        for (std::size_t j = i + 1; j < layout.size(); ++j) {
            if (layout[i].is_static && layout[j].is_static) continue;
            if (collides(layout[i], layout[j])) ++count;
        }
    }
    return count;
}

} // namespace grid_engine
