#include <grid_loaders/json_loader.hpp>
#include <nlohmann/json.hpp>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <limits>

namespace grid_loaders {

namespace {

// Missing or non-numeric fields keep `fallback`. A number that is not a whole
// value in int range fails the read.
bool read_int(const nlohmann::json& j, const char* key, int fallback, int& out) {
    out = fallback;
    if (!j.contains(key) || !j[key].is_number()) return true;
    const nlohmann::json& v = j[key];
    if (v.is_number_unsigned()) {
        const auto value = v.get<std::uint64_t>();
        if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) return false;
        out = static_cast<int>(value);
        return true;
    }
    if (v.is_number_integer()) {
        const auto value = v.get<std::int64_t>();
        if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) return false;
        out = static_cast<int>(value);
        return true;
    }
    const double value = v.get<double>();
    if (!std::isfinite(value) || std::trunc(value) != value) return false;
    if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) return false;
    out = static_cast<int>(value);
    return true;
}

double limit_or_infinity(const nlohmann::json& j, const char* key) {
    return j.contains(key) && j[key].is_number() ? j[key].get<double>()
                                                 : std::numeric_limits<double>::infinity();
}

std::optional<bool> optional_flag(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_boolean()) return j[key].get<bool>();
    return std::nullopt;
}

std::optional<LayoutDocument> parse_json(const nlohmann::json& j) {
    LayoutDocument doc;
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("items") || !j["items"].is_array()) return std::nullopt;

    for (const auto& n : j["items"]) {
        if (!n.is_object()) return std::nullopt;
        grid_model::LayoutItem item;
        if (!n.contains("id") || !n["id"].is_string()) return std::nullopt;
        item.id = n["id"].get<std::string>();
        if (!read_int(n, "x", 0, item.x) || !read_int(n, "y", 0, item.y)
            || !read_int(n, "w", 1, item.w) || !read_int(n, "h", 1, item.h)
            || !read_int(n, "minW", 1, item.min_w) || !read_int(n, "minH", 1, item.min_h))
            return std::nullopt;
        item.max_w = limit_or_infinity(n, "maxW");
        item.max_h = limit_or_infinity(n, "maxH");
        item.is_draggable = optional_flag(n, "isDraggable");
        item.is_resizable = optional_flag(n, "isResizable");
        item.is_static = n.contains("isStatic") && n["isStatic"].is_boolean() && n["isStatic"].get<bool>();
        item.moved = n.contains("moved") && n["moved"].is_boolean() && n["moved"].get<bool>();
        doc.items.push_back(std::move(item));
    }

    if (!read_int(j, "cols", doc.cols, doc.cols)) return std::nullopt;
    if (j.contains("compactType") && j["compactType"].is_string()) doc.compact_type = j["compactType"].get<std::string>();

    return doc;
}

nlohmann::json limit_to_json(double value) {
    if (std::isinf(value)) return nullptr;
    if (std::trunc(value) == value && value >= std::numeric_limits<int>::min()
        && value <= std::numeric_limits<int>::max())
        return static_cast<int>(value);
    return value;
}

nlohmann::json flag_to_json(const std::optional<bool>& flag) {
    if (!flag) return nullptr;
    return *flag;
}

} // namespace

std::optional<LayoutDocument> load_layout_from_json(std::istream& in) {
    try {
        nlohmann::json j = nlohmann::json::parse(in);
        return parse_json(j);
    } catch (const nlohmann::json::exception&) {
        return std::nullopt;
    }
}

std::optional<LayoutDocument> load_layout_from_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::nullopt;
    return load_layout_from_json(f);
}

std::string layout_to_json(const LayoutDocument& doc, int indent) {
    nlohmann::json items = nlohmann::json::array();
    for (const auto& item : doc.items) {
        items.push_back({
            {"id", item.id},
            {"x", item.x},
            {"y", item.y},
            {"w", item.w},
            {"h", item.h},
            {"minW", item.min_w},
            {"minH", item.min_h},
            {"maxW", limit_to_json(item.max_w)},
            {"maxH", limit_to_json(item.max_h)},
            {"isDraggable", flag_to_json(item.is_draggable)},
            {"isResizable", flag_to_json(item.is_resizable)},
            {"isStatic", item.is_static},
            {"moved", item.moved},
        });
    }
    nlohmann::json j;
    j["items"] = std::move(items);
    j["cols"] = doc.cols;
    j["compactType"] = doc.compact_type;
    return j.dump(indent);
}

bool save_layout_to_json_file(const LayoutDocument& doc, const std::string& path) {
    std::ofstream f(path);
    if (!f) return false;
    f << layout_to_json(doc) << '\n';
    return static_cast<bool>(f);
}

} // namespace grid_loaders
