#pragma once

#include <grid_model/layout_item.hpp>
#include <optional>
#include <istream>
#include <string>

namespace grid_loaders {

// A layout together with the grid settings it was saved with.
struct LayoutDocument {
    grid_model::Layout items;
    int cols = 12;
    std::string compact_type = "vertical";
};

std::optional<LayoutDocument> load_layout_from_json(std::istream& in);
std::optional<LayoutDocument> load_layout_from_json_file(const std::string& path);

std::string layout_to_json(const LayoutDocument& doc, int indent = 2);
bool save_layout_to_json_file(const LayoutDocument& doc, const std::string& path);

} // namespace grid_loaders
