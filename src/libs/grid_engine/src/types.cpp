#include <grid_engine/types.hpp>

namespace grid_engine {

std::optional<CompactType> parse_compact_type(std::string_view name) {
    if (name == "none") return CompactType::None;
    if (name == "vertical") return CompactType::Vertical;
    if (name == "horizontal") return CompactType::Horizontal;
    return std::nullopt;
}

std::optional<CompactorKind> parse_compactor_kind(std::string_view name) {
    if (name == "none") return CompactorKind::None;
    if (name == "vertical") return CompactorKind::Vertical;
    if (name == "horizontal") return CompactorKind::Horizontal;
    if (name == "fast-vertical") return CompactorKind::FastVertical;
    if (name == "fast-horizontal") return CompactorKind::FastHorizontal;
    return std::nullopt;
}

std::optional<ResizeBehavior> parse_resize_behavior(std::string_view name) {
    if (name == "push") return ResizeBehavior::Push;
    if (name == "shrink") return ResizeBehavior::Shrink;
    return std::nullopt;
}

const char* to_string(CompactType type) {
    switch (type) {
    case CompactType::None: return "none";
    case CompactType::Vertical: return "vertical";
    case CompactType::Horizontal: return "horizontal";
    }
    return "vertical";
}

const char* to_string(CompactorKind kind) {
    switch (kind) {
    case CompactorKind::None: return "none";
    case CompactorKind::Vertical: return "vertical";
    case CompactorKind::Horizontal: return "horizontal";
    case CompactorKind::FastVertical: return "fast-vertical";
    case CompactorKind::FastHorizontal: return "fast-horizontal";
    }
    return "vertical";
}

const char* to_string(ResizeBehavior behavior) {
    return behavior == ResizeBehavior::Shrink ? "shrink" : "push";
}

CompactorKind compactor_kind_for(CompactType type) {
    switch (type) {
    case CompactType::None: return CompactorKind::None;
    case CompactType::Vertical: return CompactorKind::Vertical;
    case CompactType::Horizontal: return CompactorKind::Horizontal;
    }
    return CompactorKind::Vertical;
}

CompactType axis_of(CompactorKind kind) {
    switch (kind) {
    case CompactorKind::None: return CompactType::None;
    case CompactorKind::Vertical:
    case CompactorKind::FastVertical: return CompactType::Vertical;
    case CompactorKind::Horizontal:
    case CompactorKind::FastHorizontal: return CompactType::Horizontal;
    }
    return CompactType::Vertical;
}

} // namespace grid_engine
