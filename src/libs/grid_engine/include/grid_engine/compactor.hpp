#pragma once

#include <grid_engine/engine_limits.hpp>
#include <grid_engine/geometry.hpp>
#include <grid_engine/types.hpp>
#include <memory>

namespace grid_engine {

// Common contract of the compaction strategies.
//
// compact() returns the layout with items pulled toward the strategy's edge
// (or, for NoCompactor, only with overlaps removed). With allow_overlap set it
// returns the input unchanged. Static items never move. Every item in the
// result has moved == false; items whose position did not change and whose
// flag was already clear are returned untouched.
//
// resolve_collisions() only pushes overlapping items forward along the
// strategy's axis; it never pulls items back and marks pushed items as moved.
class Compactor {
public:
    virtual ~Compactor() = default;

    virtual CompactorKind kind() const = 0;
    virtual Layout compact(const Layout& layout, int cols, bool allow_overlap) const = 0;
    virtual Layout resolve_collisions(const Layout& layout, int cols) const = 0;
};

// Gravity up. Quadratic in the item count.
class VerticalCompactor : public Compactor {
public:
    explicit VerticalCompactor(EngineLimits limits = {}) : limits_(limits) {}

    CompactorKind kind() const override { return CompactorKind::Vertical; }
    Layout compact(const Layout& layout, int cols, bool allow_overlap) const override;
    Layout resolve_collisions(const Layout& layout, int cols) const override;

private:
    EngineLimits limits_;
};

// Gravity left. Items pushed past `cols` wrap to x = 0 on the next row.
class HorizontalCompactor : public Compactor {
public:
    explicit HorizontalCompactor(EngineLimits limits = {}) : limits_(limits) {}

    CompactorKind kind() const override { return CompactorKind::Horizontal; }
    Layout compact(const Layout& layout, int cols, bool allow_overlap) const override;
    Layout resolve_collisions(const Layout& layout, int cols) const override;

private:
    EngineLimits limits_;
};

// No gravity: compact() only resolves existing overlaps along `axis`.
class NoCompactor : public Compactor {
public:
    explicit NoCompactor(CompactType axis = CompactType::Vertical, EngineLimits limits = {})
        : axis_(axis == CompactType::Horizontal ? CompactType::Horizontal : CompactType::Vertical)
        , limits_(limits)
    {}

    CompactorKind kind() const override { return CompactorKind::None; }
    CompactType axis() const { return axis_; }
    Layout compact(const Layout& layout, int cols, bool allow_overlap) const override;
    Layout resolve_collisions(const Layout& layout, int cols) const override;

private:
    CompactType axis_;
    EngineLimits limits_;
};

// Skyline ("rising tide") variant of VerticalCompactor: one pass over the
// items sorted by (y, x), tracking the lowest free row per column.
class FastVerticalCompactor : public Compactor {
public:
    explicit FastVerticalCompactor(EngineLimits limits = {}) : limits_(limits) {}

    CompactorKind kind() const override { return CompactorKind::FastVertical; }
    Layout compact(const Layout& layout, int cols, bool allow_overlap) const override;
    Layout resolve_collisions(const Layout& layout, int cols) const override;

private:
    EngineLimits limits_;
};

// Skyline variant of HorizontalCompactor. `cols` is the number of rows here:
// the tide tracks the leftmost free column per row.
class FastHorizontalCompactor : public Compactor {
public:
    explicit FastHorizontalCompactor(EngineLimits limits = {}) : limits_(limits) {}

    CompactorKind kind() const override { return CompactorKind::FastHorizontal; }
    Layout compact(const Layout& layout, int cols, bool allow_overlap) const override;
    Layout resolve_collisions(const Layout& layout, int cols) const override;

private:
    EngineLimits limits_;
};

std::unique_ptr<Compactor> make_compactor(CompactorKind kind, const EngineLimits& limits = {});

// Gravity plus push for one item against an already placed set.
LayoutItem compact_item(const Layout& placed, const LayoutItem& item, CompactType compact_type,
    int cols, const EngineLimits& limits = {});

// Compaction with the baseline strategy for `compact_type`.
Layout compact(const Layout& layout, CompactType compact_type, int cols,
    bool allow_overlap = false, const EngineLimits& limits = {});

} // namespace grid_engine
