#pragma once

#include <algorithm>
#include <cstddef>

namespace grid_engine {

// Safety bounds shared by the engine algorithms. None of them is reached by
// well-formed layouts; they stop runaway propagation on cyclic or corrupt input.

namespace limits {

constexpr int min_move_iterations = 5000;
constexpr int move_iterations_per_item = 2;
constexpr int max_placement_iterations = 10000; // per auto-placed item
constexpr int max_push_iterations = 10000;      // per item, compaction and overlap resolution

} // namespace limits

struct EngineLimits {
    int min_move_iterations = limits::min_move_iterations;
    int move_iterations_per_item = limits::move_iterations_per_item;
    int max_placement_iterations = limits::max_placement_iterations;
    int max_push_iterations = limits::max_push_iterations;

    int move_iteration_cap(std::size_t item_count) const {
        return std::max(min_move_iterations,
            move_iterations_per_item * static_cast<int>(item_count));
    }
};

} // namespace grid_engine
