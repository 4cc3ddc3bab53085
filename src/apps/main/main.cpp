// Dashboard grid tool: applies one layout-engine operation to a JSON layout (C++20)
#include <grid_engine/cluster.hpp>
#include <grid_engine/compactor.hpp>
#include <grid_engine/free_areas.hpp>
#include <grid_engine/log.hpp>
#include <grid_engine/move.hpp>
#include <grid_engine/placement.hpp>
#include <grid_engine/resize.hpp>
#include <grid_loaders/debug_layout.hpp>
#include <grid_loaders/json_loader.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cstdio>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <vector>

namespace {

struct Args {
    std::string input;
    std::string output;
    std::string op = "compact";
    std::optional<int> cols;
    std::string compact;
    std::optional<int> x;
    std::optional<int> y;
    std::string id;
    std::string ids;
    std::optional<int> w;
    std::optional<int> h;
    std::string behavior = "push";
    bool prevent_collision = false;
    bool auto_overlap_test = false;
    std::string log_level = "warn";
};

void print_usage() {
    (void)fprintf(stderr,
        "usage: dashgrid_tool [--input layout.json] [--output out.json] [--op OP]\n"
        "                     [--cols N] [--compact none|vertical|horizontal|fast-vertical|fast-horizontal]\n"
        "                     [--id ID] [--ids A,B,...] [--x N] [--y N] [--w N] [--h N]\n"
        "                     [--behavior push|shrink] [--prevent-collision]\n"
        "                     [--auto-overlap-test] [--log-level trace|debug|info|warn|err|off]\n"
        "ops: compact optimize place correct-bounds move resize cluster free-areas\n");
}

std::optional<int> parse_int(const std::string& text) {
    try {
        std::size_t used = 0;
        const int value = std::stoi(text, &used);
        if (used != text.size()) return std::nullopt;
        return value;
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

// Returns false on an unknown flag or a missing/malformed value.
bool parse_args(int argc, char* argv[], Args& args) {
    for (int i = 1; i < argc; ++i) {
        const std::string flag = argv[i];
        if (flag == "--prevent-collision") {
            args.prevent_collision = true;
            continue;
        }
        if (flag == "--auto-overlap-test") {
            args.auto_overlap_test = true;
            continue;
        }
        if (i + 1 >= argc) {
            (void)fprintf(stderr, "missing value for %s\n", flag.c_str());
            return false;
        }
        const std::string value = argv[++i];
        std::optional<int>* number = nullptr;
        if (flag == "--input") args.input = value;
        else if (flag == "--output") args.output = value;
        else if (flag == "--op") args.op = value;
        else if (flag == "--compact") args.compact = value;
        else if (flag == "--id") args.id = value;
        else if (flag == "--ids") args.ids = value;
        else if (flag == "--behavior") args.behavior = value;
        else if (flag == "--log-level") args.log_level = value;
        else if (flag == "--cols") number = &args.cols;
        else if (flag == "--x") number = &args.x;
        else if (flag == "--y") number = &args.y;
        else if (flag == "--w") number = &args.w;
        else if (flag == "--h") number = &args.h;
        else {
            (void)fprintf(stderr, "unknown option %s\n", flag.c_str());
            return false;
        }
        if (number) {
            *number = parse_int(value);
            if (!*number) {
                (void)fprintf(stderr, "%s expects an integer, got '%s'\n", flag.c_str(), value.c_str());
                return false;
            }
        }
    }
    return true;
}

std::unordered_set<std::string> split_ids(const std::string& text) {
    std::unordered_set<std::string> ids;
    std::stringstream in(text);
    std::string id;
    while (std::getline(in, id, ',')) {
        if (!id.empty()) ids.insert(id);
    }
    return ids;
}

// Scripted interaction run against the sample dashboard; every step must leave
// the layout free of overlaps.
int run_auto_overlap_test(int cols) {
    using namespace grid_engine;
    Layout layout = grid_loaders::sample_dashboard_layout();
    int step = 0;
    std::size_t worst = 0;

    auto check = [&](const char* what) {
        const std::size_t overlaps = count_overlaps(layout);
        if (overlaps > 0)
            (void)fprintf(stderr, "[auto-overlap-test] step=%d %s overlap_count=%zu\n", step, what, overlaps);
        worst = std::max(worst, overlaps);
        ++step;
    };

    layout = compact(layout, CompactType::Vertical, cols);
    check("compact");

    MoveOptions move_options;
    move_options.cols = cols;
    move_options.prevent_collision = true;
    if (const LayoutItem* item = find_item(layout, "sales_chart")) {
        layout = move_element(layout, *item, 4, 1, move_options);
        check("move");
    }

    ResizeOptions resize_options;
    resize_options.cols = cols;
    resize_options.prevent_collision = true;
    if (const LayoutItem* item = find_item(layout, "revenue")) {
        layout = resize_item(layout, item->with_size(6, 3), resize_options);
        check("resize");
    }

    ClusterMoveOptions cluster_options;
    cluster_options.cols = cols;
    cluster_options.prevent_collision = true;
    layout = move_cluster(layout, {"orders", "visitors"}, 0, 2, cluster_options);
    check("cluster");

    grid_model::LayoutItem extra;
    extra.id = "extra";
    extra.x = grid_model::kUnplaced;
    extra.y = grid_model::kUnplaced;
    extra.w = 5;
    extra.h = 2;
    layout = place_new_items(layout, {extra}, cols);
    check("place");

    layout = optimize_layout(layout, cols);
    check("optimize");

    layout = make_compactor(CompactorKind::FastVertical)->compact(layout, cols, false);
    check("fast-compact");

    (void)fprintf(stderr, "[auto-overlap-test] finished steps=%d overlap_count=%zu\n", step, worst);
    return worst == 0 ? 0 : 2;
}

} // namespace

int main(int argc, char* argv[])
{
    Args args;
    if (!parse_args(argc, argv, args)) {
        print_usage();
        return 1;
    }
    if (args.cols && *args.cols <= 0) {
        (void)fprintf(stderr, "--cols must be positive\n");
        return 1;
    }

    const auto level = spdlog::level::from_str(args.log_level);
    grid_engine::set_engine_log_level(level);
    spdlog::set_level(level);

    if (args.auto_overlap_test) {
        return run_auto_overlap_test(args.cols.value_or(12));
    }

    grid_loaders::LayoutDocument doc;
    if (!args.input.empty()) {
        auto loaded = grid_loaders::load_layout_from_json_file(args.input);
        if (!loaded) {
            (void)fprintf(stderr, "failed to load layout from %s\n", args.input.c_str());
            return 1;
        }
        doc = std::move(*loaded);
    } else {
        doc.items = grid_loaders::sample_dashboard_layout();
    }
    if (args.cols) doc.cols = *args.cols;
    if (!args.compact.empty()) doc.compact_type = args.compact;

    const auto kind = grid_engine::parse_compactor_kind(doc.compact_type);
    if (!kind) {
        (void)fprintf(stderr, "unknown compact type '%s'\n", doc.compact_type.c_str());
        return 1;
    }
    const grid_engine::CompactType compact_type = grid_engine::axis_of(*kind);

    const grid_model::LayoutItem* target = nullptr;
    if (args.op == "move" || args.op == "resize") {
        target = grid_engine::find_item(doc.items, args.id);
        if (!target) {
            (void)fprintf(stderr, "--op %s needs --id of an item in the layout\n", args.op.c_str());
            return 1;
        }
    }

    try {
        if (args.op == "compact") {
            doc.items = grid_engine::make_compactor(*kind)->compact(doc.items, doc.cols, false);
        } else if (args.op == "optimize") {
            doc.items = grid_engine::optimize_layout(doc.items, doc.cols);
        } else if (args.op == "place") {
            grid_model::Layout existing;
            grid_model::Layout pending;
            for (const auto& item : doc.items)
                (grid_model::needs_placement(item) ? pending : existing).push_back(item);
            doc.items = grid_engine::place_new_items(existing, pending, doc.cols);
        } else if (args.op == "correct-bounds") {
            doc.items = grid_engine::correct_bounds(doc.items, doc.cols);
        } else if (args.op == "move") {
            grid_engine::MoveOptions options;
            options.cols = doc.cols;
            options.compact_type = compact_type;
            options.prevent_collision = args.prevent_collision;
            grid_engine::PropagationStats stats;
            doc.items = grid_engine::move_element(doc.items, *target, args.x, args.y, options, &stats);
            spdlog::info("move of '{}' took {} propagation steps{}", args.id, stats.iterations,
                stats.capped ? " (capped)" : "");
        } else if (args.op == "resize") {
            const auto behavior = grid_engine::parse_resize_behavior(args.behavior);
            if (!behavior) {
                (void)fprintf(stderr, "unknown resize behavior '%s'\n", args.behavior.c_str());
                return 1;
            }
            grid_engine::ResizeOptions options;
            options.cols = doc.cols;
            options.behavior = *behavior;
            options.prevent_collision = args.prevent_collision;
            grid_model::LayoutItem resized = *target;
            resized.x = args.x.value_or(target->x);
            resized.y = args.y.value_or(target->y);
            resized.w = args.w.value_or(target->w);
            resized.h = args.h.value_or(target->h);
            doc.items = grid_engine::resize_item(doc.items, resized, options);
        } else if (args.op == "cluster") {
            if (!args.x || !args.y) {
                (void)fprintf(stderr, "--op cluster needs --x and --y\n");
                return 1;
            }
            grid_engine::ClusterMoveOptions options;
            options.cols = doc.cols;
            options.compact_type = compact_type;
            options.prevent_collision = args.prevent_collision;
            doc.items = grid_engine::move_cluster(doc.items, split_ids(args.ids), *args.x, *args.y, options);
        } else if (args.op == "free-areas") {
            doc.items = grid_engine::available_free_areas(doc.items, doc.cols);
        } else {
            (void)fprintf(stderr, "unknown op '%s'\n", args.op.c_str());
            print_usage();
            return 1;
        }
    } catch (const std::invalid_argument& e) {
        (void)fprintf(stderr, "%s\n", e.what());
        return 1;
    }

    const std::size_t overlaps = grid_engine::count_overlaps(doc.items);
    if (overlaps > 0) spdlog::info("result has {} overlapping pairs", overlaps);

    if (args.output.empty()) {
        std::cout << grid_loaders::layout_to_json(doc) << '\n';
    } else if (!grid_loaders::save_layout_to_json_file(doc, args.output)) {
        (void)fprintf(stderr, "failed to write %s\n", args.output.c_str());
        return 1;
    }
    return 0;
}
