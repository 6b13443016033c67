#include <cstdint>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "nlohmann/json.hpp"
#include "pc_bridge/field_decoder.hpp"
#include "pc_bridge/solver_context.hpp"
#include "pc_engine/model.hpp"

namespace {

struct CliOptions {
    std::string field;
    std::string pieces;
    std::uint32_t height{4};
    std::optional<std::string> model_path;
    std::optional<std::string> config_path;
    bool check{false};
    bool render{false};
};

CliOptions parse_cli(int argc, char** argv) {
    CliOptions opts;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--field" && i + 1 < argc) {
            opts.field = argv[++i];
        } else if (arg == "--pieces" && i + 1 < argc) {
            opts.pieces = argv[++i];
        } else if (arg == "--height" && i + 1 < argc) {
            opts.height = static_cast<std::uint32_t>(std::stoul(argv[++i]));
        } else if (arg == "--model" && i + 1 < argc) {
            opts.model_path = argv[++i];
        } else if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            opts.config_path = argv[++i];
        } else if (arg == "--check") {
            opts.check = true;
        } else if (arg == "--render") {
            opts.render = true;
        } else {
            throw std::runtime_error("Unknown argument: " + arg);
        }
    }
    if (opts.pieces.empty()) {
        throw std::runtime_error("--pieces is required");
    }
    return opts;
}

pc_engine::SolverOptions load_config(const std::optional<std::string>& path) {
    pc_engine::SolverOptions options;
    if (!path.has_value()) {
        return options;
    }
    std::ifstream in(*path);
    if (!in) {
        throw std::runtime_error("Failed to open config file: " + *path);
    }
    nlohmann::json j;
    in >> j;
    if (j.contains("node_limit")) {
        options.node_limit = j.at("node_limit").get<std::uint64_t>();
    }
    return options;
}

pc_bridge::ModelLoader make_loader(const std::optional<std::string>& path) {
    if (!path.has_value()) {
        return pc_engine::load_default_model;
    }
    return [file = *path] { return pc_engine::load_model_file(file); };
}

void print_board(const std::string& rendered) {
    for (std::size_t i = 0; i < rendered.size(); i += pc_engine::kBoardWidth) {
        std::cout << rendered.substr(i, pc_engine::kBoardWidth) << '\n';
    }
}

}  // namespace

int main(int argc, char** argv) {
    try {
        auto opts = parse_cli(argc, argv);
        pc_bridge::SolverContext context(pc_bridge::kOutputCapacity, make_loader(opts.model_path),
                                         load_config(opts.config_path));

        auto field = pc_bridge::ByteView::of(opts.field);
        auto pieces = pc_bridge::ByteView::of(opts.pieces);

        if (opts.render) {
            pc_engine::Board board;
            pc_bridge::decode_field(field, opts.height, board);
            print_board(pc_bridge::render_field(board, opts.height));
        }

        if (opts.check) {
            std::cout << (context.check_pc_possible(field, pieces, opts.height) ? 1 : 0) << '\n';
        } else {
            std::cout << context.find_path(field, pieces, opts.height) << '\n';
        }

        const auto& stats = context.last_stats();
        std::cerr << "nodes: " << stats.nodes << ", expansions: " << stats.expansions
                  << ", heights: " << stats.heights_searched << '\n';
    } catch (const std::exception& e) {
        std::cerr << "pc_solve: " << e.what() << '\n';
        return 1;
    }
    return 0;
}
