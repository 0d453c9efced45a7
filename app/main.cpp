#include <iostream>
#include <vector>
#include <string>
#include <chrono> // added for timing
#include <cstdint>
#include <optional>
#include <random>
#include <stdexcept>

#include "box_shape.hpp"
#include "dataset_writer.hpp"
#include "grid_render.hpp"
#include "puzzle_io.hpp"
#include "solver_engine.hpp"
#include "stochastic_solver.hpp"
#include "sudoku.hpp"

static void printUsage(const char* prog) {
    std::cerr << "Usage:\n"
              << "  " << prog << " solve [--box RxC] [--algo dfs|stochastic] [--seed S] <puzzle_file>\n"
              << "  " << prog << " render [--box RxC] [--out DIR] [--count K] [--seed S]\n"
              << "        [--mode random|solved] [--width W] [--no-highlight] [--no-cell-grid]\n";
}

struct CliOptions {
    std::string command;
    BoxShape shape = BoxShape::classic();
    SolverKind algo = SolverKind::Dfs;
    std::optional<std::uint64_t> seed;
    std::string puzzle_path;
    RenderConfig render;
    int count = 10;
    SampleMode mode = SampleMode::Random;
};

// Throws std::invalid_argument on unknown flags or missing values.
static CliOptions parseArgs(int argc, char* argv[]) {
    if (argc < 2) throw std::invalid_argument("missing command");

    CliOptions opts;
    opts.command = argv[1];
    if (opts.command != "solve" && opts.command != "render") {
        throw std::invalid_argument("unknown command '" + opts.command + "'");
    }

    for (int i = 2; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> std::string {
            if (i + 1 >= argc) throw std::invalid_argument(arg + " needs a value");
            return argv[++i];
        };

        if (arg == "--box") opts.shape = BoxShape::parse(next());
        else if (arg == "--algo") opts.algo = parse_solver_kind(next());
        else if (arg == "--seed") opts.seed = parse_seed(next());
        else if (arg == "--out") opts.render.out_dir = next();
        else if (arg == "--count") opts.count = std::stoi(next());
        else if (arg == "--mode") opts.mode = parse_sample_mode(next());
        else if (arg == "--width") opts.render.img_w = std::stoi(next());
        else if (arg == "--no-highlight") opts.render.with_highlight = false;
        else if (arg == "--no-cell-grid") opts.render.do_cell_grid = false;
        else if (!arg.empty() && arg[0] == '-') throw std::invalid_argument("unknown option " + arg);
        else if (opts.puzzle_path.empty()) opts.puzzle_path = arg;
        else throw std::invalid_argument("unexpected argument " + arg);
    }

    if (opts.command == "solve" && opts.puzzle_path.empty()) {
        throw std::invalid_argument("solve needs a puzzle file");
    }
    if (opts.count < 0) throw std::invalid_argument("--count must not be negative");
    return opts;
}

static int runSolve(const CliOptions& opts) {
    Grid puzzle = load_grid(opts.puzzle_path, opts.shape);

    std::cout << "Puzzle (" << opts.shape.to_string() << " boxes):" << std::endl;
    print_grid(puzzle, opts.shape, std::cout);

    if (auto problem = find_puzzle_error(puzzle, opts.shape)) {
        std::cerr << "ERROR: Invalid puzzle: " << *problem << std::endl;
        return 1;
    }

    if (opts.seed && opts.algo == SolverKind::Dfs) {
        std::cerr << "WARNING: --seed only affects the stochastic solver" << std::endl;
    }

    StochasticOptions stochastic;
    stochastic.seed = opts.seed;
    SolverEngine engine = SolverEngine::create(opts.algo, opts.shape, stochastic);
    Sudoku sudoku(puzzle, opts.shape);

    auto t_start = std::chrono::high_resolution_clock::now();
    SolveStatus status = engine.solve(sudoku);
    auto t_end = std::chrono::high_resolution_clock::now();
    auto t_us = std::chrono::duration_cast<std::chrono::microseconds>(t_end - t_start).count();
    std::cout << "Solving (" << to_string(opts.algo) << ") took: " << t_us << " us" << std::endl;

    std::cout << "\nStatus: " << to_string(status) << "\n";
    if (const SearchStats* stats = engine.search_stats()) {
        std::cout << "Iterations: " << stats->iterations << ", branches: " << stats->branches
                  << ", backtracks: " << stats->backtracks << ", forced: " << stats->forced
                  << "\n";
    }

    if (status != SolveStatus::Solved) {
        std::cout << "\nCould not solve the sudoku (" << to_string(status) << ")." << std::endl;
        return 1;
    }

    std::cout << "\nSolved Sudoku:" << std::endl;
    print_grid(sudoku.solution(), opts.shape, std::cout);
    std::cout << "Check: " << (sudoku.check() ? "valid" : "INVALID") << std::endl;
    return sudoku.check() ? 0 : 1;
}

static int runRender(const CliOptions& opts) {
    opts.render.validate(opts.shape.size());
    if (opts.count == 0) std::cerr << "WARNING: --count 0, only an empty labels.jsonl is written" << std::endl;

    std::uint64_t base_seed = opts.seed ? *opts.seed : std::random_device{}();
    FontSet fonts;
    DatasetWriter writer(opts.render.out_dir);

    auto t_start = std::chrono::high_resolution_clock::now();
    for (int i = 0; i < opts.count; ++i) {
        std::uint64_t seed = base_seed + static_cast<std::uint64_t>(i);
        Grid grid = sample_puzzle(opts.shape, seed, opts.mode);
        RenderedItem item = render_grid(grid, opts.shape, opts.render, fonts, seed);
        writer.write(static_cast<std::uint32_t>(i + 1), seed, grid, item);
    }
    writer.finalize();
    auto t_end = std::chrono::high_resolution_clock::now();
    auto t_ms = std::chrono::duration_cast<std::chrono::milliseconds>(t_end - t_start).count();

    std::cout << "Wrote " << writer.records_written() << " images to "
              << writer.root().string() << " (base seed " << base_seed << ")" << std::endl;
    std::cout << "Rendering took: " << t_ms << " ms" << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    CliOptions opts;
    try {
        opts = parseArgs(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage(argv[0]);
        return 2;
    }

    try {
        return opts.command == "solve" ? runSolve(opts) : runRender(opts);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
}
