#include "dataset_writer.hpp"

#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>
#include <opencv2/opencv.hpp>

#include "search_engine.hpp"
#include "stochastic_solver.hpp"

namespace fs = std::filesystem;

SampleMode parse_sample_mode(const std::string& name) {
    if (name == "random") return SampleMode::Random;
    if (name == "solved") return SampleMode::Solved;
    throw std::invalid_argument("unknown sample mode '" + name + "', expected random or solved");
}

static Grid random_solution(const BoxShape& shape, std::uint64_t seed) {
    StochasticOptions options;
    options.seed = seed;
    StochasticSolver solver(shape, options);
    Sudoku sudoku(make_empty_grid(shape), shape);
    if (solver.solve(sudoku) == SolveStatus::Solved) return sudoku.solution();

    // The exhaustive engine always completes an empty grid
    SearchEngine engine(shape);
    if (engine.solve(sudoku) != SolveStatus::Solved) {
        throw std::runtime_error("could not build a solution for box shape " + shape.to_string());
    }
    return sudoku.solution();
}

Grid sample_puzzle(const BoxShape& shape, std::uint64_t seed, SampleMode mode) {
    shape.validate();
    const int n = shape.size();

    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<int> percent(0, 99);
    std::uniform_int_distribution<int> value(1, n);
    int p0 = std::uniform_int_distribution<int>(60, 75)(rng);

    Grid grid = mode == SampleMode::Solved ? random_solution(shape, rng()) : make_empty_grid(shape);
    for (auto& row : grid) {
        for (int& cell : row) {
            if (percent(rng) < p0) {
                cell = 0;
            } else if (mode == SampleMode::Random) {
                cell = value(rng);
            }
        }
    }
    return grid;
}

std::string image_name(std::uint32_t id) {
    std::ostringstream name;
    name << "images/" << std::setw(6) << std::setfill('0') << id << ".png";
    return name.str();
}

std::string make_record_json(const std::string& image, const Grid& labels,
                             const std::vector<CellBox>& boxes, std::uint64_t seed,
                             const std::optional<Highlight>& highlight) {
    std::ostringstream out;
    out << "{\"schema\":\"v1\",\"image\":\"" << image << "\",\"labels\":[";

    bool first = true;
    for (const auto& row : labels) {
        for (int v : row) {
            out << (first ? "" : ",") << v;
            first = false;
        }
    }

    out << "],\"boxes\":[";
    for (size_t i = 0; i < boxes.size(); ++i) {
        const CellBox& b = boxes[i];
        out << (i ? "," : "") << "[" << b.x << "," << b.y << "," << b.w << "," << b.h << "]";
    }

    out << "],\"dim\":" << labels.size() << ",\"seed\":" << seed;
    if (highlight) {
        const Highlight& hl = *highlight;
        out << ",\"highlight\":{\"row\":" << hl.row << ",\"col\":" << hl.col
            << ",\"box\":[" << hl.box_row << "," << hl.box_col << "]"
            << ",\"cell\":[" << hl.cell_row << "," << hl.cell_col << "]}";
    }
    out << "}";
    return out.str();
}

DatasetWriter::DatasetWriter(const std::string& out_dir) : root_dir(out_dir) {
    std::error_code ec;
    fs::create_directories(root_dir / "images", ec);
    if (ec) {
        throw std::runtime_error("could not create " + (root_dir / "images").string() + ": " +
                                 ec.message());
    }

    labels.open(root_dir / "labels.jsonl", std::ios::out | std::ios::trunc);
    if (!labels) {
        throw std::runtime_error("could not open " + (root_dir / "labels.jsonl").string());
    }
}

DatasetWriter::~DatasetWriter() {
    if (labels.is_open()) labels.close();
}

std::string DatasetWriter::write(std::uint32_t id, std::uint64_t seed, const Grid& grid,
                                 const RenderedItem& item) {
    if (!labels.is_open()) throw std::runtime_error("dataset writer already finalized");

    std::string relative = image_name(id);
    fs::path image_path = root_dir / relative;
    if (!cv::imwrite(image_path.string(), item.image)) {
        throw std::runtime_error("could not write image " + image_path.string());
    }

    labels << make_record_json(relative, grid, item.boxes, seed, item.highlight) << '\n';
    if (!labels) throw std::runtime_error("could not append to labels.jsonl");

    ++records;
    return image_path.string();
}

void DatasetWriter::finalize() {
    if (!labels.is_open()) return;
    labels.flush();
    bool ok = static_cast<bool>(labels);
    labels.close();
    if (!ok) throw std::runtime_error("could not flush labels.jsonl");
}
