#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>

#include "box_shape.hpp"
#include "grid_render.hpp"
#include "sudoku.hpp"

enum class SampleMode {
    Random,  // independent random labels, not necessarily a consistent puzzle
    Solved,  // a random full solution with cells blanked out
};

SampleMode parse_sample_mode(const std::string& name);

// 60..75% of the cells are left empty; the rate itself is drawn from the seed.
Grid sample_puzzle(const BoxShape& shape, std::uint64_t seed, SampleMode mode);

// "images/000042.png"
std::string image_name(std::uint32_t id);

// One labels.jsonl line (without the trailing newline).
std::string make_record_json(const std::string& image, const Grid& labels,
                             const std::vector<CellBox>& boxes, std::uint64_t seed,
                             const std::optional<Highlight>& highlight);

/**
 * Writes rendered grids as out_dir/images/NNNNNN.png plus one JSON record per
 * image in out_dir/labels.jsonl. Throws std::runtime_error on any I/O failure.
 */
class DatasetWriter {
public:
    explicit DatasetWriter(const std::string& out_dir);
    ~DatasetWriter();

    DatasetWriter(const DatasetWriter&) = delete;
    DatasetWriter& operator=(const DatasetWriter&) = delete;

    // Returns the path of the written image.
    std::string write(std::uint32_t id, std::uint64_t seed, const Grid& grid,
                      const RenderedItem& item);
    void finalize();

    size_t records_written() const { return records; }
    const std::filesystem::path& root() const { return root_dir; }

private:
    std::filesystem::path root_dir;
    std::ofstream labels;
    size_t records = 0;
};
