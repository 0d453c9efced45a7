#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include <opencv2/core.hpp>

#include "box_shape.hpp"
#include "sudoku.hpp"

struct RenderConfig {
    std::string out_dir = "dataset";
    int img_w = 512;
    int margin = 16;
    int line_thin = 2;
    int line_thick = 5;
    double font_px = 48.0;
    bool do_cell_grid = true;    // thin lines between the cells of a box
    bool with_highlight = true;  // row/column/box/cell overlays

    int board_size() const { return img_w - 2 * margin; }
    int cell_size(int n) const { return board_size() / n; }

    // Throws std::invalid_argument when an N x N board does not fit the image.
    void validate(int n) const;
};

// Pixel bounds of one cell inside the rendered image.
struct CellBox {
    int x = 0;
    int y = 0;
    int w = 0;
    int h = 0;
};

struct Highlight {
    int row = 0;
    int col = 0;
    int box_row = 0;
    int box_col = 0;
    int cell_row = 0;
    int cell_col = 0;
};

struct ColorPalette {
    cv::Scalar background;
    cv::Scalar border;
    cv::Scalar highlight_row;
    cv::Scalar highlight_col;
    cv::Scalar highlight_box;
    cv::Scalar highlight_cell;

    // Light background, dark ink and pastel overlays, each channel jittered.
    static ColorPalette random(std::mt19937_64& rng);
};

struct FontFace {
    std::string name;
    int face;  // cv::HersheyFonts
};

struct TextMetrics {
    double scale = 1.0;
    int thickness = 1;
    int height = 0;
    std::vector<int> widths;  // rendered width of each value, indexed by value
};

/**
 * Fonts available to the renderer plus their measured metrics.
 * Constructed once by the caller and passed to every render call;
 * the metrics cache makes it unsafe to share between threads.
 */
class FontSet {
public:
    FontSet();  // every Hershey face that has digit glyphs
    explicit FontSet(std::vector<FontFace> faces);

    size_t size() const { return faces.size(); }
    const FontFace& pick(std::mt19937_64& rng) const;

    // Metrics of `face` scaled to `px` pixels of height, computed on first use.
    const TextMetrics& metrics(const FontFace& face, int px);

private:
    std::vector<FontFace> faces;
    std::map<std::pair<int, int>, TextMetrics> cache;
};

struct RenderedItem {
    cv::Mat image;
    std::vector<CellBox> boxes;  // row-major, N * N entries
    std::optional<Highlight> highlight;
};

// Cell bounds for an N x N board; the last row and column absorb the rounding remainder.
std::vector<CellBox> cell_boxes(const RenderConfig& config, int n);

/**
 * Draws the grid (0 = empty cell) as a synthetic training image.
 * Colours, font, overlays and digit jitter all derive from `seed`, so the same
 * seed reproduces the same image.
 */
RenderedItem render_grid(const Grid& grid, const BoxShape& shape, const RenderConfig& config,
                         FontSet& fonts, std::uint64_t seed);
