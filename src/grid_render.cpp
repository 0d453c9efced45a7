#include "grid_render.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>
#include <vector>
#include <opencv2/opencv.hpp>

void RenderConfig::validate(int n) const {
    if (n < 1) throw std::invalid_argument("grid size must be positive");
    if (margin < 0 || line_thin < 0 || line_thick < 1 || font_px < 2.0) {
        throw std::invalid_argument("invalid render line/font settings");
    }
    if (board_size() < n * 4) {
        throw std::invalid_argument("image width " + std::to_string(img_w) +
                                    " is too small for a " + std::to_string(n) + "x" +
                                    std::to_string(n) + " board");
    }
}

static int jitter_channel(std::mt19937_64& rng, int base, int spread) {
    std::uniform_int_distribution<int> dist(-spread, spread);
    return std::clamp(base + dist(rng), 0, 255);
}

static cv::Scalar jittered(std::mt19937_64& rng, int b, int g, int r, int spread) {
    return cv::Scalar(jitter_channel(rng, b, spread), jitter_channel(rng, g, spread),
                      jitter_channel(rng, r, spread));
}

ColorPalette ColorPalette::random(std::mt19937_64& rng) {
    ColorPalette colors;
    colors.background = jittered(rng, 240, 240, 240, 15);
    colors.border = jittered(rng, 30, 30, 30, 30);
    colors.highlight_row = jittered(rng, 230, 210, 190, 20);
    colors.highlight_col = jittered(rng, 190, 220, 230, 20);
    colors.highlight_box = jittered(rng, 200, 230, 200, 20);
    colors.highlight_cell = jittered(rng, 150, 200, 240, 20);
    return colors;
}

FontSet::FontSet()
    : FontSet({{"hershey_simplex", cv::FONT_HERSHEY_SIMPLEX},
               {"hershey_duplex", cv::FONT_HERSHEY_DUPLEX},
               {"hershey_complex", cv::FONT_HERSHEY_COMPLEX},
               {"hershey_triplex", cv::FONT_HERSHEY_TRIPLEX},
               {"hershey_complex_small", cv::FONT_HERSHEY_COMPLEX_SMALL},
               {"hershey_script_simplex", cv::FONT_HERSHEY_SCRIPT_SIMPLEX},
               {"hershey_italic", cv::FONT_HERSHEY_COMPLEX | cv::FONT_ITALIC}}) {}

FontSet::FontSet(std::vector<FontFace> font_faces) : faces(std::move(font_faces)) {
    if (faces.empty()) throw std::invalid_argument("font set needs at least one face");
}

const FontFace& FontSet::pick(std::mt19937_64& rng) const {
    std::uniform_int_distribution<size_t> dist(0, faces.size() - 1);
    return faces[dist(rng)];
}

const TextMetrics& FontSet::metrics(const FontFace& face, int px) {
    auto key = std::make_pair(face.face, px);
    auto it = cache.find(key);
    if (it != cache.end()) return it->second;

    TextMetrics m;
    m.thickness = std::max(1, px / 16);
    m.scale = cv::getFontScaleFromHeight(face.face, px, m.thickness);

    int baseline = 0;
    m.height = cv::getTextSize("0123456789", face.face, m.scale, m.thickness, &baseline).height;
    m.widths.resize(kMaxGridSize + 1);
    for (int v = 0; v <= kMaxGridSize; ++v) {
        m.widths[v] = cv::getTextSize(std::to_string(v), face.face, m.scale, m.thickness,
                                      &baseline).width;
    }

    return cache.emplace(key, std::move(m)).first->second;
}

std::vector<CellBox> cell_boxes(const RenderConfig& config, int n) {
    const int board = config.board_size();
    const int cs = config.cell_size(n);

    std::vector<CellBox> boxes(static_cast<size_t>(n) * n);
    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            CellBox& box = boxes[r * n + c];
            box.x = config.margin + c * cs;
            box.y = config.margin + r * cs;
            box.w = c == n - 1 ? board - cs * (n - 1) : cs;
            box.h = r == n - 1 ? board - cs * (n - 1) : cs;
        }
    }
    return boxes;
}

static bool coin(std::mt19937_64& rng, int percent) {
    std::uniform_int_distribution<int> dist(0, 99);
    return dist(rng) < percent;
}

static Highlight random_highlight(const BoxShape& shape, std::mt19937_64& rng) {
    const int n = shape.size();
    std::uniform_int_distribution<int> any(0, n - 1);
    std::uniform_int_distribution<int> box_rows(0, shape.boxes_down() - 1);
    std::uniform_int_distribution<int> box_cols(0, shape.boxes_across() - 1);

    Highlight hl;
    hl.row = any(rng);
    hl.col = any(rng);
    hl.box_row = box_rows(rng);
    hl.box_col = box_cols(rng);
    hl.cell_row = any(rng);
    hl.cell_col = any(rng);
    return hl;
}

static void render_highlights(cv::Mat& img, const Highlight& hl, const std::vector<CellBox>& boxes,
                              const BoxShape& shape, const RenderConfig& config,
                              const ColorPalette& colors, std::mt19937_64& rng) {
    const int n = shape.size();
    const int cs = config.cell_size(n);
    const int board = config.board_size();

    // Each overlay shows up 70% of the time
    if (coin(rng, 70)) {
        int y = boxes[hl.row * n].y;
        cv::rectangle(img, cv::Rect(config.margin, y, board, cs), colors.highlight_row, cv::FILLED);
    }
    if (coin(rng, 70)) {
        int x = boxes[hl.col].x;
        cv::rectangle(img, cv::Rect(x, config.margin, cs, board), colors.highlight_col, cv::FILLED);
    }
    if (coin(rng, 70)) {
        int x0 = config.margin + hl.box_col * shape.box_cols * cs;
        int y0 = config.margin + hl.box_row * shape.box_rows * cs;
        cv::rectangle(img, cv::Rect(x0, y0, shape.box_cols * cs, shape.box_rows * cs),
                      colors.highlight_box, cv::FILLED);
    }
    if (coin(rng, 70)) {
        const CellBox& cell = boxes[hl.cell_row * n + hl.cell_col];
        cv::rectangle(img, cv::Rect(cell.x, cell.y, cell.w, cell.h), colors.highlight_cell,
                      cv::FILLED);
    }
}

static int line_thickness(const RenderConfig& config, int i, int n, int block) {
    if (i == 0 || i == n || i % block == 0) return config.line_thick;
    return config.do_cell_grid ? config.line_thin : 0;
}

static void render_borders(cv::Mat& img, const BoxShape& shape, const RenderConfig& config,
                           const ColorPalette& colors) {
    const int n = shape.size();
    const int cs = config.cell_size(n);
    const int board = config.board_size();

    for (int i = 0; i <= n; ++i) {
        int pos = config.margin + i * cs;

        // Vertical lines split box columns, horizontal lines split box rows
        int v = line_thickness(config, i, n, shape.box_cols);
        if (v > 0) {
            cv::rectangle(img, cv::Rect(pos - v / 2, config.margin, v, board), colors.border,
                          cv::FILLED);
        }
        int h = line_thickness(config, i, n, shape.box_rows);
        if (h > 0) {
            cv::rectangle(img, cv::Rect(config.margin, pos - h / 2, board, h), colors.border,
                          cv::FILLED);
        }
    }
}

static void render_numbers(cv::Mat& img, const Grid& grid, const std::vector<CellBox>& boxes,
                           const RenderConfig& config, const ColorPalette& colors,
                           FontSet& fonts, std::mt19937_64& rng) {
    const int n = static_cast<int>(grid.size());
    bool small = coin(rng, 35);
    int px = static_cast<int>(std::lround(small ? config.font_px / 2.0 : config.font_px));

    const FontFace& face = fonts.pick(rng);
    const TextMetrics& m = fonts.metrics(face, px);
    std::uniform_real_distribution<double> jitter(small ? -1.0 : -2.0, small ? 1.0 : 2.0);

    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            int v = grid[r][c];
            if (v == 0) continue;

            const CellBox& cell = boxes[r * n + c];
            double cx = cell.x + 0.5 * cell.w;
            double cy = cell.y + 0.5 * cell.h;
            double jx = jitter(rng);
            double jy = jitter(rng);

            // putText anchors the bottom-left corner of the text
            int x = static_cast<int>(std::lround(cx - 0.5 * m.widths[v] + jx));
            int y = static_cast<int>(std::lround(cy + 0.5 * m.height + jy));
            cv::putText(img, std::to_string(v), cv::Point(x, y), face.face, m.scale,
                        colors.border, m.thickness, cv::LINE_AA);
        }
    }
}

RenderedItem render_grid(const Grid& grid, const BoxShape& shape, const RenderConfig& config,
                         FontSet& fonts, std::uint64_t seed) {
    shape.validate();
    const int n = shape.size();
    config.validate(n);
    if (static_cast<int>(grid.size()) != n) {
        throw std::invalid_argument("grid does not match box shape " + shape.to_string());
    }
    for (const auto& row : grid) {
        if (static_cast<int>(row.size()) != n) {
            throw std::invalid_argument("grid does not match box shape " + shape.to_string());
        }
        for (int v : row) {
            if (v < 0 || v > n) throw std::invalid_argument("cell value out of range");
        }
    }

    std::mt19937_64 rng(seed);
    ColorPalette colors = ColorPalette::random(rng);

    RenderedItem item;
    item.image = cv::Mat(config.img_w, config.img_w, CV_8UC3, colors.background);
    item.boxes = cell_boxes(config, n);
    if (config.with_highlight) item.highlight = random_highlight(shape, rng);

    if (item.highlight) {
        render_highlights(item.image, *item.highlight, item.boxes, shape, config, colors, rng);
    }
    render_borders(item.image, shape, config, colors);
    render_numbers(item.image, grid, item.boxes, config, colors, fonts, rng);
    return item;
}
