#include "box_shape.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>
#include <vector>

void BoxShape::validate() const {
    if (box_rows < 1 || box_cols < 1) {
        throw std::invalid_argument("box dimensions must be positive, got " + to_string());
    }
    // Bounding each side first keeps size() from overflowing
    if (box_rows > kMaxGridSize || box_cols > kMaxGridSize || size() > kMaxGridSize) {
        throw std::invalid_argument("box shape " + to_string() +
                                    " exceeds the supported grid size of " +
                                    std::to_string(kMaxGridSize));
    }
}

std::string BoxShape::to_string() const {
    return std::to_string(box_rows) + "x" + std::to_string(box_cols);
}

BoxShape BoxShape::parse(const std::string& text) {
    auto sep = text.find_first_of("xX");
    if (sep == std::string::npos || sep == 0 || sep + 1 == text.size()) {
        throw std::invalid_argument("expected box shape as RxC, got '" + text + "'");
    }

    BoxShape shape;
    try {
        size_t used_rows = 0;
        size_t used_cols = 0;
        std::string rows_text = text.substr(0, sep);
        std::string cols_text = text.substr(sep + 1);
        shape.box_rows = std::stoi(rows_text, &used_rows);
        shape.box_cols = std::stoi(cols_text, &used_cols);
        if (used_rows != rows_text.size() || used_cols != cols_text.size()) {
            throw std::invalid_argument("trailing characters");
        }
    } catch (const std::logic_error&) {
        throw std::invalid_argument("expected box shape as RxC, got '" + text + "'");
    }

    shape.validate();
    return shape;
}

CellGeometry::CellGeometry(const BoxShape& shape) : box_shape(shape) {
    box_shape.validate();

    const int n = box_shape.size();
    const int cells = box_shape.cell_count();
    box_indices.resize(cells);
    peer_lists.resize(cells);

    // Precompute box indices to avoid repetitive division in the hot loops
    for (int i = 0; i < cells; ++i) {
        box_indices[i] = box_shape.box_index(i / n, i % n);
    }

    for (int i = 0; i < cells; ++i) {
        int r = i / n;
        int c = i % n;
        std::vector<int>& peers = peer_lists[i];
        peers.reserve(3 * n);

        for (int k = 0; k < n; ++k) {
            peers.push_back(r * n + k);
            peers.push_back(k * n + c);
        }

        int r0 = (r / box_shape.box_rows) * box_shape.box_rows;
        int c0 = (c / box_shape.box_cols) * box_shape.box_cols;
        for (int dr = 0; dr < box_shape.box_rows; ++dr) {
            for (int dc = 0; dc < box_shape.box_cols; ++dc) {
                peers.push_back((r0 + dr) * n + (c0 + dc));
            }
        }

        std::sort(peers.begin(), peers.end());
        peers.erase(std::unique(peers.begin(), peers.end()), peers.end());
        peers.erase(std::remove(peers.begin(), peers.end(), i), peers.end());
    }
}
