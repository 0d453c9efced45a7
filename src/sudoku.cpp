#include "sudoku.hpp"

#include <ostream>
#include <string>
#include <vector>

const char* to_string(SolveStatus status) {
    switch (status) {
        case SolveStatus::Solved: return "Solved";
        case SolveStatus::InvalidPuzzle: return "InvalidPuzzle";
        case SolveStatus::Unsolvable: return "Unsolvable";
        case SolveStatus::Aborted: return "Aborted";
    }
    return "Unknown";
}

Grid make_empty_grid(const BoxShape& shape) {
    return Grid(shape.size(), std::vector<int>(shape.size(), 0));
}

static bool has_shape(const Grid& grid, int n) {
    if (static_cast<int>(grid.size()) != n) return false;
    for (const auto& row : grid) {
        if (static_cast<int>(row.size()) != n) return false;
    }
    return true;
}

bool is_valid_solution(const Grid& grid, const BoxShape& shape) {
    const int n = shape.size();
    if (n < 1 || n > kMaxGridSize || !has_shape(grid, n)) return false;

    const CandidateMask full = shape.full_mask();
    std::vector<CandidateMask> rows(n, 0), cols(n, 0), boxes(n, 0);

    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            int v = grid[r][c];
            if (v < 1 || v > n) return false;
            CandidateMask bit = value_bit(v);
            rows[r] |= bit;
            cols[c] |= bit;
            boxes[shape.box_index(r, c)] |= bit;
        }
    }

    // N distinct values per unit of N cells means every unit is a permutation
    for (int i = 0; i < n; ++i) {
        if (rows[i] != full || cols[i] != full || boxes[i] != full) return false;
    }
    return true;
}

std::optional<std::string> find_puzzle_error(const Grid& grid, const BoxShape& shape) {
    const int n = shape.size();
    if (!has_shape(grid, n)) {
        return "grid must be " + std::to_string(n) + "x" + std::to_string(n) +
               " for box shape " + shape.to_string();
    }

    std::vector<CandidateMask> rows(n, 0), cols(n, 0), boxes(n, 0);
    for (int r = 0; r < n; ++r) {
        for (int c = 0; c < n; ++c) {
            int v = grid[r][c];
            if (v == 0) continue;
            if (v < 0 || v > n) {
                return "value " + std::to_string(v) + " at (" + std::to_string(r) + "," +
                       std::to_string(c) + ") is outside 0.." + std::to_string(n);
            }

            CandidateMask bit = value_bit(v);
            int b = shape.box_index(r, c);
            if ((rows[r] | cols[c] | boxes[b]) & bit) {
                return "duplicate given " + std::to_string(v) + " at (" + std::to_string(r) +
                       "," + std::to_string(c) + ")";
            }
            rows[r] |= bit;
            cols[c] |= bit;
            boxes[b] |= bit;
        }
    }
    return std::nullopt;
}

void print_grid(const Grid& grid, const BoxShape& shape, std::ostream& out) {
    const int n = shape.size();
    const int width = n > 9 ? 2 : 1;

    // One separator segment per box column: (width + 1) chars per cell
    std::string separator;
    for (int b = 0; b < shape.boxes_across(); ++b) {
        if (b > 0) separator += "+-";
        separator += std::string(shape.box_cols * (width + 1), '-');
    }

    for (int r = 0; r < static_cast<int>(grid.size()); ++r) {
        if (r > 0 && r % shape.box_rows == 0) out << separator << "\n";
        for (int c = 0; c < static_cast<int>(grid[r].size()); ++c) {
            if (c > 0 && c % shape.box_cols == 0) out << "| ";
            int v = grid[r][c];
            std::string text = v == 0 ? "." : std::to_string(v);
            int pad = width - static_cast<int>(text.size());
            if (pad > 0) out << std::string(pad, ' ');
            out << text << " ";
        }
        out << "\n";
    }
}

Sudoku::Sudoku(Grid initial_grid, BoxShape shape)
    : box_shape(shape), initial(std::move(initial_grid)), solved(initial) {}
