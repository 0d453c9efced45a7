#pragma once

#include <iosfwd>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "box_shape.hpp"

// Row-major N x N grid, 0 marks an empty cell.
using Grid = std::vector<std::vector<int>>;

enum class SolveStatus {
    Solved,
    InvalidPuzzle,
    Unsolvable,
    Aborted,
};

const char* to_string(SolveStatus status);

Grid make_empty_grid(const BoxShape& shape);

/**
 * Checks that every row, column and box of the grid is a permutation of 1..N.
 * Pure function: does not rely on any solver bookkeeping.
 * @return False for grids with the wrong dimensions or any empty cell.
 */
bool is_valid_solution(const Grid& grid, const BoxShape& shape);

// Describes the first structural problem of a puzzle (dimensions, value range,
// duplicate givens inside a unit), or std::nullopt when the givens are consistent.
std::optional<std::string> find_puzzle_error(const Grid& grid, const BoxShape& shape);

void print_grid(const Grid& grid, const BoxShape& shape, std::ostream& out);

class Sudoku {
public:
    Sudoku(Grid initial, BoxShape shape = BoxShape::classic());

    const BoxShape& shape() const { return box_shape; }
    const Grid& init() const { return initial; }
    const Grid& solution() const { return solved; }

    void set_solution(Grid grid) { solved = std::move(grid); }
    // Restores the solution field to the givens.
    void reset() { solved = initial; }

    bool check() const { return is_valid_solution(solved, box_shape); }

private:
    BoxShape box_shape;
    Grid initial;
    Grid solved;
};
