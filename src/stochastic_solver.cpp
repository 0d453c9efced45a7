#include "stochastic_solver.hpp"

#include <algorithm>
#include <bit>
#include <cctype>
#include <stdexcept>
#include <utility>
#include <vector>

std::uint64_t parse_seed(const std::string& text) {
    // std::stoull accepts "-1" and wraps it, so only plain digits get through
    if (text.empty() || !std::all_of(text.begin(), text.end(), [](char ch) {
            return std::isdigit(static_cast<unsigned char>(ch));
        })) {
        throw std::invalid_argument("seed must be a non-negative integer, got '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("seed '" + text + "' does not fit in 64 bits");
    }
}

StochasticSolver::StochasticSolver(BoxShape shape, StochasticOptions options)
    : box_shape(shape), opts(options) {
    box_shape.validate();
    if (opts.max_attempts < 1 || opts.max_restarts < 0) {
        throw std::invalid_argument("stochastic solver needs max_attempts >= 1 and max_restarts >= 0");
    }
    rng.seed(opts.seed ? *opts.seed : std::random_device{}());
}

void StochasticSolver::reset_box(const Grid& init, Grid& grid, int box) const {
    int r0 = (box / box_shape.boxes_across()) * box_shape.box_rows;
    int c0 = (box % box_shape.boxes_across()) * box_shape.box_cols;
    for (int r = r0; r < r0 + box_shape.box_rows; ++r) {
        for (int c = c0; c < c0 + box_shape.box_cols; ++c) {
            if (init[r][c] == 0) grid[r][c] = 0;
        }
    }
}

bool StochasticSolver::fill_box(Grid& grid, int box) {
    const int n = box_shape.size();
    int r0 = (box / box_shape.boxes_across()) * box_shape.box_rows;
    int c0 = (box % box_shape.boxes_across()) * box_shape.box_cols;

    for (int r = r0; r < r0 + box_shape.box_rows; ++r) {
        for (int c = c0; c < c0 + box_shape.box_cols; ++c) {
            if (grid[r][c] != 0) continue;

            CandidateMask taken = 0;
            for (int q = 0; q < n; ++q) {
                if (grid[r][q] > 0) taken |= value_bit(grid[r][q]);
                if (grid[q][c] > 0) taken |= value_bit(grid[q][c]);
            }
            for (int br = r0; br < r0 + box_shape.box_rows; ++br) {
                for (int bc = c0; bc < c0 + box_shape.box_cols; ++bc) {
                    if (grid[br][bc] > 0) taken |= value_bit(grid[br][bc]);
                }
            }

            CandidateMask candidates = box_shape.full_mask() & ~taken;
            if (candidates == 0) return false;

            // Uniform pick of the k-th set bit
            std::uniform_int_distribution<int> pick(0, std::popcount(candidates) - 1);
            for (int k = pick(rng); k > 0; --k) candidates &= candidates - 1;
            grid[r][c] = std::countr_zero(candidates) + 1;
        }
    }
    return true;
}

SolveStatus StochasticSolver::solve(Sudoku& sudoku) {
    restart_count = 0;
    if (sudoku.shape() != box_shape || find_puzzle_error(sudoku.init(), box_shape)) {
        return SolveStatus::InvalidPuzzle;
    }

    const Grid& init = sudoku.init();
    const int boxes = box_shape.size();
    Grid grid = init;
    std::vector<int> attempts(boxes, 0);
    int current = 0;

    while (current < boxes) {
        // Walk back from the failed box to the newest box with attempts left,
        // clearing every box passed on the way
        bool retried = false;
        for (int t = current; t >= 0; --t) {
            reset_box(init, grid, t);
            if (attempts[t] >= opts.max_attempts) continue;

            ++attempts[t];
            std::fill(attempts.begin() + t + 1, attempts.end(), 0);
            current = t;
            retried = true;
            break;
        }

        if (!retried) {
            if (++restart_count > opts.max_restarts) return SolveStatus::Unsolvable;
            std::fill(attempts.begin(), attempts.end(), 0);
            current = 0;
            continue;
        }

        while (current < boxes && fill_box(grid, current)) ++current;
    }

    if (!is_valid_solution(grid, box_shape)) return SolveStatus::Unsolvable;
    sudoku.set_solution(std::move(grid));
    return SolveStatus::Solved;
}
