#pragma once

#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "box_shape.hpp"
#include "sudoku.hpp"

struct StochasticOptions {
    int max_attempts = 10;      // tries per box before stepping back to the previous box
    int max_restarts = 10000;   // full restarts before giving up
    std::optional<std::uint64_t> seed;  // std::random_device when empty
};

// Decimal seed from the command line; throws std::invalid_argument for signs,
// non-digits and values beyond 64 bits.
std::uint64_t parse_seed(const std::string& text);

/**
 * Randomized local repair: fills the grid box by box with random legal values.
 * A cell without any legal value resets the current box and retries it; a box
 * that used up its attempts is reset too and the search steps back to the
 * previous box. Finds *a* solution, not necessarily the one the DFS engine finds.
 */
class StochasticSolver {
public:
    explicit StochasticSolver(BoxShape shape = BoxShape::classic(),
                              StochasticOptions options = {});

    SolveStatus solve(Sudoku& sudoku);

    const BoxShape& shape() const { return box_shape; }
    int restarts() const { return restart_count; }

private:
    BoxShape box_shape;
    StochasticOptions opts;
    std::mt19937_64 rng;
    int restart_count = 0;

    void reset_box(const Grid& init, Grid& grid, int box) const;
    bool fill_box(Grid& grid, int box);
};
