#pragma once

#include <cstdint>
#include <vector>

#include "box_shape.hpp"
#include "grid_state.hpp"
#include "propagator.hpp"
#include "sudoku.hpp"
#include "trail.hpp"

struct SearchStats {
    std::uint64_t iterations = 0;
    std::uint64_t branches = 0;
    std::uint64_t backtracks = 0;
    std::uint64_t forced = 0;  // naked singles placed by propagation
};

/**
 * Constraint propagation + backtracking solver.
 *
 * Each loop iteration propagates naked singles, then branches on the MRV cell
 * with the LCV value. Contradictions unwind the trail to the newest choice point
 * and retry its next untried value; the failed value stays banned at that cell
 * until the choice point itself is discarded.
 *
 * One engine solves one puzzle at a time and shares nothing, so independent
 * puzzles can be solved on separate threads with separate engines.
 */
class SearchEngine {
public:
    explicit SearchEngine(BoxShape shape = BoxShape::classic());

    // Fills sudoku's solution only when the result is SolveStatus::Solved.
    SolveStatus solve(Sudoku& sudoku);
    SolveStatus solve(const Grid& input, Grid& result);

    // Stops the search with SolveStatus::Aborted after this many loop iterations.
    // Zero (the default) means no limit.
    void set_iteration_limit(std::uint64_t limit) { iteration_limit = limit; }

    const BoxShape& shape() const { return geometry.shape(); }
    const SearchStats& stats() const { return last_stats; }

private:
    enum class SearchState { Propagating, Branching, Conflict, Backtrack, Solved, Exhausted };

    struct ChoicePoint {
        int cell;
        int value;                // value currently being tried
        CandidateMask remaining;  // siblings not tried yet
        size_t mark;              // trail length before the assignment
    };

    CellGeometry geometry;
    Propagator propagator;
    std::uint64_t iteration_limit = 0;
    SearchStats last_stats;

    SearchState branch(GridState& state, Trail& trail, std::vector<ChoicePoint>& choices);
    SearchState backtrack(GridState& state, Trail& trail, std::vector<ChoicePoint>& choices);
};
