#include "box_shape.hpp"
#include "grid_state.hpp"
#include "propagator.hpp"
#include "trail.hpp"
#include "test_harness.hpp"

#include <vector>

static const Grid kCanonical = {
    {9,0,6,3,4,0,8,1,0},
    {0,5,1,7,0,0,3,0,0},
    {4,7,0,0,9,1,0,0,5},
    {0,0,0,9,0,3,0,0,2},
    {0,0,2,0,8,7,0,0,0},
    {1,0,7,2,0,0,6,0,0},
    {0,8,5,0,0,9,1,0,0},
    {0,3,4,0,6,0,0,0,9},
    {0,1,0,5,0,8,7,0,6},
};

static const Grid kCanonicalSolution = {
    {9,2,6,3,4,5,8,1,7},
    {8,5,1,7,2,6,3,9,4},
    {4,7,3,8,9,1,2,6,5},
    {5,6,8,9,1,3,4,7,2},
    {3,4,2,6,8,7,9,5,1},
    {1,9,7,2,5,4,6,3,8},
    {6,8,5,4,7,9,1,2,3},
    {7,3,4,1,6,2,5,8,9},
    {2,1,9,5,3,8,7,4,6},
};

int main() {
    std::vector<TestCase> cases = {
        {"single_hole_filled", [] {
            Grid puzzle = kCanonicalSolution;
            puzzle[4][4] = 0;
            CellGeometry geo(BoxShape::classic());
            GridState state(puzzle, geo);
            Trail trail;
            Propagator propagator;
            expect(propagator.propagate(state, trail), "propagation failed");
            expect(propagator.forced() == 1, "exactly one forced placement");
            expect(state.value(40) == 8, "hole not filled with 8");
            expect(state.is_solved(), "grid not complete");
        }},
        {"canonical_by_singles", [] {
            CellGeometry geo(BoxShape::classic());
            GridState state(kCanonical, geo);
            Trail trail;
            Propagator propagator;
            expect(propagator.propagate(state, trail), "propagation failed");
            expect(propagator.forced() == 43, "every empty cell should be forced");
            expect(state.to_grid() == kCanonicalSolution, "unexpected grid");

            trail.undo_to(0, state);
            expect(state.to_grid() == kCanonical, "undo did not restore the givens");
        }},
        {"empty_grid_untouched", [] {
            CellGeometry geo({2, 2});
            GridState state(make_empty_grid({2, 2}), geo);
            Trail trail;
            Propagator propagator;
            expect(propagator.propagate(state, trail), "empty grid is not a contradiction");
            expect(propagator.forced() == 0, "nothing is forced on an empty grid");
            expect(trail.empty(), "trail must stay empty");
        }},
        {"contradiction_detected", [] {
            Grid puzzle = make_empty_grid(BoxShape::classic());
            for (int c = 0; c < 8; ++c) puzzle[0][c] = c + 1;
            puzzle[4][8] = 9;
            CellGeometry geo(BoxShape::classic());
            GridState state(puzzle, geo);
            Trail trail;
            Propagator propagator;
            expect(state.available_count(8) == 0, "(0,8) should have no candidates");
            expect(!propagator.propagate(state, trail), "contradiction not reported");
        }},
        {"assignment_wipes_out_peer", [] {
            // (0,3) can only hold 4; putting 4 at (1,3) leaves it nothing
            Grid puzzle = {
                {1,2,3,0},
                {0,0,0,0},
                {0,0,0,0},
                {0,0,0,0},
            };
            CellGeometry geo({2, 2});
            GridState state(puzzle, geo);
            Trail trail;
            expect(!apply_assignment(state, trail, 7, 4), "wipe-out not reported");
            trail.undo_to(0, state);
            expect(state.to_grid() == puzzle, "undo after failure did not restore the grid");
            expect(state.available_count(3) == 1, "candidates of (0,3) not restored");
        }},
    };

    return run_tests("propagator", cases);
}
