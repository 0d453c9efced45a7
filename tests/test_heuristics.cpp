#include "box_shape.hpp"
#include "grid_state.hpp"
#include "heuristics.hpp"
#include "test_harness.hpp"

#include <vector>

static Selection select_in(const Grid& grid) {
    CellGeometry geo({2, 2});
    GridState state(grid, geo);
    return select_variable(state);
}

static int lcv_in(const Grid& grid, int cell, CandidateMask candidates = 0) {
    CellGeometry geo({2, 2});
    GridState state(grid, geo);
    if (candidates == 0) candidates = state.available_candidates(cell);
    return least_constraining_value(state, cell, candidates);
}

int main() {
    const Grid empty = make_empty_grid({2, 2});

    std::vector<TestCase> cases = {
        {"peer_pressure_counts", [&] {
            CellGeometry geo({2, 2});
            GridState state(empty, geo);
            PeerPressure p = peer_pressure(state, 0);
            expect(p.peers_count == 7, "7 empty peers");
            expect(p.peers_domain_sum == 28, "each peer keeps 4 candidates");

            Grid one = empty;
            one[0][1] = 3;
            GridState partial(one, geo);
            p = peer_pressure(partial, 0);
            expect(p.peers_count == 6, "filled peer not skipped");
            expect(p.peers_domain_sum == 6 * 4 - 4, "peers sharing a unit with (0,1) lose the 3");
        }},
        {"fewest_candidates_first", [] {
            Grid grid = {
                {0,0,0,0},
                {0,0,3,0},
                {0,2,0,0},
                {0,0,0,4},
            };
            Selection s = select_in(grid);
            expect(s.kind == Selection::Kind::Cell, "expected a cell");
            expect(s.cell == 10, "(2,2) is the only cell with one candidate");
        }},
        {"first_cell_on_full_tie", [&] {
            Selection s = select_in(empty);
            expect(s.kind == Selection::Kind::Cell && s.cell == 0, "expected (0,0)");
            Grid grid = empty;
            grid[0][0] = 1;
            expect(select_in(grid).cell == 1, "expected (0,1)");
        }},
        {"more_empty_peers_wins", [] {
            // (0,1) and (1,0) both keep two candidates; (1,0) has one more empty peer
            Grid grid = {
                {1,0,0,0},
                {0,4,0,0},
                {0,0,0,0},
                {0,1,0,0},
            };
            expect(select_in(grid).cell == 4, "expected (1,0)");
        }},
        {"smaller_peer_domains_win", [] {
            Grid grid = {
                {1,2,0,0},
                {0,0,0,0},
                {0,0,0,0},
                {0,0,0,0},
            };
            expect(select_in(grid).cell == 4, "expected (1,0) over (0,2)");
        }},
        {"solved_and_unsolvable", [] {
            Grid full = {
                {1,2,3,4},
                {3,4,1,2},
                {2,1,4,3},
                {4,3,2,1},
            };
            expect(select_in(full).kind == Selection::Kind::Solved, "full grid not reported");

            Grid dead = {
                {1,2,3,0},
                {0,0,0,4},
                {0,0,0,0},
                {0,0,0,0},
            };
            Selection s = select_in(dead);
            expect(s.kind == Selection::Kind::Unsolvable, "wiped-out cell not reported");
            expect(s.cell == 3, "expected the wiped-out cell (0,3)");
        }},
        {"least_constraining_value", [&] {
            Grid grid = {
                {0,0,0,0},
                {0,0,3,0},
                {0,2,0,0},
                {0,0,0,4},
            };
            // 2 and 3 are both already ruled out at four peers; the higher one wins
            expect(lcv_in(grid, 0) == 3, "expected 3");
            expect(lcv_in(grid, 0, 0b1001) == 4, "only 1 and 4 offered");

            Grid single = empty;
            single[2][1] = 2;
            expect(lcv_in(single, 0) == 2, "expected 2");
            expect(lcv_in(empty, 0) == 4, "ties on an empty grid go to the highest value");
        }},
    };

    return run_tests("heuristics", cases);
}
