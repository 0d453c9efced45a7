#include "search_engine.hpp"
#include "sudoku.hpp"
#include "test_harness.hpp"

#include <iostream>
#include <sstream>
#include <string>
#include <utility>
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

// "AI Escargot" - widely considered one of the hardest Sudokus for computers
static const Grid kEscargot = {
    {1,0,0,0,0,7,0,9,0},
    {0,3,0,0,2,0,0,0,8},
    {0,0,9,6,0,0,5,0,0},
    {0,0,5,3,0,0,9,0,0},
    {0,1,0,0,8,0,0,0,2},
    {6,0,0,0,0,4,0,0,0},
    {3,0,0,0,0,0,0,1,0},
    {0,4,0,0,0,0,0,0,7},
    {0,0,7,0,0,0,3,0,0},
};

static void expect_givens_kept(const Grid& puzzle, const Grid& solution) {
    for (size_t r = 0; r < puzzle.size(); ++r) {
        for (size_t c = 0; c < puzzle[r].size(); ++c) {
            if (puzzle[r][c] != 0) {
                expect(solution[r][c] == puzzle[r][c],
                       "given at (" + std::to_string(r) + "," + std::to_string(c) + ") changed");
            }
        }
    }
}

static void solve_empty(BoxShape shape) {
    SearchEngine engine(shape);
    Sudoku sudoku(make_empty_grid(shape), shape);
    expect(engine.solve(sudoku) == SolveStatus::Solved, shape.to_string() + " empty board not solved");
    expect(sudoku.check(), shape.to_string() + " solution fails the checker");
}

int main() {
    std::vector<TestCase> cases = {
        {"canonical_fixture", [] {
            SearchEngine engine;
            Sudoku sudoku(kCanonical);
            expect(engine.solve(sudoku) == SolveStatus::Solved, "canonical puzzle not solved");
            expect(sudoku.solution() == kCanonicalSolution, "unexpected solution grid");
            expect(sudoku.init() == kCanonical, "givens were modified");
        }},
        {"canonical_needs_no_branching", [] {
            SearchEngine engine;
            Grid result;
            expect(engine.solve(kCanonical, result) == SolveStatus::Solved, "not solved");
            expect(engine.stats().branches == 0, "naked singles alone should solve it");
            expect(engine.stats().forced == 43, "expected one forced placement per empty cell");
        }},
        {"hard_puzzle", [] {
            SearchEngine engine;
            Grid result;
            expect(engine.solve(kEscargot, result) == SolveStatus::Solved, "escargot not solved");
            expect(is_valid_solution(result, BoxShape::classic()), "escargot solution invalid");
            expect_givens_kept(kEscargot, result);
            expect(engine.stats().backtracks > 0, "escargot should need backtracking");
        }},
        {"determinism", [] {
            SearchEngine first;
            SearchEngine second;
            Grid a, b, c;
            expect(first.solve(kEscargot, a) == SolveStatus::Solved, "first solve failed");
            expect(second.solve(kEscargot, b) == SolveStatus::Solved, "second solve failed");
            expect(first.solve(kEscargot, c) == SolveStatus::Solved, "engine reuse failed");
            expect(a == b && a == c, "same input produced different solutions");
        }},
        {"empty_boards", [] {
            solve_empty(BoxShape::classic());
            solve_empty(BoxShape::six());
            solve_empty({3, 2});
            solve_empty({2, 2});
            solve_empty({2, 4});
            solve_empty({1, 1});
        }},
        {"six_by_six_puzzle", [] {
            Grid puzzle = {
                {6,0,0,5,0,1},
                {0,0,1,6,0,2},
                {0,1,3,0,5,0},
                {0,5,6,0,0,3},
                {3,6,5,1,2,0},
                {1,2,4,0,6,5},
            };
            Grid expected = {
                {6,4,2,5,3,1},
                {5,3,1,6,4,2},
                {4,1,3,2,5,6},
                {2,5,6,4,1,3},
                {3,6,5,1,2,4},
                {1,2,4,3,6,5},
            };
            SearchEngine engine(BoxShape::six());
            Grid result;
            expect(engine.solve(puzzle, result) == SolveStatus::Solved, "6x6 puzzle not solved");
            expect(result == expected, "unexpected 6x6 solution");
        }},
        {"duplicate_givens_rejected", [] {
            Grid puzzle = make_empty_grid(BoxShape::classic());
            puzzle[0][0] = 5;
            puzzle[0][1] = 5;
            SearchEngine engine;
            Grid result;
            expect(engine.solve(puzzle, result) == SolveStatus::InvalidPuzzle,
                   "duplicate in a row must be rejected");
            expect(result.empty(), "no solution may be returned");
        }},
        {"malformed_input_rejected", [] {
            SearchEngine engine;
            Grid result;
            Grid short_rows(9, std::vector<int>(8, 0));
            expect(engine.solve(short_rows, result) == SolveStatus::InvalidPuzzle, "8 columns accepted");
            Grid out_of_range = make_empty_grid(BoxShape::classic());
            out_of_range[4][4] = 10;
            expect(engine.solve(out_of_range, result) == SolveStatus::InvalidPuzzle, "value 10 accepted");

            Sudoku six(make_empty_grid(BoxShape::six()), BoxShape::six());
            expect(engine.solve(six) == SolveStatus::InvalidPuzzle, "shape mismatch accepted");
        }},
        {"contradiction_found_by_propagation", [] {
            // (0,8) can only be 9, but column 8 already holds a 9
            Grid puzzle = make_empty_grid(BoxShape::classic());
            for (int c = 0; c < 8; ++c) puzzle[0][c] = c + 1;
            puzzle[4][8] = 9;
            SearchEngine engine;
            Sudoku sudoku(puzzle);
            expect(engine.solve(sudoku) == SolveStatus::Unsolvable, "expected Unsolvable");
            expect(sudoku.solution() == puzzle, "solution field must stay untouched");
        }},
        {"contradiction_found_by_search", [] {
            // No cell runs out of candidates until the search starts guessing
            Grid puzzle = {
                {0,2,0,0},
                {0,0,0,1},
                {0,0,0,0},
                {0,0,2,0},
            };
            SearchEngine engine({2, 2});
            Grid result;
            expect(engine.solve(puzzle, result) == SolveStatus::Unsolvable, "expected Unsolvable");
            expect(engine.stats().branches > 0, "search should have branched");
        }},
        {"iteration_limit_aborts", [] {
            SearchEngine engine;
            engine.set_iteration_limit(1);
            Grid result;
            expect(engine.solve(make_empty_grid(BoxShape::classic()), result) == SolveStatus::Aborted,
                   "empty board needs more than one iteration");
            engine.set_iteration_limit(0);
            expect(engine.solve(make_empty_grid(BoxShape::classic()), result) == SolveStatus::Solved,
                   "unlimited solve failed");
        }},
        {"validity_checker", [] {
            BoxShape shape = BoxShape::classic();
            expect(is_valid_solution(kCanonicalSolution, shape), "known solution rejected");
            expect(is_valid_solution(kCanonicalSolution, shape) ==
                       is_valid_solution(kCanonicalSolution, shape), "checker not idempotent");

            Grid swapped = kCanonicalSolution;
            std::swap(swapped[0][0], swapped[0][1]);
            expect(!is_valid_solution(swapped, shape), "swapped cells accepted");

            Grid with_hole = kCanonicalSolution;
            with_hole[8][8] = 0;
            expect(!is_valid_solution(with_hole, shape), "empty cell accepted");
            expect(!is_valid_solution(kCanonicalSolution, BoxShape::six()), "wrong shape accepted");

            // Latin square whose boxes repeat values
            Grid latin(9, std::vector<int>(9));
            for (int r = 0; r < 9; ++r)
                for (int c = 0; c < 9; ++c) latin[r][c] = (r + c) % 9 + 1;
            expect(!is_valid_solution(latin, shape), "box duplicates accepted");
        }},
        {"puzzle_errors_described", [] {
            BoxShape shape = BoxShape::classic();
            expect(!find_puzzle_error(kCanonical, shape), "canonical puzzle flagged");
            Grid dup = make_empty_grid(shape);
            dup[0][0] = 3;
            dup[2][2] = 3;
            auto error = find_puzzle_error(dup, shape);
            expect(error && error->find("duplicate") != std::string::npos, "box duplicate not described");
        }},
        {"print_grid_layout", [] {
            std::ostringstream out;
            print_grid(kCanonical, BoxShape::classic(), out);
            std::string text = out.str();
            expect(text.rfind("9 . 6 | 3 4 . | 8 1 . \n", 0) == 0, "unexpected first row: " + text);
            expect(text.find("------+-------+-------\n") != std::string::npos, "missing separator");
        }},
    };

    return run_tests("sudoku_solver", cases);
}
