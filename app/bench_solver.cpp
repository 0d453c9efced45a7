#include "search_engine.hpp"
#include "sudoku.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <string>
#include <vector>

// Repeatedly solves a few reference puzzles and prints the mean time per solve.
int main(int argc, char* argv[]) {
    int iterations = 1000;
    if (argc > 1) {
        try {
            iterations = std::stoi(argv[1]);
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\nUsage: " << argv[0] << " [iterations]" << std::endl;
            return -1;
        }
    }
    if (iterations < 1) iterations = 1;

    struct Case {
        const char* name;
        Grid puzzle;
    };

    std::vector<Case> cases = {
        {"canonical", {
            {9,0,6,3,4,0,8,1,0},
            {0,5,1,7,0,0,3,0,0},
            {4,7,0,0,9,1,0,0,5},
            {0,0,0,9,0,3,0,0,2},
            {0,0,2,0,8,7,0,0,0},
            {1,0,7,2,0,0,6,0,0},
            {0,8,5,0,0,9,1,0,0},
            {0,3,4,0,6,0,0,0,9},
            {0,1,0,5,0,8,7,0,6},
        }},
        // "AI Escargot"
        {"ai_escargot", {
            {1,0,0,0,0,7,0,9,0},
            {0,3,0,0,2,0,0,0,8},
            {0,0,9,6,0,0,5,0,0},
            {0,0,5,3,0,0,9,0,0},
            {0,1,0,0,8,0,0,0,2},
            {6,0,0,0,0,4,0,0,0},
            {3,0,0,0,0,0,0,1,0},
            {0,4,0,0,0,0,0,0,7},
            {0,0,7,0,0,0,3,0,0},
        }},
        {"empty", make_empty_grid(BoxShape::classic())},
    };

    SearchEngine engine;
    for (const auto& c : cases) {
        Grid result;
        auto start = std::chrono::high_resolution_clock::now();
        SolveStatus status = SolveStatus::Unsolvable;
        for (int i = 0; i < iterations; ++i) status = engine.solve(c.puzzle, result);
        auto end = std::chrono::high_resolution_clock::now();

        std::chrono::duration<double, std::micro> elapsed = end - start;
        std::cout << c.name << ": " << to_string(status) << ", "
                  << elapsed.count() / iterations << " microseconds/solve, "
                  << engine.stats().backtracks << " backtracks" << std::endl;
    }
    return 0;
}
