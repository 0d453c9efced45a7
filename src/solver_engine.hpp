#pragma once

#include <string>
#include <utility>
#include <variant>

#include "search_engine.hpp"
#include "stochastic_solver.hpp"
#include "sudoku.hpp"

enum class SolverKind { Dfs, Stochastic };

// "dfs" or "stochastic"; throws std::invalid_argument otherwise.
SolverKind parse_solver_kind(const std::string& name);
const char* to_string(SolverKind kind);

// Uniform front for the available algorithms.
class SolverEngine {
public:
    explicit SolverEngine(SearchEngine engine) : algorithm(std::move(engine)) {}
    explicit SolverEngine(StochasticSolver solver) : algorithm(std::move(solver)) {}

    static SolverEngine create(SolverKind kind, BoxShape shape,
                               const StochasticOptions& options = {});

    SolveStatus solve(Sudoku& sudoku);
    SolverKind kind() const;

    // Search statistics of the last solve, only for SolverKind::Dfs.
    const SearchStats* search_stats() const;

private:
    std::variant<SearchEngine, StochasticSolver> algorithm;
};
