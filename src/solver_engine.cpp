#include "solver_engine.hpp"

#include <stdexcept>

SolverKind parse_solver_kind(const std::string& name) {
    if (name == "dfs") return SolverKind::Dfs;
    if (name == "stochastic") return SolverKind::Stochastic;
    throw std::invalid_argument("unknown solver '" + name + "', expected dfs or stochastic");
}

const char* to_string(SolverKind kind) {
    return kind == SolverKind::Dfs ? "dfs" : "stochastic";
}

SolverEngine SolverEngine::create(SolverKind kind, BoxShape shape,
                                  const StochasticOptions& options) {
    if (kind == SolverKind::Stochastic) return SolverEngine(StochasticSolver(shape, options));
    return SolverEngine(SearchEngine(shape));
}

SolveStatus SolverEngine::solve(Sudoku& sudoku) {
    return std::visit([&sudoku](auto& alg) { return alg.solve(sudoku); }, algorithm);
}

SolverKind SolverEngine::kind() const {
    return std::holds_alternative<SearchEngine>(algorithm) ? SolverKind::Dfs
                                                           : SolverKind::Stochastic;
}

const SearchStats* SolverEngine::search_stats() const {
    if (const auto* engine = std::get_if<SearchEngine>(&algorithm)) return &engine->stats();
    return nullptr;
}
