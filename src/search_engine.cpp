#include "search_engine.hpp"

#include "heuristics.hpp"

SearchEngine::SearchEngine(BoxShape shape) : geometry(shape) {}

SolveStatus SearchEngine::solve(const Grid& input, Grid& result) {
    Sudoku sudoku(input, geometry.shape());
    SolveStatus status = solve(sudoku);
    if (status == SolveStatus::Solved) result = sudoku.solution();
    return status;
}

SolveStatus SearchEngine::solve(Sudoku& sudoku) {
    last_stats = SearchStats{};

    if (sudoku.shape() != geometry.shape() ||
        find_puzzle_error(sudoku.init(), geometry.shape())) {
        return SolveStatus::InvalidPuzzle;
    }

    // State and trail live for this call only
    GridState state(sudoku.init(), geometry);
    Trail trail;
    trail.reserve(static_cast<size_t>(geometry.cell_count()) * 8);
    std::vector<ChoicePoint> choices;

    SearchState current = SearchState::Propagating;
    while (true) {
        switch (current) {
            case SearchState::Propagating:
                ++last_stats.iterations;
                if (iteration_limit != 0 && last_stats.iterations > iteration_limit) {
                    return SolveStatus::Aborted;
                }
                if (!propagator.propagate(state, trail)) {
                    last_stats.forced += propagator.forced();
                    current = SearchState::Conflict;
                    break;
                }
                last_stats.forced += propagator.forced();
                current = state.is_solved() ? SearchState::Solved : SearchState::Branching;
                break;

            case SearchState::Branching:
                current = branch(state, trail, choices);
                break;

            case SearchState::Conflict:
                current = SearchState::Backtrack;
                break;

            case SearchState::Backtrack:
                current = backtrack(state, trail, choices);
                break;

            case SearchState::Solved:
                sudoku.set_solution(state.to_grid());
                return SolveStatus::Solved;

            case SearchState::Exhausted:
                return SolveStatus::Unsolvable;
        }
    }
}

SearchEngine::SearchState SearchEngine::branch(GridState& state, Trail& trail,
                                               std::vector<ChoicePoint>& choices) {
    Selection selection = select_variable(state);
    if (selection.kind == Selection::Kind::Solved) return SearchState::Solved;
    if (selection.kind == Selection::Kind::Unsolvable) return SearchState::Conflict;

    int cell = selection.cell;
    CandidateMask candidates = state.available_candidates(cell);
    int value = least_constraining_value(state, cell, candidates);

    choices.push_back({cell, value, candidates & ~value_bit(value), trail.mark()});
    ++last_stats.branches;

    if (!apply_assignment(state, trail, cell, value)) return SearchState::Conflict;
    return SearchState::Propagating;
}

SearchEngine::SearchState SearchEngine::backtrack(GridState& state, Trail& trail,
                                                  std::vector<ChoicePoint>& choices) {
    while (!choices.empty()) {
        ChoicePoint& choice = choices.back();
        trail.undo_to(choice.mark, state);
        ++last_stats.backtracks;

        if (choice.remaining == 0) {
            // Popping lets the older choice point's undo clear this cell's bans
            choices.pop_back();
            continue;
        }

        state.ban(choice.cell, choice.value, trail);

        int value = least_constraining_value(state, choice.cell, choice.remaining);
        choice.remaining &= ~value_bit(value);
        choice.value = value;
        choice.mark = trail.mark();

        if (apply_assignment(state, trail, choice.cell, value)) return SearchState::Propagating;
    }
    return SearchState::Exhausted;
}
