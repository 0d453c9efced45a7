#include "propagator.hpp"

#include <bit>

bool apply_assignment(GridState& state, Trail& trail, int cell, int value,
                      std::vector<int>* singles) {
    state.place(cell, value, trail);

    const CandidateMask bit = value_bit(value);
    for (int peer : state.geometry().peers(cell)) {
        if (!state.is_empty(peer) || (state.forbidden_candidates(peer) & bit)) continue;

        std::uint8_t left = state.forbid(peer, bit, trail);
        if (left == 0) return false;
        if (left == 1 && singles) singles->push_back(peer);
    }
    return true;
}

bool Propagator::propagate(GridState& state, Trail& trail) {
    worklist.clear();
    forced_count = 0;

    // 1. Seed from a full scan of the empty cells
    for (int i = 0; i < state.cell_count(); ++i) {
        if (!state.is_empty(i)) continue;
        if (state.available_count(i) == 0) return false;
        if (state.available_count(i) == 1) worklist.push_back(i);
    }

    // 2. Drain; a queued cell may have been filled or emptied out since
    while (!worklist.empty()) {
        int cell = worklist.back();
        worklist.pop_back();

        if (!state.is_empty(cell)) continue;
        if (state.available_count(cell) == 0) return false;
        if (state.available_count(cell) != 1) continue;

        int value = std::countr_zero(state.available_candidates(cell)) + 1;
        ++forced_count;
        if (!apply_assignment(state, trail, cell, value, &worklist)) return false;
    }
    return true;
}
