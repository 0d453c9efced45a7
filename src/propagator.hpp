#pragma once

#include <vector>

#include "grid_state.hpp"
#include "trail.hpp"

/**
 * Places `value` at `cell` and narrows every empty peer that did not yet forbid it.
 * Peers whose count drops to exactly one are appended to `singles` when given.
 *
 * @return False as soon as a peer is left without candidates. The entries already
 *         pushed on the trail stay valid, the caller is expected to backtrack.
 */
bool apply_assignment(GridState& state, Trail& trail, int cell, int value,
                      std::vector<int>* singles = nullptr);

// Naked-single propagation: keeps assigning cells with exactly one candidate
// until none is left. Returns false on contradiction (an empty cell with no
// candidates). Hidden singles and subsets are not inferred.
class Propagator {
public:
    bool propagate(GridState& state, Trail& trail);

    // Number of forced assignments made by the last propagate() call.
    int forced() const { return forced_count; }

private:
    std::vector<int> worklist;
    int forced_count = 0;
};
