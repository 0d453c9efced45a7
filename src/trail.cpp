#include "trail.hpp"

#include "grid_state.hpp"

void Trail::undo_to(size_t mark, GridState& state) {
    while (ops.size() > mark) {
        state.restore(ops.back());
        ops.pop_back();
    }
}
