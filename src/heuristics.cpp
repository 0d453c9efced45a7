#include "heuristics.hpp"

#include <bit>

PeerPressure peer_pressure(const GridState& state, int cell) {
    PeerPressure pressure;
    for (int peer : state.geometry().peers(cell)) {
        if (!state.is_empty(peer)) continue;
        ++pressure.peers_count;
        pressure.peers_domain_sum += state.available_count(peer);
    }
    return pressure;
}

static bool is_preferred(const PeerPressure& a, const PeerPressure& b) {
    if (a.peers_count != b.peers_count) return a.peers_count > b.peers_count;
    return a.peers_domain_sum < b.peers_domain_sum;
}

Selection select_variable(const GridState& state) {
    Selection best;
    if (state.is_solved()) return best;

    int best_count = state.size() + 1;
    PeerPressure best_pressure;

    for (int i = 0; i < state.cell_count(); ++i) {
        if (!state.is_empty(i)) continue;

        int count = state.available_count(i);
        if (count < best_count) {
            best_count = count;
            best.cell = i;
            best_pressure = peer_pressure(state, i);
        } else if (count == best_count) {
            // Peer pressure is only computed for cells tied on the minimum
            PeerPressure pressure = peer_pressure(state, i);
            if (is_preferred(pressure, best_pressure)) {
                best.cell = i;
                best_pressure = pressure;
            }
        }
    }

    best.kind = best_count == 0 ? Selection::Kind::Unsolvable : Selection::Kind::Cell;
    return best;
}

int least_constraining_value(const GridState& state, int cell, CandidateMask candidates) {
    const auto& peers = state.geometry().peers(cell);
    int best_value = 0;
    int max_score = -1;

    while (candidates) {
        int bit_idx = std::countr_zero(candidates);
        CandidateMask bit = CandidateMask{1} << bit_idx;

        int score = 0;
        for (int peer : peers) {
            if (state.is_empty(peer) && (state.forbidden_candidates(peer) & bit)) ++score;
        }
        if (score >= max_score) {
            max_score = score;
            best_value = bit_idx + 1;
        }

        candidates &= candidates - 1;
    }
    return best_value;
}
