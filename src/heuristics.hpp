#pragma once

#include "grid_state.hpp"

struct PeerPressure {
    int peers_count = 0;       // still-empty row/column/box neighbours
    int peers_domain_sum = 0;  // sum of their available-candidate counts
};

PeerPressure peer_pressure(const GridState& state, int cell);

struct Selection {
    enum class Kind { Cell, Solved, Unsolvable };

    Kind kind = Kind::Solved;
    int cell = -1;
};

/**
 * Minimum-remaining-values cell choice.
 * Ties on the candidate count go to the cell with more empty peers, then to the
 * one whose peers have the smaller summed domain, then to the lowest index.
 */
Selection select_variable(const GridState& state);

/**
 * Least-constraining value among `candidates` for an empty cell: the value already
 * forbidden by the most empty peers (placing it takes the fewest options away).
 * Values are scanned upwards and ties go to the later one, i.e. the highest value.
 */
int least_constraining_value(const GridState& state, int cell, CandidateMask candidates);
