#pragma once

#include <cstddef>
#include <cstdint>
#include <variant>
#include <vector>

#include "box_shape.hpp"

class GridState;

enum class UnitKind : std::uint8_t { Row, Column, Box };

// Every entry stores the value it overwrote so undo restores it exactly.
struct CellWrite {
    int cell;
    std::uint8_t previous;
};

struct UnitMaskWrite {
    UnitKind unit;
    int index;
    CandidateMask previous;
};

struct CellCacheWrite {
    int cell;
    CandidateMask previous_forbidden;
    std::uint8_t previous_count;
};

struct LocalBanWrite {
    int cell;
    CandidateMask previous;
};

using TrailOp = std::variant<CellWrite, UnitMaskWrite, CellCacheWrite, LocalBanWrite>;

/**
 * Append-only log of reversible GridState mutations.
 * Backtracking undoes entries in reverse order down to a recorded mark,
 * so no copy of the search state is ever taken.
 */
class Trail {
public:
    size_t mark() const { return ops.size(); }
    size_t size() const { return ops.size(); }
    bool empty() const { return ops.empty(); }

    void push(const TrailOp& op) { ops.push_back(op); }
    void reserve(size_t n) { ops.reserve(n); }
    void clear() { ops.clear(); }

    // Undoes every entry recorded after `mark`, newest first.
    void undo_to(size_t mark, GridState& state);

private:
    std::vector<TrailOp> ops;
};
