#pragma once

#include <cstdint>
#include <vector>

#include "box_shape.hpp"
#include "sudoku.hpp"
#include "trail.hpp"

/**
 * Search state of one puzzle: cell values, the values taken in every unit,
 * and per empty cell a cached forbidden mask and available-candidate count.
 *
 * Every mutating call records the overwritten data on a Trail first;
 * Trail::undo_to() feeds the entries back through restore().
 * The geometry must outlive the state.
 */
class GridState {
public:
    // Givens are expected to be consistent (see find_puzzle_error()).
    GridState(const Grid& grid, const CellGeometry& geometry);

    const CellGeometry& geometry() const { return geo; }
    int size() const { return geo.size(); }
    int cell_count() const { return geo.cell_count(); }

    int value(int cell) const { return cells[cell]; }
    bool is_empty(int cell) const { return cells[cell] == 0; }
    int empty_count() const { return empty_cells; }
    bool is_solved() const { return empty_cells == 0; }

    CandidateMask unit_mask(UnitKind unit, int index) const;
    CandidateMask local_ban(int cell) const { return banned[cell]; }

    // Only meaningful for empty cells.
    CandidateMask forbidden_candidates(int cell) const { return forbidden[cell]; }
    CandidateMask available_candidates(int cell) const { return ~forbidden[cell] & full; }
    std::uint8_t available_count(int cell) const { return available[cell]; }

    Grid to_grid() const;

    // Writes the value and marks it taken in the row, column and box of the cell.
    // Peer caches are left to the caller (see apply_assignment()).
    void place(int cell, int value, Trail& trail);

    // Adds `bit` to the forbidden mask of an empty cell and returns the new count.
    // No-op when the bit was already forbidden.
    std::uint8_t forbid(int cell, CandidateMask bit, Trail& trail);

    // Excludes a value that already failed at this cell for the rest of the branch.
    void ban(int cell, int value, Trail& trail);

    void restore(const TrailOp& op);

private:
    const CellGeometry& geo;
    CandidateMask full;
    int empty_cells = 0;

    std::vector<std::uint8_t> cells;
    std::vector<CandidateMask> row_taken;
    std::vector<CandidateMask> col_taken;
    std::vector<CandidateMask> box_taken;

    std::vector<CandidateMask> banned;
    std::vector<CandidateMask> forbidden;
    std::vector<std::uint8_t> available;

    CandidateMask& unit_ref(UnitKind unit, int index);
};
