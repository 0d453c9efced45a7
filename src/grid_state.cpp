#include "grid_state.hpp"

#include <bit>
#include <type_traits>
#include <variant>

GridState::GridState(const Grid& grid, const CellGeometry& geometry)
    : geo(geometry), full(geometry.shape().full_mask()) {
    const int n = geo.size();
    const int count = geo.cell_count();

    cells.assign(count, 0);
    row_taken.assign(n, 0);
    col_taken.assign(n, 0);
    box_taken.assign(n, 0);
    banned.assign(count, 0);
    forbidden.assign(count, 0);
    available.assign(count, 0);

    // Single pass over the givens builds the unit masks
    for (int i = 0; i < count; ++i) {
        int v = grid[geo.row_of(i)][geo.col_of(i)];
        if (v == 0) {
            ++empty_cells;
            continue;
        }
        CandidateMask bit = value_bit(v);
        cells[i] = static_cast<std::uint8_t>(v);
        row_taken[geo.row_of(i)] |= bit;
        col_taken[geo.col_of(i)] |= bit;
        box_taken[geo.box_of(i)] |= bit;
    }

    for (int i = 0; i < count; ++i) {
        if (cells[i] != 0) continue;
        forbidden[i] = (row_taken[geo.row_of(i)] | col_taken[geo.col_of(i)] |
                        box_taken[geo.box_of(i)]) & full;
        available[i] = static_cast<std::uint8_t>(std::popcount(static_cast<CandidateMask>(~forbidden[i] & full)));
    }
}

CandidateMask GridState::unit_mask(UnitKind unit, int index) const {
    switch (unit) {
        case UnitKind::Row: return row_taken[index];
        case UnitKind::Column: return col_taken[index];
        case UnitKind::Box: return box_taken[index];
    }
    return 0;
}

CandidateMask& GridState::unit_ref(UnitKind unit, int index) {
    switch (unit) {
        case UnitKind::Row: return row_taken[index];
        case UnitKind::Column: return col_taken[index];
        case UnitKind::Box: break;
    }
    return box_taken[index];
}

Grid GridState::to_grid() const {
    const int n = geo.size();
    Grid grid(n, std::vector<int>(n, 0));
    for (int i = 0; i < geo.cell_count(); ++i) {
        grid[geo.row_of(i)][geo.col_of(i)] = cells[i];
    }
    return grid;
}

void GridState::place(int cell, int value, Trail& trail) {
    CandidateMask bit = value_bit(value);

    trail.push(CellWrite{cell, cells[cell]});
    if (cells[cell] == 0) --empty_cells;
    cells[cell] = static_cast<std::uint8_t>(value);

    const UnitKind units[] = {UnitKind::Row, UnitKind::Column, UnitKind::Box};
    const int indices[] = {geo.row_of(cell), geo.col_of(cell), geo.box_of(cell)};
    for (int k = 0; k < 3; ++k) {
        CandidateMask& mask = unit_ref(units[k], indices[k]);
        trail.push(UnitMaskWrite{units[k], indices[k], mask});
        mask |= bit;
    }
}

std::uint8_t GridState::forbid(int cell, CandidateMask bit, Trail& trail) {
    if (forbidden[cell] & bit) return available[cell];

    trail.push(CellCacheWrite{cell, forbidden[cell], available[cell]});
    forbidden[cell] |= bit;
    --available[cell];
    return available[cell];
}

void GridState::ban(int cell, int value, Trail& trail) {
    CandidateMask bit = value_bit(value);
    trail.push(LocalBanWrite{cell, banned[cell]});
    banned[cell] |= bit;
    forbid(cell, bit, trail);
}

void GridState::restore(const TrailOp& op) {
    std::visit([this](const auto& entry) {
        using T = std::decay_t<decltype(entry)>;
        if constexpr (std::is_same_v<T, CellWrite>) {
            if (cells[entry.cell] != 0 && entry.previous == 0) ++empty_cells;
            if (cells[entry.cell] == 0 && entry.previous != 0) --empty_cells;
            cells[entry.cell] = entry.previous;
        } else if constexpr (std::is_same_v<T, UnitMaskWrite>) {
            unit_ref(entry.unit, entry.index) = entry.previous;
        } else if constexpr (std::is_same_v<T, CellCacheWrite>) {
            forbidden[entry.cell] = entry.previous_forbidden;
            available[entry.cell] = entry.previous_count;
        } else {
            banned[entry.cell] = entry.previous;
        }
    }, op);
}
