#pragma once

#include <cstdint>
#include <limits>
#include <string>
#include <vector>

// One bit per value, bit (v - 1) for value v.
// Widen this type to support grids larger than kMaxGridSize.
using CandidateMask = std::uint32_t;

constexpr int kMaxGridSize = std::numeric_limits<CandidateMask>::digits;

struct BoxShape {
    int box_rows = 3;
    int box_cols = 3;

    int size() const { return box_rows * box_cols; }
    int cell_count() const { return size() * size(); }
    int boxes_across() const { return size() / box_cols; }
    int boxes_down() const { return size() / box_rows; }

    int box_index(int r, int c) const {
        return (r / box_rows) * boxes_across() + (c / box_cols);
    }

    CandidateMask full_mask() const {
        return size() == kMaxGridSize ? ~CandidateMask{0}
                                      : static_cast<CandidateMask>((CandidateMask{1} << size()) - 1);
    }

    // Throws std::invalid_argument for shapes the engine cannot represent.
    void validate() const;
    std::string to_string() const;

    static BoxShape classic() { return {3, 3}; }
    static BoxShape six() { return {2, 3}; }
    // Accepts "3x3", "2x3", ... Throws std::invalid_argument on bad input.
    static BoxShape parse(const std::string& text);

    bool operator==(const BoxShape&) const = default;
};

inline CandidateMask value_bit(int value) {
    return CandidateMask{1} << (value - 1);
}

// Per-cell unit indices and deduplicated peers, computed once per shape.
class CellGeometry {
public:
    explicit CellGeometry(const BoxShape& shape);

    const BoxShape& shape() const { return box_shape; }
    int size() const { return box_shape.size(); }
    int cell_count() const { return box_shape.cell_count(); }

    int row_of(int cell) const { return cell / box_shape.size(); }
    int col_of(int cell) const { return cell % box_shape.size(); }
    int box_of(int cell) const { return box_indices[cell]; }
    const std::vector<int>& peers(int cell) const { return peer_lists[cell]; }

private:
    BoxShape box_shape;
    std::vector<int> box_indices;
    std::vector<std::vector<int>> peer_lists;
};
