/// File grid.h
/// ===========
/// Copyright 2020 Cloud-fantasy team
/// The 9x9 board together with the candidate set of every empty cell.
/// Assignments are recorded on a trail so that any prefix of the search
/// can be rolled back exactly.
#ifndef SUDOKU_GRID_H
#define SUDOKU_GRID_H

#include <string>
#include <vector>
#include "common.h"

namespace sudoku {

enum cell_state_t {
    CELL_EMPTY,
    CELL_GIVEN,
    CELL_SOLVED
};

struct cell {
    cell_state_t state = CELL_EMPTY;

    /// 0 while the cell is empty.
    int digit = 0;

    /// Only meaningful while the cell is empty.
    candidate_set_t candidates = kAllCandidates;

    bool operator==(const cell &o) const
    {
        return state == o.state && digit == o.digit && candidates == o.candidates;
    }
};

/// Index of the cells of one row, column or box.
typedef std::array<std::size_t, kDim> group_t;

/// The 27 constraint groups: rows 0-8, columns 9-17, boxes 18-26.
const std::array<group_t, 3 * kDim> &groups();

/// The 20 cells sharing a group with each cell.
const std::array<std::array<std::size_t, 20>, kCells> &peers();

class grid {
public:
    /// Build from parsed digits. Throws _malformed_input_error for a value
    /// outside 0-9 and _contradictory_givens_error when two givens collide.
    explicit grid(const board_t &board);

    const cell &at(std::size_t idx) const { return cells_[idx]; }
    const cell &at(std::size_t r, std::size_t c) const { return cells_[r * kDim + c]; }

    /// Number of cells that are still empty.
    std::size_t empty_count() const { return empty_; }
    bool complete() const { return empty_ == 0; }

    /// Solve the empty cell [idx] with [digit], a member of its candidates,
    /// and strike [digit] from its peers. Peers left with a single
    /// candidate are appended to [singles] when given. Returns false when
    /// some peer has no candidate left; the grid is still fully updated
    /// and undo() restores it.
    bool assign(std::size_t idx, int digit, std::vector<std::size_t> *singles = nullptr);

    /// Current trail position.
    std::size_t mark() const { return trail_.size(); }

    /// Roll back every change made after [mark].
    void undo(std::size_t mark);

    board_t to_board() const;

    /// Digit grid with the candidates of empty cells in braces.
    std::string describe() const;

private:
    struct undo_record {
        std::uint8_t idx;
        std::uint8_t digit;
        /// True for the assignment itself, false for a struck candidate.
        bool assignment;
        candidate_set_t saved;
    };

    std::array<cell, kCells> cells_;
    std::vector<undo_record> trail_;
    std::size_t empty_;
};

} // namespace sudoku

#endif
