/// File common.h
/// =============
/// Copyright 2020 Cloud-fantasy team
/// Board dimensions and the candidate bitset shared by every module.
#ifndef SUDOKU_COMMON_H
#define SUDOKU_COMMON_H

#include <array>
#include <bitset>
#include <cstddef>
#include <cstdint>

namespace sudoku {

/// Side of the board.
const std::size_t kDim = 9;

/// Side of a box.
const std::size_t kGrid = 3;

/// Number of cells.
const std::size_t kCells = kDim * kDim;

/// Largest digit.
const int kMax = 9;

/// Row-major 9x9 digits, 0 for a blank cell.
typedef std::array<std::array<int, kDim>, kDim> board_t;

/// Bit (d - 1) is set when digit d is still allowed.
typedef std::uint16_t candidate_set_t;

const candidate_set_t kAllCandidates = 0x1FF;

inline candidate_set_t digit_bit(int d)
{
    return static_cast<candidate_set_t>(1u << (d - 1));
}

inline int candidate_count(candidate_set_t s)
{
    return static_cast<int>(std::bitset<kMax>(s).count());
}

/// Smallest digit of a non-empty set.
inline int lowest_digit(candidate_set_t s)
{
    int d = 1;
    while (!(s & 1u))
    {
        s >>= 1;
        d++;
    }
    return d;
}

inline std::size_t row_of(std::size_t idx)  { return idx / kDim; }
inline std::size_t col_of(std::size_t idx)  { return idx % kDim; }
inline std::size_t box_of(std::size_t idx)
{
    return row_of(idx) / kGrid * kGrid + col_of(idx) / kGrid;
}

} // namespace sudoku

#endif
