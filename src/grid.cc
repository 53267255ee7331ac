#include <sstream>
#include "grid.h"
#include "errors.h"

namespace sudoku {

static std::string position(std::size_t idx)
{
    std::stringstream ss;
    ss << "(" << row_of(idx) + 1 << ", " << col_of(idx) + 1 << ")";
    return ss.str();
}

static std::array<group_t, 3 * kDim> make_groups()
{
    std::array<group_t, 3 * kDim> g;
    for (std::size_t i = 0; i < kDim; i++)
    {
        for (std::size_t j = 0; j < kDim; j++)
        {
            g[i][j] = i * kDim + j;
            g[kDim + i][j] = j * kDim + i;

            std::size_t r = i / kGrid * kGrid + j / kGrid;
            std::size_t c = i % kGrid * kGrid + j % kGrid;
            g[2 * kDim + i][j] = r * kDim + c;
        }
    }
    return g;
}

static std::array<std::array<std::size_t, 20>, kCells> make_peers()
{
    std::array<std::array<std::size_t, 20>, kCells> p;
    for (std::size_t idx = 0; idx < kCells; idx++)
    {
        std::size_t n = 0;
        for (std::size_t other = 0; other < kCells; other++)
        {
            if (other == idx)
                continue;
            if (row_of(other) == row_of(idx) ||
                col_of(other) == col_of(idx) ||
                box_of(other) == box_of(idx))
                p[idx][n++] = other;
        }
    }
    return p;
}

const std::array<group_t, 3 * kDim> &groups()
{
    static const std::array<group_t, 3 * kDim> g = make_groups();
    return g;
}

const std::array<std::array<std::size_t, 20>, kCells> &peers()
{
    static const std::array<std::array<std::size_t, 20>, kCells> p = make_peers();
    return p;
}

grid::grid(const board_t &board)
    : empty_(0)
{
    for (std::size_t r = 0; r < kDim; r++)
    {
        for (std::size_t c = 0; c < kDim; c++)
        {
            int v = board[r][c];
            std::size_t idx = r * kDim + c;
            if (v < 0 || v > kMax)
                __INPUT_THROW("digit " + std::to_string(v) + " out of range at " + position(idx));

            if (v == 0)
            {
                empty_++;
                continue;
            }
            cells_[idx].state = CELL_GIVEN;
            cells_[idx].digit = v;
            cells_[idx].candidates = 0;
        }
    }

    // Givens must be pairwise distinct within every group.
    for (std::size_t idx = 0; idx < kCells; idx++)
    {
        if (cells_[idx].state != CELL_GIVEN)
            continue;
        for (std::size_t p : peers()[idx])
        {
            if (p > idx && cells_[p].state == CELL_GIVEN && cells_[p].digit == cells_[idx].digit)
                __GIVENS_THROW("digit " + std::to_string(cells_[idx].digit) + " given at both "
                               + position(idx) + " and " + position(p));
        }
    }

    for (std::size_t idx = 0; idx < kCells; idx++)
    {
        if (cells_[idx].state != CELL_EMPTY)
            continue;
        for (std::size_t p : peers()[idx])
        {
            if (cells_[p].digit != 0)
                cells_[idx].candidates &= ~digit_bit(cells_[p].digit);
        }
    }

    trail_.reserve(kCells * 21);
}

bool grid::assign(std::size_t idx, int digit, std::vector<std::size_t> *singles)
{
    cell &target = cells_[idx];
    trail_.push_back({ static_cast<std::uint8_t>(idx), static_cast<std::uint8_t>(digit),
                       true, target.candidates });
    target.state = CELL_SOLVED;
    target.digit = digit;
    target.candidates = 0;
    empty_--;

    bool alive = true;
    const candidate_set_t bit = digit_bit(digit);
    for (std::size_t p : peers()[idx])
    {
        cell &peer = cells_[p];
        if (peer.state != CELL_EMPTY || !(peer.candidates & bit))
            continue;

        trail_.push_back({ static_cast<std::uint8_t>(p), static_cast<std::uint8_t>(digit),
                           false, peer.candidates });
        peer.candidates &= ~bit;

        if (peer.candidates == 0)
            alive = false;
        else if (singles && candidate_count(peer.candidates) == 1)
            singles->push_back(p);
    }
    return alive;
}

void grid::undo(std::size_t mark)
{
    while (trail_.size() > mark)
    {
        const undo_record &rec = trail_.back();
        cell &c = cells_[rec.idx];
        if (rec.assignment)
        {
            c.state = CELL_EMPTY;
            c.digit = 0;
            empty_++;
        }
        c.candidates = rec.saved;
        trail_.pop_back();
    }
}

board_t grid::to_board() const
{
    board_t b;
    for (std::size_t idx = 0; idx < kCells; idx++)
        b[row_of(idx)][col_of(idx)] = cells_[idx].digit;
    return b;
}

std::string grid::describe() const
{
    std::stringstream ss;
    for (std::size_t r = 0; r < kDim; r++)
    {
        for (std::size_t c = 0; c < kDim; c++)
        {
            const cell &x = at(r, c);
            ss << x.digit;
            if (x.state == CELL_EMPTY)
            {
                ss << "{";
                for (int d = 1; d <= kMax; d++)
                {
                    if (x.candidates & digit_bit(d))
                        ss << d;
                }
                ss << "}";
            }
            ss << " ";
        }
        ss << "\n";
    }
    return ss.str();
}

} // namespace sudoku
