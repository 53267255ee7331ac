#include <ostream>
#include "solver.h"

namespace sudoku {

solver::solver(const board_t &board, solver_options opts)
    : grid_(board)
    , opts_(opts)
    , limit_(0)
    , sink_(nullptr) {}

std::size_t solver::solve(const solution_sink &sink)
{
    stats_ = search_stats();
    limit_ = opts_.mode == MODE_FIRST ? 1 : opts_.max_solutions;
    sink_ = &sink;

    const std::size_t start = grid_.mark();

    // Givens may already leave singles behind.
    std::vector<std::size_t> singles;
    bool alive = true;
    if (opts_.propagation != PROPAGATE_NONE)
    {
        for (std::size_t idx = 0; idx < kCells; idx++)
        {
            const cell &c = grid_.at(idx);
            if (c.state == CELL_EMPTY && candidate_count(c.candidates) <= 1)
                singles.push_back(idx);
        }
        alive = propagate(singles);
    }

    if (alive)
        stats_.stopped = !search();
    else
        stats_.dead_ends++;

    grid_.undo(start);
    sink_ = nullptr;
    return stats_.solutions;
}

std::vector<board_t> solver::solve_all()
{
    std::vector<board_t> ret;
    solve([&ret](const board_t &b) {
        ret.push_back(b);
        return true;
    });
    return ret;
}

bool solver::search()
{
    stats_.nodes++;
    if (grid_.complete())
        return emit();

    std::size_t idx = select_cell();
    candidate_set_t cands = grid_.at(idx).candidates;
    if (cands == 0)
    {
        stats_.dead_ends++;
        return true;
    }

    for (int d = 1; d <= kMax; d++)
    {
        if (!(cands & digit_bit(d)))
            continue;

        std::size_t mark = grid_.mark();
        stats_.guesses++;

        bool go_on = true;
        if (place(idx, d))
            go_on = search();
        else
            stats_.dead_ends++;

        // NOTE: restore before leaving, stopped or not.
        grid_.undo(mark);
        if (!go_on)
            return false;
    }

    return true;
}

bool solver::emit()
{
    stats_.solutions++;
    bool go_on = (*sink_)(grid_.to_board());

    if (limit_ != 0 && stats_.solutions >= limit_)
        return false;
    return go_on;
}

std::size_t solver::select_cell() const
{
    std::size_t best = kCells;
    int best_count = kMax + 1;

    for (std::size_t idx = 0; idx < kCells; idx++)
    {
        const cell &c = grid_.at(idx);
        if (c.state != CELL_EMPTY)
            continue;

        int n = candidate_count(c.candidates);
        if (n < best_count)
        {
            best = idx;
            best_count = n;
            if (n <= 1)
                break;
        }
    }
    return best;
}

bool solver::place(std::size_t idx, int digit)
{
    if (opts_.propagation == PROPAGATE_NONE)
        return grid_.assign(idx, digit);

    std::vector<std::size_t> singles;
    if (!grid_.assign(idx, digit, &singles))
        return false;
    return propagate(singles);
}

bool solver::propagate(std::vector<std::size_t> &singles)
{
    for (;;)
    {
        while (!singles.empty())
        {
            std::size_t idx = singles.back();
            singles.pop_back();

            const cell &c = grid_.at(idx);
            if (c.state != CELL_EMPTY)
                continue;
            if (c.candidates == 0)
                return false;

            stats_.forced++;
            if (!grid_.assign(idx, lowest_digit(c.candidates), &singles))
                return false;
        }

        if (opts_.propagation != PROPAGATE_HIDDEN)
            return true;

        std::size_t idx;
        int digit;
        switch (find_hidden_single(idx, digit))
        {
        case HIDDEN_NONE:
            return true;
        case HIDDEN_CONTRADICTION:
            return false;
        case HIDDEN_FOUND:
            stats_.forced++;
            if (!grid_.assign(idx, digit, &singles))
                return false;
            break;
        }
    }
}

solver::hidden_t solver::find_hidden_single(std::size_t &idx, int &digit) const
{
    for (const group_t &g : groups())
    {
        candidate_set_t placed = 0;
        for (std::size_t i : g)
        {
            if (grid_.at(i).digit != 0)
                placed |= digit_bit(grid_.at(i).digit);
        }

        for (int d = 1; d <= kMax; d++)
        {
            const candidate_set_t bit = digit_bit(d);
            if (placed & bit)
                continue;

            int homes = 0;
            std::size_t home = kCells;
            for (std::size_t i : g)
            {
                const cell &c = grid_.at(i);
                if (c.state == CELL_EMPTY && (c.candidates & bit))
                {
                    homes++;
                    home = i;
                }
            }

            if (homes == 0)
                return HIDDEN_CONTRADICTION;
            if (homes == 1)
            {
                idx = home;
                digit = d;
                return HIDDEN_FOUND;
            }
        }
    }
    return HIDDEN_NONE;
}

std::ostream &operator<<(std::ostream &os, const search_stats &s)
{
    return os << "nodes=" << s.nodes
              << " guesses=" << s.guesses
              << " forced=" << s.forced
              << " dead_ends=" << s.dead_ends
              << " solutions=" << s.solutions
              << (s.stopped ? " (stopped)" : "");
}

const char *to_string(search_mode_t mode)
{
    switch (mode)
    {
    case MODE_FIRST:    return "first";
    case MODE_ALL:      return "all";
    }
    return "unknown";
}

const char *to_string(propagation_t p)
{
    switch (p)
    {
    case PROPAGATE_NONE:    return "none";
    case PROPAGATE_NAKED:   return "naked";
    case PROPAGATE_HIDDEN:  return "hidden";
    }
    return "unknown";
}

} // namespace sudoku
