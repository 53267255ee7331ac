/// File solver.h
/// =============
/// Copyright 2020 Cloud-fantasy team
/// Depth-first search over a grid. The cell with the fewest candidates is
/// branched on first, digits are tried in ascending order and every
/// solution reached is handed to a sink as soon as it is found.
#ifndef SUDOKU_SOLVER_H
#define SUDOKU_SOLVER_H

#include <functional>
#include <iosfwd>
#include <string>
#include <vector>
#include "grid.h"

namespace sudoku {

enum search_mode_t {
    MODE_FIRST,
    MODE_ALL
};

/// What is deduced after each assignment before branching again.
enum propagation_t {
    /// Plain backtracking.
    PROPAGATE_NONE,
    /// Cells left with one candidate are solved at once.
    PROPAGATE_NAKED,
    /// As above, plus digits with a single home in a row, column or box.
    PROPAGATE_HIDDEN
};

struct solver_options {
    search_mode_t mode = MODE_ALL;

    /// 0 for no limit. MODE_FIRST behaves as a limit of 1.
    std::size_t max_solutions = 0;

    propagation_t propagation = PROPAGATE_NAKED;
};

struct search_stats {
    /// Branch points visited.
    std::size_t nodes = 0;
    /// Tentative assignments.
    std::size_t guesses = 0;
    /// Assignments made by propagation.
    std::size_t forced = 0;
    std::size_t dead_ends = 0;
    std::size_t solutions = 0;
    /// The search ended before the tree was exhausted.
    bool stopped = false;
};

std::ostream &operator<<(std::ostream &os, const search_stats &s);

/// Receives each solution. Returning false ends the search.
typedef std::function<bool(const board_t &)> solution_sink;

class solver {
public:
    /// Throws what grid's constructor throws.
    explicit solver(const board_t &board, solver_options opts = solver_options());

    /// Run the search, feeding [sink]. Returns the number of solutions
    /// emitted. The grid is back in its initial state afterwards, so the
    /// search may be run again.
    std::size_t solve(const solution_sink &sink);

    /// Collect the solutions the options allow.
    std::vector<board_t> solve_all();

    const search_stats &stats() const { return stats_; }
    const solver_options &options() const { return opts_; }
    const grid &current() const { return grid_; }

private:
    /// Returns false once the search must stop.
    bool search();
    bool emit();

    /// MRV with row-major tie-break.
    std::size_t select_cell() const;

    /// Assign and run the configured propagation. False on contradiction.
    bool place(std::size_t idx, int digit);
    bool propagate(std::vector<std::size_t> &singles);

    enum hidden_t { HIDDEN_NONE, HIDDEN_FOUND, HIDDEN_CONTRADICTION };
    hidden_t find_hidden_single(std::size_t &idx, int &digit) const;

    grid grid_;
    solver_options opts_;
    search_stats stats_;
    std::size_t limit_;
    const solution_sink *sink_;
};

const char *to_string(search_mode_t mode);
const char *to_string(propagation_t p);

} // namespace sudoku

#endif
