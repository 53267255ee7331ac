/// File batch.h
/// ============
/// Copyright 2020 Cloud-fantasy team
/// Many puzzles, one per line, solved concurrently on a thread pool and
/// reported in input order.
#ifndef SUDOKU_BATCH_H
#define SUDOKU_BATCH_H

#include <istream>
#include <string>
#include <vector>
#include "solver.h"
#include "thread_pool.h"

namespace sudoku {

struct batch_result {
    enum status_t {
        SOLVED,
        NO_SOLUTION,
        INVALID
    };

    status_t status = NO_SOLUTION;

    /// First solution found, valid when SOLVED.
    board_t solution;

    /// Reason when INVALID.
    std::string error;

    search_stats stats;
};

/// Solve a single puzzle line. Input errors become an INVALID result.
batch_result solve_line(const std::string &line, const solver_options &opts);

/// Solve every non-blank line of [in] on [pool].
std::vector<batch_result> solve_batch(std::istream &in, const solver_options &opts, thread_pool &pool);

/// The output line of one result.
std::string result_line(const batch_result &res);

} // namespace sudoku

#endif
