#include <future>
#include "batch.h"
#include "board_io.h"
#include "errors.h"

namespace sudoku {

batch_result solve_line(const std::string &line, const solver_options &opts)
{
    batch_result res;

    try
    {
        // One output line per puzzle, so only the first solution is searched for.
        solver_options first = opts;
        first.mode = MODE_FIRST;

        solver s{ parse_board(line), first };
        s.solve([&res](const board_t &b) {
            res.solution = b;
            return false;
        });

        res.stats = s.stats();
        res.status = res.stats.solutions > 0 ? batch_result::SOLVED : batch_result::NO_SOLUTION;
    }
    catch (_malformed_input_error &e)
    {
        res.status = batch_result::INVALID;
        res.error = e.what();
    }
    catch (_contradictory_givens_error &e)
    {
        res.status = batch_result::INVALID;
        res.error = e.what();
    }

    return res;
}

std::vector<batch_result> solve_batch(std::istream &in, const solver_options &opts, thread_pool &pool)
{
    // Futures are kept in input order.
    std::vector<std::future<batch_result>> pending;

    process_file_by_line(in, [&pool, &pending, &opts](const std::string &line) {
        if (line.find_first_not_of(" \t\r") == std::string::npos)
            return;

        pending.emplace_back(pool.add_task(solve_line, line, opts));
    });

    std::vector<batch_result> ret;
    ret.reserve(pending.size());
    for (auto &f : pending)
        ret.push_back(f.get());
    return ret;
}

std::string result_line(const batch_result &res)
{
    switch (res.status)
    {
    case batch_result::SOLVED:      return serialize_board(res.solution);
    case batch_result::NO_SOLUTION: return "no solution";
    case batch_result::INVALID:     return "invalid input: " + res.error;
    }
    return "";
}

} // namespace sudoku
