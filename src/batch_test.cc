#include <cassert>
#include <sstream>
#include <string>
#include <vector>

#include "batch.h"
#include "board_io.h"
#include "thread_pool.h"

using namespace sudoku;

void pool_simple()
{
    thread_pool pool(4);
    assert(pool.size() == 4);

    auto addition = [](int a, int b) { return a + b; };

    std::vector<std::pair<int, int>> params{
        {23, 23},
        {10, 23},
        {33, 3}
    };
    std::vector<int> expected{
        23 + 23,
        10 + 23,
        33 + 3
    };
    std::vector<std::future<int>> res;

    for (auto &p : params)
    {
        res.push_back(pool.add_task(addition, p.first, p.second));
    }

    for (std::size_t i = 0; i < res.size(); i++)
    {
        assert(expected[i] == res[i].get() && "batch_test.cc: pool_simple() failed");
    }
}

void pool_default_size()
{
    thread_pool pool(0);
    assert(pool.size() >= 1);
}

void pool_drains_on_exit()
{
    std::vector<std::future<int>> res;
    {
        thread_pool pool(1);
        for (int i = 0; i < 16; i++)
            res.push_back(pool.add_task([](int x) { return x * x; }, i));
    }

    for (int i = 0; i < 16; i++)
        assert(res[i].get() == i * i);
}

void single_lines()
{
    solver_options opts;

    batch_result ok = solve_line(
        "040610925051000746926000813080050071090100032013470598000000189162800357809001264", opts);
    assert(ok.status == batch_result::SOLVED);
    assert(result_line(ok) ==
        "748613925351928746926745813284359671597186432613472598435267189162894357879531264");
    assert(ok.stats.solutions == 1);

    batch_result none = solve_line(
        "123456780000000009000000000000000000000000000000000000000000000000000000000000000", opts);
    assert(none.status == batch_result::NO_SOLUTION);
    assert(result_line(none) == "no solution");

    batch_result shortline = solve_line("12345", opts);
    assert(shortline.status == batch_result::INVALID);
    assert(result_line(shortline).find("invalid input: ") == 0);

    batch_result clash = solve_line(
        "550000000000000000000000000000000000000000000000000000000000000000000000000000000", opts);
    assert(clash.status == batch_result::INVALID);
}

void blank_line_stops_at_first()
{
    // Enumerating every completion of an empty grid would never finish.
    solver_options opts;
    assert(opts.mode == MODE_ALL && opts.max_solutions == 0);

    batch_result blank = solve_line(std::string(kCells, '0'), opts);
    assert(blank.status == batch_result::SOLVED);
    assert(blank.stats.solutions == 1);
    assert(result_line(blank).size() == kCells);
    assert(result_line(blank).find('0') == std::string::npos);

    std::stringstream in{ std::string(kCells, '0') + "\n" + std::string(kCells, '0') + "\n" };
    thread_pool pool(2);
    std::vector<batch_result> results = solve_batch(in, opts, pool);
    assert(results.size() == 2);
    assert(results[0].status == batch_result::SOLVED && results[1].status == batch_result::SOLVED);
}

void many()
{
    std::stringstream in{
        "040610925051000746926000813080050071090100032013470598000000189162800357809001264\n"
        "\n"
        "800000000003600000070090200050007000000045700000100030001000068008500010090000400\n"
        "04061092505100074692600081308005007109010003201347059800000018916280035780900126x\n"
        "123456780000000009000000000000000000000000000000000000000000000000000000000000000\n"
        "046903000003050060900002003005006000800000010010780200000000050081300007000800104\n"
    };

    solver_options opts;
    opts.mode = MODE_FIRST;
    opts.propagation = PROPAGATE_HIDDEN;

    thread_pool pool(3);
    std::vector<batch_result> results = solve_batch(in, opts, pool);

    // Blank lines are skipped, order follows the input.
    assert(results.size() == 5);
    assert(result_line(results[0]).substr(0, 9) == "748613925");
    assert(result_line(results[1]) ==
        "812753649943682175675491283154237896369845721287169534521974368438526917796318452");
    assert(results[2].status == batch_result::INVALID);
    assert(results[3].status == batch_result::NO_SOLUTION);
    assert(result_line(results[4]) ==
        "146973582723458961958612473375126849892534716614789235467291358281345697539867124");
}

int main()
{
    pool_simple();
    pool_default_size();
    pool_drains_on_exit();
    single_lines();
    blank_line_stops_at_first();
    many();
}
