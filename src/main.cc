#include <string>
#include <fstream>
#include <iostream>
#include <memory>
#include "Flags.hh"
#include "batch.h"
#include "board_io.h"
#include "configuration.h"
#include "errors.h"
#include "reporter.h"
#include "solver.h"
#include "thread_pool.h"
using sudoku::board_t;
using sudoku::configuration;
using sudoku::configuration_manager;
using sudoku::solver;

/// Exit status.
static const int EXIT_SOLVED = 0;
static const int EXIT_NO_SOLUTION = 1;
static const int EXIT_INVALID_INPUT = 2;
static const int EXIT_USAGE = 3;

/// Solve one puzzle read from [filename], or stdin when it is empty.
static int run_single(const configuration &conf, const std::string &filename)
{
    try
    {
        board_t board = filename.empty() ? sudoku::read_board(std::cin)
                                         : sudoku::read_board_file(filename);
        solver s{ board, conf.options };
        report(sudoku::REPORT_INFO) << "puzzle:\n" << s.current().describe();

        std::size_t count = 0;
        s.solve([&conf, &count](const board_t &b) {
            if (count > 0)
                std::cout << conf.separator << "\n";
            count++;

            std::cout << "Solved #" << count << ":\n"
                      << sudoku::format_board(b, conf.spaced);
            std::cout.flush();

            // Nobody is listening any more.
            return std::cout.good();
        });

        report(sudoku::REPORT_INFO) << "search finished: " << s.stats() << std::endl;
        if (count == 0)
        {
            std::cout << "no solution" << std::endl;
            return EXIT_NO_SOLUTION;
        }
        return EXIT_SOLVED;
    }
    catch (sudoku::_malformed_input_error &e)
    {
        report(sudoku::REPORT_ERROR) << e.file() << ":" << e.line() << " " << e.what() << std::endl;
        std::cerr << "invalid input: " << e.what() << std::endl;
    }
    catch (sudoku::_contradictory_givens_error &e)
    {
        report(sudoku::REPORT_ERROR) << e.file() << ":" << e.line() << " " << e.what() << std::endl;
        std::cerr << "invalid input: " << e.what() << std::endl;
    }
    return EXIT_INVALID_INPUT;
}

/// Solve a file of puzzles, one per line, on a thread pool.
static int run_batch(const configuration &conf, const std::string &filename)
{
    std::unique_ptr<std::ifstream> fs;
    if (!filename.empty())
    {
        fs.reset(new std::ifstream(filename, std::ios::in));
        if (!fs->is_open())
            __IO_THROW("bad filename: " + filename);
    }
    std::istream &in = fs ? static_cast<std::istream &>(*fs) : std::cin;

    sudoku::thread_pool pool(conf.num_workers);
    report(sudoku::REPORT_INFO) << "batch with " << pool.size() << " workers" << std::endl;

    auto results = sudoku::solve_batch(in, conf.options, pool);

    bool any_invalid = false;
    bool any_unsolved = false;
    for (std::size_t i = 0; i < results.size(); i++)
    {
        const sudoku::batch_result &res = results[i];
        std::cout << sudoku::result_line(res) << "\n";

        if (res.status == sudoku::batch_result::INVALID)
        {
            any_invalid = true;
            report(sudoku::REPORT_WARN) << "puzzle " << i + 1 << ": " << res.error << std::endl;
        }
        else
        {
            any_unsolved = any_unsolved || res.status == sudoku::batch_result::NO_SOLUTION;
            report(sudoku::REPORT_INFO) << "puzzle " << i + 1 << ": " << res.stats << std::endl;
        }
    }
    std::cout.flush();

    if (any_invalid)
        return EXIT_INVALID_INPUT;
    return any_unsolved ? EXIT_NO_SOLUTION : EXIT_SOLVED;
}

int main(int argc, char *argv[])
{
    std::string config_path;        /* E.g., "./solver.conf" */
    std::string file;               /* E.g., "./puzzle.txt", stdin when empty */
    std::string mode;               /* "first" | "all" */
    std::string max_solutions;      /* E.g., "10" */
    std::string propagation;        /* "none" | "naked" | "hidden" */
    std::string spaced;             /* "true" | "false" */
    std::string num_workers;        /* E.g., "4" */

    bool help;
    bool batch;
    bool quiet;
    Flags flags;
    flags.Bool(help, 'h', "help", "print this message and exit");
    flags.Var(config_path, 'c', "config_path", std::string{""}, "specify the path to config");
    flags.Var(file, 'f', "file", std::string{""}, "read the puzzle from a file instead of stdin");
    flags.Var(mode, 'm', "mode", std::string{""}, "[\"first\" | \"all\"]. Defaulted to \"all\"");
    flags.Var(max_solutions, 'n', "max_solutions", std::string{""}, "stop after this many solutions, 0 for no limit");
    flags.Var(propagation, 'p', "propagation", std::string{""}, "[\"none\" | \"naked\" | \"hidden\"]. Defaulted to \"naked\"");
    flags.Var(spaced, 's', "spaced", std::string{""}, "separate digits with blanks [\"true\" | \"false\"]");
    flags.Bool(batch, 'b', "batch", "solve one puzzle per input line on a thread pool");
    flags.Var(num_workers, 'w', "num_workers", std::string{""}, "number of batch workers, 0 for one per core");
    flags.Bool(quiet, 'q', "quiet", "do not log info messages");

    if (!flags.Parse(argc, argv))
    {
        flags.PrintHelp(argv[0]);
        return EXIT_USAGE;
    }

    if (help)
    {
        flags.PrintHelp(argv[0]);
        return 0;
    }

    std::unique_ptr<configuration> conf;
    try
    {
        configuration_manager conf_manager{};
        if (!config_path.empty())
            conf = conf_manager.get_conf(config_path);
        else
            conf.reset(new configuration);

        /// Flags override the file.
        if (!mode.empty())
            conf_manager.apply(conf.get(), "mode", mode);
        if (!max_solutions.empty())
            conf_manager.apply(conf.get(), "max_solutions", max_solutions);
        if (!propagation.empty())
            conf_manager.apply(conf.get(), "propagation", propagation);
        if (!spaced.empty())
            conf_manager.apply(conf.get(), "spaced", spaced);
        if (!num_workers.empty())
            conf_manager.apply(conf.get(), "num_workers", num_workers);
        if (quiet)
            conf->quiet = true;
    }
    catch (sudoku::_config_error &e)
    {
        std::cerr << "configuration error: " << e.what() << std::endl;
        flags.PrintHelp(argv[0]);
        return EXIT_USAGE;
    }

    sudoku::initialize_reporter(conf->err_log, conf->warn_log, conf->info_log, conf->quiet);
    report(sudoku::REPORT_INFO) << "mode=" << sudoku::to_string(conf->options.mode)
                                << " max_solutions=" << conf->options.max_solutions
                                << " propagation=" << sudoku::to_string(conf->options.propagation)
                                << std::endl;

    try
    {
        if (batch)
            return run_batch(*conf, file);
        return run_single(*conf, file);
    }
    catch (sudoku::_io_error &e)
    {
        report(sudoku::REPORT_ERROR) << e.what() << std::endl;
        std::cerr << e.what() << std::endl;
        return EXIT_USAGE;
    }
}
