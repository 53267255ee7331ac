/// File configuration.h
/// ====================
/// Copyright 2020 Cloud-fantasy team
/// Run-time settings of the solver front end, read from a `key value`
/// file. Command-line flags are applied on top through the same setters.
#ifndef SUDOKU_CONFIGURATION_H
#define SUDOKU_CONFIGURATION_H
#include <functional>
#include <istream>
#include <memory>
#include <string>
#include <unordered_map>
#include "solver.h"

namespace sudoku {

/// Forward declaration.
struct configuration;

/// Configuration manager.
class configuration_manager {
public:
    /// Ctor.
    configuration_manager();

    /// Obtain a configuration from file [conf_path].
    std::unique_ptr<configuration> get_conf(const std::string &conf_path);

    /// Obtain a configuration from an already opened stream.
    std::unique_ptr<configuration> read_conf(std::istream &in);

    /// Set field [op] of [conf] from its textual [value].
    void apply(configuration *conf, const std::string &op, const std::string &value);

    /// Split one configuration [line] into its key [op] and [value].
    bool get_option(const std::string &line, std::string &op, std::string &value);

private:
    /*
    Corresponding field setters.
    */
    void mode(configuration *conf, const std::string &value);
    void max_solutions(configuration *conf, const std::string &value);
    void propagation(configuration *conf, const std::string &value);
    void spaced(configuration *conf, const std::string &value);
    void separator(configuration *conf, const std::string &value);
    void num_workers(configuration *conf, const std::string &value);

    /*
    Logging.
    */
    void err_log(configuration *conf, const std::string &value);
    void warn_log(configuration *conf, const std::string &value);
    void info_log(configuration *conf, const std::string &value);
    void quiet(configuration *conf, const std::string &value);

private:
    std::unordered_map<
        std::string,
        std::function<void(configuration*, const std::string &)>
    > m;
};

struct configuration {
    /// Search settings handed to every solver.
    solver_options options;

    /// Print solution digits separated by blanks.
    bool spaced = true;

    /// Printed between two consecutive solutions.
    std::string separator;

    /// Workers used in batch mode, 0 for the hardware concurrency.
    std::size_t num_workers = 0;

    /// Log files, empty for std::clog.
    std::string err_log;
    std::string warn_log;
    std::string info_log;
    bool quiet = false;
};

} // namespace sudoku


#endif
