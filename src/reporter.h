#ifndef SUDOKU_REPORTER_H
#define SUDOKU_REPORTER_H

#include <fstream>
#include <iostream>
#include <string>

#define report(f)  sudoku::Reporter::log((f), __LINE__, __FILE__)

namespace sudoku
{

enum ReportSeverity
{
    REPORT_ERROR,
    REPORT_INFO,
    REPORT_WARN
};

/// Setup err, warn, info files. An empty path keeps that severity on
/// std::clog. With [quiet] set, INFO lines are dropped.
void initialize_reporter(std::string const &err,
                        std::string const &warn,
                        std::string const &info,
                        bool quiet = false);

/// Singleton reporter class.
class Reporter
{
private:
    friend void initialize_reporter(std::string const &err,
                        std::string const &warn,
                        std::string const &info,
                        bool quiet);

    static std::ofstream info_;
    static std::ofstream warn_;
    static std::ofstream err_;

    /// Sink for suppressed severities.
    static std::ostream null_;
    static bool quiet_;

    static std::ostream &file(const int severity);
    static std::ostream &target(std::ofstream &f);

    /// Disallow instantiation.
    Reporter() = delete;
    Reporter(const Reporter&) = delete;
    Reporter(const Reporter&&) = delete;
    void operator=(Reporter&) = delete;
    void operator=(Reporter&&) = delete;

public:
    static std::ostream &log(int severity, int line, std::string const &file);
};

}   // namespace sudoku
#endif
