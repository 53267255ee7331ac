/// reporter.cc
/// Copyright 2020 Cloud-fantasy team

#include <ctime>
#include <chrono>
#include "reporter.h"

namespace sudoku
{

std::ofstream Reporter::err_;
std::ofstream Reporter::warn_;
std::ofstream Reporter::info_;
std::ostream Reporter::null_(nullptr);
bool Reporter::quiet_ = false;

static void reopen(std::ofstream &f, std::string const &path)
{
    if (f.is_open())
        f.close();
    if (!path.empty())
        f.open(path, std::ios::out | std::ios::app);
}

void initialize_reporter(std::string const &err,
                        std::string const &warn,
                        std::string const &info,
                        bool quiet)
{
    reopen(Reporter::err_, err);
    reopen(Reporter::warn_, warn);
    reopen(Reporter::info_, info);
    Reporter::quiet_ = quiet;
}

std::ostream &Reporter::target(std::ofstream &f)
{
    if (f.is_open())
        return f;
    return std::clog;
}

std::ostream &Reporter::file(const int severity)
{
    auto now = std::chrono::system_clock::now();
    auto now_time = std::chrono::system_clock::to_time_t(now);

    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", std::localtime(&now_time));

    switch (severity)
    {
    case REPORT_ERROR:  return target(err_) << stamp << " Error ";
    case REPORT_WARN:   return target(warn_) << stamp << " Warn ";
    case REPORT_INFO:
    default:
        if (quiet_)
            return null_;
        return target(info_) << stamp << " Info ";
    }
}

std::ostream &Reporter::log(int severity, int line, std::string const &filename)
{
    auto &f = file(severity);

    f << filename << " " << line << ": ";
    return f;
}

} // namespace sudoku
