#include <fstream>
#include "configuration.h"
#include "errors.h"

namespace sudoku {

static bool parse_bool(const std::string &value, bool &out)
{
    if (value == "true" || value == "yes" || value == "1")
    {
        out = true;
        return true;
    }
    if (value == "false" || value == "no" || value == "0")
    {
        out = false;
        return true;
    }
    return false;
}

static std::size_t parse_count(const std::string &field, const std::string &value)
{
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos)
        __CONF_THROW("invalid " + field + ": " + value);

    std::size_t n = 0;
    try
    {
        n = std::stoul(value);
    }
    catch (std::out_of_range &e)
    {
        __CONF_THROW("invalid " + field + ": " + value);
    }
    return n;
}

bool configuration_manager::get_option(const std::string &line, std::string &op, std::string &value)
{
    std::size_t idx = line.find_first_not_of(" \t\r");
    if (idx == std::string::npos)     return false;

    std::size_t key_end = line.find_first_of(" \t\r", idx);
    if (key_end == std::string::npos)
        key_end = line.size();
    op = line.substr(idx, key_end - idx);

    // Surrounding blanks are not part of the value; a bare key has an empty one.
    std::size_t begin = line.find_first_not_of(" \t\r", key_end);
    std::size_t end = line.find_last_not_of(" \t\r");
    value = (begin == std::string::npos) ? std::string{} : line.substr(begin, end - begin + 1);
    return true;
}

configuration_manager::configuration_manager()
{
    using std::placeholders::_1;
    using std::placeholders::_2;
    m["mode"] = std::bind(&configuration_manager::mode, this, _1, _2);
    m["max_solutions"] = std::bind(&configuration_manager::max_solutions, this, _1, _2);
    m["propagation"] = std::bind(&configuration_manager::propagation, this, _1, _2);
    m["spaced"] = std::bind(&configuration_manager::spaced, this, _1, _2);
    m["separator"] = std::bind(&configuration_manager::separator, this, _1, _2);
    m["num_workers"] = std::bind(&configuration_manager::num_workers, this, _1, _2);
    m["err_log"] = std::bind(&configuration_manager::err_log, this, _1, _2);
    m["warn_log"] = std::bind(&configuration_manager::warn_log, this, _1, _2);
    m["info_log"] = std::bind(&configuration_manager::info_log, this, _1, _2);
    m["quiet"] = std::bind(&configuration_manager::quiet, this, _1, _2);
}

std::unique_ptr<configuration>
configuration_manager::get_conf(const std::string &conf_path)
{
    std::ifstream conf_str{conf_path};
    if (!conf_str.is_open())
        __CONF_THROW("configuration file does not exist: " + conf_path);

    return read_conf(conf_str);
}

std::unique_ptr<configuration>
configuration_manager::read_conf(std::istream &in)
{
    std::unique_ptr<configuration> ret{ new configuration };
    std::string line;
    while (std::getline(in, line))
    {
        /// Ignore comment and blank lines.
        std::size_t first = line.find_first_not_of(" \t\r");
        if (first == std::string::npos || line[first] == '!') continue;

        std::string op, value;
        if (!get_option(line, op, value))
            __CONF_THROW("invalid configuration line: " + line);

        apply(ret.get(), op, value);
    }
    return ret;
}

void
configuration_manager::apply(configuration *conf, const std::string &op, const std::string &value)
{
    auto it = m.find(op);
    if (it == m.end())
        __CONF_THROW("unknown configuration field: " + op);

    (it->second)(conf, value);
}

void
configuration_manager::mode(configuration *conf, const std::string &value)
{
    if (value == "first")
        conf->options.mode = MODE_FIRST;
    else if (value == "all")
        conf->options.mode = MODE_ALL;
    else
        __CONF_THROW("invalid mode: " + value);
}

void
configuration_manager::max_solutions(configuration *conf, const std::string &value)
{
    conf->options.max_solutions = parse_count("max_solutions", value);
}

void
configuration_manager::propagation(configuration *conf, const std::string &value)
{
    if (value == "none")
        conf->options.propagation = PROPAGATE_NONE;
    else if (value == "naked")
        conf->options.propagation = PROPAGATE_NAKED;
    else if (value == "hidden")
        conf->options.propagation = PROPAGATE_HIDDEN;
    else
        __CONF_THROW("invalid propagation: " + value);
}

void
configuration_manager::spaced(configuration *conf, const std::string &value)
{
    if (!parse_bool(value, conf->spaced))
        __CONF_THROW("invalid spaced: " + value);
}

void
configuration_manager::separator(configuration *conf, const std::string &value)
{
    conf->separator = value;
}

void
configuration_manager::num_workers(configuration *conf, const std::string &value)
{
    conf->num_workers = parse_count("num_workers", value);
}

void
configuration_manager::err_log(configuration *conf, const std::string &value)
{
    conf->err_log = value;
}

void
configuration_manager::warn_log(configuration *conf, const std::string &value)
{
    conf->warn_log = value;
}

void
configuration_manager::info_log(configuration *conf, const std::string &value)
{
    conf->info_log = value;
}

void
configuration_manager::quiet(configuration *conf, const std::string &value)
{
    if (!parse_bool(value, conf->quiet))
        __CONF_THROW("invalid quiet: " + value);
}

} // namespace sudoku
