#include <cassert>
#include <sstream>
#include <string>
#include <iostream>

#include "configuration.h"
#include "errors.h"

using namespace sudoku;

template <typename F>
static bool throws_config(F &&f)
{
    try { f(); }
    catch (_config_error &e)
    {
        std::cout << "Caught error: " << e.what() << std::endl;
        return true;
    }
    return false;
}

void defaults()
{
    configuration_manager manager;
    std::stringstream empty;
    auto conf = manager.read_conf(empty);

    assert(conf->options.mode == MODE_ALL);
    assert(conf->options.max_solutions == 0);
    assert(conf->options.propagation == PROPAGATE_NAKED);
    assert(conf->spaced);
    assert(conf->separator.empty());
    assert(conf->num_workers == 0);
    assert(!conf->quiet);
}

void simple()
{
    std::stringstream ss{
        "! solver settings\n"
        "mode first\n"
        "max_solutions 12\n"
        "propagation hidden\r\n"
        "\n"
        "spaced false\n"
        "separator ---  \n"
        "num_workers 4\n"
        "info_log /tmp/info.log\n"
        "quiet yes\n"
    };

    configuration_manager manager;
    auto conf = manager.read_conf(ss);

    assert(conf->options.mode == MODE_FIRST);
    assert(conf->options.max_solutions == 12);
    assert(conf->options.propagation == PROPAGATE_HIDDEN);
    assert(!conf->spaced);
    assert(conf->separator == "---");
    assert(conf->num_workers == 4);
    assert(conf->info_log == "/tmp/info.log");
    assert(conf->err_log.empty());
    assert(conf->quiet);
}

void overrides()
{
    configuration_manager manager;
    std::stringstream ss{ "mode first\npropagation none\n" };
    auto conf = manager.read_conf(ss);

    manager.apply(conf.get(), "mode", "all");
    manager.apply(conf.get(), "max_solutions", "3");
    assert(conf->options.mode == MODE_ALL);
    assert(conf->options.max_solutions == 3);
    assert(conf->options.propagation == PROPAGATE_NONE);
}

void errors()
{
    configuration_manager manager;
    configuration conf;

    assert(throws_config([&] { manager.apply(&conf, "colour", "blue"); }));
    assert(throws_config([&] { manager.apply(&conf, "mode", "some"); }));
    assert(throws_config([&] { manager.apply(&conf, "propagation", "x-wing"); }));
    assert(throws_config([&] { manager.apply(&conf, "max_solutions", "-1"); }));
    assert(throws_config([&] { manager.apply(&conf, "max_solutions", "ten"); }));
    assert(throws_config([&] { manager.apply(&conf, "num_workers", ""); }));
    assert(throws_config([&] { manager.apply(&conf, "spaced", "maybe"); }));

    std::stringstream no_value{ "mode\n" };
    assert(throws_config([&] { manager.read_conf(no_value); }));

    assert(throws_config([&] { manager.get_conf("/nonexistent/solver.conf"); }));
}

void indented_and_bare_keys()
{
    std::stringstream ss{
        "  mode first\n"
        "\tpropagation none\n"
        "   ! indented comment\n"
        "separator ---\n"
        "separator\n"
    };

    configuration_manager manager;
    auto conf = manager.read_conf(ss);

    assert(conf->options.mode == MODE_FIRST);
    assert(conf->options.propagation == PROPAGATE_NONE);
    // A key on its own sets an empty value.
    assert(conf->separator.empty());

    std::string op, value;
    assert(manager.get_option("  spaced  true \r", op, value));
    assert(op == "spaced" && value == "true");
    assert(manager.get_option("separator", op, value));
    assert(op == "separator" && value.empty());
}

void huge_counts()
{
    configuration_manager manager;
    configuration conf;

    assert(throws_config([&] {
        manager.apply(&conf, "max_solutions", "99999999999999999999999999999999");
    }));
    manager.apply(&conf, "max_solutions", "007");
    assert(conf.options.max_solutions == 7);
}

int main()
{
    defaults();
    simple();
    overrides();
    errors();
    indented_and_bare_keys();
    huge_counts();
}
