#include <cassert>
#include <sstream>
#include <string>

#include "board_io.h"
#include "errors.h"

using namespace sudoku;

static const std::string rows =
    "040610925\n"
    "051000746\n"
    "926000813\n"
    "080050071\n"
    "090100032\n"
    "013470598\n"
    "000000189\n"
    "162800357\n"
    "809001264\n";

template <typename F>
static bool throws_malformed(F &&f)
{
    try { f(); }
    catch (_malformed_input_error &e) { return true; }
    return false;
}

void layout_is_ignored()
{
    board_t a = parse_board(rows);
    assert(a[0][1] == 4 && a[0][8] == 5);
    assert(a[8][0] == 8 && a[8][8] == 4);
    assert(a[6][0] == 0);

    // One line, and blanks between digits.
    std::string flat;
    for (char ch : rows)
        if (ch != '\n')
            flat.push_back(ch);
    assert(parse_board(flat) == a);

    std::string spaced;
    for (char ch : rows)
    {
        spaced.push_back(ch);
        if (ch != '\n')
            spaced.push_back(' ');
    }
    assert(parse_board("  \r\n" + spaced + "\t\n") == a);
}

void wrong_count()
{
    std::string text = rows;
    text.erase(text.find('5'), 1);
    assert(throws_malformed([&text] { parse_board(text); }) && "80 cells");

    assert(throws_malformed([] { parse_board(rows + "1"); }) && "82 cells");
    assert(throws_malformed([] { parse_board(""); }));
}

void bad_characters()
{
    std::string letter = rows;
    letter[3] = 'a';
    assert(throws_malformed([&letter] { parse_board(letter); }));

    std::string dot = rows;
    dot[0] = '.';
    assert(throws_malformed([&dot] { parse_board(dot); }));

    std::string minus = rows;
    minus[0] = '-';
    assert(throws_malformed([&minus] { parse_board(minus); }));
}

void streams()
{
    std::stringstream ss{ rows };
    assert(read_board(ss) == parse_board(rows));

    bool caught = false;
    try { read_board_file("/nonexistent/puzzle.txt"); }
    catch (_io_error &e) { caught = true; }
    assert(caught);
}

void output()
{
    board_t b = parse_board(rows);

    std::string line = serialize_board(b);
    assert(line.size() == kCells);
    assert(line.substr(0, 9) == "040610925");
    assert(parse_board(line) == b);

    std::string tight = format_board(b, false);
    assert(tight.substr(0, 10) == "040610925\n");
    assert(tight == rows);

    std::string spaced = format_board(b, true);
    assert(spaced.substr(0, 18) == "0 4 0 6 1 0 9 2 5\n");
}

void lines()
{
    std::stringstream ss{ "a\nb\n\nc" };
    std::string seen;
    process_file_by_line(ss, [&seen](const std::string &line) { seen += "[" + line + "]"; });
    assert(seen == "[a][b][][c]");
}

int main()
{
    layout_is_ignored();
    wrong_count();
    bad_characters();
    streams();
    output();
    lines();
}
