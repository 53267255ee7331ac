#include <cctype>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include "board_io.h"
#include "errors.h"

namespace sudoku {

board_t parse_board(const std::string &text)
{
    board_t board;
    int *board_ptr = &board[0][0];
    std::size_t count = 0;

    for (std::size_t i = 0; i < text.size(); i++)
    {
        char ch = text[i];
        if (std::isspace(static_cast<unsigned char>(ch)))
            continue;

        if (ch < '0' || ch > '9')
            __INPUT_THROW(std::string{ "invalid character '" } + ch + "' at offset " + std::to_string(i));

        if (count == kCells)
            __INPUT_THROW("more than " + std::to_string(kCells) + " cells");

        board_ptr[count++] = ch - '0';
    }

    if (count != kCells)
        __INPUT_THROW("expected " + std::to_string(kCells) + " cells, got " + std::to_string(count));

    return board;
}

board_t read_board(std::istream &in)
{
    std::string text{ std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>() };
    if (in.bad())
        __IO_THROW("failed to read puzzle");
    return parse_board(text);
}

board_t read_board_file(const std::string &filename)
{
    auto fs = std::make_unique<std::ifstream>(filename, std::ios::in);
    if (!fs || !fs->is_open())
        __IO_THROW("bad filename: " + filename);

    return read_board(*fs);
}

std::string serialize_board(const board_t &board)
{
    std::string ret;

    ret.reserve(kCells);
    for (std::size_t i = 0; i < kDim; i++)
    {
        for (std::size_t j = 0; j < kDim; j++)
        {
            ret.push_back(static_cast<char>('0' + board[i][j]));
        }
    }

    return ret;
}

std::string format_board(const board_t &board, bool spaced)
{
    std::stringstream ss;
    for (std::size_t i = 0; i < kDim; i++)
    {
        for (std::size_t j = 0; j < kDim; j++)
        {
            if (spaced && j > 0)
                ss << ' ';
            ss << board[i][j];
        }
        ss << '\n';
    }
    return ss.str();
}

} // namespace sudoku
