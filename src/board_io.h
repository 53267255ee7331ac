/// File board_io.h
/// ===============
/// Copyright 2020 Cloud-fantasy team
/// Text in, text out: puzzle parsing and solution rendering.
#ifndef SUDOKU_BOARD_IO_H
#define SUDOKU_BOARD_IO_H

#include <istream>
#include <string>
#include "common.h"

namespace sudoku {

/// Deserialization of the board. Whitespace is layout and is skipped; any
/// other character must be a digit and exactly 81 of them are required.
/// Throws _malformed_input_error otherwise.
board_t parse_board(const std::string &text);

/// Read [in] to the end and parse it.
board_t read_board(std::istream &in);

/// Open [filename] and parse it. Throws _io_error when it cannot be opened.
board_t read_board_file(const std::string &filename);

/// Serialization as a single 81-digit line.
std::string serialize_board(const board_t &board);

/// Nine lines of nine digits, separated by blanks when [spaced] is set.
std::string format_board(const board_t &board, bool spaced);

/// Synchronously read lines from [in] and pass each line to
/// [process_line] eagerly.
template <typename F>
void process_file_by_line(std::istream &in, F &&process_line)
{
    std::string line;
    while (std::getline(in, line))
    {
        process_line(line);
    }
}

} // namespace sudoku

#endif
