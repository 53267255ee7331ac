/// File errors.h
/// =============
/// Copyright 2020 Cloud-fantasy team
/// Typed failures raised before a search starts. Every error remembers the
/// source position that raised it.
#ifndef SUDOKU_ERRORS_H
#define SUDOKU_ERRORS_H

#include <string>
#include <stdexcept>

#define __INPUT_THROW(msg)                                                              \
    {                                                                                   \
        throw sudoku::_malformed_input_error((msg), __FILE__, __LINE__);                \
    }

#define __GIVENS_THROW(msg)                                                             \
    {                                                                                   \
        throw sudoku::_contradictory_givens_error((msg), __FILE__, __LINE__);           \
    }

#define __CONF_THROW(msg)                                                               \
    {                                                                                   \
        throw sudoku::_config_error((msg), __FILE__, __LINE__);                         \
    }

#define __IO_THROW(msg)                                                                 \
    {                                                                                   \
        throw sudoku::_io_error((msg), __FILE__, __LINE__);                             \
    }

#define DECLARE_RUNTIME_ERROR(name)                                                     \
    class _##name : public std::runtime_error                                           \
    {                                                                                   \
    public:                                                                             \
        _##name(const std::string &msg, const std::string &file, std::size_t line);     \
        const std::string &file() const;                                                \
        std::size_t line() const;                                                       \
    private:                                                                            \
        std::string file_;                                                              \
        std::size_t line_;                                                              \
    }

#define DEFINE_RUNTIME_ERROR(name)                                                      \
    _##name::_##name(const std::string &msg, const std::string &file, std::size_t line) \
        : std::runtime_error(msg)                                                       \
        , file_(file)                                                                   \
        , line_(line) {}                                                                \
    const std::string& _##name::file() const { return file_; }                          \
    std::size_t _##name::line() const { return line_; }

namespace sudoku {

/// Wrong cell count, a stray character or a digit outside 0-9.
DECLARE_RUNTIME_ERROR(malformed_input_error);

/// Two givens share a row, column or box and hold the same digit.
DECLARE_RUNTIME_ERROR(contradictory_givens_error);

DECLARE_RUNTIME_ERROR(config_error);
DECLARE_RUNTIME_ERROR(io_error);

} // namespace sudoku


#endif
