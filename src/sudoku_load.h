#ifndef SUDOKU_LOAD_H
#define SUDOKU_LOAD_H

#include <stdexcept>
#include <string>
#include <vector>

#include "sudoku_game.h"

// Rejected puzzle input. row and column are 1-based, 0 when not applicable.
class LoadError : public std::runtime_error {
public:
    LoadError(const std::string& message, int row = 0, int column = 0)
        : std::runtime_error(message), row_(row), column_(column) {}

    int row() const { return row_; }
    int column() const { return column_; }

private:
    int row_;
    int column_;
};

// Nine lines of nine whitespace separated tokens: 1..9, or '_' / '0' for empty
Game load(const std::string& text);

// 81 characters in row-major order: 1..9, or '0' / '.' / '_' for empty
Game load_line(const std::string& puzzle);

Game load_steps(const std::vector<Step>& steps);

// Non-negative decimal int with nothing trailing; false leaves out untouched
bool parse_count(const char* text, int& out);

// Throws LoadError for the first row, column or block holding a duplicate
void validate(const Grid& grid);

#endif
