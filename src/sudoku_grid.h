#ifndef SUDOKU_GRID_H
#define SUDOKU_GRID_H

#include <functional>
#include <string>

#include "sudoku_common.h"

// 9x9 cell store; 0 marks an empty cell
class Grid {
public:
    Grid();

    int get(int x, int y) const;
    void set(int x, int y, int z);
    void clear(int x, int y);
    bool has(int x, int y) const;

    bool exists(int x, int y) const;
    bool is_allowed(int x, int y, int z) const;

    // Masks of the values present in a row, column or 3x3 block
    int row_values(int x) const;
    int column_values(int y) const;
    int block_values(int x, int y) const;

    void iterate(const std::function<void(int, int, int)>& visit) const;

    Grid copy() const;

    // Every row, column and block holds 1..9 exactly once
    bool is_solved() const;

    std::string to_string() const;

    bool operator==(const Grid& other) const;
    bool operator!=(const Grid& other) const;

private:
    void check(int x, int y) const;

    int cells[SUDOKU_N][SUDOKU_N];
};

#endif
