#ifndef SUDOKU_TEST_PUZZLES_H
#define SUDOKU_TEST_PUZZLES_H

#include <string>

#include "sudoku_game.h"

// Solvable with a few naked-single sweeps, unique solution
const char* const EASY_PUZZLE =
    "530070000600195000098000060800060003400803001700020006060000280000419005000080079";
const char* const EASY_SOLUTION =
    "534678912672195348198342567859761423426853791713924856961537284287419635345286179";

// 17 clues, unique solution, needs guessing
const char* const HARD_PUZZLE =
    "000000010400000000020000000000050407008000300001090000300400200050100000000806000";

// EASY_SOLUTION with a 6/7 rectangle removed: exactly two completions
const char* const TWO_SOLUTIONS_PUZZLE =
    "534008912672195348198342567859001423426853791713924856961537284287419635345286179";

// Valid clues, but cell 1-9 has no candidate left
const char* const DEAD_END_PUZZLE =
    "123456780000000009000000000000000000000000000000000000000000000000000000000000000";

const char* const EASY_TEXT =
    "5 3 _ _ 7 _ _ _ _\n"
    "6 _ _ 1 9 5 _ _ _\n"
    "_ 9 8 _ _ _ _ 6 _\n"
    "8 _ _ _ 6 _ _ _ 3\n"
    "4 _ _ 8 _ 3 _ _ 1\n"
    "7 _ _ _ 2 _ _ _ 6\n"
    "_ 6 _ _ _ _ 2 8 _\n"
    "_ _ _ 4 1 9 _ _ 5\n"
    "_ _ _ _ 8 _ _ 7 9\n";

inline std::string flatten(const Grid& grid) {
    std::string out;
    grid.iterate([&out](int, int, int z) {
        out += static_cast<char>('0' + z);
    });
    return out;
}

// Every clue of puzzle is unchanged in solution
inline bool keeps_clues(const Grid& puzzle, const Grid& solution) {
    bool kept = true;
    puzzle.iterate([&](int x, int y, int z) {
        if (z != 0 && solution.get(x, y) != z) kept = false;
    });
    return kept;
}

#endif
