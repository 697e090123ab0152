#ifndef SUDOKU_COMMON_H
#define SUDOKU_COMMON_H

#include <iostream>
#include <mutex>
#include <string>
#include <vector>

#define SUDOKU_N 9
#define SUDOKU_SQRT_N 3
#define SUDOKU_CELLS (SUDOKU_N * SUDOKU_N)

#ifndef SUDOKU_DEFAULT_TIMEOUT_MS
#define SUDOKU_DEFAULT_TIMEOUT_MS 10000
#endif

#ifndef SUDOKU_DEFAULT_MIN_SOLUTIONS
#define SUDOKU_DEFAULT_MIN_SOLUTIONS 1
#endif

// bit (v - 1) stands for value v
const int FULL_MASK = (1 << SUDOKU_N) - 1;

inline int value_bit(int v) {
    return 1 << (v - 1);
}

inline int count_bits(int mask) {
    int count = 0;
    while (mask) { mask &= (mask - 1); count++; }
    return count;
}

// Values of a mask in ascending order
inline std::vector<int> mask_values(int mask) {
    std::vector<int> values;
    for (int val = 1; val <= SUDOKU_N; val++) {
        if (mask & value_bit(val)) {
            values.push_back(val);
        }
    }
    return values;
}

inline int single_value(int mask) {
    int val = 0;
    while ((mask & 1) == 0) {
        mask >>= 1;
        val++;
    }
    return val + 1;
}

// Diagnostic output shared by all search tasks
inline void log_line(const std::string& line) {
    static std::mutex log_mutex;
    std::lock_guard<std::mutex> lock(log_mutex);
    std::cerr << line << std::endl;
}

#endif
