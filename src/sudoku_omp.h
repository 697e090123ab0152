#ifndef SUDOKU_OMP_H
#define SUDOKU_OMP_H

#include <chrono>
#include <vector>

#include "sudoku_game.h"

// Upper bound on propagation sweeps per search node
const int MAX_STEPS = SUDOKU_CELLS;

struct SolveConfig {
    std::chrono::milliseconds timeout;
    int min_solutions;
    // OpenMP team size, 0 leaves it to the runtime (OMP_NUM_THREADS)
    int threads;
    bool verbose;

    SolveConfig()
        : timeout(SUDOKU_DEFAULT_TIMEOUT_MS),
          min_solutions(SUDOKU_DEFAULT_MIN_SOLUTIONS),
          threads(0),
          verbose(false) {}
};

enum class SolveStatus {
    COMPLETE,    // min_solutions distinct solutions found
    PARTIAL,     // at least one, but fewer than requested
    NO_SOLUTION
};

struct SolveResult {
    SolveStatus status;
    std::vector<Game> solutions;
    bool timed_out;   // the deadline ended the wait
    bool exhausted;   // every branch finished before the wait ended
    double elapsed_ms;

    SolveResult()
        : status(SolveStatus::NO_SOLUTION), timed_out(false), exhausted(false), elapsed_ms(0) {}

    bool ok() const { return status != SolveStatus::NO_SOLUTION; }
};

// Solve root with concurrent branching. Returns once min_solutions distinct
// grids arrived, the timeout elapsed or the search tree was exhausted. No
// search task is left running on return.
SolveResult solve(const Game& root, const SolveConfig& config);

// Body of one search task: propagate, then report, fork or give up
void solve_node(Game& g);

// Cell the search branches on once propagation is stuck: the first cell in
// row-major order among those with the fewest candidates
bool choose_branch_cell(const Game& g, Cell& out);

#endif
