#ifndef SUDOKU_GAME_H
#define SUDOKU_GAME_H

#include <atomic>
#include <chrono>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include "sudoku_grid.h"

class SolutionChannel;

// Returned by Game::step() when some empty cell has no candidate left
const int CONTRADICTION = -1;

// One placement, in the order it was made
struct Step {
    int x;
    int y;
    int z;
    bool initial;
    bool is_guess;

    Step();
    Step(int x, int y, int z, bool initial = false, bool is_guess = false);
};

// An empty cell together with its candidate values
struct Cell {
    int x;
    int y;
    std::vector<int> candidates;
};

typedef std::chrono::steady_clock::time_point Deadline;

// Search node: a private grid plus everything a search task needs to
// report a solution or notice that it should stop
class Game {
public:
    Game();

    // Deep copy; the channel, deadline and cancellation token are shared
    Game copy() const;

    const Grid& grid() const { return grid_; }
    int cells_to_be_solved() const { return cells_to_be_solved_; }
    int guess_count() const { return guess_count_; }
    const std::vector<Step>& steps() const { return steps_; }
    bool verbose() const { return verbose_; }

    void set(int x, int y, int z, bool initial, bool is_guess);

    int candidates(int x, int y) const;

    // One row-major sweep placing naked singles. Returns the number of cells
    // filled, or CONTRADICTION.
    int step();

    int count_empty_values() const;

    // Empty cells with more than one candidate, fewest candidates first.
    // Cells with equal counts keep row-major order.
    std::vector<Cell> find_cells_with_least_candidates() const;

    void attach(const std::shared_ptr<SolutionChannel>& channel, Deadline deadline,
                const std::shared_ptr<std::atomic<bool> >& cancelled, bool verbose);
    void detach();

    bool expired() const;

    // Push a detached copy of this node onto the channel
    void report() const;

    std::string to_string() const;
    std::string provenance() const;
    void dump_state(std::ostream& out) const;

private:
    Grid grid_;
    int cells_to_be_solved_;
    int guess_count_;
    std::vector<Step> steps_;

    std::shared_ptr<SolutionChannel> channel_;
    Deadline deadline_;
    std::shared_ptr<std::atomic<bool> > cancelled_;
    bool verbose_;
};

#endif
