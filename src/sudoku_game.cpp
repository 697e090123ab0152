#include "sudoku_game.h"

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "sudoku_channel.h"

using namespace std;

Step::Step() : x(0), y(0), z(0), initial(false), is_guess(false) {}

Step::Step(int x, int y, int z, bool initial, bool is_guess)
    : x(x), y(y), z(z), initial(initial), is_guess(is_guess) {}

Game::Game()
    : cells_to_be_solved_(SUDOKU_CELLS),
      guess_count_(0),
      deadline_(Deadline::max()),
      verbose_(false) {
    steps_.reserve(SUDOKU_CELLS);
}

Game Game::copy() const {
    return *this;
}

void Game::set(int x, int y, int z, bool initial, bool is_guess) {
    if (z < 1 || z > SUDOKU_N) {
        ostringstream oss;
        oss << "Placement value " << z << " is outside 1.." << SUDOKU_N;
        throw out_of_range(oss.str());
    }
    bool was_empty = !grid_.has(x, y);
    grid_.set(x, y, z);
    if (was_empty) {
        cells_to_be_solved_--;
    }
    steps_.push_back(Step(x, y, z, initial, is_guess));
    if (is_guess) {
        guess_count_++;
    }
}

int Game::candidates(int x, int y) const {
    int used = grid_.row_values(x) | grid_.column_values(y) | grid_.block_values(x, y);
    return used ^ FULL_MASK;
}

int Game::step() {
    int cells_solved = 0;

    for (int x = 0; x < SUDOKU_N; x++) {
        for (int y = 0; y < SUDOKU_N; y++) {
            if (grid_.has(x, y)) continue;

            int mask = candidates(x, y);
            if (mask == 0) {
                // wrong guess somewhere upstream
                if (verbose_) {
                    ostringstream oss;
                    oss << this << ": Cell " << x + 1 << "-" << y + 1
                        << " has zero candidates due to wrong guess upstream";
                    log_line(oss.str());
                }
                return CONTRADICTION;
            }
            if ((mask & (mask - 1)) == 0) {
                set(x, y, single_value(mask), false, false);
                cells_solved++;
            }
        }
    }

    return cells_solved;
}

int Game::count_empty_values() const {
    int count = 0;
    grid_.iterate([&count](int, int, int z) {
        if (z == 0) count++;
    });
    return count;
}

vector<Cell> Game::find_cells_with_least_candidates() const {
    vector<Cell> cells;
    cells.reserve(SUDOKU_CELLS);
    grid_.iterate([this, &cells](int x, int y, int z) {
        if (z != 0) return;
        int mask = candidates(x, y);
        if (count_bits(mask) > 1) {
            Cell cell;
            cell.x = x;
            cell.y = y;
            cell.candidates = mask_values(mask);
            cells.push_back(cell);
        }
    });
    stable_sort(cells.begin(), cells.end(), [](const Cell& a, const Cell& b) {
        return a.candidates.size() < b.candidates.size();
    });
    return cells;
}

void Game::attach(const shared_ptr<SolutionChannel>& channel, Deadline deadline,
                  const shared_ptr<atomic<bool> >& cancelled, bool verbose) {
    channel_ = channel;
    deadline_ = deadline;
    cancelled_ = cancelled;
    verbose_ = verbose;
}

void Game::detach() {
    channel_.reset();
    cancelled_.reset();
    deadline_ = Deadline::max();
}

bool Game::expired() const {
    if (cancelled_ && cancelled_->load(memory_order_relaxed)) return true;
    return chrono::steady_clock::now() >= deadline_;
}

void Game::report() const {
    if (!channel_) return;

    // the channel must not hold nodes that point back at it
    Game solution = *this;
    solution.detach();
    channel_->push(solution);
}

string Game::to_string() const {
    return grid_.to_string();
}

string Game::provenance() const {
    ostringstream oss;
    for (size_t i = 0; i < steps_.size(); i++) {
        const Step& s = steps_[i];
        oss << setw(2) << i + 1 << ": " << s.x + 1 << "-" << s.y + 1 << " = " << s.z;
        if (s.initial) {
            oss << " (initial)";
        } else if (s.is_guess) {
            oss << " (guess)";
        }
        oss << '\n';
    }
    return oss.str();
}

void Game::dump_state(ostream& out) const {
    const string rule(12 * SUDOKU_N + 2 * SUDOKU_SQRT_N + 1, '_');
    ios::fmtflags flags = out.flags();

    for (int x = 0; x < SUDOKU_N; x++) {
        if ((x % SUDOKU_SQRT_N) == 0) {
            out << rule << '\n';
        }
        for (int y = 0; y < SUDOKU_N; y++) {
            if ((y % SUDOKU_SQRT_N) == 0) {
                out << "| ";
            }
            ostringstream cell;
            if (grid_.has(x, y)) {
                cell << grid_.get(x, y);
            } else {
                vector<int> values = mask_values(candidates(x, y));
                cell << '[';
                for (size_t i = 0; i < values.size(); i++) {
                    if (i > 0) cell << ' ';
                    cell << values[i];
                }
                cell << ']';
            }
            out << left << setw(12) << cell.str();
        }
        out << "|\n";
    }
    out << rule << "\n\n";
    out.flags(flags);
}
