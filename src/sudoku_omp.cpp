#include <omp.h>

#include <algorithm>
#include <memory>
#include <sstream>
#include <thread>

#include "sudoku_omp.h"
#include "sudoku_channel.h"

using namespace std;

static void trace(const Game& g, const string& message) {
    ostringstream oss;
    oss << &g << ": " << message;
    log_line(oss.str());
}

bool choose_branch_cell(const Game& g, Cell& out) {
    vector<Cell> cells = g.find_cells_with_least_candidates();
    if (cells.empty()) return false;
    out = cells[0];
    return true;
}

// Fork one task per candidate of the most constrained cell. The parent
// does no further work once its children are queued.
static void guess_and_continue(const Game& g) {
    Cell best;
    if (!choose_branch_cell(g, best)) return;

    for (int cand : best.candidates) {
        if (g.expired()) return;

        Game cpy = g.copy();
        cpy.set(best.x, best.y, cand, false, true);
        if (g.verbose()) {
            ostringstream oss;
            oss << "Got stuck -> Try " << best.x + 1 << "-" << best.y + 1
                << " with value " << cand << " and continue";
            trace(g, oss.str());
        }

        #pragma omp task firstprivate(cpy)
        {
            solve_node(cpy);
        }
    }
}

void solve_node(Game& g) {
    if (g.verbose()) trace(g, "Start solving");

    if (g.cells_to_be_solved() == 0) {
        g.report();
        return;
    }

    for (int i = 0; i < MAX_STEPS; i++) {
        if (g.expired()) {
            if (g.verbose()) trace(g, "Abort because deadline expired or search cancelled");
            return;
        }

        int cells_solved = g.step();

        if (cells_solved == CONTRADICTION) {
            // wrong guess upstream, drop this branch
            return;
        }

        if (cells_solved == 0) {
            // stuck using deterministic approach: start guessing
            guess_and_continue(g);
            return;
        }

        if (g.verbose()) {
            ostringstream oss;
            oss << "Solved " << cells_solved << " cells this loop";
            trace(g, oss.str());
        }

        if (g.cells_to_be_solved() == 0) {
            if (g.verbose()) trace(g, "Got solution");
            g.report();
            return;
        }
    }

    if (g.verbose()) {
        ostringstream oss;
        oss << "Abort at cells to go:" << g.count_empty_values();
        trace(g, oss.str());
    }
}

static bool solution_exists(const vector<Game>& solutions, const Game& solution) {
    for (const Game& s : solutions) {
        if (s.grid() == solution.grid()) return true;
    }
    return false;
}

static SolveResult wait_for_completion(SolutionChannel& channel, Deadline deadline,
                                       const SolveConfig& config) {
    SolveResult result;
    size_t wanted = (size_t)max(config.min_solutions, 1);

    while (true) {
        Game solution;
        PopResult popped = channel.pop_until(solution, deadline);

        if (popped == PopResult::TIMEOUT) {
            result.timed_out = true;
            if (config.verbose) {
                ostringstream oss;
                oss << "Timeout expired after " << config.timeout.count() << " ms";
                log_line(oss.str());
            }
            break;
        }
        if (popped == PopResult::CLOSED) {
            result.exhausted = true;
            if (config.verbose) log_line("Search tree exhausted");
            break;
        }

        if (solution_exists(result.solutions, solution)) {
            if (config.verbose) log_line("Solution exists");
            continue;
        }

        if (config.verbose) log_line("Solution is new");
        result.solutions.push_back(solution);
        if (result.solutions.size() >= wanted) {
            if (config.verbose) {
                ostringstream oss;
                oss << "Enough solutions received: " << result.solutions.size();
                log_line(oss.str());
            }
            break;
        }
    }

    if (result.solutions.empty()) {
        result.status = SolveStatus::NO_SOLUTION;
        if (config.verbose) log_line("No solutions found");
    } else if (result.solutions.size() >= wanted) {
        result.status = SolveStatus::COMPLETE;
    } else {
        result.status = SolveStatus::PARTIAL;
    }
    return result;
}

SolveResult solve(const Game& root, const SolveConfig& config) {
    auto start = chrono::steady_clock::now();
    Deadline deadline = start + config.timeout;

    shared_ptr<SolutionChannel> channel = make_shared<SolutionChannel>();
    shared_ptr<atomic<bool> > cancelled = make_shared<atomic<bool> >(false);

    Game g = root.copy();
    g.attach(channel, deadline, cancelled, config.verbose);

    int threads = config.threads > 0 ? config.threads : omp_get_max_threads();

    // Solutions are reported back over the channel; the channel is closed
    // once the implicit barrier has drained every task
    thread search([&g, channel, threads]() {
        #pragma omp parallel num_threads(threads)
        {
            #pragma omp single nowait
            {
                solve_node(g);
            }
        }
        channel->close();
    });

    SolveResult result;
    try {
        result = wait_for_completion(*channel, deadline, config);
    } catch (...) {
        cancelled->store(true);
        search.join();
        throw;
    }

    // stop the branches still running
    cancelled->store(true);
    search.join();

    chrono::duration<double, milli> elapsed = chrono::steady_clock::now() - start;
    result.elapsed_ms = elapsed.count();
    return result;
}
