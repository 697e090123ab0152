#include <catch2/catch.hpp>

#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

#include "sudoku_channel.h"
#include "sudoku_load.h"
#include "sudoku_omp.h"
#include "puzzles.h"

static SolveConfig make_config(int timeout_ms, int min_solutions, int threads = 0) {
    SolveConfig config;
    config.timeout = std::chrono::milliseconds(timeout_ms);
    config.min_solutions = min_solutions;
    config.threads = threads;
    return config;
}

static std::vector<std::string> solution_set(const SolveResult& result) {
    std::vector<std::string> out;
    for (const Game& s : result.solutions) out.push_back(flatten(s.grid()));
    std::sort(out.begin(), out.end());
    return out;
}

static void check_solutions(const Game& puzzle, const SolveResult& result) {
    for (const Game& s : result.solutions) {
        REQUIRE(s.grid().is_solved());
        REQUIRE(keeps_clues(puzzle.grid(), s.grid()));
        REQUIRE(s.cells_to_be_solved() == 0);
    }
}

TEST_CASE("Solve an easy puzzle", "[solve]") {
    Game puzzle = load_line(EASY_PUZZLE);
    SolveResult result = solve(puzzle, make_config(5000, 1));

    REQUIRE(result.ok());
    REQUIRE(result.status == SolveStatus::COMPLETE);
    REQUIRE(result.solutions.size() == 1);
    REQUIRE(flatten(result.solutions[0].grid()) == EASY_SOLUTION);
    REQUIRE(result.solutions[0].guess_count() == 0);
    check_solutions(puzzle, result);

    // the caller's node is left untouched
    REQUIRE(puzzle.cells_to_be_solved() == 51);
}

TEST_CASE("Solve a 17-clue puzzle within a few seconds", "[solve]") {
    Game puzzle = load_line(HARD_PUZZLE);
    SolveResult result = solve(puzzle, make_config(10000, 1));

    REQUIRE(result.status == SolveStatus::COMPLETE);
    REQUIRE(result.solutions.size() == 1);
    REQUIRE_FALSE(result.timed_out);
    REQUIRE(result.solutions[0].guess_count() > 0);
    check_solutions(puzzle, result);
}

TEST_CASE("Asking for more solutions than a unique puzzle has", "[solve]") {
    Game puzzle = load_line(HARD_PUZZLE);
    SolveResult result = solve(puzzle, make_config(10000, 2));

    REQUIRE(result.ok());
    REQUIRE(result.status == SolveStatus::PARTIAL);
    REQUIRE(result.solutions.size() == 1);
    check_solutions(puzzle, result);

    Game easy = load_line(EASY_PUZZLE);
    result = solve(easy, make_config(500, 2));
    REQUIRE(result.status == SolveStatus::PARTIAL);
    REQUIRE(result.solutions.size() == 1);
    REQUIRE(flatten(result.solutions[0].grid()) == EASY_SOLUTION);
}

TEST_CASE("Two distinct solutions of an under-constrained puzzle", "[solve]") {
    Game puzzle = load_line(TWO_SOLUTIONS_PUZZLE);
    SolveResult result = solve(puzzle, make_config(5000, 2));

    REQUIRE(result.status == SolveStatus::COMPLETE);
    REQUIRE(result.solutions.size() == 2);
    REQUIRE(result.solutions[0].grid() != result.solutions[1].grid());
    check_solutions(puzzle, result);

    for (const Game& s : result.solutions) {
        REQUIRE(s.guess_count() == 1);
    }
}

TEST_CASE("Distinct solutions of a nearly empty grid", "[solve]") {
    Game puzzle = load_line(
        "123456789000000000000000000000000000000000000000000000000000000000000000000000000");
    SolveResult result = solve(puzzle, make_config(10000, 2));

    REQUIRE(result.status == SolveStatus::COMPLETE);
    REQUIRE(result.solutions.size() == 2);
    REQUIRE(result.solutions[0].grid() != result.solutions[1].grid());
    check_solutions(puzzle, result);
}

TEST_CASE("Search exhaustion returns every solution without waiting for the deadline", "[solve]") {
    Game puzzle = load_line(TWO_SOLUTIONS_PUZZLE);
    SolveResult result = solve(puzzle, make_config(30000, 5));

    REQUIRE(result.status == SolveStatus::PARTIAL);
    REQUIRE(result.solutions.size() == 2);
    REQUIRE(result.exhausted);
    REQUIRE_FALSE(result.timed_out);
    REQUIRE(result.elapsed_ms < 30000);
}

TEST_CASE("An unsolvable puzzle reports no solution", "[solve][error]") {
    Game puzzle = load_line(DEAD_END_PUZZLE);
    SolveResult result = solve(puzzle, make_config(5000, 1));

    REQUIRE_FALSE(result.ok());
    REQUIRE(result.status == SolveStatus::NO_SOLUTION);
    REQUIRE(result.solutions.empty());
    REQUIRE(result.exhausted);
}

TEST_CASE("No solution is reported regardless of verbosity", "[solve][error]") {
    Game puzzle = load_line(DEAD_END_PUZZLE);
    SolveConfig config = make_config(5000, 1);
    config.verbose = true;
    SolveResult result = solve(puzzle, config);

    REQUIRE(result.status == SolveStatus::NO_SOLUTION);
}

TEST_CASE("An expired budget yields no solution", "[solve][error]") {
    Game puzzle = load_line(HARD_PUZZLE);
    SolveResult result = solve(puzzle, make_config(0, 1));

    REQUIRE(result.status == SolveStatus::NO_SOLUTION);
    REQUIRE(result.solutions.empty());
    REQUIRE(result.timed_out);
    REQUIRE_FALSE(result.exhausted);
}

TEST_CASE("A budget cut short is reported as a timeout, not exhaustion", "[solve][timeout]") {
    Game puzzle = load_line(HARD_PUZZLE);
    for (int i = 0; i < 50; i++) {
        SolveResult result = solve(puzzle, make_config(1 + i % 5, 1));
        if (!result.ok()) {
            REQUIRE(result.timed_out);
            REQUIRE_FALSE(result.exhausted);
        }
        REQUIRE_FALSE((result.timed_out && result.exhausted));
    }
}

TEST_CASE("Collecting stops at the deadline while branches keep reporting", "[solve][timeout]") {
    Game puzzle;
    SolveResult result = solve(puzzle, make_config(200, 100000000));

    REQUIRE(result.ok());
    REQUIRE(result.status == SolveStatus::PARTIAL);
    REQUIRE(result.timed_out);
    REQUIRE_FALSE(result.exhausted);
    REQUIRE(result.elapsed_ms >= 200);
    REQUIRE(result.elapsed_ms < 1200);
    for (const Game& s : result.solutions) {
        REQUIRE(s.grid().is_solved());
    }
}

TEST_CASE("Channel pop honours the deadline", "[solve][channel]") {
    Game solution = load_line(EASY_SOLUTION);
    Deadline past = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
    Deadline future = std::chrono::steady_clock::now() + std::chrono::seconds(5);

    SECTION("queued solutions are not handed out after the deadline") {
        SolutionChannel channel;
        channel.push(solution);
        Game out;
        REQUIRE(channel.pop_until(out, past) == PopResult::TIMEOUT);
        REQUIRE(channel.pop_until(out, future) == PopResult::ITEM);
        REQUIRE(out.grid() == solution.grid());
    }
    SECTION("closing before the deadline means exhaustion") {
        SolutionChannel channel;
        channel.close();
        Game out;
        REQUIRE(channel.pop_until(out, future) == PopResult::CLOSED);
    }
    SECTION("closing after the deadline is a timeout") {
        SolutionChannel channel;
        channel.close();
        Game out;
        REQUIRE(channel.pop_until(out, past) == PopResult::TIMEOUT);
    }
    SECTION("an idle channel times out") {
        SolutionChannel channel;
        Game out;
        Deadline soon = std::chrono::steady_clock::now() + std::chrono::milliseconds(20);
        REQUIRE(channel.pop_until(out, soon) == PopResult::TIMEOUT);
    }
}

TEST_CASE("A complete grid solves to itself", "[solve]") {
    Game puzzle = load_line(EASY_SOLUTION);
    SolveResult result = solve(puzzle, make_config(1000, 1));

    REQUIRE(result.status == SolveStatus::COMPLETE);
    REQUIRE(result.solutions[0].grid() == puzzle.grid());
}

TEST_CASE("Solving twice gives the same solution set", "[solve]") {
    Game puzzle = load_line(TWO_SOLUTIONS_PUZZLE);
    SolveResult first = solve(puzzle.copy(), make_config(5000, 2));
    SolveResult second = solve(puzzle.copy(), make_config(5000, 2));

    REQUIRE(first.solutions.size() == 2);
    REQUIRE(solution_set(first) == solution_set(second));

    Game hard = load_line(HARD_PUZZLE);
    first = solve(hard, make_config(10000, 1));
    second = solve(hard, make_config(10000, 1));
    REQUIRE(solution_set(first) == solution_set(second));
}

TEST_CASE("A single search thread finds the same solution", "[solve]") {
    Game puzzle = load_line(HARD_PUZZLE);
    SolveResult parallel = solve(puzzle, make_config(10000, 1));
    SolveResult serial = solve(puzzle, make_config(10000, 1, 1));

    REQUIRE(serial.status == SolveStatus::COMPLETE);
    REQUIRE(solution_set(serial) == solution_set(parallel));
}

TEST_CASE("Solutions carry their full provenance", "[solve][provenance]") {
    Game puzzle = load_line(HARD_PUZZLE);
    SolveResult result = solve(puzzle, make_config(10000, 1));
    REQUIRE(result.ok());

    const Game& s = result.solutions[0];
    REQUIRE(s.steps().size() == 81);

    int initial = 0;
    int guesses = 0;
    Grid replay;
    for (const Step& step : s.steps()) {
        if (step.initial) initial++;
        if (step.is_guess) guesses++;
        REQUIRE_FALSE((step.initial && step.is_guess));
        REQUIRE_FALSE(replay.has(step.x, step.y));
        replay.set(step.x, step.y, step.z);
    }
    REQUIRE(initial == 17);
    REQUIRE(guesses == s.guess_count());
    REQUIRE(replay == s.grid());

    // clues come first, in load order
    for (int i = 0; i < 17; i++) {
        REQUIRE(s.steps()[i].initial);
    }
}
