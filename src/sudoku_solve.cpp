#include <cstring>
#include <iomanip>
#include <iostream>
#include <iterator>
#include <string>

#include "sudoku_load.h"
#include "sudoku_omp.h"

using namespace std;

// Usage: sudoku_solve [-v] [timeout_ms] [min_solutions] [threads] < puzzle
// The puzzle is either nine lines of nine tokens or one 81-character line.
// Exit code: 0 solved, 1 no solution found, 2 invalid input.
int main(int argc, char* argv[]) {
    ios::sync_with_stdio(false);

    const string usage = string("Usage: ") + argv[0] + " [-v] [timeout_ms] [min_solutions] [threads]";

    SolveConfig config;
    int positional = 0;
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-v") == 0) {
            config.verbose = true;
            continue;
        }
        int value = 0;
        if (!parse_count(argv[i], value)) {
            cerr << "Invalid argument '" << argv[i] << "'\n" << usage << endl;
            return 2;
        }
        switch (positional++) {
        case 0: config.timeout = chrono::milliseconds(value); break;
        case 1: config.min_solutions = value; break;
        case 2: config.threads = value; break;
        default:
            cerr << usage << endl;
            return 2;
        }
    }

    string input((istreambuf_iterator<char>(cin)), istreambuf_iterator<char>());
    size_t first = input.find_first_not_of(" \t\r\n");
    size_t last = input.find_last_not_of(" \t\r\n");
    string compact = first == string::npos ? string() : input.substr(first, last - first + 1);

    Game game;
    try {
        if ((int)compact.size() == SUDOKU_CELLS && compact.find_first_of(" \t\n") == string::npos) {
            game = load_line(compact);
        } else {
            game = load(input.substr(first == string::npos ? 0 : first));
        }
    } catch (const LoadError& e) {
        cerr << "Error: " << e.what() << endl;
        return 2;
    }

    SolveResult result = solve(game, config);

    if (!result.ok()) {
        cout << "No solution found." << (result.timed_out ? " (timeout)" : "") << endl;
        return 1;
    }

    cout << fixed << setprecision(4) << result.elapsed_ms << " ms" << endl;
    for (size_t i = 0; i < result.solutions.size(); i++) {
        const Game& s = result.solutions[i];
        cout << "\nSolution " << i + 1 << " (guesses: " << s.guess_count() << ")\n"
             << s.to_string();
        if (config.verbose) {
            cerr << s.provenance();
        }
    }
    return 0;
}
