#include "sudoku_load.h"

#include <cerrno>
#include <climits>
#include <cstdlib>
#include <sstream>

using namespace std;

namespace {

void place_clue(Game& game, int x, int y, int num, const string& suffix = "") {
    if (!game.grid().is_allowed(x, y, num)) {
        ostringstream oss;
        oss << "Duplicate value " << num << " for item row:" << x + 1
            << ", column:" << y + 1 << suffix;
        throw LoadError(oss.str(), x + 1, y + 1);
    }
    game.set(x, y, num, true, false);
}

// First value seen twice, 0 if none
int find_duplicate(const int* values, int count) {
    int seen = 0;
    for (int i = 0; i < count; i++) {
        if (values[i] == 0) continue;
        int bit = value_bit(values[i]);
        if (seen & bit) return values[i];
        seen |= bit;
    }
    return 0;
}

} // namespace

Game load(const string& text) {
    Game game;
    istringstream lines(text);
    string line;
    int lines_read = 0;

    while (getline(lines, line)) {
        size_t end = line.find_last_not_of(" \t\r");
        if (end == string::npos) break;
        line.erase(end + 1);

        int x = lines_read;
        if (x >= SUDOKU_N) {
            ostringstream oss;
            oss << "Too many rows: row " << x + 1 << " exceeds " << SUDOKU_N;
            throw LoadError(oss.str(), x + 1);
        }

        vector<string> tokens;
        istringstream splitter(line);
        string token;
        while (splitter >> token) {
            tokens.push_back(token);
        }
        if ((int)tokens.size() != SUDOKU_N) {
            ostringstream oss;
            oss << "Invalid number of columns for row " << x + 1 << ": needs "
                << SUDOKU_N << ", actual " << tokens.size();
            throw LoadError(oss.str(), x + 1);
        }

        for (int y = 0; y < SUDOKU_N; y++) {
            const string& val = tokens[y];
            if (val == "_") continue;

            char* rest = nullptr;
            long num = strtol(val.c_str(), &rest, 10);
            if (rest == val.c_str() || *rest != '\0') {
                ostringstream oss;
                oss << "Invalid value '" << val << "' for item row:" << x + 1
                    << ", column:" << y + 1;
                throw LoadError(oss.str(), x + 1, y + 1);
            }
            if (num < 0 || num > SUDOKU_N) {
                ostringstream oss;
                oss << "Invalid value " << num << " for item row:" << x + 1
                    << ", column:" << y + 1;
                throw LoadError(oss.str(), x + 1, y + 1);
            }
            if (num == 0) continue;

            place_clue(game, x, y, (int)num);
        }
        lines_read++;
    }

    if (lines_read != SUDOKU_N) {
        ostringstream oss;
        oss << "Not enough rows: needs " << SUDOKU_N << ", actual " << lines_read;
        throw LoadError(oss.str(), lines_read + 1);
    }
    return game;
}

Game load_line(const string& puzzle) {
    if ((int)puzzle.size() != SUDOKU_CELLS) {
        ostringstream oss;
        oss << "Invalid puzzle length: needs " << SUDOKU_CELLS << ", actual " << puzzle.size();
        throw LoadError(oss.str());
    }

    Game game;
    for (int i = 0; i < SUDOKU_CELLS; i++) {
        int x = i / SUDOKU_N;
        int y = i % SUDOKU_N;
        char c = puzzle[i];
        if (c == '0' || c == '.' || c == '_') continue;
        if (c < '1' || c > '9') {
            ostringstream oss;
            oss << "Invalid character '" << c << "' for item row:" << x + 1
                << ", column:" << y + 1;
            throw LoadError(oss.str(), x + 1, y + 1);
        }
        place_clue(game, x, y, c - '0');
    }
    return game;
}

Game load_steps(const vector<Step>& steps) {
    Game game;
    for (size_t idx = 0; idx < steps.size(); idx++) {
        const Step& step = steps[idx];
        if (!game.grid().exists(step.x, step.y)) {
            ostringstream oss;
            oss << "Invalid offset: " << step.x << "-" << step.y << " for step " << idx;
            throw LoadError(oss.str());
        }
        if (game.grid().has(step.x, step.y)) {
            ostringstream oss;
            oss << "Cell row:" << step.x + 1 << ", column:" << step.y + 1
                << " already set for step " << idx;
            throw LoadError(oss.str(), step.x + 1, step.y + 1);
        }
        if (step.z < 1 || step.z > SUDOKU_N) {
            ostringstream oss;
            oss << "Invalid value " << step.z << " for item row:" << step.x + 1
                << ", column:" << step.y + 1 << " for step " << idx;
            throw LoadError(oss.str(), step.x + 1, step.y + 1);
        }
        ostringstream suffix;
        suffix << " for step " << idx;
        place_clue(game, step.x, step.y, step.z, suffix.str());
    }
    return game;
}

void validate(const Grid& grid) {
    int values[SUDOKU_N];

    for (int x = 0; x < SUDOKU_N; x++) {
        for (int k = 0; k < SUDOKU_N; k++) values[k] = grid.get(x, k);
        int dup = find_duplicate(values, SUDOKU_N);
        if (dup) {
            ostringstream oss;
            oss << "Row " << x + 1 << " contains duplicate value " << dup;
            throw LoadError(oss.str(), x + 1);
        }
    }

    for (int y = 0; y < SUDOKU_N; y++) {
        for (int k = 0; k < SUDOKU_N; k++) values[k] = grid.get(k, y);
        int dup = find_duplicate(values, SUDOKU_N);
        if (dup) {
            ostringstream oss;
            oss << "Column " << y + 1 << " contains duplicate value " << dup;
            throw LoadError(oss.str(), 0, y + 1);
        }
    }

    // visit the top-left cell of each block
    for (int x = 0; x < SUDOKU_N; x += SUDOKU_SQRT_N) {
        for (int y = 0; y < SUDOKU_N; y += SUDOKU_SQRT_N) {
            for (int k = 0; k < SUDOKU_N; k++) {
                values[k] = grid.get(x + k / SUDOKU_SQRT_N, y + k % SUDOKU_SQRT_N);
            }
            int dup = find_duplicate(values, SUDOKU_N);
            if (dup) {
                ostringstream oss;
                oss << "Cell " << x + 1 << "-" << y + 1
                    << " is in block with duplicate value " << dup;
                throw LoadError(oss.str(), x + 1, y + 1);
            }
        }
    }
}

bool parse_count(const char* text, int& out) {
    if (text == nullptr || *text == '\0') return false;
    char* rest = nullptr;
    errno = 0;
    long value = strtol(text, &rest, 10);
    if (rest == text || *rest != '\0' || errno == ERANGE) return false;
    if (value < 0 || value > INT_MAX) return false;
    out = (int)value;
    return true;
}
