#include "sudoku_grid.h"

#include <cstring>
#include <sstream>
#include <stdexcept>

using namespace std;

Grid::Grid() {
    memset(cells, 0, sizeof(cells));
}

void Grid::check(int x, int y) const {
    if (!exists(x, y)) {
        ostringstream oss;
        oss << "Cell " << x << "-" << y << " is outside the grid";
        throw out_of_range(oss.str());
    }
}

int Grid::get(int x, int y) const {
    check(x, y);
    return cells[x][y];
}

void Grid::set(int x, int y, int z) {
    check(x, y);
    if (z < 0 || z > SUDOKU_N) {
        ostringstream oss;
        oss << "Value " << z << " is outside 0.." << SUDOKU_N;
        throw out_of_range(oss.str());
    }
    cells[x][y] = z;
}

void Grid::clear(int x, int y) {
    check(x, y);
    cells[x][y] = 0;
}

bool Grid::has(int x, int y) const {
    check(x, y);
    return cells[x][y] != 0;
}

bool Grid::exists(int x, int y) const {
    return x >= 0 && x < SUDOKU_N && y >= 0 && y < SUDOKU_N;
}

bool Grid::is_allowed(int x, int y, int z) const {
    if (!exists(x, y) || z < 1 || z > SUDOKU_N) return false;

    for (int k = 0; k < SUDOKU_N; k++) {
        if (k != y && cells[x][k] == z) return false;
        if (k != x && cells[k][y] == z) return false;
    }
    int br = (x / SUDOKU_SQRT_N) * SUDOKU_SQRT_N;
    int bc = (y / SUDOKU_SQRT_N) * SUDOKU_SQRT_N;
    for (int i = br; i < br + SUDOKU_SQRT_N; i++) {
        for (int j = bc; j < bc + SUDOKU_SQRT_N; j++) {
            if ((i != x || j != y) && cells[i][j] == z) return false;
        }
    }
    return true;
}

int Grid::row_values(int x) const {
    check(x, 0);
    int used = 0;
    for (int k = 0; k < SUDOKU_N; k++) {
        if (cells[x][k] != 0) used |= value_bit(cells[x][k]);
    }
    return used;
}

int Grid::column_values(int y) const {
    check(0, y);
    int used = 0;
    for (int k = 0; k < SUDOKU_N; k++) {
        if (cells[k][y] != 0) used |= value_bit(cells[k][y]);
    }
    return used;
}

int Grid::block_values(int x, int y) const {
    check(x, y);
    int used = 0;
    int br = (x / SUDOKU_SQRT_N) * SUDOKU_SQRT_N;
    int bc = (y / SUDOKU_SQRT_N) * SUDOKU_SQRT_N;
    for (int i = 0; i < SUDOKU_SQRT_N; i++) {
        for (int j = 0; j < SUDOKU_SQRT_N; j++) {
            int val = cells[br + i][bc + j];
            if (val != 0) used |= value_bit(val);
        }
    }
    return used;
}

void Grid::iterate(const function<void(int, int, int)>& visit) const {
    for (int x = 0; x < SUDOKU_N; x++) {
        for (int y = 0; y < SUDOKU_N; y++) {
            visit(x, y, cells[x][y]);
        }
    }
}

Grid Grid::copy() const {
    return *this;
}

bool Grid::is_solved() const {
    for (int k = 0; k < SUDOKU_N; k++) {
        int br = (k / SUDOKU_SQRT_N) * SUDOKU_SQRT_N;
        int bc = (k % SUDOKU_SQRT_N) * SUDOKU_SQRT_N;
        int row_seen = 0, col_seen = 0, box_seen = 0;
        for (int i = 0; i < SUDOKU_N; i++) {
            if (cells[k][i] == 0 || cells[i][k] == 0) return false;
            row_seen |= value_bit(cells[k][i]);
            col_seen |= value_bit(cells[i][k]);
            box_seen |= value_bit(cells[br + i / SUDOKU_SQRT_N][bc + i % SUDOKU_SQRT_N]);
        }
        if (row_seen != FULL_MASK || col_seen != FULL_MASK || box_seen != FULL_MASK) {
            return false;
        }
    }
    return true;
}

string Grid::to_string() const {
    ostringstream oss;
    for (int x = 0; x < SUDOKU_N; x++) {
        for (int y = 0; y < SUDOKU_N; y++) {
            if (y > 0) oss << ' ';
            if (cells[x][y] == 0) {
                oss << '_';
            } else {
                oss << cells[x][y];
            }
        }
        oss << '\n';
    }
    return oss.str();
}

bool Grid::operator==(const Grid& other) const {
    return memcmp(cells, other.cells, sizeof(cells)) == 0;
}

bool Grid::operator!=(const Grid& other) const {
    return !(*this == other);
}
