#pragma once

#include <string>
#include <vector>

namespace boggle {

// Face codes for multi-letter tiles. '0' is the blank face, which may sit on
// a die but is never rolled.
enum class MultiFace : char {
    Blank = '0',
    Qu = '1',
    In = '2',
    Th = '3',
    Er = '4',
    He = '5',
    An = '6',
};

bool is_face_symbol(char symbol);
bool is_blank_face(char symbol);

// Uppercase letters spelled by one face, e.g. "A" or "QU".
std::string face_letters(char symbol);
// How a face is shown to a player, e.g. "A" or "Qu".
std::string face_display(char symbol);

struct Coord {
    int row;
    int col;
};

inline bool operator==(const Coord& a, const Coord& b) { return a.row == b.row && a.col == b.col; }

struct Grid {
    int height = 0;
    int width = 0;
    std::string faces;  // row-major, one symbol per cell

    int size() const { return height * width; }
    int index(Coord c) const { return c.row * width + c.col; }
    Coord coord(int i) const { return Coord{i / width, i % width}; }
    char at(Coord c) const { return faces[index(c)]; }
};

// Number of cells of a height x width board. Throws std::invalid_argument for
// negative dimensions or a product that does not fit in an int.
int cell_count(int height, int width);

// Validates `faces` against the board shape. Lowercase letters are folded.
Grid make_grid(int height, int width, const std::string& faces);

std::vector<Coord> adjacent_cells(const Grid& grid, Coord c);
// Neighbour lists for every cell index of a height x width board.
std::vector<std::vector<int>> build_neighbors(int height, int width);

}  // namespace boggle
