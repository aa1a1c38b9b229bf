#include "grid.h"

#include <cctype>
#include <climits>
#include <stdexcept>

#include "errors.h"

namespace boggle {

namespace {

struct MultiFaceInfo {
    MultiFace code;
    const char* letters;
    const char* display;
};

const MultiFaceInfo kMultiFaces[] = {
    {MultiFace::Qu, "QU", "Qu"},
    {MultiFace::In, "IN", "In"},
    {MultiFace::Th, "TH", "Th"},
    {MultiFace::Er, "ER", "Er"},
    {MultiFace::He, "HE", "He"},
    {MultiFace::An, "AN", "An"},
};

const MultiFaceInfo* find_multi_face(char symbol) {
    for (const auto& f : kMultiFaces) {
        if ((char)f.code == symbol) return &f;
    }
    return nullptr;
}

std::string describe(char symbol) {
    unsigned char c = (unsigned char)symbol;
    if (std::isprint(c)) return std::string("'") + symbol + "'";
    return "byte " + std::to_string((int)c);
}

}  // namespace

bool is_blank_face(char symbol) { return symbol == (char)MultiFace::Blank; }

bool is_face_symbol(char symbol) {
    if (symbol >= 'A' && symbol <= 'Z') return true;
    if (symbol >= 'a' && symbol <= 'z') return true;
    return find_multi_face(symbol) != nullptr;
}

std::string face_letters(char symbol) {
    if (symbol >= 'A' && symbol <= 'Z') return std::string(1, symbol);
    if (symbol >= 'a' && symbol <= 'z') return std::string(1, (char)(symbol - 'a' + 'A'));
    if (const MultiFaceInfo* f = find_multi_face(symbol)) return f->letters;
    throw InvalidDiceStringError("invalid face symbol " + describe(symbol));
}

std::string face_display(char symbol) {
    if (const MultiFaceInfo* f = find_multi_face(symbol)) return f->display;
    return face_letters(symbol);
}

int cell_count(int height, int width) {
    if (height < 0 || width < 0)
        throw std::invalid_argument("board dimensions must not be negative");
    if (width > 0 && height > INT_MAX / width)
        throw std::invalid_argument("board " + std::to_string(height) + "x" + std::to_string(width) +
                                    " has too many cells");
    return height * width;
}

Grid make_grid(int height, int width, const std::string& faces) {
    const int cells = cell_count(height, width);

    Grid g;
    g.height = height;
    g.width = width;
    if (faces.size() != (std::size_t)cells) {
        throw InvalidDiceStringError("board string must contain " + std::to_string(cells) +
                                     " faces, got " + std::to_string(faces.size()));
    }
    g.faces.reserve(faces.size());
    for (char ch : faces) {
        if (!is_face_symbol(ch)) throw InvalidDiceStringError("invalid face symbol " + describe(ch));
        g.faces.push_back((char)std::toupper((unsigned char)ch));
    }
    return g;
}

std::vector<Coord> adjacent_cells(const Grid& grid, Coord c) {
    std::vector<Coord> out;
    for (int dr = -1; dr <= 1; dr++) for (int dc = -1; dc <= 1; dc++) {
        if (dr == 0 && dc == 0) continue;
        int nr = c.row + dr, nc = c.col + dc;
        if (0 <= nr && nr < grid.height && 0 <= nc && nc < grid.width)
            out.push_back(Coord{nr, nc});
    }
    return out;
}

std::vector<std::vector<int>> build_neighbors(int height, int width) {
    std::vector<std::vector<int>> nbr(cell_count(height, width));
    auto idx = [width](int r, int c) { return r * width + c; };
    for (int r = 0; r < height; r++) for (int c = 0; c < width; c++) {
        int v = idx(r, c);
        for (int dr = -1; dr <= 1; dr++) for (int dc = -1; dc <= 1; dc++) {
            if (dr == 0 && dc == 0) continue;
            int nr = r + dr, nc = c + dc;
            if (0 <= nr && nr < height && 0 <= nc && nc < width)
                nbr[v].push_back(idx(nr, nc));
        }
    }
    return nbr;
}

}  // namespace boggle
