#pragma once

#include <set>
#include <string>
#include <vector>

#include "dictionary.h"
#include "grid.h"

namespace boggle {

// Points per word, indexed by word length.
using ScoreTable = std::vector<int>;

struct WordSet {
    std::set<std::string> words;      // lowercase, sorted
    std::vector<int> count_by_length; // index = word length
    int longest = 0;
    int score = 0;

    std::size_t size() const { return words.size(); }
    bool empty() const { return words.empty(); }
    bool contains(const std::string& w) const { return words.count(w) != 0; }

    bool operator==(const WordSet& o) const {
        return words == o.words && count_by_length == o.count_by_length &&
               longest == o.longest && score == o.score;
    }
    bool operator!=(const WordSet& o) const { return !(*this == o); }
};

// Bounds checked while a board is being searched. -1 leaves a bound open.
struct SearchLimits {
    int min_legal = 3;
    int max_words = -1;
    int max_score = -1;
    int max_longest = -1;
};

WordSet solve(const Dictionary& dict, const Grid& grid, const ScoreTable& scores, int min_legal);

// Same search, but gives up and returns false as soon as `out` goes past one
// of the max bounds in `limits`. `out` is cleared first.
bool search_board(const Dictionary& dict, const Grid& grid, const ScoreTable& scores,
                  const SearchLimits& limits, WordSet& out);

}  // namespace boggle
