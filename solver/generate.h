#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "dice.h"
#include "dictionary.h"
#include "grid.h"
#include "search.h"

namespace boggle {

// -1 on a max bound means unbounded.
struct GenerateOptions {
    int min_words = 1;
    int max_words = -1;
    int min_score = 1;
    int max_score = -1;
    int min_longest = 3;
    int max_longest = -1;
    int min_legal = 3;
    int max_tries = 100000;
    uint32_t seed = 0;
};

struct GenerateResult {
    Grid grid;
    WordSet words;
    int tries = 0;  // attempts used, including the accepted one
};

bool satisfies(const WordSet& words, const GenerateOptions& opts);

// Rolls boards from `dice` until one meets every bound in `opts`. The first
// board that passes is returned. Throws BoardGenerationExhaustedError after
// opts.max_tries rejected boards.
GenerateResult generate(const Dictionary& dict, const std::vector<Die>& dice, const ScoreTable& scores,
                        int height, int width, const GenerateOptions& opts);

// Rebuilds a board from its face string and solves it.
WordSet restore(const Dictionary& dict, const ScoreTable& scores, int height, int width,
                const std::string& faces, int min_legal = 3);

}  // namespace boggle
