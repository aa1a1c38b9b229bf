#include "generate.h"

#include "errors.h"
#include "sampler.h"

namespace boggle {

namespace {

bool within(int value, int lo, int hi) { return value >= lo && (hi < 0 || value <= hi); }

}  // namespace

bool satisfies(const WordSet& words, const GenerateOptions& opts) {
    return within((int)words.size(), opts.min_words, opts.max_words) &&
           within(words.score, opts.min_score, opts.max_score) &&
           within(words.longest, opts.min_longest, opts.max_longest);
}

GenerateResult generate(const Dictionary& dict, const std::vector<Die>& dice, const ScoreTable& scores,
                        int height, int width, const GenerateOptions& opts) {
    validate_dice(dice, cell_count(height, width));

    SearchLimits limits;
    limits.min_legal = opts.min_legal;
    limits.max_words = opts.max_words;
    limits.max_score = opts.max_score;
    limits.max_longest = opts.max_longest;

    Rng rng(opts.seed);
    std::vector<Die> set = dice;
    GenerateResult r;
    int attempts = 0;
    while (attempts < opts.max_tries) {
        r.grid = sample_board(set, height, width, rng);
        attempts++;
        if (search_board(dict, r.grid, scores, limits, r.words) && satisfies(r.words, opts)) {
            r.tries = attempts;
            return r;
        }
    }
    throw BoardGenerationExhaustedError(attempts);
}

WordSet restore(const Dictionary& dict, const ScoreTable& scores, int height, int width,
                const std::string& faces, int min_legal) {
    return solve(dict, make_grid(height, width, faces), scores, min_legal);
}

}  // namespace boggle
