#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

#include "dice.h"
#include "dictionary.h"
#include "errors.h"
#include "generate.h"
#include "sampler.h"
#include "search.h"
#include "test_support.h"

using namespace boggle_tests;
using boggle::Dictionary;
using boggle::GenerateOptions;
using boggle::GenerateResult;

namespace {

Dictionary common_words() {
    return Dictionary::from_words({
        "THE", "AND", "ARE", "ATE", "EAT", "TEA", "TEN", "NET", "SET", "SIT", "ITS", "TIE",
        "TOE", "HOT", "NOT", "TON", "ONE", "EON", "SON", "NOD", "RED", "ROD", "DOE", "HEN",
        "HER", "HIS", "HIT", "OAT", "OAR", "ORE", "ROE", "RAT", "TAR", "ART", "SAT", "SEA",
        "TIN", "NIT", "SIN", "INN", "DEN", "END", "NET", "TOT", "TOO", "HOE", "SHE", "HAS",
        "ASH", "RAN", "NAG", "AGE", "EGO", "ODE", "DOT", "LOT", "LET", "LIE", "OIL", "SOIL",
        "TOIL", "RISE", "SIRE", "TIRE", "TIER", "RITE", "SITE", "TIES", "NEST", "NETS", "TENS",
        "SENT", "TONE", "NOTE", "STONE", "ONSET", "NOTES", "TONES", "REST", "TREE", "TREES",
        "STEER", "RESET", "TERSE", "ENTER", "TREND", "SNORE", "STORE", "HOSE", "SHOE", "HOES",
        "SHOT", "HOST", "TOSH", "OATH", "HEAT", "HATE", "EATS", "SEAT", "EAST", "TEAS", "RATE",
        "TEAR", "STARE", "TEARS", "RATES", "HEART", "EARTH", "HATER", "OTHER", "THOSE", "THESE",
        "THEIR", "DIET", "EDIT", "TIDE", "TIED", "SIDE", "DIES", "RIDE", "DIRE", "WIDE", "WOE",
        "OWE", "TOW", "TWO", "NOW", "OWN", "WON", "NEW", "WEN", "HOW", "WHO", "BOO", "JOB",
        "BOB", "OBOE", "ODOR", "DOOR", "ROOT", "TOOT", "SOOT", "MUST", "SUIT", "UNIT", "UNTIE",
        "MINT", "EMIT", "TIME", "ITEM", "MITE", "SMITE", "TIMES", "ITEMS", "YET", "YES", "LYE",
    });
}

GenerateOptions bounded(uint32_t seed) {
    GenerateOptions opts;
    opts.min_words = 3;
    opts.max_words = 60;
    opts.min_score = 3;
    opts.max_score = 80;
    opts.min_longest = 4;
    opts.max_longest = 7;
    opts.max_tries = 100000;
    opts.seed = seed;
    return opts;
}

TestResult test_deterministic() {
    return run_test("same seed generates the same board", [](TestResult& r) {
        auto dict = common_words();
        const auto& dice = boggle::find_dice_set("4")->dice;
        GenerateResult a = boggle::generate(dict, dice, kScores, 4, 4, bounded(7));
        GenerateResult b = boggle::generate(dict, dice, kScores, 4, 4, bounded(7));
        r.passed = a.grid.faces == b.grid.faces && a.words == b.words && a.tries == b.tries &&
                   a.grid.faces.size() == 16;
        r.message = a.grid.faces + " after " + std::to_string(a.tries) + " tries";
    });
}

TestResult test_constraints_hold() {
    return run_test("accepted boards meet every bound", [](TestResult& r) {
        auto dict = common_words();
        bool ok = true;
        int total_tries = 0;
        for (const char* name : {"4", "4-classic", "5"}) {
            const boggle::DiceSet* set = boggle::find_dice_set(name);
            for (uint32_t seed = 1; ok && seed <= 5; seed++) {
                GenerateOptions opts = bounded(seed);
                GenerateResult g = boggle::generate(dict, set->dice, kScores, set->size, set->size, opts);
                total_tries += g.tries;
                int n = (int)g.words.size();
                if (n < opts.min_words || n > opts.max_words || g.words.score < opts.min_score ||
                    g.words.score > opts.max_score || g.words.longest < opts.min_longest ||
                    g.words.longest > opts.max_longest || g.tries < 1 || g.tries > opts.max_tries ||
                    !boggle::satisfies(g.words, opts)) {
                    ok = false;
                    r.message = std::string("bounds broken for ") + name + " seed " + std::to_string(seed);
                }
            }
        }
        r.passed = ok;
        if (ok) r.message = std::to_string(total_tries) + " tries in total";
    });
}

TestResult test_exhausted() {
    return run_test("try budget is a hard ceiling", [](TestResult& r) {
        auto dict = common_words();
        const auto& dice = boggle::find_dice_set("4")->dice;
        GenerateOptions opts;
        opts.min_words = 1000000;
        opts.max_tries = 10;
        opts.seed = 3;
        int attempts = -1;
        try {
            boggle::generate(dict, dice, kScores, 4, 4, opts);
        } catch (const boggle::BoardGenerationExhaustedError& e) {
            attempts = e.attempts();
        }

        opts.max_tries = 0;
        int none = -1;
        try {
            boggle::generate(dict, dice, kScores, 4, 4, opts);
        } catch (const boggle::BoardGenerationExhaustedError& e) {
            none = e.attempts();
        }
        r.passed = attempts == 10 && none == 0;
        r.message = "attempts=" + std::to_string(attempts);
    });
}

TestResult test_try_budget_boundary() {
    return run_test("try budget counts sampled boards", [](TestResult& r) {
        auto dict = common_words();
        const auto& dice = boggle::find_dice_set("4")->dice;
        GenerateOptions opts = bounded(1);

        // a seed whose first board is rejected
        GenerateResult g;
        for (uint32_t seed = 1; seed <= 200; seed++) {
            opts = bounded(seed);
            g = boggle::generate(dict, dice, kScores, 4, 4, opts);
            if (g.tries >= 2) break;
        }
        if (g.tries < 2) {
            r.message = "no seed needed more than one board";
            return;
        }
        const int t = g.tries;

        opts.max_tries = t - 1;
        int attempts = -1;
        try {
            boggle::generate(dict, dice, kScores, 4, 4, opts);
        } catch (const boggle::BoardGenerationExhaustedError& e) {
            attempts = e.attempts();
        }
        opts.max_tries = t;
        GenerateResult exact = boggle::generate(dict, dice, kScores, 4, 4, opts);

        // draw the same boards by hand; only the last one passes
        boggle::Rng rng(opts.seed);
        std::vector<boggle::Die> set = dice;
        bool rejected = true;
        boggle::Grid last;
        for (int i = 1; i <= t; i++) {
            last = boggle::sample_board(set, 4, 4, rng);
            if (i < t && boggle::satisfies(boggle::solve(dict, last, kScores, opts.min_legal), opts))
                rejected = false;
        }

        r.passed = attempts == t - 1 && exact.tries == t && exact.grid.faces == g.grid.faces &&
                   last.faces == g.grid.faces && rejected;
        r.message = "seed " + std::to_string(opts.seed) + " accepted on try " + std::to_string(t) +
                    ", exhausted after " + std::to_string(attempts);
    });
}

TestResult test_restore_replays_generate() {
    return run_test("restore replays a generated board", [](TestResult& r) {
        auto dict = common_words();
        const boggle::DiceSet* set = boggle::find_dice_set("5");
        GenerateOptions opts = bounded(11);
        GenerateResult g = boggle::generate(dict, set->dice, kScores, 5, 5, opts);
        boggle::WordSet again = boggle::restore(dict, kScores, 5, 5, g.grid.faces, opts.min_legal);
        r.passed = again == g.words;
        r.message = g.grid.faces;
    });
}

TestResult test_blank_faces_never_rolled() {
    return run_test("blank faces never reach the board", [](TestResult& r) {
        auto dict = common_words();
        const boggle::DiceSet* set = boggle::find_dice_set("6-super");
        GenerateOptions opts;
        opts.min_words = 0;
        opts.min_score = 0;
        opts.min_longest = 0;
        bool ok = true;
        for (uint32_t seed = 0; ok && seed < 20; seed++) {
            opts.seed = seed;
            GenerateResult g = boggle::generate(dict, set->dice, kScores, 6, 6, opts);
            if (g.tries != 1 || g.grid.faces.find('0') != std::string::npos) ok = false;
        }
        r.passed = ok;
        r.message = ok ? "ok" : "blank face on board";
    });
}

TestResult test_bad_inputs() {
    return run_test("bad generate and restore inputs", [](TestResult& r) {
        auto dict = common_words();
        const auto& dice = boggle::find_dice_set("4")->dice;
        GenerateOptions opts;
        bool count = throws<boggle::InvalidDiceStringError>(
            [&] { boggle::generate(dict, dice, kScores, 5, 5, opts); });
        bool length = throws<boggle::InvalidDiceStringError>(
            [&] { boggle::restore(dict, kScores, 4, 4, "ADYERESTLPNAGIE", 3); });
        bool symbol = throws<boggle::InvalidDiceStringError>(
            [&] { boggle::restore(dict, kScores, 2, 2, "AB9D", 3); });
        boggle::ScoreTable tiny = {0, 0, 0};
        bool table = throws<boggle::InvalidScoreTableError>(
            [&] { boggle::generate(dict, dice, tiny, 4, 4, opts); });
        bool huge = throws<std::invalid_argument>(
            [&] { boggle::generate(dict, dice, kScores, 70000, 70000, opts); });
        bool huge_restore = throws<std::invalid_argument>(
            [&] { boggle::restore(dict, kScores, 70000, 70000, "", 3); });
        r.passed = count && length && symbol && table && huge && huge_restore;
        r.message = r.passed ? "ok" : "bad input accepted";
    });
}

TestResult test_satisfies_unbounded() {
    return run_test("-1 leaves a max bound open", [](TestResult& r) {
        boggle::WordSet ws;
        ws.words = {"aaa", "bbb"};
        ws.score = 1000;
        ws.longest = 3;
        GenerateOptions opts;
        bool open = boggle::satisfies(ws, opts);
        opts.max_score = 999;
        bool capped = boggle::satisfies(ws, opts);
        opts.max_score = -1;
        opts.min_words = 3;
        bool too_few = boggle::satisfies(ws, opts);
        r.passed = open && !capped && !too_few;
        r.message = r.passed ? "ok" : "wrong bound check";
    });
}

}  // namespace

int main() {
    std::vector<TestResult> results;
    results.push_back(test_deterministic());
    results.push_back(test_constraints_hold());
    results.push_back(test_exhausted());
    results.push_back(test_try_budget_boundary());
    results.push_back(test_restore_replays_generate());
    results.push_back(test_blank_faces_never_rolled());
    results.push_back(test_bad_inputs());
    results.push_back(test_satisfies_unbounded());
    return report(results);
}
