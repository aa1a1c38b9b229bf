// Command-line driver: restore or generate a board and print its words.

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <iostream>
#include <string>

#include "dice.h"
#include "dictionary.h"
#include "errors.h"
#include "generate.h"
#include "grid.h"
#include "search.h"

namespace {

const boggle::ScoreTable kDefaultScores = {0, 0, 0, 1, 1, 2, 3, 5, 11, 11, 11, 11, 11, 11, 11, 11, 11};

void usage_and_die(char** argv) {
    fprintf(stderr,
            "Usage: %s restore <dictionary> <height> <width> <faces> [--min-legal N] [--dawg]\n"
            "       %s generate <dictionary> <dice-set> [--seed N] [--min-words N] [--max-words N]\n"
            "           [--min-score N] [--max-score N] [--min-longest N] [--max-longest N]\n"
            "           [--min-legal N] [--max-tries N] [--dawg]\n",
            argv[0], argv[0]);
    exit(1);
}

bool parse_int(const char* s, long long& out) {
    if (s == nullptr) return false;
    char* end = nullptr;
    const long long v = std::strtoll(s, &end, 10);
    if (end == s || *end != '\0') return false;
    out = v;
    return true;
}

int int_arg(const char* s, char** argv) {
    long long v = 0;
    if (!parse_int(s, v)) {
        fprintf(stderr, "Expected a number, got '%s'\n", s ? s : "");
        usage_and_die(argv);
    }
    return (int)v;
}

void print_board(const boggle::Grid& g) {
    for (int r = 0; r < g.height; r++) {
        for (int c = 0; c < g.width; c++) {
            std::string f = boggle::face_display(g.at(boggle::Coord{r, c}));
            std::cout << f << (f.size() == 1 ? "  " : " ");
        }
        std::cout << "\n";
    }
}

void print_words(const boggle::WordSet& ws) {
    for (const auto& w : ws.words) std::cout << w << "\n";
    std::cout << ws.size() << " words, score " << ws.score << ", longest " << ws.longest << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 4) usage_and_die(argv);

    const std::string mode = argv[1];
    const std::string dict_file = argv[2];

    // positional arguments first, then --flags
    int first_flag = mode == "restore" ? 6 : mode == "generate" ? 4 : -1;
    if (first_flag < 0 || argc < first_flag) usage_and_die(argv);

    bool packed = false;
    int min_legal = 3;
    boggle::GenerateOptions opts;
    for (int i = first_flag; i < argc; i++) {
        const std::string a = argv[i];
        const char* v = i + 1 < argc ? argv[i + 1] : nullptr;
        if (a == "--dawg") { packed = true; continue; }
        if (v == nullptr) usage_and_die(argv);
        if (a == "--min-legal") min_legal = opts.min_legal = int_arg(v, argv);
        else if (a == "--seed") {
            long long seed = 0;
            if (!parse_int(v, seed) || seed < 0 || seed > 0xFFFFFFFFLL) usage_and_die(argv);
            opts.seed = (uint32_t)seed;
        }
        else if (a == "--min-words") opts.min_words = int_arg(v, argv);
        else if (a == "--max-words") opts.max_words = int_arg(v, argv);
        else if (a == "--min-score") opts.min_score = int_arg(v, argv);
        else if (a == "--max-score") opts.max_score = int_arg(v, argv);
        else if (a == "--min-longest") opts.min_longest = int_arg(v, argv);
        else if (a == "--max-longest") opts.max_longest = int_arg(v, argv);
        else if (a == "--max-tries") opts.max_tries = int_arg(v, argv);
        else usage_and_die(argv);
        i++;
    }

    try {
        auto dict = packed ? boggle::Dictionary::from_packed_dawg(dict_file)
                           : boggle::Dictionary::from_file(dict_file);
        std::cerr << "Loaded " << dict.num_words() << " words, " << dict.num_nodes() << " nodes" << std::endl;

        if (mode == "restore") {
            int height = int_arg(argv[3], argv);
            int width = int_arg(argv[4], argv);
            boggle::Grid g = boggle::make_grid(height, width, argv[5]);
            print_board(g);
            print_words(boggle::solve(dict, g, kDefaultScores, min_legal));
        } else {
            const boggle::DiceSet* set = boggle::find_dice_set(argv[3]);
            if (set == nullptr) {
                std::cerr << "Unknown dice set " << argv[3] << std::endl;
                return 1;
            }
            auto r = boggle::generate(dict, set->dice, kDefaultScores, set->size, set->size, opts);
            std::cerr << "tries: " << r.tries << std::endl;
            std::cout << r.grid.faces << "\n";
            print_board(r.grid);
            print_words(r.words);
        }
    } catch (const boggle::BoardGenerationExhaustedError& e) {
        std::cerr << e.what() << std::endl;
        return 2;
    } catch (const std::exception& e) {
        std::cerr << e.what() << std::endl;
        return 1;
    }
    return 0;
}
