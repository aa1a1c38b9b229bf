#include "sampler.h"

#include <cctype>
#include <utility>

namespace boggle {

namespace {

// Fisher-Yates
void shuffle_dice(std::vector<Die>& dice, Rng& rng) {
    const uint32_t n = (uint32_t)dice.size();
    for (uint32_t i = 0; i + 1 < n; i++) {
        uint32_t j = i + rng() % (n - i);
        std::swap(dice[i], dice[j]);
    }
}

char roll(const Die& die, Rng& rng) {
    for (;;) {
        char face = die[rng() % die.size()];
        if (!is_blank_face(face)) return (char)std::toupper((unsigned char)face);
    }
}

}  // namespace

Grid sample_board(std::vector<Die>& dice, int height, int width, Rng& rng) {
    Grid g;
    g.height = height;
    g.width = width;
    shuffle_dice(dice, rng);

    g.faces.reserve(g.size());
    for (int i = 0; i < g.size(); i++) g.faces.push_back(roll(dice[i], rng));
    return g;
}

}  // namespace boggle
