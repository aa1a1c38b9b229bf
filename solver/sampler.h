#pragma once

#include <cstdint>
#include <random>
#include <vector>

#include "dice.h"
#include "grid.h"

namespace boggle {

using Rng = std::mt19937;

// Shuffles `dice` in place, then rolls one die per cell in row-major order.
// Blank faces are re-rolled. Draws use rng() % n so that a seed gives the
// same board with every standard library.
Grid sample_board(std::vector<Die>& dice, int height, int width, Rng& rng);

}  // namespace boggle
