#pragma once

#include <string>
#include <vector>

namespace boggle {

constexpr int kNumFaces = 6;

// Six face symbols, see grid.h for the codes.
using Die = std::string;

struct DiceSet {
    std::string name;
    std::string desc;
    int size;  // side length of the board
    std::vector<Die> dice;
};

const std::vector<DiceSet>& builtin_dice_sets();
// nullptr when no built-in set has that name.
const DiceSet* find_dice_set(const std::string& name);

// Throws InvalidDiceStringError unless there is one well-formed die per cell.
void validate_dice(const std::vector<Die>& dice, int cells);

}  // namespace boggle
