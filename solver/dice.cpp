#include "dice.h"

#include "errors.h"
#include "grid.h"

namespace boggle {

const std::vector<DiceSet>& builtin_dice_sets() {
    static const std::vector<DiceSet> sets = {
        {"4-classic", "4x4 Classic", 4, {
            "AACIOT", "ABILTY", "ABJMOQ", "ACDEMP",
            "ACELRS", "ADENVZ", "AHMORS", "BIFORX",
            "DENOSW", "DKNOTU", "EEFHIY", "EGKLUY",
            "EGINTV", "EHINPS", "ELPSTU", "GILRUW",
        }},
        {"4", "4x4 Revised", 4, {
            "AAEEGN", "ABBJOO", "ACHOPS", "AFFKPS",
            "AOOTTW", "CIMOTU", "DEILRX", "DELRVY",
            "DISTTY", "EEGHNW", "EEINSU", "EHRTVW",
            "EIOSST", "ELRTTY", "HIMNU1", "HLNNRZ",
        }},
        {"5-orig", "5x5 Original", 5, {
            "AAAFRS", "AAEEEE", "AAFIRS", "ADENNN", "AEEEEM",
            "AEEGMU", "AEGMNN", "AFIRSY", "BJK1XZ", "CCENST",
            "CEIILT", "CEIPST", "DDHNOT", "DHHLOR", "DHHLOR",
            "DHLNOR", "EIIITT", "CEILPT", "EMOTTT", "ENSSSU",
            "FIPRSY", "GORRVW", "IPRRRY", "NOOTUW", "OOOTTU",
        }},
        {"5-challenge", "5x5 Challenge", 5, {
            "AAAFRS", "AAEEEE", "AAFIRS", "ADENNN", "AEEEEM",
            "AEEGMU", "AEGMNN", "AFIRSY", "BJK1XZ", "CCENST",
            "CEIILT", "CEIPST", "DDHNOT", "DHHLOR", "IKLM1U",
            "DHLNOR", "EIIITT", "CEILPT", "EMOTTT", "ENSSSU",
            "FIPRSY", "GORRVW", "IPRRRY", "NOOTUW", "OOOTTU",
        }},
        {"5-big-deluxe", "5x5 Big Deluxe", 5, {
            "AAAFRS", "AAEEEE", "AAFIRS", "ADENNN", "AEEEEM",
            "AEEGMU", "AEGMNN", "AFIRSY", "BJK1XZ", "CCNSTW",
            "CEIILT", "CEIPST", "DDLNOR", "DHHLOR", "DHHNOT",
            "DHLNOR", "EIIITT", "CEILPT", "EMOTTT", "ENSSSU",
            "FIPRSY", "GORRVW", "HIPRRY", "NOOTUW", "OOOTTU",
        }},
        {"5", "5x5 Big 2012", 5, {
            "AAAFRS", "AAEEEE", "AAFIRS", "ADENNN", "AEEEEM",
            "AEEGMU", "AEGMNN", "AFIRSY", "BBJKXZ", "CCENST",
            "EIILST", "CEIPST", "DDHNOT", "DHHLOR", "DHHNOW",
            "DHLNOR", "EIIITT", "EILPST", "EMOTTT", "ENSSSU",
            "123456", "GORRVW", "IPRSYY", "NOOTUW", "OOOTTU",
        }},
        {"6-super", "6x6 Super Big", 6, {
            "AAAFRS", "AAEEEE", "AAEEOO", "AAFIRS", "ABDEIO", "ADENNN",
            "AEEEEM", "AEEGMU", "AEGMNN", "AEILMN", "AEINOU", "AFIRSY",
            "123456", "BBJKXZ", "CCENST", "CDDLNN", "CEIITT", "CEIPST",
            "CFGNUY", "DDHNOT", "DHHLOR", "DHHNOW", "DHLNOR", "EHILRS",
            "EIILST", "EILPST", "EIO000", "EMTTTO", "ENSSSU", "GORRVW",
            "HIRSTV", "HOPRST", "IPRSYY", "JK1WXZ", "NOOTUW", "OOOTTU",
        }},
        {"6", "6x6 Super Big Simple", 6, {
            "AAAFRS", "AAEEEE", "AAEEOO", "AAFIRS", "ABDEIO", "ADENNN",
            "AEEEEM", "AEEGMU", "AEGMNN", "AEILMN", "AEINOU", "AFIRSY",
            "AEIOUS", "BBJKXZ", "CCENST", "CDDLNN", "CEIITT", "CEIPST",
            "CFGNUY", "DDHNOT", "DHHLOR", "DHHNOW", "DHLNOR", "EHILRS",
            "EIILST", "EILPST", "EIOSSS", "EMTTTO", "ENSSSU", "GORRVW",
            "HIRSTV", "HOPRST", "IPRSYY", "JK1WXZ", "NOOTUW", "OOOTTU",
        }},
    };
    return sets;
}

const DiceSet* find_dice_set(const std::string& name) {
    for (const auto& s : builtin_dice_sets()) {
        if (s.name == name) return &s;
    }
    return nullptr;
}

void validate_dice(const std::vector<Die>& dice, int cells) {
    if ((int)dice.size() != cells) {
        throw InvalidDiceStringError("board has " + std::to_string(cells) + " cells but " +
                                     std::to_string(dice.size()) + " dice were given");
    }
    for (const auto& die : dice) {
        if ((int)die.size() != kNumFaces)
            throw InvalidDiceStringError("die \"" + die + "\" must have " + std::to_string(kNumFaces) + " faces");
        int blanks = 0;
        for (char f : die) {
            if (is_blank_face(f)) {
                blanks++;
            } else if (!is_face_symbol(f)) {
                throw InvalidDiceStringError("die \"" + die + "\" has an invalid face");
            }
        }
        if (blanks == kNumFaces) throw InvalidDiceStringError("die \"" + die + "\" has only blank faces");
    }
}

}  // namespace boggle
