#include "search.h"

#include "errors.h"

namespace boggle {

namespace {

struct Search {
    const Dictionary& dict;
    const ScoreTable& scores;
    const SearchLimits& limits;
    std::vector<std::string> letters;  // expanded face per cell
    std::vector<std::vector<int>> nbr;
    std::vector<char> used;
    std::string cur;
    WordSet& out;

    Search(const Dictionary& d, const Grid& g, const ScoreTable& s, const SearchLimits& l, WordSet& o)
        : dict(d), scores(s), limits(l), nbr(build_neighbors(g.height, g.width)), used(g.size(), 0), out(o) {
        letters.reserve(g.size());
        for (char f : g.faces) letters.push_back(face_letters(f));
        cur.reserve(2 * g.size());
    }

    // Returns false once a max bound is exceeded.
    bool record() {
        if (!out.words.insert(cur).second) return true;

        int len = (int)cur.size();
        if (len >= (int)scores.size()) {
            throw InvalidScoreTableError("score table has " + std::to_string(scores.size()) +
                                         " entries, found a word of length " + std::to_string(len));
        }
        if ((int)out.count_by_length.size() <= len) out.count_by_length.resize(len + 1, 0);
        out.count_by_length[len]++;
        out.score += scores[len];
        if (len > out.longest) out.longest = len;

        if (limits.max_words >= 0 && (int)out.words.size() > limits.max_words) return false;
        if (limits.max_score >= 0 && out.score > limits.max_score) return false;
        if (limits.max_longest >= 0 && out.longest > limits.max_longest) return false;
        return true;
    }

    bool dfs(int cell, int node) {
        const std::string& face = letters[cell];
        int nxt = node;
        for (char c : face) {
            nxt = dict.child(nxt, c);
            if (nxt == Dictionary::kNone) return true;
        }

        used[cell] = 1;
        for (char c : face) cur.push_back((char)(c - 'A' + 'a'));

        bool ok = true;
        if (dict.is_word(nxt) && (int)cur.size() >= limits.min_legal) ok = record();

        for (std::size_t i = 0; ok && i < nbr[cell].size(); i++) {
            int to = nbr[cell][i];
            if (used[to]) continue;
            ok = dfs(to, nxt);
        }

        cur.resize(cur.size() - face.size());
        used[cell] = 0;
        return ok;
    }
};

}  // namespace

bool search_board(const Dictionary& dict, const Grid& grid, const ScoreTable& scores,
                  const SearchLimits& limits, WordSet& out) {
    out = WordSet();
    Search s(dict, grid, scores, limits, out);
    for (int i = 0; i < grid.size(); i++) {
        if (!s.dfs(i, Dictionary::kRoot)) return false;
    }
    return true;
}

WordSet solve(const Dictionary& dict, const Grid& grid, const ScoreTable& scores, int min_legal) {
    SearchLimits limits;
    limits.min_legal = min_legal;
    WordSet out;
    search_board(dict, grid, scores, limits, out);
    return out;
}

}  // namespace boggle
