#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace boggle {

// Prefix graph over uppercase A-Z. Nodes live in one arena and refer to
// their children by index; the root is node 0. Once built the graph is
// never modified, so any number of searches may read it concurrently.
class Dictionary {
public:
    static constexpr int kAlphabet = 26;
    static constexpr int kRoot = 0;
    static constexpr int kNone = -1;

    struct Node {
        int next[kAlphabet];
        bool terminal = false;
        Node();
    };

    static Dictionary from_words(const std::vector<std::string>& words);
    // One word per line; blank lines are skipped.
    static Dictionary from_file(const std::string& path);
    // Packed DAWG as written by the original tboggle word compiler.
    static Dictionary from_packed_dawg(const std::string& path);

    // Child of `node` along `letter` (either case), or kNone.
    int child(int node, char letter) const {
        int k = letter_index(letter);
        if (k < 0) return kNone;
        return t[node].next[k];
    }

    bool is_word(int node) const { return t[node].terminal; }

    // Node reached by spelling `letters` from the root, or kNone when no
    // word starts with them.
    int has_prefix(const std::string& letters) const;
    bool contains(const std::string& word) const;

    std::size_t num_nodes() const { return t.size(); }
    std::size_t num_words() const { return words_; }

    static int letter_index(char c) {
        if (c >= 'A' && c <= 'Z') return c - 'A';
        if (c >= 'a' && c <= 'z') return c - 'a';
        return -1;
    }

private:
    Dictionary();

    void insert(const std::string& w);
    void minimize();

    std::vector<Node> t;
    std::size_t words_ = 0;
};

}  // namespace boggle
