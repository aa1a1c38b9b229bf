#include "dictionary.h"

#include <algorithm>
#include <array>
#include <cstdint>
#include <cstring>
#include <fstream>
#include <iterator>
#include <map>
#include <utility>

#include "errors.h"

namespace boggle {

namespace {

// Entry layout of the packed DAWG: low byte letter, then end-of-list and
// end-of-word flags, child list index in the remaining bits.
constexpr uint32_t kLetterMask = 0x000000FF;
constexpr uint32_t kEndOfListBit = 0x00000100;
constexpr uint32_t kEndOfWordBit = 0x00000200;
constexpr int kChildShift = 10;

using Node = Dictionary::Node;
using Signature = std::array<int, Dictionary::kAlphabet + 1>;

// Merges nodes with identical (terminal, children) after their children
// have been merged, bottom-up. The root keeps index 0. The walk keeps its
// own stack so word length is not bounded by the call stack.
struct Minimizer {
    const std::vector<Node>& in;
    std::vector<Node> out;
    std::map<Signature, int> registry;
    std::vector<int> remap;

    explicit Minimizer(const std::vector<Node>& nodes)
        : in(nodes), out(1), remap(nodes.size(), Dictionary::kNone) {}

    int run(int root) {
        // (node, next letter to look at)
        std::vector<std::pair<int, int>> stack;
        stack.emplace_back(root, 0);
        while (!stack.empty()) {
            int v = stack.back().first;
            int& k = stack.back().second;
            int pending = Dictionary::kNone;
            while (k < Dictionary::kAlphabet) {
                int c = in[v].next[k++];
                if (c != Dictionary::kNone && remap[c] == Dictionary::kNone) {
                    pending = c;
                    break;
                }
            }
            if (pending != Dictionary::kNone) {
                stack.emplace_back(pending, 0);
                continue;
            }
            remap[v] = merge(v);
            stack.pop_back();
        }
        return remap[root];
    }

    // All children of v are already merged.
    int merge(int v) {
        Node n;
        n.terminal = in[v].terminal;
        for (int k = 0; k < Dictionary::kAlphabet; k++) {
            if (in[v].next[k] != Dictionary::kNone) n.next[k] = remap[in[v].next[k]];
        }

        if (v == Dictionary::kRoot) {
            out[0] = n;
            return 0;
        }
        Signature sig;
        sig[0] = n.terminal ? 1 : 0;
        std::copy(std::begin(n.next), std::end(n.next), sig.begin() + 1);
        auto it = registry.find(sig);
        if (it != registry.end()) return it->second;
        int id = (int)out.size();
        out.push_back(n);
        registry.emplace(sig, id);
        return id;
    }
};

struct PackedImporter {
    const std::vector<int32_t>& raw;  // raw[0] is the header
    std::vector<Node> out;
    std::map<std::pair<uint32_t, bool>, int> memo;
    std::vector<bool> open;

    // A node whose sibling list is being read, and its current entry
    // (0 once the list is done).
    struct Frame {
        int id;
        uint32_t i;
    };

    explicit PackedImporter(const std::vector<int32_t>& r) : raw(r) {}

    uint32_t entry(uint32_t i) const {
        if (i + 1 >= raw.size())
            throw InvalidWordListError("packed dictionary index out of range: " + std::to_string(i));
        return (uint32_t)raw[i + 1];
    }

    int open_node(uint32_t i, bool terminal) {
        int id = (int)out.size();
        out.emplace_back();
        out[id].terminal = terminal;
        open.push_back(true);
        memo.emplace(std::make_pair(i, terminal), id);
        return id;
    }

    // Nodes stay open while on the stack; reaching an open node again
    // means the lists loop back on themselves.
    int import_root() {
        int root = open_node(1, false);
        std::vector<Frame> stack;
        stack.push_back({root, 1});
        while (!stack.empty()) {
            Frame& f = stack.back();
            if (f.i == 0) {
                open[f.id] = false;
                stack.pop_back();
                continue;
            }

            uint32_t e = entry(f.i);
            char letter = (char)(e & kLetterMask);
            int k = Dictionary::letter_index(letter);
            if (k < 0)
                throw InvalidWordListError("packed dictionary has invalid letter code " +
                                           std::to_string((int)(unsigned char)letter));
            int id = f.id;
            f.i = (e & kEndOfListBit) ? 0 : f.i + 1;

            uint32_t list = e >> kChildShift;
            bool eow = (e & kEndOfWordBit) != 0;
            auto it = memo.find(std::make_pair(list, eow));
            if (it != memo.end()) {
                if (open[it->second]) throw InvalidWordListError("packed dictionary contains a cycle");
                out[id].next[k] = it->second;
                continue;
            }
            int c = open_node(list, eow);
            out[id].next[k] = c;
            stack.push_back({c, list});
        }
        return root;
    }
};

std::size_t count_words(const std::vector<Node>& t, int root) {
    std::vector<long long> memo(t.size(), -1);
    std::vector<std::pair<int, int>> stack;
    stack.emplace_back(root, 0);
    while (!stack.empty()) {
        int v = stack.back().first;
        int& k = stack.back().second;
        int pending = Dictionary::kNone;
        while (k < Dictionary::kAlphabet) {
            int c = t[v].next[k++];
            if (c != Dictionary::kNone && memo[c] < 0) {
                pending = c;
                break;
            }
        }
        if (pending != Dictionary::kNone) {
            stack.emplace_back(pending, 0);
            continue;
        }
        long long n = t[v].terminal ? 1 : 0;
        for (int c : t[v].next) {
            if (c != Dictionary::kNone) n += memo[c];
        }
        memo[v] = n;
        stack.pop_back();
    }
    return (std::size_t)memo[root];
}

void check_word(const std::string& w, const std::string& where) {
    if (w.empty()) throw InvalidWordListError("empty word" + where);
    for (unsigned char c : w) {
        if (Dictionary::letter_index((char)c) < 0) {
            throw InvalidWordListError("invalid character '" + std::string(1, (char)c) +
                                       "' in word \"" + w + "\"" + where);
        }
    }
}

}  // namespace

Dictionary::Node::Node() { std::fill(std::begin(next), std::end(next), kNone); }

Dictionary::Dictionary() { t.emplace_back(); }

void Dictionary::insert(const std::string& w) {
    int v = kRoot;
    for (char c : w) {
        int k = letter_index(c);
        if (t[v].next[k] == kNone) {
            t[v].next[k] = (int)t.size();
            t.emplace_back();
        }
        v = t[v].next[k];
    }
    if (!t[v].terminal) {
        t[v].terminal = true;
        words_++;
    }
}

void Dictionary::minimize() {
    Minimizer m(t);
    m.run(kRoot);
    t = std::move(m.out);
}

Dictionary Dictionary::from_words(const std::vector<std::string>& words) {
    Dictionary d;
    for (const auto& w : words) {
        check_word(w, "");
        d.insert(w);
    }
    d.minimize();
    return d;
}

Dictionary Dictionary::from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw InvalidWordListError("Failed to open dictionary file: " + path);

    Dictionary d;
    std::string line;
    int lineno = 0;
    while (std::getline(in, line)) {
        lineno++;
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t'))
            line.pop_back();
        if (line.empty()) continue;
        check_word(line, " at " + path + ":" + std::to_string(lineno));
        d.insert(line);
    }
    if (in.bad()) throw InvalidWordListError("Failed to read dictionary file: " + path);

    d.minimize();
    return d;
}

Dictionary Dictionary::from_packed_dawg(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw InvalidWordListError("Failed to open dictionary file: " + path);

    std::vector<char> bytes((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    if (bytes.size() < 2 * sizeof(int32_t) || bytes.size() % sizeof(int32_t) != 0)
        throw InvalidWordListError("packed dictionary is truncated: " + path);

    std::vector<int32_t> raw(bytes.size() / sizeof(int32_t));
    std::memcpy(raw.data(), bytes.data(), bytes.size());
    if (raw[0] < 0 || (std::size_t)raw[0] > raw.size())
        throw InvalidWordListError("packed dictionary header does not match its size: " + path);

    PackedImporter imp(raw);
    imp.import_root();

    Dictionary d;
    d.t = std::move(imp.out);
    d.words_ = count_words(d.t, kRoot);
    d.minimize();
    return d;
}

int Dictionary::has_prefix(const std::string& letters) const {
    int v = kRoot;
    for (char c : letters) {
        v = child(v, c);
        if (v == kNone) return kNone;
    }
    return v;
}

bool Dictionary::contains(const std::string& word) const {
    if (word.empty()) return false;
    int v = has_prefix(word);
    return v != kNone && is_word(v);
}

}  // namespace boggle
