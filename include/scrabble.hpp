#pragma once

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <random>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "alphabet.hpp"
#include "word_trie.hpp"

namespace scrabble {

constexpr size_t N_SHOW_BEST = 20;
constexpr size_t N_SHOW_RANDOM = 10;

// letter values of English Scrabble, indexed by letter rank
constexpr std::array<uint64_t, Alphabet::SIGMA> VALUES = {
//  A  B  C  D  E  F  G  H  I  J  K  L  M  N  O  P  Q   R  S  T  U  V  W  X  Y  Z
    1, 3, 3, 2, 1, 4, 2, 4, 1, 8, 5, 1, 3, 1, 1, 3, 10, 1, 1, 1, 1, 4, 4, 8, 4, 10
};

// a multiset of letter tiles
class Tiles {
private:
    std::array<uint64_t, Alphabet::SIGMA> count_;

public:
    Tiles() {
        count_.fill(0);
    }

    // the English Scrabble distribution without the two blanks
    static Tiles standard() {
        Tiles t;
        t.count_ = {
        //  A  B  C  D  E   F  G  H  I  J  K  L  M  N  O  P  Q  R  S  T  U  V  W  X  Y  Z
            9, 2, 2, 4, 12, 2, 3, 2, 9, 1, 1, 4, 2, 6, 8, 2, 1, 6, 4, 6, 4, 2, 2, 1, 2, 1
        };
        return t;
    }

    // counts the letters of a word, which must consist of A-Z only
    static Tiles from_letters(std::string_view const letters) {
        Alphabet::validate_word(letters);

        Tiles t;
        for(auto const c : letters) ++t.count_[Alphabet::rank(c)];
        return t;
    }

    // throws InvalidCharacter if c is not a letter
    uint64_t operator[](char const c) const {
        Alphabet::validate_word(std::string_view(&c, 1));
        return count_[Alphabet::rank(c)];
    }

    uint64_t total() const {
        uint64_t sum = 0;
        for(auto const n : count_) sum += n;
        return sum;
    }

    bool empty() const {
        return total() == 0;
    }

    // tests whether this multiset contains the other
    bool covers(Tiles const& other) const {
        for(size_t r = 0; r < Alphabet::SIGMA; r++) {
            if(other.count_[r] > count_[r]) return false;
        }
        return true;
    }

    void take(size_t const r) {
        --count_[r];
    }

    void give(size_t const r) {
        ++count_[r];
    }

    bool available(size_t const r) const {
        return count_[r] > 0;
    }

    Tiles& operator-=(Tiles const& other) {
        for(size_t r = 0; r < Alphabet::SIGMA; r++) count_[r] -= other.count_[r];
        return *this;
    }

    Tiles& operator+=(Tiles const& other) {
        for(size_t r = 0; r < Alphabet::SIGMA; r++) count_[r] += other.count_[r];
        return *this;
    }

    bool operator==(Tiles const&) const = default;

    // the letters in alphabetical order along with their counts, omitting letters that are not available
    std::vector<std::pair<std::string, uint64_t>> items() const {
        std::vector<std::pair<std::string, uint64_t>> v;
        for(size_t r = 0; r < Alphabet::SIGMA; r++) {
            if(count_[r] > 0) v.emplace_back(std::string(1, Alphabet::letter(r)), count_[r]);
        }
        return v;
    }
};

// throws InvalidCharacter if the word contains anything other than A-Z
inline uint64_t score(std::string_view const word) {
    Alphabet::validate_word(word);

    uint64_t sum = 0;
    for(auto const c : word) sum += VALUES[Alphabet::rank(c)];
    return sum;
}

inline bool can_play(std::string_view const word, Tiles const& hand) {
    return hand.covers(Tiles::from_letters(word));
}

// removes the word's letters from the hand if possible
inline bool play(std::string_view const word, Tiles& hand) {
    auto const w = Tiles::from_letters(word);
    if(hand.covers(w)) {
        hand -= w;
        return true;
    }
    return false;
}

// returns the word's letters to the hand
inline void unplay(std::string_view const word, Tiles& hand) {
    hand += Tiles::from_letters(word);
}

namespace internal {

inline void collect_playable(WordTrieNode const& v, std::string_view const pattern, Tiles& hand, std::string& word, std::vector<std::string>& out) {
    auto const depth = word.length();
    if(depth == pattern.length()) {
        if(v.is_word) out.push_back(word);
        return;
    }

    if(v.is_leaf()) return;

    auto const c = pattern[depth];
    size_t const first = (c == Alphabet::WILDCARD) ? 0 : Alphabet::rank(c);
    size_t const last = (c == Alphabet::WILDCARD) ? Alphabet::SIGMA : first + 1;
    for(size_t r = first; r < last; r++) {
        auto const* child = v.child(r);
        if(child && hand.available(r)) {
            hand.take(r);
            word.push_back(Alphabet::letter(r));
            collect_playable(*child, pattern, hand, word, out);
            word.pop_back();
            hand.give(r);
        }
    }
}

}

// all words matching the pattern that can be played from the hand, in lexicographic order
// nb: branches that would require a tile that is no longer in the hand are never entered
inline std::vector<std::string> playable_matches(WordTrie const& trie, std::string_view const pattern, Tiles const& hand) {
    Alphabet::validate_pattern(pattern);

    std::vector<std::string> words;
    std::string word;
    word.reserve(pattern.length());

    auto remaining = hand;
    internal::collect_playable(trie.root(), pattern, remaining, word, words);
    return words;
}

// sorts words by descending score, words of equal score keep their order
inline void rank_by_score(std::vector<std::string>& words) {
    std::stable_sort(words.begin(), words.end(), [](std::string const& a, std::string const& b){
        return score(a) > score(b);
    });
}

inline std::vector<std::pair<std::string, uint64_t>> with_scores(std::vector<std::string> const& words, size_t const n) {
    std::vector<std::pair<std::string, uint64_t>> scored;
    for(size_t i = 0; i < std::min(n, words.size()); i++) {
        scored.emplace_back(words[i], score(words[i]));
    }
    return scored;
}

// chooses min(n, |words|) distinct words uniformly at random
template<typename Rng>
std::vector<std::string> sample_words(std::vector<std::string> const& words, size_t const n, Rng& rng) {
    std::vector<std::string> sample;
    sample.reserve(std::min(n, words.size()));
    std::sample(words.begin(), words.end(), std::back_inserter(sample), n, rng);
    std::shuffle(sample.begin(), sample.end(), rng);
    return sample;
}

}
