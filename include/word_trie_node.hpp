#pragma once

#include <array>
#include <cstddef>
#include <memory>
#include <sstream>
#include <string>

#include "alphabet.hpp"
#include "always_inline.hpp"

struct WordTrieNode {
    using ChildArray = std::array<std::unique_ptr<WordTrieNode>, Alphabet::SIGMA>;

    // nb: leaves do not allocate a child array at all
    std::unique_ptr<ChildArray> children;

    // the number of insertions that passed through this node towards a longer word
    size_t n_descendants;

    // whether the path from the root to this node spells a word
    bool is_word;

    WordTrieNode() : n_descendants(0), is_word(false) {
    }

    WordTrieNode(WordTrieNode&&) = default;
    WordTrieNode& operator=(WordTrieNode&&) = default;

    WordTrieNode(WordTrieNode const&) = delete;
    WordTrieNode& operator=(WordTrieNode const&) = delete;

    bool is_leaf() const ALWAYS_INLINE {
        return !children;
    }

    WordTrieNode const* child(size_t const r) const ALWAYS_INLINE {
        return children ? (*children)[r].get() : nullptr;
    }

    // returns the child for the given letter rank, creating it (and the child array) if necessary
    WordTrieNode& follow_or_create(size_t const r, bool& out_created) {
        if(!children) children = std::make_unique<ChildArray>();

        auto& slot = (*children)[r];
        out_created = !slot;
        if(out_created) slot = std::make_unique<WordTrieNode>();
        return *slot;
    }

    size_t size() const {
        if(!children) return 0;

        size_t n = 0;
        for(auto const& c : *children) {
            if(c) ++n;
        }
        return n;
    }
};

inline std::string display(WordTrieNode const& node) {
    std::ostringstream oss;
    oss << "WordTrieNode(is_word=" << (node.is_word ? "true" : "false") << ", n_descendants=" << node.n_descendants << ")";
    return oss.str();
}
