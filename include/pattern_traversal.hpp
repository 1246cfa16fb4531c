#pragma once

#include <cassert>
#include <cstddef>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

#include "alphabet.hpp"
#include "word_trie_node.hpp"

// enumerates all words of a trie that match a pattern, in lexicographic order
//
// The pattern consists of letters A-Z and wildcards, each matching exactly one letter, so every match
// has the length of the pattern. Matches are computed on demand as the traversal is advanced,
// so a consumer that stops early does not pay for the rest of the trie.
// The trie must not be modified while a traversal over it is alive.
class PatternTraversal {
private:
    // a node on the current path along with the range of child ranks that remain to be visited
    struct Frame {
        WordTrieNode const* node;
        size_t next;
        size_t end;
    };

    std::string pattern_;
    std::vector<Frame> stack_;
    std::string word_;    // the letters spelled by the path, word_.length() == stack_.size() - 1
    std::string current_; // the most recent match
    bool has_current_;

    void push(WordTrieNode const* node) {
        auto const depth = stack_.size();
        assert(depth < pattern_.length());

        auto const c = pattern_[depth];
        if(c == Alphabet::WILDCARD) {
            stack_.push_back(Frame { node, 0, Alphabet::SIGMA });
        } else {
            auto const r = Alphabet::rank(c);
            stack_.push_back(Frame { node, r, r + 1 });
        }
    }

    void advance() {
        has_current_ = false;
        while(!stack_.empty()) {
            auto& top = stack_.back();

            // find the next child to descend into
            WordTrieNode const* child = nullptr;
            if(!top.node->is_leaf()) {
                while(top.next < top.end && !(child = top.node->child(top.next))) ++top.next;
            }

            if(!child) {
                // this branch is exhausted
                stack_.pop_back();
                if(!stack_.empty()) word_.pop_back();
                continue;
            }

            word_.push_back(Alphabet::letter(top.next++));
            if(word_.length() == pattern_.length()) {
                // the pattern is consumed, report the word if it is one
                bool const match = child->is_word;
                if(match) current_ = word_;
                word_.pop_back();

                if(match) {
                    has_current_ = true;
                    return;
                }
            } else {
                push(child);
            }
        }
    }

public:
    class Iterator {
    private:
        PatternTraversal* traversal_;

    public:
        using iterator_category = std::input_iterator_tag;
        using difference_type = std::ptrdiff_t;
        using value_type = std::string;
        using pointer = std::string const*;
        using reference = std::string const&;

        Iterator() : traversal_(nullptr) {
        }

        Iterator(PatternTraversal& traversal) : traversal_(&traversal) {
        }

        reference operator*() const { return traversal_->current(); }
        pointer operator->() const { return &traversal_->current(); }

        Iterator& operator++() {
            traversal_->next();
            return *this;
        }

        void operator++(int) {
            ++*this;
        }

        bool operator==(std::default_sentinel_t) const {
            return !traversal_ || traversal_->done();
        }
    };

    // assumes that the pattern has been validated
    PatternTraversal(WordTrieNode const& root, std::string_view const pattern) : pattern_(pattern), has_current_(false) {
        if(pattern_.empty()) {
            // the only candidate is the empty word
            has_current_ = root.is_word;
        } else {
            stack_.reserve(pattern_.length());
            word_.reserve(pattern_.length());
            push(&root);
            advance();
        }
    }

    PatternTraversal(PatternTraversal&&) = default;
    PatternTraversal& operator=(PatternTraversal&&) = default;

    PatternTraversal(PatternTraversal const&) = delete;
    PatternTraversal& operator=(PatternTraversal const&) = delete;

    std::string_view pattern() const { return pattern_; }

    bool done() const { return !has_current_; }

    std::string const& current() const {
        assert(has_current_);
        return current_;
    }

    void next() {
        assert(has_current_);
        advance();
    }

    Iterator begin() { return Iterator(*this); }
    std::default_sentinel_t end() const { return std::default_sentinel; }

    // consumes the remaining matches
    std::vector<std::string> collect() {
        std::vector<std::string> words;
        for(auto const& w : *this) words.push_back(w);
        return words;
    }
};
