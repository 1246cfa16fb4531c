#pragma once

#include <algorithm>
#include <cstddef>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>

#include "alphabet.hpp"
#include "pattern_traversal.hpp"
#include "word_list.hpp"
#include "word_trie_node.hpp"

// a trie over the alphabet A-Z storing a set of capitalized words
class WordTrie {
private:
    std::unique_ptr<WordTrieNode> root_;
    size_t num_nodes_;
    size_t num_words_;

public:
    WordTrie() : root_(std::make_unique<WordTrieNode>()), num_nodes_(1), num_words_(0) {
    }

    WordTrie(WordTrie&&) = default;
    WordTrie& operator=(WordTrie&&) = default;

    WordTrie(WordTrie const&) = delete;
    WordTrie& operator=(WordTrie const&) = delete;

    // inserts each word after mapping it to upper case
    // nb: words are not trimmed, surrounding whitespace is an invalid character like any other
    template<typename Words>
    static WordTrie from_words(Words const& words) {
        WordTrie trie;
        for(auto const& word : words) {
            trie.insert(Alphabet::to_upper(word));
        }
        return trie;
    }

    // inserts each line after trimming it and mapping it to upper case
    // nb: blank lines insert the empty word
    template<typename Lines>
    static WordTrie from_lines(Lines const& lines) {
        WordTrie trie;
        for(auto const& line : lines) {
            trie.insert(Alphabet::normalize(line));
        }
        return trie;
    }

    // loads a word list with one word per line
    static WordTrie from_file(std::string const& path, bool const gzip) {
        WordTrie trie;
        word_list::for_each_line(path, gzip, [&](std::string_view const line){
            trie.insert(Alphabet::normalize(line));
        });
        return trie;
    }

    // the word must consist of A-Z only, otherwise InvalidCharacter is thrown and the trie is left unchanged
    void insert(std::string_view const word) {
        Alphabet::validate_word(word);

        auto* v = root_.get();
        for(auto const c : word) {
            ++v->n_descendants;

            bool created;
            v = &v->follow_or_create(Alphabet::rank(c), created);
            if(created) ++num_nodes_;
        }

        if(!v->is_word) {
            v->is_word = true;
            ++num_words_;
        }
    }

    // returns the node spelled by the prefix, or nullptr if there is none
    WordTrieNode const* lookup_prefix(std::string_view const prefix) const {
        WordTrieNode const* v = root_.get();
        for(auto const c : prefix) {
            if(!Alphabet::is_letter(c)) return nullptr;

            v = v->child(Alphabet::rank(c));
            if(!v) return nullptr;
        }
        return v;
    }

    bool contains(std::string_view const word) const {
        auto const* v = lookup_prefix(word);
        return v && v->is_word;
    }

    // the number of insertions that extended the prefix to a longer word
    size_t count_extensions(std::string_view const prefix) const {
        auto const* v = lookup_prefix(prefix);
        return v ? v->n_descendants : 0;
    }

    // enumerates the words matching the pattern, where '.' matches any letter
    // throws InvalidPattern if the pattern contains anything other than A-Z and '.'
    PatternTraversal traverse(std::string_view const pattern) const {
        Alphabet::validate_pattern(pattern);
        return PatternTraversal(*root_, pattern);
    }

    WordTrieNode const& root() const {
        return *root_;
    }

    // the number of distinct words
    size_t size() const {
        return num_words_;
    }

    bool empty() const {
        return num_words_ == 0;
    }

    size_t num_nodes() const {
        return num_nodes_;
    }

    struct Analysis {
        size_t leaves;
        size_t outd_total;
        size_t outd_max;
        size_t height;

        Analysis() : leaves(0), outd_total(0), outd_max(0), height(0) {
        }
    };

private:
    void analyze(Analysis& ana, WordTrieNode const& v, size_t const depth) const {
        ana.height = std::max(ana.height, depth);

        size_t const outd = v.size();
        ana.outd_total += outd;
        ana.outd_max = std::max(ana.outd_max, outd);
        if(outd == 0) {
            ++ana.leaves;
        } else {
            for(size_t r = 0; r < Alphabet::SIGMA; r++) {
                if(auto const* child = v.child(r)) analyze(ana, *child, depth + 1);
            }
        }
    }

public:
    Analysis analyze() const {
        Analysis ana;
        analyze(ana, *root_, 0);
        return ana;
    }

    void print_debug_info() const {
        auto const ana = analyze();
        std::cout << "# DEBUG: trie"
                  << ", sizeof(WordTrieNode)=" << sizeof(WordTrieNode)
                  << ", sizeof(ChildArray)=" << sizeof(WordTrieNode::ChildArray)
                  << ", num_words=" << num_words_
                  << ", num_nodes=" << num_nodes_
                  << ", num_leaves=" << ana.leaves
                  << ", outd_max=" << ana.outd_max
                  << ", height=" << ana.height
                  << std::endl;
    }
};
