#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "always_inline.hpp"
#include "display.hpp"

// thrown if a word contains a character other than A-Z
class InvalidCharacter : public std::invalid_argument {
private:
    char c_;
    size_t pos_;

public:
    InvalidCharacter(std::string_view const word, size_t const pos)
        : std::invalid_argument("invalid character " + display(word[pos]) + " at position " + std::to_string(pos) + " in " + display(word) + ", words must be capitalized A-Z only"),
          c_(word[pos]),
          pos_(pos) {
    }

    char character() const { return c_; }
    size_t position() const { return pos_; }
};

// thrown if a pattern contains a character other than A-Z and the wildcard
class InvalidPattern : public std::invalid_argument {
private:
    char c_;
    size_t pos_;

public:
    InvalidPattern(std::string_view const pattern, size_t const pos)
        : std::invalid_argument("invalid character " + display(pattern[pos]) + " at position " + std::to_string(pos) + " in pattern " + display(pattern) + ", patterns must be capitalized A-Z and . only"),
          c_(pattern[pos]),
          pos_(pos) {
    }

    char character() const { return c_; }
    size_t position() const { return pos_; }
};

struct Alphabet {
    static constexpr size_t SIGMA = 26;
    static constexpr char WILDCARD = '.';

    static constexpr bool is_letter(char const c) ALWAYS_INLINE { return c >= 'A' && c <= 'Z'; }
    static constexpr bool is_pattern_char(char const c) ALWAYS_INLINE { return is_letter(c) || c == WILDCARD; }

    static constexpr size_t rank(char const c) ALWAYS_INLINE { return size_t(c - 'A'); }
    static constexpr char letter(size_t const r) ALWAYS_INLINE { return char('A' + r); }

    static void validate_word(std::string_view const word) {
        for(size_t i = 0; i < word.length(); i++) {
            if(!is_letter(word[i])) throw InvalidCharacter(word, i);
        }
    }

    static void validate_pattern(std::string_view const pattern) {
        for(size_t i = 0; i < pattern.length(); i++) {
            if(!is_pattern_char(pattern[i])) throw InvalidPattern(pattern, i);
        }
    }

    static constexpr bool is_space(char const c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    // maps a-z to A-Z, other characters are kept as they are
    static std::string to_upper(std::string_view const word) {
        std::string upper(word);
        for(auto& c : upper) {
            if(c >= 'a' && c <= 'z') c = char(c - 'a' + 'A');
        }
        return upper;
    }

    // trims surrounding whitespace and maps a-z to A-Z
    static std::string normalize(std::string_view line) {
        while(!line.empty() && is_space(line.front())) line.remove_prefix(1);
        while(!line.empty() && is_space(line.back())) line.remove_suffix(1);
        return to_upper(line);
    }
};
