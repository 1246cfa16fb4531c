#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

#include <algorithm>
#include <random>
#include <set>
#include <string>
#include <vector>

#include <display.hpp>
#include <scrabble.hpp>
#include <word_trie.hpp>

TEST_SUITE("scrabble") {
    using namespace scrabble;
    using Words = std::vector<std::string>;

    TEST_CASE("standard tiles") {
        auto const t = Tiles::standard();
        REQUIRE(t.total() == 98);
        REQUIRE(t['E'] == 12);
        REQUIRE(t['A'] == 9);
        REQUIRE(t['I'] == 9);
        REQUIRE(t['O'] == 8);
        REQUIRE(t['N'] == 6);
        REQUIRE(t['R'] == 6);
        REQUIRE(t['T'] == 6);
        REQUIRE(t['L'] == 4);
        REQUIRE(t['S'] == 4);
        REQUIRE(t['D'] == 4);
        REQUIRE(t['U'] == 4);
        REQUIRE(t['G'] == 3);
        for(char const c : std::string("BCMPFHVWY")) REQUIRE(t[c] == 2);
        for(char const c : std::string("KJXQZ")) REQUIRE(t[c] == 1);
    }

    TEST_CASE("score") {
        REQUIRE(score("") == 0);
        REQUIRE(score("HELLO") == 8);
        REQUIRE(score("LOLLY") == 8);
        REQUIRE(score("QUIZ") == 22);
        REQUIRE(score("JINX") == 18);
        REQUIRE(score("ABCDEFGHIJKLMNOPQRSTUVWXYZ") == 87);
    }

    TEST_CASE("non-letters") {
        REQUIRE_THROWS_AS(score("HELLO!"), InvalidCharacter);
        REQUIRE_THROWS_AS(score("hello"), InvalidCharacter);

        auto const t = Tiles::standard();
        REQUIRE_THROWS_AS(t['?'], InvalidCharacter);
        REQUIRE_THROWS_AS(t['e'], InvalidCharacter);
        REQUIRE_THROWS_AS(t['['], InvalidCharacter);
    }

    TEST_CASE("play and unplay") {
        auto hand = Tiles::from_letters("HELLO");
        REQUIRE(hand['H'] == 1);
        REQUIRE(hand['E'] == 1);
        REQUIRE(hand['L'] == 2);
        REQUIRE(hand['O'] == 1);
        REQUIRE(hand.total() == 5);
        auto const original = hand;

        REQUIRE(can_play("HELLO", hand));
        REQUIRE(!can_play("LOLLY", hand));
        REQUIRE(can_play("HOLE", hand));
        REQUIRE(!can_play("HEEL", hand));

        REQUIRE(play("HELLO", hand));
        REQUIRE(hand.empty());
        REQUIRE(!play("LOLLY", hand));
        REQUIRE(hand.empty());

        unplay("HELLO", hand);
        REQUIRE(hand == original);
    }

    TEST_CASE("play from the standard tiles") {
        auto hand = Tiles::standard();
        REQUIRE(play("HELLO", hand));
        REQUIRE(hand['L'] == 2);

        // LOLLY needs three Ls
        REQUIRE(!play("LOLLY", hand));
        REQUIRE(hand['L'] == 2);

        unplay("HELLO", hand);
        REQUIRE(hand == Tiles::standard());
    }

    TEST_CASE("invalid tiles") {
        REQUIRE_THROWS_AS(Tiles::from_letters("abc"), InvalidCharacter);
        REQUIRE_THROWS_AS(Tiles::from_letters("AB?"), InvalidCharacter);
        REQUIRE(Tiles::from_letters("").empty());
    }

    TEST_CASE("playable_matches") {
        auto const trie = WordTrie::from_words(Words { "HELLO", "HELLS", "HOLLY", "LOLLY", "HOLE", "HELL", "JELLO" });
        auto const hand = Tiles::from_letters("HELLOS");

        REQUIRE(playable_matches(trie, ".....", hand) == Words { "HELLO", "HELLS" });
        REQUIRE(playable_matches(trie, "....", hand) == Words { "HELL", "HOLE" });
        REQUIRE(playable_matches(trie, "H..L.", hand) == Words { "HELLO", "HELLS" });
        REQUIRE(playable_matches(trie, "J....", hand).empty());
        REQUIRE(playable_matches(trie, ".....", Tiles()).empty());

        REQUIRE_THROWS_AS(playable_matches(trie, "h....", hand), InvalidPattern);
    }

    TEST_CASE("playable_matches agrees with filtering") {
        std::mt19937 gen(4711);
        std::uniform_int_distribution<size_t> rand_len(2, 7);
        std::uniform_int_distribution<int> rand_letter(0, 7);

        Words list;
        for(size_t i = 0; i < 3'000; i++) {
            std::string w;
            auto const len = rand_len(gen);
            for(size_t j = 0; j < len; j++) w.push_back(char('A' + rand_letter(gen)));
            list.push_back(w);
        }
        auto const trie = WordTrie::from_words(list);

        for(auto const tiles : { "ABCDEFGH", "AABBCCDD", "ABACADAE", "HHGGFFEE" }) {
            auto const hand = Tiles::from_letters(tiles);
            for(auto const pattern : { "...", "....", "A...", ".B..", "....." }) {
                Words expected;
                for(auto const& w : trie.traverse(pattern)) {
                    if(can_play(w, hand)) expected.push_back(w);
                }
                REQUIRE(playable_matches(trie, pattern, hand) == expected);
            }
        }
    }

    TEST_CASE("rank_by_score") {
        Words words = { "ACE", "AXE", "BEE", "CAB", "ZAP" };
        rank_by_score(words);
        // ZAP=14, AXE=10, CAB=7, ACE=5, BEE=5 with ties in their previous order
        REQUIRE(words == Words { "ZAP", "AXE", "CAB", "ACE", "BEE" });

        auto const scored = with_scores(words, 2);
        REQUIRE(scored.size() == 2);
        REQUIRE(scored[0].first == "ZAP");
        REQUIRE(scored[0].second == 14);
        REQUIRE(scored[1].first == "AXE");
        REQUIRE(scored[1].second == 10);

        REQUIRE(with_scores(words, 20).size() == words.size());
    }

    TEST_CASE("sample_words") {
        Words const words = { "A", "B", "C", "D", "E", "F", "G", "H", "I", "J", "K", "L" };
        std::mt19937_64 gen(42);

        auto const few = sample_words(words, 10, gen);
        REQUIRE(few.size() == 10);
        REQUIRE(std::set<std::string>(few.begin(), few.end()).size() == 10);
        for(auto const& w : few) {
            REQUIRE(std::find(words.begin(), words.end(), w) != words.end());
        }

        auto const all = sample_words(words, 100, gen);
        REQUIRE(all.size() == words.size());
        REQUIRE(std::set<std::string>(all.begin(), all.end()) == std::set<std::string>(words.begin(), words.end()));

        REQUIRE(sample_words(Words {}, 10, gen).empty());
    }

    TEST_CASE("display") {
        REQUIRE(display_list(Words {}, 100) == "[]");
        REQUIRE(display_list(Words { "CAT", "DOG" }, 100) == "['CAT', 'DOG']");
        REQUIRE(display_list(with_scores(Words { "HELLO" }, 1), 100) == "[('HELLO', 8)]");

        // wrapped so that no line exceeds the width
        REQUIRE(display_list(Words { "CAT", "DOG", "EMU", "GNU" }, 16) == "['CAT', 'DOG',\n 'EMU', 'GNU']");
    }
}
