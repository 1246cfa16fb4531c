#include <exception>
#include <iostream>
#include <stdexcept>
#include <random>
#include <string>

#include <oocmd.hpp>

#include <display.hpp>
#include <scrabble.hpp>
#include <word_list.hpp>
#include <word_trie.hpp>

using namespace oocmd;

struct Options : public ConfigObject {
    bool gzip = false;
    uint64_t seed = 0;
    uint64_t width = 100;

    Options() : ConfigObject("scrabble", "Find the best Scrabble words matching a pattern, where '.' matches any letter, that can be played with the given tiles") {
        param('z', "gzip", gzip, "Decompress the word list even if it does not end with .gz.");
        param("seed", seed, "The random seed for choosing random words, zero for a nondeterministic seed.");
        param('w', "width", width, "The maximum width of an output line.");
    }
};

Options options;

namespace {

void print_rule(size_t const width) {
    std::cout << std::string(width, '-') << std::endl;
}

}

int main(int argc, char** argv) {
    Application app(options, argc, argv);
    if(app) {
        if(app.args().size() == 2 || app.args().size() == 3) {
            auto const& pattern = app.args()[0];
            auto const& trie_file = app.args()[1];

            try {
                scrabble::Tiles hand;
                if(app.args().size() == 3) {
                    auto const& tiles = app.args()[2];
                    if(tiles.empty()) throw std::invalid_argument("the tiles must not be empty");

                    hand = scrabble::Tiles::from_letters(tiles);
                    std::cout << "Using custom tiles: " << tiles << std::endl;
                } else {
                    hand = scrabble::Tiles::standard();
                    std::cout << "Using default Scrabble tiles (excluding 2 blanks):" << std::endl;
                    std::cout << display_list(hand.items(), options.width) << std::endl;
                }
                std::cout << "Total tiles: " << hand.total() << std::endl;

                Alphabet::validate_pattern(pattern);
                if(pattern.empty()) throw std::invalid_argument("the pattern must not be empty");

                auto const trie = WordTrie::from_file(trie_file, options.gzip || word_list::is_gzip_path(trie_file));

                auto words = scrabble::playable_matches(trie, pattern, hand);
                std::mt19937_64 gen(options.seed ? options.seed : std::random_device()());
                auto const random_words = scrabble::sample_words(words, scrabble::N_SHOW_RANDOM, gen);

                scrabble::rank_by_score(words);
                auto const best = scrabble::with_scores(words, scrabble::N_SHOW_BEST);

                std::cout << std::endl;
                std::cout << "Top " << best.size() << " words I can play with my tiles matching '" << pattern << "':" << std::endl;
                print_rule(options.width);
                std::cout << display_list(best, options.width) << std::endl;

                std::cout << std::endl;
                std::cout << random_words.size() << " random words I can play with my tiles matching '" << pattern << "':" << std::endl;
                print_rule(options.width);
                std::cout << display_list(scrabble::with_scores(random_words, random_words.size()), options.width) << std::endl;
                return 0;
            } catch(std::exception const& e) {
                std::cerr << "error: " << e.what() << std::endl;
                return -1;
            }
        } else {
            app.print_usage(options);
            std::cerr << "example: scrabble W..D words.txt.gz" << std::endl;
        }
    }
    return -1;
}
