#include <cmath>
#include <exception>
#include <filesystem>
#include <iostream>
#include <stdexcept>

#include <oocmd.hpp>

#include <pm/result.hpp>
#include <pm/stopwatch.hpp>

#include <display.hpp>
#include <word_list.hpp>
#include <word_trie.hpp>

using namespace oocmd;

struct Options : public ConfigObject {
    bool gzip = false;
    bool stats = false;
    uint64_t width = 200;

    Options() : ConfigObject("wordtrie", "Print all words of a word list matching a pattern, where '.' matches any letter") {
        param('z', "gzip", gzip, "Decompress the word list even if it does not end with .gz.");
        param('s', "stats", stats, "Print statistics about the trie and the query.");
        param('w', "width", width, "The maximum width of an output line.");
    }
};

Options options;

int main(int argc, char** argv) {
    Application app(options, argc, argv);
    if(app) {
        if(app.args().size() == 2) {
            auto const& pattern = app.args()[0];
            auto const& trie_file = app.args()[1];

            try {
                Alphabet::validate_pattern(pattern);
                if(pattern.empty()) throw std::invalid_argument("the pattern must not be empty");

                pm::Stopwatch sw;
                sw.start();
                auto const trie = WordTrie::from_file(trie_file, options.gzip || word_list::is_gzip_path(trie_file));
                sw.stop();
                auto const t_load = (uint64_t)std::round(sw.elapsed_time_millis());

                sw.start();
                auto const words = trie.traverse(pattern).collect();
                sw.stop();
                auto const t_traverse = (uint64_t)std::round(sw.elapsed_time_millis());

                std::cout << display_list(words, options.width) << std::endl;

                if(options.stats) {
                    pm::Result r;
                    r.add("file", std::filesystem::path(trie_file).filename().string());
                    r.add("pattern", pattern);
                    r.add("words", trie.size());
                    r.add("nodes", trie.num_nodes());
                    r.add("matches", words.size());
                    r.add("t_load", t_load);
                    r.add("t_traverse", t_traverse);
                    r.sort();
                    std::cout << r.str() << std::endl;
                }
                return 0;
            } catch(std::exception const& e) {
                std::cerr << "error: " << e.what() << std::endl;
                return -1;
            }
        } else {
            app.print_usage(options);
            std::cerr << "example: wordtrie W..D words.txt.gz" << std::endl;
        }
    }
    return -1;
}
