#include <exception>
#include <iostream>
#include <string>

#include <oocmd.hpp>

#include <word_list.hpp>
#include <word_trie.hpp>

using namespace oocmd;

struct Options : public ConfigObject {
    bool gzip = false;

    Options() : ConfigObject("wordlen", "Count the words of a word list by their length") {
        param('z', "gzip", gzip, "Decompress the word list even if it does not end with .gz.");
    }
};

Options options;

int main(int argc, char** argv) {
    Application app(options, argc, argv);
    if(app) {
        if(app.args().size() == 1) {
            try {
                auto const& path = app.args()[0];
                auto const trie = WordTrie::from_file(path, options.gzip || word_list::is_gzip_path(path));
                auto const height = trie.analyze().height;

                std::string pattern;
                for(size_t len = 0; len <= height; len++) {
                    size_t n = 0;
                    for(auto const& w : trie.traverse(pattern)) {
                        (void)w;
                        ++n;
                    }
                    if(n > 0) std::cout << len << "\t" << n << std::endl;

                    pattern.push_back(Alphabet::WILDCARD);
                }
                return 0;
            } catch(std::exception const& e) {
                std::cerr << "error: " << e.what() << std::endl;
                return -1;
            }
        } else {
            app.print_usage(options);
        }
    }
    return -1;
}
