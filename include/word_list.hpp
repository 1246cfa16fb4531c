#pragma once

#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>

#include <iopp/file_input_stream.hpp>
#include <zlib.h>

namespace word_list {

inline bool is_gzip_path(std::string_view const path) {
    return path.ends_with(".gz");
}

// splits a character stream into lines and reports them without their line terminator
// nb: lines end at "\n", "\r\n" or a lone "\r"
// nb: a final line without terminator is reported as well, a final terminator does not produce an empty line
template<typename LineFunc>
class LineSplitter {
private:
    LineFunc& f_;
    std::string line_;
    bool pending_;
    bool after_cr_;

    void emit() {
        f_(std::string_view(line_));
        line_.clear();
        pending_ = false;
    }

public:
    LineSplitter(LineFunc& f) : f_(f), pending_(false), after_cr_(false) {
    }

    void push(char const c) {
        if(c == '\r') {
            emit();
            after_cr_ = true;
        } else if(c == '\n') {
            // the line has already been reported at the preceding '\r'
            if(!after_cr_) emit();
            after_cr_ = false;
        } else {
            line_.push_back(c);
            pending_ = true;
            after_cr_ = false;
        }
    }

    void finish() {
        if(pending_) emit();
    }
};

inline void require_file(std::string const& path) {
    if(!std::filesystem::is_regular_file(path)) {
        throw std::runtime_error("cannot open word list " + path + ": no such file");
    }
}

template<typename LineFunc>
void for_each_line_plain(std::string const& path, LineFunc&& f) {
    require_file(path);

    LineSplitter<LineFunc> lines(f);
    iopp::FileInputStream fis(path);
    for(char const c : fis) {
        lines.push(c);
    }
    lines.finish();
}

template<typename LineFunc>
void for_each_line_gzip(std::string const& path, LineFunc&& f) {
    require_file(path);

    struct GzClose {
        void operator()(gzFile_s* gz) const { gzclose(gz); }
    };

    std::unique_ptr<gzFile_s, GzClose> gz(gzopen(path.c_str(), "rb"));
    if(!gz) {
        throw std::runtime_error("cannot open word list " + path + ": gzopen failed");
    }

    LineSplitter<LineFunc> lines(f);

    static constexpr unsigned buffer_size_ = 1U << 16;
    auto buffer = std::make_unique<char[]>(buffer_size_);
    while(true) {
        auto const n = gzread(gz.get(), buffer.get(), buffer_size_);
        if(n < 0) {
            int errnum;
            char const* msg = gzerror(gz.get(), &errnum);
            throw std::runtime_error("cannot decompress word list " + path + ": " + msg);
        }
        if(n == 0) {
            // nb: a stream that ends before its end marker is reported as end of file with an error set
            int errnum;
            char const* msg = gzerror(gz.get(), &errnum);
            if(errnum != Z_OK) {
                throw std::runtime_error("cannot decompress word list " + path + ": " + msg);
            }
            break;
        }

        for(int i = 0; i < n; i++) {
            lines.push(buffer[i]);
        }
    }
    lines.finish();
}

// calls f for each line of the given file, which is decompressed on the fly if gzip is set
template<typename LineFunc>
void for_each_line(std::string const& path, bool const gzip, LineFunc&& f) {
    if(gzip) {
        for_each_line_gzip(path, f);
    } else {
        for_each_line_plain(path, f);
    }
}

}
