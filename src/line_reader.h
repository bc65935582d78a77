// line_reader.h - Line splitting and classification of RUNOFF input
#pragma once

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>

#include "syntax.h"

// Fatal failure of the underlying input stream
class InputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Line {
    enum class Kind {
        TEXT,
        DIRECTIVE,
    };

    Kind kind = Kind::TEXT;
    std::string text;   // line without terminator, leading blanks kept
    size_t number = 0;  // 1-based

    bool is_directive() const { return kind == Kind::DIRECTIVE; }
    bool is_blank() const { return text.find_first_not_of(" \t") == std::string::npos; }

    static Kind classify(std::string_view text) {
        size_t pos = text.find_first_not_of(" \t");
        if (pos != std::string_view::npos && text[pos] == syntax::COMMAND_PREFIX) {
            return Kind::DIRECTIVE;
        }
        return Kind::TEXT;
    }
};

// Forward-only reader producing one classified line at a time.
// Bytes are passed through untouched; only "\n" and a preceding "\r" are removed.
class LineReader {
public:
    explicit LineReader(std::FILE* in, std::string_view source = "<stdin>")
        : in_(in), source_(source) {}

    LineReader(const LineReader&)            = delete;
    LineReader& operator=(const LineReader&) = delete;

    // Read the next line; false at end of input. Throws InputError on read failure.
    bool next(Line& line) {
        if (eof_) return false;

        line.text.clear();
        bool got_any = false;
        int c;
        while ((c = std::getc(in_)) != EOF) {
            got_any = true;
            if (c == '\n') break;
            line.text += static_cast<char>(c);
        }

        if (c == EOF) {
            if (std::ferror(in_)) {
                throw InputError(source_ + ": read error: " + std::strerror(errno));
            }
            eof_ = true;
            if (!got_any) return false;
        }

        if (!line.text.empty() && line.text.back() == '\r') {
            line.text.pop_back();
        }
        line.number = ++line_number_;
        line.kind   = Line::classify(line.text);
        return true;
    }

    const std::string& source() const { return source_; }
    size_t line_number() const { return line_number_; }

private:
    std::FILE* in_;
    std::string source_;
    size_t line_number_ = 0;
    bool eof_           = false;
};
