// directive.h - Parsing of RUNOFF directive lines
#pragma once

#include <cctype>
#include <charconv>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "command_table.h"
#include "syntax.h"

// One parsed directive line
struct Directive {
    std::string name;              // upper-case keyword, e.g. "HL" or "END LITERAL"
    std::vector<std::string> args; // argument tokens, quotes removed
    std::string text;              // raw argument text after the keyword separators
};

namespace directive {

inline bool is_blank(char c) { return c == ' ' || c == '\t'; }

inline bool is_alpha(char c) { return std::isalpha(static_cast<unsigned char>(c)) != 0; }

inline size_t skip_blanks(std::string_view s, size_t pos) {
    while (pos < s.size() && is_blank(s[pos])) ++pos;
    return pos;
}

inline std::string_view trim(std::string_view s) {
    size_t begin = skip_blanks(s, 0);
    size_t end   = s.size();
    while (end > begin && is_blank(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

// Upper-cased run of letters starting at pos
inline std::string read_word(std::string_view s, size_t& pos) {
    std::string word;
    while (pos < s.size() && is_alpha(s[pos])) {
        word += static_cast<char>(std::toupper(static_cast<unsigned char>(s[pos])));
        ++pos;
    }
    return word;
}

// Split argument text on blanks and commas; quoted tokens keep their
// separators and lose their quotes
inline std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> tokens;
    size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos];
        if (syntax::ARG_SEPARATORS.find(c) != std::string_view::npos) {
            ++pos;
            continue;
        }
        std::string token;
        if (syntax::QUOTES.find(c) != std::string_view::npos) {
            size_t close = text.find(c, pos + 1);
            if (close == std::string_view::npos) close = text.size();
            token.assign(text.substr(pos + 1, close - pos - 1));
            pos = close + 1;
        } else {
            while (pos < text.size() && syntax::ARG_SEPARATORS.find(text[pos]) == std::string_view::npos) {
                token += text[pos++];
            }
        }
        tokens.push_back(std::move(token));
    }
    return tokens;
}

inline std::optional<int> parse_int(std::string_view s) {
    s = trim(s);
    if (!s.empty() && s.front() == '+') s.remove_prefix(1);
    int value = 0;
    auto [end, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
    if (ec != std::errc() || end != s.data() + s.size() || s.empty()) return std::nullopt;
    return value;
}

// Leading integer of text (".HL2 Title" -> 2, "Title") and the rest of the text
inline std::pair<std::optional<int>, std::string_view> split_leading_int(std::string_view text) {
    size_t pos = skip_blanks(text, 0);
    size_t end = pos;
    if (end < text.size() && (text[end] == '-' || text[end] == '+')) ++end;
    size_t digits = end;
    while (end < text.size() && std::isdigit(static_cast<unsigned char>(text[end]))) ++end;
    if (end == digits) return {std::nullopt, text};

    std::optional<int> value = parse_int(text.substr(pos, end - pos));
    while (end < text.size() && syntax::SEPARATORS.find(text[end]) != std::string_view::npos) ++end;
    return {value, text.substr(end)};
}

} // namespace directive

// Parse a directive line. The line must start (after blanks) with the
// command prefix. Compound keywords are joined only when the table knows them.
inline Directive parse_directive(std::string_view line, const CommandTable& table) {
    using namespace directive;
    Directive result;

    size_t pos = skip_blanks(line, 0);
    if (pos < line.size() && line[pos] == syntax::COMMAND_PREFIX) ++pos;

    if (pos < line.size() && line[pos] == syntax::COMMENT_KEYWORD) {
        result.name = syntax::COMMENT_KEYWORD;
        ++pos;
    } else {
        result.name = read_word(line, pos);

        size_t next = skip_blanks(line, pos);
        std::string second = read_word(line, next);
        if (!second.empty() && table.contains(result.name + ' ' + second)) {
            result.name += ' ';
            result.name += second;
            pos = next;
        }
    }

    while (pos < line.size() && syntax::SEPARATORS.find(line[pos]) != std::string_view::npos) ++pos;
    result.text = line.substr(pos);
    result.args = tokenize(result.text);
    return result;
}
