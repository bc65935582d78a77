// latex.h - LaTeX output constants and character escaping
#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

namespace latex {

// Document frame
constexpr std::string_view DOCUMENT_CLASS = "\\documentclass{article}";
constexpr std::string_view BEGIN_DOCUMENT = "\\begin{document}";
constexpr std::string_view END_DOCUMENT   = "\\end{document}";

// Sectioning commands by heading level (1-based)
constexpr std::array<std::string_view, 5> SECTIONING = {
    "section", "subsection", "subsubsection", "paragraph", "subparagraph",
};
constexpr int MIN_LEVEL = 1;
constexpr int MAX_LEVEL = static_cast<int>(SECTIONING.size());

// Structural commands
constexpr std::string_view APPENDIX       = "\\appendix";
constexpr std::string_view MAKE_TITLE     = "\\maketitle";
constexpr std::string_view NEW_PAGE       = "\\newpage";
constexpr std::string_view PARAGRAPH      = "\\par";
constexpr std::string_view BEGIN_ITEMIZE  = "\\begin{itemize}";
constexpr std::string_view END_ITEMIZE    = "\\end{itemize}";
constexpr std::string_view ITEM           = "\\item";
constexpr std::string_view FOOTNOTE_OPEN  = "\\footnote{";
constexpr std::string_view GROUP_CLOSE    = "}";
constexpr std::string_view BEGIN_VERBATIM = "\\begin{verbatim}";
constexpr std::string_view END_VERBATIM   = "\\end{verbatim}";

// Replacement for END_VERBATIM occurring inside verbatim content
constexpr std::string_view END_VERBATIM_GUARDED = "\\end {verbatim}";

// Inline style groups
constexpr std::string_view BOLD_OPEN      = "\\textbf{";
constexpr std::string_view UNDERLINE_OPEN = "\\underline{";
constexpr char             STYLE_CLOSE    = '}';
constexpr char             NBSP           = '~';

// Comment marker for directives that are not translated
constexpr std::string_view UNSUPPORTED_MARKER = "% roff2tex: unsupported directive: ";

// Indentation per list nesting level
constexpr std::string_view INDENT = "  ";

// Escape sequence for characters with special meaning in LaTeX,
// or an empty view if the character is ordinary
inline std::string_view escape_sequence(char c) {
    switch (c) {
    case '\\': return "\\textbackslash{}";
    case '{':  return "\\{";
    case '}':  return "\\}";
    case '%':  return "\\%";
    case '&':  return "\\&";
    case '_':  return "\\_";
    case '#':  return "\\#";
    case '$':  return "\\$";
    case '~':  return "\\textasciitilde{}";
    case '^':  return "\\textasciicircum{}";
    case '<':  return "\\textless{}";
    case '>':  return "\\textgreater{}";
    default:   return {};
    }
}

inline void append_escaped(std::string& out, char c) {
    std::string_view seq = escape_sequence(c);
    if (seq.empty()) {
        out += c;
    } else {
        out += seq;
    }
}

inline std::string escape(std::string_view text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        append_escaped(result, c);
    }
    return result;
}

// Verbatim content with any premature end-of-environment sequence guarded
inline std::string guard_verbatim(std::string_view line) {
    std::string result;
    size_t pos = 0;
    size_t hit;
    while ((hit = line.find(END_VERBATIM, pos)) != std::string_view::npos) {
        result.append(line, pos, hit - pos);
        result += END_VERBATIM_GUARDED;
        pos = hit + END_VERBATIM.size();
    }
    result.append(line, pos, std::string_view::npos);
    return result;
}

inline std::string section(int level, std::string_view text) {
    std::string result = "\\";
    result += SECTIONING[level - MIN_LEVEL];
    result += '{';
    result += text;
    result += '}';
    return result;
}

} // namespace latex
