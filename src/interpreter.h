// interpreter.h - Directive dispatch, document state and LaTeX emission
#pragma once

#include <algorithm>
#include <cstdarg>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "command_table.h"
#include "directive.h"
#include "flag_table.h"
#include "inline_automaton.h"
#include "latch.h"
#include "latex.h"
#include "line_reader.h"
#include "options.h"

// Text-bearing directive still waiting for its text line
struct Pending {
    Command command;
    int level = latex::MIN_LEVEL;
};

// List or footnote that is still open
struct Region {
    enum class Kind { LIST, FOOTNOTE };

    Kind kind;
    std::string bullet; // lists only

    const char* name() const { return kind == Kind::LIST ? "list" : "footnote"; }
};

struct DocumentState {
    std::vector<Region> regions; // innermost last
    bool in_literal    = false;
    bool in_comment    = false;
    bool in_appendices = false;
    bool title_made    = false;
    std::optional<Pending> pending;
    FlagTable flags;
    LatchState latch;

    size_t list_depth() const {
        return static_cast<size_t>(std::count_if(regions.begin(), regions.end(),
                                                 [](const Region& r) { return r.kind == Region::Kind::LIST; }));
    }
};

// Consumes classified lines and writes LaTeX lines to the output stream
// in input order. Never fails on malformed input: problems are reported
// as warnings and translation continues.
class Interpreter {
public:
    Interpreter(const CommandTable& commands, const FlagTable& flags, const Options& options, std::FILE* out)
        : commands_(commands), options_(options), out_(out) {
        state_.flags = flags;
    }

    Interpreter(const Interpreter&)            = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    // Emit the document preamble
    void begin();

    // Handle one input line
    void process(const Line& line);

    // Handle every line of the reader. InputError propagates.
    void translate(LineReader& reader);

    // Close whatever is still open and emit the postamble
    void finish();

    const DocumentState& state() const { return state_; }
    size_t warning_count() const { return warning_count_; }

private:
    const CommandTable& commands_;
    const Options options_;
    std::FILE* out_;
    DocumentState state_;

    std::string source_ = "<input>";
    size_t line_number_ = 0;
    size_t warning_count_ = 0;

    void warn(const char* format, ...) {
        ++warning_count_;
        if (!options_.warnings) return;
        std::fprintf(stderr, "roff2tex: %s:%zu: warning: ", source_.c_str(), line_number_);
        va_list args;
        va_start(args, format);
        std::vfprintf(stderr, format, args);
        va_end(args);
        std::fputc('\n', stderr);
    }

    void emit_line(std::string_view text) {
        std::fwrite(text.data(), 1, text.size(), out_);
        std::fputc('\n', out_);
    }

    std::string indent(size_t depth) const {
        std::string result;
        for (size_t i = 0; i < depth; ++i) result += latex::INDENT;
        return result;
    }

    std::optional<Command> command_of(const Line& line) const {
        if (!line.is_directive()) return std::nullopt;
        auto spec = commands_.find(parse_directive(line.text, commands_).name);
        if (!spec) return std::nullopt;
        return spec->command;
    }

    std::string translate_span(std::string_view text) {
        InlineResult result = translate_inline(text, state_.flags, state_.latch);
        state_.latch        = result.latch;
        return result.text;
    }

    // Ignored layout directives take numbers; anything else is document text
    static bool carries_text(const Directive& d) {
        return std::any_of(d.args.begin(), d.args.end(),
                           [](const std::string& arg) { return !directive::parse_int(arg); });
    }

    void process_text(const Line& line);
    void process_directive(const Directive& d, std::string_view raw);
    void dispatch(Command command, const Directive& d);
    void unknown_directive(std::string_view raw);

    void text_bearing(Command command, int level, std::string_view text);
    void emit_construct(const Pending& p, std::string_view text);
    void flush_pending();

    void heading(const Directive& d);
    void blank(const Directive& d);
    void change_flags(const Directive& d, bool enable);
    void start_list(const Directive& d);
    void list_element(const Directive& d);
    void end_list();
    void end_footnote();
    void end_literal();

    void close_region();
    bool close_through(Region::Kind kind);
};

// Implementation

inline void Interpreter::begin() {
    if (!options_.preamble) return;
    emit_line(latex::DOCUMENT_CLASS);
    emit_line(latex::BEGIN_DOCUMENT);
}

inline void Interpreter::translate(LineReader& reader) {
    source_ = reader.source();
    Line line;
    while (reader.next(line)) {
        process(line);
    }
}

inline void Interpreter::process(const Line& line) {
    line_number_ = line.number;

    if (state_.in_comment) {
        if (command_of(line) == Command::END_COMMENT) {
            state_.in_comment = false;
        }
        return;
    }

    if (state_.in_literal) {
        if (command_of(line) == Command::END_LITERAL) {
            end_literal();
        } else {
            emit_line(latex::guard_verbatim(line.text));
        }
        return;
    }

    if (line.number == 1 && options_.skip_header &&
        std::string_view(line.text).substr(0, syntax::FILE_HEADER.size()) == syntax::FILE_HEADER) {
        return;
    }

    if (line.is_directive()) {
        process_directive(parse_directive(line.text, commands_), line.text);
    } else {
        process_text(line);
    }
}

inline void Interpreter::process_text(const Line& line) {
    if (state_.pending && !line.is_blank()) {
        Pending p = *state_.pending;
        state_.pending.reset();
        emit_construct(p, directive::trim(line.text));
        return;
    }
    emit_line(translate_span(line.text));
}

inline void Interpreter::process_directive(const Directive& d, std::string_view raw) {
    if (!options_.carry_latch) state_.latch = LatchState::none();

    auto spec = commands_.find(d.name);
    if (!spec) {
        if (state_.pending) flush_pending();
        unknown_directive(raw);
    } else {
        bool transparent = spec->kind == CommandKind::IGNORED || spec->command == Command::COMMENT_LINE ||
                           spec->command == Command::COMMENT;
        if (state_.pending && !transparent) flush_pending();
        if (spec->kind != CommandKind::IGNORED) {
            dispatch(spec->command, d);
        } else if (carries_text(d)) {
            std::string_view trimmed = directive::trim(d.text);
            warn("directive .%s is ignored, its text '%.*s' is dropped", d.name.c_str(),
                 static_cast<int>(trimmed.size()), trimmed.data());
        }
    }

    if (!options_.carry_latch) state_.latch = LatchState::none();
}

inline void Interpreter::dispatch(Command command, const Directive& d) {
    switch (command) {
    case Command::APPENDIX:
    case Command::CENTRE:
    case Command::TITLE:
        text_bearing(command, latex::MIN_LEVEL, d.text);
        break;
    case Command::HEADING:      heading(d);                 break;
    case Command::BLANK:        blank(d);                   break;
    case Command::FLAGS:        change_flags(d, true);      break;
    case Command::NO_FLAGS:     change_flags(d, false);     break;
    case Command::LIST:         start_list(d);              break;
    case Command::LIST_ELEMENT: list_element(d);            break;
    case Command::END_LIST:     end_list();                 break;
    case Command::PAGE:         emit_line(latex::NEW_PAGE); break;

    case Command::COMMENT:
        state_.in_comment = true;
        break;
    case Command::END_COMMENT:
        warn(".END COMMENT without .COMMENT");
        break;

    case Command::FOOTNOTE:
        emit_line(latex::FOOTNOTE_OPEN);
        state_.regions.push_back(Region{Region::Kind::FOOTNOTE, {}});
        break;
    case Command::END_FOOTNOTE:
        end_footnote();
        break;

    case Command::LITERAL:
        emit_line(latex::BEGIN_VERBATIM);
        state_.in_literal = true;
        break;
    case Command::END_LITERAL:
        warn(".END LITERAL without .LITERAL");
        break;

    case Command::COMMENT_LINE:
    case Command::LAYOUT:
        break;
    }
}

inline void Interpreter::unknown_directive(std::string_view raw) {
    std::string_view trimmed = directive::trim(raw);
    warn("unsupported directive '%.*s'", static_cast<int>(trimmed.size()), trimmed.data());
    if (options_.unknown == UnknownPolicy::MARK) {
        std::string marker(latex::UNSUPPORTED_MARKER);
        marker += trimmed;
        emit_line(marker);
    }
}

inline void Interpreter::text_bearing(Command command, int level, std::string_view text) {
    std::string_view trimmed = directive::trim(text);
    if (trimmed.empty()) {
        state_.pending = Pending{command, level};
        return;
    }
    emit_construct(Pending{command, level}, trimmed);
}

inline void Interpreter::emit_construct(const Pending& p, std::string_view text) {
    std::string body = translate_span(text);

    switch (p.command) {
    case Command::APPENDIX:
        if (!state_.in_appendices) {
            emit_line(latex::APPENDIX);
            state_.in_appendices = true;
        }
        emit_line(latex::section(latex::MIN_LEVEL, body));
        break;
    case Command::CENTRE:
        emit_line("\\centerline{" + body + "}");
        break;
    case Command::HEADING:
        emit_line(latex::section(p.level, body));
        break;
    case Command::TITLE:
        emit_line("\\title{" + body + "}");
        if (!state_.title_made) {
            emit_line(latex::MAKE_TITLE);
            state_.title_made = true;
        }
        break;
    default:
        emit_line(body);
        break;
    }
}

inline void Interpreter::flush_pending() {
    warn("text for the previous heading, title or centred line is missing");
    Pending p = *state_.pending;
    state_.pending.reset();
    emit_construct(p, {});
}

inline void Interpreter::heading(const Directive& d) {
    auto [parsed, text] = directive::split_leading_int(d.text);

    int level = latex::MIN_LEVEL;
    if (!parsed) {
        warn("heading level missing or not a number, using %d", level);
    } else if (*parsed < latex::MIN_LEVEL || *parsed > latex::MAX_LEVEL) {
        level = *parsed < latex::MIN_LEVEL ? latex::MIN_LEVEL : latex::MAX_LEVEL;
        warn("heading level %d out of range, using %d", *parsed, level);
    } else {
        level = *parsed;
    }
    text_bearing(Command::HEADING, level, text);
}

inline void Interpreter::blank(const Directive& d) {
    int count = 1;
    if (!d.args.empty()) {
        auto parsed = directive::parse_int(d.args.front());
        if (parsed) {
            count = *parsed;
        } else {
            warn("blank line count '%s' is not a number, using 1", d.args.front().c_str());
        }
    }

    if (count <= 0) {
        emit_line(latex::PARAGRAPH);
    } else {
        emit_line("\\vspace{" + std::to_string(count) + "\\baselineskip}");
    }
}

// .FLAGS name [char] / .NO FLAGS name
inline void Interpreter::change_flags(const Directive& d, bool enable) {
    std::string_view text = d.text;
    size_t pos       = directive::skip_blanks(text, 0);
    std::string name = directive::read_word(text, pos);
    pos              = directive::skip_blanks(text, pos);

    if (name.empty()) {
        warn("flag name missing");
        return;
    }

    if (FlagTable::is_all(name)) {
        if (!enable) {
            state_.flags.disable_all();
            return;
        }
        state_.flags = FlagTable::all_defaults();
        return;
    }

    auto flag = FlagTable::find(name);
    if (!flag) {
        warn("unsupported flag %s", name.c_str());
        return;
    }

    if (!enable) {
        state_.flags.disable(*flag);
        return;
    }

    char c = pos < text.size() ? text[pos] : FlagTable::default_char(*flag);
    state_.flags.set(*flag, c);
}

inline void Interpreter::start_list(const Directive& d) {
    std::string bullet;
    for (const std::string& arg : d.args) {
        if (!directive::parse_int(arg)) {
            bullet = arg;
            break;
        }
    }
    emit_line(indent(state_.list_depth()) + std::string(latex::BEGIN_ITEMIZE));
    state_.regions.push_back(Region{Region::Kind::LIST, std::move(bullet)});
}

inline void Interpreter::list_element(const Directive& d) {
    const Region* list = nullptr;
    if (!state_.regions.empty() && state_.regions.back().kind == Region::Kind::LIST) {
        list = &state_.regions.back();
    } else {
        warn("list element outside of a list");
    }

    std::string item = indent(state_.list_depth());
    item += latex::ITEM;
    if (list && !list->bullet.empty()) {
        item += '[';
        item += latex::escape(list->bullet);
        item += ']';
    }

    std::string_view text = directive::trim(d.text);
    if (!text.empty()) {
        item += ' ';
        item += translate_span(text);
    }
    emit_line(item);
}

// Depth never goes below zero: a stray end-of-list is ignored
inline void Interpreter::end_list() {
    if (!close_through(Region::Kind::LIST)) {
        warn("end of list without a matching list start");
    }
}

inline void Interpreter::end_footnote() {
    if (!close_through(Region::Kind::FOOTNOTE)) {
        warn(".END FOOTNOTE without .FOOTNOTE");
    }
}

inline void Interpreter::close_region() {
    Region::Kind kind = state_.regions.back().kind;
    state_.regions.pop_back();
    if (kind == Region::Kind::LIST) {
        emit_line(indent(state_.list_depth()) + std::string(latex::END_ITEMIZE));
    } else {
        emit_line(latex::GROUP_CLOSE);
    }
}

// Close the innermost region of the given kind, and first every region
// opened inside it. Returns false when no such region is open.
inline bool Interpreter::close_through(Region::Kind kind) {
    auto it = std::find_if(state_.regions.rbegin(), state_.regions.rend(),
                           [kind](const Region& r) { return r.kind == kind; });
    if (it == state_.regions.rend()) return false;

    while (state_.regions.back().kind != kind) {
        warn("%s still open, closing it", state_.regions.back().name());
        close_region();
    }
    close_region();
    return true;
}

inline void Interpreter::end_literal() {
    emit_line(latex::END_VERBATIM);
    state_.in_literal = false;
}

inline void Interpreter::finish() {
    if (state_.pending) flush_pending();

    if (state_.in_literal) {
        warn("literal block not closed before end of input");
        end_literal();
    }
    if (state_.in_comment) {
        warn("comment not closed before end of input");
        state_.in_comment = false;
    }
    while (!state_.regions.empty()) {
        warn("%s not closed before end of input", state_.regions.back().name());
        close_region();
    }

    if (options_.preamble) {
        emit_line(latex::END_DOCUMENT);
    }
    std::fflush(out_);
}
