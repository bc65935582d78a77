// inline_automaton.h - State machine translating RUNOFF flags in text to LaTeX
#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "flag_table.h"
#include "latch.h"
#include "latex.h"

// Processes a text span character-by-character, rewriting flag sequences
// into LaTeX groups and escaping LaTeX special characters.
// Style groups are opened lazily before the first character they apply to
// and are always closed by finish(), so every span yields balanced braces.
class InlineAutomaton {
public:
    InlineAutomaton(const FlagTable& flags, LatchState latch = LatchState::none())
        : flags_(flags), latch_(latch) {
        if (latch_.bold)      wanted_.push_back(Style::BOLD);
        if (latch_.underline) wanted_.push_back(Style::UNDERLINE);
    }

    // Process a single input character
    void accept(int c);

    // Flush dangling flags, close open groups and hand back the latch state.
    // The automaton must not be used afterwards.
    InlineResult finish();

private:
    // Parser states
    enum class State {
        DEFAULT,
        AFTER_UPPERCASE, // ^ seen: lock on, shift up, or upper-case next char
        AFTER_LOWERCASE, // \ seen: lock off, shift down, or lower-case next char
        AFTER_ACCEPT,    // _ seen: next char is taken literally
        AFTER_BOLD,      // * seen: bold next char
        AFTER_UNDERLINE, // & seen: underline next char
    };

    const FlagTable& flags_;
    LatchState latch_;
    State state_       = State::DEFAULT;
    char pending_flag_ = syntax::flag::DISABLED;
    std::string out_;

    // Locked styles in lock order; the first open_ of them are emitted
    std::vector<Style> wanted_;
    size_t open_ = 0;

    static std::string_view open_sequence(Style s) {
        return s == Style::BOLD ? latex::BOLD_OPEN : latex::UNDERLINE_OPEN;
    }

    static char apply_case(char c, CaseShift shift) {
        if (shift == CaseShift::UPPER && c >= 'a' && c <= 'z') return static_cast<char>(c - 'a' + 'A');
        if (shift == CaseShift::LOWER && c >= 'A' && c <= 'Z') return static_cast<char>(c - 'A' + 'a');
        return c;
    }

    // Open any locked styles not yet emitted
    void sync_styles() {
        while (open_ < wanted_.size()) {
            out_ += open_sequence(wanted_[open_++]);
        }
    }

    void close_groups(size_t count) {
        out_.append(count, latex::STYLE_CLOSE);
        open_ -= count;
    }

    void emit_text(char c, CaseShift shift) {
        sync_styles();
        latex::append_escaped(out_, apply_case(c, shift));
    }

    void emit_literal(char c) {
        sync_styles();
        latex::append_escaped(out_, c);
    }

    void lock_style(Style s) {
        if (latch_.has(s)) return;
        latch_.set(s, true);
        wanted_.push_back(s);
    }

    // Close the style's group together with any opened after it;
    // those are reopened lazily on the next character
    void unlock_style(Style s) {
        if (!latch_.has(s)) return;
        latch_.set(s, false);

        auto it = std::find(wanted_.begin(), wanted_.end(), s);
        size_t pos = static_cast<size_t>(it - wanted_.begin());
        if (pos < open_) {
            close_groups(open_ - pos);
        }
        wanted_.erase(it);
    }

    void single_style(char c, Style s) {
        if (latch_.has(s)) {
            emit_text(c, latch_.shift);
            return;
        }
        sync_styles();
        out_ += open_sequence(s);
        latex::append_escaped(out_, apply_case(c, latch_.shift));
        out_ += latex::STYLE_CLOSE;
    }

    // State handlers
    void handle_default(int c);
    void handle_uppercase(int c);
    void handle_lowercase(int c);
};

// Implementation

inline void InlineAutomaton::handle_default(int c) {
    char ch = static_cast<char>(c);
    auto flag = flags_.lookup(ch);
    if (!flag) {
        emit_text(ch, latch_.shift);
        return;
    }

    pending_flag_ = ch;
    switch (*flag) {
    case Flag::ACCEPT:    state_ = State::AFTER_ACCEPT;    break;
    case Flag::UPPERCASE: state_ = State::AFTER_UPPERCASE; break;
    case Flag::LOWERCASE: state_ = State::AFTER_LOWERCASE; break;
    case Flag::BOLD:      state_ = State::AFTER_BOLD;      break;
    case Flag::UNDERLINE: state_ = State::AFTER_UNDERLINE; break;
    case Flag::SPACE:
        sync_styles();
        out_ += latex::NBSP;
        break;
    }
}

inline void InlineAutomaton::handle_uppercase(int c) {
    char ch = static_cast<char>(c);
    if (flags_.is(ch, Flag::BOLD)) {
        lock_style(Style::BOLD);
    } else if (flags_.is(ch, Flag::UNDERLINE)) {
        lock_style(Style::UNDERLINE);
    } else if (flags_.is(ch, Flag::UPPERCASE)) {
        latch_.shift_up();
    } else {
        emit_text(ch, CaseShift::UPPER);
    }
}

inline void InlineAutomaton::handle_lowercase(int c) {
    char ch = static_cast<char>(c);
    if (flags_.is(ch, Flag::BOLD)) {
        unlock_style(Style::BOLD);
    } else if (flags_.is(ch, Flag::UNDERLINE)) {
        unlock_style(Style::UNDERLINE);
    } else if (flags_.is(ch, Flag::LOWERCASE)) {
        latch_.shift_down();
    } else {
        emit_text(ch, CaseShift::LOWER);
    }
}

inline void InlineAutomaton::accept(int c) {
    State state = state_;
    state_      = State::DEFAULT;

    switch (state) {
    case State::AFTER_UPPERCASE:
        handle_uppercase(c);
        break;
    case State::AFTER_LOWERCASE:
        handle_lowercase(c);
        break;
    case State::AFTER_ACCEPT:
        emit_literal(static_cast<char>(c));
        break;
    case State::AFTER_BOLD:
        single_style(static_cast<char>(c), Style::BOLD);
        break;
    case State::AFTER_UNDERLINE:
        single_style(static_cast<char>(c), Style::UNDERLINE);
        break;
    case State::DEFAULT:
    default:
        handle_default(c);
        break;
    }
}

inline InlineResult InlineAutomaton::finish() {
    // A flag with nothing after it is ordinary text
    if (state_ != State::DEFAULT) {
        emit_literal(pending_flag_);
        state_ = State::DEFAULT;
    }
    close_groups(open_);
    return InlineResult{std::move(out_), latch_};
}

// Translate a whole span, threading the latch state through
inline InlineResult translate_inline(std::string_view span, const FlagTable& flags,
                                     LatchState latch = LatchState::none()) {
    InlineAutomaton automaton(flags, latch);
    for (char c : span) {
        automaton.accept(static_cast<unsigned char>(c));
    }
    return automaton.finish();
}
