// latch.h - Inline latch state carried between text spans
#pragma once

#include <cstdint>
#include <string>

// Case shift applied to letters while scanning text
enum class CaseShift : uint8_t {
    NONE,
    UPPER,
    LOWER,
};

// Inline styles that can be locked across characters
enum class Style : uint8_t {
    BOLD,
    UNDERLINE,
};

struct LatchState {
    CaseShift shift = CaseShift::NONE;
    bool bold       = false;
    bool underline  = false;

    // Factory: nothing latched
    static LatchState none() { return LatchState{}; }

    bool has(Style s) const {
        return s == Style::BOLD ? bold : underline;
    }

    void set(Style s, bool on) {
        if (s == Style::BOLD) {
            bold = on;
        } else {
            underline = on;
        }
    }

    // Shift one step towards upper case: LOWER -> NONE, otherwise UPPER
    void shift_up() {
        shift = shift == CaseShift::LOWER ? CaseShift::NONE : CaseShift::UPPER;
    }

    // Shift one step towards lower case: UPPER -> NONE, otherwise LOWER
    void shift_down() {
        shift = shift == CaseShift::UPPER ? CaseShift::NONE : CaseShift::LOWER;
    }

    bool operator==(const LatchState&) const = default;
};

// Translated span plus the latch state to thread into the next span
struct InlineResult {
    std::string text;
    LatchState latch;
};
