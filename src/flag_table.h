// flag_table.h - Mapping between RUNOFF flags and their characters
#pragma once

#include <array>
#include <cctype>
#include <optional>
#include <string_view>

#include "syntax.h"

// One character per flag, or DISABLED. A character belongs to at most one flag.
struct FlagTable {
    std::array<char, FLAG_COUNT> chars{};

    FlagTable() { chars.fill(syntax::flag::DISABLED); }

    // Table as it stands when translation starts: only UPPERCASE is on
    static FlagTable standard() {
        FlagTable table;
        for (size_t i = 0; i < FLAG_COUNT; ++i) {
            if (syntax::flag::ENABLED_AT_START[i]) table.chars[i] = syntax::flag::DEFAULT_CHARS[i];
        }
        return table;
    }

    // Every flag enabled at its default character (.FLAGS ALL)
    static FlagTable all_defaults() {
        FlagTable table;
        table.chars = syntax::flag::DEFAULT_CHARS;
        return table;
    }

    // Find flag by name (case-insensitive)
    static std::optional<Flag> find(std::string_view name) {
        for (size_t i = 0; i < FLAG_COUNT; ++i) {
            if (equals_ignore_case(syntax::flag::NAMES[i], name)) {
                return static_cast<Flag>(i);
            }
        }
        return std::nullopt;
    }

    static bool is_all(std::string_view name) {
        return equals_ignore_case(syntax::flag::ALL, name);
    }

    static std::string_view name(Flag f) {
        return syntax::flag::NAMES[index(f)];
    }

    static char default_char(Flag f) {
        return syntax::flag::DEFAULT_CHARS[index(f)];
    }

    std::optional<Flag> lookup(char c) const {
        if (c == syntax::flag::DISABLED) return std::nullopt;
        for (size_t i = 0; i < FLAG_COUNT; ++i) {
            if (chars[i] == c) return static_cast<Flag>(i);
        }
        return std::nullopt;
    }

    bool is(char c, Flag f) const {
        return c != syntax::flag::DISABLED && chars[index(f)] == c;
    }

    char get(Flag f) const { return chars[index(f)]; }

    bool enabled(Flag f) const { return get(f) != syntax::flag::DISABLED; }

    // Assign a character to a flag; any other flag holding it is disabled
    void set(Flag f, char c) {
        for (char& held : chars) {
            if (held == c) held = syntax::flag::DISABLED;
        }
        chars[index(f)] = c;
    }

    void disable(Flag f) { chars[index(f)] = syntax::flag::DISABLED; }

    void disable_all() { chars.fill(syntax::flag::DISABLED); }

private:
    static size_t index(Flag f) { return static_cast<size_t>(f); }

    static bool equals_ignore_case(std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        for (size_t i = 0; i < a.size(); ++i) {
            if (std::toupper(static_cast<unsigned char>(a[i])) !=
                std::toupper(static_cast<unsigned char>(b[i]))) {
                return false;
            }
        }
        return true;
    }
};
