// syntax.h - RUNOFF source syntax constants and flag character defaults
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

// RUNOFF flags: single characters with in-band formatting meaning
enum class Flag : uint8_t {
    ACCEPT    = 0, // take next character literally
    BOLD      = 1,
    UNDERLINE = 2,
    UPPERCASE = 3, // also the lock-on prefix, as in ^* and ^&
    LOWERCASE = 4, // also the lock-off prefix, as in \* and \&
    SPACE     = 5, // non-expandable space
};

constexpr size_t FLAG_COUNT = 6;
static_assert(static_cast<size_t>(Flag::SPACE) + 1 == FLAG_COUNT, "FLAG_COUNT out of step with Flag");

namespace syntax {

// Directive lines begin with this character (after optional blanks)
constexpr char COMMAND_PREFIX = '.';

// Single-line comment keyword: ".! anything"
constexpr char COMMENT_KEYWORD = '!';

// Characters separating a keyword from its argument text
constexpr std::string_view SEPARATORS = " \t;";

// Characters separating argument tokens
constexpr std::string_view ARG_SEPARATORS = " \t,";

// Quote characters accepted around string arguments (list bullets)
constexpr std::string_view QUOTES = "\"'";

// First line of a file beginning with this is a file header and is skipped
constexpr std::string_view FILE_HEADER = "+-";

namespace flag {

// Names accepted by .FLAGS / .NO FLAGS, indexed by Flag
constexpr std::array<std::string_view, FLAG_COUNT> NAMES = {
    "ACCEPT", "BOLD", "UNDERLINE", "UPPERCASE", "LOWERCASE", "SPACE",
};

// Default characters, indexed by Flag. Used when .FLAGS names a flag
// without giving a character.
constexpr std::array<char, FLAG_COUNT> DEFAULT_CHARS = {
    '_', '*', '&', '^', '\\', '#',
};

// Flags enabled when translation starts. The others stay off until a
// .FLAGS directive turns them on, so _ * & \\ # are plain text by default.
constexpr std::array<bool, FLAG_COUNT> ENABLED_AT_START = {
    false, false, false, true, false, false,
};

// Pseudo-name addressing every flag at once
constexpr std::string_view ALL = "ALL";

// Marks a flag as disabled in a FlagTable
constexpr char DISABLED = '\0';

} // namespace flag
} // namespace syntax
