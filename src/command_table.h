// command_table.h - RUNOFF directive keywords and their actions
#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <optional>
#include <string>
#include <string_view>

enum class Command : uint8_t {
    APPENDIX,
    BLANK,
    CENTRE,
    COMMENT_LINE,
    COMMENT,
    END_COMMENT,
    FLAGS,
    NO_FLAGS,
    FOOTNOTE,
    END_FOOTNOTE,
    HEADING,
    LIST,
    LIST_ELEMENT,
    END_LIST,
    LITERAL,
    END_LITERAL,
    PAGE,
    TITLE,
    LAYOUT, // recognised but has no LaTeX counterpart
};

enum class CommandKind : uint8_t {
    STRUCTURAL,   // changes document state or emits fixed markup
    TEXT_BEARING, // translates its argument text
    IGNORED,      // accepted and discarded; text arguments are reported
};

struct CommandSpec {
    Command command;
    CommandKind kind;
};

// Keyword -> command mapping. Keywords are stored upper-case; compound
// keywords use a single space ("END LITERAL").
class CommandTable {
public:
    CommandTable() = default;

    // Standard RUNOFF subset
    static CommandTable standard() {
        using K = CommandKind;
        CommandTable table;
        table.add({"AX", "APPENDIX"},                   Command::APPENDIX,     K::TEXT_BEARING);
        table.add({"B", "BLANK", "S", "SKIP"},          Command::BLANK,        K::STRUCTURAL);
        table.add({"C", "CENTRE", "CENTER"},            Command::CENTRE,       K::TEXT_BEARING);
        table.add({"!"},                                Command::COMMENT_LINE, K::STRUCTURAL);
        table.add({"COMMENT"},                          Command::COMMENT,      K::STRUCTURAL);
        table.add({"END COMMENT"},                      Command::END_COMMENT,  K::STRUCTURAL);
        table.add({"FL", "FLAGS"},                      Command::FLAGS,        K::STRUCTURAL);
        table.add({"NFL", "NO FLAGS"},                  Command::NO_FLAGS,     K::STRUCTURAL);
        table.add({"FN", "FOOTNOTE"},                   Command::FOOTNOTE,     K::STRUCTURAL);
        table.add({"EFN", "END FOOTNOTE"},              Command::END_FOOTNOTE, K::STRUCTURAL);
        table.add({"HL", "HEADER LEVEL"},               Command::HEADING,      K::TEXT_BEARING);
        table.add({"LS", "LIST"},                       Command::LIST,         K::STRUCTURAL);
        table.add({"LE", "LIST ELEMENT"},               Command::LIST_ELEMENT, K::TEXT_BEARING);
        table.add({"ELS", "END LIST"},                  Command::END_LIST,     K::STRUCTURAL);
        table.add({"LT", "LITERAL"},                    Command::LITERAL,      K::STRUCTURAL);
        table.add({"EL", "END LITERAL"},                Command::END_LITERAL,  K::STRUCTURAL);
        table.add({"PG", "PAGE"},                       Command::PAGE,         K::STRUCTURAL);
        table.add({"T", "TITLE"},                       Command::TITLE,        K::TEXT_BEARING);
        table.add({"LM", "LEFT MARGIN", "RM", "RIGHT MARGIN", "PS", "PAGE SIZE",
                   "AJ", "AUTOJUSTIFY", "AP", "AUTOPARAGRAPH", "J", "JUSTIFY",
                   "NJ", "NO JUSTIFY", "F", "FILL", "NF", "NO FILL", "SP", "SPACING",
                   "EBB", "EBO", "EUN", "REQ", "REQUIRE", "ST", "SUBTITLE"},
                  Command::LAYOUT, K::IGNORED);
        return table;
    }

    // Register keywords for a command; later registrations win
    void add(std::initializer_list<std::string_view> names, Command command, CommandKind kind) {
        for (std::string_view name : names) {
            entries_[std::string(name)] = CommandSpec{command, kind};
        }
    }

    std::optional<CommandSpec> find(std::string_view name) const {
        auto it = entries_.find(name);
        if (it == entries_.end()) return std::nullopt;
        return it->second;
    }

    bool contains(std::string_view name) const { return entries_.find(name) != entries_.end(); }

    size_t size() const { return entries_.size(); }

private:
    std::map<std::string, CommandSpec, std::less<>> entries_;
};
