// test_directive.cpp - Directive parsing and the command table

#include <gtest/gtest.h>

#include "command_table.h"
#include "directive.h"

class DirectiveTest : public ::testing::Test {
protected:
    CommandTable table = CommandTable::standard();

    Directive parse(const char* line) { return parse_directive(line, table); }
};

TEST_F(DirectiveTest, KeywordAndArguments) {
    Directive d = parse(".HL1 Overview");
    EXPECT_EQ(d.name, "HL");
    EXPECT_EQ(d.text, "1 Overview");
    ASSERT_EQ(d.args.size(), 2u);
    EXPECT_EQ(d.args[0], "1");
    EXPECT_EQ(d.args[1], "Overview");
}

TEST_F(DirectiveTest, KeywordsAreCaseInsensitive) {
    EXPECT_EQ(parse(".hl 2 Title").name, "HL");
    EXPECT_EQ(parse(".Page").name, "PAGE");
}

TEST_F(DirectiveTest, LeadingBlanksAreSkipped) {
    EXPECT_EQ(parse("   .PG").name, "PG");
}

TEST_F(DirectiveTest, CompoundKeywords) {
    Directive d = parse(".end   literal");
    EXPECT_EQ(d.name, "END LITERAL");
    EXPECT_EQ(d.text, "");

    d = parse(".NO FLAGS BOLD");
    EXPECT_EQ(d.name, "NO FLAGS");
    EXPECT_EQ(d.text, "BOLD");
}

TEST_F(DirectiveTest, UnknownCompoundKeepsFirstWord) {
    Directive d = parse(".END FOO");
    EXPECT_EQ(d.name, "END");
    EXPECT_EQ(d.text, "FOO");

    d = parse(".T My Title");
    EXPECT_EQ(d.name, "T");
    EXPECT_EQ(d.text, "My Title");
}

TEST_F(DirectiveTest, SemicolonSeparatesText) {
    Directive d = parse(".LE;first element");
    EXPECT_EQ(d.name, "LE");
    EXPECT_EQ(d.text, "first element");
}

TEST_F(DirectiveTest, CommentKeyword) {
    Directive d = parse(".!just a note");
    EXPECT_EQ(d.name, "!");
    EXPECT_EQ(d.text, "just a note");
}

TEST_F(DirectiveTest, QuotedArguments) {
    Directive d = parse(".LS 1,\"o o\"");
    ASSERT_EQ(d.args.size(), 2u);
    EXPECT_EQ(d.args[0], "1");
    EXPECT_EQ(d.args[1], "o o");

    d = parse(".LS '*'");
    ASSERT_EQ(d.args.size(), 1u);
    EXPECT_EQ(d.args[0], "*");
}

TEST_F(DirectiveTest, EmptyKeyword) {
    Directive d = parse(".");
    EXPECT_EQ(d.name, "");
    EXPECT_FALSE(table.find(d.name));
}

TEST(DirectiveHelpersTest, ParseInt) {
    EXPECT_EQ(directive::parse_int("12"), 12);
    EXPECT_EQ(directive::parse_int(" +3 "), 3);
    EXPECT_EQ(directive::parse_int("-2"), -2);
    EXPECT_FALSE(directive::parse_int("x"));
    EXPECT_FALSE(directive::parse_int("4x"));
    EXPECT_FALSE(directive::parse_int(""));
}

TEST(DirectiveHelpersTest, SplitLeadingInt) {
    auto [level, text] = directive::split_leading_int("2 Title here");
    EXPECT_EQ(level, 2);
    EXPECT_EQ(text, "Title here");

    auto [none, rest] = directive::split_leading_int("Title");
    EXPECT_FALSE(none);
    EXPECT_EQ(rest, "Title");

    auto [negative, after] = directive::split_leading_int("-1;x");
    EXPECT_EQ(negative, -1);
    EXPECT_EQ(after, "x");
}

TEST(CommandTableTest, StandardEntries) {
    CommandTable table = CommandTable::standard();

    auto heading = table.find("HL");
    ASSERT_TRUE(heading);
    EXPECT_EQ(heading->command, Command::HEADING);
    EXPECT_EQ(heading->kind, CommandKind::TEXT_BEARING);

    auto literal_end = table.find("EL");
    ASSERT_TRUE(literal_end);
    EXPECT_EQ(literal_end->command, Command::END_LITERAL);
    EXPECT_EQ(table.find("END LITERAL")->command, Command::END_LITERAL);

    auto margin = table.find("LM");
    ASSERT_TRUE(margin);
    EXPECT_EQ(margin->kind, CommandKind::IGNORED);

    EXPECT_FALSE(table.find("XYZ"));
    EXPECT_FALSE(table.find("hl"));
}

TEST(CommandTableTest, CustomTable) {
    CommandTable table;
    EXPECT_EQ(table.size(), 0u);
    table.add({"NP", "NEW PAGE"}, Command::PAGE, CommandKind::STRUCTURAL);
    EXPECT_TRUE(table.contains("NEW PAGE"));
    EXPECT_EQ(parse_directive(".new page", table).name, "NEW PAGE");
    EXPECT_EQ(parse_directive(".new page", CommandTable::standard()).name, "NEW");
}
