// GraphQL lexer tests

#include "graphql/lexer.hpp"

#include <gtest/gtest.h>

using namespace embedql;
using namespace embedql::graphql;

class LexerTest : public ::testing::Test {
protected:
    std::vector<Token> lex(const std::string& text) {
        Source source(text);
        Lexer lexer(source);
        auto result = lexer.tokenize();
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).message : "");
        return is_ok(result) ? unwrap(result) : std::vector<Token>{};
    }

    SyntaxError lex_error(const std::string& text, SourceLocation offset = {}) {
        Source source(text, "src/Foo.js", offset);
        Lexer lexer(source);
        auto result = lexer.tokenize();
        EXPECT_TRUE(is_err(result));
        return is_err(result) ? unwrap_err(result) : SyntaxError{};
    }
};

// ============================================================================
// Tokens
// ============================================================================

TEST_F(LexerTest, Punctuators) {
    auto tokens = lex("! $ & ( ) ... : = @ [ ] { | }");
    std::vector<TokenKind> expected = {
        TokenKind::Bang,     TokenKind::Dollar,   TokenKind::Amp,    TokenKind::ParenL,
        TokenKind::ParenR,   TokenKind::Spread,   TokenKind::Colon,  TokenKind::Equals,
        TokenKind::At,       TokenKind::BracketL, TokenKind::BracketR, TokenKind::BraceL,
        TokenKind::Pipe,     TokenKind::BraceR,   TokenKind::Eof,
    };
    ASSERT_EQ(tokens.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(tokens[i].kind, expected[i]) << "token " << i;
    }
}

TEST_F(LexerTest, IgnoresCommasCommentsAndBom) {
    auto tokens = lex("\xEF\xBB\xBF query, # trailing comment\n Foo");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].value, "query");
    EXPECT_EQ(tokens[1].value, "Foo");
    EXPECT_TRUE(tokens[2].is(TokenKind::Eof));
}

TEST_F(LexerTest, Numbers) {
    auto tokens = lex("0 -12 3.5 1e10 -2.5E-3");
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Int);
    EXPECT_EQ(tokens[1].kind, TokenKind::Int);
    EXPECT_EQ(tokens[1].value, "-12");
    EXPECT_EQ(tokens[2].kind, TokenKind::Float);
    EXPECT_EQ(tokens[3].kind, TokenKind::Float);
    EXPECT_EQ(tokens[4].kind, TokenKind::Float);
    EXPECT_EQ(tokens[4].value, "-2.5E-3");
}

TEST_F(LexerTest, StringEscapes) {
    auto tokens = lex(R"("a\"b\\c\nA")");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::String);
    EXPECT_EQ(tokens[0].value, "a\"b\\c\nA");
}

TEST_F(LexerTest, UnicodeEscapes) {
    auto fixed = lex(R"("caf\u00E9 \u20AC")");
    ASSERT_EQ(fixed.size(), 2u);
    EXPECT_EQ(fixed[0].value, "caf\xC3\xA9 \xE2\x82\xAC");

    // Surrogate pairs and braced escapes both produce 4-byte UTF-8
    auto pair = lex(R"("\uD83D\uDE00")");
    ASSERT_EQ(pair.size(), 2u);
    EXPECT_EQ(pair[0].value, "\xF0\x9F\x98\x80");

    auto braced = lex(R"("\u{1F600}\u{41}")");
    ASSERT_EQ(braced.size(), 2u);
    EXPECT_EQ(braced[0].value, "\xF0\x9F\x98\x80"
                               "A");
}

TEST_F(LexerTest, InvalidUnicodeEscapes) {
    EXPECT_EQ(lex_error(R"("\uD800")").message,
              "Syntax Error: Invalid Unicode escape sequence: \"\\uD800\".");
    EXPECT_EQ(lex_error(R"("\uDE00\uD83D")").message,
              "Syntax Error: Invalid Unicode escape sequence: \"\\uDE00\".");
    EXPECT_EQ(lex_error(R"("\u{110000}")").message,
              "Syntax Error: Invalid Unicode escape sequence: \"\\u{110000\".");
    EXPECT_EQ(lex_error(R"("\u{}")").message,
              "Syntax Error: Invalid Unicode escape sequence: \"\\u{}\".");
    EXPECT_EQ(lex_error(R"("\u12G4")").message,
              "Syntax Error: Invalid Unicode escape sequence: \"\\u12G4\".");
}

TEST_F(LexerTest, BlockStringIsDedented) {
    auto tokens = lex("\"\"\"\n    Hello,\n      World!\n    \"\"\"");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::BlockString);
    EXPECT_EQ(tokens[0].value, "Hello,\n  World!");
}

TEST_F(LexerTest, TokenOffsets) {
    auto tokens = lex("query Foo");
    EXPECT_EQ(tokens[1].start, 6u);
    EXPECT_EQ(tokens[1].end, 9u);
}

TEST(DedentTest, KeepsFirstLineIndentation) {
    EXPECT_EQ(dedent_block_string("  first\n    second\n    third"), "  first\nsecond\nthird");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(LexerTest, UnterminatedString) {
    auto err = lex_error("\"abc");
    EXPECT_EQ(err.message, "Syntax Error: Unterminated string.");
    EXPECT_EQ(err.source_name, "src/Foo.js");
}

TEST_F(LexerTest, UnexpectedCharacter) {
    auto err = lex_error("query ?");
    EXPECT_EQ(err.message, "Syntax Error: Unexpected character: \"?\".");
    EXPECT_EQ(err.location.column, 7u);
}

TEST_F(LexerTest, SingleQuoteHint) {
    auto err = lex_error("'abc'");
    EXPECT_NE(err.message.find("did you mean to use a double quote"), std::string::npos);
}

TEST_F(LexerTest, LeadingZero) {
    auto err = lex_error("012");
    EXPECT_EQ(err.message, "Syntax Error: Invalid number, unexpected digit after 0: \"1\".");
}

TEST_F(LexerTest, ErrorLocationIsShiftedIntoHostFile) {
    // Literal body starts at line 4, column 20 of the host file
    auto err = lex_error("{ id ?", SourceLocation{4, 20, 100});
    EXPECT_EQ(err.location.line, 4u);
    EXPECT_EQ(err.location.column, 25u);
    EXPECT_EQ(err.location.offset, 105u);

    auto second_line = lex_error("{\n  id ?", SourceLocation{4, 20, 100});
    EXPECT_EQ(second_line.location.line, 5u);
    EXPECT_EQ(second_line.location.column, 6u);
}
