//! # GraphQL Tokens
//!
//! Lexical token kinds of the GraphQL language. Whitespace, commas, the
//! byte-order mark and `#` comments are insignificant and never produce
//! tokens.

#ifndef EMBEDQL_GRAPHQL_TOKEN_HPP
#define EMBEDQL_GRAPHQL_TOKEN_HPP

#include <cstdint>
#include <string>

namespace embedql::graphql {

enum class TokenKind : uint8_t {
    Sof,         ///< Start of file (never returned by the lexer)
    Eof,         ///< End of file
    Bang,        ///< !
    Dollar,      ///< $
    Amp,         ///< &
    ParenL,      ///< (
    ParenR,      ///< )
    Spread,      ///< ...
    Colon,       ///< :
    Equals,      ///< =
    At,          ///< @
    BracketL,    ///< [
    BracketR,    ///< ]
    BraceL,      ///< {
    Pipe,        ///< |
    BraceR,      ///< }
    Name,        ///< [_A-Za-z][_0-9A-Za-z]*
    Int,         ///< Integer literal
    Float,       ///< Float literal
    String,      ///< "..." (value is unescaped)
    BlockString, ///< """...""" (value is dedented)
};

/// Display form used in syntax errors, e.g. `"{"` or `Name`.
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> const char*;

struct Token {
    TokenKind kind = TokenKind::Sof;
    std::string value; ///< Name text or decoded literal value
    size_t start = 0;  ///< Byte offset into the source body
    size_t end = 0;    ///< Exclusive end offset

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    /// Description used in "found ..." messages: `Name "foo"`, `"{"`, `<EOF>`.
    [[nodiscard]] auto describe() const -> std::string;
};

} // namespace embedql::graphql

#endif // EMBEDQL_GRAPHQL_TOKEN_HPP
