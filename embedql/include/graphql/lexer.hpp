//! # GraphQL Lexer
//!
//! Converts a GraphQL `Source` into tokens on demand. The parser pulls one
//! token at a time with `next_token()`; `tokenize()` collects the whole
//! stream for tests and tooling.
//!
//! ## Errors
//!
//! GraphQL has no error recovery: the first malformed token (unterminated
//! string, bad number, unexpected character) ends lexing with a
//! `SyntaxError` located in the host file.
//!
//! ## Example
//!
//! ```cpp
//! Source source("query Q { id }");
//! Lexer lexer(source);
//! auto tokens = lexer.tokenize(); // Name Name { Name } <EOF>
//! ```

#ifndef EMBEDQL_GRAPHQL_LEXER_HPP
#define EMBEDQL_GRAPHQL_LEXER_HPP

#include "common.hpp"
#include "graphql/source.hpp"
#include "graphql/token.hpp"

#include <optional>
#include <string>
#include <vector>

namespace embedql::graphql {

/// A lexing or parsing failure inside one GraphQL source.
struct SyntaxError {
    std::string message;     ///< "Syntax Error: Expected Name, found <EOF>."
    std::string source_name; ///< Source::name() of the failing text
    SourceLocation location; ///< Host-file location
};

class Lexer {
public:
    /// The source must outlive the lexer.
    explicit Lexer(const Source& source);

    /// Returns the next significant token, `Eof` at the end.
    [[nodiscard]] auto next_token() -> Result<Token, SyntaxError>;

    /// Lexes the whole source. The vector ends with the `Eof` token.
    [[nodiscard]] auto tokenize() -> Result<std::vector<Token>, SyntaxError>;

private:
    const Source& source_;
    size_t pos_ = 0;

    [[nodiscard]] auto peek(size_t ahead = 0) const -> char {
        return source_.at(pos_ + ahead);
    }

    void skip_ignored();
    [[nodiscard]] auto error_at(size_t offset, const std::string& detail) const -> SyntaxError;

    auto lex_name(size_t start) -> Token;
    auto lex_number(size_t start) -> Result<Token, SyntaxError>;
    auto lex_string(size_t start) -> Result<Token, SyntaxError>;
    auto lex_block_string(size_t start) -> Result<Token, SyntaxError>;
    /// Decodes a unicode escape at `cursor`, fixed or braced width, joining
    /// surrogate pairs. Advances past it.
    auto lex_unicode_escape(size_t& cursor, std::string& value) const
        -> std::optional<SyntaxError>;
    auto lex_digits(size_t& cursor) const -> std::optional<SyntaxError>;
};

/// Removes common indentation and blank leading/trailing lines from a block
/// string's raw contents.
[[nodiscard]] auto dedent_block_string(std::string_view raw) -> std::string;

} // namespace embedql::graphql

#endif // EMBEDQL_GRAPHQL_LEXER_HPP
