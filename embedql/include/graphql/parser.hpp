//! # GraphQL Parser
//!
//! Recursive-descent parser for executable GraphQL documents.
//!
//! ## Grammar
//!
//! ```text
//! Document       = Definition*
//! Definition     = OperationDef | FragmentDef
//! OperationDef   = SelectionSet
//!                | OpType Name? VariableDefs? Directives? SelectionSet
//! FragmentDef    = "fragment" Name "on" Name Directives? SelectionSet
//! SelectionSet   = "{" Selection+ "}"
//! Selection      = Field | "..." Name Directives?
//!                | "..." ("on" Name)? Directives? SelectionSet
//! Field          = (Name ":")? Name Arguments? Directives? SelectionSet?
//! ```
//!
//! An empty or comment-only source parses to a document with no
//! definitions. Deciding whether that is acceptable is the caller's job.
//!
//! The first error ends the parse; there is no recovery.

#ifndef EMBEDQL_GRAPHQL_PARSER_HPP
#define EMBEDQL_GRAPHQL_PARSER_HPP

#include "common.hpp"
#include "graphql/ast.hpp"
#include "graphql/lexer.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace embedql::graphql {

class Parser {
public:
    /// The source must outlive the parser.
    explicit Parser(const Source& source);

    /// Lexes and parses the whole source.
    [[nodiscard]] auto parse_document() -> Result<Document, SyntaxError>;

private:
    const Source& source_;
    std::vector<Token> tokens_;
    size_t pos_ = 0;

    // Token access
    [[nodiscard]] auto peek() const -> const Token&;
    auto advance() -> const Token&;
    [[nodiscard]] auto check(TokenKind kind) const -> bool;
    [[nodiscard]] auto check_keyword(std::string_view word) const -> bool;
    auto match(TokenKind kind) -> bool;
    auto expect(TokenKind kind) -> Result<Token, SyntaxError>;
    auto expect_keyword(std::string_view word) -> Result<Token, SyntaxError>;
    auto expect_name() -> Result<std::string, SyntaxError>;

    // Errors
    [[nodiscard]] auto error_at(const Token& tok, const std::string& detail) const
        -> SyntaxError;
    [[nodiscard]] auto unexpected() const -> SyntaxError;
    [[nodiscard]] auto loc_of(const Token& tok) const -> SourceLocation;

    // Definitions
    auto parse_definition() -> Result<Definition, SyntaxError>;
    auto parse_operation() -> Result<OperationDefinition, SyntaxError>;
    auto parse_fragment() -> Result<FragmentDefinition, SyntaxError>;
    auto parse_variable_definitions() -> Result<std::vector<VariableDefinition>, SyntaxError>;
    auto parse_type() -> Result<TypeRef, SyntaxError>;

    // Selections
    auto parse_selection_set() -> Result<std::vector<Selection>, SyntaxError>;
    auto parse_selection() -> Result<Selection, SyntaxError>;
    auto parse_field() -> Result<Field, SyntaxError>;

    // Arguments, directives and values
    auto parse_arguments(bool is_const) -> Result<std::vector<Argument>, SyntaxError>;
    auto parse_directives(bool is_const) -> Result<std::vector<Directive>, SyntaxError>;
    auto parse_value(bool is_const) -> Result<Value, SyntaxError>;
};

/// Convenience wrapper: `Parser(source).parse_document()`.
[[nodiscard]] auto parse(const Source& source) -> Result<Document, SyntaxError>;

} // namespace embedql::graphql

#endif // EMBEDQL_GRAPHQL_PARSER_HPP
