//! # GraphQL AST
//!
//! Executable documents: operations and fragments with their selection
//! sets, arguments, variables and directives. Type-system definitions are
//! outside what embedded literals may contain and are rejected by the
//! parser.
//!
//! ```text
//! Document
//! └─ Definition (OperationDefinition | FragmentDefinition)
//!    └─ Selection (Field | FragmentSpread | InlineFragment)
//!       └─ Selection ...
//! ```
//!
//! Nodes are plain values. Every node records the host-file location of
//! its first token.

#ifndef EMBEDQL_GRAPHQL_AST_HPP
#define EMBEDQL_GRAPHQL_AST_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace embedql::graphql {

// ============================================================================
// Values and Types
// ============================================================================

enum class ValueKind { Variable, Int, Float, String, Boolean, Null, Enum, List, Object };

/// An input value. `text` holds the variable name, the literal text or the
/// enum name depending on `kind`.
struct Value {
    ValueKind kind = ValueKind::Null;
    std::string text;
    bool block = false;                               ///< String came from """..."""
    std::vector<Value> items;                         ///< List elements
    std::vector<std::pair<std::string, Value>> fields; ///< Object fields, in source order
};

enum class TypeKind { Named, List, NonNull };

/// A type reference such as `ID`, `[String]` or `Int!`.
struct TypeRef {
    TypeKind kind = TypeKind::Named;
    std::string name;    ///< Set for Named
    Rc<TypeRef> of_type; ///< Set for List and NonNull

    /// Renders the reference as written, e.g. "[ID!]!".
    [[nodiscard]] auto to_string() const -> std::string;
};

struct Argument {
    std::string name;
    Value value;
    SourceLocation loc;
};

struct Directive {
    std::string name;
    std::vector<Argument> arguments;
    SourceLocation loc;
};

struct VariableDefinition {
    std::string name; ///< Without the leading `$`
    TypeRef type;
    std::optional<Value> default_value;
    std::vector<Directive> directives;
    SourceLocation loc;
};

// ============================================================================
// Selections
// ============================================================================

struct Selection;

struct Field {
    std::optional<std::string> alias;
    std::string name;
    std::vector<Argument> arguments;
    std::vector<Directive> directives;
    std::vector<Selection> selections; ///< Empty for leaf fields
    SourceLocation loc;

    /// Alias when present, otherwise the field name.
    [[nodiscard]] auto response_key() const -> const std::string& {
        return alias ? *alias : name;
    }
};

struct FragmentSpread {
    std::string name;
    std::vector<Directive> directives;
    SourceLocation loc;
};

struct InlineFragment {
    std::optional<std::string> type_condition;
    std::vector<Directive> directives;
    std::vector<Selection> selections;
    SourceLocation loc;
};

struct Selection {
    std::variant<Field, FragmentSpread, InlineFragment> node;
};

// ============================================================================
// Definitions
// ============================================================================

enum class OperationType { Query, Mutation, Subscription };

[[nodiscard]] auto operation_type_name(OperationType op) -> const char*;

struct OperationDefinition {
    OperationType operation = OperationType::Query;
    std::optional<std::string> name; ///< Absent for `{ ... }` shorthand
    std::vector<VariableDefinition> variables;
    std::vector<Directive> directives;
    std::vector<Selection> selections;
    SourceLocation loc;
};

struct FragmentDefinition {
    std::string name;
    std::string type_condition;
    std::vector<Directive> directives;
    std::vector<Selection> selections;
    SourceLocation loc;
};

/// One named unit of a document.
struct Definition {
    std::variant<OperationDefinition, FragmentDefinition> node;

    [[nodiscard]] auto is_operation() const -> bool {
        return std::holds_alternative<OperationDefinition>(node);
    }

    [[nodiscard]] auto is_fragment() const -> bool {
        return std::holds_alternative<FragmentDefinition>(node);
    }

    /// "OperationDefinition" or "FragmentDefinition".
    [[nodiscard]] auto kind_name() const -> const char*;

    /// Definition name, absent for anonymous operations.
    [[nodiscard]] auto name() const -> std::optional<std::string>;

    [[nodiscard]] auto loc() const -> const SourceLocation&;
};

/// An ordered list of definitions.
struct Document {
    std::vector<Definition> definitions;

    /// Names of all definitions in order; anonymous operations appear as
    /// "<anonymous>".
    [[nodiscard]] auto definition_names() const -> std::vector<std::string>;
};

} // namespace embedql::graphql

#endif // EMBEDQL_GRAPHQL_AST_HPP
