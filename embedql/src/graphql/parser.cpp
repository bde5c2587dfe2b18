//! # GraphQL Parser
//!
//! ## Token Navigation
//!
//! | Method       | Description                          |
//! |--------------|--------------------------------------|
//! | `peek()`     | Look at current token                |
//! | `advance()`  | Consume and return current token     |
//! | `check()`    | Check current token without consuming |
//! | `match()`    | Consume token if it matches          |
//! | `expect()`   | Require specific token or error      |
//!
//! Error messages follow the reference implementation's wording:
//! `Syntax Error: Expected Name, found "}".` and
//! `Syntax Error: Unexpected Name "type".`

#include "graphql/parser.hpp"

namespace embedql::graphql {

Parser::Parser(const Source& source) : source_(source) {}

// ============================================================================
// Token Access
// ============================================================================

auto Parser::peek() const -> const Token& {
    if (pos_ >= tokens_.size()) {
        return tokens_.back(); // Eof
    }
    return tokens_[pos_];
}

auto Parser::advance() -> const Token& {
    const Token& tok = peek();
    if (!tok.is(TokenKind::Eof)) {
        ++pos_;
    }
    return tok;
}

auto Parser::check(TokenKind kind) const -> bool {
    return peek().is(kind);
}

auto Parser::check_keyword(std::string_view word) const -> bool {
    return peek().is(TokenKind::Name) && peek().value == word;
}

auto Parser::match(TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::expect(TokenKind kind) -> Result<Token, SyntaxError> {
    if (check(kind)) {
        return advance();
    }
    return error_at(peek(), std::string("Expected ") + token_kind_to_string(kind) + ", found " +
                                peek().describe() + ".");
}

auto Parser::expect_keyword(std::string_view word) -> Result<Token, SyntaxError> {
    if (check_keyword(word)) {
        return advance();
    }
    return error_at(peek(), "Expected \"" + std::string(word) + "\", found " + peek().describe() +
                                ".");
}

auto Parser::expect_name() -> Result<std::string, SyntaxError> {
    auto tok = expect(TokenKind::Name);
    if (is_err(tok))
        return unwrap_err(tok);
    return std::move(unwrap(tok).value);
}

// ============================================================================
// Errors
// ============================================================================

auto Parser::error_at(const Token& tok, const std::string& detail) const -> SyntaxError {
    return SyntaxError{"Syntax Error: " + detail, source_.name(), loc_of(tok)};
}

auto Parser::unexpected() const -> SyntaxError {
    return error_at(peek(), "Unexpected " + peek().describe() + ".");
}

auto Parser::loc_of(const Token& tok) const -> SourceLocation {
    return source_.location(tok.start);
}

// ============================================================================
// Document
// ============================================================================

auto Parser::parse_document() -> Result<Document, SyntaxError> {
    Lexer lexer(source_);
    auto tokens = lexer.tokenize();
    if (is_err(tokens))
        return unwrap_err(tokens);
    tokens_ = std::move(unwrap(tokens));
    pos_ = 0;

    Document doc;
    while (!check(TokenKind::Eof)) {
        auto def = parse_definition();
        if (is_err(def))
            return unwrap_err(def);
        doc.definitions.push_back(std::move(unwrap(def)));
    }
    return doc;
}

auto Parser::parse_definition() -> Result<Definition, SyntaxError> {
    if (check(TokenKind::BraceL) || check_keyword("query") || check_keyword("mutation") ||
        check_keyword("subscription")) {
        auto op = parse_operation();
        if (is_err(op))
            return unwrap_err(op);
        return Definition{std::move(unwrap(op))};
    }
    if (check_keyword("fragment")) {
        auto frag = parse_fragment();
        if (is_err(frag))
            return unwrap_err(frag);
        return Definition{std::move(unwrap(frag))};
    }
    // Type-system definitions and anything else
    return unexpected();
}

auto Parser::parse_operation() -> Result<OperationDefinition, SyntaxError> {
    OperationDefinition op;
    op.loc = loc_of(peek());

    // Shorthand: `{ ... }` is an anonymous query
    if (check(TokenKind::BraceL)) {
        auto selections = parse_selection_set();
        if (is_err(selections))
            return unwrap_err(selections);
        op.selections = std::move(unwrap(selections));
        return op;
    }

    const Token& keyword = advance();
    if (keyword.value == "mutation") {
        op.operation = OperationType::Mutation;
    } else if (keyword.value == "subscription") {
        op.operation = OperationType::Subscription;
    }

    if (check(TokenKind::Name)) {
        op.name = advance().value;
    }

    auto variables = parse_variable_definitions();
    if (is_err(variables))
        return unwrap_err(variables);
    op.variables = std::move(unwrap(variables));

    auto directives = parse_directives(false);
    if (is_err(directives))
        return unwrap_err(directives);
    op.directives = std::move(unwrap(directives));

    auto selections = parse_selection_set();
    if (is_err(selections))
        return unwrap_err(selections);
    op.selections = std::move(unwrap(selections));
    return op;
}

auto Parser::parse_fragment() -> Result<FragmentDefinition, SyntaxError> {
    FragmentDefinition frag;
    frag.loc = loc_of(peek());
    advance(); // fragment

    if (check_keyword("on")) {
        return unexpected();
    }
    auto name = expect_name();
    if (is_err(name))
        return unwrap_err(name);
    frag.name = std::move(unwrap(name));

    auto on = expect_keyword("on");
    if (is_err(on))
        return unwrap_err(on);

    auto type_condition = expect_name();
    if (is_err(type_condition))
        return unwrap_err(type_condition);
    frag.type_condition = std::move(unwrap(type_condition));

    auto directives = parse_directives(false);
    if (is_err(directives))
        return unwrap_err(directives);
    frag.directives = std::move(unwrap(directives));

    auto selections = parse_selection_set();
    if (is_err(selections))
        return unwrap_err(selections);
    frag.selections = std::move(unwrap(selections));
    return frag;
}

auto Parser::parse_variable_definitions() -> Result<std::vector<VariableDefinition>, SyntaxError> {
    std::vector<VariableDefinition> vars;
    if (!match(TokenKind::ParenL)) {
        return vars;
    }

    do {
        VariableDefinition var;
        var.loc = loc_of(peek());

        auto dollar = expect(TokenKind::Dollar);
        if (is_err(dollar))
            return unwrap_err(dollar);
        auto name = expect_name();
        if (is_err(name))
            return unwrap_err(name);
        var.name = std::move(unwrap(name));

        auto colon = expect(TokenKind::Colon);
        if (is_err(colon))
            return unwrap_err(colon);
        auto type = parse_type();
        if (is_err(type))
            return unwrap_err(type);
        var.type = std::move(unwrap(type));

        if (match(TokenKind::Equals)) {
            auto value = parse_value(true);
            if (is_err(value))
                return unwrap_err(value);
            var.default_value = std::move(unwrap(value));
        }

        auto directives = parse_directives(true);
        if (is_err(directives))
            return unwrap_err(directives);
        var.directives = std::move(unwrap(directives));

        vars.push_back(std::move(var));
    } while (!match(TokenKind::ParenR));

    return vars;
}

auto Parser::parse_type() -> Result<TypeRef, SyntaxError> {
    TypeRef type;
    if (match(TokenKind::BracketL)) {
        auto inner = parse_type();
        if (is_err(inner))
            return unwrap_err(inner);
        auto close = expect(TokenKind::BracketR);
        if (is_err(close))
            return unwrap_err(close);
        type.kind = TypeKind::List;
        type.of_type = make_rc<TypeRef>(std::move(unwrap(inner)));
    } else {
        auto name = expect_name();
        if (is_err(name))
            return unwrap_err(name);
        type.name = std::move(unwrap(name));
    }

    if (match(TokenKind::Bang)) {
        TypeRef non_null;
        non_null.kind = TypeKind::NonNull;
        non_null.of_type = make_rc<TypeRef>(std::move(type));
        return non_null;
    }
    return type;
}

// ============================================================================
// Selections
// ============================================================================

auto Parser::parse_selection_set() -> Result<std::vector<Selection>, SyntaxError> {
    auto open = expect(TokenKind::BraceL);
    if (is_err(open))
        return unwrap_err(open);

    std::vector<Selection> selections;
    do {
        auto selection = parse_selection();
        if (is_err(selection))
            return unwrap_err(selection);
        selections.push_back(std::move(unwrap(selection)));
    } while (!match(TokenKind::BraceR));

    return selections;
}

auto Parser::parse_selection() -> Result<Selection, SyntaxError> {
    if (!check(TokenKind::Spread)) {
        auto field = parse_field();
        if (is_err(field))
            return unwrap_err(field);
        return Selection{std::move(unwrap(field))};
    }

    SourceLocation loc = loc_of(advance());

    // Named spread: `...Name`, where the name is not `on`
    if (check(TokenKind::Name) && !check_keyword("on")) {
        FragmentSpread spread;
        spread.loc = loc;
        spread.name = advance().value;
        auto directives = parse_directives(false);
        if (is_err(directives))
            return unwrap_err(directives);
        spread.directives = std::move(unwrap(directives));
        return Selection{std::move(spread)};
    }

    InlineFragment inline_fragment;
    inline_fragment.loc = loc;
    if (check_keyword("on")) {
        advance();
        auto type_condition = expect_name();
        if (is_err(type_condition))
            return unwrap_err(type_condition);
        inline_fragment.type_condition = std::move(unwrap(type_condition));
    }

    auto directives = parse_directives(false);
    if (is_err(directives))
        return unwrap_err(directives);
    inline_fragment.directives = std::move(unwrap(directives));

    auto selections = parse_selection_set();
    if (is_err(selections))
        return unwrap_err(selections);
    inline_fragment.selections = std::move(unwrap(selections));
    return Selection{std::move(inline_fragment)};
}

auto Parser::parse_field() -> Result<Field, SyntaxError> {
    Field field;
    field.loc = loc_of(peek());

    auto first = expect_name();
    if (is_err(first))
        return unwrap_err(first);

    if (match(TokenKind::Colon)) {
        field.alias = std::move(unwrap(first));
        auto name = expect_name();
        if (is_err(name))
            return unwrap_err(name);
        field.name = std::move(unwrap(name));
    } else {
        field.name = std::move(unwrap(first));
    }

    auto arguments = parse_arguments(false);
    if (is_err(arguments))
        return unwrap_err(arguments);
    field.arguments = std::move(unwrap(arguments));

    auto directives = parse_directives(false);
    if (is_err(directives))
        return unwrap_err(directives);
    field.directives = std::move(unwrap(directives));

    if (check(TokenKind::BraceL)) {
        auto selections = parse_selection_set();
        if (is_err(selections))
            return unwrap_err(selections);
        field.selections = std::move(unwrap(selections));
    }
    return field;
}

// ============================================================================
// Arguments, Directives and Values
// ============================================================================

auto Parser::parse_arguments(bool is_const) -> Result<std::vector<Argument>, SyntaxError> {
    std::vector<Argument> args;
    if (!match(TokenKind::ParenL)) {
        return args;
    }

    do {
        Argument arg;
        arg.loc = loc_of(peek());
        auto name = expect_name();
        if (is_err(name))
            return unwrap_err(name);
        arg.name = std::move(unwrap(name));

        auto colon = expect(TokenKind::Colon);
        if (is_err(colon))
            return unwrap_err(colon);

        auto value = parse_value(is_const);
        if (is_err(value))
            return unwrap_err(value);
        arg.value = std::move(unwrap(value));
        args.push_back(std::move(arg));
    } while (!match(TokenKind::ParenR));

    return args;
}

auto Parser::parse_directives(bool is_const) -> Result<std::vector<Directive>, SyntaxError> {
    std::vector<Directive> directives;
    while (check(TokenKind::At)) {
        Directive directive;
        directive.loc = loc_of(advance());
        auto name = expect_name();
        if (is_err(name))
            return unwrap_err(name);
        directive.name = std::move(unwrap(name));

        auto args = parse_arguments(is_const);
        if (is_err(args))
            return unwrap_err(args);
        directive.arguments = std::move(unwrap(args));
        directives.push_back(std::move(directive));
    }
    return directives;
}

auto Parser::parse_value(bool is_const) -> Result<Value, SyntaxError> {
    Value value;
    const Token& tok = peek();

    switch (tok.kind) {
    case TokenKind::BracketL:
        advance();
        value.kind = ValueKind::List;
        while (!match(TokenKind::BracketR)) {
            auto item = parse_value(is_const);
            if (is_err(item))
                return unwrap_err(item);
            value.items.push_back(std::move(unwrap(item)));
        }
        return value;

    case TokenKind::BraceL:
        advance();
        value.kind = ValueKind::Object;
        while (!match(TokenKind::BraceR)) {
            auto name = expect_name();
            if (is_err(name))
                return unwrap_err(name);
            auto colon = expect(TokenKind::Colon);
            if (is_err(colon))
                return unwrap_err(colon);
            auto field = parse_value(is_const);
            if (is_err(field))
                return unwrap_err(field);
            value.fields.emplace_back(std::move(unwrap(name)), std::move(unwrap(field)));
        }
        return value;

    case TokenKind::Int:
        value.kind = ValueKind::Int;
        value.text = advance().value;
        return value;

    case TokenKind::Float:
        value.kind = ValueKind::Float;
        value.text = advance().value;
        return value;

    case TokenKind::String:
    case TokenKind::BlockString:
        value.kind = ValueKind::String;
        value.block = tok.is(TokenKind::BlockString);
        value.text = advance().value;
        return value;

    case TokenKind::Name:
        if (tok.value == "true" || tok.value == "false") {
            value.kind = ValueKind::Boolean;
        } else if (tok.value == "null") {
            value.kind = ValueKind::Null;
        } else {
            value.kind = ValueKind::Enum;
        }
        value.text = advance().value;
        return value;

    case TokenKind::Dollar:
        if (!is_const) {
            advance();
            auto name = expect_name();
            if (is_err(name))
                return unwrap_err(name);
            value.kind = ValueKind::Variable;
            value.text = std::move(unwrap(name));
            return value;
        }
        break;

    default:
        break;
    }
    return unexpected();
}

auto parse(const Source& source) -> Result<Document, SyntaxError> {
    return Parser(source).parse_document();
}

} // namespace embedql::graphql
