#include "graphql/token.hpp"

namespace embedql::graphql {

auto token_kind_to_string(TokenKind kind) -> const char* {
    switch (kind) {
    case TokenKind::Sof:
        return "<SOF>";
    case TokenKind::Eof:
        return "<EOF>";
    case TokenKind::Bang:
        return "\"!\"";
    case TokenKind::Dollar:
        return "\"$\"";
    case TokenKind::Amp:
        return "\"&\"";
    case TokenKind::ParenL:
        return "\"(\"";
    case TokenKind::ParenR:
        return "\")\"";
    case TokenKind::Spread:
        return "\"...\"";
    case TokenKind::Colon:
        return "\":\"";
    case TokenKind::Equals:
        return "\"=\"";
    case TokenKind::At:
        return "\"@\"";
    case TokenKind::BracketL:
        return "\"[\"";
    case TokenKind::BracketR:
        return "\"]\"";
    case TokenKind::BraceL:
        return "\"{\"";
    case TokenKind::Pipe:
        return "\"|\"";
    case TokenKind::BraceR:
        return "\"}\"";
    case TokenKind::Name:
        return "Name";
    case TokenKind::Int:
        return "Int";
    case TokenKind::Float:
        return "Float";
    case TokenKind::String:
        return "String";
    case TokenKind::BlockString:
        return "BlockString";
    }
    return "<unknown>";
}

auto Token::describe() const -> std::string {
    std::string out = token_kind_to_string(kind);
    if (kind == TokenKind::Name || kind == TokenKind::Int || kind == TokenKind::Float ||
        kind == TokenKind::String || kind == TokenKind::BlockString) {
        out += " \"" + value + "\"";
    }
    return out;
}

} // namespace embedql::graphql
