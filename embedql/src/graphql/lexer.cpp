//! # GraphQL Lexer
//!
//! Punctuators, names, numbers, strings and block strings, following the
//! lexical grammar of the GraphQL specification (October 2021 edition).

#include "graphql/lexer.hpp"

#include <algorithm>
#include <cstdint>

namespace embedql::graphql {

namespace {

bool is_name_start(char c) {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || c == '_';
}

bool is_name_continue(char c) {
    return is_name_start(c) || (c >= '0' && c <= '9');
}

bool is_digit(char c) {
    return c >= '0' && c <= '9';
}

int hex_value(char c) {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

/// Display form of a character in error messages.
std::string printable(char c) {
    if (c == '\0')
        return "<EOF>";
    if (static_cast<unsigned char>(c) < 0x20) {
        static constexpr char HEX[] = "0123456789ABCDEF";
        std::string out = "\\u00";
        out += HEX[(c >> 4) & 0xF];
        out += HEX[c & 0xF];
        return out;
    }
    return std::string("\"") + c + "\"";
}

/// Value of `count` hex digits starting at `offset`, or -1.
int32_t read_hex(const Source& source, size_t offset, size_t count) {
    int32_t value = 0;
    for (size_t i = 0; i < count; ++i) {
        int h = hex_value(source.at(offset + i));
        if (h < 0)
            return -1;
        value = (value << 4) | h;
    }
    return value;
}

bool is_leading_surrogate(uint32_t cp) {
    return cp >= 0xD800 && cp <= 0xDBFF;
}

bool is_trailing_surrogate(uint32_t cp) {
    return cp >= 0xDC00 && cp <= 0xDFFF;
}

bool is_scalar_value(uint32_t cp) {
    return cp <= 0x10FFFF && !(cp >= 0xD800 && cp <= 0xDFFF);
}

void append_utf8(std::string& out, uint32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

Token make(TokenKind kind, size_t start, size_t end, std::string value = {}) {
    Token tok;
    tok.kind = kind;
    tok.start = start;
    tok.end = end;
    tok.value = std::move(value);
    return tok;
}

} // namespace

Lexer::Lexer(const Source& source) : source_(source) {}

auto Lexer::error_at(size_t offset, const std::string& detail) const -> SyntaxError {
    return SyntaxError{"Syntax Error: " + detail, source_.name(), source_.location(offset)};
}

void Lexer::skip_ignored() {
    while (pos_ < source_.length()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == ',' || c == '\n' || c == '\r') {
            ++pos_;
        } else if (c == '\xEF' && peek(1) == '\xBB' && peek(2) == '\xBF') {
            pos_ += 3;
        } else if (c == '#') {
            while (pos_ < source_.length() && peek() != '\n' && peek() != '\r') {
                ++pos_;
            }
        } else {
            break;
        }
    }
}

auto Lexer::next_token() -> Result<Token, SyntaxError> {
    skip_ignored();

    size_t start = pos_;
    if (start >= source_.length()) {
        return make(TokenKind::Eof, start, start);
    }

    char c = peek();
    auto punct = [&](TokenKind kind) {
        ++pos_;
        return make(kind, start, pos_);
    };

    switch (c) {
    case '!':
        return punct(TokenKind::Bang);
    case '$':
        return punct(TokenKind::Dollar);
    case '&':
        return punct(TokenKind::Amp);
    case '(':
        return punct(TokenKind::ParenL);
    case ')':
        return punct(TokenKind::ParenR);
    case ':':
        return punct(TokenKind::Colon);
    case '=':
        return punct(TokenKind::Equals);
    case '@':
        return punct(TokenKind::At);
    case '[':
        return punct(TokenKind::BracketL);
    case ']':
        return punct(TokenKind::BracketR);
    case '{':
        return punct(TokenKind::BraceL);
    case '|':
        return punct(TokenKind::Pipe);
    case '}':
        return punct(TokenKind::BraceR);
    case '.':
        if (peek(1) == '.' && peek(2) == '.') {
            pos_ += 3;
            return make(TokenKind::Spread, start, pos_);
        }
        break;
    case '"':
        if (peek(1) == '"' && peek(2) == '"') {
            return lex_block_string(start);
        }
        return lex_string(start);
    default:
        break;
    }

    if (is_name_start(c)) {
        return lex_name(start);
    }
    if (c == '-' || is_digit(c)) {
        return lex_number(start);
    }
    if (c == '\'') {
        return error_at(start, "Unexpected single quote character ('), did you mean to use a "
                               "double quote (\")?");
    }
    return error_at(start, "Unexpected character: " + printable(c) + ".");
}

auto Lexer::tokenize() -> Result<std::vector<Token>, SyntaxError> {
    std::vector<Token> tokens;
    while (true) {
        auto tok = next_token();
        if (is_err(tok)) {
            return unwrap_err(tok);
        }
        tokens.push_back(std::move(unwrap(tok)));
        if (tokens.back().is(TokenKind::Eof)) {
            return tokens;
        }
    }
}

auto Lexer::lex_name(size_t start) -> Token {
    size_t end = start + 1;
    while (is_name_continue(source_.at(end))) {
        ++end;
    }
    pos_ = end;
    return make(TokenKind::Name, start, end, std::string(source_.body().substr(start, end - start)));
}

auto Lexer::lex_digits(size_t& cursor) const -> std::optional<SyntaxError> {
    if (!is_digit(source_.at(cursor))) {
        return error_at(cursor,
                        "Invalid number, expected digit but got: " + printable(source_.at(cursor)) +
                            ".");
    }
    while (is_digit(source_.at(cursor))) {
        ++cursor;
    }
    return std::nullopt;
}

auto Lexer::lex_number(size_t start) -> Result<Token, SyntaxError> {
    size_t cursor = start;
    bool is_float = false;

    if (source_.at(cursor) == '-') {
        ++cursor;
    }

    if (source_.at(cursor) == '0') {
        ++cursor;
        if (is_digit(source_.at(cursor))) {
            return error_at(cursor, "Invalid number, unexpected digit after 0: " +
                                        printable(source_.at(cursor)) + ".");
        }
    } else if (auto err = lex_digits(cursor)) {
        return *err;
    }

    if (source_.at(cursor) == '.') {
        is_float = true;
        ++cursor;
        if (auto err = lex_digits(cursor)) {
            return *err;
        }
    }

    if (source_.at(cursor) == 'e' || source_.at(cursor) == 'E') {
        is_float = true;
        ++cursor;
        if (source_.at(cursor) == '+' || source_.at(cursor) == '-') {
            ++cursor;
        }
        if (auto err = lex_digits(cursor)) {
            return *err;
        }
    }

    // 1.2.3 and 12abc are single malformed numbers, not two tokens
    char next = source_.at(cursor);
    if (next == '.' || is_name_start(next)) {
        return error_at(cursor, "Invalid number, expected digit but got: " + printable(next) + ".");
    }

    pos_ = cursor;
    return make(is_float ? TokenKind::Float : TokenKind::Int, start, cursor,
                std::string(source_.body().substr(start, cursor - start)));
}

auto Lexer::lex_string(size_t start) -> Result<Token, SyntaxError> {
    size_t cursor = start + 1;
    std::string value;

    while (cursor < source_.length()) {
        char c = source_.at(cursor);
        if (c == '"') {
            pos_ = cursor + 1;
            return make(TokenKind::String, start, pos_, std::move(value));
        }
        if (c == '\n' || c == '\r') {
            break;
        }
        if (static_cast<unsigned char>(c) < 0x20 && c != '\t') {
            return error_at(cursor, "Invalid character within String: " + printable(c) + ".");
        }
        if (c != '\\') {
            value += c;
            ++cursor;
            continue;
        }

        char esc = source_.at(cursor + 1);
        switch (esc) {
        case '"':
            value += '"';
            break;
        case '\\':
            value += '\\';
            break;
        case '/':
            value += '/';
            break;
        case 'b':
            value += '\b';
            break;
        case 'f':
            value += '\f';
            break;
        case 'n':
            value += '\n';
            break;
        case 'r':
            value += '\r';
            break;
        case 't':
            value += '\t';
            break;
        case 'u':
            if (auto err = lex_unicode_escape(cursor, value)) {
                return *err;
            }
            continue;
        default:
            return error_at(cursor, "Invalid character escape sequence: \"\\" +
                                        std::string(1, esc) + "\".");
        }
        cursor += 2;
    }

    return error_at(cursor, "Unterminated string.");
}

auto Lexer::lex_unicode_escape(size_t& cursor, std::string& value) const
    -> std::optional<SyntaxError> {
    auto invalid = [&](size_t length) {
        return error_at(cursor, "Invalid Unicode escape sequence: \"" +
                                    std::string(source_.body().substr(
                                        cursor, std::min(length, source_.length() - cursor))) +
                                    "\".");
    };

    // Braced form, any scalar value
    if (source_.at(cursor + 2) == '{') {
        size_t end = cursor + 3;
        uint32_t cp = 0;
        while (source_.at(end) != '}') {
            int h = hex_value(source_.at(end));
            if (h < 0) {
                return invalid(end - cursor + 1);
            }
            cp = (cp << 4) | static_cast<uint32_t>(h);
            if (!is_scalar_value(cp)) {
                return invalid(end - cursor + 1);
            }
            ++end;
        }
        if (end == cursor + 3) {
            return invalid(4);
        }
        append_utf8(value, cp);
        cursor = end + 1;
        return std::nullopt;
    }

    int32_t cp = read_hex(source_, cursor + 2, 4);
    if (cp < 0) {
        return invalid(6);
    }
    // Four-digit form; a surrogate pair decodes to one code point
    if (is_leading_surrogate(static_cast<uint32_t>(cp)) && source_.at(cursor + 6) == '\\' &&
        source_.at(cursor + 7) == 'u') {
        int32_t trail = read_hex(source_, cursor + 8, 4);
        if (trail >= 0 && is_trailing_surrogate(static_cast<uint32_t>(trail))) {
            append_utf8(value, 0x10000 + ((static_cast<uint32_t>(cp) - 0xD800) << 10) +
                                   (static_cast<uint32_t>(trail) - 0xDC00));
            cursor += 12;
            return std::nullopt;
        }
    }
    if (!is_scalar_value(static_cast<uint32_t>(cp))) {
        return invalid(6);
    }
    append_utf8(value, static_cast<uint32_t>(cp));
    cursor += 6;
    return std::nullopt;
}

auto Lexer::lex_block_string(size_t start) -> Result<Token, SyntaxError> {
    size_t cursor = start + 3;
    std::string raw;

    while (cursor < source_.length()) {
        char c = source_.at(cursor);
        if (c == '"' && source_.at(cursor + 1) == '"' && source_.at(cursor + 2) == '"') {
            pos_ = cursor + 3;
            return make(TokenKind::BlockString, start, pos_, dedent_block_string(raw));
        }
        if (c == '\\' && source_.body().substr(cursor + 1, 3) == "\"\"\"") {
            raw += "\"\"\"";
            cursor += 4;
            continue;
        }
        raw += c;
        ++cursor;
    }

    return error_at(cursor, "Unterminated string.");
}

auto dedent_block_string(std::string_view raw) -> std::string {
    std::vector<std::string_view> lines;
    size_t line_start = 0;
    for (size_t i = 0; i <= raw.size(); ++i) {
        if (i == raw.size() || raw[i] == '\n' || raw[i] == '\r') {
            lines.push_back(raw.substr(line_start, i - line_start));
            if (i < raw.size() && raw[i] == '\r' && i + 1 < raw.size() && raw[i + 1] == '\n') {
                ++i;
            }
            line_start = i + 1;
        }
    }

    auto indent_of = [](std::string_view line) {
        size_t n = 0;
        while (n < line.size() && (line[n] == ' ' || line[n] == '\t')) {
            ++n;
        }
        return n;
    };

    size_t common = std::string_view::npos;
    for (size_t i = 1; i < lines.size(); ++i) {
        size_t indent = indent_of(lines[i]);
        if (indent < lines[i].size()) {
            common = std::min(common, indent);
        }
    }
    if (common != std::string_view::npos) {
        for (size_t i = 1; i < lines.size(); ++i) {
            lines[i].remove_prefix(std::min(common, lines[i].size()));
        }
    }

    auto is_blank = [&](std::string_view line) { return indent_of(line) == line.size(); };
    size_t first = 0;
    while (first < lines.size() && is_blank(lines[first])) {
        ++first;
    }
    size_t last = lines.size();
    while (last > first && is_blank(lines[last - 1])) {
        --last;
    }

    std::string out;
    for (size_t i = first; i < last; ++i) {
        if (i > first) {
            out += '\n';
        }
        out += lines[i];
    }
    return out;
}

} // namespace embedql::graphql
