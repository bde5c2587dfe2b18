#include "extract/raw_string_extractor.hpp"

#include "extract/module_name.hpp"
#include "graphql/source.hpp"
#include "log/log.hpp"

#include <array>

namespace embedql::extract {

namespace {

constexpr std::string_view DELIMITER = "graphql";

// Raw string delimiters are at most 16 characters
constexpr size_t MAX_DELIMITER = 16;

constexpr std::array<std::string_view, 5> RAW_PREFIXES = {"R", "u8R", "uR", "UR", "LR"};

bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

bool is_raw_prefix(std::string_view word) {
    for (auto prefix : RAW_PREFIXES) {
        if (prefix == word) {
            return true;
        }
    }
    return false;
}

/// Skips a quoted string or character literal starting at `p`.
size_t skip_quoted(std::string_view text, size_t p) {
    char quote = text[p++];
    while (p < text.size()) {
        if (text[p] == '\\') {
            p += 2;
            continue;
        }
        if (text[p] == quote || text[p] == '\n') {
            return p + 1;
        }
        ++p;
    }
    return text.size();
}

} // namespace

auto RawStringExtractor::extract(std::string_view text, const std::string& /*base_dir*/,
                                 const source::File& file, const ExtractionOptions& options) const
    -> Result<std::vector<LiteralSpan>, Error> {
    graphql::Source host(std::string(text), file.rel_path);
    std::vector<LiteralSpan> spans;

    size_t pos = 0;
    while (pos < text.size()) {
        char c = text[pos];

        if (c == '/' && pos + 1 < text.size() && text[pos + 1] == '/') {
            size_t nl = text.find('\n', pos);
            pos = nl == std::string_view::npos ? text.size() : nl + 1;
        } else if (c == '/' && pos + 1 < text.size() && text[pos + 1] == '*') {
            size_t end = text.find("*/", pos + 2);
            pos = end == std::string_view::npos ? text.size() : end + 2;
        } else if (c == '"' || c == '\'') {
            pos = skip_quoted(text, pos);
        } else if (c >= '0' && c <= '9') {
            // pp-number, including digit separators: 1'000'000
            ++pos;
            while (pos < text.size() &&
                   (is_ident_char(text[pos]) || text[pos] == '.' || text[pos] == '\'')) {
                ++pos;
            }
        } else if (is_ident_start(c)) {
            size_t end = pos + 1;
            while (end < text.size() && is_ident_char(text[end])) {
                ++end;
            }
            std::string_view word = text.substr(pos, end - pos);
            pos = end;
            if (end >= text.size() || text[end] != '"' || !is_raw_prefix(word)) {
                continue;
            }

            // Raw string: R"delim( ... )delim"
            size_t paren = text.find('(', end + 1);
            if (paren == std::string_view::npos || paren - end - 1 > MAX_DELIMITER) {
                pos = end + 1;
                continue;
            }
            std::string_view delim = text.substr(end + 1, paren - end - 1);
            std::string terminator = ")" + std::string(delim) + "\"";
            size_t close = text.find(terminator, paren + 1);

            if (delim != DELIMITER) {
                pos = close == std::string_view::npos ? text.size() : close + terminator.size();
                continue;
            }
            if (close == std::string_view::npos) {
                return Error::extraction("Unterminated raw string literal `" + std::string(word) +
                                             "\"graphql(`.",
                                         file.rel_path, host.location(pos - word.size()));
            }

            LiteralSpan span;
            span.text = std::string(text.substr(paren + 1, close - paren - 1));
            span.file = file.rel_path;
            span.tag = std::string(DELIMITER);
            span.start = host.location(paren + 1);
            spans.push_back(std::move(span));
            pos = close + terminator.size();
        } else {
            ++pos;
        }
    }

    if (options.validate_names) {
        std::string module_name = module_name_for(file.rel_path);
        for (const auto& span : spans) {
            if (auto error = validate_literal_names(span, module_name)) {
                return *error;
            }
        }
    }

    EMBEDQL_LOG_DEBUG("extract", file.rel_path << ": " << spans.size() << " raw graphql string(s)");
    return spans;
}

} // namespace embedql::extract
