//! # Tagged Template Extractor
//!
//! Single forward pass over the host text. The scanner keeps a stack of
//! open brackets so it can tell when a template sits directly inside the
//! object argument of a container call, and remembers the last significant
//! character to decide whether `/` starts a regular expression.

#include "extract/tagged_template_extractor.hpp"

#include "extract/module_name.hpp"
#include "graphql/source.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <array>

namespace embedql::extract {

namespace {

constexpr std::string_view SUBSTITUTION_ERROR =
    "Substitutions are not allowed in graphql fragments. Included fragments should be "
    "referenced as `...MyModule_propName`.";

constexpr std::array<std::string_view, 3> CONTAINER_FUNCTIONS = {
    "createFragmentContainer",
    "createRefetchContainer",
    "createPaginationContainer",
};

// Keywords after which `/` begins a regular expression
constexpr std::array<std::string_view, 14> REGEX_KEYWORDS = {
    "return", "typeof", "case", "do",     "else", "in",    "of",
    "new",    "delete", "void", "throw", "instanceof", "yield", "await",
};

bool is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' ||
           static_cast<unsigned char>(c) >= 0x80;
}

bool is_ident_char(char c) {
    return is_ident_start(c) || (c >= '0' && c <= '9');
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

template <size_t N> bool contains(const std::array<std::string_view, N>& words, std::string_view w) {
    for (auto word : words) {
        if (word == w) {
            return true;
        }
    }
    return false;
}

struct Frame {
    char close = ')';
    bool container_call = false;   ///< `(` of createXContainer(...)
    bool container_object = false; ///< `{` passed directly to such a call
    std::optional<std::string> key;
};

class TemplateScanner {
public:
    TemplateScanner(std::string_view text, const source::File& file)
        : text_(text), file_(file), host_(std::string(text), file.rel_path) {}

    auto run() -> Result<std::vector<LiteralSpan>, Error>;

private:
    std::string_view text_;
    const source::File& file_;
    graphql::Source host_;
    size_t pos_ = 0;

    std::vector<Frame> frames_;
    std::vector<LiteralSpan> spans_;

    char last_significant_ = '\0';
    std::string last_ident_;
    bool last_was_ident_ = false;
    std::optional<std::string> key_candidate_;

    [[nodiscard]] auto at(size_t i) const -> char {
        return i < text_.size() ? text_[i] : '\0';
    }

    [[nodiscard]] auto regex_allowed() const -> bool;
    void mark_value();

    auto skip_line_comment(size_t p) const -> size_t;
    auto skip_block_comment(size_t p) const -> size_t;
    auto skip_string(size_t p) const -> size_t;
    auto skip_regex(size_t p) const -> size_t;
    auto skip_template(size_t p) const -> size_t;
    auto skip_expression(size_t p) const -> size_t;

    void on_identifier(std::string word, size_t end, std::optional<Error>& error);
    void on_punctuation(char c);
    auto read_tagged_template(size_t backtick, std::string tag) -> std::optional<Error>;
};

auto TemplateScanner::run() -> Result<std::vector<LiteralSpan>, Error> {
    while (pos_ < text_.size()) {
        char c = text_[pos_];

        if (is_space(c)) {
            ++pos_;
            continue;
        }
        if (c == '/' && at(pos_ + 1) == '/') {
            pos_ = skip_line_comment(pos_);
            continue;
        }
        if (c == '/' && at(pos_ + 1) == '*') {
            pos_ = skip_block_comment(pos_);
            continue;
        }
        if (c == '/' && regex_allowed()) {
            pos_ = skip_regex(pos_);
            mark_value();
            continue;
        }
        if (c == '\'' || c == '"') {
            size_t end = skip_string(pos_);
            // Quoted property names can be container keys too
            std::string content(text_.substr(pos_ + 1, end > pos_ + 1 ? end - pos_ - 2 : 0));
            pos_ = end;
            mark_value();
            key_candidate_ = std::move(content);
            continue;
        }
        if (c == '`') {
            pos_ = skip_template(pos_);
            mark_value();
            continue;
        }
        if (is_ident_start(c)) {
            size_t end = pos_ + 1;
            while (end < text_.size() && is_ident_char(text_[end])) {
                ++end;
            }
            std::optional<Error> error;
            on_identifier(std::string(text_.substr(pos_, end - pos_)), end, error);
            if (error) {
                return *error;
            }
            continue;
        }
        if (c >= '0' && c <= '9') {
            while (pos_ < text_.size() && (is_ident_char(text_[pos_]) || text_[pos_] == '.')) {
                ++pos_;
            }
            mark_value();
            continue;
        }

        on_punctuation(c);
        ++pos_;
    }
    return std::move(spans_);
}

auto TemplateScanner::regex_allowed() const -> bool {
    if (last_was_ident_) {
        return contains(REGEX_KEYWORDS, last_ident_);
    }
    switch (last_significant_) {
    case '\0':
    case '(':
    case ',':
    case '=':
    case ':':
    case '[':
    case '!':
    case '&':
    case '|':
    case '?':
    case '{':
    case '}':
    case ';':
    case '+':
    case '-':
    case '*':
    case '%':
    case '<':
    case '>':
    case '~':
    case '^':
        return true;
    default:
        return false;
    }
}

void TemplateScanner::mark_value() {
    last_significant_ = 'a';
    last_was_ident_ = false;
    key_candidate_.reset();
}

auto TemplateScanner::skip_line_comment(size_t p) const -> size_t {
    while (p < text_.size() && text_[p] != '\n') {
        ++p;
    }
    return p;
}

auto TemplateScanner::skip_block_comment(size_t p) const -> size_t {
    p += 2;
    while (p < text_.size() && !(text_[p] == '*' && at(p + 1) == '/')) {
        ++p;
    }
    return std::min(p + 2, text_.size());
}

auto TemplateScanner::skip_string(size_t p) const -> size_t {
    char quote = text_[p++];
    while (p < text_.size()) {
        char c = text_[p];
        if (c == '\\') {
            p += 2;
            continue;
        }
        if (c == quote) {
            return p + 1;
        }
        if (c == '\n') {
            return p;
        }
        ++p;
    }
    return text_.size();
}

auto TemplateScanner::skip_regex(size_t p) const -> size_t {
    bool in_class = false;
    ++p;
    while (p < text_.size()) {
        char c = text_[p];
        if (c == '\\') {
            p += 2;
            continue;
        }
        if (c == '\n') {
            return p;
        }
        if (c == '[') {
            in_class = true;
        } else if (c == ']') {
            in_class = false;
        } else if (c == '/' && !in_class) {
            ++p;
            while (p < text_.size() && is_ident_char(text_[p])) {
                ++p; // flags
            }
            return p;
        }
        ++p;
    }
    return text_.size();
}

auto TemplateScanner::skip_template(size_t p) const -> size_t {
    ++p;
    while (p < text_.size()) {
        char c = text_[p];
        if (c == '\\') {
            p += 2;
            continue;
        }
        if (c == '`') {
            return p + 1;
        }
        if (c == '$' && at(p + 1) == '{') {
            p = skip_expression(p + 2);
            continue;
        }
        ++p;
    }
    return text_.size();
}

/// Skips a `${...}` body up to and including its closing brace.
auto TemplateScanner::skip_expression(size_t p) const -> size_t {
    int depth = 0;
    while (p < text_.size()) {
        char c = text_[p];
        if (c == '\'' || c == '"') {
            p = skip_string(p);
        } else if (c == '`') {
            p = skip_template(p);
        } else if (c == '/' && at(p + 1) == '/') {
            p = skip_line_comment(p);
        } else if (c == '/' && at(p + 1) == '*') {
            p = skip_block_comment(p);
        } else if (c == '{') {
            ++depth;
            ++p;
        } else if (c == '}') {
            if (depth == 0) {
                return p + 1;
            }
            --depth;
            ++p;
        } else {
            ++p;
        }
    }
    return text_.size();
}

void TemplateScanner::on_identifier(std::string word, size_t end, std::optional<Error>& error) {
    bool is_member = last_significant_ == '.';

    if (word == "graphql" && !is_member) {
        std::string tag = "graphql";
        size_t p = end;
        constexpr std::string_view EXPERIMENTAL = ".experimental";
        if (text_.substr(p, EXPERIMENTAL.size()) == EXPERIMENTAL &&
            !is_ident_char(at(p + EXPERIMENTAL.size()))) {
            tag = "graphql.experimental";
            p += EXPERIMENTAL.size();
        }
        size_t q = p;
        while (q < text_.size() && is_space(text_[q])) {
            ++q;
        }
        if (at(q) == '`') {
            error = read_tagged_template(q, std::move(tag));
            return;
        }
    }

    pos_ = end;
    last_significant_ = 'a';
    last_was_ident_ = true;
    key_candidate_ = word;
    last_ident_ = std::move(word);
}

void TemplateScanner::on_punctuation(char c) {
    switch (c) {
    case '(':
        frames_.push_back(
            Frame{')', last_was_ident_ && contains(CONTAINER_FUNCTIONS, last_ident_), false, {}});
        break;
    case '{':
        frames_.push_back(Frame{'}', false,
                                !frames_.empty() && frames_.back().container_call &&
                                    (last_significant_ == '(' || last_significant_ == ','),
                                {}});
        break;
    case '[':
        frames_.push_back(Frame{']', false, false, {}});
        break;
    case ')':
    case '}':
    case ']':
        if (!frames_.empty()) {
            frames_.pop_back();
        }
        break;
    case ',':
        if (!frames_.empty() && frames_.back().container_object) {
            frames_.back().key.reset();
        }
        break;
    case ':':
        if (!frames_.empty() && frames_.back().container_object && key_candidate_) {
            frames_.back().key = key_candidate_;
        }
        break;
    default:
        break;
    }

    last_significant_ = c;
    last_was_ident_ = false;
    key_candidate_.reset();
}

auto TemplateScanner::read_tagged_template(size_t backtick, std::string tag)
    -> std::optional<Error> {
    size_t body_start = backtick + 1;
    size_t p = body_start;
    while (p < text_.size()) {
        char c = text_[p];
        if (c == '\\') {
            p += 2;
            continue;
        }
        if (c == '`') {
            break;
        }
        if (c == '$' && at(p + 1) == '{') {
            return Error::extraction(std::string(SUBSTITUTION_ERROR), file_.rel_path,
                                     host_.location(p));
        }
        ++p;
    }
    if (p >= text_.size()) {
        return Error::extraction("Unterminated graphql template literal.", file_.rel_path,
                                 host_.location(backtick));
    }

    LiteralSpan span;
    span.text = std::string(text_.substr(body_start, p - body_start));
    span.file = file_.rel_path;
    span.tag = std::move(tag);
    span.start = host_.location(body_start);
    if (!frames_.empty() && frames_.back().container_object && last_significant_ == ':') {
        span.key_name = frames_.back().key;
    }
    spans_.push_back(std::move(span));

    pos_ = p + 1;
    mark_value();
    return std::nullopt;
}

} // namespace

auto TaggedTemplateExtractor::extract(std::string_view text, const std::string& /*base_dir*/,
                                      const source::File& file,
                                      const ExtractionOptions& options) const
    -> Result<std::vector<LiteralSpan>, Error> {
    auto result = TemplateScanner(text, file).run();
    if (is_err(result)) {
        return result;
    }
    auto& spans = unwrap(result);

    if (options.validate_names) {
        std::string module_name = module_name_for(file.rel_path);
        for (const auto& span : spans) {
            if (auto error = validate_literal_names(span, module_name)) {
                return *error;
            }
        }
    }

    EMBEDQL_LOG_DEBUG("extract", file.rel_path << ": " << spans.size() << " graphql template(s)");
    return result;
}

} // namespace embedql::extract
