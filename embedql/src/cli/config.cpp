//! # Tool Configuration
//!
//! Command-line parsing, the `embedql.toml` reader, and layering of the
//! two over the defaults.

#include "cli/config.hpp"

#include "log/log.hpp"

#include <cctype>
#include <charconv>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string_view>

namespace fs = std::filesystem;

namespace embedql::cli {

// ============================================================================
// Config
// ============================================================================

auto Config::effective_extensions() const -> std::vector<std::string> {
    if (!extensions.empty()) {
        return extensions;
    }
    if (extractor == "cpp" || extractor == "c++") {
        return {".cpp", ".cc", ".hpp", ".h"};
    }
    return {".js", ".jsx", ".ts", ".tsx"};
}

auto split_list(const std::string& value) -> std::vector<std::string> {
    std::vector<std::string> parts;
    std::stringstream ss(value);
    std::string part;
    while (std::getline(ss, part, ',')) {
        if (!part.empty()) {
            parts.push_back(part);
        }
    }
    return parts;
}

// ============================================================================
// Command Line
// ============================================================================

namespace {

std::optional<size_t> parse_count(std::string_view text) {
    size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

auto parse_command_line(int argc, char* argv[]) -> Result<CommandLine, std::string> {
    CommandLine cmd;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (log::is_log_option(arg)) {
            continue;
        }

        if (arg == "--help" || arg == "-h") {
            cmd.help = true;
        } else if (arg == "--version" || arg == "-V") {
            cmd.version = true;
        } else if (arg == "--print") {
            cmd.print_sources = true;
        } else if (arg == "--validate-names") {
            cmd.validate_names = true;
        } else if (arg == "--no-validate-names") {
            cmd.validate_names = false;
        } else if (arg.starts_with("--extractor=")) {
            cmd.extractor = std::string(arg.substr(12));
        } else if (arg.starts_with("--ext=")) {
            cmd.extensions = split_list(std::string(arg.substr(6)));
        } else if (arg.starts_with("--exclude=")) {
            cmd.exclude = split_list(std::string(arg.substr(10)));
        } else if (arg.starts_with("--config=")) {
            cmd.config_path = std::string(arg.substr(9));
        } else if (arg == "-j" || arg.starts_with("--jobs=")) {
            std::string_view value;
            if (arg == "-j") {
                if (i + 1 >= argc) {
                    return std::string("-j requires a thread count");
                }
                value = argv[++i];
            } else {
                value = arg.substr(7);
            }
            auto jobs = parse_count(value);
            if (!jobs) {
                return "invalid thread count: " + std::string(value);
            }
            cmd.jobs = *jobs;
        } else if (arg.starts_with("-")) {
            return "unknown option: " + std::string(arg);
        } else if (cmd.base_dir.empty()) {
            cmd.base_dir = std::string(arg);
        } else {
            return "unexpected argument: " + std::string(arg);
        }
    }

    if (!cmd.help && !cmd.version && cmd.base_dir.empty()) {
        return std::string("missing <base-dir>");
    }
    return cmd;
}

// ============================================================================
// ConfigParser
// ============================================================================

ConfigParser::ConfigParser(const std::string& content) : content_(content) {}

char ConfigParser::advance() {
    char c = peek();
    if (!is_eof()) {
        ++pos_;
    }
    return c;
}

void ConfigParser::skip_whitespace() {
    while (peek() == ' ' || peek() == '\t' || peek() == '\r') {
        ++pos_;
    }
}

void ConfigParser::skip_comment() {
    while (!is_eof() && peek() != '\n') {
        ++pos_;
    }
}

void ConfigParser::set_error(const std::string& message) {
    error_message_ = "line " + std::to_string(line_) + ": " + message;
}

bool ConfigParser::parse(Config& config) {
    while (true) {
        skip_whitespace();
        if (is_eof()) {
            return true;
        }
        if (peek() == '\n') {
            advance();
            ++line_;
            continue;
        }
        if (peek() == '#') {
            skip_comment();
            continue;
        }
        if (peek() == '[') {
            set_error("tables are not supported");
            return false;
        }

        auto key = parse_identifier();
        if (!key) {
            set_error("expected a key");
            return false;
        }
        skip_whitespace();
        if (advance() != '=') {
            set_error("expected '=' after `" + *key + "`");
            return false;
        }
        skip_whitespace();

        if (!apply(*key, config) || !expect_line_end()) {
            return false;
        }
    }
}

bool ConfigParser::apply(const std::string& key, Config& config) {
    if (key == "extractor") {
        auto value = parse_string();
        if (!value) {
            return false;
        }
        config.extractor = *value;
    } else if (key == "validate_names") {
        auto value = parse_boolean();
        if (!value) {
            return false;
        }
        config.validate_names = *value;
    } else if (key == "extensions" || key == "exclude") {
        auto value = parse_string_array();
        if (!value) {
            return false;
        }
        (key == "extensions" ? config.extensions : config.exclude) = std::move(*value);
    } else if (key == "jobs") {
        auto value = parse_number();
        if (!value) {
            return false;
        }
        if (*value < 0) {
            set_error("`jobs` must not be negative");
            return false;
        }
        config.jobs = static_cast<size_t>(*value);
    } else {
        set_error("unknown key `" + key + "`");
        return false;
    }
    return true;
}

bool ConfigParser::expect_line_end() {
    skip_whitespace();
    if (peek() == '#') {
        skip_comment();
    }
    if (is_eof()) {
        return true;
    }
    if (peek() != '\n') {
        set_error(std::string("unexpected character '") + peek() + "' after value");
        return false;
    }
    advance();
    ++line_;
    return true;
}

std::optional<std::string> ConfigParser::parse_identifier() {
    size_t start = pos_;
    while (!is_eof() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                         peek() == '-')) {
        ++pos_;
    }
    if (pos_ == start) {
        return std::nullopt;
    }
    return content_.substr(start, pos_ - start);
}

std::optional<std::string> ConfigParser::parse_string() {
    if (advance() != '"') {
        set_error("expected a string");
        return std::nullopt;
    }
    std::string value;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        char c = advance();
        if (c == '\\') {
            char esc = advance();
            switch (esc) {
            case 'n':
                value += '\n';
                break;
            case 't':
                value += '\t';
                break;
            default:
                value += esc;
                break;
            }
        } else {
            value += c;
        }
    }
    if (advance() != '"') {
        set_error("unterminated string");
        return std::nullopt;
    }
    return value;
}

std::optional<int> ConfigParser::parse_number() {
    size_t start = pos_;
    if (peek() == '-') {
        ++pos_;
    }
    while (!is_eof() && std::isdigit(static_cast<unsigned char>(peek()))) {
        ++pos_;
    }
    int value = 0;
    auto [ptr, ec] = std::from_chars(content_.data() + start, content_.data() + pos_, value);
    if (ec != std::errc() || ptr != content_.data() + pos_) {
        set_error("expected an integer");
        return std::nullopt;
    }
    return value;
}

std::optional<bool> ConfigParser::parse_boolean() {
    auto word = parse_identifier();
    if (word == "true") {
        return true;
    }
    if (word == "false") {
        return false;
    }
    set_error("expected true or false");
    return std::nullopt;
}

std::optional<std::vector<std::string>> ConfigParser::parse_string_array() {
    if (advance() != '[') {
        set_error("expected an array");
        return std::nullopt;
    }

    std::vector<std::string> items;
    auto skip_blank = [this]() {
        while (true) {
            skip_whitespace();
            if (peek() == '\n') {
                advance();
                ++line_;
            } else if (peek() == '#') {
                skip_comment();
            } else {
                return;
            }
        }
    };

    skip_blank();
    while (peek() != ']') {
        auto item = parse_string();
        if (!item) {
            return std::nullopt;
        }
        items.push_back(std::move(*item));
        skip_blank();
        if (peek() == ',') {
            advance();
            skip_blank();
        } else if (peek() != ']') {
            set_error("expected ',' or ']' in array");
            return std::nullopt;
        }
    }
    advance(); // ]
    return items;
}

// ============================================================================
// Layering
// ============================================================================

auto load_config(const CommandLine& cmd) -> Result<Config, std::string> {
    Config config;
    config.base_dir = cmd.base_dir;

    fs::path path =
        cmd.config_path ? fs::path(*cmd.config_path) : fs::path(cmd.base_dir) / CONFIG_FILE_NAME;
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
        std::ifstream file(path);
        if (!file) {
            return "cannot open config file: " + path.string();
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        ConfigParser parser(buffer.str());
        if (!parser.parse(config)) {
            return path.string() + ": " + parser.get_error();
        }
        EMBEDQL_LOG_DEBUG("cli", "loaded " << path.string());
    } else if (cmd.config_path) {
        return "config file not found: " + path.string();
    }

    if (cmd.extractor) {
        config.extractor = *cmd.extractor;
    }
    if (cmd.validate_names) {
        config.validate_names = *cmd.validate_names;
    }
    if (cmd.extensions) {
        config.extensions = *cmd.extensions;
    }
    if (cmd.exclude) {
        config.exclude = *cmd.exclude;
    }
    if (cmd.jobs) {
        config.jobs = *cmd.jobs;
    }
    config.print_sources = cmd.print_sources;
    return config;
}

} // namespace embedql::cli
