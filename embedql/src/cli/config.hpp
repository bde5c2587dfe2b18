//! # Tool Configuration
//!
//! Settings for the `embedql` command come from three layers, later ones
//! winning:
//!
//! 1. Built-in defaults
//! 2. `embedql.toml` in the base directory (or `--config=<path>`)
//! 3. Command-line flags
//!
//! ## Configuration File
//!
//! ```toml
//! # embedql.toml
//! extractor = "javascript"
//! validate_names = true
//! extensions = [".js", ".jsx"]
//! exclude = ["node_modules", ".git", "__generated__"]
//! jobs = 8
//! ```
//!
//! ## TOML Parser
//!
//! `ConfigParser` handles the flat subset of TOML the file needs.

#ifndef EMBEDQL_CLI_CONFIG_HPP
#define EMBEDQL_CLI_CONFIG_HPP

#include "common.hpp"

#include <optional>
#include <string>
#include <vector>

namespace embedql::cli {

/// Name of the configuration file looked up in the base directory.
constexpr const char* CONFIG_FILE_NAME = "embedql.toml";

struct Config {
    std::string base_dir;
    std::string extractor = "javascript";
    bool validate_names = true;
    std::vector<std::string> extensions; ///< Empty = defaults for the extractor
    std::vector<std::string> exclude = {"node_modules", ".git"};
    size_t jobs = 0;                     ///< 0 = hardware concurrency
    bool print_sources = false;

    /// Configured extensions, or the extractor's defaults.
    [[nodiscard]] auto effective_extensions() const -> std::vector<std::string>;
};

/// Parsed command line. Unset optionals leave the configured value alone.
struct CommandLine {
    std::string base_dir;
    std::optional<std::string> config_path;
    bool help = false;
    bool version = false;
    bool print_sources = false;
    std::optional<std::string> extractor;
    std::optional<bool> validate_names;
    std::optional<std::vector<std::string>> extensions;
    std::optional<std::vector<std::string>> exclude;
    std::optional<size_t> jobs;
};

/// Parses flags. Logging flags are skipped; `log::parse_log_options`
/// handles them.
[[nodiscard]] auto parse_command_line(int argc, char* argv[]) -> Result<CommandLine, std::string>;

/**
 * Flat TOML subset parser.
 *
 * Supported:
 * - Comments: # ...
 * - Strings: key = "value"
 * - Integers: key = 42
 * - Booleans: key = true
 * - Arrays: key = ["value1", "value2"]
 */
class ConfigParser {
public:
    explicit ConfigParser(const std::string& content);

    /**
     * Apply every key in the content to `config`.
     * Returns false on a syntax error or unknown key.
     */
    bool parse(Config& config);

    std::string get_error() const {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    void skip_whitespace();
    void skip_comment();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    std::optional<std::string> parse_identifier();
    std::optional<std::string> parse_string();
    std::optional<int> parse_number();
    std::optional<bool> parse_boolean();
    std::optional<std::vector<std::string>> parse_string_array();

    bool apply(const std::string& key, Config& config);
    bool expect_line_end();
    void set_error(const std::string& message);
};

/// Builds the effective configuration for a command line: defaults, then
/// the configuration file, then flags.
[[nodiscard]] auto load_config(const CommandLine& cmd) -> Result<Config, std::string>;

/// Splits "a,b,c" into its non-empty parts.
[[nodiscard]] auto split_list(const std::string& value) -> std::vector<std::string>;

} // namespace embedql::cli

#endif // EMBEDQL_CLI_CONFIG_HPP
