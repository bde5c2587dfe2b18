//! # CLI Dispatcher
//!
//! ```text
//! embedql_main(argc, argv)
//!   ├─ log options    → Logger::init()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   └─ <base-dir>     → load_config() → Session::run()
//! ```

#include "cli/driver.hpp"

#include "cli/config.hpp"
#include "cli/session.hpp"
#include "common.hpp"
#include "log/log.hpp"

#include <iostream>

namespace embedql::cli {

namespace {

void print_usage() {
    std::cout << "Usage: embedql [options] <base-dir>\n"
              << "\n"
              << "Finds GraphQL literals embedded in source files, parses them and reports\n"
              << "the definitions found in each file.\n"
              << "\n"
              << "Options:\n"
              << "  --extractor=<name>     Host convention: javascript (default) or cpp\n"
              << "  --validate-names       Enforce module naming of definitions (default)\n"
              << "  --no-validate-names    Accept any definition names\n"
              << "  --ext=<list>           File extensions to scan, e.g. .js,.jsx\n"
              << "  --exclude=<list>       Directory names to skip (default node_modules,.git)\n"
              << "  -j <n>, --jobs=<n>     Parser threads (default: hardware concurrency)\n"
              << "  --print                Print the literal sources of each file\n"
              << "  --config=<path>        Configuration file (default <base-dir>/embedql.toml)\n"
              << "  -h, --help             Show this message\n"
              << "  -V, --version          Show version\n"
              << "\n"
              << "Logging:\n"
              << "  --log-level=<level>    trace, debug, info, warn, error, off\n"
              << "  --log-filter=<spec>    Per-module levels, e.g. cache=debug,*=warn\n"
              << "  --log-file=<path>      Also write log records to a file\n"
              << "  --log-format=<fmt>     text or json\n"
              << "  -v, -vv, -vvv, -q      Raise or silence log verbosity\n";
}

void print_version() {
    std::cout << "embedql " << VERSION << "\n";
}

} // namespace

} // namespace embedql::cli

/// Entry point of the `embedql` tool.
///
/// ## Return Codes
///
/// | Code | Meaning                                   |
/// |------|-------------------------------------------|
/// | 0    | Success                                   |
/// | 1    | Usage, configuration or parse error       |
int embedql_main(int argc, char* argv[]) {
    using namespace embedql;

    log::Logger::init(log::parse_log_options(argc, argv));

    auto cmd = cli::parse_command_line(argc, argv);
    if (is_err(cmd)) {
        std::cerr << "error: " << unwrap_err(cmd) << "\n";
        std::cerr << "Run `embedql --help` for usage.\n";
        return 1;
    }
    if (unwrap(cmd).help) {
        cli::print_usage();
        return 0;
    }
    if (unwrap(cmd).version) {
        cli::print_version();
        return 0;
    }

    auto config = cli::load_config(unwrap(cmd));
    if (is_err(config)) {
        std::cerr << "error: " << unwrap_err(config) << "\n";
        return 1;
    }

    auto session = cli::Session::create(std::move(unwrap(config)));
    if (is_err(session)) {
        std::cerr << "error: " << unwrap_err(session) << "\n";
        return 1;
    }

    int code = unwrap(session)->run(std::cout, std::cerr);
    log::Logger::instance().flush();
    return code;
}
