//! # Session
//!
//! Owns one pipeline for one base directory: the file system, the
//! extraction cache, the source module parser and its AST cache. Nothing in
//! the pipeline is global, so several sessions can coexist in one process.
//!
//! ## Run
//!
//! ```text
//! scan ─► extension + exclude filter ─► marker filter ─► parse (parallel) ─► report
//! ```

#ifndef EMBEDQL_CLI_SESSION_HPP
#define EMBEDQL_CLI_SESSION_HPP

#include "cache/ast_cache.hpp"
#include "cli/config.hpp"
#include "extract/memoized_extract.hpp"
#include "module/source_module_parser.hpp"
#include "source/file_system.hpp"

#include <ostream>
#include <vector>

namespace embedql::cli {

class Session {
public:
    Session(Config config, Rc<extract::TagExtractor> extractor,
            Rc<source::FileSystem> file_system);

    /// Resolves the configured extractor and builds a session reading from
    /// disk. Fails on an unknown extractor name.
    [[nodiscard]] static auto create(Config config) -> Result<Box<Session>, std::string>;

    /// Files below the base directory with a configured extension, skipping
    /// excluded directories. Sorted by relative path.
    [[nodiscard]] auto scan() const -> std::vector<source::File>;

    /// Scans, filters, parses and reports. Returns the process exit code.
    auto run(std::ostream& out, std::ostream& err) -> int;

    [[nodiscard]] auto config() const -> const Config& {
        return config_;
    }

    [[nodiscard]] auto parser() const -> const module::SourceModuleParser& {
        return parser_;
    }

    [[nodiscard]] auto ast_cache() -> cache::AstCache& {
        return *ast_cache_;
    }

    [[nodiscard]] auto extraction_cache() const -> const extract::ExtractionCache& {
        return *extraction_cache_;
    }

private:
    Config config_;
    Rc<source::FileSystem> file_system_;
    Rc<extract::ExtractionCache> extraction_cache_;
    module::SourceModuleParser parser_;
    Box<cache::AstCache> ast_cache_;
};

} // namespace embedql::cli

#endif // EMBEDQL_CLI_SESSION_HPP
