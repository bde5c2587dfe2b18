//! # Source Module Parser
//!
//! Turns one host source file into a combined GraphQL document:
//!
//! ```text
//! read text ─► marker check ─► memoized extraction ─► parse each literal ─► combine
//! ```
//!
//! The marker check doubles as the build layer's file filter. A file that
//! reaches the parser without the marker is a caller bug and fails with
//! `ErrorKind::Precondition`.
//!
//! ## Example
//!
//! ```cpp
//! auto fs = make_rc<source::DiskFileSystem>();
//! SourceModuleParser parser(extract::make_tag_extractor("javascript"),
//!                           make_rc<graphql::GraphQLDocumentParser>(), fs,
//!                           make_rc<extract::ExtractionCache>());
//! auto cache = parser.make_ast_cache("/project");
//! auto doc = cache->get({"src/Foo.js"});
//! ```

#ifndef EMBEDQL_MODULE_SOURCE_MODULE_PARSER_HPP
#define EMBEDQL_MODULE_SOURCE_MODULE_PARSER_HPP

#include "cache/ast_cache.hpp"
#include "common.hpp"
#include "common/error.hpp"
#include "extract/memoized_extract.hpp"
#include "extract/tag_extractor.hpp"
#include "graphql/document_parser.hpp"
#include "source/file.hpp"
#include "source/file_system.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace embedql::module {

struct ParserOptions {
    bool validate_names = true;
};

/// A combined document plus the literal texts it came from, in extraction
/// order.
struct ParsedModule {
    graphql::Document document;
    std::vector<std::string> sources;
    source::ContentSignature signature; ///< Of the text that was parsed
};

using FileFilter = std::function<bool(const source::File&)>;

class SourceModuleParser {
public:
    SourceModuleParser(Rc<extract::TagExtractor> extractor,
                       Rc<graphql::DocumentParser> document_parser,
                       Rc<source::FileSystem> file_system,
                       Rc<extract::ExtractionCache> extraction_cache, ParserOptions options = {});

    /// Parses a file and returns only its document.
    [[nodiscard]] auto parse_file(const std::string& base_dir, const source::File& file) const
        -> Result<graphql::Document, Error>;

    /// Parses a file and returns its document and literal sources.
    [[nodiscard]] auto parse_file_with_sources(const std::string& base_dir,
                                               const source::File& file) const
        -> Result<ParsedModule, Error>;

    /// Predicate for the build layer: true when the file contains the marker.
    /// Unreadable files are logged and rejected.
    [[nodiscard]] auto file_filter(const std::string& base_dir) const -> FileFilter;

    /// An `AstCache` over `base_dir` that parses with
    /// `parse_file_with_sources`. Entries are keyed by `file.hash` when the
    /// watch layer supplied one, otherwise by the signature of the text the
    /// parse read. The cache keeps this parser's collaborators alive.
    [[nodiscard]] auto make_ast_cache(const std::string& base_dir) const -> Box<cache::AstCache>;

    [[nodiscard]] static constexpr auto marker() -> std::string_view {
        return "graphql";
    }

    [[nodiscard]] auto options() const -> const ParserOptions& {
        return options_;
    }

    /// Call count and timings of the grammar parser, shared with every
    /// cache made by `make_ast_cache`.
    [[nodiscard]] auto parse_stats() const -> graphql::InstrumentedDocumentParser::Stats {
        return document_parser_->get_stats();
    }

private:
    Rc<extract::TagExtractor> extractor_;
    Rc<graphql::InstrumentedDocumentParser> document_parser_;
    Rc<source::FileSystem> file_system_;
    Rc<extract::ExtractionCache> extraction_cache_;
    ParserOptions options_;
};

} // namespace embedql::module

#endif // EMBEDQL_MODULE_SOURCE_MODULE_PARSER_HPP
