//! # AST Cache
//!
//! Signature-keyed store of parsed documents, one entry per file. This is
//! the entry point the build layer calls; the parse strategy it is built
//! with runs only on a miss.
//!
//! ## Lookup
//!
//! ```text
//! get(file)
//!   ├─ signature(file) ── error ──► return error
//!   ├─ entry.signature == signature ──► hit: same shared document
//!   └─ miss ──► single flight on rel_path
//!                 ├─ leader: parse, commit on success, publish
//!                 └─ waiter: receive leader's document or error
//! ```
//!
//! The parse strategy reports the signature of the text it actually parsed,
//! and the entry is stored under that signature. A file saved between the
//! signature read and the parse read is therefore never stored under the
//! older revision. A waiter that joined a parse of a different revision
//! retries with its own signature once that parse lands.
//!
//! ## Invariants
//!
//! - At most one parse in flight per path.
//! - Entries are replaced, never merged.
//! - Failed parses leave the stored entry untouched.

#ifndef EMBEDQL_CACHE_AST_CACHE_HPP
#define EMBEDQL_CACHE_AST_CACHE_HPP

#include "cache/single_flight.hpp"
#include "common.hpp"
#include "common/error.hpp"
#include "graphql/ast.hpp"
#include "source/file.hpp"
#include "source/file_system.hpp"
#include "source/signature.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace embedql::cache {

using DocumentPtr = std::shared_ptr<const graphql::Document>;
using DocumentMap = std::map<std::string, DocumentPtr>;

/// What the parse strategy produced for one file.
struct ParsedRevision {
    graphql::Document document;
    std::vector<std::string> sources;     ///< Literal texts, in extraction order
    source::ContentSignature signature;   ///< Revision the document was parsed from
};

class AstCache {
public:
    using ParseFn = std::function<Result<ParsedRevision, Error>(const std::string& base_dir,
                                                               const source::File& file)>;
    using SignatureFn = std::function<Result<source::ContentSignature, Error>(
        const std::string& base_dir, const source::File& file)>;

    AstCache(std::string base_dir, ParseFn parse, SignatureFn signature);

    /// Returns the document for the current revision of `file`, parsing it
    /// at most once per revision.
    [[nodiscard]] auto get(const source::File& file) -> Result<DocumentPtr, Error>;

    /// Evicts files with `exists == false` and gets all others in order.
    /// The first failure is returned as `Parse error: <message> in "<path>"`
    /// with its kind kept. On success returns `documents()`.
    [[nodiscard]] auto parse_files(const std::vector<source::File>& files)
        -> Result<DocumentMap, Error>;

    /// Same contract as `parse_files` using `jobs` worker threads (0 means
    /// hardware concurrency). The reported error is the first failing file
    /// in input order.
    [[nodiscard]] auto parse_files_parallel(const std::vector<source::File>& files, size_t jobs)
        -> Result<DocumentMap, Error>;

    /// Snapshot of every stored document.
    [[nodiscard]] auto documents() const -> DocumentMap;

    /// Literal texts of the stored revision of `rel_path`; empty when none
    /// is stored.
    [[nodiscard]] auto sources(const std::string& rel_path) const -> std::vector<std::string>;

    /// Removes the entry for a path.
    void evict(const std::string& rel_path);

    /// Clear the entire cache.
    void clear();

    [[nodiscard]] auto base_dir() const -> const std::string& {
        return base_dir_;
    }

    struct Stats {
        size_t total_entries = 0;
        size_t hits = 0;
        size_t misses = 0;
        size_t parses = 0;
        size_t failures = 0;
        uint64_t parse_time_us = 0; ///< Wall time spent in the parse strategy
    };

    [[nodiscard]] Stats get_stats() const;

private:
    struct Entry {
        source::ContentSignature signature;
        DocumentPtr document;
        std::shared_ptr<const std::vector<std::string>> sources;
    };

    /// What a flight produced, tagged with the revision it parsed.
    struct Flight {
        source::ContentSignature signature;
        Result<DocumentPtr, Error> result;
    };

    [[nodiscard]] auto find(const std::string& rel_path,
                            const source::ContentSignature& signature) const -> DocumentPtr;
    auto parse_and_commit(const source::File& file, const source::ContentSignature& signature)
        -> Flight;

    std::string base_dir_;
    ParseFn parse_;
    SignatureFn signature_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    SingleFlight<std::string, Flight> flights_;

    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
    std::atomic<size_t> parses_{0};
    std::atomic<size_t> failures_{0};
    std::atomic<uint64_t> parse_time_us_{0};
};

/// Default signature strategy: `file.hash` when the watch layer supplied
/// one, otherwise the signature of the file's current text.
[[nodiscard]] auto hash_or_content_signature(Rc<source::FileSystem> file_system)
    -> AstCache::SignatureFn;

/// Wraps a per-file failure the way `parse_files` reports it.
[[nodiscard]] auto wrap_parse_error(const Error& error, const std::string& rel_path) -> Error;

} // namespace embedql::cache

#endif // EMBEDQL_CACHE_AST_CACHE_HPP
