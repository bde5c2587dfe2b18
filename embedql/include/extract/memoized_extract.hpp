//! # Memoized Extraction
//!
//! Caches extractor output per file revision. Extraction is cheap next to
//! parsing but still scans the whole host text, and a build touches the same
//! unchanged files over and over.
//!
//! ## Keys
//!
//! An entry is keyed by `(rel_path, signature(text), validate_names)`.
//! Each `(rel_path, validate_names)` slot holds at most one revision: a new
//! signature for the same path replaces the old entry.
//!
//! ## Concurrency
//!
//! Concurrent misses for the same key run the wrapped extractor once; the
//! other callers wait for its result. Errors are handed to every waiter and
//! never stored.
//!
//! ```cpp
//! auto cache = make_rc<ExtractionCache>();
//! MemoizedTagExtractor memo(make_tag_extractor("javascript"), cache);
//! auto spans = memo.extract(text, base_dir, file, {});
//! ```

#ifndef EMBEDQL_EXTRACT_MEMOIZED_EXTRACT_HPP
#define EMBEDQL_EXTRACT_MEMOIZED_EXTRACT_HPP

#include "cache/single_flight.hpp"
#include "extract/tag_extractor.hpp"
#include "source/signature.hpp"

#include <atomic>
#include <functional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace embedql::extract {

struct ExtractionKey {
    std::string rel_path;
    source::ContentSignature signature;
    bool validate_names = true;

    bool operator==(const ExtractionKey& other) const = default;
};

struct ExtractionKeyHash {
    size_t operator()(const ExtractionKey& key) const noexcept {
        size_t h = std::hash<std::string>{}(key.rel_path);
        h ^= source::ContentSignatureHash{}(key.signature) + 0x9E3779B97F4A7C15ULL + (h << 6) +
             (h >> 2);
        return h ^ static_cast<size_t>(key.validate_names);
    }
};

/// Thread-safe store of extracted literal spans.
class ExtractionCache {
public:
    using Spans = std::vector<LiteralSpan>;
    using SpansPtr = std::shared_ptr<const Spans>;
    using ExtractFn = std::function<Result<Spans, Error>()>;

    /// Returns the spans stored under `key`, running `extract` on a miss.
    [[nodiscard]] auto get_or_extract(const ExtractionKey& key, const ExtractFn& extract)
        -> Result<SpansPtr, Error>;

    /// Check if a key is cached.
    [[nodiscard]] bool contains(const ExtractionKey& key) const;

    /// Drop every revision stored for a path.
    void invalidate(const std::string& rel_path);

    /// Clear the entire cache.
    void clear();

    struct Stats {
        size_t total_entries = 0;
        size_t hits = 0;
        size_t misses = 0;
    };

    [[nodiscard]] Stats get_stats() const;

private:
    struct Slot {
        std::string rel_path;
        bool validate_names = true;

        bool operator==(const Slot& other) const = default;
    };

    struct SlotHash {
        size_t operator()(const Slot& slot) const noexcept {
            return std::hash<std::string>{}(slot.rel_path) ^ static_cast<size_t>(slot.validate_names);
        }
    };

    struct Entry {
        source::ContentSignature signature;
        SpansPtr spans;
    };

    [[nodiscard]] auto find(const ExtractionKey& key) const -> SpansPtr;

    mutable std::shared_mutex mutex_;
    std::unordered_map<Slot, Entry, SlotHash> entries_;
    cache::SingleFlight<ExtractionKey, Result<SpansPtr, Error>, ExtractionKeyHash> flights_;
    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
};

/// Extracts through `cache`. `file` must exist; the key uses the signature
/// of `text`, not `file.hash`.
[[nodiscard]] auto memoized_extract(const TagExtractor& extractor, ExtractionCache& cache,
                                    std::string_view text, const std::string& base_dir,
                                    const source::File& file, const ExtractionOptions& options)
    -> Result<std::vector<LiteralSpan>, Error>;

/// A `TagExtractor` that memoizes another one.
class MemoizedTagExtractor : public TagExtractor {
public:
    explicit MemoizedTagExtractor(Rc<TagExtractor> inner,
                                  Rc<ExtractionCache> cache = make_rc<ExtractionCache>());

    [[nodiscard]] auto name() const -> std::string_view override {
        return inner_->name();
    }

    [[nodiscard]] auto extract(std::string_view text, const std::string& base_dir,
                               const source::File& file, const ExtractionOptions& options) const
        -> Result<std::vector<LiteralSpan>, Error> override;

    [[nodiscard]] auto cache() const -> const Rc<ExtractionCache>& {
        return cache_;
    }

private:
    Rc<TagExtractor> inner_;
    Rc<ExtractionCache> cache_;
};

} // namespace embedql::extract

#endif // EMBEDQL_EXTRACT_MEMOIZED_EXTRACT_HPP
