#include "extract/memoized_extract.hpp"

#include "log/log.hpp"

namespace embedql::extract {

// ============================================================================
// ExtractionCache
// ============================================================================

auto ExtractionCache::find(const ExtractionKey& key) const -> SpansPtr {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(Slot{key.rel_path, key.validate_names});
    if (it == entries_.end() || it->second.signature != key.signature) {
        return nullptr;
    }
    return it->second.spans;
}

auto ExtractionCache::get_or_extract(const ExtractionKey& key, const ExtractFn& extract)
    -> Result<SpansPtr, Error> {
    if (auto spans = find(key)) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        EMBEDQL_LOG_DEBUG("memo", "hit " << key.rel_path << " @" << key.signature.to_hex());
        return spans;
    }
    misses_.fetch_add(1, std::memory_order_relaxed);
    EMBEDQL_LOG_DEBUG("memo", "miss " << key.rel_path << " @" << key.signature.to_hex());

    auto landing = flights_.run(key, [&]() -> Result<SpansPtr, Error> {
        // Another flight may have committed between find() and run()
        if (auto spans = find(key)) {
            return spans;
        }

        auto result = extract();
        if (is_err(result)) {
            return unwrap_err(result);
        }

        auto spans = std::make_shared<const Spans>(std::move(unwrap(result)));
        std::unique_lock lock(mutex_);
        entries_[Slot{key.rel_path, key.validate_names}] = Entry{key.signature, spans};
        return spans;
    });
    return std::move(landing.value);
}

bool ExtractionCache::contains(const ExtractionKey& key) const {
    return find(key) != nullptr;
}

void ExtractionCache::invalidate(const std::string& rel_path) {
    std::unique_lock lock(mutex_);
    entries_.erase(Slot{rel_path, true});
    entries_.erase(Slot{rel_path, false});
}

void ExtractionCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
}

ExtractionCache::Stats ExtractionCache::get_stats() const {
    std::shared_lock lock(mutex_);
    return {entries_.size(), hits_.load(std::memory_order_relaxed),
            misses_.load(std::memory_order_relaxed)};
}

// ============================================================================
// memoized_extract
// ============================================================================

auto memoized_extract(const TagExtractor& extractor, ExtractionCache& cache,
                      std::string_view text, const std::string& base_dir,
                      const source::File& file, const ExtractionOptions& options)
    -> Result<std::vector<LiteralSpan>, Error> {
    if (!file.exists) {
        return Error::precondition("Called with non-existent file `" + file.rel_path + "`",
                                   file.rel_path);
    }

    ExtractionKey key{file.rel_path, source::signature_of(text), options.validate_names};
    auto spans = cache.get_or_extract(
        key, [&]() { return extractor.extract(text, base_dir, file, options); });
    if (is_err(spans)) {
        return unwrap_err(spans);
    }
    return *unwrap(spans);
}

// ============================================================================
// MemoizedTagExtractor
// ============================================================================

MemoizedTagExtractor::MemoizedTagExtractor(Rc<TagExtractor> inner, Rc<ExtractionCache> cache)
    : inner_(std::move(inner)), cache_(std::move(cache)) {}

auto MemoizedTagExtractor::extract(std::string_view text, const std::string& base_dir,
                                   const source::File& file,
                                   const ExtractionOptions& options) const
    -> Result<std::vector<LiteralSpan>, Error> {
    return memoized_extract(*inner_, *cache_, text, base_dir, file, options);
}

} // namespace embedql::extract
