#include "cache/ast_cache.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <optional>
#include <thread>

namespace embedql::cache {

AstCache::AstCache(std::string base_dir, ParseFn parse, SignatureFn signature)
    : base_dir_(std::move(base_dir)), parse_(std::move(parse)), signature_(std::move(signature)) {}

// ============================================================================
// Lookup
// ============================================================================

auto AstCache::find(const std::string& rel_path, const source::ContentSignature& signature) const
    -> DocumentPtr {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(rel_path);
    if (it == entries_.end() || it->second.signature != signature) {
        return nullptr;
    }
    return it->second.document;
}

auto AstCache::get(const source::File& file) -> Result<DocumentPtr, Error> {
    auto sig = signature_(base_dir_, file);
    if (is_err(sig)) {
        return unwrap_err(sig);
    }
    const source::ContentSignature signature = unwrap(sig);

    if (auto doc = find(file.rel_path, signature)) {
        hits_.fetch_add(1, std::memory_order_relaxed);
        EMBEDQL_LOG_DEBUG("cache", "hit " << file.rel_path);
        return doc;
    }
    misses_.fetch_add(1, std::memory_order_relaxed);
    EMBEDQL_LOG_DEBUG("cache", "miss " << file.rel_path << " @" << signature.to_hex());

    while (true) {
        auto landing =
            flights_.run(file.rel_path, [&]() { return parse_and_commit(file, signature); });
        if (landing.leader || landing.value.signature == signature) {
            return std::move(landing.value.result);
        }
        // Joined a parse of another revision; look again with ours
        if (auto doc = find(file.rel_path, signature)) {
            return doc;
        }
    }
}

auto AstCache::parse_and_commit(const source::File& file,
                                const source::ContentSignature& signature) -> Flight {
    // Committed by a flight that landed between find() and run()
    if (auto doc = find(file.rel_path, signature)) {
        return Flight{signature, doc};
    }

    parses_.fetch_add(1, std::memory_order_relaxed);
    EMBEDQL_LOG_TRACE("cache", "parsing " << file.rel_path);

    auto started = std::chrono::steady_clock::now();
    auto parsed = parse_(base_dir_, file);
    auto elapsed_us = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                                                std::chrono::steady_clock::now() - started)
                                                .count());
    parse_time_us_.fetch_add(elapsed_us, std::memory_order_relaxed);
    EMBEDQL_LOG_DEBUG("cache", "parsed " << file.rel_path << " in " << elapsed_us << " us");

    if (is_err(parsed)) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        EMBEDQL_LOG_WARN("cache", "parse failed for " << file.rel_path << ": "
                                                      << unwrap_err(parsed).message);
        return Flight{signature, unwrap_err(parsed)};
    }

    auto& revision = unwrap(parsed);
    if (revision.signature != signature) {
        EMBEDQL_LOG_DEBUG("cache", file.rel_path << " changed while parsing, storing @"
                                                 << revision.signature.to_hex());
    }
    auto doc = std::make_shared<const graphql::Document>(std::move(revision.document));
    auto sources = std::make_shared<const std::vector<std::string>>(std::move(revision.sources));
    {
        std::unique_lock lock(mutex_);
        entries_[file.rel_path] = Entry{revision.signature, doc, std::move(sources)};
    }
    return Flight{revision.signature, doc};
}

// ============================================================================
// Batch Parsing
// ============================================================================

auto AstCache::parse_files(const std::vector<source::File>& files) -> Result<DocumentMap, Error> {
    for (const auto& file : files) {
        if (!file.exists) {
            evict(file.rel_path);
            continue;
        }
        auto doc = get(file);
        if (is_err(doc)) {
            return wrap_parse_error(unwrap_err(doc), file.rel_path);
        }
    }
    return documents();
}

auto AstCache::parse_files_parallel(const std::vector<source::File>& files, size_t jobs)
    -> Result<DocumentMap, Error> {
    std::vector<const source::File*> work;
    work.reserve(files.size());
    for (const auto& file : files) {
        if (!file.exists) {
            evict(file.rel_path);
        } else {
            work.push_back(&file);
        }
    }

    if (jobs == 0) {
        jobs = std::max(1u, std::thread::hardware_concurrency());
    }
    size_t num_threads = std::min(jobs, work.size());

    std::vector<std::optional<Error>> errors(work.size());
    std::vector<std::exception_ptr> thrown(work.size());
    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next.fetch_add(1); i < work.size(); i = next.fetch_add(1)) {
            try {
                auto doc = get(*work[i]);
                if (is_err(doc)) {
                    errors[i] = std::move(unwrap_err(doc));
                }
            } catch (...) {
                // Rethrown on the calling thread once the workers are joined
                thrown[i] = std::current_exception();
            }
        }
    };

    EMBEDQL_LOG_DEBUG("cache", "parsing " << work.size() << " file(s) on " << num_threads
                                          << " thread(s)");
    std::vector<std::thread> workers;
    workers.reserve(num_threads);
    for (size_t t = 0; t < num_threads; ++t) {
        workers.emplace_back(worker);
    }
    for (auto& w : workers) {
        w.join();
    }

    for (size_t i = 0; i < work.size(); ++i) {
        if (thrown[i]) {
            std::rethrow_exception(thrown[i]);
        }
        if (errors[i]) {
            return wrap_parse_error(*errors[i], work[i]->rel_path);
        }
    }
    return documents();
}

// ============================================================================
// Maintenance
// ============================================================================

auto AstCache::documents() const -> DocumentMap {
    std::shared_lock lock(mutex_);
    DocumentMap docs;
    for (const auto& [path, entry] : entries_) {
        docs.emplace(path, entry.document);
    }
    return docs;
}

auto AstCache::sources(const std::string& rel_path) const -> std::vector<std::string> {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(rel_path);
    if (it == entries_.end() || !it->second.sources) {
        return {};
    }
    return *it->second.sources;
}

void AstCache::evict(const std::string& rel_path) {
    std::unique_lock lock(mutex_);
    if (entries_.erase(rel_path) > 0) {
        EMBEDQL_LOG_DEBUG("cache", "evicted " << rel_path);
    }
}

void AstCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
    parses_.store(0, std::memory_order_relaxed);
    failures_.store(0, std::memory_order_relaxed);
    parse_time_us_.store(0, std::memory_order_relaxed);
}

AstCache::Stats AstCache::get_stats() const {
    std::shared_lock lock(mutex_);
    return {entries_.size(), hits_.load(std::memory_order_relaxed),
            misses_.load(std::memory_order_relaxed), parses_.load(std::memory_order_relaxed),
            failures_.load(std::memory_order_relaxed),
            parse_time_us_.load(std::memory_order_relaxed)};
}

// ============================================================================
// Helpers
// ============================================================================

auto hash_or_content_signature(Rc<source::FileSystem> file_system) -> AstCache::SignatureFn {
    return [file_system = std::move(file_system)](const std::string& base_dir,
                                                  const source::File& file)
               -> Result<source::ContentSignature, Error> {
        if (file.hash) {
            return *file.hash;
        }
        auto text = file_system->read_text(base_dir, file.rel_path);
        if (is_err(text)) {
            return unwrap_err(text);
        }
        return source::signature_of(unwrap(text));
    };
}

auto wrap_parse_error(const Error& error, const std::string& rel_path) -> Error {
    Error wrapped = error;
    wrapped.message = "Parse error: " + error.message + " in \"" + rel_path + "\"";
    if (wrapped.file.empty()) {
        wrapped.file = rel_path;
    }
    return wrapped;
}

} // namespace embedql::cache
