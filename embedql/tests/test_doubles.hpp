//! # Test Doubles
//!
//! In-memory collaborators shared by the pipeline tests.

#ifndef EMBEDQL_TESTS_TEST_DOUBLES_HPP
#define EMBEDQL_TESTS_TEST_DOUBLES_HPP

#include "extract/tag_extractor.hpp"
#include "graphql/document_parser.hpp"
#include "source/file_system.hpp"

#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <string>
#include <thread>

namespace embedql::test_support {

/// Serves files from a map keyed by relative path. Counts reads.
class MemoryFileSystem : public source::FileSystem {
public:
    void set(const std::string& rel_path, std::string text) {
        std::lock_guard lock(mutex_);
        files_[rel_path] = std::move(text);
    }

    void remove(const std::string& rel_path) {
        std::lock_guard lock(mutex_);
        files_.erase(rel_path);
    }

    auto read_text(const std::string& /*base_dir*/, const std::string& rel_path)
        -> Result<std::string, Error> override {
        reads.fetch_add(1);
        std::lock_guard lock(mutex_);
        auto it = files_.find(rel_path);
        if (it == files_.end()) {
            return Error::io("No such file: " + rel_path, rel_path);
        }
        return it->second;
    }

    auto exists(const std::string& /*base_dir*/, const std::string& rel_path) -> bool override {
        std::lock_guard lock(mutex_);
        return files_.count(rel_path) > 0;
    }

    std::atomic<int> reads{0};

private:
    std::mutex mutex_;
    std::map<std::string, std::string> files_;
};

/// Real GraphQL parser that counts calls and can be slowed down.
class CountingDocumentParser : public graphql::DocumentParser {
public:
    auto parse(const graphql::Source& source)
        -> Result<graphql::Document, graphql::SyntaxError> override {
        calls.fetch_add(1);
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return inner_.parse(source);
    }

    std::atomic<int> calls{0};
    std::chrono::milliseconds delay{0};

private:
    graphql::GraphQLDocumentParser inner_;
};

/// Wraps an extractor and counts how often it actually runs.
class CountingExtractor : public extract::TagExtractor {
public:
    explicit CountingExtractor(Rc<extract::TagExtractor> inner) : inner_(std::move(inner)) {}

    auto name() const -> std::string_view override {
        return inner_->name();
    }

    auto extract(std::string_view text, const std::string& base_dir, const source::File& file,
                 const extract::ExtractionOptions& options) const
        -> Result<std::vector<extract::LiteralSpan>, Error> override {
        calls.fetch_add(1);
        if (delay.count() > 0) {
            std::this_thread::sleep_for(delay);
        }
        return inner_->extract(text, base_dir, file, options);
    }

    mutable std::atomic<int> calls{0};
    std::chrono::milliseconds delay{0};

private:
    Rc<extract::TagExtractor> inner_;
};

} // namespace embedql::test_support

#endif // EMBEDQL_TESTS_TEST_DOUBLES_HPP
