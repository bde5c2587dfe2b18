#include "graphql/document_parser.hpp"

#include "graphql/parser.hpp"
#include "log/log.hpp"

#include <chrono>

namespace embedql::graphql {

auto GraphQLDocumentParser::parse(const Source& source) -> Result<Document, SyntaxError> {
    return Parser(source).parse_document();
}

// ============================================================================
// Instrumentation
// ============================================================================

InstrumentedDocumentParser::InstrumentedDocumentParser(Rc<DocumentParser> inner)
    : inner_(std::move(inner)) {}

auto InstrumentedDocumentParser::parse(const Source& source) -> Result<Document, SyntaxError> {
    auto started = std::chrono::steady_clock::now();
    auto result = inner_->parse(source);
    auto elapsed_us = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(
                                                std::chrono::steady_clock::now() - started)
                                                .count());

    calls_.fetch_add(1, std::memory_order_relaxed);
    if (is_err(result)) {
        failures_.fetch_add(1, std::memory_order_relaxed);
    }
    total_time_us_.fetch_add(elapsed_us, std::memory_order_relaxed);
    uint64_t max = max_time_us_.load(std::memory_order_relaxed);
    while (elapsed_us > max &&
           !max_time_us_.compare_exchange_weak(max, elapsed_us, std::memory_order_relaxed)) {
    }

    const auto& at = source.location_offset();
    EMBEDQL_LOG_TRACE("parser", "GraphQL.parse " << source.name() << ":" << at.line << ":"
                                                 << at.column << " took " << elapsed_us << " us");
    return result;
}

InstrumentedDocumentParser::Stats InstrumentedDocumentParser::get_stats() const {
    return {calls_.load(std::memory_order_relaxed), failures_.load(std::memory_order_relaxed),
            total_time_us_.load(std::memory_order_relaxed),
            max_time_us_.load(std::memory_order_relaxed)};
}

void InstrumentedDocumentParser::reset() {
    calls_.store(0, std::memory_order_relaxed);
    failures_.store(0, std::memory_order_relaxed);
    total_time_us_.store(0, std::memory_order_relaxed);
    max_time_us_.store(0, std::memory_order_relaxed);
}

} // namespace embedql::graphql
