//! # Document Parser Interface
//!
//! The grammar-parser collaborator of the pipeline: text in, document or
//! syntax error out. `GraphQLDocumentParser` is the built-in
//! implementation; tests substitute counting or failing doubles.
//! `InstrumentedDocumentParser` wraps any of them and times every call.

#ifndef EMBEDQL_GRAPHQL_DOCUMENT_PARSER_HPP
#define EMBEDQL_GRAPHQL_DOCUMENT_PARSER_HPP

#include "common.hpp"
#include "graphql/ast.hpp"
#include "graphql/lexer.hpp"
#include "graphql/source.hpp"

#include <atomic>
#include <cstdint>

namespace embedql::graphql {

class DocumentParser {
public:
    virtual ~DocumentParser() = default;

    /// Parses one literal. Must be safe to call from several threads.
    [[nodiscard]] virtual auto parse(const Source& source) -> Result<Document, SyntaxError> = 0;
};

/// Parses with `graphql::Parser`. Stateless.
class GraphQLDocumentParser : public DocumentParser {
public:
    [[nodiscard]] auto parse(const Source& source) -> Result<Document, SyntaxError> override;
};

/// Times each call to the wrapped parser. Counters are shared by every
/// copy of the pipeline holding this instance.
class InstrumentedDocumentParser : public DocumentParser {
public:
    explicit InstrumentedDocumentParser(Rc<DocumentParser> inner);

    [[nodiscard]] auto parse(const Source& source) -> Result<Document, SyntaxError> override;

    struct Stats {
        size_t calls = 0;
        size_t failures = 0;
        uint64_t total_time_us = 0;
        uint64_t max_time_us = 0;
    };

    [[nodiscard]] Stats get_stats() const;

    void reset();

private:
    Rc<DocumentParser> inner_;
    std::atomic<size_t> calls_{0};
    std::atomic<size_t> failures_{0};
    std::atomic<uint64_t> total_time_us_{0};
    std::atomic<uint64_t> max_time_us_{0};
};

} // namespace embedql::graphql

#endif // EMBEDQL_GRAPHQL_DOCUMENT_PARSER_HPP
