//! # GraphQL Source
//!
//! A GraphQL text buffer plus where it came from. Literals extracted from a
//! host file start somewhere in the middle of that file, so a `Source`
//! carries a location offset: the host-file line/column of its first
//! character. Every location computed from the body is shifted by it, and
//! diagnostics point into the host file rather than the literal.
//!
//! ```cpp
//! // Literal body begins at line 12, column 30 of Foo.js
//! Source source(body, "src/Foo.js", {12, 30, 0});
//! SourceLocation loc = source.location(5); // host-file position of body[5]
//! ```

#ifndef EMBEDQL_GRAPHQL_SOURCE_HPP
#define EMBEDQL_GRAPHQL_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace embedql::graphql {

class Source {
public:
    /// `name` is the file the text belongs to; `location_offset` is the
    /// host position of `body[0]` (offset field is the host byte offset).
    Source(std::string body, std::string name = "GraphQL request",
           SourceLocation location_offset = {});

    [[nodiscard]] auto body() const -> std::string_view {
        return body_;
    }

    [[nodiscard]] auto name() const -> const std::string& {
        return name_;
    }

    [[nodiscard]] auto location_offset() const -> const SourceLocation& {
        return location_offset_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return body_.size();
    }

    /// Character at `offset`, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char {
        return offset < body_.size() ? body_[offset] : '\0';
    }

    /// Host-file location of a byte offset inside the body.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

private:
    std::string body_;
    std::string name_;
    SourceLocation location_offset_;
    std::vector<size_t> line_starts_;
};

} // namespace embedql::graphql

#endif // EMBEDQL_GRAPHQL_SOURCE_HPP
