//! # Tag Extractor
//!
//! Finds the GraphQL literals embedded in a host source file. Each host
//! language has its own convention for marking a literal, so extraction is
//! a pluggable capability:
//!
//! | Extractor                 | Host          | Literal form                  |
//! |---------------------------|---------------|-------------------------------|
//! | `TaggedTemplateExtractor` | JS / Flow / TS | graphql`query Foo { id }`    |
//! | `RawStringExtractor`      | C++           | R"graphql(query Foo { id })graphql" |
//!
//! Extractors are pure functions of their inputs: no hidden state, no I/O.
//! The rest of the pipeline never branches on which one is installed.
//!
//! ## Name Validation
//!
//! With `validate_names` set, every definition must follow the module
//! naming convention (see `extract/module_name.hpp`); a violation fails the
//! file with `ErrorKind::Extraction`.

#ifndef EMBEDQL_EXTRACT_TAG_EXTRACTOR_HPP
#define EMBEDQL_EXTRACT_TAG_EXTRACTOR_HPP

#include "common.hpp"
#include "common/error.hpp"
#include "source/file.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace embedql::extract {

struct ExtractionOptions {
    bool validate_names = true;
};

/// One embedded literal.
struct LiteralSpan {
    std::string text;                    ///< Literal body, without delimiters
    std::string file;                    ///< Relative path of the host file
    std::string tag;                     ///< "graphql", "graphql.experimental", ...
    std::optional<std::string> key_name; ///< Container property the literal is bound to
    SourceLocation start;                ///< Host position of text[0]
};

class TagExtractor {
public:
    virtual ~TagExtractor() = default;

    /// Short identifier, e.g. "javascript".
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// Returns every literal in `text`, in source order.
    [[nodiscard]] virtual auto extract(std::string_view text, const std::string& base_dir,
                                       const source::File& file,
                                       const ExtractionOptions& options) const
        -> Result<std::vector<LiteralSpan>, Error> = 0;
};

/// Creates the extractor for a host convention: "javascript" (also "js",
/// "typescript") or "cpp". Returns nullptr for unknown names.
[[nodiscard]] auto make_tag_extractor(std::string_view name) -> Rc<TagExtractor>;

} // namespace embedql::extract

#endif // EMBEDQL_EXTRACT_TAG_EXTRACTOR_HPP
