//! # Raw String Extractor
//!
//! Extracts GraphQL from C++ raw string literals that use `graphql` as
//! their delimiter:
//!
//! ```cpp
//! constexpr auto QUERY = R"graphql(
//!   query UserViewQuery { viewer { id } }
//! )graphql";
//! ```
//!
//! Encoding prefixes (`u8R`, `uR`, `UR`, `LR`) are accepted. Comments,
//! ordinary strings, character literals and raw strings with any other
//! delimiter are skipped. The tag recorded on each span is `graphql`.

#ifndef EMBEDQL_EXTRACT_RAW_STRING_EXTRACTOR_HPP
#define EMBEDQL_EXTRACT_RAW_STRING_EXTRACTOR_HPP

#include "extract/tag_extractor.hpp"

namespace embedql::extract {

class RawStringExtractor : public TagExtractor {
public:
    [[nodiscard]] auto name() const -> std::string_view override {
        return "cpp";
    }

    [[nodiscard]] auto extract(std::string_view text, const std::string& base_dir,
                               const source::File& file, const ExtractionOptions& options) const
        -> Result<std::vector<LiteralSpan>, Error> override;
};

} // namespace embedql::extract

#endif // EMBEDQL_EXTRACT_RAW_STRING_EXTRACTOR_HPP
