//! # Tagged Template Extractor
//!
//! Extracts graphql`...` and graphql.experimental`...` tagged template
//! literals from JavaScript, Flow and TypeScript sources.
//!
//! The scanner understands just enough of the host language to avoid false
//! matches: comments, string literals, regular expression literals and
//! nested template literals are skipped. Templates bound to a property of
//! the fragment-spec object of a Relay container call record that property
//! as their key:
//!
//! ```js
//! createFragmentContainer(Foo, {
//!   user: graphql`fragment Foo_user on User { id }`, // key_name = "user"
//! });
//! ```
//!
//! A `${...}` substitution inside a graphql template is an extraction
//! error; fragments are composed with spreads instead.

#ifndef EMBEDQL_EXTRACT_TAGGED_TEMPLATE_EXTRACTOR_HPP
#define EMBEDQL_EXTRACT_TAGGED_TEMPLATE_EXTRACTOR_HPP

#include "extract/tag_extractor.hpp"

namespace embedql::extract {

class TaggedTemplateExtractor : public TagExtractor {
public:
    [[nodiscard]] auto name() const -> std::string_view override {
        return "javascript";
    }

    [[nodiscard]] auto extract(std::string_view text, const std::string& base_dir,
                               const source::File& file, const ExtractionOptions& options) const
        -> Result<std::vector<LiteralSpan>, Error> override;
};

} // namespace embedql::extract

#endif // EMBEDQL_EXTRACT_TAGGED_TEMPLATE_EXTRACTOR_HPP
