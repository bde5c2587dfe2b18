#include "module/source_module_parser.hpp"

#include "log/log.hpp"

namespace embedql::module {

SourceModuleParser::SourceModuleParser(Rc<extract::TagExtractor> extractor,
                                       Rc<graphql::DocumentParser> document_parser,
                                       Rc<source::FileSystem> file_system,
                                       Rc<extract::ExtractionCache> extraction_cache,
                                       ParserOptions options)
    : extractor_(std::move(extractor)),
      document_parser_(make_rc<graphql::InstrumentedDocumentParser>(std::move(document_parser))),
      file_system_(std::move(file_system)), extraction_cache_(std::move(extraction_cache)),
      options_(options) {}

auto SourceModuleParser::parse_file(const std::string& base_dir, const source::File& file) const
    -> Result<graphql::Document, Error> {
    auto result = parse_file_with_sources(base_dir, file);
    if (is_err(result)) {
        return unwrap_err(result);
    }
    return std::move(unwrap(result).document);
}

auto SourceModuleParser::parse_file_with_sources(const std::string& base_dir,
                                                 const source::File& file) const
    -> Result<ParsedModule, Error> {
    auto text = file_system_->read_text(base_dir, file.rel_path);
    if (is_err(text)) {
        return unwrap_err(text);
    }
    const std::string& body = unwrap(text);

    if (body.find(marker()) == std::string::npos) {
        return Error::precondition("Files should be filtered before passed to the parser, got "
                                   "unfiltered file `" +
                                       file.rel_path + "`.",
                                   file.rel_path);
    }

    extract::ExtractionOptions extract_options;
    extract_options.validate_names = options_.validate_names;
    auto spans = extract::memoized_extract(*extractor_, *extraction_cache_, body, base_dir, file,
                                           extract_options);
    if (is_err(spans)) {
        return unwrap_err(spans);
    }

    ParsedModule parsed;
    parsed.signature = source::signature_of(body);
    for (const auto& span : unwrap(spans)) {
        graphql::Source source(span.text, file.rel_path, span.start);
        auto ast = document_parser_->parse(source);
        if (is_err(ast)) {
            const auto& err = unwrap_err(ast);
            return Error::malformed(err.message, file.rel_path, err.location);
        }

        auto& definitions = unwrap(ast).definitions;
        if (definitions.empty()) {
            return Error::malformed("Expected GraphQL text to contain at least one definition "
                                    "(fragment, mutation, query, subscription), got `" +
                                        span.text + "`.",
                                    file.rel_path, span.start);
        }

        for (auto& def : definitions) {
            parsed.document.definitions.push_back(std::move(def));
        }
        parsed.sources.push_back(span.text);
    }

    EMBEDQL_LOG_TRACE("parser", file.rel_path << ": " << parsed.sources.size() << " literal(s), "
                                              << parsed.document.definitions.size()
                                              << " definition(s)");
    return parsed;
}

auto SourceModuleParser::file_filter(const std::string& base_dir) const -> FileFilter {
    return [file_system = file_system_, base_dir](const source::File& file) {
        auto text = file_system->read_text(base_dir, file.rel_path);
        if (is_err(text)) {
            EMBEDQL_LOG_WARN("filter", "skipping " << file.rel_path << ": "
                                                   << unwrap_err(text).message);
            return false;
        }
        return unwrap(text).find(marker()) != std::string::npos;
    };
}

auto SourceModuleParser::make_ast_cache(const std::string& base_dir) const
    -> Box<cache::AstCache> {
    return make_box<cache::AstCache>(
        base_dir,
        [self = *this](const std::string& dir,
                       const source::File& file) -> Result<cache::ParsedRevision, Error> {
            auto parsed = self.parse_file_with_sources(dir, file);
            if (is_err(parsed)) {
                return unwrap_err(parsed);
            }
            auto& parsed_module = unwrap(parsed);
            return cache::ParsedRevision{std::move(parsed_module.document),
                                         std::move(parsed_module.sources),
                                         file.hash.value_or(parsed_module.signature)};
        },
        cache::hash_or_content_signature(file_system_));
}

} // namespace embedql::module
