#include "cli/session.hpp"

#include "graphql/document_parser.hpp"
#include "log/log.hpp"

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <sstream>

namespace fs = std::filesystem;

namespace embedql::cli {

Session::Session(Config config, Rc<extract::TagExtractor> extractor,
                 Rc<source::FileSystem> file_system)
    : config_(std::move(config)), file_system_(std::move(file_system)),
      extraction_cache_(make_rc<extract::ExtractionCache>()),
      parser_(std::move(extractor), make_rc<graphql::GraphQLDocumentParser>(), file_system_,
              extraction_cache_, module::ParserOptions{config_.validate_names}),
      ast_cache_(parser_.make_ast_cache(config_.base_dir)) {}

auto Session::create(Config config) -> Result<Box<Session>, std::string> {
    auto extractor = extract::make_tag_extractor(config.extractor);
    if (!extractor) {
        return "unknown extractor `" + config.extractor + "` (expected javascript or cpp)";
    }
    return make_box<Session>(std::move(config), std::move(extractor),
                             make_rc<source::DiskFileSystem>());
}

auto Session::scan() const -> std::vector<source::File> {
    std::vector<source::File> files;
    auto extensions = config_.effective_extensions();
    auto is_excluded = [this](const fs::path& dir) {
        return std::find(config_.exclude.begin(), config_.exclude.end(),
                         dir.filename().string()) != config_.exclude.end();
    };

    fs::path root(config_.base_dir);
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        EMBEDQL_LOG_ERROR("cli", "cannot scan " << root.string() << ": " << ec.message());
        return files;
    }

    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            EMBEDQL_LOG_WARN("cli", "scan error: " << ec.message());
            break;
        }
        const auto& entry = *it;
        if (entry.is_directory(ec)) {
            if (is_excluded(entry.path())) {
                it.disable_recursion_pending();
            }
            continue;
        }
        if (!entry.is_regular_file(ec)) {
            continue;
        }
        auto ext = entry.path().extension().string();
        if (std::find(extensions.begin(), extensions.end(), ext) == extensions.end()) {
            continue;
        }
        source::File file;
        file.rel_path = entry.path().lexically_relative(root).generic_string();
        files.push_back(std::move(file));
    }

    std::sort(files.begin(), files.end(),
              [](const source::File& a, const source::File& b) { return a.rel_path < b.rel_path; });
    return files;
}

auto Session::run(std::ostream& out, std::ostream& err) -> int {
    auto files = scan();
    auto filter = parser_.file_filter(config_.base_dir);

    std::vector<source::File> candidates;
    std::copy_if(files.begin(), files.end(), std::back_inserter(candidates), filter);
    EMBEDQL_LOG_INFO("cli", candidates.size() << " of " << files.size()
                                              << " file(s) contain graphql");

    auto result = ast_cache_->parse_files_parallel(candidates, config_.jobs);
    if (is_err(result)) {
        err << "error: " << unwrap_err(result).to_string() << "\n";
        return 1;
    }
    const auto& documents = unwrap(result);

    for (const auto& file : candidates) {
        auto it = documents.find(file.rel_path);
        if (it == documents.end()) {
            continue;
        }
        auto names = it->second->definition_names();
        out << file.rel_path << ": " << names.size() << " definition(s)";
        for (size_t i = 0; i < names.size(); ++i) {
            out << (i == 0 ? ": " : ", ") << names[i];
        }
        out << "\n";

        if (config_.print_sources) {
            for (const auto& text : ast_cache_->sources(file.rel_path)) {
                std::istringstream lines(text);
                std::string line;
                while (std::getline(lines, line)) {
                    out << "    " << line << "\n";
                }
            }
        }
    }

    auto stats = ast_cache_->get_stats();
    auto memo = extraction_cache_->get_stats();
    auto timing = parser_.parse_stats();
    EMBEDQL_LOG_DEBUG("cli", "ast cache: " << stats.total_entries << " entries, " << stats.hits
                                           << " hits, " << stats.misses << " misses, "
                                           << stats.parses << " parses");
    EMBEDQL_LOG_DEBUG("cli", "extraction cache: " << memo.total_entries << " entries, "
                                                  << memo.hits << " hits, " << memo.misses
                                                  << " misses");
    EMBEDQL_LOG_DEBUG("cli", "GraphQL.parse: " << timing.calls << " call(s), "
                                               << timing.total_time_us << " us total, "
                                               << timing.max_time_us << " us max; cache parse time "
                                               << stats.parse_time_us << " us");
    return 0;
}

} // namespace embedql::cli
