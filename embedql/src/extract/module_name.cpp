#include "extract/module_name.hpp"

#include "graphql/parser.hpp"

#include <cctype>
#include <filesystem>

namespace embedql::extract {

namespace {

bool is_alnum(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

bool is_word(char c) {
    return is_alnum(c) || c == '_';
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.size() >= prefix.size() && s.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view s, std::string_view suffix) {
    return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

/// Removes the first run of `.ext` segments: "Foo.react" -> "Foo".
std::string strip_inner_extensions(const std::string& name) {
    for (size_t i = 0; i + 1 < name.size(); ++i) {
        if (name[i] != '.' || !is_word(name[i + 1])) {
            continue;
        }
        size_t end = i;
        while (end + 1 < name.size() && name[end] == '.' && is_word(name[end + 1])) {
            ++end;
            while (end < name.size() && is_word(name[end])) {
                ++end;
            }
        }
        return name.substr(0, i) + name.substr(end);
    }
    return name;
}

} // namespace

auto module_name_for(std::string_view rel_path) -> std::string {
    std::filesystem::path path{std::string(rel_path)};

    // index.js.flow -> index.js -> index
    std::string filename = strip_inner_extensions(path.stem().string());
    std::string raw = filename == "index" ? path.parent_path().filename().string() : filename;

    // foo-bar -> fooBar, my_module -> myModule
    std::string name;
    name.reserve(raw.size());
    for (size_t i = 0; i < raw.size();) {
        if (is_alnum(raw[i])) {
            name += raw[i++];
            continue;
        }
        while (i < raw.size() && !is_alnum(raw[i])) {
            ++i;
        }
        if (i < raw.size()) {
            name += static_cast<char>(std::toupper(static_cast<unsigned char>(raw[i++])));
        }
    }
    return name;
}

auto validate_literal_names(const LiteralSpan& span, const std::string& module_name)
    -> std::optional<Error> {
    graphql::Source source(span.text, span.file, span.start);
    auto parsed = graphql::parse(source);
    if (is_err(parsed)) {
        return std::nullopt;
    }

    for (const auto& def : unwrap(parsed).definitions) {
        auto name = def.name();
        if (!name) {
            return Error::extraction("In module `" + module_name + "`, a definition of kind `" +
                                         def.kind_name() + "` requires a name.",
                                     span.file, def.loc());
        }

        if (def.is_operation()) {
            if (!starts_with(*name, module_name) ||
                !(ends_with(*name, "Query") || ends_with(*name, "Mutation") ||
                  ends_with(*name, "Subscription"))) {
                return Error::extraction(
                    "Operation names in graphql tags must be prefixed with the module name and "
                    "end in \"Mutation\", \"Query\", or \"Subscription\". Got `" +
                        *name + "` in module `" + module_name + "`.",
                    span.file, def.loc());
            }
        } else if (span.key_name) {
            std::string expected = module_name + "_" + *span.key_name;
            if (*name != expected) {
                return Error::extraction("Container fragment names must be "
                                         "`<ModuleName>_<propName>`. Got `" +
                                             *name + "`, expected `" + expected + "`.",
                                         span.file, def.loc());
            }
        } else if (!starts_with(*name, module_name)) {
            return Error::extraction("Fragment names in graphql tags must be prefixed with the "
                                     "module name. Got `" +
                                         *name + "` in module `" + module_name + "`.",
                                     span.file, def.loc());
        }
    }
    return std::nullopt;
}

} // namespace embedql::extract
