//! # Module Naming Convention
//!
//! Definitions embedded in a host file are named after the file's module:
//!
//! | Path                        | Module name  |
//! |-----------------------------|--------------|
//! | `src/FooBar.js`             | `FooBar`     |
//! | `src/Foo.react.js`          | `Foo`        |
//! | `src/button/index.js`       | `button`     |
//! | `src/my-module.ts`          | `myModule`   |
//!
//! Operations must be called `<Module>...Query|Mutation|Subscription`,
//! fragments `<Module>...`, and fragments bound to a container property
//! `k` exactly `<Module>_k`.

#ifndef EMBEDQL_EXTRACT_MODULE_NAME_HPP
#define EMBEDQL_EXTRACT_MODULE_NAME_HPP

#include "common/error.hpp"
#include "extract/tag_extractor.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace embedql::extract {

/// Derives the module name from a file path.
[[nodiscard]] auto module_name_for(std::string_view rel_path) -> std::string;

/// Checks every definition of `span` against the naming convention for
/// `module_name`. Returns the first violation, or nullopt. A literal that
/// does not parse is not checked here; the parse stage reports it.
[[nodiscard]] auto validate_literal_names(const LiteralSpan& span, const std::string& module_name)
    -> std::optional<Error>;

} // namespace embedql::extract

#endif // EMBEDQL_EXTRACT_MODULE_NAME_HPP
