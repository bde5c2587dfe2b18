//! # Source Files
//!
//! `File` is what the build/watch layer hands to the pipeline: a path
//! relative to a base directory, optionally with a signature it already
//! computed, and whether the file still exists.

#ifndef EMBEDQL_SOURCE_FILE_HPP
#define EMBEDQL_SOURCE_FILE_HPP

#include "source/signature.hpp"

#include <optional>
#include <string>

namespace embedql::source {

struct File {
    std::string rel_path;                 ///< Identity within the base directory
    std::optional<ContentSignature> hash; ///< Precomputed by the watch layer
    bool exists = true;                   ///< False once the file was deleted
};

} // namespace embedql::source

#endif // EMBEDQL_SOURCE_FILE_HPP
