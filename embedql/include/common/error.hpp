//! # Pipeline Errors
//!
//! Error taxonomy shared by extraction, parsing and caching.
//!
//! | Kind               | Meaning                                           |
//! |--------------------|---------------------------------------------------|
//! | `Precondition`     | API misuse: unfiltered or non-existent file       |
//! | `MalformedLiteral` | Literal failed to parse or has no definitions     |
//! | `Extraction`       | Literal rejected by the tag extractor             |
//! | `IO`               | File could not be read                            |
//!
//! Errors travel as values inside `Result<T, Error>` and abort the parse of
//! the file they belong to.

#ifndef EMBEDQL_COMMON_ERROR_HPP
#define EMBEDQL_COMMON_ERROR_HPP

#include "common.hpp"

#include <optional>
#include <string>

namespace embedql {

/// Category of a pipeline error.
enum class ErrorKind {
    Precondition,     ///< Caller violated an API contract
    MalformedLiteral, ///< Embedded literal is not valid query text
    Extraction,       ///< Extractor-level validation failed
    IO                ///< Filesystem failure
};

/// Returns the display name of an error kind (e.g. "malformed literal").
[[nodiscard]] auto error_kind_name(ErrorKind kind) -> const char*;

/// An error produced anywhere in the pipeline.
struct Error {
    ErrorKind kind = ErrorKind::IO;
    std::string message;
    std::string file;                       ///< Relative path, when known
    std::optional<SourceLocation> location; ///< Position in the host file

    /// Formats as `file:line:col: kind: message`, dropping absent parts.
    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] static auto precondition(std::string message, std::string file = {}) -> Error;
    [[nodiscard]] static auto malformed(std::string message, std::string file,
                                        std::optional<SourceLocation> location = std::nullopt)
        -> Error;
    [[nodiscard]] static auto extraction(std::string message, std::string file,
                                         std::optional<SourceLocation> location = std::nullopt)
        -> Error;
    [[nodiscard]] static auto io(std::string message, std::string file) -> Error;
};

} // namespace embedql

#endif // EMBEDQL_COMMON_ERROR_HPP
