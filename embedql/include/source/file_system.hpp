//! # File System
//!
//! Read access to project files. The pipeline never touches the disk
//! directly; it goes through a `FileSystem` so tests can serve files from
//! memory and count reads.

#ifndef EMBEDQL_SOURCE_FILE_SYSTEM_HPP
#define EMBEDQL_SOURCE_FILE_SYSTEM_HPP

#include "common.hpp"
#include "common/error.hpp"

#include <string>

namespace embedql::source {

class FileSystem {
public:
    virtual ~FileSystem() = default;

    /// Reads `base_dir/rel_path`. Fails with `ErrorKind::IO` when the file
    /// is missing or unreadable. Must be safe to call concurrently.
    [[nodiscard]] virtual auto read_text(const std::string& base_dir,
                                         const std::string& rel_path)
        -> Result<std::string, Error> = 0;

    [[nodiscard]] virtual auto exists(const std::string& base_dir, const std::string& rel_path)
        -> bool = 0;
};

/// Reads files from the local disk.
class DiskFileSystem : public FileSystem {
public:
    [[nodiscard]] auto read_text(const std::string& base_dir, const std::string& rel_path)
        -> Result<std::string, Error> override;

    [[nodiscard]] auto exists(const std::string& base_dir, const std::string& rel_path)
        -> bool override;
};

} // namespace embedql::source

#endif // EMBEDQL_SOURCE_FILE_SYSTEM_HPP
