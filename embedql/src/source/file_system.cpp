#include "source/file_system.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace embedql::source {

auto DiskFileSystem::read_text(const std::string& base_dir, const std::string& rel_path)
    -> Result<std::string, Error> {
    fs::path path = fs::path(base_dir) / rel_path;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return Error::io("No such file: " + path.string(), rel_path);
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error::io("Cannot open file: " + path.string(), rel_path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    if (file.bad()) {
        return Error::io("Failed to read file: " + path.string(), rel_path);
    }
    return ss.str();
}

auto DiskFileSystem::exists(const std::string& base_dir, const std::string& rel_path) -> bool {
    std::error_code ec;
    return fs::exists(fs::path(base_dir) / rel_path, ec);
}

} // namespace embedql::source
