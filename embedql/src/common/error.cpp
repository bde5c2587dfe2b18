#include "common/error.hpp"

#include <sstream>

namespace embedql {

auto error_kind_name(ErrorKind kind) -> const char* {
    switch (kind) {
    case ErrorKind::Precondition:
        return "precondition violation";
    case ErrorKind::MalformedLiteral:
        return "malformed literal";
    case ErrorKind::Extraction:
        return "extraction error";
    case ErrorKind::IO:
        return "io error";
    }
    return "error";
}

auto Error::to_string() const -> std::string {
    std::ostringstream oss;
    if (!file.empty()) {
        oss << file;
        if (location) {
            oss << ":" << location->line << ":" << location->column;
        }
        oss << ": ";
    }
    oss << error_kind_name(kind) << ": " << message;
    return oss.str();
}

auto Error::precondition(std::string message, std::string file) -> Error {
    return Error{ErrorKind::Precondition, std::move(message), std::move(file), std::nullopt};
}

auto Error::malformed(std::string message, std::string file,
                      std::optional<SourceLocation> location) -> Error {
    return Error{ErrorKind::MalformedLiteral, std::move(message), std::move(file), location};
}

auto Error::extraction(std::string message, std::string file,
                       std::optional<SourceLocation> location) -> Error {
    return Error{ErrorKind::Extraction, std::move(message), std::move(file), location};
}

auto Error::io(std::string message, std::string file) -> Error {
    return Error{ErrorKind::IO, std::move(message), std::move(file), std::nullopt};
}

} // namespace embedql
