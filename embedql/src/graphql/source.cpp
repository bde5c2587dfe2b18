#include "graphql/source.hpp"

#include <algorithm>

namespace embedql::graphql {

Source::Source(std::string body, std::string name, SourceLocation location_offset)
    : body_(std::move(body)), name_(std::move(name)), location_offset_(location_offset) {
    line_starts_.push_back(0);
    for (size_t i = 0; i < body_.size(); ++i) {
        // \r\n counts once; a lone \r is a line terminator too
        if (body_[i] == '\n' || (body_[i] == '\r' && at(i + 1) != '\n')) {
            line_starts_.push_back(i + 1);
        }
    }
}

auto Source::location(size_t offset) const -> SourceLocation {
    offset = std::min(offset, body_.size());

    auto it = std::upper_bound(line_starts_.begin(), line_starts_.end(), offset);
    auto line_index = static_cast<uint32_t>(std::distance(line_starts_.begin(), it) - 1);
    auto column = static_cast<uint32_t>(offset - line_starts_[line_index]) + 1;

    SourceLocation loc;
    loc.line = location_offset_.line + line_index;
    // Only the first line of the body shares its row with host text
    loc.column = line_index == 0 ? location_offset_.column + column - 1 : column;
    loc.offset = location_offset_.offset + static_cast<uint32_t>(offset);
    return loc;
}

} // namespace embedql::graphql
