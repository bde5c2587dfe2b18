#include "source/signature.hpp"

#include "common/crc32c.hpp"

namespace embedql::source {

std::string ContentSignature::to_hex() const {
    static constexpr char HEX[] = "0123456789abcdef";
    char buf[33];
    uint64_t vals[2] = {high, low};
    for (int v = 0; v < 2; ++v) {
        uint64_t val = vals[v];
        for (int i = 15; i >= 0; --i) {
            buf[v * 16 + i] = HEX[val & 0xF];
            val >>= 4;
        }
    }
    buf[32] = '\0';
    return std::string(buf);
}

ContentSignature signature_bytes(const void* data, size_t len) {
    // Empty text still needs a non-zero signature: zero means "not computed"
    static constexpr uint32_t SALT = 0x9E3779B9;
    if (!data || len == 0) {
        return {1, SALT};
    }

    const auto* bytes = static_cast<const uint8_t*>(data);
    size_t half = len / 2;

    // High: CRC32C of first half combined with length
    uint32_t crc_high = embedql::crc32c(bytes, half > 0 ? half : len);
    uint64_t hi = (static_cast<uint64_t>(crc_high) << 32) | static_cast<uint64_t>(len & 0xFFFFFFFF);

    // Low: CRC32C of second half combined with a salt
    uint32_t crc_low = embedql::crc32c(bytes + half, len - half);
    uint64_t lo = (static_cast<uint64_t>(crc_low) << 32) |
                  static_cast<uint64_t>(SALT ^ static_cast<uint32_t>(len >> 1));

    return {hi, lo};
}

ContentSignature signature_of(std::string_view text) {
    return signature_bytes(text.data(), text.size());
}

} // namespace embedql::source
