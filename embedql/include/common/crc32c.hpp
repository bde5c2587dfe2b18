//! # CRC32C Hash Utility
//!
//! CRC32C (Castagnoli polynomial, reflected form 0x82F63B78) over byte
//! buffers. Used for content signatures: fast, and good enough at detecting
//! changed text between builds.
//!
//! ```cpp
//! uint32_t h = embedql::crc32c("query Foo { id }");
//! ```

#ifndef EMBEDQL_COMMON_CRC32C_HPP
#define EMBEDQL_COMMON_CRC32C_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string_view>

namespace embedql {

namespace detail {

/// Builds the byte-wise lookup table at compile time.
constexpr auto make_crc32c_table() -> std::array<uint32_t, 256> {
    constexpr uint32_t POLY = 0x82F63B78;
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int bit = 0; bit < 8; ++bit) {
            crc = (crc & 1) ? (crc >> 1) ^ POLY : (crc >> 1);
        }
        table[i] = crc;
    }
    return table;
}

inline constexpr std::array<uint32_t, 256> CRC32C_TABLE = make_crc32c_table();

} // namespace detail

/// Computes the CRC32C of a byte buffer.
[[nodiscard]] inline uint32_t crc32c(const void* data, size_t len) noexcept {
    const auto* bytes = static_cast<const uint8_t*>(data);
    uint32_t crc = 0xFFFFFFFF;
    for (size_t i = 0; i < len; ++i) {
        crc = detail::CRC32C_TABLE[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return crc ^ 0xFFFFFFFF;
}

[[nodiscard]] inline uint32_t crc32c(std::string_view str) noexcept {
    return crc32c(str.data(), str.size());
}

} // namespace embedql

#endif // EMBEDQL_COMMON_CRC32C_HPP
