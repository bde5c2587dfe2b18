//! # Content Signatures
//!
//! 128-bit fingerprints of file and literal text. Both caches key their
//! entries on the signature of the exact content they were built from, so a
//! path that is reused with different content never serves stale data.
//!
//! Uses CRC32C (Castagnoli) from `common/crc32c.hpp`.

#ifndef EMBEDQL_SOURCE_SIGNATURE_HPP
#define EMBEDQL_SOURCE_SIGNATURE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace embedql::source {

/// 128-bit content fingerprint.
struct ContentSignature {
    uint64_t high = 0;
    uint64_t low = 0;

    bool operator==(const ContentSignature& other) const = default;
    bool operator!=(const ContentSignature& other) const = default;

    /// Returns true if this signature has not been computed yet.
    [[nodiscard]] bool is_zero() const {
        return high == 0 && low == 0;
    }

    /// Returns a 32-character hex string representation.
    [[nodiscard]] std::string to_hex() const;
};

/// Hash functor for unordered containers.
struct ContentSignatureHash {
    size_t operator()(const ContentSignature& sig) const noexcept {
        return static_cast<size_t>(sig.high ^ (sig.low * 0x9E3779B97F4A7C15ULL));
    }
};

/// Compute a signature from raw bytes.
[[nodiscard]] ContentSignature signature_bytes(const void* data, size_t len);

/// Compute a signature of a text.
[[nodiscard]] ContentSignature signature_of(std::string_view text);

} // namespace embedql::source

#endif // EMBEDQL_SOURCE_SIGNATURE_HPP
