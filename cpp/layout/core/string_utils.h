#pragma once

#include <cstdint>
#include <cstring>
#include <cmath>
#include <cctype>
#include <string>
#include <string_view>

namespace layout {

// =============================================================================
// Text helpers
// =============================================================================

inline std::string_view trimView(std::string_view s) {
    std::size_t begin = 0;
    std::size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

inline std::string trimCopy(std::string_view s) {
    return std::string(trimView(s));
}

inline std::string toLowerCopy(std::string_view s) {
    std::string out(s);
    for (char& c : out) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

// Case-insensitive ordering; names equal ignoring case fall back to byte order.
inline bool nameLess(std::string_view a, std::string_view b) {
    const std::size_t n = a.size() < b.size() ? a.size() : b.size();
    for (std::size_t i = 0; i < n; ++i) {
        const int ca = std::tolower(static_cast<unsigned char>(a[i]));
        const int cb = std::tolower(static_cast<unsigned char>(b[i]));
        if (ca != cb) return ca < cb;
    }
    if (a.size() != b.size()) return a.size() < b.size();
    return a < b;
}

// Java-style 32-bit string hash (h = c + (h << 5) - h), wrapping.
inline std::int32_t nameHash32(std::string_view s) {
    std::uint32_t h = 0;
    for (const char c : s) {
        h = static_cast<std::uint32_t>(static_cast<unsigned char>(c)) + ((h << 5) - h);
    }
    return static_cast<std::int32_t>(h);
}

// =============================================================================
// Digest helpers (FNV-1a 64)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::uint64_t hashString(std::uint64_t h, std::string_view s) {
    h = hashU32(h, static_cast<std::uint32_t>(s.size()));
    if (s.empty()) return h;
    return hashBytes(h, reinterpret_cast<const std::uint8_t*>(s.data()), s.size());
}

inline std::uint64_t canonicalizeF64(double v) {
    if (std::isnan(v)) return 0x7ff8000000000000ull;
    if (v == 0.0) return 0; // -0 and +0 hash the same
    std::uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF64(std::uint64_t h, double v) {
    const std::uint64_t bits = canonicalizeF64(v);
    h = hashU32(h, static_cast<std::uint32_t>(bits & 0xFFFFFFFFu));
    return hashU32(h, static_cast<std::uint32_t>(bits >> 32));
}

} // namespace layout
