#ifndef LAYOUT_CORE_UTIL_H
#define LAYOUT_CORE_UTIL_H

#include <cstdint>
#include <cstddef>
#include <cstring>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native builds and tests
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(system_clock::now().time_since_epoch()).count();
}
#endif

namespace layout {

static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline double readF64(const std::uint8_t* src, std::size_t offset) noexcept {
    double v;
    std::memcpy(&v, src + offset, sizeof(v));
    return v;
}

static inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

static inline void writeF64LE(std::uint8_t* dst, std::size_t offset, double v) noexcept {
    std::memcpy(dst + offset, &v, sizeof(v));
}

} // namespace layout

#endif // LAYOUT_CORE_UTIL_H
