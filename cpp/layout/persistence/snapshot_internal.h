#pragma once

#include "layout/core/util.h"

#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <vector>

namespace layout::snapshot::detail {

constexpr std::uint32_t fourCC(char a, char b, char c, char d) {
    return static_cast<std::uint32_t>(a)
        | (static_cast<std::uint32_t>(b) << 8)
        | (static_cast<std::uint32_t>(c) << 16)
        | (static_cast<std::uint32_t>(d) << 24);
}

constexpr std::uint32_t TAG_PROJ = fourCC('P', 'R', 'O', 'J');
constexpr std::uint32_t TAG_FURN = fourCC('F', 'U', 'R', 'N');
constexpr std::uint32_t TAG_VIEW = fourCC('V', 'I', 'E', 'W');
constexpr std::uint32_t TAG_SELC = fourCC('S', 'E', 'L', 'C');

constexpr std::uint32_t PROJ_HAS_JOB_REF = 1u << 0;
constexpr std::uint32_t PROJ_HAS_FLOOR_PLAN = 1u << 1;
constexpr std::uint32_t PROJ_HAS_PLAN_WIDTH = 1u << 2;
constexpr std::uint32_t PROJ_HAS_PLAN_HEIGHT = 1u << 3;
constexpr std::uint32_t PROJ_HAS_SCALE = 1u << 4;

constexpr std::uint32_t ITEM_HAS_PRODUCT_CODE = 1u << 0;
constexpr std::uint32_t ITEM_HAS_POSITION = 1u << 1;
constexpr std::uint32_t ITEM_HAS_INSTALL_ORDER = 1u << 2;
constexpr std::uint32_t ITEM_HAS_GROUP = 1u << 3;
constexpr std::uint32_t ITEM_HAS_STACK = 1u << 4;
constexpr std::uint32_t ITEM_HAS_LINE_NUMBER = 1u << 5;
constexpr std::uint32_t ITEM_HAS_MINUTES = 1u << 6;

constexpr std::size_t viewSnapshotBytes = 3 * 8;

inline std::uint32_t crc32(const std::uint8_t* bytes, std::size_t len) {
    static std::uint32_t table[256];
    static bool tableReady = false;
    if (!tableReady) {
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            table[i] = c;
        }
        tableReady = true;
    }

    std::uint32_t crc = 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return (crc ^ 0xFFFFFFFFu);
}

inline bool tryAdd(std::size_t a, std::size_t b, std::size_t& out) {
    if (a > (std::numeric_limits<std::size_t>::max() - b)) return false;
    out = a + b;
    return true;
}

inline bool tryMul(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) {
        out = 0;
        return true;
    }
    if (a > (std::numeric_limits<std::size_t>::max() / b)) return false;
    out = a * b;
    return true;
}

inline bool requireBytes(std::size_t offset, std::size_t size, std::size_t total) {
    if (offset > total) return false;
    return size <= (total - offset);
}

// Bounds-checked cursor over one section payload.
class SectionReader {
public:
    SectionReader(const std::uint8_t* data, std::size_t size) : data_(data), size_(size) {}

    bool u32(std::uint32_t& v) {
        if (!requireBytes(o_, 4, size_)) return false;
        v = readU32(data_, o_);
        o_ += 4;
        return true;
    }

    bool f64(double& v) {
        if (!requireBytes(o_, 8, size_)) return false;
        v = readF64(data_, o_);
        o_ += 8;
        return true;
    }

    bool str(std::string& s) {
        std::uint32_t len = 0;
        if (!u32(len)) return false;
        if (!requireBytes(o_, len, size_)) return false;
        s.assign(reinterpret_cast<const char*>(data_ + o_), len);
        o_ += len;
        return true;
    }

    bool atEnd() const noexcept { return o_ == size_; }

private:
    const std::uint8_t* data_;
    std::size_t size_;
    std::size_t o_{0};
};

class SectionWriter {
public:
    explicit SectionWriter(std::vector<std::uint8_t>& out) : out_(out) {}

    void u32(std::uint32_t v) {
        const std::size_t o = out_.size();
        out_.resize(o + 4);
        writeU32LE(out_.data(), o, v);
    }

    void f64(double v) {
        const std::size_t o = out_.size();
        out_.resize(o + 8);
        writeF64LE(out_.data(), o, v);
    }

    void str(const std::string& s) {
        u32(static_cast<std::uint32_t>(s.size()));
        out_.insert(out_.end(), s.begin(), s.end());
    }

private:
    std::vector<std::uint8_t>& out_;
};

} // namespace layout::snapshot::detail
