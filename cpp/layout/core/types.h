#pragma once

#include <cstdint>
#include <cstddef>

// Lightweight types shared by every layout component.

namespace layout {

struct Point2 {
    double x;
    double y;
};

// Axis-aligned box in world units. min <= max is not enforced; use normalizedRect().
struct Rect2 {
    double minX;
    double minY;
    double maxX;
    double maxY;
};

inline Rect2 normalizedRect(const Point2& a, const Point2& b) {
    return Rect2{
        a.x < b.x ? a.x : b.x,
        a.y < b.y ? a.y : b.y,
        a.x < b.x ? b.x : a.x,
        a.y < b.y ? b.y : a.y,
    };
}

// Open-interval overlap on both axes: touching edges do not intersect.
inline bool rectsOverlap(const Rect2& a, const Rect2& b) {
    return a.minX < b.maxX && a.maxX > b.minX
        && a.minY < b.maxY && a.maxY > b.minY;
}

inline bool rectContains(const Rect2& r, const Point2& p) {
    return p.x >= r.minX && p.x <= r.maxX && p.y >= r.minY && p.y <= r.maxY;
}

// Status values returned by engine operations. Only Ok means state may have changed.
enum class LayoutError : std::uint32_t {
    Ok = 0,
    InvalidCalibrationInput = 1,
    PlacementSessionInactive = 2,
    HistoryBoundary = 3,
    UnknownIdentity = 4,
    InvalidSnapshot = 5,
    InvalidOperation = 6,
    ScaleRequired = 7,
    InvalidImportRecord = 8,
    BufferTruncated = 9,
    InvalidMagic = 10,
    UnsupportedVersion = 11,
    InvalidPayloadSize = 12,
};

const char* layoutErrorName(LayoutError error) noexcept;

// Snapshot container constants (FPSN v1)
static constexpr std::uint32_t snapshotMagicFpsn = 0x4E535046; // "FPSN"
static constexpr std::uint32_t snapshotVersionFpsn = 1;
static constexpr std::size_t snapshotHeaderBytesFpsn = 4 * 4; // magic + version + sectionCount + reserved
static constexpr std::size_t snapshotSectionEntryBytes = 4 * 4; // tag + offset + size + crc32

} // namespace layout
