// Project digest: stable 64-bit fingerprint of a snapshot.
// Field order here is part of the digest; append new fields at the end of a record.

#include "layout/model/project.h"
#include "layout/core/string_utils.h"

namespace layout {

namespace {

std::uint64_t hashOptString(std::uint64_t h, const std::optional<std::string>& v) {
    h = hashU32(h, v ? 1u : 0u);
    return v ? hashString(h, *v) : h;
}

std::uint64_t hashOptU32(std::uint64_t h, const std::optional<std::uint32_t>& v) {
    h = hashU32(h, v ? 1u : 0u);
    return v ? hashU32(h, *v) : h;
}

std::uint64_t hashOptF64(std::uint64_t h, const std::optional<double>& v) {
    h = hashU32(h, v ? 1u : 0u);
    return v ? hashF64(h, *v) : h;
}

} // namespace

std::uint64_t projectDigest(const Project& project) {
    std::uint64_t h = kDigestOffset;

    h = hashU32(h, 0x4E414C50u); // "PLAN" marker
    h = hashString(h, project.id);
    h = hashString(h, project.name);
    h = hashString(h, project.createdAt);
    h = hashOptString(h, project.jobRef);
    h = hashOptString(h, project.floorPlanRef);
    h = hashOptF64(h, project.floorPlanWidth);
    h = hashOptF64(h, project.floorPlanHeight);
    h = hashOptF64(h, project.scale);

    h = hashU32(h, static_cast<std::uint32_t>(project.furniture.size()));
    for (const auto& item : project.furniture) {
        h = hashString(h, item.id);
        h = hashString(h, item.name);
        h = hashOptString(h, item.productCode);
        h = hashF64(h, item.widthCm);
        h = hashF64(h, item.depthCm);
        h = hashU32(h, item.position ? 1u : 0u);
        if (item.position) {
            h = hashF64(h, item.position->x);
            h = hashF64(h, item.position->y);
        }
        h = hashF64(h, item.rotation);
        h = hashString(h, item.roomZone);
        h = hashString(h, item.color);
        h = hashOptU32(h, item.installOrder);
        h = hashOptString(h, item.groupId);
        h = hashOptString(h, item.stackId);
        h = hashOptU32(h, item.lineNumber);
        h = hashOptU32(h, item.estimatedMinutes);
    }
    return h;
}

} // namespace layout
