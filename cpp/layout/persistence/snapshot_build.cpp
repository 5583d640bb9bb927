#include "layout/persistence/project_snapshot.h"
#include "layout/core/util.h"
#include "layout/persistence/snapshot_internal.h"

#include <cstring>
#include <utility>

namespace layout {
using namespace snapshot::detail;

std::vector<std::uint8_t> buildProjectSnapshotBytes(const ProjectSnapshotData& data) {
    struct SectionBytes {
        std::uint32_t tag;
        std::vector<std::uint8_t> bytes;
    };

    std::vector<SectionBytes> sections;
    sections.reserve(4);

    const Project& p = data.project;

    // PROJ
    {
        SectionBytes sec{TAG_PROJ, {}};
        SectionWriter w(sec.bytes);
        std::uint32_t flags = 0;
        if (p.jobRef) flags |= PROJ_HAS_JOB_REF;
        if (p.floorPlanRef) flags |= PROJ_HAS_FLOOR_PLAN;
        if (p.floorPlanWidth) flags |= PROJ_HAS_PLAN_WIDTH;
        if (p.floorPlanHeight) flags |= PROJ_HAS_PLAN_HEIGHT;
        if (p.scale) flags |= PROJ_HAS_SCALE;

        w.str(p.id);
        w.str(p.name);
        w.str(p.createdAt);
        w.u32(flags);
        if (p.jobRef) w.str(*p.jobRef);
        if (p.floorPlanRef) w.str(*p.floorPlanRef);
        if (p.floorPlanWidth) w.f64(*p.floorPlanWidth);
        if (p.floorPlanHeight) w.f64(*p.floorPlanHeight);
        if (p.scale) w.f64(*p.scale);
        sections.push_back(std::move(sec));
    }

    // FURN (document order is significant and kept as-is)
    {
        SectionBytes sec{TAG_FURN, {}};
        SectionWriter w(sec.bytes);
        w.u32(static_cast<std::uint32_t>(p.furniture.size()));
        for (const auto& item : p.furniture) {
            std::uint32_t flags = 0;
            if (item.productCode) flags |= ITEM_HAS_PRODUCT_CODE;
            if (item.position) flags |= ITEM_HAS_POSITION;
            if (item.installOrder) flags |= ITEM_HAS_INSTALL_ORDER;
            if (item.groupId) flags |= ITEM_HAS_GROUP;
            if (item.stackId) flags |= ITEM_HAS_STACK;
            if (item.lineNumber) flags |= ITEM_HAS_LINE_NUMBER;
            if (item.estimatedMinutes) flags |= ITEM_HAS_MINUTES;

            w.str(item.id);
            w.str(item.name);
            w.u32(flags);
            w.f64(item.widthCm);
            w.f64(item.depthCm);
            w.f64(item.rotation);
            w.str(item.roomZone);
            w.str(item.color);
            if (item.productCode) w.str(*item.productCode);
            if (item.position) {
                w.f64(item.position->x);
                w.f64(item.position->y);
            }
            if (item.installOrder) w.u32(*item.installOrder);
            if (item.groupId) w.str(*item.groupId);
            if (item.stackId) w.str(*item.stackId);
            if (item.lineNumber) w.u32(*item.lineNumber);
            if (item.estimatedMinutes) w.u32(*item.estimatedMinutes);
        }
        sections.push_back(std::move(sec));
    }

    if (data.view) {
        SectionBytes sec{TAG_VIEW, {}};
        SectionWriter w(sec.bytes);
        w.f64(data.view->scale);
        w.f64(data.view->offsetX);
        w.f64(data.view->offsetY);
        sections.push_back(std::move(sec));
    }

    if (!data.selection.empty()) {
        SectionBytes sec{TAG_SELC, {}};
        SectionWriter w(sec.bytes);
        w.u32(static_cast<std::uint32_t>(data.selection.size()));
        for (const auto& id : data.selection) w.str(id);
        sections.push_back(std::move(sec));
    }

    const std::size_t tableBytes = sections.size() * snapshotSectionEntryBytes;
    std::size_t total = snapshotHeaderBytesFpsn + tableBytes;
    for (const auto& sec : sections) total += sec.bytes.size();

    std::vector<std::uint8_t> out(total);
    writeU32LE(out.data(), 0, snapshotMagicFpsn);
    writeU32LE(out.data(), 4, snapshotVersionFpsn);
    writeU32LE(out.data(), 8, static_cast<std::uint32_t>(sections.size()));
    writeU32LE(out.data(), 12, 0);

    std::size_t offset = snapshotHeaderBytesFpsn + tableBytes;
    for (std::size_t i = 0; i < sections.size(); ++i) {
        const auto& sec = sections[i];
        const std::size_t base = snapshotHeaderBytesFpsn + i * snapshotSectionEntryBytes;
        const std::uint32_t size = static_cast<std::uint32_t>(sec.bytes.size());
        writeU32LE(out.data(), base + 0, sec.tag);
        writeU32LE(out.data(), base + 4, static_cast<std::uint32_t>(offset));
        writeU32LE(out.data(), base + 8, size);
        writeU32LE(out.data(), base + 12, crc32(sec.bytes.data(), sec.bytes.size()));
        if (size > 0) {
            std::memcpy(out.data() + offset, sec.bytes.data(), size);
        }
        offset += size;
    }
    return out;
}

} // namespace layout
