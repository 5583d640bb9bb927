#include "layout/persistence/project_snapshot.h"
#include "layout/core/logging.h"
#include "layout/core/util.h"
#include "layout/persistence/snapshot_internal.h"

#include <cmath>
#include <unordered_map>

namespace {
struct SectionView {
    const std::uint8_t* data{nullptr};
    std::uint32_t size{0};
};
} // namespace

namespace layout {
using namespace snapshot::detail;

namespace {

bool readProject(const SectionView& sec, Project& p) {
    SectionReader r(sec.data, sec.size);
    std::uint32_t flags = 0;
    if (!r.str(p.id) || !r.str(p.name) || !r.str(p.createdAt) || !r.u32(flags)) return false;

    if (flags & PROJ_HAS_JOB_REF) {
        std::string s;
        if (!r.str(s)) return false;
        p.jobRef = std::move(s);
    }
    if (flags & PROJ_HAS_FLOOR_PLAN) {
        std::string s;
        if (!r.str(s)) return false;
        p.floorPlanRef = std::move(s);
    }
    if (flags & PROJ_HAS_PLAN_WIDTH) {
        double v = 0.0;
        if (!r.f64(v)) return false;
        p.floorPlanWidth = v;
    }
    if (flags & PROJ_HAS_PLAN_HEIGHT) {
        double v = 0.0;
        if (!r.f64(v)) return false;
        p.floorPlanHeight = v;
    }
    if (flags & PROJ_HAS_SCALE) {
        double v = 0.0;
        if (!r.f64(v)) return false;
        p.scale = v;
    }
    return r.atEnd();
}

bool readItem(SectionReader& r, FurnitureItem& item) {
    std::uint32_t flags = 0;
    if (!r.str(item.id) || !r.str(item.name) || !r.u32(flags)) return false;
    if (!r.f64(item.widthCm) || !r.f64(item.depthCm) || !r.f64(item.rotation)) return false;
    if (!r.str(item.roomZone) || !r.str(item.color)) return false;

    if (flags & ITEM_HAS_PRODUCT_CODE) {
        std::string s;
        if (!r.str(s)) return false;
        item.productCode = std::move(s);
    }
    if (flags & ITEM_HAS_POSITION) {
        Point2 pos{};
        if (!r.f64(pos.x) || !r.f64(pos.y)) return false;
        item.position = pos;
    }
    if (flags & ITEM_HAS_INSTALL_ORDER) {
        std::uint32_t v = 0;
        if (!r.u32(v)) return false;
        item.installOrder = v;
    }
    if (flags & ITEM_HAS_GROUP) {
        std::string s;
        if (!r.str(s)) return false;
        item.groupId = std::move(s);
    }
    if (flags & ITEM_HAS_STACK) {
        std::string s;
        if (!r.str(s)) return false;
        item.stackId = std::move(s);
    }
    if (flags & ITEM_HAS_LINE_NUMBER) {
        std::uint32_t v = 0;
        if (!r.u32(v)) return false;
        item.lineNumber = v;
    }
    if (flags & ITEM_HAS_MINUTES) {
        std::uint32_t v = 0;
        if (!r.u32(v)) return false;
        item.estimatedMinutes = v;
    }
    return true;
}

} // namespace

LayoutError parseProjectSnapshot(const std::uint8_t* src, std::uint32_t byteCount, ProjectSnapshotData& out) {
    if (!src || byteCount < snapshotHeaderBytesFpsn) {
        return LayoutError::BufferTruncated;
    }

    const std::uint32_t magic = readU32(src, 0);
    if (magic != snapshotMagicFpsn) return LayoutError::InvalidMagic;

    const std::uint32_t version = readU32(src, 4);
    if (version != snapshotVersionFpsn) return LayoutError::UnsupportedVersion;
    out.version = version;

    const std::uint32_t sectionCount = readU32(src, 8);
    const std::size_t headerBytes = snapshotHeaderBytesFpsn;
    std::size_t tableBytes = 0;
    if (!tryMul(static_cast<std::size_t>(sectionCount), snapshotSectionEntryBytes, tableBytes)) {
        return LayoutError::InvalidPayloadSize;
    }
    std::size_t headerPlusTable = 0;
    if (!tryAdd(headerBytes, tableBytes, headerPlusTable)) {
        return LayoutError::InvalidPayloadSize;
    }
    if (byteCount < headerPlusTable) {
        return LayoutError::BufferTruncated;
    }

    std::unordered_map<std::uint32_t, SectionView> sections;
    sections.reserve(sectionCount);

    for (std::uint32_t i = 0; i < sectionCount; ++i) {
        const std::size_t base = headerBytes + i * snapshotSectionEntryBytes;
        const std::uint32_t tag = readU32(src, base + 0);
        const std::uint32_t offset = readU32(src, base + 4);
        const std::uint32_t size = readU32(src, base + 8);
        const std::uint32_t expectedCrc = readU32(src, base + 12);

        std::size_t end = 0;
        if (!tryAdd(static_cast<std::size_t>(offset), static_cast<std::size_t>(size), end)) {
            return LayoutError::InvalidPayloadSize;
        }
        if (offset < headerPlusTable) return LayoutError::InvalidPayloadSize;
        if (end > byteCount) return LayoutError::BufferTruncated;

        const std::uint8_t* payload = src + offset;
        if (crc32(payload, size) != expectedCrc) return LayoutError::InvalidPayloadSize;

        if (sections.find(tag) == sections.end()) {
            sections.emplace(tag, SectionView{payload, size});
        }
    }

    const auto findSection = [&](std::uint32_t tag) -> const SectionView* {
        auto it = sections.find(tag);
        if (it == sections.end()) return nullptr;
        return &it->second;
    };

    const SectionView* proj = findSection(TAG_PROJ);
    const SectionView* furn = findSection(TAG_FURN);
    const SectionView* view = findSection(TAG_VIEW);
    const SectionView* selc = findSection(TAG_SELC);
    if (!proj || !furn) {
        return LayoutError::InvalidPayloadSize;
    }

    out.project = Project{};
    if (!readProject(*proj, out.project)) return LayoutError::BufferTruncated;

    // FURN
    {
        SectionReader r(furn->data, furn->size);
        std::uint32_t count = 0;
        if (!r.u32(count)) return LayoutError::BufferTruncated;
        out.project.furniture.clear();
        for (std::uint32_t i = 0; i < count; ++i) {
            FurnitureItem item;
            if (!readItem(r, item)) return LayoutError::BufferTruncated;
            out.project.furniture.push_back(std::move(item));
        }
        if (!r.atEnd()) return LayoutError::InvalidPayloadSize;
    }

    out.view.reset();
    if (view) {
        if (view->size != viewSnapshotBytes) return LayoutError::InvalidPayloadSize;
        ViewTransformState state{};
        state.scale = readF64(view->data, 0);
        state.offsetX = readF64(view->data, 8);
        state.offsetY = readF64(view->data, 16);
        if (!std::isfinite(state.scale) || state.scale <= 0.0
            || !std::isfinite(state.offsetX) || !std::isfinite(state.offsetY)) {
            return LayoutError::InvalidSnapshot;
        }
        out.view = state;
    }

    out.selection.clear();
    if (selc) {
        SectionReader r(selc->data, selc->size);
        std::uint32_t count = 0;
        if (!r.u32(count)) return LayoutError::BufferTruncated;
        for (std::uint32_t i = 0; i < count; ++i) {
            std::string id;
            if (!r.str(id)) return LayoutError::BufferTruncated;
            out.selection.push_back(std::move(id));
        }
    }

    const ValidationResult check = validateProject(out.project);
    if (!check.ok()) {
        LAYOUT_LOG_WARN("snapshot: project rejected (%s)", check.message.c_str());
        return LayoutError::InvalidSnapshot;
    }
    return LayoutError::Ok;
}

} // namespace layout
