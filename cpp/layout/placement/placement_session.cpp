#include "layout/placement/placement_session.h"
#include "layout/core/id_generator.h"
#include "layout/core/logging.h"
#include "layout/history/project_history.h"
#include "layout/view/view_transform.h"

#include <utility>

namespace layout {

PlacementSession::PlacementSession(ProjectHistory& history, IdGenerator& ids)
    : history_(history), ids_(ids) {}

LayoutError PlacementSession::start(ItemTemplate itemTemplate, std::uint32_t quantity, PlacementSource source) {
    if (quantity < 1) return LayoutError::InvalidOperation;
    state_ = PlacementSessionState{std::move(itemTemplate), quantity, quantity, source};
    LAYOUT_LOG_DEBUG("placement: start '%s' x%u", state_->itemTemplate.name.c_str(), quantity);
    return LayoutError::Ok;
}

LayoutError PlacementSession::placeAt(const Point2& world, std::string* outId) {
    if (!isActive()) {
        LAYOUT_LOG_DEBUG("placement: placeAt without an active session");
        return LayoutError::PlacementSessionInactive;
    }

    Project next = history_.current();
    std::string id;
    if (state_->source == PlacementSource::Unplaced) {
        FurnitureItem* target = nullptr;
        for (auto& item : next.furniture) {
            if (!item.isPlaced() && item.name == state_->itemTemplate.name) {
                target = &item;
                break;
            }
        }
        if (!target) {
            LAYOUT_LOG_DEBUG("placement: no unplaced '%s' left", state_->itemTemplate.name.c_str());
            state_.reset();
            return LayoutError::UnknownIdentity;
        }
        target->position = world;
        target->rotation = 0.0;
        id = target->id;
    } else {
        FurnitureItem item = itemFromTemplate(state_->itemTemplate, ids_.next("furn"), world);
        id = item.id;
        next.furniture.push_back(std::move(item));
    }
    const LayoutError err = history_.commit(std::move(next));
    if (err != LayoutError::Ok) return err;

    if (outId) *outId = id;
    // The history listener may have cancelled the session (Escape inside a callback).
    if (state_) {
        state_->remaining -= 1;
        if (state_->remaining == 0) state_.reset();
    }
    return LayoutError::Ok;
}

LayoutError PlacementSession::placeAtScreen(const Point2& screen, const ViewTransform& view, std::string* outId) {
    return placeAt(view.screenToWorld(screen), outId);
}

} // namespace layout
