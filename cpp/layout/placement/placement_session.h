#pragma once

#include "layout/core/types.h"
#include "layout/model/project.h"

#include <cstdint>
#include <optional>
#include <string>

namespace layout {

class IdGenerator;
class ProjectHistory;
class ViewTransform;

// Template: every placement creates a new item. Unplaced: every placement positions
// the first unplaced item with the template's name, keeping its identity.
enum class PlacementSource : std::uint8_t {
    Template = 0,
    Unplaced = 1,
};

struct PlacementSessionState {
    ItemTemplate itemTemplate;
    std::uint32_t total{0};
    std::uint32_t remaining{0};
    PlacementSource source{PlacementSource::Template};
};

// Places N copies of a template at successive click points. Every placement is its
// own history commit, so cancelling keeps what was already placed.
class PlacementSession {
public:
    PlacementSession(ProjectHistory& history, IdGenerator& ids);

    // quantity must be >= 1; replaces any session in progress.
    LayoutError start(ItemTemplate itemTemplate, std::uint32_t quantity,
                      PlacementSource source = PlacementSource::Template);
    void cancel() noexcept { state_.reset(); }

    // PlacementSessionInactive when no session is running. On success outId receives
    // the identity of the placed item; the session closes itself after the last copy.
    // An Unplaced session with no unplaced item of its name left fails with
    // UnknownIdentity and closes.
    LayoutError placeAt(const Point2& world, std::string* outId = nullptr);
    LayoutError placeAtScreen(const Point2& screen, const ViewTransform& view, std::string* outId = nullptr);

    bool isActive() const noexcept { return state_.has_value() && state_->remaining > 0; }
    std::uint32_t remaining() const noexcept { return state_ ? state_->remaining : 0; }
    std::uint32_t total() const noexcept { return state_ ? state_->total : 0; }
    const std::optional<PlacementSessionState>& state() const noexcept { return state_; }

private:
    ProjectHistory& history_;
    IdGenerator& ids_;
    std::optional<PlacementSessionState> state_;
};

} // namespace layout
