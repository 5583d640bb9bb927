#pragma once

#include <functional>
#include <utility>

namespace layout {

// Scoped pointer capture for one drag gesture. The hook is told true on acquisition
// and false exactly once on release; destruction releases.
class PointerCapture {
public:
    using Hook = std::function<void(bool captured)>;

    PointerCapture() = default;
    explicit PointerCapture(Hook hook) : hook_(std::move(hook)), active_(true) {
        if (hook_) hook_(true);
    }

    PointerCapture(const PointerCapture&) = delete;
    PointerCapture& operator=(const PointerCapture&) = delete;

    PointerCapture(PointerCapture&& other) noexcept
        : hook_(std::move(other.hook_)), active_(other.active_) {
        other.active_ = false;
    }

    PointerCapture& operator=(PointerCapture&& other) noexcept {
        if (this != &other) {
            release();
            hook_ = std::move(other.hook_);
            active_ = other.active_;
            other.active_ = false;
        }
        return *this;
    }

    ~PointerCapture() { release(); }

    void release() {
        if (!active_) return;
        active_ = false;
        if (hook_) hook_(false);
    }

    bool active() const noexcept { return active_; }

private:
    Hook hook_;
    bool active_ = false;
};

} // namespace layout
