#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace layout {

// Produces fresh identities for items, stacks and groups.
// Identities look like "<prefix>_<stamp>_<counter>"; the counter alone guarantees
// uniqueness within one engine, the stamp keeps identities unique across sessions.
class IdGenerator {
public:
    using Clock = std::function<double()>;

    IdGenerator();
    explicit IdGenerator(Clock clock);

    std::string next(const char* prefix);

    void reset() noexcept { counter_ = 0; }
    std::uint64_t issued() const noexcept { return counter_; }

private:
    Clock clock_;
    std::uint64_t counter_ = 0;
};

} // namespace layout
