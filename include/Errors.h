#pragma once

#include <stdexcept>
#include <string>

namespace ringsim {

// Raised when an operation names a fighter id that is not part of the fight
// or has not been registered with a per-fighter manager.
class InvalidFighterReference : public std::out_of_range {
public:
    explicit InvalidFighterReference(const std::string& fighter_id)
        : std::out_of_range("unknown fighter id: '" + fighter_id + "'"), fighter_id_(fighter_id) {}

    const std::string& fighterId() const noexcept { return fighter_id_; }

private:
    std::string fighter_id_;
};

// Raised when a primary state change is not in the fighter transition table.
class InvalidStateTransition : public std::logic_error {
public:
    explicit InvalidStateTransition(const std::string& what) : std::logic_error(what) {}
};

} // namespace ringsim
