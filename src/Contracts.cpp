#include "Contracts.h"

namespace ringsim {

const char* toString(ActionType a) {
    switch (a) {
        case ActionType::None:        return "none";
        case ActionType::Punch:       return "punch";
        case ActionType::Combination: return "combination";
        case ActionType::Block:       return "block";
        case ActionType::Evade:       return "evade";
        case ActionType::Move:        return "move";
        case ActionType::Clinch:      return "clinch";
        case ActionType::Wait:        return "wait";
    }
    return "unknown";
}

const char* toString(MoveDirection d) {
    switch (d) {
        case MoveDirection::None:     return "none";
        case MoveDirection::Forward:  return "forward";
        case MoveDirection::Backward: return "backward";
        case MoveDirection::Left:     return "left";
        case MoveDirection::Right:    return "right";
    }
    return "unknown";
}

const char* toString(PunchResult r) {
    switch (r) {
        case PunchResult::Hit:     return "hit";
        case PunchResult::Blocked: return "blocked";
        case PunchResult::Evaded:  return "evaded";
        case PunchResult::Missed:  return "missed";
    }
    return "unknown";
}

} // namespace ringsim
