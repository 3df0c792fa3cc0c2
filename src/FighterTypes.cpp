#include "FighterTypes.h"

namespace ringsim {

const char* toString(FighterState s) {
    switch (s) {
        case FighterState::Neutral:     return "NEUTRAL";
        case FighterState::Offensive:   return "OFFENSIVE";
        case FighterState::Defensive:   return "DEFENSIVE";
        case FighterState::Timing:      return "TIMING";
        case FighterState::Moving:      return "MOVING";
        case FighterState::Clinch:      return "CLINCH";
        case FighterState::Buzzed:      return "BUZZED";
        case FighterState::Hurt:        return "HURT";
        case FighterState::KnockedDown: return "KNOCKED_DOWN";
        case FighterState::FlashDown:   return "FLASH_DOWN";
        case FighterState::Recovered:   return "RECOVERED";
        default:                        return "UNKNOWN";
    }
}

const char* toString(SubState s) {
    switch (s) {
        case SubState::None:         return "NONE";
        case SubState::Jabbing:      return "JABBING";
        case SubState::Combination:  return "COMBINATION";
        case SubState::PowerShot:    return "POWER_SHOT";
        case SubState::BodyWork:     return "BODY_WORK";
        case SubState::Feinting:     return "FEINTING";
        case SubState::HighGuard:    return "HIGH_GUARD";
        case SubState::PhillyShell:  return "PHILLY_SHELL";
        case SubState::HeadMovement: return "HEAD_MOVEMENT";
        case SubState::Distance:     return "DISTANCE";
        case SubState::Parrying:     return "PARRYING";
        case SubState::CuttingOff:   return "CUTTING_OFF";
        case SubState::Circling:     return "CIRCLING";
        case SubState::Retreating:   return "RETREATING";
        default:                     return "UNKNOWN";
    }
}

const char* toString(StaminaTier t) {
    switch (t) {
        case StaminaTier::Fresh:     return "fresh";
        case StaminaTier::Good:      return "good";
        case StaminaTier::Tired:     return "tired";
        case StaminaTier::Exhausted: return "exhausted";
        case StaminaTier::Gassed:    return "gassed";
        default:                     return "unknown";
    }
}

const char* toString(PunchType p) {
    switch (p) {
        case PunchType::Jab:          return "jab";
        case PunchType::Cross:        return "cross";
        case PunchType::LeadHook:     return "lead_hook";
        case PunchType::RearHook:     return "rear_hook";
        case PunchType::LeadUppercut: return "lead_uppercut";
        case PunchType::RearUppercut: return "rear_uppercut";
        case PunchType::BodyJab:      return "body_jab";
        case PunchType::BodyCross:    return "body_cross";
        case PunchType::BodyHookLead: return "body_hook_lead";
        case PunchType::BodyHookRear: return "body_hook_rear";
        default:                      return "unknown";
    }
}

const char* toString(TargetLocation l) {
    return (l == TargetLocation::Head) ? "head" : "body";
}

const char* toString(PunchQuality q) {
    return (q == PunchQuality::Clean) ? "clean" : "partial";
}

const char* toString(BodyType b) {
    switch (b) {
        case BodyType::Average:  return "average";
        case BodyType::Lean:     return "lean";
        case BodyType::Muscular: return "muscular";
        case BodyType::Stocky:   return "stocky";
        case BodyType::Lanky:    return "lanky";
        default:                 return "unknown";
    }
}

const char* toString(Side s) {
    return (s == Side::A) ? "A" : "B";
}

namespace {

bool isDowned(FighterState s) {
    return s == FighterState::KnockedDown || s == FighterState::FlashDown;
}

} // namespace

bool isValidTransition(FighterState from, FighterState to) {
    if (from == FighterState::Count || to == FighterState::Count) return false;

    // Downed fighters either get up or stay down (the fight ends).
    if (isDowned(from)) {
        return to == FighterState::Recovered;
    }

    // Recovered is only reachable from the canvas.
    if (to == FighterState::Recovered) {
        return false;
    }

    // Everything upright may go down, be dazed, or change posture.
    return true;
}

bool isVoluntaryState(FighterState s) {
    switch (s) {
        case FighterState::Neutral:
        case FighterState::Offensive:
        case FighterState::Defensive:
        case FighterState::Timing:
        case FighterState::Moving:
        case FighterState::Clinch:
            return true;
        default:
            return false;
    }
}

FighterState subStateCategory(SubState s) {
    switch (s) {
        case SubState::Jabbing:
        case SubState::Combination:
        case SubState::PowerShot:
        case SubState::BodyWork:
        case SubState::Feinting:
            return FighterState::Offensive;
        case SubState::HighGuard:
        case SubState::PhillyShell:
        case SubState::HeadMovement:
        case SubState::Distance:
        case SubState::Parrying:
            return FighterState::Defensive;
        case SubState::CuttingOff:
        case SubState::Circling:
        case SubState::Retreating:
            return FighterState::Moving;
        default:
            return FighterState::Neutral;
    }
}

bool subStateAllowedIn(FighterState state, SubState sub) {
    if (sub == SubState::None) return true;
    const FighterState cat = subStateCategory(sub);
    if (cat == state) return true;
    if ((state == FighterState::Buzzed || state == FighterState::Hurt) &&
        cat == FighterState::Defensive) {
        return true;
    }
    return false;
}

bool isJab(PunchType p) {
    return p == PunchType::Jab || p == PunchType::BodyJab;
}

bool isBodyPunch(PunchType p) {
    switch (p) {
        case PunchType::BodyJab:
        case PunchType::BodyCross:
        case PunchType::BodyHookLead:
        case PunchType::BodyHookRear:
            return true;
        default:
            return false;
    }
}

bool isPowerPunch(PunchType p) {
    switch (p) {
        case PunchType::Cross:
        case PunchType::LeadHook:
        case PunchType::RearHook:
        case PunchType::LeadUppercut:
        case PunchType::RearUppercut:
        case PunchType::BodyCross:
        case PunchType::BodyHookLead:
        case PunchType::BodyHookRear:
            return true;
        default:
            return false;
    }
}

bool isLeadHand(PunchType p) {
    switch (p) {
        case PunchType::Jab:
        case PunchType::LeadHook:
        case PunchType::LeadUppercut:
        case PunchType::BodyJab:
        case PunchType::BodyHookLead:
            return true;
        default:
            return false;
    }
}

TargetLocation targetOf(PunchType p) {
    return isBodyPunch(p) ? TargetLocation::Body : TargetLocation::Head;
}

} // namespace ringsim
