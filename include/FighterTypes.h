#pragma once

#include <cstdint>

namespace ringsim {

// ============================================================
// Fighter condition vocabulary
//
// Primary states are mutually exclusive; sub-states are orthogonal tags that
// are only meaningful while the matching primary state is active. Every
// primary state change is checked against isValidTransition().
// ============================================================

enum class FighterState : std::uint8_t {
    Neutral = 0,
    Offensive,
    Defensive,
    Timing,
    Moving,
    Clinch,
    Buzzed,
    Hurt,
    KnockedDown,
    FlashDown,
    Recovered,
    Count
};

enum class SubState : std::uint8_t {
    None = 0,
    // Offensive
    Jabbing,
    Combination,
    PowerShot,
    BodyWork,
    Feinting,
    // Defensive
    HighGuard,
    PhillyShell,
    HeadMovement,
    Distance,
    Parrying,
    // Movement
    CuttingOff,
    Circling,
    Retreating,
    Count
};

enum class StaminaTier : std::uint8_t { Fresh = 0, Good, Tired, Exhausted, Gassed };

enum class PunchType : std::uint8_t {
    Jab = 0,
    Cross,
    LeadHook,
    RearHook,
    LeadUppercut,
    RearUppercut,
    BodyJab,
    BodyCross,
    BodyHookLead,
    BodyHookRear,
    Count
};

enum class TargetLocation : std::uint8_t { Head = 0, Body };

enum class PunchQuality : std::uint8_t { Clean = 0, Partial };

enum class BodyType : std::uint8_t { Average = 0, Lean, Muscular, Stocky, Lanky };

enum class Stance : std::uint8_t { Orthodox = 0, Southpaw };

// Corner of the ring a fighter was introduced from; the fight's internal key.
enum class Side : std::uint8_t { A = 0, B = 1 };

inline Side opponentOf(Side s) { return (s == Side::A) ? Side::B : Side::A; }
inline int sideIndex(Side s) { return (s == Side::A) ? 0 : 1; }

const char* toString(FighterState s);
const char* toString(SubState s);
const char* toString(StaminaTier t);
const char* toString(PunchType p);
const char* toString(TargetLocation l);
const char* toString(PunchQuality q);
const char* toString(BodyType b);
const char* toString(Side s);

// Transition table for primary states. Self-transitions are valid for the
// voluntary states; downed states only leave through Recovered.
bool isValidTransition(FighterState from, FighterState to);

// States a decision source may request. Buzzed/Hurt/downed/Recovered are
// owned by the engine.
bool isVoluntaryState(FighterState s);

// Primary state a sub-state belongs to (Neutral for SubState::None).
FighterState subStateCategory(SubState s);

// Whether a sub-state tag may be attached while in the given primary state.
// Buzzed and Hurt fighters may carry defensive tags.
bool subStateAllowedIn(FighterState state, SubState sub);

bool isJab(PunchType p);
bool isBodyPunch(PunchType p);
bool isPowerPunch(PunchType p);
bool isLeadHand(PunchType p);
TargetLocation targetOf(PunchType p);

} // namespace ringsim
