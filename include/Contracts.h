#pragma once

#include <array>
#include <vector>

#include "FighterTypes.h"
#include "Rng.h"

namespace ringsim {

class Fight;
class FightEffects;
class Fighter;

// ============================================================
// Collaborator contracts consumed by SimulationLoop.
//
// The loop owns none of these; it holds non-owning pointers and falls back
// to inert behaviour for any that are missing. Implementations receive the
// engine Rng so a seed replays a fight exactly.
// ============================================================

enum class ActionType : std::uint8_t { None = 0, Punch, Combination, Block, Evade, Move, Clinch, Wait };

enum class MoveDirection : std::uint8_t { None = 0, Forward, Backward, Left, Right };

const char* toString(ActionType a);
const char* toString(MoveDirection d);

struct Action {
    ActionType type = ActionType::Wait;
    PunchType punch = PunchType::Jab;             // Punch
    std::vector<PunchType> combination{};         // Combination, in throw order
    bool isCounter = false;
    MoveDirection direction = MoveDirection::None; // Move
    bool cutting = false;                          // Move: cutting off the ring
};

struct Decision {
    FighterState state = FighterState::Neutral;
    SubState subState = SubState::None;
    Action action{};
};

enum class PunchResult : std::uint8_t { Hit = 0, Blocked, Evaded, Missed };

const char* toString(PunchResult r);

struct PunchOutcome {
    Side attacker = Side::A;
    PunchType punch = PunchType::Jab;
    TargetLocation location = TargetLocation::Head;
    PunchResult result = PunchResult::Missed;
    PunchQuality quality = PunchQuality::Clean;
    double damage = 0.0; // hits only; filled by the resolver's own estimate
    bool isCounter = false;
    bool causedStun = false;
};

struct KnockdownRequest {
    Side target = Side::B;
    Side attacker = Side::A;
    PunchType punch = PunchType::Cross;
    double damage = 0.0;
    bool flash = false;
};

struct CombatResult {
    std::vector<PunchOutcome> hits{};
    std::vector<PunchOutcome> misses{};
    std::vector<PunchOutcome> blocks{};
    std::vector<PunchOutcome> evades{};
    bool hasKnockdown = false;
    KnockdownRequest knockdown{};
};

// What the loop knows about the ring that a fighter cannot know on its own.
struct RingContext {
    double distance_ft = 8.0;
    std::array<bool, 2> onRopes{{false, false}};
    std::array<bool, 2> inCorner{{false, false}};
    const FightEffects* effects = nullptr; // may be null
};

class DecisionSource {
public:
    virtual ~DecisionSource() = default;

    virtual Decision decide(const Fighter& fighter,
                            const Fighter& opponent,
                            const Fight& fight,
                            const RingContext& ring,
                            Rng& rng) = 0;
};

class CombatResolver {
public:
    virtual ~CombatResolver() = default;

    virtual CombatResult resolve(Fighter& a,
                                 Fighter& b,
                                 const Decision& decisionA,
                                 const Decision& decisionB,
                                 const Fight& fight,
                                 const RingContext& ring,
                                 Rng& rng) = 0;
};

class DamageCalculator {
public:
    virtual ~DamageCalculator() = default;

    virtual double calculateDamage(const PunchOutcome& hit, const Fighter& attacker, const Fighter& target) = 0;

    // Whether this much damage leaves the target hurt.
    virtual bool checkHurt(const Fighter& target, double damage, Rng& rng) = 0;
};

class StaminaManager {
public:
    virtual ~StaminaManager() = default;

    virtual void update(Fighter& fighter, const Decision& decision, double tickRate) = 0;
    virtual double calculateHitStaminaCost(double damage, TargetLocation location) const = 0;
    virtual double calculateMissStaminaCost(PunchType punch) const = 0;
};

struct RingPoint {
    double x = 0.0;
    double y = 0.0;
};

class PositionTracker {
public:
    virtual ~PositionTracker() = default;

    virtual void initializePositions() = 0;
    virtual void resetForRound() = 0;
    virtual void update(Fighter& a,
                        Fighter& b,
                        const Decision& decisionA,
                        const Decision& decisionB,
                        double dt,
                        Rng& rng) = 0;

    virtual double getDistance() const = 0;
    virtual bool isOnRopes(Side s) const = 0;
    virtual bool isInCorner(Side s) const = 0;
    virtual bool isInCenter(Side s) const = 0;

    // False when neither side controls the center; otherwise sets who does.
    virtual bool getCenterControl(Side& controller) const = 0;

    // Places the fighters the given distance apart around their midpoint.
    virtual void separateFighters(double distance_ft) = 0;

    virtual RingPoint position(Side s) const = 0;
};

} // namespace ringsim
