#pragma once

#include <array>

#include "Contracts.h"

namespace ringsim {

// ============================================================
// Reference implementations of the collaborator contracts.
//
// Enough behaviour for a fight to run end to end; every roll goes through
// the Rng passed in by the loop.
// ============================================================

// Preferred punching distance in feet: reach / 45 plus a style offset.
double optimalRangeFor(const Fighter& f);

// Style-weighted state choice, survival mode when hurt or buzzed and
// stamina-gated punching. Reads AttributeSnapshot::aggressionBias.
class BasicDecisionSource : public DecisionSource {
public:
    Decision decide(const Fighter& fighter,
                    const Fighter& opponent,
                    const Fight& fight,
                    const RingContext& ring,
                    Rng& rng) override;

private:
    Decision survival(const Fighter& fighter, double distance) const;
    SubState offensiveSubState(const Fighter& fighter, const Fighter& opponent, double distance, Rng& rng) const;
    SubState defensiveSubState(const Fighter& fighter) const;
    Action offensiveAction(const Fighter& fighter, SubState sub, double distance, Rng& rng) const;
    Action combination(const Fighter& fighter, double distance, Rng& rng) const;
};

struct PunchStats {
    double baseDamage;
    double baseAccuracy;
    double range_ft;
};

const PunchStats& punchStats(PunchType p);

// Accuracy, defense (block, evade, partial) and per-hit damage estimate,
// plus the knockdown roll. At most one knockdown is requested per tick.
class BasicCombatResolver : public CombatResolver {
public:
    static constexpr double kActivityRate = 0.50;
    static constexpr int kRecoveryTicks = 2;
    static constexpr int kMaxComboLength = 5;

    CombatResult resolve(Fighter& a,
                         Fighter& b,
                         const Decision& decisionA,
                         const Decision& decisionB,
                         const Fight& fight,
                         const RingContext& ring,
                         Rng& rng) override;

    double calculateAccuracy(const Fighter& attacker,
                             const Fighter& defender,
                             PunchType punch,
                             double distance,
                             bool isCounter,
                             double effectsAccuracy) const;

    // Fraction of knockdown resistance left at this chin; 0.25 .. 0.97.
    static double chinResistance(double chin);

private:
    struct DefenseOutcome {
        bool blocked = false;
        bool evaded = false;
        bool partial = false;
    };

    bool readyToThrow(Side s, Rng& rng);
    void resolveSingle(Side side, Fighter& attacker, Fighter& defender, const Decision& att,
                       const Decision& def, const RingContext& ring, CombatResult& out, Rng& rng);
    void resolveCombination(Side side, Fighter& attacker, Fighter& defender, const Decision& att,
                            const Decision& def, const RingContext& ring, CombatResult& out, Rng& rng);
    DefenseOutcome resolveDefense(const Fighter& defender, Side defenderSide, const Decision& def,
                                  PunchType punch, const RingContext& ring, Rng& rng) const;
    double estimateDamage(const Fighter& attacker, PunchType punch, double distance, bool isCounter,
                          bool partial, double effectsPower, Rng& rng) const;
    bool checkKnockdown(const PunchOutcome& hit, const Fighter& attacker, const Fighter& target,
                        int round, KnockdownRequest& out, Rng& rng) const;

    std::array<int, 2> cooldown_{{0, 0}};
};

// Resistance, chin and attacker-fatigue scaling of the resolver's estimate.
class BasicDamageCalculator : public DamageCalculator {
public:
    double calculateDamage(const PunchOutcome& hit, const Fighter& attacker, const Fighter& target) override;
    bool checkHurt(const Fighter& target, double damage, Rng& rng) override;

    // Blocking, experience and body type; 0 .. 0.3.
    static double calculateResistance(const Fighter& target);
    static double hurtChance(const Fighter& target, double damage);
};

class BasicStaminaManager : public StaminaManager {
public:
    void update(Fighter& fighter, const Decision& decision, double tickRate) override;
    double calculateHitStaminaCost(double damage, TargetLocation location) const override;
    double calculateMissStaminaCost(PunchType punch) const override;

    double calculateCost(const Fighter& fighter, const Decision& decision, double dt) const;
    double calculateRecovery(const Fighter& fighter, double dt) const;

    static double punchCost(PunchType p);
    static double recoveryCeilingEfficiency(double staminaPercent);
    static double ageRecoveryModifier(double age);
};

} // namespace ringsim
