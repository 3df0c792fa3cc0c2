#include "ReferenceCollaborators.h"

#include "Fight.h"
#include "FightEffects.h"
#include "Fighter.h"

#include <algorithm>
#include <cmath>

namespace ringsim {

namespace {

// --------------------
// Tunable constants
// --------------------
constexpr double kRangeSlack_ft = 1.0;

// Accuracy
constexpr double kRangePenalty = 0.15;
constexpr double kReachBonusFactor = 0.6;
constexpr double kCounterAccuracy = 1.2;
constexpr double kHurtTargetAccuracy = 1.3;
constexpr double kMovingDefenderAccuracy = 0.85;

// Defense
constexpr double kHurtDefendChance = 0.3;
constexpr double kCornerDefendChance = 0.4;
constexpr double kRopesDefendChance = 0.6;
constexpr double kMaxEvadeChance = 0.45;
constexpr double kBlockBase = 0.3;
constexpr double kPartialWindow = 0.15;

// Combinations
constexpr double kComboAccuracyDecay = 0.92;
constexpr double kComboBlockDecay = 0.95;
constexpr double kComboBreakOnMiss = 0.5;
constexpr double kComboBreakOnEvade = 0.4;

// Knockdown roll
constexpr double kFreshHeadDamage = 0.15;
constexpr double kFlashDamageThreshold = 8.0;
constexpr double kZeroStaminaThreshold = 0.10;
constexpr double kDirectKnockdownFreshScale = 1.3;

// Stamina
constexpr double kBaselineDrain = 0.12;  // per second
constexpr double kMinimumDrain = 0.08;   // per second
constexpr double kHurtDrain = 1.5;       // per second
constexpr double kClinchInitiation = 0.5;
constexpr double kClinchHolding = 0.1;   // per second
constexpr double kMovingDrain = 0.12;    // per second, halved
constexpr double kMissCostShare = 0.5;

static inline double clampd(double v, double lo, double hi) {
    if (!std::isfinite(v)) return lo;
    return (v < lo) ? lo : (v > hi) ? hi : v;
}

const PunchStats kPunchStats[static_cast<int>(PunchType::Count)] = {
    {0.5, 0.42, 5.0}, // jab
    {2.0, 0.32, 4.5}, // cross
    {1.5, 0.28, 3.0}, // lead hook
    {2.5, 0.26, 3.0}, // rear hook
    {1.2, 0.25, 2.5}, // lead uppercut
    {3.0, 0.22, 2.5}, // rear uppercut
    {0.6, 0.40, 4.5}, // body jab
    {1.8, 0.30, 4.0}, // body cross
    {1.5, 0.30, 2.5}, // body hook lead
    {2.0, 0.28, 2.5}, // body hook rear
};

bool isHookOrUppercut(PunchType p) {
    switch (p) {
        case PunchType::LeadHook:
        case PunchType::RearHook:
        case PunchType::LeadUppercut:
        case PunchType::RearUppercut:
        case PunchType::BodyHookLead:
        case PunchType::BodyHookRear:
            return true;
        default:
            return false;
    }
}

bool isStraight(PunchType p) { return p == PunchType::Jab || p == PunchType::Cross; }

double effectOr(const RingContext& ring, const Fighter& f, double (FightEffects::*get)(const std::string&) const) {
    if (ring.effects == nullptr || !ring.effects->isRegistered(f.id())) return 0.0;
    return (ring.effects->*get)(f.id());
}

// ====================
// Decision tables
// ====================
struct StyleWeights {
    const char* style;
    double offensive, defensive, timing, moving, clinch;
    std::array<double, static_cast<int>(PunchType::Count)> punches;
};

// Punch order: jab, cross, lead hook, rear hook, lead upper, rear upper,
// body jab, body cross, body hook lead, body hook rear.
const StyleWeights kStyles[] = {
    {"out-boxer", 0.30, 0.20, 0.15, 0.30, 0.05, {{0.40, 0.20, 0.10, 0.05, 0.05, 0.05, 0.10, 0.05, 0.00, 0.00}}},
    {"swarmer", 0.54, 0.05, 0.03, 0.32, 0.06, {{0.20, 0.15, 0.20, 0.10, 0.05, 0.05, 0.05, 0.00, 0.15, 0.05}}},
    {"slugger", 0.47, 0.10, 0.08, 0.29, 0.06, {{0.30, 0.28, 0.18, 0.10, 0.03, 0.06, 0.00, 0.05, 0.00, 0.00}}},
    {"boxer-puncher", 0.40, 0.12, 0.13, 0.28, 0.07, {{0.25, 0.25, 0.15, 0.10, 0.05, 0.05, 0.05, 0.00, 0.10, 0.00}}},
    {"counter-puncher", 0.15, 0.22, 0.28, 0.30, 0.05, {{0.20, 0.30, 0.15, 0.10, 0.10, 0.10, 0.00, 0.05, 0.00, 0.00}}},
    {"inside-fighter", 0.50, 0.07, 0.03, 0.32, 0.08, {{0.10, 0.10, 0.25, 0.15, 0.15, 0.10, 0.00, 0.00, 0.10, 0.05}}},
    {"volume-puncher", 0.42, 0.10, 0.05, 0.38, 0.05, {{0.30, 0.20, 0.15, 0.10, 0.05, 0.05, 0.10, 0.00, 0.05, 0.00}}},
};

const StyleWeights& styleWeights(const std::string& primary) {
    for (const auto& s : kStyles) {
        if (primary == s.style) return s;
    }
    return kStyles[3]; // boxer-puncher
}

template <std::size_t N>
int weightedPick(const std::array<double, N>& w, Rng& rng) {
    double total = 0.0;
    for (double x : w) total += std::max(0.0, x);
    if (total <= 0.0) return 0;
    double r = rng.u01() * total;
    for (std::size_t i = 0; i < N; ++i) {
        r -= std::max(0.0, w[i]);
        if (r <= 0.0 && w[i] > 0.0) return static_cast<int>(i);
    }
    return 0;
}

} // namespace

const PunchStats& punchStats(PunchType p) {
    const int i = static_cast<int>(p);
    return kPunchStats[(i >= 0 && i < static_cast<int>(PunchType::Count)) ? i : 0];
}

double optimalRangeFor(const Fighter& f) {
    const std::string& style = f.profile().style.primary;
    double mod = 0.0;
    if (style == "out-boxer") mod = 0.3;
    else if (style == "swarmer") mod = -0.5;
    else if (style == "boxer-puncher") mod = 0.1;
    else if (style == "counter-puncher") mod = 0.2;
    else if (style == "inside-fighter") mod = -0.6;
    return f.profile().physical.reach_cm / 45.0 + mod;
}

// ============================================================
// BasicDecisionSource
// ============================================================

Decision BasicDecisionSource::decide(const Fighter& fighter,
                                     const Fighter& opponent,
                                     const Fight& fight,
                                     const RingContext& ring,
                                     Rng& rng) {
    Decision d;
    const double distance = ring.distance_ft;

    if (fighter.isDown()) {
        d.state = fighter.state();
        d.action.type = ActionType::None;
        return d;
    }

    if (fighter.state() == FighterState::Recovered) {
        d.state = FighterState::Defensive;
        d.subState = SubState::HighGuard;
        d.action.type = (opponent.state() == FighterState::Offensive) ? ActionType::Block : ActionType::Wait;
        return d;
    }

    if (fighter.isHurt() || fighter.isBuzzed()) {
        return survival(fighter, distance);
    }

    const AttributeSnapshot& at = fighter.attributes();
    const StyleWeights& sw = styleWeights(fighter.profile().style.primary);
    const double stamina = fighter.getStaminaPercent();

    // Offensive, Defensive, Timing, Moving, Clinch
    std::array<double, 5> w{{sw.offensive, sw.defensive, sw.timing, sw.moving, sw.clinch}};

    if (stamina < 0.20) {
        const double critical = stamina / 0.20;
        const double conserve = (1.0 - critical) * std::min(1.5, at.technical.fightIQ / 65.0);
        w[0] *= std::max(0.15, 0.4 - conserve * 0.30);
        w[1] *= 1.8 + conserve * 0.6;
        w[2] *= 1.5 + conserve * 0.3;
        w[3] *= 0.7;
        w[4] *= 1.3 + conserve * 0.4;
    } else if (stamina >= 0.80) {
        const double fresh = (stamina - 0.80) / 0.20;
        w[0] *= 1.3 + fresh * 0.4;
        w[1] *= 0.7 - fresh * 0.2;
        w[2] *= 0.8;
    }

    if (opponent.isHurt() || opponent.isBuzzed()) {
        w[0] *= 1.5 + at.mental.killerInstinct / 100.0;
        w[1] *= 0.5;
    }

    // Fight effects lean the fighter forward or back.
    const double bias = clampd(at.aggressionBias, -0.5, 0.5);
    w[0] *= 1.0 + bias;
    w[1] *= 1.0 - bias;

    const int round = fight.currentRoundNumber();
    if (round >= fight.config().rounds - 2) {
        const double diff = fight.estimatedScoreDiff(fight.sideOf(fighter.id()));
        if (diff < -2.0) {
            w[0] *= 1.3;
            w[2] *= 1.1;
        }
    }

    const double optimal = optimalRangeFor(fighter);
    if (distance > optimal + 2.0) {
        w[3] *= 1.3;
    }
    if (distance > 3.0) {
        w[4] *= 0.2;
    }

    static const FighterState kStates[5] = {FighterState::Offensive, FighterState::Defensive,
                                            FighterState::Timing, FighterState::Moving, FighterState::Clinch};
    d.state = kStates[weightedPick(w, rng)];

    switch (d.state) {
        case FighterState::Offensive:
            d.subState = offensiveSubState(fighter, opponent, distance, rng);
            if (stamina < 0.05 && distance < 3.0) {
                d.state = FighterState::Clinch;
                d.subState = SubState::None;
                d.action.type = ActionType::Clinch;
            } else if (stamina < 0.10) {
                d.state = FighterState::Defensive;
                d.subState = SubState::HighGuard;
                d.action.type = ActionType::Block;
            } else {
                d.action = offensiveAction(fighter, d.subState, distance, rng);
            }
            break;

        case FighterState::Defensive:
            d.subState = defensiveSubState(fighter);
            if (opponent.state() == FighterState::Offensive) {
                switch (d.subState) {
                    case SubState::HeadMovement:
                        d.action.type = ActionType::Evade;
                        break;
                    case SubState::Distance:
                        d.action.type = ActionType::Move;
                        d.action.direction = MoveDirection::Backward;
                        break;
                    default:
                        d.action.type = ActionType::Block;
                        break;
                }
            } else {
                d.action.type = ActionType::Wait;
            }
            break;

        case FighterState::Timing:
            if (opponent.state() == FighterState::Offensive && stamina >= 0.10) {
                static const PunchType kCounters[3] = {PunchType::Cross, PunchType::LeadHook, PunchType::RearUppercut};
                d.action.type = ActionType::Punch;
                d.action.punch = kCounters[rng.pickIndex(3)];
                d.action.isCounter = true;
            } else {
                d.action.type = ActionType::Wait;
            }
            break;

        case FighterState::Moving:
            d.action.type = ActionType::Move;
            if (distance > optimal + 1.0) {
                d.subState = SubState::CuttingOff;
                d.action.direction = MoveDirection::Forward;
                d.action.cutting = true;
            } else if (distance < optimal - 1.0) {
                d.subState = SubState::Retreating;
                d.action.direction = MoveDirection::Backward;
            } else {
                d.subState = SubState::Circling;
                d.action.direction = rng.chance(0.5) ? MoveDirection::Left : MoveDirection::Right;
            }
            break;

        case FighterState::Clinch:
            d.action.type = ActionType::Clinch;
            break;

        default:
            d.action.type = ActionType::Wait;
            break;
    }
    return d;
}

Decision BasicDecisionSource::survival(const Fighter& fighter, double distance) const {
    Decision d;
    d.state = fighter.state();

    if (distance < 3.0 && fighter.attributes().defense.clinchOffense > 50.0) {
        d.subState = SubState::HighGuard;
        d.action.type = ActionType::Clinch;
        return d;
    }

    const std::string& def = fighter.profile().style.defensive;
    if (def == "philly-shell") {
        d.subState = SubState::PhillyShell;
        d.action.type = ActionType::Block;
    } else if (def == "slick") {
        d.subState = SubState::HeadMovement;
        d.action.type = ActionType::Evade;
    } else if (def == "distance") {
        d.subState = SubState::Distance;
        d.action.type = ActionType::Move;
        d.action.direction = MoveDirection::Backward;
    } else {
        d.subState = SubState::HighGuard;
        d.action.type = ActionType::Block;
    }
    return d;
}

SubState BasicDecisionSource::offensiveSubState(const Fighter& fighter,
                                                const Fighter& opponent,
                                                double distance,
                                                Rng& rng) const {
    const std::string& off = fighter.profile().style.offensive;
    const std::string& primary = fighter.profile().style.primary;
    const double optimal = optimalRangeFor(fighter);

    if (off == "body-snatcher" && opponent.getBodyDamagePercent() < 0.6) return SubState::BodyWork;
    if (off == "jab-and-move") return SubState::Jabbing;
    if (off == "combo-puncher" && distance <= optimal + 1.0) return SubState::Combination;

    if (opponent.isHurt()) {
        return (fighter.attributes().power.knockoutPower > 75.0) ? SubState::PowerShot : SubState::Combination;
    }

    if (distance > optimal + 1.0 && rng.chance(0.7)) return SubState::Jabbing;

    if (primary == "slugger") {
        const double roll = rng.u01();
        if (roll < 0.40) return SubState::PowerShot;
        if (roll < 0.70) return SubState::Combination;
        return SubState::Jabbing;
    }
    if (primary == "inside-fighter") {
        if (distance < 2.0) return rng.chance(0.6) ? SubState::Combination : SubState::BodyWork;
        return SubState::Jabbing;
    }
    return (distance > optimal) ? SubState::Jabbing : SubState::Combination;
}

SubState BasicDecisionSource::defensiveSubState(const Fighter& fighter) const {
    const std::string& def = fighter.profile().style.defensive;
    const DefenseAttributes& d = fighter.attributes().defense;

    if (def == "philly-shell") return (d.shoulderRoll > 60.0) ? SubState::PhillyShell : SubState::HighGuard;
    if (def == "slick") return (d.headMovement > 70.0) ? SubState::HeadMovement : SubState::HighGuard;
    if (def == "distance") return SubState::Distance;
    if (def == "high-guard" || def == "peek-a-boo") return SubState::HighGuard;
    return (d.headMovement > d.blocking) ? SubState::HeadMovement : SubState::HighGuard;
}

Action BasicDecisionSource::offensiveAction(const Fighter& fighter, SubState sub, double distance, Rng& rng) const {
    Action a;
    if (distance > optimalRangeFor(fighter) + 2.0) {
        a.type = ActionType::Move;
        a.direction = MoveDirection::Forward;
        return a;
    }
    if (sub == SubState::Combination) {
        return combination(fighter, distance, rng);
    }

    std::array<double, static_cast<int>(PunchType::Count)> w = styleWeights(fighter.profile().style.primary).punches;
    auto at = [&w](PunchType p) -> double& { return w[static_cast<int>(p)]; };

    switch (sub) {
        case SubState::Jabbing:
            at(PunchType::Jab) *= 2.0;
            at(PunchType::BodyJab) *= 1.5;
            break;
        case SubState::PowerShot:
            at(PunchType::Cross) *= 2.0;
            at(PunchType::RearHook) *= 1.8;
            at(PunchType::RearUppercut) *= 1.5;
            at(PunchType::Jab) *= 0.3;
            break;
        case SubState::BodyWork:
            at(PunchType::BodyJab) = std::max(at(PunchType::BodyJab), 0.05) * 2.0;
            at(PunchType::BodyCross) = std::max(at(PunchType::BodyCross), 0.05) * 2.0;
            at(PunchType::BodyHookLead) = std::max(at(PunchType::BodyHookLead), 0.05) * 2.0;
            at(PunchType::BodyHookRear) = std::max(at(PunchType::BodyHookRear), 0.05) * 2.0;
            break;
        default:
            break;
    }

    const double stamina = fighter.getStaminaPercent();
    if (stamina >= 0.75) {
        const double fresh = (stamina - 0.75) / 0.25;
        at(PunchType::Cross) *= 1.3 + fresh * 0.5;
        at(PunchType::RearHook) *= 1.3 + fresh * 0.5;
        at(PunchType::RearUppercut) *= 1.2 + fresh * 0.4;
        at(PunchType::LeadHook) *= 1.2 + fresh * 0.3;
        at(PunchType::Jab) *= 0.7 - fresh * 0.2;
    } else if (stamina < 0.40) {
        const double fatigue = 1.0 - stamina / 0.40;
        at(PunchType::Cross) *= 1.0 - fatigue * 0.4;
        at(PunchType::RearHook) *= 1.0 - fatigue * 0.5;
        at(PunchType::RearUppercut) *= 1.0 - fatigue * 0.5;
        at(PunchType::Jab) *= 1.0 + fatigue * 0.5;
    }

    if (distance < 3.0) {
        at(PunchType::LeadHook) *= 1.5;
        at(PunchType::RearHook) *= 1.5;
        at(PunchType::LeadUppercut) *= 1.5;
        at(PunchType::RearUppercut) *= 1.5;
        at(PunchType::Jab) *= 0.5;
        at(PunchType::Cross) *= 0.7;
    } else if (distance > 4.5) {
        at(PunchType::Jab) *= 1.5;
        at(PunchType::LeadHook) *= 0.5;
        at(PunchType::RearHook) *= 0.5;
    }

    a.type = ActionType::Punch;
    a.punch = static_cast<PunchType>(weightedPick(w, rng));
    return a;
}

Action BasicDecisionSource::combination(const Fighter& fighter, double distance, Rng& rng) const {
    const double stamina = fighter.getStaminaPercent();
    int minLen = 2;
    int maxLen = 2;
    if (stamina >= 0.80) {
        minLen = 3;
        maxLen = 6;
    } else if (stamina >= 0.50) {
        maxLen = 4;
    } else if (stamina >= 0.25) {
        maxLen = 3;
    }
    if (fighter.attributes().stamina.workRate >= 85.0) ++maxLen;

    const int length = minLen + rng.pickIndex(maxLen - minLen + 1);
    const bool power = stamina >= 0.70;

    Action a;
    a.type = ActionType::Combination;
    a.combination.push_back((distance > 3.5 || rng.chance(0.5)) ? PunchType::Jab : PunchType::LeadHook);

    while (static_cast<int>(a.combination.size()) < length) {
        const PunchType last = a.combination.back();
        std::vector<PunchType> next;
        if (last == PunchType::Jab) {
            next = {PunchType::Cross, PunchType::Jab, PunchType::LeadHook};
            if (power) {
                next.push_back(PunchType::BodyCross);
                next.push_back(PunchType::RearHook);
            }
        } else if (last == PunchType::Cross) {
            next = {PunchType::LeadHook, PunchType::Jab};
            if (power) {
                next.push_back(PunchType::BodyHookLead);
                next.push_back(PunchType::RearUppercut);
            }
        } else if (last == PunchType::LeadHook) {
            next = {PunchType::Cross};
            if (power) {
                next.push_back(PunchType::RearHook);
                next.push_back(PunchType::RearUppercut);
                next.push_back(PunchType::BodyHookRear);
            }
        } else {
            next = {PunchType::Jab, PunchType::LeadHook, PunchType::Cross};
        }
        a.combination.push_back(next[static_cast<std::size_t>(rng.pickIndex(static_cast<int>(next.size())))]);
    }
    a.punch = a.combination.front();
    return a;
}

// ============================================================
// BasicCombatResolver
// ============================================================

CombatResult BasicCombatResolver::resolve(Fighter& a,
                                          Fighter& b,
                                          const Decision& decisionA,
                                          const Decision& decisionB,
                                          const Fight& fight,
                                          const RingContext& ring,
                                          Rng& rng) {
    CombatResult out;

    const auto throws = [](const Decision& d) {
        return d.action.type == ActionType::Punch || d.action.type == ActionType::Combination;
    };

    for (Side side : {Side::A, Side::B}) {
        Fighter& attacker = (side == Side::A) ? a : b;
        Fighter& defender = (side == Side::A) ? b : a;
        const Decision& att = (side == Side::A) ? decisionA : decisionB;
        const Decision& def = (side == Side::A) ? decisionB : decisionA;
        int& cd = cooldown_[sideIndex(side)];

        if (!throws(att) || attacker.isDown()) {
            if (cd > 0) --cd;
            continue;
        }
        if (!readyToThrow(side, rng) || !attacker.canThrowPunch(rng)) continue;

        if (att.action.type == ActionType::Combination && !att.action.combination.empty()) {
            resolveCombination(side, attacker, defender, att, def, ring, out, rng);
        } else {
            resolveSingle(side, attacker, defender, att, def, ring, out, rng);
        }
    }

    const int round = fight.currentRoundNumber();
    for (const PunchOutcome& hit : out.hits) {
        const Fighter& attacker = (hit.attacker == Side::A) ? a : b;
        const Fighter& target = (hit.attacker == Side::A) ? b : a;
        if (checkKnockdown(hit, attacker, target, round, out.knockdown, rng)) {
            out.hasKnockdown = true;
            break;
        }
    }
    return out;
}

bool BasicCombatResolver::readyToThrow(Side s, Rng& rng) {
    int& cd = cooldown_[sideIndex(s)];
    if (cd > 0) {
        --cd;
        return false;
    }
    if (rng.u01() > kActivityRate) return false;
    cd = kRecoveryTicks;
    return true;
}

double BasicCombatResolver::calculateAccuracy(const Fighter& attacker,
                                              const Fighter& defender,
                                              PunchType punch,
                                              double distance,
                                              bool isCounter,
                                              double effectsAccuracy) const {
    const AttributeSnapshot& at = attacker.attributes();
    const PunchStats& ps = punchStats(punch);

    const double skill = isJab(punch) ? at.offense.jabAccuracy : at.offense.powerAccuracy;
    const double skillMod = 0.5 + skill / 100.0;
    const double handSpeedMod = 0.8 + at.speed.handSpeed / 500.0;
    const double rangeMod = std::max(0.3, 1.0 - std::abs(distance - ps.range_ft) * kRangePenalty);

    double acc = ps.baseAccuracy * (1.0 + effectsAccuracy) * skillMod * handSpeedMod * rangeMod;

    const double reachDiff = attacker.profile().physical.reach_cm - defender.profile().physical.reach_cm;
    if (reachDiff > 0.0 && distance >= 3.5) {
        acc *= 1.0 + (reachDiff / 100.0) * kReachBonusFactor * std::min(2.0, distance / 3.5);
    } else if (reachDiff < 0.0 && distance < 2.5) {
        acc *= 1.0 + std::abs(reachDiff / 100.0) * 0.30;
    } else if (reachDiff < 0.0 && distance >= 3.5) {
        acc *= 1.0 - std::abs(reachDiff / 100.0) * 0.25 * std::min(2.0, distance / 3.5);
    }

    if (defender.state() == FighterState::Moving) acc *= kMovingDefenderAccuracy;
    if (isCounter) acc *= kCounterAccuracy + at.offense.counterPunching / 200.0;
    if (defender.isHurt()) acc *= kHurtTargetAccuracy;

    const double stamina = attacker.getStaminaPercent();
    if (stamina < 0.4) acc *= 0.8;
    else if (stamina < 0.6) acc *= 0.9;

    if (at.mental.experience > 80.0) acc *= 1.0 + (at.mental.experience - 80.0) / 500.0;

    return clampd(acc, 0.1, 0.95);
}

BasicCombatResolver::DefenseOutcome BasicCombatResolver::resolveDefense(const Fighter& defender,
                                                                        Side defenderSide,
                                                                        const Decision& def,
                                                                        PunchType punch,
                                                                        const RingContext& ring,
                                                                        Rng& rng) const {
    DefenseOutcome r;
    const AttributeSnapshot& at = defender.attributes();
    const TargetLocation target = targetOf(punch);

    if (defender.isHurt()) {
        const double chance = std::max(0.1, kHurtDefendChance + effectOr(ring, defender, &FightEffects::getDefenseModifier));
        if (rng.u01() > chance) return r;
    }

    const int di = sideIndex(defenderSide);
    if (ring.inCorner[di]) {
        if (rng.u01() > kCornerDefendChance) return r;
    } else if (ring.onRopes[di]) {
        if (rng.u01() > kRopesDefendChance) return r;
    }

    const double headPct = defender.getHeadDamagePercent();
    if (headPct >= 0.95) {
        if (rng.u01() > 0.1) return r;
    } else if (headPct >= 0.85) {
        if (rng.u01() > 0.25) return r;
    } else if (headPct >= 0.70) {
        if (rng.u01() > 0.5) return r;
    }

    const SubState sub = defender.subState();
    if (def.action.type == ActionType::Evade || sub == SubState::HeadMovement) {
        double evade = 0.1 + at.defense.headMovement / 500.0 + at.speed.reflexes / 600.0;
        if (target == TargetLocation::Body) evade *= 0.4;
        if (isHookOrUppercut(punch)) evade *= 0.7;
        if (defender.getStaminaPercent() < 0.4) evade *= 0.7;
        if (at.mental.experience > 80.0) evade *= 1.0 + (at.mental.experience - 80.0) / 200.0;
        if (rng.u01() < std::min(kMaxEvadeChance, evade)) {
            r.evaded = true;
            return r;
        }
    }

    if (def.action.type == ActionType::Block || sub == SubState::HighGuard || sub == SubState::PhillyShell) {
        double block = kBlockBase;
        if (sub == SubState::HighGuard) {
            block += 0.25 - ((target == TargetLocation::Body) ? 0.15 : 0.0);
        } else if (sub == SubState::PhillyShell) {
            block += isStraight(punch) ? 0.3 : 0.1;
        }
        block += at.defense.blocking / 400.0;
        if (isStraight(punch) && at.defense.parrying > 60.0) block += 0.1;

        const double roll = rng.u01();
        if (roll < block) {
            r.blocked = true;
            return r;
        }
        if (roll < block + kPartialWindow) {
            r.partial = true;
            return r;
        }
    }

    const double passive = 0.1 + at.defense.ringAwareness / 500.0 + at.mental.experience / 500.0;
    if (rng.u01() < passive) r.partial = true;
    return r;
}

double BasicCombatResolver::estimateDamage(const Fighter& attacker,
                                           PunchType punch,
                                           double distance,
                                           bool isCounter,
                                           bool partial,
                                           double effectsPower,
                                           Rng& rng) const {
    const AttributeSnapshot& at = attacker.attributes();
    const PunchStats& ps = punchStats(punch);

    double power = at.power.powerRight;
    if (isJab(punch)) power = (at.power.powerLeft + at.power.powerRight) / 4.0;
    else if (isLeadHand(punch)) power = at.power.powerLeft;

    double powerMod = 0.6 + power / 250.0;
    const double ko = at.power.knockoutPower;
    if (!isJab(punch)) {
        if (ko >= 85.0) powerMod *= 1.15 + (ko - 85.0) / 100.0;
        else if (ko >= 70.0) powerMod *= 1.0 + (ko - 70.0) / 150.0;
    }

    double dmg = ps.baseDamage * (1.0 + effectsPower) * powerMod;
    dmg *= std::max(0.5, 1.0 - std::abs(distance - ps.range_ft) * 0.1);
    if (isCounter) dmg *= 1.15 + at.offense.counterPunching / 400.0;
    if (partial) dmg *= 0.5;
    if (isBodyPunch(punch)) dmg *= 0.7 + at.power.bodyPunching / 150.0;

    const double stamina = attacker.getStaminaPercent();
    if (stamina < 0.25) dmg *= 0.6;
    else if (stamina < 0.4) dmg *= 0.75;
    else if (stamina < 0.6) dmg *= 0.9;

    dmg *= 0.85 + rng.u01() * 0.3;
    return std::max(1.0, std::round(dmg));
}

void BasicCombatResolver::resolveSingle(Side side,
                                        Fighter& attacker,
                                        Fighter& defender,
                                        const Decision& att,
                                        const Decision& def,
                                        const RingContext& ring,
                                        CombatResult& out,
                                        Rng& rng) {
    PunchOutcome o;
    o.attacker = side;
    o.punch = att.action.punch;
    o.location = targetOf(o.punch);
    o.isCounter = att.action.isCounter;

    const double distance = ring.distance_ft;
    if (distance > punchStats(o.punch).range_ft + kRangeSlack_ft) {
        out.misses.push_back(o);
        return;
    }

    const double accuracy = calculateAccuracy(attacker, defender, o.punch, distance, o.isCounter,
                                              effectOr(ring, attacker, &FightEffects::getAccuracyModifier));
    if (rng.u01() > accuracy) {
        out.misses.push_back(o);
        return;
    }

    const DefenseOutcome dr = resolveDefense(defender, opponentOf(side), def, o.punch, ring, rng);
    if (dr.blocked) {
        o.result = PunchResult::Blocked;
        out.blocks.push_back(o);
        return;
    }
    if (dr.evaded) {
        o.result = PunchResult::Evaded;
        out.evades.push_back(o);
        return;
    }

    const double base = estimateDamage(attacker, o.punch, distance, o.isCounter, dr.partial,
                                       effectOr(ring, attacker, &FightEffects::getPowerModifier), rng);
    o.result = PunchResult::Hit;
    o.quality = dr.partial ? PunchQuality::Partial : PunchQuality::Clean;
    o.damage = std::round(base * defender.getStunVulnerability());
    o.causedStun = o.damage >= 3.0;
    out.hits.push_back(o);
}

void BasicCombatResolver::resolveCombination(Side side,
                                             Fighter& attacker,
                                             Fighter& defender,
                                             const Decision& att,
                                             const Decision& def,
                                             const RingContext& ring,
                                             CombatResult& out,
                                             Rng& rng) {
    const double distance = ring.distance_ft;
    const double effAcc = effectOr(ring, attacker, &FightEffects::getAccuracyModifier);
    const double effPow = effectOr(ring, attacker, &FightEffects::getPowerModifier);
    const std::size_t n = std::min(att.action.combination.size(), static_cast<std::size_t>(kMaxComboLength));

    double accMod = 1.0;
    for (std::size_t i = 0; i < n; ++i) {
        PunchOutcome o;
        o.attacker = side;
        o.punch = att.action.combination[i];
        o.location = targetOf(o.punch);

        if (distance > punchStats(o.punch).range_ft + kRangeSlack_ft) {
            out.misses.push_back(o);
            continue;
        }

        const double accuracy = calculateAccuracy(attacker, defender, o.punch, distance, false, effAcc) * accMod;
        if (rng.u01() > accuracy) {
            out.misses.push_back(o);
            if (rng.u01() > kComboBreakOnMiss) return;
            continue;
        }

        const DefenseOutcome dr = resolveDefense(defender, opponentOf(side), def, o.punch, ring, rng);
        if (dr.blocked) {
            o.result = PunchResult::Blocked;
            out.blocks.push_back(o);
            accMod *= kComboBlockDecay;
            continue;
        }
        if (dr.evaded) {
            o.result = PunchResult::Evaded;
            out.evades.push_back(o);
            if (rng.u01() < kComboBreakOnEvade) return;
            continue;
        }

        o.result = PunchResult::Hit;
        o.quality = dr.partial ? PunchQuality::Partial : PunchQuality::Clean;
        o.damage = estimateDamage(attacker, o.punch, distance, false, dr.partial, effPow, rng);
        o.causedStun = o.damage >= 3.0;
        out.hits.push_back(o);
        accMod *= kComboAccuracyDecay;
    }
}

double BasicCombatResolver::chinResistance(double chin) {
    if (chin >= 90.0) return 0.85 + (chin - 90.0) * 0.012;
    if (chin >= 85.0) return 0.75 + (chin - 85.0) * 0.02;
    if (chin >= 80.0) return 0.65 + (chin - 80.0) * 0.02;
    return clampd((chin - 30.0) / 80.0, 0.0, 1.0);
}

bool BasicCombatResolver::checkKnockdown(const PunchOutcome& hit,
                                         const Fighter& attacker,
                                         const Fighter& target,
                                         int round,
                                         KnockdownRequest& out,
                                         Rng& rng) const {
    if (hit.location != TargetLocation::Head) return false;

    const double headPct = target.getHeadDamagePercent();
    const double chin = target.attributes().mental.chin;
    const double stamina = target.getStaminaPercent();
    const bool fresh = headPct < kFreshHeadDamage;

    double threshold = 3.0 + chin / 15.0;
    if (headPct > 0.5) threshold *= 1.0 - (headPct - 0.5) * 0.3;
    if (stamina < 0.25) threshold *= 0.85;
    else if (stamina < 0.4) threshold *= 0.92;

    const double zeroStaminaMult =
        (stamina <= kZeroStaminaThreshold) ? 1.0 + (1.0 - stamina / kZeroStaminaThreshold) : 1.0;

    out.target = opponentOf(hit.attacker);
    out.attacker = hit.attacker;
    out.punch = hit.punch;
    out.damage = hit.damage;

    const bool direct = !fresh || hit.damage >= threshold * kDirectKnockdownFreshScale;
    if (direct && hit.damage >= threshold) {
        if (rng.u01() > chinResistance(chin) / zeroStaminaMult) {
            out.flash = false;
            return true;
        }
    }

    const bool flashPossible = !fresh || hit.damage >= kFlashDamageThreshold;
    if (!flashPossible || hit.quality != PunchQuality::Clean || !isPowerPunch(hit.punch)) return false;

    const double ko = attacker.attributes().power.knockoutPower;
    if (chin - ko >= 25.0 && headPct < 0.5) return false;

    double p = std::max(0.0, (ko - 40.0) / 200.0) * (1.0 - chin / 150.0);
    p *= (chin >= 90.0) ? 0.25 : (chin >= 85.0) ? 0.4 : (chin >= 80.0) ? 0.6 : 1.0;
    p *= (ko < 60.0) ? 0.3 : (ko < 70.0) ? 0.5 : 1.0;
    p *= (ko >= 95.0) ? (1.6 + (ko - 95.0) / 50.0) : (ko >= 90.0) ? 1.4 : (ko >= 80.0) ? 1.2 : 1.0;
    if (round <= 5 && ko >= 94.0) {
        p *= 1.0 + (ko - 92.0) / 25.0 * (1.0 - (round - 1) / 5.0) * 1.5;
    }
    if (headPct > 0.4) p *= 1.0 + (headPct - 0.4) * 1.5;
    if (fresh) p *= (ko >= 90.0) ? 0.5 : 0.35;
    if (stamina < 0.2) p *= 1.3;
    else if (stamina < 0.4) p *= 1.1;
    p *= zeroStaminaMult;
    if (isHookOrUppercut(hit.punch) || hit.punch == PunchType::Cross) p *= 1.2;

    double cap = (chin >= 90.0) ? 0.025 : (chin >= 85.0) ? 0.035 : (chin >= 80.0) ? 0.045 : (chin < 70.0) ? 0.10 : 0.06;
    cap *= (ko >= 95.0) ? 2.5 : (ko >= 90.0) ? 2.0 : (ko >= 85.0) ? 1.6 : (ko >= 80.0) ? 1.3 : 1.0;

    if (rng.u01() < std::min(cap, p)) {
        out.flash = true;
        return true;
    }
    return false;
}

// ============================================================
// BasicDamageCalculator
// ============================================================

double BasicDamageCalculator::calculateResistance(const Fighter& target) {
    const AttributeSnapshot& at = target.attributes();
    double bodyType = 0.0;
    switch (target.profile().physical.bodyType) {
        case BodyType::Stocky:   bodyType = 0.05; break;
        case BodyType::Muscular: bodyType = 0.03; break;
        case BodyType::Lean:     bodyType = -0.02; break;
        case BodyType::Lanky:    bodyType = -0.03; break;
        default: break;
    }
    return clampd(at.defense.blocking / 500.0 + at.mental.experience / 1000.0 + bodyType, 0.0, 0.3);
}

double BasicDamageCalculator::calculateDamage(const PunchOutcome& hit, const Fighter& attacker, const Fighter& target) {
    const double base = std::isfinite(hit.damage) ? std::max(0.0, hit.damage) : 0.0;
    const double resistanceMod = 1.0 - calculateResistance(target);
    const double chinMod =
        (hit.location == TargetLocation::Head) ? 1.0 + (1.0 - target.attributes().mental.chin / 100.0) : 1.0;

    const double retention = attacker.attributes().power.punchingStamina / 100.0;
    const double stamina = attacker.getStaminaPercent();
    const double staminaMod = (stamina < 0.5) ? 1.0 - (0.5 - stamina) * (1.0 - retention) : 1.0;

    return std::max(1.0, std::round(base * resistanceMod * chinMod * staminaMod));
}

double BasicDamageCalculator::hurtChance(const Fighter& target, double damage) {
    const double headPct = target.getHeadDamagePercent();
    const double threshold = 5.0 * (1.0 - headPct * 0.25);
    if (!std::isfinite(damage) || damage < threshold) return 0.0;

    const MentalAttributes& m = target.attributes().mental;
    double p = 0.25 + (damage / threshold - 1.0) * 0.3;
    p *= 1.0 - (m.chin - 70.0) / 100.0 * 0.4;
    p *= 1.0 - (m.composure - 70.0) / 300.0;
    if (headPct > 0.4) p *= 1.2 + (headPct - 0.4) * 0.8;

    const double stamina = target.getStaminaPercent();
    if (stamina < 0.3) p *= 1.3;
    else if (stamina < 0.5) p *= 1.15;

    return clampd(p, 0.10, 0.60);
}

bool BasicDamageCalculator::checkHurt(const Fighter& target, double damage, Rng& rng) {
    const double p = hurtChance(target, damage);
    if (p <= 0.0) return false;
    return rng.u01() < p;
}

// ============================================================
// BasicStaminaManager
// ============================================================

double BasicStaminaManager::punchCost(PunchType p) {
    switch (p) {
        case PunchType::Jab:          return 0.35;
        case PunchType::Cross:        return 0.80;
        case PunchType::LeadHook:     return 0.70;
        case PunchType::RearHook:     return 0.95;
        case PunchType::LeadUppercut: return 0.65;
        case PunchType::RearUppercut: return 1.0;
        case PunchType::BodyJab:      return 0.40;
        case PunchType::BodyCross:    return 0.85;
        case PunchType::BodyHookLead: return 0.75;
        case PunchType::BodyHookRear: return 1.0;
        default:                      return 2.0;
    }
}

double BasicStaminaManager::calculateCost(const Fighter& fighter, const Decision& decision, double dt) const {
    double cost = kBaselineDrain * dt;

    const Action& a = decision.action;
    switch (a.type) {
        case ActionType::Punch:
            cost += punchCost(a.punch);
            break;
        case ActionType::Combination: {
            for (PunchType p : a.combination) cost += punchCost(p);
            static const double kComboExtra[6] = {0.0, 0.0, 0.15, 0.35, 0.60, 1.0};
            cost += kComboExtra[std::min<std::size_t>(5, a.combination.size())];
            break;
        }
        case ActionType::Block:
            cost += 0.1 * 0.5;
            break;
        case ActionType::Evade:
            cost += 0.2 * 0.5;
            break;
        case ActionType::Move:
            if (a.cutting) cost += 0.2 * 0.5;
            else if (a.direction == MoveDirection::Left || a.direction == MoveDirection::Right) cost += 0.1 * 0.5;
            else if (a.direction == MoveDirection::Backward) cost += 0.05 * 0.5;
            else cost += 0.08 * 0.5;
            break;
        case ActionType::Clinch:
            cost += kClinchInitiation;
            break;
        default:
            break;
    }

    // Ongoing posture cost.
    if (fighter.state() == FighterState::Defensive) {
        switch (fighter.subState()) {
            case SubState::HighGuard:    cost += 0.10 * dt; break;
            case SubState::PhillyShell:  cost += 0.05 * dt; break;
            case SubState::HeadMovement: cost += 0.20 * dt; break;
            case SubState::Distance:     cost += 0.08 * dt; break;
            case SubState::Parrying:     cost += 0.15 * dt; break;
            default: break;
        }
    } else if (fighter.state() == FighterState::Moving) {
        cost += kMovingDrain * dt * 0.5;
    } else if (fighter.state() == FighterState::Clinch) {
        cost += kClinchHolding * dt;
    }

    if (fighter.isHurt()) cost += kHurtDrain * dt;

    const StaminaAttributes& s = fighter.attributes().stamina;
    cost *= std::max(0.50, 1.0 - (s.workRate - 50.0) * 0.012);
    cost *= std::max(0.70, 1.0 - (s.paceControl - 50.0) * 0.0075);
    cost *= std::max(0.80, 1.0 - (s.cardio - 50.0) * 0.005);
    cost *= 1.0 + fighter.bodyDamage() / 120.0;
    cost *= 1.0 + (1.0 - fighter.getStaminaPercent()) * 0.4;

    return std::max(cost, kMinimumDrain * dt);
}

double BasicStaminaManager::recoveryCeilingEfficiency(double pct) {
    if (pct <= 0.50) return 1.0;
    if (pct <= 0.70) return 1.0 - (pct - 0.50) * 1.0;
    if (pct <= 0.85) return 0.8 - (pct - 0.70) * 2.67;
    if (pct <= 0.95) return 0.4 - (pct - 0.85) * 3.0;
    return std::max(0.0, 0.1 - (pct - 0.95) * 2.0);
}

double BasicStaminaManager::ageRecoveryModifier(double age) {
    if (age <= 25.0) return 1.0;
    if (age <= 30.0) return 0.95;
    if (age <= 32.0) return 0.90;
    if (age <= 35.0) return 0.82;
    if (age <= 38.0) return 0.72;
    return 0.60;
}

double BasicStaminaManager::calculateRecovery(const Fighter& fighter, double dt) const {
    if (fighter.isHurt() || fighter.state() == FighterState::Hurt) return 0.0;

    double stateMod = 0.0;
    switch (fighter.state()) {
        case FighterState::Neutral:   stateMod = 1.0; break;
        case FighterState::Timing:    stateMod = 0.6; break;
        case FighterState::Moving:    stateMod = 0.4; break;
        case FighterState::Offensive: stateMod = 0.2; break;
        case FighterState::Clinch:    stateMod = 1.5; break;
        case FighterState::Defensive:
            switch (fighter.subState()) {
                case SubState::HighGuard:    stateMod = 0.9; break;
                case SubState::PhillyShell:  stateMod = 1.0; break;
                case SubState::HeadMovement: stateMod = 0.4; break;
                case SubState::Distance:     stateMod = 0.7; break;
                case SubState::Parrying:     stateMod = 0.5; break;
                default:                     stateMod = 0.9; break;
            }
            break;
        default:
            stateMod = 0.0;
            break;
    }

    const StaminaAttributes& s = fighter.attributes().stamina;
    const double attributeBonus =
        1.0 + std::min(0.35, (s.paceControl - 50.0) * 0.005 + (s.recoveryRate - 50.0) * 0.005);

    const double recovery = s.cardio * 0.008 * stateMod * attributeBonus * (1.0 - fighter.bodyDamage() / 150.0) *
                            (1.0 - fighter.headDamage() / 300.0) * ageRecoveryModifier(fighter.profile().physical.age) *
                            recoveryCeilingEfficiency(fighter.getStaminaPercent()) * dt;
    return std::max(0.0, recovery);
}

void BasicStaminaManager::update(Fighter& fighter, const Decision& decision, double tickRate) {
    if (!std::isfinite(tickRate) || tickRate <= 0.0) return;
    fighter.spendStamina(calculateCost(fighter, decision, tickRate));
    fighter.recoverStamina(calculateRecovery(fighter, tickRate));
}

double BasicStaminaManager::calculateHitStaminaCost(double damage, TargetLocation location) const {
    double cost = 0.3 + std::max(0.0, damage) * 0.02;
    if (location == TargetLocation::Body) cost *= 1.5;
    return cost;
}

double BasicStaminaManager::calculateMissStaminaCost(PunchType punch) const {
    return punchCost(punch) * kMissCostShare;
}

} // namespace ringsim
