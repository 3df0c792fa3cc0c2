#include "FoulPolicy.h"

#include "Fighter.h"

#include <cmath>

namespace ringsim {

namespace {

// --------------------
// Tunable constants
// --------------------
constexpr double kCleanDirtiness = 20.0;
constexpr double kBaseChancePerDirtiness = 0.001;
constexpr double kIntentionalDirtiness = 60.0;
constexpr double kIntentionalChance = 0.3;
constexpr int kDeductionsBeforeDQ = 3;

const FoulData kFoulTable[static_cast<int>(FoulType::Count)] = {
    {"Headbutt", 2.0, 8.0, 0.25, 0.60, 2, 0.0, 0.0, "uses head as a weapon"},
    {"Low Blow", 0.0, 2.0, 0.0, 0.80, 1, 15.0, 0.0, "lands a low blow"},
    {"Rabbit Punch", 1.0, 4.0, 0.0, 0.50, 2, 0.0, 0.0, "hits behind the head"},
    {"Excessive Holding", 0.0, 0.0, 0.0, 0.90, 3, 0.0, 5.0, "holds excessively"},
    {"Elbow", 3.0, 10.0, 0.35, 0.70, 1, 0.0, 0.0, "throws an elbow"},
    {"Push", 0.0, 1.0, 0.0, 0.40, 3, 0.0, 0.0, "pushes opponent"},
    {"Hitting After Break", 2.0, 6.0, 0.0, 0.95, 1, 0.0, 0.0, "hits after the break"},
    {"Hitting on Break", 1.0, 4.0, 0.0, 0.85, 2, 0.0, 0.0, "hits during break"},
};

} // namespace

const char* toString(FoulType f) {
    switch (f) {
        case FoulType::Headbutt:          return "headbutt";
        case FoulType::LowBlow:           return "low_blow";
        case FoulType::RabbitPunch:       return "rabbit_punch";
        case FoulType::Holding:           return "holding";
        case FoulType::Elbow:             return "elbow";
        case FoulType::Push:              return "push";
        case FoulType::HittingAfterBreak: return "hitting_after_break";
        case FoulType::HittingOnBreak:    return "hitting_on_break";
        default:                          return "unknown";
    }
}

const char* toString(FoulConsequence c) {
    switch (c) {
        case FoulConsequence::None:             return "none";
        case FoulConsequence::Warning:          return "warning";
        case FoulConsequence::PointDeduction:   return "point_deduction";
        case FoulConsequence::Disqualification: return "disqualification";
    }
    return "unknown";
}

const FoulData& foulData(FoulType f) {
    const int i = static_cast<int>(f);
    if (i < 0 || i >= static_cast<int>(FoulType::Count)) {
        return kFoulTable[static_cast<int>(FoulType::Push)];
    }
    return kFoulTable[i];
}

void FoulPolicy::reset() {
    for (int i = 0; i < 2; ++i) {
        warnings_[i].clear();
        pointDeductions_[i] = 0;
        foulsThisRound_[i].clear();
        totalFouls_[i].clear();
    }
}

void FoulPolicy::resetRound() {
    foulsThisRound_[0].clear();
    foulsThisRound_[1].clear();
}

int FoulPolicy::totalWarnings(Side s) const {
    int total = 0;
    for (const auto& kv : warnings_[sideIndex(s)]) total += kv.second;
    return total;
}

bool FoulPolicy::shouldAttemptFoul(const Fighter& fighter,
                                   Side side,
                                   const FoulSituation& situation,
                                   Rng& rng,
                                   FoulType& out) const {
    const double dirtiness = fighter.profile().tactics.dirtiness;
    if (!std::isfinite(dirtiness) || dirtiness < kCleanDirtiness) return false;

    double chance = dirtiness * kBaseChancePerDirtiness;

    if (situation.scoreDiff < -2.0) chance *= 1.5;       // losing
    if (situation.staminaPercent < 0.4) chance *= 1.3;   // buying a breather
    if (fighter.isHurt() || fighter.isBuzzed()) chance *= 1.4;
    if (situation.distance < 2.0) chance *= 1.5;
    if (situation.round < 3) chance *= 0.5;

    if (totalWarnings(side) >= 2) chance *= 0.6;
    if (pointDeductions_[sideIndex(side)] > 0) chance *= 0.4;

    if (rng.u01() > chance) return false;
    return selectFoulType(fighter, situation, rng, out);
}

bool FoulPolicy::selectFoulType(const Fighter& fighter,
                                const FoulSituation& situation,
                                Rng& rng,
                                FoulType& out) const {
    const FoulTactics& t = fighter.profile().tactics;
    const bool close = situation.distance < 2.0;
    const bool clinch = situation.inClinch || fighter.state() == FighterState::Clinch;

    struct Weighted {
        FoulType type;
        double weight;
    };
    const Weighted weights[] = {
        {FoulType::Headbutt, t.headbuttTendency * (close ? 2.0 : 0.3)},
        {FoulType::LowBlow, t.lowBlowTendency * 1.0},
        {FoulType::RabbitPunch, t.rabbitPunchTendency * (clinch ? 2.0 : 0.5)},
        {FoulType::Holding, t.holdingTendency * (situation.staminaPercent < 0.5 ? 2.0 : 0.8)},
        {FoulType::Elbow, t.elbowTendency * 0.5},
        {FoulType::Push, t.pushTendency * (close ? 1.5 : 0.3)},
    };

    double total = 0.0;
    for (const auto& w : weights) {
        if (std::isfinite(w.weight) && w.weight > 0.0) total += w.weight;
    }
    if (total <= 0.0) return false;

    double roll = rng.u01() * total;
    for (const auto& w : weights) {
        if (!std::isfinite(w.weight) || w.weight <= 0.0) continue;
        roll -= w.weight;
        if (roll <= 0.0) {
            out = w.type;
            return true;
        }
    }
    // Rounding left a sliver; the last positive weight takes it.
    for (int i = static_cast<int>(sizeof(weights) / sizeof(weights[0])) - 1; i >= 0; --i) {
        if (weights[i].weight > 0.0) {
            out = weights[i].type;
            return true;
        }
    }
    return false;
}

FoulResult FoulPolicy::executeFoul(FoulType type,
                                   const Fighter& attacker,
                                   Side side,
                                   double refereeSkill,
                                   Rng& rng) {
    const FoulData& data = foulData(type);
    const int si = sideIndex(side);

    FoulResult r;
    r.type = type;
    r.attacker = side;
    r.damage = data.damageMin + rng.u01() * (data.damageMax - data.damageMin);
    r.staminaDrain = data.staminaDrain;
    r.staminaRecovery = data.staminaRecovery;
    if (data.cutChance > 0.0 && rng.u01() < data.cutChance) {
        r.cutCaused = true;
    }

    const double skill = std::isfinite(refereeSkill) ? refereeSkill : 70.0;
    r.detected = rng.u01() < data.detectChance * (skill / 100.0);
    if (!r.detected) return r;

    foulsThisRound_[si].push_back(type);
    totalFouls_[si].push_back(type);

    const int count = ++warnings_[si][type];

    if (count <= data.warningThreshold) {
        r.consequence = FoulConsequence::Warning;
    } else if (count <= data.warningThreshold + 2) {
        r.consequence = FoulConsequence::PointDeduction;
        ++pointDeductions_[si];
    } else if (pointDeductions_[si] >= kDeductionsBeforeDQ) {
        r.consequence = FoulConsequence::Disqualification;
    } else {
        r.consequence = FoulConsequence::PointDeduction;
        ++pointDeductions_[si];
    }

    // A repeat intentional foul skips the warning.
    if (attacker.profile().tactics.dirtiness > kIntentionalDirtiness && rng.u01() < kIntentionalChance) {
        r.intentional = true;
        if (r.consequence == FoulConsequence::Warning && count > 1) {
            r.consequence = FoulConsequence::PointDeduction;
            ++pointDeductions_[si];
        }
    }

    return r;
}

void FoulPolicy::applyFoulEffects(const FoulResult& result, Fighter& attacker, Fighter& target) {
    if (result.damage > 0.0) {
        target.takeDamage(result.damage, TargetLocation::Head);
    }
    if (result.staminaDrain > 0.0) {
        target.spendStamina(result.staminaDrain);
    }
    if (result.staminaRecovery > 0.0) {
        attacker.recoverStamina(result.staminaRecovery);
    }
}

FoulSummary FoulPolicy::getFoulSummary(Side s) const {
    const int i = sideIndex(s);
    FoulSummary out;
    out.warnings = warnings_[i];
    out.pointDeductions = pointDeductions_[i];
    out.totalFouls = static_cast<int>(totalFouls_[i].size());
    out.foulsThisRound = static_cast<int>(foulsThisRound_[i].size());
    return out;
}

} // namespace ringsim
