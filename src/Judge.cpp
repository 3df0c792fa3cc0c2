#include "Judge.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace ringsim {

Judge::Judge(JudgeProfile profile)
    : profile_(std::move(profile)) {
    if (!std::isfinite(profile_.consistency) || profile_.consistency < 0.0 || profile_.consistency > 100.0) {
        throw std::invalid_argument("Judge consistency must be within [0, 100]");
    }
    if (!std::isfinite(profile_.knockdownWeight) || profile_.knockdownWeight <= 0.0) {
        profile_.knockdownWeight = 1.0;
    }
}

std::vector<JudgeProfile> Judge::defaultPanel() {
    std::vector<JudgeProfile> panel(3);

    panel[0].name = "Judge 1";
    panel[0].type = "technical";
    panel[0].preferences = {1.15, 1.2, 0.9, 1.1, 1.0, 0.85};
    panel[0].consistency = 88.0;

    panel[1].name = "Judge 2";
    panel[1].type = "action";
    panel[1].preferences = {0.95, 0.85, 1.2, 0.9, 1.05, 1.15};
    panel[1].consistency = 82.0;

    panel[2].name = "Judge 3";
    panel[2].type = "power";
    panel[2].preferences = {1.1, 0.95, 1.0, 0.95, 1.2, 1.0};
    panel[2].consistency = 85.0;

    return panel;
}

// ============================================================
// The four criteria
// ============================================================

ScoringCriteria Judge::scoreCriteria(const Round& round, Side s, const ScoringParams& p) {
    const RoundStats& own = round.stats(s);
    const RoundStats& opp = round.stats(opponentOf(s));

    ScoringCriteria c;

    // 1. Clean effective punching: damage dominates volume.
    c.cleanPunching = own.cleanPunchesLanded * p.clean_weight +
                      own.powerPunchesLanded * p.power_weight +
                      own.jabsLanded * p.jab_weight +
                      (own.damageDealt / 10.0) * p.damage_per_10_weight +
                      own.significantStrikesLanded * p.significant_weight;

    // 2. Effective aggression: forward time only counts if punches land.
    const double accuracy = round.getAccuracy(s);
    c.effectiveAggression = own.forwardMovementTime * p.forward_time_weight * accuracy +
                            ((own.punchesLanded > opp.punchesLanded) ? p.outland_bonus : 0.0) +
                            ((own.damageDealt > opp.damageDealt) ? p.outdamage_bonus : 0.0) +
                            own.damageDealt / p.aggression_damage_divisor;

    // 3. Ring generalship: backing up hurts far less while winning the exchanges.
    const double backwardPenalty = (own.damageDealt > opp.damageDealt)
                                       ? own.backwardMovementTime * p.backward_penalty_winning
                                       : own.backwardMovementTime * p.backward_penalty_losing;
    c.ringGeneralship = own.centerControlTime * p.center_weight +
                        opp.ropeTime * p.opponent_ropes_weight +
                        opp.cornerTime * p.opponent_corner_weight -
                        backwardPenalty -
                        own.ropeTime * p.own_ropes_penalty -
                        own.cornerTime * p.own_corner_penalty;

    // 4. Defense.
    c.defense = own.punchesBlocked * p.blocked_weight +
                own.punchesEvaded * p.evaded_weight -
                own.damageReceived / p.received_divisor;

    return c;
}

double Judge::weightedTotal(const Round& round, Side s, const ScoringParams& p) const {
    const ScoringCriteria c = scoreCriteria(round, s, p);
    const RoundStats& own = round.stats(s);
    const JudgePreferences& pref = profile_.preferences;

    const double clean = c.cleanPunching * pref.cleanPunching * p.clean_total_scale;
    const double power = own.powerPunchesLanded * pref.powerShots * p.power_total_scale;
    const double volume = own.punchesLanded * pref.volume * p.volume_total_scale;
    const double aggression = c.effectiveAggression * pref.effectiveAggression;
    const double generalship = std::max(0.0, c.ringGeneralship) * pref.ringGeneralship;
    const double defense = std::max(0.0, c.defense) * pref.defense * p.defense_total_scale;

    return clean + power + volume + aggression + generalship + defense;
}

JudgeRoundScore Judge::calculateJudgeScore(const Round& round,
                                           const JudgeContext& ctx,
                                           Rng& rng,
                                           const ScoringParams& p) const {
    double totalA = weightedTotal(round, Side::A, p);
    double totalB = weightedTotal(round, Side::B, p);

    if (profile_.homeBias > 0.0) {
        if (ctx.homeA) totalA *= 1.0 + profile_.homeBias / 100.0;
        if (ctx.homeB) totalB *= 1.0 + profile_.homeBias / 100.0;
    }

    const double diff = totalA - totalB;
    const double absDiff = std::fabs(diff);

    // ====================
    // Base score by band
    // ====================
    double a = 10.0;
    double b = 10.0;
    if (absDiff > p.clear_round_margin) {
        (diff > 0.0 ? b : a) = 9.0;
    } else if (absDiff > p.moderate_round_margin) {
        const bool inconsistent = rng.u01() > profile_.consistency / 100.0;
        const bool wrongCall = inconsistent && rng.u01() < p.wrong_call_chance;
        const bool aWins = wrongCall ? (diff < 0.0) : (diff > 0.0);
        (aWins ? b : a) = 9.0;
    } else {
        const double closeRoll = rng.u01();
        if (closeRoll >= p.close_even_chance) {
            if (diff > p.close_lean_margin) b = 9.0;
            else if (diff < -p.close_lean_margin) a = 9.0;
        }
    }

    // ====================
    // Knockdown override
    // ====================
    const int kdA = round.knockdownCount(Side::A); // A was put down
    const int kdB = round.knockdownCount(Side::B);
    const double w = profile_.knockdownWeight;

    double afterA = (kdA > 0) ? a - kdA * w : a;
    double afterB = (kdB > 0) ? b - kdB * w : b;

    // Dropped while ahead on points: the round goes to the opponent.
    const bool aDroppedWhileWinning = kdA > 0 && diff > 0.0 && kdB == 0;
    const bool bDroppedWhileWinning = kdB > 0 && diff < 0.0 && kdA == 0;
    if (aDroppedWhileWinning) {
        afterA = std::min(afterA, 9.0);
        afterB = 10.0;
    }
    if (bDroppedWhileWinning) {
        afterB = std::min(afterB, 9.0);
        afterA = 10.0;
    }

    afterA -= ctx.pointDeductions[0];
    afterB -= ctx.pointDeductions[1];

    JudgeRoundScore out;
    out.judge = profile_.name;
    out.scoreA = static_cast<int>(std::max(p.score_floor, std::round(afterA)));
    out.scoreB = static_cast<int>(std::max(p.score_floor, std::round(afterB)));
    return out;
}

} // namespace ringsim
