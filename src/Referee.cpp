#include "Referee.h"

#include "Fighter.h"

#include <cmath>
#include <stdexcept>
#include <utility>
#include <vector>

namespace ringsim {

namespace {

// Seconds past the break time during which a WORK warning is still given.
constexpr double kWorkWindow_s = 1.0;

struct CommandPhrases {
    const char* type;
    std::vector<const char*> variations;
};

const std::vector<CommandPhrases>& commandTable() {
    static const std::vector<CommandPhrases> table = {
        {"BREAK", {"Break!", "Break it up!", "Step back!", "Separate!"}},
        {"WORK", {"Let's work!", "Work out of there!", "Keep it moving!", "Box!"}},
        {"STOP", {"Stop!", "That's it!", "Stop the fight!"}},
        {"WARNING", {"Watch it!", "I'm warning you!", "Keep it clean!", "No holding!"}},
        {"POINT", {"I'm taking a point!", "Point deducted!"}},
        {"TIME", {"Time!", "Hold on!", "Stop the clock!"}},
        {"BOX", {"Box!", "Continue!", "Fight!"}},
    };
    return table;
}

} // namespace

RefereeProfile RefereeProfile::preset(const std::string& type) {
    RefereeProfile p;
    if (type == "default") {
        p.name = "Steve Smoger";
        p.attributes.experience = 80.0;
        p.attributes.attentiveness = 80.0;
    } else if (type == "strict") {
        p.name = "Mills Lane";
        p.attributes.experience = 90.0;
        p.attributes.attentiveness = 85.0;
        p.tendencies.clinchTolerance = 2.0;
        p.tendencies.foulStrictness = 0.8;
        p.tendencies.stoppageThreshold = 0.5;
        p.tendencies.keepsFightMoving = 0.9;
    } else if (type == "lenient") {
        p.name = "Joe Cortez";
        p.attributes.experience = 85.0;
        p.attributes.attentiveness = 75.0;
        p.tendencies.clinchTolerance = 5.0;
        p.tendencies.foulStrictness = 0.3;
        p.tendencies.stoppageThreshold = 0.7;
        p.tendencies.protectiveness = 0.3;
    } else if (type == "protective") {
        p.name = "Kenny Bayless";
        p.attributes.experience = 88.0;
        p.attributes.attentiveness = 90.0;
        p.tendencies.stoppageThreshold = 0.4;
        p.tendencies.protectiveness = 0.8;
    } else {
        throw std::invalid_argument("unknown referee preset: '" + type + "'");
    }
    return p;
}

Referee::Referee(RefereeProfile profile)
    : profile_(std::move(profile)) {
    const RefereeTendencies& t = profile_.tendencies;
    if (!std::isfinite(t.clinchTolerance) || t.clinchTolerance <= 0.0) {
        throw std::invalid_argument("Referee clinchTolerance must be positive");
    }
    if (!std::isfinite(t.clinchBreakSpeed) || t.clinchBreakSpeed <= 0.0) {
        throw std::invalid_argument("Referee clinchBreakSpeed must be positive");
    }
    if (!std::isfinite(t.protectiveness) || t.protectiveness < 0.0 || t.protectiveness > 1.0) {
        throw std::invalid_argument("Referee protectiveness must be within [0, 1]");
    }
}

ClinchDecision Referee::checkClinchBreak(double clinchDuration_s,
                                         const Fighter& a,
                                         const Fighter& b,
                                         Rng& rng) {
    ClinchDecision out;
    if (!std::isfinite(clinchDuration_s) || clinchDuration_s < 0.0) return out;

    double breakTime = profile_.tendencies.clinchTolerance * 0.5;

    // Protect a hurt fighter.
    if (a.isHurt() || b.isHurt()) {
        breakTime *= 0.5;
    }

    // Two tired fighters get a little longer.
    const double avgStamina = (a.getStaminaPercent() + b.getStaminaPercent()) * 0.5;
    if (avgStamina < 0.3) {
        breakTime *= 1.2;
    }

    breakTime *= 0.8 + (profile_.attributes.experience / 100.0) * 0.4;
    breakTime *= 0.8 + rng.u01() * 0.4;

    if (clinchDuration_s < breakTime) return out;

    if (!clinchWarningIssued_ && clinchDuration_s < breakTime + kWorkWindow_s) {
        clinchWarningIssued_ = true;
        out.call = ClinchCall::Work;
        out.delay_s = 0.5;
        return out;
    }

    out.call = ClinchCall::Break;
    out.delay_s = 0.3 / profile_.tendencies.clinchBreakSpeed;
    return out;
}

StoppageDecision Referee::checkStoppage(const Fighter& fighter,
                                        const Fighter& opponent,
                                        const StoppageSituation& situation) const {
    StoppageDecision out;

    // Never stop a fighter who is clearly winning.
    if (situation.scoreDiff > 2.0) return out;

    double score = 0.0;

    const double head = fighter.getHeadDamagePercent();
    if (head > 0.8) score += 0.4;
    else if (head > 0.6) score += 0.2;
    if (fighter.getBodyDamagePercent() > 0.9) score += 0.2;

    if (fighter.isHurt()) {
        score += 0.3;
        if (fighter.hurtElapsed() > 5.0) score += 0.2;
        if (fighter.hurtElapsed() > 10.0) score += 0.3;
    }

    if (fighter.knockdownsThisRound() >= 2) score += 0.3;
    if (fighter.knockdownsTotal() >= 3) score += 0.2;

    // One-sided beating.
    const int landed = fighter.roundStats().punchesLanded;
    const int taken = opponent.roundStats().punchesLanded;
    if (taken > 20 && landed < 5) score += 0.2;

    if (fighter.getStaminaPercent() < 0.1) score += 0.15;

    const double threshold = profile_.tendencies.stoppageThreshold *
                             (1.0 - profile_.tendencies.protectiveness * 0.3);
    if (score >= threshold) {
        out.shouldStop = true;
        out.reason = determineStoppageReason(fighter);
    }
    return out;
}

std::string Referee::determineStoppageReason(const Fighter& fighter) const {
    if (fighter.knockdownsThisRound() >= 3) return "three_knockdowns";
    if (fighter.isHurt() && fighter.hurtElapsed() > 10.0) return "not_defending";
    if (fighter.getHeadDamagePercent() > 0.85) return "accumulated_damage";
    return "referee_stoppage";
}

RefereeCommand Referee::issueCommand(const std::string& type, Rng& rng) const {
    RefereeCommand out;
    out.type = type;
    out.referee = profile_.name;
    out.text = type;
    for (const auto& entry : commandTable()) {
        if (type == entry.type) {
            out.text = entry.variations[static_cast<std::size_t>(rng.pickIndex(static_cast<int>(entry.variations.size())))];
            break;
        }
    }
    return out;
}

double Referee::getSkill() const {
    const RefereeAttributes& a = profile_.attributes;
    return (a.experience + a.attentiveness + a.fairness + a.positioning) / 4.0;
}

} // namespace ringsim
