#pragma once

#include <string>

#include "Rng.h"

namespace ringsim {

class Fighter;

// Referee attributes (0..100).
struct RefereeAttributes {
    double experience = 75.0;
    double attentiveness = 80.0;
    double fairness = 85.0;
    double positioning = 75.0;
    double commandPresence = 80.0;
};

struct RefereeTendencies {
    double clinchTolerance = 3.0;   // 1..10, higher waits longer
    double clinchBreakSpeed = 1.0;
    double stoppageThreshold = 0.6; // 0..1
    double protectiveness = 0.5;    // 0..1
    double countSpeed = 1.0;
    double foulStrictness = 0.5;    // 0 lenient, 1 strict
    bool warningFirst = true;
    double keepsFightMoving = 0.7;
};

struct RefereeProfile {
    std::string name = "Referee";
    RefereeAttributes attributes{};
    RefereeTendencies tendencies{};

    // default, strict, lenient, protective. Throws std::invalid_argument otherwise.
    static RefereeProfile preset(const std::string& type);
};

enum class ClinchCall { None, Work, Break };

struct ClinchDecision {
    ClinchCall call = ClinchCall::None;
    double delay_s = 0.0;
};

struct StoppageSituation {
    double scoreDiff = 0.0; // positive: the evaluated fighter leads
};

struct StoppageDecision {
    bool shouldStop = false;
    std::string reason; // three_knockdowns, not_defending, accumulated_damage, referee_stoppage
};

struct RefereeCommand {
    std::string type;
    std::string text;
    std::string referee;
};

class Referee {
public:
    explicit Referee(RefereeProfile profile = RefereeProfile{});

    const RefereeProfile& profile() const noexcept { return profile_; }
    const std::string& name() const noexcept { return profile_.name; }
    double protectiveness() const noexcept { return profile_.tendencies.protectiveness; }

    // WORK (once) slightly past the break time, BREAK beyond that.
    ClinchDecision checkClinchBreak(double clinchDuration_s,
                                    const Fighter& a,
                                    const Fighter& b,
                                    Rng& rng);
    void resetClinch() noexcept { clinchWarningIssued_ = false; }
    bool clinchWarningIssued() const noexcept { return clinchWarningIssued_; }

    StoppageDecision checkStoppage(const Fighter& fighter,
                                   const Fighter& opponent,
                                   const StoppageSituation& situation) const;

    // BREAK, WORK, STOP, WARNING, POINT, TIME, BOX; anything else echoes itself.
    RefereeCommand issueCommand(const std::string& type, Rng& rng) const;

    // Mean of experience, attentiveness, fairness and positioning.
    double getSkill() const;

private:
    std::string determineStoppageReason(const Fighter& fighter) const;

    RefereeProfile profile_;
    bool clinchWarningIssued_ = false;
};

} // namespace ringsim
