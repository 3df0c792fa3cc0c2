#pragma once

#include <array>
#include <string>
#include <vector>

#include "FighterTypes.h"

namespace ringsim {

// Landed punches above this much damage count as significant strikes.
constexpr double kSignificantStrikeDamage = 15.0;

// Per-fighter counters for one round.
struct RoundStats {
    // Punches
    int punchesThrown = 0;
    int punchesLanded = 0;
    int jabsThrown = 0;
    int jabsLanded = 0;
    int powerPunchesThrown = 0;
    int powerPunchesLanded = 0;
    int bodyPunchesThrown = 0;
    int bodyPunchesLanded = 0;
    int headPunchesThrown = 0;
    int headPunchesLanded = 0;

    // Quality
    int cleanPunchesLanded = 0;
    int partialPunchesLanded = 0;
    int punchesBlocked = 0;
    int punchesMissed = 0; // thrown at this fighter and missed outright
    int punchesEvaded = 0;

    // Damage
    double damageDealt = 0.0;
    double damageReceived = 0.0;
    int significantStrikesLanded = 0;

    // Position / activity (seconds)
    double forwardMovementTime = 0.0;
    double backwardMovementTime = 0.0;
    double centerControlTime = 0.0;
    double ropeTime = 0.0;
    double cornerTime = 0.0;
    double clinchTime = 0.0;
    int clinchesInitiated = 0;
};

struct KnockdownRecord {
    double time = 0.0;
    PunchType punch = PunchType::Jab;
    int recoveryCount = 0;
};

struct JudgeRoundScore {
    std::string judge;
    int scoreA = 10;
    int scoreB = 10;
};

struct RoundEvent {
    std::string type;
    double time = 0.0;
    Side side = Side::A;
    std::string detail;
};

struct RoundSideSummary {
    int punchesThrown = 0;
    int punchesLanded = 0;
    double accuracy = 0.0;
    int powerThrown = 0;
    int powerLanded = 0;
    int knockdowns = 0;
};

struct RoundSummary {
    int round = 0;
    double duration = 0.0;
    bool complete = false;
    std::string stoppageReason;
    std::array<RoundSideSummary, 2> sides{};
    std::vector<JudgeRoundScore> scores{};
};

// ============================================================
// Round ledger.
//
// Created at round start, mutated only while the round runs and frozen once
// the bell sounds or the round is stopped. Recording calls on a completed
// round are ignored.
// ============================================================
class Round {
public:
    // Throws std::invalid_argument for number < 1 or a non-positive duration.
    Round(int number, double duration_s);

    int number() const noexcept { return number_; }
    double duration() const noexcept { return duration_; }
    double currentTime() const noexcept { return currentTime_; }
    bool isComplete() const noexcept { return complete_; }
    bool wasStopped() const noexcept { return stopped_; }
    double stoppageTime() const noexcept { return stoppageTime_; }
    const std::string& stoppageReason() const noexcept { return stoppageReason_; }

    // Advances the clock; completes the round once duration is reached.
    // Non-finite or non-positive dt is ignored.
    void tick(double dt);

    void complete();
    void stop(const std::string& reason, double time_s);

    const RoundStats& stats(Side s) const { return stats_[sideIndex(s)]; }
    const std::vector<KnockdownRecord>& knockdowns(Side s) const { return knockdowns_[sideIndex(s)]; }
    int knockdownCount(Side s) const { return static_cast<int>(knockdowns_[sideIndex(s)].size()); }
    const std::vector<RoundEvent>& events() const noexcept { return events_; }

    // ====================
    // Recording
    // ====================
    void recordPunchThrown(Side attacker, PunchType punch);

    // Also credits damageReceived to the opponent.
    void recordPunchLanded(Side attacker, PunchType punch, PunchQuality quality, double damage);
    void recordPunchBlocked(Side defender);
    void recordPunchEvaded(Side defender);

    // Credits the miss to the target's ledger.
    void recordPunchMissed(Side attacker);

    void recordKnockdown(Side downed, PunchType punch, int recoveryCount);
    void recordClinch(Side initiator, double duration_s);
    void recordPositionTime(Side s, bool inCenter, bool onRopes, bool inCorner, double dt);
    void recordMovementTime(Side s, bool forward, bool backward, double dt);
    void addEvent(const std::string& type, Side side, const std::string& detail = std::string());

    // ====================
    // Scoring
    // ====================
    void setScores(std::vector<JudgeRoundScore> scores);
    const std::vector<JudgeRoundScore>& scores() const noexcept { return scores_; }

    double getAccuracy(Side s) const;
    double getJabAccuracy(Side s) const;
    double getPowerAccuracy(Side s) const;

    // Stats-only heuristic (not judge scoring).
    double calculateRoundScore(Side s) const;

    // Winner by calculateRoundScore; no winner when the margin is below 5.
    bool getStatsWinner(Side& winner, double& margin) const;

    RoundSummary getSummary() const;

private:
    RoundStats& mut(Side s) { return stats_[sideIndex(s)]; }

    int number_ = 1;
    double duration_ = 180.0;
    double currentTime_ = 0.0;
    bool complete_ = false;
    bool stopped_ = false;
    double stoppageTime_ = 0.0;
    std::string stoppageReason_;

    std::array<RoundStats, 2> stats_{};
    std::array<std::vector<KnockdownRecord>, 2> knockdowns_{};
    std::vector<RoundEvent> events_{};
    std::vector<JudgeRoundScore> scores_{};
};

} // namespace ringsim
