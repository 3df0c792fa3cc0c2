#include "Round.h"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace ringsim {

namespace {

constexpr double kStatsWinnerMargin = 5.0;

double ratio(int num, int den) {
    return (den > 0) ? static_cast<double>(num) / static_cast<double>(den) : 0.0;
}

bool usable(double dt) {
    return std::isfinite(dt) && dt > 0.0;
}

} // namespace

Round::Round(int number, double duration_s)
    : number_(number), duration_(duration_s) {
    if (number < 1) {
        throw std::invalid_argument("Round number must be >= 1");
    }
    if (!usable(duration_s)) {
        throw std::invalid_argument("Round duration must be positive");
    }
}

void Round::tick(double dt) {
    if (complete_ || !usable(dt)) return;
    currentTime_ += dt;
    if (currentTime_ >= duration_) {
        complete();
    }
}

void Round::complete() {
    if (complete_) return;
    complete_ = true;
    events_.push_back({"ROUND_END", currentTime_, Side::A, std::string()});
}

void Round::stop(const std::string& reason, double time_s) {
    if (complete_) return;
    complete_ = true;
    stopped_ = true;
    stoppageTime_ = (std::isfinite(time_s) && time_s > 0.0) ? time_s : currentTime_;
    stoppageReason_ = reason;
    events_.push_back({"ROUND_STOPPED", stoppageTime_, Side::A, reason});
}

void Round::recordPunchThrown(Side attacker, PunchType punch) {
    if (complete_) return;
    RoundStats& s = mut(attacker);
    ++s.punchesThrown;
    if (isJab(punch)) ++s.jabsThrown;
    else ++s.powerPunchesThrown;
    if (isBodyPunch(punch)) ++s.bodyPunchesThrown;
    else ++s.headPunchesThrown;
}

void Round::recordPunchLanded(Side attacker, PunchType punch, PunchQuality quality, double damage) {
    if (complete_) return;
    const double d = (std::isfinite(damage) && damage > 0.0) ? damage : 0.0;

    RoundStats& s = mut(attacker);
    ++s.punchesLanded;
    if (isJab(punch)) ++s.jabsLanded;
    else ++s.powerPunchesLanded;
    if (isBodyPunch(punch)) ++s.bodyPunchesLanded;
    else ++s.headPunchesLanded;

    if (quality == PunchQuality::Clean) ++s.cleanPunchesLanded;
    else ++s.partialPunchesLanded;

    s.damageDealt += d;
    if (d > kSignificantStrikeDamage) ++s.significantStrikesLanded;

    mut(opponentOf(attacker)).damageReceived += d;
}

void Round::recordPunchBlocked(Side defender) {
    if (complete_) return;
    ++mut(defender).punchesBlocked;
}

void Round::recordPunchEvaded(Side defender) {
    if (complete_) return;
    ++mut(defender).punchesEvaded;
}

void Round::recordPunchMissed(Side attacker) {
    if (complete_) return;
    ++mut(opponentOf(attacker)).punchesMissed;
}

void Round::recordKnockdown(Side downed, PunchType punch, int recoveryCount) {
    if (complete_) return;
    knockdowns_[sideIndex(downed)].push_back({currentTime_, punch, recoveryCount});
    events_.push_back({"KNOCKDOWN", currentTime_, downed, toString(punch)});
}

void Round::recordClinch(Side initiator, double duration_s) {
    if (complete_) return;
    ++mut(initiator).clinchesInitiated;
    if (!usable(duration_s)) return;
    stats_[0].clinchTime += duration_s;
    stats_[1].clinchTime += duration_s;
}

void Round::recordPositionTime(Side s, bool inCenter, bool onRopes, bool inCorner, double dt) {
    if (complete_ || !usable(dt)) return;
    RoundStats& st = mut(s);
    if (inCenter) st.centerControlTime += dt;
    if (onRopes) st.ropeTime += dt;
    if (inCorner) st.cornerTime += dt;
}

void Round::recordMovementTime(Side s, bool forward, bool backward, double dt) {
    if (complete_ || !usable(dt)) return;
    RoundStats& st = mut(s);
    if (forward) st.forwardMovementTime += dt;
    if (backward) st.backwardMovementTime += dt;
}

void Round::addEvent(const std::string& type, Side side, const std::string& detail) {
    if (complete_) return;
    events_.push_back({type, currentTime_, side, detail});
}

void Round::setScores(std::vector<JudgeRoundScore> scores) {
    scores_ = std::move(scores);
}

double Round::getAccuracy(Side s) const {
    const RoundStats& st = stats(s);
    return ratio(st.punchesLanded, st.punchesThrown);
}

double Round::getJabAccuracy(Side s) const {
    const RoundStats& st = stats(s);
    return ratio(st.jabsLanded, st.jabsThrown);
}

double Round::getPowerAccuracy(Side s) const {
    const RoundStats& st = stats(s);
    return ratio(st.powerPunchesLanded, st.powerPunchesThrown);
}

double Round::calculateRoundScore(Side s) const {
    const RoundStats& st = stats(s);
    double score = 0.0;

    score += st.cleanPunchesLanded * 3.0;
    score += (st.punchesLanded - st.cleanPunchesLanded) * 1.5;
    score += st.powerPunchesLanded * 1.0;
    score += st.damageDealt * 0.5;
    score += knockdownCount(opponentOf(s)) * 25.0;

    const int faced = stats(opponentOf(s)).punchesThrown;
    if (faced > 0) {
        score += ratio(st.punchesBlocked + st.punchesEvaded, faced) * 10.0;
    }
    return score;
}

bool Round::getStatsWinner(Side& winner, double& margin) const {
    const double a = calculateRoundScore(Side::A);
    const double b = calculateRoundScore(Side::B);
    margin = std::fabs(a - b);
    if (margin < kStatsWinnerMargin) return false;
    winner = (a > b) ? Side::A : Side::B;
    return true;
}

RoundSummary Round::getSummary() const {
    RoundSummary out;
    out.round = number_;
    out.duration = stopped_ ? stoppageTime_ : duration_;
    out.complete = complete_;
    out.stoppageReason = stoppageReason_;
    for (Side s : {Side::A, Side::B}) {
        const RoundStats& st = stats(s);
        RoundSideSummary& d = out.sides[sideIndex(s)];
        d.punchesThrown = st.punchesThrown;
        d.punchesLanded = st.punchesLanded;
        d.accuracy = getAccuracy(s);
        d.powerThrown = st.powerPunchesThrown;
        d.powerLanded = st.powerPunchesLanded;
        d.knockdowns = knockdownCount(s);
    }
    out.scores = scores_;
    return out;
}

} // namespace ringsim
