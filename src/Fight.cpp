#include "Fight.h"

#include "Errors.h"

#include <cmath>
#include <stdexcept>
#include <utility>

namespace ringsim {

namespace {

bool positiveFinite(double v) {
    return std::isfinite(v) && v > 0.0;
}

} // namespace

void FightConfig::validate() const {
    if (rounds < 1) {
        throw std::invalid_argument("FightConfig.rounds must be >= 1");
    }
    if (!positiveFinite(roundDuration_s)) {
        throw std::invalid_argument("FightConfig.roundDuration_s must be positive");
    }
    if (!positiveFinite(restDuration_s)) {
        throw std::invalid_argument("FightConfig.restDuration_s must be positive");
    }
    if (!positiveFinite(tickRate_s)) {
        throw std::invalid_argument("FightConfig.tickRate_s must be positive");
    }
}

const char* toString(FightStatus s) {
    switch (s) {
        case FightStatus::NotStarted:    return "NOT_STARTED";
        case FightStatus::InProgress:    return "IN_PROGRESS";
        case FightStatus::BetweenRounds: return "BETWEEN_ROUNDS";
        case FightStatus::Stopped:       return "STOPPED";
        case FightStatus::Completed:     return "COMPLETED";
    }
    return "UNKNOWN";
}

const char* toString(ResultMethod m) {
    switch (m) {
        case ResultMethod::KO:                  return "KO";
        case ResultMethod::TKO_Referee:         return "TKO_REFEREE";
        case ResultMethod::TKO_Corner:          return "TKO_CORNER";
        case ResultMethod::TKO_Doctor:          return "TKO_DOCTOR";
        case ResultMethod::TKO_Injury:          return "TKO_INJURY";
        case ResultMethod::TKO_ThreeKnockdowns: return "TKO_THREE_KNOCKDOWNS";
        case ResultMethod::DecisionUnanimous:   return "DECISION_UNANIMOUS";
        case ResultMethod::DecisionSplit:       return "DECISION_SPLIT";
        case ResultMethod::DecisionMajority:    return "DECISION_MAJORITY";
        case ResultMethod::DrawUnanimous:       return "DRAW_UNANIMOUS";
        case ResultMethod::DrawSplit:           return "DRAW_SPLIT";
        case ResultMethod::DrawMajority:        return "DRAW_MAJORITY";
        case ResultMethod::NoContest:           return "NO_CONTEST";
        case ResultMethod::Disqualification:    return "DISQUALIFICATION";
    }
    return "UNKNOWN";
}

bool isDecision(ResultMethod m) {
    return m == ResultMethod::DecisionUnanimous || m == ResultMethod::DecisionSplit ||
           m == ResultMethod::DecisionMajority;
}

bool isDraw(ResultMethod m) {
    return m == ResultMethod::DrawUnanimous || m == ResultMethod::DrawSplit ||
           m == ResultMethod::DrawMajority;
}

bool isStoppage(ResultMethod m) {
    return !isDecision(m) && !isDraw(m) && m != ResultMethod::NoContest;
}

Fight::Fight(Fighter& a,
             Fighter& b,
             FightConfig config,
             RefereeProfile referee,
             std::vector<JudgeProfile> judges,
             ModelParameters params)
    : a_(a),
      b_(b),
      config_(std::move(config)),
      referee_(std::move(referee)),
      params_(std::move(params)) {
    config_.validate();
    if (&a_ == &b_ || a_.id() == b_.id()) {
        throw std::invalid_argument("Fight needs two distinct fighters");
    }

    if (judges.empty()) {
        judges = Judge::defaultPanel();
    }
    if (judges.size() != 3) {
        throw std::invalid_argument("Fight needs exactly three judges");
    }
    for (auto& j : judges) {
        judges_.emplace_back(std::move(j));
    }
    for (const auto& j : judges_) {
        Scorecard sc;
        sc.judge = j.name();
        scorecards_.push_back(sc);
    }
}

Side Fight::sideOf(const std::string& fighterId) const {
    if (fighterId == a_.id()) return Side::A;
    if (fighterId == b_.id()) return Side::B;
    throw InvalidFighterReference(fighterId);
}

void Fight::start() {
    if (status_ != FightStatus::NotStarted) {
        throw std::logic_error("Fight::start called twice");
    }
    status_ = FightStatus::InProgress;
    currentRound_ = 1;
    rounds_.emplace_back(1, config_.roundDuration_s);
}

Round* Fight::getCurrentRound() {
    return rounds_.empty() ? nullptr : &rounds_.back();
}

const Round* Fight::getCurrentRound() const {
    return rounds_.empty() ? nullptr : &rounds_.back();
}

void Fight::advanceClock(double dt) {
    if (!positiveFinite(dt)) return;
    totalTime_ += dt;
}

void Fight::advanceRest(double dt) {
    if (!positiveFinite(dt)) return;
    restTime_ += dt;
}

void Fight::endRound(Rng& rng) {
    if (status_ != FightStatus::InProgress) return;
    Round* round = getCurrentRound();
    if (!round) return;

    round->complete();
    scoreRound(*round, rng);

    if (currentRound_ >= config_.rounds) {
        endFightByDecision();
    } else {
        status_ = FightStatus::BetweenRounds;
        restTime_ = 0.0;
    }
}

void Fight::startNextRound() {
    if (status_ != FightStatus::BetweenRounds) {
        throw std::logic_error(std::string("Fight::startNextRound from ") + toString(status_));
    }
    ++currentRound_;
    rounds_.emplace_back(currentRound_, config_.roundDuration_s);
    roundDeductions_ = {{0, 0}};
    status_ = FightStatus::InProgress;

    a_.resetForRound();
    b_.resetForRound();
    a_.applyBetweenRoundRecovery();
    b_.applyBetweenRoundRecovery();
}

void Fight::scoreRound(Round& round, Rng& rng) {
    JudgeContext ctx;
    ctx.homeA = (config_.homeFighter == HomeCorner::A);
    ctx.homeB = (config_.homeFighter == HomeCorner::B);
    ctx.pointDeductions = roundDeductions_;

    std::vector<JudgeRoundScore> roundScores;
    roundScores.reserve(judges_.size());
    for (std::size_t i = 0; i < judges_.size(); ++i) {
        const JudgeRoundScore s = judges_[i].calculateJudgeScore(round, ctx, rng, params_.scoring);
        scorecards_[i].rounds.push_back({round.number(), s.scoreA, s.scoreB});
        scorecards_[i].totalA += s.scoreA;
        scorecards_[i].totalB += s.scoreB;
        roundScores.push_back(s);
    }
    round.setScores(std::move(roundScores));
}

void Fight::stopFight(ResultMethod method, Side winner, const FinishDetails& details) {
    if (isOver()) return;
    status_ = FightStatus::Stopped;

    Round* round = getCurrentRound();
    if (round) {
        round->stop(toString(method), round->currentTime());
    }
    a_.archiveRoundStats();
    b_.archiveRoundStats();

    const Fighter& loser = fighter(opponentOf(winner));
    result_ = FightResult{};
    result_.hasWinner = true;
    result_.winner = winner;
    result_.method = method;
    result_.round = currentRound_;
    result_.time_s = round ? round->currentTime() : 0.0;
    result_.finish = details;
    result_.knockdownsInRound = loser.knockdownsThisRound();
    result_.totalKnockdowns = loser.knockdownsTotal();
}

void Fight::endFightByDecision() {
    if (isOver()) return;
    status_ = FightStatus::Completed;
    a_.archiveRoundStats();
    b_.archiveRoundStats();

    const std::vector<ScorecardTotal> finals = getCurrentScores();

    int winsA = 0;
    int winsB = 0;
    int draws = 0;
    for (const auto& s : finals) {
        if (s.a > s.b) ++winsA;
        else if (s.b > s.a) ++winsB;
        else ++draws;
    }

    result_ = FightResult{};
    if (winsA >= 2 || winsB >= 2) {
        const int wins = (winsA >= 2) ? winsA : winsB;
        result_.hasWinner = true;
        result_.winner = (winsA >= 2) ? Side::A : Side::B;
        if (wins == 3) result_.method = ResultMethod::DecisionUnanimous;
        else if (draws == 1) result_.method = ResultMethod::DecisionMajority;
        else result_.method = ResultMethod::DecisionSplit;
    } else {
        result_.hasWinner = false;
        if (draws == 3) result_.method = ResultMethod::DrawUnanimous;
        else if (draws == 2) result_.method = ResultMethod::DrawMajority;
        else result_.method = ResultMethod::DrawSplit;
    }
    result_.round = config_.rounds;
    result_.time_s = config_.roundDuration_s;
    result_.scorecards = finals;
}

std::vector<ScorecardTotal> Fight::getCurrentScores() const {
    std::vector<ScorecardTotal> out;
    out.reserve(scorecards_.size());
    for (const auto& sc : scorecards_) {
        out.push_back({sc.judge, sc.totalA, sc.totalB});
    }
    return out;
}

double Fight::estimatedScoreDiff(Side s) const {
    if (scorecards_.empty()) return 0.0;
    double sum = 0.0;
    for (const auto& sc : scorecards_) {
        sum += static_cast<double>(sc.totalA - sc.totalB);
    }
    const double diffA = sum / static_cast<double>(scorecards_.size());
    return (s == Side::A) ? diffA : -diffA;
}

void Fight::addPointDeduction(Side s) {
    ++roundDeductions_[sideIndex(s)];
    ++totalDeductions_[sideIndex(s)];
}

CompuboxStats Fight::getCompuboxStats() const {
    CompuboxStats out;
    for (Side s : {Side::A, Side::B}) {
        const FighterLedger& st = fighter(s).fightStats();
        const int i = sideIndex(s);
        out.total[i] = {st.punchesThrown, st.punchesLanded};
        out.jabs[i] = {st.jabsThrown, st.jabsLanded};
        out.power[i] = {st.powerPunchesThrown, st.powerPunchesLanded};
        out.accuracyPct[i] = (st.punchesThrown > 0)
                                 ? 100.0 * st.punchesLanded / st.punchesThrown
                                 : 0.0;
        out.knockdownsScored[i] = st.knockdownsScored;
    }
    return out;
}

} // namespace ringsim
