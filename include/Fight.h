#pragma once

#include <array>
#include <string>
#include <vector>

#include "Fighter.h"
#include "Judge.h"
#include "ModelParameters.h"
#include "Referee.h"
#include "Rng.h"
#include "Round.h"

namespace ringsim {

enum class HomeCorner { None, A, B };

struct FightConfig {
    std::string type = "non_title";
    int rounds = 10;
    double roundDuration_s = 180.0;
    double restDuration_s = 60.0;
    double tickRate_s = 0.5;

    bool mandatoryEightCount = true;
    bool threeKnockdownRule = false;

    HomeCorner homeFighter = HomeCorner::None;

    // Throws std::invalid_argument for non-positive rounds, durations or tick rate.
    void validate() const;
};

enum class FightStatus { NotStarted, InProgress, BetweenRounds, Stopped, Completed };

enum class ResultMethod {
    KO,
    TKO_Referee,
    TKO_Corner,
    TKO_Doctor,
    TKO_Injury,
    TKO_ThreeKnockdowns,
    DecisionUnanimous,
    DecisionSplit,
    DecisionMajority,
    DrawUnanimous,
    DrawSplit,
    DrawMajority,
    NoContest,
    Disqualification
};

const char* toString(FightStatus s);
const char* toString(ResultMethod m);

bool isDecision(ResultMethod m);
bool isDraw(ResultMethod m);
bool isStoppage(ResultMethod m);

struct ScorecardRound {
    int round = 0;
    int scoreA = 0;
    int scoreB = 0;
};

struct Scorecard {
    std::string judge;
    std::vector<ScorecardRound> rounds{};
    int totalA = 0;
    int totalB = 0;
};

struct ScorecardTotal {
    std::string judge;
    int a = 0;
    int b = 0;
};

// Optional context for how a stoppage happened.
struct FinishDetails {
    bool hasPunch = false;
    PunchType punch = PunchType::Jab;
    double damage = 0.0;
    bool wasCounter = false;
    std::string reason;
};

struct FightResult {
    bool hasWinner = false;
    Side winner = Side::A;
    ResultMethod method = ResultMethod::NoContest;
    int round = 0;
    double time_s = 0.0;
    std::vector<ScorecardTotal> scorecards{}; // decisions only
    FinishDetails finish{};
    int knockdownsInRound = 0;
    int totalKnockdowns = 0;
};

struct CompuboxLine {
    int thrown = 0;
    int landed = 0;
};

struct CompuboxStats {
    std::array<CompuboxLine, 2> total{};
    std::array<CompuboxLine, 2> jabs{};
    std::array<CompuboxLine, 2> power{};
    std::array<double, 2> accuracyPct{{0.0, 0.0}};
    std::array<int, 2> knockdownsScored{{0, 0}};
};

// ============================================================
// Fight aggregate.
//
// Owns the rounds, officials and scorecards; the two fighters are owned by
// the caller and must outlive the fight.
// Status: NotStarted -> InProgress <-> BetweenRounds -> Stopped | Completed.
// ============================================================
class Fight {
public:
    // An empty judge list means the default three-judge panel. Any other
    // panel size throws std::invalid_argument, as does an invalid config.
    Fight(Fighter& a,
          Fighter& b,
          FightConfig config = FightConfig{},
          RefereeProfile referee = RefereeProfile{},
          std::vector<JudgeProfile> judges = std::vector<JudgeProfile>{},
          ModelParameters params = ModelParameters{});

    Fight(const Fight&) = delete;
    Fight& operator=(const Fight&) = delete;

    const FightConfig& config() const noexcept { return config_; }
    const ModelParameters& params() const noexcept { return params_; }
    FightStatus status() const noexcept { return status_; }
    bool isOver() const noexcept {
        return status_ == FightStatus::Stopped || status_ == FightStatus::Completed;
    }

    Fighter& fighter(Side s) { return (s == Side::A) ? a_ : b_; }
    const Fighter& fighter(Side s) const { return (s == Side::A) ? a_ : b_; }
    Fighter& opponent(Side s) { return fighter(opponentOf(s)); }
    const Fighter& opponent(Side s) const { return fighter(opponentOf(s)); }

    // Throws InvalidFighterReference for an id that is in neither corner.
    Side sideOf(const std::string& fighterId) const;

    Referee& referee() noexcept { return referee_; }
    const Referee& referee() const noexcept { return referee_; }
    const std::vector<Judge>& judges() const noexcept { return judges_; }

    // ====================
    // Lifecycle
    // ====================
    // Throws std::logic_error unless NotStarted.
    void start();

    int currentRoundNumber() const noexcept { return currentRound_; }
    Round* getCurrentRound();
    const Round* getCurrentRound() const;
    const std::vector<Round>& rounds() const noexcept { return rounds_; }

    void advanceClock(double dt);
    double totalTime() const noexcept { return totalTime_; }
    double restTime() const noexcept { return restTime_; }
    void advanceRest(double dt);

    // Completes and scores the current round; goes to BetweenRounds or, after
    // the last round, to a decision.
    void endRound(Rng& rng);

    // Throws std::logic_error unless BetweenRounds.
    void startNextRound();

    // No-op once the fight is over.
    void stopFight(ResultMethod method, Side winner, const FinishDetails& details = FinishDetails{});
    void endFightByDecision();

    const FightResult& result() const noexcept { return result_; }

    // ====================
    // Scoring
    // ====================
    const std::vector<Scorecard>& scorecards() const noexcept { return scorecards_; }
    std::vector<ScorecardTotal> getCurrentScores() const;

    // Mean judge total difference from s's point of view.
    double estimatedScoreDiff(Side s) const;

    void addPointDeduction(Side s);
    int pointDeductions(Side s) const { return totalDeductions_[sideIndex(s)]; }

    CompuboxStats getCompuboxStats() const;

private:
    void scoreRound(Round& round, Rng& rng);

    Fighter& a_;
    Fighter& b_;
    FightConfig config_;
    Referee referee_;
    std::vector<Judge> judges_;
    ModelParameters params_;

    FightStatus status_ = FightStatus::NotStarted;
    int currentRound_ = 0;
    std::vector<Round> rounds_{};

    double totalTime_ = 0.0;
    double restTime_ = 0.0;

    std::vector<Scorecard> scorecards_{};
    std::array<int, 2> roundDeductions_{{0, 0}};
    std::array<int, 2> totalDeductions_{{0, 0}};

    FightResult result_{};
};

} // namespace ringsim
