#pragma once

#include <array>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include "Fight.h"
#include "FighterTypes.h"
#include "FoulPolicy.h"

namespace ringsim {

// ============================================================
// Engine event channel.
//
// Every observable change the orchestrator makes is published as one
// FightEvent value. Sinks receive a const reference and may copy it; the
// engine never reads anything back from a sink.
// ============================================================

enum class EventType : std::uint8_t {
    FightStart = 0,
    RoundStart,
    RoundEnd,
    Tick,
    PunchLanded,
    Knockdown,
    FlashKnockdown,
    Count,
    Recovery,
    Hurt,
    Buzzed,
    Cut,
    Foul,
    PointDeduction,
    RefereeCommand,
    Intimidation,
    BigFight,
    FastStart,
    FightEnding,
    FightEnd
};

const char* toString(EventType t);

// Condition of one fighter at the moment an event was emitted.
struct FighterSnapshot {
    std::string name;
    FighterState state = FighterState::Neutral;
    SubState subState = SubState::None;

    double stamina = 0.0;
    double maxStamina = 0.0;
    double staminaPercent = 0.0;
    StaminaTier staminaTier = StaminaTier::Fresh;

    double headDamage = 0.0;
    double bodyDamage = 0.0;
    double headDamagePercent = 0.0;
    double bodyDamagePercent = 0.0;

    int knockdownsRound = 0;
    int knockdownsTotal = 0;

    bool isHurt = false;
    bool isBuzzed = false;
    int buzzedSeverity = 0;
    bool isStunned = false;
    int stunLevel = 0;

    int cuts = 0;
    int swelling = 0;

    double x_ft = 0.0;
    double y_ft = 0.0;
    double momentum = 0.0;

    int punchesThrown = 0;
    int punchesLanded = 0;
    double damageDealt = 0.0;
};

FighterSnapshot snapshotOf(const Fighter& f, double x_ft, double y_ft, double momentum);

// One engine event. Fields that do not apply to a type keep their defaults;
// the per-type payload is:
//   FIGHT_START      fighters, text = config type, count = scheduled rounds
//   ROUND_START      round
//   ROUND_END        round, summary, scorecards
//   TICK             round, time, fighters, distance
//   PUNCH_LANDED     side (attacker), other (target), punch, location, damage, quality, isCounter
//   KNOCKDOWN        side (downed), other (attacker), punch
//   FLASH_KNOCKDOWN  side (downed), other (attacker), punch
//   COUNT            side, count, isKO
//   RECOVERY         side, count
//   HURT             side, duration
//   BUZZED           side, severity, duration
//   CUT              side, text = location, severity
//   FOUL             side (attacker), other (target), foul, detected, consequence
//   POINT_DEDUCTION  side, text = reason, count = total
//   REFEREE_COMMAND  text = command text, detail = command type
//   INTIMIDATION     side (intimidated), other (intimidator)
//   BIG_FIGHT        side
//   FAST_START       side
//   FIGHT_ENDING     hasWinner, winner, method, isKO
//   FIGHT_END        hasWinner, winner, method, round, time, scorecards
struct FightEvent {
    EventType type = EventType::Tick;
    int round = 0;
    double roundTime_s = 0.0;
    double totalTime_s = 0.0;

    Side side = Side::A;
    Side other = Side::B;

    PunchType punch = PunchType::Jab;
    TargetLocation location = TargetLocation::Head;
    PunchQuality quality = PunchQuality::Clean;
    double damage = 0.0;
    bool isCounter = false;

    int count = 0;
    bool isKO = false;
    double duration_s = 0.0;
    int severity = 0;

    FoulType foul = FoulType::Push;
    bool detected = false;
    FoulConsequence consequence = FoulConsequence::None;

    std::string text;
    std::string detail;

    bool hasWinner = false;
    Side winner = Side::A;
    ResultMethod method = ResultMethod::NoContest;

    std::vector<ScorecardTotal> scorecards{};
    RoundSummary summary{};

    bool hasFighters = false;
    std::array<FighterSnapshot, 2> fighters{};
    double distance_ft = 0.0;
};

// Folds the deterministic part of an event into a running CRC32.
std::uint32_t crc32AddEvent(std::uint32_t crc, const FightEvent& e);

class EventSink {
public:
    virtual ~EventSink() = default;
    virtual void onEvent(const FightEvent& e) = 0;
};

// Keeps every event in emission order.
class EventRecorder : public EventSink {
public:
    void onEvent(const FightEvent& e) override { events_.push_back(e); }

    const std::vector<FightEvent>& events() const noexcept { return events_; }
    std::size_t size() const noexcept { return events_.size(); }
    int countOf(EventType t) const;
    void clear() { events_.clear(); }

private:
    std::vector<FightEvent> events_{};
};

// One formatted line per event. TICK lines only in verbose mode.
class StreamEventLogger : public EventSink {
public:
    explicit StreamEventLogger(std::ostream& os, bool verbose = false) : os_(os), verbose_(verbose) {}

    void onEvent(const FightEvent& e) override;

    // Labels used for A and B in log lines; defaults to "A" / "B".
    void setNames(const std::string& a, const std::string& b);

private:
    const std::string& label(Side s) const { return names_[sideIndex(s)]; }

    std::ostream& os_;
    bool verbose_;
    std::array<std::string, 2> names_{{"A", "B"}};
};

} // namespace ringsim
