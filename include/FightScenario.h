#pragma once

#include <cstdint>
#include <string>

#include "Fight.h"
#include "SimulationLoop.h"

namespace ringsim {

class EventSink;

// Everything a batch bout needs besides the two fighters.
struct BoutConfig {
    FightConfig fight{};
    RefereeProfile referee{};
    ModelParameters params{};
};

struct BoutOutcome {
    ResultMethod method = ResultMethod::NoContest;
    bool hasWinner = false;
    Side winner = Side::A;
    int endRound = 0;
    double endTime_s = 0.0;

    // Completed rounds plus the fraction of the round a stoppage ended in.
    double roundsCompleted = 0.0;

    // Head plus body damage taken by both fighters.
    double totalDamage = 0.0;
    int knockdowns = 0;
    int ticks = 0;
    RunSignatures signatures{};

    bool isStoppage() const { return ringsim::isStoppage(method); }
    bool isKoOrTko() const;
    bool isDecision() const { return ringsim::isDecision(method); }
};

// Builds both fighters, the reference collaborators and a ring tracker,
// then runs the bout to completion in batch mode. An optional sink sees
// every event. Throws std::invalid_argument for an invalid profile or config.
BoutOutcome runBout(const FighterProfile& a,
                    const FighterProfile& b,
                    const BoutConfig& config,
                    std::uint32_t seed,
                    EventSink* sink = nullptr);

// Attribute knob by name: heart, chin, knockout_power, cardio, hand_speed.
// Throws std::invalid_argument for anything else.
void setProfileAttribute(FighterProfile& p, const std::string& attribute, double value);
double getProfileAttribute(const FighterProfile& p, const std::string& attribute);

} // namespace ringsim
