#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <vector>

#include "Contracts.h"
#include "Events.h"
#include "Fight.h"
#include "FightEffects.h"
#include "FoulPolicy.h"
#include "Rng.h"

namespace ringsim {

// ============================================================
// Tick-driven fight orchestrator.
//
// Contracts:
// - step() advances exactly one tick (or one rest tick) and never sleeps.
// - Every random draw comes from the loop's Rng, seeded from
//   SimulationOptions::seed; collaborators receive the same instance.
// - Collaborators are non-owning and optional. A missing one falls back to
//   inert behaviour (no combat, flat stamina, fixed 8 ft distance).
// - Sinks see every event in emission order and cannot mutate the fight.
// ============================================================

struct SimulationOptions {
    double tickRate_s = 0.5;
    std::uint32_t seed = 0x5EEDu;
};

struct SimulationCollaborators {
    DecisionSource* decisions = nullptr;
    CombatResolver* combat = nullptr;
    DamageCalculator* damage = nullptr;
    StaminaManager* stamina = nullptr;
    PositionTracker* positions = nullptr;
};

struct RunSignatures {
    std::uint32_t run_param_hash_u32 = 0; // FNV-1a32 over config, profiles and model parameters
    std::uint32_t event_crc_u32      = 0; // CRC32 over the emitted event stream
    std::uint32_t state_digest_u32   = 0; // FNV-1a32 over the current fighter state
};

struct TkoEvaluation {
    bool shouldStop = false;
    ResultMethod method = ResultMethod::TKO_Referee;
    double probability = 0.0;
    std::string reason;
};

class SimulationLoop {
public:
    // Throws std::invalid_argument when options.tickRate_s is not a positive
    // finite number or differs from the fight's configured tick rate.
    SimulationLoop(Fight& fight,
                   const SimulationCollaborators& collaborators = SimulationCollaborators{},
                   const SimulationOptions& options = SimulationOptions{});

    SimulationLoop(const SimulationLoop&) = delete;
    SimulationLoop& operator=(const SimulationLoop&) = delete;

    void setCollaborators(const SimulationCollaborators& c) { parts_ = c; }
    const SimulationCollaborators& collaborators() const noexcept { return parts_; }

    // Non-owning; sinks must outlive the loop. Null is ignored.
    void addSink(EventSink* sink);

    // FIGHT_START, pre-fight effects and ROUND_START 1. Idempotent.
    void start();

    // One tick. Starts the fight on first use. Returns false once the fight
    // is over; FIGHT_END is emitted exactly once.
    bool step();

    // Steps until the fight is over; returns the number of steps taken.
    int runToCompletion();

    bool isStarted() const noexcept { return started_; }
    bool isOver() const { return fight_.isOver(); }
    int tickCount() const noexcept { return tickCount_; }
    const SimulationOptions& options() const noexcept { return opts_; }

    Fight& fight() noexcept { return fight_; }
    const Fight& fight() const noexcept { return fight_; }
    FightEffects& effects() noexcept { return effects_; }
    const FightEffects& effects() const noexcept { return effects_; }
    const FoulPolicy& fouls() const noexcept { return fouls_; }
    Rng& rng() noexcept { return rng_; }

    // Heart-dominant chance to beat the count at `count`; clamped to the
    // recovery min/max in ModelParameters.
    double calculateRecoveryChance(const Fighter& fighter, double damage, int count) const;

    // Chance the fighter never beats the count at all; capped by knockout.cap.
    double calculateImmediateKOChance(const Fighter& fighter, const Fighter& attacker, double damage) const;

    // Chance a flash knockdown is beaten quickly.
    double calculateFlashRecoveryChance(const Fighter& fighter) const;

    // Draws from the Rng when the probability clears the gate.
    TkoEvaluation evaluateTKO(Side s);

    RunSignatures signatures() const;

private:
    // ====================
    // Phases
    // ====================
    void processFightTick();
    void processRestTick();
    void handleRoundEnd();
    void beginNextRound();

    RingContext ringContext() const;
    Decision decide(Side s, const RingContext& ring);
    void processFouls(const RingContext& ring);
    void applyStateUpdate(Side s, const Decision& d);
    void processClinch(const Decision& a, const Decision& b, const RingContext& ring);
    CombatResult resolveCombat(const Decision& a, const Decision& b, const RingContext& ring);
    void recordAttempts(const CombatResult& r, Round& round);
    void applyHits(const CombatResult& r, Round& round);
    void applyMissCosts(const CombatResult& r);
    void updateStamina(const Decision& a, const Decision& b);
    void updatePositions(const Decision& a, const Decision& b, Round& round);
    void handleKnockdown(const KnockdownRequest& kd, const CombatResult& r);
    void checkTKOConditions();
    void endOfTickUpdates();
    void bridgeEffectsToAttributes(Fighter& f);

    void openCut(Side s, const std::string& location, int severity);
    void endClinch();
    void stopFight(ResultMethod method, Side winner, const FinishDetails& details);
    const std::string& cutLocation();

    // ====================
    // Events
    // ====================
    FightEvent makeEvent(EventType type) const;
    FightEvent makeEventWithFighters(EventType type) const;
    FighterSnapshot snapshot(Side s) const;
    void emit(const FightEvent& e);
    void emitCommand(const std::string& type);
    void emitFightEnd();

    Fight& fight_;
    SimulationCollaborators parts_;
    SimulationOptions opts_;
    Rng rng_;
    FightEffects effects_;
    FoulPolicy fouls_;
    std::vector<EventSink*> sinks_;

    bool started_ = false;
    bool endEmitted_ = false;
    int tickCount_ = 0;
    std::uint32_t eventCrc_ = 0u;

    bool clinchActive_ = false;
    Side clinchInitiator_ = Side::A;
    double clinchDuration_s_ = 0.0;
};

} // namespace ringsim
