#pragma once

#include <string>
#include <vector>

#include "FighterTypes.h"
#include "ModelParameters.h"
#include "Rng.h"

namespace ringsim {

// ============================================================
// Attribute groups (1..100 scale)
// ============================================================
struct PowerAttributes {
    double powerLeft = 70.0;
    double powerRight = 75.0;
    double knockoutPower = 70.0;
    double bodyPunching = 70.0;
    double punchingStamina = 70.0;
};

struct SpeedAttributes {
    double handSpeed = 70.0;
    double footSpeed = 70.0;
    double reflexes = 70.0;
    double firstStep = 70.0;
    double combinationSpeed = 70.0;
};

struct StaminaAttributes {
    double cardio = 70.0;
    double recoveryRate = 70.0;
    double workRate = 70.0;
    double secondWind = 50.0;
    double paceControl = 60.0;
};

struct DefenseAttributes {
    double headMovement = 65.0;
    double blocking = 70.0;
    double parrying = 60.0;
    double shoulderRoll = 50.0;
    double clinchDefense = 65.0;
    double clinchOffense = 60.0;
    double ringAwareness = 65.0;
};

struct OffenseAttributes {
    double jabAccuracy = 70.0;
    double powerAccuracy = 65.0;
    double bodyAccuracy = 65.0;
    double punchSelection = 65.0;
    double feinting = 55.0;
    double counterPunching = 60.0;
    double combinationPunching = 70.0;
};

struct TechnicalAttributes {
    double footwork = 65.0;
    double distanceManagement = 65.0;
    double insideFighting = 60.0;
    double outsideFighting = 65.0;
    double ringGeneralship = 60.0;
    double adaptability = 60.0;
    double fightIQ = 65.0;
};

struct MentalAttributes {
    double chin = 75.0;
    double heart = 75.0;
    double killerInstinct = 65.0;
    double composure = 65.0;
    double intimidation = 50.0;
    double confidence = 70.0;
    double experience = 60.0;
    double clutchFactor = 60.0;
    double focus = 85.0;
};

struct PhysicalAttributes {
    double height_cm = 180.0;
    double weight_kg = 75.0;
    double reach_cm = 180.0;
    double age = 25.0;
    Stance stance = Stance::Orthodox;
    BodyType bodyType = BodyType::Average;
};

struct StyleProfile {
    std::string primary = "boxer-puncher";
    std::string defensive = "high-guard";
    std::string offensive = "combo-puncher";
};

// Foul propensities (0..100). A dirtiness below 20 never fouls intentionally.
struct FoulTactics {
    double dirtiness = 0.0;
    double headbuttTendency = 0.0;
    double lowBlowTendency = 0.0;
    double rabbitPunchTendency = 0.0;
    double holdingTendency = 0.0;
    double elbowTendency = 0.0;
    double pushTendency = 0.0;
};

struct CornerCrew {
    double strategySkill = 70.0;
    double cutmanSkill = 70.0;
};

// Everything needed to construct a Fighter. Only the name is mandatory.
struct FighterProfile {
    std::string name;
    std::string nickname;

    PhysicalAttributes physical{};
    StyleProfile style{};
    PowerAttributes power{};
    SpeedAttributes speed{};
    StaminaAttributes stamina{};
    DefenseAttributes defense{};
    OffenseAttributes offense{};
    TechnicalAttributes technical{};
    MentalAttributes mental{};
    FoulTactics tactics{};
    CornerCrew corner{};

    // Built-in archetypes: boxer, slugger, swarmer, counterpuncher,
    // journeyman, elite. Throws std::invalid_argument for anything else.
    static FighterProfile preset(const std::string& archetype, const std::string& name);
};

// Attribute snapshot after fatigue, chin and buff/debuff adjustment.
struct AttributeSnapshot {
    PowerAttributes power{};
    SpeedAttributes speed{};
    StaminaAttributes stamina{};
    DefenseAttributes defense{};
    OffenseAttributes offense{};
    TechnicalAttributes technical{};
    MentalAttributes mental{};

    // Decision bias from fight effects, -0.5 (cautious) .. 0.5 (aggressive).
    double aggressionBias = 0.0;
};

// Percentage modifiers; shorthand keys fan out to attribute pairs
// (power -> powerLeft/Right, speed -> hand/footSpeed, accuracy -> jab/power
// accuracy, defense -> headMovement/blocking, vision -> accuracy + headMovement).
// aggression is additive on AttributeSnapshot::aggressionBias, in percent.
struct AttributeModifiers {
    double power = 0.0;
    double speed = 0.0;
    double accuracy = 0.0;
    double defense = 0.0;
    double vision = 0.0;
    double chin = 0.0;
    double aggression = 0.0;
};

struct StatusEffect {
    std::string type;
    AttributeModifiers effects{};
    int remainingTicks = -1; // -1: until explicitly removed
};

struct CutMark {
    std::string location;
    int severity = 1;
};

// Per-round / per-fight counters owned by the fighter.
struct FighterLedger {
    int punchesThrown = 0;
    int punchesLanded = 0;
    int jabsThrown = 0;
    int jabsLanded = 0;
    int powerPunchesThrown = 0;
    int powerPunchesLanded = 0;
    int bodyPunchesThrown = 0;
    int bodyPunchesLanded = 0;
    int cleanPunchesLanded = 0;
    double damageDealt = 0.0;
    double damageReceived = 0.0;
    int punchesBlocked = 0;
    int punchesEvaded = 0;
    int knockdownsScored = 0;
    int knockdownsSuffered = 0;
};

class Fighter {
public:
    // Throws std::invalid_argument when profile.name is empty.
    explicit Fighter(const FighterProfile& profile);

    Fighter(const Fighter&) = delete;
    Fighter& operator=(const Fighter&) = delete;
    Fighter(Fighter&&) = delete;
    Fighter& operator=(Fighter&&) = delete;

    // Lowercase name with every non-alphanumeric replaced by '-'.
    static std::string makeId(const std::string& name);

    const std::string& id() const noexcept { return id_; }
    const std::string& name() const noexcept { return profile_.name; }
    const FighterProfile& profile() const noexcept { return profile_; }

    // Combat and decision logic read this, never the base profile.
    const AttributeSnapshot& attributes() const noexcept { return modified_; }

    // ====================
    // State machine
    // ====================
    FighterState state() const noexcept { return state_; }
    SubState subState() const noexcept { return subState_; }

    // Throws InvalidStateTransition when the table forbids the change.
    // Leaving a state drops a sub-state that does not belong to the new one.
    void transitionTo(FighterState next);
    bool canTransitionTo(FighterState next) const { return isValidTransition(state_, next); }

    // Returns false (and leaves the tag unchanged) when the tag does not
    // belong to the current primary state.
    bool setSubState(SubState sub);

    bool isDown() const noexcept {
        return state_ == FighterState::KnockedDown || state_ == FighterState::FlashDown;
    }

    // ====================
    // Stamina
    // ====================
    double stamina() const noexcept { return stamina_; }
    double maxStamina() const noexcept { return maxStamina_; }
    double getStaminaPercent() const;
    StaminaTier getStaminaTier() const;
    void spendStamina(double amount);
    void recoverStamina(double amount);

    // ====================
    // Damage and marks
    // ====================
    double headDamage() const noexcept { return headDamage_; }
    double bodyDamage() const noexcept { return bodyDamage_; }
    double maxHeadDamage() const noexcept { return maxHeadDamage_; }
    double maxBodyDamage() const noexcept { return maxBodyDamage_; }
    double getHeadDamagePercent() const;
    double getBodyDamagePercent() const;

    // Adds clamped damage; body damage also drains stamina (0.5 per point).
    void takeDamage(double amount, TargetLocation location);

    void addCut(const std::string& location, int severity);
    void addSwelling(const std::string& location, int severity);
    const std::vector<CutMark>& cuts() const noexcept { return cuts_; }
    const std::vector<CutMark>& swelling() const noexcept { return swelling_; }
    int worstCutSeverity() const;

    // ====================
    // Hurt / buzzed / stun
    // ====================
    bool isHurt() const noexcept { return isHurt_; }
    double hurtDuration() const noexcept { return hurtDuration_; }
    double hurtElapsed() const noexcept { return hurtElapsed_; }

    // Hurt supersedes buzzed: clears any buzzed state first.
    void setHurt(double duration_s);

    bool isBuzzed() const noexcept { return isBuzzed_; }
    int buzzedSeverity() const noexcept { return buzzedSeverity_; }
    double buzzedDuration() const noexcept { return buzzedDuration_; }
    double buzzedRecoveryRate() const noexcept { return buzzedRecoveryRate_; }

    // No-op while hurt or down. A second call while buzzed compounds.
    void setBuzzed(double damage, PunchType punchType);
    void updateBuzzed(Rng& rng);
    void clearBuzzed();

    bool isStunned() const noexcept { return stunLevel_ > 0; }
    int stunLevel() const noexcept { return stunLevel_; }
    int stunDuration() const noexcept { return stunDuration_; }
    void applyStun(double damage, PunchType punchType);

    // Advances stun by one tick and the hurt timer by tickRate seconds.
    void updateStun(double tickRate);

    bool canThrowPunch(Rng& rng) const;

    double getBuzzedVulnerability() const;
    double getStunVulnerability() const;
    double getTotalVulnerability() const;

    // ====================
    // Buffs / debuffs and the attribute snapshot
    // ====================
    void addBuff(const StatusEffect& effect);
    void addDebuff(const StatusEffect& effect);
    bool removeBuff(const std::string& type);
    bool removeDebuff(const std::string& type);
    bool hasDebuff(const std::string& type) const;
    const std::vector<StatusEffect>& buffs() const noexcept { return buffs_; }
    const std::vector<StatusEffect>& debuffs() const noexcept { return debuffs_; }

    // Decrements timed buffs/debuffs and drops the expired ones.
    void tickStatusEffects();

    void updateModifiedAttributes();

    // Blend of knockout power and killer instinct, 0..100.
    double getFinisherRating(const StoppageParams& p) const;

    // ====================
    // Knockdown counters and statistics
    // ====================
    int knockdownsThisRound() const noexcept { return knockdownsThisRound_; }
    int knockdownsTotal() const noexcept { return knockdownsTotal_; }
    void registerKnockdown();

    const FighterLedger& roundStats() const noexcept { return roundStats_; }
    const FighterLedger& fightStats() const noexcept { return fightStats_; }
    const std::vector<FighterLedger>& roundHistory() const noexcept { return roundHistory_; }

    void recordPunchThrown(PunchType punch);
    void recordPunchLanded(PunchType punch, PunchQuality quality, double damage);
    void recordDamageReceived(double damage);
    void recordPunchBlocked();
    void recordPunchEvaded();
    void recordKnockdownScored();

    // ====================
    // Round boundaries
    // ====================
    void resetForRound();
    void applyBetweenRoundRecovery();
    // Appends the current round's ledger to roundHistory(); the ledger itself is kept.
    void archiveRoundStats();

private:
    void initializeRuntimeState();
    double calculateMaxStamina() const;
    double calculateMaxDamage(TargetLocation location) const;
    void applyFatiguePenalties();
    void applyModifiers(const AttributeModifiers& m);

    FighterProfile profile_;
    std::string id_;
    AttributeSnapshot modified_{};

    FighterState state_ = FighterState::Neutral;
    SubState subState_ = SubState::None;

    double stamina_ = 0.0;
    double maxStamina_ = 0.0;

    double headDamage_ = 0.0;
    double bodyDamage_ = 0.0;
    double maxHeadDamage_ = 0.0;
    double maxBodyDamage_ = 0.0;

    std::vector<CutMark> cuts_{};
    std::vector<CutMark> swelling_{};
    double visionPenalty_ = 0.0;

    bool isHurt_ = false;
    double hurtDuration_ = 0.0;
    double hurtElapsed_ = 0.0;

    bool isBuzzed_ = false;
    int buzzedSeverity_ = 0;
    double buzzedDuration_ = 0.0;
    double buzzedRecoveryRate_ = 1.0;

    int stunLevel_ = 0;
    int stunDuration_ = 0;

    std::vector<StatusEffect> buffs_{};
    std::vector<StatusEffect> debuffs_{};

    int knockdownsThisRound_ = 0;
    int knockdownsTotal_ = 0;

    FighterLedger roundStats_{};
    FighterLedger fightStats_{};
    std::vector<FighterLedger> roundHistory_{};
};

} // namespace ringsim
