#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "FighterTypes.h"
#include "Rng.h"

namespace ringsim {

class Fighter;

enum class EffectType : std::uint8_t {
    // Buffs
    AdrenalineSurge = 0,
    Momentum,
    SecondWind,
    KillerInstinct,
    Rhythm,
    ConfidenceBoost,
    FreshLegs,
    BigFightFocus,
    FastStart,
    // Debuffs
    Cautious,
    Rattled,
    ArmWeary,
    VisionImpaired,
    Desperate,
    Demoralized,
    ShellShocked,
    Gassed,
    Frozen, // intimidated
    HurtHands,
    FocusLapse,
    Count
};

enum class EffectCategory { Buff, Debuff };

const char* toString(EffectType t);
EffectCategory categoryOf(EffectType t);

// Attribute name -> fractional modifier (0.1 = +10% at full intensity).
using EffectModifierMap = std::map<std::string, double>;

struct EffectConfig {
    double intensity = 0.5;  // 0..1
    int duration = 20;       // ticks
    std::string source = "unknown";
    bool stackable = false;
    int maxStacks = 3;
    EffectModifierMap modifiers{};
};

class FightEffect {
public:
    FightEffect(EffectType type, const EffectConfig& cfg);

    EffectType type() const noexcept { return type_; }
    EffectCategory category() const noexcept { return categoryOf(type_); }
    double intensity() const noexcept { return intensity_; }
    int duration() const noexcept { return duration_; }
    int maxDuration() const noexcept { return maxDuration_; }
    int stacks() const noexcept { return stacks_; }
    const std::string& source() const noexcept { return source_; }
    const EffectModifierMap& modifiers() const noexcept { return modifiers_; }
    EffectModifierMap& modifiers() noexcept { return modifiers_; }
    const EffectModifierMap& baseModifiers() const noexcept { return baseModifiers_; }

    // Resets every modifier to scale * its value at creation.
    void scaleModifiersFromBase(double scale);

    double getRemainingPercent() const;

    // intensity * stacks, fading linearly over the last quarter of the duration.
    double getEffectiveIntensity() const;

    // Returns false once expired.
    bool tick();

    // Keeps the stronger intensity, adds a stack when allowed and extends the
    // duration (half the maximum unless an amount is given), capped at max.
    void refresh(double newIntensity, int additionalDuration);

private:
    EffectType type_;
    double intensity_;
    int duration_;
    int maxDuration_;
    std::string source_;
    bool stackable_;
    int stacks_ = 1;
    int maxStacks_;
    EffectModifierMap modifiers_;
    EffectModifierMap baseModifiers_;
};

struct EffectSummaryEntry {
    EffectType type = EffectType::Momentum;
    double intensity = 0.0;
    double remaining = 0.0;
    int stacks = 1;
};

struct EffectsSummary {
    std::vector<EffectSummaryEntry> buffs;
    std::vector<EffectSummaryEntry> debuffs;
    double momentum = 0.0;
};

struct PunchLandedInfo {
    double damage = 0.0;
    PunchType punch = PunchType::Jab;
    bool isCounter = false;
    bool isCritical = false;
};

// ============================================================
// Timed fight modifiers keyed by fighter id.
//
// Every id must be registered first; an unknown id raises
// InvalidFighterReference. Momentum is exclusive between the two
// registered fighters and bounded to [-100, 100].
// ============================================================
class FightEffects {
public:
    FightEffects() = default;

    // At most two fighters; registering a third throws std::logic_error.
    void registerFighter(const std::string& fighterId);
    bool isRegistered(const std::string& fighterId) const;

    void applyEffect(const std::string& fighterId, EffectType type, const EffectConfig& cfg);
    void removeEffect(const std::string& fighterId, EffectType type);
    bool hasEffect(const std::string& fighterId, EffectType type) const;
    const FightEffect* getEffect(const std::string& fighterId, EffectType type) const;
    double getEffectIntensity(const std::string& fighterId, EffectType type) const;
    std::vector<const FightEffect*> getActiveEffects(const std::string& fighterId) const;

    // Per-tick decay; expired effects are dropped.
    void tick();

    // Clears per-round counters and gives everyone FRESH_LEGS.
    void resetForRound();

    // ====================
    // Aggregated modifiers (clamped)
    // ====================
    double getAttributeModifier(const std::string& fighterId, const std::string& attribute) const;
    double getAggressionModifier(const std::string& fighterId) const; // [-0.5, 0.5]
    double getDefenseModifier(const std::string& fighterId) const;    // [-0.4, 0.3]
    double getAccuracyModifier(const std::string& fighterId) const;   // [-0.3, 0.2]
    double getPowerModifier(const std::string& fighterId) const;      // [-0.3, 0.25]
    double getSpeedModifier(const std::string& fighterId) const;      // [-0.25, 0.2]
    double momentum(const std::string& fighterId) const;

    EffectsSummary getEffectsSummary(const std::string& fighterId) const;

    // ====================
    // Triggers
    // ====================
    void onPunchLanded(const std::string& attackerId, const std::string& defenderId,
                       const PunchLandedInfo& info, Rng& rng);
    void onFighterHurt(const std::string& fighterId, const std::string& opponentId, Rng& rng);
    void onKnockdown(const std::string& downedId, const std::string& attackerId);
    void onRecovery(const std::string& fighterId, Rng& rng);
    void onHighOutput(const std::string& fighterId, int punchCount);
    void onStaminaLow(const std::string& fighterId, double staminaPercent);
    void onBehindOnCards(const std::string& fighterId, int roundsRemaining, double pointsBehind);
    void onDomination(const std::string& dominatedId, const std::string& dominatorId);
    void onCutOpened(const std::string& fighterId, const std::string& location, int severity);

    // Heart (plus a fifth of experience) resists; returns true when FROZEN applied.
    bool onIntimidation(const std::string& targetId, double intimidatorPower,
                        double targetHeart, double targetExperience, Rng& rng);
    bool applyBigFightMentality(const std::string& fighterId, const Fighter& fighter, const Fighter& opponent);
    bool applyFastStart(const std::string& fighterId, const Fighter& fighter);
    void updateFastStartForRound(const std::string& fighterId, int round);
    bool checkSecondWind(const std::string& fighterId, const Fighter& fighter,
                         int currentRound, int totalRounds, Rng& rng);
    bool checkFocusLapse(const std::string& fighterId, const Fighter& fighter, Rng& rng);

private:
    struct RecentEvents {
        int punchesLanded = 0;
        int punchesTaken = 0;
        int knockdownsScored = 0;
        int knockdownsTaken = 0;
    };

    struct FighterEffects {
        std::map<EffectType, FightEffect> effects;
        double momentum = 0.0;
        RecentEvents recent{};
    };

    FighterEffects& slot(const std::string& fighterId);
    const FighterEffects& slot(const std::string& fighterId) const;
    void shiftMomentum(const std::string& fighterId, double delta);

    std::map<std::string, FighterEffects> fighters_;
    std::vector<std::string> order_;
};

} // namespace ringsim
