#include "FightEffects.h"

#include "Errors.h"
#include "Fighter.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ringsim {

namespace {

constexpr double kMomentumLimit = 100.0;

static inline double clampd(double v, double lo, double hi) {
    if (!std::isfinite(v)) return lo;
    return (v < lo) ? lo : (v > hi) ? hi : v;
}

EffectConfig cfg(double intensity, int duration, const char* source, EffectModifierMap mods) {
    EffectConfig c;
    c.intensity = intensity;
    c.duration = duration;
    c.source = source;
    c.modifiers = std::move(mods);
    return c;
}

} // namespace

const char* toString(EffectType t) {
    switch (t) {
        case EffectType::AdrenalineSurge: return "ADRENALINE";
        case EffectType::Momentum:        return "MOMENTUM";
        case EffectType::SecondWind:      return "SECOND_WIND";
        case EffectType::KillerInstinct:  return "KILLER_INSTINCT";
        case EffectType::Rhythm:          return "RHYTHM";
        case EffectType::ConfidenceBoost: return "CONFIDENCE_BOOST";
        case EffectType::FreshLegs:       return "FRESH_LEGS";
        case EffectType::BigFightFocus:   return "BIG_FIGHT_FOCUS";
        case EffectType::FastStart:       return "FAST_START";
        case EffectType::Cautious:        return "CAUTIOUS";
        case EffectType::Rattled:         return "RATTLED";
        case EffectType::ArmWeary:        return "ARM_WEARY";
        case EffectType::VisionImpaired:  return "VISION_IMPAIRED";
        case EffectType::Desperate:       return "DESPERATE";
        case EffectType::Demoralized:     return "DEMORALIZED";
        case EffectType::ShellShocked:    return "SHELL_SHOCKED";
        case EffectType::Gassed:          return "GASSED";
        case EffectType::Frozen:          return "FROZEN";
        case EffectType::HurtHands:       return "HURT_HANDS";
        case EffectType::FocusLapse:      return "FOCUS_LAPSE";
        default:                          return "UNKNOWN";
    }
}

EffectCategory categoryOf(EffectType t) {
    return (static_cast<int>(t) < static_cast<int>(EffectType::Cautious)) ? EffectCategory::Buff
                                                                            : EffectCategory::Debuff;
}

// ============================================================
// FightEffect
// ============================================================

FightEffect::FightEffect(EffectType type, const EffectConfig& c)
    : type_(type),
      intensity_(clampd(c.intensity, 0.0, 1.0)),
      duration_(std::max(1, c.duration)),
      maxDuration_(std::max(1, c.duration)),
      source_(c.source),
      stackable_(c.stackable),
      maxStacks_(std::max(1, c.maxStacks)),
      modifiers_(c.modifiers),
      baseModifiers_(c.modifiers) {}

void FightEffect::scaleModifiersFromBase(double scale) {
    if (!std::isfinite(scale)) return;
    for (auto& kv : modifiers_) {
        auto base = baseModifiers_.find(kv.first);
        if (base != baseModifiers_.end()) kv.second = base->second * scale;
    }
}

double FightEffect::getRemainingPercent() const {
    return static_cast<double>(duration_) / static_cast<double>(maxDuration_);
}

double FightEffect::getEffectiveIntensity() const {
    const double fadeStart = maxDuration_ * 0.25;
    const double durationFactor = (duration_ > fadeStart) ? 1.0 : duration_ / fadeStart;
    return intensity_ * stacks_ * durationFactor;
}

bool FightEffect::tick() {
    --duration_;
    return duration_ > 0;
}

void FightEffect::refresh(double newIntensity, int additionalDuration) {
    if (std::isfinite(newIntensity)) {
        intensity_ = std::max(intensity_, clampd(newIntensity, 0.0, 1.0));
    }
    if (stackable_ && stacks_ < maxStacks_) {
        ++stacks_;
    }
    const int extra = (additionalDuration > 0) ? additionalDuration : maxDuration_ / 2;
    duration_ = std::min(maxDuration_, duration_ + extra);
}

// ============================================================
// Registration and bookkeeping
// ============================================================

void FightEffects::registerFighter(const std::string& fighterId) {
    if (fighters_.count(fighterId)) return;
    if (order_.size() >= 2) {
        throw std::logic_error("FightEffects tracks at most two fighters");
    }
    fighters_.emplace(fighterId, FighterEffects{});
    order_.push_back(fighterId);
}

bool FightEffects::isRegistered(const std::string& fighterId) const {
    return fighters_.count(fighterId) != 0;
}

FightEffects::FighterEffects& FightEffects::slot(const std::string& fighterId) {
    auto it = fighters_.find(fighterId);
    if (it == fighters_.end()) throw InvalidFighterReference(fighterId);
    return it->second;
}

const FightEffects::FighterEffects& FightEffects::slot(const std::string& fighterId) const {
    auto it = fighters_.find(fighterId);
    if (it == fighters_.end()) throw InvalidFighterReference(fighterId);
    return it->second;
}

void FightEffects::shiftMomentum(const std::string& fighterId, double delta) {
    FighterEffects& f = slot(fighterId);
    f.momentum = clampd(f.momentum + delta, -kMomentumLimit, kMomentumLimit);
}

void FightEffects::applyEffect(const std::string& fighterId, EffectType type, const EffectConfig& c) {
    FighterEffects& f = slot(fighterId);

    // Only one corner can hold momentum.
    if (type == EffectType::Momentum) {
        for (const auto& other : order_) {
            if (other != fighterId) fighters_.at(other).effects.erase(EffectType::Momentum);
        }
    }

    auto it = f.effects.find(type);
    if (it != f.effects.end()) {
        it->second.refresh(c.intensity, c.duration);
    } else {
        f.effects.emplace(type, FightEffect(type, c));
    }
}

void FightEffects::removeEffect(const std::string& fighterId, EffectType type) {
    slot(fighterId).effects.erase(type);
}

bool FightEffects::hasEffect(const std::string& fighterId, EffectType type) const {
    return slot(fighterId).effects.count(type) != 0;
}

const FightEffect* FightEffects::getEffect(const std::string& fighterId, EffectType type) const {
    const FighterEffects& f = slot(fighterId);
    auto it = f.effects.find(type);
    return (it == f.effects.end()) ? nullptr : &it->second;
}

double FightEffects::getEffectIntensity(const std::string& fighterId, EffectType type) const {
    const FightEffect* e = getEffect(fighterId, type);
    return e ? e->getEffectiveIntensity() : 0.0;
}

std::vector<const FightEffect*> FightEffects::getActiveEffects(const std::string& fighterId) const {
    std::vector<const FightEffect*> out;
    for (const auto& kv : slot(fighterId).effects) out.push_back(&kv.second);
    return out;
}

void FightEffects::tick() {
    for (auto& kv : fighters_) {
        auto& effects = kv.second.effects;
        for (auto it = effects.begin(); it != effects.end();) {
            if (!it->second.tick()) it = effects.erase(it);
            else ++it;
        }
    }
}

void FightEffects::resetForRound() {
    for (auto& kv : fighters_) {
        kv.second.recent = RecentEvents{};
    }
    for (const auto& id : order_) {
        applyEffect(id, EffectType::FreshLegs,
                    cfg(0.3, 12, "round_start", {{"footSpeed", 0.1}, {"headMovement", 0.05}}));
    }
}

// ============================================================
// Aggregates
// ============================================================

double FightEffects::getAttributeModifier(const std::string& fighterId, const std::string& attribute) const {
    double total = 0.0;
    for (const auto& kv : slot(fighterId).effects) {
        auto m = kv.second.modifiers().find(attribute);
        if (m != kv.second.modifiers().end()) {
            total += m->second * kv.second.getEffectiveIntensity();
        }
    }
    return total;
}

double FightEffects::getAggressionModifier(const std::string& id) const {
    double m = 0.0;
    m += getEffectIntensity(id, EffectType::AdrenalineSurge) * 0.3;
    m += getEffectIntensity(id, EffectType::Momentum) * 0.2;
    m += getEffectIntensity(id, EffectType::KillerInstinct) * 0.4;
    m += getEffectIntensity(id, EffectType::ConfidenceBoost) * 0.2;
    m += getEffectIntensity(id, EffectType::FastStart) * 0.5;

    m -= getEffectIntensity(id, EffectType::Cautious) * 0.4;
    m -= getEffectIntensity(id, EffectType::Rattled) * 0.3;
    m -= getEffectIntensity(id, EffectType::ShellShocked) * 0.5;
    m -= getEffectIntensity(id, EffectType::Frozen) * 0.4;

    // Desperation is reckless aggression.
    m += getEffectIntensity(id, EffectType::Desperate) * 0.5;
    return clampd(m, -0.5, 0.5);
}

double FightEffects::getDefenseModifier(const std::string& id) const {
    double m = 0.0;
    m += getEffectIntensity(id, EffectType::Cautious) * 0.15;
    m -= getEffectIntensity(id, EffectType::Rattled) * 0.2;
    m -= getEffectIntensity(id, EffectType::ShellShocked) * 0.3;
    m -= getEffectIntensity(id, EffectType::Gassed) * 0.25;
    m -= getEffectIntensity(id, EffectType::Desperate) * 0.3;
    m -= getEffectIntensity(id, EffectType::VisionImpaired) * 0.2;
    m -= getEffectIntensity(id, EffectType::FocusLapse) * 0.3;
    m += getEffectIntensity(id, EffectType::Rhythm) * 0.1;
    m += getEffectIntensity(id, EffectType::FreshLegs) * 0.1;
    return clampd(m, -0.4, 0.3);
}

double FightEffects::getAccuracyModifier(const std::string& id) const {
    double m = 0.0;
    m += getEffectIntensity(id, EffectType::Rhythm) * 0.15;
    m += getEffectIntensity(id, EffectType::Momentum) * 0.1;
    m += getEffectIntensity(id, EffectType::ConfidenceBoost) * 0.1;
    m += getAttributeModifier(id, "accuracy") * 0.5;
    m -= getEffectIntensity(id, EffectType::VisionImpaired) * 0.25;
    m -= getEffectIntensity(id, EffectType::ArmWeary) * 0.1;
    m -= getEffectIntensity(id, EffectType::Rattled) * 0.15;
    m -= getEffectIntensity(id, EffectType::Desperate) * 0.2;
    m -= getEffectIntensity(id, EffectType::Demoralized) * 0.15;
    return clampd(m, -0.3, 0.2);
}

double FightEffects::getPowerModifier(const std::string& id) const {
    double m = 0.0;
    m += getEffectIntensity(id, EffectType::AdrenalineSurge) * 0.2;
    m += getEffectIntensity(id, EffectType::KillerInstinct) * 0.15;
    m += getEffectIntensity(id, EffectType::Momentum) * 0.1;
    m += getEffectIntensity(id, EffectType::FastStart) * 0.15;
    m -= getEffectIntensity(id, EffectType::ArmWeary) * 0.2;
    m -= getEffectIntensity(id, EffectType::Gassed) * 0.25;
    m -= getEffectIntensity(id, EffectType::HurtHands) * 0.15;
    m -= getEffectIntensity(id, EffectType::Demoralized) * 0.1;
    return clampd(m, -0.3, 0.25);
}

double FightEffects::getSpeedModifier(const std::string& id) const {
    double m = 0.0;
    m += getEffectIntensity(id, EffectType::AdrenalineSurge) * 0.15;
    m += getEffectIntensity(id, EffectType::Rhythm) * 0.1;
    m += getEffectIntensity(id, EffectType::FreshLegs) * 0.1;
    m += getEffectIntensity(id, EffectType::FastStart) * 0.2;
    m += getEffectIntensity(id, EffectType::SecondWind) * 0.1;
    m -= getEffectIntensity(id, EffectType::ArmWeary) * 0.15;
    m -= getEffectIntensity(id, EffectType::Gassed) * 0.2;
    m -= getEffectIntensity(id, EffectType::Rattled) * 0.1;
    m -= getEffectIntensity(id, EffectType::ShellShocked) * 0.15;
    m -= getEffectIntensity(id, EffectType::Frozen) * 0.1;
    return clampd(m, -0.25, 0.2);
}

double FightEffects::momentum(const std::string& fighterId) const {
    return slot(fighterId).momentum;
}

EffectsSummary FightEffects::getEffectsSummary(const std::string& fighterId) const {
    const FighterEffects& f = slot(fighterId);
    EffectsSummary out;
    out.momentum = f.momentum;
    for (const auto& kv : f.effects) {
        const FightEffect& e = kv.second;
        EffectSummaryEntry entry{e.type(), e.getEffectiveIntensity(), e.getRemainingPercent(), e.stacks()};
        if (e.category() == EffectCategory::Buff) out.buffs.push_back(entry);
        else out.debuffs.push_back(entry);
    }
    return out;
}

// ============================================================
// Triggers
// ============================================================

void FightEffects::onPunchLanded(const std::string& attackerId, const std::string& defenderId,
                                 const PunchLandedInfo& info, Rng& rng) {
    FighterEffects& att = slot(attackerId);
    FighterEffects& def = slot(defenderId);
    ++att.recent.punchesLanded;
    ++def.recent.punchesTaken;

    shiftMomentum(attackerId, 3.0);
    shiftMomentum(defenderId, -2.0);

    const double dmg = std::isfinite(info.damage) ? info.damage : 0.0;
    const bool jab = isJab(info.punch);

    if (att.recent.punchesLanded >= 3) {
        EffectConfig c = cfg(0.4, 30, "consecutive_punches", {{"confidence", 0.1}, {"accuracy", 0.05}});
        c.stackable = true;
        c.maxStacks = 3;
        applyEffect(attackerId, EffectType::Momentum, c);
    }

    if (!jab && att.recent.punchesLanded >= 2) {
        applyEffect(attackerId, EffectType::Rhythm,
                    cfg(0.3, 20, "combination_landing", {{"handSpeed", 0.1}, {"combinationSpeed", 0.1}}));
    }

    if (dmg > 15.0 && !jab && rng.u01() < 0.1) {
        applyEffect(attackerId, EffectType::HurtHands, cfg(0.3, 60, "hard_punch", {{"power", -0.1}}));
    }

    if (dmg > 10.0 && rng.u01() < dmg / 50.0) {
        applyEffect(defenderId, EffectType::Cautious,
                    cfg(std::min(0.8, dmg / 25.0), 25 + static_cast<int>(dmg), "hurt_by_punch",
                        {{"aggression", -0.2}}));
    }

    if ((info.isCritical || dmg > 20.0) && rng.u01() < 0.15) {
        applyEffect(defenderId, EffectType::ShellShocked,
                    cfg(0.5, 20, "big_shot", {{"composure", -0.2}, {"reflexes", -0.1}}));
    }
}

void FightEffects::onFighterHurt(const std::string& fighterId, const std::string& opponentId, Rng& rng) {
    applyEffect(fighterId, EffectType::Cautious, cfg(0.7, 40, "hurt", {{"aggression", -0.3}}));

    // Fight-or-flight.
    if (rng.u01() < 0.3) {
        applyEffect(fighterId, EffectType::AdrenalineSurge,
                    cfg(0.6, 30, "hurt_response", {{"power", 0.15}, {"handSpeed", 0.1}}));
    }

    applyEffect(opponentId, EffectType::KillerInstinct,
                cfg(0.8, 35, "opponent_hurt", {{"aggression", 0.3}, {"power", 0.1}}));
}

void FightEffects::onKnockdown(const std::string& downedId, const std::string& attackerId) {
    FighterEffects& down = slot(downedId);
    FighterEffects& att = slot(attackerId);
    ++att.recent.knockdownsScored;
    ++down.recent.knockdownsTaken;

    shiftMomentum(attackerId, 30.0);
    shiftMomentum(downedId, -40.0);

    applyEffect(downedId, EffectType::Rattled,
                cfg(0.8, 60, "knockdown", {{"composure", -0.25}, {"confidence", -0.2}}));
    applyEffect(downedId, EffectType::Cautious, cfg(0.6, 45, "knockdown", {{"aggression", -0.25}}));

    if (down.recent.knockdownsTaken >= 2) {
        applyEffect(downedId, EffectType::Frozen,
                    cfg(0.7, 40, "multiple_knockdowns", {{"firstStep", -0.2}, {"reflexes", -0.15}}));
    }

    applyEffect(attackerId, EffectType::ConfidenceBoost,
                cfg(0.9, 50, "knockdown_scored", {{"confidence", 0.2}, {"composure", 0.1}}));
    applyEffect(attackerId, EffectType::KillerInstinct,
                cfg(1.0, 40, "knockdown_scored", {{"aggression", 0.4}, {"power", 0.15}}));
}

void FightEffects::onRecovery(const std::string& fighterId, Rng& rng) {
    slot(fighterId);
    if (rng.u01() < 0.4) {
        applyEffect(fighterId, EffectType::AdrenalineSurge,
                    cfg(0.4, 25, "survival", {{"power", 0.1}, {"heart", 0.1}}));
    }
    removeEffect(fighterId, EffectType::ShellShocked);
}

void FightEffects::onHighOutput(const std::string& fighterId, int punchCount) {
    slot(fighterId);
    if (punchCount <= 30) return;
    EffectConfig c = cfg(std::min(0.6, (punchCount - 30) / 30.0), 30, "high_output",
                         {{"handSpeed", -0.08}, {"power", -0.08}});
    c.stackable = true;
    c.maxStacks = 2;
    applyEffect(fighterId, EffectType::ArmWeary, c);
}

void FightEffects::onStaminaLow(const std::string& fighterId, double staminaPercent) {
    if (!std::isfinite(staminaPercent)) return;
    if (staminaPercent < 0.20) {
        const double intensity = std::min(0.8, (0.20 - staminaPercent) / 0.20);
        applyEffect(fighterId, EffectType::Gassed,
                    cfg(intensity, 15, "low_stamina",
                        {{"handSpeed", -0.10}, {"footSpeed", -0.12}, {"power", -0.10}}));
    } else {
        removeEffect(fighterId, EffectType::Gassed);
    }
}

void FightEffects::onBehindOnCards(const std::string& fighterId, int roundsRemaining, double pointsBehind) {
    slot(fighterId);
    if (roundsRemaining > 3 || !(pointsBehind >= 3.0)) return;
    const double intensity = std::min(1.0, pointsBehind / 10.0 + (3 - roundsRemaining) / 3.0);
    applyEffect(fighterId, EffectType::Desperate,
                cfg(intensity, 60, "behind_on_cards", {{"aggression", 0.3}, {"defense", -0.2}}));
}

void FightEffects::onDomination(const std::string& dominatedId, const std::string& dominatorId) {
    applyEffect(dominatedId, EffectType::Demoralized,
                cfg(0.5, 45, "being_dominated", {{"confidence", -0.2}, {"composure", -0.1}}));
    applyEffect(dominatorId, EffectType::Momentum,
                cfg(0.6, 40, "dominating", {{"confidence", 0.15}, {"composure", 0.1}}));
}

void FightEffects::onCutOpened(const std::string& fighterId, const std::string& location, int severity) {
    slot(fighterId);
    if (location.find("eye") == std::string::npos) return;
    const double intensity = clampd(severity * 0.2, 0.0, 1.0);
    applyEffect(fighterId, EffectType::VisionImpaired,
                cfg(intensity, 200, "cut", {{"accuracy", -0.15}, {"headMovement", -0.1}}));
}

bool FightEffects::onIntimidation(const std::string& targetId, double intimidatorPower,
                                  double targetHeart, double targetExperience, Rng& rng) {
    slot(targetId);
    const double resistance = targetHeart + targetExperience * 0.2;
    const double gap = intimidatorPower - resistance;
    if (!(gap > 0.0)) return false;

    const double strength = std::min(1.0, gap / 40.0);
    if (rng.u01() > 0.5 + intimidatorPower / 200.0) return false;

    const int duration = static_cast<int>(std::lround(180.0 + strength * 500.0));
    applyEffect(targetId, EffectType::Frozen,
                cfg(strength, duration, "intimidation",
                    {{"firstStep", -0.05 - strength * 0.15},
                     {"confidence", -0.05 - strength * 0.20},
                     {"accuracy", -0.03 - strength * 0.12},
                     {"power", -0.02 - strength * 0.08},
                     {"reflexes", -0.02 - strength * 0.08},
                     {"composure", -0.05 - strength * 0.15}}));
    return true;
}

bool FightEffects::applyBigFightMentality(const std::string& fighterId, const Fighter& fighter,
                                          const Fighter& opponent) {
    slot(fighterId);
    const double clutch = fighter.profile().mental.clutchFactor;
    const FighterProfile& o = opponent.profile();
    const double rating = (o.mental.chin + o.mental.heart + o.power.knockoutPower +
                           o.technical.fightIQ + o.mental.experience) / 5.0;

    if (rating < 80.0 || clutch < 70.0) return false;

    const double intensity = (clutch - 50.0) / 100.0;
    const double eliteFactor = (rating - 80.0) / 20.0;
    applyEffect(fighterId, EffectType::BigFightFocus,
                cfg(intensity * (0.5 + eliteFactor * 0.5), 999999, "big_fight",
                    {{"accuracy", 0.02 + intensity * 0.04},
                     {"power", 0.01 + intensity * 0.03},
                     {"handSpeed", intensity * 0.02},
                     {"composure", intensity * 0.1},
                     {"aggression", -intensity * 0.1}}));
    return true;
}

bool FightEffects::applyFastStart(const std::string& fighterId, const Fighter& fighter) {
    slot(fighterId);
    const double score = (fighter.profile().speed.firstStep + fighter.profile().mental.killerInstinct) / 2.0;
    if (score < 92.0) return false;

    const double k = (score - 92.0) / 16.0;
    applyEffect(fighterId, EffectType::FastStart,
                cfg(0.3 + k, 480, "fast_starter",
                    {{"handSpeed", 0.05 + k * 0.08},
                     {"firstStep", 0.05 + k * 0.10},
                     {"power", 0.03 + k * 0.05},
                     {"aggression", 0.15 + k * 0.20},
                     {"combinationSpeed", 0.05 + k * 0.08},
                     {"intimidation", 0.10 + k * 0.15}}));
    return true;
}

void FightEffects::updateFastStartForRound(const std::string& fighterId, int round) {
    FighterEffects& f = slot(fighterId);
    auto it = f.effects.find(EffectType::FastStart);
    if (it == f.effects.end()) return;

    if (round > 4) {
        f.effects.erase(it);
        return;
    }
    // 100% in round 1 down to 25% in round 4.
    it->second.scaleModifiersFromBase((5 - round) / 4.0);
}

bool FightEffects::checkSecondWind(const std::string& fighterId, const Fighter& fighter,
                                   int currentRound, int totalRounds, Rng& rng) {
    slot(fighterId);
    if (currentRound < totalRounds - 2) return false;
    if (hasEffect(fighterId, EffectType::SecondWind)) return false;

    if (rng.u01() < fighter.profile().stamina.secondWind / 300.0) {
        applyEffect(fighterId, EffectType::SecondWind,
                    cfg(0.7, 80, "championship_rounds",
                        {{"cardio", 0.2}, {"heart", 0.15}, {"workRate", 0.1}}));
        return true;
    }
    return false;
}

bool FightEffects::checkFocusLapse(const std::string& fighterId, const Fighter& fighter, Rng& rng) {
    if (hasEffect(fighterId, EffectType::FocusLapse)) return false;

    const double focus = fighter.profile().mental.focus;
    const double lapseChance = std::max(0.003, (100.0 - focus) / 1500.0);

    const double stamina = fighter.getStaminaPercent();
    const double fatigueMod = (stamina < 0.4) ? 1.5 : (stamina < 0.6) ? 1.2 : 1.0;

    if (rng.u01() >= lapseChance * fatigueMod) return false;

    const int duration = static_cast<int>(std::lround(4.0 + rng.u01() * 4.0));
    const double k = clampd((100.0 - focus) / 100.0, 0.0, 1.0);
    applyEffect(fighterId, EffectType::FocusLapse,
                cfg(k, duration, "mental_lapse",
                    {{"headMovement", -0.15 - k * 0.15},
                     {"reflexes", -0.10 - k * 0.15},
                     {"blocking", -0.10 - k * 0.10},
                     {"ringAwareness", -0.20 - k * 0.10}}));
    return true;
}

} // namespace ringsim
