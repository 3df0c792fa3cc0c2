#include "Fighter.h"

#include "Errors.h"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace ringsim {

namespace {

// --------------------
// Tunable constants
// --------------------
constexpr double kBodyDamageStaminaDrain = 0.5;

constexpr int kBuzzMinTicks = 10;
constexpr int kBuzzMaxTicks = 40;
constexpr double kBuzzHeavyPunchScale = 1.4;
constexpr double kBuzzCompoundCarry = 0.75;
constexpr double kBuzzCompoundRateScale = 0.85;

constexpr int kStunMaxTicks = 5;
constexpr double kStunHeavyPunchScale = 1.3;
constexpr double kStunLightThrowChance = 0.3;

constexpr double kZeroStaminaThreshold = 0.10;
constexpr double kZeroStaminaChinPenalty = -30.0;

constexpr double kMaxVisionPenalty = 60.0;
constexpr int kMaxCutSeverity = 5;

// A tiny number for guarding divides / comparisons
constexpr double kEps = 1e-12;

static inline double clampd(double v, double lo, double hi) {
    if (!std::isfinite(v)) return lo;
    return (v < lo) ? lo : (v > hi) ? hi : v;
}

static inline double clamp01(double x) {
    if (!std::isfinite(x)) return 0.0;
    return std::clamp(x, 0.0, 1.0);
}

static inline double scalePct(double value, double pct) {
    return value * (1.0 + pct / 100.0);
}

StatusEffect makeHurtDebuff() {
    StatusEffect e;
    e.type = "hurt";
    e.effects.speed = -25.0;
    e.effects.power = -15.0;
    e.effects.defense = -30.0;
    return e;
}

StatusEffect makeBuzzedDebuff(int severity) {
    const double s = static_cast<double>(severity);
    StatusEffect e;
    e.type = "buzzed";
    e.effects.speed = -10.0 * s;
    e.effects.power = -5.0 * s;
    e.effects.defense = -12.0 * s;
    e.effects.accuracy = -10.0 * s;
    return e;
}

bool heavyBuzzPunch(PunchType p) {
    switch (p) {
        case PunchType::Cross:
        case PunchType::RearHook:
        case PunchType::RearUppercut:
        case PunchType::LeadHook:
        case PunchType::LeadUppercut:
            return true;
        default:
            return false;
    }
}

bool heavyStunPunch(PunchType p) {
    switch (p) {
        case PunchType::Cross:
        case PunchType::RearHook:
        case PunchType::RearUppercut:
        case PunchType::BodyHookRear:
            return true;
        default:
            return false;
    }
}

bool nearEye(const std::string& location) {
    return location.find("eye") != std::string::npos;
}

} // namespace

Fighter::Fighter(const FighterProfile& profile)
    : profile_(profile) {
    if (profile_.name.empty()) {
        throw std::invalid_argument("Fighter must have a name");
    }
    id_ = makeId(profile_.name);
    initializeRuntimeState();
}

std::string Fighter::makeId(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        const unsigned char lc = static_cast<unsigned char>(std::tolower(c));
        if ((lc >= 'a' && lc <= 'z') || (lc >= '0' && lc <= '9')) {
            out.push_back(static_cast<char>(lc));
        } else {
            out.push_back('-');
        }
    }
    return out;
}

void Fighter::initializeRuntimeState() {
    state_ = FighterState::Neutral;
    subState_ = SubState::None;

    maxStamina_ = calculateMaxStamina();
    stamina_ = maxStamina_;

    headDamage_ = 0.0;
    bodyDamage_ = 0.0;
    maxHeadDamage_ = calculateMaxDamage(TargetLocation::Head);
    maxBodyDamage_ = calculateMaxDamage(TargetLocation::Body);

    updateModifiedAttributes();
}

double Fighter::calculateMaxStamina() const {
    const double cardio = profile_.stamina.cardio;
    const double weight = profile_.physical.weight_kg;
    const double age = profile_.physical.age;

    double base = 80.0 + cardio * 0.4;

    // Heavier fighters carry more mass around the ring.
    base *= (1.0 - (weight - 70.0) * 0.002);

    double ageMod = 1.0;
    if (age <= 28.0) ageMod = 1.0;
    else if (age <= 32.0) ageMod = 0.97;
    else if (age <= 35.0) ageMod = 0.92;
    else if (age <= 38.0) ageMod = 0.85;
    else ageMod = 0.78;

    double bodyMod = 1.0;
    switch (profile_.physical.bodyType) {
        case BodyType::Lean:     bodyMod = 1.05; break;
        case BodyType::Muscular: bodyMod = 0.97; break;
        case BodyType::Stocky:   bodyMod = 0.98; break;
        case BodyType::Lanky:    bodyMod = 1.02; break;
        default:                 bodyMod = 1.0; break;
    }

    return std::max(1.0, base * ageMod * bodyMod);
}

double Fighter::calculateMaxDamage(TargetLocation location) const {
    const double w = profile_.physical.weight_kg;
    const bool head = (location == TargetLocation::Head);

    double base = 0.0;
    if (w >= 90.7)      base = head ? 350.0 : 300.0; // heavyweight
    else if (w >= 79.4) base = head ? 320.0 : 280.0; // cruiserweight
    else if (w >= 76.2) base = head ? 300.0 : 260.0; // light heavyweight
    else if (w >= 72.6) base = head ? 280.0 : 240.0; // middleweight
    else if (w >= 66.7) base = head ? 260.0 : 220.0; // welterweight
    else if (w >= 61.2) base = head ? 240.0 : 200.0; // lightweight
    else if (w >= 57.2) base = head ? 220.0 : 180.0; // featherweight
    else if (w >= 53.5) base = head ? 200.0 : 170.0; // bantamweight
    else                base = head ? 180.0 : 150.0; // flyweight

    if (head) {
        base *= 0.9 + profile_.mental.chin / 400.0;
    }
    return std::round(base);
}

// ============================================================
// State machine
// ============================================================

void Fighter::transitionTo(FighterState next) {
    if (!isValidTransition(state_, next)) {
        throw InvalidStateTransition(std::string("invalid fighter transition ") +
                                     toString(state_) + " -> " + toString(next));
    }
    state_ = next;
    if (!subStateAllowedIn(state_, subState_)) {
        subState_ = SubState::None;
    }
}

bool Fighter::setSubState(SubState sub) {
    if (!subStateAllowedIn(state_, sub)) {
        return false;
    }
    subState_ = sub;
    return true;
}

// ============================================================
// Stamina
// ============================================================

double Fighter::getStaminaPercent() const {
    if (maxStamina_ <= kEps) return 0.0;
    return clamp01(stamina_ / maxStamina_);
}

StaminaTier Fighter::getStaminaTier() const {
    const double pct = getStaminaPercent();
    if (pct >= 0.8) return StaminaTier::Fresh;
    if (pct >= 0.6) return StaminaTier::Good;
    if (pct >= 0.4) return StaminaTier::Tired;
    if (pct >= 0.25) return StaminaTier::Exhausted;
    return StaminaTier::Gassed;
}

void Fighter::spendStamina(double amount) {
    if (!std::isfinite(amount) || amount <= 0.0) return;
    stamina_ = clampd(stamina_ - amount, 0.0, maxStamina_);
}

void Fighter::recoverStamina(double amount) {
    if (!std::isfinite(amount) || amount <= 0.0) return;
    stamina_ = clampd(stamina_ + amount, 0.0, maxStamina_);
}

// ============================================================
// Damage
// ============================================================

double Fighter::getHeadDamagePercent() const {
    if (maxHeadDamage_ <= kEps) return 0.0;
    return clamp01(headDamage_ / maxHeadDamage_);
}

double Fighter::getBodyDamagePercent() const {
    if (maxBodyDamage_ <= kEps) return 0.0;
    return clamp01(bodyDamage_ / maxBodyDamage_);
}

void Fighter::takeDamage(double amount, TargetLocation location) {
    if (!std::isfinite(amount) || amount <= 0.0) return;

    if (location == TargetLocation::Head) {
        headDamage_ = clampd(headDamage_ + amount, 0.0, maxHeadDamage_);
    } else {
        bodyDamage_ = clampd(bodyDamage_ + amount, 0.0, maxBodyDamage_);
        spendStamina(amount * kBodyDamageStaminaDrain);
    }
}

void Fighter::addCut(const std::string& location, int severity) {
    severity = std::clamp(severity, 1, kMaxCutSeverity);
    auto it = std::find_if(cuts_.begin(), cuts_.end(),
                           [&](const CutMark& c) { return c.location == location; });
    if (it != cuts_.end()) {
        it->severity = std::min(kMaxCutSeverity, it->severity + severity);
    } else {
        cuts_.push_back({location, severity});
    }
    if (nearEye(location)) {
        visionPenalty_ = std::min(kMaxVisionPenalty, visionPenalty_ + severity * 5.0);
    }
}

void Fighter::addSwelling(const std::string& location, int severity) {
    severity = std::clamp(severity, 1, kMaxCutSeverity);
    auto it = std::find_if(swelling_.begin(), swelling_.end(),
                           [&](const CutMark& c) { return c.location == location; });
    if (it != swelling_.end()) {
        it->severity = std::min(kMaxCutSeverity, it->severity + severity);
    } else {
        swelling_.push_back({location, severity});
    }
    if (nearEye(location)) {
        visionPenalty_ = std::min(kMaxVisionPenalty, visionPenalty_ + severity * 8.0);
    }
}

int Fighter::worstCutSeverity() const {
    int worst = 0;
    for (const auto& c : cuts_) worst = std::max(worst, c.severity);
    return worst;
}

// ============================================================
// Hurt / buzzed / stun
// ============================================================

void Fighter::setHurt(double duration_s) {
    if (!std::isfinite(duration_s) || duration_s <= 0.0) return;
    if (isDown()) return;

    clearBuzzed();

    if (!isHurt_) {
        hurtElapsed_ = 0.0;
    }
    isHurt_ = true;
    hurtDuration_ = duration_s;
    transitionTo(FighterState::Hurt);

    removeDebuff("hurt");
    addDebuff(makeHurtDebuff());
}

void Fighter::setBuzzed(double damage, PunchType punchType) {
    if (!std::isfinite(damage)) return;
    if (isHurt_ || isDown()) return;

    const int severity = (damage >= 5.0) ? 3 : (damage >= 3.5) ? 2 : 1;
    const double chin = modified_.mental.chin;

    double duration = std::round((10.0 + severity * 8.0) * (0.6 + (1.0 - chin / 200.0) * 0.6));
    if (heavyBuzzPunch(punchType)) {
        duration *= kBuzzHeavyPunchScale;
    }

    const double dmgPct = getHeadDamagePercent();
    if (dmgPct > 0.6) {
        duration *= 1.3 + (dmgPct - 0.6);
    } else if (dmgPct > 0.3) {
        duration *= 1.0 + (dmgPct - 0.3) * 0.5;
    }
    duration = clampd(std::round(duration), kBuzzMinTicks, kBuzzMaxTicks);

    double rate = 0.7 + chin / 300.0 + profile_.stamina.cardio / 600.0;
    const double staminaPct = getStaminaPercent();
    if (staminaPct < 0.3) rate *= 0.5;
    else if (staminaPct < 0.5) rate *= 0.7;

    if (isBuzzed_) {
        // Getting hit again while dazed extends and deepens the daze.
        buzzedDuration_ = std::min(buzzedDuration_ + std::round(duration * kBuzzCompoundCarry),
                                   static_cast<double>(kBuzzMaxTicks));
        if (severity >= buzzedSeverity_) {
            buzzedSeverity_ = std::min(3, buzzedSeverity_ + 1);
        }
        buzzedRecoveryRate_ *= kBuzzCompoundRateScale;
    } else {
        isBuzzed_ = true;
        buzzedSeverity_ = severity;
        buzzedDuration_ = duration;
        buzzedRecoveryRate_ = rate;
        transitionTo(FighterState::Buzzed);
        subState_ = SubState::HighGuard;
    }

    removeDebuff("buzzed");
    addDebuff(makeBuzzedDebuff(buzzedSeverity_));
}

void Fighter::updateBuzzed(Rng& rng) {
    if (!isBuzzed_) return;

    buzzedDuration_ -= buzzedRecoveryRate_;

    // Occasionally a fighter shakes it off early.
    if (buzzedDuration_ > 2.0) {
        const double shakeOff = (profile_.mental.chin + profile_.mental.composure) / 800.0;
        if (rng.chance(shakeOff)) {
            buzzedDuration_ = std::max(1.0, buzzedDuration_ - 2.0);
        }
    }

    if (buzzedDuration_ <= 0.0) {
        clearBuzzed();
    }
}

void Fighter::clearBuzzed() {
    const bool was = isBuzzed_;
    isBuzzed_ = false;
    buzzedSeverity_ = 0;
    buzzedDuration_ = 0.0;
    buzzedRecoveryRate_ = 1.0;
    if (was) {
        removeDebuff("buzzed");
    }
    if (state_ == FighterState::Buzzed) {
        state_ = FighterState::Neutral;
        subState_ = SubState::None;
    }
}

void Fighter::applyStun(double damage, PunchType punchType) {
    if (!std::isfinite(damage) || damage <= 0.0) return;

    const double chin = modified_.mental.chin;
    double duration = std::ceil(damage / 2.5) * (1.0 - chin / 200.0);
    if (heavyStunPunch(punchType)) {
        duration *= kStunHeavyPunchScale;
    }
    const int ticks = std::clamp(static_cast<int>(std::lround(duration)), 1, kStunMaxTicks);
    const int level = (damage >= 5.0) ? 2 : 1;

    if (stunLevel_ == 0 || level > stunLevel_ || ticks > stunDuration_) {
        stunLevel_ = std::max(stunLevel_, level);
        stunDuration_ = std::max(stunDuration_, ticks);
    }
}

void Fighter::updateStun(double tickRate) {
    if (stunDuration_ > 0) {
        --stunDuration_;
        if (stunDuration_ <= 0) {
            stunDuration_ = 0;
            stunLevel_ = 0;
        }
    }

    if (isHurt_ && std::isfinite(tickRate) && tickRate > 0.0) {
        hurtDuration_ -= tickRate;
        hurtElapsed_ += tickRate;
        if (hurtDuration_ <= 0.0) {
            isHurt_ = false;
            hurtDuration_ = 0.0;
            hurtElapsed_ = 0.0;
            removeDebuff("hurt");
            if (state_ == FighterState::Hurt) {
                state_ = FighterState::Neutral;
                subState_ = SubState::None;
            }
        }
    }
}

bool Fighter::canThrowPunch(Rng& rng) const {
    if (stunLevel_ >= 2) return false;
    if (stunLevel_ == 1) return rng.u01() <= kStunLightThrowChance;
    return true;
}

double Fighter::getBuzzedVulnerability() const {
    return isBuzzed_ ? (1.0 + buzzedSeverity_ * 0.25) : 1.0;
}

double Fighter::getStunVulnerability() const {
    if (stunLevel_ >= 2) return 1.30;
    if (stunLevel_ == 1) return 1.15;
    return 1.0;
}

double Fighter::getTotalVulnerability() const {
    double v = getBuzzedVulnerability() * getStunVulnerability();
    if (isHurt_) v *= 1.4;
    return v;
}

// ============================================================
// Buffs / debuffs
// ============================================================

void Fighter::addBuff(const StatusEffect& effect) {
    buffs_.push_back(effect);
}

void Fighter::addDebuff(const StatusEffect& effect) {
    debuffs_.push_back(effect);
}

bool Fighter::removeBuff(const std::string& type) {
    const auto before = buffs_.size();
    buffs_.erase(std::remove_if(buffs_.begin(), buffs_.end(),
                                [&](const StatusEffect& e) { return e.type == type; }),
                 buffs_.end());
    return buffs_.size() != before;
}

bool Fighter::removeDebuff(const std::string& type) {
    const auto before = debuffs_.size();
    debuffs_.erase(std::remove_if(debuffs_.begin(), debuffs_.end(),
                                  [&](const StatusEffect& e) { return e.type == type; }),
                   debuffs_.end());
    return debuffs_.size() != before;
}

bool Fighter::hasDebuff(const std::string& type) const {
    return std::any_of(debuffs_.begin(), debuffs_.end(),
                       [&](const StatusEffect& e) { return e.type == type; });
}

void Fighter::tickStatusEffects() {
    auto tickList = [](std::vector<StatusEffect>& list) {
        for (auto& e : list) {
            if (e.remainingTicks > 0) --e.remainingTicks;
        }
        list.erase(std::remove_if(list.begin(), list.end(),
                                  [](const StatusEffect& e) { return e.remainingTicks == 0; }),
                   list.end());
    };
    tickList(buffs_);
    tickList(debuffs_);
}

void Fighter::applyModifiers(const AttributeModifiers& m) {
    auto& a = modified_;
    if (m.power != 0.0) {
        a.power.powerLeft = scalePct(a.power.powerLeft, m.power);
        a.power.powerRight = scalePct(a.power.powerRight, m.power);
    }
    if (m.speed != 0.0) {
        a.speed.handSpeed = scalePct(a.speed.handSpeed, m.speed);
        a.speed.footSpeed = scalePct(a.speed.footSpeed, m.speed);
    }
    if (m.accuracy != 0.0) {
        a.offense.jabAccuracy = scalePct(a.offense.jabAccuracy, m.accuracy);
        a.offense.powerAccuracy = scalePct(a.offense.powerAccuracy, m.accuracy);
    }
    if (m.defense != 0.0) {
        a.defense.headMovement = scalePct(a.defense.headMovement, m.defense);
        a.defense.blocking = scalePct(a.defense.blocking, m.defense);
    }
    if (m.vision != 0.0) {
        a.offense.jabAccuracy = scalePct(a.offense.jabAccuracy, m.vision);
        a.offense.powerAccuracy = scalePct(a.offense.powerAccuracy, m.vision);
        a.defense.headMovement = scalePct(a.defense.headMovement, m.vision);
    }
    if (m.chin != 0.0) {
        a.mental.chin = scalePct(a.mental.chin, m.chin);
    }
    if (m.aggression != 0.0) {
        a.aggressionBias = clampd(a.aggressionBias + m.aggression / 100.0, -0.5, 0.5);
    }
}

void Fighter::applyFatiguePenalties() {
    AttributeModifiers raw{};
    switch (getStaminaTier()) {
        case StaminaTier::Good:
            raw.power = -3.0; raw.speed = -2.0;
            break;
        case StaminaTier::Tired:
            raw.power = -8.0; raw.speed = -5.0; raw.accuracy = -5.0; raw.defense = -5.0;
            break;
        case StaminaTier::Exhausted:
            raw.power = -15.0; raw.speed = -12.0; raw.accuracy = -10.0; raw.defense = -15.0;
            break;
        case StaminaTier::Gassed:
            raw.power = -30.0; raw.speed = -25.0; raw.accuracy = -20.0; raw.defense = -30.0;
            raw.chin = -15.0;
            break;
        default:
            break;
    }

    // Heart pushes through fatigue: 98 heart shrinks the penalty by about a
    // third, 50 heart makes it about a quarter worse.
    const double heartFactor = 1.0 - (profile_.mental.heart - 70.0) / 75.0;
    AttributeModifiers adj{};
    adj.power = std::round(raw.power * heartFactor);
    adj.speed = std::round(raw.speed * heartFactor);
    adj.accuracy = std::round(raw.accuracy * heartFactor);
    adj.defense = std::round(raw.defense * heartFactor);
    adj.chin = std::round(raw.chin * heartFactor);
    applyModifiers(adj);

    const double pct = getStaminaPercent();
    if (pct <= kZeroStaminaThreshold) {
        const double severity = 1.0 - pct / kZeroStaminaThreshold;
        AttributeModifiers chinOnly{};
        chinOnly.chin = kZeroStaminaChinPenalty * severity;
        applyModifiers(chinOnly);
    }
}

void Fighter::updateModifiedAttributes() {
    modified_.power = profile_.power;
    modified_.speed = profile_.speed;
    modified_.stamina = profile_.stamina;
    modified_.defense = profile_.defense;
    modified_.offense = profile_.offense;
    modified_.technical = profile_.technical;
    modified_.mental = profile_.mental;
    modified_.aggressionBias = 0.0;

    applyFatiguePenalties();

    if (visionPenalty_ > 0.0) {
        AttributeModifiers v{};
        v.vision = -visionPenalty_;
        applyModifiers(v);
    }

    for (const auto& b : buffs_) applyModifiers(b.effects);
    for (const auto& d : debuffs_) applyModifiers(d.effects);
}

double Fighter::getFinisherRating(const StoppageParams& p) const {
    const double rating = p.finisher_power_weight * modified_.power.knockoutPower +
                          p.finisher_killer_weight * modified_.mental.killerInstinct;
    return clampd(rating, 0.0, 100.0);
}

// ============================================================
// Counters and statistics
// ============================================================

void Fighter::registerKnockdown() {
    ++knockdownsThisRound_;
    ++knockdownsTotal_;
    ++roundStats_.knockdownsSuffered;
    ++fightStats_.knockdownsSuffered;
}

void Fighter::recordPunchThrown(PunchType punch) {
    for (FighterLedger* l : {&roundStats_, &fightStats_}) {
        ++l->punchesThrown;
        if (isJab(punch)) ++l->jabsThrown;
        if (isPowerPunch(punch)) ++l->powerPunchesThrown;
        if (isBodyPunch(punch)) ++l->bodyPunchesThrown;
    }
}

void Fighter::recordPunchLanded(PunchType punch, PunchQuality quality, double damage) {
    const double d = (std::isfinite(damage) && damage > 0.0) ? damage : 0.0;
    for (FighterLedger* l : {&roundStats_, &fightStats_}) {
        ++l->punchesLanded;
        if (isJab(punch)) ++l->jabsLanded;
        if (isPowerPunch(punch)) ++l->powerPunchesLanded;
        if (isBodyPunch(punch)) ++l->bodyPunchesLanded;
        if (quality == PunchQuality::Clean) ++l->cleanPunchesLanded;
        l->damageDealt += d;
    }
}

void Fighter::recordDamageReceived(double damage) {
    if (!std::isfinite(damage) || damage <= 0.0) return;
    roundStats_.damageReceived += damage;
    fightStats_.damageReceived += damage;
}

void Fighter::recordPunchBlocked() {
    ++roundStats_.punchesBlocked;
    ++fightStats_.punchesBlocked;
}

void Fighter::recordPunchEvaded() {
    ++roundStats_.punchesEvaded;
    ++fightStats_.punchesEvaded;
}

void Fighter::recordKnockdownScored() {
    ++roundStats_.knockdownsScored;
    ++fightStats_.knockdownsScored;
}

// ============================================================
// Round boundaries
// ============================================================

void Fighter::resetForRound() {
    // A new round is a reset, not a transition: the fighter walks out upright.
    state_ = FighterState::Neutral;
    subState_ = SubState::None;
    knockdownsThisRound_ = 0;

    isHurt_ = false;
    hurtDuration_ = 0.0;
    hurtElapsed_ = 0.0;
    removeDebuff("hurt");

    clearBuzzed();
    stunLevel_ = 0;
    stunDuration_ = 0;

    archiveRoundStats();
    roundStats_ = FighterLedger{};
}

void Fighter::archiveRoundStats() {
    roundHistory_.push_back(roundStats_);
}

void Fighter::applyBetweenRoundRecovery() {
    const double age = profile_.physical.age;
    double ageMod = 1.0;
    if (age <= 25.0) ageMod = 1.0;
    else if (age <= 30.0) ageMod = 0.95;
    else if (age <= 35.0) ageMod = 0.85;
    else ageMod = 0.75;

    const double cornerMod = 1.0 + (profile_.corner.strategySkill / 100.0) * 0.1;
    const double bodyMod = std::max(0.3, 1.0 - bodyDamage_ / 200.0);

    double recovery = maxStamina_ * (profile_.stamina.recoveryRate / 100.0) * 0.4;
    recovery *= cornerMod * bodyMod * ageMod;
    recovery = std::min(recovery, maxStamina_ * 0.5);
    recoverStamina(recovery);

    headDamage_ = clampd(headDamage_ * 0.9, 0.0, maxHeadDamage_);
    bodyDamage_ = clampd(bodyDamage_ * 0.95, 0.0, maxBodyDamage_);

    updateModifiedAttributes();
}

// ============================================================
// Archetypes
// ============================================================

FighterProfile FighterProfile::preset(const std::string& archetype, const std::string& name) {
    FighterProfile p;
    p.name = name;

    if (archetype == "boxer") {
        p.style.primary = "out-boxer";
        p.speed = {82, 80, 80, 75, 80};
        p.defense.headMovement = 80; p.defense.blocking = 75; p.defense.ringAwareness = 80;
        p.offense.jabAccuracy = 82; p.offense.powerAccuracy = 72;
        p.technical.footwork = 82; p.technical.distanceManagement = 80; p.technical.ringGeneralship = 75;
        p.power.knockoutPower = 65;
        p.mental.chin = 75; p.mental.heart = 78;
    } else if (archetype == "slugger") {
        p.style.primary = "slugger";
        p.physical.weight_kg = 92.0;
        p.power = {85, 90, 88, 80, 75};
        p.speed.handSpeed = 65; p.speed.footSpeed = 60;
        p.defense.headMovement = 55; p.defense.blocking = 65;
        p.mental.chin = 80; p.mental.killerInstinct = 85; p.mental.intimidation = 75;
        p.stamina.cardio = 65;
    } else if (archetype == "swarmer") {
        p.style.primary = "swarmer";
        p.stamina = {88, 80, 88, 60, 65};
        p.power.bodyPunching = 82;
        p.technical.insideFighting = 82;
        p.mental.heart = 85; p.mental.chin = 78;
        p.tactics.dirtiness = 35; p.tactics.headbuttTendency = 40; p.tactics.holdingTendency = 30;
    } else if (archetype == "counterpuncher") {
        p.style.primary = "counter-puncher";
        p.speed.reflexes = 85;
        p.offense.counterPunching = 85;
        p.defense.parrying = 80; p.defense.headMovement = 78;
        p.technical.fightIQ = 82;
        p.mental.composure = 82;
    } else if (archetype == "journeyman") {
        p.style.primary = "boxer-puncher";
        p.power = {60, 62, 55, 60, 60};
        p.speed = {60, 60, 60, 60, 60};
        p.mental.chin = 65; p.mental.heart = 62; p.mental.experience = 70;
        p.stamina.cardio = 60;
        p.tactics.dirtiness = 25; p.tactics.holdingTendency = 50; p.tactics.pushTendency = 30;
    } else if (archetype == "elite") {
        p.style.primary = "boxer-puncher";
        p.power = {88, 92, 92, 85, 85};
        p.speed = {90, 85, 90, 92, 88};
        p.stamina = {90, 85, 88, 80, 80};
        p.defense.headMovement = 85; p.defense.blocking = 85;
        p.offense.jabAccuracy = 85; p.offense.powerAccuracy = 82;
        p.mental = {90, 95, 94, 88, 85, 90, 85, 90, 90};
        p.technical.fightIQ = 88;
    } else {
        throw std::invalid_argument("unknown fighter archetype: '" + archetype + "'");
    }
    return p;
}

} // namespace ringsim
