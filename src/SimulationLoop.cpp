#include "SimulationLoop.h"

#include "Digest.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace ringsim {

namespace {

// --------------------
// Tunable constants
// --------------------
constexpr double kCriticalHitDamage = 15.0;
constexpr double kCutDamage = 15.0;
constexpr double kCutChance = 0.10;
constexpr double kSwellingChance = 0.08;
constexpr double kStunDamage = 3.0;
constexpr double kBuzzMinDamage = 3.0;
constexpr double kBuzzMaxDamage = 6.0;
constexpr double kHurtBase_s = 3.0;
constexpr double kHurtSpread_s = 3.0;
constexpr double kLowStamina = 0.30;
constexpr double kClinchRange_ft = 3.0;
constexpr double kBreakDistance_ft = 4.0;
constexpr double kNeutralCornerDistance_ft = 6.0;
constexpr int kFinalCount = 10;
constexpr int kDominationMinLanded = 15;
constexpr double kDominationLandedRatio = 2.0;

// Fallbacks when no collaborator is installed.
constexpr double kFallbackPunchCost = 2.0;
constexpr double kFallbackRecovery = 0.2;
constexpr double kFallbackDistance_ft = 8.0;
constexpr double kFallbackX_ft = 4.0;

const std::string kCutLocations[] = {"left_eyebrow", "right_eyebrow", "left_eye", "right_eye", "nose", "lip"};

static inline double clamp01(double v) {
    if (!std::isfinite(v)) return 0.0;
    return (v < 0.0) ? 0.0 : (v > 1.0) ? 1.0 : v;
}

bool isFinite(double v) { return std::isfinite(v); }

std::uint32_t hashProfile(std::uint32_t h, const FighterProfile& p) {
    using digest::fnv1a32_add_f64;
    h = digest::fnv1a32_add_str(h, p.name);
    h = digest::fnv1a32_add_str(h, p.style.primary);
    h = digest::fnv1a32_add_str(h, p.style.defensive);
    h = digest::fnv1a32_add_str(h, p.style.offensive);

    const PhysicalAttributes& ph = p.physical;
    for (double v : {ph.height_cm, ph.weight_kg, ph.reach_cm, ph.age}) h = fnv1a32_add_f64(h, v);
    h = digest::fnv1a32_add_u32(h, static_cast<std::uint32_t>(ph.stance));
    h = digest::fnv1a32_add_u32(h, static_cast<std::uint32_t>(ph.bodyType));

    const PowerAttributes& pw = p.power;
    for (double v : {pw.powerLeft, pw.powerRight, pw.knockoutPower, pw.bodyPunching, pw.punchingStamina})
        h = fnv1a32_add_f64(h, v);
    const SpeedAttributes& sp = p.speed;
    for (double v : {sp.handSpeed, sp.footSpeed, sp.reflexes, sp.firstStep, sp.combinationSpeed})
        h = fnv1a32_add_f64(h, v);
    const StaminaAttributes& st = p.stamina;
    for (double v : {st.cardio, st.recoveryRate, st.workRate, st.secondWind, st.paceControl})
        h = fnv1a32_add_f64(h, v);
    const DefenseAttributes& d = p.defense;
    for (double v : {d.headMovement, d.blocking, d.parrying, d.shoulderRoll, d.clinchDefense, d.clinchOffense,
                     d.ringAwareness})
        h = fnv1a32_add_f64(h, v);
    const OffenseAttributes& o = p.offense;
    for (double v : {o.jabAccuracy, o.powerAccuracy, o.bodyAccuracy, o.punchSelection, o.feinting,
                     o.counterPunching, o.combinationPunching})
        h = fnv1a32_add_f64(h, v);
    const TechnicalAttributes& t = p.technical;
    for (double v : {t.footwork, t.distanceManagement, t.insideFighting, t.outsideFighting, t.ringGeneralship,
                     t.adaptability, t.fightIQ})
        h = fnv1a32_add_f64(h, v);
    const MentalAttributes& m = p.mental;
    for (double v : {m.chin, m.heart, m.killerInstinct, m.composure, m.intimidation, m.confidence, m.experience,
                     m.clutchFactor, m.focus})
        h = fnv1a32_add_f64(h, v);
    const FoulTactics& ft = p.tactics;
    for (double v : {ft.dirtiness, ft.headbuttTendency, ft.lowBlowTendency, ft.rabbitPunchTendency,
                     ft.holdingTendency, ft.elbowTendency, ft.pushTendency})
        h = fnv1a32_add_f64(h, v);
    h = fnv1a32_add_f64(h, p.corner.strategySkill);
    h = fnv1a32_add_f64(h, p.corner.cutmanSkill);
    return h;
}

std::uint32_t hashFighterState(std::uint32_t h, const Fighter& f) {
    h = digest::fnv1a32_add_u32(h, static_cast<std::uint32_t>(f.state()));
    h = digest::fnv1a32_add_u32(h, static_cast<std::uint32_t>(f.subState()));
    h = digest::fnv1a32_add_f64(h, f.stamina());
    h = digest::fnv1a32_add_f64(h, f.headDamage());
    h = digest::fnv1a32_add_f64(h, f.bodyDamage());
    h = digest::fnv1a32_add_i32(h, f.knockdownsTotal());
    h = digest::fnv1a32_add_i32(h, f.fightStats().punchesThrown);
    h = digest::fnv1a32_add_i32(h, f.fightStats().punchesLanded);
    h = digest::fnv1a32_add_f64(h, f.fightStats().damageDealt);
    h = digest::fnv1a32_add_i32(h, static_cast<std::int32_t>(f.cuts().size()));
    return h;
}

} // namespace

// ============================================================
// Construction
// ============================================================

SimulationLoop::SimulationLoop(Fight& fight,
                               const SimulationCollaborators& collaborators,
                               const SimulationOptions& options)
    : fight_(fight), parts_(collaborators), opts_(options), rng_(options.seed) {
    if (!isFinite(opts_.tickRate_s) || opts_.tickRate_s <= 0.0) {
        throw std::invalid_argument("SimulationOptions.tickRate_s must be positive");
    }
    if (std::abs(opts_.tickRate_s - fight_.config().tickRate_s) > 1e-12) {
        throw std::invalid_argument("SimulationOptions.tickRate_s must match FightConfig.tickRate_s");
    }
    if (fight_.fighter(Side::A).id() == fight_.fighter(Side::B).id()) {
        throw std::invalid_argument("fighters must have distinct ids");
    }
    effects_.registerFighter(fight_.fighter(Side::A).id());
    effects_.registerFighter(fight_.fighter(Side::B).id());
}

void SimulationLoop::addSink(EventSink* sink) {
    if (sink != nullptr) sinks_.push_back(sink);
}

// ============================================================
// Lifecycle
// ============================================================

void SimulationLoop::start() {
    if (started_) return;
    started_ = true;

    if (fight_.status() == FightStatus::NotStarted) {
        fight_.start();
    }

    Fighter& a = fight_.fighter(Side::A);
    Fighter& b = fight_.fighter(Side::B);

    FightEvent startEvent = makeEventWithFighters(EventType::FightStart);
    startEvent.text = fight_.config().type;
    startEvent.count = fight_.config().rounds;
    emit(startEvent);

    // Staredown: each side tries to intimidate the other.
    for (Side s : {Side::A, Side::B}) {
        const Fighter& intimidator = fight_.fighter(s);
        const Fighter& target = fight_.opponent(s);
        const MentalAttributes& tm = target.attributes().mental;
        if (effects_.onIntimidation(target.id(), intimidator.attributes().mental.intimidation, tm.heart,
                                    tm.experience, rng_)) {
            FightEvent e = makeEvent(EventType::Intimidation);
            e.side = opponentOf(s);
            e.other = s;
            emit(e);
        }
    }

    for (Side s : {Side::A, Side::B}) {
        if (effects_.applyBigFightMentality(fight_.fighter(s).id(), fight_.fighter(s), fight_.opponent(s))) {
            FightEvent e = makeEvent(EventType::BigFight);
            e.side = s;
            emit(e);
        }
    }
    for (Side s : {Side::A, Side::B}) {
        if (effects_.applyFastStart(fight_.fighter(s).id(), fight_.fighter(s))) {
            FightEvent e = makeEvent(EventType::FastStart);
            e.side = s;
            emit(e);
        }
    }

    effects_.resetForRound();
    bridgeEffectsToAttributes(a);
    bridgeEffectsToAttributes(b);

    if (parts_.positions) {
        parts_.positions->initializePositions();
    }

    emit(makeEvent(EventType::RoundStart));
}

bool SimulationLoop::step() {
    if (!started_) {
        start();
    }

    switch (fight_.status()) {
        case FightStatus::InProgress:
            processFightTick();
            break;
        case FightStatus::BetweenRounds:
            processRestTick();
            break;
        default:
            break;
    }

    if (fight_.isOver()) {
        if (!endEmitted_) emitFightEnd();
        return false;
    }
    return true;
}

int SimulationLoop::runToCompletion() {
    int steps = 0;
    while (!started_ || !fight_.isOver()) {
        ++steps;
        if (!step()) break;
    }
    if (!endEmitted_) emitFightEnd();
    return steps;
}

// ============================================================
// Fight tick
// ============================================================

void SimulationLoop::processFightTick() {
    Round* round = fight_.getCurrentRound();
    if (!round) return;

    const double dt = opts_.tickRate_s;
    fight_.advanceClock(dt);
    round->tick(dt);
    ++tickCount_;

    if (round->isComplete()) {
        handleRoundEnd();
        return;
    }

    const RingContext ring = ringContext();

    // 1. Decisions
    const Decision decisionA = decide(Side::A, ring);
    const Decision decisionB = decide(Side::B, ring);

    // 2. Fouls
    processFouls(ring);
    if (fight_.isOver()) return;

    // 3. State transitions
    applyStateUpdate(Side::A, decisionA);
    applyStateUpdate(Side::B, decisionB);

    // 4. Clinch
    processClinch(decisionA, decisionB, ring);

    // 5. Combat
    const CombatResult combat = resolveCombat(decisionA, decisionB, ring);
    recordAttempts(combat, *round);
    applyHits(combat, *round);
    applyMissCosts(combat);

    // 6. Stamina and movement
    updateStamina(decisionA, decisionB);
    updatePositions(decisionA, decisionB, *round);

    // 7. Knockdown
    if (combat.hasKnockdown) {
        handleKnockdown(combat.knockdown, combat);
        if (fight_.isOver()) return;
    }

    // 8. Stoppage
    checkTKOConditions();
    if (fight_.isOver()) return;

    // 9. Timers and effects
    endOfTickUpdates();

    FightEvent tick = makeEventWithFighters(EventType::Tick);
    emit(tick);
}

RingContext SimulationLoop::ringContext() const {
    RingContext ring;
    ring.effects = &effects_;
    if (parts_.positions) {
        ring.distance_ft = parts_.positions->getDistance();
        for (Side s : {Side::A, Side::B}) {
            ring.onRopes[sideIndex(s)] = parts_.positions->isOnRopes(s);
            ring.inCorner[sideIndex(s)] = parts_.positions->isInCorner(s);
        }
    } else {
        ring.distance_ft = kFallbackDistance_ft;
    }
    return ring;
}

Decision SimulationLoop::decide(Side s, const RingContext& ring) {
    const Fighter& f = fight_.fighter(s);
    if (!parts_.decisions) {
        Decision d;
        d.state = f.state();
        d.subState = f.subState();
        d.action.type = ActionType::Wait;
        return d;
    }
    return parts_.decisions->decide(f, fight_.opponent(s), fight_, ring, rng_);
}

void SimulationLoop::applyStateUpdate(Side s, const Decision& d) {
    Fighter& f = fight_.fighter(s);
    if (f.isDown()) return;

    // Hurt and buzzed are owned by the engine; only the posture may change.
    const bool engineOwned = f.isHurt() || f.isBuzzed();
    if (!engineOwned && isVoluntaryState(d.state) && d.state != f.state() && f.canTransitionTo(d.state)) {
        f.transitionTo(d.state);
    }
    if (d.subState != f.subState()) {
        f.setSubState(d.subState);
    }
}

// ============================================================
// Fouls
// ============================================================

void SimulationLoop::processFouls(const RingContext& ring) {
    Round* round = fight_.getCurrentRound();
    for (Side s : {Side::A, Side::B}) {
        if (fight_.isOver()) return;

        Fighter& attacker = fight_.fighter(s);
        Fighter& target = fight_.opponent(s);
        if (attacker.isDown() || target.isDown()) continue;

        FoulSituation situation;
        situation.staminaPercent = attacker.getStaminaPercent();
        situation.distance = ring.distance_ft;
        situation.round = fight_.currentRoundNumber();
        situation.scoreDiff = fight_.estimatedScoreDiff(s);
        situation.inClinch = clinchActive_;

        FoulType type = FoulType::Push;
        if (!fouls_.shouldAttemptFoul(attacker, s, situation, rng_, type)) continue;

        const FoulResult result = fouls_.executeFoul(type, attacker, s, fight_.referee().getSkill(), rng_);
        FoulPolicy::applyFoulEffects(result, attacker, target);
        if (round) round->addEvent("FOUL", s, toString(type));

        FightEvent e = makeEvent(EventType::Foul);
        e.side = s;
        e.other = opponentOf(s);
        e.foul = type;
        e.detected = result.detected;
        e.consequence = result.consequence;
        e.damage = result.damage;
        emit(e);

        if (result.cutCaused) {
            openCut(opponentOf(s), cutLocation(), 1);
        }

        if (!result.detected) continue;

        switch (result.consequence) {
            case FoulConsequence::Warning:
                emitCommand("WARNING");
                break;
            case FoulConsequence::PointDeduction: {
                fight_.addPointDeduction(s);
                emitCommand("POINT");
                FightEvent pd = makeEvent(EventType::PointDeduction);
                pd.side = s;
                pd.text = toString(type);
                pd.count = fight_.pointDeductions(s);
                emit(pd);
                break;
            }
            case FoulConsequence::Disqualification: {
                FinishDetails details;
                details.reason = std::string("disqualification: ") + toString(type);
                stopFight(ResultMethod::Disqualification, opponentOf(s), details);
                return;
            }
            default:
                break;
        }
    }
}

// ============================================================
// Clinch
// ============================================================

void SimulationLoop::processClinch(const Decision& a, const Decision& b, const RingContext& ring) {
    const bool aWants = a.action.type == ActionType::Clinch;
    const bool bWants = b.action.type == ActionType::Clinch;
    const bool anyDown = fight_.fighter(Side::A).isDown() || fight_.fighter(Side::B).isDown();

    if (!clinchActive_) {
        if (anyDown || !(aWants || bWants) || ring.distance_ft >= kClinchRange_ft) return;
        clinchActive_ = true;
        clinchInitiator_ = aWants ? Side::A : Side::B;
        clinchDuration_s_ = 0.0;
        fight_.referee().resetClinch();
        return;
    }

    if (anyDown || !(aWants || bWants)) {
        endClinch();
        return;
    }

    clinchDuration_s_ += opts_.tickRate_s;
    const ClinchDecision call = fight_.referee().checkClinchBreak(
        clinchDuration_s_, fight_.fighter(Side::A), fight_.fighter(Side::B), rng_);

    switch (call.call) {
        case ClinchCall::Work:
            emitCommand("WORK");
            break;
        case ClinchCall::Break:
            emitCommand("BREAK");
            endClinch();
            if (parts_.positions) parts_.positions->separateFighters(kBreakDistance_ft);
            break;
        default:
            break;
    }
}

void SimulationLoop::endClinch() {
    if (!clinchActive_) return;
    if (Round* round = fight_.getCurrentRound()) {
        round->recordClinch(clinchInitiator_, clinchDuration_s_);
    }
    clinchActive_ = false;
    clinchDuration_s_ = 0.0;
    fight_.referee().resetClinch();
}

// ============================================================
// Combat and damage
// ============================================================

CombatResult SimulationLoop::resolveCombat(const Decision& a, const Decision& b, const RingContext& ring) {
    if (!parts_.combat) {
        return CombatResult{};
    }
    return parts_.combat->resolve(fight_.fighter(Side::A), fight_.fighter(Side::B), a, b, fight_, ring, rng_);
}

void SimulationLoop::recordAttempts(const CombatResult& r, Round& round) {
    for (const auto* list : {&r.hits, &r.misses, &r.blocks, &r.evades}) {
        for (const PunchOutcome& p : *list) {
            round.recordPunchThrown(p.attacker, p.punch);
            fight_.fighter(p.attacker).recordPunchThrown(p.punch);
        }
    }
    for (const PunchOutcome& p : r.misses) {
        round.recordPunchMissed(p.attacker);
    }
    for (const PunchOutcome& p : r.blocks) {
        round.recordPunchBlocked(opponentOf(p.attacker));
        fight_.opponent(p.attacker).recordPunchBlocked();
    }
    for (const PunchOutcome& p : r.evades) {
        round.recordPunchEvaded(opponentOf(p.attacker));
        fight_.opponent(p.attacker).recordPunchEvaded();
    }
}

void SimulationLoop::applyHits(const CombatResult& r, Round& round) {
    for (const PunchOutcome& hit : r.hits) {
        const Side targetSide = opponentOf(hit.attacker);
        Fighter& attacker = fight_.fighter(hit.attacker);
        Fighter& target = fight_.fighter(targetSide);

        double damage = hit.damage;
        if (parts_.damage) {
            damage = parts_.damage->calculateDamage(hit, attacker, target);
        }
        if (!isFinite(damage) || damage < 0.0) damage = 0.0;

        target.takeDamage(damage, hit.location);
        target.recordDamageReceived(damage);
        attacker.recordPunchLanded(hit.punch, hit.quality, damage);
        round.recordPunchLanded(hit.attacker, hit.punch, hit.quality, damage);

        if (parts_.stamina) {
            target.spendStamina(parts_.stamina->calculateHitStaminaCost(damage, hit.location));
        }

        FightEvent e = makeEvent(EventType::PunchLanded);
        e.side = hit.attacker;
        e.other = targetSide;
        e.punch = hit.punch;
        e.location = hit.location;
        e.damage = damage;
        e.quality = hit.quality;
        e.isCounter = hit.isCounter;
        emit(e);

        PunchLandedInfo info;
        info.damage = damage;
        info.punch = hit.punch;
        info.isCounter = hit.isCounter;
        info.isCritical = damage > kCriticalHitDamage;
        effects_.onPunchLanded(attacker.id(), target.id(), info, rng_);

        if (hit.location == TargetLocation::Head && damage > kCutDamage) {
            if (rng_.u01() < kCutChance) {
                openCut(targetSide, cutLocation(), 1);
            } else if (rng_.u01() < kSwellingChance) {
                target.addSwelling(cutLocation(), 1);
            }
        }

        if (hit.causedStun || damage >= kStunDamage) {
            target.applyStun(damage, hit.punch);
        }

        // A fresh buzz needs the roll; an existing one compounds on the same roll.
        if (!target.isHurt() && damage >= kBuzzMinDamage && damage < kBuzzMaxDamage &&
            hit.location == TargetLocation::Head) {
            const double buzzChance = (damage - 2.0) * 0.15 + (1.0 - target.attributes().mental.chin / 150.0);
            if (rng_.u01() < buzzChance) {
                target.setBuzzed(damage, hit.punch);
                if (target.isBuzzed()) {
                    FightEvent be = makeEvent(EventType::Buzzed);
                    be.side = targetSide;
                    be.severity = target.buzzedSeverity();
                    be.duration_s = target.buzzedDuration();
                    emit(be);
                }
            }
        }

        if (parts_.damage && parts_.damage->checkHurt(target, damage, rng_)) {
            if (target.isBuzzed()) target.clearBuzzed();
            target.setHurt(kHurtBase_s + rng_.u01() * kHurtSpread_s);

            FightEvent he = makeEvent(EventType::Hurt);
            he.side = targetSide;
            he.duration_s = target.hurtDuration();
            emit(he);

            effects_.onFighterHurt(target.id(), attacker.id(), rng_);
        }
    }
}

void SimulationLoop::applyMissCosts(const CombatResult& r) {
    if (!parts_.stamina) return;
    for (const PunchOutcome& p : r.misses) {
        fight_.fighter(p.attacker).spendStamina(parts_.stamina->calculateMissStaminaCost(p.punch));
    }
}

void SimulationLoop::openCut(Side s, const std::string& location, int severity) {
    Fighter& f = fight_.fighter(s);
    f.addCut(location, severity);

    int current = severity;
    for (const CutMark& c : f.cuts()) {
        if (c.location == location) current = c.severity;
    }

    FightEvent e = makeEvent(EventType::Cut);
    e.side = s;
    e.text = location;
    e.severity = current;
    emit(e);

    effects_.onCutOpened(f.id(), location, current);
}

const std::string& SimulationLoop::cutLocation() {
    const int n = static_cast<int>(sizeof(kCutLocations) / sizeof(kCutLocations[0]));
    return kCutLocations[rng_.pickIndex(n)];
}

// ============================================================
// Stamina and positions
// ============================================================

void SimulationLoop::updateStamina(const Decision& a, const Decision& b) {
    for (Side s : {Side::A, Side::B}) {
        Fighter& f = fight_.fighter(s);
        const Decision& d = (s == Side::A) ? a : b;
        if (parts_.stamina) {
            parts_.stamina->update(f, d, opts_.tickRate_s);
            continue;
        }
        if (d.action.type == ActionType::Punch || d.action.type == ActionType::Combination) {
            f.spendStamina(kFallbackPunchCost);
        }
        if (f.state() == FighterState::Defensive || f.state() == FighterState::Neutral) {
            f.recoverStamina(kFallbackRecovery);
        }
    }
}

void SimulationLoop::updatePositions(const Decision& a, const Decision& b, Round& round) {
    if (!parts_.positions) return;
    PositionTracker& pt = *parts_.positions;
    const double dt = opts_.tickRate_s;

    pt.update(fight_.fighter(Side::A), fight_.fighter(Side::B), a, b, dt, rng_);

    Side controller = Side::A;
    const bool controlled = pt.getCenterControl(controller);
    for (Side s : {Side::A, Side::B}) {
        round.recordPositionTime(s, controlled && controller == s, pt.isOnRopes(s), pt.isInCorner(s), dt);

        const Action& act = (s == Side::A) ? a.action : b.action;
        if (act.type == ActionType::Move) {
            const bool forward = act.direction == MoveDirection::Forward || act.cutting;
            const bool backward = !forward && act.direction == MoveDirection::Backward;
            round.recordMovementTime(s, forward, backward, dt);
        }
    }
}

// ============================================================
// Knockdown protocol
// ============================================================

double SimulationLoop::calculateFlashRecoveryChance(const Fighter& fighter) const {
    const RecoveryParams& p = fight_.params().recovery;
    const double heart = fighter.attributes().mental.heart;

    double chance = 0.20;
    if (heart >= 95.0) chance = 0.98;
    else if (heart >= 90.0) chance = 0.92;
    else if (heart >= 85.0) chance = 0.80;
    else if (heart >= 80.0) chance = 0.55;
    else if (heart >= 75.0) chance = 0.35;

    const int prior = fighter.isDown() ? std::max(0, fighter.knockdownsTotal() - 1) : fighter.knockdownsTotal();
    if (prior >= 2) chance *= p.flash_prior_two_factor;
    else if (prior >= 1) chance *= p.flash_prior_one_factor;

    const double head = fighter.getHeadDamagePercent();
    if (head > 0.5) chance *= 0.6;
    else if (head > 0.3) chance *= 0.8;

    return clamp01(chance);
}

double SimulationLoop::calculateImmediateKOChance(const Fighter& fighter,
                                                  const Fighter& attacker,
                                                  double damage) const {
    const KnockoutParams& p = fight_.params().knockout;
    const MentalAttributes& m = fighter.attributes().mental;

    double ko = std::max(0.0, (attacker.attributes().power.knockoutPower - p.power_floor) / p.power_divisor);
    ko *= 1.0 - m.chin / p.chin_divisor;

    if (isFinite(damage)) {
        if (damage >= p.huge_shot_damage) ko *= 2.0;
        else if (damage >= p.big_shot_damage) ko *= 1.5;
    }

    const double head = fighter.getHeadDamagePercent();
    if (head > 0.7) ko *= 2.5;
    else if (head > 0.5) ko *= 1.8;
    else if (head > 0.3) ko *= 1.3;

    const int priorRound =
        fighter.isDown() ? std::max(0, fighter.knockdownsThisRound() - 1) : fighter.knockdownsThisRound();
    if (priorRound >= 2) ko *= 2.0;
    else if (priorRound >= 1) ko *= 1.4;

    const double stamina = fighter.getStaminaPercent();
    if (stamina < 0.2) ko *= 1.8;
    else if (stamina < 0.4) ko *= 1.3;

    ko *= 1.0 - m.heart / p.heart_divisor;

    return std::min(p.cap, std::max(0.0, ko));
}

double SimulationLoop::calculateRecoveryChance(const Fighter& fighter, double damage, int count) const {
    const RecoveryParams& p = fight_.params().recovery;
    const MentalAttributes& m = fighter.attributes().mental;
    (void)damage; // the knockdown punch is already in the head damage total

    double heartFactor = 0.30 + (m.heart - 50.0) * 0.008;
    if (m.heart >= 95.0) heartFactor = 0.95 + (m.heart - 95.0) * 0.01;
    else if (m.heart >= 85.0) heartFactor = 0.75 + (m.heart - 85.0) * 0.02;
    else if (m.heart >= 75.0) heartFactor = 0.50 + (m.heart - 75.0) * 0.025;

    const double baseFactor = (m.chin + m.experience + m.composure) / 300.0;
    double chance = heartFactor * p.heart_weight + baseFactor * p.base_weight;

    const double head = fighter.getHeadDamagePercent();
    if (head > 0.6) chance *= 1.0 - (head - 0.6) * 1.5;
    else chance *= 1.0 - head * 0.3;

    if (count <= 4) chance *= p.count_low_factor;
    else if (count == 7) chance *= p.count_seven_factor;
    else if (count == 8) chance *= p.count_eight_factor;
    else if (count >= 9) chance *= p.count_nine_factor;

    const double stamina = fighter.getStaminaPercent();
    if (stamina < 0.2) chance *= 0.5;
    else if (stamina < 0.4) chance *= 0.7;
    else chance *= 0.8 + stamina * 0.2;

    const int prior = fighter.isDown() ? std::max(0, fighter.knockdownsTotal() - 1) : fighter.knockdownsTotal();
    if (prior > 0) chance *= std::pow(p.prior_knockdown_decay, prior);

    if (!isFinite(chance)) return p.min_chance;
    return std::min(p.max_chance, std::max(p.min_chance, chance));
}

void SimulationLoop::handleKnockdown(const KnockdownRequest& kd, const CombatResult& r) {
    if (kd.target == kd.attacker) return;
    Fighter& downed = fight_.fighter(kd.target);
    Fighter& attacker = fight_.fighter(kd.attacker);
    if (downed.isDown()) return;
    Round* round = fight_.getCurrentRound();

    bool wasCounter = false;
    for (const PunchOutcome& h : r.hits) {
        if (h.attacker == kd.attacker && h.punch == kd.punch) wasCounter = wasCounter || h.isCounter;
    }

    // A third knockdown under the rule ends the fight, so it is never a flash.
    const bool threeKnockdownStop =
        fight_.config().threeKnockdownRule && downed.knockdownsThisRound() + 1 >= 3;

    // A flash is settled up front; one the fighter will not beat is reported as a full knockdown.
    const bool flash = kd.flash && !threeKnockdownStop && rng_.u01() < calculateFlashRecoveryChance(downed);

    endClinch();
    downed.registerKnockdown();
    attacker.recordKnockdownScored();
    downed.transitionTo(flash ? FighterState::FlashDown : FighterState::KnockedDown);

    FightEvent kdEvent = makeEventWithFighters(flash ? EventType::FlashKnockdown : EventType::Knockdown);
    kdEvent.side = kd.target;
    kdEvent.other = kd.attacker;
    kdEvent.punch = kd.punch;
    kdEvent.damage = kd.damage;
    emit(kdEvent);

    effects_.onKnockdown(downed.id(), attacker.id());

    FinishDetails details;
    details.hasPunch = true;
    details.punch = kd.punch;
    details.damage = kd.damage;
    details.wasCounter = wasCounter;

    if (threeKnockdownStop) {
        if (round) round->recordKnockdown(kd.target, kd.punch, 0);
        details.reason = "three_knockdowns";
        stopFight(ResultMethod::TKO_ThreeKnockdowns, kd.attacker, details);
        return;
    }

    auto emitCount = [this, &kd](int n, bool isKO) {
        FightEvent c = makeEvent(EventType::Count);
        c.side = kd.target;
        c.count = n;
        c.isKO = isKO;
        emit(c);
    };

    bool recovered = false;
    int count = 0;

    if (flash) {
        const MentalAttributes& m = downed.attributes().mental;
        const double bonus = (m.chin + m.heart) / 200.0;
        count = std::max(2, std::min(4, static_cast<int>(std::lround(4.0 - bonus * 2.0))));
        for (int i = 1; i <= count; ++i) emitCount(i, false);
        recovered = true;
    } else if (rng_.u01() < calculateImmediateKOChance(downed, attacker, kd.damage)) {
        for (int i = 1; i <= kFinalCount; ++i) emitCount(i, i == kFinalCount);
        count = kFinalCount;
    } else {
        const RecoveryParams& p = fight_.params().recovery;
        const bool mandatory = fight_.config().mandatoryEightCount;
        for (int i = 1; i <= kFinalCount; ++i) {
            count = i;
            if (i >= static_cast<int>(p.check_from_count) &&
                rng_.u01() < calculateRecoveryChance(downed, kd.damage, i) &&
                (!mandatory || i >= static_cast<int>(p.mandatory_count))) {
                recovered = true;
            }
            emitCount(i, !recovered && i == kFinalCount);
            if (recovered) break;
        }
    }

    if (round) round->recordKnockdown(kd.target, kd.punch, count);

    if (!recovered) {
        details.reason = "knockout";
        stopFight(ResultMethod::KO, kd.attacker, details);
        return;
    }

    downed.transitionTo(FighterState::Recovered);

    FightEvent rec = makeEvent(EventType::Recovery);
    rec.side = kd.target;
    rec.count = count;
    emit(rec);

    effects_.onRecovery(downed.id(), rng_);

    StatusEffect debuff;
    debuff.type = "post_knockdown";
    debuff.remainingTicks = flash ? 15 : 30;
    debuff.effects.speed = flash ? -5.0 : -10.0;
    debuff.effects.power = flash ? -3.0 : -5.0;
    debuff.effects.defense = flash ? -8.0 : -15.0;
    downed.addDebuff(debuff);

    if (flash && !downed.isHurt()) {
        downed.setBuzzed(3.0, kd.punch);
        if (downed.isBuzzed()) {
            FightEvent be = makeEvent(EventType::Buzzed);
            be.side = kd.target;
            be.severity = downed.buzzedSeverity();
            be.duration_s = downed.buzzedDuration();
            emit(be);
        }
    }

    // Getting up does not clear a hurt or a daze carried onto the canvas.
    if (downed.isHurt()) downed.transitionTo(FighterState::Hurt);
    else if (downed.isBuzzed()) downed.transitionTo(FighterState::Buzzed);

    if (parts_.positions) parts_.positions->separateFighters(kNeutralCornerDistance_ft);
    emitCommand("BOX");
}

// ============================================================
// Stoppage
// ============================================================

TkoEvaluation SimulationLoop::evaluateTKO(Side s) {
    TkoEvaluation out;
    const Fighter& f = fight_.fighter(s);
    const Fighter& opp = fight_.opponent(s);
    const StoppageParams& sp = fight_.params().stoppage;

    const double head = f.getHeadDamagePercent();
    const double body = f.getBodyDamagePercent();
    const double stamina = f.getStaminaPercent();

    auto hardStop = [&out](ResultMethod m, const char* reason) {
        out.shouldStop = true;
        out.method = m;
        out.probability = 1.0;
        out.reason = reason;
        return out;
    };

    if (fight_.config().threeKnockdownRule && f.knockdownsThisRound() >= 3) {
        return hardStop(ResultMethod::TKO_ThreeKnockdowns, "three_knockdowns");
    }

    double p = 0.0;
    if (stamina <= 0.0) {
        if (f.isHurt() || head >= 0.8) return hardStop(ResultMethod::TKO_Referee, "exhaustion_and_damage");
        p += 0.35;
    } else if (stamina < 0.15) {
        p += 0.15;
    }

    if (head >= 1.0) {
        if (f.knockdownsTotal() > 0 || stamina < 0.15) return hardStop(ResultMethod::TKO_Referee, "damage");
        p += 0.2;
    }
    if (body >= 1.0 && f.knockdownsTotal() > 0) {
        return hardStop(ResultMethod::TKO_Referee, "body_damage");
    }

    if (f.knockdownsThisRound() >= 2) p += 0.4;

    if (f.knockdownsTotal() >= 4) p += 0.3;
    else if (f.knockdownsTotal() >= 3) p += 0.2;
    else if (f.knockdownsTotal() >= 2) p += 0.1;

    if (f.isHurt() && f.knockdownsThisRound() >= 1) p += 0.3;

    if (f.isHurt() && f.hurtElapsed() > 10.0 && f.roundStats().damageReceived > 30.0) {
        p += 0.15;
    }

    const int cut = f.worstCutSeverity();
    if (cut >= 3) {
        p += 0.15;
        out.method = ResultMethod::TKO_Doctor;
        out.reason = "cut";
    }
    if (cut >= 4) {
        p += 0.3;
    }

    // A finisher in front of a fighter in trouble.
    if (f.isHurt() || f.knockdownsThisRound() >= 1) {
        const double rating = opp.getFinisherRating(sp);
        p += rating / 100.0 * sp.finisher_base_scale;
        if (rating > sp.finisher_threshold) {
            const double over = rating - sp.finisher_threshold;
            p += over * over * sp.finisher_steep_scale;
        }
    }

    p *= fight_.referee().protectiveness();
    out.probability = p;

    if (p > sp.gate_threshold && rng_.u01() < p * sp.gate_multiplier) {
        out.shouldStop = true;
        if (out.reason.empty()) out.reason = "referee_stoppage";
        return out;
    }

    // The referee steps in on his own only for a hurt fighter.
    if (f.isHurt()) {
        StoppageSituation situation;
        situation.scoreDiff = fight_.estimatedScoreDiff(s);
        const StoppageDecision ref = fight_.referee().checkStoppage(f, opp, situation);
        if (ref.shouldStop) {
            out.shouldStop = true;
            out.method = ResultMethod::TKO_Referee;
            out.reason = ref.reason;
        }
    }
    return out;
}

void SimulationLoop::checkTKOConditions() {
    for (Side s : {Side::A, Side::B}) {
        const TkoEvaluation tko = evaluateTKO(s);
        if (!tko.shouldStop) continue;

        FinishDetails details;
        details.reason = tko.reason;
        emitCommand("STOP");
        stopFight(tko.method, opponentOf(s), details);
        return;
    }
}

void SimulationLoop::stopFight(ResultMethod method, Side winner, const FinishDetails& details) {
    if (fight_.isOver()) return;
    endClinch();
    fight_.stopFight(method, winner, details);

    FightEvent e = makeEventWithFighters(EventType::FightEnding);
    e.hasWinner = true;
    e.winner = winner;
    e.method = method;
    e.isKO = (method == ResultMethod::KO);
    e.text = details.reason;
    emit(e);
}

// ============================================================
// End of tick
// ============================================================

void SimulationLoop::bridgeEffectsToAttributes(Fighter& f) {
    // Accuracy and power are read from the effects engine by the resolver
    // directly; only the remaining aggregates are folded into attributes.
    f.removeBuff("fight_effects");
    StatusEffect bridge;
    bridge.type = "fight_effects";
    bridge.effects.speed = effects_.getSpeedModifier(f.id()) * 100.0;
    bridge.effects.defense = effects_.getDefenseModifier(f.id()) * 100.0;
    bridge.effects.aggression = effects_.getAggressionModifier(f.id()) * 100.0;
    f.addBuff(bridge);
    f.updateModifiedAttributes();
}

void SimulationLoop::endOfTickUpdates() {
    const int roundNumber = fight_.currentRoundNumber();
    const int totalRounds = fight_.config().rounds;

    for (Side s : {Side::A, Side::B}) {
        Fighter& f = fight_.fighter(s);
        f.updateStun(opts_.tickRate_s);
        f.updateBuzzed(rng_);
        f.tickStatusEffects();
    }

    effects_.tick();

    for (Side s : {Side::A, Side::B}) {
        Fighter& f = fight_.fighter(s);
        const double stamina = f.getStaminaPercent();
        if (stamina < kLowStamina) effects_.onStaminaLow(f.id(), stamina);
        if (roundNumber >= totalRounds - 2) {
            effects_.checkSecondWind(f.id(), f, roundNumber, totalRounds, rng_);
        }
        effects_.checkFocusLapse(f.id(), f, rng_);
        bridgeEffectsToAttributes(f);
    }
}

// ============================================================
// Round boundaries
// ============================================================

void SimulationLoop::handleRoundEnd() {
    endClinch();
    const int ended = fight_.currentRoundNumber();
    fight_.endRound(rng_);

    FightEvent e = makeEventWithFighters(EventType::RoundEnd);
    e.round = ended;
    if (const Round* round = fight_.getCurrentRound()) {
        e.summary = round->getSummary();
        e.roundTime_s = round->currentTime();
    }
    e.scorecards = fight_.getCurrentScores();
    emit(e);

    if (fight_.isOver()) return;
    const Round* round = fight_.getCurrentRound();
    if (!round) return;

    const int remaining = fight_.config().rounds - ended;
    for (Side s : {Side::A, Side::B}) {
        const Fighter& f = fight_.fighter(s);
        const RoundStats& mine = round->stats(s);
        const RoundStats& theirs = round->stats(opponentOf(s));
        effects_.onHighOutput(f.id(), mine.punchesThrown);
        effects_.onBehindOnCards(f.id(), remaining, -fight_.estimatedScoreDiff(s));

        // Out-landed two to one and out-damaged over a full round.
        if (theirs.punchesLanded >= kDominationMinLanded &&
            theirs.punchesLanded >= kDominationLandedRatio * mine.punchesLanded &&
            theirs.damageDealt > mine.damageDealt) {
            effects_.onDomination(f.id(), fight_.opponent(s).id());
        }
    }
}

void SimulationLoop::processRestTick() {
    fight_.advanceRest(opts_.tickRate_s);
    if (fight_.restTime() + 1e-9 < fight_.config().restDuration_s) return;
    beginNextRound();
}

void SimulationLoop::beginNextRound() {
    fight_.startNextRound();
    fouls_.resetRound();
    clinchActive_ = false;
    clinchDuration_s_ = 0.0;
    fight_.referee().resetClinch();

    effects_.resetForRound();
    const int round = fight_.currentRoundNumber();
    for (Side s : {Side::A, Side::B}) {
        Fighter& f = fight_.fighter(s);
        effects_.updateFastStartForRound(f.id(), round);
        bridgeEffectsToAttributes(f);
    }

    if (parts_.positions) parts_.positions->resetForRound();

    emit(makeEvent(EventType::RoundStart));
}

// ============================================================
// Events
// ============================================================

FighterSnapshot SimulationLoop::snapshot(Side s) const {
    const Fighter& f = fight_.fighter(s);
    double x = (s == Side::A) ? -kFallbackX_ft : kFallbackX_ft;
    double y = 0.0;
    if (parts_.positions) {
        const RingPoint p = parts_.positions->position(s);
        x = p.x;
        y = p.y;
    }
    return snapshotOf(f, x, y, effects_.momentum(f.id()));
}

FightEvent SimulationLoop::makeEvent(EventType type) const {
    FightEvent e;
    e.type = type;
    e.round = fight_.currentRoundNumber();
    e.totalTime_s = fight_.totalTime();
    if (const Round* round = fight_.getCurrentRound()) {
        e.roundTime_s = round->currentTime();
    }
    return e;
}

FightEvent SimulationLoop::makeEventWithFighters(EventType type) const {
    FightEvent e = makeEvent(type);
    e.hasFighters = true;
    e.fighters[0] = snapshot(Side::A);
    e.fighters[1] = snapshot(Side::B);
    e.distance_ft = parts_.positions ? parts_.positions->getDistance() : kFallbackDistance_ft;
    return e;
}

void SimulationLoop::emit(const FightEvent& e) {
    eventCrc_ = crc32AddEvent(eventCrc_, e);
    for (EventSink* sink : sinks_) {
        sink->onEvent(e);
    }
}

void SimulationLoop::emitCommand(const std::string& type) {
    const RefereeCommand cmd = fight_.referee().issueCommand(type, rng_);
    FightEvent e = makeEvent(EventType::RefereeCommand);
    e.text = cmd.text;
    e.detail = cmd.type;
    emit(e);
}

void SimulationLoop::emitFightEnd() {
    endEmitted_ = true;
    const FightResult& r = fight_.result();

    FightEvent e = makeEventWithFighters(EventType::FightEnd);
    e.hasWinner = r.hasWinner;
    e.winner = r.winner;
    e.method = r.method;
    e.isKO = (r.method == ResultMethod::KO);
    e.round = r.round;
    e.roundTime_s = r.time_s;
    e.scorecards = fight_.getCurrentScores();
    emit(e);
}

// ============================================================
// Signatures
// ============================================================

RunSignatures SimulationLoop::signatures() const {
    RunSignatures sig;

    const FightConfig& c = fight_.config();
    std::uint32_t h = digest::fnv1a32_begin();
    h = digest::fnv1a32_add_str(h, c.type);
    h = digest::fnv1a32_add_i32(h, c.rounds);
    h = digest::fnv1a32_add_f64(h, c.roundDuration_s);
    h = digest::fnv1a32_add_f64(h, c.restDuration_s);
    h = digest::fnv1a32_add_f64(h, c.tickRate_s);
    h = digest::fnv1a32_add_u32(h, c.mandatoryEightCount ? 1u : 0u);
    h = digest::fnv1a32_add_u32(h, c.threeKnockdownRule ? 1u : 0u);
    h = digest::fnv1a32_add_u32(h, static_cast<std::uint32_t>(c.homeFighter));
    h = digest::fnv1a32_add_u32(h, opts_.seed);
    h = hashProfile(h, fight_.fighter(Side::A).profile());
    h = hashProfile(h, fight_.fighter(Side::B).profile());
    h = digest::fnv1a32_add_u32(h, fight_.params().paramHashU32());
    sig.run_param_hash_u32 = h;

    sig.event_crc_u32 = eventCrc_;

    std::uint32_t s = digest::fnv1a32_begin();
    s = digest::fnv1a32_add_u32(s, static_cast<std::uint32_t>(fight_.status()));
    s = digest::fnv1a32_add_i32(s, fight_.currentRoundNumber());
    s = digest::fnv1a32_add_f64(s, fight_.totalTime());
    s = hashFighterState(s, fight_.fighter(Side::A));
    s = hashFighterState(s, fight_.fighter(Side::B));
    s = digest::fnv1a32_add_u32(s, rng_.state());
    sig.state_digest_u32 = s;

    return sig;
}

} // namespace ringsim
