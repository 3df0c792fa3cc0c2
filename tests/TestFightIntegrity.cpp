#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "Digest.h"
#include "Errors.h"
#include "Events.h"
#include "Fight.h"
#include "FightEffects.h"
#include "FightScenario.h"
#include "FightSensitivity.h"
#include "Fighter.h"
#include "FoulPolicy.h"
#include "Judge.h"
#include "ModelParameters.h"
#include "OutcomeUQ.h"
#include "RealTimeDriver.h"
#include "Referee.h"
#include "ReferenceCollaborators.h"
#include "Rng.h"
#include "Round.h"
#include "SimulationLoop.h"
#include "../ring/ring_geometry.h"

namespace {

// Always-on requirement: never compiled out in Release.
#define REQUIRE(cond, msg)                                                      \
    do {                                                                        \
        if (!(cond)) {                                                          \
            std::cerr << "[FAIL] " << __FILE__ << ":" << __LINE__ << " " << msg \
                      << "\n";                                                  \
            std::exit(1);                                                       \
        }                                                                       \
    } while (0)

static inline void REQUIRE_FINITE(double x, const char* name) {
    if (!std::isfinite(x)) {
        std::cerr << "[FAIL] Non-finite: " << name << " = " << x << "\n";
        std::exit(1);
    }
}

static inline double absd(double x) { return x < 0 ? -x : x; }
static inline double maxd(double a, double b) { return (a > b) ? a : b; }

static void requireCloseAbsOrRel(const char* name, double a, double b, double absTol, double relTol) {
    REQUIRE_FINITE(a, name);
    REQUIRE_FINITE(b, name);

    const double diff = absd(a - b);
    const double denom = maxd(absd(a), absd(b));
    const double rel = (denom > 0.0) ? (diff / denom) : diff;

    if (!(diff <= absTol || rel <= relTol)) {
        std::cerr << "[FAIL] " << name
                  << " a=" << a << " b=" << b
                  << " diff=" << diff << " (absTol=" << absTol << ")"
                  << " rel=" << rel << " (relTol=" << relTol << ")\n";
        std::exit(1);
    }
}

static void requireExact(const char* label, double a, double b) {
    REQUIRE_FINITE(a, label);
    REQUIRE_FINITE(b, label);
    if (!(a == b)) {
        std::cerr << "[FAIL] " << label << " changed unexpectedly: a=" << a << " b=" << b << "\n";
        std::exit(1);
    }
}

// True when fn throws Ex. Any other exception escapes and fails the run.
template <class Ex, class Fn>
static bool throwsAs(Fn fn) {
    try {
        fn();
    } catch (const Ex&) {
        return true;
    }
    return false;
}

static void requireUnitInterval(const char* name, double p) {
    REQUIRE_FINITE(p, name);
    if (!(p >= 0.0 && p <= 1.0)) {
        std::cerr << "[FAIL] " << name << " outside [0,1]: " << p << "\n";
        std::exit(1);
    }
}

static ringsim::FighterProfile named(const std::string& name) {
    ringsim::FighterProfile p;
    p.name = name;
    return p;
}

static ringsim::FightConfig shortConfig(int rounds) {
    ringsim::FightConfig c;
    c.rounds = rounds;
    return c;
}

static bool sameSignatures(const ringsim::RunSignatures& a, const ringsim::RunSignatures& b) {
    return a.run_param_hash_u32 == b.run_param_hash_u32 &&
           a.event_crc_u32 == b.event_crc_u32 &&
           a.state_digest_u32 == b.state_digest_u32;
}

// Requests a knockdown of B on every tick and lands nothing else.
class KnockdownEveryTick : public ringsim::CombatResolver {
public:
    ringsim::CombatResult resolve(ringsim::Fighter&,
                                  ringsim::Fighter&,
                                  const ringsim::Decision&,
                                  const ringsim::Decision&,
                                  const ringsim::Fight&,
                                  const ringsim::RingContext&,
                                  ringsim::Rng&) override {
        ++calls;
        ringsim::CombatResult r;
        r.hasKnockdown = true;
        r.knockdown.target = ringsim::Side::B;
        r.knockdown.attacker = ringsim::Side::A;
        r.knockdown.punch = ringsim::PunchType::Cross;
        r.knockdown.damage = 5.0;
        r.knockdown.flash = false;
        return r;
    }

    int calls = 0;
};

// One knockdown of B per call while the script lasts; flash flag per entry.
class ScriptedKnockdowns : public ringsim::CombatResolver {
public:
    explicit ScriptedKnockdowns(std::vector<bool> flashes) : flashes_(std::move(flashes)) {}

    ringsim::CombatResult resolve(ringsim::Fighter&,
                                  ringsim::Fighter&,
                                  const ringsim::Decision&,
                                  const ringsim::Decision&,
                                  const ringsim::Fight&,
                                  const ringsim::RingContext&,
                                  ringsim::Rng&) override {
        ringsim::CombatResult r;
        if (calls < flashes_.size()) {
            r.hasKnockdown = true;
            r.knockdown.target = ringsim::Side::B;
            r.knockdown.attacker = ringsim::Side::A;
            r.knockdown.punch = ringsim::PunchType::LeadHook;
            r.knockdown.damage = 5.0;
            r.knockdown.flash = flashes_[calls];
        }
        ++calls;
        return r;
    }

    std::size_t calls = 0;

private:
    std::vector<bool> flashes_;
};

// A lands one clean head shot of fixed damage on B every call.
class HeadShotEveryTick : public ringsim::CombatResolver {
public:
    explicit HeadShotEveryTick(double damage) : damage_(damage) {}

    ringsim::CombatResult resolve(ringsim::Fighter&,
                                  ringsim::Fighter&,
                                  const ringsim::Decision&,
                                  const ringsim::Decision&,
                                  const ringsim::Fight&,
                                  const ringsim::RingContext&,
                                  ringsim::Rng&) override {
        ringsim::CombatResult r;
        ringsim::PunchOutcome hit;
        hit.attacker = ringsim::Side::A;
        hit.punch = ringsim::PunchType::Jab;
        hit.location = ringsim::TargetLocation::Head;
        hit.result = ringsim::PunchResult::Hit;
        hit.quality = ringsim::PunchQuality::Clean;
        hit.damage = damage_;
        r.hits.push_back(hit);
        return r;
    }

private:
    double damage_;
};

// Knockdown protocol settings that keep the fight going: no immediate KO
// from a light puncher, no referee stoppage, and the count is always beaten.
static ringsim::ModelParameters survivableKnockdowns() {
    ringsim::ModelParameters params;
    params.set("recovery.min_chance", 1.0);
    params.set("recovery.max_chance", 1.0);
    params.set("stoppage.gate_threshold", 10.0);
    return params;
}

// Knockdown-type events in order: KNOCKDOWN, FLASH_KNOCKDOWN or RECOVERY.
static std::vector<ringsim::EventType> knockdownTrail(const ringsim::EventRecorder& rec) {
    std::vector<ringsim::EventType> out;
    for (const auto& e : rec.events()) {
        if (e.type == ringsim::EventType::Knockdown || e.type == ringsim::EventType::FlashKnockdown ||
            e.type == ringsim::EventType::Recovery) {
            out.push_back(e.type);
        }
    }
    return out;
}

// Records requested waits; scripted pause/resume/stop on given calls.
class ScriptedDelay : public ringsim::Delay {
public:
    bool wait(double seconds) override {
        waits.push_back(seconds);
        const int n = static_cast<int>(waits.size());
        if (driver) {
            if (n == pauseAt) driver->pause();
            if (n == resumeAt) driver->resume();
            if (n == stopAt) driver->stop();
        }
        return !cancelled;
    }
    void cancel() override { cancelled = true; }
    void reset() override { cancelled = false; }

    ringsim::RealTimeDriver* driver = nullptr;
    std::vector<double> waits;
    bool cancelled = false;
    int pauseAt = -1;
    int resumeAt = -1;
    int stopAt = -1;
};

// Full reference stack, batch mode. Returns the loop's signatures.
static ringsim::RunSignatures runReferenceFight(std::uint32_t seed, int rounds, ringsim::EventRecorder* rec) {
    ringsim::Fighter a(ringsim::FighterProfile::preset("boxer", "Red Corner"));
    ringsim::Fighter b(ringsim::FighterProfile::preset("slugger", "Blue Corner"));
    ringsim::Fight fight(a, b, shortConfig(rounds));

    ringsim::BasicDecisionSource decisions;
    ringsim::BasicCombatResolver combat;
    ringsim::BasicDamageCalculator damage;
    ringsim::BasicStaminaManager stamina;
    ringsim::ring::RingPositionTracker positions;

    ringsim::SimulationCollaborators parts;
    parts.decisions = &decisions;
    parts.combat = &combat;
    parts.damage = &damage;
    parts.stamina = &stamina;
    parts.positions = &positions;

    ringsim::SimulationOptions opts;
    opts.seed = seed;
    ringsim::SimulationLoop loop(fight, parts, opts);
    loop.addSink(rec);
    loop.runToCompletion();
    REQUIRE(fight.isOver(), "reference fight did not finish");
    return loop.signatures();
}

// =======================
// Step 1: Primitives
// =======================

static void runRngDeterminism_1A() {
    ringsim::Rng zero(0u);
    REQUIRE(zero.state() != 0u, "1A.E1 zero seed left xorshift at its fixed point");

    ringsim::Rng r1(42u);
    ringsim::Rng r2(42u);
    for (int i = 0; i < 1000; ++i) {
        REQUIRE(r1.nextU32() == r2.nextU32(), "1A.E2 same seed diverged");
    }

    ringsim::Rng r3(7u);
    for (int i = 0; i < 1000; ++i) {
        const double u = r3.u01();
        REQUIRE(u >= 0.0 && u < 1.0, "1A.E3 u01 outside [0,1)");
        const int k = r3.pickIndex(5);
        REQUIRE(k >= 0 && k < 5, "1A.E3 pickIndex outside range");
    }
    REQUIRE(r3.pickIndex(0) == 0, "1A.E3 pickIndex(0) must be 0");

    std::cout << "[PASS] 1A.E1-E3 rng seeding, replay and ranges\n";
}

static void runDigestVectors_1A() {
    const char* check = "123456789";
    REQUIRE(ringsim::digest::crc32_update(0u, check, 9) == 0xCBF43926u, "1A.E4 crc32 check value");

    std::uint32_t h = ringsim::digest::fnv1a32_begin();
    h = ringsim::digest::fnv1a32_update(h, "a", 1);
    REQUIRE(h == 0xE40C292Cu, "1A.E4 fnv1a32 of 'a'");

    const std::uint32_t pz = ringsim::digest::fnv1a32_add_f64(ringsim::digest::fnv1a32_begin(), 0.0);
    const std::uint32_t nz = ringsim::digest::fnv1a32_add_f64(ringsim::digest::fnv1a32_begin(), -0.0);
    REQUIRE(pz != nz, "1A.E4 signed zero must hash differently");

    std::cout << "[PASS] 1A.E4 digest reference vectors\n";
}

static void runModelParameters_1A() {
    ringsim::ModelParameters p;
    requireExact("1A.E5 count_nine_factor", p.get("recovery.count_nine_factor"), 0.5);
    REQUIRE(p.has("knockout.cap"), "1A.E5 knockout.cap missing");
    REQUIRE(!p.has("knockout.nope"), "1A.E5 unknown key reported present");

    bool listed = false;
    for (const auto& k : p.keys()) {
        if (k == "stoppage.gate_threshold") listed = true;
    }
    REQUIRE(listed, "1A.E5 keys() missing stoppage.gate_threshold");

    const std::uint32_t before = p.paramHashU32();
    p.set("knockout.cap", 0.25);
    requireExact("1A.E5 set/get", p.knockout.cap, 0.25);
    REQUIRE(p.paramHashU32() != before, "1A.E5 hash ignores a changed value");

    REQUIRE(throwsAs<std::invalid_argument>([&] { p.set("no.such.key", 1.0); }),
            "1A.E6 unknown key must throw");
    REQUIRE(throwsAs<std::invalid_argument>([&] { p.set("knockout.cap", std::nan("")); }),
            "1A.E6 non-finite value must throw");
    REQUIRE(throwsAs<std::invalid_argument>([&] { (void)p.get("no.such.key"); }),
            "1A.E6 unknown get must throw");

    std::cout << "[PASS] 1A.E5-E6 named model parameters\n";
}

// =======================
// Step 2: Fighter
// =======================

static void runStateTable_2A() {
    using ringsim::FighterState;
    using ringsim::SubState;

    REQUIRE(ringsim::isValidTransition(FighterState::Neutral, FighterState::Offensive), "2A.E1 neutral->offensive");
    REQUIRE(ringsim::isValidTransition(FighterState::KnockedDown, FighterState::Recovered), "2A.E1 down->recovered");
    REQUIRE(!ringsim::isValidTransition(FighterState::KnockedDown, FighterState::Neutral), "2A.E1 down->neutral");
    REQUIRE(!ringsim::isValidTransition(FighterState::Neutral, FighterState::Recovered), "2A.E1 neutral->recovered");
    REQUIRE(!ringsim::isVoluntaryState(FighterState::Hurt), "2A.E2 hurt is engine-owned");
    REQUIRE(ringsim::isVoluntaryState(FighterState::Clinch), "2A.E2 clinch is voluntary");

    REQUIRE(ringsim::subStateAllowedIn(FighterState::Hurt, SubState::HighGuard), "2A.E3 hurt may guard");
    REQUIRE(!ringsim::subStateAllowedIn(FighterState::Hurt, SubState::Jabbing), "2A.E3 hurt may not jab");
    REQUIRE(ringsim::subStateCategory(SubState::Circling) == FighterState::Moving, "2A.E3 circling category");

    ringsim::Fighter f(named("State Check"));
    REQUIRE(!f.setSubState(SubState::Jabbing), "2A.E4 jabbing tag accepted while neutral");
    f.transitionTo(FighterState::Offensive);
    REQUIRE(f.setSubState(SubState::Jabbing), "2A.E4 jabbing tag rejected while offensive");
    f.transitionTo(FighterState::Defensive);
    REQUIRE(f.subState() == SubState::None, "2A.E4 stale sub-state survived a state change");
    REQUIRE(throwsAs<ringsim::InvalidStateTransition>([&] { f.transitionTo(FighterState::Recovered); }),
            "2A.E4 illegal transition must throw");

    std::cout << "[PASS] 2A.E1-E4 state table and sub-state tags\n";
}

static void runFighterConstruction_2B() {
    REQUIRE(throwsAs<std::invalid_argument>([] { ringsim::Fighter f(ringsim::FighterProfile{}); }),
            "2B.E1 unnamed fighter must throw");
    REQUIRE(ringsim::Fighter::makeId("Iron Mike T.") == "iron-mike-t-", "2B.E2 makeId format");

    for (const char* arch : {"boxer", "slugger", "swarmer", "counterpuncher", "journeyman", "elite"}) {
        ringsim::Fighter f(ringsim::FighterProfile::preset(arch, std::string(arch) + " test"));
        REQUIRE(f.maxStamina() > 0.0, "2B.E3 preset without stamina");
        requireExact("2B.E3 starts fresh", f.getStaminaPercent(), 1.0);
        REQUIRE(f.state() == ringsim::FighterState::Neutral, "2B.E3 preset not neutral");
    }
    REQUIRE(throwsAs<std::invalid_argument>([] { (void)ringsim::FighterProfile::preset("wrestler", "x"); }),
            "2B.E4 unknown archetype must throw");

    std::cout << "[PASS] 2B.E1-E4 construction, ids and presets\n";
}

static void runFighterDamage_2C() {
    ringsim::Fighter f(named("Damage Check"));

    f.takeDamage(1.0e9, ringsim::TargetLocation::Head);
    requireExact("2C.E1 head damage clamps", f.headDamage(), f.maxHeadDamage());
    requireExact("2C.E1 head percent", f.getHeadDamagePercent(), 1.0);

    const double before = f.stamina();
    f.takeDamage(10.0, ringsim::TargetLocation::Body);
    requireCloseAbsOrRel("2C.E2 body damage drains stamina", before - f.stamina(), 5.0, 1e-9, 1e-9);

    f.takeDamage(std::nan(""), ringsim::TargetLocation::Body);
    f.takeDamage(-3.0, ringsim::TargetLocation::Body);
    requireExact("2C.E3 invalid damage ignored", f.bodyDamage(), 10.0);

    f.addCut("left eyebrow", 2);
    f.addCut("left eyebrow", 2);
    REQUIRE(f.cuts().size() == 1, "2C.E4 same location opened a second cut");
    REQUIRE(f.worstCutSeverity() == 4, "2C.E4 cut severity did not escalate");
    f.addCut("left eyebrow", 9);
    REQUIRE(f.worstCutSeverity() == 5, "2C.E4 cut severity exceeded cap");

    std::cout << "[PASS] 2C.E1-E4 damage clamps, body drain and cuts\n";
}

static void runFighterHurtBuzzed_2D() {
    ringsim::Fighter f(named("Daze Check"));
    ringsim::Rng rng(11u);

    f.setBuzzed(4.0, ringsim::PunchType::Cross);
    REQUIRE(f.isBuzzed() && f.state() == ringsim::FighterState::Buzzed, "2D.E1 buzz not applied");
    REQUIRE(f.hasDebuff("buzzed"), "2D.E1 buzz debuff missing");
    REQUIRE(f.buzzedDuration() >= 10.0 && f.buzzedDuration() <= 40.0, "2D.E1 buzz duration out of range");

    f.setHurt(2.0);
    REQUIRE(f.isHurt() && !f.isBuzzed(), "2D.E2 hurt must supersede buzzed");
    REQUIRE(f.state() == ringsim::FighterState::Hurt, "2D.E2 hurt state missing");

    f.setBuzzed(5.0, ringsim::PunchType::RearHook);
    REQUIRE(!f.isBuzzed(), "2D.E3 buzz applied to a hurt fighter");

    for (int i = 0; i < 4; ++i) f.updateStun(0.5);
    REQUIRE(!f.isHurt(), "2D.E4 hurt did not expire");
    REQUIRE(f.state() == ringsim::FighterState::Neutral, "2D.E4 fighter not neutral after hurt");
    REQUIRE(!f.hasDebuff("hurt"), "2D.E4 hurt debuff left behind");

    f.applyStun(6.0, ringsim::PunchType::Cross);
    REQUIRE(f.stunLevel() == 2, "2D.E5 heavy stun level");
    REQUIRE(!f.canThrowPunch(rng), "2D.E5 heavily stunned fighter threw");
    REQUIRE(f.getTotalVulnerability() > 1.0, "2D.E5 stun vulnerability missing");
    for (int i = 0; i < 6; ++i) f.updateStun(0.5);
    REQUIRE(!f.isStunned(), "2D.E5 stun did not wear off");

    std::cout << "[PASS] 2D.E1-E5 buzzed, hurt and stun lifecycle\n";
}

static void runFighterModifiers_2E() {
    ringsim::Fighter f(named("Modifier Check"));
    const double basePower = f.attributes().power.powerLeft;

    ringsim::StatusEffect buff;
    buff.type = "test_power";
    buff.effects.power = 20.0;
    buff.remainingTicks = 2;
    f.addBuff(buff);
    f.updateModifiedAttributes();
    REQUIRE(f.attributes().power.powerLeft > basePower, "2E.E1 power buff not applied");

    ringsim::StatusEffect sticky;
    sticky.type = "test_sticky";
    f.addDebuff(sticky);

    f.tickStatusEffects();
    f.tickStatusEffects();
    REQUIRE(f.buffs().empty(), "2E.E2 timed buff did not expire");
    REQUIRE(f.hasDebuff("test_sticky"), "2E.E2 untimed debuff expired");
    REQUIRE(f.removeDebuff("test_sticky"), "2E.E2 removeDebuff reported nothing removed");

    f.updateModifiedAttributes();
    requireExact("2E.E3 attributes restored", f.attributes().power.powerLeft, basePower);

    ringsim::StoppageParams sp;
    const double rating = f.getFinisherRating(sp);
    REQUIRE(rating >= 0.0 && rating <= 100.0, "2E.E4 finisher rating out of range");

    std::cout << "[PASS] 2E.E1-E4 buffs, debuffs and finisher rating\n";
}

static void runBetweenRounds_2F() {
    ringsim::Fighter f(named("Corner Check"));
    const double baseAccuracy = f.attributes().offense.jabAccuracy;

    f.addSwelling("left_eye", 2);
    f.addSwelling("left_eye", 9);
    REQUIRE(f.swelling().size() == 1 && f.swelling()[0].severity == 5, "2F.E1 swelling did not cap");
    f.updateModifiedAttributes();
    REQUIRE(f.attributes().offense.jabAccuracy < baseAccuracy, "2F.E1 closed eye left accuracy intact");

    f.takeDamage(20.0, ringsim::TargetLocation::Head);
    f.spendStamina(f.maxStamina() * 0.5);
    const double stamina = f.stamina();
    f.setHurt(5.0);
    f.resetForRound();
    REQUIRE(f.state() == ringsim::FighterState::Neutral && !f.isHurt(), "2F.E2 fighter not reset for the round");
    REQUIRE(f.roundHistory().size() == 1, "2F.E2 round not archived");

    f.applyBetweenRoundRecovery();
    REQUIRE(f.stamina() > stamina, "2F.E3 no stamina back in the corner");
    REQUIRE(f.stamina() <= f.maxStamina(), "2F.E3 stamina above max");
    requireCloseAbsOrRel("2F.E3 head damage healed", f.headDamage(), 18.0, 1e-12, 1e-12);

    std::cout << "[PASS] 2F.E1-E3 swelling, round reset and corner recovery\n";
}

// =======================
// Step 3: Round, judges, referee, fouls, effects
// =======================

static void runRoundLedger_3A() {
    REQUIRE(throwsAs<std::invalid_argument>([] { ringsim::Round r(0, 180.0); }), "3A.E1 round 0 accepted");
    REQUIRE(throwsAs<std::invalid_argument>([] { ringsim::Round r(1, 0.0); }), "3A.E1 zero duration accepted");

    ringsim::Round r(1, 180.0);
    r.tick(std::nan(""));
    r.tick(-1.0);
    requireExact("3A.E2 invalid dt ignored", r.currentTime(), 0.0);

    r.recordPunchThrown(ringsim::Side::A, ringsim::PunchType::Cross);
    r.recordPunchLanded(ringsim::Side::A, ringsim::PunchType::Cross, ringsim::PunchQuality::Clean, 16.0);
    r.recordPunchThrown(ringsim::Side::B, ringsim::PunchType::Jab);
    r.recordPunchMissed(ringsim::Side::B);

    REQUIRE(r.stats(ringsim::Side::A).significantStrikesLanded == 1, "3A.E3 significant strike not counted");
    requireExact("3A.E3 damage received credited", r.stats(ringsim::Side::B).damageReceived, 16.0);
    REQUIRE(r.stats(ringsim::Side::A).punchesMissed == 1, "3A.E3 miss not credited to target");

    for (int i = 0; i < 360; ++i) r.tick(0.5);
    REQUIRE(r.isComplete(), "3A.E4 round did not complete at its duration");

    r.recordPunchThrown(ringsim::Side::A, ringsim::PunchType::Jab);
    REQUIRE(r.stats(ringsim::Side::A).punchesThrown == 1, "3A.E4 completed round accepted a record");

    const ringsim::RoundSummary s = r.getSummary();
    REQUIRE(s.complete && s.round == 1, "3A.E5 summary header");
    requireExact("3A.E5 summary accuracy", s.sides[0].accuracy, 1.0);

    std::cout << "[PASS] 3A.E1-E5 round ledger\n";
}

static void runJudgeScoring_3B() {
    const std::vector<ringsim::JudgeProfile> panel = ringsim::Judge::defaultPanel();
    REQUIRE(panel.size() == 3, "3B.E1 default panel size");

    const ringsim::ScoringParams params;
    ringsim::Rng rng(3u);
    const ringsim::Judge judge(panel[0]);

    ringsim::Round even(1, 180.0);
    even.complete();
    ringsim::JudgeContext ctx;
    const ringsim::JudgeRoundScore e = judge.calculateJudgeScore(even, ctx, rng, params);
    REQUIRE(e.scoreA == 10 && e.scoreB == 10, "3B.E2 empty round is not 10-10");

    ctx.pointDeductions = {{1, 0}};
    const ringsim::JudgeRoundScore d = judge.calculateJudgeScore(even, ctx, rng, params);
    REQUIRE(d.scoreA == 9 && d.scoreB == 10, "3B.E3 point deduction not applied");

    ringsim::Round clear(2, 180.0);
    for (int i = 0; i < 40; ++i) {
        clear.recordPunchThrown(ringsim::Side::A, ringsim::PunchType::Cross);
        clear.recordPunchLanded(ringsim::Side::A, ringsim::PunchType::Cross, ringsim::PunchQuality::Clean, 10.0);
    }
    clear.complete();
    const ringsim::JudgeRoundScore c = judge.calculateJudgeScore(clear, ringsim::JudgeContext{}, rng, params);
    REQUIRE(c.scoreA == 10 && c.scoreB == 9, "3B.E4 one-sided round is not 10-9");

    ringsim::Round kd(3, 180.0);
    kd.recordKnockdown(ringsim::Side::B, ringsim::PunchType::RearHook, 8);
    kd.complete();
    const ringsim::JudgeRoundScore k = judge.calculateJudgeScore(kd, ringsim::JudgeContext{}, rng, params);
    REQUIRE(k.scoreA == 10 && k.scoreB <= 9, "3B.E5 knockdown did not cost a point");
    REQUIRE(k.scoreB >= static_cast<int>(params.score_floor), "3B.E5 score below floor");

    // A wins the exchanges clearly but is dropped once: the round goes to B.
    ringsim::Round flipped(4, 180.0);
    for (int i = 0; i < 40; ++i) {
        flipped.recordPunchThrown(ringsim::Side::A, ringsim::PunchType::Cross);
        flipped.recordPunchLanded(ringsim::Side::A, ringsim::PunchType::Cross, ringsim::PunchQuality::Clean, 10.0);
    }
    flipped.recordKnockdown(ringsim::Side::A, ringsim::PunchType::LeadHook, 8);
    flipped.complete();
    for (const ringsim::JudgeProfile& jp : panel) {
        const ringsim::Judge j(jp);
        REQUIRE(j.weightedTotal(flipped, ringsim::Side::A, params) > j.weightedTotal(flipped, ringsim::Side::B, params),
                "3B.E6 A not ahead on points");
        const ringsim::JudgeRoundScore f = j.calculateJudgeScore(flipped, ringsim::JudgeContext{}, rng, params);
        REQUIRE(f.scoreB == 10 && f.scoreA == 9, "3B.E6 knockdown did not flip the round");
    }

    std::cout << "[PASS] 3B.E1-E6 ten-point-must scoring\n";
}

static void runReferee_3C() {
    for (const char* type : {"default", "strict", "lenient", "protective"}) {
        const ringsim::RefereeProfile p = ringsim::RefereeProfile::preset(type);
        REQUIRE(!p.name.empty(), "3C.E1 preset without a name");
    }
    REQUIRE(throwsAs<std::invalid_argument>([] { (void)ringsim::RefereeProfile::preset("corrupt"); }),
            "3C.E1 unknown preset accepted");

    ringsim::Referee ref{ringsim::RefereeProfile{}};
    requireCloseAbsOrRel("3C.E2 skill is the mean", ref.getSkill(), (75.0 + 80.0 + 85.0 + 75.0) / 4.0, 1e-12, 1e-12);

    ringsim::Rng rng(5u);
    const ringsim::RefereeCommand box = ref.issueCommand("BOX", rng);
    REQUIRE(box.type == "BOX" && box.referee == ref.name() && !box.text.empty(), "3C.E3 BOX command");
    REQUIRE(ref.issueCommand("HUDDLE", rng).text == "HUDDLE", "3C.E3 unknown command must echo");

    ringsim::Fighter a(named("Clinch A"));
    ringsim::Fighter b(named("Clinch B"));
    REQUIRE(ref.checkClinchBreak(0.0, a, b, rng).call == ringsim::ClinchCall::None, "3C.E4 instant break");
    REQUIRE(ref.checkClinchBreak(1000.0, a, b, rng).call == ringsim::ClinchCall::Break, "3C.E4 endless clinch");
    ref.resetClinch();
    REQUIRE(!ref.clinchWarningIssued(), "3C.E4 resetClinch kept the warning");

    std::cout << "[PASS] 3C.E1-E4 referee presets, commands and clinch calls\n";
}

static void runFoulEscalation_3D() {
    ringsim::Fighter clean(named("Clean Fighter"));
    ringsim::Fighter target(named("Foul Target"));
    ringsim::FoulPolicy policy;
    ringsim::Rng rng(99u);

    ringsim::FoulSituation sit;
    sit.distance = 1.0;
    sit.round = 8;
    sit.scoreDiff = -10.0;
    ringsim::FoulType picked = ringsim::FoulType::Push;
    for (int i = 0; i < 2000; ++i) {
        REQUIRE(!policy.shouldAttemptFoul(clean, ringsim::Side::A, sit, rng, picked),
                "3D.E1 clean fighter attempted a foul");
    }

    const int threshold = ringsim::foulData(ringsim::FoulType::Headbutt).warningThreshold;
    std::vector<ringsim::FoulConsequence> seen;
    for (int i = 0; i < 20000 && static_cast<int>(seen.size()) < threshold + 4; ++i) {
        const ringsim::FoulResult r = policy.executeFoul(ringsim::FoulType::Headbutt, clean, ringsim::Side::A, 100.0, rng);
        if (r.detected) seen.push_back(r.consequence);
    }
    REQUIRE(static_cast<int>(seen.size()) == threshold + 4, "3D.E2 too few detected fouls");
    for (int i = 0; i < threshold; ++i) {
        REQUIRE(seen[i] == ringsim::FoulConsequence::Warning, "3D.E2 expected a warning");
    }
    for (int i = threshold; i < threshold + 3; ++i) {
        REQUIRE(seen[i] == ringsim::FoulConsequence::PointDeduction, "3D.E2 expected a point deduction");
    }
    REQUIRE(seen[threshold + 3] == ringsim::FoulConsequence::Disqualification, "3D.E2 expected disqualification");
    REQUIRE(policy.getPointDeductions(ringsim::Side::A) == 3, "3D.E2 deduction count");
    REQUIRE(policy.getPointDeductions(ringsim::Side::B) == 0, "3D.E2 deductions leaked to B");

    ringsim::FoulResult hit;
    hit.damage = 4.0;
    ringsim::FoulPolicy::applyFoulEffects(hit, clean, target);
    requireExact("3D.E3 foul damage lands on the head", target.headDamage(), 4.0);

    std::cout << "[PASS] 3D.E1-E3 foul propensity and escalation\n";
}

static void runFightEffects_3E() {
    ringsim::FightEffects fx;
    fx.registerFighter("red");
    fx.registerFighter("blue");
    fx.registerFighter("red");
    REQUIRE(throwsAs<std::logic_error>([&] { fx.registerFighter("green"); }), "3E.E1 third fighter accepted");
    REQUIRE(throwsAs<ringsim::InvalidFighterReference>([&] { (void)fx.hasEffect("green", ringsim::EffectType::Momentum); }),
            "3E.E1 unknown id accepted");

    ringsim::EffectConfig cfg;
    cfg.intensity = 0.5;
    cfg.duration = 3;
    fx.applyEffect("red", ringsim::EffectType::Momentum, cfg);
    fx.applyEffect("blue", ringsim::EffectType::Momentum, cfg);
    REQUIRE(!fx.hasEffect("red", ringsim::EffectType::Momentum), "3E.E2 momentum held by both corners");
    REQUIRE(fx.hasEffect("blue", ringsim::EffectType::Momentum), "3E.E2 momentum not moved");

    for (int i = 0; i < 5; ++i) fx.tick();
    REQUIRE(!fx.hasEffect("blue", ringsim::EffectType::Momentum), "3E.E3 effect did not expire");

    for (int i = 0; i < 6; ++i) fx.onKnockdown("blue", "red");
    requireExact("3E.E4 momentum upper bound", fx.momentum("red"), 100.0);
    requireExact("3E.E4 momentum lower bound", fx.momentum("blue"), -100.0);

    const ringsim::EffectsSummary winner = fx.getEffectsSummary("red");
    const ringsim::EffectsSummary loser = fx.getEffectsSummary("blue");
    requireExact("3E.E4 summary momentum", winner.momentum, 100.0);
    REQUIRE(!winner.buffs.empty(), "3E.E4 knockdown gave the puncher no buffs");
    REQUIRE(!loser.debuffs.empty(), "3E.E4 knockdown gave the downed fighter no debuffs");

    ringsim::EffectConfig big;
    big.intensity = 1.0;
    big.duration = 50;
    big.stackable = true;
    big.maxStacks = 10;
    for (int i = 0; i < 10; ++i) {
        fx.applyEffect("red", ringsim::EffectType::FastStart, big);
        fx.applyEffect("red", ringsim::EffectType::Desperate, big);
        fx.applyEffect("blue", ringsim::EffectType::ShellShocked, big);
        fx.applyEffect("blue", ringsim::EffectType::Gassed, big);
    }
    for (const char* id : {"red", "blue"}) {
        const double agg = fx.getAggressionModifier(id);
        const double def = fx.getDefenseModifier(id);
        const double acc = fx.getAccuracyModifier(id);
        const double pow = fx.getPowerModifier(id);
        const double spd = fx.getSpeedModifier(id);
        REQUIRE(agg >= -0.5 && agg <= 0.5, "3E.E5 aggression modifier unclamped");
        REQUIRE(def >= -0.4 && def <= 0.3, "3E.E5 defense modifier unclamped");
        REQUIRE(acc >= -0.3 && acc <= 0.2, "3E.E5 accuracy modifier unclamped");
        REQUIRE(pow >= -0.3 && pow <= 0.25, "3E.E5 power modifier unclamped");
        REQUIRE(spd >= -0.25 && spd <= 0.2, "3E.E5 speed modifier unclamped");
    }

    fx.resetForRound();
    REQUIRE(fx.hasEffect("red", ringsim::EffectType::FreshLegs), "3E.E6 no FRESH_LEGS at round start");
    REQUIRE(fx.hasEffect("blue", ringsim::EffectType::FreshLegs), "3E.E6 no FRESH_LEGS at round start");

    ringsim::FighterProfile quick = named("Quick Starter");
    quick.speed.firstStep = 100.0;
    quick.mental.killerInstinct = 100.0;
    ringsim::Fighter starter(quick);
    ringsim::FightEffects early;
    early.registerFighter(starter.id());
    REQUIRE(early.applyFastStart(starter.id(), starter), "3E.E7 fast starter not recognised");
    const ringsim::FightEffect* fs = early.getEffect(starter.id(), ringsim::EffectType::FastStart);
    REQUIRE(fs != nullptr, "3E.E7 FAST_START missing");
    const double baseHands = fs->baseModifiers().at("handSpeed");
    for (int round = 2; round <= 4; ++round) {
        early.updateFastStartForRound(starter.id(), round);
        fs = early.getEffect(starter.id(), ringsim::EffectType::FastStart);
        REQUIRE(fs != nullptr, "3E.E7 FAST_START dropped early");
        requireCloseAbsOrRel("3E.E7 fast start scale", fs->modifiers().at("handSpeed"),
                             baseHands * (5 - round) / 4.0, 1e-12, 1e-12);
    }
    early.updateFastStartForRound(starter.id(), 5);
    REQUIRE(!early.hasEffect(starter.id(), ringsim::EffectType::FastStart), "3E.E7 FAST_START past round 4");

    std::cout << "[PASS] 3E.E1-E7 fight effects registry, expiry, clamps and fast start\n";
}

// =======================
// Step 4: Fight aggregate and events
// =======================

static void runFightLifecycle_4A() {
    ringsim::Fighter a(named("Lifecycle A"));
    ringsim::Fighter b(named("Lifecycle B"));

    ringsim::FightConfig bad;
    bad.rounds = 0;
    REQUIRE(throwsAs<std::invalid_argument>([&] { bad.validate(); }), "4A.E1 zero rounds accepted");
    REQUIRE(throwsAs<std::invalid_argument>([&] {
                ringsim::Fight f(a, b, ringsim::FightConfig{}, ringsim::RefereeProfile{},
                                 std::vector<ringsim::JudgeProfile>(2));
            }),
            "4A.E1 two-judge panel accepted");
    REQUIRE(throwsAs<std::invalid_argument>([&] { ringsim::Fight f(a, a); }), "4A.E1 fighter against himself");

    ringsim::Fight fight(a, b, shortConfig(2));
    REQUIRE(fight.status() == ringsim::FightStatus::NotStarted, "4A.E2 initial status");
    REQUIRE(fight.judges().size() == 3, "4A.E2 default panel not installed");
    REQUIRE(fight.sideOf(b.id()) == ringsim::Side::B, "4A.E2 sideOf");
    REQUIRE(throwsAs<ringsim::InvalidFighterReference>([&] { (void)fight.sideOf("nobody"); }),
            "4A.E2 unknown id accepted");

    fight.start();
    REQUIRE(throwsAs<std::logic_error>([&] { fight.start(); }), "4A.E3 second start accepted");
    REQUIRE(throwsAs<std::logic_error>([&] { fight.startNextRound(); }), "4A.E3 next round while fighting");

    ringsim::Rng rng(1u);
    fight.endRound(rng);
    REQUIRE(fight.status() == ringsim::FightStatus::BetweenRounds, "4A.E4 not between rounds");
    fight.startNextRound();
    REQUIRE(fight.currentRoundNumber() == 2, "4A.E4 round number");
    fight.endRound(rng);

    REQUIRE(fight.status() == ringsim::FightStatus::Completed, "4A.E5 last round did not complete the fight");
    REQUIRE(fight.result().method == ringsim::ResultMethod::DrawUnanimous, "4A.E5 empty fight is not a draw");
    for (const auto& card : fight.getCurrentScores()) {
        REQUIRE(card.a == 20 && card.b == 20, "4A.E5 empty rounds not scored 10-10");
    }

    REQUIRE(a.roundHistory().size() == 2 && b.roundHistory().size() == 2, "4A.E5 final round not archived");

    fight.stopFight(ringsim::ResultMethod::KO, ringsim::Side::A);
    REQUIRE(fight.result().method == ringsim::ResultMethod::DrawUnanimous, "4A.E6 stopFight changed a finished fight");
    REQUIRE(a.roundHistory().size() == 2, "4A.E6 stopFight archived a finished fight");

    std::cout << "[PASS] 4A.E1-E6 fight lifecycle and decisions\n";
}

static void runEventLogging_4B() {
    std::ostringstream os;
    ringsim::StreamEventLogger logger(os, false);
    logger.setNames("Red", "Blue");

    ringsim::FightEvent tick;
    tick.type = ringsim::EventType::Tick;
    logger.onEvent(tick);
    REQUIRE(os.str().empty(), "4B.E1 tick logged outside verbose mode");

    ringsim::FightEvent kd;
    kd.type = ringsim::EventType::Knockdown;
    kd.round = 3;
    kd.roundTime_s = 65.0;
    kd.side = ringsim::Side::B;
    kd.other = ringsim::Side::A;
    kd.punch = ringsim::PunchType::LeadHook;
    logger.onEvent(kd);
    const std::string line = os.str();
    REQUIRE(line.find("[R3 1:05.0]") != std::string::npos, "4B.E2 clock prefix");
    REQUIRE(line.find("KNOCKDOWN") != std::string::npos, "4B.E2 event name");
    REQUIRE(line.find("Blue dropped by Red") != std::string::npos, "4B.E2 side labels");

    ringsim::EventRecorder rec;
    rec.onEvent(kd);
    rec.onEvent(tick);
    rec.onEvent(kd);
    REQUIRE(rec.size() == 3 && rec.countOf(ringsim::EventType::Knockdown) == 2, "4B.E3 recorder counts");
    rec.clear();
    REQUIRE(rec.size() == 0, "4B.E3 recorder clear");

    const std::uint32_t c1 = ringsim::crc32AddEvent(0u, kd);
    kd.round = 4;
    REQUIRE(ringsim::crc32AddEvent(0u, kd) != c1, "4B.E4 event CRC ignores the round");

    std::cout << "[PASS] 4B.E1-E4 event logger, recorder and CRC\n";
}

// One round scored by the given panel: A lands aLands crosses, B lands bLands.
static ringsim::FightResult decideOneRound(const std::vector<ringsim::JudgeProfile>& judges, int aLands, int bLands) {
    ringsim::Fighter a(named("Cards A"));
    ringsim::Fighter b(named("Cards B"));
    ringsim::FightConfig cfg = shortConfig(1);
    cfg.homeFighter = ringsim::HomeCorner::B;
    ringsim::Fight fight(a, b, cfg, ringsim::RefereeProfile{}, judges);
    fight.start();

    ringsim::Round* round = fight.getCurrentRound();
    REQUIRE(round != nullptr, "4C round missing");
    for (int i = 0; i < aLands; ++i) {
        round->recordPunchThrown(ringsim::Side::A, ringsim::PunchType::Cross);
        round->recordPunchLanded(ringsim::Side::A, ringsim::PunchType::Cross, ringsim::PunchQuality::Clean, 10.0);
    }
    for (int i = 0; i < bLands; ++i) {
        round->recordPunchThrown(ringsim::Side::B, ringsim::PunchType::Cross);
        round->recordPunchLanded(ringsim::Side::B, ringsim::PunchType::Cross, ringsim::PunchQuality::Clean, 10.0);
    }

    ringsim::Rng rng(9u);
    fight.endRound(rng);
    REQUIRE(fight.status() == ringsim::FightStatus::Completed, "4C fight not decided");
    return fight.result();
}

static void runDecisionOutcomes_4C() {
    ringsim::JudgeProfile fair;
    fair.name = "Fair";
    ringsim::JudgeProfile blind;
    blind.name = "Blind";
    blind.preferences = {0.0, 0.0, 0.0, 0.0, 0.0, 0.0};
    ringsim::JudgeProfile homer;
    homer.name = "Homer";
    homer.homeBias = 2000.0;

    const ringsim::FightResult unanimous = decideOneRound({fair, fair, fair}, 60, 10);
    REQUIRE(unanimous.method == ringsim::ResultMethod::DecisionUnanimous, "4C.E1 three cards for A");
    REQUIRE(unanimous.hasWinner && unanimous.winner == ringsim::Side::A, "4C.E1 winner");

    const ringsim::FightResult majority = decideOneRound({fair, fair, blind}, 60, 10);
    REQUIRE(majority.method == ringsim::ResultMethod::DecisionMajority, "4C.E2 two cards and a draw");
    REQUIRE(majority.hasWinner && majority.winner == ringsim::Side::A, "4C.E2 winner");

    const ringsim::FightResult split = decideOneRound({fair, fair, homer}, 60, 10);
    REQUIRE(split.method == ringsim::ResultMethod::DecisionSplit, "4C.E3 two cards against one");
    REQUIRE(split.hasWinner && split.winner == ringsim::Side::A, "4C.E3 winner");

    const ringsim::FightResult drawMajority = decideOneRound({fair, blind, blind}, 60, 10);
    REQUIRE(drawMajority.method == ringsim::ResultMethod::DrawMajority, "4C.E4 one card and two draws");
    REQUIRE(!drawMajority.hasWinner, "4C.E4 draw with a winner");

    const ringsim::FightResult drawSplit = decideOneRound({fair, homer, blind}, 60, 10);
    REQUIRE(drawSplit.method == ringsim::ResultMethod::DrawSplit, "4C.E5 one card each and a draw");
    REQUIRE(!drawSplit.hasWinner, "4C.E5 draw with a winner");

    const ringsim::FightResult drawUnanimous = decideOneRound({blind, blind, blind}, 60, 10);
    REQUIRE(drawUnanimous.method == ringsim::ResultMethod::DrawUnanimous, "4C.E6 three level cards");

    std::cout << "[PASS] 4C.E1-E6 decisions and draws from the cards\n";
}

// =======================
// Step 5: Ring and reference collaborators
// =======================

static void runRingGeometry_5A() {
    const ringsim::ring::RingGeometry ring;
    REQUIRE(ring.isValid(), "5A.E1 default ring invalid");
    requireExact("5A.E1 perimeter", ring.geometry().perimeter_ft, 80.0);
    requireCloseAbsOrRel("5A.E2 wrapS negative", ring.wrapS(-5.0), 75.0, 1e-9, 1e-12);
    requireCloseAbsOrRel("5A.E2 wrapS overflow", ring.wrapS(85.0), 5.0, 1e-9, 1e-12);

    const auto proj = ring.projectNearest(0.0, -12.0);
    requireCloseAbsOrRel("5A.E3 projection distance", proj.dist_ft, 2.0, 1e-9, 1e-12);
    requireCloseAbsOrRel("5A.E3 projection y", proj.pos_ft.y, -10.0, 1e-9, 1e-12);

    const ringsim::ring::Vec2d clamped = ring.clampInside(ringsim::ring::Vec2d{50.0, -50.0});
    requireExact("5A.E4 clamp x", clamped.x, 9.5);
    requireExact("5A.E4 clamp y", clamped.y, -9.5);
    REQUIRE(ring.isInCorner(clamped) && ring.isOnRopes(clamped), "5A.E4 corner zone");
    REQUIRE(ring.isInCenter(ringsim::ring::Vec2d{0.0, 0.0}), "5A.E4 center zone");

    REQUIRE(ringsim::ring::zoneOf(1.0) == ringsim::ring::DistanceZone::Clinch, "5A.E5 clinch zone");
    REQUIRE(ringsim::ring::zoneOf(4.0) == ringsim::ring::DistanceZone::Mid, "5A.E5 mid zone");
    REQUIRE(ringsim::ring::zoneOf(12.0) == ringsim::ring::DistanceZone::Far, "5A.E5 far zone");

    ringsim::ring::RingPositionTracker tracker;
    tracker.initializePositions();
    requireCloseAbsOrRel("5A.E6 opening distance", tracker.getDistance(), 8.0, 1e-9, 1e-12);
    tracker.separateFighters(6.0);
    requireCloseAbsOrRel("5A.E6 separation", tracker.getDistance(), 6.0, 1e-9, 1e-12);
    tracker.separateFighters(0.1);
    REQUIRE(tracker.getDistance() >= ringsim::ring::RingPositionTracker::kMinSeparation_ft - 1e-9,
            "5A.E6 fighters overlap");

    std::cout << "[PASS] 5A.E1-E6 ring geometry and position tracker\n";
}

static void runReferenceCollaborators_5B() {
    for (int p = 0; p < static_cast<int>(ringsim::PunchType::Count); ++p) {
        const auto punch = static_cast<ringsim::PunchType>(p);
        REQUIRE(ringsim::BasicStaminaManager::punchCost(punch) > 0.0, "5B.E1 free punch");
    }

    REQUIRE(ringsim::BasicCombatResolver::chinResistance(60.0) <
                ringsim::BasicCombatResolver::chinResistance(85.0),
            "5B.E2 chin resistance not monotone");
    requireCloseAbsOrRel("5B.E2 iron chin", ringsim::BasicCombatResolver::chinResistance(100.0), 0.97, 1e-9, 1e-9);

    ringsim::Fighter f(named("Hurt Check"));
    requireExact("5B.E3 light shot never hurts", ringsim::BasicDamageCalculator::hurtChance(f, 1.0), 0.0);
    const double p = ringsim::BasicDamageCalculator::hurtChance(f, 30.0);
    REQUIRE(p >= 0.10 && p <= 0.60, "5B.E3 hurt chance out of [0.1,0.6]");

    const double r = ringsim::BasicDamageCalculator::calculateResistance(f);
    REQUIRE(r >= 0.0 && r <= 0.3, "5B.E4 resistance out of [0,0.3]");

    std::cout << "[PASS] 5B.E1-E4 reference collaborator formulas\n";
}

// =======================
// Step 6: Simulation loop
// =======================

static void runLoopContracts_6A() {
    ringsim::Fighter a(named("Contract A"));
    ringsim::Fighter b(named("Contract B"));
    ringsim::Fight fight(a, b, shortConfig(3));

    ringsim::SimulationOptions wrongTick;
    wrongTick.tickRate_s = 0.25;
    REQUIRE(throwsAs<std::invalid_argument>([&] { ringsim::SimulationLoop l(fight, {}, wrongTick); }),
            "6A.E1 mismatched tick rate accepted");
    ringsim::SimulationOptions badTick;
    badTick.tickRate_s = std::nan("");
    REQUIRE(throwsAs<std::invalid_argument>([&] { ringsim::SimulationLoop l(fight, {}, badTick); }),
            "6A.E1 NaN tick rate accepted");

    // No collaborators: nobody punches, the cards decide.
    ringsim::SimulationLoop loop(fight);
    ringsim::EventRecorder rec;
    loop.addSink(&rec);
    loop.addSink(nullptr);
    loop.runToCompletion();

    REQUIRE(fight.status() == ringsim::FightStatus::Completed, "6A.E2 inert fight not completed");
    REQUIRE(!ringsim::isStoppage(fight.result().method), "6A.E2 inert fight ended early");
    REQUIRE(rec.countOf(ringsim::EventType::FightStart) == 1, "6A.E3 FIGHT_START count");
    REQUIRE(rec.countOf(ringsim::EventType::RoundStart) == 3, "6A.E3 ROUND_START count");
    REQUIRE(rec.countOf(ringsim::EventType::RoundEnd) == 3, "6A.E3 ROUND_END count");
    REQUIRE(rec.countOf(ringsim::EventType::FightEnd) == 1, "6A.E3 FIGHT_END count");
    REQUIRE(rec.events().front().type == ringsim::EventType::FightStart, "6A.E3 first event");
    REQUIRE(rec.events().back().type == ringsim::EventType::FightEnd, "6A.E3 last event");

    REQUIRE(!loop.step(), "6A.E4 step after the fight reported progress");
    REQUIRE(rec.countOf(ringsim::EventType::FightEnd) == 1, "6A.E4 FIGHT_END emitted twice");
    REQUIRE(loop.runToCompletion() == 0, "6A.E4 finished fight took more steps");

    ringsim::Fighter c(named("Count A"));
    ringsim::Fighter d(named("Count B"));
    ringsim::Fight counted(c, d, shortConfig(1));
    ringsim::SimulationLoop byRun(counted);
    const int taken = byRun.runToCompletion();

    ringsim::Fighter e(named("Count A"));
    ringsim::Fighter f(named("Count B"));
    ringsim::Fight stepped(e, f, shortConfig(1));
    ringsim::SimulationLoop byStep(stepped);
    int calls = 0;
    do {
        ++calls;
    } while (byStep.step());
    REQUIRE(taken == calls, "6A.E5 runToCompletion miscounted its steps");

    std::cout << "[PASS] 6A.E1-E5 loop contracts and inert fallbacks\n";
}

static void runLoopDeterminism_6B() {
    ringsim::EventRecorder r1;
    ringsim::EventRecorder r2;
    const ringsim::RunSignatures s1 = runReferenceFight(2024u, 3, &r1);
    const ringsim::RunSignatures s2 = runReferenceFight(2024u, 3, &r2);
    REQUIRE(sameSignatures(s1, s2), "6B.E1 same seed produced different signatures");
    REQUIRE(r1.size() == r2.size(), "6B.E1 same seed produced a different event count");

    const ringsim::RunSignatures s3 = runReferenceFight(2025u, 3, nullptr);
    REQUIRE(s3.run_param_hash_u32 == s1.run_param_hash_u32, "6B.E2 seed leaked into the parameter hash");
    REQUIRE(s3.event_crc_u32 != s1.event_crc_u32, "6B.E2 different seed replayed the same fight");

    for (const auto& e : r1.events()) {
        if (!e.hasFighters) continue;
        for (const auto& f : e.fighters) {
            REQUIRE_FINITE(f.stamina, "6B.E3 stamina");
            REQUIRE(f.staminaPercent >= 0.0 && f.staminaPercent <= 1.0, "6B.E3 stamina percent");
            REQUIRE(f.headDamagePercent >= 0.0 && f.headDamagePercent <= 1.0, "6B.E3 head damage percent");
            REQUIRE(!(f.isHurt && f.isBuzzed), "6B.E3 hurt and buzzed at once");
        }
    }

    std::cout << "[PASS] 6B.E1-E3 seeded replay and snapshot sanity\n";
}

static void runKnockdownFormulas_6C() {
    ringsim::FighterProfile tough = named("Tough Fighter");
    tough.mental.heart = 98.0;
    tough.mental.chin = 95.0;
    tough.power.knockoutPower = 50.0;
    ringsim::FighterProfile soft = named("Soft Fighter");
    soft.mental.heart = 30.0;
    soft.mental.chin = 1.0;
    soft.power.knockoutPower = 100.0;

    ringsim::Fighter a(tough);
    ringsim::Fighter b(soft);
    ringsim::Fight fight(a, b);
    ringsim::SimulationLoop loop(fight);
    const ringsim::RecoveryParams& rp = fight.params().recovery;

    for (int count = 1; count <= 10; ++count) {
        for (const ringsim::Fighter* f : {&a, &b}) {
            const double p = loop.calculateRecoveryChance(*f, 8.0, count);
            REQUIRE(p >= rp.min_chance && p <= rp.max_chance, "6C.E1 recovery chance outside its clamp");
        }
    }
    REQUIRE(loop.calculateRecoveryChance(a, 8.0, 8) > loop.calculateRecoveryChance(b, 8.0, 8),
            "6C.E1 heart does not help beat the count");

    const double ko = loop.calculateImmediateKOChance(b, b, 10.0);
    requireCloseAbsOrRel("6C.E2 immediate KO cap", ko, fight.params().knockout.cap, 1e-12, 1e-12);
    requireExact("6C.E2 weak puncher cannot flatten", loop.calculateImmediateKOChance(b, a, 10.0), 0.0);

    requireCloseAbsOrRel("6C.E3 flash recovery, big heart", loop.calculateFlashRecoveryChance(a), 0.98, 1e-12, 1e-12);
    requireUnitInterval("6C.E3 flash recovery, small heart", loop.calculateFlashRecoveryChance(b));

    // Same fighter, empty tank versus half a tank.
    ringsim::FighterProfile hitter = named("Hitter");
    hitter.power.knockoutPower = 100.0;
    ringsim::FighterProfile target = named("Target");
    target.mental.chin = 50.0;
    target.mental.heart = 70.0;
    ringsim::Fighter striker(hitter);
    ringsim::Fighter fresh(target);
    ringsim::Fighter spent(target);
    fresh.spendStamina(fresh.maxStamina() * 0.5);
    spent.spendStamina(spent.maxStamina());
    REQUIRE(spent.getStaminaPercent() < 0.2 && fresh.getStaminaPercent() >= 0.4, "6C.E4 stamina setup");
    const double koSpent = loop.calculateImmediateKOChance(spent, striker, 4.0);
    const double koFresh = loop.calculateImmediateKOChance(fresh, striker, 4.0);
    REQUIRE(koFresh > 0.0, "6C.E4 no knockout chance at half stamina");
    REQUIRE(koSpent > koFresh, "6C.E4 empty tank is not more vulnerable");

    // Heart 98 against heart 60 with the same chin, at eight.
    ringsim::FighterProfile brave = named("Brave");
    brave.mental.heart = 98.0;
    brave.mental.chin = 80.0;
    ringsim::FighterProfile timid = named("Timid");
    timid.mental.heart = 60.0;
    timid.mental.chin = 80.0;
    const ringsim::Fighter braveF(brave);
    const ringsim::Fighter timidF(timid);
    REQUIRE(loop.calculateRecoveryChance(braveF, 8.0, 8) > loop.calculateRecoveryChance(timidF, 8.0, 8),
            "6C.E5 heart 98 does not beat heart 60 at eight");

    std::cout << "[PASS] 6C.E1-E5 count, immediate KO and flash formulas\n";
}

static void runThreeKnockdownRule_6D() {
    ringsim::FighterProfile puncher = named("Puncher");
    puncher.power.knockoutPower = 10.0;
    ringsim::Fighter a(puncher);
    ringsim::Fighter b(named("Target"));

    ringsim::FightConfig cfg = shortConfig(3);
    cfg.threeKnockdownRule = true;

    // Always beats the count, never an immediate KO, no random stoppage.
    ringsim::ModelParameters params;
    params.set("recovery.min_chance", 1.0);
    params.set("recovery.max_chance", 1.0);
    params.set("stoppage.gate_threshold", 10.0);

    ringsim::Fight fight(a, b, cfg, ringsim::RefereeProfile{}, {}, params);
    KnockdownEveryTick combat;
    ringsim::SimulationCollaborators parts;
    parts.combat = &combat;
    ringsim::SimulationLoop loop(fight, parts);
    ringsim::EventRecorder rec;
    loop.addSink(&rec);
    loop.runToCompletion();

    const ringsim::FightResult& r = fight.result();
    REQUIRE(r.method == ringsim::ResultMethod::TKO_ThreeKnockdowns, "6D.E1 three knockdowns did not stop the fight");
    REQUIRE(r.hasWinner && r.winner == ringsim::Side::A, "6D.E1 wrong winner");
    REQUIRE(r.round == 1, "6D.E1 stoppage not in round 1");
    REQUIRE(b.knockdownsThisRound() == 3, "6D.E1 knockdown count");
    REQUIRE(rec.countOf(ringsim::EventType::Knockdown) == 3, "6D.E2 KNOCKDOWN events");
    REQUIRE(rec.countOf(ringsim::EventType::Recovery) == 2, "6D.E2 RECOVERY events");
    REQUIRE(rec.countOf(ringsim::EventType::FightEnd) == 1, "6D.E2 FIGHT_END count");

    // Mandatory eight: nobody gets up before eight.
    for (const auto& e : rec.events()) {
        if (e.type == ringsim::EventType::Recovery) {
            REQUIRE(e.count >= 8, "6D.E3 recovery before the mandatory eight");
        }
    }
    REQUIRE(fight.getCompuboxStats().knockdownsScored[0] == 3, "6D.E4 knockdowns not credited");

    std::cout << "[PASS] 6D.E1-E4 three-knockdown rule and mandatory eight\n";
}

static void runKnockoutByCount_6E() {
    ringsim::Fighter a(named("Finisher"));
    ringsim::Fighter b(named("Glass"));

    ringsim::ModelParameters params;
    params.set("recovery.min_chance", 0.0);
    params.set("recovery.max_chance", 0.0);

    ringsim::Fight fight(a, b, shortConfig(3), ringsim::RefereeProfile{}, {}, params);
    KnockdownEveryTick combat;
    ringsim::SimulationCollaborators parts;
    parts.combat = &combat;
    ringsim::SimulationLoop loop(fight, parts);
    ringsim::EventRecorder rec;
    loop.addSink(&rec);
    loop.runToCompletion();

    REQUIRE(fight.result().method == ringsim::ResultMethod::KO, "6E.E1 unbeatable count is not a KO");
    REQUIRE(fight.result().winner == ringsim::Side::A, "6E.E1 wrong winner");
    REQUIRE(combat.calls == 1, "6E.E1 fight continued after the knockout");

    int ko = 0;
    int last = 0;
    for (const auto& e : rec.events()) {
        if (e.type != ringsim::EventType::Count) continue;
        REQUIRE(e.count == last + 1, "6E.E2 count skipped a number");
        last = e.count;
        if (e.isKO) ++ko;
    }
    REQUIRE(last == 10 && ko == 1, "6E.E2 count did not reach a single ten");
    REQUIRE(b.roundHistory().size() == 1 && b.roundHistory().back().knockdownsSuffered == 1,
            "6E.E3 stoppage round not archived");

    std::cout << "[PASS] 6E.E1-E2 ten count ends the fight\n";
}

static void runFlashKnockdowns_6F() {
    ringsim::FighterProfile puncher = named("Flash Puncher");
    puncher.power.knockoutPower = 10.0;

    // A flash is beaten inside four and always ends in RECOVERY.
    int flashes = 0;
    for (std::uint32_t seed = 1; seed <= 8; ++seed) {
        ringsim::FighterProfile sturdy = named("Big Heart");
        sturdy.mental.heart = 99.0;
        ringsim::Fighter a(puncher);
        ringsim::Fighter b(sturdy);
        ringsim::Fight fight(a, b, shortConfig(1), ringsim::RefereeProfile{}, {}, survivableKnockdowns());

        ScriptedKnockdowns combat({true});
        ringsim::SimulationCollaborators parts;
        parts.combat = &combat;
        ringsim::SimulationOptions opts;
        opts.seed = seed;
        ringsim::SimulationLoop loop(fight, parts, opts);
        ringsim::EventRecorder rec;
        loop.addSink(&rec);
        loop.runToCompletion();

        const std::vector<ringsim::EventType> trail = knockdownTrail(rec);
        REQUIRE(trail.size() == 2 && trail[1] == ringsim::EventType::Recovery, "6F.E1 knockdown without RECOVERY");

        bool onFlash = false;
        for (const auto& e : rec.events()) {
            if (e.type == ringsim::EventType::FlashKnockdown) {
                onFlash = true;
                ++flashes;
            } else if (onFlash && e.type == ringsim::EventType::Count) {
                REQUIRE(e.count <= 4 && !e.isKO, "6F.E1 flash count ran long");
            } else if (e.type == ringsim::EventType::Recovery) {
                onFlash = false;
            }
        }
    }
    REQUIRE(flashes >= 1, "6F.E1 big heart never beat a flash");

    // With prior knockdowns the flash roll cannot succeed: the second is a full knockdown.
    ringsim::ModelParameters params = survivableKnockdowns();
    params.set("recovery.flash_prior_one_factor", 0.0);
    params.set("recovery.flash_prior_two_factor", 0.0);
    ringsim::FighterProfile timid = named("Small Heart");
    timid.mental.heart = 30.0;
    ringsim::Fighter a(puncher);
    ringsim::Fighter b(timid);
    ringsim::Fight fight(a, b, shortConfig(1), ringsim::RefereeProfile{}, {}, params);

    ScriptedKnockdowns combat({true, true});
    ringsim::SimulationCollaborators parts;
    parts.combat = &combat;
    ringsim::SimulationLoop loop(fight, parts);
    ringsim::EventRecorder rec;
    loop.addSink(&rec);
    loop.runToCompletion();

    const std::vector<ringsim::EventType> trail = knockdownTrail(rec);
    REQUIRE(trail.size() == 4, "6F.E2 two knockdowns, two recoveries");
    REQUIRE(trail[2] == ringsim::EventType::Knockdown, "6F.E2 failed flash not reported as KNOCKDOWN");
    REQUIRE(trail[3] == ringsim::EventType::Recovery, "6F.E2 no RECOVERY after the full count");

    int recoveries = 0;
    for (const auto& e : rec.events()) {
        if (e.type != ringsim::EventType::Recovery) continue;
        if (++recoveries == 2) REQUIRE(e.count >= 8, "6F.E2 failed flash skipped the mandatory eight");
    }

    std::cout << "[PASS] 6F.E1-E2 flash knockdowns recover; failed flashes are full knockdowns\n";
}

static void runFlashUnderThreeKnockdownRule_6G() {
    ringsim::FighterProfile puncher = named("Puncher");
    puncher.power.knockoutPower = 10.0;
    ringsim::FighterProfile sturdy = named("Big Heart");
    sturdy.mental.heart = 99.0;
    ringsim::Fighter a(puncher);
    ringsim::Fighter b(sturdy);

    ringsim::FightConfig cfg = shortConfig(3);
    cfg.threeKnockdownRule = true;
    ringsim::ModelParameters params = survivableKnockdowns();
    params.set("recovery.flash_prior_one_factor", 1.0);
    params.set("recovery.flash_prior_two_factor", 1.0);

    ringsim::Fight fight(a, b, cfg, ringsim::RefereeProfile{}, {}, params);
    ScriptedKnockdowns combat({true, true, true});
    ringsim::SimulationCollaborators parts;
    parts.combat = &combat;
    ringsim::SimulationLoop loop(fight, parts);
    ringsim::EventRecorder rec;
    loop.addSink(&rec);
    loop.runToCompletion();

    REQUIRE(fight.result().method == ringsim::ResultMethod::TKO_ThreeKnockdowns, "6G.E1 third knockdown did not stop it");
    REQUIRE(rec.countOf(ringsim::EventType::Recovery) == 2, "6G.E1 RECOVERY count");

    const std::vector<ringsim::EventType> trail = knockdownTrail(rec);
    REQUIRE(!trail.empty() && trail.back() == ringsim::EventType::Knockdown, "6G.E2 fight-ending knockdown reported as a flash");
    for (std::size_t i = 0; i < trail.size(); ++i) {
        if (trail[i] == ringsim::EventType::FlashKnockdown) {
            REQUIRE(i + 1 < trail.size() && trail[i + 1] == ringsim::EventType::Recovery,
                    "6G.E2 FLASH_KNOCKDOWN without RECOVERY");
        }
    }

    std::cout << "[PASS] 6G.E1-E2 a stoppage knockdown is never a flash\n";
}

static void runBuzzCompounds_6H() {
    ringsim::FighterProfile glass = named("Glass Chin");
    glass.mental.chin = 1.0;
    ringsim::Fighter a(named("Jabber"));
    ringsim::Fighter b(glass);

    ringsim::ModelParameters params;
    params.set("stoppage.gate_threshold", 10.0);
    ringsim::Fight fight(a, b, shortConfig(1), ringsim::RefereeProfile{}, {}, params);

    HeadShotEveryTick combat(3.0);
    ringsim::SimulationCollaborators parts;
    parts.combat = &combat;
    ringsim::SimulationLoop loop(fight, parts);
    ringsim::EventRecorder rec;
    loop.addSink(&rec);
    for (int i = 0; i < 3; ++i) loop.step();

    std::vector<ringsim::FightEvent> buzzes;
    for (const auto& e : rec.events()) {
        if (e.type == ringsim::EventType::Buzzed) buzzes.push_back(e);
    }
    REQUIRE(buzzes.size() >= 2, "6H.E1 buzzed fighter not re-buzzed");
    REQUIRE(buzzes[0].side == ringsim::Side::B && buzzes[1].side == ringsim::Side::B, "6H.E1 wrong side buzzed");
    REQUIRE(buzzes[1].severity > buzzes[0].severity, "6H.E2 second buzz did not deepen");
    REQUIRE(buzzes[1].duration_s > buzzes[0].duration_s, "6H.E2 second buzz did not lengthen");
    REQUIRE(b.isBuzzed() && !b.isHurt(), "6H.E3 buzz state lost");

    std::cout << "[PASS] 6H.E1-E3 a buzzed fighter hit again stays buzzed longer and deeper\n";
}

static void runHurtCarriedThroughCount_6I() {
    ringsim::FighterProfile puncher = named("Puncher");
    puncher.power.knockoutPower = 10.0;
    ringsim::Fighter a(puncher);
    ringsim::Fighter b(named("Wobbly"));
    ringsim::Fight fight(a, b, shortConfig(1), ringsim::RefereeProfile{}, {}, survivableKnockdowns());

    ScriptedKnockdowns combat({false});
    ringsim::SimulationCollaborators parts;
    parts.combat = &combat;
    ringsim::SimulationLoop loop(fight, parts);
    ringsim::EventRecorder rec;
    loop.addSink(&rec);

    loop.start();
    b.setHurt(5.0);
    REQUIRE(b.isHurt() && b.state() == ringsim::FighterState::Hurt, "6I.E1 hurt setup");
    loop.step();

    const std::vector<ringsim::EventType> trail = knockdownTrail(rec);
    REQUIRE(trail.size() == 2 && trail[0] == ringsim::EventType::Knockdown, "6I.E1 knockdown not recorded");
    REQUIRE(b.isHurt() && b.state() == ringsim::FighterState::Hurt, "6I.E1 hurt fighter got up unhurt");

    for (int i = 0; i < 60 && b.isHurt(); ++i) loop.step();
    REQUIRE(!b.isHurt() && b.state() != ringsim::FighterState::Hurt, "6I.E2 hurt never wore off after the count");

    std::cout << "[PASS] 6I.E1-E2 hurt carried through the count\n";
}

// =======================
// Step 7: Real-time driver
// =======================

static void runDriverMatchesBatch_7A() {
    const ringsim::RunSignatures batch = runReferenceFight(77u, 2, nullptr);

    ringsim::Fighter a(ringsim::FighterProfile::preset("boxer", "Red Corner"));
    ringsim::Fighter b(ringsim::FighterProfile::preset("slugger", "Blue Corner"));
    ringsim::Fight fight(a, b, shortConfig(2));
    ringsim::BasicDecisionSource decisions;
    ringsim::BasicCombatResolver combat;
    ringsim::BasicDamageCalculator damage;
    ringsim::BasicStaminaManager stamina;
    ringsim::ring::RingPositionTracker positions;
    ringsim::SimulationCollaborators parts;
    parts.decisions = &decisions;
    parts.combat = &combat;
    parts.damage = &damage;
    parts.stamina = &stamina;
    parts.positions = &positions;
    ringsim::SimulationOptions opts;
    opts.seed = 77u;
    ringsim::SimulationLoop loop(fight, parts, opts);

    ringsim::NoDelay delay;
    ringsim::RealTimeDriver driver(loop, delay);
    const int steps = driver.run();
    REQUIRE(fight.isOver(), "7A.E1 driver stopped early");
    REQUIRE(steps > 0, "7A.E1 driver took no steps");
    REQUIRE(sameSignatures(loop.signatures(), batch), "7A.E1 paced run diverged from batch");

    ringsim::DriverOptions zero;
    zero.speedMultiplier = 0.0;
    REQUIRE(throwsAs<std::invalid_argument>([&] { ringsim::RealTimeDriver d(loop, delay, zero); }),
            "7A.E2 zero speed accepted");

    std::cout << "[PASS] 7A.E1-E2 paced run matches batch\n";
}

static void runDriverPauseStop_7B() {
    ringsim::Fighter a(named("Pause A"));
    ringsim::Fighter b(named("Pause B"));
    ringsim::Fight fight(a, b, shortConfig(3));
    ringsim::SimulationLoop loop(fight);

    ScriptedDelay delay;
    delay.pauseAt = 1;
    delay.resumeAt = 3;
    delay.stopAt = 4;
    ringsim::DriverOptions opts;
    ringsim::RealTimeDriver driver(loop, delay, opts);
    delay.driver = &driver;

    const int steps = driver.run();
    REQUIRE(steps == 2, "7B.E1 paused driver kept stepping");
    REQUIRE(driver.isStopped() && !fight.isOver(), "7B.E1 stop did not halt the driver");
    REQUIRE(delay.waits.size() == 4, "7B.E1 wait sequence length");
    requireCloseAbsOrRel("7B.E2 intro pause", delay.waits[0], opts.introPause_s + loop.options().tickRate_s, 1e-12, 1e-12);
    requireExact("7B.E2 paused poll", delay.waits[1], opts.pausedPoll_s);
    requireExact("7B.E2 paused poll", delay.waits[2], opts.pausedPoll_s);
    requireExact("7B.E2 tick pacing", delay.waits[3], loop.options().tickRate_s);

    ringsim::Fighter c(named("Fast C"));
    ringsim::Fighter d(named("Fast D"));
    ringsim::Fight fight2(c, d, shortConfig(1));
    ringsim::SimulationLoop loop2(fight2);
    ScriptedDelay delay2;
    delay2.stopAt = 1;
    ringsim::DriverOptions fast;
    fast.speedMultiplier = 4.0;
    ringsim::RealTimeDriver driver2(loop2, delay2, fast);
    delay2.driver = &driver2;
    driver2.run();
    requireCloseAbsOrRel("7B.E3 speed multiplier", delay2.waits[0], (fast.introPause_s + 0.5) / 4.0, 1e-12, 1e-12);

    ringsim::Fighter e(named("Stop E"));
    ringsim::Fighter f(named("Stop F"));
    ringsim::Fight fight3(e, f, shortConfig(1));
    ringsim::SimulationLoop loop3(fight3);
    ringsim::NoDelay nd;
    ringsim::RealTimeDriver driver3(loop3, nd);
    driver3.stop();
    REQUIRE(driver3.run() == 0, "7B.E4 stopped driver stepped");
    REQUIRE(!loop3.isStarted(), "7B.E4 stopped driver started the fight");

    std::cout << "[PASS] 7B.E1-E4 pause, resume, stop and speed\n";
}

// =======================
// Step 8: Batch bouts and analysis
// =======================

static void runBoutScenario_8A() {
    const ringsim::FighterProfile a = ringsim::FighterProfile::preset("elite", "Elite A");
    const ringsim::FighterProfile b = ringsim::FighterProfile::preset("journeyman", "Journeyman B");
    ringsim::BoutConfig cfg;
    cfg.fight.rounds = 3;

    ringsim::EventRecorder rec;
    const ringsim::BoutOutcome o1 = ringsim::runBout(a, b, cfg, 31u, &rec);
    const ringsim::BoutOutcome o2 = ringsim::runBout(a, b, cfg, 31u);
    REQUIRE(sameSignatures(o1.signatures, o2.signatures), "8A.E1 runBout is not reproducible");
    REQUIRE(o1.method == o2.method && o1.ticks == o2.ticks, "8A.E1 runBout outcome drifted");
    REQUIRE(rec.countOf(ringsim::EventType::FightEnd) == 1, "8A.E1 sink missed FIGHT_END");

    REQUIRE(o1.ticks > 0, "8A.E2 no ticks");
    REQUIRE(o1.roundsCompleted > 0.0 && o1.roundsCompleted <= 3.0 + 1e-9, "8A.E2 rounds completed out of range");
    REQUIRE(o1.totalDamage >= 0.0, "8A.E2 negative damage");
    REQUIRE(o1.isDecision() || o1.isStoppage() || ringsim::isDraw(o1.method), "8A.E2 unknown method");

    ringsim::FighterProfile p = a;
    ringsim::setProfileAttribute(p, "chin", 42.0);
    requireExact("8A.E3 attribute knob", ringsim::getProfileAttribute(p, "chin"), 42.0);
    REQUIRE(throwsAs<std::invalid_argument>([&] { ringsim::setProfileAttribute(p, "reach", 1.0); }),
            "8A.E3 unknown knob accepted");

    std::cout << "[PASS] 8A.E1-E3 batch bouts\n";
}

static void runSensitivitySweep_8B() {
    ringsim::FightSensitivity sweep;

    ringsim::FightSensitivity::ParameterRange range;
    range.nominal = 75.0;
    range.min = 60.0;
    range.max = 90.0;
    range.samples = 3;
    const std::vector<double> values = sweep.sampleValues(range);
    REQUIRE(values.size() == 3, "8B.E1 sample count");
    requireExact("8B.E1 first sample", values[0], 60.0);
    requireExact("8B.E1 mid sample", values[1], 75.0);
    requireExact("8B.E1 last sample", values[2], 90.0);

    ringsim::FightSensitivity::ParameterRange degenerate = range;
    degenerate.samples = 1;
    REQUIRE(sweep.sampleValues(degenerate).size() == 1, "8B.E1 single sample");

    ringsim::FightSensitivity::Matchup m;
    m.bout.fight.rounds = 2;
    m.fightsPerPoint = 2;
    sweep.setMatchup(m);
    range.samples = 2;
    sweep.analyzeHeart(range);
    REQUIRE(sweep.results().size() == 2, "8B.E2 one row per sample");
    for (const auto& row : sweep.results()) {
        REQUIRE(row.parameter_name == "heart", "8B.E2 parameter name");
        requireUnitInterval("8B.E2 stoppage rate", row.metrics.stoppageRate);
        requireUnitInterval("8B.E2 win rate", row.metrics.winRateA);
        REQUIRE(row.metrics.fights == 2, "8B.E2 fights per point");
    }

    const std::string path = "ringsim_test_sensitivity.csv";
    REQUIRE(sweep.exportSensitivityMatrixCSV(path), "8B.E3 CSV export failed");
    std::ifstream in(path);
    std::string header;
    std::getline(in, header);
    in.close();
    std::remove(path.c_str());
    REQUIRE(header == "parameter,value,ko_tko_rate,win_rate_a,mean_rounds,fights", "8B.E3 CSV header");

    sweep.clearResults();
    REQUIRE(sweep.results().empty(), "8B.E4 clearResults");

    std::cout << "[PASS] 8B.E1-E4 attribute sensitivity sweep\n";
}

static void runOutcomeUQ_8C() {
    const ringsim::OutcomeUQ::UQResult s = ringsim::OutcomeUQ::summarize({1.0, 2.0, 3.0, 4.0});
    requireExact("8C.E1 mean", s.mean, 2.5);
    requireExact("8C.E1 median", s.median, 2.5);
    requireCloseAbsOrRel("8C.E1 std dev", s.std_dev, std::sqrt(1.25), 1e-12, 1e-12);
    REQUIRE(s.ci_lower_95 >= 1.0 && s.ci_upper_95 <= 4.0, "8C.E1 interval outside data");

    const ringsim::OutcomeUQ::UQResult empty = ringsim::OutcomeUQ::summarize({});
    requireExact("8C.E1 empty mean", empty.mean, 0.0);

    ringsim::OutcomeUQ uq;
    ringsim::OutcomeUQ::Matchup m;
    m.bout.fight.rounds = 2;
    uq.setMatchup(m);
    const ringsim::OutcomeUQ::UQSummary a = uq.runMonteCarlo(3);
    const ringsim::OutcomeUQ::UQSummary b = uq.runMonteCarlo(3);
    REQUIRE(a.samples == 3, "8C.E2 sample count");
    requireExact("8C.E2 reproducible rounds", a.rounds_completed.mean, b.rounds_completed.mean);
    requireExact("8C.E2 reproducible damage", a.total_damage.mean, b.total_damage.mean);
    requireUnitInterval("8C.E2 win mean", a.win_a.mean);
    REQUIRE(a.rounds_completed.mean > 0.0 && a.rounds_completed.mean <= 2.0 + 1e-9, "8C.E2 rounds out of range");
    REQUIRE(uq.runMonteCarlo(0).samples == 1, "8C.E3 zero samples not clamped");

    std::cout << "[PASS] 8C.E1-E3 Monte Carlo outcome summary\n";
}

} // namespace

int main() {
    // Canary: prove the test fails in Release when checks are active.
    if (std::getenv("RINGSIM_CANARY_NAN")) {
        REQUIRE_FINITE(std::nan(""), "CANARY_NAN");
        return 0; // unreachable
    }

    // =======================
    // Step 1: Primitives
    // =======================
    runRngDeterminism_1A();
    runDigestVectors_1A();
    runModelParameters_1A();

    // =======================
    // Step 2: Fighter
    // =======================
    runStateTable_2A();
    runFighterConstruction_2B();
    runFighterDamage_2C();
    runFighterHurtBuzzed_2D();
    runFighterModifiers_2E();
    runBetweenRounds_2F();

    // =======================
    // Step 3: Officials and effects
    // =======================
    runRoundLedger_3A();
    runJudgeScoring_3B();
    runReferee_3C();
    runFoulEscalation_3D();
    runFightEffects_3E();

    // =======================
    // Step 4: Fight aggregate and events
    // =======================
    runFightLifecycle_4A();
    runEventLogging_4B();
    runDecisionOutcomes_4C();

    // =======================
    // Step 5: Ring and collaborators
    // =======================
    runRingGeometry_5A();
    runReferenceCollaborators_5B();

    // =======================
    // Step 6: Simulation loop
    // =======================
    runLoopContracts_6A();
    runLoopDeterminism_6B();
    runKnockdownFormulas_6C();
    runThreeKnockdownRule_6D();
    runKnockoutByCount_6E();
    runFlashKnockdowns_6F();
    runFlashUnderThreeKnockdownRule_6G();
    runBuzzCompounds_6H();
    runHurtCarriedThroughCount_6I();

    // =======================
    // Step 7: Real-time driver
    // =======================
    runDriverMatchesBatch_7A();
    runDriverPauseStop_7B();

    // =======================
    // Step 8: Batch bouts and analysis
    // =======================
    runBoutScenario_8A();
    runSensitivitySweep_8B();
    runOutcomeUQ_8C();

    std::cout << "[PASS] all fight integrity checks\n";
    return 0;
}
