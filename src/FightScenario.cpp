#include "FightScenario.h"

#include "ReferenceCollaborators.h"
#include "../ring/ring_geometry.h"

#include <stdexcept>

namespace ringsim {

bool BoutOutcome::isKoOrTko() const {
    return method != ResultMethod::Disqualification && isStoppage();
}

BoutOutcome runBout(const FighterProfile& a,
                    const FighterProfile& b,
                    const BoutConfig& config,
                    std::uint32_t seed,
                    EventSink* sink) {
    Fighter fa(a);
    Fighter fb(b);
    Fight fight(fa, fb, config.fight, config.referee, std::vector<JudgeProfile>{}, config.params);

    BasicDecisionSource decisions;
    BasicCombatResolver combat;
    BasicDamageCalculator damage;
    BasicStaminaManager stamina;
    ring::RingPositionTracker positions;

    SimulationCollaborators parts;
    parts.decisions = &decisions;
    parts.combat = &combat;
    parts.damage = &damage;
    parts.stamina = &stamina;
    parts.positions = &positions;

    SimulationOptions opts;
    opts.tickRate_s = config.fight.tickRate_s;
    opts.seed = seed;

    SimulationLoop loop(fight, parts, opts);
    loop.addSink(sink);
    loop.runToCompletion();

    const FightResult& r = fight.result();
    BoutOutcome out;
    out.method = r.method;
    out.hasWinner = r.hasWinner;
    out.winner = r.winner;
    out.endRound = r.round;
    out.endTime_s = r.time_s;
    out.totalDamage = fa.headDamage() + fa.bodyDamage() + fb.headDamage() + fb.bodyDamage();
    out.knockdowns = fa.knockdownsTotal() + fb.knockdownsTotal();
    out.ticks = loop.tickCount();
    out.signatures = loop.signatures();

    if (isStoppage(r.method)) {
        const double duration = config.fight.roundDuration_s;
        out.roundsCompleted = static_cast<double>(r.round - 1) + (duration > 0.0 ? r.time_s / duration : 0.0);
    } else {
        out.roundsCompleted = static_cast<double>(config.fight.rounds);
    }
    return out;
}

void setProfileAttribute(FighterProfile& p, const std::string& attribute, double value) {
    if (attribute == "heart") p.mental.heart = value;
    else if (attribute == "chin") p.mental.chin = value;
    else if (attribute == "knockout_power") p.power.knockoutPower = value;
    else if (attribute == "cardio") p.stamina.cardio = value;
    else if (attribute == "hand_speed") p.speed.handSpeed = value;
    else throw std::invalid_argument("unknown attribute: " + attribute);
}

double getProfileAttribute(const FighterProfile& p, const std::string& attribute) {
    if (attribute == "heart") return p.mental.heart;
    if (attribute == "chin") return p.mental.chin;
    if (attribute == "knockout_power") return p.power.knockoutPower;
    if (attribute == "cardio") return p.stamina.cardio;
    if (attribute == "hand_speed") return p.speed.handSpeed;
    throw std::invalid_argument("unknown attribute: " + attribute);
}

} // namespace ringsim
