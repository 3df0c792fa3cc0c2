#pragma once

#include <array>
#include <map>
#include <string>
#include <vector>

#include "FighterTypes.h"
#include "Rng.h"

namespace ringsim {

class Fighter;

enum class FoulType : std::uint8_t {
    Headbutt = 0,
    LowBlow,
    RabbitPunch,
    Holding,
    Elbow,
    Push,
    HittingAfterBreak,
    HittingOnBreak,
    Count
};

const char* toString(FoulType f);

// Static characteristics of one foul category.
struct FoulData {
    const char* name;
    double damageMin;
    double damageMax;
    double cutChance;
    double detectChance;
    int warningThreshold;
    double staminaDrain;    // taken from the target
    double staminaRecovery; // given to the attacker
    const char* description;
};

const FoulData& foulData(FoulType f);

enum class FoulConsequence { None, Warning, PointDeduction, Disqualification };

const char* toString(FoulConsequence c);

struct FoulSituation {
    double staminaPercent = 1.0;
    double distance = 5.0;
    int round = 1;
    double scoreDiff = 0.0; // positive: the fouler leads
    bool inClinch = false;
};

struct FoulResult {
    FoulType type = FoulType::Push;
    Side attacker = Side::A;
    bool detected = false;
    bool intentional = false;
    FoulConsequence consequence = FoulConsequence::None;
    double damage = 0.0;
    double staminaDrain = 0.0;
    double staminaRecovery = 0.0;
    bool cutCaused = false;
};

struct FoulSummary {
    std::map<FoulType, int> warnings;
    int pointDeductions = 0;
    int totalFouls = 0;
    int foulsThisRound = 0;
};

// ============================================================
// Foul attempt, execution and penalty bookkeeping per corner.
//
// Escalation per foul type: warnings up to the type's threshold, point
// deductions for the next two, then disqualification once three points
// are gone.
// ============================================================
class FoulPolicy {
public:
    FoulPolicy() = default;

    void reset();
    void resetRound();

    // Returns false when no foul is attempted this tick.
    bool shouldAttemptFoul(const Fighter& fighter,
                           Side side,
                           const FoulSituation& situation,
                           Rng& rng,
                           FoulType& out) const;

    // Weighted by the fighter's tendencies; false when every weight is zero.
    bool selectFoulType(const Fighter& fighter,
                        const FoulSituation& situation,
                        Rng& rng,
                        FoulType& out) const;

    // refereeSkill is 0..100 and scales detection.
    FoulResult executeFoul(FoulType type,
                           const Fighter& attacker,
                           Side side,
                           double refereeSkill,
                           Rng& rng);

    // Foul damage lands on the head.
    static void applyFoulEffects(const FoulResult& result, Fighter& attacker, Fighter& target);

    int getPointDeductions(Side s) const { return pointDeductions_[sideIndex(s)]; }
    int totalWarnings(Side s) const;
    FoulSummary getFoulSummary(Side s) const;

private:
    std::array<std::map<FoulType, int>, 2> warnings_{};
    std::array<int, 2> pointDeductions_{{0, 0}};
    std::array<std::vector<FoulType>, 2> foulsThisRound_{};
    std::array<std::vector<FoulType>, 2> totalFouls_{};
};

} // namespace ringsim
