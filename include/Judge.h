#pragma once

#include <array>
#include <string>
#include <vector>

#include "ModelParameters.h"
#include "Rng.h"
#include "Round.h"

namespace ringsim {

// Multipliers on the four scoring criteria (1.0 = neutral).
struct JudgePreferences {
    double cleanPunching = 1.0;
    double defense = 1.0;
    double effectiveAggression = 1.0;
    double ringGeneralship = 1.0;
    double powerShots = 1.0;
    double volume = 1.0;
};

struct JudgeProfile {
    std::string name = "Judge";
    std::string type = "balanced";
    JudgePreferences preferences{};
    double knockdownWeight = 1.0;
    double homeBias = 0.0;     // percent bonus on the home fighter's total
    double consistency = 85.0; // percent
};

// Per-fighter criterion values before judge preferences are applied.
struct ScoringCriteria {
    double cleanPunching = 0.0;
    double effectiveAggression = 0.0;
    double ringGeneralship = 0.0;
    double defense = 0.0;
};

// Fight-level facts a judge needs beyond the round ledger.
struct JudgeContext {
    bool homeA = false;
    bool homeB = false;
    std::array<int, 2> pointDeductions{{0, 0}}; // this round, indexed by sideIndex
};

class Judge {
public:
    explicit Judge(JudgeProfile profile);

    const JudgeProfile& profile() const noexcept { return profile_; }
    const std::string& name() const noexcept { return profile_.name; }

    // The technical / action / power panel.
    static std::vector<JudgeProfile> defaultPanel();

    static ScoringCriteria scoreCriteria(const Round& round, Side s, const ScoringParams& p);

    // Preference-weighted total for one fighter (home bias not applied).
    double weightedTotal(const Round& round, Side s, const ScoringParams& p) const;

    // 10-point-must score for a completed round. Uses rng for the moderate
    // and close bands only; the clear band is deterministic.
    JudgeRoundScore calculateJudgeScore(const Round& round,
                                        const JudgeContext& ctx,
                                        Rng& rng,
                                        const ScoringParams& p) const;

private:
    JudgeProfile profile_;
};

} // namespace ringsim
