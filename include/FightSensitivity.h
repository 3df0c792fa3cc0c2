#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "FightScenario.h"

namespace ringsim {

class FightSensitivity {
public:
    struct ParameterRange {
        double nominal = 0.0;
        double min = 0.0;
        double max = 0.0;
        int samples = 0;
    };

    struct Matchup {
        std::string archetypeA = "boxer";
        std::string archetypeB = "slugger";
        BoutConfig bout{};
        int fightsPerPoint = 20;
        std::uint32_t baseSeed = 1337u;
    };

    struct PointResult {
        double stoppageRate = 0.0; // KO + TKO
        double winRateA = 0.0;
        double meanRounds = 0.0;
        int fights = 0;
    };

    struct SensitivityRow {
        std::string parameter_name;
        double parameter_value = 0.0;
        PointResult metrics{};
    };

    FightSensitivity();

    void setMatchup(const Matchup& matchup);
    const Matchup& matchup() const noexcept { return matchup_; }
    void clearResults();

    // Sweeps one of fighter A's attributes (see setProfileAttribute).
    void analyzeAttribute(const std::string& attribute, const ParameterRange& range);

    void analyzeHeart(const ParameterRange& range) { analyzeAttribute("heart", range); }
    void analyzeChin(const ParameterRange& range) { analyzeAttribute("chin", range); }
    void analyzeKnockoutPower(const ParameterRange& range) { analyzeAttribute("knockout_power", range); }
    void analyzeCardio(const ParameterRange& range) { analyzeAttribute("cardio", range); }
    void analyzeHandSpeed(const ParameterRange& range) { analyzeAttribute("hand_speed", range); }

    // Returns false when the file cannot be opened.
    bool exportSensitivityMatrixCSV(const std::string& filename) const;
    const std::vector<SensitivityRow>& results() const;

    std::vector<double> sampleValues(const ParameterRange& range) const;

private:
    Matchup matchup_{};
    std::vector<SensitivityRow> results_{};

    PointResult runPoint(const FighterProfile& a, const FighterProfile& b) const;
};

} // namespace ringsim
