#pragma once

#include <string>
#include <vector>

#include "FightScenario.h"

namespace ringsim {

// Monte Carlo over fighter A's attributes; fighter B stays at its preset.
class OutcomeUQ {
public:
    struct ParameterRange {
        double min = 0.0;
        double max = 0.0;
    };

    struct UQResult {
        double mean = 0.0;
        double median = 0.0;
        double ci_lower_95 = 0.0;
        double ci_upper_95 = 0.0;
        double std_dev = 0.0;
    };

    struct UQSummary {
        UQResult rounds_completed{};
        UQResult total_damage{};
        UQResult win_a{}; // 1 when A wins, else 0
        int samples = 0;
    };

    struct UQRanges {
        ParameterRange heart{50.0, 100.0};
        ParameterRange chin{50.0, 100.0};
        ParameterRange knockout_power{50.0, 100.0};
        ParameterRange cardio{50.0, 100.0};
    };

    struct Matchup {
        std::string archetypeA = "boxer";
        std::string archetypeB = "slugger";
        BoutConfig bout{};
    };

    OutcomeUQ();

    void setMatchup(const Matchup& matchup);
    void setRanges(const UQRanges& ranges);

    UQSummary runMonteCarlo(const Matchup& matchup, int num_samples = 100) const;
    UQSummary runMonteCarlo(int num_samples = 100) const;

    // Mean, linear-interpolated percentiles and population standard deviation.
    static UQResult summarize(const std::vector<double>& values);

private:
    Matchup matchup_{};
    UQRanges ranges_{};
};

} // namespace ringsim
