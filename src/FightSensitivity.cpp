#include "FightSensitivity.h"

#include <fstream>
#include <iomanip>

namespace ringsim {

FightSensitivity::FightSensitivity() = default;

void FightSensitivity::setMatchup(const Matchup& matchup) {
    matchup_ = matchup;
}

void FightSensitivity::clearResults() {
    results_.clear();
}

std::vector<double> FightSensitivity::sampleValues(const ParameterRange& range) const {
    std::vector<double> values;
    if (range.samples <= 1 || range.max <= range.min) {
        values.push_back(range.nominal);
        return values;
    }

    values.reserve(static_cast<std::size_t>(range.samples));
    const double span = range.max - range.min;
    const int steps = range.samples - 1;
    for (int i = 0; i < range.samples; ++i) {
        const double t = static_cast<double>(i) / static_cast<double>(steps);
        values.push_back(range.min + span * t);
    }
    return values;
}

FightSensitivity::PointResult FightSensitivity::runPoint(const FighterProfile& a, const FighterProfile& b) const {
    PointResult m{};
    const int n = matchup_.fightsPerPoint < 1 ? 1 : matchup_.fightsPerPoint;

    int stoppages = 0;
    int winsA = 0;
    double rounds = 0.0;
    for (int i = 0; i < n; ++i) {
        // Seeds are shared across points so only the attribute varies.
        const BoutOutcome o = runBout(a, b, matchup_.bout, matchup_.baseSeed + static_cast<std::uint32_t>(i));
        if (o.isKoOrTko()) ++stoppages;
        if (o.hasWinner && o.winner == Side::A) ++winsA;
        rounds += o.roundsCompleted;
    }

    m.fights = n;
    m.stoppageRate = static_cast<double>(stoppages) / n;
    m.winRateA = static_cast<double>(winsA) / n;
    m.meanRounds = rounds / n;
    return m;
}

void FightSensitivity::analyzeAttribute(const std::string& attribute, const ParameterRange& range) {
    clearResults();

    FighterProfile a = FighterProfile::preset(matchup_.archetypeA, "Fighter A");
    const FighterProfile b = FighterProfile::preset(matchup_.archetypeB, "Fighter B");
    // Fail on an unknown name before running anything.
    (void)getProfileAttribute(a, attribute);

    for (double value : sampleValues(range)) {
        setProfileAttribute(a, attribute, value);
        results_.push_back({attribute, value, runPoint(a, b)});
    }
}

bool FightSensitivity::exportSensitivityMatrixCSV(const std::string& filename) const {
    std::ofstream out(filename);
    if (!out.is_open()) {
        return false;
    }

    out << "parameter,value,ko_tko_rate,win_rate_a,mean_rounds,fights\n";
    out << std::fixed << std::setprecision(6);
    for (const auto& row : results_) {
        out << row.parameter_name << ','
            << row.parameter_value << ','
            << row.metrics.stoppageRate << ','
            << row.metrics.winRateA << ','
            << row.metrics.meanRounds << ','
            << row.metrics.fights << '\n';
    }
    return true;
}

const std::vector<FightSensitivity::SensitivityRow>& FightSensitivity::results() const {
    return results_;
}

} // namespace ringsim
