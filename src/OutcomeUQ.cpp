#include "OutcomeUQ.h"

#include <algorithm>
#include <cmath>
#include <numeric>
#include <random>

namespace ringsim {

namespace {
std::vector<double> latinHypercubeSamples(double min_val, double max_val, int samples, std::mt19937& rng) {
    std::vector<double> bins;
    bins.reserve(static_cast<std::size_t>(samples));

    std::uniform_real_distribution<double> unit_dist(0.0, 1.0);
    for (int i = 0; i < samples; ++i) {
        const double u = (static_cast<double>(i) + unit_dist(rng)) / static_cast<double>(samples);
        bins.push_back(u);
    }
    std::shuffle(bins.begin(), bins.end(), rng);

    const double span = max_val - min_val;
    for (double& v : bins) {
        v = min_val + span * v;
    }
    return bins;
}

int clampSamples(int samples) {
    return samples < 1 ? 1 : samples;
}
} // namespace

OutcomeUQ::OutcomeUQ() = default;

void OutcomeUQ::setMatchup(const Matchup& matchup) {
    matchup_ = matchup;
}

void OutcomeUQ::setRanges(const UQRanges& ranges) {
    ranges_ = ranges;
}

OutcomeUQ::UQResult OutcomeUQ::summarize(const std::vector<double>& values) {
    UQResult result{};
    if (values.empty()) {
        return result;
    }

    const double mean = std::accumulate(values.begin(), values.end(), 0.0) / values.size();
    double variance = 0.0;
    for (double v : values) {
        const double d = v - mean;
        variance += d * d;
    }
    variance /= static_cast<double>(values.size());

    std::vector<double> sorted = values;
    std::sort(sorted.begin(), sorted.end());

    auto percentile = [&](double p) {
        if (sorted.size() == 1) return sorted.front();
        const double pos = p * (sorted.size() - 1);
        const std::size_t idx = static_cast<std::size_t>(pos);
        const double frac = pos - static_cast<double>(idx);
        if (idx + 1 >= sorted.size()) return sorted.back();
        return sorted[idx] * (1.0 - frac) + sorted[idx + 1] * frac;
    };

    result.mean = mean;
    result.median = percentile(0.5);
    result.ci_lower_95 = percentile(0.025);
    result.ci_upper_95 = percentile(0.975);
    result.std_dev = std::sqrt(variance);
    return result;
}

OutcomeUQ::UQSummary OutcomeUQ::runMonteCarlo(const Matchup& matchup, int num_samples) const {
    const int samples = clampSamples(num_samples);
    std::mt19937 rng(1337u);

    auto heart_samples = latinHypercubeSamples(ranges_.heart.min, ranges_.heart.max, samples, rng);
    auto chin_samples = latinHypercubeSamples(ranges_.chin.min, ranges_.chin.max, samples, rng);
    auto power_samples = latinHypercubeSamples(ranges_.knockout_power.min,
                                               ranges_.knockout_power.max,
                                               samples,
                                               rng);
    auto cardio_samples = latinHypercubeSamples(ranges_.cardio.min, ranges_.cardio.max, samples, rng);

    const FighterProfile base = FighterProfile::preset(matchup.archetypeA, "Fighter A");
    const FighterProfile b = FighterProfile::preset(matchup.archetypeB, "Fighter B");

    std::vector<double> rounds;
    std::vector<double> damage;
    std::vector<double> wins;
    rounds.reserve(static_cast<std::size_t>(samples));
    damage.reserve(static_cast<std::size_t>(samples));
    wins.reserve(static_cast<std::size_t>(samples));

    for (int i = 0; i < samples; ++i) {
        FighterProfile a = base;
        a.mental.heart = heart_samples[i];
        a.mental.chin = chin_samples[i];
        a.power.knockoutPower = power_samples[i];
        a.stamina.cardio = cardio_samples[i];

        const BoutOutcome o = runBout(a, b, matchup.bout, 1337u + static_cast<std::uint32_t>(i));
        rounds.push_back(o.roundsCompleted);
        damage.push_back(o.totalDamage);
        wins.push_back((o.hasWinner && o.winner == Side::A) ? 1.0 : 0.0);
    }

    UQSummary summary{};
    summary.rounds_completed = summarize(rounds);
    summary.total_damage = summarize(damage);
    summary.win_a = summarize(wins);
    summary.samples = samples;
    return summary;
}

OutcomeUQ::UQSummary OutcomeUQ::runMonteCarlo(int num_samples) const {
    return runMonteCarlo(matchup_, num_samples);
}

} // namespace ringsim
