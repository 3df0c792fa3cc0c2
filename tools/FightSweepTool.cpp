#include "FightSensitivity.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <exception>
#include <iomanip>
#include <iostream>
#include <string>

namespace {
std::string toLower(std::string v) {
    std::transform(v.begin(), v.end(), v.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return v;
}

std::string canonicalAttribute(const std::string& param) {
    if (param == "heart") return "heart";
    if (param == "chin") return "chin";
    if (param == "knockout_power" || param == "ko_power" || param == "power") return "knockout_power";
    if (param == "cardio") return "cardio";
    if (param == "hand_speed" || param == "speed") return "hand_speed";
    return std::string();
}

void printUsage() {
    std::cout << "FightSweepTool usage:\n"
              << "  FightSweepTool --param <heart|chin|knockout_power|cardio|hand_speed>\n"
              << "                 [--min v] [--max v] [--samples n] [--fights n] [--seed s]\n"
              << "                 [--a archetype] [--b archetype] [--rounds n] [--out file]\n";
}
} // namespace

int main(int argc, char** argv) {
    try {
        std::string param;
        double min_val = 0.0;
        double max_val = 0.0;
        int samples = 5;
        std::string out = "fight_sensitivity.csv";
        bool min_set = false;
        bool max_set = false;

        ringsim::FightSensitivity::Matchup matchup;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--param" && i + 1 < argc) {
                param = toLower(argv[++i]);
            } else if (arg == "--min" && i + 1 < argc) {
                min_val = std::stod(argv[++i]);
                min_set = true;
            } else if (arg == "--max" && i + 1 < argc) {
                max_val = std::stod(argv[++i]);
                max_set = true;
            } else if (arg == "--samples" && i + 1 < argc) {
                samples = std::stoi(argv[++i]);
            } else if (arg == "--fights" && i + 1 < argc) {
                matchup.fightsPerPoint = std::stoi(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                matchup.baseSeed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--a" && i + 1 < argc) {
                matchup.archetypeA = toLower(argv[++i]);
            } else if (arg == "--b" && i + 1 < argc) {
                matchup.archetypeB = toLower(argv[++i]);
            } else if (arg == "--rounds" && i + 1 < argc) {
                matchup.bout.fight.rounds = std::stoi(argv[++i]);
            } else if (arg == "--out" && i + 1 < argc) {
                out = argv[++i];
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }

        const std::string attribute = canonicalAttribute(param);
        if (attribute.empty()) {
            if (!param.empty()) std::cout << "Unsupported parameter: " << param << "\n";
            printUsage();
            return 1;
        }
        matchup.bout.fight.validate();

        ringsim::FightSensitivity analyzer;
        analyzer.setMatchup(matchup);

        ringsim::FightSensitivity::ParameterRange range;
        range.samples = samples;
        range.nominal = ringsim::getProfileAttribute(
            ringsim::FighterProfile::preset(matchup.archetypeA, "Fighter A"), attribute);
        range.min = min_set ? min_val : std::max(1.0, range.nominal * 0.75);
        range.max = max_set ? max_val : std::min(100.0, range.nominal * 1.25);

        analyzer.analyzeAttribute(attribute, range);

        std::cout << std::left << std::setw(12) << attribute << " | KO/TKO | Win A | Rounds\n";
        for (const auto& row : analyzer.results()) {
            std::cout << std::left << std::setw(12) << std::fixed << std::setprecision(2) << row.parameter_value
                      << " | " << std::setprecision(3) << row.metrics.stoppageRate
                      << "  | " << row.metrics.winRateA
                      << " | " << std::setprecision(2) << row.metrics.meanRounds << "\n";
        }

        if (!analyzer.exportSensitivityMatrixCSV(out)) {
            std::cerr << "[ringsim] error: cannot write " << out << "\n";
            return 1;
        }
        std::cout << "Wrote sensitivity sweep to: " << out << "\n";
    } catch (const std::exception& e) {
        std::cerr << "[ringsim] error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
