#include "Events.h"
#include "RealTimeDriver.h"
#include "ReferenceCollaborators.h"
#include "SimulationLoop.h"
#include "../ring/ring_geometry.h"

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

void printUsage() {
    std::cout << "FightRunner usage:\n"
              << "  FightRunner [--a archetype] [--b archetype] [--seed s] [--rounds n]\n"
              << "              [--referee default|strict|lenient|protective] [--three-knockdown]\n"
              << "              [--param key=value]... [--realtime] [--speed x] [--verbose] [--quiet]\n"
              << "  archetypes: boxer, slugger, swarmer, counterpuncher, journeyman, elite\n";
}

std::string displayName(const std::string& archetype, const char* corner) {
    std::string n = archetype;
    if (!n.empty()) n[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(n[0])));
    return n + " " + corner;
}

void printResult(const ringsim::Fight& fight, const ringsim::SimulationLoop& loop) {
    const ringsim::FightResult& r = fight.result();
    std::cout << "\n=== RESULT ===\n";
    if (r.hasWinner) {
        std::cout << "Winner: " << fight.fighter(r.winner).name() << "\n";
    } else {
        std::cout << "No winner\n";
    }
    std::cout << "Method: " << ringsim::toString(r.method) << "\n";
    std::cout << "Round: " << r.round << "  Time: " << std::fixed << std::setprecision(1) << r.time_s << " s\n";
    if (!r.finish.reason.empty()) {
        std::cout << "Reason: " << r.finish.reason << "\n";
    }
    for (const auto& card : fight.getCurrentScores()) {
        std::cout << "  " << card.judge << ": " << card.a << "-" << card.b << "\n";
    }

    const ringsim::CompuboxStats stats = fight.getCompuboxStats();
    std::cout << "\nPunch stats (landed/thrown):\n";
    for (ringsim::Side s : {ringsim::Side::A, ringsim::Side::B}) {
        const int i = ringsim::sideIndex(s);
        std::cout << "  " << std::left << std::setw(22) << fight.fighter(s).name()
                  << " total " << stats.total[i].landed << "/" << stats.total[i].thrown
                  << "  jabs " << stats.jabs[i].landed << "/" << stats.jabs[i].thrown
                  << "  power " << stats.power[i].landed << "/" << stats.power[i].thrown
                  << "  (" << std::setprecision(1) << stats.accuracyPct[i] << "%)"
                  << "  KD " << stats.knockdownsScored[i] << "\n";
    }

    const ringsim::RunSignatures sig = loop.signatures();
    std::cout << "\nSignatures: params=0x" << std::hex << sig.run_param_hash_u32
              << " events=0x" << sig.event_crc_u32
              << " state=0x" << sig.state_digest_u32 << std::dec << "\n";
}
} // namespace

int main(int argc, char** argv) {
    try {
        std::string archA = "boxer";
        std::string archB = "slugger";
        std::string referee = "default";
        std::uint32_t seed = 0x5EEDu;
        bool realtime = false;
        double speed = 1.0;
        bool verbose = false;
        bool quiet = false;

        ringsim::FightConfig config;
        ringsim::ModelParameters params;

        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            if (arg == "--a" && i + 1 < argc) {
                archA = toLower(argv[++i]);
            } else if (arg == "--b" && i + 1 < argc) {
                archB = toLower(argv[++i]);
            } else if (arg == "--seed" && i + 1 < argc) {
                seed = static_cast<std::uint32_t>(std::stoul(argv[++i]));
            } else if (arg == "--rounds" && i + 1 < argc) {
                config.rounds = std::stoi(argv[++i]);
            } else if (arg == "--referee" && i + 1 < argc) {
                referee = toLower(argv[++i]);
            } else if (arg == "--three-knockdown") {
                config.threeKnockdownRule = true;
            } else if (arg == "--param" && i + 1 < argc) {
                const std::string kv = argv[++i];
                const std::size_t eq = kv.find('=');
                if (eq == std::string::npos) {
                    std::cerr << "[ringsim] error: --param expects key=value, got " << kv << "\n";
                    return 1;
                }
                params.set(kv.substr(0, eq), std::stod(kv.substr(eq + 1)));
            } else if (arg == "--realtime") {
                realtime = true;
            } else if (arg == "--speed" && i + 1 < argc) {
                speed = std::stod(argv[++i]);
            } else if (arg == "--verbose") {
                verbose = true;
            } else if (arg == "--quiet") {
                quiet = true;
            } else if (arg == "--help" || arg == "-h") {
                printUsage();
                return 0;
            } else {
                std::cout << "Unknown argument: " << arg << "\n";
                printUsage();
                return 1;
            }
        }

        ringsim::Fighter a(ringsim::FighterProfile::preset(archA, displayName(archA, "(red)")));
        ringsim::Fighter b(ringsim::FighterProfile::preset(archB, displayName(archB, "(blue)")));
        ringsim::Fight fight(a, b, config, ringsim::RefereeProfile::preset(referee), {}, params);

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
        opts.tickRate_s = config.tickRate_s;
        opts.seed = seed;

        ringsim::SimulationLoop loop(fight, parts, opts);

        ringsim::StreamEventLogger logger(std::cout, verbose);
        logger.setNames(a.name(), b.name());
        if (!quiet) loop.addSink(&logger);

        std::cout << "=== " << a.name() << " vs " << b.name() << " ===\n";
        std::cout << config.rounds << " x " << std::fixed << std::setprecision(0) << config.roundDuration_s
                  << " s rounds, seed " << seed << (realtime ? ", real time\n" : ", batch\n");

        if (realtime) {
            ringsim::SteadyClockDelay delay;
            ringsim::DriverOptions dopts;
            dopts.realtime = true;
            dopts.speedMultiplier = speed;
            ringsim::RealTimeDriver driver(loop, delay, dopts);
            driver.run();
        } else {
            loop.runToCompletion();
        }

        printResult(fight, loop);
    } catch (const std::exception& e) {
        std::cerr << "[ringsim] error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
