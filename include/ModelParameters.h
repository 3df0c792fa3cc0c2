#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ringsim {

// ============================================================
// Named parameter table for the scoring, knockdown and stoppage formulas.
//
// Design intent:
// - Formulas read their constants from here instead of literals, so a sweep
//   or a test can change one value without touching code.
// - Every value is reachable by a dotted key ("recovery.count_nine_factor")
//   and participates in the run parameter hash.
// - Fighter-internal tuning (fatigue tiers, buzz durations) stays next to the
//   code that uses it; this table is the cross-module surface.
// ============================================================

struct ScoringParams {
    // Round bands on |totalA - totalB|.
    double clear_round_margin = 12.0;
    double moderate_round_margin = 4.0;
    double wrong_call_chance = 0.4;
    double close_even_chance = 0.30;
    double close_lean_margin = 1.0;
    double score_floor = 7.0;

    // Clean effective punching.
    double clean_weight = 0.8;
    double power_weight = 1.5;
    double jab_weight = 0.2;
    double damage_per_10_weight = 6.0;
    double significant_weight = 3.0;
    double significant_damage = 15.0;

    // Effective aggression.
    double forward_time_weight = 0.03;
    double outland_bonus = 2.0;
    double outdamage_bonus = 18.0;
    double aggression_damage_divisor = 15.0;

    // Ring generalship.
    double center_weight = 0.2;
    double opponent_ropes_weight = 0.25;
    double opponent_corner_weight = 0.4;
    double backward_penalty_winning = 0.02;
    double backward_penalty_losing = 0.08;
    double own_ropes_penalty = 0.12;
    double own_corner_penalty = 0.2;

    // Defense.
    double blocked_weight = 1.0;
    double evaded_weight = 2.0;
    double received_divisor = 20.0;

    // Criterion multipliers applied on top of the judge profile.
    double clean_total_scale = 1.2;
    double power_total_scale = 2.0;
    double volume_total_scale = 0.25;
    double defense_total_scale = 0.8;
};

struct RecoveryParams {
    double check_from_count = 4.0;
    double mandatory_count = 8.0;
    double heart_weight = 0.7;
    double base_weight = 0.3;
    double count_low_factor = 1.2;   // count <= 4
    double count_seven_factor = 0.9;
    double count_eight_factor = 0.75;
    double count_nine_factor = 0.5;  // count >= 9
    double prior_knockdown_decay = 0.85;
    double min_chance = 0.15;
    double max_chance = 0.92;

    // Flash knockdown pre-resolution.
    double flash_prior_two_factor = 0.5;
    double flash_prior_one_factor = 0.75;
};

struct KnockoutParams {
    double power_floor = 60.0;
    double power_divisor = 200.0;
    double chin_divisor = 150.0;
    double heart_divisor = 300.0;
    double huge_shot_damage = 8.0;
    double big_shot_damage = 6.0;
    double cap = 0.35;
};

struct StoppageParams {
    double gate_threshold = 0.5;
    double gate_multiplier = 0.15;

    double finisher_power_weight = 0.6;
    double finisher_killer_weight = 0.4;
    double finisher_base_scale = 0.2;
    double finisher_threshold = 85.0;
    double finisher_steep_scale = 0.004;
};

class ModelParameters {
public:
    ScoringParams scoring{};
    RecoveryParams recovery{};
    KnockoutParams knockout{};
    StoppageParams stoppage{};

    // Throws std::invalid_argument for an unknown key or a non-finite value.
    double get(const std::string& key) const;
    void set(const std::string& key, double value);
    bool has(const std::string& key) const;

    std::vector<std::string> keys() const;

    // FNV-1a32 over every value in key order.
    std::uint32_t paramHashU32() const;
};

} // namespace ringsim
