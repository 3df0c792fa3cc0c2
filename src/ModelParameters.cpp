#include "ModelParameters.h"

#include "Digest.h"

#include <cmath>
#include <stdexcept>

namespace ringsim {

namespace {

// Single list of (key, field) bindings; used for both const and mutable access.
template <typename Params, typename Fn>
void visitParams(Params& p, Fn&& fn) {
    fn("scoring.clear_round_margin", p.scoring.clear_round_margin);
    fn("scoring.moderate_round_margin", p.scoring.moderate_round_margin);
    fn("scoring.wrong_call_chance", p.scoring.wrong_call_chance);
    fn("scoring.close_even_chance", p.scoring.close_even_chance);
    fn("scoring.close_lean_margin", p.scoring.close_lean_margin);
    fn("scoring.score_floor", p.scoring.score_floor);
    fn("scoring.clean_weight", p.scoring.clean_weight);
    fn("scoring.power_weight", p.scoring.power_weight);
    fn("scoring.jab_weight", p.scoring.jab_weight);
    fn("scoring.damage_per_10_weight", p.scoring.damage_per_10_weight);
    fn("scoring.significant_weight", p.scoring.significant_weight);
    fn("scoring.significant_damage", p.scoring.significant_damage);
    fn("scoring.forward_time_weight", p.scoring.forward_time_weight);
    fn("scoring.outland_bonus", p.scoring.outland_bonus);
    fn("scoring.outdamage_bonus", p.scoring.outdamage_bonus);
    fn("scoring.aggression_damage_divisor", p.scoring.aggression_damage_divisor);
    fn("scoring.center_weight", p.scoring.center_weight);
    fn("scoring.opponent_ropes_weight", p.scoring.opponent_ropes_weight);
    fn("scoring.opponent_corner_weight", p.scoring.opponent_corner_weight);
    fn("scoring.backward_penalty_winning", p.scoring.backward_penalty_winning);
    fn("scoring.backward_penalty_losing", p.scoring.backward_penalty_losing);
    fn("scoring.own_ropes_penalty", p.scoring.own_ropes_penalty);
    fn("scoring.own_corner_penalty", p.scoring.own_corner_penalty);
    fn("scoring.blocked_weight", p.scoring.blocked_weight);
    fn("scoring.evaded_weight", p.scoring.evaded_weight);
    fn("scoring.received_divisor", p.scoring.received_divisor);
    fn("scoring.clean_total_scale", p.scoring.clean_total_scale);
    fn("scoring.power_total_scale", p.scoring.power_total_scale);
    fn("scoring.volume_total_scale", p.scoring.volume_total_scale);
    fn("scoring.defense_total_scale", p.scoring.defense_total_scale);

    fn("recovery.check_from_count", p.recovery.check_from_count);
    fn("recovery.mandatory_count", p.recovery.mandatory_count);
    fn("recovery.heart_weight", p.recovery.heart_weight);
    fn("recovery.base_weight", p.recovery.base_weight);
    fn("recovery.count_low_factor", p.recovery.count_low_factor);
    fn("recovery.count_seven_factor", p.recovery.count_seven_factor);
    fn("recovery.count_eight_factor", p.recovery.count_eight_factor);
    fn("recovery.count_nine_factor", p.recovery.count_nine_factor);
    fn("recovery.prior_knockdown_decay", p.recovery.prior_knockdown_decay);
    fn("recovery.min_chance", p.recovery.min_chance);
    fn("recovery.max_chance", p.recovery.max_chance);
    fn("recovery.flash_prior_two_factor", p.recovery.flash_prior_two_factor);
    fn("recovery.flash_prior_one_factor", p.recovery.flash_prior_one_factor);

    fn("knockout.power_floor", p.knockout.power_floor);
    fn("knockout.power_divisor", p.knockout.power_divisor);
    fn("knockout.chin_divisor", p.knockout.chin_divisor);
    fn("knockout.heart_divisor", p.knockout.heart_divisor);
    fn("knockout.huge_shot_damage", p.knockout.huge_shot_damage);
    fn("knockout.big_shot_damage", p.knockout.big_shot_damage);
    fn("knockout.cap", p.knockout.cap);

    fn("stoppage.gate_threshold", p.stoppage.gate_threshold);
    fn("stoppage.gate_multiplier", p.stoppage.gate_multiplier);
    fn("stoppage.finisher_power_weight", p.stoppage.finisher_power_weight);
    fn("stoppage.finisher_killer_weight", p.stoppage.finisher_killer_weight);
    fn("stoppage.finisher_base_scale", p.stoppage.finisher_base_scale);
    fn("stoppage.finisher_threshold", p.stoppage.finisher_threshold);
    fn("stoppage.finisher_steep_scale", p.stoppage.finisher_steep_scale);
}

} // namespace

double ModelParameters::get(const std::string& key) const {
    const double* found = nullptr;
    visitParams(*this, [&](const char* k, const double& v) {
        if (key == k) found = &v;
    });
    if (!found) {
        throw std::invalid_argument("unknown model parameter: '" + key + "'");
    }
    return *found;
}

void ModelParameters::set(const std::string& key, double value) {
    if (!std::isfinite(value)) {
        throw std::invalid_argument("model parameter '" + key + "' must be finite");
    }
    double* found = nullptr;
    visitParams(*this, [&](const char* k, double& v) {
        if (key == k) found = &v;
    });
    if (!found) {
        throw std::invalid_argument("unknown model parameter: '" + key + "'");
    }
    *found = value;
}

bool ModelParameters::has(const std::string& key) const {
    bool found = false;
    visitParams(*this, [&](const char* k, const double&) {
        if (key == k) found = true;
    });
    return found;
}

std::vector<std::string> ModelParameters::keys() const {
    std::vector<std::string> out;
    visitParams(*this, [&](const char* k, const double&) { out.emplace_back(k); });
    return out;
}

std::uint32_t ModelParameters::paramHashU32() const {
    std::uint32_t h = digest::fnv1a32_begin();
    visitParams(*this, [&](const char*, const double& v) { h = digest::fnv1a32_add_f64(h, v); });
    return h;
}

} // namespace ringsim
