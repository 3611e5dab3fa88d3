/*
 * Turnaround.cpp
 *
 * Author: Jose Deodoro <deodoro.filho@gmail.com> <jdeoliv@gmu.edu>
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program. If not, see <https://www.gnu.org/licenses/>.
 */



#include "Turnaround.h"
#include "Constants.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

static const TurnaroundTierConfig TURNAROUND_TIERS[] = {
    {1, "Portfolio Operations", 600, 250, 2, "Dedicated ops team running structured turnaround playbooks"},
    {2, "Transformation Office", 1000, 450, 3, "Cross-functional transformation team"},
    {3, "Interim Management", 1400, 700, 4, "Interim executives placed into struggling businesses"},
};

// id, tier, source, target, standard, quick, success, partial, failure,
// boost on success, boost on partial, damage on failure, upfront fraction, annual cost
static const std::vector<TurnaroundProgram> TURNAROUND_PROGRAMS = {
    {"t1_plan_a", 1, 1, 2, 4, 2, 0.65, 0.30, 0.05, 0.07, 0.03, 0.04, 0.10, 50},
    {"t1_plan_b", 1, 2, 3, 4, 2, 0.60, 0.35, 0.05, 0.05, 0.02, 0.03, 0.12, 75},
    {"t2_plan_a", 2, 1, 3, 5, 3, 0.68, 0.27, 0.05, 0.11, 0.05, 0.05, 0.14, 100},
    {"t2_plan_b", 2, 2, 4, 5, 3, 0.65, 0.30, 0.05, 0.09, 0.04, 0.04, 0.16, 125},
    {"t3_plan_a", 3, 1, 4, 6, 3, 0.73, 0.22, 0.05, 0.15, 0.07, 0.06, 0.18, 150},
    {"t3_plan_b", 3, 2, 5, 6, 3, 0.70, 0.25, 0.05, 0.13, 0.06, 0.06, 0.20, 200},
    // Faster variant of t3_plan_a: 10 points less success at 1.5x the upfront cost
    {"t3_quick", 3, 1, 4, 3, 2, 0.63, 0.32, 0.05, 0.15, 0.07, 0.06, 0.27, 150},
};

const char* to_string(TurnaroundStatus status) {
    switch (status) {
    case TurnaroundStatus::Active: return "active";
    case TurnaroundStatus::Completed: return "completed";
    case TurnaroundStatus::Partial: return "partial";
    case TurnaroundStatus::Failed: return "failed";
    }
    return "active";
}

const char* to_string(TurnaroundResult result) {
    switch (result) {
    case TurnaroundResult::Success: return "success";
    case TurnaroundResult::Partial: return "partial";
    case TurnaroundResult::Failure: return "failure";
    }
    return "failure";
}

const std::vector<TurnaroundProgram>& turnaround_programs() {
    return TURNAROUND_PROGRAMS;
}

const TurnaroundTierConfig& turnaround_tier_config(int tier) {
    if (tier < 1 || tier > 3) throw std::out_of_range("no turnaround tier " + std::to_string(tier));
    return TURNAROUND_TIERS[tier - 1];
}

const TurnaroundProgram* find_turnaround_program(const std::string& id) {
    for (const TurnaroundProgram& p : TURNAROUND_PROGRAMS) {
        if (p.id == id) return &p;
    }
    return nullptr;
}

int get_quality_ceiling(const std::string& sector_id) {
    if (sector_id == "agency" || sector_id == "restaurant") return 3;
    if (sector_id == "saas" || sector_id == "industrial") return 4;
    return 5;
}

std::vector<TurnaroundProgram> get_eligible_programs(const Business& business, int turnaround_tier,
    const std::vector<ActiveTurnaround>& active) {
    std::vector<TurnaroundProgram> eligible;
    if (turnaround_tier <= 0) return eligible;
    for (const ActiveTurnaround& t : active) {
        if (t.business_id == business.id && t.status == TurnaroundStatus::Active) return eligible;
    }

    int ceiling = get_quality_ceiling(business.sector_id);
    for (const TurnaroundProgram& p : TURNAROUND_PROGRAMS) {
        if (p.tier > turnaround_tier) continue;
        if (p.source_quality == business.quality && p.target_quality <= ceiling) eligible.push_back(p);
    }
    return eligible;
}

double calculate_turnaround_cost(const TurnaroundProgram& program, const Business& business) {
    return round_half_up(std::fabs(business.ebitda) * program.upfront_cost_fraction);
}

int get_turnaround_duration(const TurnaroundProgram& program, Duration duration) {
    return duration == Duration::Quick ? program.duration_quick : program.duration_standard;
}

bool can_unlock_turnaround_tier(int current_tier, double cash, int active_opcos, std::string* reason) {
    if (current_tier >= 3) {
        if (reason) *reason = "already at maximum tier";
        return false;
    }
    const TurnaroundTierConfig& next = turnaround_tier_config(current_tier + 1);
    if (active_opcos < next.required_opcos) {
        if (reason) *reason = "need " + std::to_string(next.required_opcos) + " active businesses";
        return false;
    }
    if (cash < next.unlock_cost) {
        if (reason) *reason = "need " + format_money(next.unlock_cost) + " cash";
        return false;
    }
    return true;
}

TurnaroundOutcome resolve_turnaround(const TurnaroundProgram& program, int active_count, double roll) {
    double success_rate = program.success_rate;
    double partial_rate = program.partial_rate;
    if (active_count >= TURNAROUND_FATIGUE_THRESHOLD) {
        success_rate = std::max(0.0, success_rate - TURNAROUND_FATIGUE_PENALTY);
        partial_rate = std::min(1.0 - success_rate - program.failure_rate, partial_rate + TURNAROUND_FATIGUE_PENALTY);
    }

    TurnaroundOutcome outcome;
    if (roll < success_rate) {
        outcome.result = TurnaroundResult::Success;
        outcome.target_quality = program.target_quality;
        outcome.ebitda_multiplier = 1.0 + program.ebitda_boost_on_success;
    } else if (roll < success_rate + partial_rate) {
        outcome.result = TurnaroundResult::Partial;
        outcome.target_quality = std::min(program.target_quality, program.source_quality + 1);
        outcome.ebitda_multiplier = 1.0 + program.ebitda_boost_on_partial;
    } else {
        outcome.result = TurnaroundResult::Failure;
        outcome.target_quality = program.source_quality;
        outcome.ebitda_multiplier = 1.0 - program.ebitda_damage_on_failure;
    }
    outcome.quality_change = outcome.target_quality - program.source_quality;
    return outcome;
}

double get_quality_improvement_chance(int turnaround_tier) {
    return QUALITY_IMPROVEMENT_CHANCE + QUALITY_IMPROVEMENT_TIER_BONUS[std::min(3, std::max(0, turnaround_tier))];
}

double get_turnaround_exit_premium(const Business& business) {
    return business.quality_improved_tiers >= TURNAROUND_EXIT_PREMIUM_MIN_TIERS ? TURNAROUND_EXIT_PREMIUM : 0.0;
}

double get_turnaround_tier_annual_cost(int turnaround_tier) {
    if (turnaround_tier <= 0) return 0.0;
    return turnaround_tier_config(std::min(3, turnaround_tier)).annual_cost;
}

double get_turnaround_program_costs(const std::vector<ActiveTurnaround>& turnarounds) {
    double cost = 0.0;
    for (const ActiveTurnaround& t : turnarounds) {
        if (t.status != TurnaroundStatus::Active) continue;
        if (const TurnaroundProgram* p = find_turnaround_program(t.program_id)) cost += p->annual_cost;
    }
    return cost;
}

std::string ActiveTurnaround::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"id\":\"" << id << "\",";
    oss << "\"businessId\":\"" << business_id << "\",";
    oss << "\"programId\":\"" << program_id << "\",";
    oss << "\"startRound\":" << start_round << ",";
    oss << "\"endRound\":" << end_round << ",";
    oss << "\"status\":\"" << ::to_string(status) << "\"";
    oss << "}";
    return oss.str();
}
