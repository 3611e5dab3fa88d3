/*
 * Turnaround.h
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


#ifndef TURNAROUND_H
#define TURNAROUND_H

#include "Business.h"
#include "GameConfig.h"
#include <string>
#include <vector>

enum class TurnaroundStatus { Active, Completed, Partial, Failed };
enum class TurnaroundResult { Success, Partial, Failure };

const char* to_string(TurnaroundStatus status);
const char* to_string(TurnaroundResult result);

/**
 * @brief Capability level that unlocks turnaround programs. Tiers run 1..3;
 * tier 0 is no capability.
 */
struct TurnaroundTierConfig {
    int tier{0};
    std::string name;
    double unlock_cost{0.0};
    double annual_cost{0.0};
    int required_opcos{0};
    std::string description;
};

/**
 * @brief A structured program lifting one business from a source quality to a
 * target quality. The three outcome rates sum to one.
 */
struct TurnaroundProgram {
    std::string id;
    int tier{1};
    int source_quality{1};
    int target_quality{2};
    int duration_standard{4};
    int duration_quick{2};
    double success_rate{0.0};
    double partial_rate{0.0};
    double failure_rate{0.0};
    double ebitda_boost_on_success{0.0};
    double ebitda_boost_on_partial{0.0};
    double ebitda_damage_on_failure{0.0};
    double upfront_cost_fraction{0.0};    // of the business's EBITDA
    double annual_cost{0.0};
};

struct ActiveTurnaround {
    std::string id;
    std::string business_id;
    std::string program_id;
    int start_round{0};
    int end_round{0};
    TurnaroundStatus status{TurnaroundStatus::Active};

    std::string to_json() const;
};

struct TurnaroundOutcome {
    TurnaroundResult result{TurnaroundResult::Failure};
    int quality_change{0};
    double ebitda_multiplier{1.0};
    int target_quality{1};
};

/**
 * The seven programs in tier order.
 */
const std::vector<TurnaroundProgram>& turnaround_programs();

/**
 * Config of tier 1..3. Throws std::out_of_range for any other tier.
 */
const TurnaroundTierConfig& turnaround_tier_config(int tier);

const TurnaroundProgram* find_turnaround_program(const std::string& id);

/**
 * Highest quality a business in the sector can reach: 3 for agencies and
 * restaurants, 4 for SaaS and industrial, 5 elsewhere.
 */
int get_quality_ceiling(const std::string& sector_id);

/**
 * Programs the business can start at the given tier: its quality matches the
 * program source, the target is within the sector ceiling and it has no
 * active program already.
 */
std::vector<TurnaroundProgram> get_eligible_programs(const Business& business, int turnaround_tier,
    const std::vector<ActiveTurnaround>& active);

/**
 * Upfront cost, a fraction of the absolute EBITDA, rounded.
 */
double calculate_turnaround_cost(const TurnaroundProgram& program, const Business& business);

int get_turnaround_duration(const TurnaroundProgram& program, Duration duration);

/**
 * True when the next tier exists and the holdco has the cash and the opcos
 * for it. reason, when given, receives the refusal.
 */
bool can_unlock_turnaround_tier(int current_tier, double cash, int active_opcos, std::string* reason = nullptr);

/**
 * Resolves a program against a roll in [0, 1).
 *
 * Simulation rules:
 * - With TURNAROUND_FATIGUE_THRESHOLD or more programs running, success loses
 *   TURNAROUND_FATIGUE_PENALTY and partial gains it, bounded by the failure rate.
 * - Success lands on the target quality, partial moves up one tier, failure
 *   keeps the quality and damages EBITDA.
 */
TurnaroundOutcome resolve_turnaround(const TurnaroundProgram& program, int active_count, double roll);

/**
 * Chance an operational improvement lifts quality one tier.
 */
double get_quality_improvement_chance(int turnaround_tier);

/**
 * Exit multiple premium for businesses lifted TURNAROUND_EXIT_PREMIUM_MIN_TIERS
 * or more quality tiers.
 */
double get_turnaround_exit_premium(const Business& business);

double get_turnaround_tier_annual_cost(int turnaround_tier);

/**
 * Annual cost of the programs still running.
 */
double get_turnaround_program_costs(const std::vector<ActiveTurnaround>& turnarounds);

#endif // TURNAROUND_H
