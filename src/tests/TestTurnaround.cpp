/*
 * TestTurnaround.cpp
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


// Turnaround programs, tiers and their place in the round.

#include "Constants.h"
#include "Finance.h"
#include "Game.h"
#include "Turnaround.h"
#include "Valuation.h"
#include <cmath>
#include <cstdio>
#include <set>

static int failures = 0;

static void check(bool ok, const char* name) {
    std::printf("%-60s %s\n", name, ok ? "ok" : "FAILED");
    if (!ok) ++failures;
}

class GameTestAccess {
public:
    static GameState& state(Game& game) { return game.state; }
};

static Business make_business(const std::string& id, const std::string& sector_id, int quality) {
    Business b;
    b.id = id;
    b.name = id;
    b.sector_id = sector_id;
    b.quality = quality;
    b.ebitda = 1000;
    b.acquisition_ebitda = 1000;
    b.peak_ebitda = 1000;
    b.ebitda_margin = 0.20;
    b.revenue = 5000;
    b.acquisition_round = 1;
    b.acquisition_multiple = 5;
    return b;
}

static std::set<std::string> program_ids(const std::vector<TurnaroundProgram>& programs) {
    std::set<std::string> ids;
    for (const TurnaroundProgram& p : programs) ids.insert(p.id);
    return ids;
}

static void test_program_table() {
    const std::vector<TurnaroundProgram>& programs = turnaround_programs();
    check(programs.size() == 7, "seven programs");
    bool rates = true;
    bool durations = true;
    bool targets = true;
    for (const TurnaroundProgram& p : programs) {
        rates = rates && std::fabs(p.success_rate + p.partial_rate + p.failure_rate - 1.0) < 1e-9;
        durations = durations && p.duration_quick <= p.duration_standard;
        targets = targets && p.target_quality > p.source_quality;
    }
    check(rates, "outcome rates sum to one");
    check(durations, "quick games run shorter programs");
    check(targets, "every program raises quality");
    check(program_ids(programs).size() == programs.size(), "program ids are unique");
    check(find_turnaround_program("t3_quick") && !find_turnaround_program("t4_plan_a"), "lookup by id");
}

static void test_eligibility() {
    Business weak = make_business("biz_1", "healthcare", 1);
    check(get_eligible_programs(weak, 0, {}).empty(), "nothing without a tier");
    check(program_ids(get_eligible_programs(weak, 1, {})) == std::set<std::string>{"t1_plan_a"}, "tier 1 offers Q1 to Q2");
    check(program_ids(get_eligible_programs(weak, 3, {})) ==
        std::set<std::string>{"t1_plan_a", "t2_plan_a", "t3_plan_a", "t3_quick"}, "tier 3 offers everything from Q1");

    // Agencies top out at Q3
    Business agency = make_business("biz_2", "agency", 2);
    check(program_ids(get_eligible_programs(agency, 3, {})) == std::set<std::string>{"t1_plan_b"},
        "sector ceiling caps the target");
    Business top = make_business("biz_3", "agency", 3);
    check(get_eligible_programs(top, 3, {}).empty(), "nothing above the ceiling");

    ActiveTurnaround running;
    running.business_id = "biz_1";
    running.program_id = "t1_plan_a";
    check(get_eligible_programs(weak, 3, {running}).empty(), "one program per business at a time");
    running.status = TurnaroundStatus::Completed;
    check(!get_eligible_programs(weak, 3, {running}).empty(), "finished programs do not block");
}

static void test_costs_and_tiers() {
    const TurnaroundProgram& plan_a = *find_turnaround_program("t1_plan_a");
    Business b = make_business("biz_1", "healthcare", 1);
    check(calculate_turnaround_cost(plan_a, b) == 100, "upfront cost is 10% of EBITDA");
    b.ebitda = -400;
    check(calculate_turnaround_cost(plan_a, b) == 40, "loss makers pay on absolute EBITDA");
    check(get_turnaround_duration(plan_a, Duration::Quick) == 2 &&
        get_turnaround_duration(plan_a, Duration::Standard) == 4, "duration follows the game length");

    std::string reason;
    check(!can_unlock_turnaround_tier(0, 5000, 1, &reason) && !reason.empty(), "tier 1 needs two opcos");
    check(!can_unlock_turnaround_tier(0, 599, 2), "tier 1 costs 600");
    check(can_unlock_turnaround_tier(0, 600, 2), "tier 1 unlocks");
    check(!can_unlock_turnaround_tier(3, 1e6, 10), "no tier above 3");

    check(get_turnaround_tier_annual_cost(0) == 0 && get_turnaround_tier_annual_cost(2) == 450, "tier annual cost");
    ActiveTurnaround active;
    active.program_id = "t2_plan_a";
    ActiveTurnaround done;
    done.program_id = "t3_plan_b";
    done.status = TurnaroundStatus::Failed;
    check(get_turnaround_program_costs({active, done}) == 100, "only running programs cost anything");
}

static void test_resolution() {
    const TurnaroundProgram& plan_a = *find_turnaround_program("t1_plan_a");
    TurnaroundOutcome success = resolve_turnaround(plan_a, 1, 0.10);
    check(success.result == TurnaroundResult::Success && success.target_quality == 2, "low roll succeeds");
    check(std::fabs(success.ebitda_multiplier - 1.07) < 1e-9, "success boosts EBITDA");

    TurnaroundOutcome partial = resolve_turnaround(plan_a, 1, 0.70);
    check(partial.result == TurnaroundResult::Partial && partial.quality_change == 1, "middle roll is partial");

    TurnaroundOutcome failure = resolve_turnaround(plan_a, 1, 0.97);
    check(failure.result == TurnaroundResult::Failure && failure.quality_change == 0, "high roll fails");
    check(std::fabs(failure.ebitda_multiplier - 0.96) < 1e-9, "failure damages EBITDA");

    // Two-step program: partial moves one tier only
    TurnaroundOutcome two_step = resolve_turnaround(*find_turnaround_program("t2_plan_a"), 1, 0.80);
    check(two_step.result == TurnaroundResult::Partial && two_step.target_quality == 2, "partial lifts one tier");

    // Fatigue: 65% success drops to 55%
    check(resolve_turnaround(plan_a, TURNAROUND_FATIGUE_THRESHOLD - 1, 0.60).result == TurnaroundResult::Success,
        "no fatigue below the threshold");
    check(resolve_turnaround(plan_a, TURNAROUND_FATIGUE_THRESHOLD, 0.60).result == TurnaroundResult::Partial,
        "fatigue moves success to partial");
    check(resolve_turnaround(plan_a, TURNAROUND_FATIGUE_THRESHOLD, 0.97).result == TurnaroundResult::Failure,
        "fatigue leaves the failure rate alone");

    check(get_quality_improvement_chance(0) == QUALITY_IMPROVEMENT_CHANCE, "base quality chance");
    check(std::fabs(get_quality_improvement_chance(1) - 0.45) < 1e-9 &&
        std::fabs(get_quality_improvement_chance(3) - 0.55) < 1e-9, "tiers raise the quality chance");
}

static void test_exit_premium() {
    Business b = make_business("biz_1", "healthcare", 4);
    b.quality_improved_tiers = 1;
    check(get_turnaround_exit_premium(b) == 0, "one tier earns no premium");
    ExitValuation before = calculate_exit_valuation(b, 5);
    b.quality_improved_tiers = TURNAROUND_EXIT_PREMIUM_MIN_TIERS;
    check(get_turnaround_exit_premium(b) == TURNAROUND_EXIT_PREMIUM, "two tiers earn the premium");
    ExitValuation after = calculate_exit_valuation(b, 5);
    check(std::fabs(after.total_multiple - before.total_multiple - TURNAROUND_EXIT_PREMIUM) < 1e-9,
        "premium added to the exit multiple");
}

static void test_collection_charges() {
    GameState plain;
    plain.round = 2;
    plain.cash = 5000;
    plain.shared_services = initialize_shared_services();
    plain.businesses.push_back(make_business("biz_1", "agency", 2));
    GameState turning = plain;
    turning.turnaround_tier = 1;
    ActiveTurnaround running;
    running.business_id = "biz_1";
    running.program_id = "t1_plan_a";
    turning.active_turnarounds.push_back(running);

    CollectionSummary base = run_collection_waterfall(plain);
    CollectionSummary charged = run_collection_waterfall(turning);
    check(charged.turnaround_costs == 300, "tier and program fees charged");
    check(charged.tax == base.tax, "fees are not tax deductible");
    check(turning.cash == plain.cash - 300, "fees leave cash");
}

static void test_game_flow() {
    Game game(GameConfig(42, Difficulty::Easy, Duration::Quick, "agency", "Test Holdings"));
    game.start();
    game.advance_to_event();
    game.advance_to_allocate();
    GameState& state = GameTestAccess::state(game);
    state.cash = 1e6;
    std::string target = state.businesses[0].id;
    state.businesses[0].quality = 1;

    check(!game.start_turnaround(target, "t1_plan_a"), "no programs before a tier");
    check(!game.unlock_turnaround_tier(), "one opco is not enough");
    Business second = state.businesses[0];
    second.id = "biz_second";
    second.quality = 3;
    state.businesses.push_back(second);

    check(game.unlock_turnaround_tier(), "unlock tier 1");
    check(state.turnaround_tier == 1 && state.cash == 1e6 - 600, "tier unlocked for 600");
    check(!game.start_turnaround(target, "t2_plan_a"), "tier 2 program refused at tier 1");
    check(!game.start_turnaround("biz_second", "t1_plan_a"), "program must match quality");

    double cash = state.cash;
    double cost = round_half_up(std::fabs(state.businesses[0].ebitda) * 0.10);
    check(game.start_turnaround(target, "t1_plan_a"), "start a program");
    check(state.cash == cash - cost, "upfront cost paid");
    check(state.running_turnarounds() == 1 && state.active_turnarounds[0].end_round == state.round + 2,
        "quick program runs two rounds");
    check(!game.start_turnaround(target, "t1_plan_a"), "no second program on the same business");

    Game sold = game;
    GameTestAccess::state(sold).cash = 1e6;
    check(sold.sell_business(target) && GameTestAccess::state(sold).active_turnarounds.empty(),
        "selling a business ends its program");

    int end_round = state.active_turnarounds[0].end_round;
    game.end_round();
    game.advance_to_event();
    check(game.get_last_collection().turnaround_costs == 300, "running program and tier billed at collection");
    check(state.active_turnarounds[0].status == TurnaroundStatus::Active, "program still running");
    while (state.round < end_round && !state.game_over) {
        game.advance_to_allocate();
        game.end_round();
        game.advance_to_event();
    }
    const Business* business = state.find_business(target);
    check(state.active_turnarounds[0].status != TurnaroundStatus::Active, "program settled at its end round");
    check(business && business->quality >= 1 && business->quality <= get_quality_ceiling("agency"),
        "quality within the sector ceiling");
    check(business && business->quality_improved_tiers == business->quality - 1, "tiers gained are tracked");
    bool recorded = false;
    for (const GameAction& a : state.actions_this_round) {
        if (a.type == GameActionType::TurnaroundResolved && a.business_id == target) recorded = true;
    }
    check(recorded, "resolution recorded");
}

int main() {
    test_program_table();
    test_eligibility();
    test_costs_and_tiers();
    test_resolution();
    test_exit_premium();
    test_collection_charges();
    test_game_flow();

    std::printf("\n%d failure(s)\n", failures);
    return failures == 0 ? 0 : 1;
}
