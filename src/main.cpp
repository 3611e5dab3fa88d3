/*
 * main.cpp
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


// Runs one holdco game from the command line with a simple house policy:
// buy the cheapest affordable deal all-cash, professionalize the largest
// business, keep leverage in check and take the obvious side of every choice.
// Turnarounds run one at a time on the weakest business a program fits.
//
// Usage: holdco_sim [--seed N] [--difficulty easy|normal] [--duration standard|quick]
//                   [--challenge CODE] [--sector ID] [--name NAME] [--json]

#include "Challenge.h"
#include "Constants.h"
#include "Game.h"
#include "GameSerializer.h"
#include "Scoring.h"
#include "Sectors.h"
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <string>

static void usage() {
    std::printf("usage: holdco_sim [--seed N] [--difficulty easy|normal] [--duration standard|quick]\n");
    std::printf("                  [--challenge CODE] [--sector ID] [--name NAME] [--json]\n");
}

static void resolve_event(Game& game) {
    const GameState& state = game.get_state();
    if (!state.current_event || state.current_event->choices.empty()) return;
    const GameEvent& event = *state.current_event;
    switch (event.type) {
    case EventType::UnsolicitedOffer:
        // Take offers well above what the business cost
        if (event.offer_multiple >= 8.0) {
            game.accept_offer();
        } else {
            game.decline_offer();
        }
        break;
    case EventType::PortfolioEquityDemand:
        game.grant_equity_demand();
        break;
    case EventType::PortfolioSellerNoteRenego:
        if (!game.accept_seller_note_renego()) game.decline_seller_note_renego();
        break;
    default:
        break;
    }
}

static void restructure(Game& game) {
    const GameState& state = game.get_state();
    const Business* smallest = nullptr;
    for (const Business* b : state.active_businesses()) {
        if (!smallest || b->ebitda < smallest->ebitda) smallest = b;
    }
    if (smallest && state.active_count() > 1) {
        game.distressed_sale(smallest->id);
    } else if (!game.emergency_equity_raise(1000)) {
        game.declare_bankruptcy();
        return;
    }
    if (!game.advance_from_restructure()) game.declare_bankruptcy();
}

static void allocate(Game& game) {
    const GameState& state = game.get_state();
    double reserve = game.get_config().initial_cash * 0.10;

    Metrics m = game.metrics();
    if (m.net_debt_to_ebitda > 2.5 && state.holdco_loan_balance > 0) {
        game.pay_down_debt(state.cash - reserve);
    }

    // Cheapest deal first, all-cash only
    bool bought = true;
    while (bought) {
        bought = false;
        const Deal* best = nullptr;
        for (const Deal& deal : state.deal_pipeline) {
            if (!best || deal.effective_price < best->effective_price) best = &deal;
        }
        if (!best) break;
        std::vector<DealStructure> structures = game.structures_for(*best);
        for (const DealStructure& s : structures) {
            if (s.type == DealStructureType::AllCash && state.cash - s.cash_required >= reserve) {
                std::string deal_id = best->id;
                bought = game.acquire_business(deal_id, s.type);
                break;
            }
        }
    }

    const Business* largest = nullptr;
    for (const Business* b : state.active_businesses()) {
        if (!largest || b->ebitda > largest->ebitda) largest = b;
    }
    if (largest && !largest->has_improvement(ImprovementType::OperatingPlaybook)) {
        game.improve_business(largest->id, ImprovementType::OperatingPlaybook);
    }

    if (state.active_count() >= MIN_OPCOS_FOR_SHARED_SERVICES && state.active_shared_services() == 0) {
        game.unlock_shared_service(SharedServiceType::FinanceReporting);
    }

    // One turnaround at a time, on the weakest business a program fits
    if (state.turnaround_tier == 0 && state.cash - turnaround_tier_config(1).unlock_cost >= reserve) {
        game.unlock_turnaround_tier();
    }
    if (state.turnaround_tier > 0 && state.running_turnarounds() == 0) {
        const Business* weakest = nullptr;
        for (const Business* b : state.active_businesses()) {
            if (get_eligible_programs(*b, state.turnaround_tier, state.active_turnarounds).empty()) continue;
            if (!weakest || b->quality < weakest->quality) weakest = b;
        }
        if (weakest) {
            std::string business_id = weakest->id;
            std::vector<TurnaroundProgram> programs =
                get_eligible_programs(*weakest, state.turnaround_tier, state.active_turnarounds);
            game.start_turnaround(business_id, programs.front().id);
        }
    }
}

static void print_round(const Game& game, int round) {
    const GameState& state = game.get_state();
    if (state.round_history.empty()) return;
    const RoundHistoryEntry& entry = state.round_history.back();
    std::printf("%5d  %-26s %4d %10.0f %10.0f %10.0f %6.1fx  %s\n", round,
        entry.event_title.substr(0, 26).c_str(), entry.business_count, entry.metrics.total_ebitda,
        entry.cash, entry.total_debt, entry.metrics.net_debt_to_ebitda, to_string(entry.metrics.distress_level));
}

int main(int argc, char** argv) {
    GameConfig config;
    bool json = false;
    try {
        Difficulty difficulty = Difficulty::Easy;
        Duration duration = Duration::Standard;
        int32_t seed = generate_random_seed();
        std::string sector = "agency";
        std::string name = "Holdco";
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];
            bool has_value = i + 1 < argc;
            if (arg == "--seed" && has_value) {
                seed = (int32_t)std::strtol(argv[++i], nullptr, 10);
            } else if (arg == "--difficulty" && has_value) {
                difficulty = parse_difficulty(argv[++i]);
            } else if (arg == "--duration" && has_value) {
                duration = parse_duration(argv[++i]);
            } else if (arg == "--challenge" && has_value) {
                std::optional<ChallengeParams> challenge = decode_challenge_params(argv[++i]);
                if (!challenge) throw std::invalid_argument(std::string("bad challenge code: ") + argv[i]);
                seed = challenge->seed;
                difficulty = challenge->difficulty;
                duration = challenge->duration;
            } else if (arg == "--sector" && has_value) {
                sector = argv[++i];
            } else if (arg == "--name" && has_value) {
                name = argv[++i];
            } else if (arg == "--json") {
                json = true;
            } else {
                usage();
                return 2;
            }
        }
        config = GameConfig(seed, difficulty, duration, sector, name);
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "holdco_sim: %s\n", e.what());
        usage();
        return 2;
    }

    Game game(config);
    try {
        game.start();
    } catch (const std::invalid_argument& e) {
        std::fprintf(stderr, "holdco_sim: %s\n", e.what());
        return 2;
    }

    if (!json) {
        std::printf("%s: %s, %s, seed %d, starting in %s\n\n", config.holdco_name.c_str(),
            to_string(config.difficulty), to_string(config.duration), config.seed,
            get_sector(config.starting_sector).name.c_str());
        std::printf("Round  Event                      Opcos     EBITDA       Cash       Debt  Lever.  Distress\n");
    }

    const GameState& state = game.get_state();
    while (!state.game_over) {
        int round = state.round;
        game.advance_to_event();
        if (state.game_over) break;
        if (state.phase == GamePhase::Restructure) restructure(game);
        if (state.game_over) break;
        resolve_event(game);
        game.advance_to_allocate();
        allocate(game);
        game.end_round();
        if (!json) print_round(game, round);
    }

    if (json) {
        GameSerializer::serialize(game, std::cout);
        std::cout << std::endl;
        return 0;
    }

    ScoreBreakdown score = calculate_final_score(state);
    std::printf("\n");
    if (state.bankrupt_round > 0) std::printf("Bankrupt in year %d\n", state.bankrupt_round);
    std::printf("Enterprise value      %s\n", format_money(calculate_enterprise_value(state)).c_str());
    std::printf("Founder equity value  %s\n", format_money(calculate_founder_equity_value(state)).c_str());
    std::printf("FCF/share growth      %5.1f / 25\n", score.fcf_share_growth);
    std::printf("Portfolio ROIC        %5.1f / 20\n", score.portfolio_roic);
    std::printf("Capital deployment    %5.1f / 20\n", score.capital_deployment);
    std::printf("Balance sheet         %5.1f / 15\n", score.balance_sheet_health);
    std::printf("Strategic discipline  %5.1f / 20\n", score.strategic_discipline);
    std::printf("Score %d, grade %s: %s\n", score.total, score.grade.c_str(), score.title.c_str());
    ChallengeParams challenge;
    challenge.seed = config.seed;
    challenge.difficulty = config.difficulty;
    challenge.duration = config.duration;
    std::printf("Challenge code        %s\n", encode_challenge_params(challenge).c_str());
    for (const PostGameInsight& insight : generate_post_game_insights(state)) {
        std::printf("  - %s\n", insight.insight.c_str());
    }
    return 0;
}
