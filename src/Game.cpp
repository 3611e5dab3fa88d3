/*
 * Game.cpp
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


#include "Game.h"
#include "Constants.h"
#include "EventGenerator.h"
#include "Integration.h"
#include "Sectors.h"
#include "Valuation.h"
#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <set>
#include <stdexcept>

#define DEBUG 0

/**
 * Removes the programs of a business leaving the portfolio; they stop costing
 * anything.
 */
static void drop_turnarounds(GameState& state, const std::string& business_id) {
    std::vector<ActiveTurnaround>& t = state.active_turnarounds;
    t.erase(std::remove_if(t.begin(), t.end(),
                [&](const ActiveTurnaround& a) { return a.business_id == business_id; }),
        t.end());
}

static std::optional<EventType> last_event_type(const GameState& state) {
    if (state.event_history.empty()) return std::nullopt;
    return state.event_history.back().type;
}

Game::Game(GameConfig config) : config(config) {}

void Game::start() {
    if (!is_sector(config.starting_sector)) {
        throw std::invalid_argument("unknown sector: " + config.starting_sector);
    }

    state = GameState();
    deal_generator.set_id_counter(0);
    outcomes = ActionOutcomes();
    last_collection = CollectionSummary();

    state.holdco_name = config.holdco_name;
    state.difficulty = config.difficulty;
    state.duration = config.duration;
    state.max_rounds = config.max_rounds;
    state.round = 1;
    state.phase = GamePhase::Collect;

    // Setup draws come from round 0 so they never replay round 1 streams
    RngStreams setup = create_rng_streams(config.seed, 0);
    SeededRng starting_rng = setup.deals.fork("starting-business");
    Business starting = deal_generator.create_starting_business(config.starting_sector, config.starting_ebitda,
        config.starting_multiple_cap, starting_rng);

    state.businesses.push_back(starting);
    state.cash = config.initial_cash - starting.acquisition_price;
    state.total_invested_capital = starting.acquisition_price;
    state.interest_rate = config.starting_interest_rate;
    state.founder_shares = config.founder_shares;
    state.shares_outstanding = config.total_shares;
    state.initial_raise_amount = config.initial_cash;
    state.initial_ownership_pct = (double)config.founder_shares / config.total_shares;
    state.holdco_debt_start_round = config.holdco_debt_start_round;

    state.holdco_loan_balance = config.starting_debt;
    state.holdco_loan_rate = config.starting_debt > 0 ? config.starting_interest_rate : 0.0;
    state.holdco_loan_rounds_remaining = config.holdco_loan_term();
    state.total_debt = state.compute_total_debt();

    state.shared_services = initialize_shared_services();
    state.max_acquisitions_per_round = get_max_acquisitions(0);

    PipelineContext context;
    context.max_rounds = state.max_rounds;
    state.deal_pipeline = deal_generator.generate_deal_pipeline({}, 1, context, setup.deals);

    if (DEBUG) std::cout << "Started " << state.holdco_name << " with " << starting.to_string() << std::endl;
}

PipelineContext Game::pipeline_context() const {
    PipelineContext context;
    context.focus = state.ma_focus;
    std::optional<SectorFocusBonus> focus = calculate_sector_focus_bonus(state.businesses);
    if (focus) {
        context.portfolio_focus_sector = focus->focus_group;
        context.portfolio_focus_tier = focus->tier;
    }
    context.portfolio_ebitda = state.total_active_ebitda();
    context.ma_sourcing_tier = state.ma_sourcing.active ? state.ma_sourcing.tier : 0;
    context.ma_sourcing_active = state.ma_sourcing.active;
    context.last_event = last_event_type(state);
    context.max_rounds = state.max_rounds;
    context.credit_tightening = state.credit_tightening_rounds_remaining > 0;
    return context;
}

DistressRestrictions Game::current_restrictions() const {
    return get_distress_restrictions(calculate_metrics(state).distress_level);
}

std::string Game::narrate(const GameEvent& event, SeededRng& cosmetic) {
    NarrativeContext context;
    context.holdco_name = state.holdco_name;
    context.round = state.round;
    context.max_rounds = state.max_rounds;
    context.cash = state.cash;
    context.offer_amount = event.offer_amount;
    context.variant = cosmetic.next_int(0, 1);
    if (const Business* b = state.find_business(event.affected_business_id)) {
        context.business_name = b->name;
        context.sector_name = get_sector(b->sector_id).name;
    }
    if (event.type == EventType::SectorEvent && event.sector_event_index >= 0) {
        context.sector_name = get_sector(sector_events()[event.sector_event_index].sector_id).name;
    }

    if (narrative) {
        std::optional<std::string> text = narrative->generate(event.type, context);
        if (text && !text->empty()) return *text;
    }
    return template_narrative.render(event.type, context);
}

bool Game::advance_to_event() {
    if (!in_phase(GamePhase::Collect)) return false;

    last_collection = run_collection_waterfall(state);
    if (DEBUG) std::cout << "Round " << state.round << " collection: cash " << state.cash << std::endl;

    if (last_collection.cash_went_negative) {
        if (state.has_restructured) {
            state.game_over = true;
            state.bankrupt_round = state.round;
            state.requires_restructuring = false;
            return true;
        }
        state.requires_restructuring = true;
    }

    // Timed effects from earlier years run down before this year's event
    if (state.credit_tightening_rounds_remaining > 0) --state.credit_tightening_rounds_remaining;
    if (state.inflation_rounds_remaining > 0) --state.inflation_rounds_remaining;

    RngStreams rng = create_rng_streams(config.seed, state.round);
    GameEvent event = generate_event(state, rng.events);

    if (!is_choice_event(event.type) && !state.requires_restructuring) {
        apply_event_effects(state, event, rng.events);
    }

    // A held-back referral arrives with the rest of the event after restructuring
    if (event.type == EventType::PortfolioReferralDeal && !state.requires_restructuring) {
        state.deal_pipeline.push_back(deal_generator.generate_referral_deal(state.round, state.max_rounds, rng.deals));
    }

    resolve_turnarounds(rng.simulation);

    event.narrative = narrate(event, rng.cosmetic);
    state.event_history.push_back(event);
    state.current_event = event;

    // Player-action rolls for the rest of the round
    outcomes = pre_roll_action_outcomes(rng.market, ACTION_OUTCOME_SLOTS);
    state.sell_rolls_used = 0;
    state.decline_rolls_used = 0;
    state.integration_rolls_used = 0;
    state.quality_rolls_used = 0;

    state.total_debt = state.compute_total_debt();
    state.phase = state.requires_restructuring ? GamePhase::Restructure : GamePhase::Event;
    return true;
}

bool Game::advance_to_allocate() {
    if (!in_phase(GamePhase::Event)) return false;

    RngStreams rng = round_streams();
    PipelineContext context = pipeline_context();
    state.deal_pipeline = deal_generator.generate_deal_pipeline(state.deal_pipeline, state.round, context, rng.deals);

    // Crisis and recession deals are added on top of the pipeline cap
    if (state.current_event) {
        std::vector<Deal> extra;
        if (state.current_event->type == EventType::GlobalFinancialCrisis) {
            extra = deal_generator.generate_distressed_deals(state.round, state.max_rounds, rng.deals);
        } else if (state.current_event->type == EventType::GlobalRecession) {
            extra = deal_generator.generate_recession_deals(state.round, state.max_rounds, rng.deals);
        }
        state.deal_pipeline.insert(state.deal_pipeline.end(), extra.begin(), extra.end());
    }

    state.acquisitions_this_round = 0;
    state.max_acquisitions_per_round = get_max_acquisitions(state.ma_sourcing.active ? state.ma_sourcing.tier : 0);
    state.last_acquisition_result = AcquisitionResult::None;
    state.sourcing_count_this_round = 0;
    state.outreach_count_this_round = 0;
    state.phase = GamePhase::Allocate;
    return true;
}

bool Game::end_round() {
    if (!in_phase(GamePhase::Allocate)) return false;

    SharedServicesBenefits benefits = calculate_shared_services_benefits(state);
    std::optional<SectorFocusBonus> focus = calculate_sector_focus_bonus(state.businesses);
    double focus_bonus = focus ? sector_focus_ebitda_bonus(focus->tier) : 0.0;
    bool inflation = state.inflation_rounds_remaining > 0;

    RngStreams rng = round_streams();
    for (Business& b : state.businesses) {
        if (!b.is_active()) continue;
        SeededRng growth_rng = rng.simulation.fork(b.id);
        b = apply_organic_growth(b, benefits.growth_bonus, focus_bonus, inflation, growth_rng);
    }

    state.metrics_history.push_back(record_historical_metrics(state));

    Metrics end_metrics = calculate_metrics(state);
    if (end_metrics.distress_level == DistressLevel::Breach) {
        ++state.covenant_breach_rounds;
    } else if (!state.has_restructured) {
        // After a restructuring the streak is never forgiven
        state.covenant_breach_rounds = 0;
    }

    bool bankrupt = false;
    if (state.covenant_breach_rounds >= COVENANT_BREACH_ROUNDS_LIMIT) {
        if (state.has_restructured) {
            bankrupt = true;
        } else {
            state.requires_restructuring = true;
        }
    }
    if (state.has_restructured && !bankrupt) {
        if (end_metrics.intrinsic_value_per_share * state.shares_outstanding <= 0) bankrupt = true;
        if (state.active_count() == 0 && state.cash <= 0) bankrupt = true;
    }
    if (bankrupt) state.bankrupt_round = state.round;

    RoundHistoryEntry entry;
    entry.round = state.round;
    entry.actions = state.actions_this_round;
    entry.metrics = end_metrics;
    entry.business_count = state.active_count();
    entry.cash = state.cash;
    entry.total_debt = state.compute_total_debt();
    if (state.current_event) {
        entry.event_type = state.current_event->type;
        entry.event_title = state.current_event->title;
        entry.event_description = state.current_event->description;
        entry.chronicle = state.current_event->narrative;
    }
    state.round_history.push_back(entry);

    if (DEBUG) std::cout << "End of round " << state.round << ": EBITDA " << end_metrics.total_ebitda
                         << " cash " << state.cash << std::endl;

    ++state.round;
    state.game_over = state.round > state.max_rounds || bankrupt;
    state.phase = GamePhase::Collect;
    state.current_event.reset();
    state.actions_this_round.clear();
    state.acquisitions_this_round = 0;
    state.last_acquisition_result = AcquisitionResult::None;
    state.debt_payment_this_round = 0.0;
    state.total_debt = state.compute_total_debt();
    return true;
}

void Game::record_action(GameActionType type, const std::string& business_id, double amount,
    const std::string& detail) {
    GameAction action;
    action.type = type;
    action.round = state.round;
    action.business_id = business_id;
    action.amount = amount;
    action.detail = detail;
    state.actions_this_round.push_back(action);
}

int Game::find_deal_index(const std::string& deal_id) const {
    for (size_t i = 0; i < state.deal_pipeline.size(); ++i) {
        if (state.deal_pipeline[i].id == deal_id) return (int)i;
    }
    return -1;
}

double Game::take_roll(const std::vector<double>& rolls, int& used, const char* kind) {
    int n = used++;
    if (n < (int)rolls.size()) return rolls[n];
    return round_streams().market.fork(std::string(kind) + "-" + std::to_string(n)).next();
}

std::vector<DealStructure> Game::structures_for(const Deal& deal) const {
    return generate_deal_structures(deal, state.cash, state.interest_rate,
        state.credit_tightening_rounds_remaining > 0, state.max_rounds, !current_restrictions().can_take_debt);
}

std::optional<DealStructure> Game::offered_structure(const Deal& deal, DealStructureType type) const {
    for (const DealStructure& s : structures_for(deal)) {
        if (s.type == type) return s;
    }
    return std::nullopt;
}

bool Game::can_acquire(const DealStructure& structure) const {
    if (!in_phase(GamePhase::Allocate) || state.requires_restructuring) return false;
    DistressRestrictions restrictions = current_restrictions();
    if (!restrictions.can_acquire) return false;
    if (state.acquisitions_this_round >= state.max_acquisitions_per_round) return false;
    if (state.cash < structure.cash_required) return false;
    if (structure.bank_debt) {
        if (!restrictions.can_take_debt || state.credit_tightening_rounds_remaining > 0) return false;
    }
    return true;
}

bool Game::deal_snatched(int deal_index) {
    const Deal& deal = state.deal_pipeline[deal_index];
    if (deal.heat != DealHeat::Contested) return false;
    // Keyed by deal so the outcome does not depend on what else was bought first
    double roll = round_streams().market.fork(deal.id).next();
    if (roll >= CONTESTED_SNATCH_PROBABILITY) return false;

    if (DEBUG) std::cout << "Deal " << deal.id << " snatched by another buyer" << std::endl;
    state.deal_pipeline.erase(state.deal_pipeline.begin() + deal_index);
    ++state.acquisitions_this_round;
    state.last_acquisition_result = AcquisitionResult::Snatched;
    return true;
}

bool Game::acquire_business(const std::string& deal_id, DealStructureType type) {
    int index = find_deal_index(deal_id);
    if (index < 0) return false;
    std::optional<DealStructure> offered = offered_structure(state.deal_pipeline[index], type);
    if (!offered || !can_acquire(*offered)) return false;
    const DealStructure structure = *offered;
    if (deal_snatched(index)) return true;

    const Deal deal = state.deal_pipeline[index];
    Business business = execute_deal_structure(deal, structure, state.round);
    business.is_platform = false;
    business.platform_scale = 0;
    business.bolt_on_ids.clear();
    business.synergies_realized = 0.0;

    state.businesses.push_back(business);
    state.cash -= structure.cash_required;
    state.total_invested_capital += deal.effective_price;
    state.deal_pipeline.erase(state.deal_pipeline.begin() + index);
    ++state.acquisitions_this_round;
    state.last_acquisition_result = AcquisitionResult::Success;
    state.total_debt = state.compute_total_debt();
    record_action(GameActionType::Acquire, business.id, deal.effective_price, to_string(structure.type));
    return true;
}

bool Game::acquire_tuck_in(const std::string& deal_id, DealStructureType type,
    const std::string& platform_id) {
    int index = find_deal_index(deal_id);
    if (index < 0) return false;
    std::optional<DealStructure> offered = offered_structure(state.deal_pipeline[index], type);
    if (!offered || !can_acquire(*offered)) return false;
    const DealStructure structure = *offered;
    Business* platform = state.find_business(platform_id);
    if (!platform || !platform->is_active() || !platform->is_platform) return false;
    if (platform->sector_id != state.deal_pipeline[index].business.sector_id) return false;
    if (deal_snatched(index)) return true;

    const Deal deal = state.deal_pipeline[index];
    const Business& target = deal.business;

    IntegrationContext context;
    context.platform = platform;
    context.has_shared_services = state.active_shared_services() > 0;
    context.affinity = get_sub_type_affinity(platform->sector_id, platform->sub_type, target.sub_type);
    context.has_affinity = true;
    SizeRatio size = get_size_ratio_tier(target.ebitda, platform->ebitda);
    context.size_tier = size.tier;
    context.has_size_tier = true;

    double roll = take_roll(outcomes.integration_rolls, state.integration_rolls_used, "integration");
    IntegrationOutcome outcome = determine_integration_outcome(target, context, roll);
    double synergies = calculate_synergies(outcome, target.ebitda, true, context);
    double restructuring_cost = outcome == IntegrationOutcome::Failure ? round_half_up(std::fabs(target.ebitda) * 0.07) : 0.0;

    Business bolt_on = execute_deal_structure(deal, structure, state.round);
    bolt_on.status = BusinessStatus::Integrated;
    bolt_on.parent_platform_id = platform_id;
    bolt_on.integration_rounds_remaining = 1;
    bolt_on.synergies_realized = synergies;

    double combined_ebitda = platform->ebitda + target.ebitda + synergies;
    double combined_revenue = platform->revenue + target.revenue;
    int new_scale = platform->platform_scale + 1;
    double expansion = calculate_multiple_expansion(new_scale, combined_ebitda)
        - calculate_multiple_expansion(platform->platform_scale, platform->ebitda);

    if (outcome == IntegrationOutcome::Failure) {
        platform->integration_growth_drag += calculate_integration_growth_penalty(target.ebitda, platform->ebitda, false);
        platform->integration_rounds_remaining = std::max(platform->integration_rounds_remaining, 2);
    }
    platform->platform_scale = new_scale;
    platform->bolt_on_ids.push_back(bolt_on.id);
    platform->ebitda = combined_ebitda;
    platform->revenue = combined_revenue;
    if (combined_revenue > 0) platform->ebitda_margin = clamp_margin(combined_ebitda / combined_revenue);
    platform->peak_revenue = std::max(platform->peak_revenue, combined_revenue);
    platform->peak_ebitda = std::max(platform->peak_ebitda, combined_ebitda);
    platform->synergies_realized += synergies;
    platform->total_acquisition_cost += deal.effective_price;
    platform->acquisition_multiple += expansion;

    // platform is not used past this point; push_back may reallocate
    state.businesses.push_back(bolt_on);
    state.cash = std::max(0.0, state.cash - structure.cash_required - restructuring_cost);
    state.total_invested_capital += deal.effective_price + restructuring_cost;
    state.deal_pipeline.erase(state.deal_pipeline.begin() + index);
    ++state.acquisitions_this_round;
    state.last_acquisition_result = AcquisitionResult::Success;
    state.total_debt = state.compute_total_debt();
    record_action(GameActionType::AcquireTuckIn, bolt_on.id, deal.effective_price, to_string(outcome));
    return true;
}

/**
 * Balance-weighted average of a debt instrument's rate and term over two
 * businesses.
 */
static void blend_debt(double balance1, double rate1, int rounds1, double balance2, double rate2, int rounds2,
    double& balance, double& rate, int& rounds) {
    balance = balance1 + balance2;
    if (balance <= 0) {
        rate = 0.0;
        rounds = 0;
        return;
    }
    rate = (balance1 * rate1 + balance2 * rate2) / balance;
    rounds = (int)std::ceil((balance1 * rounds1 + balance2 * rounds2) / balance);
}

bool Game::merge_businesses(const std::string& business_id1, const std::string& business_id2,
    const std::string& new_name) {
    if (!in_phase(GamePhase::Allocate) || business_id1 == business_id2) return false;
    Business* p1 = state.find_business(business_id1);
    Business* p2 = state.find_business(business_id2);
    if (!p1 || !p2 || !p1->is_active() || !p2->is_active()) return false;
    if (p1->sector_id != p2->sector_id) return false;
    const Business biz1 = *p1;
    const Business biz2 = *p2;

    double larger = std::max(std::fabs(biz1.ebitda), std::fabs(biz2.ebitda));
    double smaller = std::min(std::fabs(biz1.ebitda), std::fabs(biz2.ebitda));
    double merge_cost = std::max(MERGE_COST_FLOOR, round_half_up(smaller * 0.15));
    if (state.cash < merge_cost) return false;

    IntegrationContext context;
    context.platform = &biz1;
    context.has_shared_services = state.active_shared_services() > 0;
    context.affinity = get_sub_type_affinity(biz1.sector_id, biz1.sub_type, biz2.sub_type);
    context.has_affinity = true;
    context.size_tier = get_size_ratio_tier(smaller, larger).tier;
    context.has_size_tier = true;
    context.is_merger = true;

    // The roll is consumed before any affordability check so replays stay aligned
    double roll = take_roll(outcomes.integration_rolls, state.integration_rolls_used, "integration");
    IntegrationOutcome outcome = determine_integration_outcome(biz2, context, roll);
    double synergies = calculate_synergies(outcome, smaller, false, context);
    double restructuring_cost = outcome == IntegrationOutcome::Failure ? round_half_up(smaller * 0.07) : 0.0;
    double total_cost = merge_cost + restructuring_cost;
    if (state.cash < total_cost) {
        --state.integration_rolls_used;
        return false;
    }

    double affinity_growth = context.affinity == SubTypeAffinity::Match ? 0.015
        : context.affinity == SubTypeAffinity::Related                  ? 0.010
                                                                         : 0.005;
    double combined_ebitda = biz1.ebitda + biz2.ebitda + synergies;
    double combined_revenue = biz1.revenue + biz2.revenue;
    int prev_scale = std::max(biz1.platform_scale, biz2.platform_scale);
    double expansion = calculate_multiple_expansion(prev_scale + 1, combined_ebitda)
        - calculate_multiple_expansion(prev_scale, std::max(biz1.ebitda, biz2.ebitda));

    Business merged;
    merged.id = deal_generator.next_business_id();
    merged.name = new_name.empty() ? biz1.name + " Group" : new_name;
    merged.sector_id = biz1.sector_id;
    merged.sub_type = biz1.sub_type;
    merged.ebitda = combined_ebitda;
    merged.peak_ebitda = combined_ebitda;
    merged.acquisition_ebitda = biz1.acquisition_ebitda + biz2.acquisition_ebitda;
    merged.total_acquisition_cost = biz1.total_acquisition_cost + biz2.total_acquisition_cost + total_cost;
    merged.acquisition_price = merged.total_acquisition_cost;
    merged.acquisition_round = std::max(biz1.acquisition_round, biz2.acquisition_round);
    merged.acquisition_multiple = (biz1.acquisition_multiple + biz2.acquisition_multiple) / 2.0 + expansion;
    merged.acquisition_size_tier_premium = std::max(biz1.acquisition_size_tier_premium, biz2.acquisition_size_tier_premium);
    merged.organic_growth_rate = (biz1.organic_growth_rate + biz2.organic_growth_rate) / 2.0 + affinity_growth;
    merged.revenue_growth_rate = (biz1.revenue_growth_rate + biz2.revenue_growth_rate) / 2.0 + affinity_growth;
    merged.revenue = combined_revenue;
    merged.ebitda_margin = clamp_margin(combined_revenue > 0 ? combined_ebitda / combined_revenue
                                                             : (biz1.ebitda_margin + biz2.ebitda_margin) / 2.0);
    merged.acquisition_revenue = biz1.acquisition_revenue + biz2.acquisition_revenue;
    merged.acquisition_margin = merged.acquisition_revenue > 0 ? merged.acquisition_ebitda / merged.acquisition_revenue
                                                                : merged.ebitda_margin;
    merged.peak_revenue = combined_revenue;
    merged.margin_drift_rate = (biz1.margin_drift_rate + biz2.margin_drift_rate) / 2.0;
    merged.quality = std::max(biz1.quality, biz2.quality);
    merged.due_diligence = biz1.due_diligence;
    merged.integration_rounds_remaining = 2;
    if (outcome == IntegrationOutcome::Failure) {
        merged.integration_growth_drag = calculate_integration_growth_penalty(smaller, larger, true);
    }

    // Keep the stronger of any improvement both businesses carried
    std::map<ImprovementType, Improvement> best;
    for (const Business* b : {&biz1, &biz2}) {
        for (const Improvement& imp : b->improvements) {
            auto it = best.find(imp.type);
            if (it == best.end() || imp.effect > it->second.effect) best[imp.type] = imp;
        }
    }
    for (const auto& kv : best) merged.improvements.push_back(kv.second);

    blend_debt(biz1.seller_note_balance, biz1.seller_note_rate, biz1.seller_note_rounds_remaining,
        biz2.seller_note_balance, biz2.seller_note_rate, biz2.seller_note_rounds_remaining,
        merged.seller_note_balance, merged.seller_note_rate, merged.seller_note_rounds_remaining);
    blend_debt(biz1.bank_debt_balance, biz1.bank_debt_rate, biz1.bank_debt_rounds_remaining,
        biz2.bank_debt_balance, biz2.bank_debt_rate, biz2.bank_debt_rounds_remaining,
        merged.bank_debt_balance, merged.bank_debt_rate, merged.bank_debt_rounds_remaining);
    merged.earnout_remaining = biz1.earnout_remaining + biz2.earnout_remaining;
    merged.earnout_target = std::max(biz1.earnout_target, biz2.earnout_target);
    merged.rollover_equity_pct = std::max(biz1.rollover_equity_pct, biz2.rollover_equity_pct);

    merged.status = BusinessStatus::Active;
    merged.is_platform = true;
    merged.platform_scale = prev_scale + 1;
    merged.bolt_on_ids = biz1.bolt_on_ids;
    merged.bolt_on_ids.insert(merged.bolt_on_ids.end(), biz2.bolt_on_ids.begin(), biz2.bolt_on_ids.end());
    merged.synergies_realized = biz1.synergies_realized + biz2.synergies_realized + synergies;

    std::set<std::string> bolt_ons(merged.bolt_on_ids.begin(), merged.bolt_on_ids.end());
    std::vector<Business> remaining;
    for (const Business& b : state.businesses) {
        if (b.id == business_id1 || b.id == business_id2) continue;
        remaining.push_back(b);
        if (bolt_ons.count(b.id)) remaining.back().parent_platform_id = merged.id;
    }
    remaining.push_back(merged);
    state.businesses = remaining;
    drop_turnarounds(state, business_id1);
    drop_turnarounds(state, business_id2);

    Business exited1 = biz1;
    Business exited2 = biz2;
    exited1.status = BusinessStatus::Merged;
    exited1.exit_round = state.round;
    exited2.status = BusinessStatus::Merged;
    exited2.exit_round = state.round;
    state.exited_businesses.push_back(exited1);
    state.exited_businesses.push_back(exited2);

    state.cash -= total_cost;
    state.total_invested_capital += total_cost;
    state.total_debt = state.compute_total_debt();
    record_action(GameActionType::MergeBusinesses, merged.id, total_cost, to_string(outcome));
    return true;
}

bool Game::designate_platform(const std::string& business_id) {
    if (!in_phase(GamePhase::Allocate)) return false;
    Business* business = state.find_business(business_id);
    if (!business || !business->is_active() || business->is_platform) return false;

    double setup_cost = std::max(PLATFORM_SETUP_COST_FLOOR, round_half_up(std::fabs(business->ebitda) * 0.05));
    if (state.cash < setup_cost) return false;

    business->is_platform = true;
    business->platform_scale = 1;
    state.cash -= setup_cost;
    state.total_invested_capital += setup_cost;
    record_action(GameActionType::DesignatePlatform, business_id, setup_cost);
    return true;
}

bool Game::improve_business(const std::string& business_id, ImprovementType type) {
    if (!in_phase(GamePhase::Allocate)) return false;
    Business* business = state.find_business(business_id);
    if (!business || !business->is_active() || business->has_improvement(type)) return false;

    double base = std::fabs(business->ebitda) > 0 ? std::fabs(business->ebitda) : 1.0;
    double cost_pct = 0.0;
    double margin_boost = 0.0;
    double revenue_boost = 0.0;
    double growth_boost = 0.0;
    switch (type) {
    case ImprovementType::OperatingPlaybook:
        cost_pct = 0.15;
        margin_boost = 0.03;
        break;
    case ImprovementType::PricingModel:
        cost_pct = 0.10;
        margin_boost = 0.02;
        revenue_boost = 0.01;
        growth_boost = 0.01;
        break;
    case ImprovementType::ServiceExpansion:
        cost_pct = 0.20;
        revenue_boost = 0.08 + round_streams().simulation.fork("improve-" + business_id).next() * 0.04;
        margin_boost = -0.01;
        break;
    case ImprovementType::FixUnderperformance:
        cost_pct = 0.12;
        margin_boost = 0.04;
        break;
    case ImprovementType::RecurringRevenue:
        cost_pct = 0.25;
        margin_boost = -0.02;
        growth_boost = 0.03;
        break;
    case ImprovementType::ManagementProfessionalization:
        cost_pct = 0.18;
        margin_boost = 0.01;
        growth_boost = 0.01;
        break;
    case ImprovementType::DigitalTransformation:
        cost_pct = 0.22;
        revenue_boost = 0.03;
        margin_boost = business->ebitda_margin > 0.30 ? 0.01 : 0.02;
        growth_boost = 0.02;
        break;
    }

    double cost = std::max(IMPROVEMENT_COST_FLOOR, round_half_up(base * cost_pct));
    if (state.cash < cost) return false;

    double quality_mult = QUALITY_IMPROVEMENT_MULTIPLIER[std::min(5, std::max(1, business->quality)) - 1];
    if (margin_boost > 0) margin_boost *= quality_mult;
    if (revenue_boost > 0) revenue_boost *= quality_mult;
    if (growth_boost > 0) growth_boost *= quality_mult;

    double old_ebitda = business->ebitda;
    business->revenue = round_half_up(business->revenue * (1.0 + revenue_boost));
    business->ebitda_margin = clamp_margin(business->ebitda_margin + margin_boost);
    business->rederive_ebitda();
    business->peak_revenue = std::max(business->peak_revenue, business->revenue);
    business->organic_growth_rate += growth_boost;
    business->revenue_growth_rate += growth_boost;
    business->total_acquisition_cost += cost;

    if (type == ImprovementType::ManagementProfessionalization) {
        business->due_diligence.operator_quality = business->due_diligence.operator_quality == OperatorQuality::Weak
            ? OperatorQuality::Moderate
            : OperatorQuality::Strong;
    }
    if (type == ImprovementType::DigitalTransformation) business->margin_drift_rate += 0.002;

    Improvement improvement;
    improvement.type = type;
    improvement.applied_round = state.round;
    improvement.effect = old_ebitda > 0 ? (business->ebitda - old_ebitda) / old_ebitda : 0.0;
    business->improvements.push_back(improvement);

    if (business->quality < get_quality_ceiling(business->sector_id)) {
        double roll = take_roll(outcomes.quality_improvement_rolls, state.quality_rolls_used, "quality");
        if (roll < get_quality_improvement_chance(state.turnaround_tier)) {
            ++business->quality;
            ++business->quality_improved_tiers;
        }
    }

    state.cash -= cost;
    state.total_invested_capital += cost;
    record_action(GameActionType::Improve, business_id, cost, to_string(type));
    return true;
}

bool Game::unlock_shared_service(SharedServiceType type) {
    if (!in_phase(GamePhase::Allocate)) return false;
    if (state.active_count() < MIN_OPCOS_FOR_SHARED_SERVICES) return false;
    if (state.active_shared_services() >= MAX_ACTIVE_SHARED_SERVICES) return false;
    for (SharedService& s : state.shared_services) {
        if (s.type != type) continue;
        if (s.active || state.cash < s.unlock_cost) return false;
        s.active = true;
        s.unlocked_round = state.round;
        state.cash -= s.unlock_cost;
        state.total_invested_capital += s.unlock_cost;
        record_action(GameActionType::UnlockSharedService, "", s.unlock_cost, to_string(type));
        return true;
    }
    return false;
}

bool Game::deactivate_shared_service(SharedServiceType type) {
    if (!in_phase(GamePhase::Allocate)) return false;
    for (SharedService& s : state.shared_services) {
        if (s.type != type || !s.active) continue;
        s.active = false;
        record_action(GameActionType::DeactivateSharedService, "", 0.0, to_string(type));
        return true;
    }
    return false;
}

void Game::auto_deactivate_shared_services() {
    if (state.active_count() >= MIN_OPCOS_FOR_SHARED_SERVICES) return;
    for (SharedService& s : state.shared_services) s.active = false;
}

bool Game::unlock_turnaround_tier() {
    if (!in_phase(GamePhase::Allocate)) return false;
    std::string reason;
    if (!can_unlock_turnaround_tier(state.turnaround_tier, state.cash, state.active_count(), &reason)) {
        if (DEBUG) std::cout << "Turnaround tier refused: " << reason << std::endl;
        return false;
    }

    const TurnaroundTierConfig& next = turnaround_tier_config(state.turnaround_tier + 1);
    state.turnaround_tier = next.tier;
    state.cash -= next.unlock_cost;
    state.total_invested_capital += next.unlock_cost;
    record_action(GameActionType::UnlockTurnaroundTier, "", next.unlock_cost, next.name);
    return true;
}

bool Game::start_turnaround(const std::string& business_id, const std::string& program_id) {
    if (!in_phase(GamePhase::Allocate)) return false;
    Business* business = state.find_business(business_id);
    if (!business || !business->is_active()) return false;

    const TurnaroundProgram* program = nullptr;
    for (const TurnaroundProgram& p : get_eligible_programs(*business, state.turnaround_tier, state.active_turnarounds)) {
        if (p.id == program_id) program = find_turnaround_program(p.id);
    }
    if (!program) return false;

    double cost = calculate_turnaround_cost(*program, *business);
    if (state.cash < cost) return false;

    ActiveTurnaround turnaround;
    turnaround.id = "ta_" + business_id + "_" + std::to_string(state.round);
    turnaround.business_id = business_id;
    turnaround.program_id = program_id;
    turnaround.start_round = state.round;
    turnaround.end_round = state.round + get_turnaround_duration(*program, state.duration);
    state.active_turnarounds.push_back(turnaround);

    state.cash -= cost;
    state.total_invested_capital += cost;
    record_action(GameActionType::StartTurnaround, business_id, cost, program_id);
    return true;
}

void Game::resolve_turnarounds(SeededRng& rng) {
    // Fatigue is judged on everything running before this year's programs settle
    int running = state.running_turnarounds();
    for (ActiveTurnaround& t : state.active_turnarounds) {
        if (t.status != TurnaroundStatus::Active || state.round < t.end_round) continue;
        const TurnaroundProgram* program = find_turnaround_program(t.program_id);
        Business* business = state.find_business(t.business_id);
        if (!program || !business) continue;

        TurnaroundOutcome outcome = resolve_turnaround(*program, running, rng.fork(t.id).next());
        t.status = outcome.result == TurnaroundResult::Success ? TurnaroundStatus::Completed
            : outcome.result == TurnaroundResult::Partial      ? TurnaroundStatus::Partial
                                                               : TurnaroundStatus::Failed;

        int old_quality = business->quality;
        business->quality = std::max(old_quality,
            std::min(outcome.target_quality, get_quality_ceiling(business->sector_id)));
        business->quality_improved_tiers += std::max(0, business->quality - old_quality);
        business->scale_ebitda(outcome.ebitda_multiplier);
        business->peak_ebitda = std::max(business->peak_ebitda, business->ebitda);
        business->peak_revenue = std::max(business->peak_revenue, business->revenue);

        if (DEBUG) std::cout << "Turnaround " << t.id << " " << to_string(outcome.result) << std::endl;
        record_action(GameActionType::TurnaroundResolved, t.business_id, 0.0, to_string(outcome.result));
    }
}

bool Game::pay_down_debt(double amount) {
    if (!in_phase(GamePhase::Allocate)) return false;
    double payment = std::min(amount, std::min(state.holdco_loan_balance, state.cash));
    if (payment <= 0) return false;

    state.holdco_loan_balance -= payment;
    state.cash -= payment;
    state.total_debt = state.compute_total_debt();
    record_action(GameActionType::PayDebt, "", payment, "holdco");
    return true;
}

bool Game::pay_down_bank_debt(const std::string& business_id, double amount) {
    if (!in_phase(GamePhase::Allocate)) return false;
    Business* business = state.find_business(business_id);
    if (!business || !business->is_active() || business->bank_debt_balance <= 0) return false;
    double payment = std::min(amount, std::min(business->bank_debt_balance, state.cash));
    if (payment <= 0) return false;

    business->bank_debt_balance -= payment;
    state.cash -= payment;
    state.total_debt = state.compute_total_debt();
    record_action(GameActionType::PayDebt, business_id, payment, "bank");
    return true;
}

bool Game::issue_equity(double amount) {
    if (!in_phase(GamePhase::Allocate) || amount <= 0 || state.requires_restructuring) return false;
    if (state.last_buyback_round > 0 && state.round - state.last_buyback_round < EQUITY_BUYBACK_COOLDOWN) return false;

    Metrics m = calculate_metrics(state);
    if (m.intrinsic_value_per_share <= 0) return false;

    double discount = std::max(1.0 - EQUITY_DILUTION_STEP * state.equity_raises_used, EQUITY_DILUTION_FLOOR);
    double price = m.intrinsic_value_per_share * discount;
    double new_shares = std::round(amount / price * 1000.0) / 1000.0;
    double total_shares = state.shares_outstanding + new_shares;
    if (state.founder_shares / total_shares < MIN_FOUNDER_OWNERSHIP) return false;

    state.cash += amount;
    state.shares_outstanding = total_shares;
    ++state.equity_raises_used;
    state.last_equity_raise_round = state.round;
    record_action(GameActionType::IssueEquity, "", amount);
    return true;
}

bool Game::buyback_shares(double amount) {
    if (!in_phase(GamePhase::Allocate) || amount <= 0 || state.cash < amount) return false;
    if (state.active_count() == 0) return false;
    if (state.last_equity_raise_round > 0 && state.round - state.last_equity_raise_round < EQUITY_BUYBACK_COOLDOWN) {
        return false;
    }

    Metrics m = calculate_metrics(state);
    if (!get_distress_restrictions(m.distress_level).can_buyback) return false;
    if (m.intrinsic_value_per_share <= 0) return false;

    double outside_shares = state.shares_outstanding - state.founder_shares;
    if (outside_shares <= 0) return false;
    double repurchased = std::min(std::round(amount / m.intrinsic_value_per_share * 1000.0) / 1000.0, outside_shares);

    double total_shares = state.shares_outstanding - repurchased;
    if (std::fabs(total_shares - state.founder_shares) < 0.01) total_shares = state.founder_shares;

    state.cash -= amount;
    state.shares_outstanding = total_shares;
    state.total_buybacks += amount;
    state.last_buyback_round = state.round;
    record_action(GameActionType::Buyback, "", amount);
    return true;
}

bool Game::distribute_to_owners(double amount) {
    if (!in_phase(GamePhase::Allocate) || amount <= 0 || state.cash < amount) return false;
    if (!current_restrictions().can_distribute) return false;

    state.founder_distributions_received += round_half_up(amount * state.founder_ownership());
    state.cash -= amount;
    state.total_distributions += amount;
    record_action(GameActionType::Distribute, "", amount);
    return true;
}

double Game::dispose_business(Business& business, double exit_price) {
    double debt = business.seller_note_balance + business.bank_debt_balance + business.earnout_remaining;
    std::vector<std::string> bolt_on_ids = business.bolt_on_ids;
    for (const std::string& id : bolt_on_ids) {
        const Business* bolt_on = state.find_business(id);
        if (bolt_on && bolt_on->status == BusinessStatus::Integrated) {
            debt += bolt_on->seller_note_balance + bolt_on->bank_debt_balance + bolt_on->earnout_remaining;
        }
    }
    // Rolled-over sellers keep their share of the equity at exit
    double net = round_half_up(std::max(0.0, exit_price - debt) * (1.0 - business.rollover_equity_pct));

    business.status = BusinessStatus::Sold;
    business.exit_price = exit_price;
    business.exit_round = state.round;
    drop_turnarounds(state, business.id);
    state.exited_businesses.push_back(business);
    for (const std::string& id : bolt_on_ids) {
        Business* bolt_on = state.find_business(id);
        if (!bolt_on || bolt_on->status != BusinessStatus::Integrated) continue;
        bolt_on->status = BusinessStatus::Sold;
        bolt_on->exit_price = 0.0;
        bolt_on->exit_round = state.round;
        state.exited_businesses.push_back(*bolt_on);
    }

    state.cash += net;
    state.total_exit_proceeds += net;
    auto_deactivate_shared_services();
    state.total_debt = state.compute_total_debt();
    return net;
}

bool Game::sell_business(const std::string& business_id) {
    if (!in_phase(GamePhase::Allocate)) return false;
    Business* business = state.find_business(business_id);
    if (!business || !business->is_active()) return false;

    std::optional<EventType> last_event = last_event_type(state);
    ExitValuation valuation = calculate_exit_valuation(*business, state.round, last_event);
    SeededRng buyer_rng = round_streams().market.fork("buyer-" + business_id);
    BuyerProfile buyer = generate_buyer_profile(*business, valuation.buyer_pool_tier, buyer_rng);

    double multiple = valuation.total_multiple + (buyer.is_strategic ? buyer.strategic_premium : 0.0);
    double roll = take_roll(outcomes.sell_variance_rolls, state.sell_rolls_used, "sell");
    double variance = roll * 0.2 - 0.1;
    if (last_event == EventType::GlobalBullMarket) {
        variance = roll * 0.3;
    } else if (last_event == EventType::GlobalRecession) {
        variance = -(roll * 0.3);
    }
    double exit_price = std::max(0.0, round_half_up(business->ebitda * std::max(MIN_EXIT_MULTIPLE, multiple + variance)));

    double net = dispose_business(*business, exit_price);
    if (DEBUG) std::cout << "Sold " << business_id << " to " << buyer.name << " net " << net << std::endl;
    record_action(GameActionType::Sell, business_id, exit_price, buyer.name);
    return true;
}

GameEvent* Game::pending_choice(EventType type) {
    if (!in_phase(GamePhase::Event) || !state.current_event) return nullptr;
    GameEvent& event = *state.current_event;
    if (event.type != type || event.choices.empty()) return nullptr;
    return &event;
}

bool Game::resolve_choice(ChoiceAction action) {
    switch (action) {
    case ChoiceAction::AcceptOffer: return accept_offer();
    case ChoiceAction::DeclineOffer: return decline_offer();
    case ChoiceAction::GrantEquityDemand: return grant_equity_demand();
    case ChoiceAction::DeclineEquityDemand: return decline_equity_demand();
    case ChoiceAction::AcceptSellerNoteRenego: return accept_seller_note_renego();
    case ChoiceAction::DeclineSellerNoteRenego: return decline_seller_note_renego();
    }
    return false;
}

bool Game::accept_offer() {
    GameEvent* event = pending_choice(EventType::UnsolicitedOffer);
    if (!event || event->offer_amount <= 0) return false;
    Business* business = state.find_business(event->affected_business_id);
    if (!business || !business->is_active()) return false;

    dispose_business(*business, event->offer_amount);
    event->choices.clear();
    record_action(GameActionType::AcceptOffer, event->affected_business_id, event->offer_amount,
        event->buyer_profile ? event->buyer_profile->name : "");
    return true;
}

bool Game::decline_offer() {
    GameEvent* event = pending_choice(EventType::UnsolicitedOffer);
    if (!event) return false;
    event->choices.clear();
    record_action(GameActionType::DeclineOffer, event->affected_business_id);
    return true;
}

bool Game::grant_equity_demand() {
    GameEvent* event = pending_choice(EventType::PortfolioEquityDemand);
    if (!event) return false;
    Business* business = state.find_business(event->affected_business_id);
    if (!business) return false;

    state.shares_outstanding += event->equity_dilution_shares;
    business->ebitda_margin = clamp_margin(business->ebitda_margin + 0.01);
    business->rederive_ebitda();
    business->organic_growth_rate += 0.02;
    business->revenue_growth_rate += 0.02;
    event->choices.clear();
    return true;
}

bool Game::decline_equity_demand() {
    GameEvent* event = pending_choice(EventType::PortfolioEquityDemand);
    if (!event) return false;
    Business* business = state.find_business(event->affected_business_id);

    double roll = take_roll(outcomes.event_decline_rolls, state.decline_rolls_used, "decline");
    if (business && roll < 0.60) {
        // The manager walks
        business->revenue = round_half_up(business->revenue * 0.94);
        business->ebitda_margin = clamp_margin(business->ebitda_margin - 0.02);
        business->rederive_ebitda();
        business->organic_growth_rate -= 0.015;
        business->revenue_growth_rate -= 0.015;
    }
    event->choices.clear();
    return true;
}

bool Game::accept_seller_note_renego() {
    GameEvent* event = pending_choice(EventType::PortfolioSellerNoteRenego);
    if (!event) return false;
    Business* business = state.find_business(event->affected_business_id);
    if (!business) return false;

    double payoff = round_half_up(business->seller_note_balance * event->renego_payoff_pct);
    if (state.cash < payoff) return false;

    state.cash -= payoff;
    business->seller_note_balance = 0.0;
    business->seller_note_rounds_remaining = 0;
    event->choices.clear();
    return true;
}

bool Game::decline_seller_note_renego() {
    GameEvent* event = pending_choice(EventType::PortfolioSellerNoteRenego);
    if (!event) return false;
    event->choices.clear();
    return true;
}

bool Game::set_ma_focus(const std::string& sector_id, SizePreference size, const std::string& sub_type) {
    if (state.game_over) return false;
    if (!sector_id.empty() && !is_sector(sector_id)) return false;

    bool keep_sub_type = sector_id == state.ma_focus.sector_id && state.ma_sourcing.tier >= 2 && state.ma_sourcing.active;
    state.ma_focus.sector_id = sector_id;
    state.ma_focus.size_preference = size;
    state.ma_focus.sub_type = keep_sub_type ? sub_type : "";
    return true;
}

bool Game::source_deals() {
    if (!in_phase(GamePhase::Allocate)) return false;
    double cost = state.ma_sourcing.active && state.ma_sourcing.tier >= 1 ? DEAL_SOURCING_COST_TIER1
                                                                          : DEAL_SOURCING_COST_BASE;
    if (state.cash < cost) return false;

    // Occurrence counter in the key so a second call in the round draws new deals
    SeededRng rng = round_streams().deals.fork("source-" + std::to_string(state.sourcing_count_this_round));
    std::vector<Deal> deals = deal_generator.generate_sourced_deals(state.round, pipeline_context(), rng);
    ++state.sourcing_count_this_round;

    state.deal_pipeline.insert(state.deal_pipeline.end(), deals.begin(), deals.end());
    state.cash -= cost;
    record_action(GameActionType::SourceDeals, "", cost, std::to_string(deals.size()) + " deals");
    return true;
}

bool Game::upgrade_ma_sourcing() {
    if (!in_phase(GamePhase::Allocate) || state.ma_sourcing.tier >= 3) return false;
    const MASourcingTierConfig& next = ma_sourcing_config(state.ma_sourcing.tier + 1);
    if (state.cash < next.upgrade_cost || state.active_count() < next.min_opcos) return false;

    int from = state.ma_sourcing.tier;
    state.ma_sourcing.tier = next.tier;
    state.ma_sourcing.active = true;
    if (state.ma_sourcing.unlocked_round == 0) state.ma_sourcing.unlocked_round = state.round;
    state.ma_sourcing.last_upgrade_round = state.round;
    state.max_acquisitions_per_round = get_max_acquisitions(next.tier);
    if (next.tier < 2) state.ma_focus.sub_type.clear();

    state.cash -= next.upgrade_cost;
    state.total_invested_capital += next.upgrade_cost;
    record_action(GameActionType::UpgradeMaSourcing, "", next.upgrade_cost,
        "tier " + std::to_string(from) + " to " + std::to_string(next.tier));
    return true;
}

bool Game::toggle_ma_sourcing() {
    if (!in_phase(GamePhase::Allocate) || state.ma_sourcing.tier == 0) return false;
    state.ma_sourcing.active = !state.ma_sourcing.active;
    if (!state.ma_sourcing.active) state.ma_focus.sub_type.clear();
    state.max_acquisitions_per_round = get_max_acquisitions(state.ma_sourcing.active ? state.ma_sourcing.tier : 0);
    record_action(GameActionType::ToggleMaSourcing, "", 0.0, state.ma_sourcing.active ? "on" : "off");
    return true;
}

bool Game::proactive_outreach() {
    if (!in_phase(GamePhase::Allocate)) return false;
    if (state.ma_sourcing.tier < 3 || !state.ma_sourcing.active) return false;
    if (state.cash < PROACTIVE_OUTREACH_COST) return false;

    SeededRng rng = round_streams().deals.fork("outreach-" + std::to_string(state.outreach_count_this_round));
    std::vector<Deal> deals = deal_generator.generate_outreach_deals(state.round, pipeline_context(), rng);
    ++state.outreach_count_this_round;

    state.deal_pipeline.insert(state.deal_pipeline.end(), deals.begin(), deals.end());
    state.cash -= PROACTIVE_OUTREACH_COST;
    record_action(GameActionType::ProactiveOutreach, "", PROACTIVE_OUTREACH_COST,
        std::to_string(deals.size()) + " deals");
    return true;
}

bool Game::distressed_sale(const std::string& business_id) {
    if (!in_phase(GamePhase::Restructure)) return false;
    Business* business = state.find_business(business_id);
    if (!business || !business->is_active()) return false;

    ExitValuation valuation = calculate_exit_valuation(*business, state.round, last_event_type(state));
    double exit_price = round_half_up(valuation.exit_price * DISTRESSED_SALE_PCT);
    double net = dispose_business(*business, exit_price);
    record_action(GameActionType::DistressedSale, business_id, exit_price, format_money(net) + " net");
    return true;
}

bool Game::emergency_equity_raise(double amount) {
    if (!in_phase(GamePhase::Restructure) || amount <= 0) return false;
    Metrics m = calculate_metrics(state);
    if (m.intrinsic_value_per_share <= 0) return false;

    // Flat discount and no ownership floor
    double price = m.intrinsic_value_per_share * EMERGENCY_EQUITY_PRICE_PCT;
    double new_shares = std::round(amount / price * 1000.0) / 1000.0;
    state.cash += amount;
    state.shares_outstanding += new_shares;
    ++state.equity_raises_used;
    state.last_equity_raise_round = state.round;
    record_action(GameActionType::EmergencyEquityRaise, "", amount);
    return true;
}

bool Game::declare_bankruptcy() {
    if (!in_phase(GamePhase::Restructure)) return false;
    state.game_over = true;
    state.bankrupt_round = state.round;
    state.requires_restructuring = false;
    return true;
}

bool Game::advance_from_restructure() {
    if (!in_phase(GamePhase::Restructure)) return false;
    bool corrected = false;
    for (const GameAction& action : state.actions_this_round) {
        if (action.type == GameActionType::DistressedSale || action.type == GameActionType::EmergencyEquityRaise) {
            corrected = true;
        }
    }
    if (!corrected) return false;

    state.requires_restructuring = false;
    state.has_restructured = true;
    state.covenant_breach_rounds = 0;
    state.phase = GamePhase::Event;

    // The event drawn at collection was held back until now
    if (state.current_event && !is_choice_event(state.current_event->type)) {
        RngStreams streams = round_streams();
        SeededRng rng = streams.events.fork("restructure");
        apply_event_effects(state, *state.current_event, rng);
        if (!state.event_history.empty()) state.event_history.back().impacts = state.current_event->impacts;
        if (state.current_event->type == EventType::PortfolioReferralDeal) {
            SeededRng referral_rng = streams.deals.fork("restructure-referral");
            state.deal_pipeline.push_back(
                deal_generator.generate_referral_deal(state.round, state.max_rounds, referral_rng));
        }
    }
    state.total_debt = state.compute_total_debt();
    return true;
}
