/*
 * EventGenerator.cpp
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


#include "EventGenerator.h"
#include "Constants.h"
#include "Finance.h"
#include "Valuation.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>

#define DEBUG 0

static const std::vector<EventDefinition> GLOBAL_EVENTS = {
    {EventType::GlobalBullMarket, 0.10, "Bull Market",
        "Strong economy lifts demand across the portfolio.",
        "+5-15% EBITDA for all businesses",
        "Rising tides lift all boats. Don't mistake a bull market for operating skill.", "Ch. II"},
    {EventType::GlobalRecession, 0.07, "Recession",
        "Economic contraction hits customer budgets.",
        "EBITDA falls by sector sensitivity",
        "Recessions are when patient capital buys great businesses at fair prices.", "Ch. III"},
    {EventType::GlobalInterestHike, 0.08, "Interest Rate Hike",
        "The central bank raises rates to fight inflation.",
        "+1-2% interest rate",
        "Variable-rate debt turns expensive quickly. Know your coverage.", "Ch. V"},
    {EventType::GlobalInterestCut, 0.08, "Interest Rate Cut",
        "Rates fall and credit becomes cheaper.",
        "-1-2% interest rate",
        "Cheap money tempts. Price discipline matters more than the coupon.", "Ch. V"},
    {EventType::GlobalInflation, 0.06, "Inflation Spike",
        "Input costs and wages rise faster than prices.",
        "-3% growth for 2 years",
        "Businesses with pricing power pass costs through; the rest absorb them.", "Ch. VI"},
    {EventType::GlobalCreditTightening, 0.05, "Credit Tightening",
        "Banks pull back on acquisition lending.",
        "No bank debt for 2 years",
        "Lenders disappear exactly when you want them. Keep dry powder.", "Ch. V"},
    {EventType::GlobalFinancialCrisis, 0.02, "Financial Crisis",
        "Markets seize up and forced sellers appear.",
        "Distressed deals appear at 30-50% off",
        "Be greedy when others are fearful, provided your balance sheet lets you.", "Ch. III"},
};

static const std::vector<EventDefinition> PORTFOLIO_EVENTS = {
    {EventType::PortfolioStarJoins, 0.06, "Star Hire",
        "A top performer joins one of your companies.",
        "+12% EBITDA, +2% growth",
        "Talent compounds. Great operators attract great operators.", "Ch. VII"},
    {EventType::PortfolioTalentLeaves, 0.06, "Key Talent Departs",
        "A key manager leaves for a competitor.",
        "-10% EBITDA, -1.5% growth",
        "Succession depth is part of the asset you bought.", "Ch. VII"},
    {EventType::PortfolioClientSigns, 0.07, "Major Client Win",
        "A large new client signs a multi-year contract.",
        "+8-12% EBITDA",
        "Wins feel permanent. Diversify them anyway.", "Ch. II"},
    {EventType::PortfolioClientChurns, 0.06, "Major Client Loss",
        "A significant client walks away.",
        "-12-18% EBITDA, worse with concentration",
        "Concentration risk shows up all at once.", "Ch. II"},
    {EventType::PortfolioBreakthrough, 0.05, "Operational Breakthrough",
        "A process change unlocks efficiency.",
        "+6% EBITDA",
        "Small improvements, repeated, are the whole game.", "Ch. IV"},
    {EventType::PortfolioCompliance, 0.04, "Compliance Issue",
        "A regulatory problem needs fixing.",
        "-8% EBITDA and up to $500k in costs",
        "Cheap diligence is expensive later.", "Ch. VI"},
    {EventType::PortfolioReferralDeal, 0.05, "Referral Deal",
        "A portfolio CEO introduces a founder looking to sell.",
        "A quality deal joins the pipeline",
        "Your reputation with sellers is a sourcing channel.", "Ch. IV"},
    {EventType::PortfolioEquityDemand, 0.05, "Key Employee Equity Demand",
        "A key employee asks for equity to stay.",
        "Grant equity or risk losing them",
        "Aligned managers are worth the dilution more often than not.", "Ch. VII"},
    {EventType::PortfolioSellerNoteRenego, 0.04, "Seller Note Renegotiation",
        "A former owner offers a discount for early payoff of the seller note.",
        "Pay 75% of the balance to retire the note",
        "Discounted payoffs are a return on cash, compare them to your next deal.", "Ch. V"},
};

static std::vector<SectorEventDefinition> make_sector_events() {
    std::vector<SectorEventDefinition> events;
    auto add = [&events](const char* sector, const char* title, const char* description, const char* effect,
                   Range ebitda, double growth, double cost, bool affects_all, double probability) {
        SectorEventDefinition e;
        e.sector_id = sector;
        e.title = title;
        e.description = description;
        e.effect = effect;
        e.ebitda_effect = ebitda;
        e.growth_effect = growth;
        e.cost = cost;
        e.affects_all = affects_all;
        e.probability = probability;
        events.push_back(e);
    };
    add("agency", "Client Budget Cuts", "Marketing budgets are the first line item cut.",
        "-10-20% EBITDA for agencies", {-0.20, -0.10}, 0.0, 0, true, 0.03);
    add("agency", "AI Disruption", "Generative tools commoditize basic creative work.",
        "-5% EBITDA, -2% growth", {-0.05, -0.05}, -0.02, 0, true, 0.02);
    add("saas", "Platform Shift", "A new platform opens a distribution channel.",
        "+10-20% EBITDA", {0.10, 0.20}, 0.01, 0, false, 0.03);
    add("saas", "Security Breach", "A breach forces remediation and credits.",
        "-15% EBITDA and $300k in costs", {-0.15, -0.15}, 0.0, 300, false, 0.02);
    add("homeServices", "Extreme Weather Season", "A brutal season drives emergency demand.",
        "+8-15% EBITDA", {0.08, 0.15}, 0.0, 0, true, 0.03);
    add("homeServices", "Technician Shortage", "Skilled trades are hard to hire.",
        "-8% EBITDA", {-0.08, -0.08}, -0.01, 0, true, 0.02);
    add("consumer", "Viral Product Moment", "A product takes off on social media.",
        "+15-25% EBITDA", {0.15, 0.25}, 0.0, 0, false, 0.02);
    add("consumer", "Retailer Delisting", "A major retailer drops the line.",
        "-15-20% EBITDA", {-0.20, -0.15}, 0.0, 0, false, 0.02);
    add("industrial", "Reshoring Wave", "Customers bring production back onshore.",
        "+10% EBITDA, +1% growth", {0.10, 0.10}, 0.01, 0, true, 0.03);
    add("industrial", "Raw Material Spike", "Steel and resin prices jump.",
        "-8-12% EBITDA", {-0.12, -0.08}, 0.0, 0, true, 0.02);
    add("b2bServices", "Outsourcing Tailwind", "Mid-market firms outsource more functions.",
        "+8% EBITDA", {0.08, 0.08}, 0.01, 0, true, 0.03);
    add("healthcare", "Reimbursement Cut", "Payers cut reimbursement rates.",
        "-10% EBITDA", {-0.10, -0.10}, 0.0, 0, true, 0.03);
    add("healthcare", "Regulatory Audit", "An audit finds billing errors.",
        "-5% EBITDA and $250k in costs", {-0.05, -0.05}, 0.0, 250, false, 0.02);
    add("restaurant", "Food Cost Surge", "Commodity food prices surge.",
        "-10-15% EBITDA", {-0.15, -0.10}, 0.0, 0, true, 0.03);
    add("realEstate", "Cap Rate Compression", "Investors bid up stabilized assets.",
        "+5-10% EBITDA", {0.05, 0.10}, 0.0, 0, true, 0.03);
    add("education", "Enrollment Surge", "Demand for training programs jumps.",
        "+10% EBITDA, +1% growth", {0.10, 0.10}, 0.01, 0, true, 0.03);
    add("insurance", "Hard Market", "Premiums rise across lines and commissions follow.",
        "+8-12% EBITDA", {0.08, 0.12}, 0.0, 0, true, 0.03);
    add("autoServices", "EV Transition Pressure", "Fewer oil changes and simpler drivetrains.",
        "-5% EBITDA, -1% growth", {-0.05, -0.05}, -0.01, 0, true, 0.02);
    add("distribution", "Supplier Consolidation", "A key supplier renegotiates terms.",
        "-6-10% EBITDA", {-0.10, -0.06}, 0.0, 0, false, 0.03);
    return events;
}

const std::vector<EventDefinition>& global_events() {
    return GLOBAL_EVENTS;
}

const std::vector<EventDefinition>& portfolio_events() {
    return PORTFOLIO_EVENTS;
}

const std::vector<SectorEventDefinition>& sector_events() {
    static const std::vector<SectorEventDefinition> events = make_sector_events();
    return events;
}

bool is_eligible_for_event(EventType type, const Business& business, int round) {
    if (!business.is_active()) return false;
    switch (type) {
    case EventType::PortfolioEquityDemand:
        return round - business.acquisition_round >= 2 && business.quality >= 3;
    case EventType::PortfolioSellerNoteRenego:
        return round - business.acquisition_round <= 5 && business.seller_note_balance > 0;
    default:
        return true;
    }
}

static GameEvent from_definition(const EventDefinition& def, int round) {
    GameEvent event;
    event.id = "event_" + std::to_string(round) + "_" + to_string(def.type);
    event.type = def.type;
    event.title = def.title;
    event.description = def.description;
    event.effect = def.effect;
    event.tip = def.tip;
    event.tip_source = def.tip_source;
    return event;
}

static void add_choices(GameEvent& event, const Business& business) {
    char buf[160];
    switch (event.type) {
    case EventType::UnsolicitedOffer:
        event.choices.push_back({"Accept Offer", "Sell now at the offered price", ChoiceAction::AcceptOffer,
            "positive", 0.0, 1.0});
        event.choices.push_back({"Decline", "Keep the business", ChoiceAction::DeclineOffer, "neutral", 0.0, 1.0});
        break;
    case EventType::PortfolioEquityDemand:
        event.equity_dilution_shares = EQUITY_DEMAND_DILUTION_SHARES;
        std::snprintf(buf, sizeof(buf), "Issue %d shares; margin +1%%, growth +2%%", EQUITY_DEMAND_DILUTION_SHARES);
        event.choices.push_back({"Grant Equity", buf, ChoiceAction::GrantEquityDemand, "positive", 0.0, 1.0});
        event.choices.push_back({"Decline", "60% chance they leave: revenue -6%, margin -2%, growth -1.5%",
            ChoiceAction::DeclineEquityDemand, "negative", 0.0, 0.4});
        break;
    case EventType::PortfolioSellerNoteRenego: {
        event.renego_payoff_pct = SELLER_NOTE_RENEGO_PAYOFF;
        double payoff = round_half_up(business.seller_note_balance * SELLER_NOTE_RENEGO_PAYOFF);
        event.choices.push_back({"Pay Off Early", "Pay " + format_money(payoff) + " to retire the note",
            ChoiceAction::AcceptSellerNoteRenego, "positive", payoff, 1.0});
        event.choices.push_back({"Keep Terms", "Continue the original schedule", ChoiceAction::DeclineSellerNoteRenego,
            "neutral", 0.0, 1.0});
        break;
    }
    default:
        break;
    }
}

static std::optional<GameEvent> draw_global_event(const GameState& state, SeededRng& rng) {
    double roll = rng.next();
    double cumulative = 0.0;
    for (const EventDefinition& def : GLOBAL_EVENTS) {
        cumulative += def.probability;
        if (roll < cumulative) return from_definition(def, state.round);
    }
    return std::nullopt;
}

static std::optional<GameEvent> draw_portfolio_event(const GameState& state,
    const std::vector<const Business*>& active, SeededRng& rng) {
    SharedServicesBenefits benefits = calculate_shared_services_benefits(state);
    double roll = rng.next();
    double cumulative = 0.0;
    for (const EventDefinition& def : PORTFOLIO_EVENTS) {
        std::vector<const Business*> eligible;
        for (const Business* b : active) {
            if (is_eligible_for_event(def.type, *b, state.round)) eligible.push_back(b);
        }
        // An event nobody qualifies for cannot fire and takes no probability
        if (eligible.empty()) continue;

        double p = def.probability;
        if (def.type == EventType::PortfolioTalentLeaves) {
            p *= std::max(0.0, 1.0 - benefits.talent_retention_bonus);
        } else if (def.type == EventType::PortfolioStarJoins) {
            p *= 1.0 + benefits.talent_gain_bonus;
        }
        cumulative += p;
        if (roll < std::min(1.0, cumulative)) {
            const Business* target = rng.pick(eligible);
            GameEvent event = from_definition(def, state.round);
            event.affected_business_id = target->id;
            add_choices(event, *target);
            return event;
        }
    }
    return std::nullopt;
}

static std::optional<GameEvent> draw_sector_event(const GameState& state,
    const std::vector<const Business*>& active, SeededRng& rng) {
    const std::vector<SectorEventDefinition>& all = sector_events();
    std::vector<int> applicable;
    for (size_t i = 0; i < all.size(); ++i) {
        for (const Business* b : active) {
            if (b->sector_id == all[i].sector_id) {
                applicable.push_back((int)i);
                break;
            }
        }
    }
    if (applicable.empty()) return std::nullopt;

    double roll = rng.next();
    double cumulative = 0.0;
    for (int index : applicable) {
        const SectorEventDefinition& def = all[index];
        cumulative += def.probability;
        if (roll >= cumulative) continue;

        std::vector<const Business*> in_sector;
        for (const Business* b : active) {
            if (b->sector_id == def.sector_id) in_sector.push_back(b);
        }
        GameEvent event;
        std::string slug = def.title;
        std::replace(slug.begin(), slug.end(), ' ', '_');
        event.id = "event_" + std::to_string(state.round) + "_" + def.sector_id + "_" + slug;
        event.type = EventType::SectorEvent;
        event.title = def.title;
        event.description = def.description;
        event.effect = def.effect;
        event.sector_event_index = index;
        if (!def.affects_all) event.affected_business_id = rng.pick(in_sector)->id;
        return event;
    }
    return std::nullopt;
}

static std::optional<GameEvent> draw_unsolicited_offer(const GameState& state,
    const std::vector<const Business*>& active, SeededRng& rng) {
    double chance = 1.0 - std::pow(0.95, (double)active.size());
    if (rng.next() >= chance) return std::nullopt;

    const Business* business = rng.pick(active);
    ExitValuation valuation = calculate_exit_valuation(*business, state.round);
    BuyerProfile buyer = generate_buyer_profile(*business, valuation.buyer_pool_tier, rng);

    double multiple = valuation.total_multiple;
    if (buyer.is_strategic) multiple += buyer.strategic_premium;
    multiple *= 0.9 + rng.next() * 0.3;
    multiple = std::max(MIN_EXIT_MULTIPLE, multiple);
    double amount = round_half_up(business->ebitda * multiple);

    GameEvent event;
    event.id = "event_" + std::to_string(state.round) + "_unsolicited_" + business->id;
    event.type = EventType::UnsolicitedOffer;
    event.title = "Unsolicited Acquisition Offer";
    char buf[320];
    std::string buyer_label = buyer.is_strategic ? "Strategic acquirer " + buyer.name : buyer.name;
    std::snprintf(buf, sizeof(buf), "%s has approached you with an offer to acquire %s for %s (%.1fx EBITDA).",
        buyer_label.c_str(), business->name.c_str(), format_money(amount).c_str(), multiple);
    event.description = buf;
    event.effect = "Accept to sell immediately, or decline to keep the business";
    event.tip = "The best holdcos know when to sell. If the price is right and you can redeploy capital at higher "
                "returns, it's worth considering.";
    event.tip_source = "Ch. IV";
    event.affected_business_id = business->id;
    event.offer_amount = amount;
    event.offer_multiple = multiple;
    event.buyer_profile = buyer;
    add_choices(event, *business);
    return event;
}

GameEvent generate_event(const GameState& state, SeededRng& rng) {
    std::vector<const Business*> active = state.active_businesses();

    std::optional<GameEvent> event = draw_global_event(state, rng);
    if (!event && !active.empty()) event = draw_portfolio_event(state, active, rng);
    if (!event) event = draw_sector_event(state, active, rng);
    if (!event && !active.empty()) event = draw_unsolicited_offer(state, active, rng);
    if (event) {
        if (DEBUG) std::cout << "event round " << state.round << ": " << event->id << std::endl;
        return *event;
    }

    GameEvent quiet;
    quiet.id = "event_" + std::to_string(state.round) + "_quiet";
    quiet.type = EventType::GlobalQuiet;
    quiet.title = "Quiet Year";
    quiet.description = "Markets are stable. Business as usual.";
    quiet.effect = "No special effects this year";
    return quiet;
}

static void record_ebitda(GameEvent& event, const Business& b, double before, double pct) {
    EventImpact impact;
    impact.business_id = b.id;
    impact.business_name = b.name;
    impact.metric = ImpactMetric::Ebitda;
    impact.before = before;
    impact.after = b.ebitda;
    impact.delta = b.ebitda - before;
    impact.delta_pct = pct;
    event.impacts.push_back(impact);
}

static void record_value(GameEvent& event, ImpactMetric metric, double before, double after, bool with_pct) {
    EventImpact impact;
    impact.metric = metric;
    impact.before = before;
    impact.after = after;
    impact.delta = after - before;
    if (with_pct) impact.delta_pct = before > 0 ? (after - before) / before : 0.0;
    event.impacts.push_back(impact);
}

static void scale_business(GameEvent& event, Business& b, double pct, double growth_delta) {
    double before = b.ebitda;
    b.scale_ebitda(1.0 + pct);
    if (growth_delta != 0.0) b.organic_growth_rate = cap_growth_rate(b.organic_growth_rate + growth_delta);
    record_ebitda(event, b, before, pct);
}

static void charge_cash(GameState& state, GameEvent& event, double cost) {
    double actual = std::min(cost, std::max(0.0, state.cash));
    record_value(event, ImpactMetric::Cash, state.cash, state.cash - actual, false);
    state.cash -= actual;
}

static void apply_bull_market(GameState& state, GameEvent& event, SeededRng& rng) {
    double boost = 0.05 + rng.next() * 0.10;
    for (Business& b : state.businesses) {
        if (b.is_active()) scale_business(event, b, boost, 0.0);
    }
}

static void apply_recession(GameState& state, GameEvent& event) {
    for (Business& b : state.businesses) {
        if (!b.is_active()) continue;
        double impact = get_sector(b.sector_id).recession_sensitivity * 0.15;
        scale_business(event, b, -impact, 0.0);
    }
}

static void apply_rate_change(GameState& state, GameEvent& event, SeededRng& rng, bool hike) {
    double before = state.interest_rate;
    double step = 0.01 + rng.next() * 0.01;
    state.interest_rate = hike ? std::min(MAX_INTEREST_RATE, before + step)
                               : std::max(MIN_INTEREST_RATE, before - step);
    record_value(event, ImpactMetric::InterestRate, before, state.interest_rate, true);
}

static void apply_business_event(GameState& state, GameEvent& event, SeededRng& rng) {
    Business* b = state.find_business(event.affected_business_id);
    if (!b) return;
    switch (event.type) {
    case EventType::PortfolioStarJoins:
        scale_business(event, *b, 0.12, 0.02);
        break;
    case EventType::PortfolioTalentLeaves:
        scale_business(event, *b, -0.10, -0.015);
        break;
    case EventType::PortfolioClientSigns:
        scale_business(event, *b, 0.08 + rng.next() * 0.04, 0.0);
        break;
    case EventType::PortfolioClientChurns: {
        Level concentration = get_sector(b->sector_id).client_concentration;
        double factor = concentration == Level::High ? 1.3 : concentration == Level::Medium ? 1.0 : 0.7;
        double impact = (0.12 + rng.next() * 0.06) * factor;
        scale_business(event, *b, -impact, 0.0);
        break;
    }
    case EventType::PortfolioBreakthrough:
        scale_business(event, *b, 0.06, 0.0);
        break;
    case EventType::PortfolioCompliance:
        scale_business(event, *b, -0.08, 0.0);
        charge_cash(state, event, 500);
        break;
    default:
        break;
    }
}

static void apply_sector_event(GameState& state, GameEvent& event, SeededRng& rng) {
    if (event.sector_event_index < 0 || event.sector_event_index >= (int)sector_events().size()) return;
    const SectorEventDefinition& def = sector_events()[event.sector_event_index];
    double pct = def.ebitda_effect.min == def.ebitda_effect.max
        ? def.ebitda_effect.min
        : rng.next_in_range(def.ebitda_effect.min, def.ebitda_effect.max);

    if (def.affects_all) {
        for (Business& b : state.businesses) {
            if (b.is_active() && b.sector_id == def.sector_id) scale_business(event, b, pct, def.growth_effect);
        }
    } else if (Business* b = state.find_business(event.affected_business_id)) {
        scale_business(event, *b, pct, def.growth_effect);
    }
    if (def.cost > 0) charge_cash(state, event, def.cost);
}

void apply_event_effects(GameState& state, GameEvent& event, SeededRng& rng) {
    switch (event.type) {
    case EventType::GlobalBullMarket:
        apply_bull_market(state, event, rng);
        break;
    case EventType::GlobalRecession:
        apply_recession(state, event);
        break;
    case EventType::GlobalInterestHike:
        apply_rate_change(state, event, rng, true);
        break;
    case EventType::GlobalInterestCut:
        apply_rate_change(state, event, rng, false);
        break;
    case EventType::GlobalInflation:
        state.inflation_rounds_remaining = 2;
        break;
    case EventType::GlobalCreditTightening:
        state.credit_tightening_rounds_remaining = 2;
        break;
    case EventType::PortfolioStarJoins:
    case EventType::PortfolioTalentLeaves:
    case EventType::PortfolioClientSigns:
    case EventType::PortfolioClientChurns:
    case EventType::PortfolioBreakthrough:
    case EventType::PortfolioCompliance:
        apply_business_event(state, event, rng);
        break;
    case EventType::SectorEvent:
        apply_sector_event(state, event, rng);
        break;
    // Deal injections happen in the game loop; choice events wait for the player
    case EventType::GlobalFinancialCrisis:
    case EventType::PortfolioReferralDeal:
    case EventType::PortfolioEquityDemand:
    case EventType::PortfolioSellerNoteRenego:
    case EventType::UnsolicitedOffer:
    case EventType::GlobalQuiet:
        break;
    }
}
