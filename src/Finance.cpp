/*
 * Finance.cpp
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


#include "Finance.h"
#include "Sectors.h"
#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iostream>
#include <map>

#define DEBUG 0

static const MASourcingTierConfig MA_SOURCING_TIERS[] = {
    {0, "None", 0, 0, 0},
    {1, "Deal Sourcing Team", 800, 350, 2},
    {2, "Sector Specialists", 1200, 500, 3},
    {3, "Proprietary Network", 1600, 700, 4},
};

const MASourcingTierConfig& ma_sourcing_config(int tier) {
    return MA_SOURCING_TIERS[std::min(3, std::max(0, tier))];
}

double ma_sourcing_annual_cost(int tier) {
    return ma_sourcing_config(tier).annual_cost;
}

double calculate_annual_fcf(const Business& business, double capex_reduction, double cash_conversion_bonus) {
    const SectorDefinition& sector = get_sector(business.sector_id);
    double capex_rate = sector.capex_rate * (1.0 - capex_reduction);
    double fcf = business.ebitda - business.ebitda * capex_rate;
    fcf *= 1.0 + cash_conversion_bonus;
    return round_half_up(fcf);
}

PortfolioTax calculate_portfolio_tax(const std::vector<Business>& businesses, double holdco_debt,
    double holdco_rate, double shared_services_cost) {
    PortfolioTax tax;
    double opco_interest = 0.0;
    for (const Business& b : businesses) {
        if (!b.is_active()) continue;
        if (b.ebitda >= 0) {
            tax.gross_ebitda += b.ebitda;
        } else {
            tax.loss_offset += std::fabs(b.ebitda);
        }
        opco_interest += round_half_up(b.seller_note_balance * b.seller_note_rate);
        opco_interest += round_half_up(b.bank_debt_balance * b.bank_debt_rate);
    }
    tax.net_ebitda = tax.gross_ebitda - tax.loss_offset;
    tax.holdco_interest = round_half_up(holdco_debt * holdco_rate);
    tax.opco_interest = opco_interest;
    tax.total_interest = tax.holdco_interest + tax.opco_interest;
    tax.shared_services_cost = shared_services_cost;

    tax.taxable_income = std::max(0.0, tax.net_ebitda - tax.total_interest - shared_services_cost);
    tax.tax_amount = round_half_up(tax.taxable_income * TAX_RATE);
    double naive_tax = round_half_up(std::max(0.0, tax.gross_ebitda) * TAX_RATE);
    tax.effective_tax_rate = tax.gross_ebitda > 0 ? tax.tax_amount / tax.gross_ebitda : 0.0;

    // Shields are attributed in deduction order: losses, interest, overhead
    double remaining = std::max(0.0, tax.gross_ebitda);
    double loss_deduction = std::min(remaining, tax.loss_offset);
    tax.loss_offset_tax_shield = round_half_up(loss_deduction * TAX_RATE);
    remaining -= loss_deduction;
    double interest_deduction = std::min(remaining, tax.total_interest);
    tax.interest_tax_shield = round_half_up(interest_deduction * TAX_RATE);
    remaining -= interest_deduction;
    double overhead_deduction = std::min(remaining, shared_services_cost);
    tax.shared_services_tax_shield = round_half_up(overhead_deduction * TAX_RATE);

    tax.total_tax_savings = naive_tax - tax.tax_amount;
    return tax;
}

double calculate_portfolio_fcf(const std::vector<Business>& businesses, double capex_reduction,
    double cash_conversion_bonus, double holdco_debt, double holdco_rate, double shared_services_cost) {
    double pre_tax = 0.0;
    for (const Business& b : businesses) {
        if (b.is_active()) pre_tax += calculate_annual_fcf(b, capex_reduction, cash_conversion_bonus);
    }
    PortfolioTax tax = calculate_portfolio_tax(businesses, holdco_debt, holdco_rate, shared_services_cost);
    return pre_tax - tax.tax_amount;
}

SharedServicesBenefits calculate_shared_services_benefits(const GameState& state) {
    SharedServicesBenefits benefits;
    int opcos = state.active_count();
    double scale = opcos >= 6 ? 1.2 : opcos >= 3 ? 1.0 + (opcos - 2) * 0.05 : 1.0;

    for (const SharedService& service : state.shared_services) {
        if (!service.active) continue;
        switch (service.type) {
        case SharedServiceType::FinanceReporting:
            benefits.cash_conversion_bonus += 0.05 * scale;
            break;
        case SharedServiceType::RecruitingHr:
            benefits.talent_retention_bonus += 0.5 * scale;
            benefits.talent_gain_bonus += 0.3 * scale;
            break;
        case SharedServiceType::Procurement:
            benefits.capex_reduction += 0.15 * scale;
            break;
        case SharedServiceType::MarketingBrand:
            benefits.growth_bonus += 0.015 * scale;
            break;
        case SharedServiceType::TechnologySystems:
            benefits.reinvestment_bonus += 0.2 * scale;
            break;
        }
    }
    return benefits;
}

std::optional<SectorFocusBonus> calculate_sector_focus_bonus(const std::vector<Business>& businesses) {
    int active = 0;
    // Insertion-ordered counts so ties resolve to the first group seen
    std::vector<std::pair<std::string, int>> counts;
    for (const Business& b : businesses) {
        if (!b.is_active()) continue;
        ++active;
        for (const std::string& group : get_sector(b.sector_id).focus_groups) {
            auto it = std::find_if(counts.begin(), counts.end(),
                [&group](const std::pair<std::string, int>& c) { return c.first == group; });
            if (it == counts.end()) {
                counts.emplace_back(group, 1);
            } else {
                it->second++;
            }
        }
    }
    if (active < 2) return std::nullopt;

    std::string max_group;
    int max_count = 0;
    for (const auto& c : counts) {
        if (c.second > max_count) {
            max_count = c.second;
            max_group = c.first;
        }
    }
    if (max_count < 2) return std::nullopt;

    SectorFocusBonus bonus;
    bonus.focus_group = max_group;
    bonus.opco_count = max_count;
    bonus.tier = max_count >= 4 ? 3 : max_count >= 3 ? 2 : 1;
    return bonus;
}

double sector_focus_ebitda_bonus(int tier) {
    switch (tier) {
    case 1: return 0.02;
    case 2: return 0.04;
    case 3: return 0.07;
    default: return 0.0;
    }
}

double sector_focus_multiple_discount(int tier) {
    switch (tier) {
    case 2: return 0.3;
    case 3: return 0.5;
    default: return 0.0;
    }
}

Business apply_organic_growth(const Business& business, double shared_growth_bonus,
    double focus_bonus, bool inflation_active, SeededRng& rng) {
    const SectorDefinition& sector = get_sector(business.sector_id);
    Business grown = business;

    double growth = cap_growth_rate(business.organic_growth_rate);
    growth += sector.volatility * (rng.next() * 2.0 - 1.0);
    growth += shared_growth_bonus;
    if ((business.sector_id == "agency" || business.sector_id == "consumer") && shared_growth_bonus > 0) {
        growth += 0.01;
    }
    growth += focus_bonus;
    if (business.integration_rounds_remaining > 0) {
        growth -= 0.03 + rng.next() * 0.05;
        growth += business.integration_growth_drag;
    }
    if (inflation_active) {
        growth -= 0.03;
    }

    double new_ebitda = round_half_up(business.ebitda * (1.0 + growth));
    double floor = round_half_up(business.acquisition_ebitda * EBITDA_FLOOR_PCT);
    new_ebitda = std::max(new_ebitda, floor);

    grown.ebitda = new_ebitda;
    grown.peak_ebitda = std::max(business.peak_ebitda, new_ebitda);
    grown.integration_rounds_remaining = std::max(0, business.integration_rounds_remaining - 1);
    if (grown.integration_rounds_remaining == 0) grown.integration_growth_drag = 0.0;
    grown.organic_growth_rate = cap_growth_rate(business.organic_growth_rate);

    // Margin drifts each year; revenue follows from EBITDA at the new margin
    grown.ebitda_margin = clamp_margin(business.ebitda_margin + business.margin_drift_rate);
    if (grown.ebitda_margin > 0) {
        grown.revenue = round_half_up(grown.ebitda / grown.ebitda_margin);
    }
    grown.peak_revenue = std::max(business.peak_revenue, grown.revenue);
    grown.revenue_growth_rate = business.revenue > 0 ? (grown.revenue - business.revenue) / business.revenue : 0.0;

    if (DEBUG) std::cout << "growth " << business.id << " g=" << growth << " ebitda " << business.ebitda
                         << " -> " << new_ebitda << std::endl;
    return grown;
}

DistressLevel calculate_distress_level(double net_debt_to_ebitda, double total_debt, double total_ebitda) {
    if (total_debt <= 0 && net_debt_to_ebitda <= 0) return DistressLevel::Comfortable;
    if (total_ebitda <= 0 && total_debt > 0) return DistressLevel::Breach;
    if (net_debt_to_ebitda >= COVENANT_BREACH_RATIO) return DistressLevel::Breach;
    if (net_debt_to_ebitda >= 3.5) return DistressLevel::Stressed;
    if (net_debt_to_ebitda >= 2.5) return DistressLevel::Elevated;
    return DistressLevel::Comfortable;
}

DistressRestrictions get_distress_restrictions(DistressLevel level) {
    switch (level) {
    case DistressLevel::Comfortable:
    case DistressLevel::Elevated:
        return {true, true, true, true, 0.0};
    case DistressLevel::Stressed:
        return {true, false, true, true, 0.01};
    case DistressLevel::Breach:
        return {false, false, false, false, 0.02};
    }
    return {};
}

const char* distress_label(DistressLevel level) {
    switch (level) {
    case DistressLevel::Comfortable: return "Healthy";
    case DistressLevel::Elevated: return "Elevated";
    case DistressLevel::Stressed: return "Covenant Watch";
    case DistressLevel::Breach: return "COVENANT BREACH";
    }
    return "Healthy";
}

const char* distress_description(DistressLevel level) {
    switch (level) {
    case DistressLevel::Comfortable:
        return "Leverage is within normal bounds. Full access to capital markets and deal-making.";
    case DistressLevel::Elevated:
        return "Leverage is getting high. Banks are watching more closely.";
    case DistressLevel::Stressed:
        return "Lenders have put the holdco on covenant watch. Bank debt is unavailable and a 1% interest penalty applies.";
    case DistressLevel::Breach:
        return "Debt covenants are breached. No acquisitions, distributions or buybacks, and a 2% interest penalty applies. "
               "Two years in breach force a restructuring.";
    }
    return "";
}

CovenantHeadroom calculate_covenant_headroom(const GameState& state, double total_debt,
    double total_ebitda, double interest_penalty) {
    CovenantHeadroom headroom;
    double cash = state.cash;
    if (total_ebitda > 0) {
        headroom.current_leverage = std::max(0.0, total_debt - cash) / total_ebitda;
        headroom.headroom_cash = cash - (total_debt - COVENANT_BREACH_RATIO * total_ebitda);
    } else {
        headroom.no_ebitda = total_debt > 0;
        headroom.current_leverage = 0.0;
        headroom.headroom_cash = total_debt > 0 ? 0.0 : cash;
    }
    headroom.headroom_ratio = headroom.no_ebitda ? 0.0 : COVENANT_BREACH_RATIO - headroom.current_leverage;

    double service = 0.0;
    if (state.holdco_loan_balance > 0 && state.holdco_loan_rounds_remaining > 0) {
        service += round_half_up(state.holdco_loan_balance * (state.holdco_loan_rate + interest_penalty));
        service += round_half_up(state.holdco_loan_balance / state.holdco_loan_rounds_remaining);
    }
    for (const Business& b : state.businesses) {
        if (b.bank_debt_balance > 0 && b.bank_debt_rounds_remaining > 0) {
            double rate = b.bank_debt_rate > 0 ? b.bank_debt_rate : state.interest_rate;
            service += round_half_up(b.bank_debt_balance * rate);
            service += round_half_up(b.bank_debt_balance / b.bank_debt_rounds_remaining);
        }
    }
    headroom.next_year_debt_service = service;
    headroom.projected_cash_after_debt = cash - service;
    headroom.cash_will_go_negative = headroom.projected_cash_after_debt < 0;
    return headroom;
}

/**
 * Pays min(due, available) of an amortizing instrument. Interest is settled
 * before principal and the term only advances on a full payment.
 */
static double pay_instrument(double& balance, double rate, int& rounds_remaining, double& available,
    bool& skipped) {
    double paid = 0.0;
    if (balance > 0 && rounds_remaining > 0) {
        double interest = round_half_up(balance * rate);
        double principal = round_half_up(balance / rounds_remaining);
        double due = interest + principal;
        double actual = std::min(due, std::max(0.0, available));
        if (actual < due) skipped = true;
        double principal_paid = std::max(0.0, actual - interest);
        balance = std::max(0.0, balance - principal_paid);
        if (actual >= due) rounds_remaining -= 1;
        available -= actual;
        paid += actual;
    }
    // Balloon when the term has run out
    if (rounds_remaining <= 0 && balance > 0) {
        double final_payment = std::min(balance, std::max(0.0, available));
        if (final_payment < balance) skipped = true;
        balance -= final_payment;
        available -= final_payment;
        paid += final_payment;
    }
    return paid;
}

CollectionSummary run_collection_waterfall(GameState& state) {
    CollectionSummary summary;
    SharedServicesBenefits benefits = calculate_shared_services_benefits(state);
    Metrics metrics = calculate_metrics(state);
    DistressRestrictions restrictions = get_distress_restrictions(metrics.distress_level);

    double services_cost = state.shared_services_cost();
    double sourcing_cost = state.ma_sourcing.active ? ma_sourcing_annual_cost(state.ma_sourcing.tier) : 0.0;
    summary.overhead = services_cost + sourcing_cost;
    summary.turnaround_costs = get_turnaround_tier_annual_cost(state.turnaround_tier) +
        get_turnaround_program_costs(state.active_turnarounds);

    // (a) and (b): pre-tax FCF less portfolio tax; turnaround fees come off cash, not taxable income
    double effective_rate = state.holdco_loan_rate + restrictions.interest_penalty;
    for (const Business& b : state.businesses) {
        if (b.is_active()) {
            summary.pre_tax_fcf += calculate_annual_fcf(b, benefits.capex_reduction, benefits.cash_conversion_bonus);
        }
    }
    PortfolioTax tax = calculate_portfolio_tax(state.businesses, state.holdco_loan_balance, effective_rate,
        summary.overhead);
    summary.tax = tax.tax_amount;
    summary.portfolio_fcf = summary.pre_tax_fcf - summary.tax;

    double cash = state.cash + summary.portfolio_fcf - summary.overhead - summary.turnaround_costs;
    summary.cash_before_debt = cash;

    // (c) holdco loan
    summary.holdco_payment = pay_instrument(state.holdco_loan_balance, effective_rate,
        state.holdco_loan_rounds_remaining, cash, summary.had_skipped_payments);

    // (d) opco debt, business by business
    for (Business& b : state.businesses) {
        if (b.status != BusinessStatus::Active && b.status != BusinessStatus::Integrated) continue;
        summary.opco_debt_payments += pay_instrument(b.seller_note_balance, b.seller_note_rate,
            b.seller_note_rounds_remaining, cash, summary.had_skipped_payments);
        double bank_rate = (b.bank_debt_rate > 0 ? b.bank_debt_rate : state.interest_rate) +
            restrictions.interest_penalty;
        summary.opco_debt_payments += pay_instrument(b.bank_debt_balance, bank_rate,
            b.bank_debt_rounds_remaining, cash, summary.had_skipped_payments);
    }

    // (e) earn-outs
    for (Business& b : state.businesses) {
        if (b.status != BusinessStatus::Active && b.status != BusinessStatus::Integrated) continue;
        if (b.earnout_remaining <= 0) continue;
        if (state.round - b.acquisition_round > EARNOUT_EXPIRATION_ROUNDS) {
            summary.earnouts_forfeited += b.earnout_remaining;
            summary.notes.push_back("Earn-out expired for " + b.name);
            b.earnout_remaining = 0;
            b.earnout_target = 0;
            continue;
        }
        if (b.earnout_target <= 0) continue;

        // A bolt-on's own EBITDA lives in its platform, so the platform's growth stands in
        double growth = 0.0;
        const Business* measured = &b;
        if (b.status == BusinessStatus::Integrated && !b.parent_platform_id.empty()) {
            measured = state.find_business(b.parent_platform_id);
            if (measured && !measured->is_active()) measured = nullptr;
        }
        if (measured && measured->acquisition_ebitda > 0) {
            growth = (measured->ebitda - measured->acquisition_ebitda) / measured->acquisition_ebitda;
        }
        if (growth < b.earnout_target) continue;

        double payment = std::min(b.earnout_remaining, std::max(0.0, cash));
        if (payment < b.earnout_remaining) summary.had_skipped_payments = true;
        if (payment > 0) {
            cash -= payment;
            b.earnout_remaining -= payment;
            summary.earnouts_paid += payment;
            summary.notes.push_back("Earn-out paid for " + b.name);
            if (b.earnout_remaining <= 0) b.earnout_target = 0;
        }
    }

    if (cash < 0) {
        summary.cash_went_negative = true;
        cash = 0;
    }
    state.cash = round_half_up(cash);
    state.cash_before_debt_payments = summary.cash_before_debt;
    state.debt_payment_this_round = summary.holdco_payment + summary.opco_debt_payments;
    state.had_skipped_payments = summary.had_skipped_payments;
    state.total_debt = state.compute_total_debt();

    if (DEBUG) std::cout << "collect fcf " << summary.portfolio_fcf << " holdco " << summary.holdco_payment
                         << " opco " << summary.opco_debt_payments << " cash " << state.cash << std::endl;
    return summary;
}

Metrics calculate_metrics(const GameState& state) {
    Metrics m;
    SharedServicesBenefits benefits = calculate_shared_services_benefits(state);
    double services_cost = state.shared_services_cost();

    double opco_debt = 0.0;
    double opco_interest = 0.0;
    double portfolio_value = 0.0;
    for (const Business& b : state.businesses) {
        if (!b.is_active()) continue;
        m.total_ebitda += b.ebitda;
        m.total_revenue += b.revenue;
        opco_debt += b.seller_note_balance;
        opco_interest += b.seller_note_balance * b.seller_note_rate;
        portfolio_value += b.ebitda * get_sector(b.sector_id).acquisition_multiple.mid();
    }

    double gross_fcf = calculate_portfolio_fcf(state.businesses, benefits.capex_reduction,
        benefits.cash_conversion_bonus, state.total_debt, state.interest_rate, services_cost);
    PortfolioTax tax = calculate_portfolio_tax(state.businesses, state.total_debt, state.interest_rate,
        services_cost);

    m.cash = state.cash;
    m.total_debt = state.total_debt + opco_debt;
    double holdco_interest = state.total_debt * state.interest_rate;
    m.total_fcf = gross_fcf - holdco_interest - opco_interest - services_cost;

    double intrinsic_value = portfolio_value + state.cash - m.total_debt;
    m.intrinsic_value_per_share = state.shares_outstanding > 0 ? intrinsic_value / state.shares_outstanding : 0.0;
    m.fcf_per_share = state.shares_outstanding > 0 ? m.total_fcf / state.shares_outstanding : 0.0;

    double nopat = m.total_ebitda - tax.tax_amount;
    m.portfolio_roic = state.total_invested_capital > 0 ? nopat / state.total_invested_capital : 0.0;
    if (!state.metrics_history.empty()) {
        const HistoricalMetrics& prev = state.metrics_history.back();
        double delta_nopat = nopat - prev.nopat;
        double delta_invested = state.total_invested_capital - prev.invested_capital;
        if (delta_invested > 0) m.roiic = delta_nopat / delta_invested;
    }

    double total_returns = state.total_distributions + state.total_exit_proceeds + portfolio_value + state.cash;
    m.portfolio_moic = state.total_invested_capital > 0 ? total_returns / state.total_invested_capital : 1.0;
    m.net_debt_to_ebitda = m.total_ebitda > 0 ? (m.total_debt - state.cash) / m.total_ebitda : 0.0;
    m.distress_level = calculate_distress_level(m.net_debt_to_ebitda, m.total_debt, m.total_ebitda);
    m.cash_conversion = m.total_ebitda > 0 ? gross_fcf / m.total_ebitda : 0.0;
    m.avg_ebitda_margin = m.total_revenue > 0 ? m.total_ebitda / m.total_revenue : 0.0;

    m.interest_rate = state.interest_rate;
    m.shares_outstanding = state.shares_outstanding;
    m.total_invested_capital = state.total_invested_capital;
    m.total_distributions = state.total_distributions;
    m.total_buybacks = state.total_buybacks;
    m.total_exit_proceeds = state.total_exit_proceeds;
    return m;
}

HistoricalMetrics record_historical_metrics(const GameState& state) {
    HistoricalMetrics h;
    h.round = state.round;
    h.metrics = calculate_metrics(state);
    PortfolioTax tax = calculate_portfolio_tax(state.businesses, state.total_debt, state.interest_rate,
        state.shared_services_cost());
    h.fcf = h.metrics.total_fcf;
    h.nopat = h.metrics.total_ebitda - tax.tax_amount;
    h.invested_capital = state.total_invested_capital;
    return h;
}
