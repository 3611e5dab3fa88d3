/*
 * Finance.h
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


#ifndef FINANCE_H
#define FINANCE_H

#include "Business.h"
#include "Constants.h"
#include "GameState.h"
#include "SeededRng.h"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Portfolio-level tax with the deductions that shield it.
 */
struct PortfolioTax {
    double gross_ebitda{0.0};        // positive-EBITDA businesses only
    double loss_offset{0.0};         // absolute EBITDA of loss makers
    double net_ebitda{0.0};
    double holdco_interest{0.0};
    double opco_interest{0.0};
    double total_interest{0.0};
    double shared_services_cost{0.0};
    double taxable_income{0.0};      // never negative
    double tax_amount{0.0};
    double effective_tax_rate{0.0};
    double interest_tax_shield{0.0};
    double shared_services_tax_shield{0.0};
    double loss_offset_tax_shield{0.0};
    double total_tax_savings{0.0};
};

struct SharedServicesBenefits {
    double capex_reduction{0.0};
    double cash_conversion_bonus{0.0};
    double growth_bonus{0.0};
    double reinvestment_bonus{0.0};
    double talent_retention_bonus{0.0};
    double talent_gain_bonus{0.0};
};

struct SectorFocusBonus {
    std::string focus_group;
    int tier{0};
    int opco_count{0};
};

struct DistressRestrictions {
    bool can_acquire{true};
    bool can_take_debt{true};
    bool can_distribute{true};
    bool can_buyback{true};
    double interest_penalty{0.0};
};

struct CovenantHeadroom {
    double current_leverage{0.0};
    double breach_threshold{COVENANT_BREACH_RATIO};
    double headroom_ratio{0.0};
    double headroom_cash{0.0};
    double next_year_debt_service{0.0};
    double projected_cash_after_debt{0.0};
    bool cash_will_go_negative{false};
    bool no_ebitda{false};           // leverage undefined, reported as a breach
};

/**
 * @brief What one collection phase paid and received.
 */
struct CollectionSummary {
    double pre_tax_fcf{0.0};
    double tax{0.0};
    double portfolio_fcf{0.0};       // after tax
    double overhead{0.0};            // shared services and M&A sourcing
    double turnaround_costs{0.0};    // tier and program fees, not tax deductible
    double holdco_payment{0.0};
    double opco_debt_payments{0.0};
    double earnouts_paid{0.0};
    double earnouts_forfeited{0.0};
    double cash_before_debt{0.0};
    bool had_skipped_payments{false};
    bool cash_went_negative{false};
    std::vector<std::string> notes;
};

/**
 * Annual pre-tax free cash flow of one business: EBITDA less sector capex,
 * scaled by the cash-conversion bonus, rounded.
 */
double calculate_annual_fcf(const Business& business, double capex_reduction = 0.0,
    double cash_conversion_bonus = 0.0);

/**
 * Portfolio tax over active businesses. Loss makers offset profitable ones,
 * then interest and shared-service costs are deducted; taxable income is
 * floored at zero.
 */
PortfolioTax calculate_portfolio_tax(const std::vector<Business>& businesses, double holdco_debt = 0.0,
    double holdco_rate = 0.0, double shared_services_cost = 0.0);

/**
 * After-tax FCF of the active portfolio.
 */
double calculate_portfolio_fcf(const std::vector<Business>& businesses, double capex_reduction = 0.0,
    double cash_conversion_bonus = 0.0, double holdco_debt = 0.0, double holdco_rate = 0.0,
    double shared_services_cost = 0.0);

/**
 * Benefits of active shared services, scaled up smoothly from 3 to 6 opcos.
 */
SharedServicesBenefits calculate_shared_services_benefits(const GameState& state);

/**
 * Largest focus group among active businesses. Absent with fewer than two
 * active businesses or when no group holds two of them.
 */
std::optional<SectorFocusBonus> calculate_sector_focus_bonus(const std::vector<Business>& businesses);
double sector_focus_ebitda_bonus(int tier);
double sector_focus_multiple_discount(int tier);

/**
 * One year of organic growth. Draws the volatility roll and, during
 * integration, the integration drag roll, in that order.
 */
Business apply_organic_growth(const Business& business, double shared_growth_bonus,
    double focus_bonus, bool inflation_active, SeededRng& rng);

DistressLevel calculate_distress_level(double net_debt_to_ebitda, double total_debt = 0.0,
    double total_ebitda = 0.0);
DistressRestrictions get_distress_restrictions(DistressLevel level);
const char* distress_label(DistressLevel level);
const char* distress_description(DistressLevel level);

CovenantHeadroom calculate_covenant_headroom(const GameState& state, double total_debt,
    double total_ebitda, double interest_penalty);

struct MASourcingTierConfig {
    int tier;
    const char* name;
    double upgrade_cost;
    double annual_cost;
    int min_opcos;
};

/**
 * Configuration of a sourcing tier, clamped to [0, 3].
 */
const MASourcingTierConfig& ma_sourcing_config(int tier);
/**
 * Annual cost of a sourcing tier; zero for tier 0.
 */
double ma_sourcing_annual_cost(int tier);

/**
 * Runs the collection waterfall against state.cash: portfolio FCF after tax,
 * overhead, holdco loan P&I, then seller-note and bank-debt P&I business by
 * business in insertion order, then earn-outs. Every payment is capped by the
 * cash still available, interest first. Cash is floored at zero on exit and
 * cash_went_negative is set when it had to be.
 */
CollectionSummary run_collection_waterfall(GameState& state);

Metrics calculate_metrics(const GameState& state);
HistoricalMetrics record_historical_metrics(const GameState& state);

#endif // FINANCE_H
