/*
 * TestFinance.cpp
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


// Cash waterfall, tax and distress checks.

#include "Finance.h"
#include "GameState.h"
#include <cstdio>

static int failures = 0;

static void check(bool ok, const char* name) {
    std::printf("%-60s %s\n", name, ok ? "ok" : "FAILED");
    if (!ok) ++failures;
}

static Business make_business(const std::string& id, const std::string& sector_id, double ebitda) {
    Business b;
    b.id = id;
    b.name = id;
    b.sector_id = sector_id;
    b.ebitda = ebitda;
    b.acquisition_ebitda = ebitda;
    b.ebitda_margin = 0.20;
    b.revenue = ebitda / 0.20;
    b.acquisition_round = 1;
    return b;
}

static GameState make_state(double cash) {
    GameState state;
    state.round = 2;
    state.cash = cash;
    state.shared_services = initialize_shared_services();
    return state;
}

int main() {
    // Agency capex is 3%
    Business agency = make_business("a", "agency", 1000);
    check(calculate_annual_fcf(agency) == 970, "EBITDA 1000 at 3% capex gives FCF 970");

    std::vector<Business> portfolio = {make_business("a", "agency", 1000), make_business("b", "agency", -400)};
    PortfolioTax offset = calculate_portfolio_tax(portfolio);
    check(offset.net_ebitda == 600, "losses offset profits");
    check(offset.tax_amount == 180, "tax on net EBITDA");

    std::vector<Business> small = {make_business("a", "agency", 100)};
    PortfolioTax shielded = calculate_portfolio_tax(small, 10000, 0.10);
    check(shielded.taxable_income == 0, "taxable income floored at zero");
    check(shielded.tax_amount == 0, "no tax when interest exceeds EBITDA");

    GameState losing = make_state(0);
    losing.businesses.push_back(make_business("a", "agency", -500));
    CollectionSummary negative = run_collection_waterfall(losing);
    check(negative.cash_went_negative, "shortfall is flagged");
    check(losing.cash == 0, "cash floored at zero");

    GameState healthy = make_state(5000);
    healthy.businesses.push_back(make_business("a", "agency", 1000));
    CollectionSummary positive = run_collection_waterfall(healthy);
    check(!positive.cash_went_negative, "healthy collection is not flagged");
    check(healthy.cash == 5000 + positive.portfolio_fcf, "FCF after tax reaches cash");

    // Debt service is capped at what is available
    GameState indebted = make_state(100);
    indebted.holdco_loan_balance = 4000;
    indebted.holdco_loan_rate = 0.07;
    indebted.holdco_loan_rounds_remaining = 4;
    indebted.businesses.push_back(make_business("a", "agency", 100));
    CollectionSummary capped = run_collection_waterfall(indebted);
    check(capped.had_skipped_payments, "partial payment recorded");
    check(indebted.cash >= 0, "cash never negative after debt service");
    check(indebted.holdco_loan_rounds_remaining == 4, "term does not advance on a partial payment");
    // 197 available against 280 of interest: nothing reaches principal
    check(capped.holdco_payment == capped.cash_before_debt && indebted.cash == 0, "all available cash goes to the loan");
    check(indebted.holdco_loan_balance == 4000, "balance unchanged when interest is not covered");

    // 1097 available: 280 interest first, the remaining 817 to principal
    GameState short_principal = make_state(1000);
    short_principal.holdco_loan_balance = 4000;
    short_principal.holdco_loan_rate = 0.07;
    short_principal.holdco_loan_rounds_remaining = 4;
    short_principal.businesses.push_back(make_business("a", "agency", 100));
    CollectionSummary interest_first = run_collection_waterfall(short_principal);
    check(interest_first.holdco_payment == 1097, "payment capped at available cash");
    check(short_principal.holdco_loan_balance == 4000 - (1097 - 280), "principal gets what is left after interest");
    check(short_principal.holdco_loan_rounds_remaining == 4, "term still does not advance");

    // Earn-outs: paid on target, held below it, forfeited after the window
    GameState earnout = make_state(5000);
    earnout.round = 3;
    Business grown = make_business("grown", "agency", 1000);
    grown.ebitda = 1200;
    grown.earnout_remaining = 500;
    grown.earnout_target = 0.10;
    Business flat = make_business("flat", "agency", 1000);
    flat.ebitda = 1050;
    flat.earnout_remaining = 500;
    flat.earnout_target = 0.10;
    earnout.businesses = {grown, flat};
    CollectionSummary earned = run_collection_waterfall(earnout);
    check(earned.earnouts_paid == 500, "earn-out paid when growth meets the target");
    check(earnout.businesses[0].earnout_remaining == 0 && earnout.businesses[0].earnout_target == 0,
        "paid earn-out is settled");
    check(earnout.businesses[1].earnout_remaining == 500, "earn-out held below the target");

    GameState expiring = make_state(5000);
    Business late = make_business("late", "agency", 1000);
    late.ebitda = 1500;
    late.earnout_remaining = 500;
    late.earnout_target = 0.10;
    expiring.businesses = {late};
    expiring.round = 1 + EARNOUT_EXPIRATION_ROUNDS;
    GameState last_chance = expiring;
    CollectionSummary in_window = run_collection_waterfall(last_chance);
    check(in_window.earnouts_paid == 500, "earn-out still payable on its last year");
    expiring.round = 2 + EARNOUT_EXPIRATION_ROUNDS;
    CollectionSummary expired = run_collection_waterfall(expiring);
    check(expired.earnouts_forfeited == 500 && expired.earnouts_paid == 0, "earn-out forfeited after the window");
    check(expiring.businesses[0].earnout_remaining == 0, "forfeited earn-out cleared");

    check(calculate_distress_level(1.0) == DistressLevel::Comfortable, "low leverage is comfortable");
    check(calculate_distress_level(5.0) == DistressLevel::Breach, "leverage above 4.5 is a breach");
    DistressRestrictions breach = get_distress_restrictions(DistressLevel::Breach);
    check(!breach.can_acquire && !breach.can_distribute && !breach.can_buyback, "breach blocks capital actions");

    std::optional<SectorFocusBonus> none = calculate_sector_focus_bonus(small);
    check(!none.has_value(), "no focus bonus with one business");
    std::vector<Business> focused = {make_business("a", "agency", 500), make_business("b", "agency", 500),
        make_business("c", "agency", 500)};
    std::optional<SectorFocusBonus> bonus = calculate_sector_focus_bonus(focused);
    check(bonus && bonus->tier == 2 && bonus->opco_count == 3, "three in one group is tier 2");

    std::printf("\n%d failure(s)\n", failures);
    return failures == 0 ? 0 : 1;
}
