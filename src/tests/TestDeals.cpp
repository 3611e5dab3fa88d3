/*
 * TestDeals.cpp
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


// Deal generation and financing structure checks.

#include "Constants.h"
#include "DealGenerator.h"
#include "DealStructure.h"
#include "SeededRng.h"
#include <cstdio>

static int failures = 0;

static void check(bool ok, const char* name) {
    std::printf("%-60s %s\n", name, ok ? "ok" : "FAILED");
    if (!ok) ++failures;
}

static Deal make_deal() {
    Deal deal;
    deal.id = "deal_biz_7";
    deal.asking_price = 4000;
    deal.effective_price = 4000;
    deal.business.id = "biz_7";
    deal.business.name = "Signal Partners";
    deal.business.sector_id = "agency";
    deal.business.ebitda = 1000;
    deal.business.acquisition_ebitda = 1000;
    deal.business.quality = 3;
    deal.business.due_diligence.operator_quality = OperatorQuality::Strong;
    return deal;
}

static bool has_type(const std::vector<DealStructure>& structures, DealStructureType type) {
    for (const DealStructure& s : structures) {
        if (s.type == type) return true;
    }
    return false;
}

int main() {
    RngStreams streams = create_rng_streams(42, 5);
    PipelineContext context;
    DealGenerator generator;
    SeededRng first_rng = streams.deals.fork("source-0");
    SeededRng second_rng = streams.deals.fork("source-1");
    std::vector<Deal> first = generator.generate_sourced_deals(5, context, first_rng);
    std::vector<Deal> second = generator.generate_sourced_deals(5, context, second_rng);
    check(first.size() == 3 && second.size() == 3, "sourcing yields three deals");
    check(first[0].business.ebitda != second[0].business.ebitda, "second sourcing in a round draws new deals");
    for (const Deal& d : first) {
        if (d.source != DealSource::Sourced) check(false, "sourced deals are marked sourced");
    }

    DealGenerator gen_a;
    DealGenerator gen_b;
    SeededRng rng_a = create_rng_streams(7, 1).deals;
    SeededRng rng_b = create_rng_streams(7, 1).deals;
    std::vector<Deal> pipeline_a = gen_a.generate_deal_pipeline({}, 1, context, rng_a);
    std::vector<Deal> pipeline_b = gen_b.generate_deal_pipeline({}, 1, context, rng_b);
    bool same = pipeline_a.size() == pipeline_b.size();
    for (size_t i = 0; same && i < pipeline_a.size(); ++i) {
        same = pipeline_a[i].id == pipeline_b[i].id && pipeline_a[i].effective_price == pipeline_b[i].effective_price &&
            pipeline_a[i].business.name == pipeline_b[i].business.name;
    }
    check(same, "same seed gives the same pipeline");
    check(pipeline_a.size() >= 4 && (int)pipeline_a.size() <= MAX_PIPELINE_DEALS, "pipeline size within bounds");

    SeededRng start_rng = create_rng_streams(7, 0).deals.fork("starting-business");
    DealGenerator start_gen;
    Business starting = start_gen.create_starting_business("saas", 1000, 4.0, start_rng);
    check(starting.sector_id == "saas" && starting.quality == 3, "starting business in the chosen sector");
    check(starting.acquisition_price <= starting.ebitda * 4.0 + 1, "starting price respects the multiple cap");

    Deal deal = make_deal();
    std::vector<DealStructure> structures = generate_deal_structures(deal, 10000, 0.07, false);
    std::vector<DealStructure> again = generate_deal_structures(deal, 10000, 0.07, false);
    check(!structures.empty() && structures[0].type == DealStructureType::AllCash, "all cash is offered first");
    check(structures.size() == again.size(), "structures are stable across calls");
    check(has_type(structures, DealStructureType::BankDebt), "bank debt offered in normal credit");

    std::vector<DealStructure> tight = generate_deal_structures(deal, 10000, 0.07, true);
    check(!has_type(tight, DealStructureType::BankDebt) && !has_type(tight, DealStructureType::SellerNoteBankDebt),
        "no bank debt while credit is tight");

    std::vector<DealStructure> poor = generate_deal_structures(deal, 1000, 0.07, false);
    bool affordable = true;
    for (const DealStructure& s : poor) {
        if (s.cash_required > 1000) affordable = false;
    }
    check(!has_type(poor, DealStructureType::AllCash) && affordable, "only affordable structures are offered");

    for (const DealStructure& s : structures) {
        if (s.type != DealStructureType::SellerNote) continue;
        Business owned = execute_deal_structure(deal, s, 4);
        check(owned.id == "biz_7", "business id drops the deal prefix");
        check(owned.acquisition_round == 4 && owned.acquisition_price == 4000, "acquisition recorded");
        check(owned.seller_note_balance == 4000 - s.cash_required, "seller note carries the balance");
        check(owned.integration_rounds_remaining == 1, "strong operators integrate in one round");
    }

    check(get_max_acquisitions(0) == 2 && get_max_acquisitions(3) == 4, "sourcing tier raises acquisition cap");

    std::printf("\n%d failure(s)\n", failures);
    return failures == 0 ? 0 : 1;
}
