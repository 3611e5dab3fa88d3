/*
 * DealGenerator.h
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


#ifndef DEALGENERATOR_H
#define DEALGENERATOR_H

#include "Business.h"
#include "GameEvent.h"
#include "GameState.h"
#include "SeededRng.h"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Knobs of a single deal draw.
 */
struct DealOptions {
    std::string sub_type;                // empty draws one at random
    int quality_floor{0};
    std::optional<DealSource> source;    // drawn inbound/brokered when absent
    int freshness_bonus{0};
    double multiple_discount{0.0};       // 0.15 is 15% off asking
    std::optional<EventType> last_event;
    int max_rounds{20};
    bool credit_tightening{false};
    int ma_sourcing_tier{0};
};

/**
 * @brief Portfolio-level inputs of pipeline and sourcing draws.
 */
struct PipelineContext {
    MAFocus focus;
    std::string portfolio_focus_sector;  // empty without a sector focus bonus
    int portfolio_focus_tier{0};
    double portfolio_ebitda{0.0};
    int ma_sourcing_tier{0};
    bool ma_sourcing_active{false};
    std::optional<EventType> last_event;
    int max_rounds{20};
    bool credit_tightening{false};
};

int generate_quality_rating(SeededRng& rng);
DueDiligence generate_due_diligence(int quality, const std::string& sector_id, SeededRng& rng);
SellerArchetype assign_seller_archetype(int quality, SeededRng& rng);

/**
 * Heat tier of a deal. The base roll gives cold 25%, warm 35%, hot 30% and
 * contested 10%, then quality, market, credit, late game, source and seller
 * archetype shift it by whole tiers. Negative source and archetype shifts
 * combined are capped at three tiers.
 */
DealHeat calculate_deal_heat(int quality, DealSource source, int round, std::optional<EventType> last_event,
    std::optional<SellerArchetype> archetype, int max_rounds, bool credit_tightening, SeededRng& rng,
    int ma_sourcing_tier = 0);
double calculate_heat_premium(DealHeat heat, SeededRng& rng);

/**
 * Acquisitions allowed per round: 2, 3 from sourcing tier 1, 4 from tier 2.
 */
int get_max_acquisitions(int ma_sourcing_tier);

/**
 * Sector draw weighted by game stage: cheap sectors early, premium sectors late.
 */
std::string pick_weighted_sector(int round, int max_rounds, SeededRng& rng);

std::string generate_business_name(const std::string& sector_id, SeededRng& rng);

/**
 * @brief Source of new acquisition targets.
 *
 * Owns the business id counter, so every id issued within a game is unique.
 *
 * Simulation rules:
 * - The pipeline ages every round; deals reaching zero freshness expire.
 * - Declared focus, sourcing tier and portfolio focus each add deals before
 *   sector variety and weighted fill-up bring the pipeline to five or more.
 * - The first two rounds lean towards small and medium deals.
 * - Sourced and proprietary deals run cooler than inbound ones.
 */
class DealGenerator {
public:
    DealGenerator() {}

    std::string next_business_id();
    int get_id_counter() const { return id_counter; }
    void set_id_counter(int counter) { id_counter = counter; }

    /**
     * A business drawn from sector ranges. quality <= 0 draws one.
     */
    Business generate_business(const std::string& sector_id, int round, int quality, const std::string& sub_type,
        SeededRng& rng);

    Deal generate_deal_with_size(const std::string& sector_id, int round, SizePreference size,
        double portfolio_ebitda, const DealOptions& options, SeededRng& rng);

    std::vector<Deal> generate_deal_pipeline(const std::vector<Deal>& current, int round,
        const PipelineContext& context, SeededRng& rng);

    /**
     * Financial crisis fire sales: 3 to 4 deals at 30 to 50% off, quality 2 to 3.
     */
    std::vector<Deal> generate_distressed_deals(int round, int max_rounds, SeededRng& rng);

    /**
     * Recession opportunities: 1 to 2 deals at 15 to 25% off, quality 2 to 3.
     */
    std::vector<Deal> generate_recession_deals(int round, int max_rounds, SeededRng& rng);

    /**
     * Deal referred by a portfolio company: quality 3 or better, sourced.
     */
    Deal generate_referral_deal(int round, int max_rounds, SeededRng& rng);

    /**
     * Three banker-sourced deals, weighted towards the declared focus.
     */
    std::vector<Deal> generate_sourced_deals(int round, const PipelineContext& context, SeededRng& rng);

    /**
     * Two off-market proprietary deals in the focus sector.
     */
    std::vector<Deal> generate_outreach_deals(int round, const PipelineContext& context, SeededRng& rng);

    /**
     * The business a new holdco starts with: quality 3, priced at the sector
     * mid multiple (capped when multiple_cap is positive).
     */
    Business create_starting_business(const std::string& sector_id, double target_ebitda, double multiple_cap,
        SeededRng& rng);

private:
    int id_counter{0};
};

#endif // DEALGENERATOR_H
