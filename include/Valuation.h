/*
 * Valuation.h
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


#ifndef VALUATION_H
#define VALUATION_H

#include "Business.h"
#include "SeededRng.h"
#include <optional>
#include <string>
#include <vector>

enum class EventType;

enum class BuyerPoolTier { Individual, SmallPe, LowerMiddlePe, InstitutionalPe, LargePe };
enum class BuyerType { Individual, FamilyOffice, SmallPe, LowerMiddlePe, InstitutionalPe, LargePe, Strategic };

const char* to_string(BuyerPoolTier tier);
const char* to_string(BuyerType type);

struct SizeTier {
    BuyerPoolTier tier{BuyerPoolTier::Individual};
    double premium{0.0};
};

struct BuyerProfile {
    std::string name;
    BuyerType type{BuyerType::Individual};
    std::string fund_size;
    std::string investment_thesis;
    bool is_strategic{false};
    double strategic_premium{0.0};

    std::string to_json() const;
};

struct ValuationCommentary {
    std::string summary;
    std::vector<std::string> factors;
    std::string buyer_pool_description;
};

/**
 * @brief Itemized exit multiple of one business.
 *
 * The total multiple is the sum of its parts, never below MIN_EXIT_MULTIPLE.
 */
struct ExitValuation {
    double base_multiple{0.0};
    double growth_premium{0.0};
    double quality_premium{0.0};
    double platform_premium{0.0};
    double hold_premium{0.0};
    double improvements_premium{0.0};
    double market_modifier{0.0};
    double size_tier_premium{0.0};
    double de_risking_premium{0.0};
    double turnaround_premium{0.0};
    BuyerPoolTier buyer_pool_tier{BuyerPoolTier::Individual};
    double total_multiple{0.0};
    double exit_price{0.0};
    double net_proceeds{0.0};
    double ebitda_growth{0.0};
    int years_held{0};
    ValuationCommentary commentary;

    std::string to_json() const;
};

/**
 * Buyer pool and size premium for an EBITDA level, interpolated within each
 * band and capped at 30000.
 */
SizeTier calculate_size_tier_premium(double ebitda);

/**
 * Premium for diligence signals that reduce buyer risk, capped at 1.5x.
 */
double calculate_de_risking_premium(const Business& business);

/**
 * Values a business for sale in the given round.
 *
 * @param last_event the most recent market event, if any; bull markets add
 *        half a turn and recessions remove one
 * @param platform_ebitda consolidated EBITDA to size the buyer pool with; the
 *        business's own EBITDA when absent
 */
ExitValuation calculate_exit_valuation(const Business& business, int current_round,
    std::optional<EventType> last_event = std::nullopt,
    std::optional<double> platform_ebitda = std::nullopt);

/**
 * Draws a buyer for a business. Strategic buyers become more likely with
 * size and bring a premium of 0.5x to 1.5x.
 */
BuyerProfile generate_buyer_profile(const Business& business, BuyerPoolTier tier, SeededRng& rng);

ValuationCommentary generate_valuation_commentary(const Business& business, BuyerPoolTier tier,
    double size_premium, double de_risking_premium, double ebitda, double total_multiple);

#endif // VALUATION_H
