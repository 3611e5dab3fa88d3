/*
 * Business.h
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

#ifndef BUSINESS_H
#define BUSINESS_H

#include "Sectors.h"
#include <string>
#include <vector>

enum class BusinessStatus { Active, Integrated, Sold, Merged, WoundDown };
enum class OperatorQuality { Strong, Moderate, Weak };
enum class Trend { Growing, Flat, Declining };
enum class CompetitivePosition { Leader, Competitive, Commoditized };
enum class DealHeat { Cold, Warm, Hot, Contested };
enum class DealSource { Inbound, Brokered, Sourced, Proprietary };
enum class AcquisitionType { Standalone, TuckIn, Platform };
enum class SizePreference { Any, Small, Medium, Large };
enum class SellerArchetype {
    RetiringFounder,
    BurntOutOperator,
    AccidentalHoldco,
    DistressedSeller,
    MboCandidate,
    FranchiseBreakaway
};
enum class ImprovementType {
    OperatingPlaybook,
    PricingModel,
    ServiceExpansion,
    FixUnderperformance,
    RecurringRevenue,
    ManagementProfessionalization,
    DigitalTransformation
};

const char* to_string(BusinessStatus status);
const char* to_string(OperatorQuality quality);
const char* to_string(Trend trend);
const char* to_string(CompetitivePosition position);
const char* to_string(DealHeat heat);
const char* to_string(DealSource source);
const char* to_string(AcquisitionType type);
const char* to_string(SizePreference size);
const char* to_string(SellerArchetype archetype);
const char* to_string(ImprovementType type);

/**
 * @brief Signals a buyer learns about a target before closing.
 */
struct DueDiligence {
    Level revenue_concentration{Level::Medium};
    std::string revenue_concentration_text;
    OperatorQuality operator_quality{OperatorQuality::Moderate};
    std::string operator_quality_text;
    Trend trend{Trend::Flat};
    std::string trend_text;
    int customer_retention{85};
    CompetitivePosition competitive_position{CompetitivePosition::Competitive};
    std::string competitive_position_text;
};

struct Improvement {
    ImprovementType type{ImprovementType::OperatingPlaybook};
    int applied_round{0};
    double effect{0.0};
};

/**
 * @brief An operating company, owned or offered for sale.
 *
 * Simulation rules:
 * - EBITDA is revenue times margin; events and growth move both.
 * - Seller note, bank debt and earn-out are independent instruments, each
 *   serviced from holdco cash during collection.
 * - A platform consolidates its bolt-ons: an integrated bolt-on keeps its
 *   record for history but its EBITDA lives inside the parent.
 * - Sold, merged and wound-down businesses are terminal.
 */
class Business {
public:
    std::string id;
    std::string name;
    std::string sector_id;
    std::string sub_type;

    double ebitda{0.0};
    double peak_ebitda{0.0};
    double acquisition_ebitda{0.0};
    double acquisition_price{0.0};
    int acquisition_round{0};
    double acquisition_multiple{0.0};
    double acquisition_size_tier_premium{0.0};
    double organic_growth_rate{0.0};

    double revenue{0.0};
    double ebitda_margin{0.0};
    double acquisition_revenue{0.0};
    double acquisition_margin{0.0};
    double peak_revenue{0.0};
    double revenue_growth_rate{0.0};
    double margin_drift_rate{0.0};

    int quality{3};
    int quality_improved_tiers{0};  // tiers gained since acquisition
    DueDiligence due_diligence;
    int integration_rounds_remaining{0};
    double integration_growth_drag{0.0};
    std::vector<Improvement> improvements;

    // Debt instruments
    double seller_note_balance{0.0};
    double seller_note_rate{0.0};
    int seller_note_rounds_remaining{0};
    double bank_debt_balance{0.0};
    double bank_debt_rate{0.0};
    int bank_debt_rounds_remaining{0};
    double earnout_remaining{0.0};
    double earnout_target{0.0};

    BusinessStatus status{BusinessStatus::Active};
    double exit_price{0.0};
    int exit_round{0};

    // Platform fields
    bool is_platform{false};
    int platform_scale{0};
    std::vector<std::string> bolt_on_ids;
    std::string parent_platform_id;
    double synergies_realized{0.0};
    double total_acquisition_cost{0.0};
    double rollover_equity_pct{0.0};

    bool is_active() const { return status == BusinessStatus::Active; }
    bool has_improvement(ImprovementType type) const;
    /**
     * Scales EBITDA by a factor keeping margin fixed, so revenue moves with it.
     */
    void scale_ebitda(double factor);
    /**
     * Recomputes EBITDA from revenue and margin.
     */
    void rederive_ebitda();

    std::string to_string() const;
    std::string to_json() const;
};

/**
 * @brief An acquisition opportunity in the pipeline.
 */
class Deal {
public:
    std::string id;
    Business business;
    double asking_price{0.0};
    double effective_price{0.0};
    int freshness{2};
    int round_appeared{0};
    DealSource source{DealSource::Inbound};
    AcquisitionType acquisition_type{AcquisitionType::Standalone};
    double tuck_in_discount{0.0};
    DealHeat heat{DealHeat::Warm};
    SellerArchetype seller_archetype{SellerArchetype::RetiringFounder};

    std::string to_json() const;
};

std::string json_escape(const std::string& text);

/**
 * Formats an amount in thousands as $850k or $1.2M.
 */
std::string format_money(double amount);

#endif // BUSINESS_H
