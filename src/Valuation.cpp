/*
 * Valuation.cpp
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


#include "Valuation.h"
#include "Constants.h"
#include "GameEvent.h"
#include "Turnaround.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

static const std::vector<std::string> PE_FUND_NAMES = {
    "Summit Ridge Partners", "Clearview Capital", "Ironpoint Capital",
    "Meridian Growth Partners", "Cascadia Equity Group", "Blackthorn Capital",
    "Northstar Capital Partners", "Granite Point Partners", "Pinecrest Capital",
    "Crestline Partners", "Ridgeline Capital", "Timberstone Equity",
    "Stonebridge Partners", "Bluewater Capital", "Highland Capital Group",
};

static const std::vector<std::string> FAMILY_OFFICE_NAMES = {
    "Thornton Family Office", "Mercer Capital Partners", "Whitfield Holdings",
    "Ashford Capital Group", "Sterling Family Partners", "Kensington Capital",
    "Hartwick Investments", "Bancroft Partners", "Davenport Capital", "Winslow Holdings",
};

static const std::vector<std::string>& strategic_names(const std::string& sector_id) {
    static const std::vector<std::pair<std::string, std::vector<std::string>>> table = {
        {"agency", {"WPP", "Omnicom", "Publicis Groupe", "IPG", "Dentsu", "Accenture Song"}},
        {"saas", {"Vista Equity", "Thoma Bravo", "Silver Lake", "Insight Partners", "Salesforce"}},
        {"homeServices", {"FirstService Corp", "Neighborly", "Cintas", "Rollins", "ServiceMaster"}},
        {"consumer", {"Procter & Gamble", "Unilever", "Church & Dwight", "Spectrum Brands", "Henkel"}},
        {"industrial", {"Danaher", "Roper Technologies", "ITW", "Parker Hannifin", "Honeywell"}},
        {"b2bServices", {"Constellation Software", "Accenture", "Gartner", "IHS Markit", "Verisk"}},
        {"healthcare", {"UnitedHealth", "McKesson", "Cardinal Health", "Amedisys", "Envision"}},
        {"restaurant", {"Inspire Brands", "Restaurant Brands Intl", "Yum! Brands", "Dine Brands", "Jack in the Box"}},
        {"realEstate", {"Brookfield", "CBRE", "JLL", "Cushman & Wakefield", "Colliers"}},
        {"education", {"Pearson", "Scholastic", "Grand Canyon Education", "Bright Horizons", "Chegg"}},
        {"insurance", {"Acrisure", "Hub International", "Gallagher", "AssuredPartners", "NFP"}},
        {"autoServices", {"Driven Brands", "Mavis Discount Tire", "Caliber Collision", "Sun Auto Tire", "Crash Champions"}},
        {"distribution", {"Watsco", "Pool Corp", "Fastenal", "Grainger", "HD Supply"}},
    };
    for (const auto& entry : table) {
        if (entry.first == sector_id) return entry.second;
    }
    return table[5].second; // b2bServices
}

static double lerp(double x, double x0, double x1, double y0, double y1) {
    return y0 + ((x - x0) / (x1 - x0)) * (y1 - y0);
}

static std::string lower(std::string text) {
    for (char& c : text) c = (char)std::tolower((unsigned char)c);
    return text;
}

static std::string fixed(double value, int decimals) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.*f", decimals, value);
    return std::string(buf);
}

static BuyerType draw_buyer_type(BuyerPoolTier tier, SeededRng& rng, bool& is_strategic) {
    static const double strategic_chance[] = {0.0, 0.05, 0.15, 0.25, 0.35};
    static const std::vector<std::vector<BuyerType>> type_map = {
        {BuyerType::Individual, BuyerType::Individual, BuyerType::FamilyOffice},
        {BuyerType::SmallPe, BuyerType::FamilyOffice, BuyerType::SmallPe},
        {BuyerType::LowerMiddlePe, BuyerType::LowerMiddlePe, BuyerType::FamilyOffice},
        {BuyerType::InstitutionalPe, BuyerType::InstitutionalPe, BuyerType::LargePe},
        {BuyerType::LargePe, BuyerType::LargePe, BuyerType::InstitutionalPe},
    };
    int index = (int)tier;
    if (rng.next() < strategic_chance[index]) {
        is_strategic = true;
        return BuyerType::Strategic;
    }
    is_strategic = false;
    return rng.pick(type_map[index]);
}

static std::string pick_buyer_name(BuyerType type, const std::string& sector_id, SeededRng& rng) {
    switch (type) {
    case BuyerType::Strategic: return rng.pick(strategic_names(sector_id));
    case BuyerType::Individual: return "Independent Sponsor";
    case BuyerType::FamilyOffice: return rng.pick(FAMILY_OFFICE_NAMES);
    case BuyerType::SmallPe:
    case BuyerType::LowerMiddlePe:
    case BuyerType::InstitutionalPe:
    case BuyerType::LargePe:
        break;
    }
    return rng.pick(PE_FUND_NAMES);
}

static std::string fund_size(BuyerType type) {
    switch (type) {
    case BuyerType::FamilyOffice: return "$50-200M AUM";
    case BuyerType::SmallPe: return "$100-500M fund";
    case BuyerType::LowerMiddlePe: return "$500M-2B fund";
    case BuyerType::InstitutionalPe: return "$2-10B fund";
    case BuyerType::LargePe: return "$10B+ fund";
    case BuyerType::Individual:
    case BuyerType::Strategic:
        break;
    }
    return "";
}

static std::string investment_thesis(BuyerType type, const Business& business) {
    const std::string sector_name = get_sector(business.sector_id).name;
    const std::string margin_pct = fixed(business.ebitda_margin * 100.0, 0);
    double margin_delta = business.ebitda_margin - business.acquisition_margin;
    std::string margin_note;
    if (margin_delta >= 0.03) {
        margin_note = " Margin expansion of " + fixed(margin_delta * 100.0, 0) +
            " ppt since acquisition demonstrates operational improvement potential.";
    } else if (margin_delta <= -0.03) {
        margin_note = " Margin compression presents an opportunity for operational turnaround.";
    }

    switch (type) {
    case BuyerType::Strategic:
        return "Seeking to expand " + sector_name + " capabilities and cross-sell to existing customer base. At " +
            margin_pct + "% margins, platform synergies expected to drive 200-400 bps of margin expansion within 18 months." +
            margin_note;
    case BuyerType::Individual:
        return "Experienced operator looking for a " + lower(sector_name) + " business to run. " + margin_pct +
            "% EBITDA margins provide stable cash flow for hands-on management.";
    case BuyerType::FamilyOffice:
        return "Seeking cash-flowing " + lower(sector_name) + " assets at " + margin_pct +
            "% margins for long-term hold. Values stability and predictable returns over growth." + margin_note;
    case BuyerType::SmallPe:
    case BuyerType::LowerMiddlePe:
    case BuyerType::InstitutionalPe:
    case BuyerType::LargePe:
        break;
    }
    if (business.is_platform) {
        return "Platform acquisition thesis: consolidate fragmented " + lower(sector_name) +
            " market through programmatic M&A. Target 3-5 bolt-ons post-close to drive multiple expansion and margin improvement from " +
            margin_pct + "% base.";
    }
    if (business.ebitda >= 10000) {
        return "Institutional-quality " + lower(sector_name) + " platform with de-risked cash flows at " + margin_pct +
            "% margins. Thesis centers on operational improvements and strategic add-on acquisitions." + margin_note;
    }
    return "Attractive " + lower(sector_name) + " acquisition at " + margin_pct +
        "% EBITDA margins with strong fundamentals. Plan to professionalize operations and accelerate organic growth with margin expansion opportunity.";
}

static const char* tier_description(BuyerPoolTier tier) {
    switch (tier) {
    case BuyerPoolTier::Individual:
        return "At this size, the buyer pool is limited to individual operators and independent sponsors who typically pay lower multiples due to financing constraints.";
    case BuyerPoolTier::SmallPe:
        return "Small PE funds and family offices are the primary buyers at this level. Competition is moderate, supporting modest multiple expansion.";
    case BuyerPoolTier::LowerMiddlePe:
        return "Lower middle market PE funds compete actively for businesses this size. Multiple bidders are common, driving premium valuations.";
    case BuyerPoolTier::InstitutionalPe:
        return "Institutional PE firms with significant capital seek platform assets at this EBITDA level. Competitive auctions frequently drive multiples to 10x+.";
    case BuyerPoolTier::LargePe:
        return "Large-cap PE firms and strategic acquirers aggressively pursue assets of this scale. Auctions are highly competitive with institutional-grade pricing.";
    }
    return "";
}

static const char* tier_label(BuyerPoolTier tier) {
    switch (tier) {
    case BuyerPoolTier::Individual: return "individual buyer";
    case BuyerPoolTier::SmallPe: return "small PE";
    case BuyerPoolTier::LowerMiddlePe: return "lower middle PE";
    case BuyerPoolTier::InstitutionalPe: return "institutional PE";
    case BuyerPoolTier::LargePe: return "large PE";
    }
    return "";
}


const char* to_string(BuyerPoolTier tier) {
    switch (tier) {
    case BuyerPoolTier::Individual: return "individual";
    case BuyerPoolTier::SmallPe: return "small_pe";
    case BuyerPoolTier::LowerMiddlePe: return "lower_middle_pe";
    case BuyerPoolTier::InstitutionalPe: return "institutional_pe";
    case BuyerPoolTier::LargePe: return "large_pe";
    }
    return "individual";
}

const char* to_string(BuyerType type) {
    switch (type) {
    case BuyerType::Individual: return "individual";
    case BuyerType::FamilyOffice: return "family_office";
    case BuyerType::SmallPe: return "small_pe";
    case BuyerType::LowerMiddlePe: return "lower_middle_pe";
    case BuyerType::InstitutionalPe: return "institutional_pe";
    case BuyerType::LargePe: return "large_pe";
    case BuyerType::Strategic: return "strategic";
    }
    return "individual";
}

SizeTier calculate_size_tier_premium(double ebitda) {
    if (ebitda < 2000) return {BuyerPoolTier::Individual, 0.0};
    if (ebitda < 5000) return {BuyerPoolTier::SmallPe, lerp(ebitda, 2000, 5000, 0.5, 0.8)};
    if (ebitda < 10000) return {BuyerPoolTier::LowerMiddlePe, lerp(ebitda, 5000, 10000, 0.8, 1.5)};
    if (ebitda < 20000) return {BuyerPoolTier::InstitutionalPe, lerp(ebitda, 10000, 20000, 1.5, 2.5)};
    double capped = std::min(ebitda, 30000.0);
    return {BuyerPoolTier::LargePe, lerp(capped, 20000, 30000, 2.5, 3.5)};
}

double calculate_de_risking_premium(const Business& business) {
    double premium = 0.0;
    if (business.due_diligence.revenue_concentration == Level::Low) premium += 0.3;
    if (business.due_diligence.operator_quality == OperatorQuality::Strong) premium += 0.3;
    if (business.is_platform && business.platform_scale > 0) {
        premium += std::min(0.6, business.platform_scale * 0.2);
    }
    if (business.improvements.size() >= 2) premium += 0.2;
    if (business.due_diligence.customer_retention >= 90) premium += 0.2;
    return std::min(1.5, premium);
}

ExitValuation calculate_exit_valuation(const Business& business, int current_round,
    std::optional<EventType> last_event, std::optional<double> platform_ebitda) {
    ExitValuation v;
    v.base_multiple = business.acquisition_multiple;

    v.ebitda_growth = business.acquisition_ebitda > 0
        ? (business.ebitda - business.acquisition_ebitda) / business.acquisition_ebitda
        : 0.0;
    if (v.ebitda_growth > 0) {
        v.growth_premium = std::min(2.5, v.ebitda_growth * 0.8);
    } else {
        v.growth_premium = std::max(-1.0, v.ebitda_growth * 0.5);
    }

    v.quality_premium = (business.quality - 3) * 0.4;
    v.platform_premium = business.is_platform ? business.platform_scale * 0.2 : 0.0;
    v.years_held = current_round - business.acquisition_round;
    v.hold_premium = std::min(0.5, v.years_held * 0.1);
    v.improvements_premium = business.improvements.size() * 0.15;

    if (last_event && *last_event == EventType::GlobalBullMarket) v.market_modifier = 0.5;
    if (last_event && *last_event == EventType::GlobalRecession) v.market_modifier = -0.5;

    double effective_ebitda = platform_ebitda ? *platform_ebitda : business.ebitda;
    SizeTier size = calculate_size_tier_premium(effective_ebitda);
    v.size_tier_premium = size.premium;
    v.buyer_pool_tier = size.tier;
    v.de_risking_premium = calculate_de_risking_premium(business);
    v.turnaround_premium = get_turnaround_exit_premium(business);

    v.total_multiple = std::max(MIN_EXIT_MULTIPLE,
        v.base_multiple + v.growth_premium + v.quality_premium + v.platform_premium + v.hold_premium +
        v.improvements_premium + v.market_modifier + v.size_tier_premium + v.de_risking_premium +
        v.turnaround_premium);

    v.exit_price = round_half_up(business.ebitda * v.total_multiple);
    double debt_payoff = business.seller_note_balance + business.bank_debt_balance;
    v.net_proceeds = std::max(0.0, v.exit_price - debt_payoff);

    v.commentary = generate_valuation_commentary(business, v.buyer_pool_tier, v.size_tier_premium,
        v.de_risking_premium, effective_ebitda, v.total_multiple);
    return v;
}

BuyerProfile generate_buyer_profile(const Business& business, BuyerPoolTier tier, SeededRng& rng) {
    BuyerProfile profile;
    profile.type = draw_buyer_type(tier, rng, profile.is_strategic);
    profile.name = pick_buyer_name(profile.type, business.sector_id, rng);
    profile.fund_size = fund_size(profile.type);
    profile.investment_thesis = investment_thesis(profile.type, business);
    profile.strategic_premium = profile.is_strategic ? 0.5 + rng.next() : 0.0;
    return profile;
}

ValuationCommentary generate_valuation_commentary(const Business& business, BuyerPoolTier tier,
    double size_premium, double de_risking_premium, double ebitda, double total_multiple) {
    ValuationCommentary commentary;
    const std::string ebitda_m = fixed(ebitda / 1000.0, 1);

    if (size_premium > 0) {
        commentary.factors.push_back("Size premium of +" + fixed(size_premium, 1) +
            "x reflects institutional buyer demand at $" + ebitda_m + "M EBITDA");
    }
    if (de_risking_premium > 0) {
        std::vector<std::string> reasons;
        if (business.due_diligence.revenue_concentration == Level::Low) reasons.push_back("diversified revenue");
        if (business.due_diligence.operator_quality == OperatorQuality::Strong) reasons.push_back("strong management");
        if (business.is_platform && business.platform_scale > 0) reasons.push_back("platform scale");
        if (business.improvements.size() >= 2) reasons.push_back("operational improvements");
        if (business.due_diligence.customer_retention >= 90) reasons.push_back("high retention");
        std::string joined;
        for (size_t i = 0; i < reasons.size(); ++i) {
            if (i > 0) joined += ", ";
            joined += reasons[i];
        }
        commentary.factors.push_back("De-risking premium of +" + fixed(de_risking_premium, 1) + "x from " + joined);
    }
    if (business.is_platform) {
        commentary.factors.push_back("Platform status signals professionalized operations and scalability");
    }

    commentary.summary = "At $" + ebitda_m + "M EBITDA";
    if (business.ebitda_margin != 0.0) {
        commentary.summary += " (" + fixed(business.ebitda_margin * 100.0, 0) + "% margins)";
    }
    commentary.summary += std::string(", this attracts ") + tier_label(tier) + " attention at " +
        fixed(total_multiple, 1) + "x";
    commentary.buyer_pool_description = tier_description(tier);
    return commentary;
}

std::string BuyerProfile::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"name\":\"" << json_escape(name) << "\",";
    oss << "\"type\":\"" << ::to_string(type) << "\",";
    oss << "\"fundSize\":\"" << json_escape(fund_size) << "\",";
    oss << "\"isStrategic\":" << (is_strategic ? "true" : "false") << ",";
    oss << "\"strategicPremium\":" << strategic_premium;
    oss << "}";
    return oss.str();
}

std::string ExitValuation::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"baseMultiple\":" << base_multiple << ",";
    oss << "\"growthPremium\":" << growth_premium << ",";
    oss << "\"qualityPremium\":" << quality_premium << ",";
    oss << "\"platformPremium\":" << platform_premium << ",";
    oss << "\"holdPremium\":" << hold_premium << ",";
    oss << "\"improvementsPremium\":" << improvements_premium << ",";
    oss << "\"marketModifier\":" << market_modifier << ",";
    oss << "\"sizeTierPremium\":" << size_tier_premium << ",";
    oss << "\"deRiskingPremium\":" << de_risking_premium << ",";
    oss << "\"turnaroundPremium\":" << turnaround_premium << ",";
    oss << "\"buyerPoolTier\":\"" << ::to_string(buyer_pool_tier) << "\",";
    oss << "\"totalMultiple\":" << total_multiple << ",";
    oss << "\"exitPrice\":" << exit_price << ",";
    oss << "\"netProceeds\":" << net_proceeds << ",";
    oss << "\"summary\":\"" << json_escape(commentary.summary) << "\"";
    oss << "}";
    return oss.str();
}
