/*
 * Business.cpp
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

#include "Business.h"
#include "Constants.h"
#include <cmath>
#include <cstdio>
#include <sstream>

const char* to_string(BusinessStatus status) {
    switch (status) {
    case BusinessStatus::Active: return "active";
    case BusinessStatus::Integrated: return "integrated";
    case BusinessStatus::Sold: return "sold";
    case BusinessStatus::Merged: return "merged";
    case BusinessStatus::WoundDown: return "wound_down";
    }
    return "active";
}

const char* to_string(OperatorQuality quality) {
    switch (quality) {
    case OperatorQuality::Strong: return "strong";
    case OperatorQuality::Moderate: return "moderate";
    case OperatorQuality::Weak: return "weak";
    }
    return "moderate";
}

const char* to_string(Trend trend) {
    switch (trend) {
    case Trend::Growing: return "growing";
    case Trend::Flat: return "flat";
    case Trend::Declining: return "declining";
    }
    return "flat";
}

const char* to_string(CompetitivePosition position) {
    switch (position) {
    case CompetitivePosition::Leader: return "leader";
    case CompetitivePosition::Competitive: return "competitive";
    case CompetitivePosition::Commoditized: return "commoditized";
    }
    return "competitive";
}

const char* to_string(DealHeat heat) {
    switch (heat) {
    case DealHeat::Cold: return "cold";
    case DealHeat::Warm: return "warm";
    case DealHeat::Hot: return "hot";
    case DealHeat::Contested: return "contested";
    }
    return "warm";
}

const char* to_string(DealSource source) {
    switch (source) {
    case DealSource::Inbound: return "inbound";
    case DealSource::Brokered: return "brokered";
    case DealSource::Sourced: return "sourced";
    case DealSource::Proprietary: return "proprietary";
    }
    return "inbound";
}

const char* to_string(AcquisitionType type) {
    switch (type) {
    case AcquisitionType::Standalone: return "standalone";
    case AcquisitionType::TuckIn: return "tuck_in";
    case AcquisitionType::Platform: return "platform";
    }
    return "standalone";
}

const char* to_string(SizePreference size) {
    switch (size) {
    case SizePreference::Any: return "any";
    case SizePreference::Small: return "small";
    case SizePreference::Medium: return "medium";
    case SizePreference::Large: return "large";
    }
    return "any";
}

const char* to_string(SellerArchetype archetype) {
    switch (archetype) {
    case SellerArchetype::RetiringFounder: return "retiring_founder";
    case SellerArchetype::BurntOutOperator: return "burnt_out_operator";
    case SellerArchetype::AccidentalHoldco: return "accidental_holdco";
    case SellerArchetype::DistressedSeller: return "distressed_seller";
    case SellerArchetype::MboCandidate: return "mbo_candidate";
    case SellerArchetype::FranchiseBreakaway: return "franchise_breakaway";
    }
    return "retiring_founder";
}

const char* to_string(ImprovementType type) {
    switch (type) {
    case ImprovementType::OperatingPlaybook: return "operating_playbook";
    case ImprovementType::PricingModel: return "pricing_model";
    case ImprovementType::ServiceExpansion: return "service_expansion";
    case ImprovementType::FixUnderperformance: return "fix_underperformance";
    case ImprovementType::RecurringRevenue: return "recurring_revenue_conversion";
    case ImprovementType::ManagementProfessionalization: return "management_professionalization";
    case ImprovementType::DigitalTransformation: return "digital_transformation";
    }
    return "operating_playbook";
}

std::string json_escape(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        switch (c) {
        case '"': out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\t': out += "\\t"; break;
        default: out += c;
        }
    }
    return out;
}

std::string format_money(double amount) {
    char buf[64];
    const char* sign = amount < 0 ? "-" : "";
    double value = std::fabs(amount);
    if (value >= 1000.0) {
        std::snprintf(buf, sizeof(buf), "%s$%.1fM", sign, value / 1000.0);
    } else {
        std::snprintf(buf, sizeof(buf), "%s$%.0fk", sign, value);
    }
    return std::string(buf);
}

bool Business::has_improvement(ImprovementType type) const {
    for (const Improvement& imp : improvements) {
        if (imp.type == type) return true;
    }
    return false;
}

void Business::scale_ebitda(double factor) {
    ebitda = round_half_up(ebitda * factor);
    if (ebitda_margin > 0) {
        revenue = round_half_up(ebitda / ebitda_margin);
    }
}

void Business::rederive_ebitda() {
    ebitda = round_half_up(revenue * ebitda_margin);
}

std::string Business::to_string() const {
    char buf[256];
    std::snprintf(buf, sizeof(buf), "%-28s %-14s Q%d EBITDA %8.0f rev %8.0f margin %5.1f%% %s%s",
        name.c_str(), sector_id.c_str(), quality, ebitda, revenue, ebitda_margin * 100.0,
        ::to_string(status), is_platform ? " [platform]" : "");
    return std::string(buf);
}

std::string Business::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"id\":\"" << json_escape(id) << "\",";
    oss << "\"name\":\"" << json_escape(name) << "\",";
    oss << "\"sectorId\":\"" << sector_id << "\",";
    oss << "\"subType\":\"" << json_escape(sub_type) << "\",";
    oss << "\"status\":\"" << ::to_string(status) << "\",";
    oss << "\"quality\":" << quality << ",";
    oss << "\"qualityImprovedTiers\":" << quality_improved_tiers << ",";
    oss << "\"ebitda\":" << ebitda << ",";
    oss << "\"revenue\":" << revenue << ",";
    oss << "\"ebitdaMargin\":" << ebitda_margin << ",";
    oss << "\"organicGrowthRate\":" << organic_growth_rate << ",";
    oss << "\"acquisitionRound\":" << acquisition_round << ",";
    oss << "\"acquisitionPrice\":" << acquisition_price << ",";
    oss << "\"acquisitionMultiple\":" << acquisition_multiple << ",";
    oss << "\"operatorQuality\":\"" << ::to_string(due_diligence.operator_quality) << "\",";
    oss << "\"customerRetention\":" << due_diligence.customer_retention << ",";
    oss << "\"sellerNoteBalance\":" << seller_note_balance << ",";
    oss << "\"bankDebtBalance\":" << bank_debt_balance << ",";
    oss << "\"earnoutRemaining\":" << earnout_remaining << ",";
    oss << "\"isPlatform\":" << (is_platform ? "true" : "false") << ",";
    oss << "\"platformScale\":" << platform_scale << ",";
    oss << "\"boltOnIds\":[";
    for (size_t i = 0; i < bolt_on_ids.size(); ++i) {
        oss << "\"" << bolt_on_ids[i] << "\"";
        if (i + 1 < bolt_on_ids.size()) oss << ",";
    }
    oss << "],";
    oss << "\"improvements\":[";
    for (size_t i = 0; i < improvements.size(); ++i) {
        oss << "\"" << ::to_string(improvements[i].type) << "\"";
        if (i + 1 < improvements.size()) oss << ",";
    }
    oss << "],";
    oss << "\"exitPrice\":" << exit_price;
    oss << "}";
    return oss.str();
}

std::string Deal::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"id\":\"" << json_escape(id) << "\",";
    oss << "\"askingPrice\":" << asking_price << ",";
    oss << "\"effectivePrice\":" << effective_price << ",";
    oss << "\"freshness\":" << freshness << ",";
    oss << "\"roundAppeared\":" << round_appeared << ",";
    oss << "\"source\":\"" << to_string(source) << "\",";
    oss << "\"acquisitionType\":\"" << to_string(acquisition_type) << "\",";
    oss << "\"heat\":\"" << to_string(heat) << "\",";
    oss << "\"sellerArchetype\":\"" << to_string(seller_archetype) << "\",";
    oss << "\"business\":" << business.to_json();
    oss << "}";
    return oss.str();
}
