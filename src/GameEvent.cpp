/*
 * GameEvent.cpp
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


#include "GameEvent.h"
#include "Business.h"
#include <sstream>

const char* to_string(EventType type) {
    switch (type) {
    case EventType::GlobalBullMarket: return "global_bull_market";
    case EventType::GlobalRecession: return "global_recession";
    case EventType::GlobalInterestHike: return "global_interest_hike";
    case EventType::GlobalInterestCut: return "global_interest_cut";
    case EventType::GlobalInflation: return "global_inflation";
    case EventType::GlobalCreditTightening: return "global_credit_tightening";
    case EventType::GlobalFinancialCrisis: return "global_financial_crisis";
    case EventType::GlobalQuiet: return "global_quiet";
    case EventType::PortfolioStarJoins: return "portfolio_star_joins";
    case EventType::PortfolioTalentLeaves: return "portfolio_talent_leaves";
    case EventType::PortfolioClientSigns: return "portfolio_client_signs";
    case EventType::PortfolioClientChurns: return "portfolio_client_churns";
    case EventType::PortfolioBreakthrough: return "portfolio_breakthrough";
    case EventType::PortfolioCompliance: return "portfolio_compliance";
    case EventType::PortfolioReferralDeal: return "portfolio_referral_deal";
    case EventType::PortfolioEquityDemand: return "portfolio_equity_demand";
    case EventType::PortfolioSellerNoteRenego: return "portfolio_seller_note_renego";
    case EventType::UnsolicitedOffer: return "unsolicited_offer";
    case EventType::SectorEvent: return "sector_event";
    }
    return "global_quiet";
}

EventCategory category_of(EventType type) {
    switch (type) {
    case EventType::GlobalBullMarket:
    case EventType::GlobalRecession:
    case EventType::GlobalInterestHike:
    case EventType::GlobalInterestCut:
    case EventType::GlobalInflation:
    case EventType::GlobalCreditTightening:
    case EventType::GlobalFinancialCrisis:
    case EventType::GlobalQuiet:
        return EventCategory::Global;
    case EventType::PortfolioStarJoins:
    case EventType::PortfolioTalentLeaves:
    case EventType::PortfolioClientSigns:
    case EventType::PortfolioClientChurns:
    case EventType::PortfolioBreakthrough:
    case EventType::PortfolioCompliance:
    case EventType::PortfolioReferralDeal:
    case EventType::PortfolioEquityDemand:
    case EventType::PortfolioSellerNoteRenego:
        return EventCategory::Portfolio;
    case EventType::UnsolicitedOffer:
        return EventCategory::Offer;
    case EventType::SectorEvent:
        return EventCategory::Sector;
    }
    return EventCategory::Global;
}

bool is_choice_event(EventType type) {
    return type == EventType::UnsolicitedOffer ||
        type == EventType::PortfolioEquityDemand ||
        type == EventType::PortfolioSellerNoteRenego;
}

const char* to_string(ImpactMetric metric) {
    switch (metric) {
    case ImpactMetric::Ebitda: return "ebitda";
    case ImpactMetric::Revenue: return "revenue";
    case ImpactMetric::Margin: return "margin";
    case ImpactMetric::InterestRate: return "interestRate";
    case ImpactMetric::Cash: return "cash";
    case ImpactMetric::GrowthRate: return "growthRate";
    }
    return "ebitda";
}

const char* to_string(ChoiceAction action) {
    switch (action) {
    case ChoiceAction::AcceptOffer: return "accept_offer";
    case ChoiceAction::DeclineOffer: return "decline_offer";
    case ChoiceAction::GrantEquityDemand: return "grant_equity_demand";
    case ChoiceAction::DeclineEquityDemand: return "decline_equity_demand";
    case ChoiceAction::AcceptSellerNoteRenego: return "accept_seller_note_renego";
    case ChoiceAction::DeclineSellerNoteRenego: return "decline_seller_note_renego";
    }
    return "decline_offer";
}

std::string EventImpact::to_json() const {
    std::ostringstream oss;
    oss << "{";
    if (!business_id.empty()) {
        oss << "\"businessId\":\"" << json_escape(business_id) << "\",";
        oss << "\"businessName\":\"" << json_escape(business_name) << "\",";
    }
    oss << "\"metric\":\"" << to_string(metric) << "\",";
    oss << "\"before\":" << before << ",";
    oss << "\"after\":" << after << ",";
    oss << "\"delta\":" << delta;
    if (delta_pct) oss << ",\"deltaPercent\":" << *delta_pct;
    oss << "}";
    return oss.str();
}

std::string GameEvent::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"id\":\"" << json_escape(id) << "\",";
    oss << "\"type\":\"" << to_string(type) << "\",";
    oss << "\"title\":\"" << json_escape(title) << "\",";
    oss << "\"description\":\"" << json_escape(description) << "\",";
    oss << "\"effect\":\"" << json_escape(effect) << "\",";
    if (!affected_business_id.empty()) {
        oss << "\"affectedBusinessId\":\"" << json_escape(affected_business_id) << "\",";
    }
    if (type == EventType::UnsolicitedOffer) {
        oss << "\"offerAmount\":" << offer_amount << ",";
        oss << "\"offerMultiple\":" << offer_multiple << ",";
    }
    if (buyer_profile) {
        oss << "\"buyerProfile\":" << buyer_profile->to_json() << ",";
    }
    if (!narrative.empty()) {
        oss << "\"narrative\":\"" << json_escape(narrative) << "\",";
    }
    oss << "\"choices\":[";
    for (size_t i = 0; i < choices.size(); ++i) {
        const EventChoice& c = choices[i];
        oss << "{\"label\":\"" << json_escape(c.label) << "\",\"action\":\"" << to_string(c.action)
            << "\",\"variant\":\"" << c.variant << "\",\"cost\":" << c.cost << "}";
        if (i + 1 < choices.size()) oss << ",";
    }
    oss << "],";
    oss << "\"impacts\":[";
    for (size_t i = 0; i < impacts.size(); ++i) {
        oss << impacts[i].to_json();
        if (i + 1 < impacts.size()) oss << ",";
    }
    oss << "]";
    oss << "}";
    return oss.str();
}
