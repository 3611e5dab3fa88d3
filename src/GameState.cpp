/*
 * GameState.cpp
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


#include "GameState.h"
#include <sstream>

const char* to_string(GamePhase phase) {
    switch (phase) {
    case GamePhase::Collect: return "collect";
    case GamePhase::Event: return "event";
    case GamePhase::Allocate: return "allocate";
    case GamePhase::Restructure: return "restructure";
    }
    return "collect";
}

const char* to_string(DistressLevel level) {
    switch (level) {
    case DistressLevel::Comfortable: return "comfortable";
    case DistressLevel::Elevated: return "elevated";
    case DistressLevel::Stressed: return "stressed";
    case DistressLevel::Breach: return "breach";
    }
    return "comfortable";
}

const char* to_string(SharedServiceType type) {
    switch (type) {
    case SharedServiceType::FinanceReporting: return "finance_reporting";
    case SharedServiceType::RecruitingHr: return "recruiting_hr";
    case SharedServiceType::Procurement: return "procurement";
    case SharedServiceType::MarketingBrand: return "marketing_brand";
    case SharedServiceType::TechnologySystems: return "technology_systems";
    }
    return "finance_reporting";
}

const char* to_string(AcquisitionResult result) {
    switch (result) {
    case AcquisitionResult::None: return "none";
    case AcquisitionResult::Success: return "success";
    case AcquisitionResult::Snatched: return "snatched";
    }
    return "none";
}

const char* to_string(GameActionType type) {
    switch (type) {
    case GameActionType::Acquire: return "acquire";
    case GameActionType::AcquireTuckIn: return "acquire_tuck_in";
    case GameActionType::MergeBusinesses: return "merge_businesses";
    case GameActionType::DesignatePlatform: return "designate_platform";
    case GameActionType::Improve: return "improve";
    case GameActionType::UnlockSharedService: return "unlock_shared_service";
    case GameActionType::DeactivateSharedService: return "deactivate_shared_service";
    case GameActionType::PayDebt: return "pay_debt";
    case GameActionType::IssueEquity: return "issue_equity";
    case GameActionType::Buyback: return "buyback";
    case GameActionType::Distribute: return "distribute";
    case GameActionType::Sell: return "sell";
    case GameActionType::AcceptOffer: return "accept_offer";
    case GameActionType::DeclineOffer: return "decline_offer";
    case GameActionType::SourceDeals: return "source_deals";
    case GameActionType::UpgradeMaSourcing: return "upgrade_ma_sourcing";
    case GameActionType::ToggleMaSourcing: return "toggle_ma_sourcing";
    case GameActionType::ProactiveOutreach: return "proactive_outreach";
    case GameActionType::DistressedSale: return "distressed_sale";
    case GameActionType::EmergencyEquityRaise: return "emergency_equity_raise";
    case GameActionType::UnlockTurnaroundTier: return "unlock_turnaround_tier";
    case GameActionType::StartTurnaround: return "start_turnaround";
    case GameActionType::TurnaroundResolved: return "turnaround_resolved";
    }
    return "acquire";
}

std::vector<SharedService> initialize_shared_services() {
    std::vector<SharedService> services(5);
    services[0] = {SharedServiceType::FinanceReporting, "Finance & Reporting", 560, 250,
        "Centralized financial reporting and controls",
        "Cash conversion +5% across portfolio", 0, false};
    services[1] = {SharedServiceType::RecruitingHr, "Recruiting & HR", 750, 320,
        "Shared talent acquisition and retention programs",
        "Talent loss events 50% less likely; talent gain events 30% more likely", 0, false};
    services[2] = {SharedServiceType::Procurement, "Procurement", 600, 190,
        "Centralized purchasing and vendor management",
        "Capex rate reduced by 15% across portfolio", 0, false};
    services[3] = {SharedServiceType::MarketingBrand, "Marketing & Brand", 675, 250,
        "Shared marketing resources and brand development",
        "Organic growth +1.5% for all opcos; agencies and consumer brands get +2.5%", 0, false};
    services[4] = {SharedServiceType::TechnologySystems, "Technology & Systems", 900, 380,
        "Shared IT infrastructure and operational systems",
        "Reinvestment efficiency +20% for all opcos", 0, false};
    return services;
}

std::string Metrics::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"cash\":" << cash << ",";
    oss << "\"totalDebt\":" << total_debt << ",";
    oss << "\"totalEbitda\":" << total_ebitda << ",";
    oss << "\"totalFcf\":" << total_fcf << ",";
    oss << "\"fcfPerShare\":" << fcf_per_share << ",";
    oss << "\"portfolioRoic\":" << portfolio_roic << ",";
    oss << "\"roiic\":" << roiic << ",";
    oss << "\"portfolioMoic\":" << portfolio_moic << ",";
    oss << "\"netDebtToEbitda\":" << net_debt_to_ebitda << ",";
    oss << "\"distressLevel\":\"" << to_string(distress_level) << "\",";
    oss << "\"cashConversion\":" << cash_conversion << ",";
    oss << "\"interestRate\":" << interest_rate << ",";
    oss << "\"sharesOutstanding\":" << shares_outstanding << ",";
    oss << "\"intrinsicValuePerShare\":" << intrinsic_value_per_share << ",";
    oss << "\"totalInvestedCapital\":" << total_invested_capital << ",";
    oss << "\"totalDistributions\":" << total_distributions << ",";
    oss << "\"totalBuybacks\":" << total_buybacks << ",";
    oss << "\"totalExitProceeds\":" << total_exit_proceeds << ",";
    oss << "\"totalRevenue\":" << total_revenue << ",";
    oss << "\"avgEbitdaMargin\":" << avg_ebitda_margin;
    oss << "}";
    return oss.str();
}

std::string GameAction::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"type\":\"" << to_string(type) << "\",";
    oss << "\"round\":" << round << ",";
    oss << "\"businessId\":\"" << json_escape(business_id) << "\",";
    oss << "\"amount\":" << amount << ",";
    oss << "\"detail\":\"" << json_escape(detail) << "\"";
    oss << "}";
    return oss.str();
}

std::string RoundHistoryEntry::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"round\":" << round << ",";
    oss << "\"actions\":[";
    for (size_t i = 0; i < actions.size(); ++i) {
        oss << actions[i].to_json();
        if (i + 1 < actions.size()) oss << ",";
    }
    oss << "],";
    oss << "\"chronicle\":\"" << json_escape(chronicle) << "\",";
    if (event_type) {
        oss << "\"event\":{\"type\":\"" << to_string(*event_type) << "\",\"title\":\""
            << json_escape(event_title) << "\",\"description\":\"" << json_escape(event_description) << "\"},";
    } else {
        oss << "\"event\":null,";
    }
    oss << "\"metrics\":" << metrics.to_json() << ",";
    oss << "\"businessCount\":" << business_count << ",";
    oss << "\"cash\":" << cash << ",";
    oss << "\"totalDebt\":" << total_debt;
    oss << "}";
    return oss.str();
}

Business* GameState::find_business(const std::string& id) {
    for (Business& b : businesses) {
        if (b.id == id) return &b;
    }
    return nullptr;
}

const Business* GameState::find_business(const std::string& id) const {
    for (const Business& b : businesses) {
        if (b.id == id) return &b;
    }
    return nullptr;
}

const Deal* GameState::find_deal(const std::string& id) const {
    for (const Deal& d : deal_pipeline) {
        if (d.id == id) return &d;
    }
    return nullptr;
}

std::vector<const Business*> GameState::active_businesses() const {
    std::vector<const Business*> active;
    for (const Business& b : businesses) {
        if (b.is_active()) active.push_back(&b);
    }
    return active;
}

int GameState::active_count() const {
    int count = 0;
    for (const Business& b : businesses) {
        if (b.is_active()) ++count;
    }
    return count;
}

double GameState::total_active_ebitda() const {
    double total = 0.0;
    for (const Business& b : businesses) {
        if (b.is_active()) total += b.ebitda;
    }
    return total;
}

double GameState::shared_services_cost() const {
    double total = 0.0;
    for (const SharedService& s : shared_services) {
        if (s.active) total += s.annual_cost;
    }
    return total;
}

int GameState::active_shared_services() const {
    int count = 0;
    for (const SharedService& s : shared_services) {
        if (s.active) ++count;
    }
    return count;
}

int GameState::running_turnarounds() const {
    int count = 0;
    for (const ActiveTurnaround& t : active_turnarounds) {
        if (t.status == TurnaroundStatus::Active) ++count;
    }
    return count;
}

double GameState::founder_ownership() const {
    return shares_outstanding > 0 ? founder_shares / shares_outstanding : 0.0;
}

double GameState::compute_total_debt() const {
    double total = holdco_loan_balance;
    for (const Business& b : businesses) {
        if (b.status == BusinessStatus::Active || b.status == BusinessStatus::Integrated) {
            total += b.bank_debt_balance;
        }
    }
    return total;
}

std::string GameState::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"holdcoName\":\"" << json_escape(holdco_name) << "\",";
    oss << "\"round\":" << round << ",";
    oss << "\"maxRounds\":" << max_rounds << ",";
    oss << "\"phase\":\"" << to_string(phase) << "\",";
    oss << "\"gameOver\":" << (game_over ? "true" : "false") << ",";
    oss << "\"difficulty\":\"" << to_string(difficulty) << "\",";
    oss << "\"duration\":\"" << to_string(duration) << "\",";
    oss << "\"cash\":" << cash << ",";
    oss << "\"totalDebt\":" << total_debt << ",";
    oss << "\"interestRate\":" << interest_rate << ",";
    oss << "\"sharesOutstanding\":" << shares_outstanding << ",";
    oss << "\"founderShares\":" << founder_shares << ",";
    oss << "\"holdcoLoanBalance\":" << holdco_loan_balance << ",";
    oss << "\"holdcoLoanRoundsRemaining\":" << holdco_loan_rounds_remaining << ",";
    oss << "\"totalInvestedCapital\":" << total_invested_capital << ",";
    oss << "\"totalDistributions\":" << total_distributions << ",";
    oss << "\"totalBuybacks\":" << total_buybacks << ",";
    oss << "\"totalExitProceeds\":" << total_exit_proceeds << ",";
    oss << "\"requiresRestructuring\":" << (requires_restructuring ? "true" : "false") << ",";
    oss << "\"hasRestructured\":" << (has_restructured ? "true" : "false") << ",";
    oss << "\"covenantBreachRounds\":" << covenant_breach_rounds << ",";
    oss << "\"bankruptRound\":" << bankrupt_round << ",";
    oss << "\"creditTighteningRoundsRemaining\":" << credit_tightening_rounds_remaining << ",";
    oss << "\"inflationRoundsRemaining\":" << inflation_rounds_remaining << ",";
    oss << "\"maSourcing\":{\"tier\":" << ma_sourcing.tier << ",\"active\":"
        << (ma_sourcing.active ? "true" : "false") << "},";
    oss << "\"turnaroundTier\":" << turnaround_tier << ",";
    oss << "\"activeTurnarounds\":[";
    for (size_t i = 0; i < active_turnarounds.size(); ++i) {
        oss << active_turnarounds[i].to_json();
        if (i + 1 < active_turnarounds.size()) oss << ",";
    }
    oss << "],";
    oss << "\"sharedServices\":[";
    bool first = true;
    for (const SharedService& s : shared_services) {
        if (!s.active) continue;
        if (!first) oss << ",";
        oss << "\"" << to_string(s.type) << "\"";
        first = false;
    }
    oss << "],";
    oss << "\"businesses\":[";
    for (size_t i = 0; i < businesses.size(); ++i) {
        oss << businesses[i].to_json();
        if (i + 1 < businesses.size()) oss << ",";
    }
    oss << "],";
    oss << "\"exitedBusinesses\":[";
    for (size_t i = 0; i < exited_businesses.size(); ++i) {
        oss << exited_businesses[i].to_json();
        if (i + 1 < exited_businesses.size()) oss << ",";
    }
    oss << "],";
    oss << "\"dealPipeline\":[";
    for (size_t i = 0; i < deal_pipeline.size(); ++i) {
        oss << deal_pipeline[i].to_json();
        if (i + 1 < deal_pipeline.size()) oss << ",";
    }
    oss << "],";
    if (current_event) {
        oss << "\"currentEvent\":" << current_event->to_json();
    } else {
        oss << "\"currentEvent\":null";
    }
    oss << "}";
    return oss.str();
}
