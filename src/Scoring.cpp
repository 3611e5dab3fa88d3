/*
 * Scoring.cpp
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


#include "Scoring.h"
#include "Finance.h"
#include "Valuation.h"
#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>

double calculate_enterprise_value(const GameState& state) {
    std::vector<const Business*> active = state.active_businesses();
    if (active.empty()) return std::max(0.0, state.cash - state.total_debt);

    double total_ebitda = 0.0;
    double weighted_multiple = 0.0;
    double opco_debt = 0.0;
    for (const Business* b : active) {
        ExitValuation valuation = calculate_exit_valuation(*b, state.max_rounds);
        total_ebitda += b->ebitda;
        weighted_multiple += b->ebitda * valuation.total_multiple;
        opco_debt += b->seller_note_balance;
    }
    double blended = total_ebitda > 0 ? weighted_multiple / total_ebitda : 0.0;
    double portfolio_value = total_ebitda * blended;

    // Distributions already left the holdco, so they are added back
    double ev = portfolio_value + state.cash + state.total_distributions - (state.total_debt + opco_debt);
    return round_half_up(std::max(0.0, ev));
}

double calculate_founder_equity_value(const GameState& state) {
    return round_half_up(calculate_enterprise_value(state) * state.founder_ownership());
}

/**
 * Non-integrated businesses ever owned, exited records first.
 */
static std::vector<const Business*> all_owned_businesses(const GameState& state) {
    std::vector<const Business*> all;
    std::set<std::string> exited_ids;
    for (const Business& b : state.exited_businesses) {
        exited_ids.insert(b.id);
        if (b.status != BusinessStatus::Integrated) all.push_back(&b);
    }
    for (const Business& b : state.businesses) {
        if (exited_ids.count(b.id) == 0 && b.status != BusinessStatus::Integrated) all.push_back(&b);
    }
    return all;
}

static double average_roiic(const GameState& state) {
    if (state.metrics_history.empty()) return 0.0;
    double sum = 0.0;
    for (const HistoricalMetrics& h : state.metrics_history) sum += h.metrics.roiic;
    return sum / state.metrics_history.size();
}

static double score_fcf_share_growth(const GameState& state, const Metrics& metrics) {
    if (state.metrics_history.size() <= 1) return 0.0;
    double start = state.metrics_history.front().metrics.fcf_per_share;
    double end = metrics.fcf_per_share;
    if (start > 0) {
        double growth = (end - start) / start;
        return std::min(25.0, std::max(0.0, growth / 3.0 * 25.0));
    }
    return end > 0 ? 15.0 : 0.0;
}

static double score_roic(double roic) {
    if (roic >= 0.25) return 20.0;
    if (roic >= 0.15) return 15.0 + (roic - 0.15) / 0.10 * 5.0;
    if (roic >= 0.08) return 8.0 + (roic - 0.08) / 0.07 * 7.0;
    return std::max(0.0, roic / 0.08 * 8.0);
}

static double score_capital_deployment(const GameState& state, const std::vector<const Business*>& all) {
    double returns = 0.0;
    double capital = 0.0;
    for (const Business* b : all) {
        capital += b->acquisition_price;
        if (b->status == BusinessStatus::Sold && b->exit_price > 0) {
            returns += b->exit_price;
        } else if (b->is_active()) {
            returns += b->ebitda * b->acquisition_multiple * 1.1;
        }
    }
    double moic = capital > 0 ? returns / capital : 1.0;
    double moic_score = moic >= 2.5 ? 10.0 : moic >= 1.5 ? 5.0 + (moic - 1.5) * 5.0 : std::max(0.0, moic / 1.5 * 5.0);

    double roiic = average_roiic(state);
    double roiic_score = roiic >= 0.20 ? 10.0
        : roiic >= 0.10              ? 5.0 + (roiic - 0.10) / 0.10 * 5.0
                                     : std::max(0.0, roiic / 0.10 * 5.0);
    return moic_score + roiic_score;
}

static double score_balance_sheet(const GameState& state, const Metrics& metrics) {
    double nd = metrics.net_debt_to_ebitda;
    double score;
    if (nd < 1.0) {
        score = 15.0;
    } else if (nd < 2.5) {
        score = 10.0 + (2.5 - nd) / 1.5 * 5.0;
    } else if (nd < 3.5) {
        score = 5.0 + (3.5 - nd) * 5.0;
    } else {
        score = std::max(0.0, 5.0 - (nd - 3.5) * 2.0);
    }

    bool over_leveraged = false;
    bool breached = false;
    for (const HistoricalMetrics& h : state.metrics_history) {
        if (h.metrics.net_debt_to_ebitda > 4) over_leveraged = true;
        if (h.metrics.distress_level == DistressLevel::Breach) breached = true;
    }
    if (over_leveraged) score = std::max(0.0, score - 5.0);
    if (breached) score = std::max(0.0, score - 3.0);
    if (state.has_restructured) score = std::max(0.0, score - 5.0);
    return score;
}

static double score_distributions(const GameState& state, const Metrics& metrics) {
    double roiic = average_roiic(state);
    double nd = metrics.net_debt_to_ebitda;
    double cash_to_ebitda = metrics.total_ebitda > 0 ? state.cash / metrics.total_ebitda : 0.0;
    bool excess_cash = cash_to_ebitda > 2.0 && nd < 1.0;

    if (state.total_distributions <= 0) {
        if (excess_cash) return 1.0;
        return roiic > 0.15 ? 4.0 : 2.0;
    }

    double score = 0.0;
    if (roiic < 0.15 && nd < 2.0) {
        score = 4.0;
    } else if (roiic < 0.20 && nd < 2.5) {
        score = 2.0;
    }
    if (nd > 2.5) score = std::max(0.0, score - 2.0);
    double distribution_pct = state.total_invested_capital > 0
        ? state.total_distributions / state.total_invested_capital : 0.0;
    if (distribution_pct > 0.10 && nd < 1.5) score = std::min(5.0, score + 1.0);
    return score;
}

static double score_strategic_discipline(const GameState& state, const Metrics& metrics,
    const std::vector<const Business*>& all) {
    std::vector<const Business*> active = state.active_businesses();

    double focus_score = 0.0;
    std::optional<SectorFocusBonus> focus = calculate_sector_focus_bonus(state.businesses);
    if (focus) {
        focus_score = std::min(5.0, focus->tier * 1.5 + (focus->opco_count >= 4 ? 1.0 : 0.0));
    } else if (active.size() >= 4) {
        std::set<std::string> sectors;
        for (const Business* b : active) sectors.insert(b->sector_id);
        focus_score = std::min(4.0, (double)sectors.size());
    }

    double services_score = 0.0;
    int services = state.active_shared_services();
    if (services > 0 && active.size() >= 3) services_score = std::min(5.0, services * 1.5);

    double quality_sum = 0.0;
    for (const Business* b : all) quality_sum += b->quality;
    double avg_quality = all.empty() ? 3.0 : quality_sum / all.size();
    double quality_score = std::min(5.0, avg_quality);

    return focus_score + services_score + score_distributions(state, metrics) + quality_score;
}

static void assign_grade(ScoreBreakdown& score) {
    if (score.total >= 90) {
        score.grade = "S";
        score.title = "Master Allocator - You'd make Buffett proud";
    } else if (score.total >= 75) {
        score.grade = "A";
        score.title = "Skilled Compounder - Constellation-level discipline";
    } else if (score.total >= 60) {
        score.grade = "B";
        score.title = "Solid Builder - Your holdco has real potential";
    } else if (score.total >= 40) {
        score.grade = "C";
        score.title = "Emerging Operator - Room to sharpen your allocation instincts";
    } else if (score.total >= 20) {
        score.grade = "D";
        score.title = "Apprentice - Study the playbook and try again";
    } else {
        score.grade = "F";
        score.title = "Blown Up - Tyco sends its regards";
    }
}

ScoreBreakdown calculate_final_score(const GameState& state) {
    ScoreBreakdown score;
    if (state.bankrupt_round > 0) {
        score.grade = "F";
        score.title = "Bankrupt - Filed for bankruptcy in Year " + std::to_string(state.bankrupt_round);
        return score;
    }

    Metrics metrics = calculate_metrics(state);
    std::vector<const Business*> all = all_owned_businesses(state);

    double fcf = score_fcf_share_growth(state, metrics);
    double roic = score_roic(metrics.portfolio_roic);
    double deployment = score_capital_deployment(state, all);
    double balance = score_balance_sheet(state, metrics);
    double discipline = score_strategic_discipline(state, metrics, all);

    score.total = (int)round_half_up(fcf + roic + deployment + balance + discipline);
    score.fcf_share_growth = round1(fcf);
    score.portfolio_roic = round1(roic);
    score.capital_deployment = round1(deployment);
    score.balance_sheet_health = round1(balance);
    score.strategic_discipline = round1(discipline);
    assign_grade(score);
    return score;
}

std::vector<PostGameInsight> generate_post_game_insights(const GameState& state) {
    std::vector<PostGameInsight> insights;
    Metrics metrics = calculate_metrics(state);
    std::vector<const Business*> active = state.active_businesses();
    std::vector<const Business*> all = all_owned_businesses(state);

    std::set<std::string> sectors;
    for (const Business* b : active) sectors.insert(b->sector_id);
    bool no_improvements = true;
    for (const Business* b : all) {
        if (!b->improvements.empty()) no_improvements = false;
    }
    int smart_exits = 0;
    for (const Business& b : state.exited_businesses) {
        if (b.exit_price > 0 && b.acquisition_price > 0 && b.exit_price / b.acquisition_price > 2.0) ++smart_exits;
    }
    bool held_losers = false;
    for (const Business* b : active) {
        if (b->ebitda < b->acquisition_ebitda * 0.5) held_losers = true;
    }
    int services = state.active_shared_services();
    double roiic = average_roiic(state);
    double cash_to_ebitda = metrics.total_ebitda > 0 ? state.cash / metrics.total_ebitda : 0.0;

    if (all.size() <= 1) {
        insights.push_back({"Never Acquired", "Capital sat idle. A holdco compounds by redeploying cash flow."});
    }
    if (metrics.net_debt_to_ebitda > 3) {
        insights.push_back({"Over-Leveraged", "Debt above 3x EBITDA leaves no room for a bad year."});
    }
    if (sectors.size() == 1 && active.size() >= 3) {
        insights.push_back({"Single Sector", "Concentration built focus bonuses but one sector shock hits everything."});
    }
    if (metrics.roiic > 0.20 && metrics.portfolio_moic > 2.0) {
        insights.push_back({"High Returns", "Incremental capital earned more than 20%. That is the compounding engine."});
    }
    if (services == 0 && no_improvements) {
        insights.push_back({"Ignored Reinvestment", "No shared services or improvements. Owned businesses need capital too."});
    }
    if (metrics.cash_conversion > 0.80) {
        insights.push_back({"Strong Conversion", "More than 80% of EBITDA turned into free cash flow."});
    }
    if (smart_exits >= 2) {
        insights.push_back({"Smart Exits", "Two or more exits above 2x invested capital."});
    }
    if (held_losers) {
        insights.push_back({"Held Losers", "A business lost half its EBITDA and was never sold."});
    }
    if (services >= 2) {
        insights.push_back({"Shared Services", "Centralized functions lifted the whole portfolio."});
    }
    if (state.equity_raises_used > 0) {
        if (metrics.portfolio_roic > 0.15) {
            insights.push_back({"Equity Well Deployed", "Dilution paid off with returns above 15%."});
        } else {
            insights.push_back({"Equity Poorly Deployed", "Raised equity without earning a return that justified it."});
        }
    }
    if (state.total_buybacks > 0 && metrics.portfolio_roic < 0.15) {
        insights.push_back({"Well-Timed Buybacks", "Buying back shares beat reinvesting at modest returns."});
    }
    if (state.total_distributions > 0 && roiic < 0.15 && metrics.net_debt_to_ebitda < 2.0) {
        insights.push_back({"Smart Distributions", "Returned capital when reinvestment returns were modest."});
    }
    if (state.total_distributions <= 0 && cash_to_ebitda > 2.0 && metrics.net_debt_to_ebitda < 1.0) {
        insights.push_back({"Hoarded Cash", "Ended with idle cash that should have been deployed or returned."});
    }

    if (insights.size() > 3) insights.resize(3);
    return insights;
}

std::string ScoreBreakdown::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"fcfShareGrowth\":" << fcf_share_growth << ",";
    oss << "\"portfolioRoic\":" << portfolio_roic << ",";
    oss << "\"capitalDeployment\":" << capital_deployment << ",";
    oss << "\"balanceSheetHealth\":" << balance_sheet_health << ",";
    oss << "\"strategicDiscipline\":" << strategic_discipline << ",";
    oss << "\"total\":" << total << ",";
    oss << "\"grade\":\"" << grade << "\",";
    oss << "\"title\":\"" << json_escape(title) << "\"";
    oss << "}";
    return oss.str();
}
