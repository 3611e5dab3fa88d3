/*
 * GameState.h
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


#ifndef GAMESTATE_H
#define GAMESTATE_H

#include "Business.h"
#include "GameConfig.h"
#include "GameEvent.h"
#include "Turnaround.h"
#include <optional>
#include <string>
#include <vector>

enum class GamePhase { Collect, Event, Allocate, Restructure };
enum class DistressLevel { Comfortable, Elevated, Stressed, Breach };
enum class SharedServiceType { FinanceReporting, RecruitingHr, Procurement, MarketingBrand, TechnologySystems };
enum class AcquisitionResult { None, Success, Snatched };

const char* to_string(GamePhase phase);
const char* to_string(DistressLevel level);
const char* to_string(SharedServiceType type);
const char* to_string(AcquisitionResult result);

struct SharedService {
    SharedServiceType type{SharedServiceType::FinanceReporting};
    std::string name;
    double unlock_cost{0.0};
    double annual_cost{0.0};
    std::string description;
    std::string effect;
    int unlocked_round{0};
    bool active{false};
};

/**
 * All five shared services, inactive, in their canonical order.
 */
std::vector<SharedService> initialize_shared_services();

/**
 * @brief Declared acquisition focus. Empty strings mean "any".
 */
struct MAFocus {
    std::string sector_id;
    SizePreference size_preference{SizePreference::Any};
    std::string sub_type;
};

struct MASourcingState {
    int tier{0};
    bool active{false};
    int unlocked_round{0};
    int last_upgrade_round{0};
};

/**
 * @brief Snapshot of portfolio health, recomputed from state on demand.
 */
struct Metrics {
    double cash{0.0};
    double total_debt{0.0};
    double total_ebitda{0.0};
    double total_fcf{0.0};
    double fcf_per_share{0.0};
    double portfolio_roic{0.0};
    double roiic{0.0};
    double portfolio_moic{1.0};
    double net_debt_to_ebitda{0.0};
    DistressLevel distress_level{DistressLevel::Comfortable};
    double cash_conversion{0.0};
    double interest_rate{0.0};
    double shares_outstanding{0.0};
    double intrinsic_value_per_share{0.0};
    double total_invested_capital{0.0};
    double total_distributions{0.0};
    double total_buybacks{0.0};
    double total_exit_proceeds{0.0};
    double total_revenue{0.0};
    double avg_ebitda_margin{0.0};

    std::string to_json() const;
};

struct HistoricalMetrics {
    int round{0};
    Metrics metrics;
    double fcf{0.0};
    double nopat{0.0};
    double invested_capital{0.0};
};

enum class GameActionType {
    Acquire,
    AcquireTuckIn,
    MergeBusinesses,
    DesignatePlatform,
    Improve,
    UnlockSharedService,
    DeactivateSharedService,
    PayDebt,
    IssueEquity,
    Buyback,
    Distribute,
    Sell,
    AcceptOffer,
    DeclineOffer,
    SourceDeals,
    UpgradeMaSourcing,
    ToggleMaSourcing,
    ProactiveOutreach,
    DistressedSale,
    EmergencyEquityRaise,
    UnlockTurnaroundTier,
    StartTurnaround,
    TurnaroundResolved
};

const char* to_string(GameActionType type);

struct GameAction {
    GameActionType type{GameActionType::Acquire};
    int round{0};
    std::string business_id;
    double amount{0.0};
    std::string detail;

    std::string to_json() const;
};

/**
 * @brief Review record of a completed round.
 */
struct RoundHistoryEntry {
    int round{0};
    std::vector<GameAction> actions;
    std::string chronicle;
    std::optional<EventType> event_type;
    std::string event_title;
    std::string event_description;
    Metrics metrics;
    int business_count{0};
    double cash{0.0};
    double total_debt{0.0};

    std::string to_json() const;
};

/**
 * @brief Everything that changes during a game.
 *
 * Simulation rules:
 * - Cash is never negative once a phase transition completes.
 * - total_debt is the holdco loan plus bank debt of active and integrated
 *   businesses; seller notes are counted separately in the metrics.
 * - Bolt-ons folded into a platform stay in businesses with status integrated
 *   and never count towards portfolio EBITDA.
 * - event_history, metrics_history and round_history are append-only.
 */
class GameState {
public:
    std::string holdco_name;
    int round{0};
    GamePhase phase{GamePhase::Collect};
    bool game_over{false};
    Difficulty difficulty{Difficulty::Easy};
    Duration duration{Duration::Standard};
    int max_rounds{20};

    std::vector<Business> businesses;
    std::vector<Business> exited_businesses;

    double cash{0.0};
    double total_debt{0.0};
    double interest_rate{0.07};
    double shares_outstanding{1000.0};
    double founder_shares{800.0};
    double initial_raise_amount{0.0};
    double initial_ownership_pct{0.8};

    double total_invested_capital{0.0};
    double total_distributions{0.0};
    double total_buybacks{0.0};
    double total_exit_proceeds{0.0};
    int equity_raises_used{0};
    int last_equity_raise_round{0};
    int last_buyback_round{0};
    double founder_distributions_received{0.0};

    std::vector<SharedService> shared_services;

    std::vector<Deal> deal_pipeline;
    MAFocus ma_focus;
    MASourcingState ma_sourcing;

    int turnaround_tier{0};
    std::vector<ActiveTurnaround> active_turnarounds;

    std::optional<GameEvent> current_event;
    std::vector<GameEvent> event_history;
    int credit_tightening_rounds_remaining{0};
    int inflation_rounds_remaining{0};

    std::vector<HistoricalMetrics> metrics_history;
    std::vector<RoundHistoryEntry> round_history;
    std::vector<GameAction> actions_this_round;

    // Holdco loan
    double holdco_loan_balance{0.0};
    double holdco_loan_rate{0.0};
    int holdco_loan_rounds_remaining{0};
    int holdco_debt_start_round{0};

    // Last collection
    double debt_payment_this_round{0.0};
    double cash_before_debt_payments{0.0};
    bool had_skipped_payments{false};

    // Distress
    bool requires_restructuring{false};
    int covenant_breach_rounds{0};
    bool has_restructured{false};
    int bankrupt_round{0};

    int acquisitions_this_round{0};
    int max_acquisitions_per_round{2};
    AcquisitionResult last_acquisition_result{AcquisitionResult::None};

    // Occurrence counters keying forked streams within a round
    int sourcing_count_this_round{0};
    int outreach_count_this_round{0};
    int sell_rolls_used{0};
    int decline_rolls_used{0};
    int integration_rolls_used{0};
    int quality_rolls_used{0};

    Business* find_business(const std::string& id);
    const Business* find_business(const std::string& id) const;
    const Deal* find_deal(const std::string& id) const;
    std::vector<const Business*> active_businesses() const;
    int active_count() const;
    double total_active_ebitda() const;
    double shared_services_cost() const;
    int running_turnarounds() const;
    int active_shared_services() const;
    double founder_ownership() const;

    /**
     * Holdco loan plus bank debt of active and integrated businesses.
     */
    double compute_total_debt() const;

    std::string to_json() const;
};

#endif // GAMESTATE_H
