/*
 * GameEvent.h
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


#ifndef GAMEEVENT_H
#define GAMEEVENT_H

#include "Valuation.h"
#include <optional>
#include <string>
#include <vector>

enum class EventType {
    GlobalBullMarket,
    GlobalRecession,
    GlobalInterestHike,
    GlobalInterestCut,
    GlobalInflation,
    GlobalCreditTightening,
    GlobalFinancialCrisis,
    GlobalQuiet,
    PortfolioStarJoins,
    PortfolioTalentLeaves,
    PortfolioClientSigns,
    PortfolioClientChurns,
    PortfolioBreakthrough,
    PortfolioCompliance,
    PortfolioReferralDeal,
    PortfolioEquityDemand,
    PortfolioSellerNoteRenego,
    UnsolicitedOffer,
    SectorEvent
};

enum class EventCategory { Global, Portfolio, Sector, Offer };

const char* to_string(EventType type);
EventCategory category_of(EventType type);

/**
 * Choice events defer every effect until the player picks an action.
 */
bool is_choice_event(EventType type);

enum class ImpactMetric { Ebitda, Revenue, Margin, InterestRate, Cash, GrowthRate };

const char* to_string(ImpactMetric metric);

/**
 * @brief Measured before/after change caused by an event.
 */
struct EventImpact {
    std::string business_id;
    std::string business_name;
    ImpactMetric metric{ImpactMetric::Ebitda};
    double before{0.0};
    double after{0.0};
    double delta{0.0};
    std::optional<double> delta_pct;

    std::string to_json() const;
};

enum class ChoiceAction {
    AcceptOffer,
    DeclineOffer,
    GrantEquityDemand,
    DeclineEquityDemand,
    AcceptSellerNoteRenego,
    DeclineSellerNoteRenego
};

const char* to_string(ChoiceAction action);

struct EventChoice {
    std::string label;
    std::string description;
    ChoiceAction action{ChoiceAction::DeclineOffer};
    std::string variant;          // positive, negative or neutral
    double cost{0.0};
    double success_probability{1.0};
};

/**
 * @brief The event drawn for a round.
 *
 * Simulation rules:
 * - Portfolio and sector events may target a single business.
 * - Unsolicited offers carry the buyer, the amount and the multiple.
 * - Impacts are filled when immediate effects are applied.
 * - Choice events carry their choices and nothing is applied until one is taken.
 */
class GameEvent {
public:
    std::string id;
    EventType type{EventType::GlobalQuiet};
    std::string title;
    std::string description;
    std::string effect;
    std::string tip;
    std::string tip_source;
    std::string affected_business_id;
    int sector_event_index{-1};

    double offer_amount{0.0};
    double offer_multiple{0.0};
    std::optional<BuyerProfile> buyer_profile;

    int equity_dilution_shares{0};
    double renego_payoff_pct{0.0};

    std::vector<EventImpact> impacts;
    std::vector<EventChoice> choices;
    std::string narrative;

    bool has_choices() const { return is_choice_event(type); }
    std::string to_json() const;
};

#endif // GAMEEVENT_H
