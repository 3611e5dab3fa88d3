/*
 * EventGenerator.h
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


#ifndef EVENTGENERATOR_H
#define EVENTGENERATOR_H

#include "GameEvent.h"
#include "GameState.h"
#include "Sectors.h"
#include "SeededRng.h"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief Row of the global or portfolio event table.
 */
struct EventDefinition {
    EventType type;
    double probability;
    const char* title;
    const char* description;
    const char* effect;
    const char* tip;
    const char* tip_source;
};

/**
 * @brief Sector-specific shock. A fixed effect has min equal to max.
 */
struct SectorEventDefinition {
    std::string sector_id;
    std::string title;
    std::string description;
    std::string effect;
    Range ebitda_effect;
    double growth_effect{0.0};
    double cost{0.0};
    bool affects_all{false};
    double probability{0.0};
};

const std::vector<EventDefinition>& global_events();
const std::vector<EventDefinition>& portfolio_events();
const std::vector<SectorEventDefinition>& sector_events();

/**
 * Shares a key employee asks for in an equity demand.
 */
const int EQUITY_DEMAND_DILUTION_SHARES = 25;
/**
 * Share of the seller-note balance a renegotiating seller accepts as payoff.
 */
const double SELLER_NOTE_RENEGO_PAYOFF = 0.75;

/**
 * Whether a business can be the subject of a portfolio event. Equity demands
 * need a quality 3+ business held at least 2 rounds; renegotiations need a
 * seller note on a business bought within the last 5 rounds.
 */
bool is_eligible_for_event(EventType type, const Business& business, int round);

/**
 * Draws the event of the round from the events stream.
 *
 * Global events are tried first, then portfolio events (talent odds moved by
 * recruiting services, the cumulative probability capped at one), then sector
 * events for owned sectors, then an unsolicited offer. A quiet year is
 * returned when nothing fires.
 */
GameEvent generate_event(const GameState& state, SeededRng& rng);

/**
 * Applies the immediate effects of an event to state and records the impacts
 * on the event. Choice events are left untouched.
 */
void apply_event_effects(GameState& state, GameEvent& event, SeededRng& rng);

#endif // EVENTGENERATOR_H
