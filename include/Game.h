/*
 * Game.h
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


#ifndef GAME_H
#define GAME_H

#include "DealGenerator.h"
#include "DealStructure.h"
#include "Finance.h"
#include "GameConfig.h"
#include "GameState.h"
#include "Narrative.h"
#include "SeededRng.h"
#include <optional>
#include <string>
#include <vector>

/**
 * @brief The Game class runs one holdco through its annual cycle.
 *
 * Simulation rules:
 * - Each round moves collect -> event -> allocate -> collect. Collection runs
 *   the cash waterfall and draws the year's event; allocation regenerates the
 *   deal pipeline and accepts player actions; ending the round grows every
 *   business and records history.
 * - Running out of cash, or breaching the leverage covenant two rounds in a
 *   row, forces a restructure phase. A second occurrence after restructuring
 *   is bankruptcy and ends the game.
 * - All randomness comes from round streams derived from the master seed, so
 *   the same seed and the same decisions replay the same game.
 * - Player actions return false and leave the state untouched when they are
 *   not allowed.
 * - Acquisitions name a financing structure by type; the terms always come
 *   from the menu structures_for() offers for the deal at that moment.
 */
class Game {
    friend class GameSerializer;
    friend class GameTestAccess;
public:
    /**
     * Constructor stores the config. Call start() to set up the holdco.
     */
    explicit Game(GameConfig config = GameConfig());

    /**
     * Buys the starting business, sets up the cap table and the first pipeline.
     */
    void start();

    // Phase transitions. Each returns false when called from the wrong phase.
    bool advance_to_event();
    bool advance_to_allocate();
    bool end_round();

    // Acquisitions and portfolio construction
    bool acquire_business(const std::string& deal_id, DealStructureType structure);
    bool acquire_tuck_in(const std::string& deal_id, DealStructureType structure, const std::string& platform_id);
    bool merge_businesses(const std::string& business_id1, const std::string& business_id2,
        const std::string& new_name);
    bool designate_platform(const std::string& business_id);
    bool improve_business(const std::string& business_id, ImprovementType type);

    // Shared services
    bool unlock_shared_service(SharedServiceType type);
    bool deactivate_shared_service(SharedServiceType type);

    // Turnarounds
    bool unlock_turnaround_tier();
    bool start_turnaround(const std::string& business_id, const std::string& program_id);

    // Capital structure
    bool pay_down_debt(double amount);
    bool pay_down_bank_debt(const std::string& business_id, double amount);
    bool issue_equity(double amount);
    bool buyback_shares(double amount);
    bool distribute_to_owners(double amount);
    bool sell_business(const std::string& business_id);

    // Event choices
    bool resolve_choice(ChoiceAction action);
    bool accept_offer();
    bool decline_offer();
    bool grant_equity_demand();
    bool decline_equity_demand();
    bool accept_seller_note_renego();
    bool decline_seller_note_renego();

    // Deal sourcing
    bool set_ma_focus(const std::string& sector_id, SizePreference size, const std::string& sub_type = "");
    bool source_deals();
    bool upgrade_ma_sourcing();
    bool toggle_ma_sourcing();
    bool proactive_outreach();

    // Restructuring
    bool distressed_sale(const std::string& business_id);
    bool emergency_equity_raise(double amount);
    bool declare_bankruptcy();
    bool advance_from_restructure();

    /**
     * Financing structures currently on offer for a deal in the pipeline.
     */
    std::vector<DealStructure> structures_for(const Deal& deal) const;

    /**
     * Metrics recomputed from the current state.
     */
    Metrics metrics() const { return calculate_metrics(state); }

    /**
     * Sets the narrative writer consulted before the templates. Not owned;
     * nullptr restores templates only.
     */
    void set_narrative_provider(NarrativeProvider* provider) { narrative = provider; }

    const GameState& get_state() const { return state; }
    const GameConfig& get_config() const { return config; }
    const CollectionSummary& get_last_collection() const { return last_collection; }

private:
    GameConfig config;
    GameState state;
    DealGenerator deal_generator;
    TemplateNarrative template_narrative;
    NarrativeProvider* narrative{nullptr};
    ActionOutcomes outcomes;
    CollectionSummary last_collection;

    RngStreams round_streams() const { return create_rng_streams(config.seed, state.round); }
    PipelineContext pipeline_context() const;
    DistressRestrictions current_restrictions() const;
    bool in_phase(GamePhase phase) const { return !state.game_over && state.phase == phase; }
    /**
     * The current event when it is an unresolved choice of the given type.
     */
    GameEvent* pending_choice(EventType type);
    int find_deal_index(const std::string& deal_id) const;
    /**
     * Next pre-rolled value of a kind; past the pre-rolled slots a fork of the
     * market stream keyed by kind and occurrence takes over.
     */
    double take_roll(const std::vector<double>& rolls, int& used, const char* kind);
    /**
     * The offered structure of the given type for a deal, if it is on the menu.
     */
    std::optional<DealStructure> offered_structure(const Deal& deal, DealStructureType type) const;
    bool can_acquire(const DealStructure& structure) const;
    /**
     * Removes a contested deal won by another buyer. Returns true when it was.
     */
    bool deal_snatched(int deal_index);
    /**
     * Sells a business and its bolt-ons, settling their debts from the price.
     * Returns the net proceeds credited to the holdco.
     */
    double dispose_business(Business& business, double exit_price);
    void auto_deactivate_shared_services();
    /**
     * Settles every running program whose end round has come.
     */
    void resolve_turnarounds(SeededRng& rng);
    void record_action(GameActionType type, const std::string& business_id = "", double amount = 0.0,
        const std::string& detail = "");
    std::string narrate(const GameEvent& event, SeededRng& cosmetic);
};

#endif // GAME_H
