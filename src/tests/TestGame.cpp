/*
 * TestGame.cpp
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


// Round state machine and player action checks.

#include "Constants.h"
#include "Game.h"
#include "Scoring.h"
#include <cstdio>
#include <stdexcept>

static int failures = 0;

static void check(bool ok, const char* name) {
    std::printf("%-60s %s\n", name, ok ? "ok" : "FAILED");
    if (!ok) ++failures;
}

/**
 * Sets up situations no sequence of player actions reaches quickly.
 */
class GameTestAccess {
public:
    static GameState& state(Game& game) { return game.state; }
};

class FixedNarrative : public NarrativeProvider {
public:
    std::optional<std::string> generate(EventType, const NarrativeContext& context) override {
        return "Year " + std::to_string(context.round) + " at " + context.holdco_name;
    }
};

static GameConfig quick_config(int32_t seed) {
    return GameConfig(seed, Difficulty::Easy, Duration::Quick, "agency", "Test Holdings");
}

static Game allocating_game(int32_t seed) {
    Game game(quick_config(seed));
    game.start();
    game.advance_to_event();
    // Any choice lapses; the allocate phase is what we want
    game.advance_to_allocate();
    return game;
}

/**
 * Plays a game ending every round without actions. Restructures by
 * declaring bankruptcy.
 */
static void play_passively(Game& game) {
    const GameState& state = game.get_state();
    while (!state.game_over) {
        game.advance_to_event();
        if (state.game_over) break;
        if (state.phase == GamePhase::Restructure) {
            game.declare_bankruptcy();
            break;
        }
        game.advance_to_allocate();
        game.end_round();
    }
}

static void test_setup() {
    Game game(quick_config(42));
    game.start();
    const GameState& state = game.get_state();
    check(state.round == 1 && state.phase == GamePhase::Collect, "game starts collecting in round 1");
    check(state.businesses.size() == 1, "one starting business");
    check(state.cash == 20000 - state.businesses[0].acquisition_price, "starting business paid from cash");
    check(!state.deal_pipeline.empty(), "initial pipeline");
    check(state.max_rounds == 10, "quick game lasts ten rounds");

    GameConfig bad = quick_config(1);
    bad.starting_sector = "shipping";
    Game invalid(bad);
    bool threw = false;
    try {
        invalid.start();
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    check(threw, "unknown starting sector is rejected");
}

static void test_phases() {
    Game game(quick_config(42));
    game.start();
    const GameState& state = game.get_state();
    check(!game.advance_to_allocate(), "cannot allocate before the event");
    check(!game.end_round(), "cannot end the round while collecting");
    check(game.advance_to_event(), "collect to event");
    check(state.phase == GamePhase::Event && state.current_event.has_value(), "event drawn");
    check(state.event_history.size() == 1, "event recorded");
    check(!game.advance_to_event(), "cannot collect twice");
    check(game.advance_to_allocate(), "event to allocate");
    check(state.phase == GamePhase::Allocate, "allocating");
    check(game.end_round(), "round ends");
    check(state.round == 2 && state.phase == GamePhase::Collect, "next round collects");
    check(state.round_history.size() == 1 && state.metrics_history.size() == 1, "round history recorded");
    check(!state.current_event.has_value(), "event cleared between rounds");

    play_passively(game);
    check(state.game_over, "game ends");
    if (state.bankrupt_round == 0) {
        check(state.round_history.size() == 10, "ten rounds played");
        check(!game.advance_to_event(), "no transitions after the game ends");
    }
}

static void test_determinism() {
    Game a(quick_config(2024));
    Game b(quick_config(2024));
    a.start();
    b.start();
    play_passively(a);
    play_passively(b);
    const GameState& sa = a.get_state();
    const GameState& sb = b.get_state();
    bool same = sa.cash == sb.cash && sa.event_history.size() == sb.event_history.size();
    for (size_t i = 0; same && i < sa.event_history.size(); ++i) {
        same = sa.event_history[i].type == sb.event_history[i].type &&
            sa.event_history[i].narrative == sb.event_history[i].narrative;
    }
    check(same, "same seed and decisions replay the same game");
    check(calculate_final_score(sa).total == calculate_final_score(sb).total, "same score");
}

static void test_invalid_actions() {
    Game game(quick_config(42));
    game.start();
    check(!game.improve_business("biz_1", ImprovementType::OperatingPlaybook), "no improvements while collecting");

    Game allocating = allocating_game(42);
    const GameState& state = allocating.get_state();
    std::string owned = state.businesses[0].id;
    check(!allocating.acquire_business("deal_missing", DealStructureType::AllCash), "unknown deal");
    check(!allocating.sell_business("biz_missing"), "unknown business");
    check(!allocating.merge_businesses(owned, owned, "Self"), "cannot merge a business with itself");
    check(!allocating.pay_down_debt(100), "no holdco loan to pay");
    check(!allocating.issue_equity(0), "zero raise");
    check(!allocating.unlock_shared_service(SharedServiceType::Procurement), "shared services need three opcos");
    check(!allocating.accept_offer(), "no offer pending");
    check(!allocating.set_ma_focus("shipping", SizePreference::Any), "unknown focus sector");
    check(!allocating.proactive_outreach(), "outreach needs tier 3");
    check(!allocating.distressed_sale(owned), "distressed sale only while restructuring");
    check(!allocating.advance_from_restructure(), "not restructuring");
}

static void test_acquisition() {
    Game game = allocating_game(42);
    GameState& state = GameTestAccess::state(game);
    std::string deal_id;
    DealStructure chosen;
    bool found = false;
    for (const Deal& deal : state.deal_pipeline) {
        if (deal.heat == DealHeat::Contested) continue;
        for (const DealStructure& s : game.structures_for(deal)) {
            if (s.type == DealStructureType::AllCash) {
                deal_id = deal.id;
                chosen = s;
                found = true;
                break;
            }
        }
        if (found) break;
    }
    check(found, "an affordable uncontested deal");
    if (!found) return;

    double cash = state.cash;
    size_t pipeline = state.deal_pipeline.size();
    check(game.acquire_business(deal_id, chosen.type), "acquire all cash");
    check(state.businesses.size() == 2, "business added");
    check(state.cash == cash - chosen.cash_required, "price paid");
    check(chosen.cash_required > 0 && state.businesses[1].total_acquisition_cost > 0, "all cash is never free");
    check(state.deal_pipeline.size() == pipeline - 1, "deal leaves the pipeline");
    check(state.last_acquisition_result == AcquisitionResult::Success, "acquisition succeeded");
    check(state.actions_this_round.back().type == GameActionType::Acquire, "action recorded");
    check(!game.acquire_business(deal_id, chosen.type), "deal cannot be bought twice");

    state.acquisitions_this_round = state.max_acquisitions_per_round;
    if (!state.deal_pipeline.empty()) {
        const Deal& next = state.deal_pipeline.front();
        DealStructure any = game.structures_for(next).empty() ? chosen : game.structures_for(next).front();
        check(!game.acquire_business(next.id, any.type), "acquisition cap per round");
    }
}

static void test_capital_actions() {
    Game game = allocating_game(7);
    const GameState& state = game.get_state();

    double shares = state.shares_outstanding;
    check(!game.issue_equity(1e9), "founder keeps 51%");
    check(game.issue_equity(500), "small raise");
    check(state.shares_outstanding > shares, "new shares issued");
    check(!game.buyback_shares(100), "no buyback right after a raise");

    double cash = state.cash;
    check(game.distribute_to_owners(100), "distribution");
    check(state.cash == cash - 100 && state.total_distributions == 100, "distribution paid");
    check(!game.distribute_to_owners(state.cash + 1), "cannot distribute more than cash");

    std::string owned = state.businesses[0].id;
    cash = state.cash;
    check(game.designate_platform(owned), "designate platform");
    check(state.businesses[0].is_platform && state.businesses[0].platform_scale == 1, "platform scale 1");
    check(state.cash < cash, "platform setup costs cash");
    check(!game.designate_platform(owned), "already a platform");

    double ebitda = state.businesses[0].ebitda;
    check(game.improve_business(owned, ImprovementType::OperatingPlaybook), "operating playbook");
    check(state.businesses[0].ebitda > ebitda, "playbook lifts EBITDA");
    check(!game.improve_business(owned, ImprovementType::OperatingPlaybook), "each improvement once");

    size_t pipeline = state.deal_pipeline.size();
    cash = state.cash;
    check(game.source_deals(), "source deals");
    check(game.source_deals(), "source deals again");
    check(state.deal_pipeline.size() == pipeline + 6, "each sourcing adds three deals");
    check(state.cash == cash - 1000, "sourcing costs 500 each");
    check(state.deal_pipeline[pipeline].id != state.deal_pipeline[pipeline + 3].id, "new deal ids");

    check(game.sell_business(owned), "sell the starting business");
    check(state.active_count() == 0 && state.exited_businesses.size() == 1, "business exited");
    check(state.exited_businesses[0].exit_price >= 0, "exit price recorded");
}

static void test_narrative_provider() {
    Game game(quick_config(3));
    FixedNarrative fixed;
    game.set_narrative_provider(&fixed);
    game.start();
    game.advance_to_event();
    const GameState& state = game.get_state();
    check(state.current_event && state.current_event->narrative == "Year 1 at Test Holdings", "provider writes the chronicle");

    Game plain(quick_config(3));
    plain.start();
    plain.advance_to_event();
    check(!plain.get_state().current_event->narrative.empty(), "templates cover every event");
}

static void test_restructuring() {
    Game game(quick_config(11));
    game.start();
    GameState& state = GameTestAccess::state(game);
    state.cash = 0;
    state.businesses[0].ebitda = -5000;

    check(game.advance_to_event(), "collect with a shortfall");
    check(state.phase == GamePhase::Restructure && state.requires_restructuring, "restructuring required");
    check(state.cash == 0, "cash floored");
    check(!game.advance_to_allocate(), "no allocation while restructuring");
    check(!game.advance_from_restructure(), "restructuring needs a corrective action");

    std::string owned = state.businesses[0].id;
    check(game.distressed_sale(owned), "distressed sale");
    check(game.advance_from_restructure(), "restructure complete");
    check(state.has_restructured && !state.requires_restructuring, "restructured once");
    check(state.phase == GamePhase::Event, "back to the event");

    game.advance_to_allocate();
    game.end_round();
    check(state.game_over && state.bankrupt_round == 1, "empty holdco with no cash is bankrupt");

    ScoreBreakdown score = calculate_final_score(state);
    check(score.total == 0 && score.grade == "F", "bankruptcy scores F");
}

static void test_bankruptcy_declared() {
    Game game(quick_config(12));
    game.start();
    GameState& state = GameTestAccess::state(game);
    state.cash = 0;
    state.businesses[0].ebitda = -5000;
    game.advance_to_event();
    check(game.declare_bankruptcy(), "declare bankruptcy");
    check(state.game_over && state.bankrupt_round == 1, "game over");
    check(!game.end_round(), "nothing after bankruptcy");
}

static void test_structure_menu() {
    Game game = allocating_game(42);
    GameState& state = GameTestAccess::state(game);
    const Deal* target = nullptr;
    for (const Deal& deal : state.deal_pipeline) {
        if (deal.heat != DealHeat::Contested) target = &deal;
    }
    check(target != nullptr, "an uncontested deal");
    if (!target) return;
    std::string deal_id = target->id;
    double price = target->effective_price;

    // Without cash nothing is on the menu, so nothing can be bought for free
    state.cash = 0;
    check(game.structures_for(*target).empty(), "no structures without cash");
    check(!game.acquire_business(deal_id, DealStructureType::AllCash), "unoffered all cash is rejected");
    check(!game.acquire_business(deal_id, DealStructureType::SellerNote), "unoffered seller note is rejected");
    check(state.businesses.size() == 1 && state.acquisitions_this_round == 0, "rejected deal leaves the state alone");
    check(state.find_deal(deal_id) != nullptr, "deal still in the pipeline");

    state.cash = price;
    check(game.acquire_business(deal_id, DealStructureType::AllCash), "all cash once affordable");
    check(state.cash == 0 && state.businesses.size() == 2, "the offered price is what leaves cash");
}

/**
 * Renames a deal until the market stream says another buyer wins it.
 */
static std::string make_snatched(Game& game, Deal& deal) {
    const GameState& state = game.get_state();
    RngStreams rng = create_rng_streams(game.get_config().seed, state.round);
    for (int n = 0;; ++n) {
        std::string id = "deal_contested_" + std::to_string(n);
        if (rng.market.fork(id).next() < CONTESTED_SNATCH_PROBABILITY) {
            deal.id = id;
            deal.heat = DealHeat::Contested;
            return id;
        }
    }
}

static void test_contested_snatch() {
    Game game = allocating_game(42);
    GameState& state = GameTestAccess::state(game);
    state.cash = 1e6;
    std::string deal_id = make_snatched(game, state.deal_pipeline.front());
    size_t pipeline = state.deal_pipeline.size();

    check(game.acquire_business(deal_id, DealStructureType::AllCash), "bid on a contested deal");
    check(state.last_acquisition_result == AcquisitionResult::Snatched, "another buyer wins it");
    check(state.businesses.size() == 1, "no business granted");
    check(state.cash == 1e6, "no cash spent");
    check(state.deal_pipeline.size() == pipeline - 1 && !state.find_deal(deal_id), "deal leaves the pipeline");
    check(state.acquisitions_this_round == 1, "the attempt counts towards the cap");

    // Buying something else first does not change who wins it
    Game other = allocating_game(42);
    GameState& other_state = GameTestAccess::state(other);
    other_state.cash = 1e6;
    std::string other_id = make_snatched(other, other_state.deal_pipeline.front());
    std::string first = other_state.deal_pipeline.back().id;
    other_state.deal_pipeline.back().heat = DealHeat::Cold;
    check(other.acquire_business(first, DealStructureType::AllCash), "buy another deal first");
    check(other.acquire_business(other_id, DealStructureType::AllCash) &&
        other_state.last_acquisition_result == AcquisitionResult::Snatched, "outcome keyed by the deal");
}

static void test_tuck_in_consolidation() {
    Game game = allocating_game(42);
    GameState& state = GameTestAccess::state(game);
    state.cash = 1e6;
    std::string platform_id = state.businesses[0].id;
    check(game.designate_platform(platform_id), "platform designated");

    Deal& deal = state.deal_pipeline.front();
    deal.heat = DealHeat::Cold;
    deal.business.sector_id = state.businesses[0].sector_id;
    deal.business.sub_type = state.businesses[0].sub_type;
    std::string deal_id = deal.id;
    double target_ebitda = deal.business.ebitda;
    double platform_ebitda = state.businesses[0].ebitda;

    check(game.acquire_tuck_in(deal_id, DealStructureType::AllCash, platform_id), "tuck-in");
    const Business* platform = state.find_business(platform_id);
    const Business& bolt_on = state.businesses.back();
    check(state.businesses.size() == 2 && bolt_on.status == BusinessStatus::Integrated, "bolt-on kept as integrated");
    check(bolt_on.parent_platform_id == platform_id, "bolt-on points at its platform");
    check(platform && platform->ebitda == platform_ebitda + target_ebitda + bolt_on.synergies_realized,
        "platform consolidates the bolt-on EBITDA");
    check(platform && state.total_active_ebitda() == platform->ebitda, "bolt-on EBITDA counted once");
    check(platform && game.metrics().total_ebitda == platform->ebitda, "metrics count it once too");
    check(platform && platform->platform_scale == 2, "platform scale grows");
}

static void test_covenant_breach_restructure() {
    Game game(quick_config(42));
    game.start();
    GameState& state = GameTestAccess::state(game);
    // Long, interest-free holdco loan far above the breach ratio but cheap to service
    state.holdco_loan_balance = 12 * state.businesses[0].ebitda + state.cash;
    state.holdco_loan_rate = 0.0;
    state.holdco_loan_rounds_remaining = 1000;
    state.total_debt = state.compute_total_debt();

    game.advance_to_event();
    check(state.phase == GamePhase::Event, "first breach year plays normally");
    game.advance_to_allocate();
    game.end_round();
    check(state.covenant_breach_rounds == 1 && !state.requires_restructuring, "one breach year is tolerated");

    game.advance_to_event();
    game.advance_to_allocate();
    game.end_round();
    check(state.covenant_breach_rounds == COVENANT_BREACH_ROUNDS_LIMIT && state.requires_restructuring,
        "second breach year requires restructuring");
    check(!state.game_over, "not bankrupt before restructuring");

    game.advance_to_event();
    check(state.phase == GamePhase::Restructure, "next collection opens the restructure phase");
}

static void test_second_shortfall_bankrupt() {
    Game game(quick_config(11));
    game.start();
    GameState& state = GameTestAccess::state(game);
    state.has_restructured = true;
    state.cash = 0;
    state.businesses[0].ebitda = -5000;

    check(game.advance_to_event(), "collection runs");
    check(state.game_over && state.bankrupt_round == 1, "a shortfall after restructuring is bankruptcy");
    check(!state.requires_restructuring && state.event_history.empty(), "no event and no second restructure");
    check(calculate_final_score(state).grade == "F", "bankrupt game scores F");
}

static void test_referral_held_back() {
    // A referral drawn while restructuring adds nothing until the restructure completes
    int held = 0;
    bool held_ok = true;
    for (int32_t seed = 1; seed <= 300; ++seed) {
        Game game(quick_config(seed));
        game.start();
        GameState& state = GameTestAccess::state(game);
        state.cash = 0;
        state.businesses[0].ebitda = -5000;
        size_t pipeline = state.deal_pipeline.size();
        game.advance_to_event();
        if (!state.current_event || state.current_event->type != EventType::PortfolioReferralDeal) continue;
        ++held;
        if (state.deal_pipeline.size() != pipeline) held_ok = false;
    }
    check(held_ok, "held-back referral adds no deal");
    std::printf("  (%d held-back referrals seen)\n", held);

    Game game = allocating_game(42);
    GameState& state = GameTestAccess::state(game);
    GameEvent referral;
    referral.type = EventType::PortfolioReferralDeal;
    state.current_event = referral;
    state.event_history.push_back(referral);
    state.phase = GamePhase::Restructure;
    state.requires_restructuring = true;
    size_t pipeline = state.deal_pipeline.size();

    check(game.emergency_equity_raise(500), "emergency raise");
    check(game.advance_from_restructure(), "restructure complete");
    check(state.deal_pipeline.size() == pipeline + 1, "referral arrives after restructuring");
    check(state.deal_pipeline.back().round_appeared == state.round, "referral is this year's deal");
}

int main() {
    test_setup();
    test_phases();
    test_determinism();
    test_invalid_actions();
    test_acquisition();
    test_capital_actions();
    test_narrative_provider();
    test_restructuring();
    test_bankruptcy_declared();
    test_structure_menu();
    test_contested_snatch();
    test_tuck_in_consolidation();
    test_covenant_breach_restructure();
    test_second_shortfall_bankrupt();
    test_referral_held_back();

    std::printf("\n%d failure(s)\n", failures);
    return failures == 0 ? 0 : 1;
}
