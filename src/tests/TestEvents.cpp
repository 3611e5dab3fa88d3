/*
 * TestEvents.cpp
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


// Event generation, effects and narrative checks.

#include "Constants.h"
#include "EventGenerator.h"
#include "GameState.h"
#include "Narrative.h"
#include <cstdio>

static int failures = 0;

static void check(bool ok, const char* name) {
    std::printf("%-60s %s\n", name, ok ? "ok" : "FAILED");
    if (!ok) ++failures;
}

static GameState make_state() {
    GameState state;
    state.round = 6;
    state.cash = 3000;
    state.shared_services = initialize_shared_services();
    Business b;
    b.id = "biz_1";
    b.name = "Prism Creative";
    b.sector_id = "agency";
    b.ebitda = 1000;
    b.acquisition_ebitda = 1000;
    b.ebitda_margin = 0.20;
    b.revenue = 5000;
    b.quality = 3;
    b.acquisition_round = 1;
    state.businesses.push_back(b);
    return state;
}

/**
 * Custom writer that only covers quiet years.
 */
class QuietOnly : public NarrativeProvider {
public:
    std::optional<std::string> generate(EventType type, const NarrativeContext&) override {
        if (type == EventType::GlobalQuiet) return std::string("Nothing happened.");
        return std::nullopt;
    }
};

int main() {
    check(is_choice_event(EventType::UnsolicitedOffer), "offers are choice events");
    check(is_choice_event(EventType::PortfolioEquityDemand), "equity demands are choice events");
    check(is_choice_event(EventType::PortfolioSellerNoteRenego), "note renegotiations are choice events");
    check(!is_choice_event(EventType::GlobalRecession), "recessions apply immediately");

    const EventType choices[] = {EventType::UnsolicitedOffer, EventType::PortfolioEquityDemand,
        EventType::PortfolioSellerNoteRenego};
    for (EventType type : choices) {
        GameState state = make_state();
        GameEvent event;
        event.type = type;
        event.affected_business_id = "biz_1";
        event.offer_amount = 9000;
        SeededRng rng(5);
        apply_event_effects(state, event, rng);
        bool untouched = state.cash == 3000 && state.businesses[0].ebitda == 1000 && event.impacts.empty();
        check(untouched, "choice event applies nothing before a choice");
    }

    GameState recession = make_state();
    GameEvent hit;
    hit.type = EventType::GlobalRecession;
    SeededRng rng(11);
    apply_event_effects(recession, hit, rng);
    check(recession.businesses[0].ebitda < 1000, "recession lowers EBITDA");
    check(!hit.impacts.empty(), "recession records its impact");

    GameState capped = make_state();
    capped.interest_rate = MAX_INTEREST_RATE;
    GameEvent hike;
    hike.type = EventType::GlobalInterestHike;
    apply_event_effects(capped, hike, rng);
    check(capped.interest_rate == MAX_INTEREST_RATE, "rate hikes stop at the ceiling");

    GameState inflation = make_state();
    GameEvent inflate;
    inflate.type = EventType::GlobalInflation;
    apply_event_effects(inflation, inflate, rng);
    check(inflation.inflation_rounds_remaining == 2, "inflation lasts two rounds");

    GameState a = make_state();
    GameState b = make_state();
    SeededRng rng_a = create_rng_streams(42, 6).events;
    SeededRng rng_b = create_rng_streams(42, 6).events;
    GameEvent ea = generate_event(a, rng_a);
    GameEvent eb = generate_event(b, rng_b);
    check(ea.type == eb.type && ea.id == eb.id && ea.affected_business_id == eb.affected_business_id,
        "same seed draws the same event");

    Business fresh = make_state().businesses[0];
    fresh.acquisition_round = 5;
    check(!is_eligible_for_event(EventType::PortfolioEquityDemand, fresh, 6), "equity demand needs two years held");
    fresh.acquisition_round = 3;
    check(is_eligible_for_event(EventType::PortfolioEquityDemand, fresh, 6), "equity demand after two years");
    check(!is_eligible_for_event(EventType::PortfolioSellerNoteRenego, fresh, 6), "renegotiation needs a note");

    TemplateNarrative templates;
    NarrativeContext context;
    context.holdco_name = "Cedar Holdings";
    context.round = 4;
    context.variant = 1;
    std::string text = templates.render(EventType::GlobalRecession, context);
    check(text.find("Cedar Holdings") != std::string::npos, "template names the holdco");
    check(text.find('{') == std::string::npos, "no placeholder left behind");
    context.variant = 0;
    check(templates.render(EventType::GlobalRecession, context) != text, "variants differ");

    QuietOnly quiet;
    check(quiet.generate(EventType::GlobalQuiet, context).has_value(), "custom writer answers its events");
    check(!quiet.generate(EventType::GlobalRecession, context).has_value(), "custom writer may decline");

    std::printf("\n%d failure(s)\n", failures);
    return failures == 0 ? 0 : 1;
}
