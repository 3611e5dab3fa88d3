/*
 * TestRng.cpp
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


// Determinism checks for the seeded generator and its round streams.

#include "SeededRng.h"
#include <cstdio>
#include <vector>

static int failures = 0;

static void check(bool ok, const char* name) {
    std::printf("%-60s %s\n", name, ok ? "ok" : "FAILED");
    if (!ok) ++failures;
}

static bool same_draws(SeededRng a, SeededRng b, int n) {
    for (int i = 0; i < n; ++i) {
        if (a.next() != b.next()) return false;
    }
    return true;
}

int main() {
    RngStreams first = create_rng_streams(12345, 3);
    RngStreams second = create_rng_streams(12345, 3);
    check(same_draws(first.deals, second.deals, 1000), "deals stream replays 1000 draws");
    check(same_draws(first.events, second.events, 1000), "events stream replays 1000 draws");
    check(same_draws(first.simulation, second.simulation, 1000), "simulation stream replays 1000 draws");
    check(same_draws(first.market, second.market, 1000), "market stream replays 1000 draws");
    check(same_draws(first.cosmetic, second.cosmetic, 1000), "cosmetic stream replays 1000 draws");

    // Draining one stream must leave its siblings where they were
    RngStreams drained = create_rng_streams(777, 5);
    RngStreams fresh = create_rng_streams(777, 5);
    for (int i = 0; i < 500; ++i) drained.deals.next();
    check(same_draws(drained.events, fresh.events, 100), "events unaffected by draining deals");
    check(same_draws(drained.market, fresh.market, 100), "market unaffected by draining deals");

    check(first.deals.next() != first.events.next(), "sibling streams differ");

    RngStreams round5 = create_rng_streams(42, 5);
    double source0 = round5.deals.fork("source-0").next();
    double source1 = round5.deals.fork("source-1").next();
    check(source0 != source1, "fork keys source-0 and source-1 differ");
    check(round5.deals.fork("source-0").next() == source0, "fork is repeatable");

    RngStreams r1 = create_rng_streams(42, 1);
    RngStreams r2 = create_rng_streams(42, 2);
    check(r1.deals.next() != r2.deals.next(), "rounds derive different streams");

    SeededRng a(42);
    SeededRng b(42);
    bool equal = true;
    bool in_range = true;
    for (int i = 0; i < 100; ++i) {
        double x = a.next();
        if (x != b.next()) equal = false;
        if (x < 0.0 || x >= 1.0) in_range = false;
    }
    check(equal, "seed 42 emits the same first 100 values");
    check(in_range, "draws lie in [0, 1)");

    SeededRng ints(9);
    bool bounded = true;
    for (int i = 0; i < 1000; ++i) {
        int v = ints.next_int(3, 7);
        if (v < 3 || v > 7) bounded = false;
    }
    check(bounded, "next_int stays within inclusive bounds");

    RngStreams m1 = create_rng_streams(99, 4);
    RngStreams m2 = create_rng_streams(99, 4);
    ActionOutcomes o1 = pre_roll_action_outcomes(m1.market, 16);
    ActionOutcomes o2 = pre_roll_action_outcomes(m2.market, 16);
    check(o1.integration_rolls.size() == 16, "pre-rolled integration slots");
    check(o1.sell_variance_rolls == o2.sell_variance_rolls && o1.integration_rolls == o2.integration_rolls,
        "pre-rolled outcomes replay");

    std::printf("\n%d failure(s)\n", failures);
    return failures == 0 ? 0 : 1;
}
