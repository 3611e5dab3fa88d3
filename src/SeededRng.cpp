/*
 * SeededRng.cpp
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

#include "SeededRng.h"
#include <cmath>
#include <iostream>
#include <random>

#define DEBUG 0

SeededRng::SeededRng(int32_t seed) : state((uint32_t)seed) {}

double SeededRng::next() {
    state += 0x6d2b79f5u;
    uint32_t t = (state ^ (state >> 15)) * (1u | state);
    t = (t + (t ^ (t >> 7)) * (61u | t)) ^ t;
    uint32_t res = t ^ (t >> 14);
    if (DEBUG) {
        std::cout << "RND: " << res << std::endl;
    }
    return (double)res / 4294967296.0;
}

int SeededRng::next_int(int min, int max) {
    return (int)std::floor(next() * (double)(max - min + 1)) + min;
}

double SeededRng::next_in_range(double lo, double hi) {
    return lo + next() * (hi - lo);
}

int SeededRng::pick_index(size_t n) {
    if (n == 0) return -1;
    return (int)std::floor(next() * (double)n);
}

SeededRng SeededRng::fork(const std::string& key) const {
    return SeededRng(hash_two((int32_t)state, string_hash(key)));
}

SeededRng SeededRng::fork(int32_t key) const {
    return SeededRng(hash_two((int32_t)state, key));
}

int32_t to_int32(double value) {
    if (!std::isfinite(value)) return 0;
    double m = std::fmod(std::trunc(value), 4294967296.0);
    if (m < 0) m += 4294967296.0;
    return (int32_t)(uint32_t)m;
}

int32_t string_hash(const std::string& key) {
    uint32_t h = 0;
    for (unsigned char c : key) {
        h = h * 31u + (uint32_t)c;
    }
    return (int32_t)h;
}

int32_t hash_two(int32_t a, int32_t b) {
    // The golden-ratio product is formed in double precision before truncation.
    uint32_t h = (uint32_t)a ^ (uint32_t)to_int32((double)b * 2654435769.0);
    h = (h ^ (h >> 16)) * 0x85ebca6bu;
    h = (h ^ (h >> 13)) * 0xc2b2ae35u;
    return (int32_t)(h ^ (h >> 16));
}

int32_t derive_round_seed(int32_t master_seed, int round) {
    return hash_two(master_seed, round);
}

int32_t derive_stream_seed(int32_t round_seed, const std::string& stream_id) {
    return hash_two(round_seed, string_hash(stream_id));
}

RngStreams create_rng_streams(int32_t master_seed, int round) {
    int32_t round_seed = derive_round_seed(master_seed, round);
    return RngStreams{
        SeededRng(derive_stream_seed(round_seed, "deals")),
        SeededRng(derive_stream_seed(round_seed, "events")),
        SeededRng(derive_stream_seed(round_seed, "simulation")),
        SeededRng(derive_stream_seed(round_seed, "market")),
        SeededRng(derive_stream_seed(round_seed, "cosmetic")),
    };
}

ActionOutcomes pre_roll_action_outcomes(SeededRng& market, int max_slots) {
    ActionOutcomes outcomes;
    for (int i = 0; i < max_slots; ++i) {
        outcomes.contested_snatch_rolls.push_back(market.next());
        outcomes.sell_variance_rolls.push_back(market.next());
        outcomes.event_decline_rolls.push_back(market.next());
        outcomes.integration_rolls.push_back(market.next());
        outcomes.quality_improvement_rolls.push_back(market.next());
    }
    return outcomes;
}

int32_t generate_random_seed() {
    std::random_device rd;
    std::uniform_int_distribution<int32_t> dist(0, 0x7ffffffe);
    return dist(rd);
}
