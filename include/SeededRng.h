/*
 * SeededRng.h
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

#ifndef SEEDEDRNG_H
#define SEEDEDRNG_H

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

/**
 * @brief Deterministic 32-bit generator (Mulberry32).
 *
 * Simulation rules:
 * - The same seed always produces the same sequence on every platform.
 * - A stream can be forked by a key into an independent child stream; forking
 *   never advances the parent.
 * - All arithmetic is carried out on 32-bit words, so sequences are identical
 *   across compilers and word sizes.
 */
class SeededRng {
public:
    explicit SeededRng(int32_t seed = 0);

    /**
     * Returns a double in [0, 1).
     */
    double next();
    /**
     * Returns an integer in [min, max], both inclusive.
     */
    int next_int(int min, int max);
    /**
     * Returns a double in [lo, hi).
     */
    double next_in_range(double lo, double hi);
    /**
     * Returns a random index in [0, n), or -1 when n is zero.
     */
    int pick_index(size_t n);

    /**
     * Picks a random element. The vector must not be empty.
     */
    template <typename T>
    const T& pick(const std::vector<T>& values) {
        return values[pick_index(values.size())];
    }

    /**
     * In-place Fisher-Yates shuffle, walking down from the last element.
     */
    template <typename T>
    void shuffle(std::vector<T>& values) {
        for (size_t i = values.size(); i-- > 1;) {
            size_t j = (size_t)(next() * (double)(i + 1));
            std::swap(values[i], values[j]);
        }
    }

    /**
     * Derives an independent child stream from the current state and a key.
     */
    SeededRng fork(const std::string& key) const;
    SeededRng fork(int32_t key) const;

    int32_t get_state() const { return (int32_t)state; }

private:
    uint32_t state{0};
};

/**
 * Converts a double to a signed 32-bit integer with modular wrap-around.
 */
int32_t to_int32(double value);
/**
 * Polynomial string hash: h = h * 31 + code, wrapped to 32 bits.
 */
int32_t string_hash(const std::string& key);
/**
 * Mixing hash of two 32-bit integers used by every seed derivation.
 */
int32_t hash_two(int32_t a, int32_t b);
/**
 * Derives the seed of a round from the master seed.
 */
int32_t derive_round_seed(int32_t master_seed, int round);
/**
 * Derives the seed of a named stream from the round seed.
 */
int32_t derive_stream_seed(int32_t round_seed, const std::string& stream_id);

/**
 * @brief The five round-scoped streams.
 *
 * Consuming one stream never perturbs another.
 */
struct RngStreams {
    SeededRng deals;
    SeededRng events;
    SeededRng simulation;
    SeededRng market;
    SeededRng cosmetic;
};

RngStreams create_rng_streams(int32_t master_seed, int round);

/**
 * @brief Player-action rolls drawn up front from the market stream.
 */
struct ActionOutcomes {
    // Drawn only to keep the market stream's slot order; snatches fork the
    // market stream by deal id instead.
    std::vector<double> contested_snatch_rolls;
    std::vector<double> sell_variance_rolls;
    std::vector<double> event_decline_rolls;
    std::vector<double> integration_rolls;
    std::vector<double> quality_improvement_rolls;
};

/**
 * Pre-rolls max_slots outcomes of each kind, interleaved slot by slot.
 */
ActionOutcomes pre_roll_action_outcomes(SeededRng& market, int max_slots = 16);

/**
 * Fresh master seed for non-challenge games. This is the only source of
 * external entropy in the engine.
 */
int32_t generate_random_seed();

#endif // SEEDEDRNG_H
