/*
 * Challenge.h
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


#ifndef CHALLENGE_H
#define CHALLENGE_H

#include "GameConfig.h"
#include "GameState.h"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

/**
 * @brief What players share to face the same game: the seed and the presets.
 */
struct ChallengeParams {
    int32_t seed{0};
    Difficulty difficulty{Difficulty::Easy};
    Duration duration{Duration::Standard};
};

/**
 * @brief One player's finished game as it is compared in a challenge.
 */
struct PlayerResult {
    std::string name;
    double founder_equity_value{0.0};
    int score{0};
    std::string grade;
    int businesses{0};              // active at the end
    int sectors{0};                 // distinct sectors among them
    double peak_leverage{0.0};      // highest year-end net debt / EBITDA
    bool restructured{false};
    double total_distributions{0.0};

    std::string to_json() const;
};

struct ComparisonEntry {
    PlayerResult result;
    bool is_you{false};
};

/**
 * Compact code "SEED.DIFF.DUR", seed in base 36, difficulty 0 easy / 1 normal,
 * duration 0 standard / 1 quick.
 */
std::string encode_challenge_params(const ChallengeParams& params);

/**
 * Parses a challenge code. Returns nothing for a malformed one.
 */
std::optional<ChallengeParams> decode_challenge_params(const std::string& code);

/**
 * Summarizes a finished game for comparison.
 */
PlayerResult make_player_result(const std::string& name, const GameState& state);

/**
 * Ranks players best first: higher score, then higher founder equity value
 * plus distributions. Equal players keep their given order.
 */
std::vector<ComparisonEntry> compare_results(const std::vector<ComparisonEntry>& entries);

/**
 * True when neither the score nor the total return separates two players.
 */
bool is_tied(const PlayerResult& a, const PlayerResult& b);

#endif // CHALLENGE_H
