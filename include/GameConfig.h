/*
 * GameConfig.h
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


#ifndef GAMECONFIG_H
#define GAMECONFIG_H

#include <cstdint>
#include <string>

enum class Difficulty { Easy, Normal };
enum class Duration { Standard, Quick };

const char* to_string(Difficulty difficulty);
const char* to_string(Duration duration);

/**
 * Parses a difficulty name. Throws std::invalid_argument on unknown names.
 */
Difficulty parse_difficulty(const std::string& name);
/**
 * Parses a duration name. Throws std::invalid_argument on unknown names.
 */
Duration parse_duration(const std::string& name);

/**
 * @brief Class to store game level parameters.
 */
class GameConfig {
public:
    int32_t seed;              // master seed
    Difficulty difficulty;
    Duration duration;
    std::string starting_sector;
    std::string holdco_name;

    // Derived from difficulty and duration by apply_presets()
    int max_rounds;            // 20 standard, 10 quick
    double initial_cash;       // thousands of dollars
    int founder_shares;
    int total_shares;
    double starting_debt;      // holdco loan
    double starting_interest_rate;
    double starting_ebitda;
    double starting_multiple_cap; // 0 means uncapped
    int starting_quality;
    int holdco_debt_start_round;
    double leaderboard_multiplier;

    /**
     * @brief Default constructor: easy, standard, agency.
     */
    GameConfig()
        : seed(1), difficulty(Difficulty::Easy), duration(Duration::Standard),
          starting_sector("agency"), holdco_name("Holdco"),
          max_rounds(20), initial_cash(20000), founder_shares(800), total_shares(1000),
          starting_debt(0), starting_interest_rate(0.07), starting_ebitda(1000),
          starting_multiple_cap(0), starting_quality(3), holdco_debt_start_round(0),
          leaderboard_multiplier(1.0) {}

    GameConfig(int32_t seed, Difficulty difficulty, Duration duration,
        const std::string& starting_sector = "agency", const std::string& holdco_name = "Holdco");

    /**
     * Resets the derived fields from difficulty and duration.
     */
    void apply_presets();

    /**
     * Holdco loan term in rounds: the whole game for quick games, otherwise
     * half the game with a floor of 4.
     */
    int holdco_loan_term() const;

    /**
     * @brief Convert the game config to a JSON string.
     */
    std::string to_json() const;
};

#endif // GAMECONFIG_H
