/*
 * GameConfig.cpp
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


#include "GameConfig.h"
#include "Business.h"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

const char* to_string(Difficulty difficulty) {
    switch (difficulty) {
    case Difficulty::Easy: return "easy";
    case Difficulty::Normal: return "normal";
    }
    return "easy";
}

const char* to_string(Duration duration) {
    switch (duration) {
    case Duration::Standard: return "standard";
    case Duration::Quick: return "quick";
    }
    return "standard";
}

Difficulty parse_difficulty(const std::string& name) {
    if (name == "easy") return Difficulty::Easy;
    if (name == "normal") return Difficulty::Normal;
    throw std::invalid_argument("unknown difficulty: " + name);
}

Duration parse_duration(const std::string& name) {
    if (name == "standard") return Duration::Standard;
    if (name == "quick") return Duration::Quick;
    throw std::invalid_argument("unknown duration: " + name);
}

GameConfig::GameConfig(int32_t seed, Difficulty difficulty, Duration duration,
    const std::string& starting_sector, const std::string& holdco_name)
    : GameConfig() {
    this->seed = seed;
    this->difficulty = difficulty;
    this->duration = duration;
    this->starting_sector = starting_sector;
    this->holdco_name = holdco_name;
    apply_presets();
}

void GameConfig::apply_presets() {
    max_rounds = duration == Duration::Quick ? 10 : 20;
    starting_interest_rate = 0.07;
    starting_quality = 3;
    total_shares = 1000;
    switch (difficulty) {
    case Difficulty::Easy:
        initial_cash = 20000;
        founder_shares = 800;
        starting_debt = 0;
        starting_ebitda = 1000;
        starting_multiple_cap = 0;
        holdco_debt_start_round = 0;
        leaderboard_multiplier = 1.0;
        break;
    case Difficulty::Normal:
        initial_cash = 5000;
        founder_shares = 1000;
        starting_debt = 3000;
        starting_ebitda = 800;
        starting_multiple_cap = 4.0;
        holdco_debt_start_round = 1;
        leaderboard_multiplier = 1.15;
        break;
    }
}

int GameConfig::holdco_loan_term() const {
    if (starting_debt <= 0) return 0;
    if (duration == Duration::Quick) return max_rounds;
    return std::max(4, (int)std::ceil(max_rounds * 0.5));
}

std::string GameConfig::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"seed\":" << seed << ",";
    oss << "\"difficulty\":\"" << to_string(difficulty) << "\",";
    oss << "\"duration\":\"" << to_string(duration) << "\",";
    oss << "\"startingSector\":\"" << starting_sector << "\",";
    oss << "\"holdcoName\":\"" << json_escape(holdco_name) << "\",";
    oss << "\"maxRounds\":" << max_rounds << ",";
    oss << "\"initialCash\":" << initial_cash << ",";
    oss << "\"founderShares\":" << founder_shares << ",";
    oss << "\"totalShares\":" << total_shares << ",";
    oss << "\"startingDebt\":" << starting_debt << ",";
    oss << "\"startingInterestRate\":" << starting_interest_rate << ",";
    oss << "\"startingEbitda\":" << starting_ebitda << ",";
    oss << "\"startingMultipleCap\":" << starting_multiple_cap << ",";
    oss << "\"startingQuality\":" << starting_quality << ",";
    oss << "\"holdcoDebtStartRound\":" << holdco_debt_start_round << ",";
    oss << "\"leaderboardMultiplier\":" << leaderboard_multiplier;
    oss << "}";
    return oss.str();
}
