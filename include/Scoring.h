/*
 * Scoring.h
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


#ifndef SCORING_H
#define SCORING_H

#include "GameState.h"
#include <string>
#include <vector>

/**
 * @brief Final score out of 100 with its five components.
 */
struct ScoreBreakdown {
    double fcf_share_growth{0.0};      // out of 25
    double portfolio_roic{0.0};        // out of 20
    double capital_deployment{0.0};    // out of 20
    double balance_sheet_health{0.0};  // out of 15
    double strategic_discipline{0.0};  // out of 20
    int total{0};
    std::string grade;
    std::string title;

    std::string to_json() const;
};

struct PostGameInsight {
    std::string pattern;
    std::string insight;
};

/**
 * Portfolio value at blended exit multiples, plus cash and distributions,
 * less all debt, floored at zero.
 */
double calculate_enterprise_value(const GameState& state);

/**
 * Enterprise value attributable to the founder's shares.
 */
double calculate_founder_equity_value(const GameState& state);

/**
 * Scores a finished game. A bankrupt holdco scores zero with grade F.
 */
ScoreBreakdown calculate_final_score(const GameState& state);

/**
 * Up to three lessons drawn from how the game was played.
 */
std::vector<PostGameInsight> generate_post_game_insights(const GameState& state);

#endif // SCORING_H
