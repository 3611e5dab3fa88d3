/*
 * GameSerializer.cpp
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


#include "GameSerializer.h"
#include "Challenge.h"
#include "Scoring.h"

static void serializeRoundHistory(const std::vector<RoundHistoryEntry>& history, std::ostream& out) {
    out << "[\n";
    for (size_t i = 0; i < history.size(); ++i) {
        out << "    " << history[i].to_json();
        if (i + 1 < history.size()) out << ",\n";
    }
    out << "\n  ]";
}

static void serializeInsights(const std::vector<PostGameInsight>& insights, std::ostream& out) {
    out << "[";
    for (size_t i = 0; i < insights.size(); ++i) {
        out << "{\"pattern\":\"" << json_escape(insights[i].pattern) << "\",";
        out << "\"insight\":\"" << json_escape(insights[i].insight) << "\"}";
        if (i + 1 < insights.size()) out << ",";
    }
    out << "]";
}

void GameSerializer::serialize(const Game& game, std::ostream& out) {
    const GameState& state = game.state;
    out << "{\n";
    out << "  \"config\": " << game.config.to_json() << ",\n";
    out << "  \"state\": " << state.to_json() << ",\n";
    out << "  \"metrics\": " << calculate_metrics(state).to_json() << ",\n";
    out << "  \"roundHistory\": ";
    serializeRoundHistory(state.round_history, out);
    if (state.game_over) {
        out << ",\n  \"enterpriseValue\": " << calculate_enterprise_value(state);
        out << ",\n  \"founderEquityValue\": " << calculate_founder_equity_value(state);
        out << ",\n  \"score\": " << calculate_final_score(state).to_json();
        out << ",\n  \"insights\": ";
        serializeInsights(generate_post_game_insights(state), out);
        ChallengeParams challenge;
        challenge.seed = game.config.seed;
        challenge.difficulty = game.config.difficulty;
        challenge.duration = game.config.duration;
        out << ",\n  \"challengeCode\": \"" << encode_challenge_params(challenge) << "\"";
        out << ",\n  \"result\": " << make_player_result(state.holdco_name, state).to_json();
    }
    out << "\n}";
}
