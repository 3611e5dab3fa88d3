/*
 * Challenge.cpp
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


#include "Challenge.h"
#include "Scoring.h"
#include <algorithm>
#include <set>
#include <sstream>
#include <stdexcept>

static std::string to_base36(int64_t n) {
    const char* digits = "0123456789abcdefghijklmnopqrstuvwxyz";
    uint64_t v = (uint64_t)(n < 0 ? -n : n);
    if (v == 0) return "0";
    std::string out;
    while (v > 0) {
        out.insert(out.begin(), digits[v % 36]);
        v /= 36;
    }
    return out;
}

static std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::istringstream iss(text);
    std::string part;
    while (std::getline(iss, part, sep)) parts.push_back(part);
    return parts;
}

std::string encode_challenge_params(const ChallengeParams& params) {
    return to_base36(params.seed) + "." + (params.difficulty == Difficulty::Normal ? "1" : "0") + "." +
        (params.duration == Duration::Quick ? "1" : "0");
}

std::optional<ChallengeParams> decode_challenge_params(const std::string& code) {
    std::vector<std::string> parts = split(code, '.');
    if (parts.size() < 3 || parts[0].empty()) return std::nullopt;

    long long seed = 0;
    try {
        size_t used = 0;
        seed = std::stoll(parts[0], &used, 36);
        if (used != parts[0].size()) return std::nullopt;
    } catch (const std::invalid_argument&) {
        return std::nullopt;
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
    if (seed < 0 || seed > INT32_MAX) return std::nullopt;

    ChallengeParams params;
    params.seed = (int32_t)seed;
    if (parts[1] == "0") {
        params.difficulty = Difficulty::Easy;
    } else if (parts[1] == "1") {
        params.difficulty = Difficulty::Normal;
    } else {
        return std::nullopt;
    }
    if (parts[2] == "0") {
        params.duration = Duration::Standard;
    } else if (parts[2] == "1") {
        params.duration = Duration::Quick;
    } else {
        return std::nullopt;
    }
    return params;
}

PlayerResult make_player_result(const std::string& name, const GameState& state) {
    PlayerResult result;
    result.name = name;
    result.founder_equity_value = calculate_founder_equity_value(state);
    ScoreBreakdown score = calculate_final_score(state);
    result.score = score.total;
    result.grade = score.grade;

    std::set<std::string> sectors;
    for (const Business* b : state.active_businesses()) sectors.insert(b->sector_id);
    result.businesses = state.active_count();
    result.sectors = (int)sectors.size();

    for (const HistoricalMetrics& h : state.metrics_history) {
        result.peak_leverage = std::max(result.peak_leverage, h.metrics.net_debt_to_ebitda);
    }
    result.restructured = state.has_restructured;
    result.total_distributions = state.total_distributions;
    return result;
}

static double total_return(const PlayerResult& r) {
    return r.founder_equity_value + r.total_distributions;
}

std::vector<ComparisonEntry> compare_results(const std::vector<ComparisonEntry>& entries) {
    std::vector<ComparisonEntry> ranked = entries;
    std::stable_sort(ranked.begin(), ranked.end(), [](const ComparisonEntry& a, const ComparisonEntry& b) {
        if (a.result.score != b.result.score) return a.result.score > b.result.score;
        return total_return(a.result) > total_return(b.result);
    });
    return ranked;
}

bool is_tied(const PlayerResult& a, const PlayerResult& b) {
    return a.score == b.score && total_return(a) == total_return(b);
}

std::string PlayerResult::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"name\":\"" << json_escape(name) << "\",";
    oss << "\"founderEquityValue\":" << founder_equity_value << ",";
    oss << "\"score\":" << score << ",";
    oss << "\"grade\":\"" << grade << "\",";
    oss << "\"businesses\":" << businesses << ",";
    oss << "\"sectors\":" << sectors << ",";
    oss << "\"peakLeverage\":" << peak_leverage << ",";
    oss << "\"restructured\":" << (restructured ? "true" : "false") << ",";
    oss << "\"totalDistributions\":" << total_distributions;
    oss << "}";
    return oss.str();
}
