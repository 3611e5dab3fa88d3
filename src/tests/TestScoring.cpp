/*
 * TestScoring.cpp
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


// Valuation floor and final score checks.

#include "Challenge.h"
#include "Constants.h"
#include "GameEvent.h"
#include "Scoring.h"
#include "Valuation.h"
#include <cmath>
#include <cstdio>

static int failures = 0;

static void check(bool ok, const char* name) {
    std::printf("%-60s %s\n", name, ok ? "ok" : "FAILED");
    if (!ok) ++failures;
}

static Business make_business(double ebitda, int quality) {
    Business b;
    b.id = "biz_1";
    b.name = "Anchor Logistics";
    b.sector_id = "agency";
    b.ebitda = ebitda;
    b.acquisition_ebitda = ebitda;
    b.peak_ebitda = ebitda;
    b.ebitda_margin = 0.15;
    b.revenue = ebitda / 0.15;
    b.quality = quality;
    b.acquisition_round = 1;
    b.acquisition_price = ebitda * 5;
    b.total_acquisition_cost = ebitda * 5;
    b.acquisition_multiple = 5;
    return b;
}

static GameState finished_state() {
    GameState state;
    state.round = 21;
    state.max_rounds = 20;
    state.game_over = true;
    state.cash = 4000;
    state.shares_outstanding = 1000;
    state.founder_shares = 800;
    state.shared_services = initialize_shared_services();
    state.businesses.push_back(make_business(2000, 4));
    state.total_invested_capital = 10000;
    return state;
}

int main() {
    // A shrinking low-quality business in a recession still fetches the floor
    Business poor = make_business(200, 1);
    poor.acquisition_ebitda = 600;
    poor.organic_growth_rate = -0.10;
    poor.due_diligence.operator_quality = OperatorQuality::Weak;
    poor.due_diligence.trend = Trend::Declining;
    poor.due_diligence.competitive_position = CompetitivePosition::Commoditized;
    ExitValuation floor = calculate_exit_valuation(poor, 3, EventType::GlobalRecession);
    check(floor.total_multiple >= MIN_EXIT_MULTIPLE, "exit multiple never below 2.0x");
    check(floor.exit_price == round_half_up(poor.ebitda * floor.total_multiple), "exit price is EBITDA times multiple");

    Business good = make_business(2000, 5);
    ExitValuation strong = calculate_exit_valuation(good, 10);
    ExitValuation bull = calculate_exit_valuation(good, 10, EventType::GlobalBullMarket);
    check(bull.total_multiple > strong.total_multiple, "bull markets lift the multiple");

    GameState bankrupt = finished_state();
    bankrupt.bankrupt_round = 7;
    ScoreBreakdown failed = calculate_final_score(bankrupt);
    check(failed.total == 0 && failed.grade == "F", "bankruptcy scores zero with grade F");
    check(failed.title.find("Year 7") != std::string::npos, "title names the bankruptcy year");

    GameState done = finished_state();
    ScoreBreakdown score = calculate_final_score(done);
    double parts = score.fcf_share_growth + score.portfolio_roic + score.capital_deployment +
        score.balance_sheet_health + score.strategic_discipline;
    check(score.total >= 0 && score.total <= 100, "score within 0..100");
    check(score.fcf_share_growth <= 25 && score.portfolio_roic <= 20 && score.capital_deployment <= 20 &&
        score.balance_sheet_health <= 15 && score.strategic_discipline <= 20, "components within their caps");
    check(std::fabs(parts - score.total) <= 1.0, "total is the sum of its parts");
    check(!score.grade.empty() && !score.title.empty(), "graded");

    double ev = calculate_enterprise_value(done);
    check(ev > done.cash, "portfolio adds to enterprise value");
    check(calculate_founder_equity_value(done) == round_half_up(ev * 0.8), "founder owns 80%");

    GameState empty = finished_state();
    empty.businesses.clear();
    empty.cash = 1500;
    empty.total_debt = 500;
    check(calculate_enterprise_value(empty) == 1000, "no portfolio leaves cash less debt");
    empty.total_debt = 5000;
    check(calculate_enterprise_value(empty) == 0, "enterprise value floored at zero");

    std::vector<PostGameInsight> insights = generate_post_game_insights(done);
    check(insights.size() <= 3, "at most three insights");

    PlayerResult mine = make_player_result("Avery", done);
    check(mine.score == score.total && mine.businesses == 1 && mine.sectors == 1, "player result summarizes the game");
    check(mine.founder_equity_value == calculate_founder_equity_value(done), "player result carries founder value");

    // Ranking: score first, then founder value plus distributions
    ComparisonEntry high;
    high.result.name = "high";
    high.result.score = 80;
    high.result.founder_equity_value = 1000;
    ComparisonEntry rich = high;
    rich.result.name = "rich";
    rich.result.score = 70;
    rich.result.founder_equity_value = 90000;
    ComparisonEntry payer = rich;
    payer.result.name = "payer";
    payer.result.founder_equity_value = 80000;
    payer.result.total_distributions = 15000;
    payer.is_you = true;
    std::vector<ComparisonEntry> ranked = compare_results({rich, high, payer});
    check(ranked[0].result.name == "high", "higher score ranks first");
    check(ranked[1].result.name == "payer" && ranked[1].is_you, "distributions break a score tie");
    check(ranked[2].result.name == "rich", "lower total return ranks last");

    ComparisonEntry twin = rich;
    twin.result.name = "twin";
    twin.result.founder_equity_value = 85000;
    twin.result.total_distributions = 5000;
    check(is_tied(rich.result, twin.result), "same score and total return tie");
    check(!is_tied(rich.result, payer.result), "different total return is not a tie");
    std::vector<ComparisonEntry> tied = compare_results({twin, rich});
    check(tied[0].result.name == "twin" && tied[1].result.name == "rich", "tied players keep their order");

    ChallengeParams params;
    params.seed = 123456789;
    params.difficulty = Difficulty::Normal;
    params.duration = Duration::Quick;
    std::string code = encode_challenge_params(params);
    check(code == "21i3v9.1.1", "challenge code uses a base 36 seed");
    std::optional<ChallengeParams> decoded = decode_challenge_params(code);
    check(decoded && decoded->seed == params.seed && decoded->difficulty == Difficulty::Normal &&
        decoded->duration == Duration::Quick, "challenge code decodes");
    check(!decode_challenge_params("21i3v9.1") && !decode_challenge_params("zz!.0.0") &&
        !decode_challenge_params("abc.2.0") && !decode_challenge_params("abc.0.5") &&
        !decode_challenge_params(".0.0"), "malformed codes rejected");
    check(!decode_challenge_params("zzzzzzz.0.0"), "seed beyond 32 bits rejected");

    std::printf("\n%d failure(s)\n", failures);
    return failures == 0 ? 0 : 1;
}
