/*
 * Constants.h
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

#ifndef CONSTANTS_H
#define CONSTANTS_H

#include <algorithm>
#include <cmath>

// All money amounts are in thousands of dollars (1000 = $1M).

const double TAX_RATE = 0.30;
const double MAX_ORGANIC_GROWTH_RATE = 0.20;
const double MIN_ORGANIC_GROWTH_RATE = -0.10;
const double MIN_MARGIN = 0.03;
const double MAX_MARGIN = 0.80;
const double EBITDA_FLOOR_PCT = 0.30;
const double MIN_EXIT_MULTIPLE = 2.0;
const double COVENANT_BREACH_RATIO = 4.5;
const double MIN_FOUNDER_OWNERSHIP = 0.51;
const double CONTESTED_SNATCH_PROBABILITY = 0.40;
const double MIN_INTEREST_RATE = 0.03;
const double MAX_INTEREST_RATE = 0.15;

const int MAX_PIPELINE_DEALS = 8;
const int EARNOUT_EXPIRATION_ROUNDS = 4;
const int COVENANT_BREACH_ROUNDS_LIMIT = 2;
const int EQUITY_BUYBACK_COOLDOWN = 2;
const int MIN_OPCOS_FOR_SHARED_SERVICES = 3;
const int MAX_ACTIVE_SHARED_SERVICES = 3;
const int ACTION_OUTCOME_SLOTS = 16;

// Player action costs
const double DEAL_SOURCING_COST_BASE = 500;
const double DEAL_SOURCING_COST_TIER1 = 300;
const double PROACTIVE_OUTREACH_COST = 400;
const double IMPROVEMENT_COST_FLOOR = 50;
const double PLATFORM_SETUP_COST_FLOOR = 50;
const double MERGE_COST_FLOOR = 100;

// Equity
const double EQUITY_DILUTION_STEP = 0.10;
const double EQUITY_DILUTION_FLOOR = 0.10;
const double EMERGENCY_EQUITY_PRICE_PCT = 0.50;
const double DISTRESSED_SALE_PCT = 0.70;

// Improvement effects scale with quality 1..5
const double QUALITY_IMPROVEMENT_MULTIPLIER[] = {0.70, 0.85, 1.00, 1.10, 1.20};
const double QUALITY_IMPROVEMENT_CHANCE = 0.30;

// Turnarounds
const int TURNAROUND_FATIGUE_THRESHOLD = 4;     // active programs before success rates drop
const double TURNAROUND_FATIGUE_PENALTY = 0.10;
const double TURNAROUND_EXIT_PREMIUM = 0.25;
const int TURNAROUND_EXIT_PREMIUM_MIN_TIERS = 2;
const double QUALITY_IMPROVEMENT_TIER_BONUS[] = {0.0, 0.15, 0.20, 0.25};

// Integration drag from a failed tuck-in or merger, proportional to relative size.
const double INTEGRATION_DRAG_BASE_RATE = 0.03;
const double INTEGRATION_DRAG_FLOOR = -0.01;
const double INTEGRATION_DRAG_CAP = -0.03;
const double INTEGRATION_DRAG_MERGER_FACTOR = 0.67;

/**
 * Rounds half up, so -2.5 rounds to -2.
 */
inline double round_half_up(double x) {
    return std::floor(x + 0.5);
}

/**
 * Rounds to one decimal place, half up.
 */
inline double round1(double x) {
    return std::floor(x * 10.0 + 0.5) / 10.0;
}

inline double clamp_margin(double margin) {
    return std::min(MAX_MARGIN, std::max(MIN_MARGIN, margin));
}

inline double cap_growth_rate(double rate) {
    return std::min(MAX_ORGANIC_GROWTH_RATE, std::max(MIN_ORGANIC_GROWTH_RATE, rate));
}

#endif // CONSTANTS_H
