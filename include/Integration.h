/*
 * Integration.h
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


#ifndef INTEGRATION_H
#define INTEGRATION_H

#include "Business.h"
#include <string>

enum class IntegrationOutcome { Success, Partial, Failure };
enum class SubTypeAffinity { Match, Related, Distant };
enum class SizeRatioTier { Ideal, Stretch, Strained, Overreach };

const char* to_string(IntegrationOutcome outcome);
const char* to_string(SubTypeAffinity affinity);
const char* to_string(SizeRatioTier tier);

struct SizeRatio {
    SizeRatioTier tier{SizeRatioTier::Ideal};
    double ratio{0.0};
};

/**
 * How operationally close two sub-types of a sector are. Sub-types sharing
 * an affinity group are related; unknown sub-types are distant.
 */
SubTypeAffinity get_sub_type_affinity(const std::string& sector_id, const std::string& sub_type1,
    const std::string& sub_type2);

/**
 * Bolt-on EBITDA relative to the platform: ideal up to 0.5, stretch up to 1,
 * strained up to 2, overreach beyond (or with a non-positive platform).
 */
SizeRatio get_size_ratio_tier(double bolt_on_ebitda, double platform_ebitda);

/**
 * @brief Inputs of an integration roll.
 */
struct IntegrationContext {
    const Business* platform{nullptr};
    bool has_shared_services{false};
    SubTypeAffinity affinity{SubTypeAffinity::Match};
    bool has_affinity{false};
    SizeRatioTier size_tier{SizeRatioTier::Ideal};
    bool has_size_tier{false};
    bool is_merger{false};
};

/**
 * Probability that an integration succeeds before it is split into success,
 * partial and failure bands.
 */
double integration_success_probability(const Business& acquired, const IntegrationContext& context);

/**
 * Maps a pre-rolled value in [0, 1) to an outcome: below 0.6p succeeds, below
 * 1.2p is partial, anything else fails.
 */
IntegrationOutcome determine_integration_outcome(const Business& acquired, const IntegrationContext& context,
    double roll);

/**
 * Synergy EBITDA from an integration, a signed share of the smaller business.
 */
double calculate_synergies(IntegrationOutcome outcome, double acquired_ebitda, bool is_tuck_in,
    const IntegrationContext& context);

/**
 * Growth drag applied to a platform after a failed integration, proportional
 * to the relative size of the acquired business.
 */
double calculate_integration_growth_penalty(double acquired_ebitda, double platform_ebitda, bool is_merger);

/**
 * Exit multiple expansion of a platform: logarithmic in scale, plus a bonus
 * for combined EBITDA above 3000 and 5000.
 */
double calculate_multiple_expansion(int platform_scale, double total_ebitda);

#endif // INTEGRATION_H
