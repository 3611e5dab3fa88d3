/*
 * Integration.cpp
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


#include "Integration.h"
#include "Constants.h"
#include "Sectors.h"
#include <algorithm>
#include <cmath>

const char* to_string(IntegrationOutcome outcome) {
    switch (outcome) {
    case IntegrationOutcome::Success: return "success";
    case IntegrationOutcome::Partial: return "partial";
    case IntegrationOutcome::Failure: return "failure";
    }
    return "success";
}

const char* to_string(SubTypeAffinity affinity) {
    switch (affinity) {
    case SubTypeAffinity::Match: return "match";
    case SubTypeAffinity::Related: return "related";
    case SubTypeAffinity::Distant: return "distant";
    }
    return "match";
}

const char* to_string(SizeRatioTier tier) {
    switch (tier) {
    case SizeRatioTier::Ideal: return "ideal";
    case SizeRatioTier::Stretch: return "stretch";
    case SizeRatioTier::Strained: return "strained";
    case SizeRatioTier::Overreach: return "overreach";
    }
    return "ideal";
}

static int index_of(const std::vector<std::string>& values, const std::string& value) {
    for (size_t i = 0; i < values.size(); ++i) {
        if (values[i] == value) return (int)i;
    }
    return -1;
}

SubTypeAffinity get_sub_type_affinity(const std::string& sector_id, const std::string& sub_type1,
    const std::string& sub_type2) {
    if (sub_type1 == sub_type2) return SubTypeAffinity::Match;
    if (!is_sector(sector_id)) return SubTypeAffinity::Distant;
    const SectorDefinition& sector = get_sector(sector_id);
    int idx1 = index_of(sector.sub_types, sub_type1);
    int idx2 = index_of(sector.sub_types, sub_type2);
    if (idx1 < 0 || idx2 < 0) return SubTypeAffinity::Distant;
    return sector.sub_type_groups[idx1] == sector.sub_type_groups[idx2] ? SubTypeAffinity::Related
                                                                        : SubTypeAffinity::Distant;
}

SizeRatio get_size_ratio_tier(double bolt_on_ebitda, double platform_ebitda) {
    if (platform_ebitda <= 0) return {SizeRatioTier::Overreach, 99.0};
    double ratio = std::fabs(bolt_on_ebitda) / platform_ebitda;
    if (ratio <= 0.5) return {SizeRatioTier::Ideal, ratio};
    if (ratio <= 1.0) return {SizeRatioTier::Stretch, ratio};
    if (ratio <= 2.0) return {SizeRatioTier::Strained, ratio};
    return {SizeRatioTier::Overreach, ratio};
}

/**
 * Penalty on success probability for an oversized deal. Mergers carry half
 * the tuck-in penalty. Mitigation never exceeds half the base penalty.
 */
static double size_ratio_probability_penalty(SizeRatioTier tier, bool is_merger, int platform_scale,
    bool has_shared_services, bool both_high_quality) {
    static const double TUCK_IN_PENALTY[] = {0.0, -0.08, -0.18, -0.28};
    static const double MERGER_PENALTY[] = {0.0, -0.04, -0.09, -0.14};
    double base = is_merger ? MERGER_PENALTY[(int)tier] : TUCK_IN_PENALTY[(int)tier];
    if (base == 0.0) return 0.0;
    double mitigation = 0.0;
    if (platform_scale >= 3) mitigation += 0.15;
    if (has_shared_services) mitigation += 0.05;
    if (both_high_quality) mitigation += 0.05;
    return base + std::min(mitigation, std::fabs(base) * 0.5);
}

static double size_ratio_synergy_multiplier(SizeRatioTier tier, bool is_merger) {
    static const double TUCK_IN_MULTIPLIER[] = {1.0, 0.80, 0.50, 0.25};
    static const double MERGER_MULTIPLIER[] = {1.0, 0.90, 0.70, 0.50};
    return is_merger ? MERGER_MULTIPLIER[(int)tier] : TUCK_IN_MULTIPLIER[(int)tier];
}

double integration_success_probability(const Business& acquired, const IntegrationContext& context) {
    double p = 0.6;
    p += (acquired.quality - 3) * 0.1;

    if (acquired.due_diligence.operator_quality == OperatorQuality::Strong) {
        p += 0.15;
    } else if (acquired.due_diligence.operator_quality == OperatorQuality::Weak) {
        p -= 0.15;
    }

    if (context.platform && context.platform->sector_id == acquired.sector_id) p += 0.15;

    if (context.has_affinity) {
        if (context.affinity == SubTypeAffinity::Related) {
            p -= 0.05;
        } else if (context.affinity == SubTypeAffinity::Distant) {
            p -= 0.15;
        }
    }

    if (context.has_shared_services) p += 0.1;
    if (acquired.due_diligence.revenue_concentration == Level::High) p -= 0.1;

    if (context.has_size_tier && context.platform) {
        bool both_high_quality = acquired.quality >= 4 && context.platform->quality >= 4;
        p += size_ratio_probability_penalty(context.size_tier, context.is_merger, context.platform->platform_scale,
            context.has_shared_services, both_high_quality);
    }
    return p;
}

IntegrationOutcome determine_integration_outcome(const Business& acquired, const IntegrationContext& context,
    double roll) {
    double p = integration_success_probability(acquired, context);
    if (roll < p * 0.6) return IntegrationOutcome::Success;
    if (roll < p * 1.2) return IntegrationOutcome::Partial;
    return IntegrationOutcome::Failure;
}

double calculate_synergies(IntegrationOutcome outcome, double acquired_ebitda, bool is_tuck_in,
    const IntegrationContext& context) {
    double rate = 0.0;
    if (context.is_merger) {
        switch (outcome) {
        case IntegrationOutcome::Success: rate = 0.15; break;
        case IntegrationOutcome::Partial: rate = 0.05; break;
        case IntegrationOutcome::Failure: rate = -0.07; break;
        }
    } else {
        switch (outcome) {
        case IntegrationOutcome::Success: rate = is_tuck_in ? 0.20 : 0.10; break;
        case IntegrationOutcome::Partial: rate = is_tuck_in ? 0.08 : 0.03; break;
        case IntegrationOutcome::Failure: rate = is_tuck_in ? -0.05 : -0.10; break;
        }
    }

    if (context.has_affinity) {
        if (context.affinity == SubTypeAffinity::Related) {
            rate *= 0.75;
        } else if (context.affinity == SubTypeAffinity::Distant) {
            rate *= 0.45;
        }
    }
    if (context.has_size_tier) {
        rate *= size_ratio_synergy_multiplier(context.size_tier, context.is_merger);
    }
    return round_half_up(acquired_ebitda * rate);
}

double calculate_integration_growth_penalty(double acquired_ebitda, double platform_ebitda, bool is_merger) {
    double factor = is_merger ? INTEGRATION_DRAG_MERGER_FACTOR : 1.0;
    double cap = INTEGRATION_DRAG_CAP * factor;
    double floor = INTEGRATION_DRAG_FLOOR * factor;
    if (platform_ebitda <= 0) return cap;
    double ratio = std::fabs(acquired_ebitda) / std::fabs(platform_ebitda);
    double raw = -(ratio * INTEGRATION_DRAG_BASE_RATE) * factor;
    return std::max(cap, std::min(floor, raw));
}

double calculate_multiple_expansion(int platform_scale, double total_ebitda) {
    double scale_bonus = platform_scale > 0 ? std::min(2.0, std::log2(platform_scale + 1.0) * 0.5) : 0.0;
    double size_bonus = total_ebitda > 5000 ? 0.3 : total_ebitda > 3000 ? 0.15 : 0.0;
    return scale_bonus + size_bonus;
}
