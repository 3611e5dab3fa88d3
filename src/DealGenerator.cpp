/*
 * DealGenerator.cpp
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


#include "DealGenerator.h"
#include "Constants.h"
#include "Sectors.h"
#include "Valuation.h"
#include <algorithm>
#include <cmath>
#include <iostream>

#define DEBUG 0

static const std::vector<std::string> CHEAP_SECTORS = {"agency", "homeServices", "b2bServices", "education",
    "autoServices"};
static const std::vector<std::string> MID_SECTORS = {"consumer", "restaurant", "healthcare", "insurance",
    "distribution"};
static const std::vector<std::string> PREMIUM_SECTORS = {"saas", "industrial", "realEstate"};

static const std::vector<std::string> CONCENTRATION_LOW = {"No client exceeds 10% of revenue",
    "Well-diversified customer base", "Healthy client mix"};
static const std::vector<std::string> CONCENTRATION_MEDIUM = {"Top client is 20-25% of revenue",
    "Some customer concentration", "Moderate client diversity"};
static const std::vector<std::string> CONCENTRATION_HIGH = {"Top client is 40%+ of revenue",
    "Significant customer concentration", "Key account dependency"};

static const std::vector<std::string> OPERATOR_STRONG = {"Strong management team in place",
    "Experienced leadership staying on", "Proven operational team"};
static const std::vector<std::string> OPERATOR_MODERATE = {"Decent team, some gaps",
    "Owner willing to transition slowly", "Management needs development"};
static const std::vector<std::string> OPERATOR_WEAK = {"Founder looking to exit fully", "Key person dependency",
    "Management transition needed"};

static const std::vector<std::string> TREND_FLAT = {"EBITDA flat for 2 years", "Stable but not growing",
    "Revenue plateau"};
static const std::vector<std::string> TREND_DECLINING = {"EBITDA declining 5-10% annually",
    "Business in contraction", "Shrinking market share"};

static const std::vector<std::string> POSITION_LEADER = {"Category leader in niche", "Strong market position",
    "Dominant in local market"};
static const std::vector<std::string> POSITION_COMPETITIVE = {"Solid competitive position",
    "Well-regarded in market", "Good reputation"};
static const std::vector<std::string> POSITION_COMMODITIZED = {"Commoditized market", "Price competition pressure",
    "Low differentiation"};

static const std::vector<std::string>& operator_texts(OperatorQuality quality) {
    switch (quality) {
    case OperatorQuality::Strong: return OPERATOR_STRONG;
    case OperatorQuality::Moderate: return OPERATOR_MODERATE;
    case OperatorQuality::Weak: return OPERATOR_WEAK;
    }
    return OPERATOR_MODERATE;
}

static double draw(const Range& range, SeededRng& rng) {
    return rng.next_in_range(range.min, range.max);
}

int generate_quality_rating(SeededRng& rng) {
    double roll = rng.next();
    if (roll < 0.05) return 1;
    if (roll < 0.20) return 2;
    if (roll < 0.60) return 3;
    if (roll < 0.85) return 4;
    return 5;
}

DueDiligence generate_due_diligence(int quality, const std::string& sector_id, SeededRng& rng) {
    const SectorDefinition& sector = get_sector(sector_id);
    DueDiligence dd;

    if (sector.client_concentration == Level::High) {
        dd.revenue_concentration = quality >= 4 ? Level::Medium : Level::High;
    } else if (sector.client_concentration == Level::Medium) {
        dd.revenue_concentration = quality >= 4 ? Level::Low : quality >= 2 ? Level::Medium : Level::High;
    } else {
        dd.revenue_concentration = quality >= 3 ? Level::Low : Level::Medium;
    }
    switch (dd.revenue_concentration) {
    case Level::Low: dd.revenue_concentration_text = rng.pick(CONCENTRATION_LOW); break;
    case Level::Medium: dd.revenue_concentration_text = rng.pick(CONCENTRATION_MEDIUM); break;
    case Level::High: dd.revenue_concentration_text = rng.pick(CONCENTRATION_HIGH); break;
    }

    dd.operator_quality = quality >= 4 ? OperatorQuality::Strong
        : quality >= 2                 ? OperatorQuality::Moderate
                                       : OperatorQuality::Weak;
    dd.operator_quality_text = rng.pick(operator_texts(dd.operator_quality));

    if (quality >= 4) {
        dd.trend = Trend::Growing;
    } else if (quality >= 2) {
        dd.trend = rng.next() > 0.3 ? Trend::Flat : Trend::Growing;
    } else {
        dd.trend = rng.next() > 0.5 ? Trend::Declining : Trend::Flat;
    }
    // The growth figure is drawn whichever trend won
    int growth_pct = rng.next_int(8, 15);
    std::vector<std::string> growing = {"EBITDA growing " + std::to_string(growth_pct) + "% YoY",
        "Strong growth trajectory", "Consistent expansion"};
    switch (dd.trend) {
    case Trend::Growing: dd.trend_text = rng.pick(growing); break;
    case Trend::Flat: dd.trend_text = rng.pick(TREND_FLAT); break;
    case Trend::Declining: dd.trend_text = rng.pick(TREND_DECLINING); break;
    }

    if (quality >= 4) {
        dd.customer_retention = rng.next_int(90, 98);
    } else if (quality >= 3) {
        dd.customer_retention = rng.next_int(82, 92);
    } else if (quality >= 2) {
        dd.customer_retention = rng.next_int(75, 85);
    } else {
        dd.customer_retention = rng.next_int(65, 78);
    }

    if (quality >= 4) {
        dd.competitive_position = rng.next() > 0.3 ? CompetitivePosition::Leader : CompetitivePosition::Competitive;
    } else if (quality >= 2) {
        dd.competitive_position = rng.next() > 0.5 ? CompetitivePosition::Competitive
                                                   : CompetitivePosition::Commoditized;
    } else {
        dd.competitive_position = CompetitivePosition::Commoditized;
    }
    switch (dd.competitive_position) {
    case CompetitivePosition::Leader: dd.competitive_position_text = rng.pick(POSITION_LEADER); break;
    case CompetitivePosition::Competitive: dd.competitive_position_text = rng.pick(POSITION_COMPETITIVE); break;
    case CompetitivePosition::Commoditized:
        dd.competitive_position_text = rng.pick(POSITION_COMMODITIZED);
        break;
    }
    return dd;
}

SellerArchetype assign_seller_archetype(int quality, SeededRng& rng) {
    struct Weight {
        SellerArchetype archetype;
        double weight;
    };
    bool high = quality >= 4;
    bool low = quality <= 2;
    Weight weights[] = {
        {SellerArchetype::RetiringFounder, 0.30 + (high ? 0.10 : low ? -0.10 : 0.0)},
        {SellerArchetype::BurntOutOperator, 0.20 + (low ? 0.05 : high ? -0.05 : 0.0)},
        {SellerArchetype::AccidentalHoldco, 0.10},
        {SellerArchetype::DistressedSeller, 0.08 + (low ? 0.12 : high ? -0.05 : 0.0)},
        {SellerArchetype::MboCandidate, 0.15 + (high ? 0.05 : low ? -0.05 : 0.0)},
        {SellerArchetype::FranchiseBreakaway, 0.15 + (low ? -0.05 : 0.0)},
    };
    double total = 0.0;
    for (Weight& w : weights) {
        w.weight = std::max(0.02, w.weight);
        total += w.weight;
    }
    double roll = rng.next() * total;
    for (const Weight& w : weights) {
        roll -= w.weight;
        if (roll <= 0) return w.archetype;
    }
    return SellerArchetype::RetiringFounder;
}

static int archetype_heat_modifier(SellerArchetype archetype) {
    switch (archetype) {
    case SellerArchetype::RetiringFounder: return -1;
    case SellerArchetype::BurntOutOperator: return 0;
    case SellerArchetype::AccidentalHoldco: return 1;
    case SellerArchetype::DistressedSeller: return -2;
    case SellerArchetype::MboCandidate: return 0;
    case SellerArchetype::FranchiseBreakaway: return 0;
    }
    return 0;
}

static double archetype_price_modifier(SellerArchetype archetype, SeededRng& rng) {
    switch (archetype) {
    case SellerArchetype::RetiringFounder: return rng.next_in_range(0.0, 0.05);
    case SellerArchetype::BurntOutOperator: return rng.next_in_range(-0.10, -0.05);
    case SellerArchetype::AccidentalHoldco: return rng.next_in_range(0.05, 0.10);
    case SellerArchetype::DistressedSeller: return rng.next_in_range(-0.20, -0.10);
    case SellerArchetype::MboCandidate: return rng.next_in_range(0.0, 0.05);
    case SellerArchetype::FranchiseBreakaway: return rng.next_in_range(0.05, 0.10);
    }
    return 0.0;
}

static OperatorQuality archetype_operator_quality(SellerArchetype archetype, SeededRng& rng) {
    switch (archetype) {
    case SellerArchetype::RetiringFounder:
        return rng.next() > 0.5 ? OperatorQuality::Strong : OperatorQuality::Moderate;
    case SellerArchetype::BurntOutOperator:
        return rng.next() > 0.5 ? OperatorQuality::Weak : OperatorQuality::Moderate;
    case SellerArchetype::AccidentalHoldco: return OperatorQuality::Moderate;
    case SellerArchetype::DistressedSeller: return OperatorQuality::Weak;
    case SellerArchetype::MboCandidate: return OperatorQuality::Strong;
    case SellerArchetype::FranchiseBreakaway:
        return rng.next() > 0.5 ? OperatorQuality::Strong : OperatorQuality::Moderate;
    }
    return OperatorQuality::Moderate;
}

static const DealHeat HEAT_LEVELS[] = {DealHeat::Cold, DealHeat::Warm, DealHeat::Hot, DealHeat::Contested};

DealHeat calculate_deal_heat(int quality, DealSource source, int round, std::optional<EventType> last_event,
    std::optional<SellerArchetype> archetype, int max_rounds, bool credit_tightening, SeededRng& rng,
    int ma_sourcing_tier) {
    double roll = rng.next();
    int tier = roll < 0.25 ? 0 : roll < 0.60 ? 1 : roll < 0.90 ? 2 : 3;

    if (quality >= 4) tier += 1;
    if (quality <= 2) tier -= 1;

    if (last_event == EventType::GlobalBullMarket) tier += 1;
    if (last_event == EventType::GlobalRecession) tier -= 1;

    if (credit_tightening) tier -= 1;

    int late_game_round = (int)std::ceil(max_rounds * 0.75);
    if (round >= late_game_round) tier += 1;

    int negative = 0;
    if (source == DealSource::Proprietary) negative -= 2;
    if (source == DealSource::Sourced) negative -= 1;
    if (source == DealSource::Sourced && ma_sourcing_tier >= 2) negative -= 1;
    if (archetype) {
        int mod = archetype_heat_modifier(*archetype);
        if (mod < 0) {
            negative += mod;
        } else {
            tier += mod;
        }
    }
    tier += std::max(-3, negative);

    tier = std::max(0, std::min(3, tier));
    return HEAT_LEVELS[tier];
}

double calculate_heat_premium(DealHeat heat, SeededRng& rng) {
    switch (heat) {
    case DealHeat::Cold: return 1.0;
    case DealHeat::Warm: return rng.next_in_range(1.10, 1.15);
    case DealHeat::Hot: return rng.next_in_range(1.20, 1.30);
    case DealHeat::Contested: return rng.next_in_range(1.20, 1.35);
    }
    return 1.0;
}

int get_max_acquisitions(int ma_sourcing_tier) {
    if (ma_sourcing_tier >= 2) return 4;
    if (ma_sourcing_tier >= 1) return 3;
    return 2;
}

std::string pick_weighted_sector(int round, int max_rounds, SeededRng& rng) {
    double cheap_weight, mid_weight, premium_weight;
    int early_end = (int)std::ceil(max_rounds * 0.25);
    int mid_end = (int)std::ceil(max_rounds * 0.60);
    if (round <= early_end) {
        cheap_weight = 0.60;
        mid_weight = 0.30;
        premium_weight = 0.10;
    } else if (round <= mid_end) {
        cheap_weight = 0.30;
        mid_weight = 0.40;
        premium_weight = 0.30;
    } else {
        cheap_weight = 0.20;
        mid_weight = 0.30;
        premium_weight = 0.50;
    }

    std::vector<std::pair<std::string, double>> weights;
    for (const std::string& s : CHEAP_SECTORS) weights.emplace_back(s, cheap_weight / CHEAP_SECTORS.size());
    for (const std::string& s : MID_SECTORS) weights.emplace_back(s, mid_weight / MID_SECTORS.size());
    for (const std::string& s : PREMIUM_SECTORS) weights.emplace_back(s, premium_weight / PREMIUM_SECTORS.size());

    double total = 0.0;
    for (const auto& w : weights) total += w.second;
    double roll = rng.next() * total;
    for (const auto& w : weights) {
        roll -= w.second;
        if (roll <= 0) return w.first;
    }
    return "agency";
}

std::string generate_business_name(const std::string& sector_id, SeededRng& rng) {
    const SectorDefinition& sector = get_sector(sector_id);
    // Names come from a child stream so cosmetic draws never shift the economics
    SeededRng name_rng = rng.fork("name");
    const std::string& prefix = name_rng.pick(sector.name_prefixes);
    const std::string& suffix = name_rng.pick(sector.name_suffixes);
    return prefix + " " + suffix;
}

static AcquisitionType determine_acquisition_type(double ebitda, SeededRng& rng) {
    if (ebitda < 500) return AcquisitionType::TuckIn;
    if (ebitda < 2000) return rng.next() > 0.6 ? AcquisitionType::Platform : AcquisitionType::Standalone;
    return rng.next() > 0.3 ? AcquisitionType::Platform : AcquisitionType::Standalone;
}

static double calculate_tuck_in_discount(int quality) {
    return std::max(0.05, std::min(0.25, 0.15 + (3 - quality) * 0.05));
}

static double portfolio_scaler(double portfolio_ebitda) {
    return portfolio_ebitda > 3000 ? std::max(1.0, std::log2(portfolio_ebitda / 3000.0)) : 1.0;
}

static double distressed_multiple_cap(const std::string& sector_id, int quality) {
    const SectorDefinition& sector = get_sector(sector_id);
    return quality <= 2 ? sector.acquisition_multiple.min + 0.5 : sector.acquisition_multiple.mid();
}

std::string DealGenerator::next_business_id() {
    return "biz_" + std::to_string(++id_counter);
}

Business DealGenerator::generate_business(const std::string& sector_id, int round, int quality,
    const std::string& sub_type, SeededRng& rng) {
    const SectorDefinition& sector = get_sector(sector_id);
    Business b;
    b.sector_id = sector.id;
    b.quality = quality > 0 ? quality : generate_quality_rating(rng);
    b.due_diligence = generate_due_diligence(b.quality, sector.id, rng);

    double quality_modifier = 0.8 + (b.quality - 1) * 0.1;
    double margin = draw(sector.base_margin, rng);
    margin += (b.quality - 3) * 0.015;
    b.ebitda_margin = clamp_margin(margin);
    b.revenue = round_half_up(draw(sector.base_revenue, rng) * quality_modifier);
    b.ebitda = round_half_up(b.revenue * b.ebitda_margin);

    double growth = draw(sector.organic_growth, rng);
    growth += (b.quality - 3) * 0.005;
    if (b.due_diligence.trend == Trend::Growing) {
        growth += 0.02;
    } else if (b.due_diligence.trend == Trend::Declining) {
        growth -= 0.03;
    }
    b.revenue_growth_rate = growth;
    b.organic_growth_rate = growth;
    b.margin_drift_rate = draw(sector.margin_drift, rng);

    double multiple = draw(sector.acquisition_multiple, rng);
    multiple += (b.quality - 3) * 0.35;
    if (b.due_diligence.competitive_position == CompetitivePosition::Leader) {
        multiple += 0.3;
    } else if (b.due_diligence.competitive_position == CompetitivePosition::Commoditized) {
        multiple -= 0.3;
    }
    b.acquisition_multiple = round1(multiple);

    bool known_sub_type = std::find(sector.sub_types.begin(), sector.sub_types.end(), sub_type) !=
        sector.sub_types.end();
    b.sub_type = !sub_type.empty() && known_sub_type ? sub_type : rng.pick(sector.sub_types);

    b.name = generate_business_name(sector.id, rng);
    b.peak_ebitda = b.ebitda;
    b.acquisition_ebitda = b.ebitda;
    b.acquisition_price = round_half_up(b.ebitda * b.acquisition_multiple);
    b.acquisition_size_tier_premium = calculate_size_tier_premium(b.ebitda).premium;
    b.acquisition_revenue = b.revenue;
    b.acquisition_margin = b.ebitda_margin;
    b.peak_revenue = b.revenue;
    b.integration_rounds_remaining = 2;
    b.total_acquisition_cost = b.acquisition_price;

    if (DEBUG) std::cout << "business " << sector.id << " r" << round << " Q" << b.quality << " ebitda "
                         << b.ebitda << std::endl;
    return b;
}

Deal DealGenerator::generate_deal_with_size(const std::string& sector_id, int round, SizePreference size,
    double portfolio_ebitda, const DealOptions& options, SeededRng& rng) {
    int quality = generate_quality_rating(rng);
    if (options.quality_floor > 0 && quality < options.quality_floor) quality = options.quality_floor;

    Business business = generate_business(sector_id, round, quality, options.sub_type, rng);

    double ebitda;
    double revenue;
    if (size == SizePreference::Any) {
        revenue = round_half_up(business.revenue * portfolio_scaler(portfolio_ebitda));
        ebitda = round_half_up(revenue * business.ebitda_margin);
    } else {
        double lo = size == SizePreference::Small ? 500 : size == SizePreference::Medium ? 1500 : 3000;
        double hi = size == SizePreference::Small ? 1500 : size == SizePreference::Medium ? 3000 : 8000;
        double target = lo + rng.next() * (hi - lo);
        if (size == SizePreference::Large) target *= portfolio_scaler(portfolio_ebitda);
        ebitda = round_half_up(target);
        revenue = round_half_up(ebitda / business.ebitda_margin);
    }
    double price = round_half_up(ebitda * business.acquisition_multiple);
    AcquisitionType acquisition_type = determine_acquisition_type(ebitda, rng);
    double tuck_in_discount = acquisition_type == AcquisitionType::TuckIn ? calculate_tuck_in_discount(quality) : 0.0;

    SellerArchetype archetype = assign_seller_archetype(quality, rng);
    business.due_diligence.operator_quality = archetype_operator_quality(archetype, rng);
    business.due_diligence.operator_quality_text = rng.pick(operator_texts(business.due_diligence.operator_quality));

    // Discounts do not stack; the largest wins. Premiums stack on top.
    double price_mod = archetype_price_modifier(archetype, rng);
    double archetype_discount = price_mod < 0 ? std::fabs(price_mod) : 0.0;
    double archetype_premium = price_mod > 0 ? price_mod : 0.0;
    double discount = std::max(tuck_in_discount, std::max(options.multiple_discount, archetype_discount));
    double asking = discount > 0 ? round_half_up(price * (1.0 - discount)) : price;
    if (archetype_premium > 0) asking = round_half_up(asking * (1.0 + archetype_premium));

    if (archetype == SellerArchetype::DistressedSeller) {
        double cap = distressed_multiple_cap(sector_id, quality);
        double implied = ebitda > 0 ? asking / ebitda : 0.0;
        if (implied > cap) asking = round_half_up(ebitda * cap);
    }

    double growth = business.organic_growth_rate;
    double revenue_growth = business.revenue_growth_rate;
    if (archetype == SellerArchetype::FranchiseBreakaway) {
        growth += 0.02;
        revenue_growth += 0.02;
    }

    DealSource source = options.source ? *options.source
                                       : (rng.next() > 0.4 ? DealSource::Inbound : DealSource::Brokered);
    DealHeat heat = calculate_deal_heat(quality, source, round, options.last_event, archetype, options.max_rounds,
        options.credit_tightening, rng, options.ma_sourcing_tier);
    double effective = round_half_up(asking * calculate_heat_premium(heat, rng));
    if (archetype == SellerArchetype::DistressedSeller && ebitda > 0) {
        effective = std::min(effective, round_half_up(ebitda * distressed_multiple_cap(sector_id, quality)));
    }

    business.ebitda = ebitda;
    business.peak_ebitda = ebitda;
    business.acquisition_ebitda = ebitda;
    business.acquisition_price = price;
    business.total_acquisition_cost = price;
    business.acquisition_size_tier_premium = calculate_size_tier_premium(ebitda).premium;
    business.revenue = revenue;
    business.acquisition_revenue = revenue;
    business.peak_revenue = revenue;
    business.organic_growth_rate = growth;
    business.revenue_growth_rate = revenue_growth;

    Deal deal;
    deal.id = "deal_" + next_business_id();
    deal.business = business;
    deal.asking_price = asking;
    deal.effective_price = effective;
    deal.freshness = 2 + options.freshness_bonus;
    deal.round_appeared = round;
    deal.source = source;
    deal.acquisition_type = acquisition_type;
    deal.tuck_in_discount = tuck_in_discount;
    deal.heat = heat;
    deal.seller_archetype = archetype;
    return deal;
}

std::vector<Deal> DealGenerator::generate_deal_pipeline(const std::vector<Deal>& current, int round,
    const PipelineContext& context, SeededRng& rng) {
    std::vector<Deal> pipeline;
    for (const Deal& d : current) {
        if (d.freshness - 1 > 0) {
            pipeline.push_back(d);
            pipeline.back().freshness -= 1;
        }
    }

    int target_new_deals = std::max(0, 5 - (int)pipeline.size());
    std::vector<std::string> sectors_in_pipeline;
    for (const Deal& d : pipeline) sectors_in_pipeline.push_back(d.business.sector_id);

    DealOptions heat_options;
    heat_options.last_event = context.last_event;
    heat_options.max_rounds = context.max_rounds;
    heat_options.credit_tightening = context.credit_tightening;

    const MAFocus& focus = context.focus;
    SizePreference focus_size = focus.size_preference;
    auto full = [&pipeline]() { return (int)pipeline.size() >= MAX_PIPELINE_DEALS; };

    if (!focus.sector_id.empty()) {
        for (int i = 0; i < 2 && !full(); ++i) {
            pipeline.push_back(generate_deal_with_size(focus.sector_id, round, focus_size,
                context.portfolio_ebitda, heat_options, rng));
        }
    }

    if (context.ma_sourcing_active && context.ma_sourcing_tier >= 1 && !full()) {
        std::string focus_sector = !focus.sector_id.empty() ? focus.sector_id
                                                           : pick_weighted_sector(round, context.max_rounds, rng);
        DealOptions sourcing;
        sourcing.freshness_bonus = 1;
        sourcing.source = DealSource::Sourced;
        sourcing.last_event = context.last_event;
        sourcing.max_rounds = context.max_rounds;
        sourcing.credit_tightening = context.credit_tightening;
        sourcing.ma_sourcing_tier = context.ma_sourcing_tier;
        if (context.ma_sourcing_tier >= 2 && !focus.sub_type.empty()) {
            sourcing.sub_type = focus.sub_type;
            sourcing.quality_floor = 2;
        }
        if (context.ma_sourcing_tier >= 3) sourcing.quality_floor = 3;

        for (int i = 0; i < 2 && !full(); ++i) {
            pipeline.push_back(generate_deal_with_size(focus_sector, round, focus_size, context.portfolio_ebitda,
                sourcing, rng));
        }

        if (context.ma_sourcing_tier >= 2 && !focus.sub_type.empty() && !focus.sector_id.empty()) {
            int count = context.ma_sourcing_tier >= 3 ? rng.next_int(2, 3) : rng.next_int(1, 2);
            DealOptions matched = sourcing;
            matched.sub_type = focus.sub_type;
            for (int i = 0; i < count && !full(); ++i) {
                pipeline.push_back(generate_deal_with_size(focus.sector_id, round, focus_size,
                    context.portfolio_ebitda, matched, rng));
            }
        }

        if (context.ma_sourcing_tier >= 3) {
            DealOptions proprietary;
            proprietary.sub_type = focus.sub_type;
            proprietary.quality_floor = 3;
            proprietary.source = DealSource::Proprietary;
            proprietary.multiple_discount = 0.15;
            proprietary.freshness_bonus = 1;
            proprietary.last_event = context.last_event;
            proprietary.max_rounds = context.max_rounds;
            proprietary.credit_tightening = context.credit_tightening;
            for (int i = 0; i < 2 && !full(); ++i) {
                pipeline.push_back(generate_deal_with_size(focus_sector, round, focus_size,
                    context.portfolio_ebitda, proprietary, rng));
            }
        }
    }

    if (!context.portfolio_focus_sector.empty() && is_sector(context.portfolio_focus_sector) &&
        context.portfolio_focus_tier >= 1 && !full()) {
        int focus_deals = context.portfolio_focus_tier >= 2 ? 2 : 1;
        for (int i = 0; i < focus_deals && !full(); ++i) {
            pipeline.push_back(generate_deal_with_size(context.portfolio_focus_sector, round, focus_size,
                context.portfolio_ebitda, heat_options, rng));
        }
    }

    std::vector<std::string> missing;
    for (const SectorDefinition& s : sector_list()) {
        if (std::find(sectors_in_pipeline.begin(), sectors_in_pipeline.end(), s.id) == sectors_in_pipeline.end()) {
            missing.push_back(s.id);
        }
    }
    rng.shuffle(missing);

    // Early rounds lean towards deals a new holdco can afford
    int early_index = (int)pipeline.size();
    auto next_size = [&]() {
        int index = early_index++;
        if (round > 2) return focus_size;
        if (round == 1) return index < 2 ? SizePreference::Medium : SizePreference::Small;
        return index < 3 ? SizePreference::Medium : SizePreference::Small;
    };

    for (size_t i = 0; i < missing.size() && i < 3; ++i) {
        if (full()) break;
        SizePreference size = next_size();
        pipeline.push_back(generate_deal_with_size(missing[i], round, size, context.portfolio_ebitda, heat_options,
            rng));
    }

    int target_length = std::min(MAX_PIPELINE_DEALS, (int)pipeline.size() + target_new_deals);
    while ((int)pipeline.size() < target_length) {
        std::string sector = pick_weighted_sector(round, context.max_rounds, rng);
        SizePreference size = next_size();
        pipeline.push_back(generate_deal_with_size(sector, round, size, context.portfolio_ebitda, heat_options, rng));
    }
    while (pipeline.size() < 4) {
        std::string sector = pick_weighted_sector(round, context.max_rounds, rng);
        SizePreference size = next_size();
        pipeline.push_back(generate_deal_with_size(sector, round, size, context.portfolio_ebitda, heat_options, rng));
    }

    if (DEBUG) std::cout << "pipeline round " << round << ": " << pipeline.size() << " deals" << std::endl;
    return pipeline;
}

static void cap_quality(std::vector<Deal>& deals, int max_quality) {
    for (Deal& d : deals) d.business.quality = std::min(max_quality, d.business.quality);
}

std::vector<Deal> DealGenerator::generate_distressed_deals(int round, int max_rounds, SeededRng& rng) {
    std::vector<Deal> deals;
    int count = rng.next_int(3, 4);
    for (int i = 0; i < count; ++i) {
        std::string sector = pick_weighted_sector(round, max_rounds, rng);
        DealOptions options;
        options.quality_floor = 2;
        options.source = DealSource::Brokered;
        options.freshness_bonus = 1;
        options.multiple_discount = 0.30 + rng.next() * 0.20;
        options.max_rounds = max_rounds;
        options.credit_tightening = true;
        deals.push_back(generate_deal_with_size(sector, round, SizePreference::Any, 0, options, rng));
    }
    cap_quality(deals, 3);
    return deals;
}

std::vector<Deal> DealGenerator::generate_recession_deals(int round, int max_rounds, SeededRng& rng) {
    std::vector<Deal> deals;
    int count = rng.next_int(1, 2);
    for (int i = 0; i < count; ++i) {
        std::string sector = pick_weighted_sector(round, max_rounds, rng);
        DealOptions options;
        options.quality_floor = 2;
        options.source = DealSource::Brokered;
        options.freshness_bonus = 1;
        options.multiple_discount = 0.15 + rng.next() * 0.10;
        options.max_rounds = max_rounds;
        options.last_event = EventType::GlobalRecession;
        deals.push_back(generate_deal_with_size(sector, round, SizePreference::Any, 0, options, rng));
    }
    cap_quality(deals, 3);
    return deals;
}

Deal DealGenerator::generate_referral_deal(int round, int max_rounds, SeededRng& rng) {
    std::string sector = pick_weighted_sector(round, max_rounds, rng);
    DealOptions options;
    options.quality_floor = 3;
    options.source = DealSource::Sourced;
    options.max_rounds = max_rounds;
    return generate_deal_with_size(sector, round, SizePreference::Any, 0, options, rng);
}

std::vector<Deal> DealGenerator::generate_sourced_deals(int round, const PipelineContext& context, SeededRng& rng) {
    std::vector<Deal> deals;
    DealOptions options;
    options.source = DealSource::Sourced;
    options.max_rounds = context.max_rounds;
    options.credit_tightening = context.credit_tightening;
    options.ma_sourcing_tier = context.ma_sourcing_tier;
    if (context.ma_sourcing_tier >= 2) {
        options.quality_floor = 2;
        options.sub_type = context.focus.sub_type;
    }
    if (context.ma_sourcing_tier >= 3) options.quality_floor = 3;

    const MAFocus& focus = context.focus;
    if (!focus.sector_id.empty()) {
        deals.push_back(generate_deal_with_size(focus.sector_id, round, focus.size_preference,
            context.portfolio_ebitda, options, rng));
        deals.push_back(generate_deal_with_size(focus.sector_id, round, focus.size_preference,
            context.portfolio_ebitda, options, rng));
        std::string other = !context.portfolio_focus_sector.empty() && context.portfolio_focus_sector != focus.sector_id
            ? context.portfolio_focus_sector
            : pick_weighted_sector(round, context.max_rounds, rng);
        deals.push_back(generate_deal_with_size(other, round, focus.size_preference, context.portfolio_ebitda,
            options, rng));
    } else if (!context.portfolio_focus_sector.empty()) {
        deals.push_back(generate_deal_with_size(context.portfolio_focus_sector, round, SizePreference::Any,
            context.portfolio_ebitda, options, rng));
        deals.push_back(generate_deal_with_size(context.portfolio_focus_sector, round, SizePreference::Any,
            context.portfolio_ebitda, options, rng));
        std::string other = pick_weighted_sector(round, context.max_rounds, rng);
        deals.push_back(generate_deal_with_size(other, round, SizePreference::Any, context.portfolio_ebitda,
            options, rng));
    } else {
        std::vector<std::string> sectors;
        for (const SectorDefinition& s : sector_list()) sectors.push_back(s.id);
        rng.shuffle(sectors);
        for (size_t i = 0; i < 3 && i < sectors.size(); ++i) {
            deals.push_back(generate_deal_with_size(sectors[i], round, SizePreference::Any,
                context.portfolio_ebitda, options, rng));
        }
    }

    for (Deal& d : deals) {
        d.source = DealSource::Sourced;
        d.freshness = 2;
    }
    return deals;
}

std::vector<Deal> DealGenerator::generate_outreach_deals(int round, const PipelineContext& context, SeededRng& rng) {
    std::vector<Deal> deals;
    const MAFocus& focus = context.focus;
    std::string sector = !focus.sector_id.empty() ? focus.sector_id
                                                 : pick_weighted_sector(round, context.max_rounds, rng);
    DealOptions options;
    options.sub_type = focus.sub_type;
    options.quality_floor = 3;
    options.source = DealSource::Proprietary;
    options.max_rounds = context.max_rounds;
    options.credit_tightening = context.credit_tightening;
    for (int i = 0; i < 2; ++i) {
        deals.push_back(generate_deal_with_size(sector, round, focus.size_preference, context.portfolio_ebitda,
            options, rng));
    }
    return deals;
}

Business DealGenerator::create_starting_business(const std::string& sector_id, double target_ebitda,
    double multiple_cap, SeededRng& rng) {
    const SectorDefinition& sector = get_sector(sector_id);
    Business business = generate_business(sector.id, 1, 3, "", rng);

    double multiple = sector.acquisition_multiple.mid();
    if (multiple_cap > 0) multiple = std::min(multiple_cap, multiple);
    double price = round_half_up(target_ebitda * multiple);
    double revenue = round_half_up(target_ebitda / business.ebitda_margin);

    business.id = next_business_id();
    business.acquisition_round = 0;
    business.status = BusinessStatus::Active;
    business.ebitda = target_ebitda;
    business.peak_ebitda = target_ebitda;
    business.acquisition_ebitda = target_ebitda;
    business.acquisition_price = price;
    business.acquisition_multiple = multiple;
    business.acquisition_size_tier_premium = calculate_size_tier_premium(target_ebitda).premium;
    business.revenue = revenue;
    business.acquisition_revenue = revenue;
    business.peak_revenue = revenue;
    business.total_acquisition_cost = price;
    return business;
}
