/*
 * Sectors.h
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

#ifndef SECTORS_H
#define SECTORS_H

#include <string>
#include <vector>

enum class Level { Low, Medium, High };

const char* to_string(Level level);

struct Range {
    double min{0.0};
    double max{0.0};

    double mid() const { return (min + max) / 2.0; }
};

/**
 * @brief Static economics of an industry.
 *
 * Simulation rules:
 * - Deals draw revenue, margin, growth, drift and multiple from these ranges.
 * - Capex rate is charged against EBITDA every collection phase.
 * - Recession sensitivity scales the EBITDA hit of a recession.
 * - Businesses sharing a focus group count towards the same sector focus bonus.
 * - Sub-types with the same group number are operationally related.
 */
struct SectorDefinition {
    std::string id;
    std::string name;
    Range base_ebitda;
    Range acquisition_multiple;
    double volatility{0.0};
    double capex_rate{0.0};
    Range organic_growth;
    double reinvestment_efficiency{1.0};
    Level client_concentration{Level::Medium};
    Level talent_dependency{Level::Medium};
    double recession_sensitivity{1.0};
    double shared_services_benefit{1.0};
    std::vector<std::string> focus_groups;
    std::vector<std::string> sub_types;
    std::vector<int> sub_type_groups;   // parallel to sub_types
    Range base_revenue;
    Range base_margin;
    Range margin_drift;                 // annual drift in margin points
    double margin_volatility{0.0};
    std::vector<std::string> name_prefixes;
    std::vector<std::string> name_suffixes;
};

/**
 * All sectors in their canonical order. Iteration order is significant for
 * weighted draws.
 */
const std::vector<SectorDefinition>& sector_list();

/**
 * Looks up a sector by id. Unknown ids resolve to the first sector.
 */
const SectorDefinition& get_sector(const std::string& id);

bool is_sector(const std::string& id);

#endif // SECTORS_H
