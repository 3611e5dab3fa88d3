/*
 * Sectors.cpp
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

#include "Sectors.h"

const char* to_string(Level level) {
    switch (level) {
    case Level::Low: return "low";
    case Level::Medium: return "medium";
    case Level::High: return "high";
    }
    return "medium";
}

static std::vector<SectorDefinition> make_sectors() {
    std::vector<SectorDefinition> list;
    SectorDefinition s;

    s = SectorDefinition();
    s.id = "agency";
    s.name = "Marketing Agency";
    s.base_ebitda = {300, 1500};
    s.acquisition_multiple = {3.0, 5.5};
    s.volatility = 0.12;
    s.capex_rate = 0.03;
    s.organic_growth = {-0.02, 0.08};
    s.reinvestment_efficiency = 1.2;
    s.client_concentration = Level::High;
    s.talent_dependency = Level::High;
    s.recession_sensitivity = 1.3;
    s.shared_services_benefit = 1.2;
    s.focus_groups = {"agency"};
    s.sub_types = {"Digital/Ecommerce Agency", "Performance Media Agency", "SEO/Content Agency",
                   "Brand/Creative Agency", "PR Firm", "Video Production"};
    s.sub_type_groups = {0, 0, 0, 1, 1, 1};
    s.base_revenue = {1500, 8000};
    s.base_margin = {0.12, 0.25};
    s.margin_drift = {-0.005, 0.002};
    s.margin_volatility = 0.02;
    s.name_prefixes = {"Pixel", "Spark", "Brand", "Metric", "Prism", "Beacon", "Signal", "Vivid"};
    s.name_suffixes = {"Creative", "Media", "Agency", "Studios", "Collective", "Partners"};
    list.push_back(s);

    s = SectorDefinition();
    s.id = "saas";
    s.name = "Vertical SaaS";
    s.base_ebitda = {300, 2000};
    s.acquisition_multiple = {5.0, 9.0};
    s.volatility = 0.10;
    s.capex_rate = 0.10;
    s.organic_growth = {0.05, 0.18};
    s.reinvestment_efficiency = 1.4;
    s.client_concentration = Level::Low;
    s.talent_dependency = Level::High;
    s.recession_sensitivity = 0.6;
    s.shared_services_benefit = 0.8;
    s.focus_groups = {"saas"};
    s.sub_types = {"Vertical SaaS", "Horizontal SaaS", "Payments/Fintech", "Data & Analytics", "Dev Tools"};
    s.sub_type_groups = {0, 0, 1, 1, 2};
    s.base_revenue = {1000, 6000};
    s.base_margin = {0.18, 0.35};
    s.margin_drift = {0.0, 0.01};
    s.margin_volatility = 0.03;
    s.name_prefixes = {"Cloud", "Data", "Nimbus", "Apex", "Stream", "Sync", "Orbit", "Vertex"};
    s.name_suffixes = {"Systems", "Software", "Cloud", "Platform", "Analytics", "Labs"};
    list.push_back(s);

    s = SectorDefinition();
    s.id = "homeServices";
    s.name = "Home Services";
    s.base_ebitda = {300, 2000};
    s.acquisition_multiple = {3.5, 6.0};
    s.volatility = 0.06;
    s.capex_rate = 0.12;
    s.organic_growth = {0.02, 0.07};
    s.reinvestment_efficiency = 1.0;
    s.client_concentration = Level::Low;
    s.talent_dependency = Level::Medium;
    s.recession_sensitivity = 0.7;
    s.shared_services_benefit = 1.3;
    s.focus_groups = {"homeServices"};
    s.sub_types = {"HVAC", "Plumbing", "Electrical", "Roofing", "Pest Control", "Landscaping"};
    s.sub_type_groups = {0, 0, 0, 1, 2, 2};
    s.base_revenue = {2000, 10000};
    s.base_margin = {0.10, 0.20};
    s.margin_drift = {-0.002, 0.004};
    s.margin_volatility = 0.015;
    s.name_prefixes = {"Summit", "Comfort", "Guardian", "Reliable", "Evergreen", "Shield", "Patriot", "Valley"};
    s.name_suffixes = {"Services", "Home Pro", "Comfort", "Solutions", "Property Care", "Co"};
    list.push_back(s);

    s = SectorDefinition();
    s.id = "consumer";
    s.name = "Consumer Brand";
    s.base_ebitda = {300, 2500};
    s.acquisition_multiple = {3.5, 7.0};
    s.volatility = 0.14;
    s.capex_rate = 0.13;
    s.organic_growth = {-0.03, 0.10};
    s.reinvestment_efficiency = 1.1;
    s.client_concentration = Level::Medium;
    s.talent_dependency = Level::Low;
    s.recession_sensitivity = 1.2;
    s.shared_services_benefit = 1.1;
    s.focus_groups = {"consumer"};
    s.sub_types = {"Food & Beverage", "Personal Care", "Pet Products", "Home Goods", "Apparel"};
    s.sub_type_groups = {0, 0, 1, 1, 2};
    s.base_revenue = {2000, 12000};
    s.base_margin = {0.10, 0.22};
    s.margin_drift = {-0.006, 0.002};
    s.margin_volatility = 0.025;
    s.name_prefixes = {"Artisan", "Pure", "Heritage", "Craft", "Native", "Coastal", "Cedar", "Maple"};
    s.name_suffixes = {"Goods Co", "Brand", "Essentials", "Provisions", "Supply", "Trading"};
    list.push_back(s);

    s = SectorDefinition();
    s.id = "industrial";
    s.name = "Industrial Manufacturing";
    s.base_ebitda = {500, 3000};
    s.acquisition_multiple = {4.5, 8.0};
    s.volatility = 0.08;
    s.capex_rate = 0.15;
    s.organic_growth = {0.0, 0.06};
    s.reinvestment_efficiency = 0.9;
    s.client_concentration = Level::Medium;
    s.talent_dependency = Level::Medium;
    s.recession_sensitivity = 1.1;
    s.shared_services_benefit = 1.0;
    s.focus_groups = {"industrial"};
    s.sub_types = {"Precision Machining", "Specialty Components", "Fabrication",
                   "Industrial Automation", "Testing & Inspection"};
    s.sub_type_groups = {0, 0, 1, 2, 2};
    s.base_revenue = {3000, 15000};
    s.base_margin = {0.12, 0.22};
    s.margin_drift = {-0.002, 0.003};
    s.margin_volatility = 0.015;
    s.name_prefixes = {"Precision", "Sterling", "Titan", "Forge", "Granite", "Atlas", "Vanguard", "Cobalt"};
    s.name_suffixes = {"Industries", "Manufacturing", "Components", "Engineering", "Industrial", "Inc"};
    list.push_back(s);

    s = SectorDefinition();
    s.id = "b2bServices";
    s.name = "B2B Services";
    s.base_ebitda = {300, 2000};
    s.acquisition_multiple = {3.5, 6.5};
    s.volatility = 0.08;
    s.capex_rate = 0.06;
    s.organic_growth = {0.02, 0.08};
    s.reinvestment_efficiency = 1.1;
    s.client_concentration = Level::Medium;
    s.talent_dependency = Level::High;
    s.recession_sensitivity = 0.9;
    s.shared_services_benefit = 1.3;
    s.focus_groups = {"b2bServices"};
    s.sub_types = {"Managed IT Services", "Compliance Services", "Staffing", "Consulting", "Facilities Services"};
    s.sub_type_groups = {0, 0, 1, 1, 2};
    s.base_revenue = {1500, 8000};
    s.base_margin = {0.12, 0.24};
    s.margin_drift = {-0.003, 0.004};
    s.margin_volatility = 0.02;
    s.name_prefixes = {"Clarity", "Pinnacle", "Strategic", "Fusion", "Meridian", "Vantage", "Blueprint", "Vector"};
    s.name_suffixes = {"Solutions", "Consulting", "Services", "Advisory", "Group", "Corp"};
    list.push_back(s);

    s = SectorDefinition();
    s.id = "healthcare";
    s.name = "Healthcare Services";
    s.base_ebitda = {400, 2500};
    s.acquisition_multiple = {5.0, 8.5};
    s.volatility = 0.06;
    s.capex_rate = 0.10;
    s.organic_growth = {0.03, 0.09};
    s.reinvestment_efficiency = 1.0;
    s.client_concentration = Level::Low;
    s.talent_dependency = Level::High;
    s.recession_sensitivity = 0.4;
    s.shared_services_benefit = 1.2;
    s.focus_groups = {"healthcare"};
    s.sub_types = {"Dental Practice", "Physical Therapy", "Behavioral Health", "Home Health", "Veterinary"};
    s.sub_type_groups = {0, 0, 1, 1, 2};
    s.base_revenue = {2000, 10000};
    s.base_margin = {0.12, 0.24};
    s.margin_drift = {-0.004, 0.002};
    s.margin_volatility = 0.015;
    s.name_prefixes = {"Wellness", "Premier", "Vitality", "Compass", "Horizon", "Unity", "Thrive", "Harmony"};
    s.name_suffixes = {"Health", "Medical Group", "Care", "Healthcare", "Clinical", "Partners"};
    list.push_back(s);

    s = SectorDefinition();
    s.id = "restaurant";
    s.name = "Restaurants";
    s.base_ebitda = {200, 1500};
    s.acquisition_multiple = {2.5, 5.0};
    s.volatility = 0.14;
    s.capex_rate = 0.12;
    s.organic_growth = {-0.02, 0.06};
    s.reinvestment_efficiency = 0.8;
    s.client_concentration = Level::Low;
    s.talent_dependency = Level::Medium;
    s.recession_sensitivity = 1.4;
    s.shared_services_benefit = 1.0;
    s.focus_groups = {"restaurant"};
    s.sub_types = {"Quick Service", "Fast Casual", "Coffee/Cafe", "Full Service", "Catering"};
    s.sub_type_groups = {0, 0, 0, 1, 2};
    s.base_revenue = {2000, 12000};
    s.base_margin = {0.08, 0.16};
    s.margin_drift = {-0.006, 0.001};
    s.margin_volatility = 0.02;
    s.name_prefixes = {"Urban", "Fresh", "Local", "Harvest", "Copper", "Downtown", "Rustic", "Golden"};
    s.name_suffixes = {"Kitchen", "Eatery", "Cafe", "House", "Grill", "& Co"};
    list.push_back(s);

    s = SectorDefinition();
    s.id = "realEstate";
    s.name = "Real Estate Services";
    s.base_ebitda = {500, 3500};
    s.acquisition_multiple = {6.0, 10.0};
    s.volatility = 0.07;
    s.capex_rate = 0.18;
    s.organic_growth = {0.01, 0.05};
    s.reinvestment_efficiency = 0.7;
    s.client_concentration = Level::Low;
    s.talent_dependency = Level::Low;
    s.recession_sensitivity = 1.0;
    s.shared_services_benefit = 0.7;
    s.focus_groups = {"realEstate"};
    s.sub_types = {"Self Storage", "Industrial Flex", "Property Management", "Manufactured Housing"};
    s.sub_type_groups = {0, 0, 1, 2};
    s.base_revenue = {1500, 8000};
    s.base_margin = {0.30, 0.55};
    s.margin_drift = {-0.002, 0.002};
    s.margin_volatility = 0.01;
    s.name_prefixes = {"Keystone", "Metro", "Granite", "Pacific", "Meridian", "Gateway", "Foundation", "Capitol"};
    s.name_suffixes = {"Properties", "Storage", "Holdings", "Realty", "Capital", "Real Estate"};
    list.push_back(s);

    s = SectorDefinition();
    s.id = "education";
    s.name = "Education & Training";
    s.base_ebitda = {200, 1500};
    s.acquisition_multiple = {3.5, 6.5};
    s.volatility = 0.08;
    s.capex_rate = 0.07;
    s.organic_growth = {0.02, 0.09};
    s.reinvestment_efficiency = 1.1;
    s.client_concentration = Level::Low;
    s.talent_dependency = Level::High;
    s.recession_sensitivity = 0.6;
    s.shared_services_benefit = 1.1;
    s.focus_groups = {"education"};
    s.sub_types = {"Trade School", "Test Prep", "Tutoring", "Childcare", "Corporate Training"};
    s.sub_type_groups = {0, 1, 1, 1, 2};
    s.base_revenue = {1000, 6000};
    s.base_margin = {0.14, 0.26};
    s.margin_drift = {-0.003, 0.003};
    s.margin_volatility = 0.02;
    s.name_prefixes = {"Skill", "Elevate", "Career", "Knowledge", "Ascent", "Catalyst", "Progress", "Bright"};
    s.name_suffixes = {"Academy", "Learning", "Institute", "Training", "School", "Center"};
    list.push_back(s);

    s = SectorDefinition();
    s.id = "insurance";
    s.name = "Insurance Brokerage";
    s.base_ebitda = {300, 2000};
    s.acquisition_multiple = {5.0, 9.0};
    s.volatility = 0.05;
    s.capex_rate = 0.04;
    s.organic_growth = {0.03, 0.08};
    s.reinvestment_efficiency = 1.2;
    s.client_concentration = Level::Low;
    s.talent_dependency = Level::High;
    s.recession_sensitivity = 0.5;
    s.shared_services_benefit = 1.2;
    s.focus_groups = {"insurance"};
    s.sub_types = {"P&C Agency", "Specialty Lines", "Employee Benefits Brokerage", "Title Insurance"};
    s.sub_type_groups = {0, 0, 1, 2};
    s.base_revenue = {1000, 6000};
    s.base_margin = {0.20, 0.35};
    s.margin_drift = {0.0, 0.004};
    s.margin_volatility = 0.01;
    s.name_prefixes = {"Anchor", "Harbor", "Sentinel", "Keystone", "Liberty", "Shield", "Bastion", "Crest"};
    s.name_suffixes = {"Insurance", "Risk Partners", "Brokerage", "Agency", "Benefits", "Group"};
    list.push_back(s);

    s = SectorDefinition();
    s.id = "autoServices";
    s.name = "Auto Services";
    s.base_ebitda = {250, 1500};
    s.acquisition_multiple = {3.5, 6.0};
    s.volatility = 0.07;
    s.capex_rate = 0.10;
    s.organic_growth = {0.01, 0.06};
    s.reinvestment_efficiency = 1.0;
    s.client_concentration = Level::Low;
    s.talent_dependency = Level::Medium;
    s.recession_sensitivity = 0.8;
    s.shared_services_benefit = 1.1;
    s.focus_groups = {"autoServices"};
    s.sub_types = {"Collision Repair", "Quick Lube", "Car Wash", "Tire & Service"};
    s.sub_type_groups = {0, 1, 1, 1};
    s.base_revenue = {1500, 8000};
    s.base_margin = {0.12, 0.20};
    s.margin_drift = {-0.002, 0.003};
    s.margin_volatility = 0.015;
    s.name_prefixes = {"Precision", "Velocity", "Redline", "Torque", "Piston", "Express", "Motor", "Gearbox"};
    s.name_suffixes = {"Auto", "Collision", "Car Care", "Motors", "Service Center", "Garage"};
    list.push_back(s);

    s = SectorDefinition();
    s.id = "distribution";
    s.name = "Specialty Distribution";
    s.base_ebitda = {400, 2500};
    s.acquisition_multiple = {4.0, 7.0};
    s.volatility = 0.08;
    s.capex_rate = 0.12;
    s.organic_growth = {0.01, 0.06};
    s.reinvestment_efficiency = 0.9;
    s.client_concentration = Level::Medium;
    s.talent_dependency = Level::Low;
    s.recession_sensitivity = 1.1;
    s.shared_services_benefit = 1.2;
    s.focus_groups = {"distribution", "industrial"};
    s.sub_types = {"HVAC Distribution", "Building Products", "Industrial MRO", "Food Distribution", "Medical Supply"};
    s.sub_type_groups = {0, 0, 1, 2, 2};
    s.base_revenue = {4000, 20000};
    s.base_margin = {0.06, 0.14};
    s.margin_drift = {-0.003, 0.002};
    s.margin_volatility = 0.01;
    s.name_prefixes = {"Midland", "Allied", "Continental", "Pioneer", "Frontier", "Keystone", "Northern", "Summit"};
    s.name_suffixes = {"Supply", "Distribution", "Wholesale", "Logistics", "Trading", "Co"};
    list.push_back(s);

    return list;
}

const std::vector<SectorDefinition>& sector_list() {
    static const std::vector<SectorDefinition> sectors = make_sectors();
    return sectors;
}

const SectorDefinition& get_sector(const std::string& id) {
    const std::vector<SectorDefinition>& sectors = sector_list();
    for (const SectorDefinition& s : sectors) {
        if (s.id == id) return s;
    }
    return sectors.front();
}

bool is_sector(const std::string& id) {
    for (const SectorDefinition& s : sector_list()) {
        if (s.id == id) return true;
    }
    return false;
}
