/*
 * DealStructure.h
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


#ifndef DEALSTRUCTURE_H
#define DEALSTRUCTURE_H

#include "Business.h"
#include <optional>
#include <string>
#include <vector>

enum class DealStructureType { AllCash, SellerNote, BankDebt, Earnout, SellerNoteBankDebt, RolloverEquity };
enum class StructureRisk { Low, Medium, High };

const char* to_string(DealStructureType type);
const char* to_string(StructureRisk risk);

struct DebtTerms {
    double amount{0.0};
    double rate{0.0};
    int term_rounds{0};
};

struct EarnoutTerms {
    double amount{0.0};
    double target_ebitda_growth{0.0};
};

/**
 * @brief One way of paying for a deal.
 *
 * Simulation rules:
 * - cash_required leaves holdco cash at closing; every other component becomes
 *   an instrument on the acquired business.
 * - Bank debt is recourse to the holdco and is withheld while credit is tight
 *   or the holdco is barred from new debt.
 * - Rollover equity leaves the seller owning a share of the opco's exit proceeds.
 */
class DealStructure {
public:
    DealStructureType type{DealStructureType::AllCash};
    double cash_required{0.0};
    std::optional<DebtTerms> seller_note;
    std::optional<DebtTerms> bank_debt;
    std::optional<EarnoutTerms> earnout;
    double rollover_equity_pct{0.0};
    double leverage{0.0};            // new debt over EBITDA, one decimal
    StructureRisk risk{StructureRisk::Low};

    std::string label() const;
    std::string description() const;
    std::string to_json() const;
};

/**
 * Sum of the character codes of a deal id. Structures derived from it never
 * change while the deal sits in the pipeline.
 */
int deal_id_seed(const std::string& deal_id);

/**
 * Offers every structure the player can afford, in the fixed order all-cash,
 * seller note, bank debt, earn-out, LBO, rollover. The deal id seeds the
 * variable terms so the list is stable across calls.
 */
std::vector<DealStructure> generate_deal_structures(const Deal& deal, double player_cash, double interest_rate,
    bool credit_tightening, int max_rounds = 20, bool no_new_debt = false);

/**
 * Turns a deal into an owned business carrying the structure's instruments.
 * Weak operators integrate over 3 rounds, strong ones over 1.
 */
Business execute_deal_structure(const Deal& deal, const DealStructure& structure, int round);

#endif // DEALSTRUCTURE_H
