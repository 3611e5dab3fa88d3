/*
 * DealStructure.cpp
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


#include "DealStructure.h"
#include "Constants.h"
#include <cmath>
#include <cstdio>
#include <sstream>

const char* to_string(DealStructureType type) {
    switch (type) {
    case DealStructureType::AllCash: return "all_cash";
    case DealStructureType::SellerNote: return "seller_note";
    case DealStructureType::BankDebt: return "bank_debt";
    case DealStructureType::Earnout: return "earnout";
    case DealStructureType::SellerNoteBankDebt: return "seller_note_bank_debt";
    case DealStructureType::RolloverEquity: return "rollover_equity";
    }
    return "all_cash";
}

const char* to_string(StructureRisk risk) {
    switch (risk) {
    case StructureRisk::Low: return "low";
    case StructureRisk::Medium: return "medium";
    case StructureRisk::High: return "high";
    }
    return "low";
}

int deal_id_seed(const std::string& deal_id) {
    int seed = 0;
    for (unsigned char c : deal_id) seed += c;
    return seed;
}

static double seeded_random(int seed, double min, double max) {
    long long mixed = ((long long)seed * 9301 + 49297) % 233280;
    return min + (double)mixed / 233280.0 * (max - min);
}

static double leverage_of(double debt, double ebitda) {
    if (ebitda <= 0) return 0.0;
    return round1(debt / ebitda);
}

std::vector<DealStructure> generate_deal_structures(const Deal& deal, double player_cash, double interest_rate,
    bool credit_tightening, int max_rounds, bool no_new_debt) {
    std::vector<DealStructure> structures;
    double price = deal.effective_price;
    double ebitda = deal.business.ebitda;
    int seller_note_terms = std::max(4, (int)std::ceil(max_rounds * 0.25));
    int bank_debt_terms = std::max(4, (int)std::ceil(max_rounds * 0.50));
    int seed = deal_id_seed(deal.id);
    bool bank_allowed = !credit_tightening && !no_new_debt;

    if (player_cash >= price) {
        DealStructure s;
        s.type = DealStructureType::AllCash;
        s.cash_required = price;
        s.risk = StructureRisk::Low;
        structures.push_back(s);
    }

    double note_cash = round_half_up(price * 0.40);
    if (player_cash >= note_cash && !no_new_debt) {
        DealStructure s;
        s.type = DealStructureType::SellerNote;
        s.cash_required = note_cash;
        s.seller_note = DebtTerms{price - note_cash, 0.05 + seeded_random(seed, 0.0, 0.01), seller_note_terms};
        s.leverage = leverage_of(s.seller_note->amount, ebitda);
        s.risk = StructureRisk::Medium;
        structures.push_back(s);
    }

    if (bank_allowed) {
        double bank_cash = round_half_up(price * 0.35);
        if (player_cash >= bank_cash) {
            DealStructure s;
            s.type = DealStructureType::BankDebt;
            s.cash_required = bank_cash;
            s.bank_debt = DebtTerms{price - bank_cash, interest_rate, bank_debt_terms};
            s.leverage = leverage_of(s.bank_debt->amount, ebitda);
            s.risk = StructureRisk::High;
            structures.push_back(s);
        }
    }

    if (deal.business.quality >= 3 && seed % 10 >= 4) {
        double earnout_cash = round_half_up(price * 0.55);
        if (player_cash >= earnout_cash) {
            DealStructure s;
            s.type = DealStructureType::Earnout;
            s.cash_required = earnout_cash;
            s.earnout = EarnoutTerms{price - earnout_cash, 0.07 + seeded_random(seed, 0.0, 0.05)};
            s.risk = StructureRisk::Medium;
            structures.push_back(s);
        }
    }

    if (bank_allowed) {
        double lbo_cash = round_half_up(price * 0.25);
        double lbo_note = round_half_up(price * 0.35);
        double lbo_bank = price - lbo_cash - lbo_note;
        if (player_cash >= lbo_cash && lbo_bank > 0) {
            DealStructure s;
            s.type = DealStructureType::SellerNoteBankDebt;
            s.cash_required = lbo_cash;
            s.seller_note = DebtTerms{lbo_note, 0.05 + seeded_random(seed, 0.0, 0.01), seller_note_terms};
            s.bank_debt = DebtTerms{lbo_bank, interest_rate, bank_debt_terms};
            s.leverage = leverage_of(lbo_note + lbo_bank, ebitda);
            s.risk = StructureRisk::High;
            structures.push_back(s);
        }
    }

    // Sellers only roll equity into a healthy business they believe in
    if (deal.business.quality >= 3 && deal.seller_archetype != SellerArchetype::DistressedSeller) {
        double pct = max_rounds >= 20 ? 0.25 : 0.20;
        double rollover_cash = price - round_half_up(price * pct);
        if (player_cash >= rollover_cash) {
            DealStructure s;
            s.type = DealStructureType::RolloverEquity;
            s.cash_required = rollover_cash;
            s.rollover_equity_pct = pct;
            s.risk = StructureRisk::Medium;
            structures.push_back(s);
        }
    }

    return structures;
}

Business execute_deal_structure(const Deal& deal, const DealStructure& structure, int round) {
    Business business = deal.business;
    const std::string prefix = "deal_";
    business.id = deal.id.compare(0, prefix.size(), prefix) == 0 ? deal.id.substr(prefix.size()) : deal.id;
    business.acquisition_round = round;
    business.improvements.clear();
    business.status = BusinessStatus::Active;
    business.acquisition_price = deal.effective_price;
    business.total_acquisition_cost = deal.effective_price;

    if (structure.seller_note) {
        business.seller_note_balance = structure.seller_note->amount;
        business.seller_note_rate = structure.seller_note->rate;
        business.seller_note_rounds_remaining = structure.seller_note->term_rounds;
    }
    if (structure.bank_debt) {
        business.bank_debt_balance = structure.bank_debt->amount;
        business.bank_debt_rate = structure.bank_debt->rate;
        business.bank_debt_rounds_remaining = structure.bank_debt->term_rounds;
    }
    if (structure.earnout) {
        business.earnout_remaining = structure.earnout->amount;
        business.earnout_target = structure.earnout->target_ebitda_growth;
    }
    business.rollover_equity_pct = structure.rollover_equity_pct;

    if (deal.business.due_diligence.operator_quality == OperatorQuality::Weak) {
        business.integration_rounds_remaining = 3;
    } else if (deal.business.due_diligence.operator_quality == OperatorQuality::Strong) {
        business.integration_rounds_remaining = 1;
    }
    return business;
}

std::string DealStructure::label() const {
    switch (type) {
    case DealStructureType::AllCash: return "All Cash";
    case DealStructureType::SellerNote: return "Seller Note";
    case DealStructureType::BankDebt: return "Bank Debt";
    case DealStructureType::Earnout: return "Earn-out";
    case DealStructureType::SellerNoteBankDebt: return "LBO (Note + Debt)";
    case DealStructureType::RolloverEquity: return "Rollover Equity";
    }
    return "";
}

static int pct(double part, double total) {
    return total > 0 ? (int)round_half_up(part / total * 100.0) : 0;
}

std::string DealStructure::description() const {
    char buf[256];
    double note = seller_note ? seller_note->amount : 0.0;
    double bank = bank_debt ? bank_debt->amount : 0.0;
    double contingent = earnout ? earnout->amount : 0.0;
    switch (type) {
    case DealStructureType::AllCash:
        return "Pay full price upfront. No debt and no ongoing obligations.";
    case DealStructureType::SellerNote:
        std::snprintf(buf, sizeof(buf), "Pay %d%% upfront, remainder as seller note at %.1f%%.",
            pct(cash_required, cash_required + note), seller_note->rate * 100.0);
        return buf;
    case DealStructureType::BankDebt:
        std::snprintf(buf, sizeof(buf), "Pay %d%% equity, %d%% financed with recourse to the holdco.",
            pct(cash_required, cash_required + bank), pct(bank, cash_required + bank));
        return buf;
    case DealStructureType::Earnout:
        std::snprintf(buf, sizeof(buf), "Pay %d%% upfront, remainder paid if EBITDA grows %.0f%%.",
            pct(cash_required, cash_required + contingent), earnout->target_ebitda_growth * 100.0);
        return buf;
    case DealStructureType::SellerNoteBankDebt: {
        double total = cash_required + note + bank;
        int equity_pct = pct(cash_required, total);
        int note_pct = pct(note, total);
        std::snprintf(buf, sizeof(buf), "%d%% equity, %d%% seller note at %.1f%%, %d%% bank debt.",
            equity_pct, note_pct, seller_note->rate * 100.0, 100 - equity_pct - note_pct);
        return buf;
    }
    case DealStructureType::RolloverEquity:
        std::snprintf(buf, sizeof(buf), "Seller rolls %.0f%% into the business and keeps that share of exit proceeds.",
            rollover_equity_pct * 100.0);
        return buf;
    }
    return "";
}

std::string DealStructure::to_json() const {
    std::ostringstream oss;
    oss << "{";
    oss << "\"type\":\"" << to_string(type) << "\",";
    oss << "\"cashRequired\":" << cash_required << ",";
    if (seller_note) {
        oss << "\"sellerNote\":{\"amount\":" << seller_note->amount << ",\"rate\":" << seller_note->rate
            << ",\"termRounds\":" << seller_note->term_rounds << "},";
    }
    if (bank_debt) {
        oss << "\"bankDebt\":{\"amount\":" << bank_debt->amount << ",\"rate\":" << bank_debt->rate
            << ",\"termRounds\":" << bank_debt->term_rounds << "},";
    }
    if (earnout) {
        oss << "\"earnout\":{\"amount\":" << earnout->amount << ",\"targetEbitdaGrowth\":"
            << earnout->target_ebitda_growth << "},";
    }
    if (rollover_equity_pct > 0) oss << "\"rolloverEquityPct\":" << rollover_equity_pct << ",";
    oss << "\"leverage\":" << leverage << ",";
    oss << "\"risk\":\"" << to_string(risk) << "\"";
    oss << "}";
    return oss.str();
}
