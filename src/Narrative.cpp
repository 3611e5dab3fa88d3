/*
 * Narrative.cpp
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


#include "Narrative.h"
#include "Business.h"
#include <string>

/**
 * Two templates per event kind. Placeholders: {holdco}, {business},
 * {sector}, {year}, {amount}.
 */
static const char* template_for(EventType type, int variant) {
    bool alt = variant % 2 != 0;
    switch (type) {
    case EventType::GlobalBullMarket:
        return alt ? "Year {year}: buyers are paying up everywhere. {holdco}'s portfolio rides the tide."
                   : "Multiples expand across the market in year {year}. Sellers know it too.";
    case EventType::GlobalRecession:
        return alt ? "Year {year} brings a recession. Customers delay orders and {holdco} feels it."
                   : "The economy contracts. Every operator at {holdco} is watching costs.";
    case EventType::GlobalInterestHike:
        return alt ? "Rates move up in year {year}. Leverage just got more expensive."
                   : "The central bank tightens. {holdco}'s lenders reprice.";
    case EventType::GlobalInterestCut:
        return alt ? "Rates fall in year {year}. Debt is cheaper for everyone, competitors included."
                   : "A rate cut eases the cost of capital for {holdco}.";
    case EventType::GlobalInflation:
        return alt ? "Prices climb through year {year}. Input costs squeeze margins."
                   : "Inflation takes hold. Pricing power matters more than ever.";
    case EventType::GlobalCreditTightening:
        return alt ? "Banks pull back in year {year}. New acquisition debt is off the table."
                   : "Credit dries up. {holdco} will have to fund deals with cash.";
    case EventType::GlobalFinancialCrisis:
        return alt ? "Year {year}: a financial crisis. Fire sales appear for anyone with cash."
                   : "Markets seize up. Distressed sellers are calling {holdco}.";
    case EventType::GlobalQuiet:
        return alt ? "A quiet year {year}. The businesses simply keep compounding."
                   : "Nothing dramatic happens in year {year}, which is exactly what {holdco} wanted.";
    case EventType::PortfolioStarJoins:
        return alt ? "A star hire joins {business} and the pipeline fills up."
                   : "{business} lands an exceptional operator from a larger rival.";
    case EventType::PortfolioTalentLeaves:
        return alt ? "A key manager leaves {business}, taking relationships along."
                   : "{business} loses a senior leader in year {year}.";
    case EventType::PortfolioClientSigns:
        return alt ? "{business} signs a major new client."
                   : "A marquee customer picks {business} after a long pitch.";
    case EventType::PortfolioClientChurns:
        return alt ? "{business} loses its biggest account."
                   : "A major client walks away from {business}.";
    case EventType::PortfolioBreakthrough:
        return alt ? "{business} finds a better way to run its operations."
                   : "An operational breakthrough at {business} lifts margins.";
    case EventType::PortfolioCompliance:
        return alt ? "Regulators come knocking at {business}."
                   : "{business} faces an unexpected compliance bill.";
    case EventType::PortfolioReferralDeal:
        return alt ? "The founder of {business} introduces {holdco} to a friend looking to sell."
                   : "{business} refers a quality acquisition target.";
    case EventType::PortfolioEquityDemand:
        return alt ? "The key manager at {business} wants a piece of the holdco."
                   : "{business}'s top performer asks for equity or threatens to walk.";
    case EventType::PortfolioSellerNoteRenego:
        return alt ? "The former owner of {business} offers to settle the note early at a discount."
                   : "{business}'s seller wants cash now and will take less for it.";
    case EventType::UnsolicitedOffer:
        return alt ? "A buyer offers {amount} for {business}."
                   : "{business} draws an unsolicited bid of {amount}.";
    case EventType::SectorEvent:
        return alt ? "Year {year} shakes up the {sector} sector."
                   : "Industry news moves {sector} businesses, {business} among them.";
    }
    return "Another year passes for {holdco}.";
}

static void replace_all(std::string& text, const std::string& key, const std::string& value) {
    size_t pos = 0;
    while ((pos = text.find(key, pos)) != std::string::npos) {
        text.replace(pos, key.size(), value);
        pos += value.size();
    }
}

std::string TemplateNarrative::render(EventType type, const NarrativeContext& context) const {
    std::string text = template_for(type, context.variant);
    replace_all(text, "{holdco}", context.holdco_name.empty() ? "the holdco" : context.holdco_name);
    replace_all(text, "{business}", context.business_name.empty() ? "a portfolio company" : context.business_name);
    replace_all(text, "{sector}", context.sector_name.empty() ? "its" : context.sector_name);
    replace_all(text, "{year}", std::to_string(context.round));
    replace_all(text, "{amount}", format_money(context.offer_amount));
    return text;
}

std::optional<std::string> TemplateNarrative::generate(EventType type, const NarrativeContext& context) {
    return render(type, context);
}
