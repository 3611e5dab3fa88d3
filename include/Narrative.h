/*
 * Narrative.h
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


#ifndef NARRATIVE_H
#define NARRATIVE_H

#include "GameEvent.h"
#include <optional>
#include <string>

/**
 * @brief What a narrative writer knows about the event being told.
 */
struct NarrativeContext {
    std::string holdco_name;
    std::string business_name;   // empty for global events
    std::string sector_name;
    int round{0};
    int max_rounds{20};
    double cash{0.0};
    double offer_amount{0.0};
    int variant{0};              // drawn from the cosmetic stream
};

/**
 * @brief Source of flavor text for events.
 *
 * A provider may decline to write anything by returning an empty optional;
 * the game then falls back to its templates. Providers never affect the
 * simulation itself.
 */
class NarrativeProvider {
public:
    virtual ~NarrativeProvider() {}

    virtual std::optional<std::string> generate(EventType type, const NarrativeContext& context) = 0;
};

/**
 * @brief Deterministic template text. Always produces a narrative.
 */
class TemplateNarrative : public NarrativeProvider {
public:
    std::optional<std::string> generate(EventType type, const NarrativeContext& context) override;

    /**
     * Same as generate(), without the optional.
     */
    std::string render(EventType type, const NarrativeContext& context) const;
};

#endif // NARRATIVE_H
