/*
 * GameSerializer.h
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


#ifndef GAME_SERIALIZER_H
#define GAME_SERIALIZER_H

#include "Game.h"
#include <ostream>

class GameSerializer {
public:
    /**
     * Serializes a game's config, state, current metrics, round history and,
     * once the game is over, its score to a JSON stream.
     * @param game The Game to serialize.
     * @param out The output stream to write JSON to.
     */
    static void serialize(const Game& game, std::ostream& out);
};

#endif // GAME_SERIALIZER_H
