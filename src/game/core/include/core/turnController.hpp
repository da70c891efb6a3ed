#pragma once

#include "core/gameState.hpp"

namespace othello {

void advanceTurn(GameState& state);        //!< Hand the turn to the opponent after an accepted move.
void toggleTurnManually(GameState& state); //!< Skip the current player's turn.

} // namespace othello
