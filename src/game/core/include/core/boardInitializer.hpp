#pragma once

#include "core/gameState.hpp"

namespace othello {

//! Overwrite the state with the standard starting position.
//! Four center pieces, scores 2/2 and Player::First to move.
void resetGame(GameState& state);

} // namespace othello
