#pragma once

#include "core/gameState.hpp"
#include "model/board.hpp"
#include "model/player.hpp"

#include <vector>

namespace othello {

//! Returns the opponent cells flipped if player placed a piece at c.
//! Empty when the move is illegal (occupied, off board, or no flanked run in any direction).
std::vector<Coord> findFlips(const Board& board, Player player, Coord c);

//! Returns whether player may place a piece at c.
bool isLegalMove(const Board& board, Player player, Coord c);

//! Place a piece for the active player and flip every flanked run.
//! Returns false and leaves the state untouched if the move is illegal.
//! \note Does not advance the turn.
bool attemptMove(GameState& state, Coord target);

} // namespace othello
