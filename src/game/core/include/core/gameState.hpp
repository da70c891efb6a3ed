#pragma once

#include "model/board.hpp"
#include "model/player.hpp"

#include <cstdint>

namespace othello {

//! The single mutable aggregate of a running game.
//! \note Scores are derived from the board. Use recomputeScores to refresh them.
struct GameState {
	Board board;                         //!< Current board.
	Player currentPlayer{Player::First}; //!< Player to move.
	std::uint8_t firstScore{0};          //!< Pieces of Player::First on the board.
	std::uint8_t secondScore{0};         //!< Pieces of Player::Second on the board.

	bool operator==(const GameState&) const = default;
};

} // namespace othello
