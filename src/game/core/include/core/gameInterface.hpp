#pragma once

#include "core/gameState.hpp"

#include <cstddef>
#include <cstdint>
#include <utility>

namespace othello {

//! Create the game state in its starting position.
GameState initialize();

//! Resolve a click on cell (row, col): move, hand over the turn and refresh the scores.
//! Out of range coordinates and illegal moves are a no-op.
//! \returns true if the move was accepted.
//! \note The caller evaluates isGameOver afterwards, whether the move was accepted or not.
bool handleCellClick(GameState& state, std::size_t row, std::size_t col);

void handleResetSignal(GameState& state); //!< Start a new game.
void handlePassSignal(GameState& state);  //!< Skip the turn of the active player.

//! Cell value for rendering. Out of range coordinates read as CellState::Empty.
CellState readCell(const GameState& state, std::size_t row, std::size_t col);

//! Returns (First, Second) piece counts.
std::pair<std::uint8_t, std::uint8_t> readScores(const GameState& state);

} // namespace othello
