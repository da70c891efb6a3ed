#pragma once

#include "core/gameState.hpp"

#include <cstddef>

namespace othello {

//! Number of cells on the board holding value.
std::size_t countCells(const Board& board, CellState value);

//! Overwrite both score fields with a fresh count of the board.
void recomputeScores(GameState& state);

} // namespace othello
