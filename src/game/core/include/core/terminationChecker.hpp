#pragma once

#include "core/gameState.hpp"

#include <optional>

namespace othello {

//! True if one colour vanished from the board or no empty cell is left.
bool isGameOver(const GameState& state);

//! Player with more pieces on the board. std::nullopt on a tie.
//! \note Reads the score fields. Only meaningful once isGameOver is true.
std::optional<Player> winner(const GameState& state);

} // namespace othello
