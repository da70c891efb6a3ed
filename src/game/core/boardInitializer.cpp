#include "core/boardInitializer.hpp"

namespace othello {

void resetGame(GameState& state) {
	state.board.clear();
	state.firstScore    = 2u;
	state.secondScore   = 2u;
	state.currentPlayer = Player::First;

	// Main diagonal of the center block for First, anti-diagonal for Second.
	state.board.set({3u, 3u}, CellState::First);
	state.board.set({4u, 4u}, CellState::First);
	state.board.set({3u, 4u}, CellState::Second);
	state.board.set({4u, 3u}, CellState::Second);
}

} // namespace othello
