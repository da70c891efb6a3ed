#include "core/turnController.hpp"

namespace othello {

void advanceTurn(GameState& state) {
	state.currentPlayer = opponent(state.currentPlayer);
}

void toggleTurnManually(GameState& state) {
	advanceTurn(state);
}

} // namespace othello
