#include "core/terminationChecker.hpp"

namespace othello {

bool isGameOver(const GameState& state) {
	bool hasFirst  = false;
	bool hasSecond = false;
	bool isFull    = true;

	for (Id row = 0; row < state.board.size(); ++row) {
		for (Id col = 0; col < state.board.size(); ++col) {
			switch (state.board.get({row, col})) {
			case CellState::First:
				hasFirst = true;
				break;
			case CellState::Second:
				hasSecond = true;
				break;
			case CellState::Empty:
				isFull = false;
				break;
			}
		}
	}

	return !hasFirst || !hasSecond || isFull;
}

std::optional<Player> winner(const GameState& state) {
	if (state.firstScore == state.secondScore) {
		return std::nullopt;
	}
	return state.firstScore > state.secondScore ? Player::First : Player::Second;
}

} // namespace othello
