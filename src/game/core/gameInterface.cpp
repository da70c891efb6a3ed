#include "core/gameInterface.hpp"

#include "core/boardInitializer.hpp"
#include "core/moveResolver.hpp"
#include "core/scoreCounter.hpp"
#include "core/turnController.hpp"

namespace othello {

GameState initialize() {
	GameState state;
	resetGame(state);
	return state;
}

bool handleCellClick(GameState& state, std::size_t row, std::size_t col) {
	const Coord c{row, col};
	if (!state.board.contains(c) || !attemptMove(state, c)) {
		return false;
	}

	advanceTurn(state);
	recomputeScores(state);
	return true;
}

void handleResetSignal(GameState& state) {
	resetGame(state);
	recomputeScores(state);
}

void handlePassSignal(GameState& state) {
	toggleTurnManually(state);
}

CellState readCell(const GameState& state, std::size_t row, std::size_t col) {
	const Coord c{row, col};
	return state.board.contains(c) ? state.board.get(c) : CellState::Empty;
}

std::pair<std::uint8_t, std::uint8_t> readScores(const GameState& state) {
	return {state.firstScore, state.secondScore};
}

} // namespace othello
