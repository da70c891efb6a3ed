#include "core/scoreCounter.hpp"

namespace othello {

std::size_t countCells(const Board& board, CellState value) {
	std::size_t count = 0;
	for (Id row = 0; row < board.size(); ++row) {
		for (Id col = 0; col < board.size(); ++col) {
			if (board.get({row, col}) == value) {
				++count;
			}
		}
	}
	return count;
}

void recomputeScores(GameState& state) {
	state.firstScore  = static_cast<std::uint8_t>(countCells(state.board, CellState::First));
	state.secondScore = static_cast<std::uint8_t>(countCells(state.board, CellState::Second));
}

} // namespace othello
