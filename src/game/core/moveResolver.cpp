#include "core/moveResolver.hpp"

#include <array>

namespace othello {

struct Direction {
	int dr, dc;
};

static constexpr std::array<Direction, 8> kDirections{{
        {-1, -1},
        {-1, 0},
        {-1, 1},
        {0, -1},
        {0, 1},
        {1, -1},
        {1, 0},
        {1, 1},
}};

static bool inBounds(int row, int col) {
	return row >= 0 && col >= 0 && row < static_cast<int>(Board::kSize) && col < static_cast<int>(Board::kSize);
}

//! Walk one ray from start. If one or more opponent cells are closed by an own piece, append them to out.
static void scanRay(const Board& board, Coord start, Direction dir, CellState current, CellState target, std::vector<Coord>& out) {
	std::vector<Coord> run;

	int row = static_cast<int>(start.row) + dir.dr;
	int col = static_cast<int>(start.col) + dir.dc;
	while (inBounds(row, col)) {
		const Coord c{static_cast<Id>(row), static_cast<Id>(col)};
		const auto value = board.get(c);

		if (value != target) {
			// Own piece right next to start or an empty cell flanks nothing.
			if (value == current && !run.empty()) {
				out.insert(out.end(), run.begin(), run.end());
			}
			return;
		}
		run.push_back(c);

		row += dir.dr;
		col += dir.dc;
	}
}

std::vector<Coord> findFlips(const Board& board, Player player, Coord c) {
	std::vector<Coord> flips;
	if (!board.contains(c) || !board.isEmpty(c)) {
		return flips;
	}

	const auto current = toCellState(player);
	const auto target  = toCellState(opponent(player));

	for (const auto dir: kDirections) {
		scanRay(board, c, dir, current, target, flips);
	}
	return flips;
}

bool isLegalMove(const Board& board, Player player, Coord c) {
	return !findFlips(board, player, c).empty();
}

bool attemptMove(GameState& state, Coord target) {
	const auto flips = findFlips(state.board, state.currentPlayer, target);
	if (flips.empty()) {
		return false;
	}

	const auto current = toCellState(state.currentPlayer);
	for (const auto c: flips) {
		state.board.set(c, current);
	}
	state.board.set(target, current);
	return true;
}

} // namespace othello
