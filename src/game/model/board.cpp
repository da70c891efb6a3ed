#include "model/board.hpp"

#include <cassert>

namespace othello {

Board::Board() {
	clear();
}

std::size_t Board::size() const {
	return kSize;
}

bool Board::contains(Coord c) const {
	return c.row < kSize && c.col < kSize;
}

CellState Board::get(Coord c) const {
	assert(contains(c)); // Game should verify valid coordinate.
	return m_board[c.row * kSize + c.col];
}

void Board::set(Coord c, CellState value) {
	assert(contains(c)); // Game should verify valid coordinate.
	m_board[c.row * kSize + c.col] = value;
}

bool Board::isEmpty(Coord c) const {
	return get(c) == CellState::Empty;
}

void Board::clear() {
	m_board.fill(CellState::Empty);
}

} // namespace othello
