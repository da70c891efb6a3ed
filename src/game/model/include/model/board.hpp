#pragma once

#include "model/coordinate.hpp"
#include "model/player.hpp"

#include <array>

namespace othello {

//! Possible occupancy values of a cell on the board.
enum class CellState { Empty = 0, First = static_cast<int>(Player::First), Second = static_cast<int>(Player::Second) };

//! Returns the CellState enum value of input player.
inline constexpr CellState toCellState(Player player) {
	return player == Player::First ? CellState::First : CellState::Second;
}

//! Fixed 8x8 grid. Every cell always holds exactly one CellState.
//! \note Coordinates are (row, col) \in [0, 8). Orientation on screen is up to the renderer.
class Board {
public:
	static constexpr std::size_t kSize = 8u;

public:
	Board();

	std::size_t size() const;

	bool contains(Coord c) const;       //!< Returns whether the coordinate lies on the board.
	CellState get(Coord c) const;       //!< Get value at given coordinate.
	void set(Coord c, CellState value); //!< Overwrite the value at given coordinate.
	bool isEmpty(Coord c) const;        //!< Returns whether a certain board coordinate is free or occupied.
	void clear();                       //!< Set every cell to CellState::Empty.

	bool operator==(const Board&) const = default;

private:
	std::array<CellState, kSize * kSize> m_board{}; //!< Row major cell values.
};

} // namespace othello
