#pragma once

#include <cstddef>

namespace othello {

using Id = std::size_t; //!< Board index used by the core library.

//! Zero based (row, column) pair on the board.
struct Coord {
	Id row, col;

	bool operator==(const Coord&) const = default;
};

} // namespace othello
