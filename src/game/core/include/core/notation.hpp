#pragma once

#include "model/coordinate.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace othello {

//! Convert a cell name like "d3" (column letter, row digit) to a board coordinate.
//! Returns empty for anything that does not name a cell on the board.
std::optional<Coord> fromNotation(std::string_view s);

//! Convert a board coordinate to its cell name.
std::string toNotation(Coord c);

} // namespace othello
