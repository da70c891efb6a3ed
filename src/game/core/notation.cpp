#include "core/notation.hpp"

#include "model/board.hpp"

#include <cctype>

namespace othello {

std::optional<Coord> fromNotation(std::string_view s) {
	if (s.size() != 2u) {
		return {};
	}

	const auto column = static_cast<char>(std::tolower(static_cast<unsigned char>(s[0u])));
	const auto row    = s[1u];
	if (column < 'a' || column >= 'a' + static_cast<int>(Board::kSize) || row < '1' || row >= '1' + static_cast<int>(Board::kSize)) {
		return {};
	}

	return Coord{static_cast<Id>(row - '1'), static_cast<Id>(column - 'a')};
}

std::string toNotation(const Coord c) {
	return {char('a' + c.col), char('1' + c.row)};
}

} // namespace othello
