#pragma once

namespace othello {

//! Side to move. First was "White" in the original board colours and always opens the game.
enum class Player { First = 1, Second = 2 };

//! Returns the opponent enum value of input player.
inline constexpr Player opponent(Player player) {
	return player == Player::First ? Player::Second : Player::First;
}

} // namespace othello
