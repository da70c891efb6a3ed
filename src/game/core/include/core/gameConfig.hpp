#pragma once

namespace othello {

//! Rule policies of a Game.
struct GameConfig {
	//! Ignore clicks and passes once the game is over. Reset is always accepted.
	bool freezeOnGameOver{false};
};

} // namespace othello
