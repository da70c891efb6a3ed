#pragma once

#include "core/IGameSignalListener.hpp"
#include "core/game.hpp"

#include <ostream>

namespace othello::console {

//! Draws the board and the score labels as text whenever the game signals a change.
class ConsoleRenderer : public IGameSignalListener {
public:
	ConsoleRenderer(Game& game, std::ostream& out, bool showCoordinates = true);
	~ConsoleRenderer() override;

	ConsoleRenderer(const ConsoleRenderer&)            = delete;
	ConsoleRenderer& operator=(const ConsoleRenderer&) = delete;

	void render(); //!< Draw board, labels and the player to move.

	void onGameEvent(GameSignal signal) override;

private:
	void drawBoard();
	void drawScores();
	void drawTurn();
	void drawGameOver();

private:
	Game& m_game;
	std::ostream& m_out;
	bool m_showCoordinates;
};

//! Colour name of a player as shown to the user.
const char* colorName(Player player);

} // namespace othello::console
