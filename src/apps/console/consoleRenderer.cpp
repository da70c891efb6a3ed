#include "console/consoleRenderer.hpp"

#include "core/terminationChecker.hpp"

#include <format>

namespace othello::console {

const char* colorName(Player player) {
	return player == Player::First ? "white" : "black";
}

static char symbol(CellState value) {
	switch (value) {
	case CellState::First:
		return 'W';
	case CellState::Second:
		return 'B';
	case CellState::Empty:
		break;
	}
	return '.';
}

ConsoleRenderer::ConsoleRenderer(Game& game, std::ostream& out, bool showCoordinates)
    : m_game(game), m_out(out), m_showCoordinates(showCoordinates) {
	m_game.subscribe(this, GS_BoardChange | GS_PlayerChange | GS_ScoreChange | GS_GameOver);
}

ConsoleRenderer::~ConsoleRenderer() {
	m_game.unsubscribe(this);
}

void ConsoleRenderer::render() {
	drawBoard();
	drawScores();
	drawTurn();
}

void ConsoleRenderer::onGameEvent(GameSignal signal) {
	switch (signal) {
	case GS_BoardChange:
		drawBoard();
		break;
	case GS_ScoreChange:
		drawScores();
		break;
	case GS_PlayerChange:
		drawTurn();
		break;
	case GS_GameOver:
		drawGameOver();
		break;
	default:
		break;
	}
}

void ConsoleRenderer::drawBoard() {
	const auto size = m_game.state().board.size();

	if (m_showCoordinates) {
		m_out << "  ";
		for (Id col = 0; col < size; ++col) {
			m_out << ' ' << static_cast<char>('a' + col);
		}
		m_out << '\n';
	}

	for (Id row = 0; row < size; ++row) {
		if (m_showCoordinates) {
			m_out << std::format("{} ", row + 1);
		}
		for (Id col = 0; col < size; ++col) {
			m_out << ' ' << symbol(m_game.readCell(row, col));
		}
		m_out << '\n';
	}
}

void ConsoleRenderer::drawScores() {
	const auto [first, second] = m_game.readScores();
	m_out << std::format("{}: {}\n{}: {}\n", colorName(Player::First), first, colorName(Player::Second), second);
}

void ConsoleRenderer::drawTurn() {
	m_out << std::format("{} to move\n", colorName(m_game.currentPlayer()));
}

void ConsoleRenderer::drawGameOver() {
	m_out << "Game Over\n";

	if (const auto won = winner(m_game.state())) {
		m_out << std::format("{} wins\n", colorName(*won));
	} else {
		m_out << "Draw\n";
	}
}

} // namespace othello::console
