#include "core/game.hpp"

#include "Logging.hpp"
#include "core/gameInterface.hpp"
#include "core/notation.hpp"
#include "core/terminationChecker.hpp"

#include <format>

namespace othello {

static const char* toString(Player player) {
	return player == Player::First ? "First" : "Second";
}

Game::Game(GameConfig config) : m_config{config}, m_state{initialize()} {
}

void Game::processEvent(const GameEvent& event) {
	std::visit([&](auto&& ev) { handleEvent(ev); }, event);
}

const GameState& Game::state() const {
	return m_state;
}

CellState Game::readCell(std::size_t row, std::size_t col) const {
	return othello::readCell(m_state, row, col);
}

std::pair<std::uint8_t, std::uint8_t> Game::readScores() const {
	return othello::readScores(m_state);
}

Player Game::currentPlayer() const {
	return m_state.currentPlayer;
}

bool Game::isGameOver() const {
	return othello::isGameOver(m_state);
}

bool Game::isFrozen() const {
	return m_config.freezeOnGameOver && isGameOver();
}

void Game::handleEvent(const CellClickEvent& event) {
	auto logger = Logger();

	if (isFrozen()) {
		logger.Log(Logging::LogLevel::Debug, std::format("[Game] Ignoring click at ({}, {}). Game is over.", event.c.row, event.c.col));
		return;
	}

	const auto player = m_state.currentPlayer;
	if (handleCellClick(m_state, event.c.row, event.c.col)) {
		logger.Log(Logging::LogLevel::Info, std::format("[Game] {} played {}. Score {}:{}.", toString(player), toNotation(event.c), m_state.firstScore,
		                                                m_state.secondScore));

		m_eventHub.signal(GS_BoardChange);
		m_eventHub.signal(GS_PlayerChange);
		m_eventHub.signal(GS_ScoreChange);
	} else {
		logger.Log(Logging::LogLevel::Debug, std::format("[Game] Rejected move at ({}, {}) by {}.", event.c.row, event.c.col, toString(player)));
	}

	// Termination is evaluated after every click, accepted or not.
	if (isGameOver()) {
		logger.Log(Logging::LogLevel::Info, "[Game] Game over.");
		m_eventHub.signal(GS_GameOver);
	}
}

void Game::handleEvent(const ResetEvent&) {
	handleResetSignal(m_state);
	Logger().Log(Logging::LogLevel::Info, "[Game] New game started.");

	m_eventHub.signal(GS_BoardChange);
	m_eventHub.signal(GS_PlayerChange);
	m_eventHub.signal(GS_ScoreChange);
}

void Game::handleEvent(const PassEvent&) {
	auto logger = Logger();

	if (isFrozen()) {
		logger.Log(Logging::LogLevel::Debug, "[Game] Ignoring pass. Game is over.");
		return;
	}

	const auto player = m_state.currentPlayer;
	handlePassSignal(m_state);
	logger.Log(Logging::LogLevel::Info, std::format("[Game] {} passed.", toString(player)));

	m_eventHub.signal(GS_PlayerChange);
}

void Game::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	m_eventHub.subscribe(listener, signalMask);
}

void Game::unsubscribe(IGameSignalListener* listener) {
	m_eventHub.unsubscribe(listener);
}

} // namespace othello
