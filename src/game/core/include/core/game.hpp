#pragma once

#include "core/eventHub.hpp"
#include "core/gameConfig.hpp"
#include "core/gameEvent.hpp"
#include "core/gameState.hpp"

#include <cstdint>
#include <utility>

namespace othello {

//! Owns the one game state of the application and runs the fixed handler chain per input event.
//! External code pushes events and listens for signals; it never mutates the state directly.
class Game {
public:
	//! Setup a game in its starting position.
	explicit Game(GameConfig config = {});

	void processEvent(const GameEvent& event); //!< Process one input event to completion.

	const GameState& state() const;                             //!< Get game data for rendering.
	CellState readCell(std::size_t row, std::size_t col) const; //!< Cell value for rendering.
	std::pair<std::uint8_t, std::uint8_t> readScores() const;   //!< (First, Second) piece counts.
	Player currentPlayer() const;                               //!< Returns the currently active player.
	bool isGameOver() const;                                    //!< Returns whether the termination condition holds.

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);

private:
	void handleEvent(const CellClickEvent& event);
	void handleEvent(const ResetEvent& event);
	void handleEvent(const PassEvent& event);

	//! True if the freeze policy rejects input in the current state.
	bool isFrozen() const;

private:
	GameConfig m_config;
	GameState m_state;
	EventHub m_eventHub; //!< Hub to signal updates of the game state to external components.
};

} // namespace othello
