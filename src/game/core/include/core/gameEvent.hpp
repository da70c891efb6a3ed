#pragma once

#include "model/coordinate.hpp"
#include "model/player.hpp"

#include <cstdint>
#include <variant>

namespace othello {

struct CellClickEvent {
	Coord c;
};
struct ResetEvent {};
struct PassEvent {};

using GameEvent = std::variant<CellClickEvent, ResetEvent, PassEvent>;


//! Types of signals.
enum GameSignal : std::uint64_t {
	GS_None         = 0,
	GS_BoardChange  = 1 << 0, //!< Board was modified.
	GS_PlayerChange = 1 << 1, //!< Active player changed.
	GS_ScoreChange  = 1 << 2, //!< Piece counts were recomputed.
	GS_GameOver     = 1 << 3, //!< Termination condition holds after the last event.
};

} // namespace othello
