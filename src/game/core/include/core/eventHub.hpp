#pragma once

#include "core/IGameSignalListener.hpp"

#include <mutex>
#include <vector>

namespace othello {

//! Allows external components to be updated on internal game events.
//! \note Signals are synchronous and run on the caller thread.
class EventHub {
	struct ListenerEntry {
		IGameSignalListener* listener; //!< Pointer to the listener.
		uint64_t signalMask;           //!< What events the listener cares about.
	};

public:
	void subscribe(IGameSignalListener* listener, uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);

	void signal(GameSignal signal); //!< Signal a game event.

private:
	std::mutex m_listenerMutex;
	std::vector<ListenerEntry> m_listeners;
};

} // namespace othello
