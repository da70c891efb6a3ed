#include "core/eventHub.hpp"

#include <algorithm>

namespace othello {

void EventHub::subscribe(IGameSignalListener* listener, uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_listeners.erase(std::remove_if(m_listeners.begin(), m_listeners.end(), [&](const ListenerEntry& e) { return e.listener == listener; }),
	                  m_listeners.end());
}

void EventHub::signal(GameSignal signal) {
	// Copy so a listener may unsubscribe itself from within its callback.
	std::vector<ListenerEntry> listeners;
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		listeners = m_listeners;
	}

	for (const auto& [listener, signalMask]: listeners) {
		if (signalMask & signal) {
			listener->onGameEvent(signal);
		}
	}
}

} // namespace othello
