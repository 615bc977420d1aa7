#pragma once

#include <algorithm>
#include <cstdint>
#include <functional>
#include <mutex>
#include <utility>
#include <vector>

namespace trellis {

/// Listener ID for unsubscribing
using ListenerId = uint64_t;

/// A typed event with any number of listeners. Listeners are called in
/// subscription order on the thread that fires the event.
template <typename... Args>
class Event {
public:
    using Listener = std::function<void(Args...)>;

    ListenerId listen(Listener listener) {
        std::lock_guard<std::mutex> lock(m_mutex);
        ListenerId id = m_nextId++;
        m_listeners.push_back({id, std::move(listener)});
        return id;
    }

    bool unlisten(ListenerId id) {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_listeners.begin(), m_listeners.end(),
            [id](const Entry& entry) { return entry.id == id; });
        if (it == m_listeners.end()) return false;
        m_listeners.erase(it);
        return true;
    }

    void fire(Args... args) const {
        // Copy so listeners may unsubscribe while being called
        std::vector<Entry> listeners;
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            listeners = m_listeners;
        }
        for (const auto& entry : listeners) {
            entry.callback(args...);
        }
    }

    size_t listenerCount() const {
        std::lock_guard<std::mutex> lock(m_mutex);
        return m_listeners.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_listeners.clear();
    }

private:
    struct Entry {
        ListenerId id;
        Listener callback;
    };

    mutable std::mutex m_mutex;
    std::vector<Entry> m_listeners;
    ListenerId m_nextId = 1;
};

} // namespace trellis
