#include "canvas/ComposerCache.hpp"

namespace trellis {

ComposerCache::ComposerCache()
    : m_state(std::make_shared<State>())
{
}

void ComposerCache::State::evict(const std::string& key, uint64_t token) {
    std::lock_guard<std::mutex> lock(mutex);
    auto it = entries.find(key);
    // A newer value may already live under the same key.
    if (it != entries.end() && it->second.token == token) {
        entries.erase(it);
    }
}

std::shared_ptr<void> ComposerCache::lookup(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    auto it = m_state->entries.find(key);
    if (it == m_state->entries.end()) {
        return nullptr;
    }
    return it->second.value.lock();
}

std::shared_ptr<void> ComposerCache::store(const std::string& key, const std::shared_ptr<void>& handle,
                                           uint64_t token) {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    auto& entry = m_state->entries[key];
    if (auto existing = entry.value.lock()) {
        return existing;
    }
    entry.value = handle;
    entry.token = token;
    return handle;
}

uint64_t ComposerCache::nextToken() {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->nextToken++;
}

bool ComposerCache::contains(const std::string& key) const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    auto it = m_state->entries.find(key);
    return it != m_state->entries.end() && !it->second.value.expired();
}

size_t ComposerCache::size() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    size_t count = 0;
    for (const auto& [key, entry] : m_state->entries) {
        if (!entry.value.expired()) ++count;
    }
    return count;
}

} // namespace trellis
