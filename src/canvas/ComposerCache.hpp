#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace trellis {

/// Maps a key describing paintable state to a weakly held value. An entry
/// removes itself once the last handle returned by get() is released, so
/// the cache never keeps values alive on its own.
class ComposerCache {
public:
    ComposerCache();

    ComposerCache(const ComposerCache&) = delete;
    ComposerCache& operator=(const ComposerCache&) = delete;

    /// Return the live value for `key`, or store and return the result of
    /// `calculate()`. Callers keep the returned pointer for as long as they
    /// use the value. Keys must not be shared between value types.
    template <typename T>
    std::shared_ptr<T> get(const std::string& key, const std::function<std::shared_ptr<T>()>& calculate) {
        if (auto existing = lookup(key)) {
            return std::static_pointer_cast<T>(existing);
        }

        std::shared_ptr<T> value = calculate();
        if (!value) {
            return value;
        }

        uint64_t token = nextToken();
        std::weak_ptr<State> weakState = m_state;
        T* raw = value.get();
        std::shared_ptr<T> handle(raw, [value, weakState, key, token](T*) mutable {
            value.reset();
            if (auto state = weakState.lock()) {
                state->evict(key, token);
            }
        });

        // Another thread may have stored a value for the key meanwhile.
        return std::static_pointer_cast<T>(store(key, handle, token));
    }

    bool contains(const std::string& key) const;
    size_t size() const;

private:
    struct State {
        struct Entry {
            std::weak_ptr<void> value;
            uint64_t token;
        };

        void evict(const std::string& key, uint64_t token);

        std::mutex mutex;
        std::unordered_map<std::string, Entry> entries;
        uint64_t nextToken = 1;
    };

    std::shared_ptr<void> lookup(const std::string& key) const;
    std::shared_ptr<void> store(const std::string& key, const std::shared_ptr<void>& handle, uint64_t token);
    uint64_t nextToken();

    std::shared_ptr<State> m_state;
};

} // namespace trellis
