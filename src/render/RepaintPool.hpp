#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace trellis {

/// Fixed-size worker pool that runs layer repaint tasks. Each layer keeps
/// at most one task queued or running, so the pool only needs FIFO order.
class RepaintPool {
public:
    explicit RepaintPool(size_t threadCount = 2);
    ~RepaintPool();

    static RepaintPool& instance();

    RepaintPool(const RepaintPool&) = delete;
    RepaintPool& operator=(const RepaintPool&) = delete;

    /// Queue a task. Returns false once the pool is shutting down.
    bool submit(std::function<void()> task);

    /// Stop the workers after draining the queue, then start `threadCount`
    /// new ones.
    void resize(size_t threadCount);

    /// Drain the queue and join the workers. Later submits are rejected.
    void shutdown();

    size_t threadCount() const;
    size_t pendingCount() const;

private:
    void start(size_t threadCount);
    void stopWorkers();
    void workerLoop();

    std::vector<std::thread> m_workers;
    std::queue<std::function<void()>> m_tasks;
    mutable std::mutex m_mutex;
    std::condition_variable m_taskCV;
    bool m_stopping = false;
    std::atomic<bool> m_shutDown{false};
};

} // namespace trellis
