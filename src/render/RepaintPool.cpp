#include "render/RepaintPool.hpp"
#include "core/Log.hpp"

#include <exception>

namespace trellis {

RepaintPool& RepaintPool::instance() {
    static RepaintPool pool;
    return pool;
}

RepaintPool::RepaintPool(size_t threadCount) {
    start(threadCount);
}

RepaintPool::~RepaintPool() {
    shutdown();
}

void RepaintPool::start(size_t threadCount) {
    if (threadCount == 0) threadCount = 1;
    std::lock_guard<std::mutex> lock(m_mutex);
    m_stopping = false;
    for (size_t i = 0; i < threadCount; ++i) {
        m_workers.emplace_back(&RepaintPool::workerLoop, this);
    }
}

bool RepaintPool::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_shutDown) {
            return false;
        }
        m_tasks.push(std::move(task));
    }
    m_taskCV.notify_one();
    return true;
}

void RepaintPool::stopWorkers() {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_stopping = true;
    }
    m_taskCV.notify_all();

    for (auto& worker : m_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_workers.clear();
}

void RepaintPool::resize(size_t threadCount) {
    if (m_shutDown) return;
    stopWorkers();
    start(threadCount);
    RENDER_LOG_DEBUG("RepaintPool: running {} worker(s)", threadCount);
}

void RepaintPool::shutdown() {
    if (m_shutDown.exchange(true)) {
        return;
    }
    stopWorkers();
}

size_t RepaintPool::threadCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_workers.size();
}

size_t RepaintPool::pendingCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tasks.size();
}

void RepaintPool::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_taskCV.wait(lock, [this] { return m_stopping || !m_tasks.empty(); });

            // Queued work is drained before the worker exits.
            if (m_tasks.empty()) {
                break;
            }
            task = std::move(m_tasks.front());
            m_tasks.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            RENDER_LOG_ERROR("RepaintPool: task failed: {}", e.what());
        }
    }
}

} // namespace trellis
