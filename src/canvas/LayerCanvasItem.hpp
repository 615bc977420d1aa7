#pragma once

#include "canvas/CanvasItem.hpp"
#include "canvas/ComposerCache.hpp"

#include <chrono>
#include <condition_variable>
#include <memory>
#include <optional>
#include <thread>

namespace trellis {

/// A composite whose subtree is laid out and painted on a background task.
///
/// Updates while idle schedule one task on the RepaintPool. Updates while a
/// task runs set a flag that yields exactly one more pass. A finished pass
/// publishes its commands to the container, or, for direct-draw layers,
/// straight to a section of the root's draw sink.
class LayerCanvasItem : public CanvasItemComposition {
public:
    enum class RepaintState { Idle, Scheduled, Running };

    LayerCanvasItem();
    ~LayerCanvasItem() override;

    /// Cancel the in-flight pass and wait for it to finish, then remove the
    /// section and close the children. Must not be called from the layer's
    /// own repaint task.
    void close() override;

    void updateLayout(IntPoint origin, IntSize size) override;
    void childUpdated(AbstractCanvasItem& child) override;

    /// Opaque top-level layers may bypass their container and draw into a
    /// dedicated section of the surface.
    void setDrawsDirectly(bool drawsDirectly);
    bool drawsDirectly() const;
    int sectionId() const { return m_sectionId; }

    /// Global rect of this layer's section, pushed by the root after each
    /// layout pass. A pass that finished without a rect is repeated.
    void setSectionRect(const IntRect& rect);

    /// Minimum spacing between passes; 0 disables the limit.
    void setMaxFrameRate(int framesPerSecond);

    /// Frame rate limit given to layers created afterwards.
    static void setDefaultMaxFrameRate(int framesPerSecond);
    static int defaultMaxFrameRate();

    RepaintState repaintState() const;

    /// Completed passes, cancelled ones included.
    int repaintPassCount() const;

    /// Block until no pass is scheduled or running. Returns false on timeout.
    bool waitForIdle(std::chrono::milliseconds timeout = std::chrono::seconds(5)) const;

    /// Commands of the last published pass.
    std::shared_ptr<const DrawingContext> publishedOutput() const;

protected:
    std::shared_ptr<BaseComposer> createComposer(ComposerCache& cache) override;
    void updated() override;

    /// Hand a finished pass to its destination. Runs on the repaint thread.
    virtual void publish(std::shared_ptr<const DrawingContext> output);

    ComposerCache& composerCache();
    void scheduleRepaint();

private:
    void runRepaint();
    void renderPass(const CancelFlag& cancel);
    bool waitForFrameSlot(const CancelFlag& cancel);

    // Guarded by m_layerMutex
    mutable std::mutex m_layerMutex;
    mutable std::condition_variable m_layerCV;
    RepaintState m_state = RepaintState::Idle;
    bool m_needsRepaint = false;
    bool m_closing = false;
    bool m_drawsDirectly = false;
    bool m_sectionDrawn = false;
    bool m_sectionPending = false;
    std::optional<IntRect> m_sectionRect;
    std::shared_ptr<const DrawingContext> m_published;
    std::thread::id m_taskThread;
    std::chrono::steady_clock::time_point m_lastPass{};
    std::chrono::milliseconds m_minInterval{0};
    int m_passCount = 0;

    CancelFlag m_cancel;
    ComposerCache m_ownCache;
    const int m_sectionId;
};

} // namespace trellis
