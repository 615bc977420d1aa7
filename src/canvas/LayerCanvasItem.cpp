#include "canvas/LayerCanvasItem.hpp"
#include "canvas/RootCanvasItem.hpp"
#include "core/Log.hpp"
#include "render/RepaintPool.hpp"

#include <exception>
#include <stdexcept>

namespace trellis {

namespace {

std::atomic<int> s_nextSectionId{1};
std::atomic<int> s_defaultMaxFrameRate{0};

} // namespace

LayerCanvasItem::LayerCanvasItem()
    : m_cancel(std::make_shared<std::atomic<bool>>(false))
    , m_sectionId(s_nextSectionId++)
{
    setMaxFrameRate(s_defaultMaxFrameRate.load());
}

LayerCanvasItem::~LayerCanvasItem() = default;

void LayerCanvasItem::close() {
    {
        std::unique_lock<std::mutex> lock(m_layerMutex);
        if (m_state == RepaintState::Running && m_taskThread == std::this_thread::get_id()) {
            throw std::logic_error("LayerCanvasItem: close() called from the layer's own repaint task");
        }
        m_closing = true;
        m_needsRepaint = false;
        m_cancel->store(true);
        m_layerCV.notify_all();
        m_layerCV.wait(lock, [this] { return m_state == RepaintState::Idle; });
    }

    bool removeSection = false;
    {
        std::lock_guard<std::mutex> lock(m_layerMutex);
        removeSection = m_sectionDrawn;
        m_sectionDrawn = false;
        m_published.reset();
    }
    if (removeSection) {
        auto* root = rootContainer();
        if (auto sink = root ? root->drawSink() : nullptr) {
            sink->removeSection(m_sectionId);
        }
    }

    CanvasItemComposition::close();
}

void LayerCanvasItem::updateLayout(IntPoint origin, IntSize size) {
    auto oldSize = canvasSize();
    CanvasItemComposition::updateLayout(origin, size);
    if (oldSize != size) {
        update();
    }
}

void LayerCanvasItem::childUpdated(AbstractCanvasItem&) {
    // The container keeps showing the last published output meanwhile.
    scheduleRepaint();
}

void LayerCanvasItem::updated() {
    scheduleRepaint();
}

void LayerCanvasItem::setDrawsDirectly(bool drawsDirectly) {
    // Already laid out under a root: the next root layout may be far off.
    std::optional<IntRect> sectionRect;
    auto size = canvasSize();
    if (drawsDirectly && size && rootContainer()) {
        sectionRect = IntRect(mapToGlobal({0, 0}), *size);
    }

    bool removeSection = false;
    {
        std::lock_guard<std::mutex> lock(m_layerMutex);
        if (m_drawsDirectly == drawsDirectly) return;
        m_drawsDirectly = drawsDirectly;
        if (!drawsDirectly) {
            removeSection = m_sectionDrawn;
            m_sectionDrawn = false;
            m_sectionPending = false;
        } else if (sectionRect) {
            m_sectionRect = sectionRect;
        }
    }
    if (removeSection) {
        auto* root = rootContainer();
        if (auto sink = root ? root->drawSink() : nullptr) {
            sink->removeSection(m_sectionId);
        }
    }
    update();
    if (auto* c = container()) {
        c->childUpdated(*this);
    }
}

bool LayerCanvasItem::drawsDirectly() const {
    std::lock_guard<std::mutex> lock(m_layerMutex);
    return m_drawsDirectly;
}

void LayerCanvasItem::setSectionRect(const IntRect& rect) {
    bool redraw = false;
    {
        std::lock_guard<std::mutex> lock(m_layerMutex);
        redraw = (m_sectionDrawn && m_sectionRect != rect) || m_sectionPending;
        m_sectionRect = rect;
    }
    if (redraw) {
        scheduleRepaint();
    }
}

void LayerCanvasItem::setMaxFrameRate(int framesPerSecond) {
    std::lock_guard<std::mutex> lock(m_layerMutex);
    m_minInterval = framesPerSecond > 0 ? std::chrono::milliseconds(1000 / framesPerSecond)
                                        : std::chrono::milliseconds(0);
}

void LayerCanvasItem::setDefaultMaxFrameRate(int framesPerSecond) {
    s_defaultMaxFrameRate = framesPerSecond;
}

int LayerCanvasItem::defaultMaxFrameRate() {
    return s_defaultMaxFrameRate.load();
}

LayerCanvasItem::RepaintState LayerCanvasItem::repaintState() const {
    std::lock_guard<std::mutex> lock(m_layerMutex);
    return m_state;
}

int LayerCanvasItem::repaintPassCount() const {
    std::lock_guard<std::mutex> lock(m_layerMutex);
    return m_passCount;
}

bool LayerCanvasItem::waitForIdle(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_layerMutex);
    return m_layerCV.wait_for(lock, timeout, [this] { return m_state == RepaintState::Idle; });
}

std::shared_ptr<const DrawingContext> LayerCanvasItem::publishedOutput() const {
    std::lock_guard<std::mutex> lock(m_layerMutex);
    return m_published;
}

std::shared_ptr<BaseComposer> LayerCanvasItem::createComposer(ComposerCache&) {
    bool drawsDirectly = false;
    std::shared_ptr<const DrawingContext> output;
    {
        std::lock_guard<std::mutex> lock(m_layerMutex);
        drawsDirectly = m_drawsDirectly;
        output = m_published;
    }

    ComposerSnapshot snapshot;
    snapshot.layoutSizing = layoutSizing();
    snapshot.name = name();

    // Direct-draw layers occupy space in the container but paint nothing there.
    if (drawsDirectly) {
        return std::make_shared<BaseComposer>(std::move(snapshot));
    }
    // An empty or unsized layer never publishes and paints nothing.
    auto size = canvasSize();
    if (!size || size->isEmpty()) {
        return std::make_shared<BaseComposer>(std::move(snapshot));
    }
    if (!output) {
        return nullptr;
    }
    return std::make_shared<PassthroughComposer>(std::move(snapshot), std::move(output));
}

ComposerCache& LayerCanvasItem::composerCache() {
    auto* root = rootContainer();
    if (root && root != this) {
        return root->composerCache();
    }
    return m_ownCache;
}

void LayerCanvasItem::scheduleRepaint() {
    std::lock_guard<std::mutex> lock(m_layerMutex);
    if (m_closing || isClosed()) {
        return;
    }

    switch (m_state) {
        case RepaintState::Idle:
            break;
        case RepaintState::Scheduled:
            return;
        case RepaintState::Running:
            m_needsRepaint = true;
            return;
    }

    auto self = std::static_pointer_cast<LayerCanvasItem>(weak_from_this().lock());
    if (!self) {
        RENDER_LOG_WARN("LayerCanvasItem: layer is not owned by a shared_ptr; repaint skipped");
        return;
    }
    m_state = RepaintState::Scheduled;
    if (!RepaintPool::instance().submit([self] { self->runRepaint(); })) {
        m_state = RepaintState::Idle;
        m_layerCV.notify_all();
    }
}

void LayerCanvasItem::runRepaint() {
    CancelFlag cancel;
    {
        std::lock_guard<std::mutex> lock(m_layerMutex);
        if (m_closing) {
            m_state = RepaintState::Idle;
            m_layerCV.notify_all();
            return;
        }
        m_state = RepaintState::Running;
        m_needsRepaint = false;
        m_taskThread = std::this_thread::get_id();
        cancel = m_cancel;
    }

    try {
        renderPass(cancel);
    } catch (const std::exception& e) {
        RENDER_LOG_ERROR("{}: repaint failed: {}", name(), e.what());
    }

    std::shared_ptr<LayerCanvasItem> self;
    {
        std::lock_guard<std::mutex> lock(m_layerMutex);
        m_taskThread = std::thread::id();
        m_lastPass = std::chrono::steady_clock::now();
        ++m_passCount;

        if (m_needsRepaint && !m_closing) {
            m_needsRepaint = false;
            self = std::static_pointer_cast<LayerCanvasItem>(weak_from_this().lock());
        }
        m_state = self ? RepaintState::Scheduled : RepaintState::Idle;
        if (self && !RepaintPool::instance().submit([self] { self->runRepaint(); })) {
            m_state = RepaintState::Idle;
        }
        m_layerCV.notify_all();
    }
}

void LayerCanvasItem::renderPass(const CancelFlag& cancel) {
    if (!waitForFrameSlot(cancel)) {
        return;
    }

    auto size = canvasSize();
    if (!size || size->isEmpty()) {
        return;
    }

    auto composer = createCompositionComposer(composerCache());
    if (!composer) {
        // A nested layer has not published yet; its publish triggers another pass.
        RENDER_LOG_TRACE("{}: content not ready", name());
        return;
    }

    composer->updateLayout({0, 0}, *size);
    auto output = std::make_shared<DrawingContext>(cancel);
    if (!composer->repaint(*output, IntRect({0, 0}, *size)) || cancel->load()) {
        RENDER_LOG_TRACE("{}: pass cancelled", name());
        return;
    }
    publish(std::move(output));
}

bool LayerCanvasItem::waitForFrameSlot(const CancelFlag& cancel) {
    std::unique_lock<std::mutex> lock(m_layerMutex);
    if (m_minInterval.count() > 0) {
        auto next = m_lastPass + m_minInterval;
        m_layerCV.wait_until(lock, next, [&cancel] { return cancel->load(); });
    }
    return !cancel->load();
}

void LayerCanvasItem::publish(std::shared_ptr<const DrawingContext> output) {
    if (drawsDirectly()) {
        auto* root = rootContainer();
        auto sink = root ? root->drawSink() : nullptr;
        std::optional<IntRect> rect;
        {
            std::lock_guard<std::mutex> lock(m_layerMutex);
            rect = m_sectionRect;
            m_published = output;
            // Drawn again once setSectionRect delivers a rect.
            m_sectionPending = !rect || !sink;
        }
        if (!rect || !sink) {
            RENDER_LOG_TRACE("{}: no section to draw into yet", name());
            return;
        }
        sink->drawSection(m_sectionId, std::move(output), *rect);
        std::lock_guard<std::mutex> lock(m_layerMutex);
        m_sectionDrawn = true;
        return;
    }

    {
        std::lock_guard<std::mutex> lock(m_layerMutex);
        m_published = std::move(output);
    }
    invalidateComposer();
    if (auto* c = container()) {
        c->childUpdated(*this);
    }
}

} // namespace trellis
