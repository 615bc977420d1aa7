#include "canvas/Composer.hpp"
#include "core/Log.hpp"

#include <exception>

namespace trellis {

// ---------------------------------------------------------------------------
// BaseComposer
// ---------------------------------------------------------------------------

BaseComposer::BaseComposer(ComposerSnapshot snapshot, Painter painter)
    : m_snapshot(std::move(snapshot))
    , m_painter(std::move(painter))
{
}

std::optional<IntRect> BaseComposer::rect() const {
    if (!m_origin || !m_size) return std::nullopt;
    return IntRect(*m_origin, *m_size);
}

void BaseComposer::updateLayout(IntPoint origin, IntSize size) {
    if (m_origin == origin && m_size == size) {
        return;
    }
    m_origin = origin;
    m_size = size;
    m_output.reset();
    m_outputVisibleRect.reset();
    layoutChildren(size);
}

void BaseComposer::layoutChildren(const IntSize&) {
}

bool BaseComposer::repaint(DrawingContext& dc, const IntRect& visibleRect) {
    if (!m_size) {
        return true;
    }

    IntRect visible = visibleRect.intersection(IntRect({0, 0}, *m_size));
    if (!m_output || m_outputVisibleRect != visible) {
        if (dc.isCancelled()) {
            return false;
        }

        auto output = std::make_shared<DrawingContext>(dc.cancelFlag());
        if (m_snapshot.backgroundColor && !visible.isEmpty()) {
            output->fillRect(IntRect({0, 0}, *m_size), *m_snapshot.backgroundColor);
        }

        bool completed = false;
        try {
            completed = paintContent(*output, *m_size, visible);
        } catch (const std::exception& e) {
            // Nothing is cached, so the next pass tries again.
            RENDER_LOG_ERROR("{}: paint failed: {}", m_snapshot.name, e.what());
            m_output.reset();
            m_outputVisibleRect.reset();
            return true;
        }

        if (!completed) {
            m_output.reset();
            m_outputVisibleRect.reset();
            return false;
        }

        m_output = std::move(output);
        m_outputVisibleRect = visible;
        if (countsRepaints() && m_snapshot.repaintCounter) {
            m_snapshot.repaintCounter->fetch_add(1);
        }
    }

    dc.drawContext(m_output);
    return true;
}

bool BaseComposer::paintContent(DrawingContext& dc, const IntSize& size, const IntRect& visibleRect) {
    if (m_painter && !visibleRect.isEmpty()) {
        m_painter(dc, size, visibleRect);
    }
    return !dc.isCancelled();
}

// ---------------------------------------------------------------------------
// CompositionComposer
// ---------------------------------------------------------------------------

CompositionComposer::CompositionComposer(ComposerSnapshot snapshot,
                                         std::shared_ptr<const CanvasLayout> layout,
                                         std::vector<LayoutEntry> entries,
                                         std::vector<std::shared_ptr<BaseComposer>> children,
                                         Painter foreground)
    : BaseComposer(std::move(snapshot))
    , m_layout(std::move(layout))
    , m_entries(std::move(entries))
    , m_children(std::move(children))
    , m_foreground(std::move(foreground))
{
}

std::vector<IntRect> CompositionComposer::childRects(const IntSize& size) const {
    if (!m_layout) return std::vector<IntRect>(m_children.size(), IntRect({0, 0}, size));
    return m_layout->layout({0, 0}, size, m_entries);
}

void CompositionComposer::layoutChildren(const IntSize& size) {
    std::vector<IntRect> rects = childRects(size);
    for (size_t i = 0; i < m_children.size() && i < rects.size(); ++i) {
        m_children[i]->updateLayout(rects[i].origin, rects[i].size);
    }
}

bool CompositionComposer::paintChildren(DrawingContext& dc, const IntRect& visibleRect) {
    for (const auto& child : m_children) {
        if (dc.isCancelled()) {
            return false;
        }
        auto childRect = child->rect();
        if (!childRect || !childRect->intersects(visibleRect)) {
            continue;
        }
        dc.save();
        dc.translate(childRect->origin);
        bool completed = child->repaint(dc, visibleRect.translated(-childRect->origin));
        dc.restore();
        if (!completed) {
            return false;
        }
    }
    return true;
}

bool CompositionComposer::paintContent(DrawingContext& dc, const IntSize& size, const IntRect& visibleRect) {
    if (!paintChildren(dc, visibleRect)) {
        return false;
    }
    if (m_foreground && !visibleRect.isEmpty()) {
        m_foreground(dc, size, visibleRect);
    }
    return !dc.isCancelled();
}

// ---------------------------------------------------------------------------
// PassthroughComposer
// ---------------------------------------------------------------------------

PassthroughComposer::PassthroughComposer(ComposerSnapshot snapshot,
                                         std::shared_ptr<const DrawingContext> output)
    : BaseComposer(std::move(snapshot))
    , m_layerOutput(std::move(output))
{
}

bool PassthroughComposer::paintContent(DrawingContext& dc, const IntSize&, const IntRect&) {
    dc.drawContext(m_layerOutput);
    return true;
}

} // namespace trellis
