#include "canvas/RootCanvasItem.hpp"
#include "core/Log.hpp"

namespace trellis {

RootCanvasItem::RootCanvasItem(std::shared_ptr<IDrawSink> drawSink,
                               std::shared_ptr<ICursorSink> cursorSink)
    : m_drawSink(std::move(drawSink))
    , m_cursorSink(std::move(cursorSink))
{
    setName("root");
}

void RootCanvasItem::close() {
    LayerCanvasItem::close();
    m_mouseTrackingItem.reset();
    m_mouseCaptureItem.reset();
    m_focusedItem.reset();
    m_lastFocusedItem.reset();
    m_dragTrackingItem.reset();
    m_pendingFocusItem.reset();
}

RootCanvasItem* RootCanvasItem::rootContainer() const {
    return const_cast<RootCanvasItem*>(this);
}

std::shared_ptr<IDrawSink> RootCanvasItem::drawSink() const {
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    return m_drawSink;
}

void RootCanvasItem::setDrawSink(std::shared_ptr<IDrawSink> sink) {
    {
        std::lock_guard<std::mutex> lock(m_sinkMutex);
        m_drawSink = std::move(sink);
    }
    update();
}

std::shared_ptr<ICursorSink> RootCanvasItem::cursorSink() const {
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    return m_cursorSink;
}

void RootCanvasItem::setCursorSink(std::shared_ptr<ICursorSink> sink) {
    std::lock_guard<std::mutex> lock(m_sinkMutex);
    m_cursorSink = std::move(sink);
}

void RootCanvasItem::updateLayout(IntPoint origin, IntSize size) {
    LayerCanvasItem::updateLayout(origin, size);
    pushSectionRects(*this);
}

void RootCanvasItem::pushSectionRects(const CanvasItemComposition& composition) {
    for (const auto& item : composition.canvasItems()) {
        auto* child = dynamic_cast<CanvasItemComposition*>(item.get());
        if (!child) continue;
        if (auto* layer = dynamic_cast<LayerCanvasItem*>(child); layer && layer->drawsDirectly()) {
            if (auto size = layer->canvasSize()) {
                layer->setSectionRect(IntRect(layer->mapToGlobal({0, 0}), *size));
            }
        }
        pushSectionRects(*child);
    }
}

void RootCanvasItem::publish(std::shared_ptr<const DrawingContext> output) {
    auto frame = output;
    LayerCanvasItem::publish(std::move(output));
    if (auto sink = drawSink()) {
        sink->draw(std::move(frame));
    }
}

void RootCanvasItem::sizeChanged(int width, int height) {
    if (width <= 0 || height <= 0) {
        LOG_DEBUG("root: ignoring empty size {}x{}", width, height);
        return;
    }
    updateLayout({0, 0}, {width, height});
    update();
}

CanvasItemPtr RootCanvasItem::live(const std::weak_ptr<AbstractCanvasItem>& ref) const {
    auto item = ref.lock();
    if (!item || item->isClosed() || item->rootContainer() != this) {
        return nullptr;
    }
    return item;
}

CanvasItemPtr RootCanvasItem::mouseTrackingItem() const { return live(m_mouseTrackingItem); }
CanvasItemPtr RootCanvasItem::mouseCaptureItem() const { return live(m_mouseCaptureItem); }
CanvasItemPtr RootCanvasItem::dragTrackingItem() const { return live(m_dragTrackingItem); }
CanvasItemPtr RootCanvasItem::focusedItem() const { return live(m_focusedItem); }

CanvasItemPtr RootCanvasItem::mouseItemAtPoint(int x, int y) {
    if (auto capture = live(m_mouseCaptureItem)) {
        return capture;
    }
    for (auto& item : itemsAtPoint(x, y)) {
        if (item->wantsMouseEvents()) {
            return item;
        }
    }
    return nullptr;
}

CanvasItemPtr RootCanvasItem::dragItemAtPoint(int x, int y) {
    for (auto& item : itemsAtPoint(x, y)) {
        if (item->wantsDragEvents()) {
            return item;
        }
    }
    return nullptr;
}

void RootCanvasItem::setMouseTrackingItem(const CanvasItemPtr& item) {
    auto old = m_mouseTrackingItem.lock();
    if (old == item) return;

    // Closed or detached items get no exit notification
    if (old && live(m_mouseTrackingItem)) {
        old->mouseExited();
    }
    m_mouseTrackingItem = item;
    if (item) {
        item->mouseEntered();
        showCursorFeedback(*item);
    } else if (auto sink = cursorSink()) {
        sink->setCursorShape(CursorShape::Arrow);
        sink->hideToolTip();
    }
}

void RootCanvasItem::showCursorFeedback(const AbstractCanvasItem& item) {
    auto sink = cursorSink();
    if (!sink) return;
    sink->setCursorShape(item.cursorShape());
    if (item.toolTip().empty()) {
        sink->hideToolTip();
    } else {
        sink->showToolTip(item.toolTip(), m_lastMousePosition);
    }
}

void RootCanvasItem::cursorFeedbackChanged(const AbstractCanvasItem& item) {
    auto tracking = live(m_mouseTrackingItem);
    if (tracking.get() == &item) {
        showCursorFeedback(item);
    }
}

bool RootCanvasItem::mouseEnteredWidget() {
    m_mouseTracking = true;
    return true;
}

bool RootCanvasItem::mouseExitedWidget() {
    setMouseTrackingItem(nullptr);
    m_mouseTracking = false;
    return true;
}

bool RootCanvasItem::mousePositionChangedAt(int x, int y, const KeyboardModifiers& modifiers) {
    m_lastMousePosition = {x, y};
    if (!m_mouseTracking) {
        mouseEnteredWidget();
    }

    if (auto capture = live(m_mouseCaptureItem)) {
        auto p = capture->mapFromGlobal({x, y});
        return capture->mousePositionChanged(p.x, p.y, modifiers);
    }

    setMouseTrackingItem(mouseItemAtPoint(x, y));
    if (auto tracking = live(m_mouseTrackingItem)) {
        auto p = tracking->mapFromGlobal({x, y});
        return tracking->mousePositionChanged(p.x, p.y, modifiers);
    }
    return false;
}

bool RootCanvasItem::mousePressedAt(int x, int y, const KeyboardModifiers& modifiers) {
    mousePositionChangedAt(x, y, modifiers);

    if (!live(m_mouseCaptureItem)) {
        auto item = live(m_mouseTrackingItem);
        if (!item) {
            item = mouseItemAtPoint(x, y);
            setMouseTrackingItem(item);
        }
        m_mouseCaptureItem = item;
    }

    auto target = live(m_mouseCaptureItem);
    if (!target) {
        return false;
    }

    m_pendingFocusItem = target;
    m_pendingFocusPoint = target->mapFromGlobal({x, y});
    m_pendingFocusModifiers = modifiers;

    auto p = target->mapFromGlobal({x, y});
    return target->mousePressed(p.x, p.y, modifiers);
}

void RootCanvasItem::applyPendingFocus() {
    auto item = live(m_pendingFocusItem);
    m_pendingFocusItem.reset();
    if (item) {
        requestFocusFrom(*item, m_pendingFocusPoint, m_pendingFocusModifiers);
    }
}

void RootCanvasItem::requestFocusFrom(AbstractCanvasItem& item, IntPoint p, const KeyboardModifiers& modifiers) {
    // Walk up to the nearest focusable item
    AbstractCanvasItem* target = &item;
    while (target && !target->isFocusable()) {
        p = target->mapToContainer(p);
        target = target->container();
    }
    if (target) {
        target->mouseFocusRequested(p.x, p.y, modifiers);
    }
}

bool RootCanvasItem::mouseReleasedAt(int x, int y, const KeyboardModifiers& modifiers) {
    auto target = live(m_mouseCaptureItem);
    applyPendingFocus();

    bool handled = false;
    if (target) {
        auto p = target->mapFromGlobal({x, y});
        handled = target->mouseReleased(p.x, p.y, modifiers);
    }
    m_mouseCaptureItem.reset();

    // The item under the mouse may differ from the one released
    mousePositionChangedAt(x, y, modifiers);
    return handled;
}

bool RootCanvasItem::clickAt(int x, int y, const KeyboardModifiers& modifiers, ClickHandler handler) {
    // A click during capture belongs to the captured item alone
    if (auto target = live(m_mouseCaptureItem)) {
        auto p = target->mapFromGlobal({x, y});
        requestFocusFrom(*target, p, modifiers);
        return ((*target).*handler)(p.x, p.y, modifiers);
    }

    bool focusRequested = false;
    for (auto& item : itemsAtPoint(x, y)) {
        if (!item->wantsMouseEvents()) continue;
        auto p = item->mapFromGlobal({x, y});
        if (!focusRequested) {
            requestFocusFrom(*item, p, modifiers);
            focusRequested = true;
        }
        if (((*item).*handler)(p.x, p.y, modifiers)) {
            return true;
        }
    }
    return false;
}

bool RootCanvasItem::mouseClickedAt(int x, int y, const KeyboardModifiers& modifiers) {
    return clickAt(x, y, modifiers, &AbstractCanvasItem::mouseClicked);
}

bool RootCanvasItem::mouseDoubleClickedAt(int x, int y, const KeyboardModifiers& modifiers) {
    return clickAt(x, y, modifiers, &AbstractCanvasItem::mouseDoubleClicked);
}

bool RootCanvasItem::wheelChangedAt(int x, int y, int dx, int dy, bool isHorizontal) {
    for (auto& item : itemsAtPoint(x, y)) {
        auto p = item->mapFromGlobal({x, y});
        if (item->wheelChanged(p.x, p.y, dx, dy, isHorizontal)) {
            return true;
        }
    }
    return false;
}

bool RootCanvasItem::contextMenuAt(int x, int y, int gx, int gy) {
    for (auto& item : itemsAtPoint(x, y)) {
        auto p = item->mapFromGlobal({x, y});
        if (item->contextMenuEvent(p.x, p.y, gx, gy)) {
            return true;
        }
    }
    return false;
}

bool RootCanvasItem::panGestureAt(int dx, int dy) {
    for (auto& item : itemsAtPoint(m_lastMousePosition.x, m_lastMousePosition.y)) {
        if (item->panGesture(dx, dy)) {
            return true;
        }
    }
    return false;
}

bool RootCanvasItem::keyPressedAt(const KeyEvent& event) {
    auto focused = focusedItem();
    if (focused && focused->keyPressed(event)) {
        return true;
    }
    if (focused && event.key == Key::Tab) {
        setFocusedItem(nullptr);
        return true;
    }
    return false;
}

bool RootCanvasItem::keyReleasedAt(const KeyEvent& event) {
    auto focused = focusedItem();
    return focused && focused->keyReleased(event);
}

void RootCanvasItem::setFocusedItem(const CanvasItemPtr& item) {
    auto old = live(m_focusedItem);
    if (old != item) {
        if (old) {
            old->setFocusedState(false);
        }
        m_focusedItem = item;
        if (item) {
            item->setFocusedState(true);
        }
    }
    if (item) {
        m_lastFocusedItem = item;
    }
}

void RootCanvasItem::requestRootFocus(const CanvasItemPtr& item) {
    if (m_widgetFocused) {
        setFocusedItem(item);
        return;
    }
    // The host grants the widget focus; item focus follows on focusChanged
    m_lastFocusedItem = item;
    focusChanged(true);
}

void RootCanvasItem::focusChanged(bool focused) {
    m_widgetFocused = focused;
    if (focused) {
        if (auto last = live(m_lastFocusedItem)) {
            setFocusedItem(last);
        }
    } else if (auto current = live(m_focusedItem)) {
        current->setFocusedState(false);
        m_focusedItem.reset();
    }
}

DragAction RootCanvasItem::dragEnterAt(const MimeData&) {
    m_dragTracking = true;
    return DragAction::Copy;
}

DragAction RootCanvasItem::dragLeaveAt() {
    if (auto item = live(m_dragTrackingItem)) {
        item->dragLeave();
    }
    m_dragTrackingItem.reset();
    m_dragTracking = false;
    return DragAction::Ignore;
}

DragAction RootCanvasItem::dragMoveAt(const MimeData& mimeData, int x, int y) {
    if (!m_dragTracking) {
        dragEnterAt(mimeData);
    }

    auto item = dragItemAtPoint(x, y);
    auto old = live(m_dragTrackingItem);
    if (old != item) {
        if (old) {
            old->dragLeave();
        }
        m_dragTrackingItem = item;
        if (item) {
            item->dragEnter(mimeData);
        }
    }

    if (!item) {
        return DragAction::Ignore;
    }
    auto p = item->mapFromGlobal({x, y});
    return item->dragMove(mimeData, p.x, p.y);
}

DragAction RootCanvasItem::dropAt(const MimeData& mimeData, int x, int y) {
    dragMoveAt(mimeData, x, y);

    DragAction result = DragAction::Ignore;
    if (auto item = live(m_dragTrackingItem)) {
        auto p = item->mapFromGlobal({x, y});
        result = item->drop(mimeData, p.x, p.y);
    }
    dragLeaveAt();
    return result;
}

} // namespace trellis
