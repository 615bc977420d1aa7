#pragma once

#include "canvas/LayerCanvasItem.hpp"
#include "render/Surface.hpp"

#include <memory>
#include <mutex>

namespace trellis {

/// The top of a canvas item tree. It bridges a toolkit widget and the
/// tree: it is a layer whose passes go to the draw sink, and it routes raw
/// widget input to the items.
///
/// Two focus levels exist. The widget focus belongs to the host widget;
/// while the widget has it, one item in the tree may hold item focus.
class RootCanvasItem : public LayerCanvasItem {
public:
    explicit RootCanvasItem(std::shared_ptr<IDrawSink> drawSink = nullptr,
                            std::shared_ptr<ICursorSink> cursorSink = nullptr);

    void close() override;

    RootCanvasItem* rootContainer() const override;

    std::shared_ptr<IDrawSink> drawSink() const;
    void setDrawSink(std::shared_ptr<IDrawSink> sink);
    std::shared_ptr<ICursorSink> cursorSink() const;
    void setCursorSink(std::shared_ptr<ICursorSink> sink);

    using LayerCanvasItem::composerCache;

    /// Lays out the tree, then pushes section rects to direct-draw layers.
    void updateLayout(IntPoint origin, IntSize size) override;

    // Widget entry points, in widget coordinates
    void sizeChanged(int width, int height);
    bool mouseEnteredWidget();
    bool mouseExitedWidget();
    bool mousePressedAt(int x, int y, const KeyboardModifiers& modifiers);
    bool mouseReleasedAt(int x, int y, const KeyboardModifiers& modifiers);
    bool mousePositionChangedAt(int x, int y, const KeyboardModifiers& modifiers);
    bool mouseClickedAt(int x, int y, const KeyboardModifiers& modifiers);
    bool mouseDoubleClickedAt(int x, int y, const KeyboardModifiers& modifiers);
    bool wheelChangedAt(int x, int y, int dx, int dy, bool isHorizontal);
    bool contextMenuAt(int x, int y, int gx, int gy);
    bool keyPressedAt(const KeyEvent& event);
    bool keyReleasedAt(const KeyEvent& event);
    bool panGestureAt(int dx, int dy);
    void focusChanged(bool focused);

    /// The widget accepts drags; targets decide on move and drop.
    DragAction dragEnterAt(const MimeData& mimeData);
    DragAction dragLeaveAt();
    DragAction dragMoveAt(const MimeData& mimeData, int x, int y);
    DragAction dropAt(const MimeData& mimeData, int x, int y);

    // Focus
    CanvasItemPtr focusedItem() const;
    /// Move item focus, notifying the old and new items.
    void setFocusedItem(const CanvasItemPtr& item);
    /// Focus `item`, granting the widget focus first if needed.
    void requestRootFocus(const CanvasItemPtr& item);
    bool isWidgetFocused() const { return m_widgetFocused; }

    CanvasItemPtr mouseTrackingItem() const;
    CanvasItemPtr mouseCaptureItem() const;
    CanvasItemPtr dragTrackingItem() const;

    /// Called when the cursor shape or tooltip of `item` changed.
    void cursorFeedbackChanged(const AbstractCanvasItem& item);

protected:
    void publish(std::shared_ptr<const DrawingContext> output) override;

private:
    /// The item behind a weak reference, unless it was closed or detached.
    CanvasItemPtr live(const std::weak_ptr<AbstractCanvasItem>& ref) const;

    CanvasItemPtr mouseItemAtPoint(int x, int y);
    CanvasItemPtr dragItemAtPoint(int x, int y);
    void setMouseTrackingItem(const CanvasItemPtr& item);
    void showCursorFeedback(const AbstractCanvasItem& item);
    void applyPendingFocus();
    void requestFocusFrom(AbstractCanvasItem& item, IntPoint p, const KeyboardModifiers& modifiers);

    using ClickHandler = bool (AbstractCanvasItem::*)(int, int, const KeyboardModifiers&);
    /// Deliver to the captured item, else to the frontmost item that handles it.
    bool clickAt(int x, int y, const KeyboardModifiers& modifiers, ClickHandler handler);
    void pushSectionRects(const CanvasItemComposition& composition);

    mutable std::mutex m_sinkMutex;
    std::shared_ptr<IDrawSink> m_drawSink;
    std::shared_ptr<ICursorSink> m_cursorSink;

    // UI thread only
    std::weak_ptr<AbstractCanvasItem> m_mouseTrackingItem;
    std::weak_ptr<AbstractCanvasItem> m_mouseCaptureItem;
    std::weak_ptr<AbstractCanvasItem> m_focusedItem;
    std::weak_ptr<AbstractCanvasItem> m_lastFocusedItem;
    std::weak_ptr<AbstractCanvasItem> m_dragTrackingItem;
    std::weak_ptr<AbstractCanvasItem> m_pendingFocusItem;
    IntPoint m_pendingFocusPoint;
    KeyboardModifiers m_pendingFocusModifiers;
    IntPoint m_lastMousePosition;
    bool m_mouseTracking = false;
    bool m_dragTracking = false;
    bool m_widgetFocused = false;
};

} // namespace trellis
