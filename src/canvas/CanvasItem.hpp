#pragma once

#include "canvas/Composer.hpp"
#include "canvas/InputTypes.hpp"
#include "core/Event.hpp"
#include "core/Geometry.hpp"
#include "layout/CanvasLayout.hpp"
#include "layout/Sizing.hpp"
#include "render/Surface.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

// Forward declarations
class CanvasItemComposition;
class ComposerCache;
class LayerCanvasItem;
class RootCanvasItem;
class AbstractCanvasItem;

using CanvasItemPtr = std::shared_ptr<AbstractCanvasItem>;

/// Base class for all canvas items.
/// Items form a tree. A composite owns its children; each child keeps a
/// non-owning pointer back to its container. Items must be created with
/// std::make_shared. All mutation happens on the UI thread; state that
/// repaint threads read is guarded by the item's mutex.
class AbstractCanvasItem : public std::enable_shared_from_this<AbstractCanvasItem> {
public:
    AbstractCanvasItem();
    virtual ~AbstractCanvasItem() = default;

    // Non-copyable
    AbstractCanvasItem(const AbstractCanvasItem&) = delete;
    AbstractCanvasItem& operator=(const AbstractCanvasItem&) = delete;

    /// Release resources. Closing a composite closes its children first.
    virtual void close();
    bool isClosed() const { return m_closed; }

    // Tree structure
    CanvasItemComposition* container() const { return m_container.load(); }
    virtual RootCanvasItem* rootContainer() const;
    LayerCanvasItem* layerContainer() const;

    // Sizing
    Sizing sizing() const;
    /// Replace the sizing, then refresh the layout and repaint.
    void setSizing(const Sizing& sizing);
    /// Sizing used by the container's layout.
    virtual Sizing layoutSizing() const;

    // Geometry (relative to the container)
    std::optional<IntPoint> canvasOrigin() const;
    std::optional<IntSize> canvasSize() const;
    std::optional<IntRect> canvasRect() const;
    /// Rect at the local origin, i.e. (0, 0, width, height).
    std::optional<IntRect> canvasBounds() const;

    /// Assign origin and size; composites lay out their children as well.
    virtual void updateLayout(IntPoint origin, IntSize size);

    /// Re-run layout from the top of the tree with the current sizes.
    void refreshLayout();

    /// Fired with the new origin and size on every layout assignment.
    Event<IntPoint, IntSize>& layoutUpdatedEvent() { return m_layoutUpdated; }

    // Coordinate mapping
    IntPoint mapToContainer(IntPoint p) const;
    IntPoint mapToGlobal(IntPoint p) const;
    IntPoint mapFromGlobal(IntPoint p) const;
    /// Map a point in this item's coordinates into `other`'s coordinates.
    IntPoint mapToCanvasItem(IntPoint p, const AbstractCanvasItem& other) const;

    // Flags
    bool isVisible() const;
    void setVisible(bool visible);
    bool isEnabled() const { return m_enabled; }
    void setEnabled(bool enabled);
    bool isFocusable() const { return m_focusable; }
    void setFocusable(bool focusable) { m_focusable = focusable; }
    bool wantsMouseEvents() const { return m_wantsMouseEvents; }
    void setWantsMouseEvents(bool wants) { m_wantsMouseEvents = wants; }
    bool wantsDragEvents() const { return m_wantsDragEvents; }
    void setWantsDragEvents(bool wants) { m_wantsDragEvents = wants; }

    CursorShape cursorShape() const { return m_cursorShape; }
    void setCursorShape(CursorShape shape);
    const std::string& toolTip() const { return m_toolTip; }
    void setToolTip(const std::string& toolTip);

    std::optional<Color> backgroundColor() const;
    void setBackgroundColor(std::optional<Color> color);

    /// Name used in log messages.
    std::string name() const;
    void setName(const std::string& name);

    // Focus
    bool isFocused() const { return m_focused; }
    /// Focus this item if it is focusable. The root grants focus to the
    /// widget first when it does not have it.
    void requestFocus();
    void clearFocus();
    /// Focus request that follows a click, applied when the mouse is
    /// released. (x, y) is the press position. Defaults to requestFocus().
    virtual void mouseFocusRequested(int x, int y, const KeyboardModifiers& modifiers);
    /// Fired with the new focus state.
    Event<bool>& focusChangedEvent() { return m_focusChanged; }

    // Hit testing
    /// Items under (x, y) in local coordinates, frontmost first, ending
    /// with this item.
    virtual std::vector<CanvasItemPtr> itemsAtPoint(int x, int y);

    // Input, in local coordinates. Return true when handled.
    virtual bool mouseClicked(int x, int y, const KeyboardModifiers& modifiers);
    virtual bool mouseDoubleClicked(int x, int y, const KeyboardModifiers& modifiers);
    virtual bool mouseEntered();
    virtual bool mouseExited();
    virtual bool mousePressed(int x, int y, const KeyboardModifiers& modifiers);
    virtual bool mouseReleased(int x, int y, const KeyboardModifiers& modifiers);
    virtual bool mousePositionChanged(int x, int y, const KeyboardModifiers& modifiers);
    virtual bool wheelChanged(int x, int y, int dx, int dy, bool isHorizontal);
    virtual bool contextMenuEvent(int x, int y, int gx, int gy);
    virtual bool keyPressed(const KeyEvent& event);
    virtual bool keyReleased(const KeyEvent& event);
    virtual DragAction dragEnter(const MimeData& mimeData);
    virtual DragAction dragLeave();
    virtual DragAction dragMove(const MimeData& mimeData, int x, int y);
    virtual DragAction drop(const MimeData& mimeData, int x, int y);
    virtual bool panGesture(int dx, int dy);

    // Test helpers
    void simulateClick(IntPoint p, const KeyboardModifiers& modifiers = {});
    void simulateDrag(IntPoint from, IntPoint to, const KeyboardModifiers& modifiers = {});

    // Rendering
    /// Drop the cached composer and notify the nearest layer.
    void update();

    /// Shared composer for the current state, or null when some part of
    /// the subtree has nothing to show yet. Memoized until update().
    std::shared_ptr<BaseComposer> getComposer(ComposerCache& cache);

    /// Number of times this item's composers actually painted.
    int repaintCount() const { return m_repaintCounter->load(); }

protected:
    friend class CanvasItemComposition;
    friend class RootCanvasItem;

    /// Build a composer. Called without the item mutex held.
    virtual std::shared_ptr<BaseComposer> createComposer(ComposerCache& cache);

    /// Leaf paint routine for the default composer.
    virtual Painter makePainter(ComposerCache& cache);

    ComposerSnapshot makeSnapshot() const;

    /// Called by update() after the composer was dropped.
    virtual void updated();

    void invalidateComposer();
    void notifyContainer();
    void setFocusedState(bool focused);

    mutable std::mutex m_mutex;

private:
    // Written on the UI thread, read by repaint threads while publishing
    std::atomic<CanvasItemComposition*> m_container{nullptr};

    // Guarded by m_mutex
    Sizing m_sizing;
    std::optional<IntPoint> m_canvasOrigin;
    std::optional<IntSize> m_canvasSize;
    bool m_visible = true;
    std::optional<Color> m_backgroundColor;
    std::shared_ptr<BaseComposer> m_composer;
    uint64_t m_composerGeneration = 0;
    std::string m_name;

    // UI thread only
    bool m_enabled = true;
    bool m_focusable = false;
    bool m_focused = false;
    bool m_wantsMouseEvents = false;
    bool m_wantsDragEvents = false;
    CursorShape m_cursorShape = CursorShape::Arrow;
    std::string m_toolTip;
    std::atomic<bool> m_closed{false};

    std::shared_ptr<std::atomic<int>> m_repaintCounter;
    Event<IntPoint, IntSize> m_layoutUpdated;
    Event<bool> m_focusChanged;
};

/// A composite canvas item. Children are painted in insertion order and
/// hit-tested in reverse, so later children are in front.
class CanvasItemComposition : public AbstractCanvasItem {
public:
    CanvasItemComposition();

    void close() override;

    /// Replace the layout strategy. Defaults to OverlapLayout.
    void setLayout(std::shared_ptr<const CanvasLayout> layout);
    std::shared_ptr<const CanvasLayout> layout() const;

    std::vector<CanvasItemPtr> canvasItems() const;
    size_t canvasItemCount() const;
    CanvasItemPtr canvasItemAt(size_t index) const;
    std::optional<size_t> indexOf(const AbstractCanvasItem& item) const;
    std::optional<IntPoint> positionOf(const AbstractCanvasItem& item) const;

    /// Insert `item` before `index`. Throws std::logic_error when the item
    /// already has a container and std::out_of_range for a bad index or
    /// grid position.
    CanvasItemPtr insertCanvasItem(size_t index, CanvasItemPtr item,
                                   std::optional<IntPoint> position = std::nullopt);
    CanvasItemPtr addCanvasItem(CanvasItemPtr item, std::optional<IntPoint> position = std::nullopt);

    /// Remove and close `item`. Throws std::logic_error when not a child.
    void removeCanvasItem(const CanvasItemPtr& item);
    void removeAllCanvasItems();
    void replaceAllCanvasItems(const std::vector<CanvasItemPtr>& items);
    void replaceCanvasItem(const CanvasItemPtr& oldItem, CanvasItemPtr newItem);

    /// Fixed-size and stretch spacers sized for the current layout.
    CanvasItemPtr insertSpacing(size_t index, int spacing);
    CanvasItemPtr addSpacing(int spacing);
    CanvasItemPtr insertStretch(size_t index);
    CanvasItemPtr addStretch();

    Sizing layoutSizing() const override;
    void updateLayout(IntPoint origin, IntSize size) override;
    std::vector<CanvasItemPtr> itemsAtPoint(int x, int y) override;

    /// A child changed; propagate toward the nearest layer.
    virtual void childUpdated(AbstractCanvasItem& child);

protected:
    struct ChildSlot {
        CanvasItemPtr item;
        std::optional<IntPoint> position;
    };

    std::shared_ptr<BaseComposer> createComposer(ComposerCache& cache) override;

    /// Composer of this composite regardless of subclass overrides.
    std::shared_ptr<BaseComposer> createCompositionComposer(ComposerCache& cache);

    /// Optional foreground painted over the children.
    virtual Painter makeForegroundPainter(ComposerCache& cache);

    std::vector<ChildSlot> childSlots() const;
    std::vector<ChildSlot> visibleChildSlots() const;

    /// Layout inputs for the given children. Subclasses may substitute
    /// their own sizings.
    virtual std::vector<LayoutEntry> layoutEntries(const std::vector<ChildSlot>& slots) const;

    /// Child rects for a layout pass. Defaults to the layout strategy.
    virtual std::vector<IntRect> childRects(IntSize size, const std::vector<ChildSlot>& slots) const;

    /// Throws when `item` may not be inserted. Runs before any change.
    virtual void validateInsertion(const CanvasItemPtr& item) const;

    /// Hooks for subclasses that track children.
    virtual void canvasItemInserted(size_t index, const CanvasItemPtr& item);
    virtual void canvasItemRemoved(size_t index, const CanvasItemPtr& item);

private:
    // Guarded by m_mutex
    std::vector<ChildSlot> m_children;
    std::shared_ptr<const CanvasLayout> m_layout;
};

} // namespace trellis
