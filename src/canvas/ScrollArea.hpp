#pragma once

#include "canvas/CanvasItem.hpp"

#include <memory>

namespace trellis {

/// Viewport onto a single content item. The scroll area positions the
/// content but only sizes it when it has no layout yet or when
/// autoResizeContents is set; afterwards the content may resize itself.
/// The content origin is kept within [-(content - viewport), 0] per axis.
class ScrollAreaCanvasItem : public CanvasItemComposition {
public:
    ScrollAreaCanvasItem() = default;

    CanvasItemPtr content() const;
    /// Replace the content, closing the previous one.
    void setContent(CanvasItemPtr content);

    bool autoResizeContents() const { return m_autoResizeContents; }
    void setAutoResizeContents(bool autoResize);

    /// Content origin relative to the viewport; zero or negative.
    IntPoint contentOffset() const;
    void setContentOffset(IntPoint offset);
    void scrollBy(int dx, int dy);

    /// Largest distance the content can move per axis.
    IntSize scrollRange() const;

    void updateLayout(IntPoint origin, IntSize size) override;
    Sizing layoutSizing() const override;

    bool wheelChanged(int x, int y, int dx, int dy, bool isHorizontal) override;
    bool panGesture(int dx, int dy) override;

    /// Fired after the content moved or was resized.
    Event<IntPoint, IntSize>& contentLayoutChangedEvent() { return m_contentLayoutChanged; }

    /// Units scrolled per wheel step, shared by all scroll areas.
    static void setWheelStep(int step);
    static int wheelStep();

protected:
    std::shared_ptr<BaseComposer> createComposer(ComposerCache& cache) override;
    std::vector<IntRect> childRects(IntSize size, const std::vector<ChildSlot>& slots) const override;
    void validateInsertion(const CanvasItemPtr& item) const override;
    void canvasItemInserted(size_t index, const CanvasItemPtr& item) override;
    void canvasItemRemoved(size_t index, const CanvasItemPtr& item) override;

private:
    IntPoint clampOffset(IntPoint offset, IntSize contentSize) const;
    void contentLayoutUpdated(IntPoint origin, IntSize size);

    bool m_autoResizeContents = false;
    ListenerId m_contentListener = 0;
    Event<IntPoint, IntSize> m_contentLayoutChanged;
};

/// Vertical scroll bar for a scroll area.
class ScrollBarCanvasItem : public AbstractCanvasItem {
public:
    static constexpr int MinimumThumbLength = 32;
    static constexpr int Width = 16;

    struct PositionLength {
        int position = 0;
        int length = 0;
    };

    explicit ScrollBarCanvasItem(std::shared_ptr<ScrollAreaCanvasItem> scrollArea);
    ~ScrollBarCanvasItem() override;

    void close() override;

    /// Thumb placement along a bar of `canvasLength`. The thumb is empty
    /// when all content is visible. `contentOffset` is zero or negative.
    static PositionLength thumbPositionAndLength(int canvasLength, int visibleLength,
                                                 int contentLength, int contentOffset);

    /// Content offset after dragging the thumb by `mouseOffset`.
    static int adjustContentOffset(int canvasLength, int visibleLength, int contentLength,
                                   int contentOffset, int mouseOffset);

    IntRect thumbRect() const;
    bool isTracking() const;

    bool mousePressed(int x, int y, const KeyboardModifiers& modifiers) override;
    bool mouseReleased(int x, int y, const KeyboardModifiers& modifiers) override;
    bool mousePositionChanged(int x, int y, const KeyboardModifiers& modifiers) override;

protected:
    Painter makePainter(ComposerCache& cache) override;

private:
    void setTracking(bool tracking);
    void pageBy(int pages);
    void detachFromScrollArea();

    std::weak_ptr<ScrollAreaCanvasItem> m_scrollArea;
    ListenerId m_scrollListener = 0;
    IntPoint m_trackingStart;
    IntPoint m_trackingContentOffset;
    // Guarded by m_mutex
    bool m_tracking = false;
};

} // namespace trellis
