#include "canvas/ScrollArea.hpp"
#include "canvas/Composer.hpp"

#include <algorithm>
#include <atomic>
#include <stdexcept>

namespace trellis {

namespace {

std::atomic<int> s_wheelStep{1};

/// Clips to the viewport and paints the content at its scroll position.
class ScrollAreaComposer : public CompositionComposer {
public:
    ScrollAreaComposer(ComposerSnapshot snapshot, IntRect contentRect,
                       std::shared_ptr<BaseComposer> content)
        : CompositionComposer(std::move(snapshot), nullptr, {}, {std::move(content)})
        , m_contentRect(contentRect)
    {
    }

protected:
    std::vector<IntRect> childRects(const IntSize&) const override {
        return {m_contentRect};
    }

    bool paintContent(DrawingContext& dc, const IntSize& size, const IntRect& visibleRect) override {
        dc.save();
        dc.clipRect(IntRect({0, 0}, size));
        bool completed = paintChildren(dc, visibleRect);
        dc.restore();
        return completed && !dc.isCancelled();
    }

private:
    IntRect m_contentRect;
};

} // namespace

// ---------------------------------------------------------------------------
// ScrollAreaCanvasItem
// ---------------------------------------------------------------------------

void ScrollAreaCanvasItem::setWheelStep(int step) {
    s_wheelStep = std::max(step, 1);
}

int ScrollAreaCanvasItem::wheelStep() {
    return s_wheelStep.load();
}

CanvasItemPtr ScrollAreaCanvasItem::content() const {
    return canvasItemCount() > 0 ? canvasItemAt(0) : nullptr;
}

void ScrollAreaCanvasItem::setContent(CanvasItemPtr content) {
    removeAllCanvasItems();
    if (content) {
        addCanvasItem(std::move(content));
    }
}

void ScrollAreaCanvasItem::validateInsertion(const CanvasItemPtr&) const {
    if (canvasItemCount() > 0) {
        throw std::logic_error("ScrollAreaCanvasItem: a scroll area holds a single content item");
    }
}

void ScrollAreaCanvasItem::canvasItemInserted(size_t, const CanvasItemPtr& item) {
    std::weak_ptr<ScrollAreaCanvasItem> weakSelf =
        std::static_pointer_cast<ScrollAreaCanvasItem>(shared_from_this());
    m_contentListener = item->layoutUpdatedEvent().listen([weakSelf](IntPoint origin, IntSize size) {
        if (auto self = weakSelf.lock()) {
            self->contentLayoutUpdated(origin, size);
        }
    });
}

void ScrollAreaCanvasItem::canvasItemRemoved(size_t, const CanvasItemPtr& item) {
    item->layoutUpdatedEvent().unlisten(m_contentListener);
    m_contentListener = 0;
}

void ScrollAreaCanvasItem::setAutoResizeContents(bool autoResize) {
    if (m_autoResizeContents == autoResize) return;
    m_autoResizeContents = autoResize;
    refreshLayout();
    update();
}

IntPoint ScrollAreaCanvasItem::contentOffset() const {
    auto item = content();
    return item ? item->canvasOrigin().value_or(IntPoint{}) : IntPoint{};
}

IntSize ScrollAreaCanvasItem::scrollRange() const {
    auto item = content();
    auto viewport = canvasSize();
    if (!item || !viewport) return {};
    IntSize contentSize = item->canvasSize().value_or(IntSize{});
    return {std::max(contentSize.width - viewport->width, 0),
            std::max(contentSize.height - viewport->height, 0)};
}

IntPoint ScrollAreaCanvasItem::clampOffset(IntPoint offset, IntSize contentSize) const {
    IntSize viewport = canvasSize().value_or(IntSize{});
    int rangeX = std::max(contentSize.width - viewport.width, 0);
    int rangeY = std::max(contentSize.height - viewport.height, 0);
    return {std::clamp(offset.x, -rangeX, 0), std::clamp(offset.y, -rangeY, 0)};
}

void ScrollAreaCanvasItem::setContentOffset(IntPoint offset) {
    auto item = content();
    auto size = item ? item->canvasSize() : std::nullopt;
    if (!size) return;
    // The content's layout listener clamps and repaints
    item->updateLayout(clampOffset(offset, *size), *size);
}

void ScrollAreaCanvasItem::scrollBy(int dx, int dy) {
    setContentOffset(contentOffset() + IntPoint{dx, dy});
}

void ScrollAreaCanvasItem::contentLayoutUpdated(IntPoint origin, IntSize size) {
    if (!canvasSize()) return;
    IntPoint clamped = clampOffset(origin, size);
    if (clamped != origin) {
        // Re-enters with the clamped origin
        if (auto item = content()) {
            item->updateLayout(clamped, size);
        }
        return;
    }
    update();
    m_contentLayoutChanged.fire(origin, size);
}

void ScrollAreaCanvasItem::updateLayout(IntPoint origin, IntSize size) {
    AbstractCanvasItem::updateLayout(origin, size);

    auto item = content();
    if (!item) return;

    auto contentRect = item->canvasRect();
    if (!contentRect) {
        // First layout: the content's preferred size, or the viewport per axis
        Sizing s = item->layoutSizing();
        IntSize initial = size;
        if (s.preferredWidth && !s.preferredWidth->isFraction()) initial.width = s.preferredWidth->resolve(size.width);
        if (s.preferredHeight && !s.preferredHeight->isFraction()) initial.height = s.preferredHeight->resolve(size.height);
        item->updateLayout({0, 0}, initial);
    } else if (m_autoResizeContents) {
        item->updateLayout(contentRect->origin, size);
    } else {
        // The viewport changed; the valid scroll range may have too
        contentLayoutUpdated(contentRect->origin, contentRect->size);
    }
}

Sizing ScrollAreaCanvasItem::layoutSizing() const {
    // Content size does not propagate through a viewport
    return sizing();
}

std::vector<IntRect> ScrollAreaCanvasItem::childRects(IntSize, const std::vector<ChildSlot>& slots) const {
    std::vector<IntRect> rects;
    for (const auto& slot : slots) {
        rects.push_back(slot.item->canvasRect().value_or(IntRect{}));
    }
    return rects;
}

std::shared_ptr<BaseComposer> ScrollAreaCanvasItem::createComposer(ComposerCache& cache) {
    auto item = content();
    if (!item || !item->isVisible()) {
        return std::make_shared<BaseComposer>(makeSnapshot());
    }
    auto rect = item->canvasRect();
    auto child = item->getComposer(cache);
    if (!child || !rect) {
        return nullptr;
    }
    return std::make_shared<ScrollAreaComposer>(makeSnapshot(), *rect, std::move(child));
}

bool ScrollAreaCanvasItem::wheelChanged(int, int, int dx, int dy, bool isHorizontal) {
    IntPoint before = contentOffset();
    int step = wheelStep();
    if (isHorizontal) {
        scrollBy(dx * step, 0);
    } else {
        scrollBy(0, dy * step);
    }
    return contentOffset() != before;
}

bool ScrollAreaCanvasItem::panGesture(int dx, int dy) {
    IntPoint before = contentOffset();
    scrollBy(dx, dy);
    return contentOffset() != before;
}

// ---------------------------------------------------------------------------
// ScrollBarCanvasItem
// ---------------------------------------------------------------------------

ScrollBarCanvasItem::ScrollBarCanvasItem(std::shared_ptr<ScrollAreaCanvasItem> scrollArea)
    : m_scrollArea(scrollArea)
{
    setWantsMouseEvents(true);
    setSizing(Sizing().withFixedWidth(Width));
    if (scrollArea) {
        m_scrollListener = scrollArea->contentLayoutChangedEvent().listen([this](IntPoint, IntSize) {
            update();
        });
    }
}

ScrollBarCanvasItem::~ScrollBarCanvasItem() {
    detachFromScrollArea();
}

void ScrollBarCanvasItem::close() {
    detachFromScrollArea();
    AbstractCanvasItem::close();
}

void ScrollBarCanvasItem::detachFromScrollArea() {
    if (auto area = m_scrollArea.lock()) {
        area->contentLayoutChangedEvent().unlisten(m_scrollListener);
    }
    m_scrollArea.reset();
}

ScrollBarCanvasItem::PositionLength ScrollBarCanvasItem::thumbPositionAndLength(
    int canvasLength, int visibleLength, int contentLength, int contentOffset) {
    int scrollRange = std::max(contentLength - visibleLength, 0);
    if (contentLength <= visibleLength || scrollRange == 0) {
        return {};
    }
    contentOffset = std::clamp(contentOffset, -scrollRange, 0);

    int length = static_cast<int>(canvasLength * (static_cast<double>(visibleLength) / contentLength));
    length = std::max(length, MinimumThumbLength);
    int position = static_cast<int>((canvasLength - length) *
                                    (static_cast<double>(-contentOffset) / scrollRange));
    return {position, length};
}

int ScrollBarCanvasItem::adjustContentOffset(int canvasLength, int visibleLength, int contentLength,
                                             int contentOffset, int mouseOffset) {
    int scrollRange = std::max(contentLength - visibleLength, 0);
    auto thumb = thumbPositionAndLength(canvasLength, visibleLength, contentLength, contentOffset);
    int freeLength = canvasLength - thumb.length;
    if (freeLength <= 0) {
        return std::clamp(contentOffset, -scrollRange, 0);
    }
    int relative = static_cast<int>(scrollRange * static_cast<double>(mouseOffset) / freeLength);
    return std::clamp(contentOffset - relative, -scrollRange, 0);
}

IntRect ScrollBarCanvasItem::thumbRect() const {
    auto area = m_scrollArea.lock();
    auto size = canvasSize();
    if (!area || !size) return {};
    auto content = area->content();
    auto viewport = area->canvasSize();
    if (!content || !viewport) return {};

    IntSize contentSize = content->canvasSize().value_or(IntSize{});
    IntPoint offset = content->canvasOrigin().value_or(IntPoint{});
    auto thumb = thumbPositionAndLength(size->height, viewport->height, contentSize.height, offset.y);
    return IntRect(0, thumb.position, size->width, thumb.length);
}

bool ScrollBarCanvasItem::isTracking() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_tracking;
}

void ScrollBarCanvasItem::setTracking(bool tracking) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_tracking == tracking) return;
        m_tracking = tracking;
    }
    update();
}

void ScrollBarCanvasItem::pageBy(int pages) {
    auto area = m_scrollArea.lock();
    auto viewport = area ? area->canvasSize() : std::nullopt;
    if (!viewport) return;
    area->scrollBy(0, -viewport->height * pages);
}

bool ScrollBarCanvasItem::mousePressed(int x, int y, const KeyboardModifiers& modifiers) {
    auto area = m_scrollArea.lock();
    if (!area) return AbstractCanvasItem::mousePressed(x, y, modifiers);

    IntRect thumb = thumbRect();
    if (thumb.isEmpty()) {
        return AbstractCanvasItem::mousePressed(x, y, modifiers);
    }
    if (thumb.contains(x, y)) {
        m_trackingStart = {x, y};
        m_trackingContentOffset = area->contentOffset();
        setTracking(true);
        return true;
    }
    if (y < thumb.top()) {
        pageBy(-1);
        return true;
    }
    if (y >= thumb.bottom()) {
        pageBy(1);
        return true;
    }
    return AbstractCanvasItem::mousePressed(x, y, modifiers);
}

bool ScrollBarCanvasItem::mouseReleased(int x, int y, const KeyboardModifiers& modifiers) {
    setTracking(false);
    return AbstractCanvasItem::mouseReleased(x, y, modifiers);
}

bool ScrollBarCanvasItem::mousePositionChanged(int x, int y, const KeyboardModifiers& modifiers) {
    auto area = m_scrollArea.lock();
    auto size = canvasSize();
    if (isTracking() && area && size) {
        auto content = area->content();
        auto viewport = area->canvasSize();
        if (content && viewport) {
            int contentHeight = content->canvasSize().value_or(IntSize{}).height;
            int offsetY = adjustContentOffset(size->height, viewport->height, contentHeight,
                                              m_trackingContentOffset.y, y - m_trackingStart.y);
            area->setContentOffset({m_trackingContentOffset.x, offsetY});
            return true;
        }
    }
    return AbstractCanvasItem::mousePositionChanged(x, y, modifiers);
}

Painter ScrollBarCanvasItem::makePainter(ComposerCache&) {
    IntRect thumb = thumbRect();
    bool tracking = isTracking();
    return [thumb, tracking](DrawingContext& dc, const IntSize& size, const IntRect&) {
        dc.fillRect(IntRect({0, 0}, size), Color(248, 248, 248, 255));
        if (thumb.height() > 0) {
            dc.fillRect(IntRect(4, thumb.top() + 6, std::max(size.width - 8, 1), std::max(thumb.height() - 12, 1)),
                        tracking ? Color(136, 136, 136, 255) : Color(204, 204, 204, 255));
        }
        dc.line({0, 0}, {0, size.height}, Color(227, 227, 227, 255));
        dc.line({size.width - 1, 0}, {size.width - 1, size.height}, Color(153, 153, 153, 255));
    };
}

} // namespace trellis
