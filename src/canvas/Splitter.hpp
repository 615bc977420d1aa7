#pragma once

#include "canvas/CanvasItem.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace trellis {

/// Children side by side along one axis, separated by draggable
/// boundaries. Each child has a persisted sizing along the split axis that
/// is resolved by the solver; the child's own sizing applies to the other
/// axis only.
class SplitterCanvasItem : public CanvasItemComposition {
public:
    /// Vertical boundaries (children in a row) or horizontal boundaries
    /// (children in a column).
    enum class Orientation { Vertical, Horizontal };

    explicit SplitterCanvasItem(Orientation orientation = Orientation::Vertical);

    Orientation orientation() const { return m_orientation; }

    using CanvasItemComposition::addCanvasItem;
    using CanvasItemComposition::insertCanvasItem;

    /// Insert with a split sizing. Only the split-axis values are used; a
    /// missing minimum defaults to 10% of the splitter.
    CanvasItemPtr insertCanvasItem(size_t index, CanvasItemPtr item, const Sizing& splitSizing);
    CanvasItemPtr addCanvasItem(CanvasItemPtr item, const Sizing& splitSizing);

    /// Split sizings in child order.
    std::vector<Sizing> splitSizings() const;

    /// Fraction of the splitter occupied by each child, or empty before the
    /// first layout.
    std::vector<double> splits() const;
    /// Set each child's preferred fraction. Throws std::invalid_argument on
    /// a count mismatch.
    void setSplits(const std::vector<double>& splits);

    /// Boundary positions along the split axis, excluding the leading 0.
    std::vector<int> boundaries() const;

    bool isTracking() const { return m_trackingIndex.has_value(); }

    void setSnapTolerance(int tolerance) { m_snapTolerance = tolerance; }
    int snapTolerance() const { return m_snapTolerance; }
    void setHitTolerance(int tolerance) { m_hitTolerance = tolerance; }
    int hitTolerance() const { return m_hitTolerance; }

    /// Defaults applied to splitters created afterwards.
    static void setDefaultSnapTolerance(int tolerance);
    static void setDefaultHitTolerance(int tolerance);
    static int defaultSnapTolerance();
    static int defaultHitTolerance();

    Sizing layoutSizing() const override;
    void updateLayout(IntPoint origin, IntSize size) override;
    std::vector<CanvasItemPtr> itemsAtPoint(int x, int y) override;

    bool mousePressed(int x, int y, const KeyboardModifiers& modifiers) override;
    bool mouseReleased(int x, int y, const KeyboardModifiers& modifiers) override;
    bool mousePositionChanged(int x, int y, const KeyboardModifiers& modifiers) override;

protected:
    std::vector<LayoutEntry> layoutEntries(const std::vector<ChildSlot>& slots) const override;
    Painter makeForegroundPainter(ComposerCache& cache) override;
    void canvasItemInserted(size_t index, const CanvasItemPtr& item) override;
    void canvasItemRemoved(size_t index, const CanvasItemPtr& item) override;

private:
    int axisLength(IntSize size) const;
    int axisCoordinate(int x, int y) const;
    std::optional<SizingValue>& preferredOnAxis(Sizing& sizing) const;
    std::vector<size_t> visibleIndexes() const;
    /// Size per child along the split axis; only `visible` children share `length`.
    std::vector<int> solveSizes(const std::vector<Sizing>& sizings, const std::vector<size_t>& visible,
                                int length) const;
    std::vector<int> solveSizes(int length) const;
    std::optional<size_t> boundaryAt(int x, int y) const;
    /// Store each visible child's resolved size as its new fixed preference.
    void normalize(int length);

    const Orientation m_orientation;
    int m_snapTolerance;
    int m_hitTolerance;

    // Guarded by m_mutex
    std::vector<Sizing> m_splitSizings;
    std::optional<Sizing> m_pendingSplitSizing;

    // Drag state, UI thread only
    std::optional<size_t> m_trackingIndex;
    std::pair<size_t, size_t> m_trackingPair{0, 0};
    int m_trackingStart = 0;
    int m_trackingStartBoundary = 0;
    int m_trackingStartSize = 0;
    int m_trackingStartSizeNext = 0;
};

} // namespace trellis
