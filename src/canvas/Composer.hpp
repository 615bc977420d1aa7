#pragma once

#include "core/Geometry.hpp"
#include "layout/CanvasLayout.hpp"
#include "layout/Sizing.hpp"
#include "render/DrawingContext.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace trellis {

/// Paints a leaf in local coordinates. `visibleRect` is already clipped to
/// the item bounds. Runs on a repaint thread; it must only touch state it
/// captured when the composer was built.
using Painter = std::function<void(DrawingContext& dc, const IntSize& size, const IntRect& visibleRect)>;

/// Item state copied into a composer when it is built.
struct ComposerSnapshot {
    Sizing layoutSizing;
    std::optional<Color> backgroundColor;
    std::shared_ptr<std::atomic<int>> repaintCounter;
    std::string name;
};

/// Immutable snapshot of one canvas item, laid out and painted off the UI
/// thread. A composer is used by one repaint task at a time.
class BaseComposer {
public:
    explicit BaseComposer(ComposerSnapshot snapshot, Painter painter = {});
    virtual ~BaseComposer() = default;

    BaseComposer(const BaseComposer&) = delete;
    BaseComposer& operator=(const BaseComposer&) = delete;

    const Sizing& layoutSizing() const { return m_snapshot.layoutSizing; }
    const std::string& name() const { return m_snapshot.name; }

    /// Origin relative to the parent composer, once laid out.
    std::optional<IntPoint> origin() const { return m_origin; }
    std::optional<IntSize> size() const { return m_size; }
    std::optional<IntRect> rect() const;

    /// Assign the rect. Does nothing when the rect is unchanged; otherwise
    /// drops the cached output and lays out children.
    void updateLayout(IntPoint origin, IntSize size);

    /// Append this composer's output to `dc`, painting it first if there is
    /// no cached output or `visibleRect` changed. Coordinates are local.
    /// Returns false only when the pass was cancelled.
    bool repaint(DrawingContext& dc, const IntRect& visibleRect);

    bool hasCachedOutput() const { return m_output != nullptr; }

protected:
    virtual void layoutChildren(const IntSize& size);

    /// Record content into `dc`. Returns false when cancelled.
    virtual bool paintContent(DrawingContext& dc, const IntSize& size, const IntRect& visibleRect);

    /// Pass-through composers forward pre-rendered output and do not count
    /// as a repaint of the item.
    virtual bool countsRepaints() const { return true; }

private:
    ComposerSnapshot m_snapshot;
    Painter m_painter;
    std::optional<IntPoint> m_origin;
    std::optional<IntSize> m_size;
    std::shared_ptr<const DrawingContext> m_output;
    std::optional<IntRect> m_outputVisibleRect;
};

/// Composer of a composite item: lays out and paints child composers.
class CompositionComposer : public BaseComposer {
public:
    CompositionComposer(ComposerSnapshot snapshot,
                        std::shared_ptr<const CanvasLayout> layout,
                        std::vector<LayoutEntry> entries,
                        std::vector<std::shared_ptr<BaseComposer>> children,
                        Painter foreground = {});

    const std::vector<std::shared_ptr<BaseComposer>>& children() const { return m_children; }

protected:
    void layoutChildren(const IntSize& size) override;
    bool paintContent(DrawingContext& dc, const IntSize& size, const IntRect& visibleRect) override;

    /// Child rects for the given size. Defaults to the layout strategy.
    virtual std::vector<IntRect> childRects(const IntSize& size) const;

    bool paintChildren(DrawingContext& dc, const IntRect& visibleRect);

    std::shared_ptr<const CanvasLayout> m_layout;
    std::vector<LayoutEntry> m_entries;
    std::vector<std::shared_ptr<BaseComposer>> m_children;
    Painter m_foreground;
};

/// Forwards the finished output of another layer.
class PassthroughComposer : public BaseComposer {
public:
    PassthroughComposer(ComposerSnapshot snapshot, std::shared_ptr<const DrawingContext> output);

protected:
    bool paintContent(DrawingContext& dc, const IntSize& size, const IntRect& visibleRect) override;
    bool countsRepaints() const override { return false; }

private:
    std::shared_ptr<const DrawingContext> m_layerOutput;
};

} // namespace trellis
