#pragma once

#include "core/Geometry.hpp"
#include "layout/Sizing.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace trellis {

/// Cross-axis placement of row and column children.
enum class Alignment {
    Start,
    Center,
    End
};

/// What a layout needs to know about one visible child.
struct LayoutEntry {
    Sizing sizing;
    std::optional<IntPoint> position;   ///< Grid cell; ignored by other layouts
};

/// Base class for layout strategies. A layout turns a rect plus the
/// children's layout sizings into one rect per child, and computes the
/// aggregate sizing of a composite from the same inputs. Layouts are
/// immutable once built so composers can share them across threads.
class CanvasLayout {
public:
    explicit CanvasLayout(Margins margins = {}, int spacing = 0)
        : m_margins(margins), m_spacing(spacing) {}
    virtual ~CanvasLayout() = default;

    /// Child rects, relative to the composite, in entry order.
    virtual std::vector<IntRect> layout(IntPoint origin, IntSize size,
                                        const std::vector<LayoutEntry>& entries) const = 0;

    /// Sizing of the composite, including margins and spacing.
    virtual Sizing aggregateSizing(const std::vector<LayoutEntry>& entries) const = 0;

    /// Throws std::out_of_range when a child cannot be placed at `position`.
    virtual void validatePosition(const std::optional<IntPoint>& position) const;

    /// Sizing for a fixed spacer along the primary axis. Layouts without a
    /// primary axis return a fixed square.
    virtual Sizing spacingSizing(int spacing) const;

    /// Sizing for a spacer that absorbs free space along the primary axis.
    virtual Sizing stretchSizing() const;

    const Margins& margins() const { return m_margins; }
    int spacing() const { return m_spacing; }

protected:
    IntRect contentRect(IntPoint origin, IntSize size) const;

    /// Shrink `rect` to honor the sizing's aspect ratio bounds, centered.
    static IntRect fitAspectRatio(const IntRect& rect, const Sizing& sizing);

    /// Add margins and the total spacing to every value present.
    Sizing withMarginsAndSpacing(Sizing sizing, int xSpacing, int ySpacing) const;

    static Sizing overlapSizing(const std::vector<const Sizing*>& sizings);

    Margins m_margins;
    int m_spacing;
};

/// Every child gets the full content rect.
class OverlapLayout : public CanvasLayout {
public:
    using CanvasLayout::CanvasLayout;

    std::vector<IntRect> layout(IntPoint origin, IntSize size,
                                const std::vector<LayoutEntry>& entries) const override;
    Sizing aggregateSizing(const std::vector<LayoutEntry>& entries) const override;
};

/// Children are solved along one axis and aligned on the other.
class LinearLayout : public CanvasLayout {
public:
    enum class Axis { Horizontal, Vertical };

    LinearLayout(Axis axis, Margins margins, int spacing, Alignment alignment);

    std::vector<IntRect> layout(IntPoint origin, IntSize size,
                                const std::vector<LayoutEntry>& entries) const override;
    Sizing aggregateSizing(const std::vector<LayoutEntry>& entries) const override;
    Sizing spacingSizing(int spacing) const override;
    Sizing stretchSizing() const override;

    Axis axis() const { return m_axis; }
    Alignment alignment() const { return m_alignment; }

    /// Solver constraints along the primary axis, as used by layout().
    std::vector<Constraint> primaryConstraints(IntSize size, const std::vector<LayoutEntry>& entries) const;

private:
    Axis m_axis;
    Alignment m_alignment;
};

class RowLayout : public LinearLayout {
public:
    explicit RowLayout(Margins margins = {}, int spacing = 0, Alignment alignment = Alignment::Start)
        : LinearLayout(Axis::Horizontal, margins, spacing, alignment) {}
};

class ColumnLayout : public LinearLayout {
public:
    explicit ColumnLayout(Margins margins = {}, int spacing = 0, Alignment alignment = Alignment::Start)
        : LinearLayout(Axis::Vertical, margins, spacing, alignment) {}
};

/// Fixed number of columns and rows; children are placed by explicit
/// cell position. Empty cells still take part in solving.
class GridLayout : public CanvasLayout {
public:
    explicit GridLayout(IntSize gridSize, Margins margins = {}, int spacing = 0);

    std::vector<IntRect> layout(IntPoint origin, IntSize size,
                                const std::vector<LayoutEntry>& entries) const override;
    Sizing aggregateSizing(const std::vector<LayoutEntry>& entries) const override;
    void validatePosition(const std::optional<IntPoint>& position) const override;

    IntSize gridSize() const { return m_gridSize; }

private:
    std::vector<Sizing> columnSizings(const std::vector<LayoutEntry>& entries) const;
    std::vector<Sizing> rowSizings(const std::vector<LayoutEntry>& entries) const;

    IntSize m_gridSize;
};

} // namespace trellis
