#include "layout/CanvasLayout.hpp"
#include "layout/Solver.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

namespace trellis {

namespace {

using Aggregate = std::optional<int64_t>;

// Fractions depend on space the composite does not know yet, so they do not
// contribute to aggregate sizing.
Aggregate absoluteValue(const std::optional<SizingValue>& v) {
    if (!v || v->isFraction()) return std::nullopt;
    return static_cast<int64_t>(v->value());
}

// Fold one child value into the running aggregate. With clearIfMissing a
// single missing child value clears the aggregate for good.
void combine(Aggregate& value, const Aggregate& child,
             const std::function<int64_t(int64_t, int64_t)>& op,
             bool clearIfMissing = false) {
    if (child) {
        if (value) {
            value = op(*value, *child);
        } else if (!clearIfMissing) {
            value = child;
        }
    } else if (clearIfMissing) {
        value.reset();
    }
}

int64_t maxOp(int64_t a, int64_t b) { return std::max(a, b); }
int64_t minOp(int64_t a, int64_t b) { return std::min(a, b); }
int64_t addOp(int64_t a, int64_t b) { return a + b; }

std::optional<SizingValue> toValue(const Aggregate& v) {
    if (!v) return std::nullopt;
    return SizingValue(static_cast<int>(std::min<int64_t>(*v, Constraint::Unbounded)));
}

// An aggregate maximum at or beyond Unbounded means "no maximum".
std::optional<SizingValue> toMaximum(const Aggregate& v, bool empty) {
    if (!v || empty || *v >= Constraint::Unbounded) return std::nullopt;
    return toValue(v);
}

std::optional<SizingValue> addTo(const std::optional<SizingValue>& v, int amount) {
    if (!v || v->isFraction()) return v;
    return SizingValue(static_cast<int>(
        std::min<int64_t>(static_cast<int64_t>(v->value()) + amount, Constraint::Unbounded)));
}

} // namespace

// ---------------------------------------------------------------------------
// CanvasLayout
// ---------------------------------------------------------------------------

void CanvasLayout::validatePosition(const std::optional<IntPoint>&) const {
}

Sizing CanvasLayout::spacingSizing(int spacing) const {
    return Sizing().withFixedSize({spacing, spacing});
}

Sizing CanvasLayout::stretchSizing() const {
    return Sizing();
}

IntRect CanvasLayout::contentRect(IntPoint origin, IntSize size) const {
    return {origin.x + m_margins.left,
            origin.y + m_margins.top,
            std::max(0, size.width - m_margins.horizontal()),
            std::max(0, size.height - m_margins.vertical())};
}

IntRect CanvasLayout::fitAspectRatio(const IntRect& rect, const Sizing& sizing) {
    if (rect.isEmpty()) return rect;

    double aspect = static_cast<double>(rect.width()) / rect.height();
    std::optional<double> target;
    if (sizing.minimumAspectRatio && aspect < *sizing.minimumAspectRatio) {
        target = sizing.minimumAspectRatio;
    } else if (sizing.maximumAspectRatio && aspect > *sizing.maximumAspectRatio) {
        target = sizing.maximumAspectRatio;
    } else if (sizing.preferredAspectRatio) {
        target = sizing.preferredAspectRatio;
    }
    if (!target || *target <= 0.0) return rect;

    if (aspect > *target) {
        int width = static_cast<int>(rect.height() * *target);
        return {rect.left() + (rect.width() - width) / 2, rect.top(), width, rect.height()};
    }
    int height = static_cast<int>(rect.width() / *target);
    return {rect.left(), rect.top() + (rect.height() - height) / 2, rect.width(), height};
}

Sizing CanvasLayout::withMarginsAndSpacing(Sizing sizing, int xSpacing, int ySpacing) const {
    int dx = m_margins.horizontal() + xSpacing;
    int dy = m_margins.vertical() + ySpacing;
    sizing.minimumWidth = addTo(sizing.minimumWidth, dx);
    sizing.maximumWidth = addTo(sizing.maximumWidth, dx);
    sizing.preferredWidth = addTo(sizing.preferredWidth, dx);
    sizing.minimumHeight = addTo(sizing.minimumHeight, dy);
    sizing.maximumHeight = addTo(sizing.maximumHeight, dy);
    sizing.preferredHeight = addTo(sizing.preferredHeight, dy);
    return sizing;
}

Sizing CanvasLayout::overlapSizing(const std::vector<const Sizing*>& sizings) {
    Aggregate preferredWidth, preferredHeight, minimumWidth, minimumHeight;
    Aggregate maximumWidth = Constraint::Unbounded;
    Aggregate maximumHeight = Constraint::Unbounded;
    bool empty = true;

    for (const Sizing* s : sizings) {
        if (!s) continue;
        empty = false;
        combine(preferredWidth, absoluteValue(s->preferredWidth), maxOp);
        combine(preferredHeight, absoluteValue(s->preferredHeight), maxOp);
        combine(minimumWidth, absoluteValue(s->minimumWidth), maxOp);
        combine(minimumHeight, absoluteValue(s->minimumHeight), maxOp);
        combine(maximumWidth, absoluteValue(s->maximumWidth), minOp, true);
        combine(maximumHeight, absoluteValue(s->maximumHeight), minOp, true);
    }

    Sizing sizing;
    sizing.preferredWidth = toValue(preferredWidth);
    sizing.preferredHeight = toValue(preferredHeight);
    sizing.minimumWidth = toValue(minimumWidth);
    sizing.minimumHeight = toValue(minimumHeight);
    sizing.maximumWidth = toMaximum(maximumWidth, empty);
    sizing.maximumHeight = toMaximum(maximumHeight, empty);
    return sizing;
}

// ---------------------------------------------------------------------------
// OverlapLayout
// ---------------------------------------------------------------------------

std::vector<IntRect> OverlapLayout::layout(IntPoint origin, IntSize size,
                                           const std::vector<LayoutEntry>& entries) const {
    IntRect content = contentRect(origin, size);
    std::vector<IntRect> rects;
    rects.reserve(entries.size());
    for (const auto& entry : entries) {
        rects.push_back(fitAspectRatio(content, entry.sizing));
    }
    return rects;
}

Sizing OverlapLayout::aggregateSizing(const std::vector<LayoutEntry>& entries) const {
    std::vector<const Sizing*> sizings;
    sizings.reserve(entries.size());
    for (const auto& entry : entries) sizings.push_back(&entry.sizing);
    return withMarginsAndSpacing(overlapSizing(sizings), 0, 0);
}

// ---------------------------------------------------------------------------
// LinearLayout
// ---------------------------------------------------------------------------

LinearLayout::LinearLayout(Axis axis, Margins margins, int spacing, Alignment alignment)
    : CanvasLayout(margins, spacing)
    , m_axis(axis)
    , m_alignment(alignment)
{
}

std::vector<Constraint> LinearLayout::primaryConstraints(IntSize size,
                                                         const std::vector<LayoutEntry>& entries) const {
    IntRect content = contentRect({0, 0}, size);
    int spacingTotal = m_spacing * std::max(0, static_cast<int>(entries.size()) - 1);
    bool horizontal = m_axis == Axis::Horizontal;
    int available = (horizontal ? content.width() : content.height()) - spacingTotal;

    std::vector<Constraint> constraints;
    constraints.reserve(entries.size());
    for (const auto& entry : entries) {
        constraints.push_back(horizontal ? entry.sizing.widthConstraint(available)
                                         : entry.sizing.heightConstraint(available));
    }
    return constraints;
}

std::vector<IntRect> LinearLayout::layout(IntPoint origin, IntSize size,
                                          const std::vector<LayoutEntry>& entries) const {
    std::vector<IntRect> rects;
    if (entries.empty()) return rects;

    IntRect content = contentRect(origin, size);
    bool horizontal = m_axis == Axis::Horizontal;
    int spacingTotal = m_spacing * (static_cast<int>(entries.size()) - 1);
    int primaryStart = horizontal ? content.left() : content.top();
    int primaryAvailable = (horizontal ? content.width() : content.height()) - spacingTotal;
    int crossStart = horizontal ? content.top() : content.left();
    int crossAvailable = horizontal ? content.height() : content.width();

    SolverResult solved = Solver::solve(primaryStart, primaryAvailable,
                                        primaryConstraints(size, entries), m_spacing);

    rects.reserve(entries.size());
    for (size_t i = 0; i < entries.size(); ++i) {
        const Sizing& sizing = entries[i].sizing;
        Constraint cross = horizontal ? sizing.heightConstraint(crossAvailable)
                                      : sizing.widthConstraint(crossAvailable);
        int extent = crossAvailable;
        if (cross.maximum != Constraint::Unbounded) {
            extent = std::clamp(cross.maximum, 0, crossAvailable);
        }

        int offset = 0;
        if (m_alignment == Alignment::Center) {
            offset = (crossAvailable - extent) / 2;
        } else if (m_alignment == Alignment::End) {
            offset = crossAvailable - extent;
        }

        IntRect rect = horizontal
            ? IntRect(solved.origins[i], crossStart + offset, solved.sizes[i], extent)
            : IntRect(crossStart + offset, solved.origins[i], extent, solved.sizes[i]);
        rects.push_back(fitAspectRatio(rect, sizing));
    }
    return rects;
}

Sizing LinearLayout::aggregateSizing(const std::vector<LayoutEntry>& entries) const {
    bool horizontal = m_axis == Axis::Horizontal;

    Aggregate primaryPreferred, primaryMinimum;
    Aggregate primaryMaximum = 0;
    Aggregate crossPreferred, crossMinimum;
    Aggregate crossMaximum = Constraint::Unbounded;

    for (const auto& entry : entries) {
        const Sizing& s = entry.sizing;
        const auto& pPref = horizontal ? s.preferredWidth : s.preferredHeight;
        const auto& pMin = horizontal ? s.minimumWidth : s.minimumHeight;
        const auto& pMax = horizontal ? s.maximumWidth : s.maximumHeight;
        const auto& cPref = horizontal ? s.preferredHeight : s.preferredWidth;
        const auto& cMin = horizontal ? s.minimumHeight : s.minimumWidth;
        const auto& cMax = horizontal ? s.maximumHeight : s.maximumWidth;

        combine(primaryPreferred, absoluteValue(pPref), addOp);
        combine(primaryMinimum, absoluteValue(pMin), addOp);
        combine(primaryMaximum, absoluteValue(pMax), addOp, true);
        combine(crossPreferred, absoluteValue(cPref), maxOp);
        combine(crossMinimum, absoluteValue(cMin), maxOp);
        combine(crossMaximum, absoluteValue(cMax), minOp, true);
    }

    bool empty = entries.empty();
    Sizing sizing;
    auto& pPref = horizontal ? sizing.preferredWidth : sizing.preferredHeight;
    auto& pMin = horizontal ? sizing.minimumWidth : sizing.minimumHeight;
    auto& pMax = horizontal ? sizing.maximumWidth : sizing.maximumHeight;
    auto& cPref = horizontal ? sizing.preferredHeight : sizing.preferredWidth;
    auto& cMin = horizontal ? sizing.minimumHeight : sizing.minimumWidth;
    auto& cMax = horizontal ? sizing.maximumHeight : sizing.maximumWidth;
    pPref = toValue(primaryPreferred);
    pMin = toValue(primaryMinimum);
    pMax = toMaximum(primaryMaximum, empty);
    cPref = toValue(crossPreferred);
    cMin = toValue(crossMinimum);
    cMax = toMaximum(crossMaximum, false);

    int spacingTotal = m_spacing * std::max(0, static_cast<int>(entries.size()) - 1);
    return horizontal ? withMarginsAndSpacing(sizing, spacingTotal, 0)
                      : withMarginsAndSpacing(sizing, 0, spacingTotal);
}

Sizing LinearLayout::spacingSizing(int spacing) const {
    Sizing sizing;
    if (m_axis == Axis::Horizontal) {
        sizing.minimumWidth = spacing;
        sizing.maximumWidth = spacing;
    } else {
        sizing.minimumHeight = spacing;
        sizing.maximumHeight = spacing;
    }
    return sizing;
}

Sizing LinearLayout::stretchSizing() const {
    // Zero extent across the axis so the stretch never widens the composite.
    Sizing sizing;
    if (m_axis == Axis::Horizontal) {
        sizing.minimumHeight = 0;
        sizing.maximumHeight = 0;
    } else {
        sizing.minimumWidth = 0;
        sizing.maximumWidth = 0;
    }
    return sizing;
}

// ---------------------------------------------------------------------------
// GridLayout
// ---------------------------------------------------------------------------

GridLayout::GridLayout(IntSize gridSize, Margins margins, int spacing)
    : CanvasLayout(margins, spacing)
    , m_gridSize(gridSize)
{
    if (gridSize.width <= 0 || gridSize.height <= 0) {
        throw std::invalid_argument("GridLayout: grid size must be positive");
    }
}

void GridLayout::validatePosition(const std::optional<IntPoint>& position) const {
    if (!position) {
        throw std::out_of_range("GridLayout: items require a cell position");
    }
    if (position->x < 0 || position->x >= m_gridSize.width ||
        position->y < 0 || position->y >= m_gridSize.height) {
        throw std::out_of_range("GridLayout: cell (" + std::to_string(position->x) + ", " +
                                std::to_string(position->y) + ") is outside the grid");
    }
}

std::vector<Sizing> GridLayout::columnSizings(const std::vector<LayoutEntry>& entries) const {
    std::vector<Sizing> result;
    for (int x = 0; x < m_gridSize.width; ++x) {
        std::vector<const Sizing*> cells;
        for (const auto& entry : entries) {
            if (entry.position && entry.position->x == x) cells.push_back(&entry.sizing);
        }
        result.push_back(overlapSizing(cells));
    }
    return result;
}

std::vector<Sizing> GridLayout::rowSizings(const std::vector<LayoutEntry>& entries) const {
    std::vector<Sizing> result;
    for (int y = 0; y < m_gridSize.height; ++y) {
        std::vector<const Sizing*> cells;
        for (const auto& entry : entries) {
            if (entry.position && entry.position->y == y) cells.push_back(&entry.sizing);
        }
        result.push_back(overlapSizing(cells));
    }
    return result;
}

std::vector<IntRect> GridLayout::layout(IntPoint origin, IntSize size,
                                        const std::vector<LayoutEntry>& entries) const {
    IntRect content = contentRect(origin, size);

    int contentWidth = content.width() - m_spacing * (m_gridSize.width - 1);
    std::vector<Constraint> widthConstraints;
    for (const auto& sizing : columnSizings(entries)) {
        widthConstraints.push_back(sizing.widthConstraint(contentWidth));
    }
    SolverResult columns = Solver::solve(content.left(), contentWidth, widthConstraints, m_spacing);

    int contentHeight = content.height() - m_spacing * (m_gridSize.height - 1);
    std::vector<Constraint> heightConstraints;
    for (const auto& sizing : rowSizings(entries)) {
        heightConstraints.push_back(sizing.heightConstraint(contentHeight));
    }
    SolverResult rows = Solver::solve(content.top(), contentHeight, heightConstraints, m_spacing);

    std::vector<IntRect> rects;
    rects.reserve(entries.size());
    for (const auto& entry : entries) {
        validatePosition(entry.position);
        int x = entry.position->x;
        int y = entry.position->y;
        IntRect cell(columns.origins[x], rows.origins[y], columns.sizes[x], rows.sizes[y]);
        rects.push_back(fitAspectRatio(cell, entry.sizing));
    }
    return rects;
}

Sizing GridLayout::aggregateSizing(const std::vector<LayoutEntry>& entries) const {
    Aggregate preferredWidth, minimumWidth;
    Aggregate maximumWidth = 0;
    for (const auto& column : columnSizings(entries)) {
        combine(preferredWidth, absoluteValue(column.preferredWidth), addOp);
        combine(minimumWidth, absoluteValue(column.minimumWidth), addOp);
        combine(maximumWidth, absoluteValue(column.maximumWidth), addOp, true);
    }

    Aggregate preferredHeight, minimumHeight;
    Aggregate maximumHeight = 0;
    for (const auto& row : rowSizings(entries)) {
        combine(preferredHeight, absoluteValue(row.preferredHeight), addOp);
        combine(minimumHeight, absoluteValue(row.minimumHeight), addOp);
        combine(maximumHeight, absoluteValue(row.maximumHeight), addOp, true);
    }

    Sizing sizing;
    sizing.preferredWidth = toValue(preferredWidth);
    sizing.minimumWidth = toValue(minimumWidth);
    sizing.maximumWidth = toMaximum(maximumWidth, false);
    sizing.preferredHeight = toValue(preferredHeight);
    sizing.minimumHeight = toValue(minimumHeight);
    sizing.maximumHeight = toMaximum(maximumHeight, false);
    return withMarginsAndSpacing(sizing,
                                 m_spacing * (m_gridSize.width - 1),
                                 m_spacing * (m_gridSize.height - 1));
}

} // namespace trellis
