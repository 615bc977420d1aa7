#include "canvas/Splitter.hpp"
#include "core/Log.hpp"
#include "layout/Solver.hpp"

#include <atomic>
#include <cstdlib>
#include <stdexcept>

namespace trellis {

namespace {

std::atomic<int> s_defaultSnapTolerance{12};
std::atomic<int> s_defaultHitTolerance{6};

const Color BoundaryColor(102, 102, 102, 255);

} // namespace

void SplitterCanvasItem::setDefaultSnapTolerance(int tolerance) { s_defaultSnapTolerance = tolerance; }
void SplitterCanvasItem::setDefaultHitTolerance(int tolerance) { s_defaultHitTolerance = tolerance; }
int SplitterCanvasItem::defaultSnapTolerance() { return s_defaultSnapTolerance.load(); }
int SplitterCanvasItem::defaultHitTolerance() { return s_defaultHitTolerance.load(); }

SplitterCanvasItem::SplitterCanvasItem(Orientation orientation)
    : m_orientation(orientation)
    , m_snapTolerance(s_defaultSnapTolerance.load())
    , m_hitTolerance(s_defaultHitTolerance.load())
{
    setWantsMouseEvents(true);
    if (orientation == Orientation::Horizontal) {
        setLayout(std::make_shared<ColumnLayout>());
    } else {
        setLayout(std::make_shared<RowLayout>());
    }
}

int SplitterCanvasItem::axisLength(IntSize size) const {
    return m_orientation == Orientation::Horizontal ? size.height : size.width;
}

int SplitterCanvasItem::axisCoordinate(int x, int y) const {
    return m_orientation == Orientation::Horizontal ? y : x;
}

std::optional<SizingValue>& SplitterCanvasItem::preferredOnAxis(Sizing& sizing) const {
    return m_orientation == Orientation::Horizontal ? sizing.preferredHeight : sizing.preferredWidth;
}

CanvasItemPtr SplitterCanvasItem::insertCanvasItem(size_t index, CanvasItemPtr item, const Sizing& splitSizing) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_pendingSplitSizing = splitSizing;
    }
    return CanvasItemComposition::insertCanvasItem(index, std::move(item));
}

CanvasItemPtr SplitterCanvasItem::addCanvasItem(CanvasItemPtr item, const Sizing& splitSizing) {
    return insertCanvasItem(canvasItemCount(), std::move(item), splitSizing);
}

void SplitterCanvasItem::canvasItemInserted(size_t index, const CanvasItemPtr&) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Sizing sizing = m_pendingSplitSizing.value_or(Sizing());
    m_pendingSplitSizing.reset();

    preferredOnAxis(sizing).reset();
    if (m_orientation == Orientation::Horizontal) {
        if (!sizing.minimumHeight) sizing.minimumHeight = SizingValue::fraction(0.1);
    } else {
        if (!sizing.minimumWidth) sizing.minimumWidth = SizingValue::fraction(0.1);
    }
    m_splitSizings.insert(m_splitSizings.begin() + static_cast<std::ptrdiff_t>(index), sizing);
}

void SplitterCanvasItem::canvasItemRemoved(size_t index, const CanvasItemPtr&) {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (index < m_splitSizings.size()) {
        m_splitSizings.erase(m_splitSizings.begin() + static_cast<std::ptrdiff_t>(index));
    }
}

std::vector<Sizing> SplitterCanvasItem::splitSizings() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_splitSizings;
}

std::vector<size_t> SplitterCanvasItem::visibleIndexes() const {
    std::vector<size_t> result;
    auto items = canvasItems();
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i]->isVisible()) result.push_back(i);
    }
    return result;
}

std::vector<int> SplitterCanvasItem::solveSizes(const std::vector<Sizing>& sizings, const std::vector<size_t>& visible,
                                                int length) const {
    std::vector<size_t> solvedIndexes;
    std::vector<Constraint> constraints;
    for (size_t index : visible) {
        if (index >= sizings.size()) continue;
        const Sizing& sizing = sizings[index];
        solvedIndexes.push_back(index);
        constraints.push_back(m_orientation == Orientation::Horizontal ? sizing.heightConstraint(length)
                                                                      : sizing.widthConstraint(length));
    }
    auto solved = Solver::solve(0, length, constraints).sizes;

    // Hidden children take no space
    std::vector<int> sizes(sizings.size(), 0);
    for (size_t k = 0; k < solved.size() && k < solvedIndexes.size(); ++k) {
        sizes[solvedIndexes[k]] = solved[k];
    }
    return sizes;
}

std::vector<int> SplitterCanvasItem::solveSizes(int length) const {
    return solveSizes(splitSizings(), visibleIndexes(), length);
}

std::vector<int> SplitterCanvasItem::boundaries() const {
    auto size = canvasSize();
    if (!size) return {};
    auto visible = visibleIndexes();
    auto sizes = solveSizes(splitSizings(), visible, axisLength(*size));
    std::vector<int> result;
    int position = 0;
    for (size_t k = 0; k + 1 < visible.size() && visible[k] < sizes.size(); ++k) {
        position += sizes[visible[k]];
        result.push_back(position);
    }
    return result;
}

std::vector<double> SplitterCanvasItem::splits() const {
    auto size = canvasSize();
    if (!size || axisLength(*size) <= 0) return {};
    int length = axisLength(*size);
    std::vector<double> result;
    for (int s : solveSizes(length)) {
        result.push_back(static_cast<double>(s) / length);
    }
    return result;
}

void SplitterCanvasItem::setSplits(const std::vector<double>& splits) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (splits.size() != m_splitSizings.size()) {
            throw std::invalid_argument("SplitterCanvasItem: expected " + std::to_string(m_splitSizings.size()) +
                                        " splits, got " + std::to_string(splits.size()));
        }
        for (size_t i = 0; i < splits.size(); ++i) {
            preferredOnAxis(m_splitSizings[i]) = SizingValue::fraction(splits[i]);
        }
    }
    refreshLayout();
    update();
}

void SplitterCanvasItem::normalize(int length) {
    auto visible = visibleIndexes();
    std::lock_guard<std::mutex> lock(m_mutex);
    auto sizes = solveSizes(m_splitSizings, visible, length);
    for (size_t index : visible) {
        if (index < m_splitSizings.size()) {
            preferredOnAxis(m_splitSizings[index]) = SizingValue::absolute(sizes[index]);
        }
    }
}

Sizing SplitterCanvasItem::layoutSizing() const {
    return sizing();
}

void SplitterCanvasItem::updateLayout(IntPoint origin, IntSize size) {
    // Persist the resolved sizes so later drags start from what is shown
    normalize(axisLength(size));
    CanvasItemComposition::updateLayout(origin, size);
}

std::vector<LayoutEntry> SplitterCanvasItem::layoutEntries(const std::vector<ChildSlot>& slots) const {
    auto entries = CanvasItemComposition::layoutEntries(slots);
    auto size = canvasSize();
    if (!size) return entries;

    std::vector<std::optional<size_t>> indexes;
    indexes.reserve(slots.size());
    for (const auto& slot : slots) {
        indexes.push_back(indexOf(*slot.item));
    }
    auto sizes = solveSizes(axisLength(*size));

    for (size_t i = 0; i < entries.size(); ++i) {
        if (!indexes[i] || *indexes[i] >= sizes.size()) continue;
        int fixed = sizes[*indexes[i]];
        if (m_orientation == Orientation::Horizontal) {
            entries[i].sizing.setFixedHeight(fixed);
        } else {
            entries[i].sizing.setFixedWidth(fixed);
        }
    }
    return entries;
}

std::optional<size_t> SplitterCanvasItem::boundaryAt(int x, int y) const {
    int coordinate = axisCoordinate(x, y);
    auto positions = boundaries();
    for (size_t i = 0; i < positions.size(); ++i) {
        if (std::abs(coordinate - positions[i]) < m_hitTolerance) {
            return i;
        }
    }
    return std::nullopt;
}

std::vector<CanvasItemPtr> SplitterCanvasItem::itemsAtPoint(int x, int y) {
    auto bounds = canvasBounds();
    if (isVisible() && bounds && bounds->contains(x, y) && boundaryAt(x, y)) {
        return {shared_from_this()};
    }
    return CanvasItemComposition::itemsAtPoint(x, y);
}

bool SplitterCanvasItem::mousePressed(int x, int y, const KeyboardModifiers& modifiers) {
    auto index = boundaryAt(x, y);
    auto size = canvasSize();
    if (!index || !size) {
        return CanvasItemComposition::mousePressed(x, y, modifiers);
    }

    auto visible = visibleIndexes();
    auto sizes = solveSizes(splitSizings(), visible, axisLength(*size));
    if (*index + 1 >= visible.size() || visible[*index + 1] >= sizes.size()) {
        return CanvasItemComposition::mousePressed(x, y, modifiers);
    }
    m_trackingIndex = index;
    m_trackingPair = {visible[*index], visible[*index + 1]};
    m_trackingStart = axisCoordinate(x, y);
    m_trackingStartBoundary = boundaries()[*index];
    m_trackingStartSize = sizes[m_trackingPair.first];
    m_trackingStartSizeNext = sizes[m_trackingPair.second];
    LOG_TRACE("{}: dragging boundary {}", name(), *index);
    return true;
}

bool SplitterCanvasItem::mouseReleased(int x, int y, const KeyboardModifiers& modifiers) {
    if (!m_trackingIndex) {
        return CanvasItemComposition::mouseReleased(x, y, modifiers);
    }
    m_trackingIndex.reset();
    if (auto size = canvasSize()) {
        normalize(axisLength(*size));
    }
    update();
    return true;
}

bool SplitterCanvasItem::mousePositionChanged(int x, int y, const KeyboardModifiers& modifiers) {
    auto size = canvasSize();
    if (!m_trackingIndex || !size) {
        setCursorShape(boundaryAt(x, y) ? (m_orientation == Orientation::Horizontal ? CursorShape::SplitVertical
                                                                                   : CursorShape::SplitHorizontal)
                                        : CursorShape::Arrow);
        return CanvasItemComposition::mousePositionChanged(x, y, modifiers);
    }

    int length = axisLength(*size);
    int offset = axisCoordinate(x, y) - m_trackingStart;
    if (!modifiers.shift) {
        int boundary = m_trackingStartBoundary + offset;
        for (int snap : {length / 3, length / 2, 2 * length / 3}) {
            if (std::abs(boundary - snap) <= m_snapTolerance) {
                offset = snap - m_trackingStartBoundary;
                break;
            }
        }
    }

    auto [first, second] = m_trackingPair;
    auto visible = visibleIndexes();
    std::vector<Sizing> saved;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (second >= m_splitSizings.size()) return true;
        saved = m_splitSizings;
        preferredOnAxis(m_splitSizings[first]) = SizingValue::absolute(m_trackingStartSize + offset);
        preferredOnAxis(m_splitSizings[second]) = SizingValue::absolute(m_trackingStartSizeNext - offset);
        // Only the pair moves; every other child keeps its current size
        auto current = solveSizes(saved, visible, length);
        for (size_t i = 0; i < m_splitSizings.size(); ++i) {
            if (i == first || i == second) continue;
            if (m_orientation == Orientation::Horizontal) {
                m_splitSizings[i].setFixedHeight(current[i]);
            } else {
                m_splitSizings[i].setFixedWidth(current[i]);
            }
        }
    }

    refreshLayout();

    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (size_t i = 0; i < m_splitSizings.size() && i < saved.size(); ++i) {
            if (i == first || i == second) continue;
            m_splitSizings[i] = saved[i];
        }
    }
    update();
    return true;
}

Painter SplitterCanvasItem::makeForegroundPainter(ComposerCache&) {
    bool horizontal = m_orientation == Orientation::Horizontal;
    std::vector<int> sizes;
    if (auto size = canvasSize()) {
        auto visible = visibleIndexes();
        auto all = solveSizes(splitSizings(), visible, axisLength(*size));
        for (size_t index : visible) {
            if (index < all.size()) sizes.push_back(all[index]);
        }
    }
    return [sizes, horizontal](DrawingContext& dc, const IntSize& size, const IntRect&) {
        int position = 0;
        for (size_t i = 0; i + 1 < sizes.size(); ++i) {
            position += sizes[i];
            if (horizontal) {
                dc.line({0, position}, {size.width, position}, BoundaryColor);
            } else {
                dc.line({position, 0}, {position, size.height}, BoundaryColor);
            }
        }
    };
}

} // namespace trellis
