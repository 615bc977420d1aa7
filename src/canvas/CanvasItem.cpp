#include "canvas/CanvasItem.hpp"
#include "canvas/LayerCanvasItem.hpp"
#include "canvas/RootCanvasItem.hpp"
#include "canvas/Widgets.hpp"
#include "core/Log.hpp"

#include <algorithm>
#include <stdexcept>

namespace trellis {

namespace {

// Values set on the item itself take precedence over the aggregate.
Sizing overrideWith(Sizing base, const Sizing& own) {
    if (own.minimumWidth) base.minimumWidth = own.minimumWidth;
    if (own.maximumWidth) base.maximumWidth = own.maximumWidth;
    if (own.preferredWidth) base.preferredWidth = own.preferredWidth;
    if (own.minimumHeight) base.minimumHeight = own.minimumHeight;
    if (own.maximumHeight) base.maximumHeight = own.maximumHeight;
    if (own.preferredHeight) base.preferredHeight = own.preferredHeight;
    if (own.minimumAspectRatio) base.minimumAspectRatio = own.minimumAspectRatio;
    if (own.maximumAspectRatio) base.maximumAspectRatio = own.maximumAspectRatio;
    if (own.preferredAspectRatio) base.preferredAspectRatio = own.preferredAspectRatio;
    base.collapsible = own.collapsible;
    return base;
}

} // namespace

// ---------------------------------------------------------------------------
// AbstractCanvasItem
// ---------------------------------------------------------------------------

AbstractCanvasItem::AbstractCanvasItem()
    : m_repaintCounter(std::make_shared<std::atomic<int>>(0))
{
}

void AbstractCanvasItem::close() {
    m_closed = true;
    m_layoutUpdated.clear();
    m_focusChanged.clear();
    std::lock_guard<std::mutex> lock(m_mutex);
    m_composer.reset();
    ++m_composerGeneration;
}

RootCanvasItem* AbstractCanvasItem::rootContainer() const {
    auto* c = container();
    return c ? c->rootContainer() : nullptr;
}

LayerCanvasItem* AbstractCanvasItem::layerContainer() const {
    for (auto* c = container(); c; c = c->container()) {
        if (auto* layer = dynamic_cast<LayerCanvasItem*>(c)) {
            return layer;
        }
    }
    return nullptr;
}

std::string AbstractCanvasItem::name() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_name;
}

void AbstractCanvasItem::setName(const std::string& name) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_name = name;
}

Sizing AbstractCanvasItem::sizing() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_sizing;
}

void AbstractCanvasItem::setSizing(const Sizing& sizing) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_sizing == sizing) return;
        m_sizing = sizing;
    }
    refreshLayout();
    update();
    notifyContainer();
}

Sizing AbstractCanvasItem::layoutSizing() const {
    return sizing();
}

std::optional<IntPoint> AbstractCanvasItem::canvasOrigin() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_canvasOrigin;
}

std::optional<IntSize> AbstractCanvasItem::canvasSize() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_canvasSize;
}

std::optional<IntRect> AbstractCanvasItem::canvasRect() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_canvasOrigin || !m_canvasSize) return std::nullopt;
    return IntRect(*m_canvasOrigin, *m_canvasSize);
}

std::optional<IntRect> AbstractCanvasItem::canvasBounds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_canvasSize) return std::nullopt;
    return IntRect({0, 0}, *m_canvasSize);
}

void AbstractCanvasItem::updateLayout(IntPoint origin, IntSize size) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_canvasOrigin = origin;
        m_canvasSize = size;
    }
    m_layoutUpdated.fire(origin, size);
}

void AbstractCanvasItem::refreshLayout() {
    if (auto* c = container()) {
        c->refreshLayout();
        return;
    }
    if (auto rect = canvasRect()) {
        updateLayout(rect->origin, rect->size);
    }
}

IntPoint AbstractCanvasItem::mapToContainer(IntPoint p) const {
    return p + canvasOrigin().value_or(IntPoint{});
}

IntPoint AbstractCanvasItem::mapToGlobal(IntPoint p) const {
    IntPoint result = mapToContainer(p);
    for (auto* c = container(); c; c = c->container()) {
        result = c->mapToContainer(result);
    }
    return result;
}

IntPoint AbstractCanvasItem::mapFromGlobal(IntPoint p) const {
    return p - mapToGlobal({0, 0});
}

IntPoint AbstractCanvasItem::mapToCanvasItem(IntPoint p, const AbstractCanvasItem& other) const {
    return other.mapFromGlobal(mapToGlobal(p));
}

bool AbstractCanvasItem::isVisible() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_visible;
}

void AbstractCanvasItem::setVisible(bool visible) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_visible == visible) return;
        m_visible = visible;
    }
    refreshLayout();
    update();
    notifyContainer();
}

void AbstractCanvasItem::setEnabled(bool enabled) {
    if (m_enabled == enabled) return;
    m_enabled = enabled;
    update();
}

void AbstractCanvasItem::setCursorShape(CursorShape shape) {
    if (m_cursorShape == shape) return;
    m_cursorShape = shape;
    if (auto* root = rootContainer()) {
        root->cursorFeedbackChanged(*this);
    }
}

void AbstractCanvasItem::setToolTip(const std::string& toolTip) {
    if (m_toolTip == toolTip) return;
    m_toolTip = toolTip;
    if (auto* root = rootContainer()) {
        root->cursorFeedbackChanged(*this);
    }
}

std::optional<Color> AbstractCanvasItem::backgroundColor() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_backgroundColor;
}

void AbstractCanvasItem::setBackgroundColor(std::optional<Color> color) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_backgroundColor == color) return;
        m_backgroundColor = color;
    }
    update();
}

void AbstractCanvasItem::requestFocus() {
    if (!m_focusable) return;
    if (auto* root = rootContainer()) {
        root->requestRootFocus(shared_from_this());
    }
}

void AbstractCanvasItem::mouseFocusRequested(int, int, const KeyboardModifiers&) {
    requestFocus();
}

void AbstractCanvasItem::clearFocus() {
    if (!m_focused) return;
    if (auto* root = rootContainer()) {
        root->setFocusedItem(nullptr);
    }
}

void AbstractCanvasItem::setFocusedState(bool focused) {
    if (m_focused == focused) return;
    m_focused = focused;
    m_focusChanged.fire(focused);
    update();
}

std::vector<CanvasItemPtr> AbstractCanvasItem::itemsAtPoint(int x, int y) {
    std::vector<CanvasItemPtr> result;
    auto bounds = canvasBounds();
    if (isVisible() && bounds && bounds->contains(x, y)) {
        result.push_back(shared_from_this());
    }
    return result;
}

bool AbstractCanvasItem::mouseClicked(int, int, const KeyboardModifiers&) { return false; }
bool AbstractCanvasItem::mouseDoubleClicked(int, int, const KeyboardModifiers&) { return false; }
bool AbstractCanvasItem::mouseEntered() { return false; }
bool AbstractCanvasItem::mouseExited() { return false; }
bool AbstractCanvasItem::mousePressed(int, int, const KeyboardModifiers&) { return false; }
bool AbstractCanvasItem::mouseReleased(int, int, const KeyboardModifiers&) { return false; }
bool AbstractCanvasItem::mousePositionChanged(int, int, const KeyboardModifiers&) { return false; }
bool AbstractCanvasItem::wheelChanged(int, int, int, int, bool) { return false; }
bool AbstractCanvasItem::contextMenuEvent(int, int, int, int) { return false; }
bool AbstractCanvasItem::keyPressed(const KeyEvent&) { return false; }
bool AbstractCanvasItem::keyReleased(const KeyEvent&) { return false; }
DragAction AbstractCanvasItem::dragEnter(const MimeData&) { return DragAction::Ignore; }
DragAction AbstractCanvasItem::dragLeave() { return DragAction::Ignore; }
DragAction AbstractCanvasItem::dragMove(const MimeData&, int, int) { return DragAction::Ignore; }
DragAction AbstractCanvasItem::drop(const MimeData&, int, int) { return DragAction::Ignore; }
bool AbstractCanvasItem::panGesture(int, int) { return false; }

void AbstractCanvasItem::simulateClick(IntPoint p, const KeyboardModifiers& modifiers) {
    mousePressed(p.x, p.y, modifiers);
    mouseReleased(p.x, p.y, modifiers);
    mouseClicked(p.x, p.y, modifiers);
}

void AbstractCanvasItem::simulateDrag(IntPoint from, IntPoint to, const KeyboardModifiers& modifiers) {
    mousePressed(from.x, from.y, modifiers);
    IntPoint middle{(from.x + to.x) / 2, (from.y + to.y) / 2};
    mousePositionChanged(middle.x, middle.y, modifiers);
    mousePositionChanged(to.x, to.y, modifiers);
    mouseReleased(to.x, to.y, modifiers);
}

void AbstractCanvasItem::update() {
    invalidateComposer();
    updated();
}

void AbstractCanvasItem::updated() {
    if (auto* c = container()) {
        c->childUpdated(*this);
    }
}

void AbstractCanvasItem::notifyContainer() {
    // Layers do not forward their own updates, but the container's layout
    // inputs changed as well.
    if (auto* c = container()) {
        c->childUpdated(*this);
    }
}

void AbstractCanvasItem::invalidateComposer() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_composer.reset();
    ++m_composerGeneration;
}

std::shared_ptr<BaseComposer> AbstractCanvasItem::getComposer(ComposerCache& cache) {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_composer) return m_composer;
        generation = m_composerGeneration;
    }

    auto composer = createComposer(cache);

    // A composer built while the item changed is used once, never cached.
    std::lock_guard<std::mutex> lock(m_mutex);
    if (composer && generation == m_composerGeneration) {
        m_composer = composer;
    }
    return composer;
}

std::shared_ptr<BaseComposer> AbstractCanvasItem::createComposer(ComposerCache& cache) {
    return std::make_shared<BaseComposer>(makeSnapshot(), makePainter(cache));
}

Painter AbstractCanvasItem::makePainter(ComposerCache&) {
    return {};
}

ComposerSnapshot AbstractCanvasItem::makeSnapshot() const {
    ComposerSnapshot snapshot;
    snapshot.layoutSizing = layoutSizing();
    snapshot.repaintCounter = m_repaintCounter;
    std::lock_guard<std::mutex> lock(m_mutex);
    snapshot.backgroundColor = m_backgroundColor;
    snapshot.name = m_name.empty() ? "canvas item" : m_name;
    return snapshot;
}

// ---------------------------------------------------------------------------
// CanvasItemComposition
// ---------------------------------------------------------------------------

CanvasItemComposition::CanvasItemComposition()
    : m_layout(std::make_shared<OverlapLayout>())
{
}

void CanvasItemComposition::close() {
    std::vector<ChildSlot> children;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        children = m_children;
    }
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
        it->item->close();
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_children.clear();
    }
    for (auto& slot : children) {
        slot.item->m_container = nullptr;
    }
    AbstractCanvasItem::close();
}

void CanvasItemComposition::setLayout(std::shared_ptr<const CanvasLayout> layout) {
    if (!layout) {
        throw std::invalid_argument("CanvasItemComposition: layout must not be null");
    }
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        for (const auto& slot : m_children) {
            if (slot.position) layout->validatePosition(slot.position);
        }
        m_layout = std::move(layout);
    }
    refreshLayout();
    update();
}

std::shared_ptr<const CanvasLayout> CanvasItemComposition::layout() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_layout;
}

std::vector<CanvasItemPtr> CanvasItemComposition::canvasItems() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<CanvasItemPtr> items;
    items.reserve(m_children.size());
    for (const auto& slot : m_children) items.push_back(slot.item);
    return items;
}

size_t CanvasItemComposition::canvasItemCount() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_children.size();
}

CanvasItemPtr CanvasItemComposition::canvasItemAt(size_t index) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (index >= m_children.size()) {
        throw std::out_of_range("CanvasItemComposition: index out of range");
    }
    return m_children[index].item;
}

std::optional<size_t> CanvasItemComposition::indexOf(const AbstractCanvasItem& item) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (size_t i = 0; i < m_children.size(); ++i) {
        if (m_children[i].item.get() == &item) return i;
    }
    return std::nullopt;
}

std::optional<IntPoint> CanvasItemComposition::positionOf(const AbstractCanvasItem& item) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& slot : m_children) {
        if (slot.item.get() == &item) return slot.position;
    }
    return std::nullopt;
}

CanvasItemPtr CanvasItemComposition::insertCanvasItem(size_t index, CanvasItemPtr item,
                                                      std::optional<IntPoint> position) {
    if (!item) {
        throw std::invalid_argument("CanvasItemComposition: cannot insert a null item");
    }
    if (item->container() || item.get() == this) {
        throw std::logic_error("CanvasItemComposition: item is already attached to a container");
    }
    if (item->isClosed()) {
        throw std::logic_error("CanvasItemComposition: cannot insert a closed item");
    }
    validateInsertion(item);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (index > m_children.size()) {
            throw std::out_of_range("CanvasItemComposition: insert index out of range");
        }
        m_layout->validatePosition(position);
        m_children.insert(m_children.begin() + static_cast<std::ptrdiff_t>(index), ChildSlot{item, position});
    }
    item->m_container = this;
    canvasItemInserted(index, item);
    refreshLayout();
    update();
    return item;
}

CanvasItemPtr CanvasItemComposition::addCanvasItem(CanvasItemPtr item, std::optional<IntPoint> position) {
    return insertCanvasItem(canvasItemCount(), std::move(item), position);
}

void CanvasItemComposition::removeCanvasItem(const CanvasItemPtr& item) {
    if (!item || !indexOf(*item)) {
        throw std::logic_error("CanvasItemComposition: item is not a child of this container");
    }

    item->close();

    size_t index = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        auto it = std::find_if(m_children.begin(), m_children.end(),
            [&item](const ChildSlot& slot) { return slot.item == item; });
        index = static_cast<size_t>(it - m_children.begin());
        m_children.erase(it);
    }
    item->m_container = nullptr;
    canvasItemRemoved(index, item);
    refreshLayout();
    update();
}

void CanvasItemComposition::removeAllCanvasItems() {
    auto items = canvasItems();
    for (auto it = items.rbegin(); it != items.rend(); ++it) {
        removeCanvasItem(*it);
    }
}

void CanvasItemComposition::replaceAllCanvasItems(const std::vector<CanvasItemPtr>& items) {
    removeAllCanvasItems();
    for (const auto& item : items) {
        addCanvasItem(item);
    }
}

void CanvasItemComposition::replaceCanvasItem(const CanvasItemPtr& oldItem, CanvasItemPtr newItem) {
    auto index = oldItem ? indexOf(*oldItem) : std::nullopt;
    if (!index) {
        throw std::logic_error("CanvasItemComposition: item to replace is not a child of this container");
    }
    auto position = positionOf(*oldItem);
    removeCanvasItem(oldItem);
    insertCanvasItem(*index, std::move(newItem), position);
}

CanvasItemPtr CanvasItemComposition::insertSpacing(size_t index, int spacing) {
    auto item = std::make_shared<EmptyCanvasItem>();
    item->setSizing(layout()->spacingSizing(spacing));
    return insertCanvasItem(index, item);
}

CanvasItemPtr CanvasItemComposition::addSpacing(int spacing) {
    return insertSpacing(canvasItemCount(), spacing);
}

CanvasItemPtr CanvasItemComposition::insertStretch(size_t index) {
    auto item = std::make_shared<EmptyCanvasItem>();
    item->setSizing(layout()->stretchSizing());
    return insertCanvasItem(index, item);
}

CanvasItemPtr CanvasItemComposition::addStretch() {
    return insertStretch(canvasItemCount());
}

std::vector<CanvasItemComposition::ChildSlot> CanvasItemComposition::childSlots() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_children;
}

std::vector<CanvasItemComposition::ChildSlot> CanvasItemComposition::visibleChildSlots() const {
    std::vector<ChildSlot> slots = childSlots();
    slots.erase(std::remove_if(slots.begin(), slots.end(),
        [](const ChildSlot& slot) { return !slot.item->isVisible(); }), slots.end());
    return slots;
}

std::vector<LayoutEntry> CanvasItemComposition::layoutEntries(const std::vector<ChildSlot>& slots) const {
    std::vector<LayoutEntry> entries;
    entries.reserve(slots.size());
    for (const auto& slot : slots) {
        entries.push_back({slot.item->layoutSizing(), slot.position});
    }
    return entries;
}

std::vector<IntRect> CanvasItemComposition::childRects(IntSize size, const std::vector<ChildSlot>& slots) const {
    return layout()->layout({0, 0}, size, layoutEntries(slots));
}

void CanvasItemComposition::validateInsertion(const CanvasItemPtr&) const {
}

void CanvasItemComposition::canvasItemInserted(size_t, const CanvasItemPtr&) {
}

void CanvasItemComposition::canvasItemRemoved(size_t, const CanvasItemPtr&) {
}

Sizing CanvasItemComposition::layoutSizing() const {
    Sizing own = sizing();
    auto slots = visibleChildSlots();
    if (own.collapsible && slots.empty()) {
        return Sizing::collapsed();
    }
    return overrideWith(layout()->aggregateSizing(layoutEntries(slots)), own);
}

void CanvasItemComposition::updateLayout(IntPoint origin, IntSize size) {
    AbstractCanvasItem::updateLayout(origin, size);
    auto slots = visibleChildSlots();
    auto rects = childRects(size, slots);
    for (size_t i = 0; i < slots.size() && i < rects.size(); ++i) {
        slots[i].item->updateLayout(rects[i].origin, rects[i].size);
    }
}

std::vector<CanvasItemPtr> CanvasItemComposition::itemsAtPoint(int x, int y) {
    std::vector<CanvasItemPtr> result;
    if (!isVisible()) return result;

    auto slots = visibleChildSlots();
    for (auto it = slots.rbegin(); it != slots.rend(); ++it) {
        auto rect = it->item->canvasRect();
        if (rect && rect->contains(x, y)) {
            auto hits = it->item->itemsAtPoint(x - rect->left(), y - rect->top());
            result.insert(result.end(), hits.begin(), hits.end());
        }
    }

    auto bounds = canvasBounds();
    if (bounds && bounds->contains(x, y)) {
        result.push_back(shared_from_this());
    }
    return result;
}

void CanvasItemComposition::childUpdated(AbstractCanvasItem&) {
    update();
}

std::shared_ptr<BaseComposer> CanvasItemComposition::createComposer(ComposerCache& cache) {
    return createCompositionComposer(cache);
}

std::shared_ptr<BaseComposer> CanvasItemComposition::createCompositionComposer(ComposerCache& cache) {
    auto slots = visibleChildSlots();
    std::vector<std::shared_ptr<BaseComposer>> children;
    children.reserve(slots.size());
    for (const auto& slot : slots) {
        auto composer = slot.item->getComposer(cache);
        if (!composer) {
            return nullptr;
        }
        children.push_back(std::move(composer));
    }
    return std::make_shared<CompositionComposer>(makeSnapshot(), layout(), layoutEntries(slots),
                                                 std::move(children), makeForegroundPainter(cache));
}

Painter CanvasItemComposition::makeForegroundPainter(ComposerCache&) {
    return {};
}

} // namespace trellis
