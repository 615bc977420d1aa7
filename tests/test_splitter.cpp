#include <gtest/gtest.h>
#include "canvas/ComposerCache.hpp"
#include "canvas/Splitter.hpp"
#include "canvas/Widgets.hpp"
#include "TestSupport.hpp"

#include <stdexcept>

using namespace trellis;
using namespace trellis::test;

class SplitterTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (auto& item : m_items) item->close();
    }

    std::shared_ptr<SplitterCanvasItem> splitter(int panes, IntSize size,
                                                 SplitterCanvasItem::Orientation orientation =
                                                     SplitterCanvasItem::Orientation::Vertical) {
        auto item = std::make_shared<SplitterCanvasItem>(orientation);
        m_items.push_back(item);
        for (int i = 0; i < panes; ++i) {
            item->addCanvasItem(std::make_shared<EmptyCanvasItem>());
        }
        item->updateLayout({0, 0}, size);
        return item;
    }

    static int widthOf(const SplitterCanvasItem& item, size_t index) {
        return item.canvasItemAt(index)->canvasSize().value_or(IntSize{}).width;
    }

    std::vector<CanvasItemPtr> m_items;
};

TEST_F(SplitterTest, DefaultsSplitEvenly) {
    auto split = splitter(2, {200, 50});
    EXPECT_EQ(split->canvasItemAt(0)->canvasRect(), IntRect(0, 0, 100, 50));
    EXPECT_EQ(split->canvasItemAt(1)->canvasRect(), IntRect(100, 0, 100, 50));
    EXPECT_EQ(split->boundaries(), (std::vector<int>{100}));
    EXPECT_EQ(split->splits(), (std::vector<double>{0.5, 0.5}));
    EXPECT_EQ(split->snapTolerance(), 12);
    EXPECT_EQ(split->hitTolerance(), 6);
}

TEST_F(SplitterTest, DefaultMinimumIsTenPercent) {
    auto split = splitter(1, {100, 10});
    auto sizings = split->splitSizings();
    ASSERT_EQ(sizings.size(), 1u);
    ASSERT_TRUE(sizings[0].minimumWidth);
    EXPECT_TRUE(sizings[0].minimumWidth->isFraction());
    EXPECT_DOUBLE_EQ(sizings[0].minimumWidth->value(), 0.1);
}

TEST_F(SplitterTest, SplitSizingDropsPreferredOnAxis) {
    auto split = std::make_shared<SplitterCanvasItem>();
    m_items.push_back(split);
    split->addCanvasItem(std::make_shared<EmptyCanvasItem>(),
                         Sizing().withMinimumWidth(50).withPreferredWidth(10));
    auto sizings = split->splitSizings();
    ASSERT_EQ(sizings.size(), 1u);
    EXPECT_EQ(sizings[0].minimumWidth, SizingValue(50));
    EXPECT_FALSE(sizings[0].preferredWidth);
}

TEST_F(SplitterTest, DragMovesBoundary) {
    auto split = splitter(2, {200, 50});
    split->simulateDrag({100, 10}, {120, 10});
    EXPECT_EQ(widthOf(*split, 0), 120);
    EXPECT_EQ(widthOf(*split, 1), 80);
    EXPECT_EQ(split->boundaries(), (std::vector<int>{120}));
    EXPECT_FALSE(split->isTracking());
}

TEST_F(SplitterTest, DragSnapsNearThirdsAndHalf) {
    auto split = splitter(2, {200, 50});
    split->simulateDrag({100, 10}, {110, 10});
    EXPECT_EQ(widthOf(*split, 0), 100);

    split->simulateDrag({100, 10}, {70, 10});
    EXPECT_EQ(widthOf(*split, 0), 66);
    EXPECT_EQ(widthOf(*split, 1), 134);
}

TEST_F(SplitterTest, ShiftDisablesSnapping) {
    auto split = splitter(2, {200, 50});
    split->simulateDrag({100, 10}, {110, 10}, KeyboardModifiers::withShift());
    EXPECT_EQ(widthOf(*split, 0), 110);
    EXPECT_EQ(widthOf(*split, 1), 90);
}

TEST_F(SplitterTest, DragStopsAtMinimum) {
    auto split = splitter(2, {200, 50});
    split->simulateDrag({100, 10}, {5, 10});
    EXPECT_EQ(widthOf(*split, 0), 20);
    EXPECT_EQ(widthOf(*split, 1), 180);
}

TEST_F(SplitterTest, DragOnlyMovesAdjacentPair) {
    auto split = splitter(3, {300, 20});
    EXPECT_EQ(split->boundaries(), (std::vector<int>{100, 200}));
    split->simulateDrag({100, 5}, {130, 5});
    EXPECT_EQ(widthOf(*split, 0), 130);
    EXPECT_EQ(widthOf(*split, 1), 70);
    EXPECT_EQ(widthOf(*split, 2), 100);
}

TEST_F(SplitterTest, PressAwayFromBoundaryIsIgnored) {
    auto split = splitter(2, {200, 50});
    EXPECT_FALSE(split->mousePressed(50, 10, KeyboardModifiers()));
    EXPECT_FALSE(split->isTracking());
}

TEST_F(SplitterTest, SetSplits) {
    auto split = splitter(2, {200, 50});
    split->setSplits({0.25, 0.75});
    EXPECT_EQ(widthOf(*split, 0), 50);
    EXPECT_EQ(widthOf(*split, 1), 150);
    EXPECT_EQ(split->splits(), (std::vector<double>{0.25, 0.75}));
}

TEST_F(SplitterTest, SetSplitsRejectsCountMismatch) {
    auto split = splitter(2, {200, 50});
    EXPECT_THROW(split->setSplits({1.0}), std::invalid_argument);
    EXPECT_EQ(split->boundaries(), (std::vector<int>{100}));
}

TEST_F(SplitterTest, RemovingChildDropsItsSizing) {
    auto split = splitter(3, {300, 20});
    split->removeCanvasItem(split->canvasItemAt(1));
    EXPECT_EQ(split->splitSizings().size(), 2u);
    EXPECT_EQ(widthOf(*split, 0) + widthOf(*split, 1), 300);
}

TEST_F(SplitterTest, HorizontalOrientationSplitsHeight) {
    auto split = splitter(2, {40, 100}, SplitterCanvasItem::Orientation::Horizontal);
    EXPECT_EQ(split->canvasItemAt(0)->canvasRect(), IntRect(0, 0, 40, 50));
    EXPECT_EQ(split->canvasItemAt(1)->canvasRect(), IntRect(0, 50, 40, 50));

    split->simulateDrag({20, 50}, {20, 80}, KeyboardModifiers::withShift());
    EXPECT_EQ(split->canvasItemAt(0)->canvasSize(), IntSize(40, 80));
}

TEST_F(SplitterTest, BoundaryHitTest) {
    auto split = splitter(2, {200, 50});
    auto onBoundary = split->itemsAtPoint(102, 10);
    ASSERT_EQ(onBoundary.size(), 1u);
    EXPECT_EQ(onBoundary[0], split);

    auto inPane = split->itemsAtPoint(40, 10);
    ASSERT_EQ(inPane.size(), 2u);
    EXPECT_EQ(inPane[0], split->canvasItemAt(0));
}

TEST_F(SplitterTest, CursorOverBoundary) {
    auto split = splitter(2, {200, 50});
    KeyboardModifiers none;
    split->mousePositionChanged(99, 10, none);
    EXPECT_EQ(split->cursorShape(), CursorShape::SplitHorizontal);
    split->mousePositionChanged(30, 10, none);
    EXPECT_EQ(split->cursorShape(), CursorShape::Arrow);

    auto rows = splitter(2, {50, 200}, SplitterCanvasItem::Orientation::Horizontal);
    rows->mousePositionChanged(10, 100, none);
    EXPECT_EQ(rows->cursorShape(), CursorShape::SplitVertical);
}

TEST_F(SplitterTest, PaintsBoundaryLines) {
    auto split = splitter(2, {200, 50});
    ComposerCache cache;
    auto composer = split->getComposer(cache);
    ASSERT_NE(composer, nullptr);
    composer->updateLayout({0, 0}, {200, 50});
    DrawingContext dc;
    composer->repaint(dc, IntRect(0, 0, 200, 50));

    bool found = false;
    for (const auto& cmd : dc.flattened()) {
        if (cmd.type == DrawCommandType::Line && cmd.from == IntPoint(100, 0) && cmd.to == IntPoint(100, 50)) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(SplitterTest, HiddenChildTakesNoSpace) {
    auto split = std::make_shared<SplitterCanvasItem>();
    m_items.push_back(split);
    for (int i = 0; i < 3; ++i) {
        split->addCanvasItem(std::make_shared<EmptyCanvasItem>());
    }
    split->canvasItemAt(1)->setVisible(false);
    split->updateLayout({0, 0}, {300, 20});

    EXPECT_EQ(split->canvasItemAt(0)->canvasRect(), IntRect(0, 0, 150, 20));
    EXPECT_EQ(split->canvasItemAt(2)->canvasRect(), IntRect(150, 0, 150, 20));
    EXPECT_EQ(split->boundaries(), (std::vector<int>{150}));

    split->simulateDrag({150, 5}, {180, 5}, KeyboardModifiers::withShift());
    EXPECT_EQ(widthOf(*split, 0), 180);
    EXPECT_EQ(widthOf(*split, 2), 120);
    EXPECT_EQ(split->boundaries(), (std::vector<int>{180}));
    EXPECT_EQ(split->splitSizings().size(), 3u);
}
