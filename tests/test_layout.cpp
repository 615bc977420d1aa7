#include <gtest/gtest.h>
#include "layout/CanvasLayout.hpp"

#include <stdexcept>

using namespace trellis;

namespace {

LayoutEntry entry(Sizing sizing = {}, std::optional<IntPoint> position = std::nullopt) {
    return LayoutEntry{sizing, position};
}

} // namespace

// =============================================================================
// Overlap
// =============================================================================

TEST(OverlapLayoutTest, EveryChildGetsContentRect) {
    OverlapLayout layout(Margins(2));
    auto rects = layout.layout({10, 10}, {50, 60}, {entry(), entry()});
    ASSERT_EQ(rects.size(), 2u);
    EXPECT_EQ(rects[0], IntRect(12, 12, 46, 56));
    EXPECT_EQ(rects[1], IntRect(12, 12, 46, 56));
}

TEST(OverlapLayoutTest, PreferredAspectRatioCentersChild) {
    OverlapLayout layout;
    Sizing wide;
    wide.preferredAspectRatio = 2.0;
    auto rects = layout.layout({0, 0}, {100, 100}, {entry(wide)});
    EXPECT_EQ(rects[0], IntRect(0, 25, 100, 50));
}

TEST(OverlapLayoutTest, AggregateTakesLargestMinimumAndSmallestMaximum) {
    OverlapLayout layout;
    Sizing a = Sizing().withPreferredWidth(30).withMinimumWidth(10).withMaximumWidth(100);
    Sizing b = Sizing().withPreferredWidth(50).withMinimumWidth(20).withMaximumWidth(80);
    Sizing s = layout.aggregateSizing({entry(a), entry(b)});
    EXPECT_EQ(s.preferredWidth, SizingValue(50));
    EXPECT_EQ(s.minimumWidth, SizingValue(20));
    EXPECT_EQ(s.maximumWidth, SizingValue(80));
    EXPECT_FALSE(s.preferredHeight);
}

TEST(OverlapLayoutTest, MissingChildMaximumClearsAggregateMaximum) {
    OverlapLayout layout;
    Sizing a = Sizing().withMaximumWidth(100);
    Sizing s = layout.aggregateSizing({entry(a), entry()});
    EXPECT_FALSE(s.maximumWidth);
}

TEST(OverlapLayoutTest, AggregateIncludesMargins) {
    OverlapLayout layout(Margins(5));
    Sizing s = layout.aggregateSizing({entry(Sizing().withFixedSize({20, 30}))});
    EXPECT_EQ(s.preferredWidth, SizingValue(30));
    EXPECT_EQ(s.preferredHeight, SizingValue(40));
    EXPECT_EQ(s.maximumHeight, SizingValue(40));
}

// =============================================================================
// Row and column
// =============================================================================

TEST(LinearLayoutTest, RowSplitsWidthEvenly) {
    RowLayout layout;
    Sizing bounded = Sizing().withMinimumWidth(10).withMaximumWidth(100);
    auto rects = layout.layout({0, 0}, {90, 20}, {entry(bounded), entry(bounded), entry(bounded)});
    ASSERT_EQ(rects.size(), 3u);
    EXPECT_EQ(rects[0], IntRect(0, 0, 30, 20));
    EXPECT_EQ(rects[1], IntRect(30, 0, 30, 20));
    EXPECT_EQ(rects[2], IntRect(60, 0, 30, 20));
}

TEST(LinearLayoutTest, ColumnWithMarginsAndSpacing) {
    ColumnLayout layout(Margins(5), 10);
    auto rects = layout.layout({0, 0}, {100, 100}, {entry(), entry()});
    ASSERT_EQ(rects.size(), 2u);
    EXPECT_EQ(rects[0], IntRect(5, 5, 90, 40));
    EXPECT_EQ(rects[1], IntRect(5, 55, 90, 40));
}

TEST(LinearLayoutTest, EmptyLayoutHasNoRects) {
    RowLayout layout;
    EXPECT_TRUE(layout.layout({0, 0}, {100, 100}, {}).empty());
}

TEST(LinearLayoutTest, CrossAxisAlignment) {
    Sizing shortItem = Sizing().withMaximumHeight(10);

    RowLayout start;
    EXPECT_EQ(start.layout({0, 0}, {100, 30}, {entry(shortItem)})[0], IntRect(0, 0, 100, 10));

    RowLayout center(Margins(), 0, Alignment::Center);
    EXPECT_EQ(center.layout({0, 0}, {100, 30}, {entry(shortItem)})[0], IntRect(0, 10, 100, 10));

    RowLayout end(Margins(), 0, Alignment::End);
    EXPECT_EQ(end.layout({0, 0}, {100, 30}, {entry(shortItem)})[0], IntRect(0, 20, 100, 10));
}

TEST(LinearLayoutTest, FixedSpacerTakesItsWidth) {
    RowLayout layout;
    auto rects = layout.layout({0, 0}, {100, 10},
                               {entry(), entry(layout.spacingSizing(20)), entry()});
    EXPECT_EQ(rects[0].width(), 40);
    EXPECT_EQ(rects[1], IntRect(40, 0, 20, 10));
    EXPECT_EQ(rects[2], IntRect(60, 0, 40, 10));
}

TEST(LinearLayoutTest, StretchAbsorbsFreeSpace) {
    ColumnLayout layout;
    Sizing fixed = Sizing().withFixedHeight(20);
    auto rects = layout.layout({0, 0}, {50, 100},
                               {entry(fixed), entry(layout.stretchSizing()), entry(fixed)});
    EXPECT_EQ(rects[0], IntRect(0, 0, 50, 20));
    EXPECT_EQ(rects[1].height(), 60);
    EXPECT_EQ(rects[1].width(), 0);
    EXPECT_EQ(rects[2], IntRect(0, 80, 50, 20));
}

TEST(LinearLayoutTest, SpacerSizingsFollowAxis) {
    RowLayout row;
    Sizing spacer = row.spacingSizing(8);
    EXPECT_EQ(spacer.minimumWidth, SizingValue(8));
    EXPECT_EQ(spacer.maximumWidth, SizingValue(8));
    EXPECT_FALSE(spacer.minimumHeight);

    ColumnLayout column;
    Sizing stretch = column.stretchSizing();
    EXPECT_EQ(stretch.maximumWidth, SizingValue(0));
    EXPECT_FALSE(stretch.maximumHeight);
}

TEST(LinearLayoutTest, RowAggregateSumsPrimaryAxis) {
    RowLayout layout(Margins(), 5);
    Sizing a = Sizing().withPreferredWidth(30).withMinimumWidth(10).withMaximumWidth(50).withPreferredHeight(20);
    Sizing b = Sizing().withPreferredWidth(40).withMinimumWidth(10).withMaximumWidth(60).withPreferredHeight(30);
    Sizing s = layout.aggregateSizing({entry(a), entry(b)});
    EXPECT_EQ(s.preferredWidth, SizingValue(75));
    EXPECT_EQ(s.minimumWidth, SizingValue(25));
    EXPECT_EQ(s.maximumWidth, SizingValue(115));
    EXPECT_EQ(s.preferredHeight, SizingValue(30));
}

TEST(LinearLayoutTest, AggregateIgnoresFractions) {
    RowLayout layout;
    Sizing a = Sizing().withPreferredWidth(SizingValue::fraction(0.5));
    Sizing b = Sizing().withPreferredWidth(40);
    Sizing s = layout.aggregateSizing({entry(a), entry(b)});
    EXPECT_EQ(s.preferredWidth, SizingValue(40));
}

TEST(LinearLayoutTest, UnboundedChildClearsPrimaryMaximum) {
    ColumnLayout layout;
    Sizing s = layout.aggregateSizing({entry(Sizing().withMaximumHeight(10)), entry()});
    EXPECT_FALSE(s.maximumHeight);
}

// =============================================================================
// Grid
// =============================================================================

TEST(GridLayoutTest, RejectsEmptyGrid) {
    EXPECT_THROW(GridLayout(IntSize(0, 2)), std::invalid_argument);
}

TEST(GridLayoutTest, ValidatesPositions) {
    GridLayout layout({2, 3});
    EXPECT_NO_THROW(layout.validatePosition(IntPoint(1, 2)));
    EXPECT_THROW(layout.validatePosition(IntPoint(2, 0)), std::out_of_range);
    EXPECT_THROW(layout.validatePosition(IntPoint(0, -1)), std::out_of_range);
    EXPECT_THROW(layout.validatePosition(std::nullopt), std::out_of_range);
}

TEST(GridLayoutTest, EvenCells) {
    GridLayout layout({2, 2});
    auto rects = layout.layout({0, 0}, {100, 100},
                               {entry({}, IntPoint(0, 0)), entry({}, IntPoint(1, 1))});
    EXPECT_EQ(rects[0], IntRect(0, 0, 50, 50));
    EXPECT_EQ(rects[1], IntRect(50, 50, 50, 50));
}

TEST(GridLayoutTest, FixedColumnWidth) {
    GridLayout layout({2, 2});
    auto rects = layout.layout({0, 0}, {100, 100},
                               {entry(Sizing().withFixedWidth(30), IntPoint(0, 0)),
                                entry({}, IntPoint(1, 0)),
                                entry({}, IntPoint(0, 1))});
    EXPECT_EQ(rects[0], IntRect(0, 0, 30, 50));
    EXPECT_EQ(rects[1], IntRect(30, 0, 70, 50));
    EXPECT_EQ(rects[2], IntRect(0, 50, 30, 50));
}

TEST(GridLayoutTest, SpacingBetweenCells) {
    GridLayout layout({2, 1}, Margins(), 10);
    auto rects = layout.layout({0, 0}, {110, 20},
                               {entry({}, IntPoint(0, 0)), entry({}, IntPoint(1, 0))});
    EXPECT_EQ(rects[0], IntRect(0, 0, 50, 20));
    EXPECT_EQ(rects[1], IntRect(60, 0, 50, 20));
}

TEST(GridLayoutTest, AggregateSumsColumns) {
    GridLayout layout({2, 1}, Margins(), 4);
    Sizing s = layout.aggregateSizing({entry(Sizing().withFixedSize({30, 20}), IntPoint(0, 0)),
                                       entry(Sizing().withFixedSize({40, 10}), IntPoint(1, 0))});
    EXPECT_EQ(s.preferredWidth, SizingValue(74));
    EXPECT_EQ(s.maximumWidth, SizingValue(74));
    EXPECT_EQ(s.preferredHeight, SizingValue(20));
}

TEST(GridLayoutTest, EmptyColumnClearsMaximum) {
    GridLayout layout({2, 1});
    Sizing s = layout.aggregateSizing({entry(Sizing().withFixedSize({30, 20}), IntPoint(0, 0))});
    EXPECT_FALSE(s.maximumWidth);
    EXPECT_EQ(s.preferredWidth, SizingValue(30));
}
