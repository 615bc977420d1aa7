#include <gtest/gtest.h>
#include "canvas/CanvasItem.hpp"
#include "canvas/ComposerCache.hpp"
#include "canvas/LayerCanvasItem.hpp"
#include "TestSupport.hpp"

using namespace trellis;
using namespace trellis::test;

// =============================================================================
// ComposerCache
// =============================================================================

TEST(ComposerCacheTest, ReturnsLiveValue) {
    ComposerCache cache;
    int calls = 0;
    auto calculate = [&calls] { ++calls; return std::make_shared<int>(42); };

    auto first = cache.get<int>("answer", calculate);
    auto second = cache.get<int>("answer", calculate);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(*second, 42);
    EXPECT_EQ(calls, 1);
    EXPECT_TRUE(cache.contains("answer"));
    EXPECT_EQ(cache.size(), 1u);
}

TEST(ComposerCacheTest, EntryDisappearsWithLastHandle) {
    ComposerCache cache;
    int calls = 0;
    auto calculate = [&calls] { ++calls; return std::make_shared<int>(calls); };

    auto value = cache.get<int>("key", calculate);
    auto copy = value;
    value.reset();
    EXPECT_TRUE(cache.contains("key"));
    copy.reset();
    EXPECT_FALSE(cache.contains("key"));
    EXPECT_EQ(cache.size(), 0u);

    auto recomputed = cache.get<int>("key", calculate);
    EXPECT_EQ(*recomputed, 2);
    EXPECT_EQ(calls, 2);
}

TEST(ComposerCacheTest, NullResultIsNotStored) {
    ComposerCache cache;
    auto value = cache.get<int>("none", [] { return std::shared_ptr<int>(); });
    EXPECT_EQ(value, nullptr);
    EXPECT_FALSE(cache.contains("none"));
}

TEST(ComposerCacheTest, HandleOutlivesCache) {
    std::shared_ptr<int> value;
    {
        ComposerCache cache;
        value = cache.get<int>("key", [] { return std::make_shared<int>(7); });
    }
    EXPECT_EQ(*value, 7);
    value.reset();
}

// =============================================================================
// Composers built from items
// =============================================================================

class ComposerTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (auto& item : m_items) item->close();
    }

    template <typename T, typename... Args>
    std::shared_ptr<T> make(Args&&... args) {
        auto item = std::make_shared<T>(std::forward<Args>(args)...);
        m_items.push_back(item);
        return item;
    }

    ComposerCache m_cache;
    std::vector<CanvasItemPtr> m_items;
};

TEST_F(ComposerTest, ComposerIsMemoizedUntilUpdate) {
    auto item = make<PaintingCanvasItem>();
    auto first = item->getComposer(m_cache);
    ASSERT_NE(first, nullptr);
    EXPECT_EQ(item->getComposer(m_cache), first);

    item->update();
    auto second = item->getComposer(m_cache);
    ASSERT_NE(second, nullptr);
    EXPECT_NE(second, first);
}

TEST_F(ComposerTest, RepaintIsCachedForSameVisibleRect) {
    auto item = make<PaintingCanvasItem>(Color::Gray());
    auto composer = item->getComposer(m_cache);
    composer->updateLayout({0, 0}, {10, 10});

    DrawingContext dc;
    EXPECT_TRUE(composer->repaint(dc, IntRect(0, 0, 10, 10)));
    EXPECT_TRUE(composer->repaint(dc, IntRect(0, 0, 10, 10)));
    EXPECT_EQ(item->repaintCount(), 1);
    ASSERT_EQ(dc.commands().size(), 2u);
    EXPECT_EQ(dc.commands()[0].context, dc.commands()[1].context);

    EXPECT_TRUE(composer->repaint(dc, IntRect(0, 0, 5, 5)));
    EXPECT_EQ(item->repaintCount(), 2);
}

TEST_F(ComposerTest, RelayoutDropsCachedOutput) {
    auto item = make<PaintingCanvasItem>();
    auto composer = item->getComposer(m_cache);
    composer->updateLayout({0, 0}, {10, 10});
    DrawingContext dc;
    composer->repaint(dc, IntRect(0, 0, 10, 10));
    EXPECT_TRUE(composer->hasCachedOutput());

    composer->updateLayout({0, 0}, {10, 10});
    EXPECT_TRUE(composer->hasCachedOutput());
    composer->updateLayout({0, 0}, {20, 10});
    EXPECT_FALSE(composer->hasCachedOutput());
}

TEST_F(ComposerTest, BackgroundIsFilledFirst) {
    auto item = make<PaintingCanvasItem>(Color::Black());
    item->setBackgroundColor(Color::White());
    auto composer = item->getComposer(m_cache);
    composer->updateLayout({0, 0}, {8, 8});

    DrawingContext dc;
    composer->repaint(dc, IntRect(0, 0, 8, 8));
    auto flat = dc.flattened();
    ASSERT_GE(flat.size(), 4u);
    EXPECT_EQ(flat[1].type, DrawCommandType::FillRect);
    EXPECT_EQ(flat[1].color, Color::White());
    EXPECT_EQ(flat[2].color, Color::Black());
}

TEST_F(ComposerTest, UnsizedComposerPaintsNothing) {
    auto item = make<PaintingCanvasItem>();
    auto composer = item->getComposer(m_cache);
    DrawingContext dc;
    EXPECT_TRUE(composer->repaint(dc, IntRect(0, 0, 10, 10)));
    EXPECT_TRUE(dc.empty());
    EXPECT_EQ(item->repaintCount(), 0);
}

TEST_F(ComposerTest, CancelledPassReportsFalse) {
    auto item = make<PaintingCanvasItem>();
    auto composer = item->getComposer(m_cache);
    composer->updateLayout({0, 0}, {10, 10});

    DrawingContext dc(std::make_shared<std::atomic<bool>>(true));
    EXPECT_FALSE(composer->repaint(dc, IntRect(0, 0, 10, 10)));
    EXPECT_FALSE(composer->hasCachedOutput());
}

TEST_F(ComposerTest, PaintFailureIsContained) {
    auto item = make<PaintingCanvasItem>();
    item->setThrows(true);
    auto composer = item->getComposer(m_cache);
    composer->updateLayout({0, 0}, {10, 10});

    DrawingContext dc;
    EXPECT_TRUE(composer->repaint(dc, IntRect(0, 0, 10, 10)));
    EXPECT_TRUE(dc.empty());
    EXPECT_FALSE(composer->hasCachedOutput());
    EXPECT_EQ(item->repaintCount(), 0);
}

TEST_F(ComposerTest, CompositionLaysOutChildren) {
    auto row = make<CanvasItemComposition>();
    row->setLayout(std::make_shared<RowLayout>());
    auto left = std::make_shared<PaintingCanvasItem>(Color::Black());
    auto right = std::make_shared<PaintingCanvasItem>(Color::Gray());
    row->addCanvasItem(left);
    row->addCanvasItem(right);

    auto composer = std::dynamic_pointer_cast<CompositionComposer>(row->getComposer(m_cache));
    ASSERT_NE(composer, nullptr);
    composer->updateLayout({0, 0}, {100, 10});
    ASSERT_EQ(composer->children().size(), 2u);
    EXPECT_EQ(composer->children()[0]->rect(), IntRect(0, 0, 50, 10));
    EXPECT_EQ(composer->children()[1]->rect(), IntRect(50, 0, 50, 10));

    DrawingContext dc;
    EXPECT_TRUE(composer->repaint(dc, IntRect(0, 0, 100, 10)));
    bool translated = false;
    for (const auto& cmd : dc.flattened()) {
        if (cmd.type == DrawCommandType::Translate && cmd.from == IntPoint(50, 0)) translated = true;
    }
    EXPECT_TRUE(translated);
    EXPECT_EQ(left->repaintCount(), 1);
    EXPECT_EQ(right->repaintCount(), 1);
}

TEST_F(ComposerTest, ChildrenOutsideVisibleRectAreSkipped) {
    auto row = make<CanvasItemComposition>();
    row->setLayout(std::make_shared<RowLayout>());
    auto left = std::make_shared<PaintingCanvasItem>();
    auto right = std::make_shared<PaintingCanvasItem>();
    row->addCanvasItem(left);
    row->addCanvasItem(right);

    auto composer = row->getComposer(m_cache);
    composer->updateLayout({0, 0}, {100, 10});
    DrawingContext dc;
    composer->repaint(dc, IntRect(0, 0, 40, 10));
    EXPECT_EQ(left->repaintCount(), 1);
    EXPECT_EQ(right->repaintCount(), 0);
}

TEST_F(ComposerTest, ChildUpdateInvalidatesParentComposer) {
    auto group = make<CanvasItemComposition>();
    auto child = std::make_shared<PaintingCanvasItem>();
    group->addCanvasItem(child);

    auto before = group->getComposer(m_cache);
    EXPECT_EQ(group->getComposer(m_cache), before);
    child->update();
    EXPECT_NE(group->getComposer(m_cache), before);
}

TEST_F(ComposerTest, UnpublishedLayerHoldsBackParent) {
    auto group = make<CanvasItemComposition>();
    auto layer = std::make_shared<LayerCanvasItem>();
    group->addCanvasItem(layer);
    EXPECT_TRUE(layer->waitForIdle());
    EXPECT_EQ(layer->publishedOutput(), nullptr);
    EXPECT_EQ(group->getComposer(m_cache), nullptr);
}
