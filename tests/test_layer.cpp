#include <gtest/gtest.h>
#include "canvas/ComposerCache.hpp"
#include "canvas/LayerCanvasItem.hpp"
#include "canvas/RootCanvasItem.hpp"
#include "canvas/Widgets.hpp"
#include "TestSupport.hpp"

#include <chrono>

using namespace trellis;
using namespace trellis::test;

namespace {

bool containsFill(const DrawingContext& dc, Color color) {
    for (const auto& cmd : dc.flattened()) {
        if (cmd.type == DrawCommandType::FillRect && cmd.color == color) return true;
    }
    return false;
}

} // namespace

class LayerTest : public ::testing::Test {
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

    std::vector<CanvasItemPtr> m_items;
};

TEST_F(LayerTest, UpdatesWhileRunningCoalesceIntoOnePass) {
    auto gate = std::make_shared<PaintGate>();
    auto layer = make<LayerCanvasItem>();
    auto leaf = std::make_shared<BlockingCanvasItem>(gate);
    layer->addCanvasItem(leaf);
    ASSERT_TRUE(layer->waitForIdle());
    int base = layer->repaintPassCount();

    layer->updateLayout({0, 0}, {100, 100});
    ASSERT_TRUE(gate->waitEntered(1));
    EXPECT_EQ(layer->repaintState(), LayerCanvasItem::RepaintState::Running);

    for (int i = 0; i < 5; ++i) {
        leaf->update();
    }
    gate->release();
    ASSERT_TRUE(layer->waitForIdle());

    EXPECT_EQ(layer->repaintPassCount() - base, 2);
    EXPECT_EQ(layer->repaintState(), LayerCanvasItem::RepaintState::Idle);
    EXPECT_NE(layer->publishedOutput(), nullptr);
}

TEST_F(LayerTest, CloseCancelsAndJoinsRunningPass) {
    auto gate = std::make_shared<PaintGate>();
    auto layer = std::make_shared<LayerCanvasItem>();
    layer->addCanvasItem(std::make_shared<BlockingCanvasItem>(gate));
    layer->updateLayout({0, 0}, {50, 50});
    ASSERT_TRUE(gate->waitEntered(1));

    layer->close();
    EXPECT_TRUE(gate->observedCancel());
    EXPECT_EQ(layer->repaintState(), LayerCanvasItem::RepaintState::Idle);
    EXPECT_EQ(layer->publishedOutput(), nullptr);
    EXPECT_TRUE(layer->isClosed());
}

TEST_F(LayerTest, UpdatesAfterCloseAreIgnored) {
    auto layer = std::make_shared<LayerCanvasItem>();
    layer->updateLayout({0, 0}, {10, 10});
    layer->close();
    int passes = layer->repaintPassCount();
    layer->update();
    EXPECT_EQ(layer->repaintState(), LayerCanvasItem::RepaintState::Idle);
    EXPECT_EQ(layer->repaintPassCount(), passes);
}

TEST_F(LayerTest, RootPublishesToDrawSink) {
    auto sink = std::make_shared<RecordingDrawSink>();
    auto root = make<RootCanvasItem>(sink);
    root->addCanvasItem(std::make_shared<PaintingCanvasItem>(Color(10, 20, 30)));
    root->sizeChanged(100, 100);

    ASSERT_TRUE(waitUntil([&] { return sink->frameCount() > 0; }));
    ASSERT_TRUE(root->waitForIdle());
    auto frame = sink->lastFrame();
    ASSERT_NE(frame, nullptr);
    EXPECT_TRUE(containsFill(*frame, Color(10, 20, 30)));
}

TEST_F(LayerTest, NestedLayerOutputReachesRoot) {
    auto sink = std::make_shared<RecordingDrawSink>();
    auto root = make<RootCanvasItem>(sink);
    auto layer = std::make_shared<LayerCanvasItem>();
    root->addCanvasItem(layer);
    layer->addCanvasItem(std::make_shared<PaintingCanvasItem>(Color(1, 2, 3)));
    root->sizeChanged(80, 60);

    ASSERT_TRUE(waitUntil([&] { return sink->frameCount() > 0; }));
    ASSERT_NE(layer->publishedOutput(), nullptr);
    EXPECT_TRUE(containsFill(*sink->lastFrame(), Color(1, 2, 3)));
    EXPECT_EQ(layer->layerContainer(), root.get());
}

TEST_F(LayerTest, PaintFailureStillPublishes) {
    auto sink = std::make_shared<RecordingDrawSink>();
    auto root = make<RootCanvasItem>(sink);
    root->setLayout(std::make_shared<RowLayout>());
    auto broken = std::make_shared<PaintingCanvasItem>(Color(9, 9, 9));
    broken->setThrows(true);
    root->addCanvasItem(broken);
    root->addCanvasItem(std::make_shared<PaintingCanvasItem>(Color(7, 7, 7)));
    root->sizeChanged(100, 20);

    ASSERT_TRUE(waitUntil([&] { return sink->frameCount() > 0; }));
    ASSERT_TRUE(root->waitForIdle());
    auto frame = sink->lastFrame();
    EXPECT_TRUE(containsFill(*frame, Color(7, 7, 7)));
    EXPECT_FALSE(containsFill(*frame, Color(9, 9, 9)));
}

TEST_F(LayerTest, DirectDrawLayerUsesSection) {
    auto sink = std::make_shared<RecordingDrawSink>();
    auto root = make<RootCanvasItem>(sink);
    root->setLayout(std::make_shared<ColumnLayout>());
    auto header = std::make_shared<EmptyCanvasItem>();
    header->setSizing(Sizing().withFixedHeight(20));
    root->addCanvasItem(header);

    auto layer = std::make_shared<LayerCanvasItem>();
    layer->setDrawsDirectly(true);
    layer->addCanvasItem(std::make_shared<PaintingCanvasItem>(Color(4, 5, 6)));
    root->addCanvasItem(layer);
    root->sizeChanged(100, 100);

    int id = layer->sectionId();
    ASSERT_TRUE(waitUntil([&] { return sink->hasSection(id); }));
    EXPECT_EQ(sink->sectionRect(id), IntRect(0, 20, 100, 80));

    ASSERT_TRUE(waitUntil([&] { return sink->frameCount() > 0; }));
    ASSERT_TRUE(root->waitForIdle());
    EXPECT_FALSE(containsFill(*sink->lastFrame(), Color(4, 5, 6)));

    root->removeCanvasItem(layer);
    EXPECT_FALSE(sink->hasSection(id));
    ASSERT_EQ(sink->removedSections().size(), 1u);
    EXPECT_EQ(sink->removedSections()[0], id);
}

TEST_F(LayerTest, FrameRateLimitSpacesPasses) {
    auto layer = make<LayerCanvasItem>();
    layer->setMaxFrameRate(10);
    layer->addCanvasItem(std::make_shared<PaintingCanvasItem>());
    layer->updateLayout({0, 0}, {10, 10});
    ASSERT_TRUE(layer->waitForIdle());

    auto start = std::chrono::steady_clock::now();
    layer->update();
    ASSERT_TRUE(layer->waitForIdle());
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, std::chrono::milliseconds(50));
}

TEST_F(LayerTest, SectionIdsAreUnique) {
    auto a = make<LayerCanvasItem>();
    auto b = make<LayerCanvasItem>();
    EXPECT_NE(a->sectionId(), b->sectionId());
}

// ============================================================================
// Empty layers and direct-draw sections
// ============================================================================

TEST_F(LayerTest, ZeroWidthNestedLayerDoesNotBlankRoot) {
    auto sink = std::make_shared<RecordingDrawSink>();
    auto root = make<RootCanvasItem>(sink);
    root->setLayout(std::make_shared<RowLayout>());
    auto layer = std::make_shared<LayerCanvasItem>();
    layer->setSizing(Sizing().withFixedWidth(0));
    layer->addCanvasItem(std::make_shared<PaintingCanvasItem>(Color(1, 1, 1)));
    root->addCanvasItem(layer);
    root->addCanvasItem(std::make_shared<PaintingCanvasItem>(Color(7, 7, 7)));
    root->sizeChanged(100, 20);

    ASSERT_TRUE(waitUntil([&] { return sink->frameCount() > 0; }));
    ASSERT_TRUE(root->waitForIdle());
    ASSERT_TRUE(layer->waitForIdle());
    EXPECT_TRUE(containsFill(*sink->lastFrame(), Color(7, 7, 7)));
    EXPECT_FALSE(containsFill(*sink->lastFrame(), Color(1, 1, 1)));
}

TEST_F(LayerTest, UnsizedLayerComposesAsEmpty) {
    auto layer = make<LayerCanvasItem>();
    layer->addCanvasItem(std::make_shared<PaintingCanvasItem>());
    ComposerCache cache;
    auto composer = layer->getComposer(cache);
    ASSERT_NE(composer, nullptr);

    composer->updateLayout({0, 0}, {10, 10});
    DrawingContext dc;
    composer->repaint(dc, IntRect(0, 0, 10, 10));
    EXPECT_EQ(dc.flattenedSize(), 0u);
}

TEST_F(LayerTest, StandaloneDirectDrawLayerGoesIdle) {
    auto layer = make<LayerCanvasItem>();
    layer->setDrawsDirectly(true);
    layer->addCanvasItem(std::make_shared<PaintingCanvasItem>(Color(3, 3, 3)));
    layer->updateLayout({0, 0}, {40, 40});

    ASSERT_TRUE(layer->waitForIdle(std::chrono::milliseconds(1000)));
    ASSERT_NE(layer->publishedOutput(), nullptr);
    EXPECT_TRUE(containsFill(*layer->publishedOutput(), Color(3, 3, 3)));
}

TEST_F(LayerTest, DirectDrawEnabledAfterLayoutDrawsSection) {
    auto sink = std::make_shared<RecordingDrawSink>();
    auto root = make<RootCanvasItem>(sink);
    root->setLayout(std::make_shared<ColumnLayout>());
    auto header = std::make_shared<EmptyCanvasItem>();
    header->setSizing(Sizing().withFixedHeight(10));
    root->addCanvasItem(header);
    auto layer = std::make_shared<LayerCanvasItem>();
    layer->addCanvasItem(std::make_shared<PaintingCanvasItem>(Color(8, 8, 8)));
    root->addCanvasItem(layer);
    root->sizeChanged(60, 50);
    ASSERT_TRUE(waitUntil([&] { return sink->frameCount() > 0; }));
    ASSERT_TRUE(layer->waitForIdle());

    layer->setDrawsDirectly(true);
    int id = layer->sectionId();
    ASSERT_TRUE(waitUntil([&] { return sink->hasSection(id); }));
    EXPECT_EQ(sink->sectionRect(id), IntRect(0, 10, 60, 40));
    EXPECT_TRUE(layer->waitForIdle(std::chrono::milliseconds(1000)));
    EXPECT_TRUE(root->waitForIdle(std::chrono::milliseconds(1000)));
}
