#include "canvas/RootCanvasItem.hpp"
#include "canvas/ScrollArea.hpp"
#include "canvas/Settings.hpp"
#include "canvas/Splitter.hpp"
#include "canvas/Widgets.hpp"
#include "core/Config.hpp"
#include "core/Log.hpp"
#include "render/RepaintPool.hpp"

#include <atomic>
#include <memory>

namespace {

/// Headless surface: counts frames and logs their size.
class LoggingDrawSink : public trellis::IDrawSink {
public:
    void draw(std::shared_ptr<const trellis::DrawingContext> commands) override {
        int frame = ++m_frames;
        LOG_INFO("frame {}: {} commands", frame, commands ? commands->flattenedSize() : 0);
    }

    void drawSection(int sectionId, std::shared_ptr<const trellis::DrawingContext> commands,
                     const trellis::IntRect& rect) override {
        LOG_INFO("section {} at ({}, {}) {}x{}: {} commands", sectionId, rect.left(), rect.top(),
                 rect.width(), rect.height(), commands ? commands->flattenedSize() : 0);
    }

    void removeSection(int sectionId) override {
        LOG_INFO("section {} removed", sectionId);
    }

    int frames() const { return m_frames.load(); }

private:
    std::atomic<int> m_frames{0};
};

class LoggingCursorSink : public trellis::ICursorSink {
public:
    void setCursorShape(trellis::CursorShape shape) override {
        LOG_DEBUG("cursor: {}", trellis::cursorShapeName(shape));
    }
    void showToolTip(const std::string& text, trellis::IntPoint globalPos) override {
        LOG_DEBUG("tooltip '{}' at ({}, {})", text, globalPos.x, globalPos.y);
    }
    void hideToolTip() override {}
};

} // namespace

int main(int argc, char** argv) {
    trellis::Config config;
    if (argc > 1 && !config.loadFromFile(argv[1])) {
        return 1;
    }
    auto settings = config.settings();
    trellis::Log::init(settings.logFile, settings.logLevel);
    trellis::applySettings(settings);

    auto sink = std::make_shared<LoggingDrawSink>();
    auto root = std::make_shared<trellis::RootCanvasItem>(sink, std::make_shared<LoggingCursorSink>());
    root->setLayout(std::make_shared<trellis::ColumnLayout>());
    root->setBackgroundColor(trellis::Color::White());

    auto title = std::make_shared<trellis::StaticTextCanvasItem>("Trellis");
    title->setSizing(trellis::Sizing().withFixedHeight(24));
    root->addCanvasItem(title);

    auto splitter = std::make_shared<trellis::SplitterCanvasItem>();
    root->addCanvasItem(splitter);

    auto scrollArea = std::make_shared<trellis::ScrollAreaCanvasItem>();
    auto content = std::make_shared<trellis::CanvasItemComposition>();
    content->setLayout(std::make_shared<trellis::ColumnLayout>(trellis::Margins(4), 4));
    content->setSizing(trellis::Sizing().withPreferredHeight(trellis::SizingValue::absolute(1200)));
    for (int i = 0; i < 40; ++i) {
        auto row = std::make_shared<trellis::CheckBoxCanvasItem>();
        row->setToolTip("option " + std::to_string(i));
        content->addCanvasItem(row);
    }
    scrollArea->setContent(content);
    splitter->addCanvasItem(scrollArea);

    auto button = std::make_shared<trellis::TextButtonCanvasItem>("Reset");
    button->setOnClick([splitter] { splitter->setSplits({0.5, 0.5}); });
    splitter->addCanvasItem(button);

    root->sizeChanged(640, 480);
    root->focusChanged(true);

    // Drag the splitter boundary, scroll, then press the button.
    auto boundaries = splitter->boundaries();
    if (!boundaries.empty()) {
        auto at = splitter->mapToGlobal({boundaries.front(), 200});
        root->mousePressedAt(at.x, at.y, {});
        root->mousePositionChangedAt(at.x + 80, at.y, {});
        root->mouseReleasedAt(at.x + 80, at.y, {});
    }
    root->wheelChangedAt(20, 200, 0, -120, false);
    auto center = button->mapToGlobal({10, 10});
    root->mousePressedAt(center.x, center.y, {});
    root->mouseReleasedAt(center.x, center.y, {});

    root->waitForIdle();
    LOG_INFO("{} frames, splits {:.2f} / {:.2f}", sink->frames(), splitter->splits().at(0),
             splitter->splits().at(1));

    root->close();
    trellis::RepaintPool::instance().shutdown();
    trellis::Log::shutdown();
    return 0;
}
