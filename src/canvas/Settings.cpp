#include "canvas/Settings.hpp"
#include "canvas/LayerCanvasItem.hpp"
#include "canvas/ScrollArea.hpp"
#include "canvas/Splitter.hpp"
#include "core/Log.hpp"
#include "render/RepaintPool.hpp"

namespace trellis {

void applySettings(const CanvasSettings& settings) {
    auto& pool = RepaintPool::instance();
    if (pool.threadCount() != static_cast<size_t>(settings.repaintThreads)) {
        pool.resize(static_cast<size_t>(settings.repaintThreads));
    }
    LayerCanvasItem::setDefaultMaxFrameRate(settings.maxFrameRate);
    SplitterCanvasItem::setDefaultSnapTolerance(settings.splitterSnapTolerance);
    SplitterCanvasItem::setDefaultHitTolerance(settings.splitterHitTolerance);
    ScrollAreaCanvasItem::setWheelStep(settings.wheelStep);

    LOG_INFO("Canvas settings: {} repaint threads, {} fps, snap {}, hit {}, wheel step {}",
             settings.repaintThreads, settings.maxFrameRate, settings.splitterSnapTolerance,
             settings.splitterHitTolerance, settings.wheelStep);
}

} // namespace trellis
