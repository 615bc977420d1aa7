#pragma once

#include "core/Geometry.hpp"
#include "render/DrawingContext.hpp"

#include <memory>
#include <string>

namespace trellis {

/// Cursor shapes an item can request while the mouse is over it.
enum class CursorShape {
    Arrow,
    IBeam,
    Cross,
    PointingHand,
    SplitVertical,
    SplitHorizontal,
    Move
};

const char* cursorShapeName(CursorShape shape);

/// Receives finished drawing command streams. May be called from repaint
/// threads; implementations must be thread-safe.
class IDrawSink {
public:
    virtual ~IDrawSink() = default;

    /// Replace the contents of the whole surface.
    virtual void draw(std::shared_ptr<const DrawingContext> commands) = 0;

    /// Replace the contents of one directly drawn section at `rect`, in
    /// surface coordinates.
    virtual void drawSection(int sectionId, std::shared_ptr<const DrawingContext> commands,
                             const IntRect& rect) = 0;

    virtual void removeSection(int sectionId) = 0;
};

/// Cursor and tooltip feedback, called on the UI thread.
class ICursorSink {
public:
    virtual ~ICursorSink() = default;

    virtual void setCursorShape(CursorShape shape) = 0;
    virtual void showToolTip(const std::string& text, IntPoint globalPos) = 0;
    virtual void hideToolTip() = 0;
};

struct FontMetrics {
    int width = 0;
    int height = 0;
    int ascent = 0;
    int descent = 0;
};

/// Text measurement supplied by the toolkit.
class IFontMetricsProvider {
public:
    virtual ~IFontMetricsProvider() = default;

    virtual FontMetrics measure(const std::string& font, const std::string& text) const = 0;
};

} // namespace trellis
