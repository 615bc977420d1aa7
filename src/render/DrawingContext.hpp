#pragma once

#include "core/Geometry.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace trellis {

class DrawingContext;

/// Cooperative cancellation flag shared between a layer and its repaint task.
using CancelFlag = std::shared_ptr<std::atomic<bool>>;

enum class DrawCommandType {
    Save,
    Restore,
    Translate,
    ClipRect,
    FillRect,
    StrokeRect,
    Line,
    FillText,
    Context        ///< Replays a nested, already recorded context
};

/// One recorded drawing operation. Only the fields relevant to `type` are set.
struct DrawCommand {
    DrawCommandType type = DrawCommandType::Save;
    IntRect rect;
    IntPoint from;
    IntPoint to;
    Color color;
    int lineWidth = 1;
    std::string text;
    std::string font;
    std::shared_ptr<const DrawingContext> context;
};

/// An append-only stream of drawing commands. Composers record into one,
/// and finished contexts are shared immutably between threads.
class DrawingContext {
public:
    DrawingContext() = default;
    explicit DrawingContext(CancelFlag cancel) : m_cancel(std::move(cancel)) {}

    void save();
    void restore();
    void translate(IntPoint delta);
    void clipRect(const IntRect& rect);
    void fillRect(const IntRect& rect, Color color);
    void strokeRect(const IntRect& rect, Color color, int lineWidth = 1);
    void line(IntPoint from, IntPoint to, Color color, int lineWidth = 1);
    void fillText(const std::string& text, IntPoint baseline, const std::string& font, Color color);

    /// Append a finished context by reference; its commands are not copied.
    void drawContext(std::shared_ptr<const DrawingContext> context);

    const std::vector<DrawCommand>& commands() const { return m_commands; }
    bool empty() const { return m_commands.empty(); }
    void clear() { m_commands.clear(); }

    /// Number of commands including those of nested contexts.
    size_t flattenedSize() const;

    /// Nested contexts inlined, each wrapped in save/restore.
    std::vector<DrawCommand> flattened() const;

    const CancelFlag& cancelFlag() const { return m_cancel; }
    bool isCancelled() const { return m_cancel && m_cancel->load(); }

private:
    void flattenInto(std::vector<DrawCommand>& out) const;

    std::vector<DrawCommand> m_commands;
    CancelFlag m_cancel;
};

} // namespace trellis
