#include "render/DrawingContext.hpp"

namespace trellis {

void DrawingContext::save() {
    DrawCommand cmd;
    cmd.type = DrawCommandType::Save;
    m_commands.push_back(std::move(cmd));
}

void DrawingContext::restore() {
    DrawCommand cmd;
    cmd.type = DrawCommandType::Restore;
    m_commands.push_back(std::move(cmd));
}

void DrawingContext::translate(IntPoint delta) {
    if (delta == IntPoint{}) return;
    DrawCommand cmd;
    cmd.type = DrawCommandType::Translate;
    cmd.from = delta;
    m_commands.push_back(std::move(cmd));
}

void DrawingContext::clipRect(const IntRect& rect) {
    DrawCommand cmd;
    cmd.type = DrawCommandType::ClipRect;
    cmd.rect = rect;
    m_commands.push_back(std::move(cmd));
}

void DrawingContext::fillRect(const IntRect& rect, Color color) {
    DrawCommand cmd;
    cmd.type = DrawCommandType::FillRect;
    cmd.rect = rect;
    cmd.color = color;
    m_commands.push_back(std::move(cmd));
}

void DrawingContext::strokeRect(const IntRect& rect, Color color, int lineWidth) {
    DrawCommand cmd;
    cmd.type = DrawCommandType::StrokeRect;
    cmd.rect = rect;
    cmd.color = color;
    cmd.lineWidth = lineWidth;
    m_commands.push_back(std::move(cmd));
}

void DrawingContext::line(IntPoint from, IntPoint to, Color color, int lineWidth) {
    DrawCommand cmd;
    cmd.type = DrawCommandType::Line;
    cmd.from = from;
    cmd.to = to;
    cmd.color = color;
    cmd.lineWidth = lineWidth;
    m_commands.push_back(std::move(cmd));
}

void DrawingContext::fillText(const std::string& text, IntPoint baseline, const std::string& font, Color color) {
    DrawCommand cmd;
    cmd.type = DrawCommandType::FillText;
    cmd.text = text;
    cmd.from = baseline;
    cmd.font = font;
    cmd.color = color;
    m_commands.push_back(std::move(cmd));
}

void DrawingContext::drawContext(std::shared_ptr<const DrawingContext> context) {
    if (!context) return;
    DrawCommand cmd;
    cmd.type = DrawCommandType::Context;
    cmd.context = std::move(context);
    m_commands.push_back(std::move(cmd));
}

size_t DrawingContext::flattenedSize() const {
    size_t count = 0;
    for (const auto& cmd : m_commands) {
        count += (cmd.type == DrawCommandType::Context) ? cmd.context->flattenedSize() + 2 : 1;
    }
    return count;
}

std::vector<DrawCommand> DrawingContext::flattened() const {
    std::vector<DrawCommand> out;
    out.reserve(flattenedSize());
    flattenInto(out);
    return out;
}

void DrawingContext::flattenInto(std::vector<DrawCommand>& out) const {
    for (const auto& cmd : m_commands) {
        if (cmd.type != DrawCommandType::Context) {
            out.push_back(cmd);
            continue;
        }
        DrawCommand save;
        save.type = DrawCommandType::Save;
        out.push_back(save);
        cmd.context->flattenInto(out);
        DrawCommand restore;
        restore.type = DrawCommandType::Restore;
        out.push_back(restore);
    }
}

} // namespace trellis
