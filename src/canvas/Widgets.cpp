#include "canvas/Widgets.hpp"
#include "canvas/ComposerCache.hpp"

#include <algorithm>

namespace trellis {

// ---------------------------------------------------------------------------
// BackgroundCanvasItem
// ---------------------------------------------------------------------------

BackgroundCanvasItem::BackgroundCanvasItem(Color color) {
    setBackgroundColor(color);
}

// ---------------------------------------------------------------------------
// StaticTextCanvasItem
// ---------------------------------------------------------------------------

StaticTextCanvasItem::StaticTextCanvasItem(const std::string& text)
    : m_text(text)
{
}

std::string StaticTextCanvasItem::text() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_text;
}

void StaticTextCanvasItem::setText(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_text == text) return;
        m_text = text;
    }
    update();
}

std::string StaticTextCanvasItem::font() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_font;
}

void StaticTextCanvasItem::setFont(const std::string& font) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_font == font) return;
        m_font = font;
    }
    update();
}

Color StaticTextCanvasItem::textColor() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_textColor;
}

void StaticTextCanvasItem::setTextColor(Color color) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_textColor == color) return;
        m_textColor = color;
    }
    update();
}

void StaticTextCanvasItem::sizeToContent(const IFontMetricsProvider& metrics, int horizontalPadding,
                                         int verticalPadding) {
    std::string font;
    std::string text;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        font = m_font;
        text = m_text;
    }
    FontMetrics fm = metrics.measure(font, text);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_textHeight = fm.height;
    }
    Sizing s = sizing();
    s.setFixedSize({fm.width + 2 * horizontalPadding, fm.height + 2 * verticalPadding});
    setSizing(s);
}

IntPoint StaticTextCanvasItem::baselineFor(const IntSize& size, int textHeight) {
    // Vertically centered, with a left inset of 4
    return {4, (size.height + textHeight) / 2};
}

Painter StaticTextCanvasItem::makePainter(ComposerCache& cache) {
    std::string text;
    std::string font;
    Color color;
    int textHeight = 0;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        text = m_text;
        font = m_font;
        color = m_textColor;
        textHeight = m_textHeight;
    }
    if (text.empty()) {
        return {};
    }

    // Recorded at the origin so every size shares one entry
    std::string key = "text:" + font + ":" + color.toHex() + ":" + text;
    std::shared_ptr<DrawingContext> glyphs = cache.get<DrawingContext>(key, [&] {
        auto recorded = std::make_shared<DrawingContext>();
        recorded->fillText(text, {0, 0}, font, color);
        return recorded;
    });
    return [glyphs, textHeight](DrawingContext& dc, const IntSize& size, const IntRect&) {
        dc.save();
        dc.translate(baselineFor(size, textHeight));
        dc.drawContext(glyphs);
        dc.restore();
    };
}

// ---------------------------------------------------------------------------
// TextButtonCanvasItem
// ---------------------------------------------------------------------------

TextButtonCanvasItem::TextButtonCanvasItem(const std::string& text)
    : StaticTextCanvasItem(text)
{
    setWantsMouseEvents(true);
    setFocusable(true);
    setCursorShape(CursorShape::PointingHand);
}

void TextButtonCanvasItem::setVisualState(bool hovered, bool pressed) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_hovered == hovered && m_pressed == pressed) return;
        m_hovered = hovered;
        m_pressed = pressed;
    }
    update();
}

bool TextButtonCanvasItem::mouseEntered() {
    setVisualState(true, m_pressed);
    return true;
}

bool TextButtonCanvasItem::mouseExited() {
    setVisualState(false, m_pressed);
    return true;
}

bool TextButtonCanvasItem::mousePressed(int, int, const KeyboardModifiers&) {
    if (!isEnabled()) return false;
    setVisualState(m_hovered, true);
    return true;
}

bool TextButtonCanvasItem::mouseReleased(int x, int y, const KeyboardModifiers&) {
    bool wasPressed = m_pressed;
    setVisualState(m_hovered, false);
    if (!wasPressed) return false;

    // A release outside the button cancels the click
    auto size = canvasSize();
    if (size && IntRect({0, 0}, *size).contains(x, y) && m_onClick) {
        m_onClick();
    }
    return true;
}

bool TextButtonCanvasItem::keyPressed(const KeyEvent& event) {
    if (!isEnabled()) return false;
    if (event.key == Key::Enter || event.key == Key::Space) {
        if (m_onClick) m_onClick();
        return true;
    }
    return false;
}

Painter TextButtonCanvasItem::makePainter(ComposerCache& cache) {
    Painter text = StaticTextCanvasItem::makePainter(cache);
    std::optional<Color> fill;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_pressed) fill = m_pressColor;
        else if (m_hovered) fill = m_hoverColor;
    }
    return [=](DrawingContext& dc, const IntSize& size, const IntRect& visibleRect) {
        IntRect bounds({0, 0}, size);
        if (fill) {
            dc.fillRect(bounds, *fill);
        }
        dc.strokeRect(bounds, Color::Gray());
        if (text) {
            text(dc, size, visibleRect);
        }
    };
}

// ---------------------------------------------------------------------------
// CheckBoxCanvasItem
// ---------------------------------------------------------------------------

CheckBoxCanvasItem::CheckBoxCanvasItem() {
    setWantsMouseEvents(true);
    setFocusable(true);
    setSizing(Sizing().withFixedSize({20, 20}));
}

bool CheckBoxCanvasItem::isChecked() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_checked;
}

void CheckBoxCanvasItem::setChecked(bool checked) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_checked == checked) return;
        m_checked = checked;
    }
    update();
    if (m_onCheckedChanged) {
        m_onCheckedChanged(checked);
    }
}

bool CheckBoxCanvasItem::mouseClicked(int, int, const KeyboardModifiers&) {
    if (!isEnabled()) return false;
    setChecked(!isChecked());
    return true;
}

bool CheckBoxCanvasItem::keyPressed(const KeyEvent& event) {
    if (!isEnabled() || event.key != Key::Space) return false;
    setChecked(!isChecked());
    return true;
}

Painter CheckBoxCanvasItem::makePainter(ComposerCache&) {
    bool checked = isChecked();
    return [checked](DrawingContext& dc, const IntSize& size, const IntRect&) {
        int side = std::min(size.width, size.height) - 4;
        if (side <= 0) return;
        IntRect box(2, 2, side, side);
        dc.fillRect(box, Color::White());
        dc.strokeRect(box, Color::Gray());
        if (checked) {
            dc.line({box.left() + 3, box.top() + side / 2},
                    {box.left() + side / 2, box.bottom() - 3}, Color::Black(), 2);
            dc.line({box.left() + side / 2, box.bottom() - 3},
                    {box.right() - 3, box.top() + 3}, Color::Black(), 2);
        }
    };
}

} // namespace trellis
