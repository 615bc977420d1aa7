#pragma once

#include "canvas/CanvasItem.hpp"
#include "render/Surface.hpp"

#include <functional>
#include <string>

namespace trellis {

using ClickCallback = std::function<void()>;
using CheckedCallback = std::function<void(bool)>;

/// Paints nothing. Used for spacing and stretch.
class EmptyCanvasItem : public AbstractCanvasItem {
public:
    EmptyCanvasItem() = default;
};

/// Fills its bounds with a solid color.
class BackgroundCanvasItem : public AbstractCanvasItem {
public:
    explicit BackgroundCanvasItem(Color color = Color::LightGray());
};

/// A single line of text.
class StaticTextCanvasItem : public AbstractCanvasItem {
public:
    explicit StaticTextCanvasItem(const std::string& text = "");

    std::string text() const;
    void setText(const std::string& text);

    std::string font() const;
    void setFont(const std::string& font);

    Color textColor() const;
    void setTextColor(Color color);

    /// Fix the size to the measured text plus padding.
    void sizeToContent(const IFontMetricsProvider& metrics, int horizontalPadding = 4,
                       int verticalPadding = 4);

protected:
    Painter makePainter(ComposerCache& cache) override;

    /// Layout of the text for a given size; overridden by the button.
    static IntPoint baselineFor(const IntSize& size, int textHeight);

    // Guarded by m_mutex
    std::string m_text;
    std::string m_font = "normal 11px sans-serif";
    Color m_textColor = Color::Black();
    int m_textHeight = 11;
};

/// Text button with hover and pressed states.
class TextButtonCanvasItem : public StaticTextCanvasItem {
public:
    explicit TextButtonCanvasItem(const std::string& text = "");

    void setOnClick(ClickCallback callback) { m_onClick = std::move(callback); }

    bool isPressed() const { return m_pressed; }
    bool isHovered() const { return m_hovered; }

    bool mouseEntered() override;
    bool mouseExited() override;
    bool mousePressed(int x, int y, const KeyboardModifiers& modifiers) override;
    bool mouseReleased(int x, int y, const KeyboardModifiers& modifiers) override;
    bool keyPressed(const KeyEvent& event) override;

protected:
    Painter makePainter(ComposerCache& cache) override;

private:
    void setVisualState(bool hovered, bool pressed);

    ClickCallback m_onClick;
    Color m_hoverColor = Color(200, 210, 230, 255);
    Color m_pressColor = Color(160, 175, 205, 255);
    // Read by the painter, guarded by m_mutex
    bool m_hovered = false;
    bool m_pressed = false;
};

/// A fixed 20x20 check box.
class CheckBoxCanvasItem : public AbstractCanvasItem {
public:
    CheckBoxCanvasItem();

    bool isChecked() const;
    void setChecked(bool checked);

    void setOnCheckedChanged(CheckedCallback callback) { m_onCheckedChanged = std::move(callback); }

    bool mouseClicked(int x, int y, const KeyboardModifiers& modifiers) override;
    bool keyPressed(const KeyEvent& event) override;

protected:
    Painter makePainter(ComposerCache& cache) override;

private:
    CheckedCallback m_onCheckedChanged;
    bool m_checked = false;
};

} // namespace trellis
