#pragma once

#include <algorithm>
#include <cstdint>
#include <string>

namespace trellis {

/// Integer point in canvas coordinates.
struct IntPoint {
    int x = 0;
    int y = 0;

    constexpr IntPoint() = default;
    constexpr IntPoint(int x, int y) : x(x), y(y) {}

    constexpr IntPoint operator+(const IntPoint& other) const { return {x + other.x, y + other.y}; }
    constexpr IntPoint operator-(const IntPoint& other) const { return {x - other.x, y - other.y}; }
    constexpr IntPoint operator-() const { return {-x, -y}; }
    IntPoint& operator+=(const IntPoint& other) { x += other.x; y += other.y; return *this; }

    constexpr bool operator==(const IntPoint&) const = default;
};

/// Integer size. Width and height are never negative once laid out.
struct IntSize {
    int width = 0;
    int height = 0;

    constexpr IntSize() = default;
    constexpr IntSize(int w, int h) : width(w), height(h) {}

    constexpr bool isEmpty() const { return width <= 0 || height <= 0; }
    constexpr bool operator==(const IntSize&) const = default;
};

/// Axis-aligned integer rectangle (origin + size).
struct IntRect {
    IntPoint origin;
    IntSize size;

    constexpr IntRect() = default;
    constexpr IntRect(IntPoint o, IntSize s) : origin(o), size(s) {}
    constexpr IntRect(int x, int y, int w, int h) : origin(x, y), size(w, h) {}

    constexpr int left() const { return origin.x; }
    constexpr int top() const { return origin.y; }
    constexpr int right() const { return origin.x + size.width; }
    constexpr int bottom() const { return origin.y + size.height; }
    constexpr int width() const { return size.width; }
    constexpr int height() const { return size.height; }

    constexpr bool isEmpty() const { return size.isEmpty(); }

    constexpr bool contains(int px, int py) const {
        return px >= left() && px < right() && py >= top() && py < bottom();
    }
    constexpr bool contains(IntPoint p) const { return contains(p.x, p.y); }

    constexpr bool intersects(const IntRect& other) const {
        return left() < other.right() && right() > other.left() &&
               top() < other.bottom() && bottom() > other.top();
    }

    /// Overlapping region, or an empty rect at the origin when disjoint.
    constexpr IntRect intersection(const IntRect& other) const {
        int l = std::max(left(), other.left());
        int t = std::max(top(), other.top());
        int r = std::min(right(), other.right());
        int b = std::min(bottom(), other.bottom());
        if (r <= l || b <= t) return {};
        return {l, t, r - l, b - t};
    }

    constexpr IntRect translated(IntPoint delta) const { return {origin + delta, size}; }

    constexpr bool operator==(const IntRect&) const = default;
};

/// Insets applied by layouts around their content.
struct Margins {
    int top = 0;
    int left = 0;
    int bottom = 0;
    int right = 0;

    constexpr Margins() = default;
    constexpr explicit Margins(int all) : top(all), left(all), bottom(all), right(all) {}
    constexpr Margins(int t, int l, int b, int r) : top(t), left(l), bottom(b), right(r) {}

    constexpr int horizontal() const { return left + right; }
    constexpr int vertical() const { return top + bottom; }

    constexpr bool operator==(const Margins&) const = default;
};

/// Color representation with RGBA components.
struct Color {
    uint8_t r = 255;
    uint8_t g = 255;
    uint8_t b = 255;
    uint8_t a = 255;

    constexpr Color() = default;
    constexpr Color(uint8_t r, uint8_t g, uint8_t b, uint8_t a = 255)
        : r(r), g(g), b(b), a(a) {}

    static constexpr Color White()       { return {255, 255, 255, 255}; }
    static constexpr Color Black()       { return {0, 0, 0, 255}; }
    static constexpr Color Gray()        { return {128, 128, 128, 255}; }
    static constexpr Color LightGray()   { return {220, 220, 220, 255}; }
    static constexpr Color Transparent() { return {0, 0, 0, 0}; }

    constexpr bool isOpaque() const { return a == 255; }
    constexpr bool operator==(const Color&) const = default;

    /// "#rrggbbaa" form, used in cache keys and logs.
    std::string toHex() const {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out = "#";
        for (uint8_t c : {r, g, b, a}) {
            out += digits[c >> 4];
            out += digits[c & 0xF];
        }
        return out;
    }
};

} // namespace trellis
