#pragma once

#include "core/Geometry.hpp"

#include <climits>
#include <optional>
#include <string>

namespace trellis {

/// A resolved size range for one axis of one item, in absolute units.
struct Constraint {
    static constexpr int Unbounded = INT_MAX;

    int minimum = 0;
    int maximum = Unbounded;
    std::optional<int> preferred;

    constexpr Constraint() = default;
    constexpr Constraint(int min, int max, std::optional<int> pref = std::nullopt)
        : minimum(min), maximum(max), preferred(pref) {}

    static constexpr Constraint fixed(int size) { return {size, size, size}; }

    bool operator==(const Constraint&) const = default;
};

/// One sizing value: either absolute units or a fraction (<= 1.0) of the
/// space available along the axis.
class SizingValue {
public:
    constexpr SizingValue(int absolute) : m_value(absolute), m_fraction(false) {}
    /// Doubles up to 1.0 are fractions; larger doubles are absolute units.
    constexpr SizingValue(double value) : m_value(value), m_fraction(value <= 1.0) {}

    static constexpr SizingValue absolute(int units) { return SizingValue(units); }
    static constexpr SizingValue fraction(double f) { return SizingValue(f, true); }

    constexpr bool isFraction() const { return m_fraction; }
    constexpr double value() const { return m_value; }

    /// Absolute units when resolved against the available extent.
    constexpr int resolve(int available) const {
        return m_fraction ? static_cast<int>(available * m_value) : static_cast<int>(m_value);
    }

    bool operator==(const SizingValue&) const = default;

private:
    constexpr SizingValue(double value, bool fraction) : m_value(value), m_fraction(fraction) {}

    double m_value;
    bool m_fraction;
};

/// Describes the sizing of a canvas item. Every value is optional; an unset
/// value lets the layout decide. Aspect ratios are width / height.
struct Sizing {
    std::optional<SizingValue> minimumWidth;
    std::optional<SizingValue> maximumWidth;
    std::optional<SizingValue> preferredWidth;
    std::optional<SizingValue> minimumHeight;
    std::optional<SizingValue> maximumHeight;
    std::optional<SizingValue> preferredHeight;
    std::optional<double> minimumAspectRatio;
    std::optional<double> maximumAspectRatio;
    std::optional<double> preferredAspectRatio;
    bool collapsible = false;

    void setFixedWidth(SizingValue width);
    void setFixedHeight(SizingValue height);
    void setFixedSize(IntSize size);
    void clearWidth();
    void clearHeight();

    // Copy-returning variants for building sizings inline.
    Sizing withFixedWidth(SizingValue width) const;
    Sizing withFixedHeight(SizingValue height) const;
    Sizing withFixedSize(IntSize size) const;
    Sizing withMinimumWidth(std::optional<SizingValue> v) const;
    Sizing withMaximumWidth(std::optional<SizingValue> v) const;
    Sizing withPreferredWidth(std::optional<SizingValue> v) const;
    Sizing withMinimumHeight(std::optional<SizingValue> v) const;
    Sizing withMaximumHeight(std::optional<SizingValue> v) const;
    Sizing withPreferredHeight(std::optional<SizingValue> v) const;
    Sizing withCollapsible(bool value) const;

    /// Resolve the width values against the available width. Missing
    /// minimum is 0, missing maximum is Constraint::Unbounded.
    Constraint widthConstraint(int availableWidth) const;
    Constraint heightConstraint(int availableHeight) const;

    /// Values used when a collapsible composite has nothing visible.
    static Sizing collapsed();

    std::string toString() const;

    bool operator==(const Sizing&) const = default;
};

} // namespace trellis
