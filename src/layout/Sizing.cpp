#include "layout/Sizing.hpp"

#include <sstream>

namespace trellis {

namespace {

Constraint makeConstraint(const std::optional<SizingValue>& minimum,
                          const std::optional<SizingValue>& maximum,
                          const std::optional<SizingValue>& preferred,
                          int available) {
    Constraint c;
    c.minimum = minimum ? minimum->resolve(available) : 0;
    c.maximum = maximum ? maximum->resolve(available) : Constraint::Unbounded;
    if (preferred) {
        c.preferred = preferred->resolve(available);
    }
    return c;
}

void appendValue(std::ostringstream& out, const char* name, const std::optional<SizingValue>& v) {
    out << ' ' << name << '=';
    if (!v) {
        out << "none";
    } else if (v->isFraction()) {
        out << v->value() * 100.0 << '%';
    } else {
        out << static_cast<int>(v->value());
    }
}

} // namespace

void Sizing::setFixedWidth(SizingValue width) {
    minimumWidth = width;
    maximumWidth = width;
    preferredWidth = width;
}

void Sizing::setFixedHeight(SizingValue height) {
    minimumHeight = height;
    maximumHeight = height;
    preferredHeight = height;
}

void Sizing::setFixedSize(IntSize size) {
    setFixedWidth(size.width);
    setFixedHeight(size.height);
}

void Sizing::clearWidth() {
    minimumWidth.reset();
    maximumWidth.reset();
    preferredWidth.reset();
}

void Sizing::clearHeight() {
    minimumHeight.reset();
    maximumHeight.reset();
    preferredHeight.reset();
}

Sizing Sizing::withFixedWidth(SizingValue width) const {
    Sizing s = *this;
    s.setFixedWidth(width);
    return s;
}

Sizing Sizing::withFixedHeight(SizingValue height) const {
    Sizing s = *this;
    s.setFixedHeight(height);
    return s;
}

Sizing Sizing::withFixedSize(IntSize size) const {
    Sizing s = *this;
    s.setFixedSize(size);
    return s;
}

Sizing Sizing::withMinimumWidth(std::optional<SizingValue> v) const { Sizing s = *this; s.minimumWidth = v; return s; }
Sizing Sizing::withMaximumWidth(std::optional<SizingValue> v) const { Sizing s = *this; s.maximumWidth = v; return s; }
Sizing Sizing::withPreferredWidth(std::optional<SizingValue> v) const { Sizing s = *this; s.preferredWidth = v; return s; }
Sizing Sizing::withMinimumHeight(std::optional<SizingValue> v) const { Sizing s = *this; s.minimumHeight = v; return s; }
Sizing Sizing::withMaximumHeight(std::optional<SizingValue> v) const { Sizing s = *this; s.maximumHeight = v; return s; }
Sizing Sizing::withPreferredHeight(std::optional<SizingValue> v) const { Sizing s = *this; s.preferredHeight = v; return s; }
Sizing Sizing::withCollapsible(bool value) const { Sizing s = *this; s.collapsible = value; return s; }

Constraint Sizing::widthConstraint(int availableWidth) const {
    return makeConstraint(minimumWidth, maximumWidth, preferredWidth, availableWidth);
}

Constraint Sizing::heightConstraint(int availableHeight) const {
    return makeConstraint(minimumHeight, maximumHeight, preferredHeight, availableHeight);
}

Sizing Sizing::collapsed() {
    Sizing s;
    s.setFixedSize({0, 0});
    s.collapsible = true;
    return s;
}

std::string Sizing::toString() const {
    std::ostringstream out;
    out << "Sizing(";
    appendValue(out, "min_w", minimumWidth);
    appendValue(out, "max_w", maximumWidth);
    appendValue(out, "pref_w", preferredWidth);
    appendValue(out, "min_h", minimumHeight);
    appendValue(out, "max_h", maximumHeight);
    appendValue(out, "pref_h", preferredHeight);
    if (collapsible) out << " collapsible";
    out << " )";
    return out.str();
}

} // namespace trellis
