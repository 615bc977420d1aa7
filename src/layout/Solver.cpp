#include "layout/Solver.hpp"

#include <cstdint>
#include <optional>

namespace trellis {

namespace {

struct SolverItem {
    int64_t minimum;
    int64_t maximum;
    std::optional<int64_t> preferred;
    std::optional<int64_t> size;
    bool constrained = false;
};

// Floor division; the remaining space can go negative.
int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

// Give every free item an even share of what is left. Returns false when an
// item had to be clamped, in which case the caller restarts the pass.
bool distributeFreeSpace(std::vector<SolverItem>& items, int64_t available) {
    for (auto& item : items) {
        if (!item.constrained && !item.preferred) {
            item.size.reset();
        }
    }

    int64_t remaining = available;
    int64_t remainingCount = static_cast<int64_t>(items.size());
    for (const auto& item : items) {
        if (item.size) {
            remaining -= *item.size;
            --remainingCount;
        }
    }

    for (auto& item : items) {
        if (item.size) continue;
        int64_t size = floorDiv(remaining, remainingCount);
        bool clamped = false;
        if (size < item.minimum) {
            size = item.minimum;
            clamped = true;
        }
        if (size > item.maximum) {
            size = item.maximum;
            clamped = true;
        }
        item.size = size;
        remaining -= size;
        --remainingCount;
        if (clamped) {
            item.constrained = true;
            return false;
        }
    }
    return true;
}

int64_t totalSize(const std::vector<SolverItem>& items) {
    int64_t total = 0;
    for (const auto& item : items) total += *item.size;
    return total;
}

int64_t unconstrainedCount(const std::vector<SolverItem>& items) {
    int64_t count = 0;
    for (const auto& item : items) {
        if (!item.constrained) ++count;
    }
    return count;
}

// Shrink (direction < 0) or grow (direction > 0) the unconstrained items
// until the total matches or every item is pinned at a bound.
void adjustToFit(std::vector<SolverItem>& items, int64_t available, int direction) {
    bool finished = false;
    while (!finished) {
        finished = true;
        int64_t actual = totalSize(items);
        int64_t excess = direction < 0 ? actual - available : available - actual;
        if (excess <= 0) break;

        int64_t remainingCount = unconstrainedCount(items);
        if (remainingCount == 0) break;

        for (auto& item : items) {
            if (item.constrained) continue;
            int64_t share = floorDiv(excess, remainingCount);
            int64_t size = *item.size + direction * share;
            if (direction < 0 && size < item.minimum) {
                size = item.minimum;
                item.constrained = true;
                finished = false;
            } else if (direction > 0 && size > item.maximum) {
                size = item.maximum;
                item.constrained = true;
                finished = false;
            }
            int64_t adjustment = direction < 0 ? *item.size - size : size - *item.size;
            item.size = size;
            excess -= adjustment;
            --remainingCount;
            if (!finished) break;
        }
    }
}

} // namespace

SolverResult Solver::solve(int origin, int available,
                           const std::vector<Constraint>& constraints,
                           int spacing) {
    SolverResult result;
    if (constraints.empty()) {
        return result;
    }

    std::vector<SolverItem> items;
    items.reserve(constraints.size());
    for (const auto& c : constraints) {
        SolverItem item;
        item.minimum = c.minimum;
        item.maximum = c.maximum;
        if (c.preferred) item.preferred = *c.preferred;
        items.push_back(item);
    }

    // Preferred sizes first; clamping pins the item.
    for (auto& item : items) {
        if (!item.preferred) continue;
        int64_t size = *item.preferred;
        if (size < item.minimum) {
            size = item.minimum;
            item.constrained = true;
        }
        if (size > item.maximum) {
            size = item.maximum;
            item.constrained = true;
        }
        item.size = size;
    }

    // Each restart pins one more item, so this terminates.
    while (!distributeFreeSpace(items, available)) {
    }

    adjustToFit(items, available, -1);
    adjustToFit(items, available, +1);

    // Rounding residue goes to the last unconstrained item, within its bounds.
    int64_t residue = available - totalSize(items);
    if (residue != 0) {
        for (auto it = items.rbegin(); it != items.rend(); ++it) {
            if (it->constrained) continue;
            int64_t size = *it->size + residue;
            if (size >= it->minimum && size <= it->maximum) {
                it->size = size;
            }
            break;
        }
    }

    result.sizes.reserve(items.size());
    result.origins.reserve(items.size());
    int64_t position = origin;
    for (const auto& item : items) {
        result.origins.push_back(static_cast<int>(position));
        result.sizes.push_back(static_cast<int>(*item.size));
        position += *item.size + spacing;
    }
    return result;
}

} // namespace trellis
