#pragma once

#include "layout/Sizing.hpp"

#include <vector>

namespace trellis {

/// Result of solving one axis: an origin and a size per constraint.
struct SolverResult {
    std::vector<int> origins;
    std::vector<int> sizes;
};

/// One-dimensional constraint solver shared by all layouts.
class Solver {
public:
    /// Distribute `available` units among the constraints along one axis,
    /// starting at `origin` and separating items by `spacing`. Sizes always
    /// lie within [minimum, maximum]; when the minimums already exceed the
    /// space, the result is larger than `available`.
    static SolverResult solve(int origin, int available,
                              const std::vector<Constraint>& constraints,
                              int spacing = 0);
};

} // namespace trellis
