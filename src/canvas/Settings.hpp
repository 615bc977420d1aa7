#pragma once

#include "core/Config.hpp"

namespace trellis {

/// Push configured values into the process-wide canvas defaults: repaint
/// pool size, layer frame rate, splitter tolerances and wheel step.
/// Items created before the call keep their values.
void applySettings(const CanvasSettings& settings);

} // namespace trellis
